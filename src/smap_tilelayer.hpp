// Copyright (c) 2010, Björn Rehm (bjoern@shugaa.de)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef _SMAP_TILELAYER_HPP
#define _SMAP_TILELAYER_HPP

#include "smap_viewport.hpp"
#include "smap_tilemanager.hpp"

// The basemap. Draws whatever the tile manager has in memory, a flat
// placeholder for everything else, and asks to be redrawn when workers
// deliver new tiles.
class smap_tilelayer
{
    public:
        typedef void (*redrawfct_t)(void *userdata);

        smap_tilelayer(smap_tilemanager &tiles, int margin);
        ~smap_tilelayer();

        void draw(const smap_viewport &viewport);

        // Called from the FLTK main thread after a tile arrived
        void callback(redrawfct_t fct, void *userdata);

    private:
        smap_tilelayer(const smap_tilelayer&);
        smap_tilelayer& operator=(const smap_tilelayer&);

        static void tilemanager_callback(const smap_tileaddress &tile, int rc, void *userdata);
        static void tilemanager_callback_main(void *userdata);

        smap_tilemanager &m_tiles;
        int m_margin;
        int m_lastz;

        redrawfct_t m_redraw;
        void *m_userdata;
};

#endif // _SMAP_TILELAYER_HPP
