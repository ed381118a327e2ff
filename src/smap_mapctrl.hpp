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

#ifndef _SMAP_MAPCTRL_HPP
#define _SMAP_MAPCTRL_HPP

#include <string>
#include <FL/Fl.H>
#include <FL/Fl_Widget.H>
#include <FL/fl_draw.H>
#include "smap_viewport.hpp"
#include "smap_point.hpp"
#include "smap_tilelayer.hpp"

// Map widget. Drag to pan, wheel or +/- to zoom, arrow keys to pan, right
// click fires the widget callback with the pointer position available from
// mousegps().
class smap_mapctrl : public Fl_Widget
{
    public:
        smap_mapctrl(int x, int y, int w, int h, const char *label);
        ~smap_mapctrl();

        virtual int handle(int event);
        virtual void resize(int x, int y, int w, int h);

        int mousegps(double &lat, double &lon);
        int center_at(double lat, double lon);

        int zoom_get(int &z);
        int zoom_set(int z);
        int zoomrange(int zoommin, int zoommax);

        int basemap(smap_tilelayer *basemap);
        int refresh();

    private:
        smap_point<int> m_mousepos;
        smap_viewport *m_viewport;
        smap_tilelayer *m_basemap;

        void track();
        int key(int k);

    protected:
        void draw();
};

#endif // _SMAP_MAPCTRL_HPP
