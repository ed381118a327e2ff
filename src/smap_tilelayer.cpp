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

#include <FL/Fl.H>
#include <FL/fl_draw.H>
#include "smap_projection.hpp"
#include "smap_tilelayer.hpp"

smap_tilelayer::smap_tilelayer(smap_tilemanager &tiles, int margin) :
    m_tiles(tiles),
    m_margin(margin),
    m_lastz(-1),
    m_redraw(NULL),
    m_userdata(NULL)
{
    m_tiles.callback(tilemanager_callback, this);
}

smap_tilelayer::~smap_tilelayer()
{
    // No more wakeups for a layer that is gone
    m_tiles.callback(NULL, NULL);
}

void smap_tilelayer::callback(redrawfct_t fct, void *userdata)
{
    m_redraw = fct;
    m_userdata = userdata;
}

void smap_tilelayer::draw(const smap_viewport &viewport)
{
    // Zoomed since the last frame, nothing queued for the old level matters
    if (viewport.z() != m_lastz) {
        m_tiles.cancel_stale(viewport, m_margin);
        m_lastz = viewport.z();
    }

    // Visible tiles go on the stack last so the workers get to them first
    m_tiles.frame(viewport, m_margin);

    double dimxy;
    smap_projection::dim(viewport.z(), dimxy);
    const int ts = smap_projection::TILESIZE;

    smap_tilerange range = m_tiles.visible(viewport);
    for (smap_tilerange::const_iterator it = range.begin(); it != range.end(); ++it) {
        smap_tileaddress tile = *it;

        smap_point<double> screen;
        if (smap_projection::tile2screen(tile, viewport.origin(), screen) != 0)
            continue;

        // Columns past the date line wrapped around to the start of the world
        double sx = screen.get_x();
        if (sx < -ts)
            sx += dimxy;

        int px = (int)sx;
        int py = (int)screen.get_y();

        smap_image_ptr img;
        if (m_tiles.request(tile, img) != smap_tilemanager::T_CACHED) {
            fl_rectf(px, py, ts, ts, 240, 240, 240);
            continue;
        }

        fl_draw_image(img->data(), px, py, img->w(), img->h(), img->d());
    }
}

void smap_tilelayer::tilemanager_callback(const smap_tileaddress &tile, int rc, void *userdata)
{
    (void)tile;

    // Failed tiles stay blank, nothing to redraw
    if (rc != 0)
        return;

    // Make FLTK call us back from the main thread
    Fl::lock();
    Fl::awake(tilemanager_callback_main, userdata);
    Fl::unlock();
}

void smap_tilelayer::tilemanager_callback_main(void *userdata)
{
    smap_tilelayer *layer = reinterpret_cast<smap_tilelayer*>(userdata);
    if (layer->m_redraw)
        layer->m_redraw(layer->m_userdata);
}
