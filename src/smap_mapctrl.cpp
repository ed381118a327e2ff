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

#include <FL/fl_draw.H>
#include <FL/x.H>
#include "smap_mapctrl.hpp"

smap_mapctrl::smap_mapctrl(int x, int y, int w, int h, const char *label) :
    Fl_Widget(x, y, w, h, label),
    m_mousepos(0, 0),
    m_basemap(NULL)
{
    m_viewport = new smap_viewport(w, h, 13);
}

smap_mapctrl::~smap_mapctrl()
{
    delete m_viewport;
}

int smap_mapctrl::basemap(smap_tilelayer *basemap)
{
    m_basemap = basemap;
    refresh();
    return 0;
}

int smap_mapctrl::zoom_get(int &z)
{
    z = m_viewport->z();
    return 0;
}

int smap_mapctrl::zoom_set(int z)
{
    int rc = m_viewport->z(z, m_viewport->w()/2, m_viewport->h()/2);

    redraw();
    return rc;
}

int smap_mapctrl::zoomrange(int zoommin, int zoommax)
{
    int rc = m_viewport->zoomrange(zoommin, zoommax);
    redraw();
    return rc;
}

int smap_mapctrl::center_at(double lat, double lon)
{
    int rc = m_viewport->center(lat, lon);
    redraw();
    return rc;
}

int smap_mapctrl::mousegps(double &lat, double &lon)
{
    return m_viewport->screen2gps(m_mousepos.get_x(), m_mousepos.get_y(), lat, lon);
}

int smap_mapctrl::refresh()
{
    redraw();
    return 0;
}

void smap_mapctrl::track()
{
    m_mousepos.set_x(Fl::event_x()-x());
    m_mousepos.set_y(Fl::event_y()-y());
}

int smap_mapctrl::key(int k)
{
    // Arrows pan by a quarter of the view, +/- zoom around the center
    switch (k) {
        case FL_Left:
            m_viewport->move(-m_viewport->w()/4.0, 0.0);
            break;
        case FL_Right:
            m_viewport->move(m_viewport->w()/4.0, 0.0);
            break;
        case FL_Up:
            m_viewport->move(0.0, -m_viewport->h()/4.0);
            break;
        case FL_Down:
            m_viewport->move(0.0, m_viewport->h()/4.0);
            break;
        case '+':
        case '=':
            m_viewport->z(m_viewport->z()+1, m_viewport->w()/2, m_viewport->h()/2);
            break;
        case '-':
            m_viewport->z(m_viewport->z()-1, m_viewport->w()/2, m_viewport->h()/2);
            break;
        default:
            return 0;
    }

    redraw();
    return 1;
}

int smap_mapctrl::handle(int event)
{
    int ex = Fl::event_x() - x();
    int ey = Fl::event_y() - y();

    switch (event) {
        case FL_FOCUS:
        case FL_UNFOCUS:
            return 1;
        case FL_KEYBOARD:
            return key(Fl::event_key());
        case FL_ENTER:
            fl_cursor(FL_CURSOR_HAND);
            return 1;
        case FL_LEAVE:
            fl_cursor(FL_CURSOR_DEFAULT);
            return 1;
        case FL_MOVE:
        case FL_RELEASE:
            track();
            return 1;
        case FL_PUSH:
            track();
            take_focus();
            if (Fl::event_button() == FL_RIGHT_MOUSE)
                do_callback();
            return 1;
        case FL_DRAG:
            if (!Fl::event_inside(this))
                break;

            // Grab and pull, the map follows the pointer
            m_viewport->move(m_mousepos.get_x() - ex, m_mousepos.get_y() - ey);
            track();
            redraw();
            return 1;
        case FL_MOUSEWHEEL:
            if (!Fl::event_inside(this))
                break;

            // Wheel up zooms in, around the mouse pointer
            m_viewport->z(m_viewport->z()-Fl::event_dy(), ex, ey);
            redraw();
            return 1;
    }

    return Fl_Widget::handle(event);
}

void smap_mapctrl::draw()
{
    if ((damage() & FL_DAMAGE_ALL) == 0)
        return;

    // Create an offscreen drawing buffer and send all subsequent commands there
    Fl_Offscreen offscreen;
    offscreen = fl_create_offscreen(m_viewport->w(), m_viewport->h());
    fl_begin_offscreen(offscreen);

    // Shows through wherever there is no map
    fl_rectf(0, 0, m_viewport->w(), m_viewport->h(), 80, 80, 80);

    if (m_basemap)
        m_basemap->draw(*m_viewport);

    fl_end_offscreen();

    fl_copy_offscreen(x(), y(), m_viewport->w(), m_viewport->h(), offscreen, 0, 0);
    fl_delete_offscreen(offscreen);
}

void smap_mapctrl::resize(int x, int y, int w, int h)
{
    Fl_Widget::resize(x, y, w, h);
    m_viewport->resize(w, h);
}
