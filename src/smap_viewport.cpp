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

#include <cmath>
#include "smap_projection.hpp"
#include "smap_viewport.hpp"

smap_viewport::smap_viewport(int w, int h, int z) :
  m_zoommin(0),
  m_zoommax(smap_projection::ZOOMMAX),
  m_z(z),
  m_x(0.0),
  m_y(0.0),
  m_w(w),
  m_h(h)
{
    if (m_w < 1)
        m_w = 1;
    if (m_h < 1)
        m_h = 1;
    if (m_z < m_zoommin)
        m_z = m_zoommin;
    if (m_z > m_zoommax)
        m_z = m_zoommax;

    assertpos();
};

smap_viewport::~smap_viewport()
{
    ;
};

int smap_viewport::zoomrange(int zoommin, int zoommax)
{
    if ((zoommin < 0) || (zoommax > smap_projection::ZOOMMAX) || (zoommin > zoommax))
        return 1;

    m_zoommin = zoommin;
    m_zoommax = zoommax;

    // Re-clamp the current zoomlevel around the center
    return z(m_z, m_w/2, m_h/2);
}

int smap_viewport::center(double lat, double lon)
{
    smap_point<double> world, px;
    smap_projection::project(lat, lon, world);
    smap_projection::world2px(m_z, world, px);

    m_x = px.get_x() - (m_w / 2.0);
    m_y = px.get_y() - (m_h / 2.0);

    return assertpos();
}

int smap_viewport::center(double &lat, double &lon) const
{
    return screen2gps(m_w/2, m_h/2, lat, lon);
}

int smap_viewport::screen2gps(int sx, int sy, double &lat, double &lon) const
{
    smap_point<double> world;
    smap_projection::px2world(m_z, smap_point<double>(m_x + sx, m_y + sy), world);
    return smap_projection::unproject(world, lat, lon);
}

int smap_viewport::z(int z, int refx, int refy)
{
    if (z < m_zoommin)
        z = m_zoommin;
    if (z > m_zoommax)
        z = m_zoommax;

    double dimnow, dimlater;
    smap_projection::dim(m_z, dimnow);
    smap_projection::dim(z, dimlater);

    // refx and refy are viewport-relative, calculate the absolute pixel
    // position on the map and scale it to the new zoomlevel
    double arefx = (refx + m_x) * (dimlater / dimnow);
    double arefy = (refy + m_y) * (dimlater / dimnow);

    m_x = arefx - refx;
    m_y = arefy - refy;
    m_z = z;

    return assertpos();
}

int smap_viewport::resize(int w, int h)
{
    if ((w < 1) || (h < 1))
        return 1;

    // Keep the viewport centered when resizing
    m_x += (m_w - w) / 2.0;
    m_y += (m_h - h) / 2.0;
    m_w = w;
    m_h = h;

    return assertpos();
}

int smap_viewport::move(double dx, double dy)
{
    m_x += dx;
    m_y += dy;

    return assertpos();
}

int smap_viewport::assertpos()
{
    int rc = 0;
    double dimxy;
    smap_projection::dim(m_z, dimxy);

    // The world repeats horizontally
    if ((m_x < 0.0) || (m_x >= dimxy)) {
        m_x = std::fmod(m_x, dimxy);
        if (m_x < 0.0)
            m_x += dimxy;
    }

    // Vertically it doesn't. Keep the map on screen, centered if it's
    // smaller than the viewport.
    if ((double)m_h >= dimxy) {
        double y = (dimxy - m_h) / 2.0;
        if (y != m_y)
            rc = 1;
        m_y = y;
    } else if (m_y < 0.0) {
        m_y = 0.0;
        rc = 1;
    } else if ((m_y + m_h) > dimxy) {
        m_y = dimxy - m_h;
        rc = 1;
    }

    return rc;
}
