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

#ifndef _SMAP_VIEWPORT_HPP
#define _SMAP_VIEWPORT_HPP

#include "smap_point.hpp"

// The part of the world the user is looking at. x and y are the top left
// corner in world pixels at zoom level z, w and h the size on screen.
class smap_viewport
{
    public:
        smap_viewport(int w, int h, int z);
        ~smap_viewport();

        double x() const { return m_x; };
        double y() const { return m_y; };
        int w() const { return m_w; };
        int h() const { return m_h; };
        int z() const { return m_z; };

        smap_point<double> origin() const { return smap_point<double>(m_x, m_y); };

        int zoomrange(int zoommin, int zoommax);

        int center(double lat, double lon);
        int center(double &lat, double &lon) const;

        // Zoom to z keeping the world point under refx,refy (viewport
        // relative) in place
        int z(int z, int refx, int refy);

        int resize(int w, int h);
        int move(double dx, double dy);

        // Geographic position of a point on screen
        int screen2gps(int sx, int sy, double &lat, double &lon) const;

    private:
        int assertpos();

        int m_zoommin;
        int m_zoommax;

        int m_z;
        double m_x;
        double m_y;
        int m_w;
        int m_h;
};

#endif // _SMAP_VIEWPORT_HPP
