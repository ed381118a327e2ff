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

#ifndef _SMAP_PROJECTION_HPP
#define _SMAP_PROJECTION_HPP

#include "smap_point.hpp"
#include "smap_tileaddress.hpp"

// Spherical mercator projection between latitude/longitude, normalized world
// coordinates ([0,1) x [0,1), origin top left) and tile/pixel space.
//
// All functions are stateless. Geographic input is clamped and wrapped rather
// than rejected; only tile addresses that violate 0 <= x,y < 2^z are refused.
class smap_projection
{
    public:
        static const int TILESIZE = 256;
        static const int ZOOMMAX = 30;
        static const double LATMAX;

        // Size of the world in pixels at zoom level z
        static int dim(int z, double &d);

        static int project(double lat, double lon, smap_point<double> &world);
        static int unproject(const smap_point<double> &world, double &lat, double &lon);

        static int world2tile(
                int z,
                const smap_point<double> &world,
                smap_tileaddress &tile,
                smap_point<double> &offset);
        static int tile2world(
                const smap_tileaddress &tile,
                const smap_point<double> &offset,
                smap_point<double> &world);

        static int world2px(int z, const smap_point<double> &world, smap_point<double> &px);
        static int px2world(int z, const smap_point<double> &px, smap_point<double> &world);

        // Screen position of a tile's top left corner for a viewport whose top
        // left corner sits at origin (world pixels at the tile's zoom level).
        static int tile2screen(
                const smap_tileaddress &tile,
                const smap_point<double> &origin,
                smap_point<double> &screen);

    private:
        static double wrap(double v);
        static double clamp(double v, double min, double max);
};

#endif // _SMAP_PROJECTION_HPP
