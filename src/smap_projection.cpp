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

const int smap_projection::TILESIZE;
const int smap_projection::ZOOMMAX;
const double smap_projection::LATMAX = 85.0511287798066;

int smap_projection::dim(int z, double &d)
{
    if ((z < 0) || (z > ZOOMMAX))
        return 1;

    d = std::ldexp((double)TILESIZE, z);
    return 0;
}

int smap_projection::project(double lat, double lon, smap_point<double> &world)
{
    // Garbage in, origin out. The result has to stay finite.
    if (!std::isfinite(lat))
        lat = 0.0;
    if (!std::isfinite(lon))
        lon = 0.0;

    // Wrap longitude into [-180,180), clamp latitude to the valid mercator
    // range so the poles do not project to infinity.
    lon = std::fmod(lon + 180.0, 360.0);
    if (lon < 0.0)
        lon += 360.0;
    lon -= 180.0;
    lat = clamp(lat, -LATMAX, LATMAX);

    double siny = std::sin(lat * M_PI / 180.0);
    double x = (lon + 180.0) / 360.0;
    double y = 0.5 - std::log((1.0 + siny) / (1.0 - siny)) / (4.0 * M_PI);

    // The bottom edge belongs to the next world, keep y below 1
    world.set_x(wrap(x));
    world.set_y(clamp(y, 0.0, std::nextafter(1.0, 0.0)));

    return 0;
}

int smap_projection::unproject(const smap_point<double> &world, double &lat, double &lon)
{
    double x = wrap(world.get_x());
    double y = clamp(world.get_y(), 0.0, 1.0);

    lon = (x * 360.0) - 180.0;
    lat = 180.0 / M_PI * std::atan(std::sinh(M_PI * (1.0 - (2.0 * y))));

    return 0;
}

int smap_projection::world2tile(
        int z,
        const smap_point<double> &world,
        smap_tileaddress &tile,
        smap_point<double> &offset)
{
    double dimxy;
    if (dim(z, dimxy) != 0)
        return 1;

    int n = 1 << z;
    double px = wrap(world.get_x()) * dimxy;
    double py = clamp(world.get_y(), 0.0, 1.0) * dimxy;

    int tx = (int)std::floor(px / TILESIZE);
    int ty = (int)std::floor(py / TILESIZE);

    // The bottom edge belongs to the last row
    if (tx >= n)
        tx = n - 1;
    if (ty >= n)
        ty = n - 1;

    tile = smap_tileaddress(z, tx, ty);
    offset.set_x(px - ((double)tx * TILESIZE));
    offset.set_y(py - ((double)ty * TILESIZE));

    return 0;
}

int smap_projection::tile2world(
        const smap_tileaddress &tile,
        const smap_point<double> &offset,
        smap_point<double> &world)
{
    if (!tile.valid())
        return 1;

    double dimxy;
    dim(tile.z(), dimxy);

    world.set_x((((double)tile.x() * TILESIZE) + offset.get_x()) / dimxy);
    world.set_y((((double)tile.y() * TILESIZE) + offset.get_y()) / dimxy);

    return 0;
}

int smap_projection::world2px(int z, const smap_point<double> &world, smap_point<double> &px)
{
    double dimxy;
    if (dim(z, dimxy) != 0)
        return 1;

    px.set_x(world.get_x() * dimxy);
    px.set_y(world.get_y() * dimxy);

    return 0;
}

int smap_projection::px2world(int z, const smap_point<double> &px, smap_point<double> &world)
{
    double dimxy;
    if (dim(z, dimxy) != 0)
        return 1;

    world.set_x(px.get_x() / dimxy);
    world.set_y(px.get_y() / dimxy);

    return 0;
}

int smap_projection::tile2screen(
        const smap_tileaddress &tile,
        const smap_point<double> &origin,
        smap_point<double> &screen)
{
    smap_point<double> world;
    if (tile2world(tile, smap_point<double>(0.0, 0.0), world) != 0)
        return 1;

    smap_point<double> px;
    world2px(tile.z(), world, px);

    screen.set_x(px.get_x() - origin.get_x());
    screen.set_y(px.get_y() - origin.get_y());

    return 0;
}

double smap_projection::wrap(double v)
{
    if (!std::isfinite(v))
        return 0.0;

    v -= std::floor(v);

    // floor() rounding can leave exactly 1.0 for tiny negative inputs
    if (v >= 1.0)
        v = 0.0;

    return v;
}

double smap_projection::clamp(double v, double min, double max)
{
    if (!std::isfinite(v))
        return (v > 0) ? max : min;
    if (v < min)
        return min;
    if (v > max)
        return max;
    return v;
}
