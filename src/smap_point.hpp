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

#ifndef _SMAP_POINT_HPP
#define _SMAP_POINT_HPP

// A plain 2D point. Used for world coordinates (double, normalized to [0,1)),
// world pixel positions and pixel offsets inside a tile.
template <class T>
class smap_point
{
    public:
        smap_point() :
            m_x(0), m_y(0) {;};
        smap_point(T x, T y) :
            m_x(x), m_y(y) {;};

        T get_x() const { return m_x; };
        T get_y() const { return m_y; };

        void set_x(T x) { m_x = x; };
        void set_y(T y) { m_y = y; };

    private:
        T m_x;
        T m_y;
};

#endif // _SMAP_POINT_HPP
