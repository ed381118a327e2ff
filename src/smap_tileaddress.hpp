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

#ifndef _SMAP_TILEADDRESS_HPP
#define _SMAP_TILEADDRESS_HPP

#include <ostream>

// Names one tile of the quad-tree tiling scheme. This is the key for every
// cache tier.
class smap_tileaddress
{
    public:
        smap_tileaddress() :
            m_z(0), m_x(0), m_y(0) {;};
        smap_tileaddress(int z, int x, int y) :
            m_z(z), m_x(x), m_y(y) {;};

        int z() const { return m_z; };
        int x() const { return m_x; };
        int y() const { return m_y; };

        // 0 <= x,y < 2^z, and z small enough for 2^z to fit an int
        bool valid() const {
            if ((m_z < 0) || (m_z > 30))
                return false;

            int n = 1 << m_z;
            return (m_x >= 0) && (m_x < n) && (m_y >= 0) && (m_y < n);
        };

        bool operator==(const smap_tileaddress &other) const {
            return (m_z == other.m_z) && (m_x == other.m_x) && (m_y == other.m_y);
        };
        bool operator!=(const smap_tileaddress &other) const {
            return !(*this == other);
        };
        bool operator<(const smap_tileaddress &other) const {
            if (m_z != other.m_z)
                return m_z < other.m_z;
            if (m_x != other.m_x)
                return m_x < other.m_x;
            return m_y < other.m_y;
        };

    private:
        int m_z;
        int m_x;
        int m_y;
};

inline std::ostream& operator<<(std::ostream &os, const smap_tileaddress &a)
{
    return os << a.z() << "/" << a.x() << "/" << a.y();
}

#endif // _SMAP_TILEADDRESS_HPP
