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

#ifndef _SMAP_TILERANGE_HPP
#define _SMAP_TILERANGE_HPP

#include <iterator>
#include <cstddef>
#include "smap_tileaddress.hpp"
#include "smap_viewport.hpp"

// Every tile intersecting a viewport grown by margin tiles on each side.
// Columns wrap around the world, rows outside of it are left out. The range
// holds only its bounds, addresses are computed while iterating, so it can
// be rebuilt every frame and walked as often as needed.
class smap_tilerange
{
    public:
        class const_iterator
        {
            public:
                typedef std::forward_iterator_tag iterator_category;
                typedef smap_tileaddress value_type;
                typedef std::ptrdiff_t difference_type;
                typedef const smap_tileaddress* pointer;
                typedef smap_tileaddress reference;

                const_iterator() : m_range(NULL), m_col(0), m_row(0) {;};

                smap_tileaddress operator*() const;
                const_iterator& operator++();
                const_iterator operator++(int);

                bool operator==(const const_iterator &other) const {
                    return (m_col == other.m_col) && (m_row == other.m_row);
                };
                bool operator!=(const const_iterator &other) const {
                    return !(*this == other);
                };

            private:
                friend class smap_tilerange;
                const_iterator(const smap_tilerange *range, int col, int row) :
                    m_range(range), m_col(col), m_row(row) {;};

                const smap_tilerange *m_range;
                int m_col;
                int m_row;
        };

        smap_tilerange(const smap_viewport &viewport, int margin);

        const_iterator begin() const;
        const_iterator end() const;

        size_t size() const;
        bool empty() const { return size() == 0; };
        bool contains(const smap_tileaddress &tile) const;

        int z() const { return m_z; };

    private:
        int wrapcol(int col) const;

        int m_z;
        int m_n;

        // Unwrapped first column, number of columns, first and last row
        int m_col0;
        int m_cols;
        int m_row0;
        int m_row1;
};

#endif // _SMAP_TILERANGE_HPP
