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
#include "smap_tilerange.hpp"

smap_tilerange::smap_tilerange(const smap_viewport &viewport, int margin) :
    m_z(viewport.z()),
    m_n(1 << viewport.z()),
    m_col0(0),
    m_cols(0),
    m_row0(0),
    m_row1(-1)
{
    if (margin < 0)
        margin = 0;

    const double ts = smap_projection::TILESIZE;

    // Tiles touching [x, x+w) x [y, y+h)
    int col0 = (int)std::floor(viewport.x() / ts) - margin;
    int col1 = (int)std::ceil((viewport.x() + viewport.w()) / ts) - 1 + margin;
    int row0 = (int)std::floor(viewport.y() / ts) - margin;
    int row1 = (int)std::ceil((viewport.y() + viewport.h()) / ts) - 1 + margin;

    if (row0 < 0)
        row0 = 0;
    if (row1 > m_n - 1)
        row1 = m_n - 1;

    // Wider than the world, every column exactly once
    int cols = col1 - col0 + 1;
    if (cols > m_n)
        cols = m_n;

    if ((cols < 1) || (row0 > row1))
        return;

    m_col0 = col0;
    m_cols = cols;
    m_row0 = row0;
    m_row1 = row1;
}

smap_tilerange::const_iterator smap_tilerange::begin() const
{
    if (empty())
        return end();

    return const_iterator(this, 0, m_row0);
}

smap_tilerange::const_iterator smap_tilerange::end() const
{
    return const_iterator(this, m_cols, m_row0);
}

size_t smap_tilerange::size() const
{
    if ((m_cols < 1) || (m_row0 > m_row1))
        return 0;

    return (size_t)m_cols * (size_t)(m_row1 - m_row0 + 1);
}

bool smap_tilerange::contains(const smap_tileaddress &tile) const
{
    if (!tile.valid() || (tile.z() != m_z))
        return false;
    if ((tile.y() < m_row0) || (tile.y() > m_row1))
        return false;

    // Distance from the first column, going east around the world
    int d = (tile.x() - wrapcol(m_col0) + m_n) % m_n;
    return d < m_cols;
}

int smap_tilerange::wrapcol(int col) const
{
    col %= m_n;
    if (col < 0)
        col += m_n;
    return col;
}

smap_tileaddress smap_tilerange::const_iterator::operator*() const
{
    return smap_tileaddress(
            m_range->m_z,
            m_range->wrapcol(m_range->m_col0 + m_col),
            m_row);
}

smap_tilerange::const_iterator& smap_tilerange::const_iterator::operator++()
{
    // Column major, like drawing the map in vertical strips
    m_row++;
    if (m_row > m_range->m_row1) {
        m_row = m_range->m_row0;
        m_col++;
    }

    return *this;
}

smap_tilerange::const_iterator smap_tilerange::const_iterator::operator++(int)
{
    const_iterator old = *this;
    ++(*this);
    return old;
}
