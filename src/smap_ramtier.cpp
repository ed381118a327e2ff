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

#include <boost/thread/locks.hpp>
#include "smap_ramtier.hpp"

const int smap_ramtier::R_CACHED;
const int smap_ramtier::R_MISSING;
const int smap_ramtier::R_FAILED;

smap_ramtier::smap_ramtier()
{
    ;
}

smap_ramtier::~smap_ramtier()
{
    ;
}

int smap_ramtier::get(const smap_tileaddress &tile, const boost::posix_time::ptime &now, smap_image_ptr &img) const
{
    boost::shared_lock<boost::shared_mutex> lock(m_lock);

    std::map<smap_tileaddress, ramtier_entry>::const_iterator it = m_tiles.find(tile);
    if (it == m_tiles.end())
        return R_MISSING;

    if (it->second.img) {
        img = it->second.img;
        return R_CACHED;
    }

    // Failed earlier, still cooling down
    if (now < it->second.retry)
        return R_FAILED;

    return R_MISSING;
}

int smap_ramtier::put(const smap_tileaddress &tile, const smap_image_ptr &img)
{
    if (!img)
        return 1;

    boost::unique_lock<boost::shared_mutex> lock(m_lock);

    ramtier_entry &e = m_tiles[tile];
    e.img = img;
    e.retry = boost::posix_time::ptime();

    return 0;
}

int smap_ramtier::fail(const smap_tileaddress &tile, const boost::posix_time::ptime &until)
{
    boost::unique_lock<boost::shared_mutex> lock(m_lock);

    ramtier_entry &e = m_tiles[tile];

    // A tile that made it once stays
    if (e.img)
        return 1;

    e.retry = until;
    return 0;
}

bool smap_ramtier::isfailed(const smap_tileaddress &tile) const
{
    boost::shared_lock<boost::shared_mutex> lock(m_lock);

    std::map<smap_tileaddress, ramtier_entry>::const_iterator it = m_tiles.find(tile);
    if (it == m_tiles.end())
        return false;

    return !it->second.img;
}

size_t smap_ramtier::size() const
{
    boost::shared_lock<boost::shared_mutex> lock(m_lock);

    size_t n = 0;
    std::map<smap_tileaddress, ramtier_entry>::const_iterator it;
    for (it = m_tiles.begin(); it != m_tiles.end(); ++it) {
        if (it->second.img)
            n++;
    }

    return n;
}

size_t smap_ramtier::failed() const
{
    boost::shared_lock<boost::shared_mutex> lock(m_lock);

    size_t n = 0;
    std::map<smap_tileaddress, ramtier_entry>::const_iterator it;
    for (it = m_tiles.begin(); it != m_tiles.end(); ++it) {
        if (!it->second.img)
            n++;
    }

    return n;
}
