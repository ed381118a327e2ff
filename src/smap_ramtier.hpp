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

#ifndef _SMAP_RAMTIER_HPP
#define _SMAP_RAMTIER_HPP

#include <map>
#include <cstddef>
#include <boost/thread/shared_mutex.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "smap_image.hpp"
#include "smap_tileaddress.hpp"

// Decoded tiles held in memory for the whole session, plus failed downloads
// waiting for their cooldown to expire. Many readers, one writer at a time.
class smap_ramtier
{
    public:
        // get() return codes
        static const int R_CACHED = 0;
        static const int R_MISSING = 1;
        static const int R_FAILED = 2;

        smap_ramtier();
        ~smap_ramtier();

        int get(const smap_tileaddress &tile, const boost::posix_time::ptime &now, smap_image_ptr &img) const;
        int put(const smap_tileaddress &tile, const smap_image_ptr &img);

        // Suppress requests for tile until the given point in time
        int fail(const smap_tileaddress &tile, const boost::posix_time::ptime &until);

        // Whether tile is marked failed, cooling down or not
        bool isfailed(const smap_tileaddress &tile) const;

        size_t size() const;
        size_t failed() const;

    private:
        struct ramtier_entry {
            smap_image_ptr img;
            boost::posix_time::ptime retry;
        };

        smap_ramtier(const smap_ramtier&);
        smap_ramtier& operator=(const smap_ramtier&);

        std::map<smap_tileaddress, ramtier_entry> m_tiles;
        mutable boost::shared_mutex m_lock;
};

#endif // _SMAP_RAMTIER_HPP
