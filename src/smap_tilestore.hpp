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

#ifndef _SMAP_TILESTORE_HPP
#define _SMAP_TILESTORE_HPP

#include <vector>
#include <cstddef>
#include "smap_tileaddress.hpp"

// Persistent storage for raw tile bytes. Implementations must be safe to call
// from several workers at once and must never expose a partially written
// tile through get().
class smap_tilestore
{
    public:
        virtual ~smap_tilestore() {;};

        // 0 and the stored bytes on hit, 1 otherwise
        virtual int get(const smap_tileaddress &tile, std::vector<unsigned char> &buf) = 0;
        virtual int put(const smap_tileaddress &tile, const unsigned char *buf, size_t nbytes) = 0;
        virtual bool exists(const smap_tileaddress &tile) = 0;
        virtual int remove(const smap_tileaddress &tile) = 0;
};

#endif // _SMAP_TILESTORE_HPP
