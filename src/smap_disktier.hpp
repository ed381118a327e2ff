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

#ifndef _SMAP_DISKTIER_HPP
#define _SMAP_DISKTIER_HPP

#include <string>
#include "smap_tilestore.hpp"

// One file per tile: <basepath>/<z>/<x>/<y>.<ext>. The file is the whole
// record, there is no index or metadata. Nothing is ever evicted.
class smap_disktier : public smap_tilestore
{
    public:
        smap_disktier(const std::string &basepath, const std::string &ext = "png");
        ~smap_disktier();

        int get(const smap_tileaddress &tile, std::vector<unsigned char> &buf);
        int put(const smap_tileaddress &tile, const unsigned char *buf, size_t nbytes);
        bool exists(const smap_tileaddress &tile);
        int remove(const smap_tileaddress &tile);

        const std::string& basepath() const { return m_basepath; };
        int path(const smap_tileaddress &tile, std::string &p) const;

    private:
        std::string m_basepath;
        std::string m_ext;
};

#endif // _SMAP_DISKTIER_HPP
