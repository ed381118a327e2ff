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

#ifndef _SMAP_IMAGE_HPP
#define _SMAP_IMAGE_HPP

#include <vector>
#include <cstddef>
#include <boost/shared_ptr.hpp>

// A decoded raster, 8 bit per sample, rows top to bottom. Immutable once
// handed out by the tile manager.
class smap_image
{
    public:
        smap_image();
        smap_image(int w, int h, int d);
        ~smap_image();

        int w() const { return m_w; };
        int h() const { return m_h; };
        int d() const { return m_d; };

        const unsigned char *data() const;
        unsigned char *data();
        size_t nbytes() const { return m_data.size(); };

        // Sample c of the pixel at x,y
        unsigned char at(int x, int y, int c) const;

        // Decode PNG bytes. Returns 0 on success, leaves img untouched and
        // returns 1 if the buffer does not hold a valid PNG.
        static int decode(const unsigned char *buf, size_t nbytes, smap_image &img);

    private:
        int m_w;
        int m_h;
        int m_d;
        std::vector<unsigned char> m_data;
};

typedef boost::shared_ptr<const smap_image> smap_image_ptr;

#endif // _SMAP_IMAGE_HPP
