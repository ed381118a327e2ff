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

#include <cstring>
#include <png.h>
#include "smap_image.hpp"

namespace {

struct png_source {
    const unsigned char *buf;
    size_t nbytes;
    size_t offset;
};

void png_read_mem(png_structp png_ptr, png_bytep data, png_size_t length)
{
    png_source *src = (png_source*)png_get_io_ptr(png_ptr);

    // Truncated file
    if ((src->offset + length) > src->nbytes) {
        png_error(png_ptr, "read past end of tile buffer");
        return;
    }

    memcpy(data, &src->buf[src->offset], length);
    src->offset += length;
}

void png_warn_silent(png_structp, png_const_charp)
{
    ;
}

}

smap_image::smap_image() :
    m_w(0),
    m_h(0),
    m_d(0)
{
    ;
}

smap_image::smap_image(int w, int h, int d) :
    m_w(w),
    m_h(h),
    m_d(d),
    m_data((size_t)w * h * d, 0)
{
    ;
}

smap_image::~smap_image()
{
    ;
}

const unsigned char *smap_image::data() const
{
    return m_data.empty() ? NULL : &m_data[0];
}

unsigned char *smap_image::data()
{
    return m_data.empty() ? NULL : &m_data[0];
}

unsigned char smap_image::at(int x, int y, int c) const
{
    return m_data[((size_t)y * m_w + x) * m_d + c];
}

int smap_image::decode(const unsigned char *buf, size_t nbytes, smap_image &img)
{
    if ((buf == NULL) || (nbytes < 8))
        return 1;
    if (png_sig_cmp((png_const_bytep)buf, 0, 8) != 0)
        return 1;

    png_source src;
    src.buf = buf;
    src.nbytes = nbytes;
    src.offset = 0;

    // Everything that has to survive a longjmp lives above setjmp
    std::vector<unsigned char> pixels;
    std::vector<png_bytep> rows;

    png_structp pp = png_create_read_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, png_warn_silent);
    if (pp == NULL)
        return 1;

    png_infop info = png_create_info_struct(pp);
    if (info == NULL) {
        png_destroy_read_struct(&pp, NULL, NULL);
        return 1;
    }

    if (setjmp(png_jmpbuf(pp))) {
        png_destroy_read_struct(&pp, &info, NULL);
        return 1;
    }

    png_set_read_fn(pp, (png_voidp)&src, png_read_mem);
    png_read_info(pp, info);

    // Normalize to 8 bit gray, gray+alpha, RGB or RGBA
    int colortype = png_get_color_type(pp, info);
    int bitdepth = png_get_bit_depth(pp, info);

    if (colortype == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(pp);
    if ((colortype == PNG_COLOR_TYPE_GRAY) && (bitdepth < 8))
        png_set_expand_gray_1_2_4_to_8(pp);
    if (png_get_valid(pp, info, PNG_INFO_tRNS))
        png_set_tRNS_to_alpha(pp);
    if (bitdepth == 16)
        png_set_strip_16(pp);
    if (bitdepth < 8)
        png_set_packing(pp);

    png_set_interlace_handling(pp);
    png_read_update_info(pp, info);

    int w = (int)png_get_image_width(pp, info);
    int h = (int)png_get_image_height(pp, info);
    int d = (int)png_get_channels(pp, info);
    if ((w <= 0) || (h <= 0) || (d < 1) || (d > 4)) {
        png_destroy_read_struct(&pp, &info, NULL);
        return 1;
    }

    pixels.resize((size_t)w * h * d);
    rows.resize(h);
    for (int i = 0; i < h; i++)
        rows[i] = (png_bytep)&pixels[(size_t)i * w * d];

    png_read_image(pp, &rows[0]);
    png_read_end(pp, NULL);
    png_destroy_read_struct(&pp, &info, NULL);

    img.m_w = w;
    img.m_h = h;
    img.m_d = d;
    img.m_data.swap(pixels);

    return 0;
}
