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

#ifndef _SMAP_TILESERVER_HPP
#define _SMAP_TILESERVER_HPP

#include <string>
#include <curl/curl.h>
#include "smap_semaphore.hpp"
#include "smap_tilesource.hpp"

// HTTP tile source. The URL template contains {z}, {x} and {y} placeholders.
// All requests share one curl connection cache, so workers reuse keep-alive
// connections to the server instead of reconnecting for every tile.
class smap_tileserver : public smap_tilesource
{
    public:
        smap_tileserver(const std::string &urltemplate,
                        const std::string &useragent,
                        unsigned int timeout,
                        bool verbose = false);
        ~smap_tileserver();

        int fetch(const smap_tileaddress &tile, std::vector<unsigned char> &buf);

        int url(const smap_tileaddress &tile, std::string &u) const;

        // Tiles larger than this are treated as a failed download
        static const size_t MAXBYTES = 4 * 1024 * 1024;

    private:
        struct curl_userdata {
            std::vector<unsigned char> *buf;
            size_t limit;
        };

        smap_tileserver(const smap_tileserver&);
        smap_tileserver& operator=(const smap_tileserver&);

        static size_t curl_cbdata(void *ptr, size_t size, size_t nmemb, void *data);
        static void curl_cblock(CURL *handle, curl_lock_data data, curl_lock_access access, void *userptr);
        static void curl_cbunlock(CURL *handle, curl_lock_data data, void *userptr);

        static void replace(std::string &s, const std::string &from, int to);

        std::string m_template;
        std::string m_useragent;
        unsigned int m_timeout;
        bool m_verbose;

        CURLSH *m_share;
        smap_mutex m_sharelocks[CURL_LOCK_DATA_LAST];
};

#endif // _SMAP_TILESERVER_HPP
