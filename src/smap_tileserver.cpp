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

#include <sstream>
#include <cstdio>
#include <cstring>

#include <curl/curl.h>
#include <curl/easy.h>

#include "smap_tileserver.hpp"

const size_t smap_tileserver::MAXBYTES;

smap_tileserver::smap_tileserver(const std::string &urltemplate,
                                 const std::string &useragent,
                                 unsigned int timeout,
                                 bool verbose) :
    m_template(urltemplate),
    m_useragent(useragent),
    m_timeout(timeout),
    m_verbose(verbose),
    m_share(NULL)
{
    // Init curl
    curl_global_init(CURL_GLOBAL_ALL);

    // Connection cache, DNS cache and TLS sessions are shared by every
    // request this server makes
    m_share = curl_share_init();
    if (m_share) {
        curl_share_setopt(m_share, CURLSHOPT_LOCKFUNC, curl_cblock);
        curl_share_setopt(m_share, CURLSHOPT_UNLOCKFUNC, curl_cbunlock);
        curl_share_setopt(m_share, CURLSHOPT_USERDATA, (void*)this);
        curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    } else {
        fprintf(stderr, "curl_share_init failed, tile connections will not be reused\n");
    }
}

smap_tileserver::~smap_tileserver()
{
    if (m_share)
        curl_share_cleanup(m_share);

    curl_global_cleanup();
}

int smap_tileserver::url(const smap_tileaddress &tile, std::string &u) const
{
    if (!tile.valid())
        return 1;

    u = m_template;
    replace(u, "{z}", tile.z());
    replace(u, "{x}", tile.x());
    replace(u, "{y}", tile.y());

    return 0;
}

int smap_tileserver::fetch(const smap_tileaddress &tile, std::vector<unsigned char> &buf)
{
    std::string u;
    if (url(tile, u) != 0)
        return 1;

    if (m_verbose)
        fprintf(stderr, "downloading %s\n", u.c_str());

    CURL *curl_handle = curl_easy_init();
    if (!curl_handle) {
        fprintf(stderr, "curl_easy_init failed for %s\n", u.c_str());
        return 1;
    }

    std::vector<unsigned char> data;
    curl_userdata ud;
    ud.buf = &data;
    ud.limit = MAXBYTES;

    curl_easy_setopt(curl_handle, CURLOPT_URL, u.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, curl_cbdata);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void*)&ud);
    curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, m_useragent.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, (long)m_timeout);
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, (long)m_timeout);

    // Several workers run downloads at once, keep curl away from signals
    curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);

    if (m_share)
        curl_easy_setopt(curl_handle, CURLOPT_SHARE, m_share);

    // Perform download
    CURLcode rc = curl_easy_perform(curl_handle);

    long status = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl_handle);

    if (rc != CURLE_OK) {
        fprintf(stderr, "download of %s failed: %s\n", u.c_str(), curl_easy_strerror(rc));
        return 1;
    }
    if (status != 200) {
        fprintf(stderr, "download of %s failed: HTTP status %ld\n", u.c_str(), status);
        return 1;
    }
    if (data.empty()) {
        fprintf(stderr, "download of %s failed: empty response\n", u.c_str());
        return 1;
    }

    buf.swap(data);
    return 0;
}

size_t smap_tileserver::curl_cbdata(void *ptr, size_t size, size_t nmemb, void *data)
{
    size_t realsize = size * nmemb;
    curl_userdata *ud = (curl_userdata*)data;

    // Returning less than realsize aborts the transfer
    if ((ud->buf->size() + realsize) > ud->limit)
        return 0;

    const unsigned char *src = (const unsigned char*)ptr;
    ud->buf->insert(ud->buf->end(), src, src + realsize);

    return realsize;
}

void smap_tileserver::curl_cblock(CURL *handle, curl_lock_data data, curl_lock_access access, void *userptr)
{
    (void)handle;
    (void)access;

    smap_tileserver *ts = reinterpret_cast<smap_tileserver*>(userptr);
    if ((data >= 0) && (data < CURL_LOCK_DATA_LAST))
        ts->m_sharelocks[data].acquire();
}

void smap_tileserver::curl_cbunlock(CURL *handle, curl_lock_data data, void *userptr)
{
    (void)handle;

    smap_tileserver *ts = reinterpret_cast<smap_tileserver*>(userptr);
    if ((data >= 0) && (data < CURL_LOCK_DATA_LAST))
        ts->m_sharelocks[data].release();
}

void smap_tileserver::replace(std::string &s, const std::string &from, int to)
{
    std::ostringstream ss;
    ss << to;

    std::string::size_type pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), ss.str());
        pos += ss.str().size();
    }
}
