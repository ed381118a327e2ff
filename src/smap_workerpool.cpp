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

#include <cstdio>
#include <exception>
#include <sstream>
#include "smap_workerpool.hpp"

smap_workerpool::smap_workerpool(
        smap_fetchqueue &queue,
        smap_ramtier &ramtier,
        smap_tilestore &disktier,
        smap_tilesource &source) :
    m_queue(queue),
    m_ramtier(ramtier),
    m_disktier(disktier),
    m_source(source),
    m_cooldown(30000),
    m_clock(smap_clock_now),
    m_callback(NULL),
    m_userdata(NULL)
{
    ;
}

smap_workerpool::~smap_workerpool()
{
    shutdown();
}

void smap_workerpool::callback(donefct_t fct, void *userdata)
{
    m_callback = fct;
    m_userdata = userdata;
}

int smap_workerpool::start(unsigned int nworkers)
{
    if (!m_threads.empty())
        return 1;
    if (nworkers < 1)
        return 1;

    for (unsigned int i = 0; i < nworkers; i++) {
        smap_thread *t = new smap_thread(wrapper);
        m_threads.push_back(t);
        t->run(this);
    }

    return 0;
}

int smap_workerpool::shutdown()
{
    // Unblocks every worker waiting for a tile
    m_queue.stop();

    for (std::vector<smap_thread*>::iterator it = m_threads.begin(); it != m_threads.end(); ++it) {
        (*it)->join();
        delete *it;
    }
    m_threads.clear();

    return 0;
}

void *smap_workerpool::wrapper(void *userdata)
{
    reinterpret_cast<smap_workerpool*>(userdata)->entry();
    return (void*)0;
}

void smap_workerpool::entry()
{
    for (;;) {
        smap_tileaddress tile;
        if (m_queue.qget(tile) != 0)
            return;

        int rc;
        try {
            rc = resolve(tile);
        } catch (const std::exception &e) {
            std::ostringstream ss;
            ss << tile;
            fprintf(stderr, "tile %s: %s\n", ss.str().c_str(), e.what());
            fail(tile);
            rc = 1;
        }

        // The outcome is already visible in the RAM tier, so nobody will
        // queue this address again behind our back
        m_queue.done(tile);

        if (m_callback)
            m_callback(tile, rc, m_userdata);
    }
}

int smap_workerpool::resolve(const smap_tileaddress &tile)
{
    // Queued again while another worker was finishing it
    smap_image_ptr img;
    int rc = m_ramtier.get(tile, m_clock(), img);
    if (rc == smap_ramtier::R_CACHED)
        return 0;
    if (rc == smap_ramtier::R_FAILED)
        return 1;

    if (fromdisk(tile) == 0)
        return 0;

    rc = fromsource(tile);
    if (rc == 0)
        return 0;

    // 2: already given up on for the rest of the session
    if (rc == 1)
        fail(tile);

    return 1;
}

int smap_workerpool::fromdisk(const smap_tileaddress &tile)
{
    std::vector<unsigned char> buf;
    if (m_disktier.get(tile, buf) != 0)
        return 1;

    boost::shared_ptr<smap_image> img(new smap_image());
    if (smap_image::decode(buf.empty() ? NULL : &buf[0], buf.size(), *img) != 0) {
        std::ostringstream ss;
        ss << tile;
        fprintf(stderr, "cached tile %s is corrupt, removing it\n", ss.str().c_str());

        // Don't trip over the same file again
        m_disktier.remove(tile);
        return 1;
    }

    m_ramtier.put(tile, img);
    return 0;
}

int smap_workerpool::fromsource(const smap_tileaddress &tile)
{
    std::vector<unsigned char> buf;
    if (m_source.fetch(tile, buf) != 0)
        return 1;

    // Decode before storing, a corrupt payload never reaches the disk
    boost::shared_ptr<smap_image> img(new smap_image());
    if (smap_image::decode(buf.empty() ? NULL : &buf[0], buf.size(), *img) != 0) {
        std::ostringstream ss;
        ss << tile;
        fprintf(stderr, "tile %s: server sent undecodable data (%lu bytes)\n",
                ss.str().c_str(), (unsigned long)buf.size());
        return 1;
    }

    if (m_disktier.put(tile, &buf[0], buf.size()) != 0) {
        std::ostringstream ss;
        ss << tile;
        fprintf(stderr, "tile %s: cannot be stored on disk, giving up on it\n", ss.str().c_str());

        m_ramtier.fail(tile, boost::posix_time::ptime(boost::posix_time::pos_infin));
        return 2;
    }

    m_ramtier.put(tile, img);
    return 0;
}

void smap_workerpool::fail(const smap_tileaddress &tile)
{
    m_ramtier.fail(tile, m_clock() + boost::posix_time::milliseconds(m_cooldown));
}
