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

#ifndef _SMAP_WORKERPOOL_HPP
#define _SMAP_WORKERPOOL_HPP

#include <vector>
#include "smap_clock.hpp"
#include "smap_thread.hpp"
#include "smap_fetchqueue.hpp"
#include "smap_ramtier.hpp"
#include "smap_tilestore.hpp"
#include "smap_tilesource.hpp"

// A fixed number of threads draining the fetch queue. Each tile is resolved
// from the disk tier if possible, from the tile source otherwise, and the
// outcome is published to the RAM tier before its in-flight slot is released.
class smap_workerpool
{
    public:
        // Called from a worker thread after a tile was resolved. rc is 0 if
        // the tile made it into the RAM tier, 1 if it was marked failed.
        typedef void (*donefct_t)(const smap_tileaddress &tile, int rc, void *userdata);

        smap_workerpool(
                smap_fetchqueue &queue,
                smap_ramtier &ramtier,
                smap_tilestore &disktier,
                smap_tilesource &source);
        ~smap_workerpool();

        void cooldown(unsigned int ms) { m_cooldown = ms; };
        void clock(smap_clockfct_t fct) { m_clock = fct; };
        void callback(donefct_t fct, void *userdata);

        int start(unsigned int nworkers);

        // Stop the queue and wait for every worker to finish its current tile
        int shutdown();

        size_t workers() const { return m_threads.size(); };

    private:
        smap_workerpool(const smap_workerpool&);
        smap_workerpool& operator=(const smap_workerpool&);

        static void *wrapper(void *userdata);
        void entry();

        int resolve(const smap_tileaddress &tile);
        int fromdisk(const smap_tileaddress &tile);
        int fromsource(const smap_tileaddress &tile);
        void fail(const smap_tileaddress &tile);

        smap_fetchqueue &m_queue;
        smap_ramtier &m_ramtier;
        smap_tilestore &m_disktier;
        smap_tilesource &m_source;

        unsigned int m_cooldown;
        smap_clockfct_t m_clock;
        donefct_t m_callback;
        void *m_userdata;

        std::vector<smap_thread*> m_threads;
};

#endif // _SMAP_WORKERPOOL_HPP
