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

#ifndef _SMAP_TILEMANAGER_HPP
#define _SMAP_TILEMANAGER_HPP

#include <string>
#include <vector>
#include "smap_clock.hpp"
#include "smap_image.hpp"
#include "smap_semaphore.hpp"
#include "smap_viewport.hpp"
#include "smap_tilerange.hpp"
#include "smap_ramtier.hpp"
#include "smap_fetchqueue.hpp"
#include "smap_tilestore.hpp"
#include "smap_tilesource.hpp"
#include "smap_workerpool.hpp"

struct smap_tileconfig {
    smap_tileconfig();

    std::string url;
    std::string cachedir;
    std::string useragent;
    unsigned int workers;
    unsigned int timeout;   // seconds
    unsigned int cooldown;  // milliseconds
    int preload;            // tiles around the viewport
    bool verbose;
};

// The rendering side's only way to tiles. Nothing here blocks on I/O: a tile
// is either in memory already or gets queued for the workers, and the caller
// simply asks again next frame.
class smap_tilemanager
{
    public:
        // request() return codes
        static const int T_CACHED = 0;
        static const int T_PENDING = 1;
        static const int T_FAILED = 2;
        static const int T_INVALID = 3;

        // state() return codes
        static const int S_UNREQUESTED = 0;
        static const int S_QUEUED = 1;
        static const int S_FETCHING = 2;
        static const int S_CACHED = 3;
        static const int S_FAILED = 4;

        // Fetches from cfg.url and caches in cfg.cachedir
        smap_tilemanager(const smap_tileconfig &cfg);

        // Uses the given store and source, both must outlive the manager
        smap_tilemanager(
                const smap_tileconfig &cfg,
                smap_tilestore &store,
                smap_tilesource &source,
                smap_clockfct_t clock = smap_clock_now);

        ~smap_tilemanager();

        int request(const smap_tileaddress &tile, smap_image_ptr &img);

        // Queue tiles ahead of time. Returns the number of tiles newly queued.
        size_t preload(const std::vector<smap_tileaddress> &tiles);

        // Queue the ring of margin tiles around the viewport, not the visible
        // tiles themselves
        size_t preload(const smap_viewport &viewport, int margin);

        // Queue what one frame needs: the margin ring, then the visible tiles
        // on top of it so they are served first. Returns the number of tiles
        // newly queued.
        size_t frame(const smap_viewport &viewport, int margin);

        smap_tilerange visible(const smap_viewport &viewport, int margin = 0) const;

        // Forget queued tiles the user has scrolled away from
        size_t cancel_stale(const smap_viewport &viewport, int margin);

        int state(const smap_tileaddress &tile) const;

        // Invoked from a worker thread whenever a tile was resolved. A callback
        // already running when it is replaced still runs to completion.
        void callback(smap_workerpool::donefct_t fct, void *userdata);

        int shutdown();

        const smap_tileconfig& config() const { return m_config; };
        size_t queued() const { return m_queue.size(); };
        size_t cached() const { return m_ramtier.size(); };

    private:
        smap_tilemanager(const smap_tilemanager&);
        smap_tilemanager& operator=(const smap_tilemanager&);

        void start();
        int enqueue(const smap_tileaddress &tile);

        static void worker_callback(const smap_tileaddress &tile, int rc, void *userdata);
        static bool stale(const smap_tileaddress &tile, void *userdata);

        smap_tileconfig m_config;
        smap_clockfct_t m_clock;

        smap_tilestore *m_ownedstore;
        smap_tilesource *m_ownedsource;
        smap_tilestore *m_store;
        smap_tilesource *m_source;

        smap_ramtier m_ramtier;
        smap_fetchqueue m_queue;
        smap_workerpool *m_pool;

        smap_workerpool::donefct_t m_callback;
        void *m_userdata;
        smap_mutex m_cblock;
};

#endif // _SMAP_TILEMANAGER_HPP
