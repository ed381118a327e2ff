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

#include "smap_disktier.hpp"
#include "smap_tileserver.hpp"
#include "smap_tilemanager.hpp"

const int smap_tilemanager::T_CACHED;
const int smap_tilemanager::T_PENDING;
const int smap_tilemanager::T_FAILED;
const int smap_tilemanager::T_INVALID;
const int smap_tilemanager::S_UNREQUESTED;
const int smap_tilemanager::S_QUEUED;
const int smap_tilemanager::S_FETCHING;
const int smap_tilemanager::S_CACHED;
const int smap_tilemanager::S_FAILED;

smap_tileconfig::smap_tileconfig() :
    url("https://a.basemaps.cartocdn.com/light_all/{z}/{x}/{y}.png"),
    cachedir("cache_tiles"),
    useragent("slipmap/0.1"),
    workers(4),
    timeout(5),
    cooldown(30000),
    preload(2),
    verbose(false)
{
    ;
}

smap_tilemanager::smap_tilemanager(const smap_tileconfig &cfg) :
    m_config(cfg),
    m_clock(smap_clock_now),
    m_ownedstore(NULL),
    m_ownedsource(NULL),
    m_store(NULL),
    m_source(NULL),
    m_pool(NULL),
    m_callback(NULL),
    m_userdata(NULL)
{
    m_ownedstore = new smap_disktier(m_config.cachedir);
    m_ownedsource = new smap_tileserver(m_config.url, m_config.useragent, m_config.timeout, m_config.verbose);
    m_store = m_ownedstore;
    m_source = m_ownedsource;

    start();
}

smap_tilemanager::smap_tilemanager(
        const smap_tileconfig &cfg,
        smap_tilestore &store,
        smap_tilesource &source,
        smap_clockfct_t clock) :
    m_config(cfg),
    m_clock(clock ? clock : smap_clock_now),
    m_ownedstore(NULL),
    m_ownedsource(NULL),
    m_store(&store),
    m_source(&source),
    m_pool(NULL),
    m_callback(NULL),
    m_userdata(NULL)
{
    start();
}

smap_tilemanager::~smap_tilemanager()
{
    shutdown();

    delete m_pool;
    delete m_ownedsource;
    delete m_ownedstore;
}

void smap_tilemanager::start()
{
    if (m_config.workers < 1)
        m_config.workers = 1;

    m_pool = new smap_workerpool(m_queue, m_ramtier, *m_store, *m_source);
    m_pool->cooldown(m_config.cooldown);
    m_pool->clock(m_clock);
    m_pool->callback(worker_callback, this);
    m_pool->start(m_config.workers);
}

int smap_tilemanager::shutdown()
{
    if (!m_pool)
        return 1;

    return m_pool->shutdown();
}

int smap_tilemanager::request(const smap_tileaddress &tile, smap_image_ptr &img)
{
    if (!tile.valid())
        return T_INVALID;

    int rc = m_ramtier.get(tile, m_clock(), img);
    if (rc == smap_ramtier::R_CACHED)
        return T_CACHED;
    if (rc == smap_ramtier::R_FAILED)
        return T_FAILED;

    // Not there yet, the workers will take care of it
    enqueue(tile);
    return T_PENDING;
}

int smap_tilemanager::enqueue(const smap_tileaddress &tile)
{
    return m_queue.qput(tile);
}

size_t smap_tilemanager::preload(const std::vector<smap_tileaddress> &tiles)
{
    size_t n = 0;
    boost::posix_time::ptime now = m_clock();

    for (std::vector<smap_tileaddress>::const_iterator it = tiles.begin(); it != tiles.end(); ++it) {
        if (!it->valid())
            continue;

        // Already have it, or it just failed
        smap_image_ptr img;
        if (m_ramtier.get(*it, now, img) != smap_ramtier::R_MISSING)
            continue;

        if (enqueue(*it) == smap_fetchqueue::Q_QUEUED)
            n++;
    }

    return n;
}

size_t smap_tilemanager::preload(const smap_viewport &viewport, int margin)
{
    smap_tilerange inner = visible(viewport, 0);
    smap_tilerange outer = visible(viewport, margin);

    std::vector<smap_tileaddress> ring;
    for (smap_tilerange::const_iterator it = outer.begin(); it != outer.end(); ++it) {
        smap_tileaddress tile = *it;
        if (!inner.contains(tile))
            ring.push_back(tile);
    }

    return preload(ring);
}

size_t smap_tilemanager::frame(const smap_viewport &viewport, int margin)
{
    size_t n = preload(viewport, margin);

    smap_tilerange range = visible(viewport);
    std::vector<smap_tileaddress> tiles;
    for (smap_tilerange::const_iterator it = range.begin(); it != range.end(); ++it)
        tiles.push_back(*it);

    return n + preload(tiles);
}

smap_tilerange smap_tilemanager::visible(const smap_viewport &viewport, int margin) const
{
    return smap_tilerange(viewport, margin);
}

size_t smap_tilemanager::cancel_stale(const smap_viewport &viewport, int margin)
{
    smap_tilerange keep = visible(viewport, margin);
    return m_queue.cancel_stale(stale, (void*)&keep);
}

int smap_tilemanager::state(const smap_tileaddress &tile) const
{
    int qs = m_queue.state(tile);
    if (qs == smap_fetchqueue::S_INFLIGHT)
        return S_FETCHING;
    if (qs == smap_fetchqueue::S_QUEUED)
        return S_QUEUED;

    smap_image_ptr img;
    if (m_ramtier.get(tile, m_clock(), img) == smap_ramtier::R_CACHED)
        return S_CACHED;
    if (m_ramtier.isfailed(tile))
        return S_FAILED;

    return S_UNREQUESTED;
}

void smap_tilemanager::callback(smap_workerpool::donefct_t fct, void *userdata)
{
    smap_mutexlocker lock(m_cblock);
    m_callback = fct;
    m_userdata = userdata;
}

void smap_tilemanager::worker_callback(const smap_tileaddress &tile, int rc, void *userdata)
{
    smap_tilemanager *tm = reinterpret_cast<smap_tilemanager*>(userdata);

    smap_workerpool::donefct_t fct;
    void *ud;
    {
        smap_mutexlocker lock(tm->m_cblock);
        fct = tm->m_callback;
        ud = tm->m_userdata;
    }

    // Unlocked, the callback may well install another one
    if (fct)
        fct(tile, rc, ud);
}

bool smap_tilemanager::stale(const smap_tileaddress &tile, void *userdata)
{
    const smap_tilerange *keep = reinterpret_cast<const smap_tilerange*>(userdata);
    return !keep->contains(tile);
}
