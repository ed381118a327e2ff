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

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "smap_fetchqueue.hpp"

const int smap_fetchqueue::Q_QUEUED;
const int smap_fetchqueue::Q_STOPPED;
const int smap_fetchqueue::Q_PENDING;
const int smap_fetchqueue::S_NONE;
const int smap_fetchqueue::S_QUEUED;
const int smap_fetchqueue::S_INFLIGHT;

smap_fetchqueue::smap_fetchqueue() :
    m_stopped(false),
    m_counter(0)
{
    ;
}

smap_fetchqueue::~smap_fetchqueue()
{
    stop();
}

int smap_fetchqueue::qput(const smap_tileaddress &tile)
{
    smap_mutexlocker lock(m_protector);

    if (m_stopped)
        return Q_STOPPED;

    // Somebody asked for this one already
    if ((m_queued.find(tile) != m_queued.end()) ||
        (m_inflight.find(tile) != m_inflight.end()))
        return Q_PENDING;

    m_container.push_back(tile);
    m_queued.insert(tile);
    m_counter.post();

    return Q_QUEUED;
}

int smap_fetchqueue::qget(smap_tileaddress &tile)
{
    for (;;) {
        m_counter.wait();

        int rc = take(tile);

        // Permits left over from cancel_stale() leave the stack empty
        if (rc == 2)
            continue;

        return rc;
    }
}

int smap_fetchqueue::qget(smap_tileaddress &tile, unsigned int ms)
{
    boost::posix_time::ptime deadline =
        boost::posix_time::microsec_clock::universal_time() +
        boost::posix_time::milliseconds(ms);

    for (;;) {
        boost::posix_time::ptime now = boost::posix_time::microsec_clock::universal_time();
        if (now >= deadline)
            return 1;

        if (m_counter.timedwait((unsigned int)(deadline - now).total_milliseconds()) != 0)
            return 1;

        int rc = take(tile);
        if (rc == 2)
            continue;

        return rc;
    }
}

int smap_fetchqueue::take(smap_tileaddress &tile)
{
    smap_mutexlocker lock(m_protector);

    // Pass the wakeup on so every waiter gets to see the stop
    if (m_stopped) {
        m_counter.post();
        return 1;
    }

    if (m_container.empty())
        return 2;

    // Always treat the most recent request first
    tile = m_container.back();
    m_container.pop_back();

    m_queued.erase(tile);
    m_inflight.insert(tile);

    return 0;
}

int smap_fetchqueue::done(const smap_tileaddress &tile)
{
    smap_mutexlocker lock(m_protector);

    std::set<smap_tileaddress>::iterator it = m_inflight.find(tile);
    if (it == m_inflight.end())
        return 1;

    m_inflight.erase(it);
    return 0;
}

size_t smap_fetchqueue::cancel_stale(stalefct_t fct, void *userdata)
{
    smap_mutexlocker lock(m_protector);

    size_t removed = 0;
    std::vector<smap_tileaddress>::iterator it = m_container.begin();
    while (it != m_container.end()) {
        if (fct(*it, userdata)) {
            m_queued.erase(*it);
            it = m_container.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

int smap_fetchqueue::state(const smap_tileaddress &tile) const
{
    smap_mutexlocker lock(m_protector);

    if (m_inflight.find(tile) != m_inflight.end())
        return S_INFLIGHT;
    if (m_queued.find(tile) != m_queued.end())
        return S_QUEUED;

    return S_NONE;
}

size_t smap_fetchqueue::size() const
{
    smap_mutexlocker lock(m_protector);
    return m_container.size();
}

size_t smap_fetchqueue::inflight() const
{
    smap_mutexlocker lock(m_protector);
    return m_inflight.size();
}

void smap_fetchqueue::stop()
{
    smap_mutexlocker lock(m_protector);

    if (m_stopped)
        return;

    m_stopped = true;
    m_container.clear();
    m_queued.clear();

    // One wakeup is enough, take() passes it on
    m_counter.post();
}

bool smap_fetchqueue::stopped() const
{
    smap_mutexlocker lock(m_protector);
    return m_stopped;
}
