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

#ifndef _SMAP_FETCHQUEUE_HPP
#define _SMAP_FETCHQUEUE_HPP

#include <set>
#include <vector>
#include <cstddef>
#include "smap_semaphore.hpp"
#include "smap_tileaddress.hpp"

// Pending tile downloads, served most recent first. An address is either
// queued, in flight (handed to a worker and not yet done()) or unknown to the
// queue; it is never queued twice or queued while in flight.
class smap_fetchqueue
{
    public:
        // qput() return codes
        static const int Q_QUEUED = 0;
        static const int Q_STOPPED = 1;
        static const int Q_PENDING = 2;

        // state() return codes
        static const int S_NONE = 0;
        static const int S_QUEUED = 1;
        static const int S_INFLIGHT = 2;

        typedef bool (*stalefct_t)(const smap_tileaddress &tile, void *userdata);

        smap_fetchqueue();
        ~smap_fetchqueue();

        int qput(const smap_tileaddress &tile);

        // Block until an address is available and move it to the in-flight
        // set. Returns 1 once the queue has been stopped.
        int qget(smap_tileaddress &tile);

        // Same as above but gives up after ms milliseconds
        int qget(smap_tileaddress &tile, unsigned int ms);

        // Release the in-flight slot of an address handed out by qget()
        int done(const smap_tileaddress &tile);

        // Drop every queued (not in flight) address fct considers stale.
        // Returns the number of addresses removed.
        size_t cancel_stale(stalefct_t fct, void *userdata);

        int state(const smap_tileaddress &tile) const;
        size_t size() const;
        size_t inflight() const;

        // Wake all waiting workers and refuse further work
        void stop();
        bool stopped() const;

    private:
        smap_fetchqueue(const smap_fetchqueue&);
        smap_fetchqueue& operator=(const smap_fetchqueue&);

        int take(smap_tileaddress &tile);

        // Back of the vector is the head of the stack
        std::vector<smap_tileaddress> m_container;
        std::set<smap_tileaddress> m_queued;
        std::set<smap_tileaddress> m_inflight;
        bool m_stopped;

        smap_semaphore m_counter;
        mutable smap_mutex m_protector;
};

#endif // _SMAP_FETCHQUEUE_HPP
