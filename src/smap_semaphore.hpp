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

#ifndef _SMAP_SEMAPHORE_HPP
#define _SMAP_SEMAPHORE_HPP

#include <boost/interprocess/sync/interprocess_semaphore.hpp>

class smap_semaphore
{
    public:
        smap_semaphore(unsigned int count);
        ~smap_semaphore();

        int wait();
        int post();

        // Wait at most ms milliseconds. Returns 1 on timeout.
        int timedwait(unsigned int ms);

    private:
        smap_semaphore(const smap_semaphore&);
        smap_semaphore& operator=(const smap_semaphore&);

        boost::interprocess::interprocess_semaphore m_sem;
};

class smap_mutex
{
    public:
        smap_mutex() : m_sem(1) {;};
        ~smap_mutex() {;};

        int acquire();
        int release();

    private:
        smap_semaphore m_sem;
};

class smap_mutexlocker
{
    public:
        smap_mutexlocker(smap_mutex &mutex) : m_mutex(mutex) {
            m_mutex.acquire();
        };
        ~smap_mutexlocker() {
            m_mutex.release();
        }

    private:
        smap_mutex &m_mutex;
};

#endif // _SMAP_SEMAPHORE_HPP
