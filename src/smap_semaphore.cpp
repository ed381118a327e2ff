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
#include "smap_semaphore.hpp"

smap_semaphore::smap_semaphore(unsigned int count) :
    m_sem(count)
{
    ;
}

smap_semaphore::~smap_semaphore()
{
    ;
}

int smap_semaphore::wait()
{
    m_sem.wait();
    return 0;
}

int smap_semaphore::post()
{
    m_sem.post();
    return 0;
}

int smap_semaphore::timedwait(unsigned int ms)
{
    // interprocess primitives take absolute universal time
    boost::posix_time::ptime deadline =
        boost::posix_time::microsec_clock::universal_time() +
        boost::posix_time::milliseconds(ms);

    return m_sem.timed_wait(deadline) ? 0 : 1;
}

int smap_mutex::acquire()
{
    return m_sem.wait();
}

int smap_mutex::release()
{
    return m_sem.post();
}
