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

#include <boost/bind/bind.hpp>
#include "smap_thread.hpp"

smap_thread::smap_thread(threadfct_t fct) :
    m_fct(fct),
    m_thread(NULL)
{
    ;
}

smap_thread::~smap_thread()
{
    // A destroyed boost::thread detaches, make sure nothing outlives us
    join();
    delete m_thread;
}

int smap_thread::run(void *userdata)
{
    if (m_thread)
        return 1;

    m_thread = new boost::thread(
            boost::bind(m_fct, userdata));

    return 0;
}

int smap_thread::join()
{
    if (!m_thread)
        return 1;

    if (m_thread->joinable())
        m_thread->join();

    return 0;
}
