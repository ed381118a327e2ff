#include <vector>
#include <gtest/gtest.h>
#include <boost/bind/bind.hpp>
#include <boost/thread/thread.hpp>
#include "smap_fetchqueue.hpp"

namespace {

bool other_zoom(const smap_tileaddress &tile, void *userdata)
{
    return tile.z() != *(int*)userdata;
}

void push_many(smap_fetchqueue *q, smap_tileaddress tile, int n)
{
    for (int i = 0; i < n; i++)
        q->qput(tile);
}

void pop_one(smap_fetchqueue *q, int *rc)
{
    smap_tileaddress tile;
    *rc = q->qget(tile);
}

}

TEST(FetchQueue, MostRecentFirst)
{
    smap_fetchqueue q;
    smap_tileaddress a(4, 1, 1), b(4, 1, 2), c(4, 1, 3);

    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(a));
    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(b));
    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(c));
    EXPECT_EQ((size_t)3, q.size());

    smap_tileaddress t;
    ASSERT_EQ(0, q.qget(t));
    EXPECT_EQ(c, t);
    ASSERT_EQ(0, q.qget(t));
    EXPECT_EQ(b, t);
    ASSERT_EQ(0, q.qget(t));
    EXPECT_EQ(a, t);
    EXPECT_EQ((size_t)0, q.size());
    EXPECT_EQ((size_t)3, q.inflight());
}

TEST(FetchQueue, DuplicatesAreRefused)
{
    smap_fetchqueue q;
    smap_tileaddress a(7, 10, 20);

    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(a));
    EXPECT_EQ(smap_fetchqueue::Q_PENDING, q.qput(a));
    EXPECT_EQ((size_t)1, q.size());
    EXPECT_EQ(smap_fetchqueue::S_QUEUED, q.state(a));

    // Still refused while a worker holds it
    smap_tileaddress t;
    ASSERT_EQ(0, q.qget(t));
    EXPECT_EQ(smap_fetchqueue::S_INFLIGHT, q.state(a));
    EXPECT_EQ(smap_fetchqueue::Q_PENDING, q.qput(a));
    EXPECT_EQ((size_t)0, q.size());

    // And accepted again once the worker is finished
    EXPECT_EQ(0, q.done(a));
    EXPECT_EQ(smap_fetchqueue::S_NONE, q.state(a));
    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(a));
}

TEST(FetchQueue, DoneForUnknownTile)
{
    smap_fetchqueue q;
    EXPECT_EQ(1, q.done(smap_tileaddress(1, 0, 0)));

    q.qput(smap_tileaddress(1, 0, 0));
    EXPECT_EQ(1, q.done(smap_tileaddress(1, 0, 0)));
}

TEST(FetchQueue, ConcurrentPushesOfOneTile)
{
    smap_fetchqueue q;
    smap_tileaddress a(12, 2000, 1400);

    boost::thread_group producers;
    for (int i = 0; i < 8; i++)
        producers.create_thread(boost::bind(push_many, &q, a, 200));
    producers.join_all();

    EXPECT_EQ((size_t)1, q.size());

    smap_tileaddress t;
    ASSERT_EQ(0, q.qget(t, 100));
    EXPECT_EQ(a, t);
    EXPECT_EQ(1, q.qget(t, 50));
}

TEST(FetchQueue, CancelStaleKeepsInflight)
{
    smap_fetchqueue q;
    int keep = 5;

    q.qput(smap_tileaddress(4, 0, 0));
    q.qput(smap_tileaddress(5, 0, 0));
    q.qput(smap_tileaddress(4, 0, 1));

    // Hand the most recent one to a worker
    smap_tileaddress t;
    ASSERT_EQ(0, q.qget(t));
    EXPECT_EQ(smap_tileaddress(4, 0, 1), t);

    q.qput(smap_tileaddress(4, 1, 1));
    q.qput(smap_tileaddress(5, 1, 1));

    EXPECT_EQ((size_t)2, q.cancel_stale(other_zoom, &keep));
    EXPECT_EQ((size_t)2, q.size());
    EXPECT_EQ(smap_fetchqueue::S_NONE, q.state(smap_tileaddress(4, 0, 0)));
    EXPECT_EQ(smap_fetchqueue::S_NONE, q.state(smap_tileaddress(4, 1, 1)));
    EXPECT_EQ(smap_fetchqueue::S_INFLIGHT, q.state(smap_tileaddress(4, 0, 1)));

    // Leftover wakeups do not hand out phantom tiles
    ASSERT_EQ(0, q.qget(t, 100));
    EXPECT_EQ(smap_tileaddress(5, 1, 1), t);
    ASSERT_EQ(0, q.qget(t, 100));
    EXPECT_EQ(smap_tileaddress(5, 0, 0), t);
    EXPECT_EQ(1, q.qget(t, 50));

    // A cancelled tile can be asked for again
    EXPECT_EQ(smap_fetchqueue::Q_QUEUED, q.qput(smap_tileaddress(4, 0, 0)));
}

TEST(FetchQueue, TimedGetTimesOut)
{
    smap_fetchqueue q;
    smap_tileaddress t;

    boost::posix_time::ptime t0 = boost::posix_time::microsec_clock::universal_time();
    EXPECT_EQ(1, q.qget(t, 100));
    boost::posix_time::time_duration took = boost::posix_time::microsec_clock::universal_time() - t0;

    EXPECT_GE(took.total_milliseconds(), 90);
}

TEST(FetchQueue, StopWakesAllWaiters)
{
    smap_fetchqueue q;
    int rc[4] = { -1, -1, -1, -1 };

    boost::thread_group workers;
    for (int i = 0; i < 4; i++)
        workers.create_thread(boost::bind(pop_one, &q, &rc[i]));

    boost::this_thread::sleep(boost::posix_time::milliseconds(50));
    q.stop();
    workers.join_all();

    for (int i = 0; i < 4; i++)
        EXPECT_EQ(1, rc[i]);

    EXPECT_TRUE(q.stopped());
    EXPECT_EQ(smap_fetchqueue::Q_STOPPED, q.qput(smap_tileaddress(1, 0, 0)));
}

TEST(FetchQueue, StopDropsQueuedTiles)
{
    smap_fetchqueue q;
    q.qput(smap_tileaddress(3, 1, 1));
    q.qput(smap_tileaddress(3, 1, 2));
    q.stop();

    EXPECT_EQ((size_t)0, q.size());

    smap_tileaddress t;
    EXPECT_EQ(1, q.qget(t));
    EXPECT_EQ(1, q.qget(t, 10));
}
