#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include "smap_disktier.hpp"
#include "smap_workerpool.hpp"
#include "smap_testutil.hpp"

namespace {

struct outcome {
    outcome() : calls(0), rc(-1) {;};
    smap_mutex lock;
    int calls;
    int rc;
};

void record(const smap_tileaddress &tile, int rc, void *userdata)
{
    (void)tile;
    outcome *o = reinterpret_cast<outcome*>(userdata);
    smap_mutexlocker lock(o->lock);
    o->calls++;
    o->rc = rc;
}

}

class WorkerPoolTest : public ::testing::Test
{
    protected:
        WorkerPoolTest() :
            m_disk(m_dir.str()),
            m_pool(m_queue, m_ram, m_disk, m_mock) {;};

        void SetUp() {
            smap_test_clock_set(boost::posix_time::ptime(
                        boost::gregorian::date(2024, 1, 1), boost::posix_time::hours(12)));
            m_pool.clock(smap_test_clock);
            m_pool.cooldown(30000);
            m_pool.callback(record, &m_outcome);
        }

        void TearDown() {
            m_mock.hold(false);
            m_pool.shutdown();
        }

        // Wait for n callbacks, returns the last rc
        int waitcalls(int n) {
            for (int i = 0; i < 1000; i++) {
                {
                    smap_mutexlocker lock(m_outcome.lock);
                    if (m_outcome.calls >= n)
                        return m_outcome.rc;
                }
                boost::this_thread::sleep(boost::posix_time::milliseconds(5));
            }
            return -1;
        }

        smap_testdir m_dir;
        smap_mocksource m_mock;
        smap_fetchqueue m_queue;
        smap_ramtier m_ram;
        smap_disktier m_disk;
        outcome m_outcome;
        smap_workerpool m_pool;
};

TEST_F(WorkerPoolTest, PublishesToBothTiers)
{
    smap_tileaddress tile(3, 2, 1);
    ASSERT_EQ(smap_fetchqueue::Q_QUEUED, m_queue.qput(tile));
    ASSERT_EQ(0, m_pool.start(1));
    EXPECT_EQ((size_t)1, m_pool.workers());

    EXPECT_EQ(0, waitcalls(1));
    smap_image_ptr img;
    EXPECT_EQ(smap_ramtier::R_CACHED, m_ram.get(tile, smap_test_clock(), img));
    EXPECT_TRUE(m_disk.exists(tile));
    EXPECT_EQ((size_t)0, m_queue.inflight());
}

TEST_F(WorkerPoolTest, CoolingDownTileIsNotFetchedAgain)
{
    // Failed by another worker just before it was queued once more
    smap_tileaddress tile(5, 7, 9);
    ASSERT_EQ(0, m_ram.fail(tile, smap_test_clock() + boost::posix_time::seconds(10)));
    ASSERT_EQ(smap_fetchqueue::Q_QUEUED, m_queue.qput(tile));
    ASSERT_EQ(0, m_pool.start(1));

    EXPECT_EQ(1, waitcalls(1));
    EXPECT_EQ(0, m_mock.fetches());
    EXPECT_FALSE(m_disk.exists(tile));
    EXPECT_EQ((size_t)0, m_queue.inflight());

    // The original cooldown stands
    smap_image_ptr img;
    smap_test_clock_advance(9000);
    EXPECT_EQ(smap_ramtier::R_FAILED, m_ram.get(tile, smap_test_clock(), img));
    smap_test_clock_advance(1000);
    EXPECT_EQ(smap_ramtier::R_MISSING, m_ram.get(tile, smap_test_clock(), img));
}

TEST_F(WorkerPoolTest, RefusesSecondStart)
{
    ASSERT_EQ(0, m_pool.start(2));
    EXPECT_EQ(1, m_pool.start(2));
    EXPECT_EQ((size_t)2, m_pool.workers());

    EXPECT_EQ(0, m_pool.shutdown());
    EXPECT_EQ((size_t)0, m_pool.workers());
}
