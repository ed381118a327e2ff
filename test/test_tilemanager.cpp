#include <set>
#include <fstream>
#include <gtest/gtest.h>
#include <boost/bind/bind.hpp>
#include <boost/thread/thread.hpp>
#include "smap_disktier.hpp"
#include "smap_tilemanager.hpp"
#include "smap_testutil.hpp"

namespace {

void hammer(smap_tilemanager *tm, smap_tileaddress tile)
{
    for (int i = 0; i < 50; i++) {
        smap_image_ptr img;
        tm->request(tile, img);
    }
}

struct donecounter {
    donecounter() : ok(0), failed(0) {;};
    smap_mutex lock;
    int ok;
    int failed;
};

void count_done(const smap_tileaddress &tile, int rc, void *userdata)
{
    (void)tile;
    donecounter *c = reinterpret_cast<donecounter*>(userdata);
    smap_mutexlocker lock(c->lock);
    if (rc == 0)
        c->ok++;
    else
        c->failed++;
}

struct selfremover {
    selfremover() : tm(NULL), calls(0) {;};
    smap_tilemanager *tm;
    smap_mutex lock;
    int calls;
};

// Uninstalls itself the first time round
void remove_self(const smap_tileaddress &tile, int rc, void *userdata)
{
    (void)tile;
    (void)rc;
    selfremover *r = reinterpret_cast<selfremover*>(userdata);
    r->tm->callback(NULL, NULL);

    smap_mutexlocker lock(r->lock);
    r->calls++;
}

}

class TileManagerTest : public ::testing::Test
{
    protected:
        TileManagerTest() : m_disk(NULL), m_tm(NULL) {;};

        void SetUp() {
            smap_test_clock_set(boost::posix_time::ptime(
                        boost::gregorian::date(2024, 1, 1), boost::posix_time::hours(12)));
            m_disk = new smap_disktier(m_dir.str());
        }

        void TearDown() {
            // Workers stuck at the gate would never see the shutdown
            m_mock.hold(false);
            delete m_tm;
            delete m_disk;
        }

        void create(unsigned int workers = 2) {
            smap_tileconfig cfg;
            cfg.workers = workers;
            cfg.cooldown = 30000;
            m_tm = new smap_tilemanager(cfg, *m_disk, m_mock, smap_test_clock);
        }

        // Ask for tile until it is no longer pending
        int waitfor(const smap_tileaddress &tile, smap_image_ptr &img, unsigned int ms = 5000) {
            int rc = smap_tilemanager::T_PENDING;
            for (unsigned int waited = 0; waited < ms; waited += 5) {
                rc = m_tm->request(tile, img);
                if (rc != smap_tilemanager::T_PENDING)
                    break;
                boost::this_thread::sleep(boost::posix_time::milliseconds(5));
            }
            return rc;
        }

        smap_testdir m_dir;
        smap_mocksource m_mock;
        smap_disktier *m_disk;
        smap_tilemanager *m_tm;
};

TEST_F(TileManagerTest, ResolvesThroughSourceAndDisk)
{
    create();
    smap_tileaddress tile(3, 2, 1);
    smap_image_ptr img;

    EXPECT_EQ(smap_tilemanager::T_PENDING, m_tm->request(tile, img));
    EXPECT_FALSE(img);

    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(tile, img));
    ASSERT_TRUE(img);
    EXPECT_EQ(4, img->w());
    EXPECT_EQ(4, img->h());
    for (int c = 0; c < 3; c++)
        EXPECT_EQ(smap_mocksource::COLOR[c], img->at(3, 3, c));

    EXPECT_EQ(1, m_mock.fetches(tile));
    EXPECT_EQ(smap_tilemanager::S_CACHED, m_tm->state(tile));
    EXPECT_TRUE(boost::filesystem::is_regular_file(m_dir.path() / "3" / "2" / "1.png"));

    std::vector<unsigned char> ondisk;
    ASSERT_EQ(0, m_disk->get(tile, ondisk));
    EXPECT_EQ(m_mock.png(), ondisk);
}

TEST_F(TileManagerTest, ConcurrentRequestsFetchOnce)
{
    create(4);
    smap_tileaddress tile(10, 530, 360);

    m_mock.hold(true);

    boost::thread_group callers;
    for (int i = 0; i < 8; i++)
        callers.create_thread(boost::bind(hammer, m_tm, tile));

    ASSERT_EQ(0, m_mock.waitheld(1, 5000));
    EXPECT_EQ(smap_tilemanager::S_FETCHING, m_tm->state(tile));

    callers.join_all();
    m_mock.hold(false);

    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(tile, img));
    EXPECT_EQ(1, m_mock.fetches(tile));
    EXPECT_EQ(1, m_mock.fetches());
}

TEST_F(TileManagerTest, CachedTileNeverRefetched)
{
    create();
    smap_tileaddress tile(5, 16, 11);
    smap_image_ptr img;

    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(tile, img));
    smap_image_ptr first = img;

    for (int i = 0; i < 100; i++) {
        ASSERT_EQ(smap_tilemanager::T_CACHED, m_tm->request(tile, img));
        EXPECT_EQ(first.get(), img.get());
    }

    EXPECT_EQ(1, m_mock.fetches());
    EXPECT_EQ((size_t)1, m_tm->cached());
}

TEST_F(TileManagerTest, FailedTileCoolsDown)
{
    create();
    smap_tileaddress bad(8, 100, 90), good(8, 101, 90);
    smap_image_ptr img;

    m_mock.fail(bad, true);
    ASSERT_EQ(smap_tilemanager::T_FAILED, waitfor(bad, img));
    EXPECT_EQ(smap_tilemanager::S_FAILED, m_tm->state(bad));
    EXPECT_EQ(1, m_mock.fetches(bad));

    // No new attempt while cooling down
    smap_test_clock_advance(29000);
    for (int i = 0; i < 20; i++)
        EXPECT_EQ(smap_tilemanager::T_FAILED, m_tm->request(bad, img));
    EXPECT_EQ(1, m_mock.fetches(bad));

    // Neighbours are not held back
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(good, img));

    // Cooldown over, the server recovered
    smap_test_clock_advance(1000);
    m_mock.fail(bad, false);
    EXPECT_EQ(smap_tilemanager::T_PENDING, m_tm->request(bad, img));
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(bad, img));
    EXPECT_EQ(2, m_mock.fetches(bad));
    EXPECT_EQ(smap_tilemanager::S_CACHED, m_tm->state(bad));
}

TEST_F(TileManagerTest, UnwritableCacheGivesUpForTheSession)
{
    // A regular file where the cache root has to go
    std::ofstream((m_dir.path() / "blocker").string().c_str()) << "x";
    delete m_disk;
    m_disk = new smap_disktier((m_dir.path() / "blocker").string());
    create();

    smap_tileaddress tile(3, 2, 1);
    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_FAILED, waitfor(tile, img));
    EXPECT_FALSE(img);
    EXPECT_EQ(smap_tilemanager::S_FAILED, m_tm->state(tile));
    EXPECT_EQ((size_t)0, m_tm->cached());

    // A day later it is still not asked for again
    smap_test_clock_advance(24u * 3600u * 1000u);
    for (int i = 0; i < 20; i++)
        EXPECT_EQ(smap_tilemanager::T_FAILED, m_tm->request(tile, img));
    EXPECT_EQ(smap_tilemanager::S_FAILED, m_tm->state(tile));
    EXPECT_EQ(1, m_mock.fetches(tile));
}

TEST_F(TileManagerTest, DiskHitSkipsSource)
{
    create();
    smap_tileaddress tile(6, 33, 22);

    const std::vector<unsigned char> &png = m_mock.png();
    ASSERT_EQ(0, m_disk->put(tile, &png[0], png.size()));

    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(tile, img));
    EXPECT_EQ(4, img->w());
    EXPECT_EQ(0, m_mock.fetches());
}

TEST_F(TileManagerTest, CorruptDiskFileIsReplaced)
{
    create();
    smap_tileaddress tile(6, 33, 22);

    const unsigned char garbage[] = "not a png at all";
    ASSERT_EQ(0, m_disk->put(tile, garbage, sizeof(garbage)));

    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(tile, img));
    EXPECT_EQ(1, m_mock.fetches(tile));

    std::vector<unsigned char> ondisk;
    ASSERT_EQ(0, m_disk->get(tile, ondisk));
    EXPECT_EQ(m_mock.png(), ondisk);
}

TEST_F(TileManagerTest, CorruptPayloadIsNotStored)
{
    create();
    smap_tileaddress tile(7, 64, 40);
    m_mock.corrupt(tile, true);

    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_FAILED, waitfor(tile, img));
    EXPECT_FALSE(m_disk->exists(tile));
    EXPECT_TRUE(m_dir.files().empty());
}

TEST_F(TileManagerTest, InvalidAddresses)
{
    create();
    smap_image_ptr img;

    EXPECT_EQ(smap_tilemanager::T_INVALID, m_tm->request(smap_tileaddress(2, 4, 0), img));
    EXPECT_EQ(smap_tilemanager::T_INVALID, m_tm->request(smap_tileaddress(2, 0, -1), img));
    EXPECT_EQ(smap_tilemanager::T_INVALID, m_tm->request(smap_tileaddress(-1, 0, 0), img));

    std::vector<smap_tileaddress> tiles;
    tiles.push_back(smap_tileaddress(1, 2, 2));
    EXPECT_EQ((size_t)0, m_tm->preload(tiles));
    EXPECT_EQ((size_t)0, m_tm->queued());
    EXPECT_EQ(0, m_mock.fetches());
}

TEST_F(TileManagerTest, PreloadQueuesOnlyTheRing)
{
    create(1);
    m_mock.hold(true);

    smap_viewport vp(512, 512, 5);
    vp.move(1024.0, 1024.0);

    EXPECT_EQ((size_t)12, m_tm->preload(vp, 1));
    ASSERT_EQ(0, m_mock.waitheld(1, 5000));

    smap_tilerange inner = m_tm->visible(vp);
    smap_tilerange outer = m_tm->visible(vp, 1);
    ASSERT_EQ((size_t)4, inner.size());
    ASSERT_EQ((size_t)16, outer.size());

    int fetching = 0;
    for (smap_tilerange::const_iterator it = outer.begin(); it != outer.end(); ++it) {
        int s = m_tm->state(*it);
        if (inner.contains(*it)) {
            EXPECT_EQ(smap_tilemanager::S_UNREQUESTED, s) << *it;
        } else {
            EXPECT_TRUE((s == smap_tilemanager::S_QUEUED) || (s == smap_tilemanager::S_FETCHING)) << *it;
            if (s == smap_tilemanager::S_FETCHING)
                fetching++;
        }
    }
    EXPECT_EQ(1, fetching);
    EXPECT_EQ((size_t)11, m_tm->queued());
    EXPECT_EQ(smap_tilemanager::S_UNREQUESTED, m_tm->state(smap_tileaddress(5, 7, 4)));

    // Everything is already asked for
    EXPECT_EQ((size_t)0, m_tm->preload(vp, 1));
}

TEST_F(TileManagerTest, FrameServesVisibleTilesFirst)
{
    create(1);
    m_mock.hold(true);

    smap_viewport vp(1000, 800, 13);
    ASSERT_EQ(0, vp.center(47.6386, 6.8631));

    size_t n = m_tm->frame(vp, 2);
    smap_tilerange inner = m_tm->visible(vp);
    smap_tilerange outer = m_tm->visible(vp, 2);
    ASSERT_EQ(outer.size(), n);
    ASSERT_GT(outer.size(), 2 * inner.size());

    ASSERT_EQ(0, m_mock.waitheld(1, 5000));
    m_mock.hold(false);
    for (int i = 0; i < 1000 && (m_mock.fetches() < (int)n); i++)
        boost::this_thread::sleep(boost::posix_time::milliseconds(5));

    std::vector<smap_tileaddress> order = m_mock.order();
    ASSERT_EQ(n, order.size());

    // The worker may have taken a ring tile before the visible ones were
    // queued, everything after that has to be on screen first
    size_t first = inner.contains(order[0]) ? 0 : 1;
    for (size_t i = first; i < first + inner.size(); i++)
        EXPECT_TRUE(inner.contains(order[i])) << "fetch #" << i << ": " << order[i];

    // Nothing queued twice
    EXPECT_EQ(n, std::set<smap_tileaddress>(order.begin(), order.end()).size());
}

TEST_F(TileManagerTest, CancelStaleDropsFarTiles)
{
    create(1);
    m_mock.hold(true);

    smap_viewport vp(512, 512, 5);
    vp.move(1024.0, 1024.0);

    smap_image_ptr img;
    smap_tilerange range = m_tm->visible(vp);
    for (smap_tilerange::const_iterator it = range.begin(); it != range.end(); ++it)
        EXPECT_EQ(smap_tilemanager::T_PENDING, m_tm->request(*it, img));
    ASSERT_EQ(0, m_mock.waitheld(1, 5000));
    ASSERT_EQ((size_t)3, m_tm->queued());

    // Scroll far to the east
    vp.move(4096.0, 0.0);
    EXPECT_EQ((size_t)3, m_tm->cancel_stale(vp, 1));
    EXPECT_EQ((size_t)0, m_tm->queued());

    // The tile in flight is finished regardless
    m_mock.hold(false);
    for (int i = 0; i < 1000 && (m_tm->cached() < 1); i++)
        boost::this_thread::sleep(boost::posix_time::milliseconds(5));
    EXPECT_EQ((size_t)1, m_tm->cached());
    EXPECT_EQ(1, m_mock.fetches());
}

TEST_F(TileManagerTest, CallbackReportsOutcome)
{
    create();
    donecounter done;
    m_tm->callback(count_done, &done);

    smap_tileaddress good(4, 3, 3), bad(4, 3, 4);
    m_mock.fail(bad, true);

    smap_image_ptr img;
    m_tm->request(good, img);
    m_tm->request(bad, img);

    for (int i = 0; i < 1000; i++) {
        {
            smap_mutexlocker lock(done.lock);
            if ((done.ok + done.failed) >= 2)
                break;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(5));
    }

    m_tm->callback(NULL, NULL);

    smap_mutexlocker lock(done.lock);
    EXPECT_EQ(1, done.ok);
    EXPECT_EQ(1, done.failed);
}

TEST_F(TileManagerTest, CallbackMayReplaceItself)
{
    create(1);
    selfremover r;
    r.tm = m_tm;
    m_tm->callback(remove_self, &r);

    smap_image_ptr img;
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(smap_tileaddress(4, 1, 1), img));
    for (int i = 0; i < 1000; i++) {
        {
            smap_mutexlocker lock(r.lock);
            if (r.calls > 0)
                break;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(5));
    }

    // The worker is still alive and nobody is called anymore
    ASSERT_EQ(smap_tilemanager::T_CACHED, waitfor(smap_tileaddress(4, 1, 2), img));

    smap_mutexlocker lock(r.lock);
    EXPECT_EQ(1, r.calls);
}

TEST_F(TileManagerTest, NothingQueuedAfterShutdown)
{
    create();
    EXPECT_EQ(0, m_tm->shutdown());

    smap_image_ptr img;
    smap_tileaddress tile(9, 1, 1);
    EXPECT_EQ(smap_tilemanager::T_PENDING, m_tm->request(tile, img));
    EXPECT_EQ(smap_tilemanager::S_UNREQUESTED, m_tm->state(tile));
    EXPECT_EQ(0, m_mock.fetches());
}
