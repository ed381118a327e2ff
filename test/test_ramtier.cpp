#include <gtest/gtest.h>
#include <boost/bind/bind.hpp>
#include <boost/thread/thread.hpp>
#include "smap_ramtier.hpp"

namespace {

boost::posix_time::ptime at(int secs)
{
    return boost::posix_time::ptime(boost::gregorian::date(2024, 1, 1), boost::posix_time::seconds(secs));
}

smap_image_ptr solid(int w, int h)
{
    return smap_image_ptr(new smap_image(w, h, 3));
}

void writer(smap_ramtier *ram, int row)
{
    for (int x = 0; x < 64; x++)
        ram->put(smap_tileaddress(6, x, row), solid(1, 1));
}

void reader(smap_ramtier *ram, int *seen)
{
    for (int i = 0; i < 2000; i++) {
        smap_image_ptr img;
        if (ram->get(smap_tileaddress(6, i % 64, i % 4), at(0), img) == smap_ramtier::R_CACHED) {
            if (img && (img->w() == 1))
                (*seen)++;
        }
    }
}

}

TEST(RamTier, MissingUntilPut)
{
    smap_ramtier ram;
    smap_tileaddress a(3, 2, 1);
    smap_image_ptr img;

    EXPECT_EQ(smap_ramtier::R_MISSING, ram.get(a, at(0), img));
    EXPECT_FALSE(img);

    smap_image_ptr stored = solid(4, 4);
    ASSERT_EQ(0, ram.put(a, stored));
    ASSERT_EQ(smap_ramtier::R_CACHED, ram.get(a, at(0), img));
    EXPECT_EQ(stored.get(), img.get());
    EXPECT_EQ((size_t)1, ram.size());

    EXPECT_EQ(1, ram.put(a, smap_image_ptr()));
}

TEST(RamTier, FailedTileCoolsDown)
{
    smap_ramtier ram;
    smap_tileaddress a(9, 100, 200);
    smap_image_ptr img;

    ASSERT_EQ(0, ram.fail(a, at(30)));
    EXPECT_TRUE(ram.isfailed(a));
    EXPECT_EQ((size_t)0, ram.size());
    EXPECT_EQ((size_t)1, ram.failed());

    EXPECT_EQ(smap_ramtier::R_FAILED, ram.get(a, at(0), img));
    EXPECT_EQ(smap_ramtier::R_FAILED, ram.get(a, at(29), img));
    EXPECT_EQ(smap_ramtier::R_MISSING, ram.get(a, at(30), img));
    EXPECT_EQ(smap_ramtier::R_MISSING, ram.get(a, at(600), img));

    // Other tiles are unaffected
    EXPECT_EQ(smap_ramtier::R_MISSING, ram.get(smap_tileaddress(9, 101, 200), at(0), img));
}

TEST(RamTier, SuccessClearsFailure)
{
    smap_ramtier ram;
    smap_tileaddress a(9, 100, 200);
    smap_image_ptr img;

    ram.fail(a, at(30));
    ASSERT_EQ(0, ram.put(a, solid(2, 2)));
    EXPECT_FALSE(ram.isfailed(a));
    EXPECT_EQ(smap_ramtier::R_CACHED, ram.get(a, at(0), img));
    EXPECT_EQ((size_t)0, ram.failed());

    // A cached tile is never downgraded
    EXPECT_EQ(1, ram.fail(a, at(60)));
    EXPECT_EQ(smap_ramtier::R_CACHED, ram.get(a, at(0), img));
}

TEST(RamTier, ConcurrentReadersAndWriters)
{
    smap_ramtier ram;
    int seen[4] = { 0, 0, 0, 0 };

    boost::thread_group threads;
    for (int i = 0; i < 4; i++) {
        threads.create_thread(boost::bind(writer, &ram, i));
        threads.create_thread(boost::bind(reader, &ram, &seen[i]));
    }
    threads.join_all();

    EXPECT_EQ((size_t)(4 * 64), ram.size());

    smap_image_ptr img;
    for (int row = 0; row < 4; row++)
        for (int x = 0; x < 64; x++)
            EXPECT_EQ(smap_ramtier::R_CACHED, ram.get(smap_tileaddress(6, x, row), at(0), img));
}
