#include <gtest/gtest.h>
#include "smap_tileserver.hpp"

TEST(TileServer, UrlSubstitution)
{
    smap_tileserver ts("https://a.basemaps.cartocdn.com/light_all/{z}/{x}/{y}.png", "slipmap-test", 5);
    std::string u;

    ASSERT_EQ(0, ts.url(smap_tileaddress(13, 4252, 2859), u));
    EXPECT_EQ("https://a.basemaps.cartocdn.com/light_all/13/4252/2859.png", u);

    ASSERT_EQ(0, ts.url(smap_tileaddress(0, 0, 0), u));
    EXPECT_EQ("https://a.basemaps.cartocdn.com/light_all/0/0/0.png", u);
}

TEST(TileServer, RepeatedAndReorderedPlaceholders)
{
    smap_tileserver ts("http://tiles.example.org/{z}-{y}-{x}?z={z}", "slipmap-test", 5);
    std::string u;

    ASSERT_EQ(0, ts.url(smap_tileaddress(4, 3, 9), u));
    EXPECT_EQ("http://tiles.example.org/4-9-3?z=4", u);
}

TEST(TileServer, InvalidTileIsNotRequested)
{
    smap_tileserver ts("http://127.0.0.1:1/{z}/{x}/{y}.png", "slipmap-test", 1);
    std::string u = "unchanged";
    std::vector<unsigned char> buf;

    EXPECT_EQ(1, ts.url(smap_tileaddress(2, 4, 0), u));
    EXPECT_EQ("unchanged", u);
    EXPECT_EQ(1, ts.fetch(smap_tileaddress(2, 4, 0), buf));
    EXPECT_TRUE(buf.empty());
}

TEST(TileServer, UnreachableServerFails)
{
    // Nothing listens on port 1 of the loopback interface
    smap_tileserver ts("http://127.0.0.1:1/{z}/{x}/{y}.png", "slipmap-test", 1);
    std::vector<unsigned char> buf;

    EXPECT_EQ(1, ts.fetch(smap_tileaddress(1, 0, 0), buf));
    EXPECT_TRUE(buf.empty());
}
