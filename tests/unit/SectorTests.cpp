#include <gtest/gtest.h>
#include "Mcrw/Classic/Sector.h"

using namespace mcrw;

TEST(SectorTests, SmallSectorsHoldFourBlocks)
{
    for (uint16_t n = 0; n < 32; ++n)
    {
        const Sector sector = Sector::resolve(n);
        EXPECT_EQ(sector.number, n);
        EXPECT_EQ(sector.startBlock, 4 * n);
        EXPECT_EQ(sector.blocksInSector, 4);
        EXPECT_EQ(sector.dataBlocks(), 3);
        EXPECT_EQ(sector.trailerBlock(), 4 * n + 3);
    }
}

TEST(SectorTests, LargeSectorsHoldSixteenBlocks)
{
    for (uint16_t n = 32; n < 40; ++n)
    {
        const Sector sector = Sector::resolve(n);
        EXPECT_EQ(sector.startBlock, 128 + 16 * (n - 32));
        EXPECT_EQ(sector.blocksInSector, 16);
        EXPECT_EQ(sector.dataBlocks(), 15);
    }

    EXPECT_EQ(Sector::resolve(39).trailerBlock(), 255);
}

TEST(SectorTests, TrailerDetectionMatchesSectorLayout)
{
    for (uint16_t block = 0; block < 256; ++block)
    {
        const Sector sector = Sector::resolve(sectorOfBlock(block));
        EXPECT_TRUE(sector.contains(block)) << "block " << block;
        EXPECT_EQ(isSectorTrailer(block), block == sector.trailerBlock()) << "block " << block;
    }
}

TEST(SectorTests, KnownTrailers)
{
    EXPECT_TRUE(isSectorTrailer(3));
    EXPECT_TRUE(isSectorTrailer(63));
    EXPECT_TRUE(isSectorTrailer(127));
    EXPECT_TRUE(isSectorTrailer(143));
    EXPECT_FALSE(isSectorTrailer(131));
    EXPECT_FALSE(isSectorTrailer(4));
}
