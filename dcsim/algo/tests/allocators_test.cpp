#include <dcsim/algo/best_fit_allocator.hpp>
#include <dcsim/algo/first_fit_allocator.hpp>
#include <dcsim/algo/placement_utils.hpp>
#include <dcsim/algo/worst_fit_allocator.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace dcsim::algo;
using namespace dcsim::core;

class AllocatorsTest : public ::testing::Test {
protected:
    void add_pm(Resources capacity, Resources allocated = {}) {
        PhysicalMachine pm;
        pm.id = PmId{pool.size()};
        pm.name = "pm" + std::to_string(pool.size());
        pm.capacity = capacity;
        pm.allocated = allocated;
        pool.push_back(pm);
    }

    std::vector<PhysicalMachine> pool;
};

// --- first-fit ---------------------------------------------------------------

TEST_F(AllocatorsTest, FirstFitTakesLowestIdThatFits) {
    add_pm(Resources{4, 4096, 0}, Resources{3, 1024, 0});
    add_pm(Resources{4, 4096, 0});
    add_pm(Resources{4, 4096, 0});

    FirstFitAllocator allocator;
    EXPECT_EQ(allocator.select_pm(Resources{2, 1024, 0}, pool), PmId{1});
    EXPECT_EQ(allocator.select_pm(Resources{1, 1024, 0}, pool), PmId{0});
    EXPECT_EQ(allocator.name(), "first-fit");
}

TEST_F(AllocatorsTest, ReservedCapacityIsNotAvailable) {
    add_pm(Resources{4, 4096, 0});
    pool[0].reserved = Resources{4, 0, 0};
    add_pm(Resources{4, 4096, 0});

    FirstFitAllocator allocator;
    EXPECT_EQ(allocator.select_pm(Resources{1, 128, 0}, pool), PmId{1});
}

TEST_F(AllocatorsTest, NoCapacityAnywhere) {
    add_pm(Resources{4, 4096, 0});
    add_pm(Resources{8, 2048, 0});
    const Resources demand{6, 4096, 0};

    FirstFitAllocator first;
    BestFitAllocator best;
    WorstFitAllocator worst;
    EXPECT_FALSE(first.select_pm(demand, pool).has_value());
    EXPECT_FALSE(best.select_pm(demand, pool).has_value());
    EXPECT_FALSE(worst.select_pm(demand, pool).has_value());
}

TEST_F(AllocatorsTest, EmptyPool) {
    FirstFitAllocator allocator;
    EXPECT_FALSE(allocator.select_pm(Resources{1, 1, 0}, pool).has_value());
}

TEST_F(AllocatorsTest, GpuDemandNeedsGpuHost) {
    add_pm(Resources{32, 65536, 0});
    add_pm(Resources{8, 16384, 2});

    FirstFitAllocator allocator;
    EXPECT_EQ(allocator.select_pm(Resources{2, 1024, 1}, pool), PmId{1});
}

// --- best-fit / worst-fit ----------------------------------------------------

TEST_F(AllocatorsTest, BestFitPicksTightestHost) {
    add_pm(Resources{8, 8192, 0});
    add_pm(Resources{8, 8192, 0}, Resources{6, 6144, 0});
    add_pm(Resources{8, 8192, 0}, Resources{4, 4096, 0});

    BestFitAllocator allocator;
    EXPECT_EQ(allocator.select_pm(Resources{2, 2048, 0}, pool), PmId{1});
    EXPECT_EQ(allocator.name(), "best-fit");
}

TEST_F(AllocatorsTest, WorstFitPicksEmptiestHost) {
    add_pm(Resources{8, 8192, 0}, Resources{6, 6144, 0});
    add_pm(Resources{8, 8192, 0}, Resources{4, 4096, 0});
    add_pm(Resources{8, 8192, 0});

    WorstFitAllocator allocator;
    EXPECT_EQ(allocator.select_pm(Resources{2, 2048, 0}, pool), PmId{2});
    EXPECT_EQ(allocator.name(), "worst-fit");
}

TEST_F(AllocatorsTest, ScoresAreRelativeToHostSize) {
    add_pm(Resources{4, 4096, 0});
    add_pm(Resources{16, 16384, 0});
    const Resources demand{2, 2048, 0};

    EXPECT_DOUBLE_EQ(remaining_share(pool[0], demand), 0.5);
    EXPECT_DOUBLE_EQ(remaining_share(pool[1], demand), 0.875);

    BestFitAllocator best;
    WorstFitAllocator worst;
    EXPECT_EQ(best.select_pm(demand, pool), PmId{0});
    EXPECT_EQ(worst.select_pm(demand, pool), PmId{1});
}

TEST_F(AllocatorsTest, TiesGoToLowestId) {
    add_pm(Resources{8, 8192, 0}, Resources{2, 2048, 0});
    add_pm(Resources{8, 8192, 0}, Resources{2, 2048, 0});

    BestFitAllocator best;
    WorstFitAllocator worst;
    EXPECT_EQ(best.select_pm(Resources{1, 1024, 0}, pool), PmId{0});
    EXPECT_EQ(worst.select_pm(Resources{1, 1024, 0}, pool), PmId{0});
}

TEST_F(AllocatorsTest, ExactFitScoresZero) {
    add_pm(Resources{4, 4096, 0});
    EXPECT_TRUE(pm_can_host(pool[0], Resources{4, 4096, 0}));
    EXPECT_DOUBLE_EQ(remaining_share(pool[0], Resources{4, 4096, 0}), 0.0);
    EXPECT_FALSE(pm_can_host(pool[0], Resources{5, 1, 0}));
}
