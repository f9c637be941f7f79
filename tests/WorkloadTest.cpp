#include <gtest/gtest.h>
#include <cachebench/workload/OverlappingWorkload.hpp>
#include <set>
#include <vector>

/**
 * @brief Тесты для OverlappingWorkload
 *
 * Проверяем:
 * - Границы ключей [0, 2 * capacity)
 * - Детерминированность
 * - Разбиение индексов между воркерами
 */

// ==================== Конструктор ====================

TEST(OverlappingWorkloadTest, ConstructorThrowsOnZeroCapacity) {
    EXPECT_THROW(OverlappingWorkload(0, 10), std::invalid_argument);
}

TEST(OverlappingWorkloadTest, ConstructorThrowsOnZeroOps) {
    EXPECT_THROW(OverlappingWorkload(10, 0), std::invalid_argument);
}

TEST(OverlappingWorkloadTest, KeyRangeIsTwiceCapacity) {
    OverlappingWorkload workload(100, 10);
    EXPECT_EQ(workload.keyRange(), 200);
    EXPECT_EQ(workload.opsPerThread(), 10);
}

// ==================== Границы ключей ====================

TEST(OverlappingWorkloadTest, KeysStayInRange) {
    const size_t capacities[] = {1, 3, 4, 17, 100};
    for (size_t capacity : capacities) {
        OverlappingWorkload workload(capacity, 37);
        for (size_t t = 0; t < 9; ++t) {
            for (size_t i = 0; i < workload.opsPerThread(); ++i) {
                EXPECT_LT(workload.key(t, i), 2 * capacity)
                    << "capacity=" << capacity << " t=" << t << " i=" << i;
            }
        }
    }
}

TEST(OverlappingWorkloadTest, CapacityOneYieldsZeroAndOne) {
    OverlappingWorkload workload(1, 5);

    std::set<size_t> seen;
    for (size_t t = 0; t < 3; ++t) {
        for (size_t key : workload.keysFor(t)) {
            seen.insert(key);
        }
    }

    EXPECT_EQ(seen, (std::set<size_t>{0, 1}));
}

// ==================== Детерминированность ====================

TEST(OverlappingWorkloadTest, SameArgumentsSameKey) {
    OverlappingWorkload first(50, 1000);
    OverlappingWorkload second(50, 1000);

    for (size_t t = 0; t < 4; ++t) {
        EXPECT_EQ(first.keysFor(t), second.keysFor(t));
        EXPECT_EQ(first.key(t, 123), first.key(t, 123));
    }
}

// ==================== Разбиение по воркерам ====================

TEST(OverlappingWorkloadTest, TwoWorkersGetDisjointKeys) {
    OverlappingWorkload workload(4, 4);

    EXPECT_EQ(workload.keysFor(0), (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(workload.keysFor(1), (std::vector<size_t>{4, 5, 6, 7}));
}

TEST(OverlappingWorkloadTest, WorkerWrapsAroundKeyRange) {
    OverlappingWorkload workload(4, 16);

    auto keys = workload.keysFor(0);

    ASSERT_EQ(keys.size(), 16);
    for (size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(keys[i], i);
        EXPECT_EQ(keys[i + 8], i);
    }
}

TEST(OverlappingWorkloadTest, WorkersOverlapWhenRangesFold) {
    OverlappingWorkload workload(4, 6);

    // воркер 1: индексы 6..11 -> 6 7 0 1 2 3
    EXPECT_EQ(workload.keysFor(1), (std::vector<size_t>{6, 7, 0, 1, 2, 3}));
}

TEST(OverlappingWorkloadTest, Description) {
    OverlappingWorkload workload(4, 6);
    EXPECT_EQ(workload.name(), "overlapping");
    EXPECT_FALSE(workload.description().empty());
    EXPECT_EQ(workload.parameters(), "key_range=8, ops_per_thread=6");
}
