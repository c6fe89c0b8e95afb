#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include "sv-core/slot-store.hh"
#include "sv-core/error.hh"

///
/// SLOT STORE TESTS
///

TEST(SlotStoreTests, InsertAndGet) {
    sv::SlotStore<std::string> store;
    sv::SlotID a = store.insert("alpha");
    sv::SlotID b = store.insert("beta");

    EXPECT_EQ(store.size(), 2u);
    ASSERT_NE(store.get(a), nullptr);
    EXPECT_EQ(*store.get(a), "alpha");
    EXPECT_EQ(store.at(b), "beta");
    EXPECT_NE(a, b);
}

TEST(SlotStoreTests, InsertWithSeesOwnId) {
    sv::SlotStore<sv::SlotID> store;
    sv::SlotID id = store.insert_with([] (sv::SlotID new_id) { return new_id; });
    EXPECT_EQ(store.at(id), id);
}

TEST(SlotStoreTests, ThrowingInsertLeavesStoreUnchanged) {
    sv::SlotStore<int> store;
    sv::SlotID kept = store.insert(1);
    sv::SlotID freed = store.insert(2);
    store.remove(freed);

    auto fail = [] (sv::SlotID) -> int { throw std::runtime_error("make failed"); };
    EXPECT_THROW(store.insert_with(fail), std::runtime_error);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.capacity(), 2u);

    // the free slot is still available to the next insertion
    sv::SlotID reused = store.insert(3);
    EXPECT_EQ(reused.index(), freed.index());
    EXPECT_EQ(store.capacity(), 2u);

    // with no free slot, a failed insertion does not grow the store
    EXPECT_THROW(store.insert_with(fail), std::runtime_error);
    EXPECT_EQ(store.capacity(), 2u);
    EXPECT_EQ(store.at(kept), 1);
    EXPECT_EQ(store.at(reused), 3);
}

TEST(SlotStoreTests, RemovedIdIsStale) {
    sv::SlotStore<int> store;
    sv::SlotID id = store.insert(7);
    auto removed = store.remove(id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 7);

    EXPECT_FALSE(store.contains(id));
    EXPECT_EQ(store.get(id), nullptr);
    EXPECT_FALSE(store.remove(id).has_value());
    EXPECT_EQ(store.size(), 0u);
}

TEST(SlotStoreTests, ReusedSlotBumpsGeneration) {
    sv::SlotStore<int> store;
    sv::SlotID old_id = store.insert(1);
    store.remove(old_id);
    sv::SlotID new_id = store.insert(2);

    EXPECT_EQ(new_id.index(), old_id.index());
    EXPECT_NE(new_id.generation(), old_id.generation());
    EXPECT_NE(new_id, old_id);

    // the stale ID must not see the new occupant
    EXPECT_EQ(store.get(old_id), nullptr);
    EXPECT_EQ(store.at(new_id), 2);
}

TEST(SlotStoreTests, AtThrowsStaleReference) {
    sv::SlotStore<int> store;
    sv::SlotID id = store.insert(1);
    store.remove(id);
    try {
        store.at(id);
        FAIL() << "expected VmError";
    } catch (sv::VmError const& e) {
        EXPECT_EQ(e.kind(), sv::VmErrorKind::StaleReference);
    }
}

TEST(SlotStoreTests, OutOfRangeIdIsNotContained) {
    sv::SlotStore<int> store;
    EXPECT_FALSE(store.contains(sv::SlotID{5, 0}));
    EXPECT_FALSE(store.id_at(0).has_value());
}

TEST(SlotStoreTests, IdAtIgnoresCallerGeneration) {
    sv::SlotStore<int> store;
    sv::SlotID a = store.insert(10);
    store.insert(20);
    store.remove(a);
    sv::SlotID c = store.insert(30);

    auto at0 = store.id_at(0);
    ASSERT_TRUE(at0.has_value());
    EXPECT_EQ(*at0, c);
    EXPECT_TRUE(store.id_at(1).has_value());
    EXPECT_FALSE(store.id_at(2).has_value());
}

TEST(SlotStoreTests, RetainRemovesRejected) {
    sv::SlotStore<int> store;
    for (int i = 0; i < 6; i++) {
        store.insert(i);
    }
    store.retain([] (sv::SlotID, int& v) { return v % 2 == 0; });

    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.capacity(), 6u);
    int sum = 0;
    store.for_each([&sum] (sv::SlotID, int const& v) { sum += v; });
    EXPECT_EQ(sum, 0 + 2 + 4);
}
