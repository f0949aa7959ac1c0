#include <gtest/gtest.h>
#include "lineards/linked_sequence.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using lineards::LinkedSequence;

namespace {

template<typename T>
std::vector<T> collect(const LinkedSequence<T>& seq) {
    return std::vector<T>(seq.begin(), seq.end());
}

} // namespace

/* ///////////////////
STRUCTURE
*/ ///////////////////

TEST(LinkedSequenceTest, StartsEmptyWithLinkedSentinels) {
    LinkedSequence<int> seq;
    EXPECT_TRUE(seq.is_empty());
    EXPECT_EQ(seq.size(), 0u);
    EXPECT_EQ(seq.next(seq.header()), seq.trailer());
    EXPECT_EQ(seq.prev(seq.trailer()), seq.header());
    EXPECT_EQ(seq.begin(), seq.end());
}

TEST(LinkedSequenceTest, InsertBetweenSplicesBothDirections) {
    LinkedSequence<int> seq;
    auto a = seq.insert_between(1, seq.header(), seq.trailer());
    auto c = seq.insert_between(3, a, seq.trailer());
    auto b = seq.insert_between(2, a, c);

    EXPECT_EQ(seq.size(), 3u);
    EXPECT_EQ(seq.next(a), b);
    EXPECT_EQ(seq.prev(b), a);
    EXPECT_EQ(seq.next(b), c);
    EXPECT_EQ(seq.prev(c), b);
    EXPECT_EQ(collect(seq), (std::vector<int>{1, 2, 3}));

    // walk back from the trailer
    std::vector<int> backwards;
    for (auto n = seq.prev(seq.trailer()); n != seq.header(); n = seq.prev(n)) {
        backwards.push_back(seq.element(n));
    }
    EXPECT_EQ(backwards, (std::vector<int>{3, 2, 1}));
}

TEST(LinkedSequenceTest, DeleteNodeRelinksNeighbours) {
    LinkedSequence<std::string> seq;
    auto a = seq.insert_between("a", seq.header(), seq.trailer());
    auto b = seq.insert_between("b", a, seq.trailer());
    auto c = seq.insert_between("c", b, seq.trailer());

    EXPECT_EQ(seq.delete_node(b), "b");
    EXPECT_EQ(seq.size(), 2u);
    EXPECT_EQ(seq.next(a), c);
    EXPECT_EQ(seq.prev(c), a);
    EXPECT_EQ(collect(seq), (std::vector<std::string>{"a", "c"}));

    EXPECT_EQ(seq.delete_node(a), "a");
    EXPECT_EQ(seq.delete_node(c), "c");
    EXPECT_TRUE(seq.is_empty());
    EXPECT_EQ(seq.next(seq.header()), seq.trailer());
}

TEST(LinkedSequenceTest, DeleteNodeOnEmptyThrows) {
    LinkedSequence<int> seq;
    EXPECT_THROW(seq.delete_node(seq.next(seq.header())), lineards::Empty);
    EXPECT_TRUE(seq.is_empty());
}

TEST(LinkedSequenceTest, DeleteNodeTwiceIsRejected) {
    LinkedSequence<int> seq;
    auto a = seq.insert_between(1, seq.header(), seq.trailer());
    seq.insert_between(2, a, seq.trailer());

    EXPECT_EQ(seq.delete_node(a), 1);
    EXPECT_THROW(seq.delete_node(a), std::invalid_argument);
    EXPECT_EQ(seq.size(), 1u);
    EXPECT_EQ(collect(seq), (std::vector<int>{2}));
    EXPECT_EQ(seq.next(seq.header()), seq.prev(seq.trailer()));
}

TEST(LinkedSequenceTest, DeleteNodeRejectsSentinelsAndUnknownSlots) {
    LinkedSequence<int> seq;
    seq.insert_between(1, seq.header(), seq.trailer());

    EXPECT_THROW(seq.delete_node(seq.header()), std::invalid_argument);
    EXPECT_THROW(seq.delete_node(seq.trailer()), std::invalid_argument);
    EXPECT_THROW(seq.delete_node(12345), std::invalid_argument);
    EXPECT_EQ(collect(seq), (std::vector<int>{1}));
}

/* ///////////////////
LIVENESS
*/ ///////////////////

TEST(LinkedSequenceTest, DeletedNodeIsNoLongerLive) {
    LinkedSequence<int> seq;
    auto n = seq.insert_between(7, seq.header(), seq.trailer());
    auto gen = seq.generation(n);
    EXPECT_TRUE(seq.is_live(n, gen));

    seq.delete_node(n);
    EXPECT_FALSE(seq.is_live(n, gen));
}

TEST(LinkedSequenceTest, RecycledSlotDoesNotReviveOldGeneration) {
    LinkedSequence<int> seq;
    auto n = seq.insert_between(1, seq.header(), seq.trailer());
    auto old_gen = seq.generation(n);
    seq.delete_node(n);

    auto m = seq.insert_between(2, seq.header(), seq.trailer());
    EXPECT_EQ(m, n); // slot reused
    EXPECT_FALSE(seq.is_live(n, old_gen));
    EXPECT_TRUE(seq.is_live(m, seq.generation(m)));
}

TEST(LinkedSequenceTest, SentinelsAreNeverLive) {
    LinkedSequence<int> seq;
    EXPECT_FALSE(seq.is_live(seq.header(), 0));
    EXPECT_FALSE(seq.is_live(seq.trailer(), 0));
    EXPECT_FALSE(seq.is_live(12345, 0));
}

TEST(LinkedSequenceTest, HoldsMoveOnlyElements) {
    LinkedSequence<std::unique_ptr<int>> seq;
    auto n = seq.insert_between(std::make_unique<int>(42), seq.header(), seq.trailer());
    auto out = seq.delete_node(n);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(*out, 42);
}

/* ///////////////////
ITERATION
*/ ///////////////////

TEST(LinkedSequenceTest, IterationIsRestartable) {
    LinkedSequence<int> seq;
    seq.insert_between(1, seq.header(), seq.trailer());
    seq.insert_between(2, seq.prev(seq.trailer()), seq.trailer());
    EXPECT_EQ(collect(seq), collect(seq));
}

TEST(LinkedSequenceTest, IteratorDetectsStructuralChange) {
    LinkedSequence<int> seq;
    seq.insert_between(1, seq.header(), seq.trailer());
    seq.insert_between(2, seq.prev(seq.trailer()), seq.trailer());

    auto it = seq.begin();
    EXPECT_EQ(*it, 1);
    seq.insert_between(3, seq.prev(seq.trailer()), seq.trailer());
    EXPECT_THROW(++it, lineards::ConcurrentModification);
    EXPECT_THROW(*it, lineards::ConcurrentModification);
}

TEST(LinkedSequenceTest, ElementWriteIsNotStructural) {
    LinkedSequence<int> seq;
    auto n = seq.insert_between(1, seq.header(), seq.trailer());
    auto it = seq.begin();
    seq.element(n) = 9;
    EXPECT_EQ(*it, 9);
}

TEST(LinkedSequenceTest, MoveLeavesSourceEmpty) {
    LinkedSequence<int> a;
    a.insert_between(1, a.header(), a.trailer());
    a.insert_between(2, a.prev(a.trailer()), a.trailer());

    LinkedSequence<int> b(std::move(a));
    EXPECT_EQ(collect(b), (std::vector<int>{1, 2}));
    EXPECT_TRUE(a.is_empty());
    EXPECT_EQ(a.next(a.header()), a.trailer());

    a.insert_between(5, a.header(), a.trailer());
    EXPECT_EQ(collect(a), (std::vector<int>{5}));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
