#ifndef LINEARDS_LINKED_SEQUENCE_HPP
#define LINEARDS_LINKED_SEQUENCE_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace lineards {

// A doubly linked chain bounded by two sentinel nodes (header and trailer).
// Nodes live in an arena owned by the sequence and link to each other by index,
// so callers above this layer can hold (index, generation) handles that detect a
// removed node without touching freed memory.
//
//   header <-> n0 <-> n1 <-> ... <-> trailer
//
// The two sentinels are permanently present, never hold an element, and turn
// "insert into empty" / "delete the last element" into the ordinary case.
template<typename T>
class LinkedSequence {
public:
    using NodeIndex = std::size_t;
    using Generation = std::uint64_t;

    static constexpr NodeIndex HEADER = 0;
    static constexpr NodeIndex TRAILER = 1;
    static constexpr NodeIndex NIL = std::numeric_limits<NodeIndex>::max();

    // Forward iterator over live elements. It remembers the structural version it
    // was created at and refuses to step or dereference once the chain changed.
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() noexcept = default;

        reference operator*() const {
            check();
            return seq_->element(current_);
        }

        pointer operator->() const { return &**this; }

        Iterator& operator++() {
            check();
            current_ = seq_->next(current_);
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const Iterator& other) const noexcept {
            return current_ == other.current_;
        }

        bool operator!=(const Iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        Iterator(const LinkedSequence* seq, NodeIndex node) noexcept
            : seq_(seq), current_(node), version_(seq->version()) {}

        void check() const {
            if (seq_->version() != version_) {
                throw ConcurrentModification();
            }
        }

        const LinkedSequence* seq_{nullptr};
        NodeIndex current_{NIL};
        std::uint64_t version_{0};

        friend class LinkedSequence;
    };

    LinkedSequence() {
        slots_.reserve(DEFAULT_ARENA_RESERVE);
        slots_.push_back(Slot{std::nullopt, NIL, TRAILER, 0}); // header
        slots_.push_back(Slot{std::nullopt, HEADER, NIL, 0}); // trailer
    }

    ~LinkedSequence() = default;

    LinkedSequence(const LinkedSequence&) = delete;
    LinkedSequence& operator=(const LinkedSequence&) = delete;

    // A moved-from sequence is left empty with fresh sentinels.
    LinkedSequence(LinkedSequence&& other) : LinkedSequence() { swap(other); }

    LinkedSequence& operator=(LinkedSequence&& other) {
        if (this != &other) {
            LinkedSequence tmp(std::move(other));
            swap(tmp);
        }
        return *this;
    }

    void swap(LinkedSequence& other) noexcept {
        slots_.swap(other.slots_);
        free_.swap(other.free_);
        std::swap(size_, other.size_);
        std::swap(version_, other.version_);
    }

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool is_empty() const noexcept { return size_ == 0; }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(this, next(HEADER)); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(this, TRAILER); }

    [[nodiscard]] NodeIndex header() const noexcept { return HEADER; }
    [[nodiscard]] NodeIndex trailer() const noexcept { return TRAILER; }

    [[nodiscard]] NodeIndex next(NodeIndex node) const noexcept { return slots_[node].next; }
    [[nodiscard]] NodeIndex prev(NodeIndex node) const noexcept { return slots_[node].prev; }

    [[nodiscard]] const T& element(NodeIndex node) const { return *slots_[node].element; }
    T& element(NodeIndex node) { return *slots_[node].element; }

    [[nodiscard]] Generation generation(NodeIndex node) const noexcept { return slots_[node].generation; }

    [[nodiscard]] bool is_sentinel(NodeIndex node) const noexcept {
        return node == HEADER || node == TRAILER;
    }

    // True while `node` is still linked and has not been recycled since `gen` was read.
    [[nodiscard]] bool is_live(NodeIndex node, Generation gen) const noexcept {
        if (node >= slots_.size() || is_sentinel(node)) {
            return false;
        }
        const Slot& slot = slots_[node];
        return slot.generation == gen && slot.next != NIL;
    }

    // Bumped by every insert and delete; element replacement does not count.
    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

    // Splice a new node between two adjacent nodes. Adjacency is not re-checked.
    NodeIndex insert_between(T element, NodeIndex predecessor, NodeIndex successor) {
        NodeIndex newest = allocate(std::move(element));

        Slot& slot = slots_[newest];
        slot.prev = predecessor;
        slot.next = successor;
        slots_[predecessor].next = newest;
        slots_[successor].prev = newest;

        ++size_;
        ++version_;
        return newest;
    }

    // Unlink `node`, recycle its slot and hand back the element it held.
    T delete_node(NodeIndex node) {
        if (is_empty()) {
            log_message(LogLevel::Debug, "delete_node({}) on an empty sequence", node);
            throw Empty();
        }
        if (node >= slots_.size() || is_sentinel(node) || slots_[node].next == NIL) {
            log_message(LogLevel::Debug, "delete_node({}) on a node that is not linked", node);
            throw std::invalid_argument("Node is not linked into this sequence");
        }

        Slot& slot = slots_[node];
        T element = std::move(*slot.element);

        slots_[slot.prev].next = slot.next;
        slots_[slot.next].prev = slot.prev;
        --size_;
        ++version_;

        release(node);
        return element;
    }

private:
    struct Slot {
        std::optional<T> element; // empty for sentinels and free slots
        NodeIndex prev;
        NodeIndex next; // NIL marks a slot that is not linked into the chain
        Generation generation;
    };

    NodeIndex allocate(T&& element) {
        if (!free_.empty()) {
            NodeIndex idx = free_.back();
            slots_[idx].element.emplace(std::move(element));
            free_.pop_back();
            return idx;
        }

        // keep free_ able to take every slot, so release() never allocates
        free_.reserve(slots_.size() + 1);
        slots_.push_back(Slot{std::optional<T>(std::move(element)), NIL, NIL, 0});
        return slots_.size() - 1;
    }

    void release(NodeIndex node) noexcept {
        Slot& slot = slots_[node];
        slot.element.reset();
        slot.prev = NIL;
        slot.next = NIL;
        ++slot.generation;
        free_.push_back(node);
    }

    std::vector<Slot> slots_;
    std::vector<NodeIndex> free_; // recycled slot indices
    std::size_t size_{0};
    std::uint64_t version_{0};
};

} // namespace lineards

#endif // LINEARDS_LINKED_SEQUENCE_HPP
