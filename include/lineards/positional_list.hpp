#ifndef LINEARDS_POSITIONAL_LIST_HPP
#define LINEARDS_POSITIONAL_LIST_HPP

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "linked_sequence.hpp"
#include "logging.hpp"

namespace lineards {

/*
A sequence of elements addressed through Positions.

Every element sits in a node of a LinkedSequence; callers never see the node,
only a Position: a small copyable handle naming (this list, node index, node
generation). Inserting or deleting at a known Position is O(1).

    PositionalList<int> list;
    auto p = list.add_last(10);        // [10]
    list.add_before(p, 5);             // [5, 10]
    list.replace(p, 11);               // [5, 11]   p is still valid
    list.erase(p);                     // [5]       p (and every copy) is now stale

Lifetime: a Position refers to its list by address, so the list can be neither
copied nor moved, and no Position may be used after its list is destroyed.
*/
template<typename T>
class PositionalList {
    using Sequence = LinkedSequence<T>;
    using NodeIndex = typename Sequence::NodeIndex;
    using Generation = typename Sequence::Generation;

public:
    using value_type = T;
    using const_iterator = typename Sequence::Iterator;

    class Position {
    public:
        // A default constructed Position is a null handle: no container issued it.
        Position() noexcept = default;

        // Element stored at this Position. Throws like any other use of a bad Position.
        [[nodiscard]] const T& element() const {
            if (!container_) {
                log_message(LogLevel::Debug, "element() on a null position");
                throw WrongPositionType();
            }
            return container_->seq_.element(container_->validate(*this));
        }

        // Same node of the same list. Element values play no part.
        bool operator==(const Position& other) const noexcept {
            return container_ == other.container_
                && node_ == other.node_
                && generation_ == other.generation_;
        }

        bool operator!=(const Position& other) const noexcept {
            return !(*this == other);
        }

    private:
        Position(const PositionalList* container, NodeIndex node, Generation generation) noexcept
            : container_(container), node_(node), generation_(generation) {}

        const PositionalList* container_{nullptr};
        NodeIndex node_{Sequence::NIL};
        Generation generation_{0};

        friend class PositionalList;
    };

    PositionalList() = default;
    ~PositionalList() = default;

    PositionalList(const PositionalList&) = delete;
    PositionalList& operator=(const PositionalList&) = delete;
    PositionalList(PositionalList&&) = delete;
    PositionalList& operator=(PositionalList&&) = delete;

    [[nodiscard]] std::size_t size() const noexcept { return seq_.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return seq_.is_empty(); }

    // nullopt when the list is empty
    [[nodiscard]] std::optional<Position> first() const { return make_position(seq_.next(seq_.header())); }
    [[nodiscard]] std::optional<Position> last() const { return make_position(seq_.prev(seq_.trailer())); }

    // nullopt when p is the first Position
    [[nodiscard]] std::optional<Position> before(const Position& p) const {
        return make_position(seq_.prev(validate(p)));
    }

    // nullopt when p is the last Position
    [[nodiscard]] std::optional<Position> after(const Position& p) const {
        return make_position(seq_.next(validate(p)));
    }

    Position add_first(T element) {
        return insert_between(std::move(element), seq_.header(), seq_.next(seq_.header()));
    }

    Position add_last(T element) {
        return insert_between(std::move(element), seq_.prev(seq_.trailer()), seq_.trailer());
    }

    Position add_before(const Position& p, T element) {
        NodeIndex node = validate(p);
        return insert_between(std::move(element), seq_.prev(node), node);
    }

    Position add_after(const Position& p, T element) {
        NodeIndex node = validate(p);
        return insert_between(std::move(element), node, seq_.next(node));
    }

    // Remove the element at p and return it. p and all of its copies go stale.
    T erase(const Position& p) {
        NodeIndex node = validate(p);
        return seq_.delete_node(node);
    }

    // Swap in a new element at p and return the old one. p stays valid.
    T replace(const Position& p, T element) {
        NodeIndex node = validate(p);
        return std::exchange(seq_.element(node), std::move(element));
    }

    [[nodiscard]] const_iterator begin() const noexcept { return seq_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return seq_.end(); }

    // "5 10 20"
    [[nodiscard]] std::string to_string() const {
        std::ostringstream out;
        const char* sep = "";
        for (const T& element : *this) {
            out << sep << element;
            sep = " ";
        }
        return out.str();
    }

    // "PositionalList([5, 10, 20])", string-like elements single-quoted: "PositionalList(['a', 'b'])"
    [[nodiscard]] std::string repr() const {
        std::ostringstream out;
        out << "PositionalList([";
        const char* sep = "";
        for (const T& element : *this) {
            out << sep;
            if constexpr (std::is_convertible_v<const T&, std::string_view>) {
                out << std::quoted(std::string_view(element), '\'');
            } else {
                out << element;
            }
            sep = ", ";
        }
        out << "])";
        return out.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const PositionalList& list) {
        return os << list.to_string();
    }

private:
    // The gate in front of every use of an external Position. Runs before any
    // structural change, so a rejected Position leaves the list untouched.
    NodeIndex validate(const Position& p) const {
        if (!p.container_) {
            log_message(LogLevel::Debug, "rejected null position");
            throw WrongPositionType();
        }
        if (p.container_ != this) {
            log_message(LogLevel::Debug, "rejected position of another list (node {})", p.node_);
            throw InvalidPosition();
        }
        if (!seq_.is_live(p.node_, p.generation_)) {
            log_message(LogLevel::Debug, "rejected stale position (node {}, generation {})",
                        p.node_, p.generation_);
            throw StalePosition();
        }
        return p.node_;
    }

    std::optional<Position> make_position(NodeIndex node) const {
        if (seq_.is_sentinel(node)) {
            return std::nullopt;
        }
        return Position(this, node, seq_.generation(node));
    }

    Position insert_between(T element, NodeIndex predecessor, NodeIndex successor) {
        NodeIndex node = seq_.insert_between(std::move(element), predecessor, successor);
        return Position(this, node, seq_.generation(node));
    }

    Sequence seq_;
};

} // namespace lineards

#endif // LINEARDS_POSITIONAL_LIST_HPP
