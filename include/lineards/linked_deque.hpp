#ifndef LINEARDS_LINKED_DEQUE_HPP
#define LINEARDS_LINKED_DEQUE_HPP

#include <cstddef>
#include <utility>

#include "errors.hpp"
#include "linked_sequence.hpp"
#include "logging.hpp"

namespace lineards {

// Double-ended queue on top of LinkedSequence. Every operation is O(1).
template<typename T>
class LinkedDeque {
public:
    using value_type = T;
    using const_iterator = typename LinkedSequence<T>::Iterator;

    LinkedDeque() = default;

    [[nodiscard]] std::size_t size() const noexcept { return seq_.size(); }
    [[nodiscard]] bool is_empty() const noexcept { return seq_.is_empty(); }

    [[nodiscard]] const T& first() const {
        ensure_not_empty("first");
        return seq_.element(seq_.next(seq_.header()));
    }

    [[nodiscard]] const T& last() const {
        ensure_not_empty("last");
        return seq_.element(seq_.prev(seq_.trailer()));
    }

    void insert_first(T element) {
        seq_.insert_between(std::move(element), seq_.header(), seq_.next(seq_.header()));
    }

    void insert_last(T element) {
        seq_.insert_between(std::move(element), seq_.prev(seq_.trailer()), seq_.trailer());
    }

    T delete_first() {
        ensure_not_empty("delete_first");
        return seq_.delete_node(seq_.next(seq_.header()));
    }

    T delete_last() {
        ensure_not_empty("delete_last");
        return seq_.delete_node(seq_.prev(seq_.trailer()));
    }

    [[nodiscard]] const_iterator begin() const noexcept { return seq_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return seq_.end(); }

private:
    void ensure_not_empty(const char* operation) const {
        if (seq_.is_empty()) {
            log_message(LogLevel::Debug, "{} on an empty deque", operation);
            throw Empty();
        }
    }

    LinkedSequence<T> seq_;
};

} // namespace lineards

#endif // LINEARDS_LINKED_DEQUE_HPP
