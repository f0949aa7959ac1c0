#ifndef LINEARDS_ERRORS_HPP
#define LINEARDS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lineards {

// Read or remove on a container holding zero elements.
class Empty : public std::out_of_range {
public:
    Empty() : std::out_of_range("Cannot perform operation on empty container") {}
    explicit Empty(const std::string& what) : std::out_of_range(what) {}
};

// Base of every rejection raised while validating a Position.
class PositionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The Position was issued by a different container instance.
class InvalidPosition : public PositionError {
public:
    InvalidPosition() : PositionError("Position does not belong to this container") {}
};

// The value is not a Position produced by any container (a null handle).
class WrongPositionType : public PositionError {
public:
    WrongPositionType() : PositionError("Value must be a Position issued by a container") {}
};

// The node behind the Position has already been removed.
class StalePosition : public PositionError {
public:
    StalePosition() : PositionError("Position is no longer valid") {}
};

// An iterator was used after the sequence it walks was structurally changed.
class ConcurrentModification : public std::logic_error {
public:
    ConcurrentModification() : std::logic_error("Sequence was modified during iteration") {}
};

} // namespace lineards

#endif // LINEARDS_ERRORS_HPP
