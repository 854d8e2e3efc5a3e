#pragma once

#include <stdexcept>
#include <string>

namespace cardforge::util {

// Raised when an internal guarantee of the generator does not hold.
// It signals a logic bug, never bad caller input.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace cardforge::util
