#pragma once

#include <stdexcept>
#include <string>

namespace Tempo {

// Raised when a registration or construction call receives a missing or malformed argument.
// Nothing has been modified when it is thrown.
class ArgumentError : public std::invalid_argument {
public:
    explicit ArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Raised by Action::reverse() on actions whose effect depends on state observed at bind time
// (the "-to" family) or that have no inverse at all. Check Action::canReverse() first.
class NotReversibleError : public std::logic_error {
public:
    explicit NotReversibleError(const std::string& what) : std::logic_error(what) {}
};

} // namespace Tempo
