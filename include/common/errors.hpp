#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace exchange {

/// Caller passed a value the engine cannot act on (non-positive execution
/// quantity, malformed price or quantity). Raised before any mutation.
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Order submitted to a book for a different instrument.
class SymbolMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Order side is neither BUY nor SELL.
class UnknownSide : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Malformed script line or config value. line() is 0 when not line-based.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg, size_t line = 0)
        : std::runtime_error(line > 0 ? "line " + std::to_string(line) + ": " + msg : msg)
        , line_(line) {}

    size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

} // namespace exchange
