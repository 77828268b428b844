#pragma once

#include "Types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>


enum class ErrorKind : uint8_t {
    InvalidSquare,
    EmptySource,
    WrongTurnOwner,
    BlockedPath,
    IllegalGeometry,   // destination unreachable or not capturable by the piece's rules
    IllegalCapture,    // destination holds a piece of the mover's colour
    SelfCheck,
    AmbiguousMove,
    NoLegalCandidate,
    IllegalCastle,
    PromotionError,
    InvalidNotation,
    InvalidFen
};

const char* to_string(ErrorKind kind);

struct MoveError {
    ErrorKind kind;
    std::string message;
    std::optional<Square> from;
    std::optional<Square> to;
    std::string fen; // board state when the error was raised, if a game was involved

    std::string describe() const;
};

// Value-or-error return used across the engine instead of exceptions.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(MoveError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const MoveError& error() const { return std::get<MoveError>(data_); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, MoveError> data_;
};

using Status = Result<std::monostate>;

inline MoveError make_error(ErrorKind kind, std::string message,
                            std::optional<Square> from = std::nullopt,
                            std::optional<Square> to = std::nullopt) {
    return MoveError{kind, std::move(message), from, to, {}};
}
