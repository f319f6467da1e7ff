#pragma once

#include <string>
#include <utility>
#include <variant>

namespace pda::domain {

enum class ErrorKind {
    InvalidAddress,
    TokenNotFound,
    WrongPoolType,
    DivisionByZero,
    InvalidRecord,
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidAddress: return "InvalidAddress";
        case ErrorKind::TokenNotFound:  return "TokenNotFound";
        case ErrorKind::WrongPoolType:  return "WrongPoolType";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::InvalidRecord:  return "InvalidRecord";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

// Either a fully built value or the reason it could not be built.
// Never holds a partial value.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const noexcept { return std::holds_alternative<T>(state_); }
    explicit operator bool() const noexcept { return ok(); }

    // Throws std::bad_variant_access when called on the wrong alternative.
    const T& value() const& { return std::get<T>(state_); }
    T&& value() && { return std::get<T>(std::move(state_)); }
    const Error& error() const { return std::get<Error>(state_); }

private:
    std::variant<T, Error> state_;
};

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

} // namespace pda::domain
