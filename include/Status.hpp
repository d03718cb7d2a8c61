#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace flm {

enum class ErrorCode {
    InitializationError,
    InvalidInputError,
    InvalidModeError,
    SequencingError,
    InternalError
};

const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // "<CODE_NAME>: <message>"
    std::string toString() const;
};

// Holds either a value or an Error, never both and never neither.
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        checkValue();
        return std::get<T>(storage_);
    }
    T& value() & {
        checkValue();
        return std::get<T>(storage_);
    }
    T&& value() && {
        checkValue();
        return std::get<T>(std::move(storage_));
    }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<Error>(storage_);
    }

private:
    void checkValue() const {
        if (!ok()) {
            throw std::runtime_error("Result holds an error: " + std::get<Error>(storage_).toString());
        }
    }

    std::variant<T, Error> storage_;
};

template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace flm
