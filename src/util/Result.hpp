#pragma once
// Result.hpp - Value-or-error return type used at every fallible edge

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace lg {

struct Error {
    std::string message;
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() {
        return std::get<T>(data_);
    }
    const T& value() const {
        return std::get<T>(data_);
    }
    T& operator*() {
        return value();
    }
    const T& operator*() const {
        return value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(std::string message) {
        Result r;
        r.error_ = Error{std::move(message)};
        return r;
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;

    std::optional<Error> error_;
};

} // namespace lg
