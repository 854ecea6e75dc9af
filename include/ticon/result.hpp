#pragma once

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ticon {

//=============================================================================
// Error - message plus an optional chained cause
//=============================================================================

class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, Error cause)
        : _message(std::move(message)),
          _cause(std::make_shared<const Error>(std::move(cause))) {}

    const std::string& message() const { return _message; }
    const Error* cause() const { return _cause.get(); }

    /// Outermost message first, causes appended with ": ".
    std::string fullMessage() const {
        std::string out = _message;
        for (const Error* c = cause(); c; c = c->cause()) {
            out += ": ";
            out += c->message();
        }
        return out;
    }

private:
    std::string _message;
    std::shared_ptr<const Error> _cause;
};

namespace detail {
template<typename T>
struct OkValue {
    T value;
};
} // namespace detail

//=============================================================================
// Result<T> - value or Error
//=============================================================================

template<typename T>
class [[nodiscard]] Result {
public:
    using value_type = T;

    Result(Error error) : _data(std::in_place_index<1>, std::move(error)) {}

    template<typename U>
        requires std::is_constructible_v<T, U&&>
    Result(detail::OkValue<U>&& ok)
        : _data(std::in_place_index<0>, std::move(ok.value)) {}

    template<typename U>
        requires(!std::is_same_v<U, T> && std::is_constructible_v<T, U&&>)
    Result(Result<U>&& other)
        : _data(other.has_value()
                    ? std::variant<T, Error>(std::in_place_index<0>, std::move(*other))
                    : std::variant<T, Error>(std::in_place_index<1>, other.error())) {}

    bool has_value() const { return _data.index() == 0; }
    explicit operator bool() const { return has_value(); }

    T& value() & { return std::get<0>(_data); }
    const T& value() const& { return std::get<0>(_data); }
    T&& value() && { return std::get<0>(std::move(_data)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    const Error& error() const { return std::get<1>(_data); }

private:
    std::variant<T, Error> _data;
};

template<>
class [[nodiscard]] Result<void> {
public:
    using value_type = void;

    Result() = default;
    Result(Error error) : _error(std::move(error)) {}

    bool has_value() const { return !_error.has_value(); }
    explicit operator bool() const { return has_value(); }

    const Error& error() const { return *_error; }

private:
    std::optional<Error> _error;
};

//=============================================================================
// Constructors
//=============================================================================

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
detail::OkValue<std::decay_t<T>> Ok(T&& value) {
    return {std::forward<T>(value)};
}

template<typename T = void>
Result<T> Err(std::string message) {
    return Result<T>(Error(std::move(message)));
}

/// Error that wraps the failure of an earlier result.
template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return Result<T>(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& res) {
    return res ? std::string() : res.error().fullMessage();
}

} // namespace ticon
