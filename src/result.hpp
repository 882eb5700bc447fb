// =============================================================================
// batdroid - Result Type for Unified Error Handling
// =============================================================================
// Result<T, E> carries either a success value or an Error. Library code
// returns errors as values; nothing throws across module boundaries.
//
// Usage:
//   Result<Forest> capture() {
//       if (!ok) return Err<Forest>("dump failed", errc::kCommandFailed);
//       return forest;
//   }
//
//   auto result = capture();
//   if (result.is_err()) {
//       BLOG_ERROR("main", "%s", result.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace batdroid {

// =============================================================================
// Error Codes
// =============================================================================

namespace errc {
constexpr int kOk               = 0;
constexpr int kCommandFailed    = 1;  // external command exited non-zero / could not start
constexpr int kCommandTimeout   = 2;  // external command killed after its deadline
constexpr int kUnexpectedOutput = 3;  // dump envelope did not contain <hierarchy
constexpr int kInvalidArgument  = 4;
constexpr int kNotFound         = 5;  // selector matched nothing
constexpr int kAmbiguous        = 6;  // selector matched several elements, no index
constexpr int kOutputTooLarge   = 7;
constexpr int kConfig           = 8;

inline const char* name(int code) {
    switch (code) {
        case kOk:               return "ok";
        case kCommandFailed:    return "command_failed";
        case kCommandTimeout:   return "command_timeout";
        case kUnexpectedOutput: return "unexpected_output";
        case kInvalidArgument:  return "invalid_argument";
        case kNotFound:         return "not_found";
        case kAmbiguous:        return "ambiguous";
        case kOutputTooLarge:   return "output_too_large";
        case kConfig:           return "config";
    }
    return "unknown";
}
} // namespace errc

// Error with message and one of the errc codes
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Throws std::runtime_error when holding an error
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    // Chain a fallible step; f must return Result<U, E>
    template<typename F>
    auto and_then(F&& f) const& -> decltype(f(std::declval<const T&>())) {
        using R = decltype(f(std::declval<const T&>()));
        if (is_ok()) return f(std::get<0>(data_));
        return R(std::get<1>(data_));
    }

    // Prefix the error message with context, keeping the code
    Result with_context(const std::string& context) const& {
        if (is_ok()) return *this;
        const E& e = std::get<1>(data_);
        return Result(E(context + ": " + e.message, e.code));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, int code = 0) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, int code = 0) {
    return Result<T, Error>(Error(message, code));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// Unwrap a Result or return its error from the enclosing function (GCC/Clang)
// Usage: auto forest = BATDROID_TRY(capture.capture(opts));
#define BATDROID_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace batdroid
