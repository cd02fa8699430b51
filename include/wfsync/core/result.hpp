#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace wfsync {

/**
 * @brief Failure categories surfaced by the reconciliation core
 *
 * Callers branch on the code (e.g. a NotFound on update triggers the
 * create + identity migration path), the message is for humans.
 */
enum class ErrorCode {
    NotFound,             // Remote record or local file does not exist
    Conflict,             // Both sides diverged, only a forced operation may proceed
    ConfirmationRequired, // Local deletion needs an explicit delete call
    Busy,                 // Another engine operation holds the workflow id
    Transport,            // Socket, DNS or TLS failure
    Http,                 // Remote answered with a non-2xx status
    InvalidData,          // Malformed JSON or unexpected payload shape
    Io                    // Local filesystem failure
};

struct Error {
    ErrorCode code = ErrorCode::Io;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::ConfirmationRequired: return "confirmation_required";
        case ErrorCode::Busy: return "busy";
        case ErrorCode::Transport: return "transport";
        case ErrorCode::Http: return "http";
        case ErrorCode::InvalidData: return "invalid_data";
        case ErrorCode::Io: return "io";
        default: return "unknown";
    }
}

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace wfsync
