/**
 * @file result.hpp
 * @brief Value-or-Error return type used across every ReelSync module
 *
 * Validation failures (RangeError, InvalidExportRequest, ExportBusy)
 * and media failures travel as values; the caller decides whether to
 * log, surface or recover. Exceptions are reserved for misuse, e.g.
 * reading the value of a failed Result.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "types.hpp"

namespace reelsync {

// ============================================================================
// Error
// ============================================================================

/// ErrorCode plus a human-readable message
class Error {
public:
    Error() : m_code(ErrorCode::Unknown) {}
    explicit Error(ErrorCode code) : m_code(code) {}
    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    /// Message, or the code name when no message was given
    const char* what() const {
        return m_message.empty() ? errorCodeToString(m_code) : m_message.c_str();
    }

    /// Same code, message prefixed with "<context>: "
    Error withContext(const std::string& context) const {
        return Error(m_code, context + ": " + what());
    }

    explicit operator bool() const { return m_code != ErrorCode::Ok; }

private:
    ErrorCode m_code;
    std::string m_message;
};

// ============================================================================
// Result<T, E>
// ============================================================================

/**
 * @brief Either a T or an E
 *
 * value() on a failed Result throws std::runtime_error carrying the
 * error message; error() on a successful one throws std::logic_error.
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const { return m_data.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & {
        requireValue();
        return std::get<0>(m_data);
    }

    const T& value() const& {
        requireValue();
        return std::get<0>(m_data);
    }

    T&& value() && {
        requireValue();
        return std::get<0>(std::move(m_data));
    }

    T valueOr(T fallback) const& {
        return ok() ? std::get<0>(m_data) : std::move(fallback);
    }

    const E& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() on a success value");
        }
        return std::get<1>(m_data);
    }

private:
    void requireValue() const {
        if (!ok()) {
            throw std::runtime_error(std::get<1>(m_data).what());
        }
    }

    std::variant<T, E> m_data;
};

/// Success carries no value
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool ok() const { return !m_error; }
    explicit operator bool() const { return ok(); }

    const E& error() const {
        if (!m_error) {
            throw std::logic_error("Result::error() on a success value");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helpers
// ============================================================================

template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

} // namespace reelsync
