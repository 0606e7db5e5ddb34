/**
 * @file RegistryError.hpp
 * @brief Error kinds and the discriminated result returned by registry operations.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace parasitereg::domain::registry {

/**
 * @enum ErrorKind
 * @brief Reasons a registry operation is rejected.
 */
enum class ErrorKind {
    NotAuthorized,      ///< Caller lacks the role or relationship the mutation needs.
    InvalidRecord,      ///< Record id unknown or not in the expected state.
    InvalidInstitution, ///< Institution id unknown (or already taken on registration).
    NotVerified,        ///< Caller has no membership, or its institution is unverified.
    InvalidInput        ///< A field violates its length or format constraint.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotAuthorized: return "NotAuthorized";
        case ErrorKind::InvalidRecord: return "InvalidRecord";
        case ErrorKind::InvalidInstitution: return "InvalidInstitution";
        case ErrorKind::NotVerified: return "NotVerified";
        case ErrorKind::InvalidInput: return "InvalidInput";
        default: return "Unknown";
    }
}

struct RegistryError {
    ErrorKind kind;
    std::string message;

    bool operator==(const RegistryError& other) const {
        return kind == other.kind && message == other.message;
    }
};

/** @brief Success value of operations that return nothing. */
struct Unit {
    bool operator==(const Unit&) const { return true; }
};

/**
 * @class Result
 * @brief Either a value of type T or a RegistryError.
 */
template <typename T>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result fail(ErrorKind kind, std::string message) {
        return Result(RegistryError{kind, std::move(message)});
    }
    static Result fail(RegistryError error) { return Result(std::move(error)); }

    bool isOk() const { return std::holds_alternative<T>(m_value); }
    explicit operator bool() const { return isOk(); }

    const T& value() const {
        if (!isOk()) {
            throw std::logic_error("Result::value() on error: " + error().message);
        }
        return std::get<T>(m_value);
    }

    const RegistryError& error() const {
        if (isOk()) {
            throw std::logic_error("Result::error() on success");
        }
        return std::get<RegistryError>(m_value);
    }

    /** @brief Error kind, only valid when !isOk(). */
    ErrorKind kind() const { return error().kind; }

private:
    explicit Result(T value) : m_value(std::move(value)) {}
    explicit Result(RegistryError error) : m_value(std::move(error)) {}

    std::variant<T, RegistryError> m_value;
};

} // namespace parasitereg::domain::registry
