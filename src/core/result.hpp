#pragma once

/// @file result.hpp
/// @brief Error kinds and a value-or-error return type shared by all modules.

#include <string>
#include <utility>
#include <variant>

namespace uptime::core
{
    /// @brief Recoverable failure kinds reported to callers.
    enum class ErrorCode
    {
        InvalidCalendarDate,  ///< Civil date/time field out of range
        InvalidWindow,        ///< Non-positive step, end <= start, or too many samples
        InvalidThreshold,     ///< Minimum elevation outside [-90, 90]
        InvalidCoordinate,    ///< RA/Dec/latitude/longitude outside its domain
        Cancelled,            ///< Computation abandoned by the caller
        ConfigError,          ///< Configuration file missing or invalid
        CatalogError,         ///< Station/source catalog unreadable
    };

    /// @brief Human-readable name of an error kind.
    [[nodiscard]] const char* error_code_name(ErrorCode code);

    /// @brief An error kind plus the context needed for a user-facing message.
    struct Error
    {
        ErrorCode code;
        std::string message;
    };

    /// @brief Either a value of type T or an Error.
    ///
    /// Accessing value() on an error result (or error() on a value) is a
    /// programming mistake; check has_value() first.
    template <typename T>
    class Result
    {
    public:
        Result(T value) : m_storage(std::in_place_index<0>, std::move(value)) {}
        Result(Error error) : m_storage(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool has_value() const { return m_storage.index() == 0; }
        explicit operator bool() const { return has_value(); }

        [[nodiscard]] T& value() & { return std::get<0>(m_storage); }
        [[nodiscard]] const T& value() const& { return std::get<0>(m_storage); }
        [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_storage)); }

        [[nodiscard]] const Error& error() const { return std::get<1>(m_storage); }

        T& operator*() & { return value(); }
        const T& operator*() const& { return value(); }
        T* operator->() { return &value(); }
        const T* operator->() const { return &value(); }

    private:
        std::variant<T, Error> m_storage;
    };

    /// @brief Build an Error in place.
    [[nodiscard]] inline Error make_error(ErrorCode code, std::string message)
    {
        return Error{.code = code, .message = std::move(message)};
    }

} // namespace uptime::core
