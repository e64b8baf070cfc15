/// @file result.cpp
/// @brief Error kind names.

#include "core/result.hpp"

namespace uptime::core
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::InvalidCalendarDate: return "InvalidCalendarDate";
        case ErrorCode::InvalidWindow:       return "InvalidWindow";
        case ErrorCode::InvalidThreshold:    return "InvalidThreshold";
        case ErrorCode::InvalidCoordinate:   return "InvalidCoordinate";
        case ErrorCode::Cancelled:           return "Cancelled";
        case ErrorCode::ConfigError:         return "ConfigError";
        case ErrorCode::CatalogError:        return "CatalogError";
    }
    return "Unknown";
}

} // namespace uptime::core
