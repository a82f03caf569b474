#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace heirloom {

    // ===========================================
    // Heirloom escrow error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 200;
    constexpr dp::u32 ERR_UNAUTHORIZED_ACCESS = 201;
    constexpr dp::u32 ERR_INVALID_PARAMETERS = 202;
    constexpr dp::u32 ERR_INHERITANCE_NOT_FOUND = 203;
    constexpr dp::u32 ERR_TIME_LOCK_NOT_EXPIRED = 204;
    constexpr dp::u32 ERR_EMERGENCY_MODE_ACTIVE = 205;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error unauthorized_access(const dp::String &msg = "Unauthorized access") {
        return dp::Error{ERR_UNAUTHORIZED_ACCESS, msg};
    }

    inline dp::Error invalid_parameters(const dp::String &msg = "Invalid parameters") {
        return dp::Error{ERR_INVALID_PARAMETERS, msg};
    }

    inline dp::Error inheritance_not_found(const dp::String &msg = "Inheritance not found") {
        return dp::Error{ERR_INHERITANCE_NOT_FOUND, msg};
    }

    inline dp::Error time_lock_not_expired(const dp::String &msg = "Time lock not expired") {
        return dp::Error{ERR_TIME_LOCK_NOT_EXPIRED, msg};
    }

    inline dp::Error emergency_mode_active(const dp::String &msg = "Emergency mode active") {
        return dp::Error{ERR_EMERGENCY_MODE_ACTIVE, msg};
    }

    /// Name of an escrow error code, "Unknown" for codes outside the escrow range
    inline std::string errorName(dp::u32 code) {
        switch (code) {
        case ERR_INSUFFICIENT_FUNDS:
            return "InsufficientFunds";
        case ERR_UNAUTHORIZED_ACCESS:
            return "UnauthorizedAccess";
        case ERR_INVALID_PARAMETERS:
            return "InvalidParameters";
        case ERR_INHERITANCE_NOT_FOUND:
            return "InheritanceNotFound";
        case ERR_TIME_LOCK_NOT_EXPIRED:
            return "TimeLockNotExpired";
        case ERR_EMERGENCY_MODE_ACTIVE:
            return "EmergencyModeActive";
        default:
            return "Unknown";
        }
    }

} // namespace heirloom
