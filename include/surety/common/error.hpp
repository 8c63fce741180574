#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace surety {

    // ===========================================
    // Surety error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 200;
    constexpr dp::u32 ERR_INVALID_STATE = 201;
    constexpr dp::u32 ERR_INVARIANT_VIOLATION = 202;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 203;
    constexpr dp::u32 ERR_ACCOUNT_NOT_FOUND = 204;
    constexpr dp::u32 ERR_NOT_FOUND = 205;
    constexpr dp::u32 ERR_CONCURRENCY_CONFLICT = 206;
    constexpr dp::u32 ERR_DUPLICATE = 207;
    constexpr dp::u32 ERR_SUBJECT_UNRESOLVED = 208;
    constexpr dp::u32 ERR_CROSS_TENANT = 209;
    constexpr dp::u32 ERR_JOURNAL_FAILED = 210;

    // ===========================================
    // Error factory functions
    // ===========================================

    /// Malformed input (negative amount, bad subject pair shape, unknown vocabulary value)
    inline dp::Error validation_error(const std::string &msg = "Validation failed") {
        return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())};
    }

    /// Operation not legal for the current status
    inline dp::Error invalid_state(const std::string &msg = "Invalid state") {
        return dp::Error{ERR_INVALID_STATE, dp::String(msg.c_str())};
    }

    /// Operation would break a monetary invariant
    inline dp::Error invariant_violation(const std::string &msg = "Invariant violation") {
        return dp::Error{ERR_INVARIANT_VIOLATION, dp::String(msg.c_str())};
    }

    inline dp::Error insufficient_funds(const std::string &msg = "Insufficient secured funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, dp::String(msg.c_str())};
    }

    inline dp::Error account_not_found(const std::string &msg = "Secured balance account not found") {
        return dp::Error{ERR_ACCOUNT_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error not_found(const std::string &msg = "Not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    /// Lock contention; safe to retry
    inline dp::Error concurrency_conflict(const std::string &msg = "Concurrency conflict") {
        return dp::Error{ERR_CONCURRENCY_CONFLICT, dp::String(msg.c_str())};
    }

    inline dp::Error duplicate(const std::string &msg = "Duplicate") {
        return dp::Error{ERR_DUPLICATE, dp::String(msg.c_str())};
    }

    inline dp::Error subject_unresolved(const std::string &msg = "Subject could not be resolved") {
        return dp::Error{ERR_SUBJECT_UNRESOLVED, dp::String(msg.c_str())};
    }

    inline dp::Error cross_tenant(const std::string &msg = "Cross-tenant reference") {
        return dp::Error{ERR_CROSS_TENANT, dp::String(msg.c_str())};
    }

    inline dp::Error journal_failed(const std::string &msg = "Journal write failed") {
        return dp::Error{ERR_JOURNAL_FAILED, dp::String(msg.c_str())};
    }

    /// Error message as std::string
    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

} // namespace surety
