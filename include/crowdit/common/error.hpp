#pragma once

#include <datapod/datapod.hpp>

namespace crowdit {

    // ===========================================
    // Crowdit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_AMOUNT = 100;
    constexpr dp::u32 ERR_NOT_OWNER = 101;
    constexpr dp::u32 ERR_ALREADY_FINALIZED = 102;
    constexpr dp::u32 ERR_REFUND_NOT_ALLOWED = 103;
    constexpr dp::u32 ERR_NO_FUNDS_TO_REFUND = 104;
    constexpr dp::u32 ERR_TRANSFER_FAILED = 105;
    constexpr dp::u32 ERR_CONSTRUCTION_INVALID = 106;
    constexpr dp::u32 ERR_ISSUER_FAILED = 107;
    constexpr dp::u32 ERR_WITHDRAW_NOT_ALLOWED = 108;
    constexpr dp::u32 ERR_NOTHING_TO_WITHDRAW = 109;
    constexpr dp::u32 ERR_SNAPSHOT_CORRUPT = 110;
    constexpr dp::u32 ERR_TOKEN_LOCKED = 111;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be greater than zero") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error not_owner(const dp::String &msg = "Caller is not the sale owner") {
        return dp::Error{ERR_NOT_OWNER, msg};
    }

    inline dp::Error already_finalized(const dp::String &msg = "Sale already finalized") {
        return dp::Error{ERR_ALREADY_FINALIZED, msg};
    }

    inline dp::Error refund_not_allowed(const dp::String &msg = "Refunds are not allowed") {
        return dp::Error{ERR_REFUND_NOT_ALLOWED, msg};
    }

    inline dp::Error no_funds_to_refund(const dp::String &msg = "No funds to refund") {
        return dp::Error{ERR_NO_FUNDS_TO_REFUND, msg};
    }

    inline dp::Error transfer_failed(const dp::String &msg = "Transfer failed") {
        return dp::Error{ERR_TRANSFER_FAILED, msg};
    }

    inline dp::Error construction_invalid(const dp::String &msg = "Invalid sale parameters") {
        return dp::Error{ERR_CONSTRUCTION_INVALID, msg};
    }

    inline dp::Error issuer_failed(const dp::String &msg = "Token issuer rejected the call") {
        return dp::Error{ERR_ISSUER_FAILED, msg};
    }

    inline dp::Error withdraw_not_allowed(const dp::String &msg = "Funds can only be withdrawn after release") {
        return dp::Error{ERR_WITHDRAW_NOT_ALLOWED, msg};
    }

    inline dp::Error nothing_to_withdraw(const dp::String &msg = "Nothing to withdraw") {
        return dp::Error{ERR_NOTHING_TO_WITHDRAW, msg};
    }

    inline dp::Error snapshot_corrupt(const dp::String &msg = "Snapshot is corrupt") {
        return dp::Error{ERR_SNAPSHOT_CORRUPT, msg};
    }

    inline dp::Error token_locked(const dp::String &msg = "Token is locked until release") {
        return dp::Error{ERR_TOKEN_LOCKED, msg};
    }

    /// Check whether an error carries the given crowdit code
    inline bool hasCode(const dp::Error &error, dp::u32 code) { return error.code == code; }

} // namespace crowdit
