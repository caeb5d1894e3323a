#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>

namespace crowdit {

    using Identity = std::string;
    using Amount = dp::u64;
    using Instant = dp::i64; // seconds since the Unix epoch

    inline Instant currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /// Construction parameters of a sale
    struct SaleConfig {
        Identity owner;
        Instant start_time = 0;
        Instant end_time = 0; // stored and validated, not enforced by invest
        Amount unit_price = 0;        // smallest-denomination price of one issued unit
        Amount funding_objective = 0; // smallest-denomination total deciding release vs refund
    };

    enum class SaleState : dp::u8 {
        Open = 0,
        Released = 1,
        Refunding = 2,
    };

    inline std::string saleStateToString(SaleState state) {
        switch (state) {
        case SaleState::Open:
            return "open";
        case SaleState::Released:
            return "released";
        case SaleState::Refunding:
            return "refunding";
        default:
            return "unknown";
        }
    }

} // namespace crowdit
