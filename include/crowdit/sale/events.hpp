#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <tuple>

namespace crowdit {

    enum class SaleEventType : dp::u8 {
        InvestmentRecorded = 0,
        ObjectiveMet = 1,
        ObjectiveNotMet = 2,
        RefundIssued = 3,
        FundsWithdrawn = 4,
    };

    inline std::string saleEventTypeToString(SaleEventType type) {
        switch (type) {
        case SaleEventType::InvestmentRecorded:
            return "InvestmentRecorded";
        case SaleEventType::ObjectiveMet:
            return "ObjectiveMet";
        case SaleEventType::ObjectiveNotMet:
            return "ObjectiveNotMet";
        case SaleEventType::RefundIssued:
            return "RefundIssued";
        case SaleEventType::FundsWithdrawn:
            return "FundsWithdrawn";
        default:
            return "Unknown";
        }
    }

    /// Observable record of a committed ledger operation
    struct SaleEvent {
        dp::u8 type{0}; // SaleEventType
        dp::String account;
        dp::u64 amount{0};
        dp::i64 timestamp{0};
        dp::String message; // human-readable audit line

        SaleEvent() = default;

        SaleEvent(SaleEventType event_type, const Identity &who, Amount value, const std::string &text)
            : type(static_cast<dp::u8>(event_type)), account(dp::String(who.c_str())), amount(value),
              timestamp(currentTimestamp()), message(dp::String(text.c_str())) {}

        inline SaleEventType getType() const { return static_cast<SaleEventType>(type); }
        inline std::string getAccount() const { return std::string(account.c_str()); }
        inline std::string getMessage() const { return std::string(message.c_str()); }

        auto members() { return std::tie(type, account, amount, timestamp, message); }
        auto members() const { return std::tie(type, account, amount, timestamp, message); }
    };

    /// Receiver of committed sale events
    class EventSink {
      public:
        virtual ~EventSink() = default;
        virtual void publish(const SaleEvent &event) = 0;
    };

} // namespace crowdit
