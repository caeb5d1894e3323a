#pragma once

#include "../common/error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace crowdit {

    /// Pays out funds held by the sale
    class PaymentGateway {
      public:
        virtual ~PaymentGateway() = default;
        virtual dp::Result<void, dp::Error> transfer(const Identity &to, Amount amount) = 0;
    };

    /// In-memory escrow holding contributed funds
    class EscrowAccount : public PaymentGateway {
      public:
        EscrowAccount() = default;

        /// Record funds arriving from a contributor
        inline dp::Result<void, dp::Error> deposit(const Identity &from, Amount amount) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (amount == 0) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Deposit must be positive"));
            }
            if (held_ > std::numeric_limits<Amount>::max() - amount) {
                return dp::Result<void, dp::Error>::err(dp::Error::out_of_range("Escrow balance overflow"));
            }
            held_ += amount;
            deposited_by_[from] += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> transfer(const Identity &to, Amount amount) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (blocked_.count(to) != 0) {
                return dp::Result<void, dp::Error>::err(
                    dp::Error::permission_denied(dp::String(("Recipient " + to + " rejects payments").c_str())));
            }
            if (amount > held_) {
                return dp::Result<void, dp::Error>::err(dp::Error::out_of_range("Insufficient escrow balance"));
            }
            held_ -= amount;
            paid_to_[to] += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Make every payment to the recipient fail
        inline void block(const Identity &recipient) {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.insert(recipient);
        }

        inline void unblock(const Identity &recipient) {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_.erase(recipient);
        }

        inline Amount balance() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return held_;
        }

        inline Amount paidTo(const Identity &recipient) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = paid_to_.find(recipient);
            return it == paid_to_.end() ? 0 : it->second;
        }

        inline Amount depositedBy(const Identity &contributor) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = deposited_by_.find(contributor);
            return it == deposited_by_.end() ? 0 : it->second;
        }

      private:
        Amount held_ = 0;
        std::unordered_map<Identity, Amount> paid_to_;
        std::unordered_map<Identity, Amount> deposited_by_;
        std::unordered_set<Identity> blocked_;
        mutable std::mutex mutex_;
    };

} // namespace crowdit
