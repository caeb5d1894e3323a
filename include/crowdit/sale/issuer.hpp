#pragma once

#include "../common/error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>

namespace crowdit {

    /// Token contract the sale mints into and releases on success
    class TokenIssuer {
      public:
        virtual ~TokenIssuer() = default;

        /// Credit unissued units to a beneficiary
        virtual dp::Result<void, dp::Error> mint(const Identity &beneficiary, Amount amount) = 0;

        /// Make every minted unit transferable
        virtual dp::Result<void, dp::Error> release() = 0;
    };

    /// In-memory token with zero initial supply, locked until released
    class LockedToken : public TokenIssuer {
      public:
        LockedToken() = default;

        inline dp::Result<void, dp::Error> mint(const Identity &beneficiary, Amount amount) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (beneficiary.empty()) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Beneficiary is empty"));
            }
            if (amount == 0) {
                return dp::Result<void, dp::Error>::ok();
            }
            if (total_supply_ > std::numeric_limits<Amount>::max() - amount) {
                return dp::Result<void, dp::Error>::err(dp::Error::out_of_range("Token supply overflow"));
            }
            balances_[beneficiary] += amount;
            total_supply_ += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline dp::Result<void, dp::Error> release() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Token already released"));
            }
            released_ = true;
            return dp::Result<void, dp::Error>::ok();
        }

        /// Move units between holders, only once released
        inline dp::Result<void, dp::Error> transfer(const Identity &from, const Identity &to, Amount amount) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!released_) {
                return dp::Result<void, dp::Error>::err(token_locked());
            }
            auto it = balances_.find(from);
            if (it == balances_.end() || it->second < amount) {
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Insufficient token balance"));
            }
            it->second -= amount;
            balances_[to] += amount;
            return dp::Result<void, dp::Error>::ok();
        }

        inline Amount balanceOf(const Identity &holder) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = balances_.find(holder);
            return it == balances_.end() ? 0 : it->second;
        }

        inline Amount totalSupply() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return total_supply_;
        }

        inline bool isReleased() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return released_;
        }

      private:
        std::unordered_map<Identity, Amount> balances_;
        Amount total_supply_ = 0;
        bool released_ = false;
        mutable std::mutex mutex_;
    };

} // namespace crowdit
