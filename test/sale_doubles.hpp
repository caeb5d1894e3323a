#pragma once

#include "crowdit.hpp"
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Shared collaborators for the sale tests

namespace doubles {

    constexpr crowdit::Instant NOW = 1700000000;

    inline crowdit::SaleConfig config(crowdit::Amount unit_price = 100, crowdit::Amount objective = 1000) {
        crowdit::SaleConfig cfg;
        cfg.owner = "owner";
        cfg.start_time = NOW;
        cfg.end_time = NOW + 3600;
        cfg.unit_price = unit_price;
        cfg.funding_objective = objective;
        return cfg;
    }

    /// Issuer recording every call, optionally rejecting them
    class RecordingIssuer : public crowdit::TokenIssuer {
      public:
        std::vector<std::pair<crowdit::Identity, crowdit::Amount>> mints;
        int release_calls = 0;
        bool fail_mint = false;
        bool fail_release = false;

        dp::Result<void, dp::Error> mint(const crowdit::Identity &beneficiary, crowdit::Amount amount) override {
            if (fail_mint)
                return dp::Result<void, dp::Error>::err(dp::Error::io_error("mint offline"));
            mints.emplace_back(beneficiary, amount);
            return dp::Result<void, dp::Error>::ok();
        }

        dp::Result<void, dp::Error> release() override {
            if (fail_release)
                return dp::Result<void, dp::Error>::err(dp::Error::io_error("release offline"));
            release_calls++;
            return dp::Result<void, dp::Error>::ok();
        }
    };

    /// Sink keeping every published event
    class CollectingSink : public crowdit::EventSink {
      public:
        std::vector<crowdit::SaleEvent> events;

        void publish(const crowdit::SaleEvent &event) override { events.push_back(event); }
    };

    /// Gateway that calls back into the sale before paying
    class ReentrantGateway : public crowdit::PaymentGateway {
      public:
        std::shared_ptr<crowdit::EscrowAccount> escrow = std::make_shared<crowdit::EscrowAccount>();
        std::weak_ptr<crowdit::Crowdsale> sale;
        std::vector<dp::Error> reentry_errors;
        int reentry_successes = 0;

        dp::Result<void, dp::Error> transfer(const crowdit::Identity &to, crowdit::Amount amount) override {
            if (auto target = sale.lock()) {
                auto again = target->refund(to);
                if (again.is_ok())
                    reentry_successes++;
                else
                    reentry_errors.push_back(again.error());
            }
            return escrow->transfer(to, amount);
        }
    };

    /// Issuer that calls back into the sale from inside mint and release
    class ReentrantIssuer : public crowdit::TokenIssuer {
      public:
        std::weak_ptr<crowdit::Crowdsale> sale;
        std::vector<std::pair<crowdit::Identity, crowdit::Amount>> mints;
        int release_calls = 0;
        bool finalize_on_release = false;
        // Invested once from inside the next mint for anyone else
        crowdit::Identity nested_investor;
        crowdit::Amount nested_amount = 0;
        // Reject the outer mint after the nested investment went through
        bool fail_outer_mint = false;
        std::vector<dp::Error> reentry_errors;
        int reentry_successes = 0;

        dp::Result<void, dp::Error> mint(const crowdit::Identity &beneficiary, crowdit::Amount amount) override {
            mints.emplace_back(beneficiary, amount);
            if (nested_amount > 0 && beneficiary != nested_investor) {
                crowdit::Amount pending = nested_amount;
                nested_amount = 0;
                if (auto target = sale.lock())
                    track(target->invest(nested_investor, pending));
                if (fail_outer_mint)
                    return dp::Result<void, dp::Error>::err(dp::Error::io_error("mint offline"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

        dp::Result<void, dp::Error> release() override {
            release_calls++;
            if (finalize_on_release) {
                if (auto target = sale.lock())
                    track(target->finalize("owner"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

      private:
        void track(const dp::Result<void, dp::Error> &result) {
            if (result.is_ok())
                reentry_successes++;
            else
                reentry_errors.push_back(result.error());
        }
    };

    /// Sink that reads the sale from a separate thread on every event
    class ThreadedQuerySink : public crowdit::EventSink {
      public:
        std::weak_ptr<crowdit::Crowdsale> sale;
        std::vector<crowdit::Amount> observed_totals;

        void publish(const crowdit::SaleEvent &) override {
            auto target = sale.lock();
            if (!target)
                return;
            crowdit::Amount total = 0;
            std::thread reader([&total, target]() { total = target->totalReceived(); });
            reader.join();
            observed_totals.push_back(total);
        }
    };

    struct SaleFixture {
        std::shared_ptr<crowdit::EscrowAccount> escrow = std::make_shared<crowdit::EscrowAccount>();
        std::shared_ptr<RecordingIssuer> issuer = std::make_shared<RecordingIssuer>();
        std::shared_ptr<CollectingSink> sink = std::make_shared<CollectingSink>();
        std::shared_ptr<crowdit::Crowdsale> sale;

        explicit SaleFixture(crowdit::Amount unit_price = 100, crowdit::Amount objective = 1000) {
            auto created = crowdit::Crowdsale::create(config(unit_price, objective), escrow, issuer, NOW);
            if (created.is_ok()) {
                sale = created.value();
                sale->subscribe(sink);
            }
        }

        /// Deposit into escrow and record the investment
        dp::Result<void, dp::Error> invest(const crowdit::Identity &who, crowdit::Amount amount) {
            auto result = sale->invest(who, amount);
            if (result.is_ok()) {
                auto deposited = escrow->deposit(who, amount);
                if (!deposited.is_ok())
                    return deposited;
            }
            return result;
        }
    };

} // namespace doubles
