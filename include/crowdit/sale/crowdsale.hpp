#pragma once

#include "../common/error.hpp"
#include "events.hpp"
#include "issuer.hpp"
#include "journal.hpp"
#include "payment.hpp"
#include "snapshot.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crowdit {

    /// Crowdsale funding ledger
    ///
    /// Accepts contributions while open. A single owner-only finalize either releases the
    /// issued units (objective met) or opens refunds (objective missed). Every operation is
    /// all-or-nothing: a rejected call leaves the ledger exactly as it was.
    class Crowdsale {
      public:
        /// Validate parameters and build a ledger. A null issuer gets a fresh LockedToken.
        static dp::Result<std::shared_ptr<Crowdsale>, dp::Error>
        create(const SaleConfig &config, std::shared_ptr<PaymentGateway> gateway,
               std::shared_ptr<TokenIssuer> issuer = nullptr, Instant now = currentTimestamp());

        /// Rebuild a ledger from persisted state
        static dp::Result<std::shared_ptr<Crowdsale>, dp::Error> restore(const SaleSnapshot &snapshot,
                                                                         std::shared_ptr<PaymentGateway> gateway,
                                                                         std::shared_ptr<TokenIssuer> issuer);

        Crowdsale(const Crowdsale &) = delete;
        Crowdsale &operator=(const Crowdsale &) = delete;

        // ===========================================
        // Operations
        // ===========================================

        dp::Result<void, dp::Error> invest(const Identity &contributor, Amount amount);

        dp::Result<void, dp::Error> finalize(const Identity &caller);

        dp::Result<void, dp::Error> refund(const Identity &caller);

        /// Pay the raised funds to the owner after release; returns the amount paid
        dp::Result<Amount, dp::Error> withdraw(const Identity &caller);

        void subscribe(std::shared_ptr<EventSink> sink);

        // ===========================================
        // Queries
        // ===========================================

        const Identity &owner() const { return owner_; }
        Instant startTime() const { return start_time_; }
        Instant endTime() const { return end_time_; }
        Amount unitPrice() const { return unit_price_; }
        Amount fundingObjective() const { return funding_objective_; }

        bool isFinalized() const;
        bool isRefundingAllowed() const;
        SaleState state() const;

        Amount contributionOf(const Identity &contributor) const;
        Amount totalReceived() const;
        Amount totalRefunded() const;
        Amount totalWithdrawn() const;

        /// Contributors with a non-zero balance
        size_t contributorCount() const;

        /// Sum of balances still refundable
        Amount outstandingRefunds() const;

        std::shared_ptr<TokenIssuer> issuer() const { return issuer_; }

        SaleSnapshot snapshot() const;

      private:
        Crowdsale(const SaleConfig &config, std::shared_ptr<PaymentGateway> gateway,
                  std::shared_ptr<TokenIssuer> issuer);

        dp::Result<void, dp::Error> applyInvest(const Identity &contributor, Amount amount);
        dp::Result<void, dp::Error> applyFinalize(const Identity &caller);
        dp::Result<void, dp::Error> applyRefund(const Identity &caller);
        dp::Result<Amount, dp::Error> applyWithdraw(const Identity &caller);

        /// Deliver committed events to the sinks with the state lock released.
        /// Only the outermost operation drains, and only one drain runs at a time.
        void flush(std::unique_lock<std::recursive_mutex> &lock);

        const Identity owner_;
        const Instant start_time_;
        const Instant end_time_;
        const Amount unit_price_;
        const Amount funding_objective_;

        bool finalized_ = false;
        bool refunding_allowed_ = false;
        std::unordered_map<Identity, Amount> contributions_;
        Amount total_received_ = 0;
        Amount total_refunded_ = 0;
        Amount total_withdrawn_ = 0;

        std::shared_ptr<TokenIssuer> issuer_;
        std::shared_ptr<PaymentGateway> gateway_;
        std::vector<std::shared_ptr<EventSink>> sinks_;

        // Events of committed operations awaiting delivery, in emission order
        std::vector<SaleEvent> outbox_;
        dp::u32 depth_ = 0;
        bool draining_ = false;

        // Collaborators may call back into the sale while a transfer or mint is in flight
        mutable std::recursive_mutex mutex_;
    };

} // namespace crowdit
