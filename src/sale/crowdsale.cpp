#include <algorithm>
#include <crowdit/sale/crowdsale.hpp>
#include <iostream>
#include <limits>
#include <unordered_set>

namespace crowdit {

    namespace {

        dp::String describe(const std::string &prefix, const dp::Error &cause) {
            return dp::String((prefix + ": " + std::string(cause.message.c_str())).c_str());
        }

        /// Tracks how deeply ledger operations are nested on the locking thread
        struct DepthScope {
            explicit DepthScope(dp::u32 &depth) : depth_(depth) { ++depth_; }
            ~DepthScope() { --depth_; }

            DepthScope(const DepthScope &) = delete;
            DepthScope &operator=(const DepthScope &) = delete;

          private:
            dp::u32 &depth_;
        };

    } // namespace

    Crowdsale::Crowdsale(const SaleConfig &config, std::shared_ptr<PaymentGateway> gateway,
                         std::shared_ptr<TokenIssuer> issuer)
        : owner_(config.owner), start_time_(config.start_time), end_time_(config.end_time),
          unit_price_(config.unit_price), funding_objective_(config.funding_objective), issuer_(std::move(issuer)),
          gateway_(std::move(gateway)) {}

    dp::Result<std::shared_ptr<Crowdsale>, dp::Error> Crowdsale::create(const SaleConfig &config,
                                                                        std::shared_ptr<PaymentGateway> gateway,
                                                                        std::shared_ptr<TokenIssuer> issuer,
                                                                        Instant now) {
        using R = dp::Result<std::shared_ptr<Crowdsale>, dp::Error>;

        if (config.owner.empty()) {
            return R::err(construction_invalid("Owner identity is empty"));
        }
        if (config.start_time < now) {
            return R::err(construction_invalid("Start time is in the past"));
        }
        if (config.end_time < config.start_time) {
            return R::err(construction_invalid("End time is before start time"));
        }
        if (config.unit_price == 0) {
            return R::err(construction_invalid("Unit price must be positive"));
        }
        if (config.funding_objective == 0) {
            return R::err(construction_invalid("Funding objective must be positive"));
        }
        if (!gateway) {
            return R::err(construction_invalid("Payment gateway is required"));
        }
        if (!issuer) {
            issuer = std::make_shared<LockedToken>();
        }

        return R::ok(std::shared_ptr<Crowdsale>(new Crowdsale(config, std::move(gateway), std::move(issuer))));
    }

    dp::Result<std::shared_ptr<Crowdsale>, dp::Error> Crowdsale::restore(const SaleSnapshot &snapshot,
                                                                         std::shared_ptr<PaymentGateway> gateway,
                                                                         std::shared_ptr<TokenIssuer> issuer) {
        using R = dp::Result<std::shared_ptr<Crowdsale>, dp::Error>;

        if (!gateway || !issuer) {
            return R::err(construction_invalid("Restore requires a payment gateway and the sale's issuer"));
        }
        if (snapshot.owner.empty()) {
            return R::err(snapshot_corrupt("Owner identity is empty"));
        }
        if (snapshot.unit_price == 0 || snapshot.funding_objective == 0) {
            return R::err(snapshot_corrupt("Unit price and objective must be positive"));
        }
        if (snapshot.end_time < snapshot.start_time) {
            return R::err(snapshot_corrupt("End time is before start time"));
        }
        if (snapshot.refunding_allowed && !snapshot.finalized) {
            return R::err(snapshot_corrupt("Refunding without finalize"));
        }
        if (snapshot.total_refunded > 0 && !snapshot.refunding_allowed) {
            return R::err(snapshot_corrupt("Refunds outside the refunding state"));
        }
        if (snapshot.total_withdrawn > 0 && (!snapshot.finalized || snapshot.refunding_allowed)) {
            return R::err(snapshot_corrupt("Withdrawal outside the released state"));
        }
        if (snapshot.total_refunded > snapshot.total_received ||
            snapshot.total_withdrawn > snapshot.total_received - snapshot.total_refunded) {
            return R::err(snapshot_corrupt("Payouts exceed received funds"));
        }

        Amount balance_sum = 0;
        std::unordered_set<std::string> seen;
        for (const auto &record : snapshot.contributions) {
            if (!seen.insert(record.getContributor()).second) {
                return R::err(snapshot_corrupt("Duplicate contributor"));
            }
            if (balance_sum > std::numeric_limits<Amount>::max() - record.amount) {
                return R::err(snapshot_corrupt("Contribution total overflows"));
            }
            balance_sum += record.amount;
        }
        if (balance_sum != snapshot.total_received - snapshot.total_refunded) {
            return R::err(snapshot_corrupt("Contributions do not balance against received minus refunded"));
        }

        SaleConfig config;
        config.owner = snapshot.getOwner();
        config.start_time = snapshot.start_time;
        config.end_time = snapshot.end_time;
        config.unit_price = snapshot.unit_price;
        config.funding_objective = snapshot.funding_objective;

        std::shared_ptr<Crowdsale> sale(new Crowdsale(config, std::move(gateway), std::move(issuer)));
        sale->finalized_ = snapshot.finalized;
        sale->refunding_allowed_ = snapshot.refunding_allowed;
        sale->total_received_ = snapshot.total_received;
        sale->total_refunded_ = snapshot.total_refunded;
        sale->total_withdrawn_ = snapshot.total_withdrawn;
        for (const auto &record : snapshot.contributions) {
            sale->contributions_[record.getContributor()] = record.amount;
        }
        return R::ok(sale);
    }

    dp::Result<void, dp::Error> Crowdsale::invest(const Identity &contributor, Amount amount) {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        auto result = applyInvest(contributor, amount);
        flush(lock);
        return result;
    }

    dp::Result<void, dp::Error> Crowdsale::finalize(const Identity &caller) {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        auto result = applyFinalize(caller);
        flush(lock);
        return result;
    }

    dp::Result<void, dp::Error> Crowdsale::refund(const Identity &caller) {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        auto result = applyRefund(caller);
        flush(lock);
        return result;
    }

    dp::Result<Amount, dp::Error> Crowdsale::withdraw(const Identity &caller) {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        auto result = applyWithdraw(caller);
        flush(lock);
        return result;
    }

    // ===========================================
    // Operation bodies (state lock held)
    // ===========================================

    dp::Result<void, dp::Error> Crowdsale::applyInvest(const Identity &contributor, Amount amount) {
        DepthScope scope(depth_);

        // start_time_/end_time_ are recorded only, investing is not gated on them
        if (amount == 0) {
            return dp::Result<void, dp::Error>::err(invalid_amount());
        }
        if (contributor.empty()) {
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Contributor identity is empty"));
        }
        if (total_received_ > std::numeric_limits<Amount>::max() - amount) {
            return dp::Result<void, dp::Error>::err(invalid_amount("Contribution overflows sale totals"));
        }

        Journal journal(outbox_);

        contributions_[contributor] += amount;
        journal.record([this, contributor, amount]() {
            auto it = contributions_.find(contributor);
            if (it == contributions_.end())
                return;
            it->second -= amount;
            if (it->second == 0)
                contributions_.erase(it);
        });
        total_received_ += amount;
        journal.record([this, amount]() { total_received_ -= amount; });

        // Any remainder below one unit price stays unconverted
        Amount units = amount / unit_price_;
        journal.emit(SaleEvent(SaleEventType::InvestmentRecorded, contributor, amount,
                               "Investment recorded: " + contributor + " contributed " + std::to_string(amount) +
                                   " (" + std::to_string(units) + " units minted)"));

        auto minted = issuer_->mint(contributor, units);
        if (!minted.is_ok()) {
            return dp::Result<void, dp::Error>::err(issuer_failed(describe("Mint failed", minted.error())));
        }

        journal.commit();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Crowdsale::applyFinalize(const Identity &caller) {
        DepthScope scope(depth_);

        if (finalized_) {
            return dp::Result<void, dp::Error>::err(already_finalized());
        }
        if (caller != owner_) {
            return dp::Result<void, dp::Error>::err(
                not_owner(dp::String(("Only the owner can finalize, not " + caller).c_str())));
        }

        Journal journal(outbox_);
        std::string raised = std::to_string(total_received_) + " of " + std::to_string(funding_objective_);

        // Closed before the issuer is called, a reentrant finalize sees the sale finalized
        journal.assign(finalized_, true);

        if (total_received_ >= funding_objective_) {
            journal.emit(SaleEvent(SaleEventType::ObjectiveMet, owner_, total_received_,
                                   "Objective met: raised " + raised + ", units released"));
            auto released = issuer_->release();
            if (!released.is_ok()) {
                return dp::Result<void, dp::Error>::err(issuer_failed(describe("Release failed", released.error())));
            }
        } else {
            journal.assign(refunding_allowed_, true);
            journal.emit(SaleEvent(SaleEventType::ObjectiveNotMet, owner_, total_received_,
                                   "Objective not met: raised " + raised + ", refunds enabled"));
        }

        journal.commit();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Crowdsale::applyRefund(const Identity &caller) {
        DepthScope scope(depth_);

        if (!refunding_allowed_) {
            return dp::Result<void, dp::Error>::err(refund_not_allowed());
        }
        auto it = contributions_.find(caller);
        if (it == contributions_.end() || it->second == 0) {
            return dp::Result<void, dp::Error>::err(
                no_funds_to_refund(dp::String(("No funds to refund for " + caller).c_str())));
        }

        Journal journal(outbox_);
        Amount amount = it->second;

        // Effects before interaction: the slot is empty while the payment is in flight
        it->second = 0;
        journal.record([this, caller, amount]() { contributions_[caller] += amount; });
        total_refunded_ += amount;
        journal.record([this, amount]() { total_refunded_ -= amount; });
        journal.emit(SaleEvent(SaleEventType::RefundIssued, caller, amount,
                               "Refund issued: " + caller + " received " + std::to_string(amount)));

        auto paid = gateway_->transfer(caller, amount);
        if (!paid.is_ok()) {
            return dp::Result<void, dp::Error>::err(transfer_failed(describe("Refund payment failed", paid.error())));
        }

        journal.commit();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Amount, dp::Error> Crowdsale::applyWithdraw(const Identity &caller) {
        DepthScope scope(depth_);

        if (caller != owner_) {
            return dp::Result<Amount, dp::Error>::err(
                not_owner(dp::String(("Only the owner can withdraw, not " + caller).c_str())));
        }
        if (!finalized_ || refunding_allowed_) {
            return dp::Result<Amount, dp::Error>::err(withdraw_not_allowed());
        }
        Amount amount = total_received_ - total_withdrawn_;
        if (amount == 0) {
            return dp::Result<Amount, dp::Error>::err(nothing_to_withdraw());
        }

        Journal journal(outbox_);
        total_withdrawn_ += amount;
        journal.record([this, amount]() { total_withdrawn_ -= amount; });
        journal.emit(SaleEvent(SaleEventType::FundsWithdrawn, owner_, amount,
                               "Funds withdrawn: " + owner_ + " received " + std::to_string(amount)));

        auto paid = gateway_->transfer(owner_, amount);
        if (!paid.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(transfer_failed(describe("Withdrawal payment failed", paid.error())));
        }

        journal.commit();
        return dp::Result<Amount, dp::Error>::ok(amount);
    }

    void Crowdsale::subscribe(std::shared_ptr<EventSink> sink) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (sink) {
            sinks_.push_back(std::move(sink));
        }
    }

    void Crowdsale::flush(std::unique_lock<std::recursive_mutex> &lock) {
        // Nested operations leave their events to the outer one; a running drain picks up new ones
        if (depth_ > 0 || draining_) {
            return;
        }
        draining_ = true;
        while (!outbox_.empty()) {
            std::vector<SaleEvent> events = std::move(outbox_);
            outbox_.clear();
            std::vector<std::shared_ptr<EventSink>> sinks = sinks_;

            lock.unlock();
            for (const auto &event : events) {
                std::cout << "[crowdit] " << event.getMessage() << std::endl;
                for (const auto &sink : sinks) {
                    sink->publish(event);
                }
            }
            lock.lock();
        }
        draining_ = false;
    }

    bool Crowdsale::isFinalized() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return finalized_;
    }

    bool Crowdsale::isRefundingAllowed() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return refunding_allowed_;
    }

    SaleState Crowdsale::state() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!finalized_)
            return SaleState::Open;
        return refunding_allowed_ ? SaleState::Refunding : SaleState::Released;
    }

    Amount Crowdsale::contributionOf(const Identity &contributor) const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = contributions_.find(contributor);
        return it == contributions_.end() ? 0 : it->second;
    }

    Amount Crowdsale::totalReceived() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return total_received_;
    }

    Amount Crowdsale::totalRefunded() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return total_refunded_;
    }

    Amount Crowdsale::totalWithdrawn() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return total_withdrawn_;
    }

    size_t Crowdsale::contributorCount() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(contributions_.begin(), contributions_.end(),
                                                 [](const auto &entry) { return entry.second > 0; }));
    }

    Amount Crowdsale::outstandingRefunds() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!refunding_allowed_)
            return 0;
        Amount outstanding = 0;
        for (const auto &[contributor, amount] : contributions_)
            outstanding += amount;
        return outstanding;
    }

    SaleSnapshot Crowdsale::snapshot() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);

        SaleSnapshot snap;
        snap.owner = dp::String(owner_.c_str());
        snap.start_time = start_time_;
        snap.end_time = end_time_;
        snap.unit_price = unit_price_;
        snap.funding_objective = funding_objective_;
        snap.finalized = finalized_;
        snap.refunding_allowed = refunding_allowed_;
        snap.total_received = total_received_;
        snap.total_refunded = total_refunded_;
        snap.total_withdrawn = total_withdrawn_;

        std::vector<std::pair<Identity, Amount>> ordered(contributions_.begin(), contributions_.end());
        std::sort(ordered.begin(), ordered.end(), [](const auto &a, const auto &b) { return a.first < b.first; });
        for (const auto &[contributor, amount] : ordered)
            snap.contributions.push_back(ContributionRecord(contributor, amount));
        return snap;
    }

} // namespace crowdit
