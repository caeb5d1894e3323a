#include <crowdit/common/hash.hpp>
#include <crowdit/sale/audit_log.hpp>
#include <iostream>
#include <mutex>

namespace crowdit {

    namespace {

        struct AuditTrail {
            dp::Vector<AuditEntry> entries;

            auto members() { return std::tie(entries); }
            auto members() const { return std::tie(entries); }
        };

    } // namespace

    const std::string AuditLog::ROOT_HASH(64, '0');

    AuditLog::AuditLog() : hasher_([](const std::vector<uint8_t> &data) { return sha256(data); }) {}

    AuditLog::AuditLog(Hasher hasher) : hasher_(std::move(hasher)) {}

    AuditLog::AuditLog(const AuditLog &other) {
        std::shared_lock lock(other.mutex_);
        hasher_ = other.hasher_;
        entries_ = other.entries_;
        last_error_ = other.last_error_;
    }

    AuditLog &AuditLog::operator=(const AuditLog &other) {
        if (this != &other) {
            std::shared_lock theirs(other.mutex_, std::defer_lock);
            std::unique_lock mine(mutex_, std::defer_lock);
            std::lock(mine, theirs);
            hasher_ = other.hasher_;
            entries_ = other.entries_;
            last_error_ = other.last_error_;
        }
        return *this;
    }

    dp::Result<std::string, dp::Error> AuditLog::chainHash(const std::string &previous, dp::u64 sequence,
                                                           const SaleEvent &event) const {
        auto &mutable_event = const_cast<SaleEvent &>(event);
        auto encoded = dp::serialize<dp::Mode::WITH_VERSION>(mutable_event);

        std::vector<uint8_t> input(previous.begin(), previous.end());
        std::string seq = std::to_string(sequence);
        input.insert(input.end(), seq.begin(), seq.end());
        input.insert(input.end(), encoded.begin(), encoded.end());

        auto digest = hasher_(input);
        if (!digest.is_ok()) {
            return dp::Result<std::string, dp::Error>::err(digest.error());
        }
        return dp::Result<std::string, dp::Error>::ok(toHex(digest.value()));
    }

    void AuditLog::publish(const SaleEvent &event) {
        std::unique_lock lock(mutex_);

        AuditEntry entry;
        entry.sequence = static_cast<dp::u64>(entries_.size());
        entry.event = event;
        std::string previous = entries_.empty() ? ROOT_HASH : entries_.back().getHash();
        entry.previous_hash = dp::String(previous.c_str());

        auto hash = chainHash(previous, entry.sequence, event);
        if (!hash.is_ok()) {
            std::cerr << "Audit hash failed for entry " << entry.sequence << ": " << hash.error().message.c_str()
                      << std::endl;
            last_error_ = hash.error();
            return;
        }
        entry.hash = dp::String(hash.value().c_str());
        entries_.push_back(std::move(entry));
    }

    std::optional<dp::Error> AuditLog::lastError() const {
        std::shared_lock lock(mutex_);
        return last_error_;
    }

    dp::Result<bool, dp::Error> AuditLog::verify() const {
        std::shared_lock lock(mutex_);

        std::string previous = ROOT_HASH;
        for (size_t i = 0; i < entries_.size(); ++i) {
            const auto &entry = entries_[i];
            std::string where = "Audit chain broken at entry " + std::to_string(i);
            if (entry.sequence != i || entry.getPreviousHash() != previous) {
                return dp::Result<bool, dp::Error>::err(snapshot_corrupt(dp::String(where.c_str())));
            }
            auto expected = chainHash(previous, entry.sequence, entry.event);
            if (!expected.is_ok()) {
                return dp::Result<bool, dp::Error>::err(expected.error());
            }
            if (expected.value() != entry.getHash()) {
                return dp::Result<bool, dp::Error>::err(snapshot_corrupt(dp::String(where.c_str())));
            }
            previous = entry.getHash();
        }
        return dp::Result<bool, dp::Error>::ok(true);
    }

    size_t AuditLog::size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    std::vector<AuditEntry> AuditLog::entries() const {
        std::shared_lock lock(mutex_);
        return entries_;
    }

    std::vector<AuditEntry> AuditLog::entriesFor(const Identity &account) const {
        std::shared_lock lock(mutex_);
        std::vector<AuditEntry> result;
        for (const auto &entry : entries_) {
            if (entry.event.getAccount() == account) {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::string AuditLog::head() const {
        std::shared_lock lock(mutex_);
        return entries_.empty() ? ROOT_HASH : entries_.back().getHash();
    }

    std::vector<uint8_t> AuditLog::toBytes() const {
        AuditTrail trail;
        {
            std::shared_lock lock(mutex_);
            for (const auto &entry : entries_) {
                trail.entries.push_back(entry);
            }
        }
        auto buf = dp::serialize<dp::Mode::WITH_VERSION>(trail);
        return std::vector<uint8_t>(buf.begin(), buf.end());
    }

    dp::Result<AuditLog, dp::Error> AuditLog::fromBytes(const std::vector<uint8_t> &data) {
        try {
            dp::ByteBuf buf(data.begin(), data.end());
            auto trail = dp::deserialize<dp::Mode::WITH_VERSION, AuditTrail>(buf);
            std::vector<AuditEntry> entries(trail.entries.begin(), trail.entries.end());
            return dp::Result<AuditLog, dp::Error>::ok(fromEntries(entries));
        } catch (const std::exception &e) {
            return dp::Result<AuditLog, dp::Error>::err(snapshot_corrupt(dp::String(e.what())));
        }
    }

    AuditLog AuditLog::fromEntries(const std::vector<AuditEntry> &entries) {
        AuditLog log;
        log.entries_ = entries;
        return log;
    }

} // namespace crowdit
