#pragma once

#include "../common/error.hpp"
#include "events.hpp"
#include <datapod/datapod.hpp>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <vector>

namespace crowdit {

    /// One link of the audit hash chain
    struct AuditEntry {
        dp::u64 sequence{0};
        SaleEvent event;
        dp::String previous_hash;
        dp::String hash;

        inline std::string getHash() const { return std::string(hash.c_str()); }
        inline std::string getPreviousHash() const { return std::string(previous_hash.c_str()); }

        auto members() { return std::tie(sequence, event, previous_hash, hash); }
        auto members() const { return std::tie(sequence, event, previous_hash, hash); }
    };

    /// Tamper-evident record of every committed sale event
    class AuditLog : public EventSink {
      public:
        /// Hash every chain starts from
        static const std::string ROOT_HASH;

        /// Digest function used to link entries
        using Hasher = std::function<dp::Result<std::vector<uint8_t>, dp::Error>(const std::vector<uint8_t> &)>;

        AuditLog();
        explicit AuditLog(Hasher hasher);

        /// Append an entry. An event that cannot be hashed is not recorded; see lastError().
        void publish(const SaleEvent &event) override;

        /// Failure of the most recent publish that dropped its event
        std::optional<dp::Error> lastError() const;

        /// Recompute the chain. Errors name the first broken sequence.
        dp::Result<bool, dp::Error> verify() const;

        size_t size() const;
        std::vector<AuditEntry> entries() const;
        std::vector<AuditEntry> entriesFor(const Identity &account) const;

        /// Hash of the newest entry, ROOT_HASH when empty
        std::string head() const;

        std::vector<uint8_t> toBytes() const;
        static dp::Result<AuditLog, dp::Error> fromBytes(const std::vector<uint8_t> &data);

        /// Adopt existing entries as-is; call verify() before trusting them
        static AuditLog fromEntries(const std::vector<AuditEntry> &entries);

        AuditLog(const AuditLog &other);
        AuditLog &operator=(const AuditLog &other);

      private:
        dp::Result<std::string, dp::Error> chainHash(const std::string &previous, dp::u64 sequence,
                                                     const SaleEvent &event) const;

        Hasher hasher_;
        std::vector<AuditEntry> entries_;
        std::optional<dp::Error> last_error_;
        mutable std::shared_mutex mutex_;
    };

} // namespace crowdit
