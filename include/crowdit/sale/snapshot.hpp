#pragma once

#include "../common/error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace crowdit {

    /// One contributor's recorded balance
    struct ContributionRecord {
        dp::String contributor;
        dp::u64 amount{0};

        ContributionRecord() = default;
        ContributionRecord(const Identity &who, Amount value) : contributor(dp::String(who.c_str())), amount(value) {}

        inline std::string getContributor() const { return std::string(contributor.c_str()); }

        auto members() { return std::tie(contributor, amount); }
        auto members() const { return std::tie(contributor, amount); }
    };

    /// Complete persisted state of a sale
    struct SaleSnapshot {
        dp::String owner;
        dp::i64 start_time{0};
        dp::i64 end_time{0};
        dp::u64 unit_price{0};
        dp::u64 funding_objective{0};
        bool finalized{false};
        bool refunding_allowed{false};
        dp::u64 total_received{0};
        dp::u64 total_refunded{0};
        dp::u64 total_withdrawn{0};
        dp::Vector<ContributionRecord> contributions; // sorted by contributor

        inline std::string getOwner() const { return std::string(owner.c_str()); }

        /// Serialize to bytes
        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<SaleSnapshot &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        /// Deserialize from bytes
        inline static dp::Result<SaleSnapshot, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, SaleSnapshot>(buf);
                return dp::Result<SaleSnapshot, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<SaleSnapshot, dp::Error>::err(snapshot_corrupt(dp::String(e.what())));
            }
        }

        auto members() {
            return std::tie(owner, start_time, end_time, unit_price, funding_objective, finalized, refunding_allowed,
                            total_received, total_refunded, total_withdrawn, contributions);
        }
        auto members() const {
            return std::tie(owner, start_time, end_time, unit_price, funding_objective, finalized, refunding_allowed,
                            total_received, total_refunded, total_withdrawn, contributions);
        }
    };

} // namespace crowdit
