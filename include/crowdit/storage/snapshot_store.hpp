#pragma once

#include "../common/error.hpp"
#include "../common/hash.hpp"
#include "../sale/audit_log.hpp"
#include "../sale/snapshot.hpp"
#include <cstring>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace crowdit::storage {

    /// Storage configuration options
    struct StoreOptions {
        bool create_if_missing = true; // create the directory on open
        bool verbose = true;           // log every save/load to stdout
    };

    // ===========================================
    // SnapshotStore - checksummed files for sale state
    // ===========================================

    /// Frame: magic | checksum length | SHA-256 of payload | payload length | payload
    class SnapshotStore {
      public:
        static constexpr dp::u32 MAGIC_NUMBER = 0x44575243; // "CRWD"
        static constexpr const char *SALE_FILE = "sale.dat";
        static constexpr const char *AUDIT_FILE = "audit.dat";

        SnapshotStore() = default;

        /// Open storage at given directory
        inline dp::Result<void, dp::Error> open(const std::string &path, const StoreOptions &opts = StoreOptions{}) {
            try {
                base_path_ = path;
                options_ = opts;
                if (opts.create_if_missing) {
                    std::filesystem::create_directories(base_path_);
                } else if (!std::filesystem::is_directory(base_path_)) {
                    return dp::Result<void, dp::Error>::err(
                        dp::Error::not_found(dp::String(("Store directory missing: " + path).c_str())));
                }
                is_open_ = true;
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline bool isOpen() const { return is_open_; }

        inline bool hasSnapshot() const { return is_open_ && std::filesystem::exists(base_path_ / SALE_FILE); }

        inline dp::Result<void, dp::Error> saveSnapshot(const SaleSnapshot &snapshot) {
            return writeFramed(SALE_FILE, snapshot.toBytes());
        }

        inline dp::Result<SaleSnapshot, dp::Error> loadSnapshot() const {
            auto payload = readFramed(SALE_FILE);
            if (!payload.is_ok()) {
                return dp::Result<SaleSnapshot, dp::Error>::err(payload.error());
            }
            return SaleSnapshot::fromBytes(payload.value());
        }

        inline dp::Result<void, dp::Error> saveAuditLog(const AuditLog &log) {
            return writeFramed(AUDIT_FILE, log.toBytes());
        }

        /// Load the audit log and check its hash chain
        inline dp::Result<AuditLog, dp::Error> loadAuditLog() const {
            auto payload = readFramed(AUDIT_FILE);
            if (!payload.is_ok()) {
                return dp::Result<AuditLog, dp::Error>::err(payload.error());
            }
            auto log = AuditLog::fromBytes(payload.value());
            if (!log.is_ok()) {
                return log;
            }
            auto verified = log.value().verify();
            if (!verified.is_ok()) {
                return dp::Result<AuditLog, dp::Error>::err(verified.error());
            }
            return log;
        }

        /// Remove persisted files
        inline dp::Result<void, dp::Error> clear() {
            if (!is_open_)
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));
            try {
                std::filesystem::remove(base_path_ / SALE_FILE);
                std::filesystem::remove(base_path_ / AUDIT_FILE);
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

      private:
        template <typename T> static void appendRaw(std::vector<uint8_t> &out, T value) {
            const uint8_t *bytes = reinterpret_cast<const uint8_t *>(&value);
            out.insert(out.end(), bytes, bytes + sizeof(T));
        }

        template <typename T> static bool readRaw(const std::vector<uint8_t> &in, size_t &offset, T &value) {
            if (offset + sizeof(T) > in.size())
                return false;
            std::memcpy(&value, in.data() + offset, sizeof(T));
            offset += sizeof(T);
            return true;
        }

        inline dp::Result<void, dp::Error> writeFramed(const char *name, const std::vector<uint8_t> &payload) {
            if (!is_open_)
                return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Store not open"));

            auto checksum = sha256(payload);
            if (!checksum.is_ok()) {
                return dp::Result<void, dp::Error>::err(checksum.error());
            }

            std::vector<uint8_t> frame;
            frame.reserve(4 + 4 + checksum.value().size() + 8 + payload.size());
            appendRaw(frame, MAGIC_NUMBER);
            appendRaw(frame, static_cast<dp::u32>(checksum.value().size()));
            frame.insert(frame.end(), checksum.value().begin(), checksum.value().end());
            appendRaw(frame, static_cast<dp::u64>(payload.size()));
            frame.insert(frame.end(), payload.begin(), payload.end());

            try {
                auto target = base_path_ / name;
                auto temp = base_path_ / (std::string(name) + ".tmp");
                {
                    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
                    if (!file.is_open()) {
                        return dp::Result<void, dp::Error>::err(
                            dp::Error::io_error(dp::String(("Cannot write " + temp.string()).c_str())));
                    }
                    file.write(reinterpret_cast<const char *>(frame.data()), static_cast<std::streamsize>(frame.size()));
                    if (!file.good()) {
                        return dp::Result<void, dp::Error>::err(
                            dp::Error::io_error(dp::String(("Short write to " + temp.string()).c_str())));
                    }
                }
                std::filesystem::rename(temp, target);
                if (options_.verbose) {
                    std::cout << "Saved " << payload.size() << " bytes to " << target.string() << std::endl;
                }
                return dp::Result<void, dp::Error>::ok();
            } catch (const std::exception &e) {
                return dp::Result<void, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        inline dp::Result<std::vector<uint8_t>, dp::Error> readFramed(const char *name) const {
            using R = dp::Result<std::vector<uint8_t>, dp::Error>;
            if (!is_open_)
                return R::err(dp::Error::invalid_argument("Store not open"));

            auto target = base_path_ / name;
            std::vector<uint8_t> frame;
            try {
                if (!std::filesystem::exists(target)) {
                    return R::err(dp::Error::not_found(dp::String(("Missing " + target.string()).c_str())));
                }
                std::ifstream file(target, std::ios::binary);
                if (!file.is_open()) {
                    return R::err(dp::Error::io_error(dp::String(("Cannot read " + target.string()).c_str())));
                }
                frame.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
            } catch (const std::exception &e) {
                return R::err(dp::Error::io_error(dp::String(e.what())));
            }

            size_t offset = 0;
            dp::u32 magic = 0;
            dp::u32 checksum_len = 0;
            if (!readRaw(frame, offset, magic) || magic != MAGIC_NUMBER) {
                return R::err(snapshot_corrupt("Bad magic number"));
            }
            if (!readRaw(frame, offset, checksum_len) || offset + checksum_len > frame.size()) {
                return R::err(snapshot_corrupt("Truncated checksum"));
            }
            std::vector<uint8_t> stored(frame.begin() + offset, frame.begin() + offset + checksum_len);
            offset += checksum_len;

            dp::u64 payload_len = 0;
            if (!readRaw(frame, offset, payload_len) || payload_len != frame.size() - offset) {
                return R::err(snapshot_corrupt("Truncated payload"));
            }
            std::vector<uint8_t> payload(frame.begin() + offset, frame.end());

            auto checksum = sha256(payload);
            if (!checksum.is_ok()) {
                return R::err(checksum.error());
            }
            if (checksum.value() != stored) {
                return R::err(snapshot_corrupt("Checksum mismatch"));
            }

            if (options_.verbose) {
                std::cout << "Loaded " << payload.size() << " bytes from " << target.string() << std::endl;
            }
            return R::ok(std::move(payload));
        }

        std::filesystem::path base_path_;
        StoreOptions options_;
        bool is_open_ = false;
    };

} // namespace crowdit::storage
