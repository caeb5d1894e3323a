#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace crowdit {

    /// SHA-256 digest of a byte buffer
    inline dp::Result<std::vector<uint8_t>, dp::Error> sha256(const std::vector<uint8_t> &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(data);
        if (!result.success) {
            return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                dp::Error::io_error(dp::String(result.error_message.c_str())));
        }
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(result.data);
    }

    inline dp::Result<std::vector<uint8_t>, dp::Error> sha256(const std::string &data) {
        return sha256(std::vector<uint8_t>(data.begin(), data.end()));
    }

    inline std::string toHex(const std::vector<uint8_t> &bytes) { return keylock::keylock::to_hex(bytes); }

    inline std::vector<uint8_t> fromHex(const std::string &hex) { return keylock::keylock::from_hex(hex); }

} // namespace crowdit
