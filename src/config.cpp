/**
 * @file config.cpp
 * @brief Address parsing and configuration validation
 */

#include "oepl/config.hpp"

namespace oepl {
    namespace {
        constexpr bool isHexDigit(const char c) noexcept {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        }

        constexpr char toLower(const char c) noexcept {
            return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
        }
    }  // namespace

    std::optional<DeviceAddress> DeviceAddress::parse(const std::string_view text) noexcept {
        if (text.size() != TEXT_LENGTH) {
            return std::nullopt;
        }

        DeviceAddress address;
        for (size_t i = 0; i < TEXT_LENGTH; ++i) {
            const char c = text[i];
            if (i % 3 == 2) {
                if (c != ':') return std::nullopt;
            } else if (!isHexDigit(c)) {
                return std::nullopt;
            }
            address.text_[i] = toLower(c);
        }
        address.text_[TEXT_LENGTH] = '\0';
        address.length_ = TEXT_LENGTH;
        return address;
    }

    const char* validateConfig(const UploadConfig& config) noexcept {
        if (config.target.empty()) {
            return "target address not set";
        }
        if (config.connect_retries == 0) {
            return "connect_retries must be at least 1";
        }
        if (config.scan_duration_ms == 0) {
            return "scan_duration_ms must be non-zero";
        }
        if (config.connect_timeout_ms == 0) {
            return "connect_timeout_ms must be non-zero";
        }
        if (config.notification_timeout_ms == 0 || config.response_timeout_ms == 0) {
            return "notification timeouts must be non-zero";
        }
        // A SEND_BLOCK_PART write must fit in one ATT packet
        if (config.mtu < protocol::MAX_COMMAND_SIZE + 3) {
            return "mtu too small for a block part";
        }
        if (config.mtu > protocol::MAX_MTU) {
            return "mtu above the ATT maximum";
        }
        return nullptr;
    }
}  // namespace oepl
