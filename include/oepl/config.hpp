/**
 * @file config.hpp
 * @brief Upload configuration - target, timeouts and retry budgets
 *
 * @details
 * Everything the engine needs is passed in explicitly; defaults match the
 * values the OEPL firmware is known to tolerate.
 *
 * Usage:
 * @code
 * oepl::UploadConfig cfg;
 * cfg.target = *oepl::DeviceAddress::parse("3C:60:55:84:A0:42");
 * cfg.connect_retries = 20;
 * @endcode
 */

#ifndef OEPL_CONFIG_HPP_
#define OEPL_CONFIG_HPP_

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "protocol.hpp"

namespace oepl {
    /**
     * @brief BLE MAC address in canonical `aa:bb:cc:dd:ee:ff` form
     * @details Stored lowercase because scan results are compared
     *          case-sensitively against this text.
     */
    class DeviceAddress {
    public:
        static constexpr size_t TEXT_LENGTH = 17;

        DeviceAddress() = default;

        /**
         * @brief Parse six colon-separated hex octets, any letter case
         * @return Normalised address, nullopt if malformed
         */
        static std::optional<DeviceAddress> parse(std::string_view text) noexcept;

        std::string_view view() const noexcept { return {text_.data(), length_}; }
        const char* c_str() const noexcept { return text_.data(); }
        bool empty() const noexcept { return length_ == 0; }

        bool operator==(const DeviceAddress& other) const noexcept { return view() == other.view(); }

    private:
        std::array<char, TEXT_LENGTH + 1> text_{};
        size_t length_ = 0;
    };

    /**
     * @brief Cooperative cancellation flag, settable from another task
     */
    class CancelToken {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
        void reset() noexcept { cancelled_.store(false, std::memory_order_relaxed); }
        bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    /**
     * @brief Parameters of a single upload
     */
    struct UploadConfig {
        DeviceAddress target{};
        uint8_t  data_type = protocol::DEFAULT_DATA_TYPE;

        uint32_t connect_retries = 200;
        uint32_t connect_retry_delay_ms = 1200;
        uint32_t scan_duration_ms = 10000;
        uint32_t connect_timeout_ms = 10000;

        uint16_t mtu = protocol::MTU;
        uint32_t settle_delay_ms = 300;             ///< Device needs time after subscribe

        uint32_t notification_timeout_ms = 20000;   ///< Main loop wait
        uint32_t response_timeout_ms = 10000;       ///< Ready-ack and part-ack waits

        uint32_t max_part_resends = 0;              ///< Per part; 0 = resend until acknowledged

        const CancelToken* cancel = nullptr;
    };

    /**
     * @brief Whole-upload retry, applied by the caller around upload()
     */
    struct RetryPolicy {
        uint32_t attempts = 3;
        uint32_t delay_ms = 10000;
    };

    /**
     * @brief Check a configuration before any radio activity
     * @return nullptr if valid, otherwise a static description of the problem
     */
    const char* validateConfig(const UploadConfig& config) noexcept;
}  // namespace oepl

#endif
