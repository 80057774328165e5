/**
 * @file transport.hpp
 * @brief Transport concept - the BLE central operations the transfer engine consumes
 *
 * @details
 * The engine is a template over its transport, so the BLE stack is bound at
 * compile time (NimBLE on device, a scripted stub in tests) with no virtual
 * dispatch. A transport serves one session at a time and owns the connection,
 * service and characteristic handles of that session; the engine only sees
 * status codes.
 *
 * @see nimble.hpp for the NimBLE-Arduino implementation
 */

#ifndef OEPL_TRANSPORT_HPP_
#define OEPL_TRANSPORT_HPP_

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "protocol.hpp"

namespace oepl {
    /**
     * @brief Outcome of a single transport operation
     */
    enum class TransportStatus : uint8_t {
        ok = 0,
        timeout,            ///< Operation did not finish within its window
        not_found,          ///< Service or characteristic missing on the peer
        connect_failed,     ///< Link could not be established
        disconnected,       ///< Link dropped or no session open
        io_error            ///< Stack rejected the request
    };

    /**
     * @brief One received notification
     * @details Trivially copyable so it can travel through an RTOS queue.
     *          `length == 0` is an absent frame.
     */
    struct Frame {
        std::array<uint8_t, protocol::MAX_NOTIFICATION_SIZE> data{};
        size_t length = 0;

        std::span<const uint8_t> view() const noexcept { return {data.data(), length}; }

        /// Copies at most MAX_NOTIFICATION_SIZE bytes
        void assign(const uint8_t* bytes, const size_t size) noexcept {
            length = size < data.size() ? size : data.size();
            for (size_t i = 0; i < length; ++i) {
                data[i] = bytes[i];
            }
        }
    };

    /**
     * @brief Operations required from a BLE central stack
     *
     * - `scan(address, duration_ms)`: discover the peer, compare addresses
     *   case-sensitively, return a device handle on a hit
     * - `connect(device, timeout_ms)`: open the session link
     * - `exchangeMtu`, `resolveService`, `resolveCharacteristic`,
     *   `subscribeNotify`: session setup on the open link
     * - `writeNoResponse(bytes)`: write without response to the characteristic
     * - `waitNotification(frame, timeout_ms)`: block until the next notification
     * - `disconnect()`: close the link, idempotent
     * - `sleepMs(ms)`: suspend the calling task
     */
    template<typename T>
    concept Transport = requires(T& t,
                                 const typename T::device_type& device,
                                 std::string_view address,
                                 uint32_t ms,
                                 uint16_t value,
                                 std::span<const uint8_t> bytes,
                                 Frame& frame) {
        { t.scan(address, ms) } -> std::same_as<std::optional<typename T::device_type>>;
        { t.connect(device, ms) } -> std::same_as<TransportStatus>;
        { t.exchangeMtu(value) } -> std::same_as<TransportStatus>;
        { t.resolveService(value) } -> std::same_as<TransportStatus>;
        { t.resolveCharacteristic(value) } -> std::same_as<TransportStatus>;
        { t.subscribeNotify() } -> std::same_as<TransportStatus>;
        { t.writeNoResponse(bytes) } -> std::same_as<TransportStatus>;
        { t.waitNotification(frame, ms) } -> std::same_as<TransportStatus>;
        { t.disconnect() } -> std::same_as<void>;
        { t.sleepMs(ms) } -> std::same_as<void>;
    };

    /// Log string for a transport status
    const char* transportStatusName(TransportStatus status) noexcept;
}  // namespace oepl

#endif
