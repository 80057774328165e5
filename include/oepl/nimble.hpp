/**
 * @file nimble.hpp
 * @brief NimBLE backend - BLE central Transport for the OEPL transfer engine
 *
 * @details
 * Binds the Transport concept to NimBLE-Arduino 2.x client APIs:
 * - **scan**: active scan, stops as soon as the target address is seen
 * - **connect**: one reusable NimBLEClient, attributes refreshed per connect
 * - **notifications**: NimBLE host task pushes frames into a FreeRTOS queue,
 *   the uploading task pops them in waitNotification()
 *
 * The OEPL tag exposes a single 0x1337 characteristic that is written without
 * response and notifies every reply.
 *
 * @note NimBLE-specific: requires NimBLE-Arduino >= 2.0 with central and
 *       observer roles enabled. Include <NimBLEDevice.h> first; without it
 *       this header declares nothing.
 * @see transport.hpp for the contract
 */

#ifndef OEPL_NIMBLE_HPP_
#define OEPL_NIMBLE_HPP_

// Detect if NimBLE is available
#ifdef NIMBLE_CPP_DEVICE_H_
    #define OEPL_NIMBLE_AVAILABLE
    #include <freertos/FreeRTOS.h>
    #include <freertos/queue.h>
#endif

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "log.h"
#include "protocol.hpp"
#include "transport.hpp"

#ifdef OEPL_NIMBLE_AVAILABLE

namespace oepl {
    class NimbleTransport {
    public:
        using device_type = NimBLEAddress;

        /// Notifications buffered between the host task and the uploader
        static constexpr UBaseType_t QUEUE_DEPTH = 8;
        static constexpr uint32_t SCAN_POLL_MS = 20;
        /// 30 ms interval and window, continuous listening
        static constexpr uint16_t SCAN_INTERVAL_MS = 30;
        static constexpr uint16_t SCAN_WINDOW_MS = 30;

        NimbleTransport() : queue_(xQueueCreate(QUEUE_DEPTH, sizeof(Frame))) {
            if (!queue_) {
                OEPL_LOG_ERROR("[NimBLE] Notification queue allocation failed\n");
            }
        }

        ~NimbleTransport() {
            disconnect();
            if (client_) {
                NimBLEDevice::deleteClient(client_);
                client_ = nullptr;
            }
            if (queue_) {
                vQueueDelete(queue_);
            }
        }

        NimbleTransport(const NimbleTransport&) = delete;
        NimbleTransport& operator=(const NimbleTransport&) = delete;

        /**
         * @brief Initialise the NimBLE stack for central use
         * @param name GAP device name (empty: stack default)
         * @return true if the stack is up and the preferred MTU accepted
         */
        static bool init(const char* name = "") {
            if (!NimBLEDevice::init(name)) {
                OEPL_LOG_ERROR("[NimBLE] init failed\n");
                return false;
            }
            if (!NimBLEDevice::setMTU(protocol::MTU)) {
                OEPL_LOG_ERROR("[NimBLE] setMTU(%u) rejected\n", protocol::MTU);
                return false;
            }
            return true;
        }

        std::optional<NimBLEAddress> scan(const std::string_view address, const uint32_t duration_ms) {
            if (!queue_) {
                return std::nullopt;
            }

            scan_callbacks_.arm(address);
            NimBLEScan* scanner = NimBLEDevice::getScan();
            scanner->setScanCallbacks(&scan_callbacks_, false);
            scanner->setActiveScan(true);
            scanner->setInterval(SCAN_INTERVAL_MS);
            scanner->setWindow(SCAN_WINDOW_MS);

            if (!scanner->start(duration_ms, false, true)) {
                OEPL_LOG_ERROR("[NimBLE] Scan start failed\n");
                return std::nullopt;
            }

            const TickType_t deadline = xTaskGetTickCount() + pdMS_TO_TICKS(duration_ms + 500);
            while (scanner->isScanning() && !scan_callbacks_.found()
                   && static_cast<int32_t>(deadline - xTaskGetTickCount()) > 0) {
                vTaskDelay(pdMS_TO_TICKS(SCAN_POLL_MS));
            }
            if (scanner->isScanning() && !scanner->stop()) {
                OEPL_LOG_WARN("[NimBLE] Scan stop failed\n");
            }
            scanner->clearResults();

            if (!scan_callbacks_.found()) {
                return std::nullopt;
            }
            return scan_callbacks_.address();
        }

        TransportStatus connect(const NimBLEAddress& address, const uint32_t timeout_ms) {
            if (!client_) {
                client_ = NimBLEDevice::createClient();
                if (!client_) {
                    OEPL_LOG_ERROR("[NimBLE] createClient failed\n");
                    return TransportStatus::io_error;
                }
            }

            client_->setConnectTimeout(timeout_ms);
            // MTU is exchanged explicitly during session setup
            if (!client_->connect(address, true, false, false)) {
                OEPL_LOG_WARN("[NimBLE] Connect to %s failed (rc=%d)\n",
                    address.toString().c_str(), client_->getLastError());
                return TransportStatus::connect_failed;
            }

            OEPL_LOG_INFO("[NimBLE] Connected to %s\n", address.toString().c_str());
            return TransportStatus::ok;
        }

        TransportStatus exchangeMtu(const uint16_t mtu) {
            if (!isConnected()) return TransportStatus::disconnected;

            // Preferred MTU is stack-wide and read by the exchange below
            if (!NimBLEDevice::setMTU(mtu)) {
                OEPL_LOG_ERROR("[NimBLE] setMTU(%u) rejected\n", mtu);
                return TransportStatus::io_error;
            }
            if (!client_->exchangeMTU()) {
                return TransportStatus::io_error;
            }
            // Peer may settle on less; a block part must still fit one write
            const uint16_t negotiated = client_->getMTU();
            OEPL_LOG_INFO("[NimBLE] MTU %u (requested %u)\n", negotiated, mtu);
            if (negotiated < protocol::MAX_COMMAND_SIZE + 3) {
                return TransportStatus::io_error;
            }
            return TransportStatus::ok;
        }

        TransportStatus resolveService(const uint16_t uuid) {
            if (!isConnected()) return TransportStatus::disconnected;

            service_ = client_->getService(NimBLEUUID(uuid));
            return service_ ? TransportStatus::ok : TransportStatus::not_found;
        }

        TransportStatus resolveCharacteristic(const uint16_t uuid) {
            if (!isConnected()) return TransportStatus::disconnected;
            if (!service_) return TransportStatus::not_found;

            characteristic_ = service_->getCharacteristic(NimBLEUUID(uuid));
            return characteristic_ ? TransportStatus::ok : TransportStatus::not_found;
        }

        TransportStatus subscribeNotify() {
            if (!isConnected()) return TransportStatus::disconnected;
            if (!characteristic_) return TransportStatus::not_found;

            xQueueReset(queue_);
            const bool ok = characteristic_->subscribe(true,
                [this](NimBLERemoteCharacteristic*, uint8_t* data, const size_t length, bool) {
                    onNotify(data, length);
                });
            return ok ? TransportStatus::ok : TransportStatus::io_error;
        }

        TransportStatus writeNoResponse(const std::span<const uint8_t> bytes) {
            if (!isConnected()) return TransportStatus::disconnected;
            if (!characteristic_) return TransportStatus::not_found;

            return characteristic_->writeValue(bytes.data(), bytes.size(), false)
                ? TransportStatus::ok : TransportStatus::io_error;
        }

        TransportStatus waitNotification(Frame& frame, const uint32_t timeout_ms) {
            if (xQueueReceive(queue_, &frame, pdMS_TO_TICKS(timeout_ms)) == pdTRUE) {
                return TransportStatus::ok;
            }
            return isConnected() ? TransportStatus::timeout : TransportStatus::disconnected;
        }

        void disconnect() {
            characteristic_ = nullptr;
            service_ = nullptr;
            if (isConnected() && !client_->disconnect()) {
                OEPL_LOG_WARN("[NimBLE] Disconnect request failed (rc=%d)\n", client_->getLastError());
            }
        }

        void sleepMs(const uint32_t ms) {
            vTaskDelay(pdMS_TO_TICKS(ms));
        }

    private:
        /**
         * @brief Stops the scan on the first advertisement from the target
         * @details Runs on the NimBLE host task.
         */
        class ScanCallbacks : public NimBLEScanCallbacks {
        public:
            void arm(const std::string_view target) {
                target_.assign(target.data(), target.size());
                found_.store(false, std::memory_order_release);
            }

            bool found() const noexcept { return found_.load(std::memory_order_acquire); }
            NimBLEAddress address() const { return address_; }

            void onResult(const NimBLEAdvertisedDevice* device) override {
                if (found()) return;

                const NimBLEAddress address = device->getAddress();
                OEPL_LOG_TRACE("[NimBLE]   %s\n", address.toString().c_str());
                if (address.toString() == target_) {
                    address_ = address;
                    found_.store(true, std::memory_order_release);
                    if (!NimBLEDevice::getScan()->stop()) {
                        OEPL_LOG_WARN("[NimBLE] Scan stop after match failed\n");
                    }
                }
            }

        private:
            std::string target_;
            NimBLEAddress address_;
            std::atomic<bool> found_{false};
        };

        bool isConnected() const {
            return client_ && client_->isConnected();
        }

        /// Runs on the NimBLE host task
        void onNotify(const uint8_t* data, const size_t length) {
            Frame frame;
            frame.assign(data, length);
            if (xQueueSend(queue_, &frame, 0) != pdTRUE) {
                OEPL_LOG_WARN("[NimBLE] Notification queue full, frame dropped\n");
            }
        }

        NimBLEClient* client_ = nullptr;
        NimBLERemoteService* service_ = nullptr;
        NimBLERemoteCharacteristic* characteristic_ = nullptr;
        QueueHandle_t queue_ = nullptr;
        ScanCallbacks scan_callbacks_;
    };

    static_assert(Transport<NimbleTransport>);
}  // namespace oepl

#endif // OEPL_NIMBLE_AVAILABLE

#endif // OEPL_NIMBLE_HPP_
