/**
 * @file transfer_engine.hpp
 * @brief OEPL upload state machine - discovery, session setup, block servicing
 *
 * @details
 * Drives one upload over an injected Transport:
 *
 *   Idle -> Scanning -> Connecting -> Connected -> AwaitingAck -> Servicing
 *        -> Completed | Failed
 *
 * After START_DATA_TRANSFER the device is in control: it asks for blocks with
 * a parts bitmask, and the host answers ACK_READY followed by one
 * SEND_BLOCK_PART per requested part, each acknowledged before the next is
 * sent (the device is half-duplex).
 *
 * A request that arrives while a sub-exchange is waiting for its own
 * acknowledgement (a new BLOCK_REQUEST, UPLOAD_COMPLETE or DATA_PRESENT) is
 * parked in `pending_` and dispatched by the main loop before it waits again.
 *
 * # Error handling
 * No exceptions. Every step returns false after recording the failure in
 * `result_` via fail(); the session guard disconnects on the way out.
 *
 * # Thread Safety
 * Not thread-safe; one engine per upload, driven from a single task. Only
 * the CancelToken may be touched from elsewhere.
 *
 * @note Header-only: the engine is a template over its transport
 */

#ifndef OEPL_TRANSFER_ENGINE_HPP_
#define OEPL_TRANSFER_ENGINE_HPP_

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>

#include "config.hpp"
#include "log.h"
#include "protocol.hpp"
#include "result.hpp"
#include "transport.hpp"
#include "wire_codec.hpp"

namespace oepl {
    template<Transport T>
    class TransferEngine {
    public:
        enum class State : uint8_t {
            idle,
            scanning,
            connecting,
            connected,
            awaiting_ack,
            servicing,
            completed,
            failed
        };

        TransferEngine(T& transport, const UploadConfig& config) noexcept
            : transport_(transport), config_(config) {}

        TransferEngine(const TransferEngine&) = delete;
        TransferEngine& operator=(const TransferEngine&) = delete;

        /**
         * @brief Upload an image and wait until the device confirms it
         * @param image Raw display data, must outlive the call
         * @return Result; teardown has already run when this returns
         */
        UploadResult upload(const std::span<const uint8_t> image) {
            result_ = {};
            pending_.reset();
            image_ = image;
            total_blocks_ = codec::totalBlocks(image.size());
            state_ = State::idle;

            if (const char* problem = validateConfig(config_)) {
                OEPL_LOG_ERROR("Invalid upload config: %s\n", problem);
                fail(UploadError::invalid_config);
                return result_;
            }

            OEPL_LOG_INFO("Image bytes: %u, total blocks: %u\n",
                static_cast<unsigned>(image.size()), static_cast<unsigned>(total_blocks_));

            if (!acquire()) {
                return result_;
            }

            {
                SessionGuard guard(transport_);
                if (setupSession() && startTransfer() && serviceRequests()) {
                    state_ = State::completed;
                    OEPL_LOG_INFO("Upload complete (device confirmed)\n");
                }
            }
            return result_;
        }

        State state() const noexcept { return state_; }
        const UploadResult& result() const noexcept { return result_; }

    private:
        /// Disconnects exactly once when the session scope ends
        class SessionGuard {
        public:
            explicit SessionGuard(T& transport) noexcept : transport_(transport) {}
            ~SessionGuard() {
                OEPL_LOG_DEBUG("Disconnecting\n");
                transport_.disconnect();
            }

            SessionGuard(const SessionGuard&) = delete;
            SessionGuard& operator=(const SessionGuard&) = delete;

        private:
            T& transport_;
        };

        /// Outcome of waiting for one notification inside a sub-exchange
        enum class Reply : uint8_t {
            acknowledged,   ///< Exchange finished, carry on
            resend,         ///< Device asked for the same part again
            deferred,       ///< Request for the main loop parked in pending_
            ignored,        ///< Not for this exchange, keep waiting
            failed          ///< Device error, result_ already set
        };

        // ---------------------- Failure bookkeeping ----------------------

        bool fail(const UploadError error) noexcept {
            result_.error = error;
            state_ = State::failed;
            return false;
        }

        bool fail(const UploadError error, const TransportStatus status) noexcept {
            result_.transport_status = status;
            return fail(error);
        }

        bool cancelled() noexcept {
            if (config_.cancel && config_.cancel->cancelled()) {
                OEPL_LOG_WARN("Upload cancelled\n");
                return true;
            }
            return false;
        }

        bool sleep(const uint32_t ms) {
            if (cancelled()) return fail(UploadError::cancelled);
            transport_.sleepMs(ms);
            if (cancelled()) return fail(UploadError::cancelled);
            return true;
        }

        // ---------------------- Device acquisition ----------------------

        /**
         * @brief Scan and connect with a bounded retry budget
         * @details A failed connect drops the cached device so the next attempt
         *          scans again. No sleep follows the final attempt.
         */
        bool acquire() {
            const uint32_t retries = config_.connect_retries;
            std::optional<typename T::device_type> device;
            bool seen = false;

            for (uint32_t attempt = 1; attempt <= retries; ++attempt) {
                result_.stats.connect_attempts = attempt;
                const bool last_attempt = attempt == retries;

                if (!device) {
                    state_ = State::scanning;
                    if (cancelled()) return fail(UploadError::cancelled);

                    OEPL_LOG_INFO("Connect attempt %u/%u (device scan for %s)\n",
                        static_cast<unsigned>(attempt), static_cast<unsigned>(retries), config_.target.c_str());
                    device = transport_.scan(config_.target.view(), config_.scan_duration_ms);
                    if (cancelled()) return fail(UploadError::cancelled);

                    if (!device) {
                        OEPL_LOG_WARN("Scan timeout, %s not found\n", config_.target.c_str());
                        if (!seen) result_.transport_status = TransportStatus::timeout;
                        if (!last_attempt && !sleep(config_.connect_retry_delay_ms)) return false;
                        continue;
                    }
                    OEPL_LOG_INFO("Found %s\n", config_.target.c_str());
                    seen = true;
                }

                state_ = State::connecting;
                OEPL_LOG_INFO("Connect attempt %u/%u\n",
                    static_cast<unsigned>(attempt), static_cast<unsigned>(retries));
                const TransportStatus status = transport_.connect(*device, config_.connect_timeout_ms);
                if (cancelled()) {
                    if (status == TransportStatus::ok) transport_.disconnect();
                    return fail(UploadError::cancelled);
                }
                if (status == TransportStatus::ok) {
                    state_ = State::connected;
                    result_.transport_status = TransportStatus::ok;
                    return true;
                }

                OEPL_LOG_WARN("Connect failed: %s\n", transportStatusName(status));
                result_.transport_status = status;
                device.reset();
                if (!last_attempt && !sleep(config_.connect_retry_delay_ms)) return false;
            }

            OEPL_LOG_ERROR("Unable to connect after %u attempts (last: %s)\n",
                static_cast<unsigned>(retries), transportStatusName(result_.transport_status));
            return fail(seen ? UploadError::connection_failure : UploadError::discovery_timeout);
        }

        // ---------------------- Session setup ----------------------

        bool setupSession() {
            if (const TransportStatus s = transport_.exchangeMtu(config_.mtu); s != TransportStatus::ok) {
                OEPL_LOG_ERROR("MTU exchange failed: %s\n", transportStatusName(s));
                return fail(UploadError::session_setup_failure, s);
            }
            if (const TransportStatus s = transport_.resolveService(uuids::SERVICE); s != TransportStatus::ok) {
                OEPL_LOG_ERROR("Service 0x%04X not found: %s\n", uuids::SERVICE, transportStatusName(s));
                return fail(UploadError::session_setup_failure, s);
            }
            if (const TransportStatus s = transport_.resolveCharacteristic(uuids::CHARACTERISTIC); s != TransportStatus::ok) {
                OEPL_LOG_ERROR("Characteristic 0x%04X not found: %s\n", uuids::CHARACTERISTIC, transportStatusName(s));
                return fail(UploadError::session_setup_failure, s);
            }
            if (const TransportStatus s = transport_.subscribeNotify(); s != TransportStatus::ok) {
                OEPL_LOG_ERROR("Subscribe failed: %s\n", transportStatusName(s));
                return fail(UploadError::session_setup_failure, s);
            }
            return sleep(config_.settle_delay_ms);
        }

        // ---------------------- Frame I/O ----------------------

        bool sendCommand(const uint16_t id, const std::span<const uint8_t> payload = {}) {
            std::array<uint8_t, protocol::MAX_COMMAND_SIZE> buffer;
            const size_t length = codec::encodeCommand(id, payload, buffer);
            OEPL_LOG_TRACE_BYTES("TX: ", buffer.data(), length);

            if (const TransportStatus s = transport_.writeNoResponse({buffer.data(), length}); s != TransportStatus::ok) {
                OEPL_LOG_ERROR("Write of command 0x%04X failed: %s\n", id, transportStatusName(s));
                return fail(UploadError::transport_failure, s);
            }
            return true;
        }

        bool awaitNotification(Frame& frame, const uint32_t timeout_ms) {
            if (cancelled()) return fail(UploadError::cancelled);

            frame.length = 0;
            const TransportStatus s = transport_.waitNotification(frame, timeout_ms);
            if (cancelled()) return fail(UploadError::cancelled);

            if (s == TransportStatus::timeout) {
                OEPL_LOG_ERROR("No notification within %u ms\n", static_cast<unsigned>(timeout_ms));
                return fail(UploadError::notification_timeout, s);
            }
            if (s != TransportStatus::ok) {
                OEPL_LOG_ERROR("Notification wait failed: %s\n", transportStatusName(s));
                return fail(UploadError::transport_failure, s);
            }

            OEPL_LOG_TRACE_BYTES("RX: ", frame.data.data(), frame.length);
            if (const auto id = codec::decodeNotification(frame.view()).id) {
                result_.last_response = *id;
            }
            return true;
        }

        static bool isOuterLoopEvent(const uint16_t id) noexcept {
            return id == protocol::BLOCK_REQUEST
                || id == protocol::UPLOAD_COMPLETE
                || id == protocol::DATA_PRESENT;
        }

        static void logIgnored(const char* where, const std::optional<uint16_t>& id) {
            if (id) {
                OEPL_LOG_WARN("Ignoring %s notification 0x%04X\n", where, *id);
            } else {
                OEPL_LOG_WARN("Ignoring malformed %s notification\n", where);
            }
        }

        // ---------------------- Transfer ----------------------

        bool startTransfer() {
            const codec::Announcement announcement = codec::encodeAnnouncement(image_, config_.data_type);
            OEPL_LOG_DEBUG("START_DATA_TRANSFER crc32=0x%08X size=%u type=0x%02X\n",
                static_cast<unsigned>(codec::crc32(image_)),
                static_cast<unsigned>(image_.size()),
                config_.data_type);
            if (!sendCommand(protocol::START_DATA_TRANSFER, announcement)) {
                return false;
            }
            state_ = State::awaiting_ack;
            return true;
        }

        /**
         * @brief Main loop: dispatch device requests until the upload completes
         */
        bool serviceRequests() {
            Frame frame;
            while (state_ != State::completed) {
                if (pending_) {
                    frame = *pending_;
                    pending_.reset();
                } else if (!awaitNotification(frame, config_.notification_timeout_ms)) {
                    return false;
                }

                const codec::Notification n = codec::decodeNotification(frame.view());
                if (!n.id) {
                    logIgnored("main", n.id);
                    continue;
                }

                switch (*n.id) {
                    case protocol::BLOCK_REQUEST:
                        state_ = State::servicing;
                        if (!serviceBlockRequest(n.payload)) return false;
                        break;

                    case protocol::UPLOAD_COMPLETE:
                        OEPL_LOG_INFO("Device confirmed upload\n");
                        if (!sendCommand(protocol::TRANSFER_COMPLETE)) return false;
                        state_ = State::completed;
                        break;

                    case protocol::DATA_PRESENT:
                        OEPL_LOG_INFO("Device reports identical data already present\n");
                        if (!sendCommand(protocol::TRANSFER_COMPLETE)) return false;
                        result_.data_present = true;
                        state_ = State::completed;
                        break;

                    case protocol::COMMAND_ACK:
                    case protocol::PART_ACK:
                    case protocol::PART_ERROR:
                        break;

                    case protocol::RSP_ERROR:
                        OEPL_LOG_ERROR("Device returned protocol error (0xFFFF)\n");
                        return fail(UploadError::protocol_error);

                    default:
                        logIgnored("main", n.id);
                        break;
                }
            }
            return true;
        }

        bool serviceBlockRequest(const std::span<const uint8_t> payload) {
            if (payload.size() < sizeof(protocol::block_request_t)) {
                OEPL_LOG_ERROR("Invalid BLOCK_REQUEST payload (%u bytes)\n", static_cast<unsigned>(payload.size()));
                return fail(UploadError::protocol_violation);
            }

            protocol::block_request_t request;
            std::memcpy(&request, payload.data(), sizeof(request));
            const codec::RequestedParts parts = codec::decodeRequestedParts(request.parts_mask);

            result_.block_id = request.block_id;
            result_.part_id = UploadResult::NO_ID;
            OEPL_LOG_INFO("Block %u: requesting %u parts (type 0x%02X)\n",
                request.block_id, static_cast<unsigned>(parts.size()), request.type);

            if (request.block_id >= total_blocks_) {
                OEPL_LOG_ERROR("Device requested out-of-range block %u (total %u)\n",
                    request.block_id, static_cast<unsigned>(total_blocks_));
                return fail(UploadError::protocol_violation);
            }
            ++result_.stats.block_requests;

            if (!sendCommand(protocol::ACK_READY) || !awaitReadyAck()) {
                return false;
            }
            if (pending_) {
                return true;
            }

            for (const uint8_t part_id : parts) {
                result_.part_id = part_id;
                const codec::BlockPartFrame part = codec::encodeBlockPart(image_, request.block_id, part_id);
                if (!sendPartAwaitAck(part)) {
                    return false;
                }
                if (pending_) {
                    OEPL_LOG_INFO("Block %u interrupted by device request\n", request.block_id);
                    break;
                }
                OEPL_LOG_DEBUG("  Part %u/%u sent\n", part_id + 1u, static_cast<unsigned>(protocol::PARTS_PER_BLOCK));
            }
            return true;
        }

        /**
         * @brief Wait for the COMMAND_ACK answering ACK_READY
         * @details Stale PART_ACK/PART_ERROR from the previous block are skipped.
         */
        bool awaitReadyAck() {
            Frame frame;
            while (true) {
                if (!awaitNotification(frame, config_.response_timeout_ms)) {
                    return false;
                }

                const std::optional<uint16_t> id = codec::decodeNotification(frame.view()).id;
                if (id == protocol::COMMAND_ACK) {
                    return true;
                }
                if (id && isOuterLoopEvent(*id)) {
                    pending_ = frame;
                    return true;
                }
                if (id == protocol::PART_ACK || id == protocol::PART_ERROR) {
                    continue;
                }
                if (id == protocol::RSP_ERROR) {
                    OEPL_LOG_ERROR("Device returned protocol error (0xFFFF) after ACK_READY\n");
                    return fail(UploadError::protocol_error);
                }
                logIgnored("ready-wait", id);
            }
        }

        /**
         * @brief Send one part and wait for its acknowledgement
         * @details PART_ERROR resends the identical frame without backoff,
         *          bounded only by config.max_part_resends when non-zero.
         */
        bool sendPartAwaitAck(const codec::BlockPartFrame& part) {
            uint32_t resends = 0;
            if (!sendCommand(protocol::SEND_BLOCK_PART, part)) {
                return false;
            }

            Frame frame;
            while (true) {
                if (!awaitNotification(frame, config_.response_timeout_ms)) {
                    return false;
                }

                switch (classifyPartReply(frame)) {
                    case Reply::acknowledged:
                        ++result_.stats.parts_sent;
                        return true;

                    case Reply::deferred:
                        return true;

                    case Reply::resend:
                        if (config_.max_part_resends != 0 && resends >= config_.max_part_resends) {
                            OEPL_LOG_ERROR("Part %d of block %d rejected %u times, giving up\n",
                                static_cast<int>(result_.part_id), static_cast<int>(result_.block_id),
                                static_cast<unsigned>(resends + 1));
                            return fail(UploadError::part_retry_exhausted);
                        }
                        ++resends;
                        ++result_.stats.part_resends;
                        OEPL_LOG_WARN("PART_ERROR for part %d, resending\n", static_cast<int>(result_.part_id));
                        if (!sendCommand(protocol::SEND_BLOCK_PART, part)) {
                            return false;
                        }
                        break;

                    case Reply::ignored:
                        break;

                    case Reply::failed:
                        return false;
                }
            }
        }

        Reply classifyPartReply(const Frame& frame) {
            const std::optional<uint16_t> id = codec::decodeNotification(frame.view()).id;
            if (!id) {
                logIgnored("part-wait", id);
                return Reply::ignored;
            }

            switch (*id) {
                case protocol::PART_ACK:
                    return Reply::acknowledged;
                case protocol::PART_ERROR:
                    return Reply::resend;
                case protocol::COMMAND_ACK:
                    return Reply::ignored;
                case protocol::RSP_ERROR:
                    OEPL_LOG_ERROR("Device returned protocol error (0xFFFF) during part exchange\n");
                    fail(UploadError::protocol_error);
                    return Reply::failed;
                default:
                    if (isOuterLoopEvent(*id)) {
                        pending_ = frame;
                        return Reply::deferred;
                    }
                    logIgnored("part-wait", id);
                    return Reply::ignored;
            }
        }

        T& transport_;
        const UploadConfig& config_;

        State state_ = State::idle;
        UploadResult result_{};
        std::span<const uint8_t> image_{};
        size_t total_blocks_ = 0;
        std::optional<Frame> pending_{};
    };
}  // namespace oepl

#endif
