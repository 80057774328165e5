/**
 * @file result.hpp
 * @brief Upload error codes and result reporting
 */

#ifndef OEPL_RESULT_HPP_
#define OEPL_RESULT_HPP_

#include <cstdint>

#include "transport.hpp"

namespace oepl {
    /**
     * @brief Reasons an upload ends without device confirmation
     */
    enum class UploadError : uint8_t {
        none = 0,
        discovery_timeout,      ///< Target never seen while the retry budget lasted
        connection_failure,     ///< Target seen but every connect attempt failed
        session_setup_failure,  ///< MTU, service, characteristic or subscribe failed
        protocol_violation,     ///< Malformed or out-of-range device request
        protocol_error,         ///< Device answered RSP_ERROR
        notification_timeout,   ///< Device went silent
        part_retry_exhausted,   ///< PART_ERROR resend cap reached
        transport_failure,      ///< Write failed or link dropped mid-session
        invalid_config,         ///< Rejected before any radio activity
        cancelled               ///< CancelToken fired
    };

    /**
     * @brief Counters for a single upload
     */
    struct TransferStats {
        uint32_t connect_attempts = 0;
        uint32_t block_requests = 0;    ///< BLOCK_REQUESTs serviced
        uint32_t parts_sent = 0;        ///< Parts acknowledged by PART_ACK
        uint32_t part_resends = 0;      ///< Resends after PART_ERROR
    };

    /**
     * @brief Outcome of an upload with enough context to log a failure
     */
    struct UploadResult {
        static constexpr int32_t NO_ID = -1;

        UploadError error = UploadError::none;
        TransportStatus transport_status = TransportStatus::ok;   ///< Last underlying transport status
        int32_t block_id = NO_ID;       ///< Block being serviced, if any
        int32_t part_id = NO_ID;        ///< Part being exchanged, if any
        int32_t last_response = NO_ID;  ///< Last decoded response id, if any
        bool data_present = false;      ///< Completed via DATA_PRESENT short-circuit
        TransferStats stats{};

        bool ok() const noexcept { return error == UploadError::none; }
        explicit operator bool() const noexcept { return ok(); }
    };

    /// Log string for an error code
    const char* errorName(UploadError error) noexcept;

    /**
     * @brief Whether retrying the whole upload can help
     * @details False for invalid configuration and cancellation.
     */
    bool isRetryable(UploadError error) noexcept;

    /**
     * @brief Log a one-line summary of a result at INFO or ERROR level
     */
    void logResult(const UploadResult& result);
}  // namespace oepl

#endif
