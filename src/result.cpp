/**
 * @file result.cpp
 * @brief Error and status names, result logging
 */

#include "oepl/result.hpp"
#include "oepl/log.h"
#include "oepl/protocol.hpp"

namespace oepl {
    const char* transportStatusName(const TransportStatus status) noexcept {
        switch (status) {
            case TransportStatus::ok:             return "ok";
            case TransportStatus::timeout:        return "timeout";
            case TransportStatus::not_found:      return "not_found";
            case TransportStatus::connect_failed: return "connect_failed";
            case TransportStatus::disconnected:   return "disconnected";
            case TransportStatus::io_error:       return "io_error";
        }
        return "unknown";
    }

    const char* errorName(const UploadError error) noexcept {
        switch (error) {
            case UploadError::none:                  return "none";
            case UploadError::discovery_timeout:     return "discovery_timeout";
            case UploadError::connection_failure:    return "connection_failure";
            case UploadError::session_setup_failure: return "session_setup_failure";
            case UploadError::protocol_violation:    return "protocol_violation";
            case UploadError::protocol_error:        return "protocol_error";
            case UploadError::notification_timeout:  return "notification_timeout";
            case UploadError::part_retry_exhausted:  return "part_retry_exhausted";
            case UploadError::transport_failure:     return "transport_failure";
            case UploadError::invalid_config:        return "invalid_config";
            case UploadError::cancelled:             return "cancelled";
        }
        return "unknown";
    }

    bool isRetryable(const UploadError error) noexcept {
        switch (error) {
            case UploadError::none:
            case UploadError::invalid_config:
            case UploadError::cancelled:
                return false;
            default:
                return true;
        }
    }

    void logResult([[maybe_unused]] const UploadResult& result) {
        if (result.ok()) {
            OEPL_LOG_INFO("Upload done%s: %u block requests, %u parts, %u resends\n",
                result.data_present ? " (data already present)" : "",
                static_cast<unsigned>(result.stats.block_requests),
                static_cast<unsigned>(result.stats.parts_sent),
                static_cast<unsigned>(result.stats.part_resends));
            return;
        }

        OEPL_LOG_ERROR("Upload failed: %s (transport=%s, block=%d, part=%d, last=0x%04X %s, attempts=%u)\n",
            errorName(result.error),
            transportStatusName(result.transport_status),
            static_cast<int>(result.block_id),
            static_cast<int>(result.part_id),
            static_cast<unsigned>(result.last_response == UploadResult::NO_ID ? 0 : result.last_response),
            result.last_response == UploadResult::NO_ID
                ? "-" : protocol::responseName(static_cast<uint16_t>(result.last_response)),
            static_cast<unsigned>(result.stats.connect_attempts));
    }
}  // namespace oepl
