/**
 * @file oepl.hpp
 * @brief Image upload to OpenEPaperLink BLE e-paper displays (ATC_BLE_OEPL)
 *
 * @details
 * Pushes a pre-rendered raster image to an OEPL tag over a BLE central link.
 *
 * # Architecture
 *
 * ## Layered Design
 * - **API Layer**: upload entry points (oepl.hpp)
 * - **Engine Layer**: connection and transfer state machine (oepl/transfer_engine.hpp)
 * - **Codec Layer**: stateless wire encoding (oepl/wire_codec.hpp, oepl/protocol.hpp)
 * - **Backend Layer**: BLE stack binding (oepl/nimble.hpp)
 *
 * The engine is a template over its Transport, so the stack binding is
 * resolved at compile time and tests substitute a scripted transport.
 *
 * # Example Usage
 *
 * @code{.cpp}
 * #include <NimBLEDevice.h>
 * #include <oepl.hpp>
 * #include <oepl/nimble.hpp>
 *
 * oepl::NimbleTransport transport;
 *
 * void setup() {
 *     oepl::NimbleTransport::init();
 *
 *     oepl::UploadConfig cfg;
 *     cfg.target = *oepl::DeviceAddress::parse("3c:60:55:84:a0:42");
 *
 *     const oepl::UploadResult r = oepl::uploadWithRetry(transport, cfg, image);
 *     oepl::logResult(r);
 * }
 * @endcode
 *
 * @note Compiler requirements: C++20 (concepts, std::span)
 */

#ifndef OEPL_HPP_
#define OEPL_HPP_

#include <cstdint>
#include <span>

#include "oepl/config.hpp"
#include "oepl/log.h"
#include "oepl/protocol.hpp"
#include "oepl/result.hpp"
#include "oepl/transfer_engine.hpp"
#include "oepl/transport.hpp"
#include "oepl/wire_codec.hpp"

namespace oepl {
    /**
     * @brief Upload an image once
     * @param transport BLE central backend, exclusively used for the call
     * @param config Target, data type, retry budgets and timeouts
     * @param image Raw display data
     * @return Result; the link is already closed when this returns
     */
    template<Transport T>
    UploadResult upload(T& transport, const UploadConfig& config, const std::span<const uint8_t> image) {
        TransferEngine<T> engine(transport, config);
        return engine.upload(image);
    }

    /**
     * @brief Upload with whole-upload retry
     * @details Each attempt runs the full scan/connect/transfer sequence.
     *          Configuration errors and cancellation are not retried.
     */
    template<Transport T>
    UploadResult uploadWithRetry(T& transport, const UploadConfig& config,
                                 const std::span<const uint8_t> image,
                                 const RetryPolicy& policy = {}) {
        const uint32_t attempts = policy.attempts == 0 ? 1 : policy.attempts;
        UploadResult result;
        for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
            result = upload(transport, config, image);
            if (result.ok() || !isRetryable(result.error)) {
                return result;
            }

            OEPL_LOG_WARN("Upload attempt %u/%u failed: %s\n",
                static_cast<unsigned>(attempt), static_cast<unsigned>(attempts), errorName(result.error));
            if (attempt < attempts) {
                if (config.cancel && config.cancel->cancelled()) {
                    result.error = UploadError::cancelled;
                    return result;
                }
                transport.sleepMs(policy.delay_ms);
            }
        }
        return result;
    }
}  // namespace oepl

#endif
