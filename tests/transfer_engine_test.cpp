#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "oepl.hpp"
#include "scripted_transport.hpp"

using namespace oepl;
using oepl::test::ByteVector;
using oepl::test::ScriptedTransport;
using oepl::test::blockRequest;
using oepl::test::notification;

namespace {
    const ByteVector ALL_PARTS{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};

    ByteVector onlyPart(const uint8_t part_id) {
        ByteVector mask(protocol::PARTS_MASK_SIZE, 0);
        mask[part_id / 8] = static_cast<uint8_t>(1u << (part_id % 8));
        return mask;
    }

    std::vector<uint8_t> patternImage(const size_t size) {
        std::vector<uint8_t> image(size);
        for (size_t i = 0; i < size; ++i) {
            image[i] = static_cast<uint8_t>(i * 13 + 1);
        }
        return image;
    }

    /// SEND_BLOCK_PART command exactly as it must appear on the wire
    ByteVector partCommand(const std::vector<uint8_t>& image, const uint32_t block_id, const uint32_t part_id) {
        const codec::BlockPartFrame part = codec::encodeBlockPart(image, block_id, part_id);
        ByteVector frame{0x00, 0x65};
        frame.insert(frame.end(), part.begin(), part.end());
        return frame;
    }

    class TransferEngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config.target = *DeviceAddress::parse("3C:60:55:84:A0:42");
            config.connect_retries = 5;
            config.connect_retry_delay_ms = 1200;
            config.cancel = &cancel;
        }

        UploadResult run(const std::vector<uint8_t>& image) {
            return upload(transport, config, image);
        }

        ScriptedTransport transport;
        UploadConfig config;
        CancelToken cancel;
    };
}  // namespace

// ============================================================================
// Successful transfers
// ============================================================================

TEST_F(TransferEngineTest, SendsEveryRequestedPartThenCompletes) {
    const std::vector<uint8_t> image = patternImage(4096);
    transport.queue({blockRequest(0, ALL_PARTS), notification(protocol::COMMAND_ACK)});
    transport.queueRepeated(notification(protocol::PART_ACK), 18);
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(image);

    ASSERT_TRUE(result.ok()) << errorName(result.error);
    EXPECT_FALSE(result.data_present);
    ASSERT_EQ(transport.writes.size(), 21u);
    EXPECT_EQ(transport.writtenIds().front(), protocol::START_DATA_TRANSFER);
    EXPECT_EQ(transport.writtenIds()[1], protocol::ACK_READY);
    for (uint32_t part_id = 0; part_id < 18; ++part_id) {
        EXPECT_EQ(transport.writes[2 + part_id], partCommand(image, 0, part_id)) << "part " << part_id;
    }
    EXPECT_EQ(transport.writes.back(), ByteVector({0x00, 0x03}));

    EXPECT_EQ(result.stats.connect_attempts, 1u);
    EXPECT_EQ(result.stats.block_requests, 1u);
    EXPECT_EQ(result.stats.parts_sent, 18u);
    EXPECT_EQ(result.stats.part_resends, 0u);
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, AnnouncesImageBeforeAnyBlock) {
    const std::vector<uint8_t> image = patternImage(21120);
    config.data_type = 0x20;
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    ASSERT_TRUE(run(image).ok());

    ASSERT_FALSE(transport.writes.empty());
    const codec::Announcement announcement = codec::encodeAnnouncement(image, 0x20);
    ByteVector expected{0x00, 0x64};
    expected.insert(expected.end(), announcement.begin(), announcement.end());
    EXPECT_EQ(transport.writes.front(), expected);
    EXPECT_EQ(transport.writes.front().size(), 19u);
}

TEST_F(TransferEngineTest, SessionSetupOrderAndSettleDelay) {
    config.settle_delay_ms = 300;
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    ASSERT_TRUE(run(patternImage(10)).ok());

    const std::vector<std::string> expected{
        "scan", "connect", "mtu", "service", "characteristic", "subscribe", "sleep",
        "write", "wait", "write", "disconnect"};
    EXPECT_EQ(transport.calls, expected);
    EXPECT_EQ(transport.sleeps, std::vector<uint32_t>{300});
}

TEST_F(TransferEngineTest, RequestsConfiguredMtu) {
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});
    ASSERT_TRUE(run(patternImage(10)).ok());
    EXPECT_EQ(transport.mtu_requests, std::vector<uint16_t>{protocol::MTU});

    config.mtu = 512;
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});
    ASSERT_TRUE(run(patternImage(10)).ok());
    const std::vector<uint16_t> expected{protocol::MTU, 512};
    EXPECT_EQ(transport.mtu_requests, expected);
}

TEST_F(TransferEngineTest, DataPresentShortCircuits) {
    transport.queue({notification(protocol::DATA_PRESENT)});

    const UploadResult result = run(patternImage(8192));

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.data_present);
    const std::vector<uint16_t> expected{protocol::START_DATA_TRANSFER, protocol::TRANSFER_COMPLETE};
    EXPECT_EQ(transport.writtenIds(), expected);
    EXPECT_TRUE(transport.writesOf(protocol::SEND_BLOCK_PART).empty());
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, ServicesShortLastBlock) {
    const std::vector<uint8_t> image = patternImage(4097);
    transport.queue({blockRequest(1, onlyPart(0)), notification(protocol::COMMAND_ACK),
                     notification(protocol::PART_ACK), notification(protocol::UPLOAD_COMPLETE)});

    ASSERT_TRUE(run(image).ok());

    const std::vector<ByteVector> parts = transport.writesOf(protocol::SEND_BLOCK_PART);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], partCommand(image, 1, 0));
    // header: length 1, checksum = the single byte
    EXPECT_EQ(parts[0][5], 1);
    EXPECT_EQ(parts[0][6], 0);
    EXPECT_EQ(parts[0][7], image[4096]);
}

TEST_F(TransferEngineTest, IgnoresUnknownAndMalformedNotifications) {
    transport.queue({ByteVector{0x01}, notification(0x1234), notification(protocol::COMMAND_ACK),
                     notification(protocol::PART_ACK), notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(patternImage(100));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.last_response, protocol::UPLOAD_COMPLETE);
}

TEST_F(TransferEngineTest, EmptyMaskSendsNoParts) {
    transport.queue({blockRequest(0, ByteVector(6, 0)), notification(protocol::COMMAND_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    ASSERT_TRUE(run(patternImage(100)).ok());

    const std::vector<uint16_t> expected{protocol::START_DATA_TRANSFER, protocol::ACK_READY, protocol::TRANSFER_COMPLETE};
    EXPECT_EQ(transport.writtenIds(), expected);
}

// ============================================================================
// Part errors
// ============================================================================

TEST_F(TransferEngineTest, PartErrorResendsIdenticalFrame) {
    const std::vector<uint8_t> image = patternImage(4096);
    transport.queue({blockRequest(0, onlyPart(3)), notification(protocol::COMMAND_ACK),
                     notification(protocol::PART_ERROR), notification(protocol::PART_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(image);

    ASSERT_TRUE(result.ok());
    const std::vector<ByteVector> parts = transport.writesOf(protocol::SEND_BLOCK_PART);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], partCommand(image, 0, 3));
    EXPECT_EQ(parts[1], parts[0]);
    EXPECT_EQ(result.stats.part_resends, 1u);
    EXPECT_EQ(result.stats.parts_sent, 1u);
}

TEST_F(TransferEngineTest, PartResendsAreUnboundedByDefault) {
    transport.queue({blockRequest(0, onlyPart(0)), notification(protocol::COMMAND_ACK)});
    transport.queueRepeated(notification(protocol::PART_ERROR), 25);
    transport.queue({notification(protocol::PART_ACK), notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(patternImage(100));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART).size(), 26u);
    EXPECT_EQ(result.stats.part_resends, 25u);
}

TEST_F(TransferEngineTest, PartResendCapFails) {
    config.max_part_resends = 2;
    transport.queue({blockRequest(0, onlyPart(4)), notification(protocol::COMMAND_ACK)});
    transport.queueRepeated(notification(protocol::PART_ERROR), 3);

    const UploadResult result = run(patternImage(4096));

    EXPECT_EQ(result.error, UploadError::part_retry_exhausted);
    EXPECT_EQ(result.block_id, 0);
    EXPECT_EQ(result.part_id, 4);
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART).size(), 3u);
    EXPECT_TRUE(transport.writesOf(protocol::TRANSFER_COMPLETE).empty());
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, CommandAckDuringPartWaitIsIgnored) {
    transport.queue({blockRequest(0, onlyPart(0)), notification(protocol::COMMAND_ACK),
                     notification(protocol::COMMAND_ACK), notification(protocol::PART_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    ASSERT_TRUE(run(patternImage(100)).ok());
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART).size(), 1u);
}

// ============================================================================
// Requests arriving mid-exchange
// ============================================================================

TEST_F(TransferEngineTest, BlockRequestInsteadOfReadyAckIsDeferred) {
    const std::vector<uint8_t> image = patternImage(4096);
    transport.queue({blockRequest(0, onlyPart(1)),
                     notification(protocol::PART_ACK),      // stale, skipped
                     blockRequest(0, onlyPart(2)),
                     notification(protocol::COMMAND_ACK), notification(protocol::PART_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(image);

    ASSERT_TRUE(result.ok());
    const std::vector<uint16_t> expected{protocol::START_DATA_TRANSFER, protocol::ACK_READY, protocol::ACK_READY,
                                         protocol::SEND_BLOCK_PART, protocol::TRANSFER_COMPLETE};
    EXPECT_EQ(transport.writtenIds(), expected);
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART)[0], partCommand(image, 0, 2));
    EXPECT_EQ(result.stats.block_requests, 2u);
}

TEST_F(TransferEngineTest, BlockRequestDuringPartWaitAbandonsBlock) {
    const std::vector<uint8_t> image = patternImage(8192);
    const ByteVector first_three{0x07, 0, 0, 0, 0, 0};
    transport.queue({blockRequest(0, first_three), notification(protocol::COMMAND_ACK),
                     notification(protocol::PART_ACK),
                     blockRequest(1, onlyPart(0)),          // arrives while part 1 waits
                     notification(protocol::COMMAND_ACK), notification(protocol::PART_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(image);

    ASSERT_TRUE(result.ok());
    const std::vector<ByteVector> parts = transport.writesOf(protocol::SEND_BLOCK_PART);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], partCommand(image, 0, 0));
    EXPECT_EQ(parts[1], partCommand(image, 0, 1));
    EXPECT_EQ(parts[2], partCommand(image, 1, 0));
    EXPECT_EQ(result.stats.parts_sent, 2u);
    EXPECT_EQ(transport.writesOf(protocol::ACK_READY).size(), 2u);
}

TEST_F(TransferEngineTest, UploadCompleteDuringPartWaitFinishes) {
    transport.queue({blockRequest(0, ALL_PARTS), notification(protocol::COMMAND_ACK),
                     notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(patternImage(4096));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART).size(), 1u);
    EXPECT_EQ(transport.writtenIds().back(), protocol::TRANSFER_COMPLETE);
}

TEST_F(TransferEngineTest, DataPresentDuringReadyWaitFinishes) {
    transport.queue({blockRequest(0, ALL_PARTS), notification(protocol::DATA_PRESENT)});

    const UploadResult result = run(patternImage(4096));

    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.data_present);
    EXPECT_TRUE(transport.writesOf(protocol::SEND_BLOCK_PART).empty());
}

// ============================================================================
// Protocol failures
// ============================================================================

TEST_F(TransferEngineTest, ErrorResponseInMainLoop) {
    transport.queue({notification(protocol::RSP_ERROR)});

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::protocol_error);
    EXPECT_EQ(result.last_response, 0xFFFF);
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, ErrorResponseAfterReadyAck) {
    transport.queue({blockRequest(0, ALL_PARTS), notification(protocol::RSP_ERROR)});
    EXPECT_EQ(run(patternImage(100)).error, UploadError::protocol_error);
}

TEST_F(TransferEngineTest, ErrorResponseDuringPartExchange) {
    transport.queue({blockRequest(0, ALL_PARTS), notification(protocol::COMMAND_ACK),
                     notification(protocol::PART_ACK), notification(protocol::RSP_ERROR)});

    const UploadResult result = run(patternImage(4096));

    EXPECT_EQ(result.error, UploadError::protocol_error);
    EXPECT_EQ(result.block_id, 0);
    EXPECT_EQ(result.part_id, 1);
    EXPECT_EQ(transport.writesOf(protocol::SEND_BLOCK_PART).size(), 2u);
}

TEST_F(TransferEngineTest, ShortBlockRequestIsViolation) {
    transport.queue({notification(protocol::BLOCK_REQUEST, ByteVector(16, 0))});

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::protocol_violation);
    EXPECT_TRUE(transport.writesOf(protocol::ACK_READY).empty());
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, OutOfRangeBlockIsViolation) {
    transport.queue({blockRequest(1, ALL_PARTS)});

    const UploadResult result = run(patternImage(4096));

    EXPECT_EQ(result.error, UploadError::protocol_violation);
    EXPECT_EQ(result.block_id, 1);
    EXPECT_TRUE(transport.writesOf(protocol::ACK_READY).empty());
}

TEST_F(TransferEngineTest, SilentDeviceTimesOut) {
    config.notification_timeout_ms = 20000;

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::notification_timeout);
    EXPECT_EQ(result.transport_status, TransportStatus::timeout);
    EXPECT_EQ(transport.wait_timeouts, std::vector<uint32_t>{20000});
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, SubExchangesUseResponseTimeout) {
    config.notification_timeout_ms = 20000;
    config.response_timeout_ms = 10000;
    transport.queue({blockRequest(0, onlyPart(0)), notification(protocol::COMMAND_ACK)});

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::notification_timeout);
    EXPECT_EQ(result.part_id, 0);
    const std::vector<uint32_t> expected{20000, 10000, 10000};
    EXPECT_EQ(transport.wait_timeouts, expected);
}

TEST_F(TransferEngineTest, WriteFailureIsTransportFailure) {
    transport.fail_write_at = 1;   // ACK_READY
    transport.queue({blockRequest(0, ALL_PARTS)});

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::transport_failure);
    EXPECT_EQ(result.transport_status, TransportStatus::io_error);
    EXPECT_EQ(transport.disconnects, 1u);
}

// ============================================================================
// Discovery and connection
// ============================================================================

TEST_F(TransferEngineTest, ConnectFailureExhaustsRetryBudget) {
    transport.connect_default = TransportStatus::connect_failed;

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::connection_failure);
    EXPECT_EQ(result.transport_status, TransportStatus::connect_failed);
    EXPECT_EQ(result.stats.connect_attempts, 5u);
    EXPECT_EQ(transport.connects, 5u);
    EXPECT_EQ(transport.scans, 5u);
    EXPECT_EQ(transport.sleeps, std::vector<uint32_t>(4, 1200));
    EXPECT_TRUE(transport.writes.empty());
    EXPECT_EQ(transport.disconnects, 0u);
}

TEST_F(TransferEngineTest, DeviceNeverSeenIsDiscoveryTimeout) {
    config.connect_retries = 3;
    transport.device_visible = false;

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::discovery_timeout);
    EXPECT_EQ(result.transport_status, TransportStatus::timeout);
    EXPECT_EQ(transport.scans, 3u);
    EXPECT_EQ(transport.connects, 0u);
    EXPECT_EQ(transport.sleeps, std::vector<uint32_t>(2, 1200));
}

TEST_F(TransferEngineTest, ScanComparesAddressCaseSensitively) {
    transport.visible_address = "3C:60:55:84:A0:42";
    config.connect_retries = 1;

    EXPECT_EQ(run(patternImage(100)).error, UploadError::discovery_timeout);
}

TEST_F(TransferEngineTest, DeviceAppearsOnLaterScan) {
    transport.scans_before_visible = 2;
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(patternImage(100));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.stats.connect_attempts, 3u);
    EXPECT_EQ(transport.connects, 1u);
}

TEST_F(TransferEngineTest, FailedConnectRescans) {
    transport.connect_script = {TransportStatus::connect_failed, TransportStatus::ok};
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = run(patternImage(100));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(transport.scans, 2u);
    EXPECT_EQ(transport.connects, 2u);
    EXPECT_EQ(result.transport_status, TransportStatus::ok);
}

TEST_F(TransferEngineTest, MissingServiceFailsSetup) {
    transport.service_status = TransportStatus::not_found;

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::session_setup_failure);
    EXPECT_EQ(result.transport_status, TransportStatus::not_found);
    EXPECT_TRUE(transport.writes.empty());
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, SubscribeFailureFailsSetup) {
    transport.subscribe_status = TransportStatus::io_error;
    EXPECT_EQ(run(patternImage(100)).error, UploadError::session_setup_failure);
    EXPECT_EQ(transport.disconnects, 1u);
}

TEST_F(TransferEngineTest, InvalidConfigTouchesNothing) {
    config.target = {};

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::invalid_config);
    EXPECT_TRUE(transport.calls.empty());
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(TransferEngineTest, CancelDuringRetryDelay) {
    transport.connect_default = TransportStatus::connect_failed;
    transport.on_sleep = [this] { cancel.cancel(); };

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::cancelled);
    EXPECT_EQ(transport.connects, 1u);
    EXPECT_EQ(transport.disconnects, 0u);
}

TEST_F(TransferEngineTest, CancelDuringTransferDisconnectsOnce) {
    transport.on_wait = [this] { cancel.cancel(); };
    transport.queue({blockRequest(0, ALL_PARTS)});

    const UploadResult result = run(patternImage(100));

    EXPECT_EQ(result.error, UploadError::cancelled);
    EXPECT_EQ(transport.disconnects, 1u);
    EXPECT_TRUE(transport.writesOf(protocol::ACK_READY).empty());
}

TEST_F(TransferEngineTest, EngineReportsFinalState) {
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});
    const std::vector<uint8_t> image = patternImage(100);

    TransferEngine<ScriptedTransport> engine(transport, config);
    EXPECT_EQ(engine.state(), TransferEngine<ScriptedTransport>::State::idle);
    ASSERT_TRUE(engine.upload(image).ok());
    EXPECT_EQ(engine.state(), TransferEngine<ScriptedTransport>::State::completed);

    const UploadResult failed = engine.upload(image);
    EXPECT_EQ(failed.error, UploadError::notification_timeout);
    EXPECT_EQ(engine.state(), TransferEngine<ScriptedTransport>::State::failed);
}

// ============================================================================
// Whole-upload retry
// ============================================================================

TEST_F(TransferEngineTest, RetryWrapperRepeatsFailedUpload) {
    config.connect_retries = 1;
    transport.connect_script = {TransportStatus::connect_failed};
    transport.queue({notification(protocol::UPLOAD_COMPLETE)});

    const UploadResult result = uploadWithRetry(transport, config, patternImage(100), RetryPolicy{3, 10000});

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(transport.connects, 2u);
    ASSERT_FALSE(transport.sleeps.empty());
    EXPECT_EQ(transport.sleeps.front(), 10000u);
}

TEST_F(TransferEngineTest, RetryWrapperGivesUpAfterPolicyAttempts) {
    config.connect_retries = 2;
    transport.device_visible = false;

    const UploadResult result = uploadWithRetry(transport, config, patternImage(100), RetryPolicy{3, 5000});

    EXPECT_EQ(result.error, UploadError::discovery_timeout);
    EXPECT_EQ(transport.scans, 6u);
    // one engine delay per upload, policy delay between uploads
    const std::vector<uint32_t> expected{1200, 5000, 1200, 5000, 1200};
    EXPECT_EQ(transport.sleeps, expected);
}

TEST_F(TransferEngineTest, RetryWrapperDoesNotRetryInvalidConfig) {
    config.connect_retries = 0;

    const UploadResult result = uploadWithRetry(transport, config, patternImage(100), RetryPolicy{3, 5000});

    EXPECT_EQ(result.error, UploadError::invalid_config);
    EXPECT_TRUE(transport.calls.empty());
}

TEST_F(TransferEngineTest, RetryWrapperStopsWhenCancelled) {
    config.connect_retries = 1;
    transport.device_visible = false;
    transport.on_sleep = [this] { cancel.cancel(); };

    const UploadResult result = uploadWithRetry(transport, config, patternImage(100), RetryPolicy{4, 5000});

    EXPECT_EQ(result.error, UploadError::cancelled);
    EXPECT_EQ(transport.scans, 1u);
    EXPECT_EQ(transport.sleeps, std::vector<uint32_t>{5000});
}
