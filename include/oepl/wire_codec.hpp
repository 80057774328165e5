/**
 * @file wire_codec.hpp
 * @brief Stateless encoders/decoders for the OEPL transfer protocol
 *
 * @details
 * Pure functions over byte spans: no I/O, no heap, no shared state. Output is
 * returned in fixed-size arrays sized from the packed wire structures in
 * protocol.hpp.
 *
 * @see transfer_engine.hpp for the state machine driving these
 */

#ifndef OEPL_WIRE_CODEC_HPP_
#define OEPL_WIRE_CODEC_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "protocol.hpp"

namespace oepl::codec {
    using Bytes = std::span<const uint8_t>;

    using Announcement = std::array<uint8_t, sizeof(protocol::avail_data_info_t)>;
    using BlockPartFrame = std::array<uint8_t, sizeof(protocol::block_part_t)>;

    /**
     * @brief Decoded notification frame
     * @details `payload` aliases the frame passed to decodeNotification().
     */
    struct Notification {
        std::optional<uint16_t> id;
        Bytes payload;
    };

    /**
     * @brief Block with its length/checksum header, ready to be split into parts
     */
    struct WrappedBlock {
        std::array<uint8_t, protocol::WRAPPED_BLOCK_MAX_SIZE> bytes{};
        size_t length = 0;

        Bytes view() const noexcept { return {bytes.data(), length}; }
    };

    /**
     * @brief Ascending list of part ids requested by a BLOCK_REQUEST mask
     */
    class RequestedParts {
    public:
        const uint8_t* begin() const noexcept { return ids_.data(); }
        const uint8_t* end() const noexcept { return ids_.data() + count_; }
        size_t size() const noexcept { return count_; }
        bool empty() const noexcept { return count_ == 0; }
        uint8_t operator[](size_t i) const noexcept { return ids_[i]; }

        void push(uint8_t part_id) noexcept {
            if (count_ < ids_.size()) {
                ids_[count_++] = part_id;
            }
        }

    private:
        std::array<uint8_t, protocol::PARTS_PER_BLOCK> ids_{};
        size_t count_ = 0;
    };

    /// Additive checksum mod 256
    uint8_t sum8(Bytes data) noexcept;

    /// Additive checksum mod 65536
    uint16_t sum16(Bytes data) noexcept;

    /// CRC-32/ISO-HDLC (zlib, binascii.crc32); ESP-IDF `esp_crc32_le` on ESP32
    uint32_t crc32(Bytes data) noexcept;

    /// ceil(image_size / 4096)
    constexpr size_t totalBlocks(const size_t image_size) noexcept {
        return (image_size + protocol::BLOCK_DATA_SIZE - 1) / protocol::BLOCK_DATA_SIZE;
    }

    /**
     * @brief Build a command frame: big-endian id followed by payload
     * @param out Destination buffer
     * @return Bytes written, 0 if `out` cannot hold the frame
     */
    size_t encodeCommand(uint16_t id, Bytes payload, std::span<uint8_t> out) noexcept;

    /**
     * @brief Split a notification into big-endian id and payload
     * @return `{nullopt, {}}` for an empty or 1-byte frame
     */
    Notification decodeNotification(Bytes frame) noexcept;

    /**
     * @brief Build the START_DATA_TRANSFER payload describing the whole image
     */
    Announcement encodeAnnouncement(Bytes image, uint8_t data_type) noexcept;

    /**
     * @brief Slice block `block_id` out of the image and prepend its header
     * @details The slice is clamped to the image end; a block id past the end
     *          yields a bare zero-length header.
     */
    WrappedBlock wrapBlock(Bytes image, uint32_t block_id) noexcept;

    /**
     * @brief Build one 233-byte SEND_BLOCK_PART payload
     * @details Takes the `part_id`-th 230-byte window of the wrapped block,
     *          zero-padding whatever lies past the wrapped data.
     */
    BlockPartFrame encodeBlockPart(Bytes image, uint32_t block_id, uint32_t part_id) noexcept;

    /**
     * @brief Decode a requested-parts bitmask
     * @details Only the first 18 bit positions are meaningful; bytes missing
     *          from a short mask count as unset.
     */
    RequestedParts decodeRequestedParts(Bytes mask) noexcept;
}  // namespace oepl::codec

#endif
