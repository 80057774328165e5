/**
 * @file wire_codec.cpp
 * @brief OEPL wire codec implementation
 */

#include "oepl/wire_codec.hpp"

#include <algorithm>
#include <cstring>

#if defined(ESP_PLATFORM)
    #include <esp_crc.h>
#endif

namespace oepl {
    namespace protocol {
        const char* responseName(const uint16_t id) noexcept {
            switch (id) {
                case COMMAND_ACK:     return "COMMAND_ACK";
                case PART_ERROR:      return "PART_ERROR";
                case PART_ACK:        return "PART_ACK";
                case BLOCK_REQUEST:   return "BLOCK_REQUEST";
                case UPLOAD_COMPLETE: return "UPLOAD_COMPLETE";
                case DATA_PRESENT:    return "DATA_PRESENT";
                case RSP_ERROR:       return "ERROR";
                default:              return "UNKNOWN";
            }
        }
    }  // namespace protocol

    namespace codec {
        uint8_t sum8(const Bytes data) noexcept {
            uint8_t sum = 0;
            for (const uint8_t b : data) {
                sum = static_cast<uint8_t>(sum + b);
            }
            return sum;
        }

        uint16_t sum16(const Bytes data) noexcept {
            uint16_t sum = 0;
            for (const uint8_t b : data) {
                sum = static_cast<uint16_t>(sum + b);
            }
            return sum;
        }

        uint32_t crc32(const Bytes data) noexcept {
#if defined(ESP_PLATFORM)
            return esp_crc32_le(0, data.data(), static_cast<uint32_t>(data.size()));
#else
            // Host builds (unit tests)
            uint32_t crc = 0xFFFFFFFF;
            for (const uint8_t b : data) {
                crc ^= b;
                for (int k = 0; k < 8; k++) {
                    crc = crc & 1 ? crc >> 1 ^ 0xEDB88320 : crc >> 1;
                }
            }
            return ~crc;
#endif
        }

        size_t encodeCommand(const uint16_t id, const Bytes payload, const std::span<uint8_t> out) noexcept {
            const size_t total = protocol::COMMAND_ID_SIZE + payload.size();
            if (out.size() < total) {
                return 0;
            }

            out[0] = static_cast<uint8_t>(id >> 8);
            out[1] = static_cast<uint8_t>(id & 0xFF);
            if (!payload.empty()) {
                std::memcpy(out.data() + protocol::COMMAND_ID_SIZE, payload.data(), payload.size());
            }
            return total;
        }

        Notification decodeNotification(const Bytes frame) noexcept {
            if (frame.size() < protocol::COMMAND_ID_SIZE) {
                return {};
            }

            Notification n;
            n.id = static_cast<uint16_t>(frame[0] << 8 | frame[1]);
            n.payload = frame.subspan(protocol::COMMAND_ID_SIZE);
            return n;
        }

        Announcement encodeAnnouncement(const Bytes image, const uint8_t data_type) noexcept {
            protocol::avail_data_info_t info;
            info.crc32 = crc32(image);
            info.data_size = static_cast<uint32_t>(image.size());
            info.data_type = data_type;

            Announcement out{};
            std::memcpy(out.data(), &info, sizeof(info));
            return out;
        }

        WrappedBlock wrapBlock(const Bytes image, const uint32_t block_id) noexcept {
            const size_t start = std::min(image.size(), static_cast<size_t>(block_id) * protocol::BLOCK_DATA_SIZE);
            const size_t length = std::min(image.size() - start, protocol::BLOCK_DATA_SIZE);
            const Bytes payload = image.subspan(start, length);

            protocol::block_header_t header;
            header.length = static_cast<uint16_t>(length);
            header.checksum = sum16(payload);

            WrappedBlock block;
            std::memcpy(block.bytes.data(), &header, sizeof(header));
            if (length > 0) {
                std::memcpy(block.bytes.data() + sizeof(header), payload.data(), length);
            }
            block.length = sizeof(header) + length;
            return block;
        }

        BlockPartFrame encodeBlockPart(const Bytes image, const uint32_t block_id, const uint32_t part_id) noexcept {
            const WrappedBlock block = wrapBlock(image, block_id);

            protocol::block_part_t part;
            part.block_id = static_cast<uint8_t>(block_id & 0xFF);
            part.part_id = static_cast<uint8_t>(part_id & 0xFF);

            const size_t start = static_cast<size_t>(part_id) * protocol::PART_DATA_SIZE;
            if (start < block.length) {
                const size_t length = std::min(block.length - start, protocol::PART_DATA_SIZE);
                std::memcpy(part.data, block.bytes.data() + start, length);
            }

            BlockPartFrame out{};
            std::memcpy(out.data(), &part, sizeof(part));
            out[0] = sum8(Bytes(out).subspan(1));
            return out;
        }

        RequestedParts decodeRequestedParts(const Bytes mask) noexcept {
            RequestedParts parts;
            for (size_t part_id = 0; part_id < protocol::PARTS_PER_BLOCK; ++part_id) {
                const size_t byte_index = part_id / 8;
                if (byte_index >= mask.size()) {
                    break;
                }
                if (mask[byte_index] >> (part_id % 8) & 0x01) {
                    parts.push(static_cast<uint8_t>(part_id));
                }
            }
            return parts;
        }
    }  // namespace codec
}  // namespace oepl
