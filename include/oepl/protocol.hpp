/**
 * @file protocol.hpp
 * @brief OpenEPaperLink BLE (ATC_BLE_OEPL) wire definitions
 *
 * @details
 * Command/response identifiers, transfer geometry and the packed wire
 * structures exchanged over the single 0x1337 characteristic.
 *
 * Byte order is mixed and must be kept exactly: the 2-byte command/response id
 * that prefixes every frame is big-endian, all multi-byte payload fields are
 * little-endian. The packed structs below rely on a little-endian host
 * (ESP32, x86, ARM), which is asserted at compile time.
 */

#ifndef OEPL_PROTOCOL_HPP_
#define OEPL_PROTOCOL_HPP_

#include <bit>
#include <cstddef>
#include <cstdint>

namespace oepl {
    namespace uuids {
        inline constexpr uint16_t SERVICE        = 0x1337;
        inline constexpr uint16_t CHARACTERISTIC = 0x1337;
    }

    namespace protocol {
        static_assert(std::endian::native == std::endian::little,
            "OEPL payload structures are little-endian on the wire");

        /// Host -> device commands
        enum command_t : uint16_t {
            ACK_READY           = 0x0002,   /**< Ready to send parts of the requested block. */
            TRANSFER_COMPLETE   = 0x0003,   /**< Host acknowledges the end of the upload. */
            START_DATA_TRANSFER = 0x0064,   /**< Announce image (payload: avail_data_info_t). */
            SEND_BLOCK_PART     = 0x0065,   /**< One block part (payload: block_part_t). */
        };

        /// Device -> host notifications
        enum response_t : uint16_t {
            COMMAND_ACK     = 0x0063,
            PART_ERROR      = 0x00C4,       /**< Part checksum failed on the device, resend. */
            PART_ACK        = 0x00C5,
            BLOCK_REQUEST   = 0x00C6,       /**< Payload: block_request_t. */
            UPLOAD_COMPLETE = 0x00C7,
            DATA_PRESENT    = 0x00C8,       /**< Device already holds identical content. */
            RSP_ERROR       = 0xFFFF,
        };

        inline constexpr size_t BLOCK_DATA_SIZE = 4096;
        inline constexpr size_t PART_DATA_SIZE = 230;
        inline constexpr size_t PARTS_PER_BLOCK = 18;
        inline constexpr size_t PARTS_MASK_SIZE = 6;
        inline constexpr size_t COMMAND_ID_SIZE = 2;

        inline constexpr uint16_t MTU = 247;
        /// Largest ATT MTU the Bluetooth core allows
        inline constexpr uint16_t MAX_MTU = 517;
        /// ATT notification payload limit for the negotiated MTU
        inline constexpr size_t MAX_NOTIFICATION_SIZE = MTU - 3;

        inline constexpr uint8_t AVAIL_DATA_MARKER = 0xFF;
        /// Raw B/W/R or B/W/Y bitplanes
        inline constexpr uint8_t DEFAULT_DATA_TYPE = 0x21;

#pragma pack(push, 1)
        /**
         * @brief START_DATA_TRANSFER payload (0x0064)
         */
        struct avail_data_info_t {
            uint8_t  marker = AVAIL_DATA_MARKER;
            uint64_t crc32 = 0;             ///< CRC32 of the whole image, upper 32 bits zero
            uint32_t data_size = 0;         ///< Image length in bytes
            uint8_t  data_type = DEFAULT_DATA_TYPE;
            uint8_t  reserved0 = 0;
            uint16_t reserved1 = 0;
        };
        static_assert(sizeof(avail_data_info_t) == 17);

        /**
         * @brief BLOCK_REQUEST payload (0x00C6)
         * @note Bytes 0..8 are not interpreted by the host.
         */
        struct block_request_t {
            uint8_t opaque[9];
            uint8_t block_id;
            uint8_t type;
            uint8_t parts_mask[PARTS_MASK_SIZE];
        };
        static_assert(sizeof(block_request_t) == 17);

        /**
         * @brief Header prepended to every block before it is split into parts
         */
        struct block_header_t {
            uint16_t length = 0;            ///< Block payload length
            uint16_t checksum = 0;          ///< Sum of payload bytes mod 65536
        };
        static_assert(sizeof(block_header_t) == 4);

        /**
         * @brief SEND_BLOCK_PART payload (0x0065)
         */
        struct block_part_t {
            uint8_t checksum = 0;           ///< Sum of the following 232 bytes mod 256
            uint8_t block_id = 0;
            uint8_t part_id = 0;
            uint8_t data[PART_DATA_SIZE] = {};
        };
        static_assert(sizeof(block_part_t) == 233);
#pragma pack(pop)

        inline constexpr size_t WRAPPED_BLOCK_MAX_SIZE = sizeof(block_header_t) + BLOCK_DATA_SIZE;
        static_assert(PARTS_PER_BLOCK * PART_DATA_SIZE >= WRAPPED_BLOCK_MAX_SIZE,
            "18 parts must cover a full wrapped block");

        inline constexpr size_t MAX_COMMAND_SIZE = COMMAND_ID_SIZE + sizeof(block_part_t);
        static_assert(MAX_COMMAND_SIZE <= MAX_NOTIFICATION_SIZE,
            "Largest command must fit a single write at the negotiated MTU");

        /**
         * @brief Human-readable response name for logs
         * @return Static string, "UNKNOWN" for unrecognised ids
         */
        const char* responseName(uint16_t id) noexcept;
    }  // namespace protocol
}  // namespace oepl

#endif
