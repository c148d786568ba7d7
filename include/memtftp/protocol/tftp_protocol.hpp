/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * memtftp is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * memtftp is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with memtftp.  If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file tftp_protocol.hpp
 * @brief This file declares the TFTP protocol definitions.
 */
#pragma once
#ifndef MEMTFTP_PROTOCOL_HPP
#define MEMTFTP_PROTOCOL_HPP
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
/** @brief memtftp related utilities. */
namespace memtftp {
// NOLINTBEGIN(performance-enum-size)
/** @brief A struct to contain TFTP protocol definitions. */
struct messages {
  /**
   * @brief Protocol defined operations (opcodes).
   * These are the valid TFTP operation codes as defined in RFC 1350.
   */
  enum opcode_t : std::uint16_t { RRQ = 1, WRQ, DATA, ACK, ERROR };

  /**
   * @brief Protocol defined transfer modes.
   * The mode is parsed and reported but every transfer is carried out
   * byte-for-byte.
   */
  enum mode_t : std::uint8_t { NETASCII = 1, OCTET, MAIL };

  /**
   * @brief Protocol defined error codes.
   * These are the standard TFTP error codes as defined in RFC 1350.
   */
  enum error_t : std::uint16_t {
    NOT_DEFINED = 0,
    FILE_NOT_FOUND,
    ACCESS_VIOLATION,
    DISK_FULL,
    ILLEGAL_OPERATION,
    UNKNOWN_TID,
    FILE_ALREADY_EXISTS,
    NO_SUCH_USER,
    // Errors below this point are all ALIASES to NOT_DEFINED.
    TIMED_OUT,
    BAD_PACKET,
    BAD_BLOCK
  };

  /**
   * @brief A decoded read or write request.
   */
  struct request {
    /** @brief Operation Code (RRQ or WRQ, anything else is illegal). */
    std::uint16_t opc;
    /** @brief Transfer mode (NETASCII, OCTET, MAIL or 0 if unknown). */
    std::uint8_t mode;
    /** @brief The requested filename, stripped of any directory. */
    std::string filename;
  };

  /**
   * @brief Data message header.
   * Represents the fixed part of DATA packets.
   */
  struct data {
    /** @brief Operation code (DATA). */
    std::uint16_t opc;
    /** @brief Block number (starts at 1). */
    std::uint16_t block_num;
  };

  /**
   * @brief Acknowledgment message structure.
   * ACK packets have the same structure as DATA headers (opcode + block
   * number).
   */
  using ack = data;

  /**
   * @brief Error message header.
   * The header is followed by a NUL-terminated message.
   */
  struct error {
    /** @brief Operation code (ERROR) */
    std::uint16_t opc;
    /** @brief Error code from error_t enum. */
    std::uint16_t error;
  };

  /** @brief A decoded DATA packet. */
  struct data_block {
    /** @brief The block number. */
    std::uint16_t block_num;
    /** @brief A view of the payload inside the received datagram. */
    std::span<const std::byte> payload;
    /** @brief Set when the payload is shorter than DATALEN. */
    bool final;
  };

  /** @brief The maximum data payload size in bytes (512 bytes per RFC 1350). */
  static constexpr auto DATALEN = 512UL;
  /** @brief The maximum total size of a DATA message (header + payload). */
  static constexpr auto DATAMSG_MAXLEN = sizeof(data) + DATALEN;
};
// NOLINTEND(performance-enum-size)

/** @brief Error messages. */
struct errors {
  /**
   * @brief Maps an error to the code carried on the wire.
   * @param error The TFTP error, possibly an internal alias.
   * @returns The RFC 1350 error code.
   */
  static constexpr auto wire_code(std::uint16_t error) noexcept
      -> std::uint16_t
  {
    using enum messages::error_t;
    if (error > NO_SUCH_USER)
      return NOT_DEFINED;

    return error;
  }

  /**
   * @brief Converts a TFTP error to a string.
   * @param error The TFTP error.
   * @returns A string_view containing the relevant error message.
   */
  static constexpr auto errstr(std::uint16_t error) noexcept -> std::string_view
  {
    using enum messages::error_t;
    switch (error)
    {
      case ACCESS_VIOLATION:
        return "Access violation.";

      case FILE_NOT_FOUND:
        return "File not found.";

      case DISK_FULL:
        return "Disk full.";

      case NO_SUCH_USER:
        return "No such user.";

      case FILE_ALREADY_EXISTS:
        return "File already exists.";

      case UNKNOWN_TID:
        return "Unknown TID.";

      case ILLEGAL_OPERATION:
        return "Illegal operation.";

      case TIMED_OUT:
        return "Timed out.";

      case BAD_PACKET:
        return "Unable to parse data packet";

      case BAD_BLOCK:
        return "Unexpected block number.";

      default:
        return "Not defined.";
    }
  }
};

} // namespace memtftp
#endif // MEMTFTP_PROTOCOL_HPP
