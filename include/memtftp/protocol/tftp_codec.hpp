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
 * @file tftp_codec.hpp
 * @brief This file declares the TFTP packet encoders and decoders.
 */
#pragma once
#ifndef MEMTFTP_CODEC_HPP
#define MEMTFTP_CODEC_HPP
#include "tftp_protocol.hpp"

#include <optional>
#include <vector>
/** @brief memtftp related utilities. */
namespace memtftp {
/**
 * @brief Encodes an ACK packet.
 * @param block_num The block number being acknowledged.
 * @returns The 4 byte packet.
 */
auto encode_ack(std::uint16_t block_num) -> std::vector<char>;

/**
 * @brief Checks that a datagram acknowledges a specific block.
 * @details Anything other than a 4 byte ACK for exactly `expected` is
 * rejected.
 * @param msg The received datagram.
 * @param expected The block number that must be acknowledged.
 * @returns true if msg is a well-formed ACK for expected.
 */
[[nodiscard]] auto decode_ack(std::span<const std::byte> msg,
                              std::uint16_t expected) noexcept -> bool;

/**
 * @brief Encodes a DATA packet.
 * @param payload At most messages::DATALEN bytes of file data.
 * @param block_num The block number.
 * @returns The header followed by the payload.
 */
auto encode_data(std::span<const char> payload,
                 std::uint16_t block_num) -> std::vector<char>;

/**
 * @brief Decodes a DATA packet.
 * @param msg The received datagram.
 * @returns std::nullopt if msg is not a DATA packet, the decoded block
 * otherwise. The payload is a view into msg.
 */
[[nodiscard]] auto decode_data(std::span<const std::byte> msg) noexcept
    -> std::optional<messages::data_block>;

/**
 * @brief Encodes an ERROR packet.
 * @param error The error code placed on the wire.
 * @param message The error message, a NUL is appended.
 * @returns The encoded packet.
 */
auto encode_error(std::uint16_t error,
                  std::string_view message) -> std::vector<char>;

/**
 * @brief Converts a string_view to a TFTP mode.
 * @param mode The mode string, case insensitive.
 * @returns The mode, or 0 if it is not recognized.
 */
[[nodiscard]] auto to_mode(std::string_view mode) noexcept -> std::uint8_t;

/**
 * @brief Decodes a read or write request.
 * @details The opcode is not validated here. The filename is reduced to its
 * final path component so that requests can't escape the store namespace.
 * @param msg The received datagram.
 * @returns The decoded request.
 */
[[nodiscard]] auto
decode_request(std::span<const std::byte> msg) -> messages::request;
} // namespace memtftp
#endif // MEMTFTP_CODEC_HPP
