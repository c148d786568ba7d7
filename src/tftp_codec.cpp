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
 * @file tftp_codec.cpp
 * @brief This file defines the TFTP packet encoders and decoders.
 */
#include "memtftp/protocol/tftp_codec.hpp"
#include "memtftp/detail/endian.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
namespace memtftp {
using detail::load_be16;
using detail::store_be16;

/** @brief Size of the opcode + block/error field header. */
static constexpr auto HEADERLEN = sizeof(messages::data);

/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief Converts NUL-terminated C strings to string views. */
static inline auto to_view(const char *str,
                           std::size_t maxlen) -> std::string_view
{
  const auto len = strnlen(str, maxlen);
  if (len == maxlen)
    return {};

  return {str, len};
}

auto encode_ack(std::uint16_t block_num) -> std::vector<char>
{
  using enum messages::opcode_t;
  auto buf = std::vector<char>(sizeof(messages::ack));
  store_be16(buf.data(), ACK);
  store_be16(buf.data() + sizeof(messages::opcode_t), block_num);
  return buf;
}

auto decode_ack(std::span<const std::byte> msg,
                std::uint16_t expected) noexcept -> bool
{
  using enum messages::opcode_t;
  if (msg.size() != sizeof(messages::ack))
    return false;

  if (load_be16(msg.data()) != ACK)
    return false;

  return load_be16(msg.data() + sizeof(messages::opcode_t)) == expected;
}

auto encode_data(std::span<const char> payload,
                 std::uint16_t block_num) -> std::vector<char>
{
  using enum messages::opcode_t;
  auto buf = std::vector<char>();
  buf.reserve(HEADERLEN + payload.size());
  buf.resize(HEADERLEN);
  store_be16(buf.data(), DATA);
  store_be16(buf.data() + sizeof(messages::opcode_t), block_num);
  buf.insert(buf.end(), payload.begin(), payload.end());
  return buf;
}

auto decode_data(std::span<const std::byte> msg) noexcept
    -> std::optional<messages::data_block>
{
  using enum messages::opcode_t;
  if (msg.size() < HEADERLEN || load_be16(msg.data()) != DATA)
    return std::nullopt;

  auto payload = msg.subspan(HEADERLEN);
  return messages::data_block{
      .block_num = load_be16(msg.data() + sizeof(messages::opcode_t)),
      .payload = payload,
      .final = payload.size() < messages::DATALEN};
}

auto encode_error(std::uint16_t error,
                  std::string_view message) -> std::vector<char>
{
  using enum messages::opcode_t;
  auto buf = std::vector<char>();
  buf.reserve(sizeof(messages::error) + message.size() + 1);
  buf.resize(sizeof(messages::error));
  store_be16(buf.data(), ERROR);
  store_be16(buf.data() + sizeof(messages::opcode_t), error);
  buf.insert(buf.end(), message.begin(), message.end());
  buf.push_back('\0');
  return buf;
}

auto to_mode(std::string_view mode) noexcept -> std::uint8_t
{
  using enum messages::mode_t;
  constexpr auto BUFSIZE = sizeof("netascii");

  if (mode.size() >= BUFSIZE)
    return 0;

  auto buf = std::array<char, BUFSIZE>{};
  std::ranges::transform(mode, buf.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });

  const auto lower = std::string_view(buf.data(), mode.size());
  if (lower == "netascii")
    return NETASCII;

  if (lower == "octet")
    return OCTET;

  if (lower == "mail")
    return MAIL;

  return 0;
}

auto decode_request(std::span<const std::byte> msg) -> messages::request
{
  auto req = messages::request{};
  if (msg.size() < sizeof(messages::opcode_t))
    return req;

  req.opc = load_be16(msg.data());

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *buf = reinterpret_cast<const char *>(msg.data()) +
                    sizeof(messages::opcode_t);
  const auto *end = reinterpret_cast<const char *>(msg.data()) + msg.size();

  auto filepath = to_view(buf, end - buf);
  if (filepath.empty())
    return req;

  req.filename = std::filesystem::path(filepath).filename().string();
  buf += filepath.size() + 1;
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  req.mode = to_mode({buf, strnlen(buf, end - buf)});
  return req;
}
} // namespace memtftp
