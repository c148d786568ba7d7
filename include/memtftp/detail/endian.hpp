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
 * @file endian.hpp
 * @brief This file defines constexpr network byte-order helpers.
 */
#pragma once
#ifndef MEMTFTP_ENDIAN_HPP
#define MEMTFTP_ENDIAN_HPP
#include <cstdint>
/** @brief Defines internal memtftp implementation details. */
namespace memtftp::detail {
// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers)

/**
 * @brief Reads a big-endian 16-bit field.
 * @details Works on any byte-like buffer (char, unsigned char, std::byte)
 * without any alignment requirement on the source.
 * @tparam Byte The buffer element type.
 * @param buf Pointer to the first of two bytes.
 * @returns The field value in host byte order.
 */
template <typename Byte>
constexpr auto load_be16(const Byte *buf) noexcept -> std::uint16_t
{
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto high = static_cast<unsigned char>(buf[0]);
  const auto low = static_cast<unsigned char>(buf[1]);
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return static_cast<std::uint16_t>((high << 8) | low);
}

/**
 * @brief Writes a 16-bit value as a big-endian field.
 * @tparam Byte The buffer element type.
 * @param buf Pointer to the first of two bytes.
 * @param value The value in host byte order.
 */
template <typename Byte>
constexpr auto store_be16(Byte *buf, const std::uint16_t value) noexcept
    -> void
{
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  buf[0] = static_cast<Byte>(value >> 8);
  buf[1] = static_cast<Byte>(value & 0xFF);
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers)
} // namespace memtftp::detail
#endif // MEMTFTP_ENDIAN_HPP
