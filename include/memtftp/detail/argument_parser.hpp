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
 * @file argument_parser.hpp
 * @brief This file declares a CLI argument parser.
 */
#pragma once
#ifndef MEMTFTP_ARGUMENT_PARSER_HPP
#define MEMTFTP_ARGUMENT_PARSER_HPP
#include <span>
#include <string_view>
#include <vector>
/** @brief For internal memtftp server implementation details. */
namespace memtftp::detail {
/** @brief A command line argument parser. */
struct argument_parser {
  /** @brief Command-line arguments are parsed into options. */
  struct option {
    /** @brief option flag. */
    std::string_view flag;
    /** @brief option value. */
    std::string_view value;
  };
  /**
   * @brief Parse all command-line arguments.
   * @details A flag takes at most one value, either after an `=` in a long
   * option or as the next argument. Values without a flag are returned with
   * an empty flag. The first argument (the program name) is skipped.
   * @param args The command line arguments to parse.
   * @returns The options in command-line order.
   */
  static auto parse(std::span<char const *const> args) -> std::vector<option>;
  /**
   * @brief Parse all command-line arguments.
   * @param argc The number of command-line arguments.
   * @param argv The command-line arguments.
   * @returns The options in command-line order.
   */
  static auto parse(int argc, char const *const *argv) -> std::vector<option>
  {
    return parse({argv, static_cast<std::size_t>(argc)});
  }
};
} // namespace memtftp::detail
#endif // MEMTFTP_ARGUMENT_PARSER_HPP
