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
 * @file argument_parser.cpp
 * @brief This file implements a CLI argument parser.
 */
#include "memtftp/detail/argument_parser.hpp"

#include <algorithm>
namespace memtftp::detail {

/** @brief True for tokens like "-" and "--" that are all dashes. */
static inline auto only_dashes(std::string_view token) noexcept -> bool
{
  return std::ranges::all_of(token, [](char chr) { return chr == '-'; });
}

auto argument_parser::parse(std::span<char const *const> args)
    -> std::vector<option>
{
  auto options = std::vector<option>();
  auto opt = option{};

  auto flush = [&]() {
    if (!opt.flag.empty() || !opt.value.empty())
      options.push_back(opt);
    opt = {};
  };

  for (const auto *arg : args.subspan(std::min<std::size_t>(1, args.size())))
  {
    auto token = std::string_view(arg);
    if (!token.empty() && token[0] == '-')
    {
      flush();
      opt.flag = token;

      if (token.size() > 2 && token[1] == '-') // long option.
      {
        if (auto delim = token.find('='); delim != std::string_view::npos)
        {
          opt.flag = token.substr(0, delim);
          opt.value = token.substr(delim + 1);
          flush();
        }
      }
      continue;
    }

    // Bare dashes and flags that already have a value don't take one.
    if (!opt.value.empty() || (!opt.flag.empty() && only_dashes(opt.flag)))
      flush();

    opt.value = token;
    flush();
  }

  flush();
  return options;
}
} // namespace memtftp::detail
