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
 * @file file_store.cpp
 * @brief This file implements the in-memory file store.
 */
#include "memtftp/file_store.hpp"

#include <mutex>
namespace memtftp {
auto file_store::init() -> void
{
  auto lock = std::unique_lock{mtx_};
  files_.clear();
}

auto file_store::reset() -> std::size_t
{
  auto lock = std::unique_lock{mtx_};
  auto count = files_.size();
  files_.clear();
  return count;
}

auto file_store::exists(std::string_view name) const -> bool
{
  auto lock = std::shared_lock{mtx_};
  return files_.contains(name);
}

auto file_store::create(std::string name, blob data) -> bool
{
  auto contents = std::make_shared<const blob>(std::move(data));

  auto lock = std::unique_lock{mtx_};
  return files_.try_emplace(std::move(name), std::move(contents)).second;
}

auto file_store::get(std::string_view name) const -> blob_ptr
{
  auto lock = std::shared_lock{mtx_};
  if (auto it = files_.find(name); it != files_.end())
    return it->second;

  return nullptr;
}

auto file_store::size() const -> std::size_t
{
  auto lock = std::shared_lock{mtx_};
  return files_.size();
}
} // namespace memtftp
