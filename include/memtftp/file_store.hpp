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
 * @file file_store.hpp
 * @brief This file declares the in-memory file store.
 */
#pragma once
#ifndef MEMTFTP_FILE_STORE_HPP
#define MEMTFTP_FILE_STORE_HPP
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
/** @brief memtftp related utilities. */
namespace memtftp {
/**
 * @brief A name-keyed store of immutable byte blobs.
 * @details The store is shared by every transfer. Reads take a shared lock,
 * creates take an exclusive lock, and the existence check inside create()
 * happens under that same lock so that a name can only ever be created once.
 * Stored blobs are never modified, so readers can keep using a blob after
 * the lock is released.
 */
class file_store {
public:
  /** @brief The stored file contents. */
  using blob = std::vector<char>;
  /** @brief A shared handle to stored contents. */
  using blob_ptr = std::shared_ptr<const blob>;

  /** @brief Prepares an empty store. */
  auto init() -> void;

  /**
   * @brief Discards every stored file.
   * @returns The number of files discarded.
   */
  auto reset() -> std::size_t;

  /**
   * @brief Checks whether a file exists.
   * @param name The file name.
   * @returns true if name is present.
   */
  [[nodiscard]] auto exists(std::string_view name) const -> bool;

  /**
   * @brief Atomically creates a file.
   * @param name The file name.
   * @param data The file contents.
   * @returns false if name is already present, true otherwise.
   */
  auto create(std::string name, blob data) -> bool;

  /**
   * @brief Gets the contents of a file.
   * @param name The file name.
   * @returns The contents, or nullptr if name is not present.
   */
  [[nodiscard]] auto get(std::string_view name) const -> blob_ptr;

  /** @brief The number of stored files. */
  [[nodiscard]] auto size() const -> std::size_t;

private:
  /** @brief Guards files_. */
  mutable std::shared_mutex mtx_;
  /** @brief The stored files. */
  std::map<std::string, blob_ptr, std::less<>> files_;
};
} // namespace memtftp
#endif // MEMTFTP_FILE_STORE_HPP
