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
 * @file tftp_session.hpp
 * @brief This file declares a TFTP session handle.
 */
#pragma once
#ifndef MEMTFTP_SESSION_HPP
#define MEMTFTP_SESSION_HPP
#include "memtftp/file_store.hpp"

#include <net/timers/timers.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
/** @brief memtftp related utilities. */
namespace memtftp {

/** @brief A TFTP session holds all of the state of one transfer. */
struct session {
  /** @brief The session clock. */
  using clock = std::chrono::steady_clock;
  /** @brief The session timestamp. */
  using timestamp = clock::time_point;
  /** @brief the session duration. */
  using duration = std::chrono::milliseconds;
  /** @brief The session timer. */
  using timer_id = net::timers::timer_id;
  /** @brief The invalid timer value. */
  static constexpr auto INVALID_TIMER = net::timers::INVALID_TIMER;
  /** @brief The native socket type. */
  using socket_type = io::socket::native_socket_type;
  /** @brief The invalid socket constant. */
  static constexpr auto INVALID_SOCKET = io::socket::INVALID_SOCKET;
  /** @brief How long to wait for a reply before retransmitting. */
  static constexpr auto TIMEOUT = std::chrono::milliseconds(5000);
  /** @brief Transmissions of one packet before the transfer is abandoned. */
  static constexpr std::uint8_t MAX_ATTEMPTS = 5;

  /**
   * @brief Retry bookkeeping for the packet currently awaiting a reply.
   * @details attempts counts transmissions of the current packet, so it is
   * 1 right after the first send. It is reset whenever the transfer moves on
   * to a new block.
   */
  struct retry_t {
    /** @brief Transmissions of the current packet so far. */
    std::uint8_t attempts{1};
    /** @brief Upper bound on attempts. */
    std::uint8_t limit{MAX_ATTEMPTS};
    /** @brief When the current wait for a reply expires. */
    timestamp deadline{};
  };

  /** @brief The session state. */
  struct state_t {
    /** @brief The requested file name. */
    std::string target;
    /** @brief The last packet sent, retransmissions resend it verbatim. */
    std::vector<char> buffer;
    /** @brief The file being read (RRQ). */
    file_store::blob_ptr file;
    /** @brief The bytes received so far (WRQ). */
    file_store::blob received;
    /** @brief Description of the error that ended the session. */
    std::string errmsg;
    /** @brief File offset of the block in buffer (RRQ). */
    std::size_t offset = 0;
    /** @brief Payload bytes delivered and acknowledged so far. */
    std::size_t transferred = 0;
    /** @brief Retry bookkeeping. */
    retry_t retry;
    /** @brief A timer id associated to the TFTP session. */
    timer_id timer{INVALID_TIMER};
    /** @brief The local socket that the session is keyed on. */
    socket_type socket{INVALID_SOCKET};
    /** @brief The current protocol block number. */
    std::uint16_t block_num = 0;
    /** @brief The file operation. */
    std::uint16_t opc = 0;
    /** @brief The requested mode. */
    std::uint8_t mode = 0;
    /** @brief Set when the block in buffer is the last one (RRQ). */
    bool final = false;
    /** @brief Set once the transfer has finished successfully. */
    bool complete = false;
  };

  /** @brief The session state. */
  state_t state;
};

} // namespace memtftp
#endif // MEMTFTP_SESSION_HPP
