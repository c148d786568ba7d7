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
 * @file tftp.hpp
 * @brief This file declares TFTP application logic.
 *
 * These functions advance a session's transfer state. None of them touch a
 * socket: each leaves the next packet to transmit in the session buffer and
 * the caller decides when to send it.
 */
#pragma once
#ifndef MEMTFTP_TFTP_HPP
#define MEMTFTP_TFTP_HPP
#include "file_store.hpp"
#include "protocol/tftp_codec.hpp"
#include "protocol/tftp_session.hpp"

#include <map>
/** @namespace For top-level memtftp services. */
namespace memtftp {
/** @brief The TFTP sessions container. */
using sessions_t =
    std::multimap<io::socket::socket_address<sockaddr_in6>, session>;
/** @brief The TFTP sessions iterator. */
using iterator_t = sessions_t::iterator;

/**
 * @brief Processes a request.
 * @details For an RRQ the first DATA block is placed in the session buffer,
 * for a WRQ it is ACK 0.
 * @param req The TFTP request to process.
 * @param siter An iterator pointing to the session.
 * @param store The file store.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_request(const messages::request &req, iterator_t siter,
                    const file_store &store) -> std::uint16_t;

/**
 * @brief Processes a reply received during an RRQ.
 * @details A matching ACK moves on to the next block or completes the
 * transfer. Anything else counts as a failed attempt and leaves the buffer
 * unchanged for retransmission.
 * @param msg The received datagram.
 * @param siter An iterator pointing to the session.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t;

/**
 * @brief Processes a datagram received during a WRQ.
 * @details The final block is handed to the store before it is
 * acknowledged.
 * @param msg The received datagram.
 * @param siter An iterator pointing to the session.
 * @param store The file store.
 * @returns 0 if successful, a non-zero TFTP error otherwise.
 */
auto handle_data(std::span<const std::byte> msg, iterator_t siter,
                 file_store &store) -> std::uint16_t;

/**
 * @brief Processes an expired wait for a reply.
 * @param siter An iterator pointing to the session.
 * @returns 0 if the buffer should be retransmitted, TIMED_OUT once the
 * attempts are exhausted.
 */
auto handle_timeout(iterator_t siter) -> std::uint16_t;
} // namespace memtftp
#endif // MEMTFTP_TFTP_HPP
