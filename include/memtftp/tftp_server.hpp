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
 * @file tftp_server.hpp
 * @brief This file declares the TFTP server.
 */
#pragma once
#ifndef MEMTFTP_SERVER_HPP
#define MEMTFTP_SERVER_HPP
#include "tftp.hpp"

#include <net/cppnet.hpp>

#include <memory>
#include <utility>
/** @namespace For top-level memtftp services. */
namespace memtftp {
/** @brief TFTP max buffer allocation. */
static constexpr auto BUFSIZE = messages::DATAMSG_MAXLEN;
/** @brief The service type to use. */
template <typename UDPStreamHandler>
using udp_base = net::service::async_udp_service<UDPStreamHandler, BUFSIZE>;

/**
 * @brief A TFTP server.
 * @details Requests arrive on the bound service socket. Every request gets
 * its own session and its own socket, so each transfer talks to its peer
 * from a fresh ephemeral port. Sessions run on the service's event loop and
 * only wait on their own timers.
 */
class server : public udp_base<server> {
public:
  /** @brief The base class. */
  using Base = udp_base<server>;
  /** @brief The socket message type. */
  using socket_message = io::socket::socket_message<sockaddr_in6>;

  /** @brief Per-server transfer tunables. */
  struct options {
    /** @brief How long to wait for a reply before retransmitting. */
    session::duration timeout{session::TIMEOUT};
    /** @brief Transmissions of one packet before giving up. */
    std::uint8_t max_attempts{session::MAX_ATTEMPTS};
  };

  /**
   * @brief Constructs a TFTP server on the socket address.
   * @tparam T The type of the socket_address.
   * @param address The local IP address to bind to.
   * @param store The file store shared by all transfers.
   * @param opts The transfer tunables.
   */
  template <typename T>
  server(socket_address<T> address, std::shared_ptr<file_store> store,
         options opts = {}) noexcept
      : Base(address), store_(std::move(store)), options_(opts)
  {}

  /**
   * @brief Demultiplexes a datagram to its session.
   * @details A datagram that doesn't belong to a running session starts a
   * new one on a new socket.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   */
  auto operator()(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf) -> void;

  /**
   * @brief Routes a datagram to the handler for the session's state.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The bytes that were read from the socket.
   * @param siter An iterator pointing to the session.
   */
  auto service(async_context &ctx, const socket_dialog &socket,
               const std::shared_ptr<read_context> &rctx,
               std::span<const std::byte> buf, iterator_t siter) -> void;

private:
  /** @brief The TFTP sessions. */
  sessions_t sessions_;
  /** @brief The file store. */
  std::shared_ptr<file_store> store_;
  /** @brief The transfer tunables. */
  options options_;

  // Application Logic.
  /**
   * @brief Sends an error notice to client and closes the connection.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param siter An iterator pointing to the session.
   * @param error The TFTP error code to send.
   */
  auto error(async_context &ctx, const socket_dialog &socket, iterator_t siter,
             std::uint16_t error) -> void;

  /**
   * @brief Services a read or write request.
   * @param ctx The asynchronous context of the message.
   * @param socket The session socket.
   * @param rctx The read context for the session socket.
   * @param buf The data buffer containing the request.
   * @param siter An iterator pointing to the session.
   */
  auto request(async_context &ctx, const socket_dialog &socket,
               const std::shared_ptr<read_context> &rctx,
               std::span<const std::byte> buf, iterator_t siter) -> void;

  /**
   * @brief Services a reply during a read transfer.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The received datagram.
   * @param siter An iterator pointing to the session.
   */
  auto ack(async_context &ctx, const socket_dialog &socket,
           const std::shared_ptr<read_context> &rctx,
           std::span<const std::byte> buf, iterator_t siter) -> void;

  /**
   * @brief Services a datagram during a write transfer.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param rctx The read context that manages the read buffer lifetime.
   * @param buf The received datagram.
   * @param siter An iterator pointing to the session.
   */
  auto data(async_context &ctx, const socket_dialog &socket,
            const std::shared_ptr<read_context> &rctx,
            std::span<const std::byte> buf, iterator_t siter) -> void;

  /**
   * @brief Handles an expired wait for a reply.
   * @param ctx The asynchronous context of the session.
   * @param socket The session socket.
   * @param siter An iterator pointing to the session.
   */
  auto timeout(async_context &ctx, const socket_dialog &socket,
               iterator_t siter) -> void;

  /**
   * @brief Sends the session buffer and restarts the wait for a reply.
   * @param ctx The asynchronous context of the session.
   * @param socket The session socket.
   * @param siter An iterator pointing to the session.
   */
  auto transmit(async_context &ctx, const socket_dialog &socket,
                iterator_t siter) -> void;

  /**
   * @brief Cleans-up the session from the server.
   * @param ctx The asynchronous context of the message.
   * @param socket The socket that the message was read from.
   * @param siter An iterator pointing to the session to clean up.
   */
  auto cleanup(async_context &ctx, const socket_dialog &socket,
               iterator_t siter) -> void;

  /**
   * @brief Sends a packet to the session peer.
   * @details The packet is owned by the send operation until it completes.
   * @param ctx The asynchronous context.
   * @param socket The socket to send on.
   * @param siter An iterator pointing to the session.
   * @param msg The packet.
   */
  static auto send(async_context &ctx, const socket_dialog &socket,
                   iterator_t siter, std::vector<char> msg) -> void;
};
} // namespace memtftp
#endif // MEMTFTP_SERVER_HPP
