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
 * @file tftp_server.cpp
 * @brief This file defines the TFTP server.
 */
#include "memtftp/tftp_server.hpp"

#include <net/timers/timers.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
namespace memtftp {
/** @brief Additional buffer length for <PORT>,[],: and null.  */
static constexpr auto ADDR_BUFLEN = 9UL;
/** @brief Socket address type. */
template <typename T> using socket_address = ::io::socket::socket_address<T>;

/** @brief Bounds checked implementation of strlen. */
[[nodiscard]] static constexpr auto
strnlen(const char *str, std::size_t maxlen) noexcept -> std::size_t
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto *found = std::find(str, str + maxlen, '\0');
  return found - str;
}

/** @brief Converts the socket address to a string inside buf. */
[[nodiscard]] static inline auto
to_str(std::span<char> buf,
       socket_address<sockaddr_in6> addr) noexcept -> std::string_view
{
  assert(buf.size() >= INET6_ADDRSTRLEN + ADDR_BUFLEN &&
         "Buffer must be large enough to print an IPv6 address and a port "
         "number.");

  using namespace io::socket;
  using std::to_chars;

  std::memset(buf.data(), 0, buf.size());
  unsigned short port = 0;
  std::size_t len = 0;

  if (addr->sin6_family == AF_INET)
  {
    const auto *addr_v4 =
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(addr));
    inet_ntop(addr_v4->sin_family, &addr_v4->sin_addr, buf.data(), buf.size());
    port = ntohs(addr_v4->sin_port);
    len = strnlen(buf.data(), buf.size());
  }
  else
  {
    buf[0] = '[';
    inet_ntop(addr->sin6_family, &addr->sin6_addr, buf.data() + 1,
              buf.size() - 1);
    port = ntohs(addr->sin6_port);
    len = strnlen(buf.data(), buf.size());
    buf[len++] = ']';
  }

  buf[len++] = ':';
  to_chars(buf.data() + len, buf.data() + buf.size(), port);

  return {buf.data()};
}

/** @brief The log prefix of a transfer. */
[[nodiscard]] static constexpr auto
opstr(std::uint16_t opc) noexcept -> std::string_view
{
  using enum messages::opcode_t;
  switch (opc)
  {
    case RRQ:
      return "RRQ";

    case WRQ:
      return "WRQ";

    default:
      return "REQ";
  }
}

/** @brief The text that goes with an error ending the session. */
[[nodiscard]] static inline auto
describe(std::uint16_t error,
         const session::state_t &state) noexcept -> std::string_view
{
  if (state.errmsg.empty())
    return errors::errstr(error);

  return state.errmsg;
}

#ifndef MEMTFTP_SERVER_STATIC_TEST
auto server::error(async_context &ctx, const socket_dialog &socket,
                   iterator_t siter, std::uint16_t error) -> void
{
  auto &[key, session] = *siter;

  send(ctx, socket, siter,
       encode_error(errors::wire_code(error), describe(error, session.state)));

  cleanup(ctx, socket, siter);
}

auto server::request(async_context &ctx, const socket_dialog &socket,
                     const std::shared_ptr<read_context> &rctx,
                     std::span<const std::byte> buf, iterator_t siter) -> void
{
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto &state = session.state;
  auto addrstr = to_str(addrbuf, key);

  auto req = decode_request(buf);
  auto tag = opstr(req.opc);
  spdlog::info("{}:{}:New request for {}.", tag, addrstr, req.filename);
  if (!req.mode)
    spdlog::debug("{}:{}:Unrecognized mode, sending octets.", tag, addrstr);

  state.retry.limit = options_.max_attempts;
  auto err = handle_request(req, siter, *store_);
  if (err)
  {
    spdlog::error("{}:{}:{}", tag, addrstr, describe(err, state));
    return error(ctx, socket, siter, err);
  }

  // Bind the TFTP session to this socket.
  state.socket = static_cast<session::socket_type>(*socket.socket);

  transmit(ctx, socket, siter);
  reader(ctx, socket, rctx);
}

auto server::ack(async_context &ctx, const socket_dialog &socket,
                 const std::shared_ptr<read_context> &rctx,
                 std::span<const std::byte> buf, iterator_t siter) -> void
{
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto &state = session.state;
  auto addrstr = to_str(addrbuf, key);

  const auto prev_block = state.block_num;
  auto err = handle_ack(buf, siter);
  if (err)
  {
    spdlog::error("RRQ:{}:{}", addrstr, describe(err, state));
    return error(ctx, socket, siter, err);
  }

  if (state.complete)
  {
    spdlog::info("RRQ:{}:Completed {}, {} bytes.", addrstr, state.target,
                 state.transferred);
    return cleanup(ctx, socket, siter);
  }

  if (state.block_num == prev_block)
  {
    spdlog::debug("RRQ:{}:Unexpected reply, resending block {}.", addrstr,
                  state.block_num);
  }

  transmit(ctx, socket, siter);
  reader(ctx, socket, rctx);
}

auto server::data(async_context &ctx, const socket_dialog &socket,
                  const std::shared_ptr<read_context> &rctx,
                  std::span<const std::byte> buf, iterator_t siter) -> void
{
  using enum messages::error_t;
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto &state = session.state;
  auto addrstr = to_str(addrbuf, key);

  // A datagram larger than a full DATA packet is malformed.
  if (rctx->msg.flags & MSG_TRUNC)
  {
    spdlog::error("WRQ:{}:{}", addrstr, errors::errstr(BAD_PACKET));
    return error(ctx, socket, siter, BAD_PACKET);
  }

  auto err = handle_data(buf, siter, *store_);
  if (err)
  {
    spdlog::error("WRQ:{}:{}", addrstr, describe(err, state));
    return error(ctx, socket, siter, err);
  }

  if (state.complete)
  {
    send(ctx, socket, siter, state.buffer);
    spdlog::info("WRQ:{}:Completed {}, {} bytes.", addrstr, state.target,
                 state.transferred);
    return cleanup(ctx, socket, siter);
  }

  transmit(ctx, socket, siter);
  reader(ctx, socket, rctx);
}

auto server::timeout(async_context &ctx, const socket_dialog &socket,
                     iterator_t siter) -> void
{
  auto addrbuf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};

  auto &[key, session] = *siter;
  auto &state = session.state;
  auto addrstr = to_str(addrbuf, key);

  auto err = handle_timeout(siter);
  if (err)
  {
    spdlog::error("{}:{}:{}", opstr(state.opc), addrstr, describe(err, state));
    return error(ctx, socket, siter, err);
  }

  spdlog::debug("{}:{}:Timed out, attempt {} of {}.", opstr(state.opc),
                addrstr, static_cast<int>(state.retry.attempts),
                static_cast<int>(state.retry.limit));

  send(ctx, socket, siter, state.buffer);
  state.retry.deadline = session::clock::now() + options_.timeout;
}

auto server::transmit(async_context &ctx, const socket_dialog &socket,
                      iterator_t siter) -> void
{
  auto &[key, session] = *siter;
  auto &state = session.state;

  send(ctx, socket, siter, state.buffer);

  state.retry.deadline = session::clock::now() + options_.timeout;
  state.timer = ctx.timers.remove(state.timer);
  state.timer = ctx.timers.add(
      options_.timeout,
      [&, siter, socket](auto timer_id) { timeout(ctx, socket, siter); },
      options_.timeout);
}

auto server::send(async_context &ctx, const socket_dialog &socket,
                  iterator_t siter, std::vector<char> msg) -> void
{
  using namespace stdexec;
  auto &[key, session] = *siter;

  auto buf = std::make_shared<std::vector<char>>(std::move(msg));
  sender auto sendmsg =
      io::sendmsg(socket, socket_message{.address = {key}, .buffers = *buf},
                  0) |
      then([buf](auto &&) {}) | upon_error([buf](auto &&) {});

  ctx.scope.spawn(std::move(sendmsg));
}

auto server::cleanup(async_context &ctx, const socket_dialog &socket,
                     iterator_t siter) -> void
{
  auto &[key, session] = *siter;
  auto &state = session.state;

  // Delete any associated timers.
  state.timer = ctx.timers.remove(state.timer);

  // Release the file contents.
  state.file.reset();
  state.received = {};

  // Shutdown the read-side of the socket.
  // This removes the socket from the underlying event-loop if
  // we have reached here due to a timeout.
  io::shutdown(socket, SHUT_RD);

  // Cleanup the rest of the session.
  sessions_.erase(siter);
}

auto server::service(async_context &ctx, const socket_dialog &socket,
                     const std::shared_ptr<read_context> &rctx,
                     std::span<const std::byte> buf, iterator_t siter) -> void
{
  using enum messages::opcode_t;

  auto &[key, session] = *siter;
  switch (session.state.opc)
  {
    case RRQ:
      return ack(ctx, socket, rctx, buf, siter);

    case WRQ:
      return data(ctx, socket, rctx, buf, siter);

    default:
      return request(ctx, socket, rctx, buf, siter);
  }
}

auto server::operator()(async_context &ctx, const socket_dialog &socket,
                        const std::shared_ptr<read_context> &rctx,
                        std::span<const std::byte> buf) -> void
{
  using namespace io::socket;
  if (!rctx)
    return;

  auto address = *rctx->msg.address;
  if (address->sin6_family == AF_INET)
  {
    address = socket_address(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<sockaddr_in *>(std::ranges::data(address)));
  }

  auto [siter, last] = sessions_.equal_range(address);
  for (; siter != last; ++siter)
  {
    auto &[key, session] = *siter;
    if (session.state.socket == socket)
      return service(ctx, socket, rctx, buf, siter);
  }

  // A new transfer gets its own socket on an ephemeral port.
  siter = sessions_.emplace(address, session());
  service(ctx, ctx.poller.emplace(address->sin6_family, SOCK_DGRAM, 0),
          std::make_shared<read_context>(), buf, siter);
  reader(ctx, socket, rctx);
}
#endif // MEMTFTP_SERVER_STATIC_TEST
} // namespace memtftp
