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
 * @file tftp.cpp
 * @brief This file defines the TFTP application logic.
 */
#include "memtftp/tftp.hpp"

#include <algorithm>
#include <format>
namespace memtftp {
/**
 * @brief Prepares the DATA block that starts at the session offset.
 * @details The block is sliced straight out of the stored file. When fewer
 * than DATALEN bytes remain the block is final, which includes the empty
 * block that follows a file whose size is a multiple of DATALEN. The file
 * offset is tracked separately from the block number because block numbers
 * wrap.
 * @param state The session state.
 */
static inline auto next_block(session::state_t &state) -> void
{
  const auto &file = *state.file;
  const auto start = std::min(state.offset, file.size());
  const auto len = std::min(file.size() - start, messages::DATALEN);

  state.block_num += 1; // block_num wraps on overflow.
  state.final = len < messages::DATALEN;
  state.buffer =
      encode_data(std::span(file).subspan(start, len), state.block_num);
  state.retry.attempts = 1;
}

/**
 * @brief Records a failed attempt to get a reply.
 * @param state The session state.
 * @returns 0 if another attempt is allowed, TIMED_OUT otherwise.
 */
static inline auto failed_attempt(session::state_t &state) -> std::uint16_t
{
  using enum messages::opcode_t;

  auto &retry = state.retry;
  const auto limit = retry.limit;
  if (retry.attempts < limit)
  {
    ++retry.attempts;
    return 0;
  }

  if (state.opc == RRQ)
  {
    state.errmsg =
        std::format("Failed to get ACK for data block {} after {} attempts",
                    state.block_num, static_cast<int>(limit));
  }
  else
  {
    state.errmsg =
        std::format("Failed to get data block #{} after {} attempts",
                    static_cast<std::uint16_t>(state.block_num + 1),
                    static_cast<int>(limit));
  }
  return messages::TIMED_OUT;
}

auto handle_request(const messages::request &req, iterator_t siter,
                    const file_store &store) -> std::uint16_t
{
  using enum messages::opcode_t;

  if (req.opc != RRQ && req.opc != WRQ)
    return messages::ILLEGAL_OPERATION;

  auto &[key, session] = *siter;
  auto &state = session.state;

  if (req.filename.empty())
  {
    state.errmsg = "Missing file name.";
    return messages::ILLEGAL_OPERATION;
  }

  state.opc = req.opc;
  state.target = req.filename;
  state.mode = req.mode;
  state.block_num = 0;
  state.transferred = 0;

  if (req.opc == RRQ)
  {
    state.file = store.get(state.target);
    if (!state.file)
    {
      state.errmsg = std::format("File not found: {}", state.target);
      return messages::FILE_NOT_FOUND;
    }

    state.offset = 0;
    next_block(state);
    return 0;
  }

  if (store.exists(state.target))
  {
    state.errmsg = std::format("File already exists: {}", state.target);
    return messages::FILE_ALREADY_EXISTS;
  }

  state.received.clear();
  state.buffer = encode_ack(state.block_num);
  state.retry.attempts = 1;
  return 0;
}

auto handle_ack(std::span<const std::byte> msg,
                iterator_t siter) -> std::uint16_t
{
  using enum messages::opcode_t;

  auto &[key, session] = *siter;
  auto &state = session.state;

  if (state.opc != RRQ)
    return messages::UNKNOWN_TID;

  // Timeouts, malformed packets and stale ACKs are all retried.
  if (!decode_ack(msg, state.block_num))
    return failed_attempt(state);

  state.transferred += state.buffer.size() - sizeof(messages::data);

  if (state.final)
  {
    state.complete = true;
    return 0;
  }

  state.offset += messages::DATALEN;
  next_block(state);
  return 0;
}

auto handle_data(std::span<const std::byte> msg, iterator_t siter,
                 file_store &store) -> std::uint16_t
{
  using enum messages::opcode_t;

  auto &[key, session] = *siter;
  auto &state = session.state;

  if (state.opc != WRQ)
    return messages::UNKNOWN_TID;

  auto block = decode_data(msg);
  if (!block)
  {
    state.errmsg = errors::errstr(messages::BAD_PACKET);
    return messages::BAD_PACKET;
  }

  // Wraps block_num around
  auto next = static_cast<std::uint16_t>(state.block_num + 1);
  if (block->block_num != next)
  {
    state.errmsg = std::format("Expected block #{}, but got #{} instead", next,
                               block->block_num);
    return messages::BAD_BLOCK;
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const auto *payload = reinterpret_cast<const char *>(block->payload.data());
  state.received.insert(state.received.end(), payload,
                        payload + block->payload.size());
  state.transferred += block->payload.size();
  state.block_num = next;
  state.retry.attempts = 1;

  if (!block->final)
  {
    state.buffer = encode_ack(state.block_num);
    return 0;
  }

  if (!store.create(state.target, std::move(state.received)))
  {
    state.received = {};
    state.errmsg = std::format("File already exists: {}", state.target);
    return messages::FILE_ALREADY_EXISTS;
  }

  state.received = {};
  state.buffer = encode_ack(state.block_num);
  state.complete = true;
  return 0;
}

auto handle_timeout(iterator_t siter) -> std::uint16_t
{
  auto &[key, session] = *siter;
  return failed_attempt(session.state);
}
} // namespace memtftp
