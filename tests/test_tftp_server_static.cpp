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

// NOLINTBEGIN
#ifndef MEMTFTP_SERVER_STATIC_TEST
#define MEMTFTP_SERVER_STATIC_TEST
#include "../src/tftp_server.cpp"

#include <gtest/gtest.h>

#include <array>

using namespace memtftp;
using enum messages::opcode_t;
using enum messages::error_t;

TEST(TftpServerStaticTests, TestToStr)
{
  auto buf = std::array<char, INET6_ADDRSTRLEN + ADDR_BUFLEN>{};
  auto addr_v6 = socket_address<sockaddr_in6>{};
  addr_v6->sin6_family = AF_INET6;
  addr_v6->sin6_addr = in6addr_loopback;
  addr_v6->sin6_port = htons(8080);

  const auto *addr = reinterpret_cast<sockaddr *>(std::ranges::data(addr_v6));

  auto addrstr = to_str(buf, addr);
  EXPECT_EQ(addrstr, "[::1]:8080");

  auto addr_v4 = socket_address<sockaddr_in>{};
  addr_v4->sin_family = AF_INET;
  addr_v4->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr_v4->sin_port = htons(69);

  addr = reinterpret_cast<sockaddr *>(std::ranges::data(addr_v4));

  ASSERT_EQ(addr->sa_family, AF_INET);

  addrstr = to_str(buf, addr);
  EXPECT_EQ(addrstr, "127.0.0.1:69");
}

TEST(TftpServerStaticTests, TestOpstr)
{
  EXPECT_EQ(opstr(RRQ), "RRQ");
  EXPECT_EQ(opstr(WRQ), "WRQ");
  EXPECT_EQ(opstr(DATA), "REQ");
  EXPECT_EQ(opstr(0), "REQ");
}

TEST(TftpServerStaticTests, TestDescribe)
{
  auto state = session::state_t{};
  EXPECT_EQ(describe(ILLEGAL_OPERATION, state), "Illegal operation.");
  EXPECT_EQ(describe(TIMED_OUT, state), "Timed out.");
  EXPECT_EQ(describe(BAD_PACKET, state), "Unable to parse data packet");

  state.errmsg = "File not found: test.txt";
  EXPECT_EQ(describe(FILE_NOT_FOUND, state), "File not found: test.txt");
}

TEST(TftpServerStaticTests, TestStrnlen)
{
  auto str = std::array<char, 8>{'o', 'c', 't', 'e', 't', '\0', 'x', 'x'};
  EXPECT_EQ(memtftp::strnlen(str.data(), str.size()), 5);
  EXPECT_EQ(memtftp::strnlen(str.data(), 3), 3);
}

#undef MEMTFTP_SERVER_STATIC_TEST
#endif
// NOLINTEND
