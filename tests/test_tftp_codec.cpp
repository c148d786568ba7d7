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
#include "memtftp/protocol/tftp_codec.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

using namespace memtftp;
using enum messages::opcode_t;
using enum messages::mode_t;
using enum messages::error_t;

static auto bytes(const std::vector<char> &buf) -> std::span<const std::byte>
{
  return std::as_bytes(std::span(buf));
}

static auto packet(std::string_view str) -> std::vector<char>
{
  return {str.begin(), str.end()};
}

TEST(TftpCodecTests, EncodeAck)
{
  EXPECT_EQ(encode_ack(0), packet({"\x00\x04\x00\x00", 4}));
  EXPECT_EQ(encode_ack(1), packet({"\x00\x04\x00\x01", 4}));
  EXPECT_EQ(encode_ack(0x1234), packet({"\x00\x04\x12\x34", 4}));
  EXPECT_EQ(encode_ack(0xFFFF), packet({"\x00\x04\xff\xff", 4}));
}

TEST(TftpCodecTests, DecodeAck)
{
  auto ack = packet({"\x00\x04\x00\x07", 4});
  EXPECT_TRUE(decode_ack(bytes(ack), 7));
  EXPECT_FALSE(decode_ack(bytes(ack), 6));
  EXPECT_FALSE(decode_ack(bytes(ack), 8));
}

TEST(TftpCodecTests, DecodeAckRejectsWrongSize)
{
  auto ack = packet({"\x00\x04\x00\x07\x00", 5});
  EXPECT_FALSE(decode_ack(bytes(ack), 7));

  ack.resize(3);
  EXPECT_FALSE(decode_ack(bytes(ack), 7));

  ack.clear();
  EXPECT_FALSE(decode_ack(bytes(ack), 0));
}

TEST(TftpCodecTests, DecodeAckRejectsOtherOpcodes)
{
  for (auto opc : {RRQ, WRQ, DATA, ERROR})
  {
    auto msg = encode_ack(3);
    msg[1] = static_cast<char>(opc);
    EXPECT_FALSE(decode_ack(bytes(msg), 3));
  }
}

TEST(TftpCodecTests, EncodeData)
{
  auto payload = std::string(500, 'x');
  auto msg = encode_data(payload, 1);

  ASSERT_EQ(msg.size(), 504);
  EXPECT_EQ(msg[0], 0);
  EXPECT_EQ(msg[1], DATA);
  EXPECT_EQ(msg[2], 0);
  EXPECT_EQ(msg[3], 1);
  EXPECT_EQ(std::string(msg.begin() + 4, msg.end()), payload);
}

TEST(TftpCodecTests, EncodeEmptyData)
{
  auto msg = encode_data({}, 3);
  EXPECT_EQ(msg, packet({"\x00\x03\x00\x03", 4}));
}

TEST(TftpCodecTests, DecodeData)
{
  auto payload = std::vector<char>(messages::DATALEN, 'a');
  auto msg = encode_data(payload, 0x0102);

  auto block = decode_data(bytes(msg));
  ASSERT_TRUE(block);
  EXPECT_EQ(block->block_num, 0x0102);
  EXPECT_EQ(block->payload.size(), messages::DATALEN);
  EXPECT_FALSE(block->final);
  EXPECT_EQ(block->payload.data(), bytes(msg).data() + 4);
}

TEST(TftpCodecTests, DecodeShortDataIsFinal)
{
  auto msg = encode_data(std::string(511, 'b'), 2);
  auto block = decode_data(bytes(msg));
  ASSERT_TRUE(block);
  EXPECT_TRUE(block->final);
  EXPECT_EQ(block->payload.size(), 511);

  msg = encode_data({}, 3);
  block = decode_data(bytes(msg));
  ASSERT_TRUE(block);
  EXPECT_TRUE(block->final);
  EXPECT_TRUE(block->payload.empty());
}

TEST(TftpCodecTests, DecodeDataRejectsMalformed)
{
  auto msg = packet({"\x00\x03\x00", 3});
  EXPECT_FALSE(decode_data(bytes(msg)));

  msg = encode_ack(1);
  EXPECT_FALSE(decode_data(bytes(msg)));

  msg = encode_error(NOT_DEFINED, "nope");
  EXPECT_FALSE(decode_data(bytes(msg)));

  msg.clear();
  EXPECT_FALSE(decode_data(bytes(msg)));
}

TEST(TftpCodecTests, EncodeError)
{
  auto msg = encode_error(FILE_NOT_FOUND, "File not found: a.txt");
  auto expected = std::string("\x00\x05\x00\x01"
                              "File not found: a.txt",
                              25);
  expected.push_back('\0');
  EXPECT_EQ(msg, packet(expected));
}

TEST(TftpCodecTests, EncodeErrorEmptyMessage)
{
  auto msg = encode_error(ILLEGAL_OPERATION, "");
  EXPECT_EQ(msg, packet({"\x00\x05\x00\x04\x00", 5}));
}

TEST(TftpCodecTests, WireCodes)
{
  EXPECT_EQ(errors::wire_code(FILE_ALREADY_EXISTS), FILE_ALREADY_EXISTS);
  EXPECT_EQ(errors::wire_code(NO_SUCH_USER), NO_SUCH_USER);
  EXPECT_EQ(errors::wire_code(TIMED_OUT), NOT_DEFINED);
  EXPECT_EQ(errors::wire_code(BAD_PACKET), NOT_DEFINED);
  EXPECT_EQ(errors::wire_code(BAD_BLOCK), NOT_DEFINED);
}

class TftpCodecModeTest
    : public ::testing::TestWithParam<
          std::pair<std::string_view, std::uint8_t>> {};

TEST_P(TftpCodecModeTest, TestToMode)
{
  auto [str, mode] = GetParam();
  ASSERT_EQ(to_mode(str), mode);
}

INSTANTIATE_TEST_SUITE_P(
    TftpCodecTests, TftpCodecModeTest,
    ::testing::Values(std::make_pair("netascii", NETASCII),
                      std::make_pair("NetASCII", NETASCII),
                      std::make_pair("mail", MAIL),
                      std::make_pair("octet", OCTET),
                      std::make_pair("OCTET", OCTET),
                      std::make_pair("", std::uint8_t{0}),
                      std::make_pair("octets", std::uint8_t{0}),
                      std::make_pair("netasciinetascii", std::uint8_t{0}),
                      std::make_pair("unknown", std::uint8_t{0})));

static auto make_request(std::uint16_t opc, std::string_view filename,
                         std::string_view mode) -> std::vector<char>
{
  auto msg = std::vector<char>{0, static_cast<char>(opc)};
  msg.insert(msg.end(), filename.begin(), filename.end());
  msg.push_back('\0');
  msg.insert(msg.end(), mode.begin(), mode.end());
  msg.push_back('\0');
  return msg;
}

TEST(TftpCodecTests, DecodeRequest)
{
  auto msg = make_request(RRQ, "test.txt", "octet");
  auto req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, RRQ);
  EXPECT_EQ(req.filename, "test.txt");
  EXPECT_EQ(req.mode, OCTET);

  msg = make_request(WRQ, "upload.bin", "NETASCII");
  req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, WRQ);
  EXPECT_EQ(req.filename, "upload.bin");
  EXPECT_EQ(req.mode, NETASCII);
}

TEST(TftpCodecTests, DecodeRequestStripsDirectories)
{
  auto msg = make_request(RRQ, "../../etc/passwd", "octet");
  EXPECT_EQ(decode_request(bytes(msg)).filename, "passwd");

  msg = make_request(WRQ, "/srv/tftp/boot.img", "octet");
  EXPECT_EQ(decode_request(bytes(msg)).filename, "boot.img");

  msg = make_request(WRQ, "dir/", "octet");
  EXPECT_TRUE(decode_request(bytes(msg)).filename.empty());
}

TEST(TftpCodecTests, DecodeRequestKeepsOtherOpcodes)
{
  auto msg = make_request(DATA, "test.txt", "octet");
  auto req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, DATA);
  EXPECT_EQ(req.filename, "test.txt");
}

TEST(TftpCodecTests, DecodeRequestUnterminatedFilename)
{
  auto msg = packet({"\x00\x01test.txt", 10});
  auto req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, RRQ);
  EXPECT_TRUE(req.filename.empty());
  EXPECT_EQ(req.mode, 0);
}

TEST(TftpCodecTests, DecodeRequestMissingMode)
{
  auto msg = packet({"\x00\x01test.txt\x00", 11});
  auto req = decode_request(bytes(msg));
  EXPECT_EQ(req.filename, "test.txt");
  EXPECT_EQ(req.mode, 0);

  // An unterminated mode is still read up to the end of the datagram.
  msg = packet({"\x00\x01test.txt\x00octet", 16});
  req = decode_request(bytes(msg));
  EXPECT_EQ(req.filename, "test.txt");
  EXPECT_EQ(req.mode, OCTET);
}

TEST(TftpCodecTests, DecodeRequestTooShort)
{
  auto msg = packet({"\x00", 1});
  auto req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, 0);
  EXPECT_TRUE(req.filename.empty());

  msg.clear();
  req = decode_request(bytes(msg));
  EXPECT_EQ(req.opc, 0);
}

TEST(TftpCodecTests, DataRoundTripAcrossBlockNumbers)
{
  auto payload = std::vector<char>(messages::DATALEN);
  for (std::size_t i = 0; i < payload.size(); ++i)
    payload[i] = static_cast<char>(i);

  for (std::uint16_t block_num : {1, 2, 255, 256, 65535})
  {
    auto msg = encode_data(payload, block_num);
    auto block = decode_data(bytes(msg));
    ASSERT_TRUE(block);
    EXPECT_EQ(block->block_num, block_num);
    ASSERT_EQ(block->payload.size(), payload.size());
    EXPECT_EQ(std::memcmp(block->payload.data(), payload.data(),
                          payload.size()),
              0);
  }
}
// NOLINTEND
