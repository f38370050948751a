/*
 * Copyright (C) 2025 Dan Arrhenius <dan@ultramarin.se>
 *
 * This file is part of rotftp
 *
 * rotftp is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <rotftp/engine.hpp>
#include <chrono>
#include "test-util.hpp"

using namespace rotftp;
using namespace rotftp::test;


class engine_test : public ::testing::Test {
protected:
    engine_test ()
        : client (127, 0, 0, 1, 50000),
          other_client (127, 0, 0, 1, 50001)
    {
    }

    bool send (engine& e, const packet_t& pkt, const ip_addr& from) {
        out = outbound_t ();
        return e.handle_packet (pkt.data(), pkt.size(), from, out);
    }

    bool send (engine& e, const packet_t& pkt) {
        return send (e, pkt, client);
    }

    bool send_ack (engine& e, uint16_t block, const ip_addr& from) {
        return send (e, encode_ack(block), from);
    }

    bool send_ack (engine& e, uint16_t block) {
        return send_ack (e, block, client);
    }

    // Check that the last reply is an error packet, return the error code
    uint16_t error_code () {
        uint16_t code = 0xffff;
        EXPECT_EQ (opcode_of(out.data), op_error);
        EXPECT_EQ (decode_error(out.data.data(), out.data.size(), code, error_msg), errc::ok);
        return code;
    }

    // Check that the last reply is a data packet
    data_pkt_t data () {
        data_pkt_t d;
        EXPECT_TRUE (decode_data_pkt(out.data, d));
        return d;
    }

    memory_file_system fs;
    ip_addr client;
    ip_addr other_client;
    outbound_t out;
    std::string error_msg;
};


TEST_F (engine_test, rrq_without_options_sends_block_one)
{
    auto content = make_data (1024);
    fs.add_file ("file.bin", content);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_EQ (out.addr, client);
    auto d = data ();
    EXPECT_EQ (d.block, 1);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content.begin(), content.begin()+512));
    EXPECT_TRUE (e.has_session(client));
    EXPECT_EQ (e.num_sessions(), 1u);
    EXPECT_EQ (fs.open_files(), 1);
}


TEST_F (engine_test, transfer_with_empty_last_block)
{
    auto content = make_data (1024);
    fs.add_file ("file.bin", content);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_EQ (data().block, 1);

    ASSERT_TRUE (send_ack(e, 1));
    auto d = data ();
    EXPECT_EQ (d.block, 2);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content.begin()+512, content.end()));

    ASSERT_TRUE (send_ack(e, 2));
    d = data ();
    EXPECT_EQ (d.block, 3);
    EXPECT_TRUE (d.payload.empty());

    EXPECT_FALSE (send_ack(e, 3));
    EXPECT_TRUE (out.data.empty());
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, transfer_of_a_single_short_block)
{
    auto content = make_data (500);
    fs.add_file ("small", content);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("small", "octet")));
    auto d = data ();
    EXPECT_EQ (d.block, 1);
    EXPECT_EQ (d.payload, content);

    EXPECT_FALSE (send_ack(e, 1));
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, empty_file)
{
    fs.add_file ("empty", {});
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("empty", "octet")));
    auto d = data ();
    EXPECT_EQ (d.block, 1);
    EXPECT_TRUE (d.payload.empty());
    EXPECT_FALSE (send_ack(e, 1));
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, option_negotiation)
{
    auto content = make_data (3000);
    fs.add_file ("file.bin", content);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"blksize", "1024"}, {"tsize", "0"}})));
    ASSERT_EQ (opcode_of(out.data), op_oack);
    option_list_t options;
    ASSERT_EQ (decode_oack(out.data.data(), out.data.size(), options), errc::ok);
    ASSERT_EQ (options.size(), 2u);
    EXPECT_EQ (options[0], option_t("blksize", "1024"));
    EXPECT_EQ (options[1], option_t("tsize", "3000"));
    ASSERT_NE (e.session(client), nullptr);
    EXPECT_EQ (e.session(client)->state(), tftp_session::st_negotiating);

    ASSERT_TRUE (send_ack(e, 0));
    auto d = data ();
    EXPECT_EQ (d.block, 1);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content.begin(), content.begin()+1024));

    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (data().payload.size(), 1024u);
    ASSERT_TRUE (send_ack(e, 2));
    d = data ();
    EXPECT_EQ (d.block, 3);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content.begin()+2048, content.end()));
    EXPECT_FALSE (send_ack(e, 3));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, tsize_only)
{
    fs.add_file ("file.bin", make_data(777));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"tsize", "0"}})));
    option_list_t options;
    ASSERT_EQ (decode_oack(out.data.data(), out.data.size(), options), errc::ok);
    ASSERT_EQ (options.size(), 1u);
    EXPECT_EQ (options[0], option_t("tsize", "777"));

    ASSERT_TRUE (send_ack(e, 0));
    EXPECT_EQ (data().payload.size(), 512u);
}


TEST_F (engine_test, timeout_is_acknowledged)
{
    fs.add_file ("file.bin", make_data(10));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"timeout", "3"}})));
    option_list_t options;
    ASSERT_EQ (decode_oack(out.data.data(), out.data.size(), options), errc::ok);
    ASSERT_EQ (options.size(), 1u);
    EXPECT_EQ (options[0], option_t("timeout", "3"));
}


TEST_F (engine_test, repeated_options_are_acknowledged)
{
    auto content = make_data (1500);
    fs.add_file ("file.bin", content);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"blksize", "512"},
                                                          {"timeout", "5"},
                                                          {"blksize", "1024"},
                                                          {"interval", "5"}})));
    ASSERT_EQ (opcode_of(out.data), op_oack);
    option_list_t options;
    ASSERT_EQ (decode_oack(out.data.data(), out.data.size(), options), errc::ok);
    ASSERT_EQ (options.size(), 4u);
    EXPECT_EQ (options[0], option_t("blksize", "512"));
    EXPECT_EQ (options[1], option_t("timeout", "5"));
    EXPECT_EQ (options[2], option_t("blksize", "1024"));
    EXPECT_EQ (options[3], option_t("interval", "5"));
    EXPECT_EQ (e.num_sessions(), 1u);

    ASSERT_TRUE (send_ack(e, 0));
    auto d = data ();
    EXPECT_EQ (d.block, 1);
    EXPECT_EQ (d.payload.size(), 1024u);
}


TEST_F (engine_test, negotiation_expects_ack_zero)
{
    fs.add_file ("file.bin", make_data(3000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"blksize", "1024"}})));
    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, unsupported_mode_opens_no_file)
{
    fs.add_file ("file.bin", make_data(100));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "netascii")));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (fs.open_attempts(), 0);
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, wrong_ack_aborts_the_session)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (data().block, 2);

    // Duplicate ACK
    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);

    // A new request from the same client is accepted
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_EQ (data().block, 1);
    EXPECT_TRUE (e.has_session(client));
}


TEST_F (engine_test, unknown_option_aborts_the_request)
{
    fs.add_file ("file.bin", make_data(100));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"blksize", "1024"}, {"multicast", ""}})));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_NE (error_msg.find("multicast"), std::string::npos);
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, invalid_option_value)
{
    fs.add_file ("file.bin", make_data(100));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet", {{"blksize", "large"}})));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_NE (error_msg.find("blksize"), std::string::npos);
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, file_not_found)
{
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("missing", "octet")));
    EXPECT_EQ (error_code(), tftp_err_not_found);
    EXPECT_NE (error_msg.find("missing"), std::string::npos);
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, not_a_regular_file)
{
    fs.add_dir ("pxelinux.cfg");
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("pxelinux.cfg", "octet")));
    EXPECT_EQ (error_code(), tftp_err_not_found);
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, normalized_file_name)
{
    fs.add_file ("boot/kernel", make_data(10));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("\\boot\\kernel", "octet")));
    EXPECT_EQ (fs.last_path(), "boot/kernel");
    EXPECT_EQ (data().block, 1);
}


TEST_F (engine_test, malformed_request)
{
    engine e (fs);
    const uint8_t pkt[] = {0, 1, 'f', 'i', 'l', 'e'};
    ASSERT_TRUE (e.handle_packet(pkt, sizeof(pkt), client, out));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (fs.open_attempts(), 0);
}


TEST_F (engine_test, write_request_is_rejected)
{
    packet_t wrq = encode_rrq ("upload", "octet");
    wrq[1] = op_wrq;
    engine e (fs);

    ASSERT_TRUE (send(e, wrq));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (error_msg, "write request not supported");
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, unexpected_packet_without_session)
{
    engine e (fs);

    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (error_code(), tftp_err_undefined);

    ASSERT_TRUE (send(e, encode_data(1, "x", 1)));
    EXPECT_EQ (error_code(), tftp_err_undefined);

    ASSERT_TRUE (send(e, encode_oack({{"tsize", "1"}})));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (e.num_sessions(), 0u);
}


TEST_F (engine_test, short_packets_are_ignored)
{
    engine e (fs);
    const uint8_t one_byte[] = {0};
    EXPECT_FALSE (e.handle_packet(one_byte, sizeof(one_byte), client, out));
    EXPECT_FALSE (e.handle_packet(one_byte, 0, client, out));
    EXPECT_TRUE (out.data.empty());
}


TEST_F (engine_test, unknown_opcode)
{
    const uint8_t bad[] = {0, 9, 0, 1};
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    // Without a session
    ASSERT_TRUE (e.handle_packet(bad, sizeof(bad), client, out));
    EXPECT_EQ (error_code(), tftp_err_undefined);

    // With a session, the session is aborted
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    ASSERT_TRUE (e.handle_packet(bad, sizeof(bad), client, out));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, client_error_ends_the_session)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_FALSE (send(e, encode_error(0, "transfer cancelled")));
    EXPECT_TRUE (out.data.empty());
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);

    // Never answered, also without a session
    EXPECT_FALSE (send(e, encode_error(3, "disk full")));
}


TEST_F (engine_test, new_request_during_a_session)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, malformed_ack_aborts_the_session)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    auto ack = encode_ack (1);
    ack.push_back (0);
    ASSERT_TRUE (send(e, ack));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
}


TEST_F (engine_test, clients_are_isolated)
{
    auto content_a = make_data (1000);
    auto content_b = make_data (1500);
    fs.add_file ("a", content_a);
    fs.add_file ("b", content_b);
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("a", "octet"), client));
    EXPECT_EQ (out.addr, client);
    ASSERT_TRUE (send(e, encode_rrq("b", "octet", {{"tsize", "0"}}), other_client));
    EXPECT_EQ (out.addr, other_client);
    EXPECT_EQ (opcode_of(out.data), op_oack);
    EXPECT_EQ (e.num_sessions(), 2u);

    ASSERT_TRUE (send_ack(e, 0, other_client));
    EXPECT_EQ (out.addr, other_client);
    EXPECT_EQ (data().block, 1);

    ASSERT_TRUE (send_ack(e, 1, client));
    EXPECT_EQ (out.addr, client);
    auto d = data ();
    EXPECT_EQ (d.block, 2);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content_a.begin()+512, content_a.end()));

    // An ACK from an unknown port doesn't affect the other sessions
    ip_addr stranger (127, 0, 0, 1, 50002);
    ASSERT_TRUE (send_ack(e, 2, stranger));
    EXPECT_EQ (out.addr, stranger);
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (e.num_sessions(), 2u);

    EXPECT_FALSE (send_ack(e, 2, client));
    EXPECT_FALSE (e.has_session(client));
    EXPECT_TRUE (e.has_session(other_client));

    ASSERT_TRUE (send_ack(e, 1, other_client));
    d = data ();
    EXPECT_EQ (d.block, 2);
    EXPECT_EQ (d.payload, std::vector<uint8_t>(content_b.begin()+512, content_b.begin()+1024));
}


TEST_F (engine_test, session_limit)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs, 1);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), client));
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), other_client));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_EQ (error_msg, "Server busy");
    EXPECT_EQ (e.num_sessions(), 1u);
    EXPECT_EQ (fs.open_files(), 1);

    // The first session continues
    ASSERT_TRUE (send_ack(e, 1, client));
    EXPECT_EQ (data().block, 2);
}


TEST_F (engine_test, idle_sessions_expire)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), client));
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), other_client));

    auto now = std::chrono::steady_clock::now ();
    EXPECT_EQ (e.expire_sessions(now, std::chrono::seconds(60)), 0u);
    EXPECT_EQ (e.num_sessions(), 2u);

    EXPECT_EQ (e.expire_sessions(now + std::chrono::seconds(61), std::chrono::seconds(60)), 2u);
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, clear_stops_all_sessions)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), client));
    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet"), other_client));
    e.clear ();
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, read_error_aborts_the_session)
{
    fs.add_file ("file.bin", make_data(2000));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    fs.content("file.bin").resize (700);

    ASSERT_TRUE (send_ack(e, 1));
    EXPECT_EQ (error_code(), tftp_err_undefined);
    EXPECT_FALSE (e.has_session(client));
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, block_number_wraps_around)
{
    // Block size 1 and 65537 bytes gives 65538 blocks,
    // the last one empty and numbered 2 on the wire.
    const size_t file_size = 65537;
    fs.add_file ("big", make_data(file_size));
    engine e (fs);

    ASSERT_TRUE (send(e, encode_rrq("big", "octet", {{"blksize", "1"}})));
    ASSERT_TRUE (send_ack(e, 0));

    uint64_t index = 1;
    while (true) {
        data_pkt_t d;
        ASSERT_TRUE (decode_data_pkt(out.data, d));
        ASSERT_EQ (d.block, (uint16_t)(index & 0xffff));
        if (d.payload.empty())
            break;
        ASSERT_EQ (d.payload.size(), 1u);
        ASSERT_TRUE (send_ack(e, d.block));
        ++index;
    }
    EXPECT_EQ (index, 65538u);
    EXPECT_EQ (e.session(client)->block_index(), 65538u);

    EXPECT_FALSE (send_ack(e, 2));
    EXPECT_EQ (e.num_sessions(), 0u);
    EXPECT_EQ (fs.open_files(), 0);
}


TEST_F (engine_test, packet_dump)
{
    fs.add_file ("file.bin", make_data(100));
    engine e (fs);

    int inbound = 0;
    int outbound = 0;
    size_t last_size = 0;
    e.packet_dump ([&](bool in, const ip_addr& addr, const uint8_t* buf, size_t size){
            EXPECT_EQ (addr, client);
            if (in)
                ++inbound;
            else
                ++outbound;
            last_size = size;
        });

    ASSERT_TRUE (send(e, encode_rrq("file.bin", "octet")));
    EXPECT_EQ (inbound, 1);
    EXPECT_EQ (outbound, 1);
    EXPECT_EQ (last_size, 104u);

    EXPECT_FALSE (send_ack(e, 1));
    EXPECT_EQ (inbound, 2);
    EXPECT_EQ (outbound, 1);
}
