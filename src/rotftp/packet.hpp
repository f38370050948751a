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
#ifndef ROTFTP_PACKET_HPP
#define ROTFTP_PACKET_HPP

#include <rotftp/errc.hpp>
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    static constexpr size_t   tftp_default_block_size = 512;
    static constexpr size_t   tftp_max_block_size     = 65464;
    static constexpr uint16_t tftp_default_port       = 69;
    static constexpr size_t   tftp_header_size        = sizeof(uint16_t) + sizeof(uint16_t);
    static constexpr size_t   tftp_max_packet_size    = 65536;


    enum opcode_t : uint16_t {
        op_rrq   = 1, /**< Read request. */
        op_wrq   = 2, /**< Write request. */
        op_data  = 3, /**< Data block. */
        op_ack   = 4, /**< Acknowledgment. */
        op_error = 5, /**< Error. */
        op_oack  = 6  /**< Option acknowledgment. */
    };


    /**
     * A raw TFTP packet as sent on, or received from, the wire.
     */
    using packet_t = std::vector<uint8_t>;

    /**
     * A TFTP option, name and value.
     */
    using option_t = std::pair<std::string, std::string>;

    /**
     * TFTP options in the order they appear in a packet.
     */
    using option_list_t = std::vector<option_t>;


    /**
     * Return the name of an opcode, "RRQ", "DATA", etc.
     */
    const char* opcode_to_string (uint16_t opcode);


    /**
     * Decode the opcode of a packet.
     * @param buf Packet data.
     * @param size Packet size.
     * @param op Set to the opcode on success.
     * @return errc::ok, or errc::malformed_packet if the packet is
     *         shorter than two bytes or the opcode is unknown.
     */
    errc decode_opcode (const uint8_t* buf, size_t size, opcode_t& op);

    /**
     * Decode the block number of an ACK packet.
     * The packet must be exactly four bytes with opcode op_ack.
     */
    errc decode_ack (const uint8_t* buf, size_t size, uint16_t& block);

    /**
     * Decode a DATA packet.
     * On success, <code>payload</code> points into <code>buf</code>.
     */
    errc decode_data (const uint8_t* buf, size_t size,
                      uint16_t& block,
                      const uint8_t*& payload,
                      size_t& payload_size);

    /**
     * Decode an ERROR packet.
     * A message without a terminating null character runs
     * to the end of the packet.
     */
    errc decode_error (const uint8_t* buf, size_t size,
                       uint16_t& code,
                       std::string& message);

    /**
     * Decode an OACK packet.
     */
    errc decode_oack (const uint8_t* buf, size_t size, option_list_t& options);


    /**
     * Create an ERROR packet.
     * @param code A TFTP error code.
     * @param message Error message, sent null-terminated.
     */
    packet_t encode_error (uint16_t code, const std::string& message);

    /**
     * Create a DATA packet.
     * @param block_num Block number, only the lower 16 bits are sent.
     * @param payload Data to send.
     * @param size Number of bytes in <code>payload</code>.
     */
    packet_t encode_data (size_t block_num, const void* payload, size_t size);

    /**
     * Create an ACK packet.
     */
    packet_t encode_ack (uint16_t block);

    /**
     * Create an OACK packet.
     */
    packet_t encode_oack (const option_list_t& options);

    /**
     * Create a read request.
     */
    packet_t encode_rrq (const std::string& filename,
                         const std::string& mode,
                         const option_list_t& options = option_list_t());

}


#endif
