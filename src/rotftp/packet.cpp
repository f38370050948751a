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
#include <rotftp/packet.hpp>
#include <cstring>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static inline uint16_t get_u16 (const uint8_t* buf)
    {
        return (uint16_t) ((buf[0] << 8) | buf[1]);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static inline void put_u16 (packet_t& pkt, uint16_t value)
    {
        pkt.push_back ((uint8_t) (value >> 8));
        pkt.push_back ((uint8_t) (value & 0xff));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static inline void put_str (packet_t& pkt, const std::string& str)
    {
        pkt.insert (pkt.end(), str.begin(), str.end());
        pkt.push_back ('\0');
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* opcode_to_string (uint16_t opcode)
    {
        switch (opcode) {
        case op_rrq:
            return "RRQ";
        case op_wrq:
            return "WRQ";
        case op_data:
            return "DATA";
        case op_ack:
            return "ACK";
        case op_error:
            return "ERROR";
        case op_oack:
            return "OACK";
        default:
            return "n/a";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc decode_opcode (const uint8_t* buf, size_t size, opcode_t& op)
    {
        if (size < sizeof(uint16_t))
            return errc::malformed_packet;

        auto code = get_u16 (buf);
        if (code < op_rrq || code > op_oack)
            return errc::malformed_packet;

        op = static_cast<opcode_t> (code);
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc decode_ack (const uint8_t* buf, size_t size, uint16_t& block)
    {
        if (size != tftp_header_size || get_u16(buf) != op_ack)
            return errc::malformed_packet;
        block = get_u16 (buf + 2);
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc decode_data (const uint8_t* buf, size_t size,
                      uint16_t& block,
                      const uint8_t*& payload,
                      size_t& payload_size)
    {
        if (size < tftp_header_size || get_u16(buf) != op_data)
            return errc::malformed_packet;
        block = get_u16 (buf + 2);
        payload = buf + tftp_header_size;
        payload_size = size - tftp_header_size;
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc decode_error (const uint8_t* buf, size_t size,
                       uint16_t& code,
                       std::string& message)
    {
        if (size < tftp_header_size || get_u16(buf) != op_error)
            return errc::malformed_packet;
        code = get_u16 (buf + 2);

        const char* msg = (const char*) (buf + tftp_header_size);
        size_t max_len = size - tftp_header_size;
        message.assign (msg, strnlen(msg, max_len));
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc decode_oack (const uint8_t* buf, size_t size, option_list_t& options)
    {
        if (size < sizeof(uint16_t) || get_u16(buf) != op_oack)
            return errc::malformed_packet;

        options.clear ();
        const char* pos = (const char*) (buf + sizeof(uint16_t));
        const char* end = (const char*) (buf + size);
        if (pos < end && end[-1] != '\0')
            return errc::malformed_packet;

        while (pos < end) {
            std::string name (pos);
            pos += name.size() + 1;
            if (pos >= end)
                return errc::malformed_packet; // Name without a value
            std::string value (pos);
            pos += value.size() + 1;
            options.emplace_back (name, value);
        }
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet_t encode_error (uint16_t code, const std::string& message)
    {
        packet_t pkt;
        pkt.reserve (tftp_header_size + message.size() + 1);
        put_u16 (pkt, op_error);
        put_u16 (pkt, code);
        put_str (pkt, message);
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet_t encode_data (size_t block_num, const void* payload, size_t size)
    {
        packet_t pkt;
        pkt.reserve (tftp_header_size + size);
        put_u16 (pkt, op_data);
        put_u16 (pkt, (uint16_t) (block_num & 0xffff));
        if (size) {
            auto* data = (const uint8_t*) payload;
            pkt.insert (pkt.end(), data, data+size);
        }
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet_t encode_ack (uint16_t block)
    {
        packet_t pkt;
        pkt.reserve (tftp_header_size);
        put_u16 (pkt, op_ack);
        put_u16 (pkt, block);
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet_t encode_oack (const option_list_t& options)
    {
        packet_t pkt;
        put_u16 (pkt, op_oack);
        for (auto& opt : options) {
            put_str (pkt, opt.first);
            put_str (pkt, opt.second);
        }
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    packet_t encode_rrq (const std::string& filename,
                         const std::string& mode,
                         const option_list_t& options)
    {
        packet_t pkt;
        put_u16 (pkt, op_rrq);
        put_str (pkt, filename);
        put_str (pkt, mode);
        for (auto& opt : options) {
            put_str (pkt, opt.first);
            put_str (pkt, opt.second);
        }
        return pkt;
    }


}
