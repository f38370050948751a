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
#include <rotftp/hexdump.hpp>
#include <rotftp/log.hpp>
#include <sstream>
#include <iomanip>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::vector<std::string> hexdump (const uint8_t* data,
                                      size_t size,
                                      size_t bytes_per_row)
    {
        std::vector<std::string> rows;

        if (size == 0) {
            rows.emplace_back ("<empty packet>");
            return rows;
        }
        if (bytes_per_row == 0)
            bytes_per_row = 16;

        for (size_t offset=0; offset<size; offset+=bytes_per_row) {
            std::stringstream ss;
            std::string text;

            ss << std::hex << std::setfill('0') << std::setw(4) << offset << ':';
            for (size_t i=0; i<bytes_per_row; ++i) {
                if (offset+i < size) {
                    uint8_t ch = data[offset+i];
                    ss << ' ' << std::setw(2) << (unsigned)ch;
                    text.push_back ((ch < 32 || ch > 126) ? '?' : (char)ch);
                }else{
                    ss << "   ";
                }
            }
            ss << "  " << text;
            rows.emplace_back (ss.str());
        }

        return rows;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void log_packet_dump (bool inbound,
                          const ip_addr& addr,
                          const uint8_t* data,
                          size_t size)
    {
        if (log::priority() < LOG_DEBUG)
            return;

        log::debug ("%s %s, %u bytes",
                    (inbound ? "Received from" : "Sending to"),
                    addr.to_string(true).c_str(),
                    (unsigned)size);
        for (auto& row : hexdump(data, size))
            log::debug ("  %s", row.c_str());
    }


}
