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
#ifndef ROTFTP_HEXDUMP_HPP
#define ROTFTP_HEXDUMP_HPP

#include <rotftp/ip_addr.hpp>
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * Format data as rows of hex bytes.
     * Each row holds the offset, the hex bytes, and the bytes
     * as text with non-printable characters shown as '?'.
     * @param data The data to format.
     * @param size Number of bytes.
     * @param bytes_per_row Number of bytes on each row.
     * @return One string per row, or a single row
     *         <code>&lt;empty packet&gt;</code> if
     *         <code>size</code> is zero.
     */
    std::vector<std::string> hexdump (const uint8_t* data,
                                      size_t size,
                                      size_t bytes_per_row=16);

    /**
     * Log a datagram as a hex dump with priority LOG_DEBUG.
     * Suitable as a packet dump callback for class engine.
     */
    void log_packet_dump (bool inbound,
                          const ip_addr& addr,
                          const uint8_t* data,
                          size_t size);

}


#endif
