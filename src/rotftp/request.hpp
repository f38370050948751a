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
#ifndef ROTFTP_REQUEST_HPP
#define ROTFTP_REQUEST_HPP

#include <rotftp/errc.hpp>
#include <rotftp/packet.hpp>
#include <string>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * Transfer mode accepted by the server.
     */
    static constexpr const char* tftp_mode_octet = "octet";


    /**
     * A decoded read request.
     */
    struct read_request_t {
        std::string   filename; /**< Normalized file name, relative to the served directory. */
        std::string   mode;     /**< Transfer mode as sent by the client. */
        option_list_t options;  /**< Requested options in request order. */
    };


    /**
     * Normalize a file name from a read request.
     * Backslashes are converted to forward slashes and one leading
     * slash, if any, is removed.
     */
    std::string normalize_filename (const std::string& filename);


    /**
     * Parse the payload of a read request.
     * @param payload The RRQ packet data following the opcode.
     * @param size Number of bytes in <code>payload</code>.
     * @param req Filled with the decoded request.
     * @param errmsg Set to a message for the client on failure.
     * @return errc::ok on success,
     *         errc::malformed_request if the payload isn't a sequence of
     *         null-terminated fields, has fewer than two fields, an odd
     *         number of option fields, or an empty file name,
     *         errc::unsupported_mode if the mode isn't "octet".
     */
    errc parse_read_request (const uint8_t* payload,
                             size_t size,
                             read_request_t& req,
                             std::string& errmsg);

}


#endif
