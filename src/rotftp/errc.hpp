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
#ifndef ROTFTP_ERRC_HPP
#define ROTFTP_ERRC_HPP

#include <cstdint>


namespace rotftp {


    /**
     * Error codes sent in TFTP error packets.
     */
    enum tftp_err_t : uint16_t {
        tftp_err_undefined      = 0, /**< Not defined, see error message. */
        tftp_err_not_found      = 1, /**< File not found. */
        tftp_err_access         = 2, /**< Access violation. */
        tftp_err_disk_full      = 3, /**< Disk full or allocation exceeded. */
        tftp_err_illegal_op     = 4, /**< Illegal TFTP operation. */
        tftp_err_unknown_tid    = 5, /**< Unknown transfer ID. */
        tftp_err_file_exists    = 6, /**< File already exists. */
        tftp_err_no_such_user   = 7, /**< No such user. */
        tftp_err_option         = 8  /**< Option negotiation refused. */
    };


    /**
     * Reasons a request or a transfer fails.
     * Every kind except <code>ok</code> ends the exchange
     * with exactly one error packet to the client.
     */
    enum class errc {
        ok = 0,
        malformed_packet,      /**< Unparsable opcode or frame. */
        malformed_request,     /**< Read request grammar violation. */
        unsupported_mode,      /**< Transfer mode other than "octet". */
        unsupported_option,    /**< Unrecognized option name. */
        invalid_option_value,  /**< Non-numeric or out of range option value. */
        not_found,             /**< File missing. */
        not_regular_file,      /**< Path exists but is not a plain file. */
        access_denied,         /**< Path outside the served directory. */
        io_error,              /**< Open or read failure. */
        protocol_violation,    /**< Unexpected opcode or block number. */
        server_busy            /**< Too many concurrent sessions. */
    };


    /**
     * Return the TFTP error code sent to the client for an error kind.
     */
    tftp_err_t tftp_error_code (errc e);


    /**
     * Return a short name of an error kind, used in log messages.
     */
    const char* errc_to_string (errc e);

}


#endif
