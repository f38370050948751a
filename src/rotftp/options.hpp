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
#ifndef ROTFTP_OPTIONS_HPP
#define ROTFTP_OPTIONS_HPP

#include <rotftp/errc.hpp>
#include <rotftp/packet.hpp>
#include <string>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * The result of option negotiation.
     */
    struct negotiated_options_t {
        /**
         * Block size used for the transfer.
         */
        size_t block_size {tftp_default_block_size};

        /**
         * Options to acknowledge in an OACK packet, in request order
         * and with option names spelled as the client spelled them.
         * If empty, no OACK is sent.
         */
        option_list_t accepted;
    };


    /**
     * Validate the options of a read request.
     *
     * Supported options are <code>blksize</code>, <code>tsize</code>,
     * and <code>timeout</code> or its alias <code>interval</code>.
     * Option names are case insensitive. The acknowledged value of
     * <code>tsize</code> is always <code>file_size</code>. The timeout
     * is acknowledged but not used by the server. A repeated option
     * is acknowledged each time it occurs, the last <code>blksize</code>
     * sets the block size.
     *
     * @param requested Options as sent by the client.
     * @param file_size Size of the requested file.
     * @param result Filled with the negotiated values.
     * @param errmsg Set to a message for the client on failure.
     * @return errc::ok on success,
     *         errc::unsupported_option for an unknown option name,
     *         errc::invalid_option_value for a value that isn't a
     *         non-negative integer or a block size out of range.
     */
    errc negotiate_options (const option_list_t& requested,
                            uint64_t file_size,
                            negotiated_options_t& result,
                            std::string& errmsg);

}


#endif
