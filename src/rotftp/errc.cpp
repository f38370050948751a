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
#include <rotftp/errc.hpp>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    tftp_err_t tftp_error_code (errc e)
    {
        switch (e) {
        case errc::not_found:
        case errc::not_regular_file:
            return tftp_err_not_found;

        case errc::access_denied:
            return tftp_err_access;

        default:
            return tftp_err_undefined;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* errc_to_string (errc e)
    {
        switch (e) {
        case errc::ok:
            return "ok";
        case errc::malformed_packet:
            return "malformed packet";
        case errc::malformed_request:
            return "malformed request";
        case errc::unsupported_mode:
            return "unsupported mode";
        case errc::unsupported_option:
            return "unsupported option";
        case errc::invalid_option_value:
            return "invalid option value";
        case errc::not_found:
            return "not found";
        case errc::not_regular_file:
            return "not a regular file";
        case errc::access_denied:
            return "access denied";
        case errc::io_error:
            return "I/O error";
        case errc::protocol_violation:
            return "protocol violation";
        case errc::server_busy:
            return "server busy";
        }
        return "unknown error";
    }


}
