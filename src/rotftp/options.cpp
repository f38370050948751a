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
#include <rotftp/options.hpp>
#include <limits>
#include <strings.h>


namespace rotftp {


    enum option_kind_t {
        opt_blksize,
        opt_tsize,
        opt_interval,
        opt_unknown
    };


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static option_kind_t option_kind (const std::string& name)
    {
        if (!strcasecmp(name.c_str(), "blksize"))
            return opt_blksize;
        if (!strcasecmp(name.c_str(), "tsize"))
            return opt_tsize;
        // Some clients send "timeout" instead of "interval"
        if (!strcasecmp(name.c_str(), "interval") || !strcasecmp(name.c_str(), "timeout"))
            return opt_interval;
        return opt_unknown;
    }


    //--------------------------------------------------------------------------
    // Parse a non-negative decimal integer, digits only.
    //--------------------------------------------------------------------------
    static bool parse_uint (const std::string& str, uint64_t& value)
    {
        if (str.empty())
            return false;

        uint64_t v = 0;
        for (auto ch : str) {
            if (ch < '0' || ch > '9')
                return false;
            unsigned digit = ch - '0';
            if (v > (std::numeric_limits<uint64_t>::max() - digit) / 10)
                return false; // Overflow
            v = v*10 + digit;
        }
        value = v;
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc negotiate_options (const option_list_t& requested,
                            uint64_t file_size,
                            negotiated_options_t& result,
                            std::string& errmsg)
    {
        result.block_size = tftp_default_block_size;
        result.accepted.clear ();

        for (auto& opt : requested) {
            const std::string& name  = opt.first;
            const std::string& value = opt.second;

            auto kind = option_kind (name);
            if (kind == opt_unknown) {
                errmsg = "unsupported option \"" + name + "\"";
                return errc::unsupported_option;
            }

            uint64_t num;
            if (!parse_uint(value, num)) {
                errmsg = "option " + name + " \"" + value + "\" is not a valid integer string";
                return errc::invalid_option_value;
            }

            switch (kind) {
            case opt_blksize:
                if (num < 1 || num > tftp_max_block_size) {
                    errmsg = "option " + name + " \"" + value + "\" is out of range";
                    return errc::invalid_option_value;
                }
                // A repeated blksize replaces the earlier one
                result.block_size = (size_t) num;
                result.accepted.emplace_back (name, std::to_string(num));
                break;

            case opt_tsize:
                result.accepted.emplace_back (name, std::to_string(file_size));
                break;

            default:
                result.accepted.emplace_back (name, std::to_string(num));
                break;
            }
        }

        return errc::ok;
    }


}
