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
#include <rotftp/request.hpp>
#include <vector>
#include <algorithm>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string normalize_filename (const std::string& filename)
    {
        std::string name (filename);
        std::replace (name.begin(), name.end(), '\\', '/');
        if (!name.empty() && name[0] == '/')
            name.erase (0, 1);
        return name;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc parse_read_request (const uint8_t* payload,
                             size_t size,
                             read_request_t& req,
                             std::string& errmsg)
    {
        if (size == 0) {
            errmsg = "malformed read request, no data";
            return errc::malformed_request;
        }
        if (payload[size-1] != '\0') {
            errmsg = "malformed read request, last byte not zero";
            return errc::malformed_request;
        }

        // Split the payload into null-terminated fields
        //
        std::vector<std::string> fields;
        const char* pos = (const char*) payload;
        const char* end = pos + size;
        while (pos < end) {
            fields.emplace_back (pos);
            pos += fields.back().size() + 1;
        }

        if (fields.size() < 2) {
            errmsg = "malformed read request, too few fields";
            return errc::malformed_request;
        }
        if (fields.size() % 2) {
            errmsg = "malformed read request, odd number of fields";
            return errc::malformed_request;
        }

        req.filename = normalize_filename (fields[0]);
        req.mode = fields[1];
        req.options.clear ();
        for (size_t i=2; i<fields.size(); i+=2)
            req.options.emplace_back (fields[i], fields[i+1]);

        if (req.filename.empty()) {
            errmsg = "malformed read request, empty file name";
            return errc::malformed_request;
        }

        if (req.mode != tftp_mode_octet) {
            errmsg = "only binary (octet) transfers are supported";
            return errc::unsupported_mode;
        }

        return errc::ok;
    }


}
