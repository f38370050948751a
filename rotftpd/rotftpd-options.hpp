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
#ifndef ROTFTPD_OPTIONS_HPP
#define ROTFTPD_OPTIONS_HPP

#include <rotftp.hpp>
#include <string>
#include <ostream>
#include <cstddef>



//------------------------------------------------------------------------------
//  T Y P E S
//------------------------------------------------------------------------------
struct appargs_t {
    appargs_t ();
    int parse_args (int argc, char* argv[]);
    void print_usage (std::ostream& out);

    rotftp::ip_addr bind_addr;
    std::string tftproot;
    std::string user;
    std::string group;
    size_t max_clients;
    unsigned session_timeout;
    bool log_to_stdout;
    bool dump;
    bool verbose;
};


#endif
