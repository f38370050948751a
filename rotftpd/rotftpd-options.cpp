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
#include "rotftpd-options.hpp"

#include <string>
#include <iostream>
#include <limits>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <getopt.h>


static constexpr const char* default_tftp_root = "/srv/tftp";
static constexpr const size_t default_max_clients = 0; // 0 == No limit
static constexpr const unsigned default_session_timeout = 60;


//------------------------------------------------------------------------------
// Parse a non-negative decimal number, return false on error.
//------------------------------------------------------------------------------
static bool parse_number (const char* arg, unsigned long max_value, unsigned long& value)
{
    char* end = nullptr;
    if (!arg || !*arg || *arg=='-')
        return false;
    errno = 0;
    auto v = strtoul (arg, &end, 10);
    if (errno || *end!='\0' || v>max_value)
        return false;
    value = v;
    return true;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void appargs_t::print_usage (std::ostream& out)
{
    out << "Read-only TFTP server." << std::endl;
    out << std::endl;
    out << "Usage: " << program_invocation_short_name << " [OPTIONS]" << std::endl;
    out << std::endl;
    out << "  -r, --tftproot=<directory>     Serve files from this directory. Default is: " << default_tftp_root << '.' << std::endl;
    out << "  -b, --bind=<address>           Bind the tftp server to this address[:port]." << std::endl;
    out << "                                 Default address is 0.0.0.0:" << rotftp::tftp_default_port << " (any local IPv4 address)." << std::endl;
    out << "  -p, --port=<port>              Bind the tftp server to this port number." << std::endl;
    out << "                                 This overrides any port in option --bind." << std::endl;
    out << "  -m, --max-clients=<num>        Maximum number of concurrent clients." << std::endl;
    out << "                                 A value of 0 means no limit." << " Default is "<< default_max_clients << '.' << std::endl;
    out << "  -e, --session-timeout=<sec>    Remove sessions idle for this many seconds." << std::endl;
    out << "                                 A value of 0 means never. Default is " << default_session_timeout << '.' << std::endl;
    out << "  -u, --user=<user_id>           When the server is initialized, drop user privileges to this user." << std::endl;
    out << "  -g, --group=<group_id>         When the server is initialized, drop group privileges to this group." << std::endl;
    out << "  -s, --stdout                   Log to standard output instead of syslog." << std::endl;
    out << "  -d, --dump                     Log a hex dump of all sent and received packets." << std::endl;
    out << "                                 Packets are logged with debug priority, implies --verbose." << std::endl;
    out << "  -v, --verbose                  Verbose logging." << std::endl;
    out << "  -h, --help                     Print this help message." << std::endl;
    out << std::endl;
}



//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
appargs_t::appargs_t ()
    : bind_addr (rotftp::ipv4_addr_any),
      tftproot (default_tftp_root),
      max_clients (default_max_clients),
      session_timeout (default_session_timeout),
      log_to_stdout (false),
      dump (false),
      verbose (false)
{
};


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int appargs_t::parse_args (int argc, char* argv[])
{
    static struct option long_options[] = {
        { "tftproot",        required_argument, 0, 'r'},
        { "bind",            required_argument, 0, 'b'},
        { "port",            required_argument, 0, 'p'},
        { "max-clients",     required_argument, 0, 'm'},
        { "session-timeout", required_argument, 0, 'e'},
        { "user",            required_argument, 0, 'u'},
        { "group",           required_argument, 0, 'g'},
        { "stdout",          no_argument,       0, 's'},
        { "dump",            no_argument,       0, 'd'},
        { "verbose",         no_argument,       0, 'v'},
        { "help",            no_argument,       0, 'h'},
        { 0, 0, 0, 0}
    };
    static const char* arg_format = "r:b:p:m:e:u:g:sdvh";
    int bind_port = -1;
    unsigned long num;
    size_t len;

    optind = 1;
    while (1) {
        int c = getopt_long (argc, argv, arg_format, long_options, NULL);
        if (c == -1)
            break;
        switch (c) {
        case 'r':
            len = strlen (optarg);
            // Remove trailing / if not root dir.
            if (len>1 && optarg[len-1]=='/')
                tftproot = std::string (optarg, len-1);
            else
                tftproot = optarg;
            break;

        case 'b':
            if (!bind_addr.parse(optarg) || (bind_addr.family()!=AF_INET && bind_addr.family()!=AF_INET6)) {
                std::cerr << "Error: Invalid IPv[4|6] address and/or port number to argument '--bind'" << std::endl;
                return -1;
            }
            break;

        case 'p':
            if (!parse_number(optarg, 65535, num) || num==0) {
                std::cerr << "Error: Invalid port number to argument '--port'" << std::endl;
                return -1;
            }
            bind_port = (int) num;
            break;

        case 'm':
            if (!parse_number(optarg, std::numeric_limits<size_t>::max(), num)) {
                std::cerr << "Error: Invalid number of maximum clients to argument '--max-clients'" << std::endl;
                return -1;
            }
            max_clients = (size_t) num;
            break;

        case 'e':
            if (!parse_number(optarg, std::numeric_limits<unsigned>::max(), num)) {
                std::cerr << "Error: Invalid value to argument '--session-timeout'" << std::endl;
                return -1;
            }
            session_timeout = (unsigned) num;
            break;

        case 'u':
            user = optarg;
            break;

        case 'g':
            group = optarg;
            break;

        case 's':
            log_to_stdout = true;
            break;

        case 'd':
            dump = true;
            verbose = true;
            break;

        case 'v':
            verbose = true;
            break;

        case 'h':
            print_usage (std::cout);
            return 1;

        default:
            return -1;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Invalid argument" << std::endl;
        print_usage (std::cerr);
        return -1;
    }

    // Set port number
    //
    if (bind_port != -1)
        bind_addr.port ((uint16_t)bind_port);
    else if (!bind_addr.port())
        bind_addr.port (rotftp::tftp_default_port);

    return 0;
}
