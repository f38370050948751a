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
#include <rotftp/ip_addr.hpp>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <regex>
#include <arpa/inet.h>
#include <sys/socket.h>


namespace rotftp {


    const ip_addr ipv4_addr_any ((uint32_t)0, 0);


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr ()
    {
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const ip_addr& addr)
    {
        memcpy (&sa, &addr.sa, sizeof(sa));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const struct sockaddr_in& saddr)
    {
        memcpy (&sa, &saddr, sizeof(struct sockaddr_in));
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const struct sockaddr_in6& saddr)
    {
        memcpy (&sa, &saddr, sizeof(struct sockaddr_in6));
        ((struct sockaddr_in6&)sa).sin6_family = AF_INET6;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (uint32_t ipv4_addr, uint16_t port_num)
    {
        ipv4 (ipv4_addr);
        port (port_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port_num)
    {
        uint32_t addr;
        addr  = ((uint32_t)a) << 24;
        addr |= ((uint32_t)b) << 16;
        addr |= ((uint32_t)c) <<  8;
        addr |= ((uint32_t)d);
        ipv4 (addr);
        port (port_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const std::string& address)
    {
        if (!parse(address, true))
            throw std::invalid_argument ("Invalid IP address");
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr::ip_addr (const std::string& address, uint16_t port_num)
    {
        if (!parse(address, false))
            throw std::invalid_argument ("Invalid IP address");
        port (port_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ip_addr& ip_addr::operator= (const ip_addr& addr)
    {
        memcpy (&sa, &addr.sa, sizeof(sa));
        return *this;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool parse_port (const char* str, int& port)
    {
        // Regular expression to validate a port number
        static std::regex regex_port_num ("0*(?:"
                                          "[0-9]|"
                                          "[1-9][0-9]{1,3}|"
                                          "[1-5][0-9]{4}|"
                                          "6[0-4][0-9]{3}|"
                                          "65[0-4][0-9]{2}|"
                                          "655[0-2][0-9]|"
                                          "6553[0-5]"
                                          ")");
        std::cmatch m;
        if (!regex_match(str, m, regex_port_num))
            return false;

        port = atoi (str);
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool ip_addr::parse (const std::string& address, const bool also_parse_port)
    {
        std::string ip_str;
        bool success = false;
        bool try_ipv4 = true;
        bool try_ipv6 = true;
        int port_num = -1;

        if (address.empty())
            return false;

        if (address[0] == '[') {
            // This must be an IPv6 address
            try_ipv4 = false;
            auto pos = address.find ("]:");
            if (pos != std::string::npos) {
                ip_str = address.substr (1, pos-1);
                if (!also_parse_port || !parse_port(address.c_str()+pos+2, port_num))
                    try_ipv6 = false; // Invalid port number
            }
            else if (address[address.size()-1] == ']') {
                ip_str = address.substr (1, address.size()-2);
            }
            else {
                try_ipv6 = false;
            }
        }else{
            auto pos = address.find (".");
            if (pos != std::string::npos) {
                // This must be an IPv4 address
                try_ipv6 = false;
                pos = address.find (":");
                if (pos != std::string::npos) {
                    ip_str = address.substr (0, pos);
                    if (!also_parse_port || !parse_port(address.c_str()+pos+1, port_num))
                        try_ipv4 = false; // Invalid port number
                }
            }
        }

        const std::string& addr = ip_str.empty() ? address : ip_str;
        struct in_addr  ipv4addr;
        struct in6_addr ipv6addr;

        if (try_ipv4 && inet_pton(AF_INET, addr.c_str(), &ipv4addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in&)sa).sin_family = AF_INET;
            ((struct sockaddr_in&)sa).sin_addr = ipv4addr;
            success = true;
        }
        else if (try_ipv6 && inet_pton(AF_INET6, addr.c_str(), &ipv6addr) == 1) {
            memset (&sa, 0, sizeof(sa));
            ((struct sockaddr_in6&)sa).sin6_family = AF_INET6;
            ((struct sockaddr_in6&)sa).sin6_addr = ipv6addr;
            success = true;
        }
        if (success && port_num != -1)
            port ((uint16_t)port_num);

        return success;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t ip_addr::size () const
    {
        switch (family()) {
        case AF_INET:
            return sizeof (struct sockaddr_in);
        case AF_INET6:
            return sizeof (struct sockaddr_in6);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint16_t ip_addr::port () const
    {
        switch (family()) {
        case AF_INET:
            return ntohs (((const struct sockaddr_in&)sa).sin_port);
        case AF_INET6:
            return ntohs (((const struct sockaddr_in6&)sa).sin6_port);
        default:
            return 0;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void ip_addr::port (const uint16_t port_num)
    {
        switch (family()) {
        case AF_INET:
            ((struct sockaddr_in&)sa).sin_port = htons (port_num);
            break;
        case AF_INET6:
            ((struct sockaddr_in6&)sa).sin6_port = htons (port_num);
            break;
        default:
            break;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint32_t ip_addr::ipv4 () const
    {
        return ntohl (((const struct sockaddr_in&)sa).sin_addr.s_addr);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void ip_addr::ipv4 (const uint32_t addr)
    {
        ((struct sockaddr_in&)sa).sin_addr.s_addr = htonl (addr);
        ((struct sockaddr_in&)sa).sin_family = AF_INET;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string ip_addr::to_string () const
    {
        return to_string (true);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string ip_addr::to_string (bool include_port) const
    {
        std::stringstream ss;

        if (family() == AF_INET) {
            char tmp[INET_ADDRSTRLEN];
            inet_ntop (AF_INET, &(((const struct sockaddr_in&)sa).sin_addr), tmp, sizeof(tmp));
            ss << tmp;
            if (include_port)
                ss << ':' << port();
        }
        else if (family() == AF_INET6) {
            char tmp[INET6_ADDRSTRLEN];
            inet_ntop (AF_INET6, &(((const struct sockaddr_in6&)sa).sin6_addr), tmp, sizeof(tmp));
            if (include_port)
                ss << '[';
            ss << tmp;
            if (include_port)
                ss << "]:" << port();
        }
        else {
            ss << "[n/a]";
        }
        return ss.str ();
    }


}
