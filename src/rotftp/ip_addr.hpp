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
#ifndef ROTFTP_IP_ADDR_HPP
#define ROTFTP_IP_ADDR_HPP

#include <rotftp/sock_addr.hpp>
#include <string>
#include <stdexcept>
#include <cstdint>
#include <netinet/in.h>


namespace rotftp {


    /**
     * An IPv4 or IPv6 address and port number.
     * This is the client identity that TFTP sessions are keyed by.
     */
    class ip_addr : public sock_addr {
    public:
        /**
         * Default constructor.
         * Constructs an IPv4 address with all values set to zero.
         */
        ip_addr ();

        /**
         * Copy constructor.
         * @param addr The ip_addr object to copy.
         */
        ip_addr (const ip_addr& addr);

        /**
         * Create an ip_addr from a <code>struct sockaddr_in</code>.
         * @param saddr A sockaddr_in object to copy.
         */
        explicit ip_addr (const struct sockaddr_in& saddr);

        /**
         * Create an ip_addr from a <code>struct sockaddr_in6</code>.
         * @param saddr A sockaddr_in6 object to copy.
         */
        explicit ip_addr (const struct sockaddr_in6& saddr);

        /**
         * Create an IPv4 address.
         * @param ipv4_addr A 32 bit IPv4 address in host byte order.
         * @param port_num A port number in host byte order.
         */
        explicit ip_addr (uint32_t ipv4_addr, uint16_t port_num=0);

        /**
         * Create an IPv4 address in format <code>a.b.c.d</code>.
         * @param port_num A port number in host byte order.
         */
        ip_addr (uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint16_t port_num=0);

        /**
         * Parse a string and create an IP address, optionally with a port number.
         * IPv6 addresses with a port number are written as <code>[addr]:port</code>.
         * @param address A string containing an IPv[4|6] address and optionally a port number.
         * @throw std::invalid_argument on parse error.
         */
        explicit ip_addr (const std::string& address);

        /**
         * Parse a string and create an IP address.
         * @param address A string containing an IPv[4|6] address.
         * @param port_num A port number.
         * @throw std::invalid_argument on parse error.
         */
        ip_addr (const std::string& address, uint16_t port_num);

        virtual ~ip_addr () = default;

        ip_addr& operator= (const ip_addr& addr);

        /**
         * Parse an address from a string.
         * @param address The string to parse.
         * @param parse_port If <code>true</code>,
         *                   also check for a port number in the string.
         * @return <code>true</code> on success, <code>false</code> on failure.
         */
        bool parse (const std::string& address, const bool parse_port=true);

        virtual size_t size () const;

        /**
         * Return the port number in host byte order.
         */
        uint16_t port () const;

        /**
         * Set the port number.
         * @param port_num A port number in host byte order.
         */
        void port (const uint16_t port_num);

        /**
         * Return a 32 bit IPv4 address in host byte order.
         */
        uint32_t ipv4 () const;

        /**
         * Set a 32 bit IPv4 address.
         * This will also set the address family to AF_INET.
         * @param addr A 32 bit IPv4 address in host byte order.
         */
        void ipv4 (const uint32_t addr);

        virtual std::string to_string () const;

        /**
         * Return a string representation of the IP address (optionally) including port number.
         * @param include_port If <code>true</code>, include the port number.
         * @return A string representation of the IP address.
         */
        std::string to_string (bool include_port) const;
    };


    /**
     * Functor ordering ip_addr objects, used for keyed containers.
     */
    struct ip_addr_less {
        bool operator() (const ip_addr& lhs, const ip_addr& rhs) const {
            return lhs < rhs;
        }
    };


    /**
     * Empty IP address corresponting to any IPv4 address and port.
     */
    extern const ip_addr ipv4_addr_any;

}


#endif
