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
#ifndef ROTFTP_SOCK_ADDR_HPP
#define ROTFTP_SOCK_ADDR_HPP

#include <string>
#include <cstdint>
#include <sys/socket.h>
#include <netinet/in.h>


namespace rotftp {


    /**
     * A generic socket address.
     */
    class sock_addr {
    public:
        /**
         * Default constructor.
         */
        sock_addr ();

        /**
         * Destructor.
         */
        virtual ~sock_addr () = default;

        /**
         * Compare operator.
         * @param addr The sock_addr object to compare.
         * @return <code>true</code> if the addresses are equal.
         */
        bool operator== (const sock_addr& addr) const;

        /**
         * Not-equal operator.
         * @param addr The sock_addr object to compare.
         * @return <code>true</code> if the addresses are <em>not</em> equal.
         */
        bool operator!= (const sock_addr& addr) const {
            return ! operator== (addr);
        }

        /**
         * Less-than operator.
         * Addresses are ordered by address family first,
         * then by the raw address data.
         * @param rhs The right hand size of the comparison.
         * @return <code>true</code> if this object
         *         is less than <code>rhs</code>.
         */
        bool operator< (const sock_addr& rhs) const;

        /**
         * Return the size of the address data.
         * @return The size of the address data.
         */
        virtual size_t size () const = 0;

        /**
         * Return the address data.
         * @return A pointer to the address data.
         */
        const struct sockaddr* data () const;

        /**
         * Return a writable pointer to the address storage.
         * Used when the address is filled in by
         * <code>recvfrom()</code> or <code>getsockname()</code>.
         */
        struct sockaddr* data ();

        /**
         * Return the size of the address storage.
         */
        static constexpr socklen_t capacity () {
            return sizeof (struct sockaddr_storage);
        }

        /**
         * Return address family: AF_xxx.
         * @return The address family.
         */
        sa_family_t family () const;

        /**
         * Reset the address data, the address family is kept.
         */
        void clear ();

        /**
         * Return a string representation of the socket address.
         * @return A string representation of the socket address.
         */
        virtual std::string to_string () const = 0;


    protected:
        struct sockaddr_storage sa;
    };
}


#endif
