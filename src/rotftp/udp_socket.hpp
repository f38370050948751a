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
#ifndef ROTFTP_UDP_SOCKET_HPP
#define ROTFTP_UDP_SOCKET_HPP

#include <rotftp/ip_addr.hpp>
#include <sys/types.h>
#include <sys/socket.h>


namespace rotftp {


    /**
     * A blocking UDP socket.
     * Methods returning <code>int</code> return 0 on success and -1 on
     * failure with <code>errno</code> set.
     */
    class udp_socket {
    public:
        udp_socket ();

        /**
         * Destructor, closes the socket.
         */
        ~udp_socket ();

        udp_socket (const udp_socket&) = delete;
        udp_socket& operator= (const udp_socket&) = delete;

        /**
         * Open the socket.
         * Nothing is done if the socket is already open.
         * @param domain AF_INET or AF_INET6.
         * @return 0 on success, -1 on failure.
         */
        int open (int domain=AF_INET);

        /**
         * Close the socket.
         */
        void close ();

        /**
         * Check if the socket is open.
         */
        bool is_open () const {
            return fd >= 0;
        }

        /**
         * Return the socket file descriptor, or -1 if not open.
         */
        int handle () const {
            return fd;
        }

        /**
         * Bind the socket to a local address.
         * After a successful bind, addr() returns the actual
         * address, also when binding to port 0.
         * @param addr The address to bind to, must be of the
         *             same family as the opened socket.
         * @return 0 on success, -1 on failure.
         */
        int bind (const ip_addr& addr);

        /**
         * Return the local address of the socket.
         */
        const ip_addr& addr () const {
            return local_addr;
        }

        /**
         * Set an integer socket option at level SOL_SOCKET.
         */
        int setsockopt (int optname, const int value);

        /**
         * Set a socket option.
         */
        int setsockopt (int level, int optname, const void* optval, socklen_t optlen);

        /**
         * Set the receive timeout.
         * @param timeout Timeout in milliseconds, 0 means wait forever.
         * @return 0 on success, -1 on failure.
         */
        int rx_timeout (unsigned timeout);

        /**
         * Receive a datagram.
         * @param buf Where to store the datagram.
         * @param size Size of the buffer.
         * @param peer Set to the address of the sender.
         * @return The number of bytes received, or -1 on error
         *         and <code>errno</code> is set. On receive
         *         timeout <code>errno</code> is EAGAIN.
         */
        ssize_t recvfrom (void* buf, size_t size, ip_addr& peer);

        /**
         * Send a datagram.
         * @param buf The data to send.
         * @param size Number of bytes to send.
         * @param peer The destination address.
         * @return The number of bytes sent, or -1 on error
         *         and <code>errno</code> is set.
         */
        ssize_t sendto (const void* buf, size_t size, const ip_addr& peer);


    private:
        int fd;
        ip_addr local_addr;
    };

}


#endif
