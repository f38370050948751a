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
#ifndef ROTFTP_TFTP_SERVER_HPP
#define ROTFTP_TFTP_SERVER_HPP

#include <rotftp/engine.hpp>
#include <rotftp/udp_socket.hpp>
#include <rotftp/ip_addr.hpp>
#include <atomic>


namespace rotftp {


    /**
     * A TFTP server.
     * Receives datagrams on a UDP socket, passes them to an engine,
     * and sends the replies. All requests are served from the same
     * socket in one thread.
     */
    class tftp_server {
    public:
        /**
         * Receive timeout in milliseconds.
         * The server checks for idle sessions and
         * calls to stop() at least this often.
         */
        static constexpr unsigned rx_timeout_ms = 1000;

        /**
         * Constructor.
         * @param e The engine that handles received packets.
         * @param session_timeout Remove sessions idle for this many
         *                        seconds. 0 means never.
         */
        explicit tftp_server (engine& e, unsigned session_timeout=0);

        tftp_server (const tftp_server&) = delete;
        tftp_server& operator= (const tftp_server&) = delete;

        /**
         * Open the server socket and bind it to an address.
         * @param bind_addr The address and port to listen on.
         *                  If the port is 0, a free port is chosen
         *                  and can be read using addr().
         * @return 0 on success, -1 on failure and
         *         <code>errno</code> is set.
         */
        int open (const ip_addr& bind_addr);

        /**
         * Close the server socket.
         */
        void close ();

        /**
         * Return the address the server socket is bound to.
         */
        const ip_addr& addr () const {
            return sock.addr ();
        }

        /**
         * Serve requests until stop() is called.
         * @return 0 when stopped, -1 if the server socket isn't
         *         open or fails, and <code>errno</code> is set.
         */
        int run ();

        /**
         * Make run() return.
         * May be called from another thread or a signal handler.
         */
        void stop () {
            quit = true;
        }

        /**
         * Check if run() is executing.
         */
        bool running () const {
            return is_running;
        }


    private:
        void handle_rx_error (int errnum);

        engine& eng;
        udp_socket sock;
        unsigned sess_timeout;
        std::atomic_bool quit;
        std::atomic_bool is_running;
    };

}


#endif
