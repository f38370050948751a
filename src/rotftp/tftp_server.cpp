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
#include <rotftp/tftp_server.hpp>
#include <rotftp/packet.hpp>
#include <rotftp/log.hpp>
#include <vector>
#include <chrono>
#include <cstring>
#include <cerrno>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    tftp_server::tftp_server (engine& e, unsigned session_timeout)
        : eng (e),
          sess_timeout (session_timeout),
          quit (false),
          is_running (false)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int tftp_server::open (const ip_addr& bind_addr)
    {
        int errnum;

        if (sock.open(bind_addr.family())) {
            errnum = errno;
            log::error ("Unable to open server socket: %s", strerror(errnum));
            errno = errnum;
            return -1;
        }
        if (sock.setsockopt(SO_REUSEADDR, 1)) {
            log::warning ("Unable to set SO_REUSEADDR on server socket: %s",
                          strerror(errno));
        }
        if (sock.bind(bind_addr)) {
            errnum = errno;
            log::error ("Unable to bind server socket to %s: %s",
                        bind_addr.to_string(true).c_str(), strerror(errnum));
            sock.close ();
            errno = errnum;
            return -1;
        }
        if (sock.rx_timeout(rx_timeout_ms)) {
            errnum = errno;
            log::error ("Unable to set receive timeout on server socket: %s",
                        strerror(errnum));
            sock.close ();
            errno = errnum;
            return -1;
        }

        log::info ("Listening on %s", sock.addr().to_string(true).c_str());
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void tftp_server::close ()
    {
        sock.close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void tftp_server::handle_rx_error (int errnum)
    {
        if (errnum==EAGAIN || errnum==EWOULDBLOCK || errnum==EINTR) {
            // Receive timeout or interrupted by a signal
            return;
        }
        else if (errnum==ECONNREFUSED || errnum==ECONNRESET) {
            log::info ("Connection reset reported on server socket, continue");
        }
        else {
            log::error ("Error receiving on server socket: %s", strerror(errnum));
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int tftp_server::run ()
    {
        if (!sock.is_open()) {
            errno = EBADF;
            return -1;
        }

        std::vector<uint8_t> buf (tftp_max_packet_size);
        auto last_expire_check = std::chrono::steady_clock::now ();
        int retval = 0;

        is_running = true;
        while (!quit) {
            ip_addr peer;
            auto result = sock.recvfrom (buf.data(), buf.size(), peer);
            if (result < 0) {
                int errnum = errno;
                if (errnum==EBADF || errnum==ENOTSOCK) {
                    log::error ("Server socket failed: %s", strerror(errnum));
                    errno = errnum;
                    retval = -1;
                    break;
                }
                handle_rx_error (errnum);
            }else{
                outbound_t out;
                if (eng.handle_packet(buf.data(), (size_t)result, peer, out)) {
                    if (sock.sendto(out.data.data(), out.data.size(), out.addr) < 0) {
                        log::warning ("Unable to send packet to %s: %s",
                                      out.addr.to_string(true).c_str(), strerror(errno));
                    }
                }
            }

            // Remove idle sessions
            //
            auto now = std::chrono::steady_clock::now ();
            if (sess_timeout > 0  &&  now - last_expire_check >= std::chrono::seconds(1)) {
                last_expire_check = now;
                eng.expire_sessions (now, std::chrono::seconds(sess_timeout));
            }
        }
        is_running = false;
        quit = false;

        return retval;
    }


}
