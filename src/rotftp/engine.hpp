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
#ifndef ROTFTP_ENGINE_HPP
#define ROTFTP_ENGINE_HPP

#include <rotftp/errc.hpp>
#include <rotftp/packet.hpp>
#include <rotftp/ip_addr.hpp>
#include <rotftp/file_system.hpp>
#include <rotftp/tftp_session.hpp>
#include <map>
#include <memory>
#include <string>
#include <chrono>
#include <functional>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * A packet to send.
     */
    struct outbound_t {
        ip_addr  addr; /**< Destination address. */
        packet_t data; /**< Packet data. */
    };


    /**
     * Callback receiving every datagram handled by the engine.
     * @param inbound <code>true</code> for a received datagram,
     *                <code>false</code> for one about to be sent.
     * @param addr Source or destination address.
     * @param data Datagram data.
     * @param size Number of bytes in the datagram.
     */
    using packet_dump_cb_t = std::function<void (bool inbound,
                                                 const ip_addr& addr,
                                                 const uint8_t* data,
                                                 size_t size)>;


    /**
     * The read-only TFTP protocol engine.
     *
     * The engine doesn't do any I/O on the network. Each received
     * datagram is passed to handle_packet() which returns the reply,
     * if any, to send. Sessions are keyed by the client address and
     * port so any number of clients can be served at the same time.
     */
    class engine {
    public:
        /**
         * Constructor.
         * @param fs Where requested files are opened.
         * @param max_sessions Maximum number of concurrent
         *                     sessions, 0 means no limit.
         */
        explicit engine (file_system& fs, size_t max_sessions=0);

        engine (const engine&) = delete;
        engine& operator= (const engine&) = delete;

        /**
         * Handle a received datagram.
         * @param buf Datagram data.
         * @param size Number of bytes in the datagram.
         * @param from The sender of the datagram.
         * @param out Set to the packet to send, if any.
         * @return <code>true</code> if <code>out</code> holds
         *         a packet to send, <code>false</code> if there
         *         is nothing to send.
         */
        bool handle_packet (const void* buf,
                            size_t size,
                            const ip_addr& from,
                            outbound_t& out);

        /**
         * Remove sessions that haven't received an
         * accepted packet in a while. Nothing is sent to
         * the clients of the removed sessions.
         * @param now The current time.
         * @param idle Remove sessions idle at least this long.
         * @return The number of removed sessions.
         */
        size_t expire_sessions (std::chrono::steady_clock::time_point now,
                                std::chrono::steady_clock::duration idle);

        /**
         * Stop and remove all sessions.
         */
        void clear ();

        size_t num_sessions () const {
            return sessions.size ();
        }

        size_t max_sessions () const {
            return max_sess;
        }

        bool has_session (const ip_addr& client) const {
            return sessions.find(client) != sessions.end ();
        }

        /**
         * Return the session of a client, or <code>nullptr</code>.
         */
        const tftp_session* session (const ip_addr& client) const;

        /**
         * Set a callback that receives every inbound and outbound datagram.
         * @param cb A callback, or <code>nullptr</code> to disable dumping.
         */
        void packet_dump (packet_dump_cb_t cb) {
            dump_cb = cb;
        }


    private:
        using session_map_t = std::map<ip_addr, std::unique_ptr<tftp_session>, ip_addr_less>;

        bool handle_rrq (const uint8_t* buf,
                         size_t size,
                         const ip_addr& from,
                         outbound_t& out);
        bool handle_session_packet (session_map_t::iterator& entry,
                                    opcode_t op,
                                    const uint8_t* buf,
                                    size_t size,
                                    outbound_t& out);
        void handle_client_error (const uint8_t* buf,
                                  size_t size,
                                  const ip_addr& from);
        void end_session (session_map_t::iterator& entry);
        bool error_reply (const ip_addr& to,
                          errc e,
                          const std::string& errmsg,
                          outbound_t& out);
        bool reply (const ip_addr& to, outbound_t& out);

        file_system& fs;
        size_t max_sess;
        session_map_t sessions;
        packet_dump_cb_t dump_cb;
    };

}


#endif
