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
#ifndef ROTFTP_TFTP_SESSION_HPP
#define ROTFTP_TFTP_SESSION_HPP

#include <rotftp/errc.hpp>
#include <rotftp/packet.hpp>
#include <rotftp/ip_addr.hpp>
#include <rotftp/options.hpp>
#include <rotftp/file_system.hpp>
#include <rotftp/block_reader.hpp>
#include <string>
#include <memory>
#include <chrono>
#include <cstdint>


namespace rotftp {


    /**
     * The transfer of one file to one client.
     *
     * A session is created for a valid read request with the file
     * already opened and the options negotiated. It sends an OACK
     * if any options were accepted and then waits for ACK 0, otherwise
     * it starts with data block 1. Each data block is sent when the
     * previous one is acknowledged, only one block is outstanding at
     * any time. The session owns the file and closes it when the
     * session is done or destroyed.
     */
    class tftp_session {
    public:
        enum state_t {
            st_negotiating,  /**< OACK sent, waiting for ACK 0. */
            st_transferring, /**< Data block sent, waiting for its ACK. */
            st_done          /**< Finished or aborted, file closed. */
        };

        /**
         * Constructor.
         * @param client The client address and port.
         * @param filename The requested file name, used in log messages.
         * @param file The opened file.
         * @param options Negotiated options.
         * @throw std::invalid_argument if <code>file</code>
         *                              is <code>nullptr</code>.
         */
        tftp_session (const ip_addr& client,
                      const std::string& filename,
                      std::unique_ptr<open_file> file,
                      const negotiated_options_t& options);

        tftp_session (const tftp_session&) = delete;
        tftp_session& operator= (const tftp_session&) = delete;

        /**
         * Create the first packet of the session,
         * an OACK or data block 1.
         * @param pkt Set to the packet to send.
         * @param errmsg Set to a message for the client on failure.
         * @return errc::ok, or an error if the first block can't be
         *         read. On error the session is done.
         */
        errc start (packet_t& pkt, std::string& errmsg);

        /**
         * Handle an acknowledgment from the client.
         * @param block The acknowledged block number.
         * @param pkt Set to the next packet to send, or
         *            cleared if the last block was acknowledged.
         * @param errmsg Set to a message for the client on failure.
         * @return errc::ok, errc::protocol_violation if the block
         *         number isn't the expected one, or errc::io_error
         *         if the next block can't be read.
         *         On error the session is done.
         */
        errc on_ack (uint16_t block, packet_t& pkt, std::string& errmsg);

        /**
         * End the session and close the file.
         */
        void stop ();

        state_t state () const {
            return st;
        }

        bool done () const {
            return st == st_done;
        }

        const ip_addr& client () const {
            return client_addr;
        }

        const std::string& filename () const {
            return file_name;
        }

        /**
         * Return a string identifying the session in log messages.
         */
        const std::string& id () const {
            return sess_id;
        }

        /**
         * Return the index of the last sent data block.
         * This is 0 until the first block is sent, and isn't
         * limited to 16 bits like the block number on the wire.
         */
        uint64_t block_index () const {
            return block;
        }

        /**
         * Return the block number expected in the next ACK.
         */
        uint16_t expected_ack () const {
            return (uint16_t) (block & 0xffff);
        }

        size_t block_size () const {
            return blk_size;
        }

        uint64_t file_size () const {
            return fsize;
        }

        /**
         * Return the time of the last accepted packet.
         */
        std::chrono::steady_clock::time_point last_activity () const {
            return last_active;
        }

        /**
         * Set the time of the last accepted packet.
         */
        void touch (std::chrono::steady_clock::time_point now) {
            last_active = now;
        }


    private:
        errc send_block (packet_t& pkt, std::string& errmsg);

        ip_addr client_addr;
        std::string file_name;
        std::string sess_id;
        std::unique_ptr<block_reader> reader;
        option_list_t accepted_options;
        state_t st;
        uint64_t block;
        size_t blk_size;
        uint64_t fsize;
        std::vector<uint8_t> data;
        std::chrono::steady_clock::time_point last_active;
    };

}


#endif
