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
#include <rotftp/tftp_session.hpp>
#include <rotftp/log.hpp>
#include <cinttypes>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    tftp_session::tftp_session (const ip_addr& client,
                                const std::string& filename,
                                std::unique_ptr<open_file> file,
                                const negotiated_options_t& options)
        : client_addr (client),
          file_name (filename),
          sess_id (client.to_string(true)),
          reader (new block_reader(std::move(file), options.block_size)),
          accepted_options (options.accepted),
          st (st_negotiating),
          block (0),
          blk_size (options.block_size),
          fsize (reader->file_size()),
          last_active (std::chrono::steady_clock::now())
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc tftp_session::start (packet_t& pkt, std::string& errmsg)
    {
        log::info ("RRQ session %s, file %s, size %" PRIu64 ", block size %u",
                   sess_id.c_str(), file_name.c_str(), fsize, (unsigned)blk_size);

        if (!accepted_options.empty()) {
            for (auto& opt : accepted_options) {
                log::debug ("Session %s, option %s=%s",
                            sess_id.c_str(), opt.first.c_str(), opt.second.c_str());
            }
            st = st_negotiating;
            pkt = encode_oack (accepted_options);
            return errc::ok;
        }

        st = st_transferring;
        return send_block (pkt, errmsg);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc tftp_session::send_block (packet_t& pkt, std::string& errmsg)
    {
        ++block;
        auto result = reader->read (block, data);
        if (result != errc::ok) {
            log::info ("Session %s, file read error on block %" PRIu64,
                       sess_id.c_str(), block);
            errmsg = "file read error";
            stop ();
            return result;
        }

        log::debug ("Session %s, send block #%u (%" PRIu64 "), %u bytes",
                    sess_id.c_str(), (unsigned)expected_ack(), block, (unsigned)data.size());
        pkt = encode_data (block, data.data(), data.size());
        return errc::ok;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc tftp_session::on_ack (uint16_t ack_block, packet_t& pkt, std::string& errmsg)
    {
        pkt.clear ();

        switch (st) {
        case st_negotiating:
            if (ack_block != 0) {
                log::info ("Session %s, expected ACK #0, got ACK #%u",
                           sess_id.c_str(), (unsigned)ack_block);
                errmsg = "expected ACK of block 0";
                stop ();
                return errc::protocol_violation;
            }
            st = st_transferring;
            return send_block (pkt, errmsg);

        case st_transferring:
            if (ack_block != expected_ack()) {
                log::info ("Session %s, expected ACK #%u, got ACK #%u",
                           sess_id.c_str(), (unsigned)expected_ack(), (unsigned)ack_block);
                errmsg = "expected ACK of block " + std::to_string(expected_ack());
                stop ();
                return errc::protocol_violation;
            }
            if (reader->is_last(block)) {
                log::info ("Session %s done, %" PRIu64 " bytes in %" PRIu64 " blocks",
                           sess_id.c_str(), fsize, block);
                stop ();
                return errc::ok;
            }
            return send_block (pkt, errmsg);

        default:
            errmsg = "session ended";
            return errc::protocol_violation;
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void tftp_session::stop ()
    {
        st = st_done;
        reader.reset ();
    }


}
