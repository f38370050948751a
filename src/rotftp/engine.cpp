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
#include <rotftp/engine.hpp>
#include <rotftp/request.hpp>
#include <rotftp/options.hpp>
#include <rotftp/log.hpp>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    engine::engine (file_system& file_sys, size_t max_sessions)
        : fs (file_sys),
          max_sess (max_sessions)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const tftp_session* engine::session (const ip_addr& client) const
    {
        auto entry = sessions.find (client);
        return entry==sessions.end() ? nullptr : entry->second.get();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool engine::handle_packet (const void* data,
                                size_t size,
                                const ip_addr& from,
                                outbound_t& out)
    {
        auto* buf = (const uint8_t*) data;

        if (dump_cb)
            dump_cb (true, from, buf, size);

        out.data.clear ();

        if (size < sizeof(uint16_t)) {
            log::debug ("%s: packet too short (%u bytes), ignored",
                        from.to_string(true).c_str(), (unsigned)size);
            return false;
        }

        auto entry = sessions.find (from);

        opcode_t op;
        if (decode_opcode(buf, size, op) != errc::ok) {
            unsigned code = (buf[0] << 8) | buf[1];
            log::info ("%s: invalid TFTP opcode %u", from.to_string(true).c_str(), code);
            if (entry != sessions.end())
                end_session (entry);
            return error_reply (from, errc::malformed_packet,
                                "unknown opcode " + std::to_string(code), out);
        }

        log::debug ("%s: received %s, %u bytes",
                    from.to_string(true).c_str(), opcode_to_string(op), (unsigned)size);

        if (op == op_error) {
            handle_client_error (buf, size, from);
            if (entry != sessions.end())
                end_session (entry);
            return false;
        }

        if (entry != sessions.end())
            return handle_session_packet (entry, op, buf, size, out);

        switch (op) {
        case op_rrq:
            return handle_rrq (buf, size, from, out);

        case op_wrq:
            log::info ("WRQ from %s - write requests not supported",
                       from.to_string(true).c_str());
            return error_reply (from, errc::protocol_violation,
                                "write request not supported", out);

        default:
            log::info ("%s: unexpected %s packet without a session",
                       from.to_string(true).c_str(), opcode_to_string(op));
            return error_reply (from, errc::protocol_violation,
                                "unexpected packet", out);
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool engine::handle_rrq (const uint8_t* buf,
                             size_t size,
                             const ip_addr& from,
                             outbound_t& out)
    {
        read_request_t req;
        std::string errmsg;

        // Parse the request, the mode is checked before any file is opened
        //
        auto result = parse_read_request (buf+sizeof(uint16_t),
                                          size-sizeof(uint16_t),
                                          req,
                                          errmsg);
        if (result != errc::ok) {
            log::info ("RRQ from %s - %s", from.to_string(true).c_str(), errmsg.c_str());
            return error_reply (from, result, errmsg, out);
        }

        // Check server limits
        //
        if (max_sess > 0  &&  sessions.size() >= max_sess) {
            log::info ("RRQ from %s - too many clients", from.to_string(true).c_str());
            return error_reply (from, errc::server_busy, "Server busy", out);
        }

        // Open the requested file
        //
        std::unique_ptr<open_file> file;
        result = fs.open (req.filename, file);
        if (result != errc::ok) {
            switch (result) {
            case errc::not_found:
                errmsg = "file \"" + req.filename + "\" not found";
                break;
            case errc::not_regular_file:
                errmsg = "file \"" + req.filename + "\" is not a regular file";
                break;
            case errc::access_denied:
                errmsg = "access violation";
                break;
            default:
                errmsg = "can't open file \"" + req.filename + "\"";
                break;
            }
            log::info ("RRQ from %s - %s", from.to_string(true).c_str(), errmsg.c_str());
            return error_reply (from, result, errmsg, out);
        }

        // Negotiate options, the file is closed on error
        //
        negotiated_options_t options;
        result = negotiate_options (req.options, file->size(), options, errmsg);
        if (result != errc::ok) {
            log::info ("RRQ from %s - %s", from.to_string(true).c_str(), errmsg.c_str());
            return error_reply (from, result, errmsg, out);
        }

        // Start the session
        //
        std::unique_ptr<tftp_session> sess (new tftp_session(from,
                                                             req.filename,
                                                             std::move(file),
                                                             options));
        result = sess->start (out.data, errmsg);
        if (result != errc::ok)
            return error_reply (from, result, errmsg, out);

        sess->touch (std::chrono::steady_clock::now());
        sessions.emplace (from, std::move(sess));

        return reply (from, out);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool engine::handle_session_packet (session_map_t::iterator& entry,
                                        opcode_t op,
                                        const uint8_t* buf,
                                        size_t size,
                                        outbound_t& out)
    {
        auto& sess = *entry->second;
        ip_addr client = entry->first;
        std::string errmsg;

        if (op != op_ack) {
            log::info ("Session %s, unexpected %s packet, abort session",
                       sess.id().c_str(), opcode_to_string(op));
            end_session (entry);
            return error_reply (client, errc::protocol_violation, "unexpected packet", out);
        }

        uint16_t block;
        if (decode_ack(buf, size, block) != errc::ok) {
            log::info ("Session %s, malformed ACK (%u bytes), abort session",
                       sess.id().c_str(), (unsigned)size);
            end_session (entry);
            return error_reply (client, errc::protocol_violation, "malformed ACK", out);
        }

        auto result = sess.on_ack (block, out.data, errmsg);
        if (result != errc::ok) {
            end_session (entry);
            return error_reply (client, result, errmsg, out);
        }
        if (sess.done()) {
            end_session (entry);
            return false;
        }

        sess.touch (std::chrono::steady_clock::now());
        return reply (client, out);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void engine::handle_client_error (const uint8_t* buf,
                                      size_t size,
                                      const ip_addr& from)
    {
        uint16_t code;
        std::string message;
        if (decode_error(buf, size, code, message) == errc::ok) {
            log::info ("%s: TFTP error received: %u (%s)",
                       from.to_string(true).c_str(), (unsigned)code, message.c_str());
        }else{
            log::info ("%s: truncated TFTP error received",
                       from.to_string(true).c_str());
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void engine::end_session (session_map_t::iterator& entry)
    {
        log::debug ("Session %s ended", entry->second->id().c_str());
        entry->second->stop ();
        entry = sessions.erase (entry);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool engine::error_reply (const ip_addr& to,
                              errc e,
                              const std::string& errmsg,
                              outbound_t& out)
    {
        log::debug ("%s: send error %u (%s): %s",
                    to.to_string(true).c_str(), (unsigned)tftp_error_code(e),
                    errc_to_string(e), errmsg.c_str());
        out.data = encode_error (tftp_error_code(e), errmsg);
        return reply (to, out);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool engine::reply (const ip_addr& to, outbound_t& out)
    {
        out.addr = to;
        if (dump_cb)
            dump_cb (false, out.addr, out.data.data(), out.data.size());
        return true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t engine::expire_sessions (std::chrono::steady_clock::time_point now,
                                    std::chrono::steady_clock::duration idle)
    {
        size_t count = 0;
        for (auto entry=sessions.begin(); entry!=sessions.end();) {
            if (now - entry->second->last_activity() >= idle) {
                log::info ("Session %s timed out", entry->second->id().c_str());
                end_session (entry);
                ++count;
            }else{
                ++entry;
            }
        }
        return count;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void engine::clear ()
    {
        for (auto entry=sessions.begin(); entry!=sessions.end();)
            end_session (entry);
    }


}
