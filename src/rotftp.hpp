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
#ifndef ROTFTP_HPP
#define ROTFTP_HPP

#include <rotftp/log.hpp>
#include <rotftp/errc.hpp>
#include <rotftp/sock_addr.hpp>
#include <rotftp/ip_addr.hpp>
#include <rotftp/packet.hpp>
#include <rotftp/request.hpp>
#include <rotftp/options.hpp>
#include <rotftp/file_system.hpp>
#include <rotftp/block_reader.hpp>
#include <rotftp/tftp_session.hpp>
#include <rotftp/engine.hpp>
#include <rotftp/hexdump.hpp>
#include <rotftp/udp_socket.hpp>
#include <rotftp/tftp_server.hpp>


#endif
