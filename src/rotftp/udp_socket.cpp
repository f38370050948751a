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
#include <rotftp/udp_socket.hpp>
#include <rotftp/log.hpp>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <sys/time.h>


//#define TRACE_DEBUG

#ifdef TRACE_DEBUG
#define TRACE(format, ...) log::debug("[%u] %s:%s:%d: " format, gettid(), __FILE__, __FUNCTION__, __LINE__, ## __VA_ARGS__)
#else
#define TRACE(format, ...)
#endif


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket::udp_socket ()
        : fd (-1)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    udp_socket::~udp_socket ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::open (int domain)
    {
        errno = 0;
        if (fd >= 0)
            return 0;

        if (domain!=AF_INET && domain!=AF_INET6) {
            errno = EAFNOSUPPORT;
            return -1;
        }

        fd = socket (domain, SOCK_DGRAM|SOCK_CLOEXEC, 0);
        if (fd == -1) {
            auto errnum = errno;
            TRACE ("socket() failed: %s", strerror(errno));
            errno = errnum;
            return -1;
        }
        local_addr = ip_addr ();
        local_addr.data()->sa_family = domain;
        TRACE ("Opened UDP socket %d", fd);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void udp_socket::close ()
    {
        if (fd < 0)
            return;
        TRACE ("Closing socket %d", fd);
        ::close (fd);
        fd = -1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::bind (const ip_addr& addr)
    {
        errno = 0;
        // Sanity checks
        //
        if (fd < 0) {
            TRACE ("bind() failed: Socket not open");
            errno = EINVAL;
            return -1;
        }
        if (addr.family() != local_addr.family()) {
            TRACE ("bind() failed: wrong address family");
            errno = EINVAL;
            return -1;
        }

        TRACE ("Bind socket %d to address %s", fd, addr.to_string().c_str());
        if (::bind(fd, addr.data(), addr.size())) {
            auto errnum = errno;
            TRACE ("bind() failed: %s", strerror(errno));
            errno = errnum;
            return -1;
        }

        // Get the actual local address, the port may have been chosen by the system
        //
        local_addr = addr;
        socklen_t slen = sock_addr::capacity ();
        if (getsockname(fd, local_addr.data(), &slen))
            local_addr = addr;

        errno = 0;
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::setsockopt (int optname, const int value)
    {
        socklen_t len = sizeof (value);
        errno = 0;
        return ::setsockopt (fd, SOL_SOCKET, optname, &value, len);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::setsockopt (int level, int optname, const void* optval, socklen_t optlen)
    {
        errno = 0;
        return ::setsockopt (fd, level, optname, optval, optlen);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int udp_socket::rx_timeout (unsigned timeout)
    {
        struct timeval tv;
        tv.tv_sec  = timeout / 1000;
        tv.tv_usec = (timeout % 1000) * 1000;
        return setsockopt (SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_socket::recvfrom (void* buf, size_t size, ip_addr& peer)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        peer.clear ();
        socklen_t slen = sock_addr::capacity ();
        return ::recvfrom (fd, buf, size, 0, peer.data(), &slen);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t udp_socket::sendto (const void* buf, size_t size, const ip_addr& peer)
    {
        if (fd < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t result;
        do {
            result = ::sendto (fd, buf, size, 0, peer.data(), peer.size());
        }while (result < 0 && errno == EINTR);
        return result;
    }


}
