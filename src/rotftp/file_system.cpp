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
#include <rotftp/file_system.hpp>
#include <rotftp/log.hpp>
#include <system_error>
#include <stdexcept>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_open_file::posix_open_file (int file_descriptor, uint64_t size)
        : fd (file_descriptor),
          file_size (size)
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_open_file::~posix_open_file ()
    {
        if (fd >= 0)
            ::close (fd);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint64_t posix_open_file::size () const
    {
        return file_size;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t posix_open_file::pread (void* buf, size_t size, uint64_t offset)
    {
        ssize_t result;
        do {
            result = ::pread (fd, buf, size, (off_t)offset);
        }while (result < 0 && errno == EINTR);
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    posix_file_system::posix_file_system (const std::string& root_dir)
    {
        auto* path = realpath (root_dir.c_str(), nullptr);
        if (!path)
            throw std::system_error (errno, std::generic_category(), root_dir);
        real_root = path;
        free (path);

        struct stat sb;
        if (stat(real_root.c_str(), &sb) || !S_ISDIR(sb.st_mode))
            throw std::invalid_argument (root_dir + " is not a directory");

        if (real_root.back() != '/')
            real_root.append ("/");
    }


    //--------------------------------------------------------------------------
    // Check for a ".." element in a path.
    //--------------------------------------------------------------------------
    static bool has_parent_element (const std::string& path)
    {
        std::stringstream ss (path);
        std::string element;
        while (std::getline(ss, element, '/')) {
            if (element == "..")
                return true;
        }
        return false;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc posix_file_system::open (const std::string& path,
                                  std::unique_ptr<open_file>& handle)
    {
        if (path.empty() || path[0]=='/' || has_parent_element(path)) {
            log::debug ("Illegal file name '%s'", path.c_str());
            return errc::access_denied;
        }

        // Get the canonical path of the requested file
        //
        std::string req_file = real_root + path;
        auto* resolved = realpath (req_file.c_str(), nullptr);
        if (!resolved) {
            int errnum = errno;
            log::debug ("Can't resolve '%s': %s", req_file.c_str(), strerror(errnum));
            return errnum==EACCES ? errc::access_denied : errc::not_found;
        }
        std::string real_path (resolved);
        free (resolved);

        // The file must be located below the root directory
        //
        if ((real_path + "/").compare(0, real_root.size(), real_root) != 0) {
            log::debug ("'%s' resolves to '%s', outside of %s",
                        path.c_str(), real_path.c_str(), real_root.c_str());
            return errc::access_denied;
        }

        // Only regular files are served
        //
        struct stat sb;
        if (stat(real_path.c_str(), &sb))
            return errno==EACCES ? errc::access_denied : errc::not_found;
        if (!S_ISREG(sb.st_mode))
            return errc::not_regular_file;

        int fd = ::open (real_path.c_str(), O_RDONLY);
        if (fd < 0) {
            int errnum = errno;
            log::debug ("Can't open file '%s': %s", real_path.c_str(), strerror(errnum));
            return errnum==EACCES ? errc::access_denied : errc::io_error;
        }

        handle.reset (new posix_open_file(fd, (uint64_t)sb.st_size));
        return errc::ok;
    }


}
