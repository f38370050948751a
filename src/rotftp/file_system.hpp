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
#ifndef ROTFTP_FILE_SYSTEM_HPP
#define ROTFTP_FILE_SYSTEM_HPP

#include <rotftp/errc.hpp>
#include <string>
#include <memory>
#include <cstdint>
#include <sys/types.h>


namespace rotftp {


    /**
     * An open file that can be read at any offset.
     * The file is closed when the object is destroyed.
     */
    class open_file {
    public:
        virtual ~open_file () = default;

        /**
         * Return the size of the file in bytes,
         * as it was when the file was opened.
         */
        virtual uint64_t size () const = 0;

        /**
         * Read data at a specific offset in the file.
         * Reading doesn't change any file position.
         * @param buf Buffer where data is stored.
         * @param size Maximum number of bytes to read.
         * @param offset File offset to read from.
         * @return The number of bytes read, 0 at end of file,
         *         or -1 on error and <code>errno</code> is set.
         */
        virtual ssize_t pread (void* buf, size_t size, uint64_t offset) = 0;
    };


    /**
     * Where requested files are looked up.
     */
    class file_system {
    public:
        virtual ~file_system () = default;

        /**
         * Open a file for reading.
         * @param path A file name relative to the served directory.
         * @param handle Set to the opened file on success.
         * @return errc::ok on success, or errc::not_found,
         *         errc::not_regular_file, errc::access_denied,
         *         or errc::io_error.
         */
        virtual errc open (const std::string& path,
                           std::unique_ptr<open_file>& handle) = 0;
    };


    /**
     * A file opened with <code>open()</code>.
     */
    class posix_open_file : public open_file {
    public:
        /**
         * Take ownership of an open file descriptor.
         * @param fd An open file descriptor.
         * @param file_size Size of the file.
         */
        posix_open_file (int fd, uint64_t file_size);

        /**
         * Destructor, closes the file descriptor.
         */
        virtual ~posix_open_file ();

        posix_open_file (const posix_open_file&) = delete;
        posix_open_file& operator= (const posix_open_file&) = delete;

        virtual uint64_t size () const;
        virtual ssize_t pread (void* buf, size_t size, uint64_t offset);

        /**
         * Return the file descriptor.
         */
        int handle () const {
            return fd;
        }

    private:
        int fd;
        uint64_t file_size;
    };


    /**
     * Serve regular files below a root directory.
     *
     * A requested path is refused with errc::access_denied if it has
     * a <code>..</code> element, or if it resolves, after following
     * symbolic links, to something outside of the root directory.
     */
    class posix_file_system : public file_system {
    public:
        /**
         * Constructor.
         * @param root_dir The directory to serve files from.
         * @throw std::system_error if the directory can't be resolved.
         * @throw std::invalid_argument if <code>root_dir</code>
         *                              isn't a directory.
         */
        explicit posix_file_system (const std::string& root_dir);

        virtual errc open (const std::string& path,
                           std::unique_ptr<open_file>& handle);

        /**
         * Return the canonical path of the root directory,
         * always ending with a '/'.
         */
        const std::string& root () const {
            return real_root;
        }

    private:
        std::string real_root;
    };

}


#endif
