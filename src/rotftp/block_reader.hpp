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
#ifndef ROTFTP_BLOCK_READER_HPP
#define ROTFTP_BLOCK_READER_HPP

#include <rotftp/errc.hpp>
#include <rotftp/file_system.hpp>
#include <memory>
#include <vector>
#include <cstdint>
#include <cstddef>


namespace rotftp {


    /**
     * Split a file into numbered blocks.
     *
     * Blocks are numbered from 1. All blocks except the last one
     * are <code>block_size</code> bytes. The last block holds the
     * remaining bytes and is empty if the file size is a multiple
     * of the block size. The block reader owns the file and closes
     * it when destroyed.
     */
    class block_reader {
    public:
        /**
         * Constructor.
         * @param file An open file.
         * @param block_size Block size in bytes, must not be zero.
         * @throw std::invalid_argument if <code>file</code> is
         *                              <code>nullptr</code> or
         *                              <code>block_size</code> is zero.
         */
        block_reader (std::unique_ptr<open_file> file, size_t block_size);

        /**
         * Return the file size.
         */
        uint64_t file_size () const {
            return size;
        }

        /**
         * Return the block size.
         */
        size_t block_size () const {
            return blk_size;
        }

        /**
         * Return the total number of blocks.
         */
        uint64_t num_blocks () const;

        /**
         * Return the number of bytes in a block.
         * @param index A block index, 1 to num_blocks().
         * @return The block length, or 0 for an index out of range.
         */
        size_t block_length (uint64_t index) const;

        /**
         * Check if a block is the last one.
         */
        bool is_last (uint64_t index) const {
            return index == num_blocks ();
        }

        /**
         * Read a block.
         * The same block can be read any number of times.
         * @param index A block index, 1 to num_blocks().
         * @param data Replaced with the block data.
         * @return errc::ok on success, errc::io_error if the
         *         index is out of range or the file can't be read
         *         or has been truncated.
         */
        errc read (uint64_t index, std::vector<uint8_t>& data);

    private:
        std::unique_ptr<open_file> file;
        uint64_t size;
        size_t blk_size;
    };

}


#endif
