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
#include <rotftp/block_reader.hpp>
#include <rotftp/log.hpp>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <cinttypes>


namespace rotftp {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    block_reader::block_reader (std::unique_ptr<open_file> f, size_t block_size)
        : file (std::move(f)),
          size (0),
          blk_size (block_size)
    {
        if (!file)
            throw std::invalid_argument ("No file");
        if (blk_size == 0)
            throw std::invalid_argument ("Invalid block size");
        size = file->size ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint64_t block_reader::num_blocks () const
    {
        return size / blk_size + 1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t block_reader::block_length (uint64_t index) const
    {
        if (index < 1 || index > num_blocks())
            return 0;
        if (index < num_blocks())
            return blk_size;
        return (size_t) (size % blk_size);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    errc block_reader::read (uint64_t index, std::vector<uint8_t>& data)
    {
        if (index < 1 || index > num_blocks()) {
            log::debug ("Block %" PRIu64 " out of range, file has %" PRIu64 " blocks",
                        index, num_blocks());
            return errc::io_error;
        }

        size_t length = block_length (index);
        uint64_t offset = (index - 1) * blk_size;

        data.resize (length);
        size_t pos = 0;
        while (pos < length) {
            auto result = file->pread (data.data()+pos, length-pos, offset+pos);
            if (result < 0) {
                log::info ("File read error at offset %" PRIu64 ": %s",
                           offset+pos, strerror(errno));
                data.clear ();
                return errc::io_error;
            }
            else if (result == 0) {
                log::info ("Unexpected end of file at offset %" PRIu64 ", file truncated?",
                           offset+pos);
                data.clear ();
                return errc::io_error;
            }
            pos += (size_t) result;
        }

        return errc::ok;
    }


}
