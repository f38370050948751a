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
#include <gtest/gtest.h>
#include <rotftp/request.hpp>
#include <string>

using namespace rotftp;


// Parse a read request payload given as a string with embedded null characters
static errc parse (const std::string& payload, read_request_t& req, std::string& errmsg)
{
    return parse_read_request ((const uint8_t*)payload.data(), payload.size(), req, errmsg);
}


TEST (request, filename_and_mode)
{
    read_request_t req;
    std::string errmsg;
    ASSERT_EQ (parse(std::string("pxelinux.0\0octet\0", 17), req, errmsg), errc::ok);
    EXPECT_EQ (req.filename, "pxelinux.0");
    EXPECT_EQ (req.mode, "octet");
    EXPECT_TRUE (req.options.empty());
}


TEST (request, options_in_order)
{
    read_request_t req;
    std::string errmsg;
    std::string payload ("f\0octet\0tsize\0" "0\0blksize\0" "1024\0", 29);
    ASSERT_EQ (parse(payload, req, errmsg), errc::ok);
    ASSERT_EQ (req.options.size(), 2u);
    EXPECT_EQ (req.options[0], option_t("tsize", "0"));
    EXPECT_EQ (req.options[1], option_t("blksize", "1024"));
}


TEST (request, last_byte_must_be_zero)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string("file\0octet", 10), req, errmsg), errc::malformed_request);
    EXPECT_FALSE (errmsg.empty());
}


TEST (request, empty_payload)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string(), req, errmsg), errc::malformed_request);
}


TEST (request, too_few_fields)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string("file\0", 5), req, errmsg), errc::malformed_request);
}


TEST (request, odd_number_of_fields)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string("file\0octet\0tsize\0", 17), req, errmsg), errc::malformed_request);
}


TEST (request, mode_is_case_sensitive)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string("file\0OCTET\0", 11), req, errmsg), errc::unsupported_mode);
    EXPECT_EQ (parse(std::string("file\0netascii\0", 14), req, errmsg), errc::unsupported_mode);
    EXPECT_EQ (parse(std::string("file\0mail\0", 10), req, errmsg), errc::unsupported_mode);
}


TEST (request, empty_filename)
{
    read_request_t req;
    std::string errmsg;
    EXPECT_EQ (parse(std::string("\0octet\0", 7), req, errmsg), errc::malformed_request);
    EXPECT_EQ (parse(std::string("/\0octet\0", 8), req, errmsg), errc::malformed_request);
}


TEST (request, filename_normalization)
{
    EXPECT_EQ (normalize_filename("/boot/kernel"), "boot/kernel");
    EXPECT_EQ (normalize_filename("\\boot\\kernel"), "boot/kernel");
    EXPECT_EQ (normalize_filename("boot\\kernel"), "boot/kernel");
    EXPECT_EQ (normalize_filename("//kernel"), "/kernel");
    EXPECT_EQ (normalize_filename("kernel"), "kernel");
    EXPECT_EQ (normalize_filename(""), "");
}


TEST (request, input_is_not_modified)
{
    read_request_t req;
    std::string errmsg;
    const std::string payload ("\\dir\\file\0octet\0", 16);
    std::string copy (payload);
    ASSERT_EQ (parse(copy, req, errmsg), errc::ok);
    EXPECT_EQ (copy, payload);
    EXPECT_EQ (req.filename, "dir/file");
}
