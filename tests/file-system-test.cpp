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
#include <rotftp/file_system.hpp>
#include <fstream>
#include <vector>
#include <string>
#include <system_error>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "test-util.hpp"

using namespace rotftp;


class posix_file_system_test : public ::testing::Test {
protected:
    void SetUp () override {
        root = make_temp_dir ();
        outside = make_temp_dir ();
    }

    void TearDown () override {
        for (auto i=created.rbegin(); i!=created.rend(); ++i)
            remove (i->c_str());
    }

    std::string make_temp_dir () {
        char tmpl[] = "/tmp/rotftp-test-XXXXXX";
        auto* dir = mkdtemp (tmpl);
        EXPECT_NE (dir, nullptr) << strerror(errno);
        std::string path (dir ? dir : "");
        created.push_back (path);
        return path;
    }

    void make_file (const std::string& path, const std::vector<uint8_t>& content) {
        std::ofstream out (path, std::ios::binary);
        out.write ((const char*)content.data(), content.size());
        ASSERT_TRUE (out.good());
        created.push_back (path);
    }

    void make_dir (const std::string& path) {
        ASSERT_EQ (mkdir(path.c_str(), 0755), 0) << strerror(errno);
        created.push_back (path);
    }

    void make_symlink (const std::string& target, const std::string& path) {
        ASSERT_EQ (symlink(target.c_str(), path.c_str()), 0) << strerror(errno);
        created.push_back (path);
    }

    std::vector<uint8_t> read_all (open_file& file) {
        std::vector<uint8_t> data (file.size());
        size_t pos = 0;
        while (pos < data.size()) {
            auto result = file.pread (data.data()+pos, data.size()-pos, pos);
            if (result <= 0)
                break;
            pos += result;
        }
        data.resize (pos);
        return data;
    }

    std::string root;
    std::string outside;
    std::vector<std::string> created;
};


TEST_F (posix_file_system_test, open_file)
{
    auto content = test::make_data (1234);
    make_file (root + "/file.bin", content);
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    ASSERT_EQ (fs.open("file.bin", file), errc::ok);
    ASSERT_TRUE (file != nullptr);
    EXPECT_EQ (file->size(), 1234u);
    EXPECT_EQ (read_all(*file), content);

    // Read at an offset
    uint8_t buf[4];
    ASSERT_EQ (file->pread(buf, sizeof(buf), 1000), 4);
    EXPECT_EQ (memcmp(buf, content.data()+1000, sizeof(buf)), 0);
    EXPECT_EQ (file->pread(buf, sizeof(buf), 1234), 0);
}


TEST_F (posix_file_system_test, file_in_subdirectory)
{
    make_dir (root + "/boot");
    make_file (root + "/boot/kernel", test::make_data(10));
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open("boot/kernel", file), errc::ok);
    EXPECT_EQ (fs.open("boot", file), errc::not_regular_file);
}


TEST_F (posix_file_system_test, not_found)
{
    posix_file_system fs (root);
    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open("missing", file), errc::not_found);
    EXPECT_EQ (fs.open("missing/file", file), errc::not_found);
    EXPECT_TRUE (file == nullptr);
}


TEST_F (posix_file_system_test, parent_directory_is_refused)
{
    make_file (outside + "/secret", test::make_data(10));
    make_dir (root + "/sub");
    make_file (root + "/top", test::make_data(10));
    posix_file_system fs (root);

    std::string outside_name = outside.substr (outside.rfind('/')+1);
    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open("../" + outside_name + "/secret", file), errc::access_denied);
    EXPECT_EQ (fs.open("sub/../top", file), errc::access_denied);
    EXPECT_EQ (fs.open("..", file), errc::access_denied);
    EXPECT_TRUE (file == nullptr);
}


TEST_F (posix_file_system_test, dots_in_file_names)
{
    make_file (root + "/..hidden", test::make_data(10));
    make_file (root + "/file..bak", test::make_data(10));
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open("..hidden", file), errc::ok);
    EXPECT_EQ (fs.open("file..bak", file), errc::ok);
}


TEST_F (posix_file_system_test, absolute_path_is_refused)
{
    make_file (outside + "/secret", test::make_data(10));
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open(outside + "/secret", file), errc::access_denied);
}


TEST_F (posix_file_system_test, symlink_out_of_root)
{
    make_file (outside + "/secret", test::make_data(10));
    make_symlink (outside + "/secret", root + "/link");
    make_symlink (outside, root + "/dirlink");
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open("link", file), errc::access_denied);
    EXPECT_EQ (fs.open("dirlink/secret", file), errc::access_denied);
}


TEST_F (posix_file_system_test, symlink_within_root)
{
    auto content = test::make_data (100);
    make_file (root + "/real", content);
    make_symlink ("real", root + "/alias");
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    ASSERT_EQ (fs.open("alias", file), errc::ok);
    EXPECT_EQ (read_all(*file), content);
}


TEST_F (posix_file_system_test, root_directory)
{
    posix_file_system fs (root + "/");
    ASSERT_FALSE (fs.root().empty());
    EXPECT_EQ (fs.root().back(), '/');

    std::unique_ptr<open_file> file;
    EXPECT_EQ (fs.open(".", file), errc::not_regular_file);
}


TEST_F (posix_file_system_test, invalid_root)
{
    make_file (root + "/file", test::make_data(1));
    EXPECT_THROW (posix_file_system(root + "/missing"), std::system_error);
    EXPECT_THROW (posix_file_system(root + "/file"), std::invalid_argument);
}


TEST_F (posix_file_system_test, file_is_closed_by_the_handle)
{
    make_file (root + "/file", test::make_data(1));
    posix_file_system fs (root);

    std::unique_ptr<open_file> file;
    ASSERT_EQ (fs.open("file", file), errc::ok);
    int fd = dynamic_cast<posix_open_file&>(*file).handle ();
    EXPECT_NE (fcntl(fd, F_GETFD), -1);

    file.reset ();
    EXPECT_EQ (fcntl(fd, F_GETFD), -1);
    EXPECT_EQ (errno, EBADF);
}
