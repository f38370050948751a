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
#include <rotftp.hpp>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <memory>
#include <string>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <csignal>
#include <unistd.h>
#include <syslog.h>
#include <sys/types.h>
#include <pwd.h>
#include <grp.h>

#include "rotftpd-options.hpp"

using std::cout;
using std::cerr;
using std::endl;


struct appstate_t {
    appstate_t (const appargs_t& appargs)
        : opt(appargs)
    {
        uid = getuid ();
        gid = getgid ();
    }

    const appargs_t& opt;
    std::string real_tftproot;
    uid_t uid;
    gid_t gid;
};


static rotftp::tftp_server* running_server = nullptr;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void cmd_signal_handler (int sig)
{
    // Signal the TFTP server to stop
    if (running_server)
        running_server->stop ();
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void init_signal_handler ()
{
    struct sigaction sa;
    memset (&sa, 0, sizeof(sa));
    sigemptyset (&sa.sa_mask);
    sa.sa_handler = cmd_signal_handler;
    sigaction (SIGINT, &sa, nullptr);
    sigaction (SIGTERM, &sa, nullptr);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void stdout_logger (unsigned prio, const char* msg)
{
    cout << '[' << gettid() << "] ";
    switch (prio) {
    case LOG_EMERG:
        cout << "EMERG: ";
        break;
    case LOG_ALERT:
        cout << "ALERT: ";
        break;
    case LOG_CRIT:
        cout << "CRIT: ";
        break;
    case LOG_ERR:
        cout << "ERROR: ";
        break;
    case LOG_WARNING:
        cout << "WARNING: ";
        break;
    case LOG_NOTICE:
        cout << "NOTICE: ";
        break;
    case LOG_INFO:
        cout << "INFO: ";
        break;
    case LOG_DEBUG:
        cout << "DEBUG: ";
        break;
    }
    cout << msg << endl;
}


//------------------------------------------------------------------------------
// Look up a user by name or numeric id.
//------------------------------------------------------------------------------
static int get_uid (const std::string& user, uid_t& uid)
{
    struct passwd* pwd = nullptr;
    char* end = nullptr;
    errno = 0;
    auto id = strtoul (user.c_str(), &end, 10);
    if (!user.empty() && *end=='\0')
        pwd = getpwuid ((uid_t)id);
    else
        pwd = getpwnam (user.c_str());
    if (!pwd)
        return -1;

    uid = pwd->pw_uid;
    return 0;
}


//------------------------------------------------------------------------------
// Look up a group by name or numeric id.
//------------------------------------------------------------------------------
static int get_gid (const std::string& group, gid_t& gid)
{
    struct group* grp = nullptr;
    char* end = nullptr;
    errno = 0;
    auto id = strtoul (group.c_str(), &end, 10);
    if (!group.empty() && *end=='\0')
        grp = getgrgid ((gid_t)id);
    else
        grp = getgrnam (group.c_str());
    if (!grp)
        return -1;

    gid = grp->gr_gid;
    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int set_tftproot (appstate_t& app)
{
    // Get the canonical server root path
    //
    auto* path = realpath (app.opt.tftproot.c_str(), nullptr);
    if (path) {
        app.real_tftproot = path;
        app.real_tftproot.append ("/");
        free (path);
    }else{
        return -1;
    }

    return chdir (app.real_tftproot.c_str());
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int set_privileges (appstate_t& app)
{
    // Get uid and gid from application arguments
    if (!app.opt.user.empty() && get_uid(app.opt.user, app.uid)) {
        rotftp::log::error ("Unable to set user id: %s",
                            (errno ? strerror(errno) : "No such user."));
        return -1;
    }
    if (!app.opt.group.empty() && get_gid(app.opt.group, app.gid)) {
        rotftp::log::error ("Unable to set group id: %s",
                            (errno ? strerror(errno) : "No such group."));
        return -1;
    }

    // Set group id
    if (app.gid != getgid()) {
        rotftp::log::debug ("Setting group id to %u", (unsigned(app.gid)));
        errno = 0;
        if (setgid(app.gid)) {
            rotftp::log::error ("Unable to set group id: %s", strerror(errno));
            return -1;
        }
    }

    // Set user id
    if (app.uid != getuid()) {
        errno = 0;
        rotftp::log::debug ("Setting user id to %u", (unsigned(app.uid)));
        if (setuid(app.uid)) {
            rotftp::log::error ("Unable to set user id: %s", strerror(errno));
            return -1;
        }
    }

    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int main (int argc, char* argv[])
{
    // Parse arguments
    //
    appargs_t opt;
    auto parse_result = opt.parse_args (argc, argv);
    if (parse_result) {
        return parse_result<0 ? 1 : 0;
    }

    appstate_t app (opt);

    // Configure logging
    //
    if (opt.log_to_stdout) {
        rotftp::log::set_callback (stdout_logger);
    }else{
        openlog ("rotftpd", LOG_PID, LOG_DAEMON);
    }
    rotftp::log::priority (opt.verbose ? LOG_DEBUG : LOG_INFO);

    // Change working directory to the tftp root
    //
    if (set_tftproot(app)) {
        rotftp::log::error ("Unable to set working directory %s: %s",
                            opt.tftproot.c_str(), strerror(errno));
        exit (1);
    }

    std::unique_ptr<rotftp::posix_file_system> fs;
    try {
        fs.reset (new rotftp::posix_file_system(app.real_tftproot));
    }
    catch (std::exception& e) {
        rotftp::log::error ("Unable to serve files from %s: %s",
                            app.real_tftproot.c_str(), e.what());
        exit (1);
    }

    rotftp::engine engine (*fs, opt.max_clients);
    if (opt.dump)
        engine.packet_dump (rotftp::log_packet_dump);

    // Open the server socket
    //
    rotftp::tftp_server server (engine, opt.session_timeout);
    if (server.open(opt.bind_addr))
        exit (1);

    // Server ready to serve, but first drop privileges
    //
    if (set_privileges(app))
        exit (1);

    // Exit gracefully on CTRL-C (SIGINT) and SIGTERM
    //
    running_server = &server;
    init_signal_handler ();

    rotftp::log::notice ("Serving files from %s, directory %s",
                       server.addr().to_string(true).c_str(),
                       app.real_tftproot.c_str());
    if (opt.max_clients)
        rotftp::log::debug ("Maximum number of concurrent clients: %lu", (unsigned long)opt.max_clients);

    // Serve until SIGINT or SIGTERM
    //
    int result = server.run ();
    running_server = nullptr;

    // Stop pending sessions
    //
    engine.clear ();
    server.close ();

    rotftp::log::notice ("Stopped");
    return result ? 1 : 0;
}
