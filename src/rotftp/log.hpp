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
#ifndef ROTFTP_LOG_HPP
#define ROTFTP_LOG_HPP

#include <functional>
#include <atomic>
#include <string>
#include <mutex>
#include <cstdlib>
#include <cstdarg>
#include <syslog.h>


namespace rotftp {


    /**
     * Callback for log messages.
     * This callback is called whenever a message is logged with
     * a method in class log.
     *
     * <b>NOTE:</b> Do not call log::set_callback from inside
     *              the callback since it will cause a deadlock!
     *
     * @param priority A syslog priority.<br>
     *                 One of: LOG_EMERG, LOG_ALERT, LOG_CRIT, LOG_ERR,
     *                 LOG_WARNING, LOG_NOTICE, LOG_INFO, and LOG_DEBUG.
     * @param message A null terminated string containing the log message.
     */
    using log_callback_t = std::function<void (unsigned int priority,
                                               const char* message)>;


    /**
     * The default log callback function used by class log.
     * This callback calls <code>syslog()</code> to send the log message
     * to the system logger. It does not call <code>openlog()</code>,
     * that is up to the program.
     *
     * @param priority A syslog priority.
     * @param message A null terminated string containing the log message.
     */
    void default_log_callback (unsigned int priority, const char* message);


    /**
     * Log messages produced by rotftp.
     * Messages are logged with the same priority values used by syslog,
     * from LOG_EMERG (highest) to LOG_DEBUG (lowest).
     *
     * All methods are static and the constructor is
     * deleted to prevent instantiation of this class.
     * @see default_log_callback
     */
    class log {
    public:
        static constexpr unsigned default_prio_level = LOG_INFO;

        log () = delete; // Prevent instantiation of this class.

        /**
         * Get the current log priority.
         * Messages with lower priority than the current log priority will not be logged.
         * @return The current log priority.
         */
        static unsigned int priority () {
            return prio_level;
        }

        /**
         * Set a new log priority.
         * @param priority_threshold The priority threshold for log messages.
         */
        static void priority (unsigned int priority_threshold) {
            prio_level = priority_threshold;
        }

        /**
         * This will log a message with priority LOG_ERR.
         * @param format A <code>printf</code>-style format string.
         */
        static void error (const char* format, ...) {
            if (prio_level >= LOG_ERR) {
                va_list args;
                va_start (args, format);
                vlog (LOG_ERR, format, args);
                va_end (args);
            }
        }

        /**
         * This will log a message with priority LOG_WARNING.
         * @param format A <code>printf</code>-style format string.
         */
        static void warning (const char* format, ...) {
            if (prio_level >= LOG_WARNING) {
                va_list args;
                va_start (args, format);
                vlog (LOG_WARNING, format, args);
                va_end (args);
            }
        }

        /**
         * This will log a message with priority LOG_NOTICE.
         * @param format A <code>printf</code>-style format string.
         */
        static void notice (const char* format, ...) {
            if (prio_level >= LOG_NOTICE) {
                va_list args;
                va_start (args, format);
                vlog (LOG_NOTICE, format, args);
                va_end (args);
            }
        }

        /**
         * This will log a message with priority LOG_INFO.
         * @param format A <code>printf</code>-style format string.
         */
        static void info (const char* format, ...) {
            if (prio_level >= LOG_INFO) {
                va_list args;
                va_start (args, format);
                vlog (LOG_INFO, format, args);
                va_end (args);
            }
        }

        /**
         * This will log a message with priority LOG_DEBUG.
         * @param format A <code>printf</code>-style format string.
         */
        static void debug (const char* format, ...) {
            if (prio_level >= LOG_DEBUG) {
                va_list args;
                va_start (args, format);
                vlog (LOG_DEBUG, format, args);
                va_end (args);
            }
        }

        /**
         * Set a callback function that handles log messages
         * produced by the methods in this class.
         *
         * <b>NOTE:</b> Do not call this method from inside the
         *              log callback, it will cause a deadlock!
         *
         * @param callback Function that vill be called when
         *                 a message is logged using this class.<br/>
         *                 If set to <code>nullptr</code>, no logging
         *                 will be done.
         */
        static void set_callback (log_callback_t callback);


    private:
        static void vlog (unsigned int priority, const char* format, va_list& args);

        static std::mutex log_mutex;
        static std::atomic_uint prio_level;
        static log_callback_t cb;
    };

}
#endif
