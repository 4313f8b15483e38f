/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <exception>
#include <ostream>
#include <string>

namespace conduct {

/**
 * Logger - process-wide leveled log sink
 *
 * Writes one line per record to std::cerr unless another stream is set.
 * Records below the configured level are dropped; the default level is info.
 *
 * Usage:
 *   Logger::set_level(Logger::Level::debug);
 *   Logger::debug("calc: dispatching add");
 */
class Logger {
public:
    enum class Level { debug = 0, info, warn, error, off };

    static void set_level(Level level);
    static Level level();

    /// Redirect output; nullptr restores std::cerr. The stream must outlive its use.
    static void set_sink(std::ostream* sink);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);

    /// "<type>: <what>" followed by the backtrace of a conduct::Error, one frame per line.
    static std::string format_exception(const std::exception_ptr& ex);

private:
    static void write(Level level, const std::string& msg);
};

} // namespace conduct
