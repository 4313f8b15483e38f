/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/Logger.hpp"
#include "conduct/Errors.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace conduct {

namespace {

std::atomic<Logger::Level> g_level{Logger::Level::info};
std::ostream* g_sink = nullptr;
std::mutex g_mutex;

const char* level_name(Logger::Level level)
{
    switch (level) {
    case Logger::Level::debug: return "debug";
    case Logger::Level::info:  return "info";
    case Logger::Level::warn:  return "warn";
    case Logger::Level::error: return "error";
    case Logger::Level::off:   break;
    }
    return "";
}

} // namespace

void Logger::set_level(Level level) { g_level.store(level); }

Logger::Level Logger::level() { return g_level.load(); }

void Logger::set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

void Logger::debug(const std::string& msg) { write(Level::debug, msg); }
void Logger::info(const std::string& msg) { write(Level::info, msg); }
void Logger::warn(const std::string& msg) { write(Level::warn, msg); }
void Logger::error(const std::string& msg) { write(Level::error, msg); }

void Logger::write(Level level, const std::string& msg)
{
    if (level < g_level.load() || level == Level::off) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[" << level_name(level) << "] " << msg << std::endl;
}

std::string Logger::format_exception(const std::exception_ptr& ex)
{
    if (!ex) {
        return "no exception";
    }
    std::ostringstream out;
    try {
        std::rethrow_exception(ex);
    } catch (const Error& e) {
        out << boost::core::demangle(typeid(e).name()) << ": " << e.what();
        for (const auto& frame : e.backtrace()) {
            out << "\n\t" << frame;
        }
    } catch (const std::exception& e) {
        out << boost::core::demangle(typeid(e).name()) << ": " << e.what();
    } catch (...) {
        out << "non-standard exception";
    }
    return out.str();
}

} // namespace conduct
