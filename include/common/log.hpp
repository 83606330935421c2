/*
 * File: include/common/log.hpp
 * Project: Tool Sync
 * Purpose: Line-oriented logging to stdout/stderr
 * Notes:
 *  - Info goes to stdout, WARN/ERROR to stderr
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include "common/time_util.hpp"

inline std::atomic<bool> &log_quiet_flag()
{
    static std::atomic<bool> quiet{false};
    return quiet;
}

inline void set_log_quiet(bool q) { log_quiet_flag().store(q); }

inline std::mutex &log_mutex()
{
    static std::mutex m;
    return m;
}

inline void log_line(std::ostream &os, const char *level, const std::string &component, const std::string &msg)
{
    std::scoped_lock lk(log_mutex());
    os << iso8601_now_ms() << ' ' << level << " [" << component << "] " << msg << '\n';
}

inline void log_info(const std::string &component, const std::string &msg)
{
    if (log_quiet_flag().load())
        return;
    log_line(std::cout, "INFO", component, msg);
}

inline void log_warn(const std::string &component, const std::string &msg)
{
    log_line(std::cerr, "WARN", component, msg);
}

inline void log_error(const std::string &component, const std::string &msg)
{
    log_line(std::cerr, "ERROR", component, msg);
}
