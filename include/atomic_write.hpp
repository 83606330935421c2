/*
 * File: include/atomic_write.hpp
 * Project: Tool Sync
 * Purpose: Crash-safe file primitives for the file document store
 * Notes:
 *  - Writes go to <path>.tmp, are fsynced, then renamed over the target
 *  - All failures raise StoreError
 * Last updated: 2026-10-19
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include "common/errors.hpp"

inline void fsync_path(const std::filesystem::path &p)
{
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
}

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
inline void write_atomic(const std::filesystem::path &final_path, const std::string &data)
{
    std::filesystem::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw StoreError("open tmp failed: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw StoreError("write tmp failed: " + tmp.string());
    }
    fsync_path(tmp);
    std::error_code ec;
    std::filesystem::rename(tmp, final_path, ec);
    if (ec)
    {
        std::filesystem::remove(tmp, ec);
        throw StoreError("rename tmp->dst failed: " + final_path.string());
    }
}

inline void append_line(const std::filesystem::path &dst, const std::string &line)
{
    std::ofstream f(dst, std::ios::app);
    if (!f)
        throw StoreError("open for append failed: " + dst.string());
    f << line << '\n';
    if (!f)
        throw StoreError("append failed: " + dst.string());
}

inline bool read_file_all(const std::filesystem::path &p, std::string &out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

inline void ensure_dir(const std::filesystem::path &p)
{
    std::error_code ec;
    if (!std::filesystem::exists(p, ec))
    {
        std::filesystem::create_directories(p, ec);
        if (ec)
            throw StoreError("create_directories failed: " + ec.message());
    }
}
