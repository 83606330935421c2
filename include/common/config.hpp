/*
 * File: include/common/config.hpp
 * Project: Tool Sync
 * Purpose: Server configuration: defaults, JSON file, command-line overrides
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

struct ServerConfig
{
    std::string http_bind = "0.0.0.0:8080";
    std::string ws_bind = "0.0.0.0:8090";
    std::string data_dir = "/data";
    std::string store = "file"; // file | memory
    int threads = 1;
    int heartbeat_ms = 30000;
    int poll_ms = 2000;
    int poll_window_ms = 5000;
    int stream_batch = 5;
    int history_default_limit = 50;
    int history_max_limit = 100;
    int ack_default_minutes = 60;
    int cas_retries = 16;
    std::map<std::string, std::string> tokens; // bearer token -> user id
};

namespace detail
{
template <typename T>
void read_key(const nlohmann::json &j, const char *key, T &out)
{
    auto it = j.find(key);
    if (it == j.end())
        return;
    try
    {
        out = it->get<T>();
    }
    catch (const nlohmann::json::exception &)
    {
        throw std::runtime_error(std::string("config: bad value for '") + key + "'");
    }
}
} // namespace detail

inline void apply_config_json(const nlohmann::json &j, ServerConfig &c)
{
    if (!j.is_object())
        throw std::runtime_error("config: top level must be an object");
    detail::read_key(j, "http", c.http_bind);
    detail::read_key(j, "ws", c.ws_bind);
    detail::read_key(j, "data_dir", c.data_dir);
    detail::read_key(j, "store", c.store);
    detail::read_key(j, "threads", c.threads);
    detail::read_key(j, "heartbeat_ms", c.heartbeat_ms);
    detail::read_key(j, "poll_ms", c.poll_ms);
    detail::read_key(j, "poll_window_ms", c.poll_window_ms);
    detail::read_key(j, "stream_batch", c.stream_batch);
    detail::read_key(j, "history_default_limit", c.history_default_limit);
    detail::read_key(j, "history_max_limit", c.history_max_limit);
    detail::read_key(j, "ack_default_minutes", c.ack_default_minutes);
    detail::read_key(j, "cas_retries", c.cas_retries);
    detail::read_key(j, "tokens", c.tokens);
    if (c.store != "file" && c.store != "memory")
        throw std::runtime_error("config: store must be 'file' or 'memory'");
    if (c.threads < 1 || c.poll_ms < 1 || c.heartbeat_ms < 1 || c.stream_batch < 1 || c.cas_retries < 1)
        throw std::runtime_error("config: intervals, threads, batch and retries must be positive");
}

inline void load_config_file(const std::filesystem::path &p, ServerConfig &c)
{
    std::ifstream f(p);
    if (!f)
        throw std::runtime_error("config: cannot open " + p.string());
    auto j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("config: invalid JSON in " + p.string());
    apply_config_json(j, c);
}

// --config is applied first so that explicit flags win over the file.
inline ServerConfig config_from_args(int argc, char **argv)
{
    ServerConfig c;
    for (int i = 1; i + 1 < argc; ++i)
        if (std::string(argv[i]) == "--config")
            load_config_file(argv[i + 1], c);

    nlohmann::json flags = nlohmann::json::object();
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (i + 1 >= argc)
            break;
        if (a == "--http")
            flags["http"] = argv[++i];
        else if (a == "--ws")
            flags["ws"] = argv[++i];
        else if (a == "--data")
            flags["data_dir"] = argv[++i];
        else if (a == "--store")
            flags["store"] = argv[++i];
        else if (a == "--threads")
        {
            try
            {
                flags["threads"] = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error("config: --threads expects a number");
            }
        }
    }
    apply_config_json(flags, c);
    return c;
}

inline nlohmann::json config_to_json(const ServerConfig &c)
{
    return nlohmann::json{{"http", c.http_bind},
                          {"ws", c.ws_bind},
                          {"data_dir", c.data_dir},
                          {"store", c.store},
                          {"threads", c.threads},
                          {"heartbeat_ms", c.heartbeat_ms},
                          {"poll_ms", c.poll_ms},
                          {"poll_window_ms", c.poll_window_ms},
                          {"stream_batch", c.stream_batch},
                          {"history_default_limit", c.history_default_limit},
                          {"history_max_limit", c.history_max_limit},
                          {"ack_default_minutes", c.ack_default_minutes}};
}

inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos)
        throw std::runtime_error("bind address must be host:port: " + s);
    return {s.substr(0, p), static_cast<unsigned short>(std::stoi(s.substr(p + 1)))};
}
