/*
 * File: include/common/read_model.hpp
 * Project: Tool Sync
 * Purpose: Typed views over the shared and per-user layers of a tool state
 * Notes:
 *  - Shared layer: counters / collections keyed "elementId:key"
 *  - Per-user layer: users.<userId>.selections / participation keyed "elementId:key"
 *  - Views are read-only; the engine itself never interprets state
 * Last updated: 2026-10-19
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

inline std::string element_key(const std::string &element_id, const std::string &key)
{
    return element_id + ":" + key;
}

// "poll-1:yes" -> {"poll-1", "yes"}; keys without ':' yield nullopt.
inline std::optional<std::pair<std::string, std::string>> split_element_key(const std::string &k)
{
    auto p = k.find(':');
    if (p == std::string::npos || p == 0)
        return std::nullopt;
    return std::make_pair(k.substr(0, p), k.substr(p + 1));
}

// Entries of state[layer] whose key belongs to element_id, re-keyed by the suffix.
inline nlohmann::json element_slice(const nlohmann::json &layer, const std::string &element_id)
{
    nlohmann::json out = nlohmann::json::object();
    if (!layer.is_object())
        return out;
    for (auto it = layer.begin(); it != layer.end(); ++it)
    {
        auto parts = split_element_key(it.key());
        if (parts && parts->first == element_id)
            out[parts->second] = it.value();
    }
    return out;
}

inline const nlohmann::json &field_or_null(const nlohmann::json &j, const char *k)
{
    static const nlohmann::json null_value;
    if (!j.is_object())
        return null_value;
    auto it = j.find(k);
    return it == j.end() ? null_value : *it;
}

// Counter tallies for one element, e.g. poll option -> votes.
inline std::map<std::string, long long> counter_tally(const nlohmann::json &state, const std::string &element_id)
{
    std::map<std::string, long long> out;
    auto slice = element_slice(field_or_null(state, "counters"), element_id);
    for (auto it = slice.begin(); it != slice.end(); ++it)
        if (it.value().is_number())
            out[it.key()] = it.value().get<long long>();
    return out;
}

inline nlohmann::json shared_view(const nlohmann::json &state, const std::string &element_id)
{
    return nlohmann::json{{"counters", element_slice(field_or_null(state, "counters"), element_id)},
                          {"collections", element_slice(field_or_null(state, "collections"), element_id)}};
}

inline nlohmann::json user_view(const nlohmann::json &state, const std::string &user_id,
                                const std::string &element_id)
{
    const auto &u = field_or_null(field_or_null(state, "users"), user_id.c_str());
    return nlohmann::json{{"selections", element_slice(field_or_null(u, "selections"), element_id)},
                          {"participation", element_slice(field_or_null(u, "participation"), element_id)}};
}
