/*
 * File: include/common/file_document_store.hpp
 * Project: Tool Sync
 * Purpose: Directory-backed DocumentStore
 * Notes:
 *  - Layout: <root>/<collection>/<percent-encoded id>.json
 *  - Atomic file writes via include/atomic_write.hpp
 *  - One process owns a data dir; put_if is serialized by an in-process mutex
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include "atomic_write.hpp"
#include "common/document_store.hpp"

namespace fs = std::filesystem;

inline std::string encode_doc_id(const std::string &id)
{
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id)
    {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '_' || c == '-' || c == '.';
        if (safe && !(c == '.' && out.empty()))
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

class FileDocumentStore : public DocumentStore
{
    fs::path root_;
    std::mutex m_;

    fs::path dir_for(const std::string &collection) const { return root_ / encode_doc_id(collection); }

    fs::path file_for(const std::string &collection, const std::string &id) const
    {
        return dir_for(collection) / (encode_doc_id(id) + ".json");
    }

    std::optional<Doc> load(const fs::path &p)
    {
        std::error_code ec;
        if (!fs::exists(p, ec))
        {
            if (ec)
                throw StoreError("stat failed: " + p.string());
            return std::nullopt;
        }
        std::string s;
        if (!read_file_all(p, s))
            throw StoreError("read failed: " + p.string());
        auto j = Doc::parse(s, nullptr, false);
        if (j.is_discarded())
            throw StoreError("corrupt document: " + p.string());
        return j;
    }

    void store(const std::string &collection, const std::string &id, const Doc &doc)
    {
        ensure_dir(dir_for(collection));
        write_atomic(file_for(collection, id), doc.dump());
    }

public:
    explicit FileDocumentStore(fs::path root) : root_(std::move(root)) { ensure_dir(root_); }

    const fs::path &root() const { return root_; }

    std::optional<Doc> get(const std::string &collection, const std::string &id) override
    {
        std::scoped_lock lk(m_);
        return load(file_for(collection, id));
    }

    void put(const std::string &collection, const std::string &id, const Doc &doc) override
    {
        std::scoped_lock lk(m_);
        store(collection, id, doc);
    }

    bool put_if(const std::string &collection, const std::string &id, const Guard &guard,
                const Doc &desired) override
    {
        std::scoped_lock lk(m_);
        if (!guard(load(file_for(collection, id))))
            return false;
        store(collection, id, desired);
        return true;
    }

    bool erase(const std::string &collection, const std::string &id) override
    {
        std::scoped_lock lk(m_);
        std::error_code ec;
        bool removed = fs::remove(file_for(collection, id), ec);
        if (ec)
            throw StoreError("remove failed: " + ec.message());
        return removed;
    }

    std::vector<Doc> scan(const std::string &collection, const Filter &filter) override
    {
        std::scoped_lock lk(m_);
        std::vector<Doc> out;
        std::error_code ec;
        auto dir = dir_for(collection);
        if (!fs::exists(dir, ec))
            return out;
        for (const auto &entry : fs::directory_iterator(dir, ec))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
                continue;
            auto doc = load(entry.path());
            if (doc && (!filter || filter(*doc)))
                out.push_back(std::move(*doc));
        }
        if (ec)
            throw StoreError("scan failed: " + ec.message());
        return out;
    }

    // Appended documents also land in <collection>/index.jsonl.
    void on_appended(const std::string &collection, const Doc &doc) override
    {
        std::scoped_lock lk(m_);
        ensure_dir(dir_for(collection));
        append_line(dir_for(collection) / "index.jsonl", doc.dump());
    }
};
