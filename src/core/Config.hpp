#pragma once

/**
 * Config.hpp
 * 
 * Importer settings kept as one JSON document with dot-path access
 * ("downloads.chunkSize"). The file may hold the ingestion API key and
 * the source access token, so it is written owner-only.
 */

#include "../utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace takeout::core {

using json = nlohmann::json;

/**
 * Config - Thread-safe singleton
 * 
 * Components read their settings when they are constructed, so values
 * must be loaded before the pipeline is assembled.
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }
    
    /**
     * Merge a config file over the current values
     * @return false if the file is missing, unreadable or not a JSON object;
     *         the current values are then left untouched
     */
    bool load(const std::string& path) {
        std::error_code ec;
        auto content = utils::FileUtils::readFile(path, ec);
        if (!content) {
            return false;
        }

        json loaded = json::parse(*content, nullptr, false);
        if (loaded.is_discarded() || !loaded.is_object()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(loaded);
        m_configPath = path;
        return true;
    }
    
    /**
     * Write the document (0600) inside an owner-only directory
     * @param path Target file; the last loaded or saved path when empty
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        std::filesystem::path target = path.empty() ? m_configPath : path;
        if (target.empty()) {
            return false;
        }
        
        std::error_code ec;
        if (target.has_parent_path() &&
            !utils::FileUtils::createPrivateDirectory(target.parent_path(), ec)) {
            return false;
        }
        if (!utils::FileUtils::writeFileAtomic(target, m_config.dump(4), ec, 0600)) {
            return false;
        }
        m_configPath = target.string();
        return true;
    }
    
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        m_config = {
            {"server", {
                {"url", ""},
                {"apiKey", ""}
            }},
            {"source", {
                {"accessToken", ""},
                {"baseUrl", "https://www.googleapis.com/drive/v3"},
                {"query", "name contains 'takeout' and mimeType = 'application/zip' and trashed = false"}
            }},
            {"downloads", {
                {"chunkSize", 32768},
                {"connectTimeout", 30000},
                {"lowSpeedTimeout", 60},
                {"verifyChecksums", true}
            }},
            {"uploads", {
                {"timeout", 300000},
                {"checkpointInterval", 100},
                {"maxEntrySize", int64_t{4} << 30},
                {"deviceId", "takeout-importer"}
            }},
            {"paths", {
                {"dataDir", ""}
            }},
            {"logging", {
                {"level", "info"}
            }}
        };
    }
    
    /**
     * Read a value by dot path
     * @return defaultValue when the key is absent or holds another type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        const json* node = find(key);
        if (!node) {
            return defaultValue;
        }
        try {
            return node->get<T>();
        } catch (const json::type_error&) {
            return defaultValue;
        }
    }
    
    /**
     * Write a value by dot path, creating intermediate objects
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }
    
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return find(key) != nullptr;
    }
    
    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        json::json_pointer ptr = toJsonPointer(key);
        json::json_pointer parent = ptr.parent_pointer();
        if (!find(key)) {
            return;
        }
        m_config[parent].erase(ptr.back());
    }
    
    /**
     * Apply a JSON merge patch (RFC 7386)
     */
    void merge(const json& patch) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(patch);
    }
    
    std::string path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
    }

private:
    Config() {
        setDefaults();
    }
    
    ~Config() = default;
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    
    // Caller holds m_mutex
    const json* find(const std::string& key) const {
        const json* node = &m_config;
        size_t start = 0;
        while (start <= key.size()) {
            size_t dot = key.find('.', start);
            std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!node->is_object()) {
                return nullptr;
            }
            auto it = node->find(part);
            if (it == node->end()) {
                return nullptr;
            }
            node = &*it;
            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }
        return node;
    }

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += (c == '.') ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace takeout::core
