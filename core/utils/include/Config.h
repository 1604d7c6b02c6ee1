#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ChatStorage {

    /**
     * @brief key=value settings store.
     *
     * Files contain one "key = value" per line, '#' starts a comment line.
     * instance() is the process-wide store used by the CLI; tests construct
     * their own instances.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        /// False when the file cannot be opened; malformed lines are logged and skipped
        bool loadFromFile(const std::string& path);

        /// Later files override earlier ones; true if at least one file was read
        bool loadLayered(const std::vector<std::string>& paths);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;

        /// Returns the keys whose validator rejected the stored value, sorted
        std::vector<std::string> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;
    };

}
