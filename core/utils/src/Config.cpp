#include "Config.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace ChatStorage {

    namespace {

        std::string stripBlanks(const std::string& text) {
            const char* blanks = " \t\r\n";
            auto first = text.find_first_not_of(blanks);
            if (first == std::string::npos) return "";
            return text.substr(first, text.find_last_not_of(blanks) - first + 1);
        }

        std::string lowered(std::string text) {
            for (auto& c : text) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return text;
        }

    }

    Config& Config::instance() {
        static Config shared;
        return shared;
    }

    bool Config::loadFromFile(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            return false;
        }

        std::unordered_map<std::string, std::string> entries;
        std::string raw;
        for (int lineNo = 1; std::getline(in, raw); ++lineNo) {
            const std::string line = stripBlanks(raw);
            if (line.empty() || line.front() == '#') continue;

            const auto eq = line.find('=');
            const std::string key = eq == std::string::npos ? "" : stripBlanks(line.substr(0, eq));
            if (key.empty()) {
                Logger::instance().log(LogLevel::WARN, path + ":" + std::to_string(lineNo) +
                                       ": expected key = value", "Config");
                continue;
            }
            entries[key] = stripBlanks(line.substr(eq + 1));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries) {
            settings_[entry.first] = std::move(entry.second);
        }
        return true;
    }

    bool Config::loadLayered(const std::vector<std::string>& paths) {
        bool anyLoaded = false;
        for (const auto& path : paths) {
            if (loadFromFile(path)) {
                Logger::instance().log(LogLevel::DEBUG, "Configuration layer " + path, "Config");
                anyLoaded = true;
            }
        }
        return anyLoaded;
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) != 0;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it == settings_.end() ? defaultValue : it->second;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        const std::string text = get(key);
        if (text.empty()) return defaultValue;
        try {
            return std::stoi(text);
        } catch (const std::exception&) {
            Logger::instance().log(LogLevel::WARN, key + " is not an integer: " + text, "Config");
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        const std::string text = get(key);
        if (text.empty() || text.front() == '-') return defaultValue;
        try {
            return static_cast<size_t>(std::stoull(text));
        } catch (const std::exception&) {
            Logger::instance().log(LogLevel::WARN, key + " is not a byte count: " + text, "Config");
            return defaultValue;
        }
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        const std::string text = lowered(get(key));
        if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
        if (text == "0" || text == "false" || text == "no" || text == "off") return false;
        return defaultValue;
    }

    std::vector<std::string> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::vector<std::string> rejected;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& rule : schema) {
            auto it = settings_.find(rule.first);
            if (it != settings_.end() && rule.second && !rule.second(rule.first, it->second)) {
                rejected.push_back(rule.first);
            }
        }
        std::sort(rejected.begin(), rejected.end());
        return rejected;
    }

}
