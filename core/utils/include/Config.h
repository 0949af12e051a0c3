#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace Chunkwise {

    /**
     * @brief Flat key/value configuration store
     *
     * File format:
     * @code
     * # comment
     * [network]
     * port = 5001
     * @endcode
     * A `[section]` header prefixes every following key, so the example
     * above stores `network.port`. Keys before any header are stored as-is.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadFromString(const std::string& text, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        double getDouble(const std::string& key, double defaultValue = 0.0) const;
        void setDouble(const std::string& key, double value);

        /// Returns the first key whose validator rejects its value, empty if all pass.
        /// Keys that are not set are not checked.
        std::string validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        void parseLines(std::istream& in, bool overrideExisting);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
