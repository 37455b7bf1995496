#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace TermXfer {

    /**
     * @brief Flat key=value configuration store.
     *
     * Files are read line by line; blank lines and lines starting with '#'
     * are skipped, as are lines without '='. Keys are dotted
     * ("transfer.expire_minutes"). Numeric getters fall back to the default
     * when the stored value does not parse.
     */
    class Config {
    public:
        Config() = default;

        /// @return false when the file cannot be opened
        bool loadFromFile(const std::string& path, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
