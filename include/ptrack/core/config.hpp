#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ptrack {

/**
 * @brief Configuration management class
 *
 * Provides hierarchical configuration access with:
 * - YAML file loading
 * - Type-safe value retrieval with defaults
 * - Command-line override support
 */
class Config {
public:
    Config();
    ~Config();

    // Non-copyable, non-movable (guards its tree with a mutex)
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from YAML file
     *
     * @param path Path to YAML file
     * @return true if loaded successfully
     */
    bool load(const std::string& path);

    /**
     * @brief Get string value
     *
     * @param key Dot-separated key path (e.g., "tracker.max_age")
     * @param default_value Value to return if key not found
     * @return Configuration value or default
     */
    std::string get_string(const std::string& key,
                           const std::string& default_value = "") const;

    int get_int(const std::string& key, int default_value = 0) const;

    float get_float(const std::string& key, float default_value = 0.0f) const;

    double get_double(const std::string& key, double default_value = 0.0) const;

    bool get_bool(const std::string& key, bool default_value = false) const;

    std::vector<std::string> get_string_list(const std::string& key) const;

    /**
     * @brief Check if key exists (in the file or as an override)
     */
    bool has(const std::string& key) const;

    /**
     * @brief Override value from command line
     *
     * Overrides take precedence over file values.
     */
    void override(const std::string& key, const std::string& value);

    /**
     * @brief Parse command-line arguments
     *
     * Supports --key=value and --key value formats. A bare --key is
     * stored as "true".
     */
    void parse_args(int argc, char* argv[]);

    const std::string& file_path() const { return file_path_; }

private:
    std::string file_path_;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    mutable std::mutex mutex_;

    // Command-line overrides (take precedence)
    std::unordered_map<std::string, std::string> overrides_;

    const std::string* find_override(const std::string& key) const;
};

}  // namespace ptrack
