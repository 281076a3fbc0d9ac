#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace structwire::utils {

/**
 * @brief Config value type
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::vector<std::string>
>;

/**
 * @brief Config file format
 */
enum class ConfigFormat {
    Auto,
    JSON
};

/**
 * @brief Layered key/value configuration
 *
 * Keys use dot notation ("log.level"). Later loads override earlier ones, so
 * callers load defaults, then the config file, then the environment, then the
 * command line.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief Load a config file
     * @param file_path File path
     * @param format File format (Auto detects from the extension)
     * @return true on success
     */
    bool load_from_file(const std::string& file_path, ConfigFormat format = ConfigFormat::Auto);

    /**
     * @brief Load settings from a JSON document; nested objects become dotted keys
     * @param json_content JSON text
     * @return true on success, false on parse error or a non-object document
     */
    bool load_from_json_string(const std::string& json_content);

    /**
     * @brief Load settings from environment variables
     * @param prefix Variable prefix, e.g. "STRUCTWIRE_" maps STRUCTWIRE_LOG_LEVEL to log.level
     * @param keys Keys to look up
     * @return Number of settings loaded
     */
    std::size_t load_from_environment(const std::string& prefix, const std::vector<std::string>& keys);

    /**
     * @brief Load "--key=value" arguments; bare "--flag" becomes true
     * @param argc Argument count
     * @param argv Argument vector
     * @return Number of settings loaded
     *
     * Values are stored as strings and converted by the typed getters.
     * Arguments not starting with "--" are kept in positional order.
     */
    std::size_t load_from_command_line(int argc, const char* const argv[]);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;
    std::vector<std::string> get_string_array(const std::string& key, const std::vector<std::string>& default_value = {}) const;

    void set(const std::string& key, const ConfigValue& value);

    bool has(const std::string& key) const;
    bool remove(const std::string& key);
    void clear();

    const std::vector<std::string>& positional() const { return positional_; }

    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    std::string to_json_string() const;
    std::vector<std::string> get_keys_with_prefix(const std::string& prefix) const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;
    std::vector<std::string> positional_;

    std::optional<ConfigValue> find_value(const std::string& key) const;
};

namespace config_utils {
    /**
     * @brief Build an environment variable name from a dotted key
     * @param key Key ("log.level")
     * @param prefix Prefix ("STRUCTWIRE_")
     * @return "STRUCTWIRE_LOG_LEVEL"
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "");

    std::optional<std::string> get_env_var(const std::string& env_var_name);

    /**
     * @brief Parse a boolean string ("1", "true", "yes", "on")
     */
    bool parse_bool(const std::string& str);
}

} // namespace structwire::utils
