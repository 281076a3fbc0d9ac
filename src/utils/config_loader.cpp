#include "structwire/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace structwire::utils {

namespace {

void flatten_json(const nlohmann::json& j, const std::string& prefix,
                  std::unordered_map<std::string, ConfigValue>& out) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            flatten_json(v, key, out);
        } else if (v.is_boolean()) {
            out[key] = v.get<bool>();
        } else if (v.is_number_unsigned() &&
                   v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            // above INT64_MAX, kept as text
            out[key] = std::to_string(v.get<uint64_t>());
        } else if (v.is_number_integer()) {
            out[key] = v.get<int64_t>();
        } else if (v.is_number_float()) {
            out[key] = v.get<double>();
        } else if (v.is_string()) {
            out[key] = v.get<std::string>();
        } else if (v.is_array()) {
            std::vector<std::string> items;
            for (const auto& item : v) {
                items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            out[key] = std::move(items);
        }
        // null values are skipped
    }
}

std::optional<int64_t> parse_int(const std::string& s) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
    return value;
}

std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return std::nullopt;
    return value;
}

} // namespace

bool ConfigLoader::load_from_file(const std::string& file_path, ConfigFormat format) {
    if (format == ConfigFormat::Auto) {
        auto ext = std::filesystem::path(file_path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext != ".json") return false;
    }
    std::ifstream ifs(file_path);
    if (!ifs) return false;
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return load_from_json_string(buffer.str());
}

bool ConfigLoader::load_from_json_string(const std::string& json_content) {
    nlohmann::json j = nlohmann::json::parse(json_content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    std::unordered_map<std::string, ConfigValue> flat;
    flatten_json(j, "", flat);
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (auto& [k, v] : flat) config_data_[k] = std::move(v);
    return true;
}

std::size_t ConfigLoader::load_from_environment(const std::string& prefix, const std::vector<std::string>& keys) {
    std::size_t n = 0;
    for (const auto& key : keys) {
        auto value = config_utils::get_env_var(config_utils::normalize_env_var_name(key, prefix));
        if (!value) continue;
        set(key, *value);
        ++n;
    }
    return n;
}

std::size_t ConfigLoader::load_from_command_line(int argc, const char* const argv[]) {
    std::size_t n = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            std::lock_guard<std::mutex> lk(config_mutex_);
            positional_.push_back(a);
            continue;
        }
        auto eq = a.find('=');
        if (eq == std::string::npos) {
            set(a.substr(2), true);
        } else {
            set(a.substr(2, eq - 2), a.substr(eq + 1));
        }
        ++n;
    }
    return n;
}

std::optional<ConfigValue> ConfigLoader::find_value(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    auto it = config_data_.find(key);
    if (it == config_data_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* s = std::get_if<std::string>(&*v)) return *s;
    if (auto* i = std::get_if<int64_t>(&*v)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&*v)) {
        std::ostringstream ss;
        ss << *d;
        return ss.str();
    }
    if (auto* b = std::get_if<bool>(&*v)) return *b ? "true" : "false";
    return def;
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i;
    if (auto* d = std::get_if<double>(&*v)) return static_cast<int64_t>(*d);
    if (auto* b = std::get_if<bool>(&*v)) return *b ? 1 : 0;
    if (auto* s = std::get_if<std::string>(&*v)) return parse_int(*s).value_or(def);
    return def;
}

double ConfigLoader::get_double(const std::string& key, double def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* d = std::get_if<double>(&*v)) return *d;
    if (auto* i = std::get_if<int64_t>(&*v)) return static_cast<double>(*i);
    if (auto* s = std::get_if<std::string>(&*v)) return parse_double(*s).value_or(def);
    return def;
}

bool ConfigLoader::get_bool(const std::string& key, bool def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* b = std::get_if<bool>(&*v)) return *b;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i != 0;
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_bool(*s);
    return def;
}

std::vector<std::string> ConfigLoader::get_string_array(const std::string& key, const std::vector<std::string>& def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* a = std::get_if<std::vector<std::string>>(&*v)) return *a;
    if (auto* s = std::get_if<std::string>(&*v)) {
        // comma separated list from the command line or environment
        std::vector<std::string> items;
        std::stringstream ss(*s);
        std::string item;
        while (std::getline(ss, item, ',')) items.push_back(item);
        return items;
    }
    return def;
}

void ConfigLoader::set(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_[key] = value;
}

bool ConfigLoader::has(const std::string& key) const { return find_value(key).has_value(); }

bool ConfigLoader::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return config_data_.erase(key) > 0;
}

void ConfigLoader::clear() {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_.clear();
    positional_.clear();
}

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : defaults) config_data_[k] = v;
}

std::string ConfigLoader::to_json_string() const {
    nlohmann::json j = nlohmann::json::object();
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : config_data_) {
        std::visit([&j, &key = k](const auto& value) { j[key] = value; }, v);
    }
    return j.dump();
}

std::vector<std::string> ConfigLoader::get_keys_with_prefix(const std::string& prefix) const {
    std::vector<std::string> keys;
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, _] : config_data_) {
        if (k.rfind(prefix, 0) == 0) keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

namespace config_utils {

std::string normalize_env_var_name(const std::string& key, const std::string& prefix) {
    std::string r = prefix;
    for (char c : key) {
        r += (c == '.' || c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return r;
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

bool parse_bool(const std::string& s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // namespace config_utils

} // namespace structwire::utils
