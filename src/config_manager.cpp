#include "ofdisc/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace ofdisc {

namespace {

const char* const kComponent = "CONFIG";

void trim(std::string& text) {
    text.erase(0, text.find_first_not_of(" \t\n\r\f\v"));
    text.erase(text.find_last_not_of(" \t\n\r\f\v") + 1);
}

ConfigValue parse_value(const std::string& value_str) {
    std::string lower_value_str = value_str;
    std::transform(lower_value_str.begin(), lower_value_str.end(), lower_value_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_value_str == "true") {
        return true;
    }
    if (lower_value_str == "false") {
        return false;
    }

    const char* first = value_str.data();
    const char* last = value_str.data() + value_str.size();

    int int_val;
    auto [ptr, ec] = std::from_chars(first, last, int_val);
    if (ec == std::errc() && ptr == last) {
        return int_val;
    }

    // Larger positive integers that do not fit an int
    uint64_t uint64_val;
    auto [ptr_u64, ec_u64] = std::from_chars(first, last, uint64_val);
    if (ec_u64 == std::errc() && ptr_u64 == last) {
        if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(uint64_val);
        }
        return uint64_val;
    }

    double double_val;
    std::stringstream ss_double(value_str);
    ss_double >> double_val;
    if (!value_str.empty() && !ss_double.fail() && ss_double.eof()) {
        return double_val;
    }
    return value_str;
}

// Whole number of seconds in [1, MAX_POLLING_TIME_SECONDS], whichever integer
// alternative holds it.
std::optional<uint64_t> polling_seconds(const ConfigValue& value) {
    std::optional<uint64_t> seconds = std::visit([](const auto& val) -> std::optional<uint64_t> {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, int>) {
            if (val > 0) return static_cast<uint64_t>(val);
        } else if constexpr (std::is_same_v<T, uint32_t> || std::is_same_v<T, uint64_t>) {
            if (val > 0) return static_cast<uint64_t>(val);
        }
        return std::nullopt;
    }, value);
    if (seconds && *seconds > MAX_POLLING_TIME_SECONDS) {
        return std::nullopt;
    }
    return seconds;
}

} // namespace

bool ConfigManager::load_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (logger_) logger_->error(kComponent, "Failed to open config file: " + filename);
        return false;
    }

    config_data_.clear();
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            if (logger_) logger_->warning(kComponent, "Skipping malformed line " + std::to_string(line_num) +
                                                      " in " + filename + ": " + line);
            continue;
        }

        std::string key = line.substr(0, delimiter_pos);
        std::string value_str = line.substr(delimiter_pos + 1);
        trim(key);
        trim(value_str);

        if (key.empty()) {
            if (logger_) logger_->warning(kComponent, "Skipping line " + std::to_string(line_num) +
                                                      " with empty key in " + filename);
            continue;
        }

        config_data_[key] = parse_value(value_str);
    }

    loaded_config_filename_ = filename;
    if (logger_) logger_->info(kComponent, "Loaded " + std::to_string(config_data_.size()) +
                                           " parameters from " + filename);
    return true;
}

bool ConfigManager::save_config(const std::string& filename_param) const {
    const std::string& target_filename = filename_param.empty() ? loaded_config_filename_ : filename_param;
    if (target_filename.empty()) {
        if (logger_) logger_->error(kComponent, "Save failed: no filename given and no config previously loaded");
        return false;
    }

    std::ofstream file(target_filename);
    if (!file.is_open()) {
        if (logger_) logger_->error(kComponent, "Failed to open file for saving: " + target_filename);
        return false;
    }

    for (const auto& pair : config_data_) {
        std::string value_str;
        std::visit([&](const auto& val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, bool>) {
                value_str = val ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                value_str = val;
            } else {
                value_str = std::to_string(val);
            }
        }, pair.second);
        file << pair.first << "=" << value_str << "\n";
    }
    return true;
}

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& config_to_validate) const {
    std::vector<std::string> errors;

    for (const auto& pair : config_to_validate) {
        const std::string& key = pair.first;
        const ConfigValue& value = pair.second;

        if (key.empty()) {
            errors.push_back("Configuration key cannot be empty.");
            continue;
        }

        if (key == CONFIG_KEY_POLLING_TIME) {
            if (!polling_seconds(value)) {
                errors.push_back("Invalid value for key '" + key + "'. Expected a whole number of seconds between 1 and " +
                                 std::to_string(MAX_POLLING_TIME_SECONDS) + ".");
            }
        } else if (key == CONFIG_KEY_LOG_LEVEL) {
            const auto* level = std::get_if<std::string>(&value);
            if (!level || !parse_log_level(*level)) {
                errors.push_back("Invalid value for key '" + key +
                                 "'. Expected one of debug, info, warning, error, critical.");
            }
        }
    }

    if (logger_ && !errors.empty()) {
        logger_->warning(kComponent, "Configuration validation found " + std::to_string(errors.size()) + " errors.");
    }
    return errors;
}

DiscoverySettings ConfigManager::discovery_settings() const {
    DiscoverySettings settings;

    if (auto polling_time = get_parameter(CONFIG_KEY_POLLING_TIME)) {
        if (auto seconds = polling_seconds(*polling_time)) {
            settings.polling_time = std::chrono::seconds(*seconds);
        } else if (logger_) {
            logger_->warning(kComponent, std::string("Ignoring invalid ") + CONFIG_KEY_POLLING_TIME +
                                         ", using " + std::to_string(DEFAULT_POLLING_TIME_SECONDS) + " seconds");
        }
    }

    if (auto log_level = get_parameter(CONFIG_KEY_LOG_LEVEL)) {
        const auto* level_name = std::get_if<std::string>(&*log_level);
        std::optional<LogLevel> level = level_name ? parse_log_level(*level_name) : std::nullopt;
        if (level) {
            settings.log_level = *level;
        } else if (logger_) {
            logger_->warning(kComponent, std::string("Ignoring invalid ") + CONFIG_KEY_LOG_LEVEL + ", using info");
        }
    }

    return settings;
}

} // namespace ofdisc
