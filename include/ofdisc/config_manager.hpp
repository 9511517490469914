#ifndef OFDISC_CONFIG_MANAGER_HPP
#define OFDISC_CONFIG_MANAGER_HPP

#include "ofdisc/logger.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ofdisc {

using ConfigValue = std::variant<
    bool,
    int,
    uint32_t,
    uint64_t,
    double,
    std::string
>;

using ConfigurationData = std::map<std::string, ConfigValue>;

// Recognised keys
constexpr const char* CONFIG_KEY_POLLING_TIME = "lldp.polling_time";
constexpr const char* CONFIG_KEY_LOG_LEVEL = "log.level";

constexpr uint32_t DEFAULT_POLLING_TIME_SECONDS = 3;
constexpr uint32_t MAX_POLLING_TIME_SECONDS = 86400;

struct DiscoverySettings {
    std::chrono::seconds polling_time{DEFAULT_POLLING_TIME_SECONDS};
    LogLevel log_level = LogLevel::INFO;
};

class ConfigManager {
public:
    ConfigManager() = default;

    // Reads `key=value` lines; blank lines and lines starting with '#' are
    // skipped. Replaces the current data. Returns false if the file cannot be opened.
    bool load_config(const std::string& filename);

    bool save_config(const std::string& filename_param = "") const;

    std::optional<ConfigValue> get_parameter(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it != config_data_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    template<typename T>
    std::optional<T> get_parameter_as(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (opt_val.has_value() && std::holds_alternative<T>(opt_val.value())) {
            return std::get<T>(opt_val.value());
        }
        return std::nullopt;
    }

    void set_parameter(const std::string& path, ConfigValue value) {
        config_data_[path] = std::move(value);
    }

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    void set_logger(const Logger* logger) {
        logger_ = logger;
    }

    // Returns one message per problem; empty means valid.
    std::vector<std::string> validate_config(const ConfigurationData& config_to_validate) const;

    // Current settings with defaults applied. Invalid values are ignored
    // with a warning.
    DiscoverySettings discovery_settings() const;

private:
    ConfigurationData config_data_;
    std::string loaded_config_filename_;
    const Logger* logger_ = nullptr;
};

} // namespace ofdisc

#endif // OFDISC_CONFIG_MANAGER_HPP
