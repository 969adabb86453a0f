#include "config/cache_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace secretcache {

namespace {

const char* const KNOWN_OPTIONS[] = {
    "max_cache_size",
    "exception_retry_delay_base",
    "exception_retry_growth_factor",
    "exception_retry_delay_max",
    "default_version_stage",
    "secret_refresh_interval",
};

long long parse_non_negative_integer(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Option '" + name + "' expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("Option '" + name + "' expects an integer, got '" + value + "'");
    }
    if (result < 0) {
        throw ConfigError("Option '" + name + "' must not be negative");
    }
    return result;
}

double parse_number(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Option '" + name + "' expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("Option '" + name + "' expects a number, got '" + value + "'");
    }
    return result;
}

void apply_option(CacheConfig& config, const std::string& name, const std::string& value) {
    if (name == "max_cache_size") {
        config.max_cache_size = static_cast<size_t>(parse_non_negative_integer(name, value));
    } else if (name == "exception_retry_delay_base") {
        config.exception_retry_delay_base =
            std::chrono::milliseconds(parse_non_negative_integer(name, value));
    } else if (name == "exception_retry_growth_factor") {
        config.exception_retry_growth_factor = parse_number(name, value);
    } else if (name == "exception_retry_delay_max") {
        config.exception_retry_delay_max =
            std::chrono::milliseconds(parse_non_negative_integer(name, value));
    } else if (name == "default_version_stage") {
        config.default_version_stage = value;
    } else if (name == "secret_refresh_interval") {
        config.secret_refresh_interval =
            std::chrono::seconds(parse_non_negative_integer(name, value));
    } else {
        throw ConfigError("Unexpected configuration option '" + name + "'");
    }
}

template <typename Duration>
void check_range(const char* name, Duration value, Duration max) {
    if (value < Duration::zero() || value > max) {
        throw ConfigError("Option '" + std::string(name) + "' must be between 0 and " +
                          std::to_string(max.count()));
    }
}

// Integral JSON numbers (including 1e3) are rendered without a fraction
std::string json_number_to_option(const json& value) {
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<unsigned long long>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }

    double number = value.get<double>();
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < 9.0e18) {
        return std::to_string(static_cast<long long>(number));
    }
    return value.dump();
}

std::string read_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

void validate_cache_config(const CacheConfig& config) {
    const auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(MAX_CONFIG_DURATION);
    const auto max_s = std::chrono::duration_cast<std::chrono::seconds>(MAX_CONFIG_DURATION);

    check_range("exception_retry_delay_base", config.exception_retry_delay_base, max_ms);
    check_range("exception_retry_delay_max", config.exception_retry_delay_max, max_ms);
    check_range("secret_refresh_interval", config.secret_refresh_interval, max_s);

    if (config.exception_retry_delay_max < config.exception_retry_delay_base) {
        throw ConfigError("exception_retry_delay_max must be >= exception_retry_delay_base");
    }
    if (!std::isfinite(config.exception_retry_growth_factor) ||
        config.exception_retry_growth_factor < 1.0) {
        throw ConfigError("Option 'exception_retry_growth_factor' must be a finite number >= 1");
    }
    if (config.default_version_stage.empty()) {
        throw ConfigError("Option 'default_version_stage' must not be empty");
    }
}

bool is_known_option(const std::string& name) {
    return std::find(std::begin(KNOWN_OPTIONS), std::end(KNOWN_OPTIONS), name)
        != std::end(KNOWN_OPTIONS);
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

CacheConfig make_cache_config(const std::map<std::string, std::string>& options,
                              std::shared_ptr<SecretCacheHook> hook) {
    CacheConfig config;

    for (const auto& [name, value] : options) {
        apply_option(config, name, value);
    }

    validate_cache_config(config);

    config.secret_cache_hook = std::move(hook);
    return config;
}

CacheConfig parse_cache_config_from_string(const std::string& json_string) {
    std::map<std::string, std::string> options;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigError("Configuration must be a JSON object");
        }

        const json* section = &j;
        if (j.contains("cache")) {
            section = &j["cache"];
            if (!section->is_object()) {
                throw ConfigError("'cache' section must be a JSON object");
            }
        }

        for (auto it = section->begin(); it != section->end(); ++it) {
            // Top-level "backend" belongs to the HTTP backend parser
            if (section == &j && it.key() == "backend") {
                continue;
            }

            const json& value = it.value();
            if (value.is_string()) {
                options[it.key()] = expand_environment_variables(value.get<std::string>());
            } else if (value.is_number()) {
                options[it.key()] = json_number_to_option(value);
            } else {
                throw ConfigError("Option '" + it.key() + "' must be a string or a number");
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("JSON type error: ") + e.what());
    }

    return make_cache_config(options);
}

CacheConfig parse_cache_config_from_file(const std::string& file_path) {
    return parse_cache_config_from_string(read_file(file_path));
}

HttpBackendConfig parse_http_backend_config_from_string(const std::string& json_string) {
    HttpBackendConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object() || !j.contains("backend")) {
            throw ConfigError("Missing required section: backend");
        }
        const json& backend = j["backend"];

        if (!backend.contains("endpoint")) {
            throw ConfigError("Backend missing required field: endpoint");
        }
        config.endpoint = expand_environment_variables(backend["endpoint"].get<std::string>());
        if (config.endpoint.empty()) {
            throw ConfigError("Backend endpoint must not be empty");
        }

        if (backend.contains("timeout_ms")) {
            config.timeout_ms = backend["timeout_ms"].get<int>();
            if (config.timeout_ms <= 0) {
                throw ConfigError("Backend timeout_ms must be positive");
            }
        }

        if (backend.contains("headers")) {
            for (auto it = backend["headers"].begin(); it != backend["headers"].end(); ++it) {
                config.headers[it.key()] = expand_environment_variables(it.value().get<std::string>());
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

HttpBackendConfig parse_http_backend_config_from_file(const std::string& file_path) {
    return parse_http_backend_config_from_string(read_file(file_path));
}

} // namespace secretcache
