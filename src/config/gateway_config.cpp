/**
 * @file gateway_config.cpp
 * @brief Environment-driven gateway configuration loading
 */

#include <gateway/config/gateway_config.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <utility>

namespace gateway::config {

namespace {

using integration::logger_adapter;

std::string_view trim(std::string_view value) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

// Strip one level of matching surrounding quotes, as left behind by
// env files that quote their values.
std::string_view strip_quotes(std::string_view value) {
    value = trim(value);
    if (value.size() >= 2 &&
        (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        value = trim(value.substr(1, value.size() - 2));
    }
    return value;
}

// Values too large for long long saturate, so callers still see them as
// numeric and out of range.
std::optional<long long> parse_integer(std::string_view text) {
    long long parsed = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ptr != end) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        return text.front() == '-' ? std::numeric_limits<long long>::min()
                                   : std::numeric_limits<long long>::max();
    }
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return parsed;
}

Result<bool> parse_flag(const std::string& name, std::string_view raw) {
    std::string lowered(trim(raw));
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "0" || lowered == "false" ||
        lowered == "no" || lowered == "off") {
        return false;
    }
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    return gateway_error<bool>(error_codes::config_error,
                               name + " must be a boolean (true/false)",
                               std::string(raw));
}

Result<std::uint16_t> parse_port(const std::optional<std::string>& raw) {
    if (!raw) {
        return default_port;
    }

    auto text = strip_quotes(*raw);
    if (text.empty()) {
        return default_port;
    }

    auto parsed = parse_integer(text);
    if (!parsed) {
        return gateway_error<std::uint16_t>(
            error_codes::config_error,
            "PORT must be an integer",
            std::string(text));
    }

    if (*parsed < 1 || *parsed > std::numeric_limits<std::uint16_t>::max()) {
        logger_adapter::warn("PORT {} is outside 1-65535, falling back to {}",
                             *parsed, default_port);
        return default_port;
    }

    return static_cast<std::uint16_t>(*parsed);
}

Result<std::size_t> parse_concurrency(const std::optional<std::string>& raw,
                                      std::size_t fallback) {
    if (!raw || trim(*raw).empty()) {
        return fallback;
    }

    auto parsed = parse_integer(trim(*raw));
    if (!parsed || *parsed < 1 || *parsed > 1024) {
        return gateway_error<std::size_t>(
            error_codes::config_error,
            "GATEWAY_CONCURRENCY must be an integer in 1-1024",
            *raw);
    }
    return static_cast<std::size_t>(*parsed);
}

} // namespace

environment_lookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

environment_lookup map_environment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name)
               -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::vector<std::string> split_origin_list(std::string_view value) {
    std::vector<std::string> origins;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        auto piece = value.substr(
            start, comma == std::string_view::npos ? std::string_view::npos
                                                   : comma - start);
        auto entry = trim(piece);
        if (!entry.empty()) {
            origins.emplace_back(entry);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return origins;
}

std::string normalize_base_path(std::string_view value) {
    std::string path(trim(value));
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    return path.empty() ? std::string("/api") : path;
}

Result<gateway_config> load_gateway_config(const environment_lookup& lookup) {
    gateway_config config;

    auto port = parse_port(lookup(env::port));
    if (port.is_err()) {
        return Result<gateway_config>(port.error());
    }
    config.port = port.value();

    if (auto origins = lookup(env::allowed_origins)) {
        config.allowed_origins = split_origin_list(*origins);
    }

    // The secret is used byte for byte; only an empty value means unset
    if (auto key = lookup(env::api_key)) {
        if (!key->empty()) {
            config.api_key = std::move(*key);
        }
    }

    if (auto base = lookup(env::api_base_path)) {
        config.api_base_path = normalize_base_path(*base);
    }

    if (auto app_env = lookup(env::app_env)) {
        auto value = trim(*app_env);
        if (!value.empty()) {
            config.app_env = std::string(value);
        }
    }

    if (auto address = lookup(env::bind_address)) {
        auto value = trim(*address);
        if (!value.empty()) {
            config.bind_address = std::string(value);
        }
    }

    auto concurrency = parse_concurrency(lookup(env::concurrency), config.concurrency);
    if (concurrency.is_err()) {
        return Result<gateway_config>(concurrency.error());
    }
    config.concurrency = concurrency.value();

    if (auto level_name = lookup(env::log_level)) {
        auto value = trim(*level_name);
        if (!value.empty()) {
            auto level = integration::parse_log_level(value);
            if (!level) {
                return gateway_error<gateway_config>(
                    error_codes::config_error,
                    "LOG_LEVEL must be one of trace, debug, info, warn, error, fatal, off",
                    std::string(value));
            }
            config.log_level = *level;
        }
    }

    if (auto directory = lookup(env::log_dir)) {
        auto value = trim(*directory);
        if (!value.empty()) {
            config.log_directory = std::string(value);
        }
    }

    if (auto audit = lookup(env::audit_log)) {
        auto enabled = parse_flag(env::audit_log, *audit);
        if (enabled.is_err()) {
            return Result<gateway_config>(enabled.error());
        }
        config.audit_log = enabled.value();
    }

    return config;
}

integration::logger_config make_logger_config(const gateway_config& config) {
    integration::logger_config log_config;
    log_config.min_level = config.log_level;
    log_config.enable_console = true;
    log_config.enable_file = config.log_directory.has_value();
    log_config.enable_audit_log = config.audit_log;
    if (config.log_directory) {
        log_config.log_directory = *config.log_directory;
    }
    return log_config;
}

} // namespace gateway::config
