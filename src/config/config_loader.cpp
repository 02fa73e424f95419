/**
 * @file config_loader.cpp
 * @brief Implementation of configuration file loading and parsing
 *
 * Both readers flatten the document into dotted key paths
 * ("orchestrator.worker_count", "receiver.accepted_modalities.0") that are
 * then applied to a default-initialized pipeline_config.
 */

#include "aipacs/config/config_loader.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace aipacs::config {

namespace {

using flat_map = std::map<std::string, std::string>;

// =============================================================================
// Helper Functions
// =============================================================================

config_load_error make_error(config_error code, std::string message,
                             std::optional<std::filesystem::path> path = std::nullopt,
                             std::optional<size_t> line = std::nullopt) {
    return config_load_error{.code = code,
                             .message = std::move(message),
                             .file_path = std::move(path),
                             .line_number = line,
                             .validation_errors = {}};
}

[[nodiscard]] std::expected<std::string, config_load_error> read_file(
    const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(
            config_error::file_not_found,
            std::format("Configuration file not found: {}", path.string()), path));
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to open file: {}", path.string()), path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Error reading file: {}", path.string()), path));
    }

    return buffer.str();
}

[[nodiscard]] std::expected<void, config_load_error> write_file(
    const std::filesystem::path& path, std::string_view content) {
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(make_error(
                config_error::io_error,
                std::format("Failed to create directory: {}", parent.string()), path));
        }
    }

    std::ofstream file(path);
    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to create file: {}", path.string()), path));
    }

    file << content;

    if (!file) {
        return std::unexpected(make_error(
            config_error::io_error,
            std::format("Failed to write file: {}", path.string()), path));
    }

    return {};
}

[[nodiscard]] std::string to_lower(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] bool is_quoted(std::string_view str) {
    return str.length() >= 2 &&
           ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\''));
}

[[nodiscard]] std::string unquote(std::string_view str) {
    if (is_quoted(str)) {
        return std::string(str.substr(1, str.length() - 2));
    }
    return std::string(str);
}

/**
 * @brief Drop a trailing " # comment" outside quotes
 */
[[nodiscard]] std::string strip_comment(std::string_view str) {
    char quote = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || str[i - 1] == ' ' || str[i - 1] == '\t')) {
            return trim(str.substr(0, i));
        }
    }
    return std::string(str);
}

[[nodiscard]] std::optional<bool> parse_bool(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<int64_t> parse_int(std::string_view str) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<double> parse_double(std::string_view str) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<pipeline::overflow_policy> parse_overflow(
    std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "reject") return pipeline::overflow_policy::reject;
    if (lower == "block") return pipeline::overflow_policy::block;
    return std::nullopt;
}

[[nodiscard]] std::optional<integration::log_format> parse_log_format(
    std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "text") return integration::log_format::text;
    if (lower == "json") return integration::log_format::json;
    return std::nullopt;
}

[[nodiscard]] std::string format_duration(std::chrono::milliseconds value) {
    if (value.count() % 1000 == 0) {
        return std::format("{}s", value.count() / 1000);
    }
    return std::format("{}ms", value.count());
}

[[nodiscard]] std::string escape_json(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
        }
    }
    return out;
}

// =============================================================================
// Simple YAML Parser (subset)
// =============================================================================

/**
 * @brief Flattens the YAML subset used by configuration files
 */
class simple_yaml_parser {
public:
    struct parse_result {
        flat_map values;
        size_t error_line = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        std::vector<std::pair<int, std::string>> stack;
        std::map<std::string, size_t> list_sizes;
        size_t line_number = 0;

        std::istringstream stream{std::string{content}};
        std::string line;

        while (std::getline(stream, line)) {
            ++line_number;

            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') {
                continue;
            }
            trimmed = strip_comment(trimmed);

            int indent = 0;
            for (char c : line) {
                if (c == ' ')
                    indent++;
                else if (c == '\t')
                    indent += 2;
                else
                    break;
            }

            // List items may sit at the same indent as their key
            bool list_item = trimmed == "-" || trimmed.starts_with("- ");
            while (!stack.empty() && (stack.back().first > indent ||
                                      (!list_item && stack.back().first == indent))) {
                stack.pop_back();
            }
            auto parent = build_path(stack);

            if (list_item) {
                auto item = trim(std::string_view(trimmed).substr(1));
                if (!is_quoted(item) && item.find(": ") != std::string::npos) {
                    return fail(result, line_number,
                                "Mappings inside lists are not supported");
                }
                auto& index = list_sizes[parent];
                result.values[std::format("{}.{}", parent, index++)] = unquote(item);
                continue;
            }

            auto colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                return fail(result, line_number, "Invalid YAML syntax: missing colon");
            }

            auto key = unquote(trim(std::string_view(trimmed).substr(0, colon_pos)));
            auto value = trim(std::string_view(trimmed).substr(colon_pos + 1));
            if (key.empty()) {
                return fail(result, line_number, "Invalid YAML syntax: empty key");
            }
            auto full_path = parent.empty() ? key : parent + "." + key;

            if (value.empty()) {
                stack.emplace_back(indent, key);
            } else if (value.front() == '[') {
                if (value.back() != ']') {
                    return fail(result, line_number, "Unterminated flow list");
                }
                auto inner = std::string_view(value).substr(1, value.size() - 2);
                size_t index = 0;
                size_t start = 0;
                while (start <= inner.size()) {
                    auto comma = inner.find(',', start);
                    auto item = trim(inner.substr(
                        start, comma == std::string_view::npos ? std::string_view::npos
                                                               : comma - start));
                    if (!item.empty()) {
                        result.values[std::format("{}.{}", full_path, index++)] =
                            unquote(item);
                    }
                    if (comma == std::string_view::npos) break;
                    start = comma + 1;
                }
                list_sizes[full_path] = index;
            } else {
                result.values[full_path] = unquote(value);
            }
        }

        return result;
    }

private:
    static parse_result& fail(parse_result& result, size_t line,
                              std::string message) {
        result.success = false;
        result.error_line = line;
        result.error_message = std::move(message);
        return result;
    }

    [[nodiscard]] static std::string build_path(
        const std::vector<std::pair<int, std::string>>& stack) {
        std::string path;
        for (const auto& [indent, part] : stack) {
            if (!path.empty()) path += ".";
            path += part;
        }
        return path;
    }
};

// =============================================================================
// Simple JSON Parser (subset)
// =============================================================================

/**
 * @brief Flattens a JSON document into dotted key paths
 */
class simple_json_parser {
public:
    struct parse_result {
        flat_map values;
        size_t error_pos = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        size_t pos = 0;

        skip_whitespace(content, pos);
        if (pos >= content.length() || content[pos] != '{') {
            result.success = false;
            result.error_pos = pos;
            result.error_message = "Expected '{'";
            return result;
        }

        try {
            parse_object(content, pos, "", result.values);
        } catch (const std::runtime_error& e) {
            result.success = false;
            result.error_pos = pos;
            result.error_message = e.what();
        }

        return result;
    }

private:
    static void skip_whitespace(std::string_view content, size_t& pos) {
        while (pos < content.length() &&
               std::isspace(static_cast<unsigned char>(content[pos]))) {
            ++pos;
        }
    }

    static char peek(std::string_view content, size_t pos) {
        if (pos >= content.length()) {
            throw std::runtime_error("Unexpected end of input");
        }
        return content[pos];
    }

    static std::string parse_string(std::string_view content, size_t& pos) {
        if (peek(content, pos) != '"') {
            throw std::runtime_error("Expected '\"'");
        }
        ++pos;

        std::string result;
        while (pos < content.length() && content[pos] != '"') {
            if (content[pos] == '\\' && pos + 1 < content.length()) {
                ++pos;
                switch (content[pos]) {
                    case 'n':
                        result += '\n';
                        break;
                    case 't':
                        result += '\t';
                        break;
                    case 'r':
                        result += '\r';
                        break;
                    default:
                        result += content[pos];
                }
            } else {
                result += content[pos];
            }
            ++pos;
        }

        if (pos >= content.length()) {
            throw std::runtime_error("Unterminated string");
        }
        ++pos;

        return result;
    }

    static void parse_value(std::string_view content, size_t& pos,
                            const std::string& key, flat_map& result) {
        skip_whitespace(content, pos);
        char c = peek(content, pos);

        if (c == '{') {
            parse_object(content, pos, key, result);
        } else if (c == '[') {
            parse_array(content, pos, key, result);
        } else if (c == '"') {
            result[key] = parse_string(content, pos);
        } else {
            std::string value;
            while (pos < content.length() && content[pos] != ',' &&
                   content[pos] != '}' && content[pos] != ']' &&
                   !std::isspace(static_cast<unsigned char>(content[pos]))) {
                value += content[pos++];
            }
            if (value.empty()) {
                throw std::runtime_error("Expected value");
            }
            if (value != "null") {
                result[key] = value;
            }
        }
    }

    static void parse_object(std::string_view content, size_t& pos,
                             const std::string& prefix, flat_map& result) {
        ++pos;
        skip_whitespace(content, pos);

        if (peek(content, pos) == '}') {
            ++pos;
            return;
        }

        while (true) {
            skip_whitespace(content, pos);

            auto key = parse_string(content, pos);
            auto full_key = prefix.empty() ? key : prefix + "." + key;

            skip_whitespace(content, pos);
            if (peek(content, pos) != ':') {
                throw std::runtime_error("Expected ':'");
            }
            ++pos;

            parse_value(content, pos, full_key, result);

            skip_whitespace(content, pos);
            char c = peek(content, pos);
            ++pos;
            if (c == '}') {
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}'");
            }
        }
    }

    static void parse_array(std::string_view content, size_t& pos,
                            const std::string& prefix, flat_map& result) {
        ++pos;
        skip_whitespace(content, pos);

        if (peek(content, pos) == ']') {
            ++pos;
            return;
        }

        size_t index = 0;
        while (true) {
            parse_value(content, pos, std::format("{}.{}", prefix, index++), result);

            skip_whitespace(content, pos);
            char c = peek(content, pos);
            ++pos;
            if (c == ']') {
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']'");
            }
        }
    }
};

// =============================================================================
// Value Application
// =============================================================================

/**
 * @brief Applies flattened values to a configuration, collecting conversion errors
 */
class value_applier {
public:
    explicit value_applier(pipeline_config& config) : config_(config) {}

    void apply(const std::string& key, const std::string& val) {
        // List items: "<list>.<index>"
        if (auto dot = key.rfind('.'); dot != std::string::npos) {
            auto list = key.substr(0, dot);
            if (list == "receiver.accepted_modalities") {
                if (auto index = parse_int(std::string_view(key).substr(dot + 1))) {
                    modalities_.emplace_back(*index, val);
                    return;
                }
            }
        }

        if (key == "name" || key == "server.name") {
            config_.name = val;
        }
        // Storage
        else if (key == "storage.database_path") {
            config_.storage.database_path = val;
        } else if (key == "storage.data_directory") {
            config_.storage.data_directory = val;
        } else if (key == "storage.enable_wal_mode") {
            set_bool(key, val, config_.storage.enable_wal_mode);
        }
        // Receiver
        else if (key == "receiver.ae_title") {
            config_.receiver.ae_title = val;
        } else if (key == "receiver.port") {
            set_port(key, val, config_.receiver.port);
        } else if (key == "receiver.max_associations") {
            set_size(key, val, config_.receiver.max_associations);
        } else if (key == "receiver.max_payload_bytes") {
            set_size(key, val, config_.receiver.max_payload_bytes);
        }
        // Assembler
        else if (key == "assembler.idle_timeout") {
            set_duration(key, val, config_.assembler.idle_timeout);
        } else if (key == "assembler.timer_resolution") {
            set_duration(key, val, config_.assembler.timer_resolution);
        }
        // Orchestrator
        else if (key == "orchestrator.worker_count") {
            set_size(key, val, config_.orchestrator.worker_count);
        } else if (key == "orchestrator.queue_capacity") {
            set_size(key, val, config_.orchestrator.queue_capacity);
        } else if (key == "orchestrator.overflow_policy") {
            if (auto v = parse_overflow(val)) {
                config_.orchestrator.overflow = *v;
            } else {
                invalid(key, val, "reject or block");
            }
        } else if (key == "orchestrator.scan_interval") {
            set_duration(key, val, config_.orchestrator.scan_interval);
        } else if (key == "orchestrator.lease_duration") {
            set_duration(key, val, config_.orchestrator.lease_duration);
        } else if (key == "orchestrator.worker_id") {
            config_.orchestrator.worker_id = val;
        } else if (key == "orchestrator.failure_history") {
            set_size(key, val, config_.orchestrator.failure_history);
        }
        // Retry
        else if (key == "retry.base_delay") {
            set_duration(key, val, config_.retry.base_delay);
        } else if (key == "retry.max_delay") {
            set_duration(key, val, config_.retry.max_delay);
        } else if (key == "retry.multiplier") {
            set_double(key, val, config_.retry.multiplier);
        } else if (key == "retry.max_attempts") {
            if (auto v = parse_int(val); v && *v > 0 && *v < 1000) {
                config_.retry.max_attempts = static_cast<int>(*v);
            } else {
                invalid(key, val, "Positive integer");
            }
        } else if (key == "retry.jitter_ratio") {
            set_double(key, val, config_.retry.jitter_ratio);
        }
        // Analysis
        else if (key == "analysis.timeout") {
            set_duration(key, val, config_.analysis.timeout);
        } else if (key == "analysis.confidence_threshold") {
            set_double(key, val, config_.analysis.confidence_threshold);
        } else if (key == "analysis.model_version") {
            config_.analysis.model_version = val;
        } else if (key == "analysis.service_url") {
            config_.analysis.service_url = val;
        } else if (key == "analysis.model_id") {
            config_.analysis.model_id = val;
        }
        // Report
        else if (key == "report.format") {
            config_.report.format = to_lower(val);
        } else if (key == "report.template_version") {
            config_.report.template_version = val;
        }
        // Archive
        else if (key == "archive.host") {
            config_.archive.host = val;
        } else if (key == "archive.port") {
            set_port(key, val, config_.archive.port);
        } else if (key == "archive.ae_title") {
            config_.archive.ae_title = val;
        } else if (key == "archive.called_ae") {
            config_.archive.called_ae = val;
        } else if (key == "archive.timeout") {
            set_duration(key, val, config_.archive.timeout);
        }
        // Logging
        else if (key == "logging.level") {
            if (auto v = integration::parse_log_level(val)) {
                config_.logging.level = *v;
            } else {
                invalid(key, val, "trace, debug, info, warning, error or critical");
            }
        } else if (key == "logging.format") {
            if (auto v = parse_log_format(val)) {
                config_.logging.format = *v;
            } else {
                invalid(key, val, "text or json");
            }
        } else if (key == "logging.file") {
            config_.logging.file = val;
        }
    }

    void finish() {
        if (modalities_.empty()) {
            return;
        }
        std::sort(modalities_.begin(), modalities_.end());
        config_.receiver.accepted_modalities.clear();
        for (auto& [index, modality] : modalities_) {
            config_.receiver.accepted_modalities.push_back(std::move(modality));
        }
    }

    [[nodiscard]] std::vector<validation_error_info>& errors() { return errors_; }

private:
    void invalid(const std::string& key, const std::string& val,
                 const std::string& expected) {
        errors_.push_back({.field_path = key,
                           .message = "Value cannot be converted",
                           .actual_value = val,
                           .expected = expected});
    }

    void set_bool(const std::string& key, const std::string& val, bool& out) {
        if (auto v = parse_bool(val)) {
            out = *v;
        } else {
            invalid(key, val, "true or false");
        }
    }

    void set_port(const std::string& key, const std::string& val, uint16_t& out) {
        if (auto v = parse_int(val); v && *v > 0 && *v <= 65535) {
            out = static_cast<uint16_t>(*v);
        } else {
            invalid(key, val, "1-65535");
        }
    }

    void set_size(const std::string& key, const std::string& val, size_t& out) {
        if (auto v = parse_int(val); v && *v >= 0) {
            out = static_cast<size_t>(*v);
        } else {
            invalid(key, val, "Non-negative integer");
        }
    }

    void set_double(const std::string& key, const std::string& val, double& out) {
        if (auto v = parse_double(val)) {
            out = *v;
        } else {
            invalid(key, val, "Number");
        }
    }

    void set_duration(const std::string& key, const std::string& val,
                      std::chrono::milliseconds& out) {
        if (auto v = config_loader::parse_duration(val)) {
            out = *v;
        } else {
            invalid(key, val, "Duration such as 500ms, 30s, 5m, 1h");
        }
    }

    pipeline_config& config_;
    std::vector<std::pair<int64_t, std::string>> modalities_;
    std::vector<validation_error_info> errors_;
};

[[nodiscard]] config_result apply_values(const flat_map& values) {
    pipeline_config config;
    value_applier applier(config);

    for (const auto& [key, value] : values) {
        auto expanded = config_loader::expand_env_vars(value);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }
        applier.apply(key, *expanded);
    }
    applier.finish();

    auto errors = std::move(applier.errors());
    if (!errors.empty()) {
        config_load_error error =
            make_error(config_error::invalid_value, "Configuration value is invalid");
        error.validation_errors = std::move(errors);
        return std::unexpected(std::move(error));
    }

    errors = config.validate();
    if (!errors.empty()) {
        config_load_error error = make_error(config_error::validation_error,
                                             "Configuration validation failed");
        error.validation_errors = std::move(errors);
        return std::unexpected(std::move(error));
    }

    return config;
}

}  // namespace

// =============================================================================
// config_load_error Implementation
// =============================================================================

std::string config_load_error::to_string() const {
    std::string result = message;

    if (file_path) {
        result += " (file: " + file_path->string() + ")";
    }
    if (line_number) {
        result += " at line " + std::to_string(*line_number);
    }

    if (!validation_errors.empty()) {
        result += "\nValidation errors:";
        for (const auto& err : validation_errors) {
            result += "\n  - " + err.field_path + ": " + err.message;
            if (err.actual_value) {
                result += " (got: " + *err.actual_value + ")";
            }
            if (err.expected) {
                result += " (expected: " + *err.expected + ")";
            }
        }
    }

    return result;
}

// =============================================================================
// config_loader Implementation
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    auto ext = to_lower(path.extension().string());

    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml(path);
    }
    if (ext == ".json") {
        return load_json(path);
    }

    return std::unexpected(make_error(
        config_error::invalid_format,
        std::format("Unknown configuration file format: {}. Use .yaml, .yml, or .json",
                    ext),
        path));
}

config_result config_loader::load_yaml(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto result = load_yaml_string(*content, path.string());
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(std::move(error));
    }
    return result;
}

config_result config_loader::load_json(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }

    auto result = load_json_string(*content, path.string());
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(std::move(error));
    }
    return result;
}

config_result config_loader::load_yaml_string(std::string_view yaml_content,
                                              std::string_view source_name) {
    if (trim(yaml_content).empty()) {
        return std::unexpected(make_error(
            config_error::empty_config,
            std::format("Configuration content is empty: {}", source_name)));
    }

    auto parsed = simple_yaml_parser::parse(yaml_content);
    if (!parsed.success) {
        return std::unexpected(make_error(config_error::parse_error,
                                          parsed.error_message, std::nullopt,
                                          parsed.error_line));
    }

    return apply_values(parsed.values);
}

config_result config_loader::load_json_string(std::string_view json_content,
                                              std::string_view source_name) {
    if (trim(json_content).empty()) {
        return std::unexpected(make_error(
            config_error::empty_config,
            std::format("Configuration content is empty: {}", source_name)));
    }

    auto parsed = simple_json_parser::parse(json_content);
    if (!parsed.success) {
        return std::unexpected(make_error(
            config_error::parse_error,
            std::format("{} at offset {}", parsed.error_message, parsed.error_pos)));
    }

    return apply_values(parsed.values);
}

std::vector<validation_error_info> config_loader::validate(
    const pipeline_config& config) {
    return config.validate();
}

std::expected<void, config_load_error> config_loader::save_yaml(
    const pipeline_config& config, const std::filesystem::path& path) {
    return write_file(path, to_yaml(config));
}

std::expected<void, config_load_error> config_loader::save_json(
    const pipeline_config& config, const std::filesystem::path& path) {
    return write_file(path, to_json(config, true));
}

std::string config_loader::to_yaml(const pipeline_config& config) {
    std::ostringstream ss;

    ss << "# AI PACS Configuration\n";
    ss << "# Generated by config_loader\n\n";

    ss << "name: \"" << config.name << "\"\n\n";

    ss << "storage:\n";
    ss << "  database_path: \"" << config.storage.database_path.string() << "\"\n";
    ss << "  data_directory: \"" << config.storage.data_directory.string() << "\"\n";
    ss << "  enable_wal_mode: " << (config.storage.enable_wal_mode ? "true" : "false")
       << "\n\n";

    ss << "receiver:\n";
    ss << "  ae_title: \"" << config.receiver.ae_title << "\"\n";
    ss << "  port: " << config.receiver.port << "\n";
    ss << "  max_associations: " << config.receiver.max_associations << "\n";
    ss << "  max_payload_bytes: " << config.receiver.max_payload_bytes << "\n";
    if (!config.receiver.accepted_modalities.empty()) {
        ss << "  accepted_modalities:\n";
        for (const auto& modality : config.receiver.accepted_modalities) {
            ss << "    - \"" << modality << "\"\n";
        }
    }
    ss << "\n";

    ss << "assembler:\n";
    ss << "  idle_timeout: " << format_duration(config.assembler.idle_timeout) << "\n";
    ss << "  timer_resolution: " << format_duration(config.assembler.timer_resolution)
       << "\n\n";

    ss << "orchestrator:\n";
    ss << "  worker_count: " << config.orchestrator.worker_count << "\n";
    ss << "  queue_capacity: " << config.orchestrator.queue_capacity << "\n";
    ss << "  overflow_policy: " << pipeline::to_string(config.orchestrator.overflow)
       << "\n";
    ss << "  scan_interval: " << format_duration(config.orchestrator.scan_interval)
       << "\n";
    ss << "  lease_duration: " << format_duration(config.orchestrator.lease_duration)
       << "\n";
    if (!config.orchestrator.worker_id.empty()) {
        ss << "  worker_id: \"" << config.orchestrator.worker_id << "\"\n";
    }
    ss << "  failure_history: " << config.orchestrator.failure_history << "\n\n";

    ss << "retry:\n";
    ss << "  base_delay: " << format_duration(config.retry.base_delay) << "\n";
    ss << "  max_delay: " << format_duration(config.retry.max_delay) << "\n";
    ss << "  multiplier: " << std::format("{}", config.retry.multiplier) << "\n";
    ss << "  max_attempts: " << config.retry.max_attempts << "\n";
    ss << "  jitter_ratio: " << std::format("{}", config.retry.jitter_ratio) << "\n\n";

    ss << "analysis:\n";
    ss << "  timeout: " << format_duration(config.analysis.timeout) << "\n";
    ss << "  confidence_threshold: "
       << std::format("{}", config.analysis.confidence_threshold) << "\n";
    ss << "  model_version: \"" << config.analysis.model_version << "\"\n";
    if (!config.analysis.service_url.empty()) {
        ss << "  service_url: \"" << config.analysis.service_url << "\"\n";
    }
    if (!config.analysis.model_id.empty()) {
        ss << "  model_id: \"" << config.analysis.model_id << "\"\n";
    }
    ss << "\n";

    ss << "report:\n";
    ss << "  format: " << config.report.format << "\n";
    ss << "  template_version: \"" << config.report.template_version << "\"\n\n";

    ss << "archive:\n";
    ss << "  host: \"" << config.archive.host << "\"\n";
    ss << "  port: " << config.archive.port << "\n";
    ss << "  ae_title: \"" << config.archive.ae_title << "\"\n";
    ss << "  called_ae: \"" << config.archive.called_ae << "\"\n";
    ss << "  timeout: " << format_duration(config.archive.timeout) << "\n\n";

    ss << "logging:\n";
    ss << "  level: " << integration::to_string(config.logging.level) << "\n";
    ss << "  format: " << integration::to_string(config.logging.format) << "\n";
    if (!config.logging.file.empty()) {
        ss << "  file: \"" << config.logging.file.string() << "\"\n";
    }

    return ss.str();
}

std::string config_loader::to_json(const pipeline_config& config, bool pretty) {
    std::string i1 = pretty ? "  " : "";
    std::string i2 = pretty ? "    " : "";
    std::string nl = pretty ? "\n" : "";
    std::string sp = pretty ? " " : "";

    auto str = [](std::string_view v) { return "\"" + escape_json(v) + "\""; };
    auto field = [&](std::string_view key, const std::string& value, bool last = false) {
        return std::format("{}\"{}\":{}{}{}{}", i2, key, sp, value, last ? "" : ",", nl);
    };

    std::ostringstream ss;
    ss << "{" << nl;
    ss << i1 << "\"name\":" << sp << str(config.name) << "," << nl;

    ss << i1 << "\"storage\":" << sp << "{" << nl;
    ss << field("database_path", str(config.storage.database_path.string()));
    ss << field("data_directory", str(config.storage.data_directory.string()));
    ss << field("enable_wal_mode", config.storage.enable_wal_mode ? "true" : "false",
                true);
    ss << i1 << "}," << nl;

    std::string modalities = "[";
    for (size_t i = 0; i < config.receiver.accepted_modalities.size(); ++i) {
        if (i > 0) modalities += "," + sp;
        modalities += str(config.receiver.accepted_modalities[i]);
    }
    modalities += "]";

    ss << i1 << "\"receiver\":" << sp << "{" << nl;
    ss << field("ae_title", str(config.receiver.ae_title));
    ss << field("port", std::to_string(config.receiver.port));
    ss << field("max_associations", std::to_string(config.receiver.max_associations));
    ss << field("max_payload_bytes", std::to_string(config.receiver.max_payload_bytes));
    ss << field("accepted_modalities", modalities, true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"assembler\":" << sp << "{" << nl;
    ss << field("idle_timeout", str(format_duration(config.assembler.idle_timeout)));
    ss << field("timer_resolution",
                str(format_duration(config.assembler.timer_resolution)), true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"orchestrator\":" << sp << "{" << nl;
    ss << field("worker_count", std::to_string(config.orchestrator.worker_count));
    ss << field("queue_capacity", std::to_string(config.orchestrator.queue_capacity));
    ss << field("overflow_policy", str(pipeline::to_string(config.orchestrator.overflow)));
    ss << field("scan_interval", str(format_duration(config.orchestrator.scan_interval)));
    ss << field("lease_duration",
                str(format_duration(config.orchestrator.lease_duration)));
    ss << field("worker_id", str(config.orchestrator.worker_id));
    ss << field("failure_history", std::to_string(config.orchestrator.failure_history),
                true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"retry\":" << sp << "{" << nl;
    ss << field("base_delay", str(format_duration(config.retry.base_delay)));
    ss << field("max_delay", str(format_duration(config.retry.max_delay)));
    ss << field("multiplier", std::format("{}", config.retry.multiplier));
    ss << field("max_attempts", std::to_string(config.retry.max_attempts));
    ss << field("jitter_ratio", std::format("{}", config.retry.jitter_ratio), true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"analysis\":" << sp << "{" << nl;
    ss << field("timeout", str(format_duration(config.analysis.timeout)));
    ss << field("confidence_threshold",
                std::format("{}", config.analysis.confidence_threshold));
    ss << field("model_version", str(config.analysis.model_version));
    ss << field("service_url", str(config.analysis.service_url));
    ss << field("model_id", str(config.analysis.model_id), true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"report\":" << sp << "{" << nl;
    ss << field("format", str(config.report.format));
    ss << field("template_version", str(config.report.template_version), true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"archive\":" << sp << "{" << nl;
    ss << field("host", str(config.archive.host));
    ss << field("port", std::to_string(config.archive.port));
    ss << field("ae_title", str(config.archive.ae_title));
    ss << field("called_ae", str(config.archive.called_ae));
    ss << field("timeout", str(format_duration(config.archive.timeout)), true);
    ss << i1 << "}," << nl;

    ss << i1 << "\"logging\":" << sp << "{" << nl;
    ss << field("level", str(integration::to_string(config.logging.level)));
    ss << field("format", str(integration::to_string(config.logging.format)));
    ss << field("file", str(config.logging.file.string()), true);
    ss << i1 << "}" << nl;

    ss << "}";
    return ss.str();
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        if (value[pos] == '$' && pos + 1 < value.size() && value[pos + 1] == '{') {
            size_t end = value.find('}', pos + 2);
            if (end == std::string_view::npos) {
                return std::unexpected(make_error(
                    config_error::parse_error, "Unclosed environment variable reference"));
            }

            std::string_view ref = value.substr(pos + 2, end - pos - 2);
            std::string var_name;
            std::string default_value;
            bool has_default = false;

            if (auto colon_pos = ref.find(":-"); colon_pos != std::string_view::npos) {
                var_name = std::string(ref.substr(0, colon_pos));
                default_value = std::string(ref.substr(colon_pos + 2));
                has_default = true;
            } else {
                var_name = std::string(ref);
            }

            const char* env_val = std::getenv(var_name.c_str());
            if (env_val != nullptr) {
                result += env_val;
            } else if (has_default) {
                result += default_value;
            } else {
                return std::unexpected(make_error(
                    config_error::env_var_not_found,
                    std::format("Environment variable '{}' not found", var_name)));
            }

            pos = end + 1;
        } else {
            result += value[pos++];
        }
    }

    return result;
}

bool config_loader::needs_env_expansion(std::string_view value) {
    return value.find("${") != std::string_view::npos;
}

std::optional<std::chrono::milliseconds> config_loader::parse_duration(
    std::string_view value) {
    auto str = trim(value);
    if (str.empty()) return std::nullopt;

    if (auto seconds = parse_int(str)) {
        if (*seconds < 0) return std::nullopt;
        return std::chrono::milliseconds(*seconds * 1000);
    }

    auto unit_pos = str.find_first_not_of("0123456789");
    if (unit_pos == 0) return std::nullopt;

    auto number = parse_int(std::string_view(str).substr(0, unit_pos));
    if (!number) return std::nullopt;
    auto unit = to_lower(std::string_view(str).substr(unit_pos));

    if (unit == "ms") return std::chrono::milliseconds(*number);
    if (unit == "s") return std::chrono::milliseconds(*number * 1000);
    if (unit == "m") return std::chrono::milliseconds(*number * 60'000);
    if (unit == "h") return std::chrono::milliseconds(*number * 3'600'000);
    if (unit == "d") return std::chrono::milliseconds(*number * 86'400'000);
    return std::nullopt;
}

pipeline_config config_loader::get_default_config() {
    return pipeline_config{};
}

}  // namespace aipacs::config
