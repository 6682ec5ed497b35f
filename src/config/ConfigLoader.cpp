/**
 * @file ConfigLoader.cpp
 */

#include "config/ConfigLoader.hpp"

#include "util/Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace config {

namespace {

using nlohmann::json;

class InvalidValue : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::array KNOWN_KEYS = {
    "chunk_size",           "max_io_retries",          "retry_backoff_ms",
    "max_backoff_ms",       "chunk_timeout_ms",        "progress_interval_ms",
    "progress_queue_capacity", "max_throughput_samples", "verification_policy",
    "verify_final_pass_by_default", "sampled_confidence", "sampled_defect_fraction",
    "sample_range_bytes",   "sample_min_ranges",       "max_pass_reexecutions",
    "confirmation_phrase",  "fallback_command"};

template <typename T>
void read_count(const json& j, const char* key, T& target) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        throw InvalidValue(std::string(key) + " must be a non-negative integer");
    }
    const auto raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        throw InvalidValue(std::string(key) + " is too large");
    }
    target = static_cast<T>(raw);
}

void read_millis(const json& j, const char* key, std::chrono::milliseconds& target) {
    uint64_t ms = static_cast<uint64_t>(target.count());
    read_count(j, key, ms);
    target = std::chrono::milliseconds{static_cast<int64_t>(ms)};
}

void read_number(const json& j, const char* key, double& target) {
    if (!j.contains(key)) {
        return;
    }
    if (!j.at(key).is_number()) {
        throw InvalidValue(std::string(key) + " must be a number");
    }
    target = j.at(key).get<double>();
}

}  // namespace

auto validate_wipe_config(const engine::WipeConfig& config) -> std::expected<void, util::Error> {
    auto invalid = [](const std::string& message) {
        return std::unexpected(util::Error::configuration("Invalid configuration: " + message));
    };

    if (config.chunk_size == 0 || config.chunk_size % 512 != 0) {
        return invalid("chunk_size must be a non-zero multiple of 512");
    }
    if (config.max_backoff < config.retry_backoff) {
        return invalid("max_backoff_ms must not be below retry_backoff_ms");
    }
    if (config.progress_interval.count() <= 0) {
        return invalid("progress_interval_ms must be positive");
    }
    if (config.progress_queue_capacity == 0) {
        return invalid("progress_queue_capacity must be positive");
    }
    if (config.max_throughput_samples < 2) {
        return invalid("max_throughput_samples must be at least 2");
    }
    if (!(config.sampled_confidence > 0.0 && config.sampled_confidence <= 1.0)) {
        return invalid("sampled_confidence must lie in (0, 1]");
    }
    if (!(config.sampled_defect_fraction > 0.0 && config.sampled_defect_fraction < 1.0)) {
        return invalid("sampled_defect_fraction must lie in (0, 1)");
    }
    if (config.sample_range_bytes == 0) {
        return invalid("sample_range_bytes must be positive");
    }
    if (config.confirmation_phrase.empty()) {
        return invalid("confirmation_phrase must not be empty");
    }
    if (!config.fallback_command.empty() &&
        std::none_of(config.fallback_command.begin(), config.fallback_command.end(),
                     [](const std::string& arg) {
                         return arg.find("{path}") != std::string::npos;
                     })) {
        return invalid("fallback_command must contain a {path} placeholder");
    }
    return {};
}

auto parse_wipe_config(std::string_view text) -> std::expected<engine::WipeConfig, util::Error> {
    engine::WipeConfig config;
    try {
        auto j = json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            return std::unexpected(
                util::Error::configuration("Configuration must be a JSON object"));
        }

        for (const auto& item : j.items()) {
            if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), item.key()) == KNOWN_KEYS.end()) {
                LOG_WARNING("ConfigLoader", "Ignoring unknown key: " + item.key());
            }
        }

        read_count(j, "chunk_size", config.chunk_size);
        read_count(j, "max_io_retries", config.max_io_retries);
        read_millis(j, "retry_backoff_ms", config.retry_backoff);
        read_millis(j, "max_backoff_ms", config.max_backoff);
        read_millis(j, "chunk_timeout_ms", config.chunk_timeout);
        read_millis(j, "progress_interval_ms", config.progress_interval);
        read_count(j, "progress_queue_capacity", config.progress_queue_capacity);
        read_count(j, "max_throughput_samples", config.max_throughput_samples);
        read_number(j, "sampled_confidence", config.sampled_confidence);
        read_number(j, "sampled_defect_fraction", config.sampled_defect_fraction);
        read_count(j, "sample_range_bytes", config.sample_range_bytes);
        read_count(j, "sample_min_ranges", config.sample_min_ranges);
        read_count(j, "max_pass_reexecutions", config.max_pass_reexecutions);

        if (j.contains("verification_policy")) {
            const auto name = j.at("verification_policy").get<std::string>();
            auto policy = engine::verification_policy_from_string(name);
            if (!policy) {
                throw InvalidValue("unknown verification_policy '" + name + "'");
            }
            config.verification_policy = *policy;
        }
        if (j.contains("verify_final_pass_by_default")) {
            config.verify_final_pass_by_default = j.at("verify_final_pass_by_default").get<bool>();
        }
        if (j.contains("confirmation_phrase")) {
            config.confirmation_phrase = j.at("confirmation_phrase").get<std::string>();
        }
        if (j.contains("fallback_command")) {
            config.fallback_command = j.at("fallback_command").get<std::vector<std::string>>();
        }
    } catch (const InvalidValue& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid configuration: ") +
                                                          e.what()));
    } catch (const json::exception& e) {
        return std::unexpected(util::Error::configuration(std::string("Invalid configuration: ") +
                                                          e.what()));
    }

    if (auto valid = validate_wipe_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

auto load_wipe_config(const std::filesystem::path& path)
    -> std::expected<engine::WipeConfig, util::Error> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            util::Error::configuration("Cannot open configuration file " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto config = parse_wipe_config(buffer.str());
    if (config) {
        LOG_INFO("ConfigLoader", "Loaded configuration from " + path.string());
    } else {
        LOG_ERROR("ConfigLoader", path.string() + ": " + config.error().message);
    }
    return config;
}

}  // namespace config
