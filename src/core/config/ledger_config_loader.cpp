#include "ledger_core/core/ledger_config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include "ledger_core/core/structured_log.h"

namespace ledger_core {
namespace {

using KeyValueMap = std::unordered_map<std::string, std::string>;

std::string Trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string Lowercase(std::string value) {
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

KeyValueMap LoadSimpleYaml(const std::string& path, std::string* error) {
    KeyValueMap kv;
    std::ifstream in(path);
    if (!in.is_open()) {
        if (error != nullptr) {
            *error = "unable to open config: " + path;
        }
        return kv;
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line = line.substr(0, hash);
        }
        line = Trim(line);
        if (line.empty() || line == "ledger:") {
            continue;
        }

        const auto pos = line.find(':');
        if (pos == std::string::npos) {
            continue;
        }

        const auto key = Trim(line.substr(0, pos));
        auto value = Trim(line.substr(pos + 1));
        if (!key.empty()) {
            kv[key] = ResolveEnvVars(value);
        }
    }
    return kv;
}

bool ParseIntValue(const std::string& value, int* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseInt64Value(const std::string& value, std::int64_t* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = static_cast<std::int64_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool ParseDoubleValue(const std::string& value, double* out) {
    if (out == nullptr) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        *out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

void SetOptionalString(const KeyValueMap& kv, const char* key, std::string* target) {
    const auto it = kv.find(key);
    if (it != kv.end()) {
        *target = it->second;
    }
}

void SetOptionalInt(const KeyValueMap& kv, const char* key, int* target, std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return;
    }
    int parsed = 0;
    if (!ParseIntValue(it->second, &parsed)) {
        if (error != nullptr && error->empty()) {
            *error = std::string("invalid integer for key: ") + key;
        }
        return;
    }
    *target = parsed;
}

void SetOptionalInt64(const KeyValueMap& kv,
                      const char* key,
                      std::int64_t* target,
                      std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return;
    }
    std::int64_t parsed = 0;
    if (!ParseInt64Value(it->second, &parsed)) {
        if (error != nullptr && error->empty()) {
            *error = std::string("invalid integer for key: ") + key;
        }
        return;
    }
    *target = parsed;
}

void SetOptionalDouble(const KeyValueMap& kv, const char* key, double* target, std::string* error) {
    const auto it = kv.find(key);
    if (it == kv.end()) {
        return;
    }
    double parsed = 0.0;
    if (!ParseDoubleValue(it->second, &parsed)) {
        if (error != nullptr && error->empty()) {
            *error = std::string("invalid number for key: ") + key;
        }
        return;
    }
    *target = parsed;
}

bool Validate(const LedgerFileConfig& config, std::string* error) {
    const auto fail = [error](const std::string& message) {
        if (error != nullptr) {
            *error = message;
        }
        return false;
    };
    if (!IsKnownLogLevel(config.runtime.log_level)) {
        return fail("invalid log_level: " + config.runtime.log_level);
    }
    const auto sink = Lowercase(config.runtime.log_sink);
    if (sink != "stderr" && sink != "stdout") {
        return fail("invalid log_sink: " + config.runtime.log_sink);
    }
    if (config.runtime.metrics_port < 0 || config.runtime.metrics_port > 65535) {
        return fail("metrics_port must be within [0, 65535]");
    }
    if (config.runtime.executor_worker_threads <= 0) {
        return fail("executor_worker_threads must be positive");
    }
    if (config.idempotency_default_ttl_seconds <= 0) {
        return fail("idempotency_default_ttl_seconds must be positive");
    }
    if (config.retry.max_retries < 0) {
        return fail("retry_max_attempts must not be negative");
    }
    if (config.retry.base_delay_ms <= 0) {
        return fail("retry_base_delay_ms must be positive");
    }
    if (config.retry.max_backoff_exponent < 0 || config.retry.max_backoff_exponent > 30) {
        return fail("retry_max_backoff_exponent must be within [0, 30]");
    }
    if (config.retry.jitter_ratio < 0.0 || config.retry.jitter_ratio > 1.0) {
        return fail("retry_jitter_ratio must be within [0, 1]");
    }
    if (config.breaker.failure_threshold <= 0) {
        return fail("breaker_failure_threshold must be positive");
    }
    if (config.breaker.open_duration_ms <= 0) {
        return fail("breaker_open_duration_ms must be positive");
    }
    return true;
}

}  // namespace

std::string ResolveEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    std::size_t pos = 0;
    while (pos < value.size()) {
        const auto start = value.find("${", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        const auto end = value.find('}', start + 2);
        if (end == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }
        out.append(value, pos, start - pos);
        const auto name = value.substr(start + 2, end - start - 2);
        if (const char* env = std::getenv(name.c_str()); env != nullptr) {
            out.append(env);
        }
        pos = end + 1;
    }
    return out;
}

std::string GetEnvOrDefault(const char* key, const std::string& fallback) {
    const char* value = std::getenv(key);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

bool LedgerConfigLoader::LoadFromYaml(const std::string& path,
                                      LedgerFileConfig* config,
                                      std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }

    std::string load_error;
    const auto kv = LoadSimpleYaml(path, &load_error);
    if (!load_error.empty()) {
        if (error != nullptr) {
            *error = load_error;
        }
        return false;
    }

    LedgerFileConfig loaded;
    std::string parse_error;
    SetOptionalString(kv, "organization_id", &loaded.organization_id);
    SetOptionalString(kv, "log_level", &loaded.runtime.log_level);
    SetOptionalString(kv, "log_sink", &loaded.runtime.log_sink);
    SetOptionalString(kv, "wal_path", &loaded.runtime.wal_path);
    SetOptionalInt(kv, "metrics_port", &loaded.runtime.metrics_port, &parse_error);
    SetOptionalInt(kv,
                   "executor_worker_threads",
                   &loaded.runtime.executor_worker_threads,
                   &parse_error);
    SetOptionalInt(kv,
                   "idempotency_default_ttl_seconds",
                   &loaded.idempotency_default_ttl_seconds,
                   &parse_error);
    SetOptionalInt(kv, "retry_max_attempts", &loaded.retry.max_retries, &parse_error);
    SetOptionalInt(kv, "retry_base_delay_ms", &loaded.retry.base_delay_ms, &parse_error);
    SetOptionalInt(kv,
                   "retry_max_backoff_exponent",
                   &loaded.retry.max_backoff_exponent,
                   &parse_error);
    SetOptionalDouble(kv, "retry_jitter_ratio", &loaded.retry.jitter_ratio, &parse_error);
    SetOptionalInt(kv,
                   "breaker_failure_threshold",
                   &loaded.breaker.failure_threshold,
                   &parse_error);
    SetOptionalInt64(kv,
                     "breaker_open_duration_ms",
                     &loaded.breaker.open_duration_ms,
                     &parse_error);
    if (!parse_error.empty()) {
        if (error != nullptr) {
            *error = parse_error;
        }
        return false;
    }

    loaded.runtime.log_level = NormalizeLogLevel(loaded.runtime.log_level);
    loaded.runtime.log_sink = Lowercase(loaded.runtime.log_sink);
    if (!Validate(loaded, error)) {
        return false;
    }

    *config = std::move(loaded);
    return true;
}

bool LedgerConfigLoader::LoadFromEnvironment(LedgerFileConfig* config, std::string* error) {
    if (config == nullptr) {
        if (error != nullptr) {
            *error = "output config pointer is null";
        }
        return false;
    }
    const auto path = GetEnvOrDefault(kConfigPathEnv, "");
    if (path.empty()) {
        *config = LedgerFileConfig{};
        return true;
    }
    return LoadFromYaml(path, config, error);
}

}  // namespace ledger_core
