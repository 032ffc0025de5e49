#include "utils/config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

namespace mhub {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<bool> parseBool(const std::string& text) {
    const auto lower = toLowerAscii(text);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::optional<long long> parseNonNegative(const std::string& text) {
    try {
        size_t idx = 0;
        long long v = std::stoll(text, &idx);
        if (idx != text.size() || v < 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME").value_or("");
    if (!home.empty()) return std::filesystem::path(home) / ".mhub/config.json";
    return std::filesystem::path();
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) return false;
        ifs >> out;
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring unreadable config file {}: {}", path.string(), e.what());
        return false;
    }
}

std::vector<std::string> stringArray(const nlohmann::json& v) {
    std::vector<std::string> out;
    if (!v.is_array()) return out;
    for (const auto& item : v) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

}  // namespace

const char* to_string(EngineBackend backend) {
    switch (backend) {
        case EngineBackend::Docker:
            return "docker";
        case EngineBackend::UDocker:
            return "udocker";
    }
    return "unknown";
}

std::optional<EngineBackend> parseEngineBackend(const std::string& text) {
    const auto lower = toLowerAscii(text);
    if (lower == "docker") return EngineBackend::Docker;
    if (lower == "udocker") return EngineBackend::UDocker;
    return std::nullopt;
}

std::pair<BackendConfig, std::string> loadBackendConfigWithLog() {
    BackendConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("backend") && j["backend"].is_string()) {
            if (auto b = parseEngineBackend(j["backend"].get<std::string>())) {
                cfg.engine.backend = *b;
            } else {
                spdlog::warn("Unknown backend in config: {}", j["backend"].get<std::string>());
            }
        }
        if (j.contains("docker_executable") && j["docker_executable"].is_string()) {
            cfg.engine.docker_executable = j["docker_executable"].get<std::string>();
        }
        if (j.contains("udocker_executable") && j["udocker_executable"].is_string()) {
            cfg.engine.udocker_executable = j["udocker_executable"].get<std::string>();
        }
        if (j.contains("nvidia_smi_executable") && j["nvidia_smi_executable"].is_string()) {
            cfg.engine.nvidia_smi_executable = j["nvidia_smi_executable"].get<std::string>();
        }
        if (j.contains("image_filter") && j["image_filter"].is_string()) {
            cfg.engine.image_filter = j["image_filter"].get<std::string>();
        }
        if (j.contains("command_timeout_ms") && j["command_timeout_ms"].is_number_unsigned()) {
            cfg.engine.command_timeout = std::chrono::milliseconds(j["command_timeout_ms"].get<long long>());
        }
        if (j.contains("catalog_url") && j["catalog_url"].is_string()) {
            cfg.catalog.url = j["catalog_url"].get<std::string>();
        }
        if (j.contains("catalog_timeout_ms") && j["catalog_timeout_ms"].is_number_unsigned()) {
            cfg.catalog.timeout = std::chrono::milliseconds(j["catalog_timeout_ms"].get<long long>());
        }
        if (j.contains("catalog_refresh_interval_secs") && j["catalog_refresh_interval_secs"].is_number_unsigned()) {
            cfg.catalog.refresh_interval = std::chrono::seconds(j["catalog_refresh_interval_secs"].get<long long>());
        }
        if (j.contains("image_namespace") && j["image_namespace"].is_string()) {
            cfg.catalog.image_namespace = j["image_namespace"].get<std::string>();
        }
        if (j.contains("image_tag") && j["image_tag"].is_string()) {
            cfg.catalog.image_tag = j["image_tag"].get<std::string>();
        }
        if (j.contains("docs_base_url") && j["docs_base_url"].is_string()) {
            cfg.catalog.docs_base_url = j["docs_base_url"].get<std::string>();
        }
        if (j.contains("auto_pull") && j["auto_pull"].is_boolean()) {
            cfg.orchestrator.auto_pull = j["auto_pull"].get<bool>();
        }
        if (j.contains("grace_period_ms") && j["grace_period_ms"].is_number_unsigned()) {
            cfg.orchestrator.grace_period = std::chrono::milliseconds(j["grace_period_ms"].get<long long>());
        }
        if (j.contains("run_timeout_secs") && j["run_timeout_secs"].is_number_unsigned()) {
            cfg.orchestrator.run_timeout = std::chrono::seconds(j["run_timeout_secs"].get<long long>());
        }
        if (j.contains("allow_concurrent_input") && j["allow_concurrent_input"].is_boolean()) {
            cfg.orchestrator.allow_concurrent_input = j["allow_concurrent_input"].get<bool>();
        }
        if (j.contains("max_log_lines") && j["max_log_lines"].is_number_unsigned()) {
            cfg.orchestrator.max_log_lines = j["max_log_lines"].get<size_t>();
        }
        if (j.contains("default_run_args") && j["default_run_args"].is_array()) {
            cfg.default_run_args = stringArray(j["default_run_args"]);
        }
    };

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("MHUB_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            apply_json(j);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvValue("MHUB_BACKEND")) {
        if (auto b = parseEngineBackend(*v)) {
            cfg.engine.backend = *b;
            log << "env:BACKEND=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_BACKEND={} (expected docker|udocker)", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_DOCKER_EXECUTABLE")) {
        cfg.engine.docker_executable = *v;
        log << "env:DOCKER_EXECUTABLE=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("MHUB_UDOCKER_EXECUTABLE")) {
        cfg.engine.udocker_executable = *v;
        log << "env:UDOCKER_EXECUTABLE=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("MHUB_CATALOG_URL")) {
        cfg.catalog.url = *v;
        log << "env:CATALOG_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("MHUB_CATALOG_REFRESH_SECS")) {
        if (auto n = parseNonNegative(*v)) {
            cfg.catalog.refresh_interval = std::chrono::seconds(*n);
            log << "env:CATALOG_REFRESH_SECS=" << *n << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_CATALOG_REFRESH_SECS={}", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_AUTO_PULL")) {
        if (auto b = parseBool(*v)) {
            cfg.orchestrator.auto_pull = *b;
            log << "env:AUTO_PULL=" << (*b ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_AUTO_PULL={}", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_GRACE_PERIOD_MS")) {
        if (auto n = parseNonNegative(*v)) {
            cfg.orchestrator.grace_period = std::chrono::milliseconds(*n);
            log << "env:GRACE_PERIOD_MS=" << *n << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_GRACE_PERIOD_MS={}", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_RUN_TIMEOUT_SECS")) {
        if (auto n = parseNonNegative(*v)) {
            cfg.orchestrator.run_timeout = std::chrono::seconds(*n);
            log << "env:RUN_TIMEOUT_SECS=" << *n << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_RUN_TIMEOUT_SECS={}", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_ALLOW_CONCURRENT_INPUT")) {
        if (auto b = parseBool(*v)) {
            cfg.orchestrator.allow_concurrent_input = *b;
            log << "env:ALLOW_CONCURRENT_INPUT=" << (*b ? "true" : "false") << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_ALLOW_CONCURRENT_INPUT={}", *v);
        }
    }
    if (auto v = getEnvValue("MHUB_MAX_LOG_LINES")) {
        if (auto n = parseNonNegative(*v)) {
            cfg.orchestrator.max_log_lines = static_cast<size_t>(*n);
            log << "env:MAX_LOG_LINES=" << *n << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring MHUB_MAX_LOG_LINES={}", *v);
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

BackendConfig loadBackendConfig() {
    auto info = loadBackendConfigWithLog();
    return info.first;
}

}  // namespace mhub
