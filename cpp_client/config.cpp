#include "config.hpp"
#include "logger.hpp"
#include <fstream>

Config& Config::Instance() {
    static Config instance;
    return instance;
}

void Config::Load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Warn("Config file not found at " + path + ". Using defaults.", "Config");
        return;
    }

    try {
        nlohmann::json j;
        file >> j;
        LoadFromJson(j);
        Logger::Info("Configuration loaded from " + path, "Config");
    } catch (const std::exception& e) {
        Logger::Error("Failed to parse config file: " + std::string(e.what()), "Config");
    }
}

void Config::LoadFromJson(const nlohmann::json& j) {
    // Parse into a copy so a type error halfway through leaves the old values intact.
    TransferConfig parsed = config_;

    if (j.contains("endpoint")) parsed.endpoint = j["endpoint"].get<std::string>();
    if (j.contains("use_ssl")) parsed.use_ssl = j["use_ssl"].get<bool>();
    if (j.contains("verify_tls")) parsed.verify_tls = j["verify_tls"].get<bool>();
    if (j.contains("access_key")) parsed.access_key = j["access_key"].get<std::string>();
    if (j.contains("secret_key")) parsed.secret_key = j["secret_key"].get<std::string>();
    if (j.contains("region")) parsed.region = j["region"].get<std::string>();
    if (j.contains("timeout_seconds")) parsed.timeout_seconds = j["timeout_seconds"].get<long>();
    if (j.contains("connect_timeout_seconds")) parsed.connect_timeout_seconds = j["connect_timeout_seconds"].get<long>();
    if (j.contains("progress_interval_ms")) parsed.progress_interval_ms = j["progress_interval_ms"].get<long>();
    if (j.contains("log_level")) parsed.log_level = j["log_level"].get<std::string>();

    if (j.contains("upload")) {
        auto& up = j["upload"];
        if (up.contains("chunk_size")) parsed.upload.chunk_size = up["chunk_size"].get<std::uint64_t>();
        if (up.contains("min_part_size")) parsed.upload.min_part_size = up["min_part_size"].get<std::uint64_t>();
        if (up.contains("concurrency")) parsed.upload.concurrency = up["concurrency"].get<int>();
    }

    if (j.contains("download")) {
        auto& down = j["download"];
        if (down.contains("chunk_size")) parsed.download.chunk_size = down["chunk_size"].get<std::uint64_t>();
        if (down.contains("min_chunk_size")) parsed.download.min_chunk_size = down["min_chunk_size"].get<std::uint64_t>();
        if (down.contains("concurrency")) parsed.download.concurrency = down["concurrency"].get<int>();
    }

    if (j.contains("retry")) {
        auto& retry = j["retry"];
        if (retry.contains("max_retries")) parsed.retry.max_retries = retry["max_retries"].get<int>();
        if (retry.contains("backoff_base_ms")) parsed.retry.backoff_base_ms = retry["backoff_base_ms"].get<long>();
        if (retry.contains("mode")) parsed.retry.mode = retry["mode"].get<std::string>();
    }

    if (j.contains("state")) {
        auto& state = j["state"];
        if (state.contains("directory")) parsed.state.directory = state["directory"].get<std::string>();
        if (state.contains("max_age_days")) parsed.state.max_age_days = state["max_age_days"].get<int>();
    }

    config_ = parsed;
    Logger::SetLevel(Logger::ParseLevel(config_.log_level));
}

const Config::TransferConfig& Config::Get() const {
    return config_;
}

void Config::Set(const TransferConfig& config) {
    config_ = config;
    Logger::SetLevel(Logger::ParseLevel(config_.log_level));
}

std::vector<std::string> Config::ValidationErrors() const {
    std::vector<std::string> errors;

    if (config_.endpoint.empty()) errors.push_back("endpoint is required");
    if (config_.access_key.empty()) errors.push_back("access_key is required");
    if (config_.secret_key.empty()) errors.push_back("secret_key is required");
    if (config_.region.empty()) errors.push_back("region is required");
    if (config_.timeout_seconds <= 0) errors.push_back("timeout_seconds must be greater than 0");
    if (config_.connect_timeout_seconds <= 0) errors.push_back("connect_timeout_seconds must be greater than 0");
    if (config_.upload.chunk_size == 0) errors.push_back("upload.chunk_size must be greater than 0");
    if (config_.download.chunk_size == 0) errors.push_back("download.chunk_size must be greater than 0");
    if (config_.upload.concurrency <= 0) errors.push_back("upload.concurrency must be greater than 0");
    if (config_.download.concurrency <= 0) errors.push_back("download.concurrency must be greater than 0");
    if (config_.retry.max_retries < 0) errors.push_back("retry.max_retries must be 0 or greater");
    if (config_.retry.mode != "classified" && config_.retry.mode != "uniform") {
        errors.push_back("retry.mode must be 'classified' or 'uniform'");
    }
    if (config_.state.directory.empty()) errors.push_back("state.directory is required");
    if (config_.state.max_age_days <= 0) errors.push_back("state.max_age_days must be greater than 0");

    return errors;
}
