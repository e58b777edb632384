#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class Config {
public:
    struct UploadConfig {
        std::uint64_t chunk_size = 64ULL * 1024 * 1024;
        std::uint64_t min_part_size = 5ULL * 1024 * 1024; // S3 floor for all parts but the last
        int concurrency = 4;
    };

    struct DownloadConfig {
        std::uint64_t chunk_size = 32ULL * 1024 * 1024;
        std::uint64_t min_chunk_size = 1024 * 1024;
        int concurrency = 4;
    };

    struct RetryConfig {
        int max_retries = 3;
        long backoff_base_ms = 1000;
        std::string mode = "classified"; // or "uniform"
    };

    struct StateConfig {
        std::string directory = "data/transfers";
        int max_age_days = 7;
    };

    struct TransferConfig {
        std::string endpoint = ""; // e.g. "s3.amazonaws.com" or "localhost:9000"
        bool use_ssl = true;
        bool verify_tls = true;
        std::string access_key = "";
        std::string secret_key = "";
        std::string region = "us-east-1";
        long timeout_seconds = 300;
        long connect_timeout_seconds = 30;
        long progress_interval_ms = 250;
        std::string log_level = "INFO";

        UploadConfig upload;
        DownloadConfig download;
        RetryConfig retry;
        StateConfig state;

        std::string BaseUrl() const { return (use_ssl ? "https://" : "http://") + endpoint; }
    };

    static Config& Instance();

    void Load(const std::string& path);
    void LoadFromJson(const nlohmann::json& j);
    const TransferConfig& Get() const;
    void Set(const TransferConfig& config);

    // Human readable problems with the current configuration; empty when usable.
    std::vector<std::string> ValidationErrors() const;

private:
    Config() = default;
    TransferConfig config_;
};

#endif // CONFIG_HPP
