#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config.hpp"
#include "curl_transport.hpp"
#include "download_engine.hpp"
#include "logger.hpp"
#include "progress_sink.hpp"
#include "retry_policy.hpp"
#include "s3_client.hpp"
#include "transfer_errors.hpp"
#include "transfer_state_store.hpp"
#include "upload_engine.hpp"

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void HandleSigint(int) {
    g_interrupted = 1;
}

void PrintUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program
              << " <config.json> upload <bucket> <key> <local_path> [--resume] [--content-type <type>]"
                 " [--meta <name>=<value>]...\n"
              << "  " << program << " <config.json> download <bucket> <key> <local_path> [--resume]\n"
              << "  " << program << " <config.json> presign <GET|PUT|DELETE|HEAD> <bucket> <key> <seconds>\n";
}

void ReportEvent(const ProgressEvent& event) {
    const char* component = "Host";
    switch (event.type) {
        case ProgressEvent::Type::ChunkStart:
            Logger::Debug("chunk " + std::to_string(event.chunk_index) + " started (" +
                              std::to_string(event.bytes) + " bytes)",
                          component);
            break;
        case ProgressEvent::Type::ChunkProgress:
            Logger::Debug("chunk " + std::to_string(event.chunk_index) + ": " + std::to_string(event.bytes) +
                              " bytes",
                          component);
            break;
        case ProgressEvent::Type::ChunkComplete:
            Logger::Info("chunk " + std::to_string(event.chunk_index) + " complete", component);
            break;
        case ProgressEvent::Type::ChunkError:
            Logger::Warn("chunk " + std::to_string(event.chunk_index) + " attempt " +
                             std::to_string(event.attempt) + ": " + event.detail,
                         component);
            break;
        case ProgressEvent::Type::TransferComplete:
            break;
    }
}

int PrintError(ErrorKind kind, const std::string& message) {
    nlohmann::json j;
    j["success"] = false;
    j["error"] = ErrorKindName(kind);
    j["message"] = message;
    std::cout << j.dump(2) << std::endl;
    return kind == ErrorKind::Validation ? 2 : 1;
}

int RunPresign(S3Client& client, int argc, char** argv) {
    if (argc != 7) {
        PrintUsage(argv[0]);
        return 2;
    }
    long seconds = 0;
    try {
        seconds = std::stol(argv[6]);
    } catch (const std::exception&) {
        return PrintError(ErrorKind::Validation, std::string("invalid expiry: ") + argv[6]);
    }

    PresignedUrl presigned = client.PresignUrl(argv[3], argv[4], argv[5], std::chrono::seconds(seconds));
    nlohmann::json j;
    j["success"] = true;
    j["method"] = presigned.method;
    j["url"] = presigned.url;
    j["expires_in_seconds"] = seconds;
    std::cout << j.dump(2) << std::endl;
    return 0;
}

// Runs the engine on a worker thread while this thread drains progress events and watches for SIGINT.
template <typename Engine>
TransferResult RunTransfer(Engine& engine, TransferState& state, ProgressEventQueue& events) {
    CancellationToken cancel;
    TransferResult result;
    std::thread worker([&]() { result = engine.Run(state, cancel); });

    bool finished = false;
    while (!finished) {
        if (g_interrupted && !cancel.IsCancelled()) {
            Logger::Info("Interrupt received, cancelling transfer", "Host");
            cancel.Cancel();
        }
        auto event = events.WaitPop(std::chrono::milliseconds(200));
        if (!event) {
            continue;
        }
        ReportEvent(*event);
        finished = event->type == ProgressEvent::Type::TransferComplete;
    }

    worker.join();
    events.Close();
    return result;
}
} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage(argv[0]);
        return 2;
    }

    Config::Instance().Load(argv[1]);
    const auto& config = Config::Instance().Get();

    auto problems = Config::Instance().ValidationErrors();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            Logger::Fatal("Invalid configuration: " + problem, "Host");
        }
        return 2;
    }

    std::string command = argv[2];
    try {
        CurlTransport transport(config);
        S3Client client(config, transport);

        if (command == "presign") {
            return RunPresign(client, argc, argv);
        }

        if (command != "upload" && command != "download") {
            PrintUsage(argv[0]);
            return 2;
        }
        if (argc < 6) {
            PrintUsage(argv[0]);
            return 2;
        }
        std::string bucket = argv[3];
        std::string key = argv[4];
        std::string local_path = argv[5];
        bool resume = false;
        UploadMetadata metadata;
        for (int i = 6; i < argc; ++i) {
            std::string option = argv[i];
            if (option == "--resume") {
                resume = true;
            } else if (command == "upload" && option == "--content-type" && i + 1 < argc) {
                metadata.content_type = argv[++i];
            } else if (command == "upload" && option == "--meta" && i + 1 < argc) {
                std::string entry = argv[++i];
                size_t eq = entry.find('=');
                if (eq == std::string::npos || eq == 0) {
                    return PrintError(ErrorKind::Validation, "metadata must be <name>=<value>: " + entry);
                }
                metadata.user[entry.substr(0, eq)] = entry.substr(eq + 1);
            } else {
                PrintUsage(argv[0]);
                return 2;
            }
        }

        RetryPolicy retry = RetryPolicy::FromConfig(config.retry);
        TransferStateStore store(config.state.directory, config.state.max_age_days);
        PurgeExpiredTransfers(store, client, std::chrono::system_clock::now());

        ProgressEventQueue events;
        std::signal(SIGINT, HandleSigint);

        TransferResult result;
        if (command == "upload") {
            UploadEngine engine(client, store, retry, events, config.upload);
            TransferState state =
                engine.PrepareUpload(bucket, key, local_path, config.upload.chunk_size, resume, metadata);
            result = RunTransfer(engine, state, events);
        } else {
            DownloadEngine engine(client, store, retry, events, config.download);
            TransferState state =
                engine.PrepareDownload(bucket, key, local_path, config.download.chunk_size, resume);
            result = RunTransfer(engine, state, events);
        }

        std::cout << result.ToJson().dump(2) << std::endl;
        if (result.success) return 0;
        return result.Cancelled() ? 130 : 1;
    } catch (const TransferError& e) {
        Logger::Error(e.what(), "Host");
        return PrintError(e.Kind(), e.what());
    } catch (const std::exception& e) {
        Logger::Fatal(e.what(), "Host");
        return PrintError(ErrorKind::Internal, e.what());
    }
}
