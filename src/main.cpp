#include "s3pipe/chunk_source.hpp"
#include "s3pipe/log.hpp"
#include "s3pipe/metrics.hpp"
#include "s3pipe/stream_uploader.hpp"
#include "s3pipe/upload_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

int fail(const s3pipe::UploadError& error) {
    s3pipe::log_error("%s", error.describe().c_str());
    return s3pipe::exit_code_for(error);
}

// stdin must be piped for "-", and must not be piped when a file is given
std::unique_ptr<s3pipe::ChunkSource> open_input(const s3pipe::UploadConfig& config,
                                                std::optional<s3pipe::UploadError>& error) {
    using s3pipe::ErrorKind;
    using s3pipe::UploadError;

    bool stdin_is_tty = isatty(STDIN_FILENO);
    if (stdin_is_tty) {
        if (config.infile == "-") {
            error = UploadError::make(ErrorKind::InputError, "Supply data via STDIN or file!");
            return nullptr;
        }
        std::cout << "Reading from " << config.infile << std::endl;
        std::string open_error;
        auto source = s3pipe::ChunkSource::open_file(config.infile, config.chunk_size, open_error);
        if (!source) {
            error = UploadError::make(ErrorKind::InputError, open_error);
        }
        return source;
    }

    if (config.infile != "-") {
        error = UploadError::make(ErrorKind::InputError,
            "Received data via STDIN and received a file! Aborting...");
        return nullptr;
    }
    std::cout << "Received data from stdin" << std::endl;
    return std::make_unique<s3pipe::ChunkSource>(STDIN_FILENO, config.chunk_size);
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = s3pipe::UploadConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if a log file is given
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Cannot open log file " << config.log_file << ", logging to console\n";
        }
    }

    s3pipe::set_debug_logging(config.debug);

    err = config.resolve_credentials();
    if (!err.empty()) {
        return fail(s3pipe::UploadError::make(s3pipe::ErrorKind::CredentialsError, err));
    }

    std::optional<s3pipe::UploadError> input_error;
    auto source = open_input(config, input_error);
    if (!source) {
        return fail(*input_error);
    }

    std::cout << "s3pipe starting..." << std::endl;
    std::cout << "  target: " << config.bucket << "/" << config.key << std::endl;
    std::cout << "  store: " << config.store_type << std::endl;
    if (config.store_type == "local") {
        std::cout << "  store-path: " << config.store_path << std::endl;
    } else {
        std::cout << "  region: " << config.region << std::endl;
        if (!config.endpoint.empty()) {
            std::cout << "  endpoint: " << config.endpoint
                      << (config.path_style ? " (path-style)" : "") << std::endl;
        }
        // Mask secrets in log output
        std::cout << "  access-key: " << (config.access_key.empty() ? "-" : "****") << std::endl;
        std::cout << "  secret-key: " << (config.secret_key.empty() ? "-" : "****") << std::endl;
        if (!config.session_token.empty()) {
            std::cout << "  session-token: ****" << std::endl;
        }
    }
    std::cout << "  chunk-size: " << config.chunk_size << " bytes" << std::endl;
    std::cout << "  retry: " << config.retry_limit << " attempts, "
              << config.retry_interval_secs << "s apart" << std::endl;
    std::cout << "  workers: " << config.workers << std::endl;

    std::unique_ptr<s3pipe::ObjectStore> store;
    if (config.store_type == "local") {
        try {
            store = s3pipe::ObjectStoreFactory::create_local(config.store_path);
        } catch (const std::exception& e) {
            return fail(s3pipe::UploadError::make(s3pipe::ErrorKind::ConfigError,
                std::string("cannot open local store: ") + e.what()));
        }
    } else {
        store = s3pipe::ObjectStoreFactory::create_s3(config.s3_config());
    }

    std::unique_ptr<s3pipe::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<s3pipe::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"bucket", config.bucket}});
        metrics->start();
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    s3pipe::StreamUploader uploader(*store, config.uploader_options(), metrics.get());

    // Turn a shutdown signal into a cancellation outside signal context
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&] {
        while (!finished.load()) {
            if (g_shutdown_requested) {
                s3pipe::log_info("Shutdown requested, cancelling upload");
                uploader.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    s3pipe::UploadOutcome outcome;
    try {
        outcome = uploader.run(*source);
    } catch (const std::exception& e) {
        outcome.error = s3pipe::UploadError::make(s3pipe::ErrorKind::Cancelled,
            std::string("upload stopped by internal error: ") + e.what());
    }

    finished.store(true);
    signal_watcher.join();

    if (metrics) {
        metrics->stop();
    }

    if (outcome.result) {
        const auto& result = *outcome.result;
        std::cout << "Read " << result.total_bytes << " bytes with MD5: "
                  << result.stream_md5 << std::endl;
        std::cout << "Stored data as object " << result.key << " in bucket "
                  << result.bucket << " (" << result.part_count << " parts)" << std::endl;
        std::cout << "Local  etag: " << result.composite_digest << std::endl;
        std::cout << "Remote etag: " << result.remote_digest << std::endl;
        std::cout << (result.status == s3pipe::IntegrityStatus::Verified
                      ? "Verified" : "IntegrityMismatch") << std::endl;
    }

    if (outcome.error) {
        return s3pipe::exit_code_for(*outcome.error);
    }
    return 0;
}
