#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3pipe {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename, so long-running pipes can be watched while they stream.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Serialize the registry to the textfile now. Returns false on I/O failure.
    bool write_file();

    // --- Counter accessors ---
    prometheus::Counter& parts_verified() { return *parts_verified_; }
    prometheus::Counter& parts_failed() { return *parts_failed_; }
    prometheus::Counter& part_attempts() { return *part_attempts_; }
    prometheus::Counter& retries_transport() { return *retries_transport_; }
    prometheus::Counter& retries_mismatch() { return *retries_mismatch_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& sessions_completed() { return *sessions_completed_; }
    prometheus::Counter& sessions_aborted() { return *sessions_aborted_; }
    prometheus::Counter& verifications_verified() { return *verifications_verified_; }
    prometheus::Counter& verifications_mismatch() { return *verifications_mismatch_; }

    // --- Gauge accessors ---
    prometheus::Gauge& parts_in_flight() { return *parts_in_flight_; }

    // --- Histogram accessors ---
    prometheus::Histogram& part_upload_duration() { return *part_upload_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* parts_verified_;
    prometheus::Counter* parts_failed_;
    prometheus::Counter* part_attempts_;
    prometheus::Counter* retries_transport_;
    prometheus::Counter* retries_mismatch_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* sessions_completed_;
    prometheus::Counter* sessions_aborted_;
    prometheus::Counter* verifications_verified_;
    prometheus::Counter* verifications_mismatch_;

    // --- Gauges ---
    prometheus::Gauge* parts_in_flight_;

    // --- Histograms ---
    prometheus::Histogram* part_upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;

    // Serializes write_file() between the writer thread and stop()
    std::mutex write_mutex_;
};

}  // namespace s3pipe
