#include "s3pipe/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3pipe {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& parts_family = prometheus::BuildCounter()
        .Name("s3pipe_parts_total")
        .Help("Parts that reached a terminal state")
        .Labels(labels)
        .Register(*registry_);
    parts_verified_ = &parts_family.Add({{"result", "verified"}});
    parts_failed_ = &parts_family.Add({{"result", "failed"}});

    part_attempts_ = &prometheus::BuildCounter()
        .Name("s3pipe_part_attempts_total")
        .Help("Total part upload attempts")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& retries_family = prometheus::BuildCounter()
        .Name("s3pipe_part_retries_total")
        .Help("Part attempts that ended in a retry")
        .Labels(labels)
        .Register(*registry_);
    retries_transport_ = &retries_family.Add({{"reason", "upload_error"}});
    retries_mismatch_ = &retries_family.Add({{"reason", "digest_mismatch"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("s3pipe_upload_bytes_total")
        .Help("Total bytes in verified parts")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& sessions_family = prometheus::BuildCounter()
        .Name("s3pipe_sessions_total")
        .Help("Multipart sessions by outcome")
        .Labels(labels)
        .Register(*registry_);
    sessions_completed_ = &sessions_family.Add({{"result", "completed"}});
    sessions_aborted_ = &sessions_family.Add({{"result", "aborted"}});

    auto& verify_family = prometheus::BuildCounter()
        .Name("s3pipe_verifications_total")
        .Help("Whole-object integrity checks by result")
        .Labels(labels)
        .Register(*registry_);
    verifications_verified_ = &verify_family.Add({{"result", "verified"}});
    verifications_mismatch_ = &verify_family.Add({{"result", "mismatch"}});

    // --- Gauges ---

    parts_in_flight_ = &prometheus::BuildGauge()
        .Name("s3pipe_parts_in_flight")
        .Help("Parts currently being uploaded or waiting to retry")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    part_upload_duration_ = &prometheus::BuildHistogram()
        .Name("s3pipe_part_upload_duration_seconds")
        .Help("Single part upload attempt duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace s3pipe
