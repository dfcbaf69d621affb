#include "s3pipe/upload_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace s3pipe {

namespace {

constexpr const char* USAGE =
    "Usage: s3pipe -b <bucket> -o <object> [options] [infile]\n"
    "\n"
    "Streams a file or stdin ('-', the default) into an S3 bucket with a\n"
    "verified multipart upload.\n"
    "\n"
    "Target:\n"
    "  -b, --bucket <name>              Name of the target bucket\n"
    "  -o, --obj <key>                  Name of the object to write\n"
    "\n"
    "Upload:\n"
    "  -c, --chunksize <bytes>          Part size in bytes (default: 8 MiB, min: 5 MiB)\n"
    "  -s, --secs-wait <secs>           Wait before retrying a failed part (default: 5)\n"
    "  -r, --retry <N>                  Attempts per part before giving up (default: 5)\n"
    "  --workers <N>                    Parts uploaded concurrently (default: 1)\n"
    "  --skip-preflight                 Do not check the bucket and object before uploading\n"
    "\n"
    "Credentials:\n"
    "  -k, --keyfile <path>             File containing <AWS_KEY>:<AWS_SECRET>\n"
    "                                   (default: AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY env)\n"
    "\n"
    "Object store:\n"
    "  --store <s3|local>               Store type (default: s3)\n"
    "  --store-path <path>              Root directory of the local store\n"
    "  --region <region>                S3 region (default: us-east-1)\n"
    "  --endpoint <url>                 Custom S3 endpoint (MinIO etc.)\n"
    "  --path-style                     Use path-style addressing\n"
    "  --ca-cert <path>                 CA certificate for SSL\n"
    "  --no-verify-ssl                  Skip SSL verification\n"
    "\n"
    "Other:\n"
    "  --config <path>                  JSON config file\n"
    "  -d, --debug                      Print debug information\n"
    "  --verbose                        Log HTTP traffic\n"
    "  --log-file <path>                Log file path\n"
    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
    "  -h, --help                       Show this help\n";

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

std::string parse_keyfile(const std::filesystem::path& path,
                          std::string& access_key, std::string& secret_key) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "Please provide a readable keyfile containing AWS credentials.";
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    std::string content = trim(oss.str());

    size_t colon = content.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == content.size() ||
        content.find(':', colon + 1) != std::string::npos) {
        return "Please provide AWS credentials in the form <KEY_ID>:<SECRET_KEY> in keyfile " +
               path.string() + ".";
    }
    access_key = content.substr(0, colon);
    secret_key = content.substr(colon + 1);
    return {};
}

std::optional<UploadConfig> UploadConfig::from_args(int argc, char* argv[]) {
    UploadConfig config;
    bool have_infile = false;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-b" || arg == "--bucket") {
                auto* v = next_arg(i, "--bucket");
                if (!v) return std::nullopt;
                config.bucket = v;
            } else if (arg == "-o" || arg == "--obj") {
                auto* v = next_arg(i, "--obj");
                if (!v) return std::nullopt;
                config.key = v;
            } else if (arg == "-k" || arg == "--keyfile") {
                auto* v = next_arg(i, "--keyfile");
                if (!v) return std::nullopt;
                config.keyfile = v;
            } else if (arg == "-c" || arg == "--chunksize") {
                auto* v = next_arg(i, "--chunksize");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "-s" || arg == "--secs-wait") {
                auto* v = next_arg(i, "--secs-wait");
                if (!v) return std::nullopt;
                config.retry_interval_secs = std::stoi(v);
            } else if (arg == "-r" || arg == "--retry") {
                auto* v = next_arg(i, "--retry");
                if (!v) return std::nullopt;
                config.retry_limit = std::stoi(v);
            } else if (arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.workers = std::stoull(v);
            } else if (arg == "--skip-preflight") {
                config.skip_preflight = true;
            } else if (arg == "--store") {
                auto* v = next_arg(i, "--store");
                if (!v) return std::nullopt;
                config.store_type = v;
            } else if (arg == "--store-path") {
                auto* v = next_arg(i, "--store-path");
                if (!v) return std::nullopt;
                config.store_path = v;
            } else if (arg == "--region") {
                auto* v = next_arg(i, "--region");
                if (!v) return std::nullopt;
                config.region = v;
            } else if (arg == "--endpoint") {
                auto* v = next_arg(i, "--endpoint");
                if (!v) return std::nullopt;
                config.endpoint = v;
            } else if (arg == "--path-style") {
                config.path_style = true;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.ca_cert_path = v;
            } else if (arg == "--no-verify-ssl") {
                config.verify_ssl = false;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "-d" || arg == "--debug") {
                config.debug = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << USAGE;
                return std::nullopt;
            } else if (arg == "-" || arg.empty() || arg[0] != '-') {
                if (have_infile) {
                    std::cerr << "Error: more than one input file given\n";
                    return std::nullopt;
                }
                config.infile = arg;
                have_infile = true;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    return config;
}

bool UploadConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("bucket")) bucket = j["bucket"].get<std::string>();
        if (j.contains("key")) key = j["key"].get<std::string>();
        if (j.contains("keyfile")) keyfile = j["keyfile"].get<std::string>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("retry_limit")) retry_limit = j["retry_limit"].get<int>();
        if (j.contains("retry_interval")) retry_interval_secs = j["retry_interval"].get<int>();
        if (j.contains("workers")) workers = j["workers"].get<size_t>();
        if (j.contains("skip_preflight")) skip_preflight = j["skip_preflight"].get<bool>();
        if (j.contains("debug")) debug = j["debug"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        // Object store section
        if (j.contains("store") && j["store"].is_object()) {
            auto& js = j["store"];
            if (js.contains("type")) store_type = js["type"].get<std::string>();
            if (js.contains("path")) store_path = js["path"].get<std::string>();
            if (js.contains("region")) region = js["region"].get<std::string>();
            if (js.contains("endpoint")) endpoint = js["endpoint"].get<std::string>();
            if (js.contains("path_style")) path_style = js["path_style"].get<bool>();
            if (js.contains("verify_ssl")) verify_ssl = js["verify_ssl"].get<bool>();
            if (js.contains("ca_cert")) ca_cert_path = js["ca_cert"].get<std::string>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string UploadConfig::resolve_credentials() {
    if (!keyfile.empty()) {
        return parse_keyfile(keyfile, access_key, secret_key);
    }

    if (access_key.empty()) {
        if (const char* v = std::getenv("AWS_ACCESS_KEY_ID")) access_key = v;
    }
    if (secret_key.empty()) {
        if (const char* v = std::getenv("AWS_SECRET_ACCESS_KEY")) secret_key = v;
    }
    if (session_token.empty()) {
        if (const char* v = std::getenv("AWS_SESSION_TOKEN")) session_token = v;
    }

    if (store_type == "s3" && (access_key.empty() || secret_key.empty())) {
        return "No AWS credentials: use --keyfile or set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY";
    }
    return {};
}

std::string UploadConfig::validate() const {
    if (bucket.empty()) return "bucket is required (--bucket)";
    if (key.empty()) return "object key is required (--obj)";
    if (chunk_size < constants::MIN_PART_SIZE)
        return "chunk size must be at least " + std::to_string(constants::MIN_PART_SIZE) + " bytes";
    if (chunk_size > constants::MAX_PART_SIZE)
        return "chunk size must be at most " + std::to_string(constants::MAX_PART_SIZE) + " bytes";
    if (retry_limit < 1) return "retry limit must be >= 1";
    if (retry_interval_secs < 0) return "retry interval must be >= 0";
    if (workers < 1 || workers > constants::MAX_UPLOAD_WORKERS)
        return "workers must be between 1 and " + std::to_string(constants::MAX_UPLOAD_WORKERS);
    if (store_type == "local") {
        if (store_path.empty()) return "local store requires --store-path";
    } else if (store_type != "s3") {
        return "unknown store type: " + store_type;
    }
    if (metrics_interval_secs == 0) return "metrics interval must be > 0";
    return {};
}

S3StoreConfig UploadConfig::s3_config() const {
    S3StoreConfig s3;
    s3.region = region;
    s3.endpoint = endpoint;
    s3.access_key = access_key;
    s3.secret_key = secret_key;
    s3.session_token = session_token;
    s3.use_path_style = path_style;
    s3.verify_ssl = verify_ssl;
    s3.ca_cert_path = ca_cert_path;
    s3.connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    s3.request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    s3.verbose = verbose;
    return s3;
}

UploaderOptions UploadConfig::uploader_options() const {
    UploaderOptions options;
    options.bucket = bucket;
    options.key = key;
    options.retry.max_attempts = retry_limit;
    options.retry.interval = std::chrono::seconds(retry_interval_secs);
    options.workers = static_cast<int>(workers);
    options.preflight = !skip_preflight;
    return options;
}

}  // namespace s3pipe
