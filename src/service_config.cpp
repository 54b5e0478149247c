#include "blobstream/service_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace blobstream {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type != "lmdb" && type != "local") {
        return "unknown backend type: " + type;
    }
    if (params.count("path") == 0 || params.at("path").empty()) {
        return type + " backend requires 'path'";
    }
    if (type == "lmdb" && params.count("mapsize_gb")) {
        try {
            if (std::stoull(params.at("mapsize_gb")) == 0) return "lmdb mapsize_gb must be > 0";
        } catch (const std::exception&) {
            return "lmdb mapsize_gb is not a number: " + params.at("mapsize_gb");
        }
    }
    return {};
}

// --- ServiceConfig ---

namespace {

uint16_t parse_port(const std::string& value) {
    auto port = std::stoul(value);
    if (port > 65535) throw std::out_of_range("port out of range: " + value);
    return static_cast<uint16_t>(port);
}

void print_usage() {
    std::cerr <<
        "Usage: blobstream --data-dir <path> [options]\n"
        "\n"
        "Listener:\n"
        "  --listen <address>               Listen address (default: 0.0.0.0)\n"
        "  --port <N>                       Listen port (default: 5000, or PORT env)\n"
        "  --storage-threads <N>            Storage worker threads (default: 4)\n"
        "  --request-timeout <secs>         Per-request I/O timeout (default: 30)\n"
        "  --max-upload-mb <N>              Maximum request body in MB (default: 2048)\n"
        "  --public-url <url>               Base URL for videoUrl (default: from Host header)\n"
        "  --cors-origin <origin>           Access-Control-Allow-Origin (default: *)\n"
        "  --no-cors                        Send no CORS headers\n"
        "\n"
        "Storage:\n"
        "  --data-dir <path>                Data directory (or BLOBSTREAM_DATA_DIR env)\n"
        "  --chunk-store <lmdb|local>       Chunk store engine (default: lmdb)\n"
        "  --chunk-store-path <path>        Chunk store location (default: <data-dir>/chunks)\n"
        "  --lmdb-mapsize-gb <N>            LMDB map size in GB (default: 64)\n"
        "  --record-db <path>               Record database (default: <data-dir>/records.db)\n"
        "  --chunk-size <bytes>             Chunk size (default: 1048576)\n"
        "  --serve-window <bytes>           Max bytes per range response (default: 1000000)\n"
        "  --content-type <type>            Content-Type of range responses (default: video/mp4)\n"
        "  --skip-orphan-collection         Do not sweep unreferenced chunks on startup\n"
        "\n"
        "Daemon:\n"
        "  --config <path>                  JSON config file\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --stats-interval <secs>          Stats reporting interval (default: 60)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<ServiceConfig> ServiceConfig::from_args(int argc, char* argv[]) {
    ServiceConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        if (const char* v = std::getenv("PORT"); v && *v) {
            config.port = parse_port(v);
        }
        if (const char* v = std::getenv("BLOBSTREAM_DATA_DIR"); v && *v) {
            config.data_dir = v;
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--listen") {
                auto* v = next_arg(i, "--listen");
                if (!v) return std::nullopt;
                config.listen_address = v;
            } else if (arg == "--port") {
                auto* v = next_arg(i, "--port");
                if (!v) return std::nullopt;
                config.port = parse_port(v);
            } else if (arg == "--storage-threads") {
                auto* v = next_arg(i, "--storage-threads");
                if (!v) return std::nullopt;
                config.storage_threads = std::stoull(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoull(v);
            } else if (arg == "--max-upload-mb") {
                auto* v = next_arg(i, "--max-upload-mb");
                if (!v) return std::nullopt;
                config.max_upload_bytes = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--public-url") {
                auto* v = next_arg(i, "--public-url");
                if (!v) return std::nullopt;
                config.public_url = v;
            } else if (arg == "--cors-origin") {
                auto* v = next_arg(i, "--cors-origin");
                if (!v) return std::nullopt;
                config.cors_origin = v;
            } else if (arg == "--no-cors") {
                config.cors_origin.clear();
            } else if (arg == "--data-dir") {
                auto* v = next_arg(i, "--data-dir");
                if (!v) return std::nullopt;
                config.data_dir = v;
            } else if (arg == "--chunk-store") {
                auto* v = next_arg(i, "--chunk-store");
                if (!v) return std::nullopt;
                config.chunk_store.type = v;
            } else if (arg == "--chunk-store-path") {
                auto* v = next_arg(i, "--chunk-store-path");
                if (!v) return std::nullopt;
                config.chunk_store.params["path"] = v;
            } else if (arg == "--lmdb-mapsize-gb") {
                auto* v = next_arg(i, "--lmdb-mapsize-gb");
                if (!v) return std::nullopt;
                config.chunk_store.params["mapsize_gb"] = v;
            } else if (arg == "--record-db") {
                auto* v = next_arg(i, "--record-db");
                if (!v) return std::nullopt;
                config.record_db_path = v;
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--serve-window") {
                auto* v = next_arg(i, "--serve-window");
                if (!v) return std::nullopt;
                config.serve_window = std::stoull(v);
            } else if (arg == "--content-type") {
                auto* v = next_arg(i, "--content-type");
                if (!v) return std::nullopt;
                config.content_type = v;
            } else if (arg == "--skip-orphan-collection") {
                config.collect_orphans_on_start = false;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric value: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool ServiceConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("listen_address")) listen_address = j["listen_address"].get<std::string>();
        if (j.contains("port")) port = j["port"].get<uint16_t>();
        if (j.contains("storage_threads")) storage_threads = j["storage_threads"].get<size_t>();
        if (j.contains("request_timeout")) request_timeout_secs = j["request_timeout"].get<size_t>();
        if (j.contains("max_upload_mb"))
            max_upload_bytes = j["max_upload_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("public_url")) public_url = j["public_url"].get<std::string>();
        if (j.contains("cors_origin")) cors_origin = j["cors_origin"].get<std::string>();
        if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
        if (j.contains("record_db")) record_db_path = j["record_db"].get<std::string>();
        if (j.contains("collect_orphans_on_start"))
            collect_orphans_on_start = j["collect_orphans_on_start"].get<bool>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("serve_window")) serve_window = j["serve_window"].get<uint64_t>();
        if (j.contains("content_type")) content_type = j["content_type"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("chunk_store") && j["chunk_store"].is_object()) {
            auto& jc = j["chunk_store"];
            if (jc.contains("type")) chunk_store.type = jc["type"].get<std::string>();
            for (auto& [key, val] : jc.items()) {
                if (key == "type") continue;
                chunk_store.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void ServiceConfig::apply_defaults() {
    if (chunk_store.type.empty()) {
        chunk_store.type = constants::DEFAULT_CHUNK_BACKEND;
    }
    if ((chunk_store.params.count("path") == 0 || chunk_store.params["path"].empty()) &&
        !data_dir.empty()) {
        chunk_store.params["path"] = (data_dir / "chunks").string();
    }
    if (chunk_store.type == "lmdb" && chunk_store.params.count("mapsize_gb") == 0) {
        chunk_store.params["mapsize_gb"] = std::to_string(constants::DEFAULT_LMDB_MAPSIZE_GB);
    }
    if (record_db_path.empty() && !data_dir.empty()) {
        record_db_path = data_dir / "records.db";
    }
}

std::string ServiceConfig::validate() const {
    if (data_dir.empty()) return "data_dir is required (--data-dir or BLOBSTREAM_DATA_DIR)";
    if (port == 0 && !allow_ephemeral_port) return "port must be > 0";
    auto err = chunk_store.validate();
    if (!err.empty()) return "chunk_store: " + err;
    if (record_db_path.empty()) return "record_db is required";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (serve_window == 0) return "serve_window must be > 0";
    if (storage_threads == 0) return "storage_threads must be > 0";
    if (max_upload_bytes == 0) return "max_upload_bytes must be > 0";
    if (content_type.empty()) return "content_type is required";
    return {};
}

}  // namespace blobstream
