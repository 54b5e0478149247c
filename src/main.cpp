#include "blobstream/blob_service.hpp"
#include "blobstream/service_config.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // stdout/stderr are redirected to the log file after this returns
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = blobstream::ServiceConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    std::cout << "blobstream starting..." << std::endl;
    std::cout << "  listen: " << config.listen_address << ":" << config.port << std::endl;
    std::cout << "  data-dir: " << config.data_dir << std::endl;
    std::cout << "  chunk-store: " << config.chunk_store.type << std::endl;
    for (auto& [k, v] : config.chunk_store.params) {
        std::cout << "  chunk-store-" << k << ": " << v << std::endl;
    }
    std::cout << "  record-db: " << config.record_db_path << std::endl;
    std::cout << "  chunk-size: " << config.chunk_size << " bytes" << std::endl;
    std::cout << "  serve-window: " << config.serve_window << " bytes" << std::endl;
    std::cout << "  max-upload: " << (config.max_upload_bytes / (1024 * 1024)) << " MB" << std::endl;
    std::cout << "  storage-threads: " << config.storage_threads << std::endl;
    std::cout << "  cors-origin: " << (config.cors_origin.empty() ? "(disabled)" : config.cors_origin)
              << std::endl;
    if (!config.public_url.empty()) {
        std::cout << "  public-url: " << config.public_url << std::endl;
    }
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    blobstream::BlobService service(config);

    err = service.start();
    if (!err.empty()) {
        std::cerr << "Failed to start service: " << err << std::endl;
        if (!config.pid_file.empty()) unlink(config.pid_file.c_str());
        return 1;
    }

    std::cout << "Server running on port " << service.port() << " (PID " << getpid() << ")"
              << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop();
    service.wait();

    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "blobstream exited cleanly" << std::endl;
    return 0;
}
