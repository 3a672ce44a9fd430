#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <curl/curl.h>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <jobs/job_pool.hpp>
#include <jobs/result_uploader.hpp>
#include <managers/download_manager.hpp>
#include <managers/restore_report.hpp>
#include <notify/notifier.hpp>
#include <queue/command_runner.hpp>
#include <queue/pbs_queue.hpp>
#include <store/job_store.hpp>
#include <transfer/curl_ftp_session.hpp>
#include <transfer/restore_service.hpp>

namespace {

std::atomic<bool> g_stop{false};

void handle_stop_signal(int) {
    g_stop = true;
}

void print_usage() {
    std::cout << "Usage: obspipe [--config PATH] <command>\n\n"
              << "Commands:\n"
              << "    download    Request restores and download their files\n"
              << "    jobs        Run the job pool rotation loop\n"
              << "    status      Show active restores and their downloads\n";
}

int run_download(const Config& config, Notifier& notifier) {
    JobStore store(config.store());
    store.initialize_schema();

    SoapRestoreService service(config.restore_service());
    DownloadManager manager(config.download(), store, service,
                            make_curl_ftp_factory(config.ftp()), notifier);
    manager.run(g_stop);
    return 0;
}

int run_jobs(const Config& config) {
    auto runner = make_command_runner(config.queue());
    PbsQueue queue(config.queue(), *runner);
    CommandUploader uploader(config.jobs());
    JobPool pool(config.jobs(), queue, uploader);
    pool.run(g_stop);
    return 0;
}

int run_status(const Config& config) {
    JobStore store(config.store());
    store.initialize_schema();
    print_restore_report(store, std::cout);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string cmd;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (cmd.empty()) {
            cmd = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }
    if (cmd != "download" && cmd != "jobs" && cmd != "status") {
        if (!cmd.empty()) std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }

    auto loaded = config_path.empty() ? Config::load() : Config::load(config_path);
    if (loaded.is_err()) {
        std::cerr << loaded.error << "\n";
        return 1;
    }
    const Config& config = loaded.value;
    log_configure(config.log().file, config.log().screen_output,
                  parse_log_level(config.log().level));

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    CommandNotifier notifier(config.notify());
    int rc = 1;
    try {
        if (cmd == "download") {
            rc = run_download(config, notifier);
        } else if (cmd == "jobs") {
            rc = run_jobs(config);
        } else {
            rc = run_status(config);
        }
    } catch (const std::exception& e) {
        std::string module = cmd == "jobs" ? "jobpool" : "download";
        log_error(module, fmt::format("Fatal error: {}", e.what()));
        notifier.notify(fmt::format("obspipe {} stopped", cmd),
                        fmt::format("Fatal error occurred while running {}:\n\n{}", cmd, e.what()));
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}
