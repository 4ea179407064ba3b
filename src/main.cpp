#include "catalog/http_catalog_client.hpp"
#include "download/download_orchestrator.hpp"
#include "download/progress_sinks.hpp"
#include "download/status_sink.hpp"
#include "system/cancellation.hpp"
#include "util/config_file.hpp"
#include "util/logger.hpp"
#include "util/run_options.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <string>
#include <vector>

#ifndef IPSWDL_VERSION
#define IPSWDL_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s (-A | -f <term> | -L) [-p <dir>] [-d] [-l <file>] [-c <file>] [-v]\n"
        "\n"
        "Options:\n"
        "  -p, --download-path      Directory receiving <device>/<version>.ipsw (default ./ipsw)\n"
        "  -d, --delete-old-fw      Remove older firmware files of a device after a new download\n"
        "  -A, --download-all       Download the newest firmware of every device\n"
        "  -f, --filter-term        Only devices whose name contains <term> (case-sensitive)\n"
        "  -L, --list-device-names  Print the catalog's device names and exit\n"
        "  -l, --log-path           Write a debug log to <file>\n"
        "  -c, --config             JSON config file (default: $%s)\n"
        "  -v, --verbose            Debug log to stderr\n"
        "  -h, --help               Show this help\n",
        argv, ipswdl::config::kConfigEnvVar);
}

struct CliArgs {
    const char *download_path = nullptr;
    bool delete_old_fw = false;
    bool download_all = false;
    const char *filter_term = nullptr;
    bool list_names = false;
    const char *log_path = nullptr;
    const char *config_path = nullptr;
    bool verbose = false;
};

int Run(const CliArgs &args) {
    ipswdl::RunOptions opt{};

    std::string config_path;
    if (args.config_path) {
        config_path = args.config_path;
    } else if (const char *env = std::getenv(ipswdl::config::kConfigEnvVar); env && *env) {
        config_path = env;
    }
    if (!config_path.empty()) {
        ipswdl::config::ConfigFile cfg;
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", r.msg.c_str());
            return kExitFailure;
        }
        cfg.ApplyTo(opt);
    }

    if (args.download_path) opt.download_path = args.download_path;
    if (args.delete_old_fw) opt.delete_old_fw = true;
    if (args.filter_term) opt.filter_term = std::string(args.filter_term);
    if (args.log_path) opt.log_path = std::string(args.log_path);

    auto &logger = ipswdl::Logger::Instance();
    if (opt.log_path) {
        if (auto r = logger.OpenFile(*opt.log_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitFailure;
        }
        logger.SetLevel(ipswdl::LogLevel::Debug);
    } else if (args.verbose) {
        logger.SetLevel(ipswdl::LogLevel::Debug);
    }
    LogInfo("ipswdl %s, download path %s", IPSWDL_VERSION, opt.download_path.c_str());

    ipswdl::CancellationSignal cancel;
    ipswdl::InterruptHook hook(cancel);

    ipswdl::HttpCatalogClient::Options client_opt;
    if (!opt.catalog_base_url.empty()) client_opt.base_url = opt.catalog_base_url;
    client_opt.transfer.connect_timeout_sec = opt.connect_timeout_sec;
    client_opt.transfer.user_agent = std::string("ipswdl/") + IPSWDL_VERSION;
    ipswdl::HttpCatalogClient client(client_opt);

    std::printf("Getting Devices...\n");
    std::fflush(stdout);
    std::vector<ipswdl::Device> devices;
    if (auto r = client.ListDevices(devices); !r.ok) {
        std::fprintf(stderr, "ERROR: cannot fetch device list: %s\n", r.msg.c_str());
        LogError("device list: %s", r.msg.c_str());
        return kExitFailure;
    }
    if (args.list_names) {
        for (const auto &d : devices) {
            std::printf("%s\n", d.name.c_str());
        }
        return kExitOk;
    }
    std::printf("Got %zu devices!\n", devices.size());

    ipswdl::ConsoleStatusSink status;
    ipswdl::ConsoleProgressSink progress;
    ipswdl::DownloadOrchestrator orchestrator(client, opt, cancel, status,
                                              opt.progress ? &progress : nullptr);
    const auto summary = orchestrator.Run(devices);

    LogInfo("run finished: %u/%u done, %u completed, %u skipped, %u failed",
            summary.done, summary.total, summary.completed, summary.skipped, summary.failed);
    return summary.interrupted ? kExitInterrupted : kExitOk;
}

} // namespace

int main(int argc, char **argv) {
    CliArgs args;

    static option long_opts[] = {
        {"download-path", required_argument, nullptr, 'p'},
        {"delete-old-fw", no_argument, nullptr, 'd'},
        {"download-all", no_argument, nullptr, 'A'},
        {"filter-term", required_argument, nullptr, 'f'},
        {"list-device-names", no_argument, nullptr, 'L'},
        {"log-path", required_argument, nullptr, 'l'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hp:dAf:Ll:c:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'p':
                args.download_path = optarg;
                break;
            case 'd':
                args.delete_old_fw = true;
                break;
            case 'A':
                args.download_all = true;
                break;
            case 'f':
                args.filter_term = optarg;
                break;
            case 'L':
                args.list_names = true;
                break;
            case 'l':
                args.log_path = optarg;
                break;
            case 'c':
                args.config_path = optarg;
                break;
            case 'v':
                args.verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    const int modes = (args.download_all ? 1 : 0) + (args.filter_term ? 1 : 0) + (args.list_names ? 1 : 0);
    if (modes != 1) {
        std::fprintf(stderr, modes == 0 ? "One of -A, -f or -L is required\n"
                                        : "-A, -f and -L are mutually exclusive\n");
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (args.filter_term && *args.filter_term == '\0') {
        std::fprintf(stderr, "--filter-term must not be empty\n");
        return kExitUsage;
    }

    try {
        return Run(args);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "ERROR: %s\n", e.what());
        return kExitFailure;
    }
}
