#include "janitor/orphan_finder.hpp"
#include "janitor/upload_deleter.hpp"
#include "janitor/upload_path_resolver.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultConfigPath = "/etc/upload-janitor/janitor.conf";

enum LongOnly : int {
    kOptResolve = 1000,
    kOptOrphans,
};

enum class Mode {
    Delete,
    Resolve,
    Orphans,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-r <uploads-dir> | -b <base-dir>] [-c <config>] [-i <file|->] [options] [url...]\n"
        "\n"
        "Deletes the local files referenced by /uploads/ URLs and prints a JSON report.\n"
        "\n"
        "Options:\n"
        "  -r, --root       Uploads directory\n"
        "  -b, --base       Base directory, uploads live in <base>/data/uploads\n"
        "  -c, --config     Config file (default %s if present)\n"
        "  -i, --input      Read URLs one per line from a file or '-' for stdin\n"
        "      --resolve    Print the local path of each URL, delete nothing\n"
        "      --orphans    Treat URLs as still referenced, delete every other upload\n"
        "  -n, --dry-run    Report what would be deleted\n"
        "  -s, --sort       Sort report entries\n"
        "  -v, --verbose    Debug logging\n"
        "  -h, --help       Show this help\n",
        argv, kDefaultConfigPath);
}

bool ReadUrlLines(const std::string &input, std::vector<std::string> &urls) {
    std::ifstream file;
    std::istream *is = &std::cin;
    if (input != "-") {
        file.open(input);
        if (!file.good()) return false;
        is = &file;
    }

    std::string line;
    while (std::getline(*is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        urls.push_back(line);
    }
    return !is->bad();
}

nlohmann::json ReportToJson(const janitor::DeletionReport &report) {
    nlohmann::json j;
    j["removed"] = report.removed;
    j["candidates"] = report.candidates;
    return j;
}

} // namespace

int main(int argc, char **argv) {
    std::string root_cli;
    std::string base_cli;
    std::string config_path;
    std::string input;
    Mode mode = Mode::Delete;
    bool verbose = false;

    janitor::DeleteOptions opt{};

    static option long_opts[] = {
        {"root", required_argument, nullptr, 'r'},
        {"base", required_argument, nullptr, 'b'},
        {"config", required_argument, nullptr, 'c'},
        {"input", required_argument, nullptr, 'i'},
        {"resolve", no_argument, nullptr, kOptResolve},
        {"orphans", no_argument, nullptr, kOptOrphans},
        {"dry-run", no_argument, nullptr, 'n'},
        {"sort", no_argument, nullptr, 's'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hr:b:c:i:nsv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'r':
                root_cli = optarg;
                break;
            case 'b':
                base_cli = optarg;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'i':
                input = optarg;
                break;
            case kOptResolve:
                mode = Mode::Resolve;
                break;
            case kOptOrphans:
                mode = Mode::Orphans;
                break;
            case 'n':
                opt.dry_run = true;
                break;
            case 's':
                opt.sort_results = true;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    janitor::config::JanitorConfigFromFile cfg;
    if (!config_path.empty()) {
        if (!cfg.LoadFile(config_path)) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", cfg.LastError().c_str());
            return 1;
        }
    } else {
        std::error_code ec;
        if (std::filesystem::exists(kDefaultConfigPath, ec) && !cfg.LoadFile(kDefaultConfigPath)) {
            std::fprintf(stderr, "WARN: ignoring config: %s\n", cfg.LastError().c_str());
            cfg.Reset();
        }
    }

    auto &logger = janitor::Logger::Instance();
    if (cfg.log_file && !logger.SetOutputFile(*cfg.log_file)) {
        std::fprintf(stderr, "WARN: cannot open log file %s, logging to stderr\n",
                     cfg.log_file->c_str());
    }
    if (cfg.log_level) {
        logger.SetLevel(*janitor::ParseLogLevel(*cfg.log_level));
    }
    if (verbose) {
        logger.SetLevel(janitor::LogLevel::Debug);
    }
    if (cfg.sort_results.has_value() && !opt.sort_results) {
        opt.sort_results = *cfg.sort_results;
    }

    std::string root;
    if (!root_cli.empty()) {
        root = root_cli;
    } else if (!base_cli.empty()) {
        root = janitor::UploadsRootFromBase(base_cli).string();
    } else {
        root = cfg.EffectiveUploadsRoot();
    }
    if (root.empty()) {
        std::fprintf(stderr, "ERROR: no uploads directory (use -r, -b or a config file)\n");
        PrintUsage(argv[0]);
        return 2;
    }

    std::vector<std::string> urls(argv + optind, argv + argc);
    if (!input.empty() && !ReadUrlLines(input, urls)) {
        std::fprintf(stderr, "ERROR: cannot read URLs from %s\n", input.c_str());
        return 1;
    }

    const janitor::UploadPathResolver resolver(root);
    LogDebug("uploads root: %s", resolver.Root().c_str());

    if (mode == Mode::Resolve) {
        for (const auto &url : urls) {
            const auto path = resolver.Resolve(url);
            std::printf("%s\t%s\n", url.c_str(), path ? path->c_str() : "");
        }
        return 0;
    }

    janitor::UploadDeleter deleter(resolver, opt);
    nlohmann::json out;
    if (mode == Mode::Orphans) {
        auto orphans = janitor::FindOrphanUploads(resolver, urls);
        if (!orphans) {
            std::fprintf(stderr, "ERROR: %s\n", orphans.error().c_str());
            return 1;
        }
        out = ReportToJson(deleter.DeleteLocalUploads(*orphans));
        out["orphans"] = *orphans;
    } else {
        out = ReportToJson(deleter.DeleteLocalUploads(urls));
    }

    std::cout << out.dump(2) << std::endl;
    LogInfo("removed %zu of %zu candidate(s)",
            out["removed"].size(), out["candidates"].size());
    return 0;
}
