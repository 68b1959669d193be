#include "userjs/app_config.hpp"
#include "userjs/logger.hpp"
#include "userjs/script_source.hpp"
#include "userjs/text_file.hpp"
#include "userjs/update_workflow.hpp"

#include <cstdio>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

enum class MenuChoice {
    Start,
    Help,
    Exit,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-u] [-m] [--singlebackup] [-c <config.json>] [-v]\n"
        "\n"
        "Options:\n"
        "  -u, --unattended       Run without user input\n"
        "  -m, --minify, --merge  Merge overrides instead of appending them\n"
        "      --singlebackup     Keep only the backup made by this run\n"
        "  -c, --config           JSON configuration file (default %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0,
        userjs::config::kDefaultConfigPath);
}

void PrintBanner() {
    std::printf(
        "\n"
        "    This tool should be run from your Firefox profile directory.\n"
        "    It will download the latest version of ghacks user.js from github and then\n"
        "    append any of your own changes from user-overrides.js to it.\n"
        "    Visit the wiki for more detailed information.\n"
        "\n");
}

void PrintHelp() {
    std::printf(
        "\n"
        "    Available arguments:\n"
        "        -m, --merge\n"
        "\n"
        "    Merge overrides instead of appending them. The upstream header banner is\n"
        "    kept, every user_pref line from user.js and user-overrides.js is collected\n"
        "    and written once. When there are conflicting records for the same pref,\n"
        "    the value from user-overrides.js is used; within user-overrides.js the last\n"
        "    one declared wins. Comments outside the banner are not kept.\n"
        "\n"
        "        -u, --unattended\n"
        "\n"
        "    Run without user input.\n"
        "\n"
        "        --singlebackup\n"
        "\n"
        "    After a successful update, delete older user-backup-*.js files.\n"
        "\n");
}

MenuChoice PromptMenu() {
    while (true) {
        std::printf("  1) Start\n  2) Help\n  3) Exit\n> ");
        std::fflush(stdout);

        std::string line;
        if (!std::getline(std::cin, line)) return MenuChoice::Exit;

        if (line == "1") return MenuChoice::Start;
        if (line == "2") return MenuChoice::Help;
        if (line == "3") return MenuChoice::Exit;
        std::printf("Please enter 1, 2 or 3.\n");
    }
}

int ReportError(const userjs::Result& r) {
    std::fprintf(stderr, "An error occurred during execution:\n%s\n", userjs::Describe(r).c_str());
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    bool flag_unattended = false;
    bool flag_minify = false;
    bool flag_single_backup = false;
    bool flag_verbose = false;
    const char* config_cli = nullptr;

    enum { kOptSingleBackup = 1000 };
    static option long_opts[] = {
        {"unattended", no_argument, nullptr, 'u'},
        {"minify", no_argument, nullptr, 'm'},
        {"merge", no_argument, nullptr, 'm'},
        {"singlebackup", no_argument, nullptr, kOptSingleBackup},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "umc:vh", long_opts, &idx)) != -1) {
        switch (c) {
            case 'u':
                flag_unattended = true;
                break;

            case 'm':
                flag_minify = true;
                break;

            case kOptSingleBackup:
                flag_single_backup = true;
                break;

            case 'c':
                config_cli = optarg;
                break;

            case 'v':
                flag_verbose = true;
                break;

            case 'h':
                PrintUsage(argv[0]);
                return 0;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    userjs::config::AppConfig cfg;
    const std::string config_path = config_cli ? config_cli : userjs::config::kDefaultConfigPath;
    auto lr = cfg.LoadFile(config_path);
    // The default config file is optional; an explicit --config must exist.
    const bool optional_missing = !config_cli && userjs::IsNotFound(lr);
    if (!lr.is_ok() && !optional_missing) {
        lr.kind = userjs::ErrorKind::Config;
        return ReportError(lr);
    }

    cfg.unattended = cfg.unattended || flag_unattended;
    cfg.minify = cfg.minify || flag_minify;
    cfg.single_backup = cfg.single_backup || flag_single_backup;
    if (flag_verbose) {
        cfg.log_level = userjs::LogLevel::Debug;
    }
    userjs::Logger::Instance().SetLevel(cfg.log_level);

    if (auto vr = cfg.Validate(); !vr.is_ok()) {
        return ReportError(vr);
    }

    if (!cfg.unattended) {
        PrintBanner();
        switch (PromptMenu()) {
            case MenuChoice::Start:
                break;
            case MenuChoice::Help:
                PrintHelp();
                return 0;
            case MenuChoice::Exit:
                return 0;
        }
    }

    userjs::HttpScriptSource source(cfg.ToSourceOptions());
    userjs::UpdateWorkflow workflow(source, cfg.ToWorkflowOptions());

    userjs::UpdateAttempt attempt;
    if (auto rr = workflow.Run(attempt); !rr.is_ok()) {
        return ReportError(rr);
    }

    LogDebug("Outcome: %s", userjs::ToString(attempt.outcome));
    return 0;
}
