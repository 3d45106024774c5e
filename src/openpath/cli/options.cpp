// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/cli/options.hpp>
#include <openpath/version.hpp>
#include <ostream>

namespace openpath::cli {

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
                return args;
            }
            if (arg == "-v" || arg == "--version") {
                args.version = true;
                return args;
            }
            if (arg == "--whitelist-cmd") {
                if (i + 1 < argc) {
                    args.whitelist_cmd = argv[++i];
                }
            }
            if (arg == "--update-script") {
                if (i + 1 < argc) {
                    args.update_script = argv[++i];
                }
            }
            if (arg == "--log-file") {
                if (i + 1 < argc) {
                    args.log_file = argv[++i];
                }
            }
        }
    } catch (const std::exception&) {
        return CliArgs{};
    }

    return args;
}

void apply_args(const CliArgs& args, core::HostConfig& config) {
    if (!args.whitelist_cmd.empty()) {
        config.whitelist_command = args.whitelist_cmd;
    }
    if (!args.update_script.empty()) {
        config.update_script = args.update_script;
    }
    if (!args.log_file.empty()) {
        config.log_file = args.log_file;
    }
}

//=============================================================================
// Help
//=============================================================================

void print_help(std::ostream& os, std::string_view program_name) noexcept {
    os << "Usage: " << program_name << " [options]\n"
       << "\n"
       << "Native messaging host for the openpath browser extension.\n"
       << "Speaks length-prefixed JSON on stdin/stdout.\n"
       << "\n"
       << "Options:\n"
       << "  --whitelist-cmd PATH   whitelist tool (default " << core::DEFAULT_WHITELIST_CMD << ")\n"
       << "  --update-script PATH   update script (default " << core::DEFAULT_UPDATE_SCRIPT << ")\n"
       << "  --log-file PATH        log file (default $XDG_DATA_HOME/openpath/native-host.log)\n"
       << "  -v, --version          show version\n"
       << "  -h, --help             show this help\n"
       << "\n"
       << "Environment:\n"
       << "  " << core::ENV_WHITELIST_CMD << ", " << core::ENV_UPDATE_SCRIPT
       << ", " << core::ENV_LOG_FILE << "\n";
}

void print_version(std::ostream& os) noexcept {
    os << HOST_NAME << " " << version.to_string() << "\n";
}

} // namespace openpath::cli
