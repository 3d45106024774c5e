// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/core/config.hpp>
#include <iosfwd>
#include <string>
#include <string_view>

namespace openpath::cli {

// Command line arguments
struct CliArgs {
    std::string whitelist_cmd;
    std::string update_script;
    std::string log_file;
    bool version{false};
    bool help{false};
};

// Parse command line arguments. Anything unrecognized is ignored: browsers
// pass the manifest path and extension id/origin as positional arguments.
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Overlay explicit arguments on an environment-derived config
void apply_args(const CliArgs& args, core::HostConfig& config);

// Help and version go to the given stream; stdout carries frames
void print_help(std::ostream& os, std::string_view program_name) noexcept;
void print_version(std::ostream& os) noexcept;

} // namespace openpath::cli
