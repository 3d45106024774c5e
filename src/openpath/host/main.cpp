// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/browser/dispatcher.hpp>
#include <openpath/browser/native_host.hpp>
#include <openpath/cli/options.hpp>
#include <openpath/core/config.hpp>
#include <openpath/core/whitelist_client.hpp>
#include <openpath/log/log_sink.hpp>
#include <openpath/process/subprocess.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace openpath;

// Terminate handler to report exceptions escaping noexcept functions
static void openpath_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(openpath_terminate_handler);

    auto args = cli::parse_args(argc, argv);
    if (args.help) {
        cli::print_help(std::cerr, argv[0]);
        return 0;
    }
    if (args.version) {
        cli::print_version(std::cerr);
        return 0;
    }

    auto config = core::config_from_environment();
    cli::apply_args(args, config);

    // Frames are binary; keep iostreams away from C stdio buffering
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    browser::ignore_broken_pipe();

    log::LogSink log_sink(config.log_file);
    log_sink.rotate_if_oversized();

    process::SubprocessRunner runner;
    core::WhitelistClient client(runner, config);
    browser::RequestDispatcher dispatcher(client, log_sink, config);
    browser::NativeHost host(dispatcher, log_sink, std::cin, std::cout);

    return host.run();
}
