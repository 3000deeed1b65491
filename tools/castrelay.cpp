#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <castrelay/app/CastOptions.hpp>

#include "app/CastApp.hpp"

namespace {

std::atomic<bool> g_should_stop = false;

void handle_signal(int) {
    g_should_stop.store(true);
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = CR::App::ParseCastArguments(argc, argv);
    if (!options_opt) {
        std::cerr << "Try 'castrelay --help'.\n";
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        CR::App::PrintCastUsage();
        return EXIT_SUCCESS;
    }
    if (auto error = CR::App::ValidateCastOptions(options)) {
        std::cerr << "castrelay: " << *error << '\n';
        return EXIT_FAILURE;
    }

    // Receivers that drop a media connection must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto result = CR::App::RunCast(options, &g_should_stop);
    if (!result) {
        std::cerr << "castrelay: " << CR::describeError(result.error()) << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
