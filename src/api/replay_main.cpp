#include <cstdlib>
#include <iostream>
#include <string>

#include "api/replay.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --input <script> [options]\n"
              << "Options:\n"
              << "  --config <path>         JSON engine configuration (default: transaction preset)\n"
              << "  --out <path>            Write output events to a file instead of stdout\n"
              << "  --verify-against <path> Compare output events against an expected file\n"
              << "  --max-events <N>        Optional cap on delta events applied\n"
              << "  --snapshot              Append the final left-join rows to the output\n"
              << "  --quiet                 Suppress non-error logs\n"
              << "  --verbose               Enable verbose logging\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    api::ReplayConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            cfg.input = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            cfg.config_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            cfg.output_path = argv[++i];
        } else if (arg == "--verify-against" && i + 1 < argc) {
            cfg.verify_against = argv[++i];
        } else if (arg == "--max-events" && i + 1 < argc) {
            cfg.max_events = static_cast<std::size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (arg == "--snapshot") {
            cfg.snapshot = true;
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    return api::run_replay(cfg);
}
