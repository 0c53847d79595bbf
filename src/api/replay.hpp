#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "core/incremental_matcher.hpp"
#include "core/result_materializer.hpp"

namespace api {

struct ReplayConfig {
    std::filesystem::path input{};
    std::filesystem::path config_path{}; // empty: core::transaction_recon_config()
    std::filesystem::path output_path{}; // empty: stdout
    std::filesystem::path verify_against{};
    std::size_t max_events{0};
    bool snapshot{false}; // print the final left-join rows after the event stream

    bool quiet{false};
    bool verbose{false};
};

struct ReplayStats {
    std::size_t lines{0};
    std::size_t events{0};
    std::size_t skipped{0};
    std::size_t parse_failures{0};
    std::size_t batches{0};
    std::size_t rejected_batches{0};
    std::size_t threshold_changes{0};
    std::size_t output_events{0};
};

// Applies a delta script to the matcher and collects the output stream as text lines.
//
// Consecutive delta lines form one batch; a blank line closes it. A line
// "!min_confidence <tau>" closes the current batch and re-solves under the new
// threshold. Lines that fail to parse are counted and logged, never fatal; parsing
// stops after max_events delta events when max_events > 0.
ReplayStats replay_script(std::istream& in,
                          core::IncrementalMatcher& matcher,
                          core::ResultMaterializer& materializer,
                          std::vector<std::string>& output,
                          std::size_t max_events = 0);

// Runs the replay tool. Returns 0 on success, 1 on setup or input failure and 2 when
// the output differs from the verification file.
int run_replay(const ReplayConfig& cfg);

} // namespace api
