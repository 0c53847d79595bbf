#include "api/replay.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>

#include "ingest/delta_text_parser.hpp"
#include "persist/config_loader.hpp"
#include "util/log.hpp"

namespace api {

namespace {

constexpr std::string_view threshold_directive = "!min_confidence";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

void emit(const core::BatchResult& result,
          core::ResultMaterializer& materializer,
          std::vector<std::string>& output,
          ReplayStats& stats) {
    if (!result.ok()) {
        ++stats.rejected_batches;
        LOG_SLOW_ERROR("batch %zu rejected (%s): %s", stats.batches, core::to_string(result.error),
                       result.detail.c_str());
        return;
    }
    for (const auto& ev : materializer.apply(result.diff)) {
        output.push_back(ingest::format_output_line(ev));
        ++stats.output_events;
    }
}

void flush_batch(std::vector<core::DeltaEvent>& batch,
                 core::IncrementalMatcher& matcher,
                 core::ResultMaterializer& materializer,
                 std::vector<std::string>& output,
                 ReplayStats& stats) {
    if (batch.empty()) {
        return;
    }
    ++stats.batches;
    emit(matcher.apply_batch(batch), materializer, output, stats);
    batch.clear();
}

struct CompareResult {
    bool match{false};
    std::string detail;
};

CompareResult compare_lines(const std::vector<std::string>& actual, const std::filesystem::path& expected_path) {
    std::ifstream in(expected_path);
    if (!in.is_open()) {
        return {false, "failed to open " + expected_path.string()};
    }
    std::vector<std::string> expected;
    std::string line;
    while (std::getline(in, line)) {
        const auto trimmed = trim(line);
        if (!trimmed.empty()) {
            expected.emplace_back(trimmed);
        }
    }
    const std::size_t common = std::min(actual.size(), expected.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (actual[i] != expected[i]) {
            return {false, "line " + std::to_string(i + 1) + ": expected '" + expected[i] + "' got '" + actual[i] +
                               "'"};
        }
    }
    if (actual.size() != expected.size()) {
        return {false, "line count mismatch: expected " + std::to_string(expected.size()) + " got " +
                           std::to_string(actual.size())};
    }
    return {true, ""};
}

} // namespace

ReplayStats replay_script(std::istream& in,
                          core::IncrementalMatcher& matcher,
                          core::ResultMaterializer& materializer,
                          std::vector<std::string>& output,
                          std::size_t max_events) {
    ReplayStats stats{};
    std::vector<core::DeltaEvent> batch;
    std::string line;
    while (std::getline(in, line)) {
        ++stats.lines;
        const std::string_view text = trim(line);
        if (text.empty()) {
            flush_batch(batch, matcher, materializer, output, stats);
            continue;
        }
        if (text.starts_with(threshold_directive)) {
            flush_batch(batch, matcher, materializer, output, stats);
            const std::string_view arg = trim(text.substr(threshold_directive.size()));
            double tau = 0.0;
            const auto conv = std::from_chars(arg.data(), arg.data() + arg.size(), tau);
            if (conv.ec != std::errc() || conv.ptr != arg.data() + arg.size()) {
                ++stats.parse_failures;
                LOG_SLOW_WARN("line %zu: bad threshold '%.*s'", stats.lines, static_cast<int>(arg.size()), arg.data());
                continue;
            }
            try {
                ++stats.threshold_changes;
                emit(matcher.set_min_confidence(tau), materializer, output, stats);
            } catch (const std::invalid_argument& ex) {
                ++stats.parse_failures;
                LOG_SLOW_WARN("line %zu: %s", stats.lines, ex.what());
            }
            continue;
        }

        core::DeltaEvent ev{};
        const ingest::ParseResult res = ingest::parse_delta_line(text, ev);
        if (res == ingest::ParseResult::Skip) {
            ++stats.skipped;
            continue;
        }
        if (res != ingest::ParseResult::Ok) {
            ++stats.parse_failures;
            LOG_SLOW_WARN("line %zu: %s", stats.lines, ingest::to_string(res));
            continue;
        }
        batch.push_back(std::move(ev));
        ++stats.events;
        if (max_events > 0 && stats.events >= max_events) {
            break;
        }
    }
    flush_batch(batch, matcher, materializer, output, stats);
    return stats;
}

int run_replay(const ReplayConfig& cfg) {
    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }

    if (cfg.input.empty()) {
        LOG_SLOW_ERROR("No input provided; use --input <script>");
        return 1;
    }

    core::ReconConfig recon_cfg = core::transaction_recon_config();
    if (!cfg.config_path.empty()) {
        std::string error;
        if (!persist::parse_recon_config(cfg.config_path, recon_cfg, error)) {
            LOG_SLOW_ERROR("Invalid config %s: %s", cfg.config_path.string().c_str(), error.c_str());
            return 1;
        }
    }

    std::ifstream in(cfg.input);
    if (!in.is_open()) {
        LOG_SLOW_ERROR("Failed to open input %s", cfg.input.string().c_str());
        return 1;
    }

    std::vector<std::string> output;
    ReplayStats stats{};
    core::ResultMaterializer materializer;
    try {
        core::IncrementalMatcher matcher(recon_cfg);
        stats = replay_script(in, matcher, materializer, output, cfg.max_events);
        if (cfg.verbose) {
            const auto c = matcher.counters();
            LOG_SLOW_DEBUG("matcher inserts=%llu removes=%llu duplicates=%llu replacements=%llu pairs_scored=%llu "
                           "malformed_pairs=%llu fanout_truncations=%llu regions=%llu",
                           static_cast<unsigned long long>(c.inserts), static_cast<unsigned long long>(c.removes),
                           static_cast<unsigned long long>(c.duplicate_inserts),
                           static_cast<unsigned long long>(c.replacements),
                           static_cast<unsigned long long>(c.pairs_scored),
                           static_cast<unsigned long long>(c.malformed_pairs),
                           static_cast<unsigned long long>(c.fanout_truncations),
                           static_cast<unsigned long long>(c.regions_solved));
        }
    } catch (const std::invalid_argument& ex) {
        LOG_SLOW_ERROR("Engine configuration rejected: %s", ex.what());
        return 1;
    }

    if (cfg.snapshot) {
        for (const auto& row : materializer.snapshot()) {
            core::OutputEvent ev{core::OutputOp::Upsert, row.left_id, row.right_id, row.confidence};
            output.push_back("row" + ingest::format_output_line(ev).substr(6));
        }
    }

    std::ofstream file_out;
    if (!cfg.output_path.empty()) {
        file_out.open(cfg.output_path, std::ios::trunc);
        if (!file_out.is_open()) {
            LOG_SLOW_ERROR("Failed to open output %s", cfg.output_path.string().c_str());
            return 1;
        }
    }
    std::ostream& out = cfg.output_path.empty() ? std::cout : file_out;
    for (const auto& line : output) {
        out << line << '\n';
    }
    out.flush();

    LOG_SLOW_INFO("Replay completed: lines=%zu events=%zu batches=%zu rejected=%zu parse_failures=%zu outputs=%zu",
                  stats.lines, stats.events, stats.batches, stats.rejected_batches, stats.parse_failures,
                  stats.output_events);

    if (stats.rejected_batches > 0) {
        return 1;
    }

    if (!cfg.verify_against.empty()) {
        const auto cmp = compare_lines(output, cfg.verify_against);
        if (!cmp.match) {
            LOG_SLOW_ERROR("Verification failed against %s: %s", cfg.verify_against.string().c_str(),
                           cmp.detail.c_str());
            return 2;
        }
    }
    return 0;
}

} // namespace api
