// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <chainstore/chain/block_metadata.hpp>
#include <chainstore/chain/block_store.hpp>
#include <chainstore/chain/predecessor_index.hpp>
#include <chainstore/core/byte_string.hpp>
#include <chainstore/core/bytes.hpp>
#include <chainstore/core/fiber/maintenance_pool.hpp>
#include <chainstore/core/fmt/bytes_fmt.hpp>
#include <chainstore/core/log_level_map.hpp>
#include <chainstore/core/result.hpp>
#include <chainstore/log/compression.hpp>
#include <chainstore/log/record_log.hpp>
#include <chainstore/storage/storage.hpp>
#include <chainstore/storage/storage_config.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <boost/outcome/try.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace chainstore;
namespace fs = std::filesystem;

namespace
{
    std::optional<bytes32_t> parse_hash(std::string_view s)
    {
        if (s.starts_with("0x")) {
            s.remove_prefix(2);
        }
        if (s.size() != bytes32_t::size * 2) {
            return std::nullopt;
        }
        bytes32_t hash;
        for (size_t i = 0; i < bytes32_t::size; ++i) {
            auto const *const first = s.data() + i * 2;
            auto const [ptr, ec] =
                std::from_chars(first, first + 2, hash.bytes[i], 16);
            if (ec != std::errc{} || ptr != first + 2) {
                return std::nullopt;
            }
        }
        return hash;
    }

    Result<void> print_summary(Storage const &storage)
    {
        for (auto const *const log : storage.logs()) {
            LOG_INFO(
                "log {}: segments = {}, bytes = {}",
                log->name(),
                log->segment_ids().size(),
                log->size());
        }
        BOOST_OUTCOME_TRY(auto const head, storage.blocks().main_chain_head());
        if (!head.has_value()) {
            LOG_INFO("main chain head not set");
            return success();
        }
        BOOST_OUTCOME_TRY(
            auto const meta, storage.blocks().get_block_metadata(*head));
        if (!meta.has_value()) {
            return StoreError::Corrupted;
        }
        LOG_INFO(
            "main chain head = {}, level = {}, status = {}",
            fmt::format("{}", *head),
            meta->level,
            std::string{to_string(meta->status)});
        return success();
    }

    Result<void> print_ancestor(
        Storage const &storage, bytes32_t const &block, int64_t const distance)
    {
        BOOST_OUTCOME_TRY(
            auto const ancestor,
            storage.predecessors().ancestor_at(block, distance));
        LOG_INFO(
            "ancestor of {} at distance {} = {}",
            fmt::format("{}", block),
            distance,
            fmt::format("{}", ancestor));
        return success();
    }

    Result<void> run_maintenance(Storage &storage, unsigned const nthreads)
    {
        fiber::MaintenancePool pool{nthreads};
        auto futures = storage.schedule_maintenance(pool);
        Result<void> result = success();
        for (auto &future : futures) {
            auto res = future.get();
            if (res.has_error() && !result.has_error()) {
                result = std::move(res);
            }
        }
        return result;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"chainstore_inspect"};
    cli.option_defaults()->always_capture_default();
    cli.set_config("--config", "", "read options from a toml or ini file");

    fs::path db_path;
    StorageConfig config;
    std::string ancestor_hash;
    int64_t ancestor_distance = 0;
    bool maintenance = false;
    bool index_stats = false;
    auto log_level = quill::LogLevel::Info;

    std::map<std::string, RecordCompression> const compression_map = {
        {"none", RecordCompression::None},
        {"brotli", RecordCompression::Brotli}};

    cli.add_option("--db", db_path, "storage directory")->required();
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
           "--segment_size",
           config.log.segment_size,
           "record log segment size in bytes")
        ->check(CLI::PositiveNumber);
    cli.add_option(
           "--compression",
           config.log.compression,
           "compression of newly appended records")
        ->transform(
            CLI::CheckedTransformer(compression_map, CLI::ignore_case));
    cli.add_option(
        "--max_threads", config.db.max_threads, "index background threads");
    cli.add_option(
        "--block_cache_size",
        config.db.block_cache_size,
        "index block cache size in bytes");
    auto *const ancestor =
        cli.add_option("--ancestor", ancestor_hash, "block to start from")
            ->check([](std::string const &s) -> std::string {
                if (!parse_hash(s).has_value()) {
                    return "expected a 32 byte hex hash";
                }
                return "";
            });
    cli.add_option(
           "--distance",
           ancestor_distance,
           "levels to walk back from --ancestor")
        ->needs(ancestor);
    cli.add_flag(
        "--maintenance",
        maintenance,
        "compact the index and verify sealed segments");
    cli.add_flag("--stats", index_stats, "print index statistics");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    auto opened = Storage::open(db_path, config);
    if (opened.has_error()) {
        LOG_ERROR(
            "could not open {}: {}",
            db_path.string(),
            opened.error().message().c_str());
        return EXIT_FAILURE;
    }
    auto const storage = std::move(opened).value();

    Result<void> result = print_summary(*storage);
    if (!result.has_error() && index_stats) {
        LOG_INFO("index statistics:\n{}", storage->index().stats());
    }
    if (!result.has_error() && !ancestor_hash.empty()) {
        auto const block = parse_hash(ancestor_hash);
        result = print_ancestor(*storage, *block, ancestor_distance);
    }
    if (!result.has_error() && maintenance) {
        result = run_maintenance(*storage, config.db.max_threads);
        if (!result.has_error()) {
            LOG_INFO("maintenance finished");
        }
    }
    if (result.has_error()) {
        LOG_ERROR("inspection failed: {}", result.error().message().c_str());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
