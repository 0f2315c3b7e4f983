#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <iopp/file_input_stream.hpp>
#include <pm/result.hpp>
#include <pm/stopwatch.hpp>

#include "counter_store.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "phrase_extractor.hpp"
#include "top_k_selection.hpp"
#include "working_area.hpp"

namespace top_phrases {

struct Config {
    char separator = '|';
    size_t chunk_size = 8192;
    size_t shard_width = 3;

    std::filesystem::path work_dir = "out";
    std::string run_id; // defaults to the process id

    bool keep = false;
    bool keep_on_failure = false;

    std::function<bool()> interrupted;

    std::filesystem::path working_area() const {
        return work_dir / ("storage_" + (run_id.empty() ? std::to_string(::getpid()) : run_id));
    }
};

struct TopPhrase {
    uint64_t count;
    std::string text;
    Fingerprint fingerprint;
    std::filesystem::path location; // relative to the counter store's root
};

/// \brief Finds the \c limit most frequent phrases in the input.
///
/// The result is ordered by descending count, ties broken by ascending fingerprint.
/// It contains <tt>min(limit, distinct phrases)</tt> entries and is empty if \c limit is not positive.
/// Memory use is independent of the input; the counters live in a working area on disk for the duration of the call.
inline std::vector<TopPhrase> find_top_phrases(std::istream& in, int64_t const limit, Config const& config, pm::Result& result) {
    result.add("limit", limit);
    if(limit <= 0) return {};

    WorkingArea area(config.working_area(), config.keep, config.keep_on_failure);
    result.add("stale_area", uint64_t(area.was_stale()));

    CounterStore store(area.counters_root(), config.shard_width);

    // map
    pm::Stopwatch t;
    t.start();
    {
        PhraseExtractor extractor(store, area.spill_file(), config.separator, config.chunk_size);
        extractor.interrupted = config.interrupted;
        extractor.extract(in);

        result.add("phrases", extractor.num_phrases());
        result.add("spilled", extractor.num_spilled());
    }
    t.stop();
    result.add("distinct", store.num_created());
    result.add("time_map", (uint64_t)std::round(t.elapsed_time_millis()));

    // reduce
    t.start();
    std::vector<TopPhrase> top;
    for(auto const& entry : reduce(store, limit, config.interrupted)) {
        if(config.interrupted && config.interrupted()) throw InterruptedError("interrupted while reading top phrases");
        top.push_back(TopPhrase {
            entry.count,
            entry.content(),
            entry.fingerprint,
            entry.file.parent_path().lexically_relative(store.root()) });
    }
    t.stop();
    result.add("time_reduce", (uint64_t)std::round(t.elapsed_time_millis()));

    area.release();
    return top;
}

inline std::vector<TopPhrase> find_top_phrases(std::filesystem::path const& source, int64_t const limit, Config const& config, pm::Result& result) {
    std::error_code ec;
    if(!std::filesystem::is_regular_file(source, ec)) {
        throw InvalidArgumentError("not a readable file: \"" + source.string() + "\"");
    }

    iopp::FileInputStream in(source);
    if(!in) throw InvalidArgumentError("cannot open \"" + source.string() + "\"");

    result.add("file", source.filename().string());
    result.add("n", (uint64_t)std::filesystem::file_size(source, ec));
    return find_top_phrases(in, limit, config, result);
}

inline std::vector<TopPhrase> find_top_phrases(std::filesystem::path const& source, int64_t const limit, Config const& config = Config()) {
    pm::Result result;
    return find_top_phrases(source, limit, config, result);
}

}
