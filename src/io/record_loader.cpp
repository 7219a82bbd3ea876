#include "record_loader.hpp"
#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <string>

namespace wakefeed {

// Progress line cadence when verbose.
static constexpr size_t LOAD_PROGRESS_EVERY = 1000;

LoadResult load_records(const FeatureStore& store, bool verbose) {
    const std::string source = store.source();
    if (verbose) fmt::print("pre-loading dataset from file {}\n", source);

    const std::vector<std::string> keys = store.keys();

    LoadResult result;
    result.records.reserve(keys.size());

    for (size_t i = 0; i < keys.size(); ++i) {
        const std::string& key = keys[i];

        const int64_t is_hotword = store.read_attribute(key, ATTR_IS_HOTWORD);
        const int64_t start      = store.read_attribute(key, ATTR_SPEECH_START);
        const int64_t end        = store.read_attribute(key, ATTR_SPEECH_END);

        Record rec;
        rec.file_name    = key;
        rec.label        = static_cast<uint8_t>(is_hotword);
        rec.start_speech = static_cast<int16_t>(start);
        rec.end_speech   = static_cast<int16_t>(end);
        rec.features     = store.read_features(key);
        result.records.push_back(std::move(rec));

        if (is_hotword == 1) ++result.num_wakewords;

        if (verbose && (i + 1) % LOAD_PROGRESS_EVERY == 0)
            fmt::print("  {}/{} records\n", i + 1, keys.size());
    }

    if (verbose)
        fmt::print("loaded {} records ({} wakewords)\n",
                   result.records.size(), result.num_wakewords);

    DatasetLoadedEvent ev;
    ev.source        = source;
    ev.num_records   = result.records.size();
    ev.num_wakewords = result.num_wakewords;
    EventBus::instance().emit(ev);

    return result;
}

} // namespace wakefeed
