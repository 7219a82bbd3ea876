#pragma once

#include "../stats/event_bus.hpp"
#include "../stats/events.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <fstream>
#include <mutex>
#include <string>

namespace wakefeed {

// ---------------------------------------------------------------------------
// Logger: subscribes to the EventBus (async) and writes one JSON object per
// line (JSONL) for every dataset event.
//
// Each entry has a "type" field:
//   "dataset_loaded", "dataset_pruned", "epoch_end", "batch"
//
// Batch events are frequent; they are only written when log_batches is set.
// The file is flushed every flush_every entries and on destruction.
// ---------------------------------------------------------------------------
class Logger {
public:
    // Opens the log file, truncating it. Throws std::runtime_error on failure.
    explicit Logger(const std::string& path, size_t flush_every = 100,
                    bool log_batches = false);
    ~Logger();

    // Start / stop receiving events. attach() is idempotent.
    void attach();
    void detach();

    void flush();

    size_t entries_written() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    void write(const nlohmann::json& entry);

    void on_dataset_loaded(const DatasetLoadedEvent& ev);
    void on_dataset_pruned(const DatasetPrunedEvent& ev);
    void on_epoch_end     (const DatasetEpochEndEvent& ev);
    void on_batch_served  (const BatchServedEvent& ev);

    std::string        path_;
    std::ofstream      file_;
    mutable std::mutex mutex_;
    size_t             flush_every_;
    bool               log_batches_;
    size_t             write_count_ = 0;

    std::array<SubID, 4> subs_{ INVALID_SUB_ID, INVALID_SUB_ID,
                                INVALID_SUB_ID, INVALID_SUB_ID };
};

} // namespace wakefeed
