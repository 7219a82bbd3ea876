#include "logger.hpp"

#include <stdexcept>

namespace wakefeed {

Logger::Logger(const std::string& path, size_t flush_every, bool log_batches)
    : path_(path)
    , flush_every_(flush_every == 0 ? 1 : flush_every)
    , log_batches_(log_batches) {
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_)
        throw std::runtime_error("Logger: cannot open " + path);
}

Logger::~Logger() {
    detach();
    // Handlers already queued may still write; drain them before closing.
    EventBus::instance().flush();
    flush();
}

void Logger::attach() {
    if (subs_[0] != INVALID_SUB_ID) return;

    auto& bus = EventBus::instance();
    subs_[0] = bus.subscribe<DatasetLoadedEvent>(
        [this](const DatasetLoadedEvent& ev)   { on_dataset_loaded(ev); },
        DispatchMode::Async);
    subs_[1] = bus.subscribe<DatasetPrunedEvent>(
        [this](const DatasetPrunedEvent& ev)   { on_dataset_pruned(ev); },
        DispatchMode::Async);
    subs_[2] = bus.subscribe<DatasetEpochEndEvent>(
        [this](const DatasetEpochEndEvent& ev) { on_epoch_end(ev); },
        DispatchMode::Async);
    if (log_batches_) {
        subs_[3] = bus.subscribe<BatchServedEvent>(
            [this](const BatchServedEvent& ev) { on_batch_served(ev); },
            DispatchMode::Async);
    }
}

void Logger::detach() {
    auto& bus = EventBus::instance();
    for (SubID& id : subs_) {
        if (id != INVALID_SUB_ID) bus.unsubscribe(id);
        id = INVALID_SUB_ID;
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

size_t Logger::entries_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_count_;
}

void Logger::write(const nlohmann::json& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << entry.dump() << '\n';
    ++write_count_;
    if (write_count_ % flush_every_ == 0) file_.flush();
}

// ---------------------------------------------------------------------------
// Event handlers
// ---------------------------------------------------------------------------
void Logger::on_dataset_loaded(const DatasetLoadedEvent& ev) {
    nlohmann::json j;
    j["type"]          = "dataset_loaded";
    j["source"]        = ev.source;
    j["num_records"]   = ev.num_records;
    j["num_wakewords"] = ev.num_wakewords;
    write(j);
}

void Logger::on_dataset_pruned(const DatasetPrunedEvent& ev) {
    nlohmann::json j;
    j["type"]        = "dataset_pruned";
    j["keep_ratio"]  = ev.keep_ratio;
    j["removed"]     = ev.removed;
    j["retained"]    = ev.retained;
    j["num_records"] = ev.num_records;
    j["num_batches"] = ev.num_batches;
    write(j);
}

void Logger::on_epoch_end(const DatasetEpochEndEvent& ev) {
    nlohmann::json j;
    j["type"]     = "epoch_end";
    j["epoch"]    = ev.epoch;
    j["shuffled"] = ev.shuffled;
    write(j);
}

void Logger::on_batch_served(const BatchServedEvent& ev) {
    nlohmann::json j;
    j["type"]       = "batch";
    j["index"]      = ev.index;
    j["batch_size"] = ev.batch_size;
    j["max_length"] = ev.max_length;
    write(j);
}

} // namespace wakefeed
