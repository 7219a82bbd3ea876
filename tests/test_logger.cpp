#include "gtest/gtest.h"
#include "src/io/logger.hpp"
#include "src/io/memory_feature_store.hpp"
#include "src/io/sequence_dataset.hpp"
#include "src/stats/event_bus.hpp"
#include "src/stats/events.hpp"
#include "test_data.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace wakefeed;

namespace {

std::vector<nlohmann::json> read_jsonl(const std::string& path) {
    std::vector<nlohmann::json> out;
    std::ifstream f(path);
    std::string line;
    while (std::getline(f, line))
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    return out;
}

std::string temp_log(const std::string& name) {
    return (std::filesystem::temp_directory_path() / ("wakefeed_" + name + ".jsonl")).string();
}

} // namespace

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------
TEST(EventBusTest, SyncHandlerRunsInline) {
    auto& bus = EventBus::instance();
    size_t calls = 0;
    SubID id = bus.subscribe<DatasetEpochEndEvent>(
        [&calls](const DatasetEpochEndEvent& ev) { calls += ev.epoch; });

    DatasetEpochEndEvent ev;
    ev.epoch = 3;
    bus.emit(ev);
    EXPECT_EQ(calls, 3u);

    bus.unsubscribe(id);
    bus.emit(ev);
    EXPECT_EQ(calls, 3u);
}

TEST(EventBusTest, AsyncHandlerRunsBeforeFlushReturns) {
    auto& bus = EventBus::instance();
    std::atomic<size_t> seen{0};
    SubID id = bus.subscribe<BatchServedEvent>(
        [&seen](const BatchServedEvent& ev) { seen += ev.batch_size; },
        DispatchMode::Async);

    for (size_t i = 0; i < 10; ++i) {
        BatchServedEvent ev;
        ev.batch_size = 2;
        bus.emit(ev);
    }
    bus.flush();
    bus.unsubscribe(id);

    EXPECT_EQ(seen.load(), 20u);
}

TEST(EventBusTest, SubscribersAreCountedPerType) {
    auto& bus = EventBus::instance();
    const size_t before = bus.subscriber_count<DatasetLoadedEvent>();

    SubID a = bus.subscribe<DatasetLoadedEvent>([](const DatasetLoadedEvent&) {});
    SubID b = bus.subscribe<DatasetLoadedEvent>([](const DatasetLoadedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<DatasetLoadedEvent>(), before + 2);

    bus.unsubscribe(a);
    bus.unsubscribe(b);
    bus.unsubscribe(INVALID_SUB_ID);
    EXPECT_EQ(bus.subscriber_count<DatasetLoadedEvent>(), before);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
TEST(LoggerTest, WritesOneJsonLinePerDatasetEvent) {
    const std::string path = temp_log("dataset_events");
    {
        Logger logger(path);
        logger.attach();

        MemoryFeatureStore store = wakefeed::fixtures::make_store(10, {2, 5, 7});
        DatasetConfig cfg;
        cfg.batch_size = 4;
        cfg.verbose    = false;
        SequenceDataset ds(store, cfg);
        ds.prune_positive_class(0.5);
        ds.get_batch(0);          // batches are not logged by default
        ds.on_epoch_end();

        EventBus::instance().flush();
        logger.detach();
        EXPECT_EQ(logger.entries_written(), 3u);
    }

    const auto lines = read_jsonl(path);
    ASSERT_EQ(lines.size(), 3u);

    EXPECT_EQ(lines[0]["type"], "dataset_loaded");
    EXPECT_EQ(lines[0]["source"], "<memory>");
    EXPECT_EQ(lines[0]["num_records"], 10);
    EXPECT_EQ(lines[0]["num_wakewords"], 3);

    EXPECT_EQ(lines[1]["type"], "dataset_pruned");
    EXPECT_DOUBLE_EQ(lines[1]["keep_ratio"].get<double>(), 0.5);
    EXPECT_EQ(lines[1]["removed"], 3);
    EXPECT_EQ(lines[1]["retained"], 1);
    EXPECT_EQ(lines[1]["num_records"], 8);
    EXPECT_EQ(lines[1]["num_batches"], 2);

    EXPECT_EQ(lines[2]["type"], "epoch_end");
    EXPECT_EQ(lines[2]["epoch"], 0);
    EXPECT_EQ(lines[2]["shuffled"], false);

    std::filesystem::remove(path);
}

TEST(LoggerTest, BatchEventsAreOptIn) {
    const std::string path = temp_log("batch_events");
    {
        Logger logger(path, /*flush_every=*/1, /*log_batches=*/true);
        logger.attach();
        logger.attach();   // second attach must not double-subscribe

        MemoryFeatureStore store = wakefeed::fixtures::make_store(6, {});
        DatasetConfig cfg;
        cfg.batch_size = 3;
        cfg.verbose    = false;
        SequenceDataset ds(store, cfg);
        ds.get_batch(1);

        EventBus::instance().flush();
    }

    const auto lines = read_jsonl(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1]["type"], "batch");
    EXPECT_EQ(lines[1]["index"], 1);
    EXPECT_EQ(lines[1]["batch_size"], 3);
    EXPECT_EQ(lines[1]["max_length"], 5);   // rec_04 has 5 steps

    std::filesystem::remove(path);
}

TEST(LoggerTest, UnwritablePathThrows) {
    EXPECT_THROW(Logger("/nonexistent_dir_for_wakefeed/log.jsonl"), std::runtime_error);
}
