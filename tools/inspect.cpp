#include "src/io/errors.hpp"
#include "src/io/hdf5_feature_store.hpp"
#include "src/io/logger.hpp"
#include "src/io/sequence_dataset.hpp"
#include "src/stats/event_bus.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// ---------------------------------------------------------------------------
// RunConfig: everything wakefeed_inspect reads from the command line.
// ---------------------------------------------------------------------------
struct RunConfig {
    std::string             data_path;
    wakefeed::DatasetConfig dataset;
    double                  keep_ratio  = -1.0;   // < 0: no pruning
    size_t                  epochs      = 1;
    std::string             log_path;             // empty: no JSONL log
    bool                    log_batches = false;
    bool                    list        = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <data.h5> [options]\n"
              << "Options:\n"
              << "  --batch-size N     Records per batch (default: 32)\n"
              << "  --num-features N   Expected feature width (default: 40)\n"
              << "  --shuffle          Reshuffle records after every epoch\n"
              << "  --prune RATIO      Keep RATIO of the load-time wakewords\n"
              << "  --epochs N         Passes over all batches (default: 1)\n"
              << "  --seed N           Seed for every random permutation (default: 0)\n"
              << "  --log PATH         Write dataset events as JSONL to PATH\n"
              << "  --log-batches      Also log one entry per served batch\n"
              << "  --list             Print label and file name of every record\n"
              << "  --quiet            No load progress output\n";
}

// Walks every batch like a training loop would and reports padding stats.
void run_epochs(wakefeed::SequenceDataset& ds, size_t epochs) {
    for (size_t epoch = 0; epoch < epochs; ++epoch) {
        size_t positives   = 0;
        size_t max_length  = 0;
        size_t total_steps = 0;

        for (size_t b = 0; b < ds.length(); ++b) {
            wakefeed::Batch batch = ds.get_batch(b);
            const uint8_t* labels = batch.targets.data_as<uint8_t>();
            for (size_t i = 0; i < batch.targets.numel(); ++i) positives += labels[i];
            max_length   = std::max(max_length, batch.inputs.shape[1]);
            total_steps += batch.inputs.shape[1];
        }

        const double mean_length =
            ds.length() ? static_cast<double>(total_steps) / ds.length() : 0.0;
        fmt::print("epoch {:3d}  batches={}  wakewords={}  max_len={}  mean_len={:.1f}\n",
                   epoch, ds.length(), positives, max_length, mean_length);

        ds.on_epoch_end();
    }
}

void list_records(const wakefeed::SequenceDataset& ds) {
    const auto labels = ds.get_labels();
    const auto names  = ds.get_filenames();
    for (size_t i = 0; i < names.size(); ++i)
        fmt::print("{}\t{}\n", static_cast<int>(labels[i]), names[i]);
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string first_arg = argv[1];
    if (first_arg == "--help" || first_arg == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    RunConfig cfg;
    cfg.data_path = first_arg;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--batch-size" && i + 1 < argc) {
                cfg.dataset.batch_size = std::stoull(argv[++i]);
            } else if (arg == "--num-features" && i + 1 < argc) {
                cfg.dataset.num_features = std::stoull(argv[++i]);
            } else if (arg == "--shuffle") {
                cfg.dataset.shuffle = true;
            } else if (arg == "--prune" && i + 1 < argc) {
                cfg.keep_ratio = std::stod(argv[++i]);
            } else if (arg == "--epochs" && i + 1 < argc) {
                cfg.epochs = std::stoull(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.dataset.seed = std::stoull(argv[++i]);
            } else if (arg == "--log" && i + 1 < argc) {
                cfg.log_path = argv[++i];
            } else if (arg == "--log-batches") {
                cfg.log_batches = true;
            } else if (arg == "--list") {
                cfg.list = true;
            } else if (arg == "--quiet") {
                cfg.dataset.verbose = false;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& ex) {
        // std::stoull / std::stod failures
        std::cerr << "Invalid option value: " << ex.what() << "\n";
        return 1;
    }

    try {
        std::unique_ptr<wakefeed::Logger> logger;
        if (!cfg.log_path.empty()) {
            std::filesystem::path log_dir =
                std::filesystem::path(cfg.log_path).parent_path();
            if (!log_dir.empty())
                std::filesystem::create_directories(log_dir);

            logger = std::make_unique<wakefeed::Logger>(cfg.log_path, 100, cfg.log_batches);
            logger->attach();
        }

        wakefeed::Hdf5FeatureStore store(cfg.data_path);
        wakefeed::SequenceDataset  ds(store, cfg.dataset);

        fmt::print("records={}  wakewords(at load)={}  batch_size={}  batches={}\n",
                   ds.count_records(), ds.count_wakewords_at_load(),
                   ds.batch_size(), ds.length());

        if (cfg.keep_ratio >= 0.0) {
            ds.prune_positive_class(cfg.keep_ratio);
            fmt::print("pruned: records={}  wakewords={}  batches={}\n",
                       ds.count_records(), ds.count_wakewords(), ds.length());
        }

        if (cfg.list) list_records(ds);

        run_epochs(ds, cfg.epochs);

        if (logger) {
            wakefeed::EventBus::instance().flush();
            logger->detach();
        }
    } catch (const wakefeed::LoadError& ex) {
        std::cerr << "Load error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
