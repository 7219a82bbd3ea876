#include "gtest/gtest.h"
#include "src/io/errors.hpp"
#include "src/io/hdf5_feature_store.hpp"
#include "src/io/record_loader.hpp"
#include "src/io/sequence_dataset.hpp"

#include <H5Cpp.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace wakefeed;

namespace {

// Writes HDF5 fixtures the way the feature extraction pipeline lays them out:
// one 2D dataset per utterance with scalar integer attributes.
class Hdf5Fixture : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (std::filesystem::temp_directory_path() /
                 (std::string("wakefeed_") + info->name() + ".h5")).string();
        file_ = std::make_unique<H5::H5File>(path_, H5F_ACC_TRUNC);
    }

    void TearDown() override {
        file_.reset();
        std::filesystem::remove(path_);
    }

    // Closes the writer so the store under test can open the file.
    void finish() { file_.reset(); }

    H5::DataSet add_dataset(const std::string& key, size_t rows, size_t cols,
                            float base = 0.f) {
        const hsize_t dims[2] = {rows, cols};
        H5::DataSpace space(2, dims);
        // Stored as double to exercise conversion to float on read.
        H5::DataSet ds = file_->createDataSet(key, H5::PredType::NATIVE_DOUBLE, space);
        std::vector<double> values(rows * cols);
        for (size_t i = 0; i < values.size(); ++i) values[i] = base + static_cast<double>(i) + 0.5;
        if (!values.empty()) ds.write(values.data(), H5::PredType::NATIVE_DOUBLE);
        return ds;
    }

    static void set_attr(H5::DataSet& ds, const std::string& name, int64_t value) {
        H5::DataSpace scalar(H5S_SCALAR);
        H5::Attribute attr = ds.createAttribute(name, H5::PredType::NATIVE_INT64, scalar);
        attr.write(H5::PredType::NATIVE_INT64, &value);
    }

    // h5py stores numpy.bool_ as an enum over int8 {FALSE=0, TRUE=1}.
    static void set_bool_attr(H5::DataSet& ds, const std::string& name, bool value) {
        H5::EnumType bool_type(H5::PredType::NATIVE_INT8);
        int8_t no  = 0;
        int8_t yes = 1;
        bool_type.insert("FALSE", &no);
        bool_type.insert("TRUE", &yes);

        H5::DataSpace scalar(H5S_SCALAR);
        H5::Attribute attr = ds.createAttribute(name, bool_type, scalar);
        int8_t raw = value ? yes : no;
        attr.write(bool_type, &raw);
    }

    void add_record(const std::string& key, size_t rows, size_t cols,
                    int64_t is_hotword, int64_t start, int64_t end) {
        H5::DataSet ds = add_dataset(key, rows, cols);
        set_attr(ds, ATTR_IS_HOTWORD, is_hotword);
        set_attr(ds, ATTR_SPEECH_START, start);
        set_attr(ds, ATTR_SPEECH_END, end);
    }

    std::string path_;
    std::unique_ptr<H5::H5File> file_;
};

} // namespace

TEST_F(Hdf5Fixture, KeysFollowRootGroupNameOrder) {
    add_record("utt_b", 2, 3, 0, 0, 0);
    add_record("utt_a", 2, 3, 1, 0, 0);
    add_record("utt_c", 2, 3, 0, 0, 0);
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_EQ(store.keys(), (std::vector<std::string>{"utt_a", "utt_b", "utt_c"}));
    EXPECT_EQ(store.source(), path_);
}

TEST_F(Hdf5Fixture, ReadsPayloadAsFloatAndIntegerAttributes) {
    add_record("utt", 3, 2, 1, 120, 480);
    finish();

    Hdf5FeatureStore store(path_);
    FeatureMatrix m = store.read_features("utt");
    ASSERT_EQ(m.time_steps, 3u);
    ASSERT_EQ(m.num_features, 2u);
    EXPECT_FLOAT_EQ(m.at(0, 0), 0.5f);
    EXPECT_FLOAT_EQ(m.at(2, 1), 5.5f);

    EXPECT_EQ(store.read_attribute("utt", ATTR_IS_HOTWORD), 1);
    EXPECT_EQ(store.read_attribute("utt", ATTR_SPEECH_START), 120);
    EXPECT_EQ(store.read_attribute("utt", ATTR_SPEECH_END), 480);
}

TEST_F(Hdf5Fixture, DatasetLoadsAndBatchesFromFile) {
    add_record("neg_0", 4, 5, 0, 0, 10);
    add_record("neg_1", 2, 5, 0, 0, 10);
    add_record("pos_0", 6, 5, 1, 3, 9);
    add_record("pos_1", 1, 5, 1, 3, 9);
    add_record("neg_2", 3, 5, 0, 0, 10);
    finish();

    DatasetConfig cfg;
    cfg.batch_size = 2;
    cfg.verbose    = false;
    SequenceDataset ds(path_, cfg);

    EXPECT_EQ(ds.count_records(), 5u);
    EXPECT_EQ(ds.count_wakewords_at_load(), 2u);
    EXPECT_EQ(ds.length(), 2u);
    EXPECT_EQ(ds.get_filenames(),
              (std::vector<std::string>{"neg_0", "neg_1", "neg_2", "pos_0", "pos_1"}));

    // Batch 1 = neg_2 (3 steps) + pos_0 (6 steps).
    Batch b = ds.get_batch(1);
    EXPECT_EQ(b.inputs.shape, (std::vector<size_t>{2, 6, 5}));
    EXPECT_EQ(b.targets.data_as<uint8_t>()[0], 0);
    EXPECT_EQ(b.targets.data_as<uint8_t>()[1], 1);
    EXPECT_EQ((b.inputs.at<float>({0, 3, 0})), 0.f);
}

TEST(Hdf5FeatureStoreTest, MissingFileIsLoadError) {
    const std::string path =
        (std::filesystem::temp_directory_path() / "wakefeed_does_not_exist.h5").string();
    EXPECT_THROW({ Hdf5FeatureStore store(path); }, LoadError);

    DatasetConfig cfg;
    cfg.verbose = false;
    EXPECT_THROW({ SequenceDataset ds(path, cfg); }, LoadError);
}

TEST_F(Hdf5Fixture, MissingKeyIsLoadError) {
    add_record("utt", 1, 1, 0, 0, 0);
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_THROW(store.read_features("nope"), LoadError);
    EXPECT_THROW(store.read_attribute("nope", ATTR_IS_HOTWORD), LoadError);
}

TEST_F(Hdf5Fixture, MissingAttributeAbortsWholeLoad) {
    add_record("good", 2, 2, 1, 0, 0);
    H5::DataSet bad = add_dataset("no_attrs", 2, 2);
    set_attr(bad, ATTR_IS_HOTWORD, 0);
    bad.close();
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_THROW(load_records(store, false), LoadError);
}

TEST_F(Hdf5Fixture, NonMatrixPayloadIsLoadError) {
    const hsize_t dims[1] = {4};
    H5::DataSpace space(1, dims);
    H5::DataSet ds = file_->createDataSet("flat", H5::PredType::NATIVE_FLOAT, space);
    const float values[4] = {1.f, 2.f, 3.f, 4.f};
    ds.write(values, H5::PredType::NATIVE_FLOAT);
    set_attr(ds, ATTR_IS_HOTWORD, 0);
    set_attr(ds, ATTR_SPEECH_START, 0);
    set_attr(ds, ATTR_SPEECH_END, 0);
    ds.close();
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_THROW(store.read_features("flat"), LoadError);
}

TEST_F(Hdf5Fixture, StringAttributeIsLoadError) {
    H5::DataSet ds = add_dataset("utt", 1, 1);
    H5::StrType str_type(H5::PredType::C_S1, 4);
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attr = ds.createAttribute(ATTR_IS_HOTWORD, str_type, scalar);
    attr.write(str_type, "yes");
    attr.close();
    ds.close();
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_THROW(store.read_attribute("utt", ATTR_IS_HOTWORD), LoadError);
}

TEST_F(Hdf5Fixture, BooleanEnumLabelIsReadAsInteger) {
    H5::DataSet pos = add_dataset("utt_pos", 2, 2);
    set_bool_attr(pos, ATTR_IS_HOTWORD, true);
    set_attr(pos, ATTR_SPEECH_START, 3);
    set_attr(pos, ATTR_SPEECH_END, 9);
    pos.close();

    H5::DataSet neg = add_dataset("utt_neg", 2, 2);
    set_bool_attr(neg, ATTR_IS_HOTWORD, false);
    set_attr(neg, ATTR_SPEECH_START, 0);
    set_attr(neg, ATTR_SPEECH_END, 0);
    neg.close();
    finish();

    Hdf5FeatureStore store(path_);
    EXPECT_EQ(store.read_attribute("utt_pos", ATTR_IS_HOTWORD), 1);
    EXPECT_EQ(store.read_attribute("utt_neg", ATTR_IS_HOTWORD), 0);

    LoadResult r = load_records(store, false);
    ASSERT_EQ(r.records.size(), 2u);
    EXPECT_EQ(r.num_wakewords, 1u);
    EXPECT_EQ(r.records[0].file_name, "utt_neg");
    EXPECT_EQ(r.records[0].label, 0);
    EXPECT_EQ(r.records[1].label, 1);
}
