#include "hdf5_feature_store.hpp"
#include "errors.hpp"

#include <string>

namespace wakefeed {

namespace {

std::string h5_message(const H5::Exception& ex) {
    std::string msg = ex.getDetailMsg();
    if (msg.empty()) msg = ex.getFuncName();
    return msg;
}

bool is_numeric(H5T_class_t cls) {
    return cls == H5T_INTEGER || cls == H5T_FLOAT;
}

} // namespace

// ---------------------------------------------------------------------------
// Constructor
// ---------------------------------------------------------------------------
Hdf5FeatureStore::Hdf5FeatureStore(const std::string& path)
    : path_(path) {
    // Errors are reported through LoadError; keep the HDF5 error stack quiet.
    H5::Exception::dontPrint();
    try {
        file_.openFile(path, H5F_ACC_RDONLY);
    } catch (const H5::Exception& ex) {
        throw LoadError("Hdf5FeatureStore: cannot open " + path + ": " + h5_message(ex));
    }
}

// ---------------------------------------------------------------------------
// FeatureStore interface
// ---------------------------------------------------------------------------
std::vector<std::string> Hdf5FeatureStore::keys() const {
    std::vector<std::string> out;
    try {
        const hsize_t n = file_.getNumObjs();
        out.reserve(n);
        for (hsize_t i = 0; i < n; ++i)
            out.push_back(file_.getObjnameByIdx(i));
    } catch (const H5::Exception& ex) {
        throw LoadError("Hdf5FeatureStore: cannot list keys of " + path_ + ": " +
                        h5_message(ex));
    }
    return out;
}

H5::DataSet Hdf5FeatureStore::open_dataset(const std::string& key) const {
    try {
        return file_.openDataSet(key);
    } catch (const H5::Exception& ex) {
        throw LoadError("Hdf5FeatureStore: missing dataset " + key + " in " + path_ +
                        ": " + h5_message(ex));
    }
}

FeatureMatrix Hdf5FeatureStore::read_features(const std::string& key) const {
    H5::DataSet ds = open_dataset(key);
    try {
        if (!is_numeric(ds.getTypeClass()))
            throw LoadError("Hdf5FeatureStore: payload of " + key + " is not numeric");

        H5::DataSpace space = ds.getSpace();
        const int rank = space.getSimpleExtentNdims();
        if (rank != 2)
            throw LoadError("Hdf5FeatureStore: payload of " + key + " has rank " +
                            std::to_string(rank) + ", expected 2");

        hsize_t dims[2] = {0, 0};
        space.getSimpleExtentDims(dims);

        FeatureMatrix m;
        m.time_steps   = static_cast<size_t>(dims[0]);
        m.num_features = static_cast<size_t>(dims[1]);
        m.values.resize(m.time_steps * m.num_features);
        if (!m.values.empty())
            ds.read(m.values.data(), H5::PredType::NATIVE_FLOAT);
        return m;
    } catch (const H5::Exception& ex) {
        throw LoadError("Hdf5FeatureStore: cannot read payload of " + key + ": " +
                        h5_message(ex));
    }
}

int64_t Hdf5FeatureStore::read_attribute(const std::string& key,
                                         const std::string& name) const {
    H5::DataSet ds = open_dataset(key);
    try {
        if (!ds.attrExists(name))
            throw LoadError("Hdf5FeatureStore: " + key + " has no attribute " + name);

        H5::Attribute attr = ds.openAttribute(name);
        const H5T_class_t cls = attr.getTypeClass();
        if (!is_numeric(cls) && cls != H5T_ENUM)
            throw LoadError("Hdf5FeatureStore: attribute " + name + " of " + key +
                            " is not numeric");
        if (attr.getSpace().getSimpleExtentNpoints() != 1)
            throw LoadError("Hdf5FeatureStore: attribute " + name + " of " + key +
                            " is not a scalar");

        int64_t value = 0;
        if (cls == H5T_ENUM) {
            // Booleans written by h5py are enums over int8 {FALSE=0, TRUE=1}.
            // HDF5 does not convert enum to integer, so read the raw value and
            // convert it from the enum's integer base in place.
            H5::EnumType enum_type = attr.getEnumType();
            H5::DataType base      = enum_type.getSuper();
            if (base.getClass() != H5T_INTEGER || base.getSize() > sizeof(value))
                throw LoadError("Hdf5FeatureStore: attribute " + name + " of " + key +
                                " is an enum without an integer base");
            attr.read(enum_type, &value);
            base.convert(H5::PredType::NATIVE_INT64, 1, &value, nullptr);
        } else {
            attr.read(H5::PredType::NATIVE_INT64, &value);
        }
        return value;
    } catch (const H5::Exception& ex) {
        throw LoadError("Hdf5FeatureStore: cannot read attribute " + name + " of " +
                        key + ": " + h5_message(ex));
    }
}

} // namespace wakefeed
