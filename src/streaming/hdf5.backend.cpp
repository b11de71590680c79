#include "hdf5.backend.hh"
#include "macros.hh"

#include <blosc_filter.h>
#include <hdf5.h>

#include <algorithm>
#include <cstdlib> // free
#include <string_view>
#include <vector>

#define H5_CHECK(exp) check_h5_((exp), #exp, path_)

namespace {
constexpr hid_t invalid_hid = -1;

template<typename T>
T
check_h5_(T rc, const char* expression, const std::string& path)
{
    if (rc < 0) {
        throw h5stream::StorageError(
          LOG_ERROR("HDF5 call failed for '", path, "': ", expression));
    }
    return rc;
}

/// @brief Owns an HDF5 identifier and releases it with the matching close
/// function.
class Hdf5Handle
{
  public:
    using Closer = herr_t (*)(hid_t);

    Hdf5Handle()
      : id_(invalid_hid)
      , close_(nullptr)
    {
    }

    Hdf5Handle(hid_t id, Closer close)
      : id_(id)
      , close_(close)
    {
    }

    Hdf5Handle(const Hdf5Handle&) = delete;
    Hdf5Handle& operator=(const Hdf5Handle&) = delete;

    Hdf5Handle(Hdf5Handle&& other) noexcept
      : id_(other.id_)
      , close_(other.close_)
    {
        other.id_ = invalid_hid;
    }

    Hdf5Handle& operator=(Hdf5Handle&& other) noexcept
    {
        if (this != &other) {
            reset_();
            id_ = other.id_;
            close_ = other.close_;
            other.id_ = invalid_hid;
        }
        return *this;
    }

    ~Hdf5Handle() { reset_(); }

    [[nodiscard]] hid_t get() const { return id_; }
    [[nodiscard]] bool valid() const { return id_ >= 0; }

    /// @brief Close now, reporting failure.
    void close(const std::string& path)
    {
        if (!valid()) {
            return;
        }

        const hid_t id = id_;
        id_ = invalid_hid;
        check_h5_(close_(id), "close", path);
    }

  private:
    hid_t id_;
    Closer close_;

    void reset_() noexcept
    {
        if (valid() && close_(id_) < 0) {
            LOG_WARNING("Failed to close HDF5 object ", id_);
        }
        id_ = invalid_hid;
    }
};

hid_t
file_type_of(H5StreamDataType dtype)
{
    switch (dtype) {
        case H5StreamDataType_uint8:
            return H5T_STD_U8LE;
        case H5StreamDataType_uint16:
            return H5T_STD_U16LE;
        case H5StreamDataType_uint32:
            return H5T_STD_U32LE;
        case H5StreamDataType_uint64:
            return H5T_STD_U64LE;
        case H5StreamDataType_int8:
            return H5T_STD_I8LE;
        case H5StreamDataType_int16:
            return H5T_STD_I16LE;
        case H5StreamDataType_int32:
            return H5T_STD_I32LE;
        case H5StreamDataType_int64:
            return H5T_STD_I64LE;
        case H5StreamDataType_float32:
            return H5T_IEEE_F32LE;
        case H5StreamDataType_float64:
            return H5T_IEEE_F64LE;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(dtype));
    }
}

void
register_blosc_filter()
{
    if (H5Zfilter_avail(FILTER_BLOSC) > 0) {
        return;
    }

    char* version = nullptr;
    char* date = nullptr;
    const int rc = register_blosc(&version, &date);
    EXPECT(rc >= 0, "Failed to register the blosc filter: ", rc);

    LOG_DEBUG("Registered blosc filter ",
              FILTER_BLOSC,
              " (blosc ",
              version ? version : "?",
              ", ",
              date ? date : "?",
              ")");
    free(version);
    free(date);

    EXPECT(H5Zfilter_avail(FILTER_BLOSC) > 0,
           "Blosc filter ",
           FILTER_BLOSC,
           " is not available after registration");
}

std::vector<std::string>
split_path(std::string_view path)
{
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            parts.emplace_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return parts;
}

/// @brief A JSON value converted to an HDF5 type, dataspace and buffer.
class Hdf5Value
{
  public:
    Hdf5Value(const nlohmann::json& value, const std::string& path);

    [[nodiscard]] hid_t type() const { return type_.get(); }
    [[nodiscard]] hid_t space() const { return space_.get(); }
    [[nodiscard]] const void* data() const { return data_; }

  private:
    const std::string& path_;
    Hdf5Handle type_;
    Hdf5Handle space_;
    const void* data_;

    std::vector<int8_t> bools_;
    std::vector<int64_t> ints_;
    std::vector<uint64_t> uints_;
    std::vector<double> floats_;
    std::vector<std::string> strings_;
    std::vector<const char*> string_ptrs_;
};

Hdf5Value::Hdf5Value(const nlohmann::json& value, const std::string& path)
  : path_(path)
  , data_(nullptr)
{
    std::vector<nlohmann::json> elements;
    if (value.is_array()) {
        EXPECT_ARGUMENT(!value.empty(), "Cannot store an empty array");
        elements.assign(value.begin(), value.end());
        const hsize_t n = elements.size();
        space_ = { H5_CHECK(H5Screate_simple(1, &n, nullptr)), H5Sclose };
    } else {
        elements.push_back(value);
        space_ = { H5_CHECK(H5Screate(H5S_SCALAR)), H5Sclose };
    }

    const auto all = [&elements](auto pred) {
        return std::all_of(elements.begin(), elements.end(), pred);
    };

    if (all([](const auto& v) { return v.is_string(); })) {
        type_ = { H5_CHECK(H5Tcopy(H5T_C_S1)), H5Tclose };
        H5_CHECK(H5Tset_size(type_.get(), H5T_VARIABLE));
        H5_CHECK(H5Tset_cset(type_.get(), H5T_CSET_UTF8));

        for (const auto& v : elements) {
            strings_.push_back(v.get<std::string>());
        }
        for (const auto& s : strings_) {
            string_ptrs_.push_back(s.c_str());
        }
        data_ = string_ptrs_.data();
    } else if (all([](const auto& v) { return v.is_boolean(); })) {
        // the FALSE/TRUE enum is how h5py stores booleans
        type_ = { H5_CHECK(H5Tenum_create(H5T_NATIVE_INT8)), H5Tclose };
        int8_t false_value = 0, true_value = 1;
        H5_CHECK(H5Tenum_insert(type_.get(), "FALSE", &false_value));
        H5_CHECK(H5Tenum_insert(type_.get(), "TRUE", &true_value));

        for (const auto& v : elements) {
            bools_.push_back(v.get<bool>() ? 1 : 0);
        }
        data_ = bools_.data();
    } else if (all([](const auto& v) { return v.is_number_unsigned(); })) {
        type_ = { H5_CHECK(H5Tcopy(H5T_NATIVE_UINT64)), H5Tclose };
        for (const auto& v : elements) {
            uints_.push_back(v.get<uint64_t>());
        }
        data_ = uints_.data();
    } else if (all([](const auto& v) { return v.is_number_integer(); })) {
        type_ = { H5_CHECK(H5Tcopy(H5T_NATIVE_INT64)), H5Tclose };
        for (const auto& v : elements) {
            ints_.push_back(v.get<int64_t>());
        }
        data_ = ints_.data();
    } else if (all([](const auto& v) { return v.is_number(); })) {
        type_ = { H5_CHECK(H5Tcopy(H5T_NATIVE_DOUBLE)), H5Tclose };
        for (const auto& v : elements) {
            floats_.push_back(v.get<double>());
        }
        data_ = floats_.data();
    } else {
        EXPECT_ARGUMENT(false,
                        "Cannot store value in '",
                        path,
                        "': ",
                        value.dump(),
                        ". Expected a boolean, number, string, or a "
                        "homogeneous array of numbers or strings.");
    }
}

class Hdf5Container : public h5stream::Container
{
  public:
    Hdf5Container(const h5stream::ContainerSpec& spec,
                  uint64_t initial_capacity);

    [[nodiscard]] uint64_t capacity() const override { return capacity_; }
    [[nodiscard]] uint64_t resize(uint64_t n_slots) override;
    void write_chunk(uint64_t slot, std::span<const std::byte> data) override;
    void set_group_attribute(const std::string& group_path,
                             const std::string& name,
                             const nlohmann::json& value) override;
    void set_dataset_attribute(const std::string& dataset_path,
                               const std::string& name,
                               const nlohmann::json& value) override;
    void add_dataset(const std::string& dataset_path,
                     const nlohmann::json& value) override;

  protected:
    void close_() override;

  private:
    std::string path_;
    std::string dataset_name_;
    h5stream::FrameShape frame_shape_;
    uint64_t capacity_;

    Hdf5Handle file_;
    Hdf5Handle dataset_;

    [[nodiscard]] Hdf5Handle make_link_creation_plist_() const;
    [[nodiscard]] bool link_exists_(const std::string& object_path) const;
    void ensure_group_(const std::string& group_path);
    void write_attribute_(hid_t object,
                          const std::string& name,
                          const nlohmann::json& value);
};

Hdf5Container::Hdf5Container(const h5stream::ContainerSpec& spec,
                             uint64_t initial_capacity)
  : path_(spec.path)
  , dataset_name_(spec.dataset_name)
  , frame_shape_(spec.frame_shape)
  , capacity_(initial_capacity)
{
    EXPECT_ARGUMENT(frame_shape_.rows > 0 && frame_shape_.cols > 0,
                    "Invalid frame shape: ",
                    frame_shape_.rows,
                    "x",
                    frame_shape_.cols);

    const hid_t file_type = file_type_of(spec.dtype);

    file_ = { H5_CHECK(H5Fcreate(
                path_.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT)),
              H5Fclose };

    const hsize_t dims[3] = { capacity_, frame_shape_.rows, frame_shape_.cols };
    const hsize_t max_dims[3] = { H5S_UNLIMITED,
                                  frame_shape_.rows,
                                  frame_shape_.cols };
    Hdf5Handle space{ H5_CHECK(H5Screate_simple(3, dims, max_dims)),
                      H5Sclose };

    Hdf5Handle dcpl{ H5_CHECK(H5Pcreate(H5P_DATASET_CREATE)), H5Pclose };
    const hsize_t chunk_dims[3] = { 1, frame_shape_.rows, frame_shape_.cols };
    H5_CHECK(H5Pset_chunk(dcpl.get(), 3, chunk_dims));

    if (spec.filter_id) {
        std::vector<unsigned int> cd_values(spec.filter_options.begin(),
                                            spec.filter_options.end());
        H5_CHECK(H5Pset_filter(dcpl.get(),
                               static_cast<H5Z_filter_t>(*spec.filter_id),
                               H5Z_FLAG_OPTIONAL,
                               cd_values.size(),
                               cd_values.data()));
    }

    Hdf5Handle lcpl = make_link_creation_plist_();
    dataset_ = { H5_CHECK(H5Dcreate2(file_.get(),
                                     dataset_name_.c_str(),
                                     file_type,
                                     space.get(),
                                     lcpl.get(),
                                     dcpl.get(),
                                     H5P_DEFAULT)),
                 H5Dclose };
}

uint64_t
Hdf5Container::resize(uint64_t n_slots)
{
    EXPECT(dataset_.valid(), "Container '", path_, "' is closed.");

    const hsize_t dims[3] = { n_slots, frame_shape_.rows, frame_shape_.cols };
    H5_CHECK(H5Dset_extent(dataset_.get(), dims));

    Hdf5Handle space{ H5_CHECK(H5Dget_space(dataset_.get())), H5Sclose };
    hsize_t actual[3] = { 0, 0, 0 };
    H5_CHECK(H5Sget_simple_extent_dims(space.get(), actual, nullptr));

    capacity_ = actual[0];
    return capacity_;
}

void
Hdf5Container::write_chunk(uint64_t slot, std::span<const std::byte> data)
{
    EXPECT(dataset_.valid(), "Container '", path_, "' is closed.");
    EXPECT(slot < capacity_,
           "Slot ",
           slot,
           " is out of range for a dataset of ",
           capacity_,
           " slots.");
    EXPECT(!data.empty(), "Cannot write an empty chunk at slot ", slot);

    const hsize_t offset[3] = { slot, 0, 0 };
    H5_CHECK(H5Dwrite_chunk(dataset_.get(),
                            H5P_DEFAULT,
                            0, // all filters applied
                            offset,
                            data.size(),
                            data.data()));
}

void
Hdf5Container::set_group_attribute(const std::string& group_path,
                                   const std::string& name,
                                   const nlohmann::json& value)
{
    ensure_group_(group_path);

    const std::string object_path = group_path.empty() ? "/" : group_path;
    Hdf5Handle group{
        H5_CHECK(H5Oopen(file_.get(), object_path.c_str(), H5P_DEFAULT)),
        H5Oclose
    };
    write_attribute_(group.get(), name, value);
}

void
Hdf5Container::set_dataset_attribute(const std::string& dataset_path,
                                     const std::string& name,
                                     const nlohmann::json& value)
{
    EXPECT(link_exists_(dataset_path),
           "Cannot set attribute '",
           name,
           "': no dataset at '",
           dataset_path,
           "' in ",
           path_);

    Hdf5Handle dataset{
        H5_CHECK(H5Oopen(file_.get(), dataset_path.c_str(), H5P_DEFAULT)),
        H5Oclose
    };
    write_attribute_(dataset.get(), name, value);
}

void
Hdf5Container::add_dataset(const std::string& dataset_path,
                           const nlohmann::json& value)
{
    EXPECT(dataset_path != dataset_name_,
           "Cannot replace the primary dataset '",
           dataset_path,
           "'");

    if (link_exists_(dataset_path)) {
        H5_CHECK(H5Ldelete(file_.get(), dataset_path.c_str(), H5P_DEFAULT));
    }

    Hdf5Value v(value, path_);
    Hdf5Handle lcpl = make_link_creation_plist_();
    Hdf5Handle dataset{ H5_CHECK(H5Dcreate2(file_.get(),
                                            dataset_path.c_str(),
                                            v.type(),
                                            v.space(),
                                            lcpl.get(),
                                            H5P_DEFAULT,
                                            H5P_DEFAULT)),
                        H5Dclose };
    H5_CHECK(H5Dwrite(
      dataset.get(), v.type(), H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data()));
}

void
Hdf5Container::close_()
{
    if (!file_.valid()) {
        return;
    }

    H5_CHECK(H5Fflush(file_.get(), H5F_SCOPE_LOCAL));
    dataset_.close(path_);
    file_.close(path_);
}

Hdf5Handle
Hdf5Container::make_link_creation_plist_() const
{
    Hdf5Handle lcpl{ H5_CHECK(H5Pcreate(H5P_LINK_CREATE)), H5Pclose };
    H5_CHECK(H5Pset_create_intermediate_group(lcpl.get(), 1));
    return lcpl;
}

bool
Hdf5Container::link_exists_(const std::string& object_path) const
{
    // H5Lexists fails rather than returning false when a parent is missing,
    // so each prefix is checked in turn
    std::string prefix;
    for (const auto& part : split_path(object_path)) {
        prefix += "/" + part;
        if (H5_CHECK(H5Lexists(file_.get(), prefix.c_str(), H5P_DEFAULT)) ==
            0) {
            return false;
        }
    }

    return !prefix.empty();
}

void
Hdf5Container::ensure_group_(const std::string& group_path)
{
    std::string prefix;
    for (const auto& part : split_path(group_path)) {
        prefix += "/" + part;
        if (H5_CHECK(H5Lexists(file_.get(), prefix.c_str(), H5P_DEFAULT)) >
            0) {
            continue;
        }

        Hdf5Handle group{ H5_CHECK(H5Gcreate2(file_.get(),
                                              prefix.c_str(),
                                              H5P_DEFAULT,
                                              H5P_DEFAULT,
                                              H5P_DEFAULT)),
                          H5Gclose };
    }
}

void
Hdf5Container::write_attribute_(hid_t object,
                                const std::string& name,
                                const nlohmann::json& value)
{
    if (H5_CHECK(H5Aexists(object, name.c_str())) > 0) {
        H5_CHECK(H5Adelete(object, name.c_str()));
    }

    Hdf5Value v(value, path_);
    Hdf5Handle attribute{ H5_CHECK(H5Acreate2(object,
                                              name.c_str(),
                                              v.type(),
                                              v.space(),
                                              H5P_DEFAULT,
                                              H5P_DEFAULT)),
                          H5Aclose };
    H5_CHECK(H5Awrite(attribute.get(), v.type(), v.data()));
}
} // namespace

h5stream::Hdf5Backend::Hdf5Backend(uint64_t initial_capacity)
  : initial_capacity_(initial_capacity)
{
    // lets blosc-compressed containers be read back in this process
    register_blosc_filter();
}

std::unique_ptr<h5stream::Container>
h5stream::Hdf5Backend::create_container(const ContainerSpec& spec)
{
    EXPECT_ARGUMENT(!spec.path.empty(), "Container path is empty.");
    EXPECT_ARGUMENT(!spec.dataset_name.empty(), "Dataset name is empty.");

    return std::make_unique<Hdf5Container>(spec, initial_capacity_);
}
