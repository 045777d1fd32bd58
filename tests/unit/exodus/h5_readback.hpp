#pragma once
#include <catch2/catch_test_macros.hpp>

#include <hdf5.h>

#include <filesystem>
#include <string>
#include <vector>

// Read-back through the raw HDF5 API, independent of the writer's own container.
namespace h5rb
{
namespace fs = std::filesystem;

// Fresh path in the temp directory; any leftover from an earlier run is removed.
inline std::string temp_exo(const std::string& stem)
{
    const auto p = fs::temp_directory_path() / ("exodus_ut_" + stem + ".exo");
    fs::remove(p);
    return p.string();
}

struct File
{
    hid_t id = -1;
    explicit File(const std::string& path)
    {
        id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        REQUIRE(id >= 0);
    }
    ~File()
    {
        if (id >= 0)
            H5Fclose(id);
    }
    File(const File&) = delete;
    File& operator=(const File&) = delete;

    bool has(const std::string& name) const
    {
        return H5Lexists(id, name.c_str(), H5P_DEFAULT) > 0;
    }

    std::vector<hsize_t> shape(const std::string& name) const
    {
        hid_t d = H5Dopen2(id, name.c_str(), H5P_DEFAULT);
        REQUIRE(d >= 0);
        hid_t sp = H5Dget_space(d);
        const int nd = H5Sget_simple_extent_ndims(sp);
        std::vector<hsize_t> dims(std::size_t(nd > 0 ? nd : 0));
        if (nd > 0)
            H5Sget_simple_extent_dims(sp, dims.data(), nullptr);
        H5Sclose(sp);
        H5Dclose(d);
        return dims;
    }

    // Element size in bytes of the stored type.
    std::size_t type_size(const std::string& name) const
    {
        hid_t d = H5Dopen2(id, name.c_str(), H5P_DEFAULT);
        REQUIRE(d >= 0);
        hid_t t = H5Dget_type(d);
        const std::size_t n = H5Tget_size(t);
        H5Tclose(t);
        H5Dclose(d);
        return n;
    }

    bool is_chunked(const std::string& name) const
    {
        hid_t d = H5Dopen2(id, name.c_str(), H5P_DEFAULT);
        REQUIRE(d >= 0);
        hid_t p = H5Dget_create_plist(d);
        const bool chunked = H5Pget_layout(p) == H5D_CHUNKED;
        H5Pclose(p);
        H5Dclose(d);
        return chunked;
    }

    template <class T> std::vector<T> read(const std::string& name, hid_t mem) const
    {
        hid_t d = H5Dopen2(id, name.c_str(), H5P_DEFAULT);
        REQUIRE(d >= 0);
        hid_t sp = H5Dget_space(d);
        std::vector<T> out((std::size_t) H5Sget_simple_extent_npoints(sp));
        if (!out.empty())
            REQUIRE(H5Dread(d, mem, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) >= 0);
        H5Sclose(sp);
        H5Dclose(d);
        return out;
    }

    std::vector<int> ints(const std::string& name) const
    {
        return read<int>(name, H5T_NATIVE_INT);
    }
    std::vector<double> doubles(const std::string& name) const
    {
        return read<double>(name, H5T_NATIVE_DOUBLE);
    }

    // Raw bytes of a single-character text array, read with its own stored type.
    std::vector<char> chars(const std::string& name) const
    {
        hid_t d = H5Dopen2(id, name.c_str(), H5P_DEFAULT);
        REQUIRE(d >= 0);
        hid_t t = H5Dget_type(d);
        REQUIRE(H5Tget_class(t) == H5T_STRING);
        REQUIRE(H5Tget_size(t) == 1);
        hid_t sp = H5Dget_space(d);
        std::vector<char> out((std::size_t) H5Sget_simple_extent_npoints(sp));
        if (!out.empty())
            REQUIRE(H5Dread(d, t, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) >= 0);
        H5Sclose(sp);
        H5Tclose(t);
        H5Dclose(d);
        return out;
    }

    // Row `row` of a (rows x width) text array, cut at the first NUL.
    std::string text_row(const std::string& name, std::size_t row) const
    {
        const auto raw = chars(name);
        const auto width = shape(name).at(1);
        std::string s(raw.begin() + std::ptrdiff_t(row * width),
                      raw.begin() + std::ptrdiff_t((row + 1) * width));
        return s.substr(0, s.find('\0'));
    }

    hid_t open_obj(const std::string& obj) const
    {
        hid_t o = H5Oopen(id, obj.empty() ? "/" : obj.c_str(), H5P_DEFAULT);
        REQUIRE(o >= 0);
        return o;
    }

    bool has_attr(const std::string& obj, const std::string& key) const
    {
        hid_t o = open_obj(obj);
        const bool yes = H5Aexists(o, key.c_str()) > 0;
        H5Oclose(o);
        return yes;
    }

    template <class T> std::vector<T> attr(const std::string& obj, const std::string& key,
                                           hid_t mem) const
    {
        hid_t o = open_obj(obj);
        hid_t a = H5Aopen(o, key.c_str(), H5P_DEFAULT);
        REQUIRE(a >= 0);
        hid_t sp = H5Aget_space(a);
        std::vector<T> out((std::size_t) H5Sget_simple_extent_npoints(sp));
        REQUIRE(H5Aread(a, mem, out.data()) >= 0);
        H5Sclose(sp);
        H5Aclose(a);
        H5Oclose(o);
        return out;
    }

    std::string text_attr(const std::string& obj, const std::string& key) const
    {
        hid_t o = open_obj(obj);
        hid_t a = H5Aopen(o, key.c_str(), H5P_DEFAULT);
        REQUIRE(a >= 0);
        hid_t t = H5Aget_type(a);
        std::string buf(H5Tget_size(t), '\0');
        REQUIRE(H5Aread(a, t, buf.data()) >= 0);
        H5Tclose(t);
        H5Aclose(a);
        H5Oclose(o);
        return buf.substr(0, buf.find('\0'));
    }
};

} // namespace h5rb
