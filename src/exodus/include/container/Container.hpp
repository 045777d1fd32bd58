#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file Container.hpp
 * @brief netCDF-4 dataset: named dimensions, typed variables, attributes.
 *
 * @details
 * Thin owner of a netCDF-C file id. The file is created exclusively (``NC_NETCDF4 |
 * NC_NOCLOBBER``) in the constructor and released by :cpp:func:`close` or the destructor;
 * `close()` is idempotent and never throws. Define / data mode is switched on demand, so callers
 * may interleave definitions and writes.
 *
 * The container keeps an in-memory catalog of every dimension and variable it created so lookups
 * and selection checks never query the file. Every netCDF status other than ``NC_NOERR`` becomes a
 * :cpp:class:`exodus::ContainerError` carrying ``nc_strerror``.
 *
 * netCDF reads a dimension length of 0 as unlimited; such a dimension simply has current length 0
 * here.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   Container c("mesh.exo");
 *   c.declare_dimension("num_nodes", 4);
 *   c.create_variable("coordx", {"num_nodes"}, DType::Float64);
 *   c.write<double>("coordx", xs);
 *   c.set_attribute("", "title", "demo");
 *   c.close();
 * @endrst
 */

namespace exodus::container
{

enum class DType
{
    Int32,
    Float32,
    Float64,
    Char
};

std::size_t dtype_size(DType t) noexcept;

template <class T> constexpr DType dtype_of();
template <> constexpr DType dtype_of<std::int32_t>()
{
    return DType::Int32;
}
template <> constexpr DType dtype_of<float>()
{
    return DType::Float32;
}
template <> constexpr DType dtype_of<double>()
{
    return DType::Float64;
}
template <> constexpr DType dtype_of<char>()
{
    return DType::Char;
}

// Storage layout for a new variable. deflate_level 0 keeps the variable contiguous.
struct VariableOptions
{
    int deflate_level = 0;
};

class Container
{
  public:
    explicit Container(const std::string& path);
    ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) noexcept;
    Container& operator=(Container&&) noexcept;

    void close() noexcept;
    bool is_open() const noexcept;
    const std::string& path() const noexcept;

    // ---- dimensions ----
    void declare_dimension(const std::string& name, std::size_t size);

    // ---- variables ----
    void create_variable(const std::string& name, const std::vector<std::string>& dims, DType type,
                         const VariableOptions& opts = {});
    std::vector<std::size_t> shape(std::string_view name) const;

    // Whole-variable and hyperslab access. `start`/`count` have one entry per axis.
    template <class T> void write(const std::string& name, std::span<const T> data)
    {
        write_raw(name, {}, {}, dtype_of<T>(), data.data(), data.size());
    }
    template <class T>
    void write_slab(const std::string& name, const std::vector<std::size_t>& start,
                    const std::vector<std::size_t>& count, std::span<const T> data)
    {
        write_raw(name, start, count, dtype_of<T>(), data.data(), data.size());
    }
    template <class T> std::vector<T> read(const std::string& name)
    {
        std::size_t n = 1;
        for (auto d : shape(name))
            n *= d;
        std::vector<T> out(n);
        read_raw(name, dtype_of<T>(), out.data(), out.size());
        return out;
    }

    // ---- attributes (empty `var` addresses the global attributes) ----
    void set_attribute(const std::string& var, const std::string& key,
                       std::span<const std::int32_t> values);
    void set_attribute(const std::string& var, const std::string& key,
                       std::span<const float> values);
    void set_attribute(const std::string& var, const std::string& key, std::string_view text);

  private:
    void write_raw(const std::string& name, const std::vector<std::size_t>& start,
                   const std::vector<std::size_t>& count, DType mem, const void* data,
                   std::size_t n);
    void read_raw(const std::string& name, DType mem, void* data, std::size_t n);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace exodus::container
