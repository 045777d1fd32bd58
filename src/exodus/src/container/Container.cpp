#include "container/Container.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <netcdf.h>

namespace exodus::container
{

/// \cond DOXYGEN_EXCLUDE

namespace
{

// Chunked variables aim for roughly this many bytes per chunk.
constexpr std::size_t kChunkTargetBytes = std::size_t(1) << 20;

[[noreturn]] void fail(const std::string& what)
{
    throw ContainerError("[container] " + what);
}

void check(int status, const std::string& what)
{
    if (status != NC_NOERR)
        fail(what + ": " + nc_strerror(status));
}

nc_type nc_type_of(DType t) noexcept
{
    switch (t)
    {
    case DType::Int32:
        return NC_INT;
    case DType::Float32:
        return NC_FLOAT;
    case DType::Float64:
        return NC_DOUBLE;
    case DType::Char:
        return NC_CHAR;
    }
    return NC_NAT;
}

std::vector<std::size_t> chunk_shape(const std::vector<std::size_t>& dims, std::size_t elem)
{
    std::vector<std::size_t> c = dims;
    auto bytes = [&]()
    {
        std::size_t b = elem;
        for (auto d : c)
            b *= d;
        return b;
    };
    while (bytes() > kChunkTargetBytes)
    {
        auto it = std::max_element(c.begin(), c.end());
        if (it == c.end() || *it <= 1)
            break;
        *it = (*it + 1) / 2;
    }
    return c;
}

std::string shape_str(const std::vector<std::size_t>& v)
{
    std::string s = "(";
    for (std::size_t i = 0; i < v.size(); ++i)
    {
        if (i)
            s += ",";
        s += std::to_string(v[i]);
    }
    return s + ")";
}

} // namespace

struct Container::Impl
{
    struct Dim
    {
        int id = -1;
        std::size_t size = 0;
    };
    struct Var
    {
        int id = -1;
        std::vector<std::size_t> shape;
        DType type = DType::Float64;
    };

    int ncid = -1;
    bool define_mode = true; // nc_create leaves the file in define mode
    std::string path;
    std::map<std::string, Dim, std::less<>> dims;
    std::map<std::string, Var, std::less<>> vars;

    const Var& var(std::string_view name) const
    {
        auto it = vars.find(name);
        if (it == vars.end())
            fail("unknown variable '" + std::string(name) + "'");
        return it->second;
    }

    int varid(const std::string& var_name) const
    {
        return var_name.empty() ? NC_GLOBAL : var(var_name).id;
    }

    void redef()
    {
        if (!define_mode)
        {
            check(nc_redef(ncid), "nc_redef on '" + path + "'");
            define_mode = true;
        }
    }

    void enddef()
    {
        if (define_mode)
        {
            check(nc_enddef(ncid), "nc_enddef on '" + path + "'");
            define_mode = false;
        }
    }
};

/// \endcond

std::size_t dtype_size(DType t) noexcept
{
    switch (t)
    {
    case DType::Int32:
        return 4;
    case DType::Float32:
        return 4;
    case DType::Float64:
        return 8;
    case DType::Char:
        return 1;
    }
    return 0;
}

Container::Container(const std::string& path) : impl_(new Impl)
{
    impl_->path = path;
    check(nc_create(path.c_str(), NC_NETCDF4 | NC_NOCLOBBER, &impl_->ncid),
          "cannot create '" + path + "'");
}

Container::~Container()
{
    close();
}

Container::Container(Container&&) noexcept = default;
Container& Container::operator=(Container&& other) noexcept
{
    if (this != &other)
    {
        close();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

void Container::close() noexcept
{
    if (!impl_ || impl_->ncid < 0)
        return;
    const int status = nc_close(impl_->ncid);
    if (status != NC_NOERR)
        LOGE("[container] failed to close '%s': %s\n", impl_->path.c_str(), nc_strerror(status));
    impl_->ncid = -1;
}

bool Container::is_open() const noexcept
{
    return impl_ && impl_->ncid >= 0;
}

const std::string& Container::path() const noexcept
{
    static const std::string empty;
    return impl_ ? impl_->path : empty;
}

// ---------------------------------------------------------------- dimensions

void Container::declare_dimension(const std::string& name, std::size_t size)
{
    if (!is_open())
        fail("declare_dimension on a closed container");
    if (impl_->dims.count(name))
        fail("dimension '" + name + "' already declared");

    impl_->redef();
    int dimid = -1;
    check(nc_def_dim(impl_->ncid, name.c_str(), size, &dimid),
          "cannot define dimension '" + name + "'");
    impl_->dims[name] = Impl::Dim{dimid, size};
}

// ---------------------------------------------------------------- variables

void Container::create_variable(const std::string& name, const std::vector<std::string>& dims,
                                DType type, const VariableOptions& opts)
{
    if (!is_open())
        fail("create_variable on a closed container");
    if (impl_->vars.count(name))
        fail("variable '" + name + "' already defined");

    Impl::Var v;
    v.type = type;
    std::vector<int> dimids;
    for (const auto& d : dims)
    {
        auto it = impl_->dims.find(d);
        if (it == impl_->dims.end())
            fail("variable '" + name + "' references unknown dimension '" + d + "'");
        v.shape.push_back(it->second.size);
        dimids.push_back(it->second.id);
    }

    impl_->redef();
    check(nc_def_var(impl_->ncid, name.c_str(), nc_type_of(type), (int) dimids.size(),
                     dimids.empty() ? nullptr : dimids.data(), &v.id),
          "cannot define variable '" + name + "'");

    const bool any_zero = std::find(v.shape.begin(), v.shape.end(), 0) != v.shape.end();
    if (opts.deflate_level > 0 && !v.shape.empty() && !any_zero)
    {
        const auto chunk = chunk_shape(v.shape, dtype_size(type));
        check(nc_def_var_chunking(impl_->ncid, v.id, NC_CHUNKED, chunk.data()),
              "cannot chunk '" + name + "'");
        check(nc_def_var_deflate(impl_->ncid, v.id, 0, 1, opts.deflate_level),
              "cannot deflate '" + name + "'");
    }
    impl_->vars.emplace(name, std::move(v));
}

std::vector<std::size_t> Container::shape(std::string_view name) const
{
    if (!impl_)
        fail("shape lookup on a moved-from container");
    return impl_->var(name).shape;
}

/// \cond DOXYGEN_EXCLUDE
namespace
{
struct Selection
{
    std::vector<std::size_t> start, count;
    std::size_t points = 1;
};

Selection make_selection(const std::string& name, const std::vector<std::size_t>& shape,
                         const std::vector<std::size_t>& start,
                         const std::vector<std::size_t>& count, std::size_t n)
{
    Selection s;
    const bool whole = start.empty() && count.empty();
    if (!whole && (start.size() != shape.size() || count.size() != shape.size()))
        fail("selection rank mismatch on '" + name + "'");
    for (std::size_t i = 0; i < shape.size(); ++i)
    {
        const std::size_t b = whole ? 0 : start[i];
        const std::size_t c = whole ? shape[i] : count[i];
        if (b + c > shape[i])
            fail("selection " + shape_str(whole ? std::vector<std::size_t>{} : start) + "+" +
                 shape_str(whole ? shape : count) + " outside '" + name + "' " + shape_str(shape));
        s.start.push_back(b);
        s.count.push_back(c);
        s.points *= c;
    }
    if (s.points != n)
        fail("buffer holds " + std::to_string(n) + " values, selection on '" + name + "' needs " +
             std::to_string(s.points));
    return s;
}
} // namespace
/// \endcond

void Container::write_raw(const std::string& name, const std::vector<std::size_t>& start,
                          const std::vector<std::size_t>& count, DType mem, const void* data,
                          std::size_t n)
{
    if (!is_open())
        fail("write on a closed container");
    const auto& v = impl_->var(name);
    const Selection sel = make_selection(name, v.shape, start, count, n);
    if (sel.points == 0)
        return;

    impl_->enddef();
    const int ncid = impl_->ncid;
    const std::size_t* st = sel.start.empty() ? nullptr : sel.start.data();
    const std::size_t* ct = sel.count.empty() ? nullptr : sel.count.data();
    int status = NC_NOERR;
    switch (mem)
    {
    case DType::Int32:
        status = nc_put_vara_int(ncid, v.id, st, ct, static_cast<const int*>(data));
        break;
    case DType::Float32:
        status = nc_put_vara_float(ncid, v.id, st, ct, static_cast<const float*>(data));
        break;
    case DType::Float64:
        status = nc_put_vara_double(ncid, v.id, st, ct, static_cast<const double*>(data));
        break;
    case DType::Char:
        status = nc_put_vara_text(ncid, v.id, st, ct, static_cast<const char*>(data));
        break;
    }
    check(status, "write failed on '" + name + "' " + shape_str(sel.start) + "+" +
                      shape_str(sel.count));
}

void Container::read_raw(const std::string& name, DType mem, void* data, std::size_t n)
{
    if (!is_open())
        fail("read on a closed container");
    const auto& v = impl_->var(name);
    const Selection sel = make_selection(name, v.shape, {}, {}, n);
    if (sel.points == 0)
        return;

    impl_->enddef();
    const int ncid = impl_->ncid;
    const std::size_t* st = sel.start.empty() ? nullptr : sel.start.data();
    const std::size_t* ct = sel.count.empty() ? nullptr : sel.count.data();
    int status = NC_NOERR;
    switch (mem)
    {
    case DType::Int32:
        status = nc_get_vara_int(ncid, v.id, st, ct, static_cast<int*>(data));
        break;
    case DType::Float32:
        status = nc_get_vara_float(ncid, v.id, st, ct, static_cast<float*>(data));
        break;
    case DType::Float64:
        status = nc_get_vara_double(ncid, v.id, st, ct, static_cast<double*>(data));
        break;
    case DType::Char:
        status = nc_get_vara_text(ncid, v.id, st, ct, static_cast<char*>(data));
        break;
    }
    check(status, "read failed on '" + name + "'");
}

// ---------------------------------------------------------------- attributes

void Container::set_attribute(const std::string& var, const std::string& key,
                              std::span<const std::int32_t> values)
{
    if (!is_open())
        fail("set_attribute on a closed container");
    if (values.empty())
        fail("attribute '" + key + "' needs at least one value");
    const int id = impl_->varid(var);
    impl_->redef();
    check(nc_put_att_int(impl_->ncid, id, key.c_str(), NC_INT, values.size(), values.data()),
          "cannot write attribute '" + key + "'");
}

void Container::set_attribute(const std::string& var, const std::string& key,
                              std::span<const float> values)
{
    if (!is_open())
        fail("set_attribute on a closed container");
    if (values.empty())
        fail("attribute '" + key + "' needs at least one value");
    const int id = impl_->varid(var);
    impl_->redef();
    check(nc_put_att_float(impl_->ncid, id, key.c_str(), NC_FLOAT, values.size(), values.data()),
          "cannot write attribute '" + key + "'");
}

void Container::set_attribute(const std::string& var, const std::string& key,
                              std::string_view text)
{
    if (!is_open())
        fail("set_attribute on a closed container");
    const int id = impl_->varid(var);
    impl_->redef();
    check(nc_put_att_text(impl_->ncid, id, key.c_str(), text.size(), text.data()),
          "cannot write attribute '" + key + "'");
}

} // namespace exodus::container
