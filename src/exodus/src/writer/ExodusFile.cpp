#include "writer/ExodusFile.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "container/Container.hpp"
#include "schema/FixedString.hpp"
#include "schema/Schema.hpp"
#include "writer/BulkWriter.hpp"
#include "writer/EntityAllocator.hpp"
#include "writer/SchemaInit.hpp"
#include "writer/VariableRegistry.hpp"

#include <utility>

namespace exodus::writer
{
using container::DType;

/// \cond DOXYGEN_EXCLUDE

struct ExodusFile::Impl
{
    Impl(const std::string& path, const CreateOptions& o, int ws)
        : opts(o), word_size(ws), c(path),
          alloc(c, o.num_elems, o.num_blocks, o.num_side_sets, variable_options(o)),
          vars(c, real_type(ws), variable_options(o), o.num_nodes)
    {
    }

    CreateOptions opts;
    int word_size = 8;
    container::Container c;
    EntityAllocator alloc;
    VariableRegistry vars;
    bool info_written = false;
};

/// \endcond

ExodusFile::ExodusFile(const std::string& path, const CreateOptions& opts)
{
    validate_create_options(path, opts);
    const int ws = resolve_word_size(opts.io_size);

    impl_ = std::make_unique<Impl>(path, opts, ws);
    initialize_schema(impl_->c, opts, ws);

    LOGI("[exodus] created %s (%dD, %zu nodes, %zu elems, %zu blocks, %zu side sets, %d-byte "
         "reals)\n",
         path.c_str(), opts.num_dims, opts.num_nodes, opts.num_elems, opts.num_blocks,
         opts.num_side_sets, ws);
}

ExodusFile::~ExodusFile()
{
    close();
}

ExodusFile::ExodusFile(ExodusFile&&) noexcept = default;

ExodusFile& ExodusFile::operator=(ExodusFile&& other) noexcept
{
    if (this != &other)
    {
        close();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

void ExodusFile::close() noexcept
{
    if (!impl_ || !impl_->c.is_open())
        return;
    impl_->c.close();
    LOGI("[exodus] closed %s\n", impl_->c.path().c_str());
}

bool ExodusFile::is_open() const noexcept
{
    return impl_ && impl_->c.is_open();
}

ExodusFile::Impl& ExodusFile::open_impl(const char* op)
{
    if (!is_open())
        throw ValidationError(std::string("[exodus] ") + op + ": file is closed");
    return *impl_;
}

const ExodusFile::Impl& ExodusFile::open_impl(const char* op) const
{
    if (!is_open())
        throw ValidationError(std::string("[exodus] ") + op + ": file is closed");
    return *impl_;
}

const ExodusFile::Impl& ExodusFile::state(const char* op) const
{
    if (!impl_)
        throw ValidationError(std::string("[exodus] ") + op + ": file was moved from");
    return *impl_;
}

const std::string& ExodusFile::path() const
{
    return state("path").c.path();
}
int ExodusFile::num_dims() const
{
    return state("num_dims").opts.num_dims;
}
std::size_t ExodusFile::num_nodes() const
{
    return state("num_nodes").opts.num_nodes;
}
std::size_t ExodusFile::num_elems() const
{
    return state("num_elems").opts.num_elems;
}
std::size_t ExodusFile::num_blocks() const
{
    return state("num_blocks").opts.num_blocks;
}
std::size_t ExodusFile::num_side_sets() const
{
    return state("num_side_sets").opts.num_side_sets;
}
int ExodusFile::float_word_size() const
{
    return state("float_word_size").word_size;
}
std::size_t ExodusFile::time_steps() const noexcept
{
    return schema::kTimeSteps;
}

// ---------------------------------------------------------------------------
// mesh
// ---------------------------------------------------------------------------

void ExodusFile::put_info_records(const std::vector<std::string>& lines)
{
    auto& I = open_impl("put_info_records");
    if (lines.empty())
        return;
    if (I.info_written)
        throw ValidationError("[exodus] info records were already written");

    // Every line is encoded before the file is touched, so a bad line leaves no trace.
    std::vector<char> flat;
    flat.reserve(lines.size() * schema::kLenLine);
    for (const auto& line : lines)
    {
        const auto row = schema::FixedString::encode(line, schema::kLenLine);
        const auto b = row.bytes();
        flat.insert(flat.end(), b.begin(), b.end());
    }

    I.c.declare_dimension(schema::dim::kNumInfo, lines.size());
    I.c.create_variable(schema::var::kInfoRecords, {schema::dim::kNumInfo, schema::dim::kLenLine},
                        DType::Char, variable_options(I.opts));
    I.c.write<char>(schema::var::kInfoRecords, flat);
    I.info_written = true;
}

void ExodusFile::put_coord_names(const std::vector<std::string>& names)
{
    auto& I = open_impl("put_coord_names");
    if (names.size() != std::size_t(I.opts.num_dims))
        throw ValidationError("[exodus] expected " + std::to_string(I.opts.num_dims) +
                              " coordinate names, got " + std::to_string(names.size()));

    std::vector<char> flat;
    flat.reserve(names.size() * schema::kLenName);
    for (const auto& n : names)
    {
        const auto row = schema::FixedString::encode(n, schema::kLenName);
        const auto b = row.bytes();
        flat.insert(flat.end(), b.begin(), b.end());
    }
    I.c.write<char>(schema::var::kCoorNames, flat);
}

void ExodusFile::put_coords(std::span<const double> x, std::span<const double> y,
                            std::span<const double> z)
{
    auto& I = open_impl("put_coords");
    const std::size_t n = I.opts.num_nodes;
    if (I.opts.num_dims == 2 && !z.empty())
        throw ValidationError("[exodus] z coordinates given for a 2-D file");

    const std::span<const double> axes[] = {x, y, z};
    for (int a = 0; a < I.opts.num_dims; ++a)
        if (axes[a].size() != n)
            throw ValidationError("[exodus] " + schema::coord_var(a) + " needs " +
                                  std::to_string(n) + " values, got " +
                                  std::to_string(axes[a].size()));

    for (int a = 0; a < I.opts.num_dims; ++a)
        I.c.write<double>(schema::coord_var(a), axes[a]);
}

void ExodusFile::put_time(int step, double value)
{
    auto& I = open_impl("put_time");
    schema::check_step(step);
    I.c.write_slab<double>(schema::var::kTimeWhole, {std::size_t(step - 1)}, {1},
                           std::span<const double>(&value, 1));
}

// ---------------------------------------------------------------------------
// element blocks
// ---------------------------------------------------------------------------

void ExodusFile::put_elem_blk_info(std::int32_t id, std::string_view elem_type,
                                   std::size_t num_elems, std::size_t nodes_per_elem,
                                   std::size_t attrs_per_elem)
{
    open_impl("put_elem_blk_info")
        .alloc.allocate_block(id, elem_type, num_elems, nodes_per_elem, attrs_per_elem);
}

void ExodusFile::put_elem_blk_name(std::int32_t id, std::string_view name)
{
    open_impl("put_elem_blk_name").alloc.put_block_name(id, name);
}

void ExodusFile::put_elem_connectivity(std::int32_t id, std::span<const int> conn, int shift,
                                       std::optional<std::size_t> chunk_bytes)
{
    auto& I = open_impl("put_elem_connectivity");
    write_connectivity(I.c, I.alloc.block(id), conn, shift,
                       chunk_bytes.value_or(I.opts.connectivity_chunk_bytes));
}

// ---------------------------------------------------------------------------
// side sets
// ---------------------------------------------------------------------------

void ExodusFile::put_side_set_params(std::int32_t id, std::size_t num_sides,
                                     std::size_t num_dist_facts)
{
    open_impl("put_side_set_params").alloc.allocate_side_set(id, num_sides, num_dist_facts);
}

void ExodusFile::put_side_set(std::int32_t id, std::span<const int> elements,
                              std::span<const int> sides, int shift)
{
    auto& I = open_impl("put_side_set");
    write_side_set(I.c, I.alloc.side_set(id), elements, sides, shift);
}

void ExodusFile::put_side_set_name(std::int32_t id, std::string_view name)
{
    open_impl("put_side_set_name").alloc.put_side_set_name(id, name);
}

// ---------------------------------------------------------------------------
// variables
// ---------------------------------------------------------------------------

void ExodusFile::set_global_variable_number(std::size_t count)
{
    open_impl("set_global_variable_number").vars.declare(VarKind::Global, count);
}
void ExodusFile::put_global_variable_name(std::string_view name, int index)
{
    open_impl("put_global_variable_name").vars.put_name(VarKind::Global, name, index);
}
std::vector<std::string> ExodusFile::get_global_variable_names() const
{
    return open_impl("get_global_variable_names").vars.names(VarKind::Global);
}
void ExodusFile::put_global_variable_value(std::string_view name, int step, double value)
{
    open_impl("put_global_variable_value").vars.put_global_value(name, step, value);
}

void ExodusFile::set_element_variable_number(std::size_t count)
{
    open_impl("set_element_variable_number").vars.declare(VarKind::Element, count);
}
void ExodusFile::put_element_variable_name(std::string_view name, int index)
{
    open_impl("put_element_variable_name").vars.put_name(VarKind::Element, name, index);
}
std::vector<std::string> ExodusFile::get_element_variable_names() const
{
    return open_impl("get_element_variable_names").vars.names(VarKind::Element);
}
void ExodusFile::put_element_variable_values(std::int32_t block_id, std::string_view name,
                                             int step, std::span<const double> values)
{
    auto& I = open_impl("put_element_variable_values");
    schema::check_step(step);
    I.vars.put_element_values(I.alloc.block(block_id), name, step, values);
}

void ExodusFile::set_node_variable_number(std::size_t count)
{
    open_impl("set_node_variable_number").vars.declare(VarKind::Node, count);
}
void ExodusFile::put_node_variable_name(std::string_view name, int index)
{
    open_impl("put_node_variable_name").vars.put_name(VarKind::Node, name, index);
}
std::vector<std::string> ExodusFile::get_node_variable_names() const
{
    return open_impl("get_node_variable_names").vars.names(VarKind::Node);
}
void ExodusFile::put_node_variable_values(std::string_view name, int step,
                                          std::span<const double> values)
{
    open_impl("put_node_variable_values").vars.put_node_values(name, step, values);
}

} // namespace exodus::writer
