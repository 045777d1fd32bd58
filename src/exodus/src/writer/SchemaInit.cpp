#include "writer/SchemaInit.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "schema/Schema.hpp"

#include <filesystem>
#include <vector>

namespace exodus::writer
{
namespace fs = std::filesystem;
using container::DType;

void validate_create_options(const std::string& path, const CreateOptions& opts)
{
    if (fs::exists(path))
        throw ValidationError("[exodus.create] file '" + path + "' already exists");
    if (opts.mode != CreateOptions::Mode::Write)
        throw ValidationError("[exodus.create] only mode Write (create a new file) is supported");
    if (opts.num_dims != 2 && opts.num_dims != 3)
        throw ValidationError("[exodus.create] num_dims must be 2 or 3, got " +
                              std::to_string(opts.num_dims));
    if (opts.num_node_sets != 0)
        throw ValidationError("[exodus.create] node sets are not supported; num_node_sets must "
                              "be 0");
    if (opts.io_size != 0 && opts.io_size != 4 && opts.io_size != 8)
        throw ValidationError("[exodus.create] io_size must be 0, 4 or 8, got " +
                              std::to_string(opts.io_size));
    if (opts.compression)
    {
        if (opts.compression->method != "gzip")
            throw ValidationError("[exodus.create] unsupported compression method '" +
                                  opts.compression->method + "' (only gzip)");
        if (opts.compression->level < 1 || opts.compression->level > 9)
            throw ValidationError("[exodus.create] gzip level must be in 1..9, got " +
                                  std::to_string(opts.compression->level));
    }
}

int resolve_word_size(int io_size) noexcept
{
    if (io_size == 4 || io_size == 8)
        return io_size;
    return sizeof(void*) == 8 ? 8 : 4;
}

DType real_type(int word_size) noexcept
{
    return word_size == 4 ? DType::Float32 : DType::Float64;
}

container::VariableOptions variable_options(const CreateOptions& opts) noexcept
{
    container::VariableOptions v;
    if (opts.compression)
        v.deflate_level = opts.compression->level;
    return v;
}

static void write_file_attributes(container::Container& c, const CreateOptions& opts,
                                  int word_size)
{
    namespace A = schema::attr;
    const float api[] = {schema::kApiVersion};
    const float ver[] = {schema::kDbVersion};
    const std::int32_t ws[] = {word_size};
    const std::int32_t fsz[] = {schema::kFileSize};
    const std::int32_t maxn[] = {schema::kMaxNameLength};
    const std::int32_t i64[] = {schema::kInt64Status};

    c.set_attribute("", A::kApiVersion, std::span<const float>(api));
    c.set_attribute("", A::kVersion, std::span<const float>(ver));
    c.set_attribute("", A::kFloatWordSize, std::span<const std::int32_t>(ws));
    c.set_attribute("", A::kFileSize, std::span<const std::int32_t>(fsz));
    c.set_attribute("", A::kMaxNameLength, std::span<const std::int32_t>(maxn));
    c.set_attribute("", A::kInt64Status, std::span<const std::int32_t>(i64));
    c.set_attribute("", A::kTitle, std::string_view(opts.title));
}

// Name / status / property triple of an entity catalog.
static void create_entity_arrays(container::Container& c, const char* count_dim,
                                 const char* names, const char* status, const char* prop,
                                 std::size_t capacity, const container::VariableOptions& vo)
{
    c.create_variable(names, {count_dim, schema::dim::kLenName}, DType::Char, vo);

    c.create_variable(prop, {count_dim}, DType::Int32, vo);
    const std::vector<std::int32_t> unassigned(capacity, schema::kUnassignedId);
    c.write<std::int32_t>(prop, unassigned);
    const std::string id_tag = "ID";
    c.set_attribute(prop, schema::attr::kName, std::string_view(id_tag));

    c.create_variable(status, {count_dim}, DType::Int32, vo);
    const std::vector<std::int32_t> unclaimed(capacity, 0);
    c.write<std::int32_t>(status, unclaimed);
}

void initialize_schema(container::Container& c, const CreateOptions& opts, int word_size)
{
    namespace D = schema::dim;
    namespace V = schema::var;
    const auto vo = variable_options(opts);
    const DType real = real_type(word_size);

    write_file_attributes(c, opts, word_size);

    c.declare_dimension(D::kLenString, schema::kLenString);
    c.declare_dimension(D::kLenLine, schema::kLenLine);
    c.declare_dimension(D::kFour, schema::kFour);
    c.declare_dimension(D::kLenName, schema::kLenName);
    c.declare_dimension(D::kTimeStep, schema::kTimeSteps);

    c.declare_dimension(D::kNumDim, std::size_t(opts.num_dims));
    c.declare_dimension(D::kNumNodes, opts.num_nodes);
    c.declare_dimension(D::kNumElem, opts.num_elems);
    c.declare_dimension(D::kNumElBlk, opts.num_blocks);
    if (opts.num_side_sets > 0)
        c.declare_dimension(D::kNumSideSets, opts.num_side_sets);

    c.create_variable(V::kCoorNames, {D::kNumDim, D::kLenName}, DType::Char, vo);
    for (int axis = 0; axis < opts.num_dims; ++axis)
        c.create_variable(schema::coord_var(axis), {D::kNumNodes}, real, vo);

    create_entity_arrays(c, D::kNumElBlk, V::kEbNames, V::kEbStatus, V::kEbProp1,
                         opts.num_blocks, vo);
    if (opts.num_side_sets > 0)
        create_entity_arrays(c, D::kNumSideSets, V::kSsNames, V::kSsStatus, V::kSsProp1,
                             opts.num_side_sets, vo);

    c.create_variable(V::kTimeWhole, {D::kTimeStep}, real, vo);

    LOGD("[exodus.create] schema: dims=%d nodes=%zu elems=%zu blocks=%zu side_sets=%zu "
         "word_size=%d deflate=%d\n",
         opts.num_dims, opts.num_nodes, opts.num_elems, opts.num_blocks, opts.num_side_sets,
         word_size, vo.deflate_level);
}

} // namespace exodus::writer
