#include "writer/VariableRegistry.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "schema/FixedString.hpp"
#include "schema/Schema.hpp"

#include <algorithm>

namespace exodus::writer
{
using container::DType;

namespace
{
struct CatalogNames
{
    const char* count_dim;
    const char* name_var;
};

CatalogNames names_of(VarKind k) noexcept
{
    switch (k)
    {
    case VarKind::Global:
        return {schema::dim::kNumGloVar, schema::var::kNameGloVar};
    case VarKind::Element:
        return {schema::dim::kNumElemVar, schema::var::kNameElemVar};
    case VarKind::Node:
        return {schema::dim::kNumNodVar, schema::var::kNameNodVar};
    }
    return {"", ""};
}
} // namespace

const char* var_kind_name(VarKind k) noexcept
{
    switch (k)
    {
    case VarKind::Global:
        return "global";
    case VarKind::Element:
        return "element";
    case VarKind::Node:
        return "node";
    }
    return "?";
}

VariableRegistry::VariableRegistry(container::Container& c, DType real_type,
                                   container::VariableOptions var_opts, std::size_t num_nodes)
    : c_(c), real_(real_type), var_opts_(var_opts), num_nodes_(num_nodes)
{
}

void VariableRegistry::declare(VarKind kind, std::size_t count)
{
    if (count == 0)
        return;
    auto& cat = catalog(kind);
    if (cat.declared)
        throw ValidationError(std::string("[exodus.vars] ") + var_kind_name(kind) +
                              " variables were already declared (" + std::to_string(cat.count) +
                              ")");

    const auto nm = names_of(kind);
    c_.declare_dimension(nm.count_dim, count);
    c_.create_variable(nm.name_var, {nm.count_dim, schema::dim::kLenName}, DType::Char,
                       var_opts_);

    if (kind == VarKind::Global)
    {
        c_.create_variable(schema::var::kValsGloVar, {schema::dim::kTimeStep, nm.count_dim},
                           real_, var_opts_);
    }
    else if (kind == VarKind::Node)
    {
        for (std::size_t i = 0; i < count; ++i)
            c_.create_variable(schema::vals_nod_var(int(i) + 1),
                               {schema::dim::kTimeStep, schema::dim::kNumNodes}, real_,
                               var_opts_);
    }

    cat.declared = true;
    cat.count = count;
    LOGD("[exodus.vars] declared %zu %s variables\n", count, var_kind_name(kind));
}

void VariableRegistry::require_declared(VarKind kind) const
{
    if (!declared(kind))
        throw ValidationError(std::string("[exodus.vars] no ") + var_kind_name(kind) +
                              " variables declared");
}

void VariableRegistry::put_name(VarKind kind, std::string_view name, int index)
{
    require_declared(kind);
    if (index < 1 || std::size_t(index) > count(kind))
        throw ValidationError(std::string("[exodus.vars] ") + var_kind_name(kind) +
                              " variable index " + std::to_string(index) + " outside 1.." +
                              std::to_string(count(kind)));
    // Encoding zero-fills the whole slot before the name bytes land in it.
    const auto text = schema::FixedString::encode(name, schema::kLenName);
    c_.write_slab<char>(names_of(kind).name_var, {std::size_t(index - 1), 0}, {1, text.width()},
                        text.bytes());
}

std::vector<std::string> VariableRegistry::names(VarKind kind) const
{
    if (!declared(kind))
        return {};
    const auto raw = c_.read<char>(names_of(kind).name_var);
    return schema::decode_rows(raw, schema::kLenName);
}

int VariableRegistry::index_of(VarKind kind, std::string_view name) const
{
    const auto all = names(kind);
    auto it = std::find(all.begin(), all.end(), name);
    if (it == all.end())
        throw NotFoundError(std::string("[exodus.vars] ") + var_kind_name(kind) + " variable '" +
                            std::string(name) + "' does not exist");
    return int(it - all.begin()) + 1;
}

void VariableRegistry::put_global_value(std::string_view name, int step, double value)
{
    schema::check_step(step);
    const int idx = index_of(VarKind::Global, name);
    c_.write_slab<double>(schema::var::kValsGloVar, {std::size_t(step - 1), std::size_t(idx - 1)},
                          {1, 1}, std::span<const double>(&value, 1));
}

void VariableRegistry::put_node_values(std::string_view name, int step,
                                       std::span<const double> values)
{
    schema::check_step(step);
    const int idx = index_of(VarKind::Node, name);
    if (values.size() != num_nodes_)
        throw ValidationError("[exodus.vars] node variable '" + std::string(name) + "' needs " +
                              std::to_string(num_nodes_) + " values, got " +
                              std::to_string(values.size()));
    c_.write_slab<double>(schema::vals_nod_var(idx), {std::size_t(step - 1), 0}, {1, num_nodes_},
                          values);
}

void VariableRegistry::put_element_values(const BlockInfo& block, std::string_view name,
                                          int step, std::span<const double> values)
{
    schema::check_step(step);
    const int idx = index_of(VarKind::Element, name);
    if (values.size() != block.num_elems)
        throw ValidationError("[exodus.vars] element variable '" + std::string(name) +
                              "' on block " + std::to_string(block.id) + " needs " +
                              std::to_string(block.num_elems) + " values, got " +
                              std::to_string(values.size()));
    const std::string& arr = element_array(idx, block);
    c_.write_slab<double>(arr, {std::size_t(step - 1), 0}, {1, block.num_elems}, values);
}

const std::string& VariableRegistry::element_array(int var_index, const BlockInfo& block)
{
    const auto key = std::make_pair(var_index, block.slot);
    auto it = element_arrays_.find(key);
    if (it != element_arrays_.end())
        return it->second;

    std::string name = schema::vals_elem_var(var_index, block.slot);
    c_.create_variable(name, {schema::dim::kTimeStep, schema::num_el_in_blk(block.slot)}, real_,
                       var_opts_);
    LOGD("[exodus.vars] created %s\n", name.c_str());
    return element_arrays_.emplace(key, std::move(name)).first->second;
}

} // namespace exodus::writer
