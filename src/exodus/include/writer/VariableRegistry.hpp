#pragma once
#include "container/Container.hpp"
#include "writer/EntityAllocator.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file VariableRegistry.hpp
 * @brief Global, element and node variable catalogs and their per-step value arrays.
 *
 * @details
 * @rst
 * Each catalog is declared once with a fixed count. Declaration creates the name array
 * (``count x len_name``) and, depending on the kind, the value storage:
 *
 * ========= ============================ ==================================================
 * kind      created at declaration       value arrays
 * ========= ============================ ==================================================
 * Global    ``name_glo_var``             ``vals_glo_var`` (time_step x count), one array
 * Node      ``name_nod_var``             ``vals_nod_var{i}`` (time_step x num_nodes) each
 * Element   ``name_elem_var``            ``vals_elem_var{i}eb{slot}`` on first write only
 * ========= ============================ ==================================================
 *
 * Element value arrays are resolved through a get-or-create map keyed by
 * ``(variable index, block slot)``.
 * @endrst
 */

namespace exodus::writer
{

enum class VarKind
{
    Global = 0,
    Element = 1,
    Node = 2
};

const char* var_kind_name(VarKind k) noexcept;

class VariableRegistry
{
  public:
    VariableRegistry(container::Container& c, container::DType real_type,
                     container::VariableOptions var_opts, std::size_t num_nodes);

    // count == 0 leaves the catalog undeclared; a second declaration throws ValidationError.
    void declare(VarKind kind, std::size_t count);
    bool declared(VarKind kind) const noexcept { return catalog(kind).declared; }
    std::size_t count(VarKind kind) const noexcept { return catalog(kind).count; }

    void put_name(VarKind kind, std::string_view name, int index);
    std::vector<std::string> names(VarKind kind) const;
    // 1-based slot of the first exact match; throws NotFoundError.
    int index_of(VarKind kind, std::string_view name) const;

    void put_global_value(std::string_view name, int step, double value);
    void put_node_values(std::string_view name, int step, std::span<const double> values);
    void put_element_values(const BlockInfo& block, std::string_view name, int step,
                            std::span<const double> values);

    const std::string& element_array(int var_index, const BlockInfo& block);

  private:
    struct Catalog
    {
        bool declared = false;
        std::size_t count = 0;
    };
    const Catalog& catalog(VarKind k) const noexcept { return catalogs_[std::size_t(k)]; }
    Catalog& catalog(VarKind k) noexcept { return catalogs_[std::size_t(k)]; }
    void require_declared(VarKind kind) const;

    container::Container& c_;
    container::DType real_;
    container::VariableOptions var_opts_;
    std::size_t num_nodes_ = 0;

    std::array<Catalog, 3> catalogs_{};
    std::map<std::pair<int, int>, std::string> element_arrays_;
};

} // namespace exodus::writer
