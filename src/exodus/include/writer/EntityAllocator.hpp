#pragma once
#include "container/Container.hpp"
#include "schema/SlotTable.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

/**
 * @file EntityAllocator.hpp
 * @brief Slot assignment for element blocks and side sets.
 *
 * @details
 * Blocks and side sets are addressed by a caller-chosen external id but stored under a 1-based
 * slot index (`connect{slot}`, `elem_ss{slot}`, ...). Allocation claims the smallest free slot,
 * declares the entity's dimensions, creates its arrays and serializes the claim into the
 * `*_status` / `*_prop1` arrays.
 *
 * External ids must be unique within a catalog for blocks and side sets alike; a repeated id is a
 * :cpp:class:`ValidationError`, a full catalog a :cpp:class:`CapacityExhausted`.
 */

namespace exodus::writer
{

struct BlockInfo
{
    std::int32_t id = 0;
    int slot = 0;
    std::string elem_type;
    std::size_t num_elems = 0;
    std::size_t nodes_per_elem = 0;
};

struct SideSetInfo
{
    std::int32_t id = 0;
    int slot = 0;
    std::size_t num_sides = 0;
};

class EntityAllocator
{
  public:
    EntityAllocator(container::Container& c, std::size_t num_elems, std::size_t num_blocks,
                    std::size_t num_side_sets, container::VariableOptions var_opts);

    const BlockInfo& allocate_block(std::int32_t id, std::string_view elem_type,
                                    std::size_t num_elems, std::size_t nodes_per_elem,
                                    std::size_t attrs_per_elem);
    const SideSetInfo& allocate_side_set(std::int32_t id, std::size_t num_sides,
                                         std::size_t num_dist_facts);

    // Throw NotFoundError for unknown ids.
    const BlockInfo& block(std::int32_t id) const;
    const SideSetInfo& side_set(std::int32_t id) const;

    void put_block_name(std::int32_t id, std::string_view name);
    void put_side_set_name(std::int32_t id, std::string_view name);

  private:
    container::Container& c_;
    std::size_t num_elems_ = 0;
    container::VariableOptions var_opts_;

    schema::SlotTable blocks_;
    schema::SlotTable side_sets_;
    std::map<std::int32_t, BlockInfo> block_info_;
    std::map<std::int32_t, SideSetInfo> side_set_info_;
};

} // namespace exodus::writer
