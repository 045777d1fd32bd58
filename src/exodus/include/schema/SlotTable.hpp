#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace exodus::container
{
class Container;
}

/**
 * @file SlotTable.hpp
 * @brief In-memory tracker of claimed entity slots, serialized to status / property arrays.
 *
 * @details
 * Each Exodus entity catalog (element blocks, side sets) has a fixed number of slots. A slot is
 * free until :cpp:func:`SlotTable::claim` assigns it an external id; callers take slots
 * smallest-free first (:cpp:func:`SlotTable::first_free`), 1-based, and claim one only once the
 * entity's own definitions are in the file. The table never reads the file: after a claim,
 * :cpp:func:`SlotTable::store` writes the two entries that changed (`status[slot-1] = 1` and
 * `prop[slot-1] = id`).
 */

namespace exodus::schema
{

class SlotTable
{
  public:
    SlotTable() = default;
    SlotTable(std::size_t capacity, std::string status_var, std::string prop_var);

    std::size_t capacity() const noexcept { return ids_.size(); }

    // Smallest free slot, or nullopt when every slot is claimed.
    std::optional<int> first_free() const noexcept;
    std::optional<int> find(std::int32_t external_id) const noexcept;
    bool contains(std::int32_t external_id) const noexcept { return find(external_id).has_value(); }

    // Assigns free `slot` to `external_id`; throws Error when the slot is not free.
    void claim(int slot, std::int32_t external_id);

    // Writes the status / property entries of `slot` to their arrays.
    void store(container::Container& c, int slot) const;

  private:
    std::vector<std::int32_t> ids_; // kUnassignedId where free
    std::set<int> free_;            // 1-based
    std::unordered_map<std::int32_t, int> slot_of_;
    std::string status_var_, prop_var_;
};

} // namespace exodus::schema
