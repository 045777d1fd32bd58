#include "schema/SlotTable.hpp"
#include "Errors.hpp"
#include "container/Container.hpp"
#include "schema/Schema.hpp"

#include <utility>

namespace exodus::schema
{

SlotTable::SlotTable(std::size_t capacity, std::string status_var, std::string prop_var)
    : ids_(capacity, kUnassignedId), status_var_(std::move(status_var)),
      prop_var_(std::move(prop_var))
{
    for (std::size_t i = 0; i < capacity; ++i)
        free_.insert(int(i) + 1);
}

std::optional<int> SlotTable::first_free() const noexcept
{
    if (free_.empty())
        return std::nullopt;
    return *free_.begin();
}

std::optional<int> SlotTable::find(std::int32_t external_id) const noexcept
{
    auto it = slot_of_.find(external_id);
    if (it == slot_of_.end())
        return std::nullopt;
    return it->second;
}

void SlotTable::claim(int slot, std::int32_t external_id)
{
    if (free_.erase(slot) == 0)
        throw Error("[schema] " + prop_var_ + " slot " + std::to_string(slot) + " is not free");
    ids_[std::size_t(slot - 1)] = external_id;
    slot_of_.emplace(external_id, slot);
}

void SlotTable::store(container::Container& c, int slot) const
{
    const std::size_t i = std::size_t(slot - 1);
    const std::int32_t st = free_.count(slot) ? 0 : 1;
    c.write_slab<std::int32_t>(status_var_, {i}, {1}, std::span<const std::int32_t>(&st, 1));
    c.write_slab<std::int32_t>(prop_var_, {i}, {1}, std::span<const std::int32_t>(&ids_[i], 1));
}

} // namespace exodus::schema
