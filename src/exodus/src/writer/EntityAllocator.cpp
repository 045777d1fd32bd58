#include "writer/EntityAllocator.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "schema/FixedString.hpp"
#include "schema/Schema.hpp"

namespace exodus::writer
{
using container::DType;

static void check_external_id(std::int32_t id, const char* what)
{
    if (id == schema::kUnassignedId)
        throw ValidationError(std::string("[exodus.alloc] ") + what + " id " +
                              std::to_string(id) + " is reserved for unclaimed slots");
}

static void write_name(container::Container& c, const char* var, int slot, std::string_view name)
{
    const auto text = schema::FixedString::encode(name, schema::kLenName);
    c.write_slab<char>(var, {std::size_t(slot - 1), 0}, {1, text.width()}, text.bytes());
}

EntityAllocator::EntityAllocator(container::Container& c, std::size_t num_elems,
                                 std::size_t num_blocks, std::size_t num_side_sets,
                                 container::VariableOptions var_opts)
    : c_(c), num_elems_(num_elems), var_opts_(var_opts),
      blocks_(num_blocks, schema::var::kEbStatus, schema::var::kEbProp1),
      side_sets_(num_side_sets, schema::var::kSsStatus, schema::var::kSsProp1)
{
}

const BlockInfo& EntityAllocator::allocate_block(std::int32_t id, std::string_view elem_type,
                                                 std::size_t num_elems,
                                                 std::size_t nodes_per_elem,
                                                 std::size_t attrs_per_elem)
{
    if (num_elems > num_elems_)
        throw ValidationError("[exodus.alloc] block " + std::to_string(id) + " has " +
                              std::to_string(num_elems) + " elements, the file only " +
                              std::to_string(num_elems_));
    if (attrs_per_elem != 0)
        throw ValidationError("[exodus.alloc] element attributes are not supported; "
                              "attrs_per_elem must be 0");
    check_external_id(id, "block");
    if (blocks_.contains(id))
        throw ValidationError("[exodus.alloc] block id " + std::to_string(id) +
                              " already exists");

    const auto next = blocks_.first_free();
    if (!next)
        throw CapacityExhausted("[exodus.alloc] maximum number of blocks (" +
                                std::to_string(blocks_.capacity()) + ") reached");

    // The slot is claimed once the container calls succeed; a failure leaves it free.
    const int slot = *next;
    const std::string n_el = schema::num_el_in_blk(slot);
    const std::string n_nod = schema::num_nod_per_el(slot);
    const std::string conn = schema::connect(slot);

    c_.declare_dimension(n_el, num_elems);
    c_.declare_dimension(n_nod, nodes_per_elem);
    c_.create_variable(conn, {n_el, n_nod}, DType::Int32, var_opts_);
    c_.set_attribute(conn, schema::attr::kElemType, elem_type);

    blocks_.claim(slot, id);
    blocks_.store(c_, slot);

    LOGD("[exodus.alloc] block id=%d -> slot %d (%s, %zu x %zu)\n", (int) id, slot,
         std::string(elem_type).c_str(), num_elems, nodes_per_elem);

    BlockInfo info;
    info.id = id;
    info.slot = slot;
    info.elem_type = std::string(elem_type);
    info.num_elems = num_elems;
    info.nodes_per_elem = nodes_per_elem;
    return block_info_.emplace(id, std::move(info)).first->second;
}

const SideSetInfo& EntityAllocator::allocate_side_set(std::int32_t id, std::size_t num_sides,
                                                      std::size_t num_dist_facts)
{
    if (num_dist_facts != 0)
        throw ValidationError("[exodus.alloc] distribution factors are not supported; "
                              "num_dist_facts must be 0");
    check_external_id(id, "side set");
    if (side_sets_.contains(id))
        throw ValidationError("[exodus.alloc] side set id " + std::to_string(id) +
                              " already exists");
    const auto next = side_sets_.first_free();
    if (!next)
        throw CapacityExhausted("[exodus.alloc] maximum number of side sets (" +
                                std::to_string(side_sets_.capacity()) + ") reached");

    const int slot = *next;
    const std::string n_side = schema::num_side_ss(slot);

    c_.declare_dimension(n_side, num_sides);
    c_.create_variable(schema::elem_ss(slot), {n_side}, DType::Int32, var_opts_);
    c_.create_variable(schema::side_ss(slot), {n_side}, DType::Int32, var_opts_);

    side_sets_.claim(slot, id);
    side_sets_.store(c_, slot);

    LOGD("[exodus.alloc] side set id=%d -> slot %d (%zu sides)\n", (int) id, slot, num_sides);

    SideSetInfo info;
    info.id = id;
    info.slot = slot;
    info.num_sides = num_sides;
    return side_set_info_.emplace(id, info).first->second;
}

const BlockInfo& EntityAllocator::block(std::int32_t id) const
{
    auto it = block_info_.find(id);
    if (it == block_info_.end())
        throw NotFoundError("[exodus.alloc] block id " + std::to_string(id) + " does not exist");
    return it->second;
}

const SideSetInfo& EntityAllocator::side_set(std::int32_t id) const
{
    auto it = side_set_info_.find(id);
    if (it == side_set_info_.end())
        throw NotFoundError("[exodus.alloc] side set id " + std::to_string(id) +
                            " does not exist");
    return it->second;
}

void EntityAllocator::put_block_name(std::int32_t id, std::string_view name)
{
    write_name(c_, schema::var::kEbNames, block(id).slot, name);
}

void EntityAllocator::put_side_set_name(std::int32_t id, std::string_view name)
{
    write_name(c_, schema::var::kSsNames, side_set(id).slot, name);
}

} // namespace exodus::writer
