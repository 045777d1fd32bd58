#include "schema/Schema.hpp"
#include "Errors.hpp"

namespace exodus::schema
{

std::string coord_var(int axis)
{
    static const char kAxes[] = {'x', 'y', 'z'};
    if (axis < 0 || axis > 2)
        throw ValidationError("[schema] coordinate axis " + std::to_string(axis) +
                              " outside 0..2");
    return std::string("coord") + kAxes[axis];
}

std::string num_el_in_blk(int slot)
{
    return "num_el_in_blk" + std::to_string(slot);
}

std::string num_nod_per_el(int slot)
{
    return "num_nod_per_el" + std::to_string(slot);
}

std::string connect(int slot)
{
    return "connect" + std::to_string(slot);
}

std::string num_side_ss(int slot)
{
    return "num_side_ss" + std::to_string(slot);
}

std::string elem_ss(int slot)
{
    return "elem_ss" + std::to_string(slot);
}

std::string side_ss(int slot)
{
    return "side_ss" + std::to_string(slot);
}

std::string vals_nod_var(int var_index)
{
    return "vals_nod_var" + std::to_string(var_index);
}

std::string vals_elem_var(int var_index, int block_slot)
{
    return "vals_elem_var" + std::to_string(var_index) + "eb" + std::to_string(block_slot);
}

void check_step(int step)
{
    if (step < 1)
        throw ValidationError("[schema] time step must be >= 1, got " + std::to_string(step));
    if (std::size_t(step) > kTimeSteps)
        throw ValidationError("[schema] time step " + std::to_string(step) +
                              " exceeds the time axis capacity " + std::to_string(kTimeSteps));
}

} // namespace exodus::schema
