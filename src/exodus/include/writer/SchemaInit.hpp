#pragma once
#include "container/Container.hpp"
#include "writer/CreateOptions.hpp"

#include <string>

/**
 * @file SchemaInit.hpp
 * @brief Validation of creation parameters and the fixed part of every Exodus file.
 *
 * @details
 * :cpp:func:`validate_create_options` runs before anything touches the disk.
 * :cpp:func:`initialize_schema` then writes the file attributes, the fixed and sized dimensions
 * and the variables every Exodus file carries (coordinates, block / side-set name, status and
 * property arrays, the time axis). Property arrays start at `kUnassignedId` and status arrays at
 * zero, so claimed slots are distinguishable from an id that happens to be 0.
 */

namespace exodus::writer
{

// Throws ValidationError for an existing path, a non-Write mode, num_dims outside {2,3},
// nonzero node sets, io_size outside {0,4,8} or an unsupported compression request.
void validate_create_options(const std::string& path, const CreateOptions& opts);

// Word size chosen for io_size (0 = machine precision).
int resolve_word_size(int io_size) noexcept;
container::DType real_type(int word_size) noexcept;
container::VariableOptions variable_options(const CreateOptions& opts) noexcept;

void initialize_schema(container::Container& c, const CreateOptions& opts, int word_size);

} // namespace exodus::writer
