#pragma once
#include "container/Container.hpp"
#include "writer/EntityAllocator.hpp"

#include <cstddef>
#include <span>

/**
 * @file BulkWriter.hpp
 * @brief Connectivity and side-set index writes with an optional index shift.
 *
 * @details
 * @rst
 * Connectivity arrays can be large. Two paths are used:
 *
 * - ``shift == 0``: the caller's buffer goes to the container in a single write; no copy.
 * - ``shift != 0``: rows are staged through a reused buffer sized by
 *   :cpp:func:`exodus::io::build_chunk_plan`, shifted and written one row range at a time, so
 *   the extra memory stays near ``chunk_bytes`` however large the block is.
 *
 * Side-set arrays are short and always go in one write (shifted into a copy when needed).
 * Shifted values are computed in 64 bits and must fit int32 again.
 * @endrst
 */

namespace exodus::writer
{

void write_connectivity(container::Container& c, const BlockInfo& block,
                        std::span<const int> conn, int shift, std::size_t chunk_bytes);

void write_side_set(container::Container& c, const SideSetInfo& ss,
                    std::span<const int> elements, std::span<const int> sides, int shift);

} // namespace exodus::writer
