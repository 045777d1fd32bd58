#pragma once
#include <algorithm>
#include <cstddef>

/**
 * @file ChunkPlan.hpp
 * @brief Row-range plan that bounds the staging memory of a transformed bulk write.
 *
 * @details
 * A 2-D array of `rows x row_width` elements is split into consecutive row ranges of at most
 * `rows_per_chunk` rows, where `rows_per_chunk = budget / (row_width * elem_size)` (at least one
 * row). Writers copy one range at a time into a staging buffer, transform it and write it, so the
 * extra memory never exceeds :cpp:func:`ChunkPlan::staging_bytes`.
 *
 * The plan holds only the split parameters; row ranges are computed on demand, so its size does
 * not depend on the array.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   ChunkPlan P = build_chunk_plan(num_elems, nodes_per_elem, sizeof(int), 128u << 20);
 *   for (std::size_t first = 0; first < P.rows; first += P.rows_per_chunk) {
 *     const RowChunk r = P.chunk_at(first); // stage rows [r.first, r.first + r.count)
 *     // ...
 *   }
 * @endrst
 */

namespace exodus::io
{

struct RowChunk
{
    std::size_t first = 0;
    std::size_t count = 0;
};

struct ChunkPlan
{
    std::size_t rows = 0;
    std::size_t row_width = 0;
    std::size_t elem_size = 0;
    std::size_t rows_per_chunk = 0;

    std::size_t staging_bytes() const noexcept { return rows_per_chunk * row_width * elem_size; }
    std::size_t num_chunks() const noexcept
    {
        return rows_per_chunk ? (rows + rows_per_chunk - 1) / rows_per_chunk : 0;
    }
    // Range starting at row `first`; the last range may be short.
    RowChunk chunk_at(std::size_t first) const noexcept
    {
        return RowChunk{first, std::min(rows_per_chunk, rows - first)};
    }
};

ChunkPlan build_chunk_plan(std::size_t rows, std::size_t row_width, std::size_t elem_size,
                           std::size_t budget_bytes);

} // namespace exodus::io
