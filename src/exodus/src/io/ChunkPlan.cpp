#include "io/ChunkPlan.hpp"
#include <algorithm>

namespace exodus::io
{

ChunkPlan build_chunk_plan(std::size_t rows, std::size_t row_width, std::size_t elem_size,
                           std::size_t budget_bytes)
{
    ChunkPlan plan;
    plan.rows = rows;
    plan.row_width = row_width;
    plan.elem_size = elem_size;

    const std::size_t row_bytes = row_width * elem_size;
    plan.rows_per_chunk = row_bytes ? std::max<std::size_t>(1, budget_bytes / row_bytes) : rows;
    plan.rows_per_chunk = std::min(plan.rows_per_chunk, rows);
    return plan;
}

} // namespace exodus::io
