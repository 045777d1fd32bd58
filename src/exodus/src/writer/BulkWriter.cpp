#include "writer/BulkWriter.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "io/ChunkPlan.hpp"
#include "schema/Schema.hpp"

#include <cstdint>
#include <limits>
#include <vector>

namespace exodus::writer
{

static std::int32_t shifted(int v, int shift, const char* what)
{
    const std::int64_t s = std::int64_t(v) + std::int64_t(shift);
    if (s < std::numeric_limits<std::int32_t>::min() ||
        s > std::numeric_limits<std::int32_t>::max())
        throw ValidationError(std::string("[exodus.bulk] shifted ") + what + " index " +
                              std::to_string(s) + " does not fit in 32 bits");
    return std::int32_t(s);
}

static void shift_into(std::span<const int> src, int shift, const char* what,
                       std::vector<std::int32_t>& dst)
{
    dst.resize(src.size());
    for (std::size_t i = 0; i < src.size(); ++i)
        dst[i] = shifted(src[i], shift, what);
}

void write_connectivity(container::Container& c, const BlockInfo& block,
                        std::span<const int> conn, int shift, std::size_t chunk_bytes)
{
    const std::size_t width = block.nodes_per_elem;
    const std::size_t expected = block.num_elems * width;
    if (conn.size() != expected)
        throw ValidationError("[exodus.bulk] block " + std::to_string(block.id) +
                              " connectivity needs " + std::to_string(block.num_elems) + " x " +
                              std::to_string(width) + " = " + std::to_string(expected) +
                              " entries, got " + std::to_string(conn.size()));

    const std::string var = schema::connect(block.slot);
    if (shift == 0)
    {
        c.write<std::int32_t>(var, conn);
        LOGD("[exodus.bulk] %s: %zu entries in one write\n", var.c_str(), conn.size());
        return;
    }

    const io::ChunkPlan P =
        io::build_chunk_plan(block.num_elems, width, sizeof(std::int32_t), chunk_bytes);
    std::vector<std::int32_t> staging;
    staging.reserve(P.rows_per_chunk * width);

    for (std::size_t first = 0; first < P.rows; first += P.rows_per_chunk)
    {
        const io::RowChunk r = P.chunk_at(first);
        shift_into(conn.subspan(r.first * width, r.count * width), shift, "connectivity",
                   staging);
        c.write_slab<std::int32_t>(var, {r.first, 0}, {r.count, width}, staging);
    }

    LOGD("[exodus.bulk] %s: %zu rows in %zu chunks of <= %zu rows (shift %d, staging %zu B)\n",
         var.c_str(), P.rows, P.num_chunks(), P.rows_per_chunk, shift, P.staging_bytes());
}

void write_side_set(container::Container& c, const SideSetInfo& ss,
                    std::span<const int> elements, std::span<const int> sides, int shift)
{
    if (elements.size() != ss.num_sides || sides.size() != ss.num_sides)
        throw ValidationError("[exodus.bulk] side set " + std::to_string(ss.id) + " needs " +
                              std::to_string(ss.num_sides) + " elements and sides, got " +
                              std::to_string(elements.size()) + " and " +
                              std::to_string(sides.size()));

    const std::string elem_var = schema::elem_ss(ss.slot);
    const std::string side_var = schema::side_ss(ss.slot);
    if (shift == 0)
    {
        c.write<std::int32_t>(elem_var, elements);
        c.write<std::int32_t>(side_var, sides);
    }
    else
    {
        std::vector<std::int32_t> buf;
        shift_into(elements, shift, "side-set element", buf);
        c.write<std::int32_t>(elem_var, buf);
        shift_into(sides, shift, "side-set side", buf);
        c.write<std::int32_t>(side_var, buf);
    }

    LOGD("[exodus.bulk] side set id=%d slot %d: %zu sides\n", (int) ss.id, ss.slot, ss.num_sides);
}

} // namespace exodus::writer
