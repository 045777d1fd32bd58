#pragma once
#include <cstddef>
#include <optional>
#include <string>

/**
 * @file CreateOptions.hpp
 * @brief Creation parameters of an Exodus file (sizes, precision, storage policy).
 *
 * @details
 * Sizes are fixed for the file's lifetime. `io_size` selects the floating-point word size of every
 * real-valued variable (0 = machine precision, 4 = float32, 8 = float64); values are converted on
 * write. `compression`, when set, stores every variable chunked and deflated.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   CreateOptions opt;
 *   opt.title     = "cube";
 *   opt.num_dims  = 3;
 *   opt.num_nodes = 8;
 *   opt.num_elems = 1;
 *   opt.num_blocks = 1;
 *   opt.compression = CreateOptions::Compression{"gzip", 2};
 * @endrst
 */

namespace exodus::writer
{

struct CreateOptions
{
    enum class Mode
    {
        Read,
        Write,
        Append
    };
    Mode mode = Mode::Write; // only Write (create new) is supported

    std::string title;
    int num_dims = 3;
    std::size_t num_nodes = 0;
    std::size_t num_elems = 0;
    std::size_t num_blocks = 0;
    std::size_t num_node_sets = 0; // must be 0
    std::size_t num_side_sets = 0; // 0 = file has no side-set arrays

    int io_size = 0; // 0 | 4 | 8

    struct Compression
    {
        std::string method = "gzip";
        int level = 2;
    };
    std::optional<Compression> compression;

    // Staging budget of shifted connectivity writes when the caller passes none.
    std::size_t connectivity_chunk_bytes = std::size_t(128) << 20;
};

} // namespace exodus::writer
