#pragma once
#include "Errors.hpp"
#include "writer/CreateOptions.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @file   ConfigYAML.hpp
 * @brief  YAML -> CreateOptions loader.
 *
 * @details
 * @rst
 * Creation parameters of an Exodus file can be kept next to the mesh that produces them.
 *
 * **Schema**
 *
 * .. code-block:: yaml
 *
 *    file:
 *      title: "cube"              # stored as the 'title' attribute
 *      mode: w                    # w | r | a (only w is accepted at creation)
 *      num_dims: 3                # 2 | 3
 *      num_nodes: 8
 *      num_elems: 1
 *      num_blocks: 1
 *      num_node_sets: 0           # must be 0
 *      num_side_sets: 0
 *
 *    io:
 *      io_size: 0                 # 0 (machine) | 4 | 8
 *      compression:               # omit, or 'none', for contiguous storage
 *        method: gzip
 *        level: 2
 *      connectivity_chunk_mb: 128 # staging budget of shifted connectivity writes
 *
 * Keys that are absent keep the :cpp:struct:`exodus::writer::CreateOptions` defaults. Values
 * are not range-checked here; :cpp:func:`exodus::writer::validate_create_options` does that when
 * the file is created.
 * @endrst
 */

namespace exodus::io
{

static inline std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = (char) std::tolower((unsigned char) c);
    return s;
}

static inline writer::CreateOptions::Mode parse_mode(const std::string& s)
{
    auto v = to_lower(s);
    if (v == "r" || v == "read")
        return writer::CreateOptions::Mode::Read;
    if (v == "a" || v == "append")
        return writer::CreateOptions::Mode::Append;
    if (v == "w" || v == "write")
        return writer::CreateOptions::Mode::Write;
    throw ValidationError("[config] unknown file mode '" + s + "' (expected w, r or a)");
}

inline writer::CreateOptions load_create_options_from_yaml(const std::string& path)
{
    writer::CreateOptions opt;
    YAML::Node root = YAML::LoadFile(path);

    if (auto f = root["file"])
    {
        if (auto n = f["title"])
            opt.title = n.as<std::string>();
        if (auto n = f["mode"])
            opt.mode = parse_mode(n.as<std::string>());
        if (auto n = f["num_dims"])
            opt.num_dims = n.as<int>();
        if (auto n = f["num_nodes"])
            opt.num_nodes = n.as<std::size_t>();
        if (auto n = f["num_elems"])
            opt.num_elems = n.as<std::size_t>();
        if (auto n = f["num_blocks"])
            opt.num_blocks = n.as<std::size_t>();
        if (auto n = f["num_node_sets"])
            opt.num_node_sets = n.as<std::size_t>();
        if (auto n = f["num_side_sets"])
            opt.num_side_sets = n.as<std::size_t>();
    }

    if (auto I = root["io"])
    {
        if (auto n = I["io_size"])
            opt.io_size = n.as<int>();
        if (auto C = I["compression"])
        {
            if (C.IsScalar())
            {
                // 'none' / 'off' disables; any other scalar names the method at default level
                const auto v = to_lower(C.as<std::string>());
                if (v != "none" && v != "off")
                    opt.compression = writer::CreateOptions::Compression{v, 2};
            }
            else if (C.IsMap())
            {
                writer::CreateOptions::Compression z;
                if (auto n = C["method"])
                    z.method = to_lower(n.as<std::string>());
                if (auto n = C["level"])
                    z.level = n.as<int>();
                opt.compression = z;
            }
        }
        if (auto n = I["connectivity_chunk_mb"])
            opt.connectivity_chunk_bytes = n.as<std::size_t>() << 20;
    }

    return opt;
}

} // namespace exodus::io
