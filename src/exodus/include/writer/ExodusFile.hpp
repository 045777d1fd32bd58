#pragma once
#include "writer/CreateOptions.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file ExodusFile.hpp
 * @brief Write-only Exodus II file: mesh, blocks, side sets and single-step variables.
 *
 * @details
 * Construction validates :cpp:struct:`CreateOptions`, creates the file exclusively and writes the
 * fixed schema. Blocks and side sets are then registered by external id; variables are declared
 * per catalog, named, and written for step 1 (the file holds exactly one time step).
 *
 * The object owns the file handle. It is movable, not copyable; :cpp:func:`close` is idempotent
 * and the destructor closes a file left open. Any operation on a closed file throws
 * ValidationError, and so does every call on a moved-from object except `is_open` and `close`.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   CreateOptions opt;
 *   opt.num_dims = 2; opt.num_nodes = 4; opt.num_elems = 1; opt.num_blocks = 1;
 *   ExodusFile f("quad.exo", opt);
 *   f.put_coords(xs, ys);
 *   f.put_elem_blk_info(100, "QUAD4", 1, 4, 0);
 *   f.put_elem_connectivity(100, conn);
 *   f.set_global_variable_number(1);
 *   f.put_global_variable_name("energy", 1);
 *   f.put_global_variable_value("energy", 1, 3.5);
 *   f.close();
 * @endrst
 */

namespace exodus::writer
{

class ExodusFile
{
  public:
    ExodusFile(const std::string& path, const CreateOptions& opts);
    ~ExodusFile();

    ExodusFile(const ExodusFile&) = delete;
    ExodusFile& operator=(const ExodusFile&) = delete;
    ExodusFile(ExodusFile&&) noexcept;
    ExodusFile& operator=(ExodusFile&&) noexcept;

    void close() noexcept;
    bool is_open() const noexcept;

    // ---- file properties (readable after close; ValidationError on a moved-from object) ----
    const std::string& path() const;
    int num_dims() const;
    std::size_t num_nodes() const;
    std::size_t num_elems() const;
    std::size_t num_blocks() const;
    std::size_t num_side_sets() const;
    int float_word_size() const;
    std::size_t time_steps() const noexcept;

    // ---- mesh ----
    void put_info_records(const std::vector<std::string>& lines);
    void put_coord_names(const std::vector<std::string>& names);
    // z must be empty for a 2-D file.
    void put_coords(std::span<const double> x, std::span<const double> y,
                    std::span<const double> z = {});
    void put_time(int step, double value);

    // ---- element blocks ----
    void put_elem_blk_info(std::int32_t id, std::string_view elem_type, std::size_t num_elems,
                           std::size_t nodes_per_elem, std::size_t attrs_per_elem);
    void put_elem_blk_name(std::int32_t id, std::string_view name);
    // Row-major num_elems x nodes_per_elem; `shift` is added to every entry before it is stored.
    void put_elem_connectivity(std::int32_t id, std::span<const int> conn, int shift = 0,
                               std::optional<std::size_t> chunk_bytes = std::nullopt);

    // ---- side sets ----
    void put_side_set_params(std::int32_t id, std::size_t num_sides, std::size_t num_dist_facts);
    void put_side_set(std::int32_t id, std::span<const int> elements, std::span<const int> sides,
                      int shift = 0);
    void put_side_set_name(std::int32_t id, std::string_view name);

    // ---- global variables ----
    void set_global_variable_number(std::size_t count);
    void put_global_variable_name(std::string_view name, int index);
    std::vector<std::string> get_global_variable_names() const;
    void put_global_variable_value(std::string_view name, int step, double value);

    // ---- element variables ----
    void set_element_variable_number(std::size_t count);
    void put_element_variable_name(std::string_view name, int index);
    std::vector<std::string> get_element_variable_names() const;
    void put_element_variable_values(std::int32_t block_id, std::string_view name, int step,
                                     std::span<const double> values);

    // ---- node variables ----
    void set_node_variable_number(std::size_t count);
    void put_node_variable_name(std::string_view name, int index);
    std::vector<std::string> get_node_variable_names() const;
    void put_node_variable_values(std::string_view name, int step, std::span<const double> values);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    Impl& open_impl(const char* op);
    const Impl& open_impl(const char* op) const;
    const Impl& state(const char* op) const;
};

} // namespace exodus::writer
