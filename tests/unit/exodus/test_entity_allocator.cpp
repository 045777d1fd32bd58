#include "Errors.hpp"
#include "container/Container.hpp"
#include "h5_readback.hpp"
#include "writer/EntityAllocator.hpp"
#include "writer/ExodusFile.hpp"
#include "writer/SchemaInit.hpp"
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using namespace exodus;
using namespace exodus::writer;

static CreateOptions quad_opts(std::size_t blocks, std::size_t side_sets)
{
    CreateOptions o;
    o.num_dims = 2;
    o.num_nodes = 4;
    o.num_elems = 1;
    o.num_blocks = blocks;
    o.num_side_sets = side_sets;
    return o;
}

TEST_CASE("Single quad block lands in slot 1 under its external id", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_quad");
    {
        ExodusFile f(path, quad_opts(1, 0));
        f.put_elem_blk_info(100, "QUAD4", 1, 4, 0);
        const std::vector<int> conn{1, 2, 3, 4};
        f.put_elem_connectivity(100, conn);
        f.put_elem_blk_name(100, "fluid");
    }

    h5rb::File h(path);
    REQUIRE(h.shape("connect1") == std::vector<hsize_t>{1, 4});
    REQUIRE(h.ints("connect1") == std::vector<int>{1, 2, 3, 4});
    REQUIRE(h.text_attr("connect1", "elem_type") == "QUAD4");
    REQUIRE(h.ints("eb_prop1") == std::vector<int>{100});
    REQUIRE(h.ints("eb_status") == std::vector<int>{1});
    REQUIRE(h.shape("num_el_in_blk1") == std::vector<hsize_t>{1});
    REQUIRE(h.shape("num_nod_per_el1") == std::vector<hsize_t>{4});
    REQUIRE(h.text_row("eb_names", 0) == "fluid");
}

TEST_CASE("Tetrahedral block in a 3-D file", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_tetra");
    {
        CreateOptions o;
        o.num_dims = 3;
        o.num_nodes = 4;
        o.num_elems = 1;
        o.num_blocks = 1;
        ExodusFile f(path, o);
        f.put_elem_blk_info(100, "TETRA", 1, 4, 0);
        const std::vector<int> conn{1, 2, 3, 4};
        f.put_elem_connectivity(100, conn);
    }

    h5rb::File h(path);
    REQUIRE(h.shape("connect1") == std::vector<hsize_t>{1, 4});
    REQUIRE(h.ints("connect1") == std::vector<int>{1, 2, 3, 4});
    REQUIRE(h.text_attr("connect1", "elem_type") == "TETRA");
    REQUIRE(h.ints("eb_prop1") == std::vector<int>{100});
    REQUIRE(h.ints("eb_status") == std::vector<int>{1});
    REQUIRE(h.has("coordz"));
}

TEST_CASE("Blocks take slots in order and exhaust the catalog", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_slots");
    {
        ExodusFile f(path, quad_opts(3, 0));
        f.put_elem_blk_info(7, "QUAD4", 1, 4, 0);
        f.put_elem_blk_info(0, "QUAD4", 0, 4, 0);
        f.put_elem_blk_info(42, "TRI3", 1, 3, 0);
        REQUIRE_THROWS_AS(f.put_elem_blk_info(43, "TRI3", 1, 3, 0), CapacityExhausted);
    }

    h5rb::File h(path);
    REQUIRE(h.ints("eb_prop1") == std::vector<int>{7, 0, 42});
    REQUIRE(h.ints("eb_status") == std::vector<int>{1, 1, 1});
    REQUIRE(h.has("connect3"));
    REQUIRE_FALSE(h.has("connect4"));
}

TEST_CASE("Unclaimed block slots keep the unassigned id", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_partial");
    {
        ExodusFile f(path, quad_opts(3, 0));
        f.put_elem_blk_info(0, "QUAD4", 1, 4, 0);
    }

    h5rb::File h(path);
    REQUIRE(h.ints("eb_prop1") == std::vector<int>{0, -1, -1});
    REQUIRE(h.ints("eb_status") == std::vector<int>{1, 0, 0});
}

TEST_CASE("Block allocation preconditions", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_block_errors");
    ExodusFile f(path, quad_opts(2, 0));

    REQUIRE_THROWS_AS(f.put_elem_blk_info(1, "QUAD4", 2, 4, 0), ValidationError);
    REQUIRE_THROWS_AS(f.put_elem_blk_info(1, "QUAD4", 1, 4, 1), ValidationError);
    REQUIRE_THROWS_AS(f.put_elem_blk_info(-1, "QUAD4", 1, 4, 0), ValidationError);

    f.put_elem_blk_info(1, "QUAD4", 1, 4, 0);
    REQUIRE_THROWS_AS(f.put_elem_blk_info(1, "QUAD4", 1, 4, 0), ValidationError);

    // failed attempts claimed nothing
    f.put_elem_blk_info(2, "QUAD4", 1, 4, 0);
    REQUIRE_THROWS_AS(f.put_elem_blk_info(3, "QUAD4", 1, 4, 0), CapacityExhausted);
}

TEST_CASE("A block whose definitions fail leaves its slot unclaimed", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_block_failed");
    const auto opts = quad_opts(1, 0);
    container::Container c(path);
    initialize_schema(c, opts, 8);
    // occupy the name the first block's element-count dimension needs
    c.declare_dimension("num_el_in_blk1", 1);

    EntityAllocator alloc(c, opts.num_elems, opts.num_blocks, opts.num_side_sets, {});
    REQUIRE_THROWS_AS(alloc.allocate_block(7, "QUAD4", 1, 4, 0), ContainerError);
    REQUIRE_THROWS_AS(alloc.block(7), NotFoundError);

    REQUIRE(c.read<std::int32_t>("eb_status") == std::vector<std::int32_t>{0});
    REQUIRE(c.read<std::int32_t>("eb_prop1") == std::vector<std::int32_t>{-1});
    c.close();
}

TEST_CASE("Unknown block ids are reported as missing", "[exodus][alloc]")
{
    const auto path = h5rb::temp_exo("alloc_block_missing");
    ExodusFile f(path, quad_opts(1, 0));
    const std::vector<int> conn{1, 2, 3, 4};
    REQUIRE_THROWS_AS(f.put_elem_connectivity(5, conn), NotFoundError);
    REQUIRE_THROWS_AS(f.put_elem_blk_name(5, "x"), NotFoundError);
}

TEST_CASE("Side sets: slots, duplicate ids and capacity", "[exodus][alloc][sideset]")
{
    const auto path = h5rb::temp_exo("alloc_sidesets");
    {
        ExodusFile f(path, quad_opts(1, 2));
        f.put_side_set_params(10, 2, 0);

        // a repeated id is a validation error even while slots remain
        REQUIRE_THROWS_AS(f.put_side_set_params(10, 1, 0), ValidationError);
        REQUIRE_THROWS_AS(f.put_side_set_params(11, 1, 3), ValidationError);
        REQUIRE_THROWS_AS(f.put_side_set_params(-1, 1, 0), ValidationError);

        f.put_side_set_params(20, 1, 0);
        REQUIRE_THROWS_AS(f.put_side_set_params(30, 1, 0), CapacityExhausted);
        REQUIRE_THROWS_AS(f.put_side_set_params(20, 1, 0), ValidationError);

        const std::vector<int> elems{1, 1}, sides{1, 2};
        f.put_side_set(10, elems, sides);
        const std::vector<int> e2{0}, s2{3};
        f.put_side_set(20, e2, s2, 1);
        f.put_side_set_name(20, "outlet");

        REQUIRE_THROWS_AS(f.put_side_set(99, e2, s2), NotFoundError);
        REQUIRE_THROWS_AS(f.put_side_set(10, e2, s2), ValidationError);
    }

    h5rb::File h(path);
    REQUIRE(h.ints("ss_prop1") == std::vector<int>{10, 20});
    REQUIRE(h.ints("ss_status") == std::vector<int>{1, 1});
    REQUIRE(h.ints("elem_ss1") == std::vector<int>{1, 1});
    REQUIRE(h.ints("side_ss1") == std::vector<int>{1, 2});
    REQUIRE(h.ints("elem_ss2") == std::vector<int>{1});
    REQUIRE(h.ints("side_ss2") == std::vector<int>{4});
    REQUIRE(h.shape("num_side_ss1") == std::vector<hsize_t>{2});
    REQUIRE(h.text_row("ss_names", 1) == "outlet");
}

TEST_CASE("A file declared without side sets rejects every side set", "[exodus][alloc][sideset]")
{
    const auto path = h5rb::temp_exo("alloc_no_sidesets");
    ExodusFile f(path, quad_opts(1, 0));
    REQUIRE_THROWS_AS(f.put_side_set_params(1, 1, 0), CapacityExhausted);
}
