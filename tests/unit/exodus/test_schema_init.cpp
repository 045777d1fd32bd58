#include "Errors.hpp"
#include "h5_readback.hpp"
#include "writer/ExodusFile.hpp"
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace exodus;
using namespace exodus::writer;
using Catch::Approx;

static CreateOptions cube_opts()
{
    CreateOptions o;
    o.title = "cube";
    o.num_dims = 3;
    o.num_nodes = 8;
    o.num_elems = 1;
    o.num_blocks = 2;
    o.num_side_sets = 1;
    o.io_size = 8;
    return o;
}

TEST_CASE("New file carries the fixed Exodus schema", "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_3d");
    {
        ExodusFile f(path, cube_opts());
        REQUIRE(f.is_open());
        REQUIRE(f.num_dims() == 3);
        REQUIRE(f.num_nodes() == 8);
        REQUIRE(f.float_word_size() == 8);
        REQUIRE(f.time_steps() == 1);
        f.close();
    }

    h5rb::File h(path);

    // file attributes
    REQUIRE(h.attr<float>("", "api_version", H5T_NATIVE_FLOAT)[0] == Approx(6.3f));
    REQUIRE(h.attr<float>("", "version", H5T_NATIVE_FLOAT)[0] == Approx(6.3f));
    REQUIRE(h.attr<int>("", "floating_point_word_size", H5T_NATIVE_INT)[0] == 8);
    REQUIRE(h.attr<int>("", "file_size", H5T_NATIVE_INT)[0] == 1);
    REQUIRE(h.attr<int>("", "maximum_name_length", H5T_NATIVE_INT)[0] == 32);
    REQUIRE(h.attr<int>("", "int64_status", H5T_NATIVE_INT)[0] == 0);
    REQUIRE(h.text_attr("", "title") == "cube");

    // fixed and sized dimensions
    REQUIRE(h.shape("len_string") == std::vector<hsize_t>{33});
    REQUIRE(h.shape("len_line") == std::vector<hsize_t>{81});
    REQUIRE(h.shape("four") == std::vector<hsize_t>{4});
    REQUIRE(h.shape("len_name") == std::vector<hsize_t>{33});
    REQUIRE(h.shape("time_step") == std::vector<hsize_t>{1});
    REQUIRE(h.shape("num_dim") == std::vector<hsize_t>{3});
    REQUIRE(h.shape("num_el_blk") == std::vector<hsize_t>{2});
    REQUIRE(h.shape("num_side_sets") == std::vector<hsize_t>{1});

    // variables
    REQUIRE(h.shape("coor_names") == std::vector<hsize_t>{3, 33});
    for (const char* v : {"coordx", "coordy", "coordz"})
    {
        REQUIRE(h.shape(v) == std::vector<hsize_t>{8});
        REQUIRE(h.type_size(v) == 8);
    }
    REQUIRE(h.ints("eb_prop1") == std::vector<int>{-1, -1});
    REQUIRE(h.ints("eb_status") == std::vector<int>{0, 0});
    REQUIRE(h.text_attr("eb_prop1", "name") == "ID");
    REQUIRE(h.ints("ss_prop1") == std::vector<int>{-1});
    REQUIRE(h.shape("eb_names") == std::vector<hsize_t>{2, 33});
    REQUIRE(h.shape("time_whole") == std::vector<hsize_t>{1});
}

TEST_CASE("2-D file has no z coordinate and no side-set arrays when none are declared",
          "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_2d");
    auto o = cube_opts();
    o.num_dims = 2;
    o.num_side_sets = 0;
    o.io_size = 4;
    {
        ExodusFile f(path, o);
        REQUIRE(f.float_word_size() == 4);
    }

    h5rb::File h(path);
    REQUIRE(h.has("coordx"));
    REQUIRE(h.has("coordy"));
    REQUIRE_FALSE(h.has("coordz"));
    REQUIRE(h.type_size("coordx") == 4);
    REQUIRE_FALSE(h.has("num_side_sets"));
    REQUIRE_FALSE(h.has("ss_prop1"));
    REQUIRE(h.attr<int>("", "floating_point_word_size", H5T_NATIVE_INT)[0] == 4);
}

TEST_CASE("io_size 0 selects machine precision", "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_io0");
    auto o = cube_opts();
    o.io_size = 0;
    ExodusFile f(path, o);
    REQUIRE(f.float_word_size() == (sizeof(void*) == 8 ? 8 : 4));
}

TEST_CASE("Creation parameters are validated before the file is touched", "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_invalid");

    SECTION("num_dims outside {2,3}")
    {
        auto o = cube_opts();
        o.num_dims = 1;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
        o.num_dims = 4;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
    }
    SECTION("node sets")
    {
        auto o = cube_opts();
        o.num_node_sets = 1;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
    }
    SECTION("mode other than write")
    {
        auto o = cube_opts();
        o.mode = CreateOptions::Mode::Append;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
        o.mode = CreateOptions::Mode::Read;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
    }
    SECTION("io_size")
    {
        auto o = cube_opts();
        o.io_size = 2;
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
    }
    SECTION("compression")
    {
        auto o = cube_opts();
        o.compression = CreateOptions::Compression{"szip", 2};
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
        o.compression = CreateOptions::Compression{"gzip", 0};
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
        o.compression = CreateOptions::Compression{"gzip", 10};
        REQUIRE_THROWS_AS(ExodusFile(path, o), ValidationError);
    }

    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("Existing path is never overwritten", "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_exists");
    {
        std::ofstream out(path);
        out << "keep me";
    }
    REQUIRE_THROWS_AS(ExodusFile(path, cube_opts()), ValidationError);

    std::ifstream in(path);
    std::string body;
    std::getline(in, body);
    REQUIRE(body == "keep me");
}

TEST_CASE("Compression stores variables chunked and deflated", "[exodus][schema]")
{
    const auto path = h5rb::temp_exo("schema_gzip");
    auto o = cube_opts();
    o.compression = CreateOptions::Compression{"gzip", 4};
    {
        ExodusFile f(path, o);
        const std::vector<double> x{0, 1, 1, 0, 0, 1, 1, 0};
        const std::vector<double> y{0, 0, 1, 1, 0, 0, 1, 1};
        const std::vector<double> z{0, 0, 0, 0, 1, 1, 1, 1};
        f.put_coords(x, y, z);
    }

    h5rb::File h(path);
    REQUIRE(h.is_chunked("coordx"));
    REQUIRE(h.is_chunked("eb_prop1"));
    REQUIRE(h.doubles("coordz") == std::vector<double>{0, 0, 0, 0, 1, 1, 1, 1});
}
