#define CATCH_CONFIG_MAIN

#include <string>
#include <fstream>
#include <stdexcept>

#include <boost/filesystem.hpp>

#include <catch2/catch.hpp>

#include <cg++/config.hpp>

namespace {

std::string write_config(const std::string& name, const std::string& contents)
{
    const boost::filesystem::path path = boost::filesystem::temp_directory_path() / ("cg++-" + name + ".toml");
    std::ofstream ofs(path.string(), std::ios::out | std::ios::trunc);
    ofs << contents;
    return path.string();
}

}

TEST_CASE( "full config", "[config]" ) {
    const std::string path = write_config("full",
        "[log]\n"
        "level = \"debug\"\n"
        "[store]\n"
        "path = \"wallet.cgstore\"\n"
        "[chain]\n"
        "query_height = 1234\n"
    );

    const cg::config config = cg::load_config(path);
    REQUIRE( config.log_level == spdlog::level::debug );
    REQUIRE( config.store_path == "wallet.cgstore" );
    REQUIRE( config.query_height == 1234 );

    boost::filesystem::remove(path);
}

TEST_CASE( "optional tables fall back to defaults", "[config]" ) {
    const std::string path = write_config("minimal",
        "[store]\n"
        "path = \"w.cgstore\"\n"
    );

    const cg::config config = cg::load_config(path);
    REQUIRE( config.log_level == spdlog::level::info );
    REQUIRE( config.store_path == "w.cgstore" );
    REQUIRE( config.query_height == 0 );

    boost::filesystem::remove(path);
}

TEST_CASE( "bad configs throw", "[config]" ) {
    const std::string no_store = write_config("no-store", "[log]\nlevel = \"info\"\n");
    REQUIRE_THROWS( cg::load_config(no_store) );
    boost::filesystem::remove(no_store);

    const std::string bad_level = write_config("bad-level", "[log]\nlevel = \"loud\"\n[store]\npath = \"x\"\n");
    REQUIRE_THROWS_AS( cg::load_config(bad_level), std::runtime_error );
    boost::filesystem::remove(bad_level);

    REQUIRE_THROWS( cg::load_config("/nonexistent/cg++.toml") );
}
