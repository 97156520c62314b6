/**
 * @file test_config.cpp
 * @brief Unit tests for the INI configuration loader.
 */

#include <catch2/catch_test_macros.hpp>

#include "nodeflow/core/config.hpp"

#include <raylib.h>

#include <filesystem>
#include <fstream>

using namespace nodeflow::core;

TEST_CASE("Config: defaults", "[core][config]") {
    Config config;

    REQUIRE(config.window().width == 800);
    REQUIRE(config.window().height == 450);
    REQUIRE(config.window().title == "nodeflow");
    REQUIRE(config.engine().fixed_fps == 60);
    REQUIRE(config.logging().enabled);
    REQUIRE(config.logging().level == LOG_INFO);
    REQUIRE(config.logging().file.empty());
    REQUIRE_FALSE(config.debug().draw_shapes);
    REQUIRE(config.physics().warn_missing_shape);
    REQUIRE(config.loaded_from_path().empty());
}

TEST_CASE("Config: sections, comments and quotes", "[core][config]") {
    Config config;
    config.load_from_string(
        "# sandbox settings\n"
        "[window]\n"
        "width = 1024 ; inline comment\n"
        "title = \"Node Flow\"\n"
        "vsync = yes\n"
        "\n"
        "[Engine]\n"
        "fixed_fps = 30\n"
        "[logging]\n"
        "level = warn\n"
        "file = 'nodeflow.log'\n"
        "collision_debug = on\n"
        "[debug]\n"
        "draw_shapes = true\n"
        "[physics]\n"
        "warn_missing_shape = 0\n");

    REQUIRE(config.window().width == 1024);
    REQUIRE(config.window().height == 450);
    REQUIRE(config.window().title == "Node Flow");
    REQUIRE(config.window().vsync);
    REQUIRE(config.engine().fixed_fps == 30);
    REQUIRE(config.logging().level == LOG_WARNING);
    REQUIRE(config.logging().file == "nodeflow.log");
    REQUIRE(config.logging().collision_debug);
    REQUIRE(config.debug().draw_shapes);
    REQUIRE_FALSE(config.physics().warn_missing_shape);
}

TEST_CASE("Config: bad input keeps defaults", "[core][config]") {
    Config config;
    config.load_from_string(
        "[window]\n"
        "width = wide\n"
        "height = 600px\n"
        "target_fps = 99999999999999\n"
        "vsync = maybe\n"
        "no equals sign here\n"
        "= orphan value\n"
        "[unknown]\n"
        "width = 10\n"
        "[logging]\n"
        "level = chatty\n"
        "colour = red\n");

    REQUIRE(config.window().width == 800);
    REQUIRE(config.window().height == 450);
    REQUIRE(config.window().target_fps == 60);
    REQUIRE_FALSE(config.window().vsync);
    REQUIRE(config.logging().level == LOG_INFO);
}

TEST_CASE("Config: numeric log levels are accepted", "[core][config]") {
    Config config;
    config.load_from_string("[logging]\nlevel = 2\n");
    REQUIRE(config.logging().level == LOG_DEBUG);
}

TEST_CASE("Config: file loading", "[core][config]") {
    namespace fs = std::filesystem;

    Config config;

    SECTION("missing file") {
        REQUIRE_FALSE(config.load_from_file("definitely/not/here.conf"));
        REQUIRE(config.loaded_from_path().empty());
    }

    SECTION("existing file") {
        const fs::path path = fs::temp_directory_path() / "nodeflow_test_config.conf";
        {
            std::ofstream out(path);
            out << "[engine]\nfixed_fps = 120\n";
        }

        REQUIRE(config.load_from_file(path.string()));
        REQUIRE(config.engine().fixed_fps == 120);
        REQUIRE(config.loaded_from_path() == path.string());

        fs::remove(path);
    }
}

TEST_CASE("Config: per-subsystem log levels", "[core][config]") {
    Config config;
    config.load_from_string(
        "[logging]\n"
        "level = warning\n"
        "level.physics = debug\n"
        "Level.Input = \"error\"\n"
        "level.scene = loud\n"
        "level. = info\n");

    const auto& levels = config.logging().subsystem_levels;
    REQUIRE(config.logging().level == LOG_WARNING);
    REQUIRE(levels.size() == 2);
    REQUIRE(levels.at("physics") == LOG_DEBUG);
    REQUIRE(levels.at("input") == LOG_ERROR);
    REQUIRE(levels.find("scene") == levels.end());
}
