/*
 * Relief Logging Tests
 */

#include <catch2/catch_test_macros.hpp>
#include "relief/log.h"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace {

struct CapturedLine {
    Relief_LogLevel level;
    std::string subsystem;
    std::string message;
};

void capture_line(Relief_LogLevel level, const char *subsystem, const char *message, void *userdata) {
    auto *lines = static_cast<std::vector<CapturedLine> *>(userdata);
    lines->push_back({level, subsystem, message});
}

std::string read_file(const char *path) {
    std::string contents;
    FILE *f = fopen(path, "r");
    if (!f) return contents;
    char buf[512];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        contents.append(buf, n);
    }
    fclose(f);
    return contents;
}

} // namespace

TEST_CASE("Log callbacks", "[log]") {
    std::vector<CapturedLine> lines;
    relief_log_set_console_output(false);
    relief_log_set_level(RELIEF_LOG_LEVEL_INFO);

    uint32_t handle = relief_log_add_callback(capture_line, &lines);
    REQUIRE(handle != 0);

    SECTION("messages reach the callback with their subsystem tag") {
        relief_log_info(RELIEF_LOG_TERRAIN, "Built %d tiles", 9);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].level == RELIEF_LOG_LEVEL_INFO);
        REQUIRE(lines[0].message == "Built 9 tiles");
        REQUIRE(lines[0].subsystem == RELIEF_LOG_TERRAIN);
    }

    SECTION("missing subsystem is reported as core") {
        relief_log_warning(nullptr, "untagged");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].subsystem == RELIEF_LOG_CORE);
    }

    SECTION("level filter drops verbose messages") {
        relief_log_debug(RELIEF_LOG_NOISE, "hidden");
        REQUIRE(lines.empty());

        relief_log_set_level(RELIEF_LOG_LEVEL_DEBUG);
        REQUIRE(relief_log_enabled(RELIEF_LOG_LEVEL_DEBUG));
        relief_log_debug(RELIEF_LOG_NOISE, "shown");
        REQUIRE(lines.size() == 1);
    }

    SECTION("errors pass any level") {
        relief_log_set_level(RELIEF_LOG_LEVEL_ERROR);
        REQUIRE(relief_log_enabled(RELIEF_LOG_LEVEL_ERROR));
        REQUIRE_FALSE(relief_log_enabled(RELIEF_LOG_LEVEL_WARNING));
        relief_log_warning(RELIEF_LOG_CONFIG, "dropped");
        relief_log_error(RELIEF_LOG_CONFIG, "kept");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].message == "kept");
    }

    SECTION("removed callback is silent") {
        relief_log_remove_callback(handle);
        relief_log_info(RELIEF_LOG_CORE, "nobody listens");
        REQUIRE(lines.empty());
    }

    relief_log_remove_callback(handle);
    relief_log_set_level(RELIEF_LOG_LEVEL_INFO);
    relief_log_set_console_output(true);
}

TEST_CASE("Log callback rejects null", "[log]") {
    REQUIRE(relief_log_add_callback(nullptr, nullptr) == 0);
    relief_log_remove_callback(0);
}

TEST_CASE("Log level names", "[log]") {
    REQUIRE(std::string(relief_log_level_name(RELIEF_LOG_LEVEL_WARNING)) == "WARN");
    REQUIRE(std::string(relief_log_level_name((Relief_LogLevel)9)) == "UNKNOWN");

    Relief_LogLevel level = RELIEF_LOG_LEVEL_INFO;
    REQUIRE(relief_log_level_parse("debug", &level));
    REQUIRE(level == RELIEF_LOG_LEVEL_DEBUG);
    REQUIRE(relief_log_level_parse("Warning", &level));
    REQUIRE(level == RELIEF_LOG_LEVEL_WARNING);
    REQUIRE(relief_log_level_parse("ERROR", &level));
    REQUIRE(level == RELIEF_LOG_LEVEL_ERROR);

    REQUIRE_FALSE(relief_log_level_parse("verbose", &level));
    REQUIRE(level == RELIEF_LOG_LEVEL_ERROR);
    REQUIRE_FALSE(relief_log_level_parse(nullptr, &level));
}

TEST_CASE("Out-of-range level is ignored", "[log]") {
    relief_log_set_level(RELIEF_LOG_LEVEL_WARNING);
    relief_log_set_level((Relief_LogLevel)7);
    REQUIRE(relief_log_get_level() == RELIEF_LOG_LEVEL_WARNING);
    relief_log_set_level(RELIEF_LOG_LEVEL_INFO);
}

TEST_CASE("Log file output", "[log]") {
    const char *path = "relief_test_log.txt";
    std::remove(path);
    relief_log_set_console_output(false);

    REQUIRE_FALSE(relief_log_is_initialized());
    REQUIRE(relief_log_get_path() == nullptr);

    REQUIRE(relief_log_init_with_path(path));
    REQUIRE(relief_log_is_initialized());
    REQUIRE(strcmp(relief_log_get_path(), path) == 0);

    // Second init is a no-op
    REQUIRE(relief_log_init_with_path("ignored.txt"));
    REQUIRE(strcmp(relief_log_get_path(), path) == 0);

    relief_log_warning(RELIEF_LOG_MATERIAL, "thresholds out of order");
    relief_log_shutdown();
    REQUIRE_FALSE(relief_log_is_initialized());

    std::string contents = read_file(path);
    REQUIRE(contents.find("INFO  Core: Relief ") != std::string::npos);
    REQUIRE(contents.find("] WARN  Material: thresholds out of order\n") != std::string::npos);
    REQUIRE(contents.find("INFO  Core: log closed") != std::string::npos);
    REQUIRE(relief_log_get_path() == nullptr);

    std::remove(path);
    relief_log_set_console_output(true);
}
