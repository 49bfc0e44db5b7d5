/*
 * Relief Error Handling Tests
 */

#include <catch2/catch_test_macros.hpp>
#include "relief/error.h"
#include "relief/log.h"
#include "relief/validate.h"
#include <cstring>
#include <thread>
#include <string>
#include <vector>

/* ============================================================================
 * Basic Error Operations
 * ============================================================================ */

TEST_CASE("Error set and get", "[error][basic]") {
    relief_clear_error();

    SECTION("Initial state has no error") {
        REQUIRE_FALSE(relief_has_error());
        REQUIRE(strlen(relief_get_last_error()) == 0);
    }

    SECTION("Set formatted error") {
        relief_set_error("tile (%d, %d): %s", 2, 1, "out of range");
        REQUIRE(relief_has_error());
        REQUIRE(strcmp(relief_get_last_error(), "tile (2, 1): out of range") == 0);
    }

    SECTION("Clear error") {
        relief_set_error("An error occurred");
        relief_clear_error();
        REQUIRE_FALSE(relief_has_error());
    }

    SECTION("Overwrite existing error") {
        relief_set_error("First error");
        relief_set_error("Second error");
        REQUIRE(strcmp(relief_get_last_error(), "Second error") == 0);
    }

    SECTION("NULL format clears the buffer") {
        relief_set_error("Something");
        relief_set_error(nullptr);
        REQUIRE_FALSE(relief_has_error());
    }

    relief_clear_error();
}

TEST_CASE("Long errors are truncated", "[error][edge]") {
    std::string long_text(4000, 'x');
    relief_set_error("%s", long_text.c_str());

    REQUIRE(relief_has_error());
    std::string message = relief_get_last_error();
    REQUIRE(message.size() == RELIEF_ERROR_MAX - 1);
    REQUIRE(message.compare(message.size() - 3, 3, "...") == 0);
    REQUIRE(message.compare(0, 10, "xxxxxxxxxx") == 0);

    // A message that fits exactly is not marked
    std::string fitting(RELIEF_ERROR_MAX - 1, 'y');
    relief_set_error("%s", fitting.c_str());
    REQUIRE(std::string(relief_get_last_error()) == fitting);

    relief_clear_error();
}

TEST_CASE("Error buffer is thread-local", "[error][thread]") {
    relief_set_error("main thread");

    bool other_saw_error = true;
    std::thread worker([&]() {
        other_saw_error = relief_has_error();
        relief_set_error("worker thread");
    });
    worker.join();

    REQUIRE_FALSE(other_saw_error);
    REQUIRE(strcmp(relief_get_last_error(), "main thread") == 0);

    relief_clear_error();
}

namespace {

struct ReportedError {
    std::string subsystem;
    std::string message;
};

void capture_error(Relief_LogLevel level, const char *subsystem, const char *message, void *userdata) {
    if (level != RELIEF_LOG_LEVEL_ERROR) return;
    auto *reports = static_cast<std::vector<ReportedError> *>(userdata);
    reports->push_back({subsystem, message});
}

} // namespace

TEST_CASE("Log and clear error", "[error]") {
    std::vector<ReportedError> reports;
    relief_log_set_console_output(false);
    uint32_t handle = relief_log_add_callback(capture_error, &reports);

    SECTION("pending error is logged under the given subsystem") {
        relief_set_error("config: octaves must be in 1..16");
        REQUIRE(relief_log_and_clear_error(RELIEF_LOG_CONFIG));
        REQUIRE_FALSE(relief_has_error());
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].subsystem == RELIEF_LOG_CONFIG);
        REQUIRE(reports[0].message == "config: octaves must be in 1..16");
    }

    SECTION("NULL subsystem falls back to core") {
        relief_set_error("reported once");
        REQUIRE(relief_log_and_clear_error(nullptr));
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].subsystem == RELIEF_LOG_CORE);
    }

    SECTION("nothing pending is a no-op") {
        relief_clear_error();
        REQUIRE_FALSE(relief_log_and_clear_error(RELIEF_LOG_TERRAIN));
        REQUIRE(reports.empty());
    }

    relief_log_remove_callback(handle);
    relief_log_set_console_output(true);
    relief_clear_error();
}

/* ============================================================================
 * Validation Macros
 * ============================================================================ */

static int validated_ptr(const int *p) {
    RELIEF_VALIDATE_PTR_RET(p, -1);
    return *p;
}

static int validated_range(int v) {
    RELIEF_VALIDATE_RANGE_RET(v, 1, 64, -1);
    return v;
}

static bool validated_string(const char *s) {
    RELIEF_VALIDATE_STRING_RET(s, false);
    return true;
}

TEST_CASE("Validation macros", "[error][validate]") {
    relief_clear_error();

    SECTION("null pointer") {
        REQUIRE(validated_ptr(nullptr) == -1);
        REQUIRE(strstr(relief_get_last_error(), "null pointer") != nullptr);
    }

    SECTION("valid pointer leaves error untouched") {
        int value = 7;
        REQUIRE(validated_ptr(&value) == 7);
        REQUIRE_FALSE(relief_has_error());
    }

    SECTION("range") {
        REQUIRE(validated_range(64) == 64);
        REQUIRE(validated_range(65) == -1);
        REQUIRE(strstr(relief_get_last_error(), "out of range") != nullptr);
    }

    SECTION("string") {
        REQUIRE_FALSE(validated_string(""));
        REQUIRE_FALSE(validated_string(nullptr));
        REQUIRE(validated_string("simplex"));
    }

    relief_clear_error();
}
