/*
 * Relief Falloff Mask Tests
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "relief/falloff.h"
#include "relief/error.h"

TEST_CASE("Falloff curve", "[falloff]") {
    SECTION("endpoints") {
        REQUIRE(relief_falloff_evaluate(0.0f) == 0.0f);
        REQUIRE(relief_falloff_evaluate(1.0f) == Catch::Approx(1.0f));
    }

    SECTION("input is clamped to [0, 1]") {
        REQUIRE(relief_falloff_evaluate(-3.0f) == relief_falloff_evaluate(0.0f));
        REQUIRE(relief_falloff_evaluate(4.0f) == relief_falloff_evaluate(1.0f));
    }

    SECTION("monotonic non-decreasing") {
        float prev = relief_falloff_evaluate(0.0f);
        for (int i = 1; i <= 100; i++) {
            float v = relief_falloff_evaluate((float)i / 100.0f);
            REQUIRE(v >= prev);
            prev = v;
        }
    }

    SECTION("flat interior, steep edge") {
        REQUIRE(relief_falloff_evaluate(0.3f) < 0.05f);
        REQUIRE(relief_falloff_evaluate(0.9f) > 0.9f);
    }
}

TEST_CASE("Falloff mask creation", "[falloff]") {
    SECTION("invalid size") {
        relief_clear_error();
        REQUIRE(relief_falloff_create(0) == nullptr);
        REQUIRE(relief_has_error());
        REQUIRE(relief_falloff_create(-4) == nullptr);
    }

    SECTION("single cell sits at the center") {
        Relief_FalloffMask *mask = relief_falloff_create(1);
        REQUIRE(mask != nullptr);
        REQUIRE(relief_falloff_size(mask) == 1);
        REQUIRE(relief_falloff_get(mask, 0, 0) == 0.0f);
        relief_falloff_destroy(mask);
    }

    SECTION("5x5 center and corners") {
        Relief_FalloffMask *mask = relief_falloff_create(5);
        REQUIRE(mask != nullptr);

        REQUIRE(relief_falloff_get(mask, 2, 2) == Catch::Approx(0.0f).margin(1e-6));
        REQUIRE(relief_falloff_get(mask, 0, 0) == Catch::Approx(1.0f));
        REQUIRE(relief_falloff_get(mask, 4, 4) == Catch::Approx(1.0f));
        REQUIRE(relief_falloff_get(mask, 0, 2) == Catch::Approx(1.0f));

        relief_falloff_destroy(mask);
    }

    SECTION("out of range reads are zero") {
        Relief_FalloffMask *mask = relief_falloff_create(4);
        REQUIRE(relief_falloff_get(mask, -1, 0) == 0.0f);
        REQUIRE(relief_falloff_get(mask, 0, 4) == 0.0f);
        REQUIRE(relief_falloff_get(nullptr, 0, 0) == 0.0f);
        relief_falloff_destroy(mask);
    }

    relief_falloff_destroy(nullptr);
    relief_clear_error();
}

TEST_CASE("Falloff mask symmetry", "[falloff]") {
    const int n = 17;
    Relief_FalloffMask *mask = relief_falloff_create(n);
    REQUIRE(mask != nullptr);

    const float *data = relief_falloff_data(mask);
    REQUIRE(data != nullptr);

    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            float v = relief_falloff_get(mask, i, j);
            REQUIRE(v == data[i * n + j]);
            REQUIRE(v >= 0.0f);
            REQUIRE(v <= 1.0f);

            // 8 symmetries of the square
            REQUIRE(relief_falloff_get(mask, j, i) == Catch::Approx(v).margin(1e-6));
            REQUIRE(relief_falloff_get(mask, n - 1 - i, j) == Catch::Approx(v).margin(1e-6));
            REQUIRE(relief_falloff_get(mask, i, n - 1 - j) == Catch::Approx(v).margin(1e-6));
            REQUIRE(relief_falloff_get(mask, n - 1 - j, n - 1 - i) == Catch::Approx(v).margin(1e-6));
        }
    }

    SECTION("monotonic moving away from the center") {
        int c = n / 2;
        for (int k = c; k < n - 1; k++) {
            REQUIRE(relief_falloff_get(mask, k + 1, c) >= relief_falloff_get(mask, k, c));
            REQUIRE(relief_falloff_get(mask, k + 1, k + 1) >= relief_falloff_get(mask, k, k));
        }
    }

    relief_falloff_destroy(mask);
}
