/*
 * Relief Terrain Tile Tests
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "relief/tile.h"
#include "relief/error.h"
#include "tile_internal.h"
#include <cstring>
#include <vector>

namespace {

struct TileFixture {
    Relief_GenerationConfig cfg = RELIEF_GENERATION_CONFIG_DEFAULT;
    Relief_Noise *noise = nullptr;
    Relief_HeightSampler *sampler = nullptr;

    TileFixture() {
        cfg.grid_extent = 3;
        cfg.tile_size = 64.0f;
        cfg.samples_per_tile = 9;
        cfg.octaves = 3;
        noise = relief_noise_create(2024);
        sampler = relief_sampler_create(noise, &cfg);
    }

    ~TileFixture() {
        relief_sampler_destroy(sampler);
        relief_noise_destroy(noise);
    }
};

} // namespace

TEST_CASE("Tile construction", "[tile]") {
    TileFixture fx;
    REQUIRE(fx.sampler != nullptr);

    SECTION("coordinates, offset and spacing") {
        Relief_Tile *tile = relief_tile_create(1, 2, &fx.cfg, fx.sampler, nullptr);
        REQUIRE(tile != nullptr);

        int row, col;
        relief_tile_get_coords(tile, &row, &col);
        REQUIRE(row == 1);
        REQUIRE(col == 2);

        float ox, oz;
        relief_tile_get_offset(tile, &ox, &oz);
        REQUIRE(ox == 64.0f);
        REQUIRE(oz == 128.0f);

        REQUIRE(relief_tile_get_samples(tile) == 9);
        REQUIRE(relief_tile_get_cell_spacing(tile) == 8.0f);

        relief_tile_destroy(tile);
    }

    SECTION("every cell is sampled once through the shared sampler") {
        Relief_Tile *tile = relief_tile_create(0, 0, &fx.cfg, fx.sampler, nullptr);
        REQUIRE(relief_sampler_get_sample_count(fx.sampler) == 81);

        const float *heights = relief_tile_get_heights(tile);
        for (int k = 0; k < 81; k++) {
            REQUIRE(heights[k] >= 0.0f);
            REQUIRE(heights[k] <= 1.0f);
        }
        REQUIRE(relief_tile_get_height(tile, 2, 3) == heights[2 * 9 + 3]);
        REQUIRE(relief_tile_get_height(tile, 9, 0) == 0.0f);

        relief_tile_destroy(tile);
    }

    SECTION("world positions span the tile edge to edge") {
        Relief_Tile *tile = relief_tile_create(2, 1, &fx.cfg, fx.sampler, nullptr);

        float x, z;
        REQUIRE(relief_tile_world_position(tile, 0, 0, &x, &z));
        REQUIRE(x == 128.0f);
        REQUIRE(z == 64.0f);

        REQUIRE(relief_tile_world_position(tile, 8, 8, &x, &z));
        REQUIRE(x == Catch::Approx(192.0f));
        REQUIRE(z == Catch::Approx(128.0f));

        REQUIRE_FALSE(relief_tile_world_position(tile, -1, 0, &x, &z));

        relief_tile_destroy(tile);
    }

    SECTION("out-of-grid coordinates are rejected") {
        relief_clear_error();
        REQUIRE(relief_tile_create(3, 0, &fx.cfg, fx.sampler, nullptr) == nullptr);
        REQUIRE(relief_has_error());
        REQUIRE(relief_tile_create(0, -1, &fx.cfg, fx.sampler, nullptr) == nullptr);
        REQUIRE(relief_tile_create(0, 0, &fx.cfg, nullptr, nullptr) == nullptr);
    }

    relief_tile_destroy(nullptr);
    relief_clear_error();
}

TEST_CASE("Neighboring tiles share border samples", "[tile][continuity]") {
    TileFixture fx;
    const int n = fx.cfg.samples_per_tile;

    Relief_Tile *a = relief_tile_create(1, 1, &fx.cfg, fx.sampler, nullptr);
    Relief_Tile *right = relief_tile_create(1, 2, &fx.cfg, fx.sampler, nullptr);
    Relief_Tile *below = relief_tile_create(2, 1, &fx.cfg, fx.sampler, nullptr);

    for (int k = 0; k < n; k++) {
        float ax, az, bx, bz;

        relief_tile_world_position(a, k, n - 1, &ax, &az);
        relief_tile_world_position(right, k, 0, &bx, &bz);
        REQUIRE(ax == bx);
        REQUIRE(az == bz);
        REQUIRE(relief_sampler_raw_at(fx.sampler, ax, az) == relief_sampler_raw_at(fx.sampler, bx, bz));

        relief_tile_world_position(a, n - 1, k, &ax, &az);
        relief_tile_world_position(below, 0, k, &bx, &bz);
        REQUIRE(ax == bx);
        REQUIRE(az == bz);
    }

    relief_tile_destroy(a);
    relief_tile_destroy(right);
    relief_tile_destroy(below);
}

TEST_CASE("Tile island mask", "[tile][islands]") {
    TileFixture fx;

    SECTION("mask size must match the sample count") {
        Relief_FalloffMask *wrong = relief_falloff_create(4);
        relief_clear_error();
        REQUIRE(relief_tile_create(0, 0, &fx.cfg, fx.sampler, wrong) == nullptr);
        REQUIRE(strstr(relief_get_last_error(), "falloff mask size") != nullptr);
        relief_falloff_destroy(wrong);
    }

    SECTION("masked heights stay in [0, 1] and corners sink to zero") {
        Relief_FalloffMask *mask = relief_falloff_create(fx.cfg.samples_per_tile);
        Relief_Tile *tile = relief_tile_create(0, 0, &fx.cfg, fx.sampler, mask);
        REQUIRE(tile != nullptr);

        int n = fx.cfg.samples_per_tile;
        for (int i = 0; i < n; i++) {
            for (int j = 0; j < n; j++) {
                float h = relief_tile_get_height(tile, i, j);
                REQUIRE(h >= 0.0f);
                REQUIRE(h <= 1.0f);
            }
        }
        // Corner falloff is ~1, so anything short of a perfect 1.0 clamps to 0
        REQUIRE(relief_tile_get_height(tile, 0, 0) == Catch::Approx(0.0f).margin(1e-5));

        relief_tile_destroy(tile);
        relief_falloff_destroy(mask);
    }
}

TEST_CASE("Two-pass tile normalization", "[tile][global]") {
    TileFixture fx;

    Relief_Tile *tile = relief_tile_create_raw(0, 0, &fx.cfg, fx.sampler);
    REQUIRE(tile != nullptr);
    REQUIRE(relief_sampler_get_sample_count(fx.sampler) == 81);

    float lo, hi;
    relief_sampler_get_range(fx.sampler, &lo, &hi);
    REQUIRE(hi > lo);

    REQUIRE(relief_tile_finalize(tile, fx.sampler, nullptr));

    float seen_lo = 1.0f, seen_hi = 0.0f;
    const float *heights = relief_tile_get_heights(tile);
    for (int k = 0; k < 81; k++) {
        if (heights[k] < seen_lo) seen_lo = heights[k];
        if (heights[k] > seen_hi) seen_hi = heights[k];
    }
    REQUIRE(seen_lo == 0.0f);
    REQUIRE(seen_hi == 1.0f);

    relief_tile_destroy(tile);
}

TEST_CASE("Finalize rejects a mismatched mask", "[tile][global][islands]") {
    TileFixture fx;
    relief_clear_error();

    Relief_Tile *tile = relief_tile_create_raw(1, 1, &fx.cfg, fx.sampler);
    REQUIRE(tile != nullptr);

    const float *heights = relief_tile_get_heights(tile);
    std::vector<float> raw(heights, heights + 81);

    Relief_FalloffMask *mask = relief_falloff_create(4);
    REQUIRE_FALSE(relief_tile_finalize(tile, fx.sampler, mask));
    REQUIRE(strstr(relief_get_last_error(), "falloff mask size 4") != nullptr);

    // Heights are still the raw sums
    REQUIRE(std::vector<float>(heights, heights + 81) == raw);

    REQUIRE_FALSE(relief_tile_finalize(nullptr, fx.sampler, nullptr));
    REQUIRE_FALSE(relief_tile_finalize(tile, nullptr, nullptr));

    relief_falloff_destroy(mask);
    relief_tile_destroy(tile);
    relief_clear_error();
}
