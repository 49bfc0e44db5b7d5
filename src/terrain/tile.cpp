#include "relief/tile.h"
#include "relief/error.h"
#include "relief/validate.h"
#include "tile_internal.h"
#include <stdlib.h>

struct Relief_Tile {
    int row;
    int col;
    float offset_x;
    float offset_z;
    float cell_spacing;
    int samples;
    float *heights;
};

/*
 * World coordinate of sample index along one axis. Computed from the global
 * sample index so a tile's last sample and its neighbor's first sample are
 * the same float.
 */
static float tile_axis_coord(const Relief_Tile *tile, int tile_coord, int index) {
    int stride = tile->samples > 1 ? tile->samples - 1 : 1;
    return (float)(tile_coord * stride + index) * tile->cell_spacing;
}

static Relief_Tile *tile_alloc(int row, int col, const Relief_GenerationConfig *cfg) {
    RELIEF_VALIDATE_RANGE_RET(row, 0, cfg->grid_extent - 1, NULL);
    RELIEF_VALIDATE_RANGE_RET(col, 0, cfg->grid_extent - 1, NULL);
    RELIEF_VALIDATE_RANGE_RET(cfg->samples_per_tile, 1, RELIEF_CONFIG_MAX_SAMPLES, NULL);

    Relief_Tile *tile = (Relief_Tile *)calloc(1, sizeof(Relief_Tile));
    if (!tile) {
        relief_set_error("tile: failed to allocate tile (%d, %d)", row, col);
        return NULL;
    }

    int n = cfg->samples_per_tile;
    tile->heights = (float *)calloc((size_t)n * (size_t)n, sizeof(float));
    if (!tile->heights) {
        relief_set_error("tile: failed to allocate %dx%d heights", n, n);
        free(tile);
        return NULL;
    }

    tile->row = row;
    tile->col = col;
    tile->offset_x = (float)row * cfg->tile_size;
    tile->offset_z = (float)col * cfg->tile_size;
    tile->cell_spacing = relief_config_cell_spacing(cfg);
    tile->samples = n;

    return tile;
}

static bool tile_mask_matches(const Relief_FalloffMask *mask, int samples) {
    if (!mask) return true;
    if (relief_falloff_size(mask) == samples) return true;

    relief_set_error("tile: falloff mask size %d does not match %d samples per tile",
                     relief_falloff_size(mask), samples);
    return false;
}

static float tile_apply_mask(float height, const Relief_FalloffMask *mask, int i, int j) {
    if (!mask) return height;
    return relief_clamp(height - relief_falloff_get(mask, i, j), 0.0f, 1.0f);
}

Relief_Tile *relief_tile_create(int row, int col,
                                const Relief_GenerationConfig *cfg,
                                Relief_HeightSampler *sampler,
                                const Relief_FalloffMask *mask) {
    RELIEF_VALIDATE_PTRS2_RET(cfg, sampler, NULL);
    if (!tile_mask_matches(mask, cfg->samples_per_tile)) return NULL;

    Relief_Tile *tile = tile_alloc(row, col, cfg);
    if (!tile) return NULL;

    int n = tile->samples;
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            float wx = tile_axis_coord(tile, tile->row, i);
            float wz = tile_axis_coord(tile, tile->col, j);

            float h = relief_sampler_height_at(sampler, wx, wz);
            tile->heights[i * n + j] = tile_apply_mask(h, mask, i, j);
        }
    }

    return tile;
}

Relief_Tile *relief_tile_create_raw(int row, int col,
                                    const Relief_GenerationConfig *cfg,
                                    Relief_HeightSampler *sampler) {
    RELIEF_VALIDATE_PTRS2_RET(cfg, sampler, NULL);

    Relief_Tile *tile = tile_alloc(row, col, cfg);
    if (!tile) return NULL;

    int n = tile->samples;
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            float wx = tile_axis_coord(tile, tile->row, i);
            float wz = tile_axis_coord(tile, tile->col, j);

            float raw = relief_sampler_raw_at(sampler, wx, wz);
            relief_sampler_observe(sampler, raw);
            tile->heights[i * n + j] = raw;
        }
    }

    return tile;
}

bool relief_tile_finalize(Relief_Tile *tile,
                          const Relief_HeightSampler *sampler,
                          const Relief_FalloffMask *mask) {
    RELIEF_VALIDATE_PTRS2_RET(tile, sampler, false);
    if (!tile_mask_matches(mask, tile->samples)) return false;

    int n = tile->samples;
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            float h = relief_sampler_normalize(sampler, tile->heights[i * n + j]);
            tile->heights[i * n + j] = tile_apply_mask(h, mask, i, j);
        }
    }
    return true;
}

void relief_tile_destroy(Relief_Tile *tile) {
    if (!tile) return;
    free(tile->heights);
    free(tile);
}

void relief_tile_get_coords(const Relief_Tile *tile, int *out_row, int *out_col) {
    if (out_row) *out_row = tile ? tile->row : 0;
    if (out_col) *out_col = tile ? tile->col : 0;
}

void relief_tile_get_offset(const Relief_Tile *tile, float *out_x, float *out_z) {
    if (out_x) *out_x = tile ? tile->offset_x : 0.0f;
    if (out_z) *out_z = tile ? tile->offset_z : 0.0f;
}

int relief_tile_get_samples(const Relief_Tile *tile) {
    return tile ? tile->samples : 0;
}

float relief_tile_get_cell_spacing(const Relief_Tile *tile) {
    return tile ? tile->cell_spacing : 0.0f;
}

const float *relief_tile_get_heights(const Relief_Tile *tile) {
    return tile ? tile->heights : NULL;
}

float relief_tile_get_height(const Relief_Tile *tile, int i, int j) {
    if (!tile) return 0.0f;
    if (i < 0 || j < 0 || i >= tile->samples || j >= tile->samples) return 0.0f;
    return tile->heights[i * tile->samples + j];
}

bool relief_tile_world_position(const Relief_Tile *tile, int i, int j,
                                float *out_x, float *out_z) {
    if (!tile) return false;
    if (i < 0 || j < 0 || i >= tile->samples || j >= tile->samples) return false;

    if (out_x) *out_x = tile_axis_coord(tile, tile->row, i);
    if (out_z) *out_z = tile_axis_coord(tile, tile->col, j);
    return true;
}
