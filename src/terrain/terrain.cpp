#include "relief/terrain.h"
#include "relief/error.h"
#include "relief/falloff.h"
#include "relief/log.h"
#include "relief/noise.h"
#include "relief/sampler.h"
#include "relief/validate.h"
#include "tile_internal.h"
#include <stdlib.h>
#include <string.h>

/* Everything one build produces; swapped into the terrain on success */
typedef struct TerrainState {
    Relief_GenerationConfig config;
    char fingerprint[RELIEF_CONFIG_FINGERPRINT_MAX];
    uint64_t seed;
    Relief_Noise *noise;
    Relief_HeightSampler *sampler;
    Relief_FalloffMask *mask;
    Relief_Tile **tiles;
    int tile_count;
} TerrainState;

struct Relief_Terrain {
    TerrainState state;
    bool built;
    char failed_fingerprint[RELIEF_CONFIG_FINGERPRINT_MAX];
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static void state_release(TerrainState *state) {
    if (state->tiles) {
        for (int i = 0; i < state->tile_count; i++) {
            relief_tile_destroy(state->tiles[i]);
        }
        free(state->tiles);
    }
    relief_falloff_destroy(state->mask);
    relief_sampler_destroy(state->sampler);
    relief_noise_destroy(state->noise);
    memset(state, 0, sizeof(*state));
}

static bool state_build_online(TerrainState *state) {
    int extent = state->config.grid_extent;
    for (int row = 0; row < extent; row++) {
        for (int col = 0; col < extent; col++) {
            Relief_Tile *tile = relief_tile_create(row, col, &state->config,
                                                   state->sampler, state->mask);
            if (!tile) return false;
            state->tiles[row * extent + col] = tile;
        }
    }
    return true;
}

static bool state_build_global(TerrainState *state) {
    int extent = state->config.grid_extent;
    for (int row = 0; row < extent; row++) {
        for (int col = 0; col < extent; col++) {
            Relief_Tile *tile = relief_tile_create_raw(row, col, &state->config, state->sampler);
            if (!tile) return false;
            state->tiles[row * extent + col] = tile;
        }
    }

    for (int i = 0; i < state->tile_count; i++) {
        if (!relief_tile_finalize(state->tiles[i], state->sampler, state->mask)) return false;
    }
    return true;
}

static bool state_build(TerrainState *state, const Relief_GenerationConfig *cfg, uint64_t seed) {
    /* The stored config carries the seed actually used, drawn or explicit */
    state->config = *cfg;
    state->config.seed = seed;
    state->seed = seed;
    relief_config_fingerprint(&state->config, state->fingerprint, sizeof(state->fingerprint));

    state->noise = relief_noise_create(seed);
    if (!state->noise) return false;

    state->sampler = relief_sampler_create(state->noise, cfg);
    if (!state->sampler) return false;

    if (cfg->islands) {
        state->mask = relief_falloff_create(cfg->samples_per_tile);
        if (!state->mask) return false;
    }

    state->tile_count = cfg->grid_extent * cfg->grid_extent;
    state->tiles = (Relief_Tile **)calloc((size_t)state->tile_count, sizeof(Relief_Tile *));
    if (!state->tiles) {
        relief_set_error("terrain: failed to allocate %d tile slots", state->tile_count);
        return false;
    }

    if (cfg->normalization == RELIEF_NORMALIZE_GLOBAL) {
        return state_build_global(state);
    }
    return state_build_online(state);
}

static void state_log_tiles(const TerrainState *state) {
    if (!relief_log_enabled(RELIEF_LOG_LEVEL_DEBUG)) return;

    for (int t = 0; t < state->tile_count; t++) {
        const Relief_Tile *tile = state->tiles[t];
        const float *heights = relief_tile_get_heights(tile);
        int count = relief_tile_get_samples(tile) * relief_tile_get_samples(tile);

        float lo = heights[0], hi = heights[0];
        for (int k = 1; k < count; k++) {
            if (heights[k] < lo) lo = heights[k];
            if (heights[k] > hi) hi = heights[k];
        }

        int row, col;
        float ox, oz;
        relief_tile_get_coords(tile, &row, &col);
        relief_tile_get_offset(tile, &ox, &oz);
        relief_log_debug(RELIEF_LOG_TERRAIN, "Tile (%d, %d) offset (%.1f, %.1f) heights [%.4f, %.4f]",
                         row, col, (double)ox, (double)oz, (double)lo, (double)hi);
    }
}

static bool terrain_build_with_seed(Relief_Terrain *terrain, const Relief_GenerationConfig *cfg,
                                    uint64_t seed) {
    TerrainState next;
    memset(&next, 0, sizeof(next));

    if (!state_build(&next, cfg, seed)) {
        relief_log_error(RELIEF_LOG_TERRAIN, "Build aborted: %s", relief_get_last_error());
        state_release(&next);
        return false;
    }

    state_release(&terrain->state);
    terrain->state = next;
    terrain->built = true;

    state_log_tiles(&terrain->state);

    float lo, hi;
    relief_sampler_get_range(next.sampler, &lo, &hi);
    relief_log_info(RELIEF_LOG_TERRAIN,
                    "Built %dx%d tiles of %dx%d samples (seed %llu, %s normalization, islands %s), raw range [%.4f, %.4f]",
                    cfg->grid_extent, cfg->grid_extent,
                    cfg->samples_per_tile, cfg->samples_per_tile,
                    (unsigned long long)seed,
                    relief_normalization_name(cfg->normalization),
                    cfg->islands ? "on" : "off",
                    (double)lo, (double)hi);
    return true;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Relief_Terrain *relief_terrain_create_empty(void) {
    Relief_Terrain *terrain = (Relief_Terrain *)calloc(1, sizeof(Relief_Terrain));
    if (!terrain) {
        relief_set_error("terrain: failed to allocate terrain");
        return NULL;
    }
    return terrain;
}

Relief_Terrain *relief_terrain_create(const Relief_GenerationConfig *cfg) {
    RELIEF_VALIDATE_PTR_RET(cfg, NULL);

    Relief_Terrain *terrain = relief_terrain_create_empty();
    if (!terrain) return NULL;

    if (!relief_terrain_build(terrain, cfg)) {
        relief_terrain_destroy(terrain);
        return NULL;
    }
    return terrain;
}

void relief_terrain_destroy(Relief_Terrain *terrain) {
    if (!terrain) return;
    state_release(&terrain->state);
    free(terrain);
}

/* ============================================================================
 * Building
 * ============================================================================ */

bool relief_terrain_build(Relief_Terrain *terrain, const Relief_GenerationConfig *cfg) {
    RELIEF_VALIDATE_PTRS2_RET(terrain, cfg, false);

    Relief_ConfigError err = relief_config_validate(cfg);
    if (err != RELIEF_CONFIG_OK) {
        relief_log_error(RELIEF_LOG_TERRAIN, "Rejected configuration (%s): %s",
                         relief_config_error_string(err), relief_get_last_error());
        return false;
    }

    uint64_t seed = cfg->has_seed ? cfg->seed : relief_noise_random_seed();
    return terrain_build_with_seed(terrain, cfg, seed);
}

void relief_terrain_teardown(Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return;

    relief_log_debug(RELIEF_LOG_TERRAIN, "Teardown of %d tiles", terrain->state.tile_count);
    state_release(&terrain->state);
    terrain->built = false;
}

bool relief_terrain_regenerate(Relief_Terrain *terrain) {
    RELIEF_VALIDATE_PTR_RET(terrain, false);
    RELIEF_VALIDATE_COND_RET(terrain->built, "terrain has not been built", false);

    Relief_GenerationConfig cfg = terrain->state.config;
    uint64_t seed = relief_noise_random_seed();
    if (cfg.has_seed) {
        cfg.seed = seed;
    }
    return terrain_build_with_seed(terrain, &cfg, seed);
}

Relief_SyncResult relief_terrain_sync(Relief_Terrain *terrain, const Relief_GenerationConfig *desired) {
    if (!terrain || !desired) {
        relief_set_error("terrain: sync requires a terrain and a configuration");
        return RELIEF_SYNC_FAILED;
    }

    char wanted[RELIEF_CONFIG_FINGERPRINT_MAX];
    relief_config_fingerprint(desired, wanted, sizeof(wanted));

    if (terrain->built && strcmp(wanted, terrain->state.fingerprint) == 0) {
        return RELIEF_SYNC_UNCHANGED;
    }
    if (terrain->failed_fingerprint[0] != '\0' && strcmp(wanted, terrain->failed_fingerprint) == 0) {
        return RELIEF_SYNC_FAILED;
    }

    relief_log_debug(RELIEF_LOG_TERRAIN, "Configuration changed, rebuilding");

    /* A successful build tears down the previous structure itself */
    if (!relief_terrain_build(terrain, desired)) {
        memcpy(terrain->failed_fingerprint, wanted, sizeof(wanted));
        return RELIEF_SYNC_FAILED;
    }

    terrain->failed_fingerprint[0] = '\0';
    return RELIEF_SYNC_REBUILT;
}

/* ============================================================================
 * Queries
 * ============================================================================ */

bool relief_terrain_is_built(const Relief_Terrain *terrain) {
    return terrain && terrain->built;
}

const char *relief_terrain_fingerprint(const Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return "";
    return terrain->state.fingerprint;
}

const Relief_GenerationConfig *relief_terrain_get_config(const Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return NULL;
    return &terrain->state.config;
}

uint64_t relief_terrain_get_seed(const Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return 0;
    return terrain->state.seed;
}

int relief_terrain_get_grid_extent(const Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return 0;
    return terrain->state.config.grid_extent;
}

int relief_terrain_get_tile_count(const Relief_Terrain *terrain) {
    if (!terrain || !terrain->built) return 0;
    return terrain->state.tile_count;
}

const Relief_Tile *relief_terrain_get_tile(const Relief_Terrain *terrain, int row, int col) {
    int extent = relief_terrain_get_grid_extent(terrain);
    if (row < 0 || col < 0 || row >= extent || col >= extent) return NULL;
    return terrain->state.tiles[row * extent + col];
}

const Relief_Tile *relief_terrain_get_tile_at(const Relief_Terrain *terrain, int index) {
    if (index < 0 || index >= relief_terrain_get_tile_count(terrain)) return NULL;
    return terrain->state.tiles[index];
}

float relief_terrain_get_height(const Relief_Terrain *terrain, int row, int col, int i, int j) {
    return relief_tile_get_height(relief_terrain_get_tile(terrain, row, col), i, j);
}

bool relief_terrain_get_height_range(const Relief_Terrain *terrain, float *out_min, float *out_max) {
    if (!terrain || !terrain->built) return false;
    relief_sampler_get_range(terrain->state.sampler, out_min, out_max);
    return true;
}
