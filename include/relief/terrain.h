/*
 * Relief Terrain Field
 *
 * The whole terrain: grid_extent x grid_extent tiles built in row-major
 * order through one shared noise generator and height sampler, so noise is
 * continuous across tile borders and the normalization range is threaded
 * through the entire build. The structure is rebuilt wholesale whenever the
 * configuration changes; there is no incremental update.
 *
 * Usage:
 *   Relief_GenerationConfig cfg = RELIEF_GENERATION_CONFIG_DEFAULT;
 *   Relief_Terrain *terrain = relief_terrain_create(&cfg);
 *
 *   for (int i = 0; i < relief_terrain_get_tile_count(terrain); i++) {
 *       const Relief_Tile *tile = relief_terrain_get_tile_at(terrain, i);
 *       // ... build geometry from relief_tile_get_heights(tile) ...
 *   }
 *
 *   // Driving loop, once per frame
 *   relief_terrain_sync(terrain, &live_cfg);
 *
 *   relief_terrain_destroy(terrain);
 */

#ifndef RELIEF_TERRAIN_H
#define RELIEF_TERRAIN_H

#include "relief/config.h"
#include "relief/tile.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Relief_Terrain Relief_Terrain;

/** Outcome of relief_terrain_sync() */
typedef enum Relief_SyncResult {
    RELIEF_SYNC_UNCHANGED = 0,  /**< Fingerprint matched, nothing done */
    RELIEF_SYNC_REBUILT,        /**< Structure rebuilt from the new config */
    RELIEF_SYNC_FAILED          /**< Build failed, previous structure kept */
} Relief_SyncResult;

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * Create a terrain and build it from cfg.
 * Caller OWNS the returned pointer and MUST call relief_terrain_destroy().
 *
 * @return Built terrain, or NULL if cfg is invalid or the build failed
 */
Relief_Terrain *relief_terrain_create(const Relief_GenerationConfig *cfg);

/**
 * Create a terrain with no structure; the first relief_terrain_sync() or
 * relief_terrain_build() populates it.
 */
Relief_Terrain *relief_terrain_create_empty(void);

/** Destroy a terrain and everything it owns. Safe to call with NULL. */
void relief_terrain_destroy(Relief_Terrain *terrain);

/* ============================================================================
 * Building
 * ============================================================================ */

/**
 * Build the structure for cfg, replacing the current one.
 * A fresh noise generator is seeded with cfg->seed when cfg->has_seed is
 * set, otherwise with relief_noise_random_seed(). On failure nothing is
 * replaced: the previous structure (if any) stays intact.
 *
 * @return true on success
 */
bool relief_terrain_build(Relief_Terrain *terrain, const Relief_GenerationConfig *cfg);

/**
 * Release all tiles and generation state. Idempotent.
 */
void relief_terrain_teardown(Relief_Terrain *terrain);

/**
 * Rebuild the current configuration with a newly drawn random seed.
 * An explicitly seeded configuration takes the new seed, so its fingerprint
 * changes and a later relief_terrain_sync() with the old seed rebuilds the
 * old terrain. An unseeded configuration keeps its fingerprint.
 *
 * @return true on success; false if the terrain was never built
 */
bool relief_terrain_regenerate(Relief_Terrain *terrain);

/**
 * One step of the driving loop: rebuild if the fingerprint of desired
 * differs from the current one. A config that already failed to build is
 * not retried until it changes.
 */
Relief_SyncResult relief_terrain_sync(Relief_Terrain *terrain, const Relief_GenerationConfig *desired);

/* ============================================================================
 * Queries
 * ============================================================================ */

/** true while a structure is present. */
bool relief_terrain_is_built(const Relief_Terrain *terrain);

/**
 * Fingerprint of the configuration the current structure was built from,
 * or "" when torn down. Borrowed; invalidated by the next build/teardown.
 */
const char *relief_terrain_fingerprint(const Relief_Terrain *terrain);

/**
 * Configuration of the current structure, or NULL when torn down.
 * Its seed field holds the seed actually used, even when has_seed is false.
 */
const Relief_GenerationConfig *relief_terrain_get_config(const Relief_Terrain *terrain);

/** Seed actually used by the current structure (0 when torn down). */
uint64_t relief_terrain_get_seed(const Relief_Terrain *terrain);

/** Tiles per side (0 when torn down). */
int relief_terrain_get_grid_extent(const Relief_Terrain *terrain);

/** Number of tiles (grid_extent squared, 0 when torn down). */
int relief_terrain_get_tile_count(const Relief_Terrain *terrain);

/** Tile at grid coordinates, or NULL. Borrowed. */
const Relief_Tile *relief_terrain_get_tile(const Relief_Terrain *terrain, int row, int col);

/** Tile at row-major index, or NULL. Borrowed. */
const Relief_Tile *relief_terrain_get_tile_at(const Relief_Terrain *terrain, int index);

/** Normalized height of sample (i, j) of tile (row, col), 0 if out of range. */
float relief_terrain_get_height(const Relief_Terrain *terrain, int row, int col, int i, int j);

/**
 * Range of raw fractal sums observed by the build. Either output may be NULL.
 *
 * @return false when torn down
 */
bool relief_terrain_get_height_range(const Relief_Terrain *terrain, float *out_min, float *out_max);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_TERRAIN_H */
