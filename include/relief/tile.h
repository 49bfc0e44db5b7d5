/*
 * Relief Terrain Tile
 *
 * One square patch of the terrain: grid coordinates, world offset and a
 * samples x samples array of normalized heights. Heights are stored
 * row-major, heights[i * samples + j], with i stepping along world X (the
 * row axis) and j along world Z (the column axis). Tiles are immutable once
 * built.
 *
 * Sample (i, j) sits at offset + (i, j) * cell_spacing, so the last row and
 * column of a tile coincide with the first row and column of its neighbors.
 */

#ifndef RELIEF_TILE_H
#define RELIEF_TILE_H

#include "relief/config.h"
#include "relief/falloff.h"
#include "relief/sampler.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Relief_Tile Relief_Tile;

/**
 * Build a tile, sampling every cell through the shared sampler in row-major
 * order. In island mode (mask non-NULL) the mask value of each cell is
 * subtracted from the normalized height and the result clamped to [0, 1].
 * Caller OWNS the returned pointer and MUST call relief_tile_destroy().
 *
 * @param row Tile row (world X)
 * @param col Tile column (world Z)
 * @param cfg Generation configuration
 * @param sampler Shared sampler; its range is widened by every cell
 * @param mask Falloff mask sized samples_per_tile, or NULL
 * @return Tile, or NULL on invalid arguments or allocation failure
 */
Relief_Tile *relief_tile_create(int row, int col,
                                const Relief_GenerationConfig *cfg,
                                Relief_HeightSampler *sampler,
                                const Relief_FalloffMask *mask);

/** Destroy a tile. Safe to call with NULL. */
void relief_tile_destroy(Relief_Tile *tile);

/** Grid coordinates. Either output may be NULL. */
void relief_tile_get_coords(const Relief_Tile *tile, int *out_row, int *out_col);

/** World offset (row * tile_size, col * tile_size). Either output may be NULL. */
void relief_tile_get_offset(const Relief_Tile *tile, float *out_x, float *out_z);

/** Samples per side (0 for NULL). */
int relief_tile_get_samples(const Relief_Tile *tile);

/** Spacing between neighboring samples in world units. */
float relief_tile_get_cell_spacing(const Relief_Tile *tile);

/** Row-major height array (samples * samples entries). Borrowed. */
const float *relief_tile_get_heights(const Relief_Tile *tile);

/** Height at (i, j), 0 when out of range. */
float relief_tile_get_height(const Relief_Tile *tile, int i, int j);

/**
 * World position of sample (i, j). Either output may be NULL.
 *
 * @return false if tile is NULL or (i, j) is out of range
 */
bool relief_tile_world_position(const Relief_Tile *tile, int i, int j,
                                float *out_x, float *out_z);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_TILE_H */
