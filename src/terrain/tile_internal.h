#ifndef RELIEF_TILE_INTERNAL_H
#define RELIEF_TILE_INTERNAL_H

#include "relief/tile.h"

/*
 * Two-pass construction used by global normalization. A raw tile holds
 * un-normalized fractal sums (each observed into the sampler range); once
 * every tile is sampled, relief_tile_finalize() rescales it against the
 * sampler's final range and applies the mask.
 */

Relief_Tile *relief_tile_create_raw(int row, int col,
                                    const Relief_GenerationConfig *cfg,
                                    Relief_HeightSampler *sampler);

/* Fails, leaving the tile raw, when the mask size does not match */
bool relief_tile_finalize(Relief_Tile *tile,
                          const Relief_HeightSampler *sampler,
                          const Relief_FalloffMask *mask);

#endif /* RELIEF_TILE_INTERNAL_H */
