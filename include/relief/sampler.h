/*
 * Relief Height Sampler
 *
 * Fractal Brownian motion over a Relief_Noise basis, with a running
 * normalization range. Every relief_sampler_height_at() call widens
 * [observed_min, observed_max] with its own fractal sum and then rescales
 * that sum against the widened range, so samples taken early in a build are
 * normalized against a narrower range than later ones. The result therefore
 * depends on sampling order, even for a fixed seed and configuration.
 *
 * One sampler serves one terrain build. Tiles receive it by pointer so the
 * range is threaded through the whole build without global state.
 *
 * Usage:
 *   Relief_HeightSampler *s = relief_sampler_create(noise, &cfg);
 *   float h = relief_sampler_height_at(s, world_x, world_z);   // [0, 1]
 *   relief_sampler_destroy(s);
 */

#ifndef RELIEF_SAMPLER_H
#define RELIEF_SAMPLER_H

#include "relief/config.h"
#include "relief/noise.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Relief_HeightSampler Relief_HeightSampler;

/**
 * Create a sampler over a noise generator.
 * The sampler BORROWS noise (which must outlive it) and copies the fractal
 * parameters and terrain width out of cfg.
 * Caller OWNS the returned pointer and MUST call relief_sampler_destroy().
 *
 * @return Sampler with an empty range, or NULL on invalid arguments
 */
Relief_HeightSampler *relief_sampler_create(const Relief_Noise *noise,
                                            const Relief_GenerationConfig *cfg);

/** Destroy a sampler. Safe to call with NULL. Does not destroy the noise. */
void relief_sampler_destroy(Relief_HeightSampler *sampler);

/**
 * Normalized height at a world position (tile offset included).
 * Widens the observed range with this sample, then returns the sample
 * rescaled into [0, 1] against that range. A zero-width range, as on the
 * first call, yields 0.
 *
 * Thread Safety: NOT thread-safe (mutates the range)
 */
float relief_sampler_height_at(Relief_HeightSampler *sampler, float world_x, float world_z);

/**
 * Un-normalized fractal sum at a world position. Does not touch the range.
 */
float relief_sampler_raw_at(const Relief_HeightSampler *sampler, float world_x, float world_z);

/** Widen the range to include raw. */
void relief_sampler_observe(Relief_HeightSampler *sampler, float raw);

/** Rescale raw against the current range without widening it. */
float relief_sampler_normalize(const Relief_HeightSampler *sampler, float raw);

/**
 * Current range. Before any observation min is +inf and max is -inf.
 * Either output may be NULL.
 */
void relief_sampler_get_range(const Relief_HeightSampler *sampler, float *out_min, float *out_max);

/** Number of samples observed since creation or the last reset. */
int relief_sampler_get_sample_count(const Relief_HeightSampler *sampler);

/** Empty the range (min = +inf, max = -inf). */
void relief_sampler_reset(Relief_HeightSampler *sampler);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_SAMPLER_H */
