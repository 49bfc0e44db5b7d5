/*
 * Relief Noise Source
 *
 * Seeded, continuous 2D noise used as the basis function for terrain height
 * synthesis. A generator owns its seed plus the permutation and gradient
 * tables derived from it, so two generators with the same seed sample the
 * same field and a reseed leaves nothing of the previous field behind.
 *
 * Usage:
 *   Relief_Noise *noise = relief_noise_create(12345);
 *
 *   // Raw basis in [-1, 1]
 *   float raw = relief_noise_simplex2d(noise, x, z);
 *
 *   // Remapped to [0, 1], as consumed by the height sampler
 *   float v = relief_noise_sample01(noise, RELIEF_NOISE_SIMPLEX, x, z);
 *
 *   relief_noise_destroy(noise);
 */

#ifndef RELIEF_NOISE_H
#define RELIEF_NOISE_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Relief_Noise Relief_Noise;

/** Noise basis function */
typedef enum Relief_NoiseType {
    RELIEF_NOISE_SIMPLEX = 0,   /**< Simplex noise (default) */
    RELIEF_NOISE_PERLIN         /**< Classic gradient Perlin noise */
} Relief_NoiseType;

/** Exclusive upper bound of seeds drawn by relief_noise_random_seed() */
#define RELIEF_NOISE_RANDOM_SEED_MAX 100000

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

/**
 * Create a noise generator with a seed.
 * Caller OWNS the returned pointer and MUST call relief_noise_destroy().
 *
 * @param seed Seed for reproducible noise
 * @return Noise generator, or NULL on allocation failure
 */
Relief_Noise *relief_noise_create(uint64_t seed);

/**
 * Destroy a noise generator. Safe to call with NULL.
 */
void relief_noise_destroy(Relief_Noise *noise);

/**
 * Reseed the generator. All tables are rebuilt from the new seed.
 *
 * Thread Safety: NOT thread-safe
 */
void relief_noise_reseed(Relief_Noise *noise, uint64_t seed);

/**
 * Get the current seed (0 for NULL).
 */
uint64_t relief_noise_get_seed(const Relief_Noise *noise);

/**
 * Draw a uniform random seed in [0, RELIEF_NOISE_RANDOM_SEED_MAX) from the
 * SDL pseudo-random generator.
 */
uint64_t relief_noise_random_seed(void);

/* ============================================================================
 * Sampling
 * ============================================================================ */

/**
 * Sample 2D Simplex noise.
 *
 * @return Noise value in [-1, 1], or 0 for a NULL generator
 *
 * Thread Safety: Thread-safe (read-only after creation)
 */
float relief_noise_simplex2d(const Relief_Noise *noise, float x, float z);

/**
 * Sample 2D Perlin noise.
 *
 * @return Noise value in [-1, 1], or 0 for a NULL generator
 *
 * Thread Safety: Thread-safe (read-only after creation)
 */
float relief_noise_perlin2d(const Relief_Noise *noise, float x, float z);

/**
 * Sample the selected basis, clamped to [-1, 1].
 */
float relief_noise_sample(const Relief_Noise *noise, Relief_NoiseType type, float x, float z);

/**
 * Sample the selected basis remapped from [-1, 1] to [0, 1].
 */
float relief_noise_sample01(const Relief_Noise *noise, Relief_NoiseType type, float x, float z);

/**
 * Name of a noise type ("simplex", "perlin"), or NULL if unknown.
 */
const char *relief_noise_type_name(Relief_NoiseType type);

/**
 * Parse a noise type name (case-sensitive).
 *
 * @return true on success; out_type is untouched on failure
 */
bool relief_noise_type_parse(const char *name, Relief_NoiseType *out_type);

/* ============================================================================
 * Utility Functions
 * ============================================================================ */

/**
 * Rescale value from [min, max] into [0, 1], clamping first.
 * A zero-width or inverted range yields 0.
 */
float relief_inverse_lerp(float min, float max, float value);

float relief_clamp(float value, float min, float max);

float relief_lerp(float a, float b, float t);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_NOISE_H */
