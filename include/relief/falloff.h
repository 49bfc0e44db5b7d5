/*
 * Relief Island Falloff Mask
 *
 * Precomputed square attenuation grid. Values are ~0 at the center and reach
 * 1 at the border; island mode subtracts them from tile heights so the edges
 * sink into the water band. Distance is Chebyshev, which gives a square-ish
 * island outline.
 *
 * Usage:
 *   Relief_FalloffMask *mask = relief_falloff_create(32);
 *   float f = relief_falloff_get(mask, i, j);
 *   relief_falloff_destroy(mask);
 */

#ifndef RELIEF_FALLOFF_H
#define RELIEF_FALLOFF_H

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Relief_FalloffMask Relief_FalloffMask;

/** Curve exponent */
#define RELIEF_FALLOFF_SHAPE_A 3.0f
/** Curve offset; larger values push the transition towards the border */
#define RELIEF_FALLOFF_SHAPE_B 2.2f

/**
 * Build an n x n mask.
 * Caller OWNS the returned pointer and MUST call relief_falloff_destroy().
 *
 * @param size Cells per side (>= 1)
 * @return Mask, or NULL on invalid size or allocation failure
 */
Relief_FalloffMask *relief_falloff_create(int size);

/** Destroy a mask. Safe to call with NULL. */
void relief_falloff_destroy(Relief_FalloffMask *mask);

/** Cells per side (0 for NULL). */
int relief_falloff_size(const Relief_FalloffMask *mask);

/**
 * Value at cell (i, j), 0 when out of range or mask is NULL.
 */
float relief_falloff_get(const Relief_FalloffMask *mask, int i, int j);

/**
 * Row-major value array (size * size entries). Borrowed.
 */
const float *relief_falloff_data(const Relief_FalloffMask *mask);

/**
 * The attenuation curve d^a / (d^a + (b - b*d)^a) for a Chebyshev distance
 * d in [0, 1].
 */
float relief_falloff_evaluate(float distance);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_FALLOFF_H */
