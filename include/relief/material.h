/*
 * Relief Material Classifier
 *
 * Maps a normalized height to a visual material band and the elevation the
 * renderer should place the vertex at. Water is flattened: any height below
 * the water threshold is raised to water_floor, giving a flat sea surface.
 *
 * Usage:
 *   Relief_MaterialSample s = relief_material_classify(h, NULL);
 *   float y = relief_material_elevation(s, cfg.height_multiplier);
 *   uint32_t rgb = relief_material_color(s.band);
 */

#ifndef RELIEF_MATERIAL_H
#define RELIEF_MATERIAL_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum Relief_MaterialBand {
    RELIEF_MATERIAL_WATER = 0,
    RELIEF_MATERIAL_SAND,
    RELIEF_MATERIAL_GRASS,
    RELIEF_MATERIAL_ROCK,
    RELIEF_MATERIAL_SNOW,
    RELIEF_MATERIAL_COUNT
} Relief_MaterialBand;

/**
 * Upper bounds (exclusive) of each band below snow. A height h belongs to
 * the first band whose threshold is strictly greater than h.
 */
typedef struct Relief_MaterialConfig {
    float water;        /**< h < water is WATER */
    float sand;         /**< h < sand is SAND */
    float grass;        /**< h < grass is GRASS */
    float rock;         /**< h < rock is ROCK, anything above is SNOW */
    float water_floor;  /**< Elevation given to water samples (at least) */
} Relief_MaterialConfig;

#define RELIEF_MATERIAL_DEFAULT { \
    .water = 0.45f, \
    .sand = 0.5f, \
    .grass = 0.7f, \
    .rock = 0.9f, \
    .water_floor = 0.45f \
}

typedef struct Relief_MaterialSample {
    Relief_MaterialBand band;
    float clamped_height;   /**< max(height, water_floor) for water, height otherwise */
} Relief_MaterialSample;

/**
 * Classify a normalized height. Total: every float maps to a band
 * (NaN falls through to snow).
 *
 * @param height Normalized height, nominally [0, 1]
 * @param cfg Thresholds, or NULL for RELIEF_MATERIAL_DEFAULT
 */
Relief_MaterialSample relief_material_classify(float height, const Relief_MaterialConfig *cfg);

/** World-space elevation of a classified sample. */
float relief_material_elevation(Relief_MaterialSample sample, float height_multiplier);

/**
 * Check that thresholds are ascending and inside [0, 1].
 * Sets the error message on failure.
 */
bool relief_material_config_validate(const Relief_MaterialConfig *cfg);

/**
 * Classify an array of heights.
 *
 * @return Number of samples written (count), 0 on invalid arguments
 */
int relief_material_classify_array(const float *heights, int count,
                                   const Relief_MaterialConfig *cfg,
                                   Relief_MaterialSample *out_samples);

/** Packed 0xRRGGBB color of a band (0 for an unknown band). */
uint32_t relief_material_color(Relief_MaterialBand band);

/** Band color as three floats in [0, 1]. */
void relief_material_color_rgb(Relief_MaterialBand band, float *out_r, float *out_g, float *out_b);

/** Lowercase band name ("water", "sand", ...), "unknown" otherwise. */
const char *relief_material_name(Relief_MaterialBand band);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_MATERIAL_H */
