/*
 * Relief Generation Configuration
 *
 * Plain parameter block for one terrain build, with validation, TOML loading
 * and a canonical fingerprint used to detect when a rebuild is needed.
 *
 * Usage:
 *   Relief_GenerationConfig cfg = RELIEF_GENERATION_CONFIG_DEFAULT;
 *   cfg.octaves = 6;
 *
 *   // Or from a file (missing keys keep their defaults)
 *   if (!relief_config_load_file("terrain.toml", &cfg)) {
 *       printf("%s\n", relief_get_last_error());
 *   }
 *
 *   char fp[RELIEF_CONFIG_FINGERPRINT_MAX];
 *   relief_config_fingerprint(&cfg, fp, sizeof(fp));
 *
 * File format (top level or inside a [terrain] table):
 *   grid_extent = 3
 *   tile_size = 256.0
 *   samples_per_tile = 32
 *   octaves = 8
 *   persistence = 0.5
 *   lacunarity = 2.0
 *   height_multiplier = 50.0
 *   noise_scale = 32.0
 *   noise_type = "simplex"      # or "perlin"
 *   normalization = "online"    # or "global"
 *   islands = false
 *   wireframe = false
 *   has_seed = true
 *   seed = 1234
 */

#ifndef RELIEF_CONFIG_H
#define RELIEF_CONFIG_H

#include "relief/noise.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Limits
 * ============================================================================ */

#define RELIEF_CONFIG_MAX_GRID_EXTENT    64
#define RELIEF_CONFIG_MAX_SAMPLES        4096
#define RELIEF_CONFIG_MAX_OCTAVES        16
#define RELIEF_CONFIG_MAX_TOTAL_SAMPLES  (1 << 26)

/**
 * Upper bound on the highest octave's noise frequency
 * (noise_scale * lacunarity^(octaves-1)) and on its amplitude
 * (persistence^(octaves-1)). Keeps lattice coordinates within int range.
 */
#define RELIEF_CONFIG_MAX_FRACTAL_SCALE  16777216.0

/** Buffer size sufficient for any fingerprint */
#define RELIEF_CONFIG_FINGERPRINT_MAX    512

/* ============================================================================
 * Types
 * ============================================================================ */

/** How fractal sums are rescaled into [0, 1] */
typedef enum Relief_NormalizationMode {
    /**
     * Running min/max widened by every sample and applied to that same
     * sample. Early samples see a narrower range than later ones, so results
     * depend on generation order.
     */
    RELIEF_NORMALIZE_ONLINE = 0,
    /** Two passes: raw sums first, then rescale against the true extremes. */
    RELIEF_NORMALIZE_GLOBAL
} Relief_NormalizationMode;

/** Result of relief_config_validate() */
typedef enum Relief_ConfigError {
    RELIEF_CONFIG_OK = 0,
    RELIEF_CONFIG_ERR_NULL,
    RELIEF_CONFIG_ERR_GRID_EXTENT,
    RELIEF_CONFIG_ERR_TILE_SIZE,
    RELIEF_CONFIG_ERR_SAMPLES,
    RELIEF_CONFIG_ERR_OCTAVES,
    RELIEF_CONFIG_ERR_PERSISTENCE,
    RELIEF_CONFIG_ERR_LACUNARITY,
    RELIEF_CONFIG_ERR_HEIGHT_MULTIPLIER,
    RELIEF_CONFIG_ERR_NOISE_SCALE,
    RELIEF_CONFIG_ERR_ENUM
} Relief_ConfigError;

/** Parameters of one terrain build */
typedef struct Relief_GenerationConfig {
    int grid_extent;                 /**< Tiles per side (1-64) */
    float tile_size;                 /**< World units per tile edge (> 0) */
    int samples_per_tile;            /**< Samples per tile edge (1-4096) */
    int octaves;                     /**< Fractal layers (1-16) */
    float persistence;               /**< Amplitude multiplier per octave (> 0) */
    float lacunarity;                /**< Frequency multiplier per octave (> 0) */
    float height_multiplier;         /**< World-space height of a normalized 1.0 */
    float noise_scale;               /**< Noise units spanned by the whole terrain (> 0) */
    Relief_NoiseType noise_type;     /**< Basis function */
    Relief_NormalizationMode normalization;
    bool islands;                    /**< Apply the falloff mask to every tile */
    bool wireframe;                  /**< Render hint, carried for the renderer */
    bool has_seed;                   /**< Use seed; otherwise draw one per build */
    uint64_t seed;
} Relief_GenerationConfig;

/** Default configuration */
#define RELIEF_GENERATION_CONFIG_DEFAULT { \
    .grid_extent = 3, \
    .tile_size = 256.0f, \
    .samples_per_tile = 32, \
    .octaves = 8, \
    .persistence = 0.5f, \
    .lacunarity = 2.0f, \
    .height_multiplier = 50.0f, \
    .noise_scale = 32.0f, \
    .noise_type = RELIEF_NOISE_SIMPLEX, \
    .normalization = RELIEF_NORMALIZE_ONLINE, \
    .islands = false, \
    .wireframe = false, \
    .has_seed = false, \
    .seed = 0 \
}

/* ============================================================================
 * Validation
 * ============================================================================ */

/**
 * Check every field against its documented range.
 * Sets the error message for the first failing field.
 *
 * @return RELIEF_CONFIG_OK or the kind of the first failure
 */
Relief_ConfigError relief_config_validate(const Relief_GenerationConfig *cfg);

/** Short description of an error kind. */
const char *relief_config_error_string(Relief_ConfigError err);

/* ============================================================================
 * Derived Values
 * ============================================================================ */

/**
 * Distance between neighboring samples of a tile. The last sample of a tile
 * lands on the first sample of its neighbor.
 */
float relief_config_cell_spacing(const Relief_GenerationConfig *cfg);

/** grid_extent * tile_size */
float relief_config_terrain_width(const Relief_GenerationConfig *cfg);

/** Name of a normalization mode ("online", "global"), or NULL. */
const char *relief_normalization_name(Relief_NormalizationMode mode);

/** Parse a normalization mode name. out_mode untouched on failure. */
bool relief_normalization_parse(const char *name, Relief_NormalizationMode *out_mode);

/* ============================================================================
 * Fingerprint
 * ============================================================================ */

/**
 * Write the canonical serialization of cfg: a TOML document with every field
 * in fixed order. Two configs with equal field values always produce the
 * same text, and relief_config_load_string() reads it back.
 *
 * @return Number of characters written (excluding terminator), or 0 if the
 *         buffer is too small or an argument is NULL
 */
size_t relief_config_fingerprint(const Relief_GenerationConfig *cfg, char *out, size_t out_size);

/**
 * Field-wise equality. seed is ignored when neither config has has_seed set.
 */
bool relief_config_equals(const Relief_GenerationConfig *a, const Relief_GenerationConfig *b);

/* ============================================================================
 * TOML Loading
 * ============================================================================ */

/**
 * Load configuration from a TOML file into out_cfg.
 * Keys absent from the file keep the value already in out_cfg.
 * out_cfg is untouched on failure.
 */
bool relief_config_load_file(const char *path, Relief_GenerationConfig *out_cfg);

/**
 * Load configuration from a TOML string. Same semantics as the file variant.
 */
bool relief_config_load_string(const char *toml_string, Relief_GenerationConfig *out_cfg);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_CONFIG_H */
