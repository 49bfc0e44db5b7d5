#include "relief/config.h"
#include "relief/error.h"
#include "relief/log.h"
#include "relief/validate.h"
#include "toml.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <limits.h>
#include <math.h>

static const char *const KNOWN_KEYS[] = {
    "grid_extent", "tile_size", "samples_per_tile", "octaves", "persistence",
    "lacunarity", "height_multiplier", "noise_scale", "noise_type",
    "normalization", "islands", "wireframe", "has_seed", "seed"
};

/* ============================================================================
 * Validation
 * ============================================================================ */

static bool config_positive_finite(float v) {
    return isfinite(v) && v > 0.0f;
}

Relief_ConfigError relief_config_validate(const Relief_GenerationConfig *cfg) {
    if (!cfg) {
        relief_set_error("config: null configuration");
        return RELIEF_CONFIG_ERR_NULL;
    }

    if (cfg->grid_extent < 1 || cfg->grid_extent > RELIEF_CONFIG_MAX_GRID_EXTENT) {
        relief_set_error("config: grid_extent out of range [1, %d]: %d",
                         RELIEF_CONFIG_MAX_GRID_EXTENT, cfg->grid_extent);
        return RELIEF_CONFIG_ERR_GRID_EXTENT;
    }
    if (!config_positive_finite(cfg->tile_size)) {
        relief_set_error("config: tile_size must be positive and finite: %g", (double)cfg->tile_size);
        return RELIEF_CONFIG_ERR_TILE_SIZE;
    }
    if (cfg->samples_per_tile < 1 || cfg->samples_per_tile > RELIEF_CONFIG_MAX_SAMPLES) {
        relief_set_error("config: samples_per_tile out of range [1, %d]: %d",
                         RELIEF_CONFIG_MAX_SAMPLES, cfg->samples_per_tile);
        return RELIEF_CONFIG_ERR_SAMPLES;
    }

    long long per_side = (long long)cfg->grid_extent * (long long)cfg->samples_per_tile;
    if (per_side * per_side > (long long)RELIEF_CONFIG_MAX_TOTAL_SAMPLES) {
        relief_set_error("config: %d tiles of %d samples exceeds %d total samples",
                         cfg->grid_extent * cfg->grid_extent, cfg->samples_per_tile * cfg->samples_per_tile,
                         RELIEF_CONFIG_MAX_TOTAL_SAMPLES);
        return RELIEF_CONFIG_ERR_SAMPLES;
    }

    if (cfg->octaves < 1 || cfg->octaves > RELIEF_CONFIG_MAX_OCTAVES) {
        relief_set_error("config: octaves out of range [1, %d]: %d",
                         RELIEF_CONFIG_MAX_OCTAVES, cfg->octaves);
        return RELIEF_CONFIG_ERR_OCTAVES;
    }
    if (!config_positive_finite(cfg->persistence)) {
        relief_set_error("config: persistence must be positive and finite: %g", (double)cfg->persistence);
        return RELIEF_CONFIG_ERR_PERSISTENCE;
    }
    if (!config_positive_finite(cfg->lacunarity)) {
        relief_set_error("config: lacunarity must be positive and finite: %g", (double)cfg->lacunarity);
        return RELIEF_CONFIG_ERR_LACUNARITY;
    }
    if (!isfinite(cfg->height_multiplier)) {
        relief_set_error("config: height_multiplier must be finite");
        return RELIEF_CONFIG_ERR_HEIGHT_MULTIPLIER;
    }
    if (!config_positive_finite(cfg->noise_scale)) {
        relief_set_error("config: noise_scale must be positive and finite: %g", (double)cfg->noise_scale);
        return RELIEF_CONFIG_ERR_NOISE_SCALE;
    }
    /* Highest octave; lacunarity and persistence below 1 only shrink it */
    double top = (double)(cfg->octaves - 1);
    double max_frequency = (double)cfg->noise_scale * pow(fmax((double)cfg->lacunarity, 1.0), top);
    if (!(max_frequency <= RELIEF_CONFIG_MAX_FRACTAL_SCALE)) {
        relief_set_error("config: noise_scale %g with lacunarity %g over %d octaves reaches frequency %g (max %g)",
                         (double)cfg->noise_scale, (double)cfg->lacunarity, cfg->octaves,
                         max_frequency, RELIEF_CONFIG_MAX_FRACTAL_SCALE);
        return cfg->noise_scale > RELIEF_CONFIG_MAX_FRACTAL_SCALE ? RELIEF_CONFIG_ERR_NOISE_SCALE
                                                                  : RELIEF_CONFIG_ERR_LACUNARITY;
    }
    double max_amplitude = pow(fmax((double)cfg->persistence, 1.0), top);
    if (!(max_amplitude <= RELIEF_CONFIG_MAX_FRACTAL_SCALE)) {
        relief_set_error("config: persistence %g over %d octaves reaches amplitude %g (max %g)",
                         (double)cfg->persistence, cfg->octaves, max_amplitude,
                         RELIEF_CONFIG_MAX_FRACTAL_SCALE);
        return RELIEF_CONFIG_ERR_PERSISTENCE;
    }

    if (!relief_noise_type_name(cfg->noise_type)) {
        relief_set_error("config: unknown noise_type: %d", (int)cfg->noise_type);
        return RELIEF_CONFIG_ERR_ENUM;
    }
    if (!relief_normalization_name(cfg->normalization)) {
        relief_set_error("config: unknown normalization: %d", (int)cfg->normalization);
        return RELIEF_CONFIG_ERR_ENUM;
    }

    return RELIEF_CONFIG_OK;
}

const char *relief_config_error_string(Relief_ConfigError err) {
    switch (err) {
        case RELIEF_CONFIG_OK:                    return "ok";
        case RELIEF_CONFIG_ERR_NULL:              return "null configuration";
        case RELIEF_CONFIG_ERR_GRID_EXTENT:       return "invalid grid_extent";
        case RELIEF_CONFIG_ERR_TILE_SIZE:         return "invalid tile_size";
        case RELIEF_CONFIG_ERR_SAMPLES:           return "invalid samples_per_tile";
        case RELIEF_CONFIG_ERR_OCTAVES:           return "invalid octaves";
        case RELIEF_CONFIG_ERR_PERSISTENCE:       return "invalid persistence";
        case RELIEF_CONFIG_ERR_LACUNARITY:        return "invalid lacunarity";
        case RELIEF_CONFIG_ERR_HEIGHT_MULTIPLIER: return "invalid height_multiplier";
        case RELIEF_CONFIG_ERR_NOISE_SCALE:       return "invalid noise_scale";
        case RELIEF_CONFIG_ERR_ENUM:              return "invalid enumeration value";
    }
    return "unknown";
}

/* ============================================================================
 * Derived Values
 * ============================================================================ */

float relief_config_cell_spacing(const Relief_GenerationConfig *cfg) {
    if (!cfg) return 0.0f;
    if (cfg->samples_per_tile <= 1) return cfg->tile_size;
    return cfg->tile_size / (float)(cfg->samples_per_tile - 1);
}

float relief_config_terrain_width(const Relief_GenerationConfig *cfg) {
    if (!cfg) return 0.0f;
    return (float)cfg->grid_extent * cfg->tile_size;
}

const char *relief_normalization_name(Relief_NormalizationMode mode) {
    switch (mode) {
        case RELIEF_NORMALIZE_ONLINE: return "online";
        case RELIEF_NORMALIZE_GLOBAL: return "global";
    }
    return NULL;
}

bool relief_normalization_parse(const char *name, Relief_NormalizationMode *out_mode) {
    if (!name || !out_mode) return false;

    if (strcmp(name, "online") == 0) {
        *out_mode = RELIEF_NORMALIZE_ONLINE;
        return true;
    }
    if (strcmp(name, "global") == 0) {
        *out_mode = RELIEF_NORMALIZE_GLOBAL;
        return true;
    }
    return false;
}

/* ============================================================================
 * Fingerprint
 * ============================================================================ */

/* %.9g round-trips a float; TOML needs a '.' or exponent to read it as float */
static void format_float(char *buf, size_t size, float value) {
    snprintf(buf, size, "%.9g", (double)value);
    if (!strpbrk(buf, ".eEni")) {
        size_t len = strlen(buf);
        if (len + 2 < size) {
            buf[len] = '.';
            buf[len + 1] = '0';
            buf[len + 2] = '\0';
        }
    }
}

size_t relief_config_fingerprint(const Relief_GenerationConfig *cfg, char *out, size_t out_size) {
    if (!cfg || !out || out_size == 0) return 0;

    char tile_size[32], persistence[32], lacunarity[32], height_mult[32], noise_scale[32];
    format_float(tile_size, sizeof(tile_size), cfg->tile_size);
    format_float(persistence, sizeof(persistence), cfg->persistence);
    format_float(lacunarity, sizeof(lacunarity), cfg->lacunarity);
    format_float(height_mult, sizeof(height_mult), cfg->height_multiplier);
    format_float(noise_scale, sizeof(noise_scale), cfg->noise_scale);

    const char *noise_type = relief_noise_type_name(cfg->noise_type);
    const char *normalization = relief_normalization_name(cfg->normalization);

    /* Seed is only meaningful when explicit */
    long long seed = cfg->has_seed ? (long long)cfg->seed : 0;

    int written = snprintf(out, out_size,
        "grid_extent = %d\n"
        "tile_size = %s\n"
        "samples_per_tile = %d\n"
        "octaves = %d\n"
        "persistence = %s\n"
        "lacunarity = %s\n"
        "height_multiplier = %s\n"
        "noise_scale = %s\n"
        "noise_type = \"%s\"\n"
        "normalization = \"%s\"\n"
        "islands = %s\n"
        "wireframe = %s\n"
        "has_seed = %s\n"
        "seed = %lld\n",
        cfg->grid_extent,
        tile_size,
        cfg->samples_per_tile,
        cfg->octaves,
        persistence,
        lacunarity,
        height_mult,
        noise_scale,
        noise_type ? noise_type : "invalid",
        normalization ? normalization : "invalid",
        cfg->islands ? "true" : "false",
        cfg->wireframe ? "true" : "false",
        cfg->has_seed ? "true" : "false",
        seed);

    if (written < 0 || (size_t)written >= out_size) {
        out[0] = '\0';
        return 0;
    }
    return (size_t)written;
}

bool relief_config_equals(const Relief_GenerationConfig *a, const Relief_GenerationConfig *b) {
    if (!a || !b) return false;
    if (a == b) return true;

    if (a->has_seed != b->has_seed) return false;
    if (a->has_seed && a->seed != b->seed) return false;

    return a->grid_extent == b->grid_extent &&
           a->tile_size == b->tile_size &&
           a->samples_per_tile == b->samples_per_tile &&
           a->octaves == b->octaves &&
           a->persistence == b->persistence &&
           a->lacunarity == b->lacunarity &&
           a->height_multiplier == b->height_multiplier &&
           a->noise_scale == b->noise_scale &&
           a->noise_type == b->noise_type &&
           a->normalization == b->normalization &&
           a->islands == b->islands &&
           a->wireframe == b->wireframe;
}

/* ============================================================================
 * TOML Loading
 * ============================================================================ */

static bool config_read_int(toml_table_t *table, const char *key, int *out) {
    if (!toml_raw_in(table, key)) return true;

    toml_datum_t d = toml_int_in(table, key);
    if (!d.ok || d.u.i < INT_MIN || d.u.i > INT_MAX) {
        relief_set_error("config: '%s' must be an integer", key);
        return false;
    }
    *out = (int)d.u.i;
    return true;
}

static bool config_read_float(toml_table_t *table, const char *key, float *out) {
    if (!toml_raw_in(table, key)) return true;

    toml_datum_t d = toml_double_in(table, key);
    if (d.ok) {
        *out = (float)d.u.d;
        return true;
    }

    d = toml_int_in(table, key);
    if (d.ok) {
        *out = (float)d.u.i;
        return true;
    }

    relief_set_error("config: '%s' must be a number", key);
    return false;
}

static bool config_read_bool(toml_table_t *table, const char *key, bool *out) {
    if (!toml_raw_in(table, key)) return true;

    toml_datum_t d = toml_bool_in(table, key);
    if (!d.ok) {
        relief_set_error("config: '%s' must be a boolean", key);
        return false;
    }
    *out = d.u.b != 0;
    return true;
}

static bool config_read_seed(toml_table_t *table, uint64_t *out) {
    if (!toml_raw_in(table, "seed")) return true;

    toml_datum_t d = toml_int_in(table, "seed");
    if (!d.ok) {
        relief_set_error("config: 'seed' must be an integer");
        return false;
    }
    *out = (uint64_t)d.u.i;
    return true;
}

static bool config_read_noise_type(toml_table_t *table, Relief_NoiseType *out) {
    if (!toml_raw_in(table, "noise_type")) return true;

    toml_datum_t d = toml_string_in(table, "noise_type");
    if (!d.ok) {
        relief_set_error("config: 'noise_type' must be a string");
        return false;
    }

    bool ok = relief_noise_type_parse(d.u.s, out);
    if (!ok) {
        relief_set_error("config: unknown noise_type '%s'", d.u.s);
    }
    free(d.u.s);
    return ok;
}

static bool config_read_normalization(toml_table_t *table, Relief_NormalizationMode *out) {
    if (!toml_raw_in(table, "normalization")) return true;

    toml_datum_t d = toml_string_in(table, "normalization");
    if (!d.ok) {
        relief_set_error("config: 'normalization' must be a string");
        return false;
    }

    bool ok = relief_normalization_parse(d.u.s, out);
    if (!ok) {
        relief_set_error("config: unknown normalization '%s'", d.u.s);
    }
    free(d.u.s);
    return ok;
}

static void config_warn_unknown_keys(toml_table_t *table) {
    const char *key;
    int i = 0;
    while ((key = toml_key_in(table, i++)) != NULL) {
        bool known = false;
        for (size_t k = 0; k < sizeof(KNOWN_KEYS) / sizeof(KNOWN_KEYS[0]); k++) {
            if (strcmp(key, KNOWN_KEYS[k]) == 0) {
                known = true;
                break;
            }
        }
        if (!known && strcmp(key, "terrain") != 0) {
            relief_log_warning(RELIEF_LOG_CONFIG, "Ignoring unknown key '%s'", key);
        }
    }
}

static bool config_apply_table(toml_table_t *root, Relief_GenerationConfig *out_cfg) {
    toml_table_t *table = toml_table_in(root, "terrain");
    if (!table) {
        table = root;
    }

    config_warn_unknown_keys(table);

    Relief_GenerationConfig cfg = *out_cfg;

    if (!config_read_int(table, "grid_extent", &cfg.grid_extent)) return false;
    if (!config_read_float(table, "tile_size", &cfg.tile_size)) return false;
    if (!config_read_int(table, "samples_per_tile", &cfg.samples_per_tile)) return false;
    if (!config_read_int(table, "octaves", &cfg.octaves)) return false;
    if (!config_read_float(table, "persistence", &cfg.persistence)) return false;
    if (!config_read_float(table, "lacunarity", &cfg.lacunarity)) return false;
    if (!config_read_float(table, "height_multiplier", &cfg.height_multiplier)) return false;
    if (!config_read_float(table, "noise_scale", &cfg.noise_scale)) return false;
    if (!config_read_noise_type(table, &cfg.noise_type)) return false;
    if (!config_read_normalization(table, &cfg.normalization)) return false;
    if (!config_read_bool(table, "islands", &cfg.islands)) return false;
    if (!config_read_bool(table, "wireframe", &cfg.wireframe)) return false;
    if (!config_read_bool(table, "has_seed", &cfg.has_seed)) return false;
    if (!config_read_seed(table, &cfg.seed)) return false;

    *out_cfg = cfg;
    return true;
}

bool relief_config_load_file(const char *path, Relief_GenerationConfig *out_cfg) {
    RELIEF_VALIDATE_STRING_RET(path, false);
    RELIEF_VALIDATE_PTR_RET(out_cfg, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        relief_set_error("config: cannot open '%s'", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        relief_set_error("config: parse error in '%s': %s", path, errbuf);
        return false;
    }

    bool ok = config_apply_table(root, out_cfg);
    toml_free(root);

    if (ok) {
        relief_log_debug(RELIEF_LOG_CONFIG, "Loaded configuration from %s", path);
    }
    return ok;
}

bool relief_config_load_string(const char *toml_string, Relief_GenerationConfig *out_cfg) {
    RELIEF_VALIDATE_PTRS2_RET(toml_string, out_cfg, false);

    /* toml_parse needs a mutable string */
    char *copy = strdup(toml_string);
    if (!copy) {
        relief_set_error("config: out of memory");
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse(copy, errbuf, sizeof(errbuf));
    free(copy);

    if (!root) {
        relief_set_error("config: parse error: %s", errbuf);
        return false;
    }

    bool ok = config_apply_table(root, out_cfg);
    toml_free(root);
    return ok;
}
