#include "relief/material.h"
#include "relief/error.h"
#include "relief/log.h"
#include "relief/validate.h"

static const Relief_MaterialConfig s_default_config = RELIEF_MATERIAL_DEFAULT;

static const uint32_t s_band_colors[RELIEF_MATERIAL_COUNT] = {
    0x4169e1,   /* water: royal blue */
    0xeee8aa,   /* sand: pale goldenrod */
    0x2e8b57,   /* grass: sea green */
    0x696969,   /* rock: dim gray */
    0xfffafa    /* snow */
};

static const char *s_band_names[RELIEF_MATERIAL_COUNT] = {
    "water", "sand", "grass", "rock", "snow"
};

static bool band_valid(Relief_MaterialBand band) {
    return band >= RELIEF_MATERIAL_WATER && band < RELIEF_MATERIAL_COUNT;
}

Relief_MaterialSample relief_material_classify(float height, const Relief_MaterialConfig *cfg) {
    if (!cfg) cfg = &s_default_config;

    Relief_MaterialSample sample;
    sample.clamped_height = height;

    if (height < cfg->water) {
        sample.band = RELIEF_MATERIAL_WATER;
        if (sample.clamped_height < cfg->water_floor) {
            sample.clamped_height = cfg->water_floor;
        }
    } else if (height < cfg->sand) {
        sample.band = RELIEF_MATERIAL_SAND;
    } else if (height < cfg->grass) {
        sample.band = RELIEF_MATERIAL_GRASS;
    } else if (height < cfg->rock) {
        sample.band = RELIEF_MATERIAL_ROCK;
    } else {
        sample.band = RELIEF_MATERIAL_SNOW;
    }

    return sample;
}

float relief_material_elevation(Relief_MaterialSample sample, float height_multiplier) {
    return sample.clamped_height * height_multiplier;
}

bool relief_material_config_validate(const Relief_MaterialConfig *cfg) {
    RELIEF_VALIDATE_PTR_RET(cfg, false);

    const float bounds[] = { 0.0f, cfg->water, cfg->sand, cfg->grass, cfg->rock, 1.0f };
    for (int i = 1; i < (int)(sizeof(bounds) / sizeof(bounds[0])); i++) {
        if (!(bounds[i] >= bounds[i - 1])) {
            relief_set_error("material: thresholds must ascend within [0, 1] "
                             "(water %.3f, sand %.3f, grass %.3f, rock %.3f)",
                             (double)cfg->water, (double)cfg->sand,
                             (double)cfg->grass, (double)cfg->rock);
            return false;
        }
    }

    if (!(cfg->water_floor >= 0.0f && cfg->water_floor <= 1.0f)) {
        relief_set_error("material: water_floor %.3f outside [0, 1]", (double)cfg->water_floor);
        return false;
    }

    return true;
}

int relief_material_classify_array(const float *heights, int count,
                                   const Relief_MaterialConfig *cfg,
                                   Relief_MaterialSample *out_samples) {
    RELIEF_VALIDATE_PTRS2_RET(heights, out_samples, 0);
    RELIEF_VALIDATE_POSITIVE_RET(count, 0);

    if (cfg && !relief_material_config_validate(cfg)) {
        relief_log_warning(RELIEF_LOG_MATERIAL, "Classifying with suspect thresholds: %s",
                           relief_get_last_error());
    }

    for (int i = 0; i < count; i++) {
        out_samples[i] = relief_material_classify(heights[i], cfg);
    }
    return count;
}

uint32_t relief_material_color(Relief_MaterialBand band) {
    if (!band_valid(band)) return 0;
    return s_band_colors[band];
}

void relief_material_color_rgb(Relief_MaterialBand band, float *out_r, float *out_g, float *out_b) {
    uint32_t rgb = relief_material_color(band);
    if (out_r) *out_r = (float)((rgb >> 16) & 0xff) / 255.0f;
    if (out_g) *out_g = (float)((rgb >> 8) & 0xff) / 255.0f;
    if (out_b) *out_b = (float)(rgb & 0xff) / 255.0f;
}

const char *relief_material_name(Relief_MaterialBand band) {
    if (!band_valid(band)) return "unknown";
    return s_band_names[band];
}
