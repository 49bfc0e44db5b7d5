#include "relief/sampler.h"
#include "relief/error.h"
#include "relief/validate.h"
#include <stdlib.h>
#include <math.h>

struct Relief_HeightSampler {
    const Relief_Noise *noise;
    Relief_NoiseType noise_type;
    int octaves;
    float persistence;
    float lacunarity;
    float noise_scale;
    float terrain_width;

    float observed_min;
    float observed_max;
    int sample_count;
};

Relief_HeightSampler *relief_sampler_create(const Relief_Noise *noise,
                                            const Relief_GenerationConfig *cfg) {
    RELIEF_VALIDATE_PTRS2_RET(noise, cfg, NULL);
    if (relief_config_validate(cfg) != RELIEF_CONFIG_OK) return NULL;

    float width = relief_config_terrain_width(cfg);

    Relief_HeightSampler *sampler = (Relief_HeightSampler *)calloc(1, sizeof(Relief_HeightSampler));
    if (!sampler) {
        relief_set_error("sampler: failed to allocate height sampler");
        return NULL;
    }

    sampler->noise = noise;
    sampler->noise_type = cfg->noise_type;
    sampler->octaves = cfg->octaves;
    sampler->persistence = cfg->persistence;
    sampler->lacunarity = cfg->lacunarity;
    sampler->noise_scale = cfg->noise_scale;
    sampler->terrain_width = width;
    relief_sampler_reset(sampler);

    return sampler;
}

void relief_sampler_destroy(Relief_HeightSampler *sampler) {
    free(sampler);
}

float relief_sampler_raw_at(const Relief_HeightSampler *sampler, float world_x, float world_z) {
    if (!sampler) return 0.0f;

    /* Width-normalized so frequency scaling is independent of tile count */
    float nx = world_x / sampler->terrain_width * sampler->noise_scale;
    float nz = world_z / sampler->terrain_width * sampler->noise_scale;

    float amplitude = 1.0f;
    float frequency = 1.0f;
    float accum = 0.0f;

    for (int i = 0; i < sampler->octaves; i++) {
        float value = relief_noise_sample01(sampler->noise, sampler->noise_type,
                                            nx * frequency, nz * frequency);
        accum += value * amplitude;

        amplitude *= sampler->persistence;
        frequency *= sampler->lacunarity;
    }

    return accum;
}

void relief_sampler_observe(Relief_HeightSampler *sampler, float raw) {
    if (!sampler) return;

    if (raw < sampler->observed_min) sampler->observed_min = raw;
    if (raw > sampler->observed_max) sampler->observed_max = raw;
    sampler->sample_count++;
}

float relief_sampler_normalize(const Relief_HeightSampler *sampler, float raw) {
    if (!sampler) return 0.0f;
    return relief_inverse_lerp(sampler->observed_min, sampler->observed_max, raw);
}

float relief_sampler_height_at(Relief_HeightSampler *sampler, float world_x, float world_z) {
    if (!sampler) return 0.0f;

    float raw = relief_sampler_raw_at(sampler, world_x, world_z);
    relief_sampler_observe(sampler, raw);
    return relief_sampler_normalize(sampler, raw);
}

void relief_sampler_get_range(const Relief_HeightSampler *sampler, float *out_min, float *out_max) {
    if (out_min) *out_min = sampler ? sampler->observed_min : INFINITY;
    if (out_max) *out_max = sampler ? sampler->observed_max : -INFINITY;
}

int relief_sampler_get_sample_count(const Relief_HeightSampler *sampler) {
    return sampler ? sampler->sample_count : 0;
}

void relief_sampler_reset(Relief_HeightSampler *sampler) {
    if (!sampler) return;
    sampler->observed_min = INFINITY;
    sampler->observed_max = -INFINITY;
    sampler->sample_count = 0;
}
