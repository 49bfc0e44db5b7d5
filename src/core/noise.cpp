/*
 * Relief Noise Source Implementation
 *
 * Gradient Perlin and Simplex noise over a seeded permutation table.
 */

#include "relief/noise.h"
#include "relief/error.h"
#include "relief/log.h"
#include <SDL3/SDL.h>
#include <stdlib.h>
#include <string.h>
#include <math.h>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

/* ============================================================================
 * Constants
 * ============================================================================ */

#define PERM_SIZE 256
#define PERM_MASK 255

/* Simplex skew factors */
static const float F2 = 0.3660254037844386f;  /* (sqrt(3) - 1) / 2 */
static const float G2 = 0.21132486540518713f; /* (3 - sqrt(3)) / 6 */

/* ============================================================================
 * Internal Types
 * ============================================================================ */

struct Relief_Noise {
    uint64_t seed;
    uint8_t perm[PERM_SIZE * 2];     /* Doubled to avoid modulo */
    float grad2[PERM_SIZE][2];
};

/* ============================================================================
 * Internal Helpers
 * ============================================================================ */

static int noise_fastfloor(float x) {
    int xi = (int)x;
    return x < xi ? xi - 1 : xi;
}

/* 6t^5 - 15t^4 + 10t^3 */
static float noise_fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

static float noise_dot2(const float *g, float x, float z) {
    return g[0] * x + g[1] * z;
}

static uint32_t noise_hash(uint32_t x) {
    x = ((x >> 16) ^ x) * 0x45d9f3b;
    x = ((x >> 16) ^ x) * 0x45d9f3b;
    x = (x >> 16) ^ x;
    return x;
}

static void noise_init_tables(Relief_Noise *noise) {
    for (int i = 0; i < PERM_SIZE; i++) {
        noise->perm[i] = (uint8_t)i;
    }

    /* Fisher-Yates shuffle driven by the seed */
    uint32_t rng = (uint32_t)(noise->seed ^ (noise->seed >> 32));
    for (int i = PERM_SIZE - 1; i > 0; i--) {
        rng = noise_hash(rng);
        int j = (int)(rng % (uint32_t)(i + 1));
        uint8_t tmp = noise->perm[i];
        noise->perm[i] = noise->perm[j];
        noise->perm[j] = tmp;
    }

    for (int i = 0; i < PERM_SIZE; i++) {
        noise->perm[PERM_SIZE + i] = noise->perm[i];
    }

    /* Unit gradients evenly spaced on the circle */
    for (int i = 0; i < PERM_SIZE; i++) {
        float angle = (float)i * (2.0f * (float)M_PI / (float)PERM_SIZE);
        noise->grad2[i][0] = cosf(angle);
        noise->grad2[i][1] = sinf(angle);
    }
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Relief_Noise *relief_noise_create(uint64_t seed) {
    Relief_Noise *noise = (Relief_Noise *)calloc(1, sizeof(Relief_Noise));
    if (!noise) {
        relief_set_error("noise: failed to allocate noise generator");
        return NULL;
    }

    noise->seed = seed;
    noise_init_tables(noise);

    return noise;
}

void relief_noise_destroy(Relief_Noise *noise) {
    free(noise);
}

void relief_noise_reseed(Relief_Noise *noise, uint64_t seed) {
    if (!noise) return;
    noise->seed = seed;
    noise_init_tables(noise);
}

uint64_t relief_noise_get_seed(const Relief_Noise *noise) {
    return noise ? noise->seed : 0;
}

uint64_t relief_noise_random_seed(void) {
    uint64_t seed = (uint64_t)SDL_rand(RELIEF_NOISE_RANDOM_SEED_MAX);
    relief_log_debug(RELIEF_LOG_NOISE, "Drew random seed %llu", (unsigned long long)seed);
    return seed;
}

/* ============================================================================
 * Perlin Noise
 * ============================================================================ */

float relief_noise_perlin2d(const Relief_Noise *noise, float x, float z) {
    if (!noise) return 0.0f;

    int X = noise_fastfloor(x);
    int Z = noise_fastfloor(z);

    x -= (float)X;
    z -= (float)Z;

    X &= PERM_MASK;
    Z &= PERM_MASK;

    float u = noise_fade(x);
    float v = noise_fade(z);

    /* Hash the 4 cell corners */
    int aa = noise->perm[X + noise->perm[Z]];
    int ab = noise->perm[X + noise->perm[Z + 1]];
    int ba = noise->perm[X + 1 + noise->perm[Z]];
    int bb = noise->perm[X + 1 + noise->perm[Z + 1]];

    float res = relief_lerp(
        relief_lerp(noise_dot2(noise->grad2[aa], x, z),
                    noise_dot2(noise->grad2[ba], x - 1, z), u),
        relief_lerp(noise_dot2(noise->grad2[ab], x, z - 1),
                    noise_dot2(noise->grad2[bb], x - 1, z - 1), u),
        v);

    /* Scale to [-1, 1] */
    return res * 1.4142135623730951f;
}

/* ============================================================================
 * Simplex Noise
 * ============================================================================ */

float relief_noise_simplex2d(const Relief_Noise *noise, float x, float z) {
    if (!noise) return 0.0f;

    /* Skew input space to find the simplex cell */
    float s = (x + z) * F2;
    int i = noise_fastfloor(x + s);
    int j = noise_fastfloor(z + s);

    float t = (float)(i + j) * G2;
    float x0 = x - ((float)i - t);
    float z0 = z - ((float)j - t);

    int i1, j1;
    if (x0 > z0) {
        i1 = 1; j1 = 0;
    } else {
        i1 = 0; j1 = 1;
    }

    float x1 = x0 - (float)i1 + G2;
    float z1 = z0 - (float)j1 + G2;
    float x2 = x0 - 1.0f + 2.0f * G2;
    float z2 = z0 - 1.0f + 2.0f * G2;

    int ii = i & PERM_MASK;
    int jj = j & PERM_MASK;

    float n0, n1, n2;

    float t0 = 0.5f - x0 * x0 - z0 * z0;
    if (t0 < 0.0f) {
        n0 = 0.0f;
    } else {
        t0 *= t0;
        int gi0 = noise->perm[ii + noise->perm[jj]];
        n0 = t0 * t0 * noise_dot2(noise->grad2[gi0], x0, z0);
    }

    float t1 = 0.5f - x1 * x1 - z1 * z1;
    if (t1 < 0.0f) {
        n1 = 0.0f;
    } else {
        t1 *= t1;
        int gi1 = noise->perm[ii + i1 + noise->perm[jj + j1]];
        n1 = t1 * t1 * noise_dot2(noise->grad2[gi1], x1, z1);
    }

    float t2 = 0.5f - x2 * x2 - z2 * z2;
    if (t2 < 0.0f) {
        n2 = 0.0f;
    } else {
        t2 *= t2;
        int gi2 = noise->perm[ii + 1 + noise->perm[jj + 1]];
        n2 = t2 * t2 * noise_dot2(noise->grad2[gi2], x2, z2);
    }

    return 70.0f * (n0 + n1 + n2);
}

/* ============================================================================
 * Basis Selection
 * ============================================================================ */

float relief_noise_sample(const Relief_Noise *noise, Relief_NoiseType type, float x, float z) {
    float value;
    switch (type) {
        case RELIEF_NOISE_PERLIN:
            value = relief_noise_perlin2d(noise, x, z);
            break;
        default:
            value = relief_noise_simplex2d(noise, x, z);
            break;
    }
    return relief_clamp(value, -1.0f, 1.0f);
}

float relief_noise_sample01(const Relief_Noise *noise, Relief_NoiseType type, float x, float z) {
    return (relief_noise_sample(noise, type, x, z) + 1.0f) * 0.5f;
}

const char *relief_noise_type_name(Relief_NoiseType type) {
    switch (type) {
        case RELIEF_NOISE_SIMPLEX: return "simplex";
        case RELIEF_NOISE_PERLIN:  return "perlin";
    }
    return NULL;
}

bool relief_noise_type_parse(const char *name, Relief_NoiseType *out_type) {
    if (!name || !out_type) return false;

    if (strcmp(name, "simplex") == 0) {
        *out_type = RELIEF_NOISE_SIMPLEX;
        return true;
    }
    if (strcmp(name, "perlin") == 0) {
        *out_type = RELIEF_NOISE_PERLIN;
        return true;
    }
    return false;
}

/* ============================================================================
 * Utility Functions
 * ============================================================================ */

float relief_inverse_lerp(float min, float max, float value) {
    if (!(max > min)) return 0.0f;

    value = relief_clamp(value, min, max);
    return (value - min) / (max - min);
}

float relief_clamp(float value, float min, float max) {
    if (value < min) return min;
    if (value > max) return max;
    return value;
}

float relief_lerp(float a, float b, float t) {
    return a + t * (b - a);
}
