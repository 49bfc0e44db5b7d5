#include "relief/falloff.h"
#include "relief/error.h"
#include "relief/validate.h"
#include <stdlib.h>
#include <math.h>

struct Relief_FalloffMask {
    int size;
    float *values;
};

/* Map cell index to [-1, 1]; the single-cell grid sits at the center */
static float falloff_axis(int index, int size) {
    if (size <= 1) return 0.0f;
    return (float)index / (float)(size - 1) * 2.0f - 1.0f;
}

float relief_falloff_evaluate(float distance) {
    const float a = RELIEF_FALLOFF_SHAPE_A;
    const float b = RELIEF_FALLOFF_SHAPE_B;

    float d = distance < 0.0f ? 0.0f : (distance > 1.0f ? 1.0f : distance);
    float num = powf(d, a);
    float den = num + powf(b - b * d, a);
    if (den <= 0.0f) return 0.0f;
    return num / den;
}

Relief_FalloffMask *relief_falloff_create(int size) {
    RELIEF_VALIDATE_POSITIVE_RET(size, NULL);

    Relief_FalloffMask *mask = (Relief_FalloffMask *)calloc(1, sizeof(Relief_FalloffMask));
    if (!mask) {
        relief_set_error("falloff: failed to allocate mask");
        return NULL;
    }

    mask->values = (float *)calloc((size_t)size * (size_t)size, sizeof(float));
    if (!mask->values) {
        relief_set_error("falloff: failed to allocate %dx%d values", size, size);
        free(mask);
        return NULL;
    }
    mask->size = size;

    for (int i = 0; i < size; i++) {
        for (int j = 0; j < size; j++) {
            float x = falloff_axis(i, size);
            float y = falloff_axis(j, size);
            float d = fmaxf(fabsf(x), fabsf(y));
            mask->values[i * size + j] = relief_falloff_evaluate(d);
        }
    }

    return mask;
}

void relief_falloff_destroy(Relief_FalloffMask *mask) {
    if (!mask) return;
    free(mask->values);
    free(mask);
}

int relief_falloff_size(const Relief_FalloffMask *mask) {
    return mask ? mask->size : 0;
}

float relief_falloff_get(const Relief_FalloffMask *mask, int i, int j) {
    if (!mask) return 0.0f;
    if (i < 0 || j < 0 || i >= mask->size || j >= mask->size) return 0.0f;
    return mask->values[i * mask->size + j];
}

const float *relief_falloff_data(const Relief_FalloffMask *mask) {
    return mask ? mask->values : NULL;
}
