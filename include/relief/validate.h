#ifndef RELIEF_VALIDATE_H
#define RELIEF_VALIDATE_H

#include "relief/error.h"
#include <stdbool.h>
#include <stddef.h>

/**
 * Relief Validation Macros
 *
 * Early-return argument checks that report through relief_set_error().
 *
 * Usage:
 *   Relief_Tile *make(const Relief_GenerationConfig *cfg, int row) {
 *       RELIEF_VALIDATE_PTR_RET(cfg, NULL);
 *       RELIEF_VALIDATE_RANGE_RET(row, 0, cfg->grid_extent - 1, NULL);
 *       ...
 *   }
 */

/*============================================================================
 * Pointer Validation
 *============================================================================*/

/**
 * Validate pointer is not NULL (with return value).
 */
#define RELIEF_VALIDATE_PTR_RET(ptr, ret) \
    do { \
        if (!(ptr)) { \
            relief_set_error("%s: null pointer: %s", __func__, #ptr); \
            return (ret); \
        } \
    } while(0)

/**
 * Validate two pointers (with return value).
 */
#define RELIEF_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        if (!(p1)) { relief_set_error("%s: null pointer: %s", __func__, #p1); return (ret); } \
        if (!(p2)) { relief_set_error("%s: null pointer: %s", __func__, #p2); return (ret); } \
    } while(0)

/*============================================================================
 * Range Validation
 *============================================================================*/

/**
 * Validate integer value is within range [min, max] (with return value).
 */
#define RELIEF_VALIDATE_RANGE_RET(val, min, max, ret) \
    do { \
        if ((val) < (min) || (val) > (max)) { \
            relief_set_error("%s: %s out of range [%d, %d]: %d", \
                             __func__, #val, (int)(min), (int)(max), (int)(val)); \
            return (ret); \
        } \
    } while(0)

/**
 * Validate value is positive (> 0).
 */
#define RELIEF_VALIDATE_POSITIVE_RET(val, ret) \
    do { \
        if ((val) <= 0) { \
            relief_set_error("%s: %s must be positive: %d", __func__, #val, (int)(val)); \
            return (ret); \
        } \
    } while(0)

/*============================================================================
 * String Validation
 *============================================================================*/

/**
 * Validate string is not NULL or empty (with return value).
 */
#define RELIEF_VALIDATE_STRING_RET(str, ret) \
    do { \
        if (!(str) || (str)[0] == '\0') { \
            relief_set_error("%s: null or empty string: %s", __func__, #str); \
            return (ret); \
        } \
    } while(0)

/*============================================================================
 * Condition Validation
 *============================================================================*/

/**
 * Validate arbitrary condition (with return value).
 */
#define RELIEF_VALIDATE_COND_RET(cond, msg, ret) \
    do { \
        if (!(cond)) { \
            relief_set_error("%s: %s", __func__, (msg)); \
            return (ret); \
        } \
    } while(0)

#endif /* RELIEF_VALIDATE_H */
