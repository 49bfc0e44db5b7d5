#ifndef RELIEF_H
#define RELIEF_H

#include <stdbool.h>
#include <stdint.h>

// Version info
#define RELIEF_VERSION_MAJOR 0
#define RELIEF_VERSION_MINOR 1
#define RELIEF_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    Functions named `relief_*_create()` return pointers the caller OWNS and
 *    MUST release with the matching `relief_*_destroy()`. Every destroy
 *    function accepts NULL.
 *
 * 2. BORROWED POINTERS:
 *    Tiles, height arrays, configs and fingerprints returned by
 *    `relief_terrain_*` queries are owned by the terrain. They stay valid
 *    until the next build, sync rebuild, regenerate, teardown or destroy.
 *
 * 3. ERRORS:
 *    Functions that can fail return NULL, false or 0 and leave a message in
 *    relief_get_last_error() (thread-local).
 */

#include "relief/error.h"
#include "relief/log.h"
#include "relief/noise.h"
#include "relief/falloff.h"
#include "relief/config.h"
#include "relief/sampler.h"
#include "relief/tile.h"
#include "relief/terrain.h"
#include "relief/material.h"

#endif /* RELIEF_H */
