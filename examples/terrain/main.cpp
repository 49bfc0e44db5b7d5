/**
 * Relief - Terrain Example
 *
 * Headless walk through the driving loop: every frame the desired
 * configuration is handed to relief_terrain_sync(), which rebuilds only when
 * the configuration fingerprint changes. Each rebuild prints an ASCII map of
 * the classified terrain.
 *
 * Usage:
 *   relief_terrain_demo                  Scripted parameter edits
 *   relief_terrain_demo terrain.toml [N] Reload terrain.toml every 500 ms
 *                                        for N frames (default 20); edit the
 *                                        file while it runs
 *
 * RELIEF_LOG_LEVEL=debug adds one line per tile to each build report.
 *
 * Map legend:  ~ water   . sand   " grass   ^ rock   * snow
 */

#include "relief/relief.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <stdlib.h>

static const int MAP_COLUMNS = 72;
static const char BAND_GLYPHS[RELIEF_MATERIAL_COUNT] = { '~', '.', '"', '^', '*' };

/* Classify the sample nearest to global sample position (gi, gj) */
static Relief_MaterialBand band_at(const Relief_Terrain *terrain, int gi, int gj) {
    const Relief_GenerationConfig *cfg = relief_terrain_get_config(terrain);
    int n = cfg->samples_per_tile;
    int stride = n > 1 ? n - 1 : 1;

    int row = gi / stride, i = gi % stride;
    int col = gj / stride, j = gj % stride;
    if (row >= cfg->grid_extent) { row = cfg->grid_extent - 1; i = n - 1; }
    if (col >= cfg->grid_extent) { col = cfg->grid_extent - 1; j = n - 1; }

    float h = relief_terrain_get_height(terrain, row, col, i, j);
    return relief_material_classify(h, NULL).band;
}

static void print_map(const Relief_Terrain *terrain) {
    const Relief_GenerationConfig *cfg = relief_terrain_get_config(terrain);
    int n = cfg->samples_per_tile;
    int stride = n > 1 ? n - 1 : 1;
    int extent = cfg->grid_extent * stride + (n > 1 ? 1 : 0);

    int columns = extent < MAP_COLUMNS ? extent : MAP_COLUMNS;
    int rows = columns / 2 > 0 ? columns / 2 : 1;

    int counts[RELIEF_MATERIAL_COUNT] = {0};

    for (int r = 0; r < rows; r++) {
        char line[MAP_COLUMNS + 1];
        for (int c = 0; c < columns; c++) {
            int gi = (int)((long long)r * (extent - 1) / (rows > 1 ? rows - 1 : 1));
            int gj = (int)((long long)c * (extent - 1) / (columns > 1 ? columns - 1 : 1));
            Relief_MaterialBand band = band_at(terrain, gi, gj);
            counts[band]++;
            line[c] = BAND_GLYPHS[band];
        }
        line[columns] = '\0';
        printf("  %s\n", line);
    }

    printf("  ");
    for (int b = 0; b < RELIEF_MATERIAL_COUNT; b++) {
        printf("%s %d%%  ", relief_material_name((Relief_MaterialBand)b),
               counts[b] * 100 / (rows * columns));
    }
    printf("\n\n");
}

static void report(const Relief_Terrain *terrain, Relief_SyncResult result, int frame) {
    switch (result) {
        case RELIEF_SYNC_UNCHANGED:
            SDL_Log("frame %d: unchanged", frame);
            return;
        case RELIEF_SYNC_FAILED:
            SDL_Log("frame %d: rebuild failed: %s", frame, relief_get_last_error());
            return;
        case RELIEF_SYNC_REBUILT:
            break;
    }

    float lo, hi;
    relief_terrain_get_height_range(terrain, &lo, &hi);
    SDL_Log("frame %d: rebuilt %d tiles, seed %llu, raw range [%.3f, %.3f]",
            frame, relief_terrain_get_tile_count(terrain),
            (unsigned long long)relief_terrain_get_seed(terrain), (double)lo, (double)hi);
    print_map(terrain);
}

static int run_scripted(Relief_Terrain *terrain, Relief_GenerationConfig cfg) {
    /* Frame-by-frame edits, as a parameter panel would make them */
    for (int frame = 0; frame < 6; frame++) {
        switch (frame) {
            case 2: cfg.islands = true; break;
            case 3: cfg.octaves = 0; break;          /* invalid: previous terrain stays */
            case 4: cfg.octaves = 4; cfg.normalization = RELIEF_NORMALIZE_GLOBAL; break;
            default: break;
        }
        report(terrain, relief_terrain_sync(terrain, &cfg), frame);
    }

    /* "New seed" action */
    if (!relief_terrain_regenerate(terrain)) {
        SDL_Log("regenerate failed: %s", relief_get_last_error());
        return 1;
    }
    report(terrain, RELIEF_SYNC_REBUILT, 6);
    return 0;
}

static int run_watch(Relief_Terrain *terrain, const char *path, Relief_GenerationConfig cfg, int frames) {
    Relief_GenerationConfig desired = cfg;
    for (int frame = 0; frame < frames; frame++) {
        /* Keys removed from the file fall back to the defaults; a broken file keeps the last good config */
        Relief_GenerationConfig loaded = cfg;
        if (relief_config_load_file(path, &loaded)) {
            desired = loaded;
        } else {
            relief_log_and_clear_error(RELIEF_LOG_CONFIG);
        }
        report(terrain, relief_terrain_sync(terrain, &desired), frame);
        SDL_Delay(500);
    }
    return relief_terrain_is_built(terrain) ? 0 : 1;
}

int main(int argc, char **argv) {
    relief_log_init();

    Relief_LogLevel level;
    const char *level_name = SDL_getenv("RELIEF_LOG_LEVEL");
    if (level_name) {
        if (relief_log_level_parse(level_name, &level)) {
            relief_log_set_level(level);
        } else {
            relief_log_warning(RELIEF_LOG_CORE, "unknown log level '%s'", level_name);
        }
    }

    Relief_GenerationConfig cfg = RELIEF_GENERATION_CONFIG_DEFAULT;
    cfg.samples_per_tile = 25;
    cfg.has_seed = true;
    cfg.seed = 1234;

    Relief_Terrain *terrain = relief_terrain_create_empty();
    if (!terrain) {
        SDL_Log("Failed to create terrain: %s", relief_get_last_error());
        relief_log_shutdown();
        return 1;
    }

    int status;
    if (argc > 1) {
        int frames = argc > 2 ? atoi(argv[2]) : 20;
        status = run_watch(terrain, argv[1], cfg, frames > 0 ? frames : 1);
    } else {
        status = run_scripted(terrain, cfg);
    }

    relief_terrain_destroy(terrain);
    relief_log_shutdown();
    return status;
}
