#ifndef MATCHTAPE_CONFIG_H
#define MATCHTAPE_CONFIG_H

#include "matchtape/host.h"
#include "matchtape/kinds.h"
#include "matchtape/log.h"
#include "matchtape/recording.h"
#include <stdbool.h>

/**
 * @file config.h
 * @brief TOML configuration for sessions, replay tuning and logging
 *
 * Example:
 *   [session]
 *   name = "arena"
 *   save_dir = "recordings"
 *   autorecord = false
 *
 *   [replay]
 *   snap_threshold = 4.0
 *   spectator_team = 200
 *   appearance_kinds = ["knight", "archer", "builder"]
 *
 *   [log]
 *   path = "matchtape.log"
 *   level = "info"
 *   console = true
 *
 * Every key is optional. Unknown keys are ignored.
 */

#ifdef __cplusplus
extern "C" {
#endif

#define MATCHTAPE_CONFIG_MAX_KINDS      32
#define MATCHTAPE_CONFIG_NAME_MAX       64
#define MATCHTAPE_CONFIG_PATH_MAX       256

typedef struct Matchtape_Config {
    /* [session] */
    char session_name[MATCHTAPE_CONFIG_NAME_MAX];   /**< Empty: generated from the clock */
    char save_dir[MATCHTAPE_CONFIG_PATH_MAX];
    bool autorecord;

    /* [replay] */
    float snap_threshold;
    int spectator_team;
    char appearance_kinds[MATCHTAPE_CONFIG_MAX_KINDS][MATCHTAPE_KIND_MAX];
    int appearance_kind_count;

    /* Recording scope; not read from TOML. NULL records player characters */
    Matchtape_RecordPredicate record_predicate;
    void *record_predicate_userdata;

    /* [log] */
    char log_path[MATCHTAPE_CONFIG_PATH_MAX];       /**< Empty: no log file */
    Matchtape_LogLevel log_level;
    bool log_console;
} Matchtape_Config;

/** Fill with built-in defaults. */
void matchtape_config_defaults(Matchtape_Config *config);

/**
 * Load a TOML file over the defaults.
 *
 * @return false on I/O, syntax or validation errors (config left at defaults)
 */
bool matchtape_config_load_file(const char *path, Matchtape_Config *config);

/** Same as matchtape_config_load_file for in-memory TOML text. */
bool matchtape_config_load_string(const char *text, Matchtape_Config *config);

/** @return Kind table marking every configured appearance kind */
Matchtape_KindTable *matchtape_config_build_kind_table(const Matchtape_Config *config);

/**
 * Apply [log]: set level and console echo, and open log_path if set.
 */
bool matchtape_config_apply_logging(const Matchtape_Config *config);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_CONFIG_H */
