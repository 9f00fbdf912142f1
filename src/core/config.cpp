/**
 * Matchtape - TOML Configuration
 */

#include "matchtape/config.h"
#include "matchtape/error.h"
#include "matchtape/replay.h"
#include "matchtape/storage.h"
#include "matchtape/validate.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>

#include "toml.h"

static const char *s_default_appearance_kinds[] = {
    "knight",
    "archer",
    "builder"
};

void matchtape_config_defaults(Matchtape_Config *config) {
    if (!config) return;

    memset(config, 0, sizeof(*config));
    snprintf(config->save_dir, sizeof(config->save_dir), "recordings");
    config->autorecord = false;

    config->snap_threshold = MATCHTAPE_REPLAY_DEFAULT_SNAP_THRESHOLD;
    config->spectator_team = MATCHTAPE_REPLAY_DEFAULT_SPECTATOR_TEAM;
    for (const char *kind : s_default_appearance_kinds) {
        snprintf(config->appearance_kinds[config->appearance_kind_count++],
                 MATCHTAPE_KIND_MAX, "%s", kind);
    }

    config->log_level = MATCHTAPE_LOG_LEVEL_INFO;
    config->log_console = true;
}

/*============================================================================
 * Typed Readers
 *
 * Each returns false only for a present key of the wrong type or an
 * oversized value. Missing keys leave the output untouched.
 *============================================================================*/

static bool read_string(toml_table_t *table, const char *section, const char *key,
                        char *out, size_t out_size) {
    toml_datum_t datum = toml_string_in(table, key);
    if (!datum.ok) {
        if (toml_raw_in(table, key) || toml_array_in(table, key) || toml_table_in(table, key)) {
            matchtape_set_error("config: [%s] %s must be a string", section, key);
            return false;
        }
        return true;
    }

    bool fits = strlen(datum.u.s) < out_size;
    if (fits) {
        snprintf(out, out_size, "%s", datum.u.s);
    } else {
        matchtape_set_error("config: [%s] %s is longer than %zu characters",
                            section, key, out_size - 1);
    }
    free(datum.u.s);
    return fits;
}

static bool read_bool(toml_table_t *table, const char *section, const char *key, bool *out) {
    toml_datum_t datum = toml_bool_in(table, key);
    if (datum.ok) {
        *out = datum.u.b != 0;
        return true;
    }
    if (toml_raw_in(table, key)) {
        matchtape_set_error("config: [%s] %s must be true or false", section, key);
        return false;
    }
    return true;
}

static bool read_int(toml_table_t *table, const char *section, const char *key, int *out) {
    toml_datum_t datum = toml_int_in(table, key);
    if (datum.ok) {
        *out = (int)datum.u.i;
        return true;
    }
    if (toml_raw_in(table, key)) {
        matchtape_set_error("config: [%s] %s must be an integer", section, key);
        return false;
    }
    return true;
}

static bool read_number(toml_table_t *table, const char *section, const char *key, float *out) {
    toml_datum_t datum = toml_double_in(table, key);
    if (datum.ok) {
        *out = (float)datum.u.d;
        return true;
    }
    datum = toml_int_in(table, key);
    if (datum.ok) {
        *out = (float)datum.u.i;
        return true;
    }
    if (toml_raw_in(table, key)) {
        matchtape_set_error("config: [%s] %s must be a number", section, key);
        return false;
    }
    return true;
}

/*============================================================================
 * Sections
 *============================================================================*/

static bool parse_session(toml_table_t *root, Matchtape_Config *config) {
    toml_table_t *session = toml_table_in(root, "session");
    if (!session) return true;

    if (!read_string(session, "session", "name", config->session_name, sizeof(config->session_name)) ||
        !read_string(session, "session", "save_dir", config->save_dir, sizeof(config->save_dir)) ||
        !read_bool(session, "session", "autorecord", &config->autorecord)) {
        return false;
    }

    if (config->session_name[0] != '\0' && !matchtape_storage_name_is_safe(config->session_name)) {
        matchtape_set_error("config: [session] name '%s' is not a valid file name part",
                            config->session_name);
        return false;
    }
    return true;
}

static bool parse_replay(toml_table_t *root, Matchtape_Config *config) {
    toml_table_t *replay = toml_table_in(root, "replay");
    if (!replay) return true;

    if (!read_number(replay, "replay", "snap_threshold", &config->snap_threshold) ||
        !read_int(replay, "replay", "spectator_team", &config->spectator_team)) {
        return false;
    }
    if (config->snap_threshold < 0.0f) {
        matchtape_set_error("config: [replay] snap_threshold must not be negative");
        return false;
    }

    toml_array_t *kinds = toml_array_in(replay, "appearance_kinds");
    if (!kinds) {
        if (toml_raw_in(replay, "appearance_kinds")) {
            matchtape_set_error("config: [replay] appearance_kinds must be an array of strings");
            return false;
        }
        return true;
    }

    int n = toml_array_nelem(kinds);
    if (n > MATCHTAPE_CONFIG_MAX_KINDS) {
        matchtape_set_error("config: [replay] appearance_kinds has %d entries (max %d)",
                            n, MATCHTAPE_CONFIG_MAX_KINDS);
        return false;
    }

    config->appearance_kind_count = 0;
    for (int i = 0; i < n; i++) {
        toml_datum_t val = toml_string_at(kinds, i);
        if (!val.ok) {
            matchtape_set_error("config: [replay] appearance_kinds[%d] must be a string", i);
            return false;
        }
        bool fits = val.u.s[0] != '\0' && strlen(val.u.s) < MATCHTAPE_KIND_MAX;
        if (fits) {
            snprintf(config->appearance_kinds[config->appearance_kind_count++],
                     MATCHTAPE_KIND_MAX, "%s", val.u.s);
        } else {
            matchtape_set_error("config: [replay] appearance_kinds[%d] is empty or too long", i);
        }
        free(val.u.s);
        if (!fits) return false;
    }
    return true;
}

static bool parse_log(toml_table_t *root, Matchtape_Config *config) {
    toml_table_t *log = toml_table_in(root, "log");
    if (!log) return true;

    char level[16] = {0};
    if (!read_string(log, "log", "path", config->log_path, sizeof(config->log_path)) ||
        !read_string(log, "log", "level", level, sizeof(level)) ||
        !read_bool(log, "log", "console", &config->log_console)) {
        return false;
    }

    if (level[0] != '\0' && !matchtape_log_level_from_string(level, &config->log_level)) {
        matchtape_set_error("config: [log] unknown level '%s'", level);
        return false;
    }
    return true;
}

static bool apply_root(toml_table_t *root, Matchtape_Config *config) {
    Matchtape_Config parsed;
    matchtape_config_defaults(&parsed);
    parsed.record_predicate = config->record_predicate;
    parsed.record_predicate_userdata = config->record_predicate_userdata;

    bool ok = parse_session(root, &parsed) &&
              parse_replay(root, &parsed) &&
              parse_log(root, &parsed);
    toml_free(root);

    if (ok) {
        *config = parsed;
    } else {
        matchtape_config_defaults(config);
    }
    return ok;
}

/*============================================================================
 * Public API
 *============================================================================*/

bool matchtape_config_load_file(const char *path, Matchtape_Config *config) {
    MATCHTAPE_VALIDATE_PTRS2_RET(path, config, false);

    FILE *fp = fopen(path, "r");
    if (!fp) {
        matchtape_config_defaults(config);
        matchtape_set_error_from_errno("config: cannot open %s", path);
        return false;
    }

    char errbuf[256];
    toml_table_t *root = toml_parse_file(fp, errbuf, sizeof(errbuf));
    fclose(fp);

    if (!root) {
        matchtape_config_defaults(config);
        matchtape_set_error("config: failed to parse %s: %s", path, errbuf);
        return false;
    }

    bool ok = apply_root(root, config);
    if (ok) {
        matchtape_log_info(MATCHTAPE_LOG_CONFIG, "Loaded %s", path);
    }
    return ok;
}

bool matchtape_config_load_string(const char *text, Matchtape_Config *config) {
    MATCHTAPE_VALIDATE_PTRS2_RET(text, config, false);

    /* toml_parse wants a mutable buffer */
    std::string buffer(text);

    char errbuf[256];
    toml_table_t *root = toml_parse(&buffer[0], errbuf, sizeof(errbuf));
    if (!root) {
        matchtape_config_defaults(config);
        matchtape_set_error("config: parse error: %s", errbuf);
        return false;
    }

    return apply_root(root, config);
}

Matchtape_KindTable *matchtape_config_build_kind_table(const Matchtape_Config *config) {
    MATCHTAPE_VALIDATE_PTR_RET(config, NULL);

    Matchtape_KindTable *table = matchtape_kind_table_create();
    if (!table) return NULL;

    for (int i = 0; i < config->appearance_kind_count; i++) {
        if (!matchtape_kind_table_set(table, config->appearance_kinds[i], MATCHTAPE_SPAWN_APPEARANCE)) {
            matchtape_kind_table_destroy(table);
            return NULL;
        }
    }
    return table;
}

bool matchtape_config_apply_logging(const Matchtape_Config *config) {
    MATCHTAPE_VALIDATE_PTR_RET(config, false);

    matchtape_log_set_level(config->log_level);
    matchtape_log_set_console_output(config->log_console);

    if (config->log_path[0] != '\0' && !matchtape_log_init_with_path(config->log_path)) {
        matchtape_set_error("config: cannot open log file %s", config->log_path);
        return false;
    }
    return true;
}
