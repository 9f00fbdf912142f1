/**
 * Matchtape - Mode Controller
 */

#include "matchtape/controller.h"
#include "matchtape/error.h"
#include "matchtape/log.h"
#include "matchtape/storage.h"
#include "matchtape/validate.h"

#include <new>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

struct Matchtape_Controller {
    Matchtape_Host host;
    Matchtape_Config config;
    Matchtape_KindTable *kinds;
    Matchtape_Storage *storage;

    Matchtape_Mode mode;
    bool autorecord;

    Matchtape_Recording *recording;
    Matchtape_Replay *replay;

    char session_name[MATCHTAPE_CONFIG_NAME_MAX];
    uint32_t match_number;
    uint32_t recording_number;
    char last_save_name[MATCHTAPE_STORAGE_NAME_MAX + 1];
};

/*============================================================================
 * Reporting
 *============================================================================*/

/* Invalid transition: error buffer, log and broadcast, then false */
static bool reject(Matchtape_Controller *ctrl, const char *fmt, ...) {
    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    matchtape_set_error("%s", message);
    matchtape_log_warning(MATCHTAPE_LOG_MODE, "%s", message);
    matchtape_host_broadcast(&ctrl->host, "%s", message);
    return false;
}

/* Failed operation whose cause is already in the error buffer */
static bool reject_cause(Matchtape_Controller *ctrl, const char *context) {
    matchtape_prefix_error("%s", context);
    matchtape_log_warning(MATCHTAPE_LOG_MODE, "%s", matchtape_get_last_error());
    matchtape_host_broadcast(&ctrl->host, "%s", matchtape_get_last_error());
    return false;
}

static void announce(Matchtape_Controller *ctrl, const char *fmt, ...) {
    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    matchtape_log_info(MATCHTAPE_LOG_MODE, "%s", message);
    matchtape_host_broadcast(&ctrl->host, "%s", message);
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

Matchtape_Controller *matchtape_controller_create(const Matchtape_Host *host,
                                                  const Matchtape_Config *config) {
    if (!matchtape_host_validate(host)) {
        return nullptr;
    }

    Matchtape_Controller *ctrl = new (std::nothrow) Matchtape_Controller();
    if (!ctrl) {
        matchtape_set_error("controller: failed to allocate controller");
        return nullptr;
    }

    ctrl->host = *host;
    if (config) {
        ctrl->config = *config;
    } else {
        matchtape_config_defaults(&ctrl->config);
    }

    ctrl->kinds = matchtape_config_build_kind_table(&ctrl->config);
    ctrl->storage = matchtape_storage_create(ctrl->config.save_dir);
    if (!ctrl->kinds || !ctrl->storage) {
        matchtape_controller_destroy(ctrl);
        return nullptr;
    }

    if (ctrl->config.session_name[0] != '\0') {
        snprintf(ctrl->session_name, sizeof(ctrl->session_name), "%s", ctrl->config.session_name);
    } else if (!matchtape_storage_session_name_now(ctrl->session_name, sizeof(ctrl->session_name))) {
        matchtape_controller_destroy(ctrl);
        return nullptr;
    }

    ctrl->mode = MATCHTAPE_MODE_IDLE;
    ctrl->autorecord = ctrl->config.autorecord;
    ctrl->recording = nullptr;
    ctrl->replay = nullptr;
    ctrl->match_number = 0;
    ctrl->recording_number = 0;
    ctrl->last_save_name[0] = '\0';

    matchtape_log_info(MATCHTAPE_LOG_MODE, "Session '%s' ready (autorecord %s)",
                       ctrl->session_name, ctrl->autorecord ? "on" : "off");
    return ctrl;
}

void matchtape_controller_destroy(Matchtape_Controller *ctrl) {
    if (!ctrl) return;

    matchtape_replay_destroy(ctrl->replay);
    matchtape_recording_destroy(ctrl->recording);
    matchtape_storage_destroy(ctrl->storage);
    matchtape_kind_table_destroy(ctrl->kinds);
    delete ctrl;
}

/*============================================================================
 * Recording
 *============================================================================*/

bool matchtape_controller_start_recording(Matchtape_Controller *ctrl) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode == MATCHTAPE_MODE_RECORDING) {
        return reject(ctrl, "Already recording");
    }
    if (ctrl->mode == MATCHTAPE_MODE_REPLAYING) {
        return reject(ctrl, "Cannot record while a replay is running");
    }

    Matchtape_RecordingConfig rcfg = MATCHTAPE_RECORDING_CONFIG_DEFAULT;
    if (ctrl->config.record_predicate) {
        rcfg.predicate = ctrl->config.record_predicate;
        rcfg.predicate_userdata = ctrl->config.record_predicate_userdata;
    }

    Matchtape_Recording *rec = matchtape_recording_create(&rcfg);
    if (!rec) {
        return reject_cause(ctrl, "Cannot start recording");
    }
    if (!matchtape_recording_start(rec, &ctrl->host)) {
        matchtape_recording_destroy(rec);
        return reject_cause(ctrl, "Cannot start recording");
    }

    if (ctrl->recording && matchtape_recording_get_num_ticks(ctrl->recording) > 0) {
        matchtape_log_info(MATCHTAPE_LOG_MODE, "Discarding previous recording (%zu ticks)",
                           matchtape_recording_get_num_ticks(ctrl->recording));
    }
    matchtape_recording_destroy(ctrl->recording);
    ctrl->recording = rec;
    ctrl->mode = MATCHTAPE_MODE_RECORDING;

    announce(ctrl, "Recording started (match %u)", ctrl->match_number);
    return true;
}

bool matchtape_controller_stop_recording(Matchtape_Controller *ctrl) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode != MATCHTAPE_MODE_RECORDING) {
        return reject(ctrl, "Not recording");
    }

    ctrl->mode = MATCHTAPE_MODE_IDLE;
    if (!matchtape_recording_end(ctrl->recording, &ctrl->host)) {
        return reject_cause(ctrl, "Cannot finalize recording");
    }

    announce(ctrl, "Recording stopped after %zu ticks",
             matchtape_recording_get_num_ticks(ctrl->recording));
    return true;
}

bool matchtape_controller_save_recording(Matchtape_Controller *ctrl) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (!ctrl->recording) {
        return reject(ctrl, "No recording to save");
    }
    if (ctrl->mode == MATCHTAPE_MODE_RECORDING && !matchtape_controller_stop_recording(ctrl)) {
        return false;
    }

    char name[MATCHTAPE_STORAGE_NAME_MAX + 1];
    if (!matchtape_storage_format_name(ctrl->session_name, ctrl->match_number,
                                       ctrl->recording_number, name, sizeof(name))) {
        return reject_cause(ctrl, "Cannot save recording");
    }

    size_t len = 0;
    char *text = matchtape_recording_serialize(ctrl->recording, &len);
    if (!text) {
        return reject_cause(ctrl, "Cannot serialize recording");
    }

    bool ok;
    if (ctrl->host.persist) {
        ok = ctrl->host.persist(ctrl->host.userdata, name, text, len);
        if (!ok) matchtape_set_error("host refused to persist %s", name);
    } else {
        ok = matchtape_storage_write(ctrl->storage, name, text, len);
    }
    free(text);

    if (!ok) {
        return reject_cause(ctrl, "Failed to save recording");
    }

    snprintf(ctrl->last_save_name, sizeof(ctrl->last_save_name), "%s", name);
    ctrl->recording_number++;
    announce(ctrl, "Saved recording as %s", name);
    return true;
}

bool matchtape_controller_add_save_point(Matchtape_Controller *ctrl, const char *name) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode != MATCHTAPE_MODE_RECORDING) {
        return reject(ctrl, "Save points can only be set while recording");
    }
    if (!matchtape_recording_add_save_point(ctrl->recording, name)) {
        return reject_cause(ctrl, "Cannot set save point");
    }

    announce(ctrl, "Save point '%s' set at tick %zu", name,
             matchtape_recording_get_num_ticks(ctrl->recording));
    return true;
}

bool matchtape_controller_load_recording(Matchtape_Controller *ctrl, const char *name) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode != MATCHTAPE_MODE_IDLE) {
        return reject(ctrl, "Cannot load a recording while %s",
                      matchtape_mode_name(ctrl->mode));
    }
    if (!matchtape_storage_name_is_safe(name)) {
        return reject(ctrl, "Invalid recording name '%s'", name ? name : "");
    }

    size_t len = 0;
    char *text;
    if (ctrl->host.restore) {
        text = ctrl->host.restore(ctrl->host.userdata, name, &len);
        if (!text) matchtape_set_error("host could not restore %s", name);
    } else {
        text = matchtape_storage_read(ctrl->storage, name, &len);
    }
    if (!text) {
        return reject_cause(ctrl, "Cannot load recording");
    }

    Matchtape_Recording *rec = matchtape_recording_parse(text, len, name);
    free(text);
    if (!rec) {
        return reject_cause(ctrl, "Cannot load recording");
    }

    matchtape_recording_destroy(ctrl->recording);
    ctrl->recording = rec;

    announce(ctrl, "Loaded %s (%zu ticks on '%s')", name,
             matchtape_recording_get_num_ticks(rec), matchtape_recording_get_map_name(rec));
    return true;
}

/*============================================================================
 * Replay
 *============================================================================*/

bool matchtape_controller_start_replay(Matchtape_Controller *ctrl, const char *save_point) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode == MATCHTAPE_MODE_REPLAYING) {
        return reject(ctrl, "Already replaying");
    }
    if (ctrl->autorecord) {
        return reject(ctrl, "Cannot replay while autorecord is on");
    }
    if (ctrl->mode == MATCHTAPE_MODE_RECORDING) {
        return reject(ctrl, "Stop recording before replaying");
    }
    if (!ctrl->recording) {
        return reject(ctrl, "No recording to replay");
    }

    Matchtape_ReplayConfig cfg = MATCHTAPE_REPLAY_CONFIG_DEFAULT;
    cfg.snap_threshold = ctrl->config.snap_threshold;
    cfg.spectator_team = ctrl->config.spectator_team;
    cfg.kinds = ctrl->kinds;

    if (save_point && save_point[0] != '\0' &&
        !matchtape_recording_find_save_point(ctrl->recording, save_point, &cfg.first_tick)) {
        return reject_cause(ctrl, "Cannot replay");
    }

    Matchtape_Replay *replay = matchtape_replay_create(ctrl->recording, &cfg);
    if (!replay) {
        return reject_cause(ctrl, "Cannot replay");
    }
    if (!matchtape_replay_start(replay, &ctrl->host)) {
        matchtape_replay_destroy(replay);
        return reject_cause(ctrl, "Cannot replay");
    }

    ctrl->replay = replay;
    ctrl->mode = MATCHTAPE_MODE_REPLAYING;

    announce(ctrl, "Replay started (%zu ticks from tick %zu)",
             matchtape_recording_get_num_ticks(ctrl->recording), cfg.first_tick);
    return true;
}

bool matchtape_controller_stop_replay(Matchtape_Controller *ctrl) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->mode != MATCHTAPE_MODE_REPLAYING) {
        return reject(ctrl, "Not replaying");
    }

    matchtape_replay_destroy(ctrl->replay);
    ctrl->replay = nullptr;
    ctrl->mode = MATCHTAPE_MODE_IDLE;

    const char *map = matchtape_recording_get_map_name(ctrl->recording);
    if (!ctrl->host.load_map(ctrl->host.userdata, map)) {
        matchtape_set_error("replay stopped but map '%s' could not be reloaded", map);
        matchtape_log_error(MATCHTAPE_LOG_MODE, "%s", matchtape_get_last_error());
        matchtape_host_broadcast(&ctrl->host, "%s", matchtape_get_last_error());
        return false;
    }

    announce(ctrl, "Replay stopped, reloading '%s'", map);
    return true;
}

/*============================================================================
 * Settings
 *============================================================================*/

bool matchtape_controller_set_autorecord(Matchtape_Controller *ctrl, bool enabled) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    if (ctrl->autorecord == enabled) {
        announce(ctrl, "Autorecord is already %s", enabled ? "on" : "off");
        return true;
    }
    if (enabled && ctrl->mode == MATCHTAPE_MODE_REPLAYING) {
        return reject(ctrl, "Cannot enable autorecord while a replay is running");
    }
    ctrl->autorecord = enabled;
    announce(ctrl, "Autorecord %s", enabled ? "enabled" : "disabled");
    return true;
}

bool matchtape_controller_get_autorecord(const Matchtape_Controller *ctrl) {
    return ctrl && ctrl->autorecord;
}

size_t matchtape_controller_force_spectate(Matchtape_Controller *ctrl) {
    if (!ctrl) return 0;
    size_t moved = matchtape_replay_force_spectators(&ctrl->host, ctrl->config.spectator_team);
    announce(ctrl, "Moved %zu players to spectators", moved);
    return moved;
}

/*============================================================================
 * Tick and Events
 *============================================================================*/

bool matchtape_controller_update(Matchtape_Controller *ctrl) {
    MATCHTAPE_VALIDATE_PTR_RET(ctrl, false);

    switch (ctrl->mode) {
        case MATCHTAPE_MODE_IDLE:
            return true;

        case MATCHTAPE_MODE_RECORDING:
            return matchtape_recording_capture_tick(ctrl->recording, &ctrl->host);

        case MATCHTAPE_MODE_REPLAYING:
            if (matchtape_replay_is_finished(ctrl->replay)) {
                matchtape_log_debug(MATCHTAPE_LOG_MODE, "Replay finished, looping");
                return matchtape_replay_start(ctrl->replay, &ctrl->host);
            }
            return matchtape_replay_advance(ctrl->replay, &ctrl->host);
    }
    return false;
}

void matchtape_controller_on_restart(Matchtape_Controller *ctrl) {
    if (!ctrl) return;

    /* A restart without game over still closes the previous match's recording */
    if (ctrl->autorecord && ctrl->mode == MATCHTAPE_MODE_RECORDING &&
        !matchtape_controller_save_recording(ctrl)) {
        matchtape_log_error(MATCHTAPE_LOG_MODE, "Recording of match %u was not saved",
                            ctrl->match_number);
    }

    ctrl->match_number++;
    matchtape_log_info(MATCHTAPE_LOG_MODE, "Match %u begins", ctrl->match_number);

    if (ctrl->autorecord && !matchtape_controller_start_recording(ctrl)) {
        matchtape_log_error(MATCHTAPE_LOG_MODE, "Autorecord could not start match %u",
                            ctrl->match_number);
    }
}

void matchtape_controller_on_game_over(Matchtape_Controller *ctrl) {
    if (!ctrl) return;

    if (ctrl->autorecord && ctrl->mode == MATCHTAPE_MODE_RECORDING &&
        !matchtape_controller_save_recording(ctrl)) {
        matchtape_log_error(MATCHTAPE_LOG_MODE, "Recording of match %u was not saved",
                            ctrl->match_number);
    }
}

/*============================================================================
 * Queries
 *============================================================================*/

Matchtape_Mode matchtape_controller_get_mode(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->mode : MATCHTAPE_MODE_IDLE;
}

const char *matchtape_mode_name(Matchtape_Mode mode) {
    switch (mode) {
        case MATCHTAPE_MODE_IDLE:      return "idle";
        case MATCHTAPE_MODE_RECORDING: return "recording";
        case MATCHTAPE_MODE_REPLAYING: return "replaying";
    }
    return "unknown";
}

const Matchtape_Recording *matchtape_controller_get_recording(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->recording : nullptr;
}

const Matchtape_Replay *matchtape_controller_get_replay(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->replay : nullptr;
}

const Matchtape_Host *matchtape_controller_get_host(const Matchtape_Controller *ctrl) {
    return ctrl ? &ctrl->host : nullptr;
}

const char *matchtape_controller_get_session_name(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->session_name : "";
}

uint32_t matchtape_controller_get_match_number(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->match_number : 0;
}

uint32_t matchtape_controller_get_recording_number(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->recording_number : 0;
}

const char *matchtape_controller_get_last_save_name(const Matchtape_Controller *ctrl) {
    return ctrl ? ctrl->last_save_name : "";
}
