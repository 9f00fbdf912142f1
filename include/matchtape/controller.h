/**
 * @file controller.h
 * @brief Idle / recording / replaying state machine for one game session
 *
 * The controller is the single context object a host integration owns. It
 * holds the current recording, the active replay, the autorecord flag and
 * the save-file counters. Every command is a no-op with a reported reason
 * when its precondition does not hold.
 *
 * Usage:
 *   Matchtape_Config cfg;
 *   matchtape_config_defaults(&cfg);
 *   Matchtape_Controller *ctrl = matchtape_controller_create(&host, &cfg);
 *
 *   // once per simulation tick, after the simulation step
 *   matchtape_controller_update(ctrl);
 *
 *   // from game events
 *   matchtape_controller_on_restart(ctrl);
 *   matchtape_controller_on_game_over(ctrl);
 *
 *   matchtape_controller_destroy(ctrl);
 *
 * Not thread-safe: every call must come from the thread running the
 * simulation, or be serialized by the host.
 */

#ifndef MATCHTAPE_CONTROLLER_H
#define MATCHTAPE_CONTROLLER_H

#include "matchtape/config.h"
#include "matchtape/host.h"
#include "matchtape/recording.h"
#include "matchtape/replay.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Matchtape_Controller Matchtape_Controller;

typedef enum Matchtape_Mode {
    MATCHTAPE_MODE_IDLE = 0,
    MATCHTAPE_MODE_RECORDING,
    MATCHTAPE_MODE_REPLAYING
} Matchtape_Mode;

/*============================================================================
 * Lifecycle
 *============================================================================*/

/**
 * Create a controller. The host table is copied.
 *
 * @param host   Host callbacks (all required callbacks must be set)
 * @param config Configuration (NULL for defaults)
 * @return New controller or NULL on failure
 */
Matchtape_Controller *matchtape_controller_create(const Matchtape_Host *host,
                                                  const Matchtape_Config *config);

/** Destroy a controller. Safe to call with NULL. Unsaved data is discarded. */
void matchtape_controller_destroy(Matchtape_Controller *ctrl);

/*============================================================================
 * Tick
 *============================================================================*/

/**
 * Per-tick driver. Recording: capture a tick. Replaying: restart when
 * finished, otherwise advance. Idle: nothing.
 */
bool matchtape_controller_update(Matchtape_Controller *ctrl);

/** Match restarted: bumps the match number and starts recording if autorecord is on. */
void matchtape_controller_on_restart(Matchtape_Controller *ctrl);

/** Match over: stops and saves the recording if autorecord is on. */
void matchtape_controller_on_game_over(Matchtape_Controller *ctrl);

/*============================================================================
 * Commands
 *============================================================================*/

bool matchtape_controller_start_recording(Matchtape_Controller *ctrl);
bool matchtape_controller_stop_recording(Matchtape_Controller *ctrl);

/**
 * Save the current recording, stopping it first if it is running. Uses the
 * host persist callback when set, the configured save directory otherwise.
 * The recording number advances only on success.
 */
bool matchtape_controller_save_recording(Matchtape_Controller *ctrl);

/**
 * Start replaying the current recording.
 *
 * @param save_point Name of a save point to start from, or NULL for tick 0
 */
bool matchtape_controller_start_replay(Matchtape_Controller *ctrl, const char *save_point);

/** Stop replaying and reload the recorded session's map. */
bool matchtape_controller_stop_replay(Matchtape_Controller *ctrl);

/**
 * Turn autorecord on or off. Enabling is refused while a replay runs.
 */
bool matchtape_controller_set_autorecord(Matchtape_Controller *ctrl, bool enabled);
bool matchtape_controller_get_autorecord(const Matchtape_Controller *ctrl);

/** Move every player to the spectator team. @return Players moved */
size_t matchtape_controller_force_spectate(Matchtape_Controller *ctrl);

/**
 * Replace the current recording with a saved one.
 * Only allowed while idle.
 */
bool matchtape_controller_load_recording(Matchtape_Controller *ctrl, const char *name);

/** Name the next tick of the running recording. */
bool matchtape_controller_add_save_point(Matchtape_Controller *ctrl, const char *name);

/*============================================================================
 * Queries
 *============================================================================*/

Matchtape_Mode matchtape_controller_get_mode(const Matchtape_Controller *ctrl);
const char *matchtape_mode_name(Matchtape_Mode mode);

/** @return Current recording (running, stopped or loaded), or NULL */
const Matchtape_Recording *matchtape_controller_get_recording(const Matchtape_Controller *ctrl);

/** @return Active replay, or NULL when not replaying */
const Matchtape_Replay *matchtape_controller_get_replay(const Matchtape_Controller *ctrl);

const Matchtape_Host *matchtape_controller_get_host(const Matchtape_Controller *ctrl);
const char *matchtape_controller_get_session_name(const Matchtape_Controller *ctrl);
uint32_t matchtape_controller_get_match_number(const Matchtape_Controller *ctrl);
uint32_t matchtape_controller_get_recording_number(const Matchtape_Controller *ctrl);

/** @return Name of the last successful save ("" if none) */
const char *matchtape_controller_get_last_save_name(const Matchtape_Controller *ctrl);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_CONTROLLER_H */
