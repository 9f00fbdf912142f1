/**
 * @file replay.h
 * @brief Re-simulation of a recording against the live host
 *
 * A replay re-creates every recorded entity the first tick it appears, maps
 * its recorded netid to the new simulation id, and drives it each tick:
 * position is snapped back when drift exceeds the threshold, aim is set and
 * every recognized key is pressed or released from the recorded bitmask.
 *
 * The recording is borrowed and never modified; it must outlive the replay.
 *
 * Usage:
 *   Matchtape_ReplayConfig cfg = MATCHTAPE_REPLAY_CONFIG_DEFAULT;
 *   Matchtape_Replay *replay = matchtape_replay_create(rec, &cfg);
 *
 *   matchtape_replay_start(replay, &host);    // applies the first tick
 *   while (running) {
 *       step_simulation();
 *       if (matchtape_replay_is_finished(replay)) {
 *           matchtape_replay_start(replay, &host);   // loop
 *       } else {
 *           matchtape_replay_advance(replay, &host);
 *       }
 *   }
 *
 *   matchtape_replay_destroy(replay);
 */

#ifndef MATCHTAPE_REPLAY_H
#define MATCHTAPE_REPLAY_H

#include "matchtape/host.h"
#include "matchtape/kinds.h"
#include "matchtape/recording.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Constants
 *============================================================================*/

/** Drift (world units) beyond which a replayed entity is teleported */
#define MATCHTAPE_REPLAY_DEFAULT_SNAP_THRESHOLD   4.0f

/** Team live players are moved to while a replay runs */
#define MATCHTAPE_REPLAY_DEFAULT_SPECTATOR_TEAM   200

/*============================================================================
 * Types
 *============================================================================*/

typedef struct Matchtape_Replay Matchtape_Replay;

typedef enum Matchtape_ReplayState {
    MATCHTAPE_REPLAY_IDLE = 0,      /**< Not started */
    MATCHTAPE_REPLAY_ACTIVE,        /**< Applying ticks */
    MATCHTAPE_REPLAY_FINISHED       /**< On the last tick, restart to loop */
} Matchtape_ReplayState;

typedef struct Matchtape_ReplayConfig {
    float snap_threshold;
    int spectator_team;
    const Matchtape_KindTable *kinds;   /**< Copied at create; NULL for the default table */
    size_t first_tick;                  /**< Tick applied by start (save point replays) */
} Matchtape_ReplayConfig;

#define MATCHTAPE_REPLAY_CONFIG_DEFAULT { \
    .snap_threshold = MATCHTAPE_REPLAY_DEFAULT_SNAP_THRESHOLD, \
    .spectator_team = MATCHTAPE_REPLAY_DEFAULT_SPECTATOR_TEAM, \
    .kinds = NULL, \
    .first_tick = 0 \
}

/**
 * Counters for the current run. Reset by every start except starts.
 */
typedef struct Matchtape_ReplayStats {
    uint32_t starts;            /**< Number of (re)starts, never reset */
    uint32_t ticks_applied;
    uint32_t spawned;
    uint32_t snaps;             /**< Drift corrections */
    uint32_t missing_meta;      /**< Samples whose netid has no meta */
    uint32_t spawn_failures;
    uint32_t stale_mappings;    /**< Mapped entities that vanished */
} Matchtape_ReplayStats;

/*============================================================================
 * Lifecycle
 *============================================================================*/

/**
 * Create a replay bound to a recording.
 *
 * @param rec    Recording to replay (borrowed)
 * @param config Configuration (NULL for defaults)
 * @return New replay or NULL on failure
 */
Matchtape_Replay *matchtape_replay_create(const Matchtape_Recording *rec,
                                          const Matchtape_ReplayConfig *config);

/** Destroy a replay. Safe to call with NULL. Replayed entities are left alive. */
void matchtape_replay_destroy(Matchtape_Replay *replay);

/*============================================================================
 * Playback
 *============================================================================*/

/**
 * Start or restart. Moves live players to the spectator team, destroys live
 * entities of every kind the recording will re-create, clears the id mapping
 * and applies the first tick.
 *
 * @return false for an empty recording or a first_tick past the end
 */
bool matchtape_replay_start(Matchtape_Replay *replay, const Matchtape_Host *host);

/**
 * Apply the next tick.
 *
 * @return false if not started or already on the final tick
 */
bool matchtape_replay_advance(Matchtape_Replay *replay, const Matchtape_Host *host);

/** @return true once the current tick is the last one (tick >= num_ticks - 1) */
bool matchtape_replay_is_finished(const Matchtape_Replay *replay);

Matchtape_ReplayState matchtape_replay_get_state(const Matchtape_Replay *replay);

/** @return Index of the tick applied last */
size_t matchtape_replay_get_tick(const Matchtape_Replay *replay);

const Matchtape_Recording *matchtape_replay_get_recording(const Matchtape_Replay *replay);

/**
 * @return Live entity replaying netid, or MATCHTAPE_INVALID_ENTITY when not
 *         spawned yet, spawn failed or the entity vanished
 */
Matchtape_EntityId matchtape_replay_get_mapped_entity(const Matchtape_Replay *replay, uint16_t netid);

/** @return Number of netids with a mapping entry (including failed ones) */
size_t matchtape_replay_get_mapping_count(const Matchtape_Replay *replay);

Matchtape_ReplayStats matchtape_replay_get_stats(const Matchtape_Replay *replay);

/*============================================================================
 * Host Helpers
 *============================================================================*/

/**
 * Move every live player to a team.
 *
 * @return Number of players moved
 */
size_t matchtape_replay_force_spectators(const Matchtape_Host *host, int team);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_REPLAY_H */
