/**
 * @file recording.h
 * @brief Tick-indexed capture of selected entities
 *
 * A recording holds one sample set per simulation tick plus one immutable
 * meta per entity ever observed. Ticks are append-only and strictly ordered;
 * a tick with no qualifying entities is still stored (empty) so tick indices
 * stay aligned with elapsed simulation steps.
 *
 * Usage:
 *   Matchtape_Recording *rec = matchtape_recording_create(NULL);
 *   matchtape_recording_start(rec, &host);
 *
 *   while (match_running) {
 *       step_simulation();
 *       matchtape_recording_capture_tick(rec, &host);
 *   }
 *
 *   matchtape_recording_end(rec, &host);
 *
 *   size_t len;
 *   char *text = matchtape_recording_serialize(rec, &len);
 *   write_somewhere(text, len);
 *   free(text);
 *
 *   matchtape_recording_destroy(rec);
 */

#ifndef MATCHTAPE_RECORDING_H
#define MATCHTAPE_RECORDING_H

#include "matchtape/entity_meta.h"
#include "matchtape/entity_sample.h"
#include "matchtape/host.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Constants
 *============================================================================*/

/** Recording text format version */
#define MATCHTAPE_RECORDING_VERSION         1

/** Oldest version that can still be parsed */
#define MATCHTAPE_RECORDING_MIN_VERSION     1

/** Default capacity hint for entity enumeration */
#define MATCHTAPE_RECORDING_DEFAULT_MAX_ENTITIES 256

#define MATCHTAPE_SAVE_POINT_NAME_MAX       64

/*============================================================================
 * Types
 *============================================================================*/

typedef struct Matchtape_Recording Matchtape_Recording;

/**
 * Decides whether a live entity is recorded.
 *
 * @param desc     Host description of the entity
 * @param userdata Predicate userdata from the config
 * @return true to record the entity
 */
typedef bool (*Matchtape_RecordPredicate)(const Matchtape_EntityDesc *desc, void *userdata);

typedef struct Matchtape_RecordingConfig {
    Matchtape_RecordPredicate predicate;    /**< NULL records player characters */
    void *predicate_userdata;
    size_t max_entities;                    /**< Initial enumeration buffer size */
} Matchtape_RecordingConfig;

/** Default predicate: entities with an attached player. */
bool matchtape_record_player_characters(const Matchtape_EntityDesc *desc, void *userdata);

#define MATCHTAPE_RECORDING_CONFIG_DEFAULT { \
    .predicate = matchtape_record_player_characters, \
    .predicate_userdata = NULL, \
    .max_entities = MATCHTAPE_RECORDING_DEFAULT_MAX_ENTITIES \
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

/**
 * Create an empty recording.
 *
 * @param config Configuration (NULL for defaults)
 * @return New recording or NULL on failure
 */
Matchtape_Recording *matchtape_recording_create(const Matchtape_RecordingConfig *config);

/** Destroy a recording. Safe to call with NULL. */
void matchtape_recording_destroy(Matchtape_Recording *rec);

/*============================================================================
 * Capture
 *============================================================================*/

/**
 * Stamp start time and map name, and seed metas for qualifying entities
 * already present. Only reads from the host.
 *
 * @return false if already started
 */
bool matchtape_recording_start(Matchtape_Recording *rec, const Matchtape_Host *host);

/**
 * Append one tick: a sample for every qualifying live entity, creating metas
 * for newly seen ones.
 *
 * @return false if not started or already ended
 */
bool matchtape_recording_capture_tick(Matchtape_Recording *rec, const Matchtape_Host *host);

/**
 * Stamp end time. No further ticks are accepted.
 */
bool matchtape_recording_end(Matchtape_Recording *rec, const Matchtape_Host *host);

bool matchtape_recording_is_started(const Matchtape_Recording *rec);
bool matchtape_recording_is_ended(const Matchtape_Recording *rec);

/*============================================================================
 * Queries
 *============================================================================*/

size_t matchtape_recording_get_num_ticks(const Matchtape_Recording *rec);
uint32_t matchtape_recording_get_init_time(const Matchtape_Recording *rec);
uint32_t matchtape_recording_get_end_time(const Matchtape_Recording *rec);
const char *matchtape_recording_get_map_name(const Matchtape_Recording *rec);

/**
 * Samples of one tick.
 *
 * @param index     Tick index
 * @param out_count Receives the sample count (0 for an empty tick)
 * @return Pointer to the samples (valid until the next capture), or NULL
 *         when empty or out of range
 */
const Matchtape_EntitySample *matchtape_recording_get_tick(const Matchtape_Recording *rec,
                                                           size_t index, size_t *out_count);

/** @return Meta for netid, or NULL if never observed */
const Matchtape_EntityMeta *matchtape_recording_find_meta(const Matchtape_Recording *rec,
                                                          uint16_t netid);

size_t matchtape_recording_get_meta_count(const Matchtape_Recording *rec);

/** @return Meta by insertion order, or NULL */
const Matchtape_EntityMeta *matchtape_recording_get_meta(const Matchtape_Recording *rec,
                                                         size_t index);

/*============================================================================
 * Save Points
 *============================================================================*/

/**
 * Name the next tick to be captured. Only valid while capturing.
 *
 * @return false for a duplicate or invalid name
 */
bool matchtape_recording_add_save_point(Matchtape_Recording *rec, const char *name);

/**
 * @param out_tick Receives the tick index
 * @return false if no save point has that name
 */
bool matchtape_recording_find_save_point(const Matchtape_Recording *rec, const char *name,
                                         size_t *out_tick);

size_t matchtape_recording_get_save_point_count(const Matchtape_Recording *rec);

/** @return Save point name by index (NULL if out of range) */
const char *matchtape_recording_get_save_point(const Matchtape_Recording *rec, size_t index,
                                               size_t *out_tick);

/*============================================================================
 * Serialization
 *============================================================================*/

/**
 * Serialize to the <matchrecording> text format.
 *
 * @param out_len Optional, receives the text length
 * @return Text (caller frees with free()), or NULL on failure
 */
char *matchtape_recording_serialize(const Matchtape_Recording *rec, size_t *out_len);

/**
 * Parse <matchrecording> text. Versions outside
 * [MATCHTAPE_RECORDING_MIN_VERSION, MATCHTAPE_RECORDING_VERSION] are rejected.
 * The returned recording is ended and accepts no further ticks.
 *
 * @param source_name Used in error messages (NULL for "<source>")
 * @return New recording or NULL on failure
 */
Matchtape_Recording *matchtape_recording_parse(const char *text, size_t len,
                                               const char *source_name);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_RECORDING_H */
