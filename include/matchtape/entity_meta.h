#ifndef MATCHTAPE_ENTITY_META_H
#define MATCHTAPE_ENTITY_META_H

#include "matchtape/host.h"
#include "matchtape/tagblock.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * @file entity_meta.h
 * @brief Identity and appearance of a recorded entity
 *
 * Captured once, the first tick an entity is observed, and never updated.
 * Later team or appearance changes on the live entity do not reach the
 * recording.
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Matchtape_EntityMeta {
    uint16_t netid;
    char kind[MATCHTAPE_KIND_MAX];
    int team;
    int sex;
    int head;
    uint16_t player_id;                                 /**< 0 when no player */
    char player_username[MATCHTAPE_PLAYER_NAME_MAX];
    char player_charname[MATCHTAPE_PLAYER_NAME_MAX];
} Matchtape_EntityMeta;

/**
 * Capture meta from a live entity through the host.
 *
 * @return false if the host cannot describe the entity
 */
bool matchtape_entity_meta_capture(const Matchtape_Host *host, Matchtape_EntityId entity,
                                   Matchtape_EntityMeta *out);

/** Build meta from an already-read host description. */
void matchtape_entity_meta_from_desc(const Matchtape_EntityDesc *desc, Matchtape_EntityMeta *out);

/** @return true iff a player is attached (player_id != 0) */
bool matchtape_entity_meta_has_player(const Matchtape_EntityMeta *meta);

/**
 * Write a <blobmeta> block. Player fields are omitted without a player.
 */
bool matchtape_entity_meta_write(const Matchtape_EntityMeta *meta, Matchtape_TagWriter *writer);

/**
 * Read a <blobmeta> block. Missing player fields mean a non-player entity.
 */
bool matchtape_entity_meta_read(const Matchtape_TagNode *node, Matchtape_EntityMeta *out);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_ENTITY_META_H */
