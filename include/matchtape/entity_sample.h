#ifndef MATCHTAPE_ENTITY_SAMPLE_H
#define MATCHTAPE_ENTITY_SAMPLE_H

#include "matchtape/host.h"
#include "matchtape/tagblock.h"
#include <stdbool.h>
#include <stdint.h>

/**
 * @file entity_sample.h
 * @brief Dynamic state of one recorded entity at one tick
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef struct Matchtape_EntitySample {
    uint16_t netid;
    Matchtape_Vec2 position;
    Matchtape_Vec2 aim;
    uint16_t keys;          /**< One bit per Matchtape_Key */
    float health;
} Matchtape_EntitySample;

/**
 * Read position, aim, pressed keys and health from a live entity.
 * Issues one is_key_pressed query per recognized key.
 */
bool matchtape_entity_sample_capture(const Matchtape_Host *host, Matchtape_EntityId entity,
                                     uint16_t netid, Matchtape_EntitySample *out);

/** @return true if the key bit is set */
bool matchtape_entity_sample_key_down(const Matchtape_EntitySample *sample, Matchtape_Key key);

/** Write a <blobdata> block. */
bool matchtape_entity_sample_write(const Matchtape_EntitySample *sample, Matchtape_TagWriter *writer);

/** Read a <blobdata> block. */
bool matchtape_entity_sample_read(const Matchtape_TagNode *node, Matchtape_EntitySample *out);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_ENTITY_SAMPLE_H */
