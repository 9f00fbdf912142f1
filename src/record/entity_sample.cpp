/**
 * Matchtape - Entity Samples
 *
 * Per-tick position, aim, keys and health of a recorded entity.
 */

#include "matchtape/entity_sample.h"
#include "matchtape/validate.h"
#include <string.h>

bool matchtape_entity_sample_capture(const Matchtape_Host *host, Matchtape_EntityId entity,
                                     uint16_t netid, Matchtape_EntitySample *out) {
    MATCHTAPE_VALIDATE_PTRS2_RET(host, out, false);

    Matchtape_EntitySample sample;
    memset(&sample, 0, sizeof(sample));
    sample.netid = netid;
    sample.position = host->get_position(host->userdata, entity);
    sample.aim = host->get_aim(host->userdata, entity);
    sample.health = host->get_health(host->userdata, entity);

    for (int k = 0; k < MATCHTAPE_KEY_COUNT; k++) {
        if (host->is_key_pressed(host->userdata, entity, (Matchtape_Key)k)) {
            sample.keys |= MATCHTAPE_KEY_BIT(k);
        }
    }

    *out = sample;
    return true;
}

bool matchtape_entity_sample_key_down(const Matchtape_EntitySample *sample, Matchtape_Key key) {
    if (!sample || (int)key < 0 || key >= MATCHTAPE_KEY_COUNT) return false;
    return (sample->keys & MATCHTAPE_KEY_BIT(key)) != 0;
}

bool matchtape_entity_sample_write(const Matchtape_EntitySample *sample, Matchtape_TagWriter *writer) {
    MATCHTAPE_VALIDATE_PTRS2_RET(sample, writer, false);

    return matchtape_tag_open(writer, "blobdata") &&
           matchtape_tag_write_uint(writer, "netid", sample->netid) &&
           matchtape_tag_write_vec2(writer, "position", sample->position) &&
           matchtape_tag_write_vec2(writer, "aimpos", sample->aim) &&
           matchtape_tag_write_uint(writer, "keys", sample->keys) &&
           matchtape_tag_write_float(writer, "health", sample->health) &&
           matchtape_tag_close(writer, "blobdata");
}

bool matchtape_entity_sample_read(const Matchtape_TagNode *node, Matchtape_EntitySample *out) {
    MATCHTAPE_VALIDATE_PTRS2_RET(node, out, false);

    Matchtape_EntitySample sample;
    memset(&sample, 0, sizeof(sample));

    if (!matchtape_tag_get_u16(node, "netid", &sample.netid) ||
        !matchtape_tag_get_vec2(node, "position", &sample.position) ||
        !matchtape_tag_get_vec2(node, "aimpos", &sample.aim) ||
        !matchtape_tag_get_u16(node, "keys", &sample.keys) ||
        !matchtape_tag_get_float(node, "health", &sample.health)) {
        return false;
    }

    *out = sample;
    return true;
}
