/**
 * Matchtape - Entity Metadata
 *
 * Identity captured once per recorded entity, and its block form.
 */

#include "matchtape/entity_meta.h"
#include "matchtape/error.h"
#include "matchtape/validate.h"
#include <stdio.h>
#include <string.h>

void matchtape_entity_meta_from_desc(const Matchtape_EntityDesc *desc, Matchtape_EntityMeta *out) {
    if (!desc || !out) return;

    memset(out, 0, sizeof(*out));
    out->netid = desc->netid;
    snprintf(out->kind, sizeof(out->kind), "%s", desc->kind);
    out->team = desc->team;
    out->sex = desc->sex;
    out->head = desc->head;
    out->player_id = desc->player_id;
    if (desc->player_id != 0) {
        snprintf(out->player_username, sizeof(out->player_username), "%s", desc->player_username);
        snprintf(out->player_charname, sizeof(out->player_charname), "%s", desc->player_charname);
    }
}

bool matchtape_entity_meta_capture(const Matchtape_Host *host, Matchtape_EntityId entity,
                                   Matchtape_EntityMeta *out) {
    MATCHTAPE_VALIDATE_PTRS2_RET(host, out, false);

    Matchtape_EntityDesc desc;
    memset(&desc, 0, sizeof(desc));
    if (!host->describe_entity(host->userdata, entity, &desc)) {
        matchtape_set_error("entity_meta: host cannot describe entity %llu",
                            (unsigned long long)entity);
        return false;
    }

    matchtape_entity_meta_from_desc(&desc, out);
    return true;
}

bool matchtape_entity_meta_has_player(const Matchtape_EntityMeta *meta) {
    return meta && meta->player_id != 0;
}

bool matchtape_entity_meta_write(const Matchtape_EntityMeta *meta, Matchtape_TagWriter *writer) {
    MATCHTAPE_VALIDATE_PTRS2_RET(meta, writer, false);

    bool ok = matchtape_tag_open(writer, "blobmeta") &&
              matchtape_tag_write_uint(writer, "netid", meta->netid) &&
              matchtape_tag_write_string(writer, "name", meta->kind) &&
              matchtape_tag_write_int(writer, "teamNum", meta->team) &&
              matchtape_tag_write_int(writer, "sexNum", meta->sex) &&
              matchtape_tag_write_int(writer, "headNum", meta->head);

    if (ok && matchtape_entity_meta_has_player(meta)) {
        ok = matchtape_tag_write_uint(writer, "playerid", meta->player_id) &&
             matchtape_tag_write_string(writer, "playerusername", meta->player_username) &&
             matchtape_tag_write_string(writer, "playercharname", meta->player_charname);
    }

    return ok && matchtape_tag_close(writer, "blobmeta");
}

bool matchtape_entity_meta_read(const Matchtape_TagNode *node, Matchtape_EntityMeta *out) {
    MATCHTAPE_VALIDATE_PTRS2_RET(node, out, false);

    Matchtape_EntityMeta meta;
    memset(&meta, 0, sizeof(meta));

    if (!matchtape_tag_get_u16(node, "netid", &meta.netid) ||
        !matchtape_tag_get_string(node, "name", meta.kind, sizeof(meta.kind)) ||
        !matchtape_tag_get_int(node, "teamNum", &meta.team) ||
        !matchtape_tag_get_int(node, "sexNum", &meta.sex) ||
        !matchtape_tag_get_int(node, "headNum", &meta.head)) {
        return false;
    }

    if (matchtape_tag_node_find(node, "playerid")) {
        if (!matchtape_tag_get_u16(node, "playerid", &meta.player_id) ||
            !matchtape_tag_get_string(node, "playerusername", meta.player_username,
                                      sizeof(meta.player_username)) ||
            !matchtape_tag_get_string(node, "playercharname", meta.player_charname,
                                      sizeof(meta.player_charname))) {
            return false;
        }
    }

    *out = meta;
    return true;
}
