/**
 * Matchtape - Session Recording
 *
 * Capture, query, serialization and parsing of tick-indexed recordings.
 */

#include "matchtape/recording.h"
#include "matchtape/error.h"
#include "matchtape/log.h"
#include "matchtape/tagblock.h"
#include "matchtape/validate.h"

#include <new>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <unordered_map>
#include <vector>

/*============================================================================
 * Internal Structures
 *============================================================================*/

struct SavePoint {
    std::string name;
    size_t tick;
};

struct Matchtape_Recording {
    Matchtape_RecordingConfig config;

    std::vector<std::vector<Matchtape_EntitySample>> ticks;
    std::vector<Matchtape_EntityMeta> metas;
    std::unordered_map<uint16_t, size_t> meta_index;
    std::vector<SavePoint> save_points;

    /* Enumeration scratch, reused every tick */
    std::vector<Matchtape_EntityId> live;

    uint32_t init_time;
    uint32_t end_time;
    char map_name[MATCHTAPE_MAP_NAME_MAX];

    bool started;
    bool ended;
};

bool matchtape_record_player_characters(const Matchtape_EntityDesc *desc, void *userdata) {
    (void)userdata;
    return desc && desc->player_id != 0;
}

/*============================================================================
 * Helpers
 *============================================================================*/

static void enumerate_live(Matchtape_Recording *rec, const Matchtape_Host *host) {
    if (rec->live.size() < rec->config.max_entities) {
        rec->live.resize(rec->config.max_entities);
    }

    size_t count = host->list_entities(host->userdata, rec->live.data(), rec->live.size());
    if (count > rec->live.size()) {
        rec->live.resize(count);
        count = host->list_entities(host->userdata, rec->live.data(), rec->live.size());
        if (count > rec->live.size()) count = rec->live.size();
    }
    rec->live.resize(count);
}

/* Describe entity and apply the predicate */
static bool qualifies(const Matchtape_Recording *rec, const Matchtape_Host *host,
                      Matchtape_EntityId id, Matchtape_EntityDesc *desc) {
    memset(desc, 0, sizeof(*desc));
    if (!host->describe_entity(host->userdata, id, desc)) {
        return false;
    }
    return rec->config.predicate(desc, rec->config.predicate_userdata);
}

static bool insert_meta(Matchtape_Recording *rec, const Matchtape_EntityMeta *meta) {
    if (rec->meta_index.count(meta->netid)) return false;
    rec->meta_index[meta->netid] = rec->metas.size();
    rec->metas.push_back(*meta);
    return true;
}

static void observe_meta(Matchtape_Recording *rec, const Matchtape_EntityDesc *desc) {
    if (rec->meta_index.count(desc->netid)) return;

    Matchtape_EntityMeta meta;
    matchtape_entity_meta_from_desc(desc, &meta);
    insert_meta(rec, &meta);
    matchtape_log_debug(MATCHTAPE_LOG_RECORD, "New entity netid=%u kind=%s team=%d player=%u",
                        meta.netid, meta.kind, meta.team, meta.player_id);
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

Matchtape_Recording *matchtape_recording_create(const Matchtape_RecordingConfig *config) {
    Matchtape_Recording *rec = new (std::nothrow) Matchtape_Recording();
    if (!rec) {
        matchtape_set_error("recording: failed to allocate recording");
        return nullptr;
    }

    if (config) {
        rec->config = *config;
    } else {
        Matchtape_RecordingConfig def = MATCHTAPE_RECORDING_CONFIG_DEFAULT;
        rec->config = def;
    }
    if (!rec->config.predicate) {
        rec->config.predicate = matchtape_record_player_characters;
    }
    if (rec->config.max_entities == 0) {
        rec->config.max_entities = MATCHTAPE_RECORDING_DEFAULT_MAX_ENTITIES;
    }

    rec->init_time = 0;
    rec->end_time = 0;
    rec->map_name[0] = '\0';
    rec->started = false;
    rec->ended = false;

    return rec;
}

void matchtape_recording_destroy(Matchtape_Recording *rec) {
    delete rec;
}

/*============================================================================
 * Capture
 *============================================================================*/

bool matchtape_recording_start(Matchtape_Recording *rec, const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTRS2_RET(rec, host, false);

    if (rec->started) {
        matchtape_set_error("recording: already started");
        return false;
    }

    rec->init_time = host->get_time(host->userdata);
    if (!host->get_map_name(host->userdata, rec->map_name, sizeof(rec->map_name))) {
        rec->map_name[0] = '\0';
        matchtape_log_warning(MATCHTAPE_LOG_RECORD, "Host did not report a map name");
    }

    enumerate_live(rec, host);
    Matchtape_EntityDesc desc;
    for (Matchtape_EntityId id : rec->live) {
        if (qualifies(rec, host, id, &desc)) {
            observe_meta(rec, &desc);
        }
    }

    rec->started = true;
    matchtape_log_info(MATCHTAPE_LOG_RECORD, "Recording started on '%s' at t=%u with %zu entities",
                       rec->map_name, rec->init_time, rec->metas.size());
    return true;
}

bool matchtape_recording_capture_tick(Matchtape_Recording *rec, const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTRS2_RET(rec, host, false);

    if (!rec->started) {
        matchtape_set_error("recording: capture before start");
        return false;
    }
    if (rec->ended) {
        matchtape_set_error("recording: capture after end");
        return false;
    }

    enumerate_live(rec, host);

    std::vector<Matchtape_EntitySample> tick;
    tick.reserve(rec->live.size());

    Matchtape_EntityDesc desc;
    for (Matchtape_EntityId id : rec->live) {
        if (!qualifies(rec, host, id, &desc)) continue;

        observe_meta(rec, &desc);

        Matchtape_EntitySample sample;
        if (matchtape_entity_sample_capture(host, id, desc.netid, &sample)) {
            tick.push_back(sample);
        }
    }

    rec->ticks.push_back(std::move(tick));
    return true;
}

bool matchtape_recording_end(Matchtape_Recording *rec, const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTRS2_RET(rec, host, false);

    if (!rec->started) {
        matchtape_set_error("recording: end before start");
        return false;
    }
    if (rec->ended) {
        matchtape_set_error("recording: already ended");
        return false;
    }

    rec->end_time = host->get_time(host->userdata);
    rec->ended = true;
    matchtape_log_info(MATCHTAPE_LOG_RECORD, "Recording ended at t=%u: %zu ticks, %zu entities",
                       rec->end_time, rec->ticks.size(), rec->metas.size());
    return true;
}

bool matchtape_recording_is_started(const Matchtape_Recording *rec) {
    return rec && rec->started;
}

bool matchtape_recording_is_ended(const Matchtape_Recording *rec) {
    return rec && rec->ended;
}

/*============================================================================
 * Queries
 *============================================================================*/

size_t matchtape_recording_get_num_ticks(const Matchtape_Recording *rec) {
    return rec ? rec->ticks.size() : 0;
}

uint32_t matchtape_recording_get_init_time(const Matchtape_Recording *rec) {
    return rec ? rec->init_time : 0;
}

uint32_t matchtape_recording_get_end_time(const Matchtape_Recording *rec) {
    return rec ? rec->end_time : 0;
}

const char *matchtape_recording_get_map_name(const Matchtape_Recording *rec) {
    return rec ? rec->map_name : "";
}

const Matchtape_EntitySample *matchtape_recording_get_tick(const Matchtape_Recording *rec,
                                                           size_t index, size_t *out_count) {
    if (out_count) *out_count = 0;
    MATCHTAPE_VALIDATE_PTR_RET(rec, NULL);
    MATCHTAPE_VALIDATE_INDEX_RET(index, rec->ticks.size(), NULL);

    const std::vector<Matchtape_EntitySample> &tick = rec->ticks[index];
    if (out_count) *out_count = tick.size();
    return tick.empty() ? NULL : tick.data();
}

const Matchtape_EntityMeta *matchtape_recording_find_meta(const Matchtape_Recording *rec,
                                                          uint16_t netid) {
    if (!rec) return NULL;
    auto it = rec->meta_index.find(netid);
    if (it == rec->meta_index.end()) return NULL;
    return &rec->metas[it->second];
}

size_t matchtape_recording_get_meta_count(const Matchtape_Recording *rec) {
    return rec ? rec->metas.size() : 0;
}

const Matchtape_EntityMeta *matchtape_recording_get_meta(const Matchtape_Recording *rec,
                                                         size_t index) {
    if (!rec || index >= rec->metas.size()) return NULL;
    return &rec->metas[index];
}

/*============================================================================
 * Save Points
 *============================================================================*/

static const SavePoint *find_save_point(const Matchtape_Recording *rec, const char *name) {
    for (const SavePoint &sp : rec->save_points) {
        if (sp.name == name) return &sp;
    }
    return nullptr;
}

static bool add_save_point_at(Matchtape_Recording *rec, const char *name, size_t tick) {
    if (strlen(name) >= MATCHTAPE_SAVE_POINT_NAME_MAX) {
        matchtape_set_error("recording: save point name too long (max %d)",
                            MATCHTAPE_SAVE_POINT_NAME_MAX - 1);
        return false;
    }
    if (find_save_point(rec, name)) {
        matchtape_set_error("recording: save point '%s' already exists", name);
        return false;
    }
    rec->save_points.push_back(SavePoint{name, tick});
    return true;
}

bool matchtape_recording_add_save_point(Matchtape_Recording *rec, const char *name) {
    MATCHTAPE_VALIDATE_PTR_RET(rec, false);
    MATCHTAPE_VALIDATE_STRING_RET(name, false);

    if (!rec->started || rec->ended) {
        matchtape_set_error("recording: save points can only be added while recording");
        return false;
    }
    if (!add_save_point_at(rec, name, rec->ticks.size())) {
        return false;
    }

    matchtape_log_info(MATCHTAPE_LOG_RECORD, "Save point '%s' at tick %zu", name, rec->ticks.size());
    return true;
}

bool matchtape_recording_find_save_point(const Matchtape_Recording *rec, const char *name,
                                         size_t *out_tick) {
    MATCHTAPE_VALIDATE_PTRS2_RET(rec, name, false);

    const SavePoint *sp = find_save_point(rec, name);
    if (!sp) {
        matchtape_set_error("recording: no save point named '%s'", name);
        return false;
    }
    if (out_tick) *out_tick = sp->tick;
    return true;
}

size_t matchtape_recording_get_save_point_count(const Matchtape_Recording *rec) {
    return rec ? rec->save_points.size() : 0;
}

const char *matchtape_recording_get_save_point(const Matchtape_Recording *rec, size_t index,
                                               size_t *out_tick) {
    if (!rec || index >= rec->save_points.size()) return NULL;
    if (out_tick) *out_tick = rec->save_points[index].tick;
    return rec->save_points[index].name.c_str();
}

/*============================================================================
 * Serialization
 *============================================================================*/

static bool write_recording(const Matchtape_Recording *rec, Matchtape_TagWriter *w) {
    bool ok = matchtape_tag_open(w, "matchrecording") &&
              matchtape_tag_write_int(w, "version", MATCHTAPE_RECORDING_VERSION) &&
              matchtape_tag_write_uint(w, "initT", rec->init_time) &&
              matchtape_tag_write_uint(w, "endT", rec->end_time) &&
              matchtape_tag_write_string(w, "mapname", rec->map_name) &&
              matchtape_tag_open(w, "allblobmeta");

    for (size_t i = 0; ok && i < rec->metas.size(); i++) {
        ok = matchtape_entity_meta_write(&rec->metas[i], w);
    }

    ok = ok && matchtape_tag_close(w, "allblobmeta") &&
         matchtape_tag_open(w, "recording");

    for (size_t t = 0; ok && t < rec->ticks.size(); t++) {
        ok = matchtape_tag_open(w, "tick");
        for (size_t s = 0; ok && s < rec->ticks[t].size(); s++) {
            ok = matchtape_entity_sample_write(&rec->ticks[t][s], w);
        }
        ok = ok && matchtape_tag_close(w, "tick");
    }

    ok = ok && matchtape_tag_close(w, "recording");

    if (ok && !rec->save_points.empty()) {
        ok = matchtape_tag_open(w, "savepoints");
        for (size_t i = 0; ok && i < rec->save_points.size(); i++) {
            ok = matchtape_tag_open(w, "savepoint") &&
                 matchtape_tag_write_string(w, "name", rec->save_points[i].name.c_str()) &&
                 matchtape_tag_write_uint(w, "tick", rec->save_points[i].tick) &&
                 matchtape_tag_close(w, "savepoint");
        }
        ok = ok && matchtape_tag_close(w, "savepoints");
    }

    return ok && matchtape_tag_close(w, "matchrecording");
}

char *matchtape_recording_serialize(const Matchtape_Recording *rec, size_t *out_len) {
    MATCHTAPE_VALIDATE_PTR_RET(rec, NULL);

    Matchtape_TagWriter *writer = matchtape_tag_writer_create();
    if (!writer) {
        return NULL;
    }

    char *text = NULL;
    if (write_recording(rec, writer)) {
        text = matchtape_tag_writer_finish(writer, out_len);
    }
    matchtape_tag_writer_destroy(writer);

    if (!text) {
        matchtape_log_error(MATCHTAPE_LOG_FORMAT, "Serialization failed: %s",
                            matchtape_get_last_error());
    }
    return text;
}

/*============================================================================
 * Parsing
 *============================================================================*/

static const Matchtape_TagNode *require_block(const Matchtape_TagNode *node, const char *name) {
    const Matchtape_TagNode *child = matchtape_tag_node_find(node, name);
    if (!child) {
        matchtape_set_error("recording: line %d: <%s> is missing <%s>",
                            matchtape_tag_node_line(node), matchtape_tag_node_name(node), name);
    }
    return child;
}

static bool expect_name(const Matchtape_TagNode *node, const char *name) {
    if (strcmp(matchtape_tag_node_name(node), name) != 0) {
        matchtape_set_error("recording: line %d: expected <%s>, found <%s>",
                            matchtape_tag_node_line(node), name, matchtape_tag_node_name(node));
        return false;
    }
    return true;
}

static bool parse_metas(Matchtape_Recording *rec, const Matchtape_TagNode *all) {
    for (size_t i = 0; i < matchtape_tag_node_child_count(all); i++) {
        const Matchtape_TagNode *node = matchtape_tag_node_child(all, i);
        if (!expect_name(node, "blobmeta")) return false;

        Matchtape_EntityMeta meta;
        if (!matchtape_entity_meta_read(node, &meta)) return false;
        if (!insert_meta(rec, &meta)) {
            matchtape_set_error("recording: line %d: duplicate meta for netid %u",
                                matchtape_tag_node_line(node), meta.netid);
            return false;
        }
    }
    return true;
}

static bool parse_ticks(Matchtape_Recording *rec, const Matchtape_TagNode *recording,
                        size_t *unresolved) {
    size_t tick_count = matchtape_tag_node_child_count(recording);
    rec->ticks.reserve(tick_count);

    for (size_t t = 0; t < tick_count; t++) {
        const Matchtape_TagNode *tick_node = matchtape_tag_node_child(recording, t);
        if (!expect_name(tick_node, "tick")) return false;

        std::vector<Matchtape_EntitySample> tick;
        for (size_t s = 0; s < matchtape_tag_node_child_count(tick_node); s++) {
            const Matchtape_TagNode *node = matchtape_tag_node_child(tick_node, s);
            if (!expect_name(node, "blobdata")) return false;

            Matchtape_EntitySample sample;
            if (!matchtape_entity_sample_read(node, &sample)) return false;
            if (!rec->meta_index.count(sample.netid)) {
                (*unresolved)++;
            }
            tick.push_back(sample);
        }
        rec->ticks.push_back(std::move(tick));
    }
    return true;
}

static bool parse_save_points(Matchtape_Recording *rec, const Matchtape_TagNode *list) {
    for (size_t i = 0; i < matchtape_tag_node_child_count(list); i++) {
        const Matchtape_TagNode *node = matchtape_tag_node_child(list, i);
        if (!expect_name(node, "savepoint")) return false;

        char name[MATCHTAPE_SAVE_POINT_NAME_MAX];
        uint32_t tick;
        if (!matchtape_tag_get_string(node, "name", name, sizeof(name)) ||
            !matchtape_tag_get_u32(node, "tick", &tick)) {
            return false;
        }
        if (name[0] == '\0' || tick > rec->ticks.size()) {
            matchtape_set_error("recording: line %d: invalid save point",
                                matchtape_tag_node_line(node));
            return false;
        }
        if (!add_save_point_at(rec, name, tick)) return false;
    }
    return true;
}

static bool parse_root(Matchtape_Recording *rec, const Matchtape_TagNode *root) {
    if (!expect_name(root, "matchrecording")) return false;

    int version;
    if (!matchtape_tag_get_int(root, "version", &version)) return false;
    if (version > MATCHTAPE_RECORDING_VERSION) {
        matchtape_set_error("recording: version %d is newer than supported version %d",
                            version, MATCHTAPE_RECORDING_VERSION);
        return false;
    }
    if (version < MATCHTAPE_RECORDING_MIN_VERSION) {
        matchtape_set_error("recording: version %d is too old (min %d)",
                            version, MATCHTAPE_RECORDING_MIN_VERSION);
        return false;
    }

    if (!matchtape_tag_get_u32(root, "initT", &rec->init_time) ||
        !matchtape_tag_get_u32(root, "endT", &rec->end_time) ||
        !matchtape_tag_get_string(root, "mapname", rec->map_name, sizeof(rec->map_name))) {
        return false;
    }

    const Matchtape_TagNode *all = require_block(root, "allblobmeta");
    const Matchtape_TagNode *recording = all ? require_block(root, "recording") : NULL;
    if (!recording || !parse_metas(rec, all)) return false;

    size_t unresolved = 0;
    if (!parse_ticks(rec, recording, &unresolved)) return false;
    if (unresolved > 0) {
        matchtape_log_warning(MATCHTAPE_LOG_FORMAT,
                              "%zu samples reference netids with no meta", unresolved);
    }

    const Matchtape_TagNode *save_points = matchtape_tag_node_find(root, "savepoints");
    if (save_points && !parse_save_points(rec, save_points)) return false;

    return true;
}

Matchtape_Recording *matchtape_recording_parse(const char *text, size_t len,
                                               const char *source_name) {
    MATCHTAPE_VALIDATE_PTR_RET(text, NULL);

    Matchtape_TagNode *root = matchtape_tag_parse(text, len, source_name);
    if (!root) {
        return NULL;
    }

    Matchtape_Recording *rec = matchtape_recording_create(NULL);
    if (!rec) {
        matchtape_tag_node_destroy(root);
        return NULL;
    }

    bool ok = parse_root(rec, root);
    matchtape_tag_node_destroy(root);

    if (!ok) {
        matchtape_recording_destroy(rec);
        return NULL;
    }

    rec->started = true;
    rec->ended = true;
    matchtape_log_info(MATCHTAPE_LOG_FORMAT, "Parsed recording '%s': %zu ticks, %zu entities",
                       source_name ? source_name : "<source>", rec->ticks.size(), rec->metas.size());
    return rec;
}
