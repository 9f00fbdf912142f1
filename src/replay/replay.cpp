/**
 * Matchtape - Session Replay
 *
 * Re-instantiates recorded entities and drives them from recorded samples.
 */

#include "matchtape/replay.h"
#include "matchtape/error.h"
#include "matchtape/log.h"
#include "matchtape/validate.h"

#include <new>
#include <string.h>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/*============================================================================
 * Internal Structures
 *============================================================================*/

struct Matchtape_Replay {
    const Matchtape_Recording *rec;
    Matchtape_ReplayConfig config;
    Matchtape_KindTable *kinds;

    bool started;
    size_t fake_t;

    /* Recorded netid to live entity. MATCHTAPE_INVALID_ENTITY marks a
     * failed spawn or a vanished entity: never re-spawned in this run. */
    std::unordered_map<uint16_t, Matchtape_EntityId> mapping;

    Matchtape_ReplayStats stats;
};

/*============================================================================
 * Lifecycle
 *============================================================================*/

Matchtape_Replay *matchtape_replay_create(const Matchtape_Recording *rec,
                                          const Matchtape_ReplayConfig *config) {
    MATCHTAPE_VALIDATE_PTR_RET(rec, nullptr);

    Matchtape_Replay *replay = new (std::nothrow) Matchtape_Replay();
    if (!replay) {
        matchtape_set_error("replay: failed to allocate replay");
        return nullptr;
    }

    if (config) {
        replay->config = *config;
    } else {
        Matchtape_ReplayConfig def = MATCHTAPE_REPLAY_CONFIG_DEFAULT;
        replay->config = def;
    }
    if (replay->config.snap_threshold < 0.0f) {
        replay->config.snap_threshold = MATCHTAPE_REPLAY_DEFAULT_SNAP_THRESHOLD;
    }

    replay->kinds = replay->config.kinds
        ? matchtape_kind_table_clone(replay->config.kinds)
        : matchtape_kind_table_create_default();
    if (!replay->kinds) {
        delete replay;
        return nullptr;
    }
    replay->config.kinds = replay->kinds;

    replay->rec = rec;
    replay->started = false;
    replay->fake_t = 0;
    memset(&replay->stats, 0, sizeof(replay->stats));

    return replay;
}

void matchtape_replay_destroy(Matchtape_Replay *replay) {
    if (!replay) return;
    matchtape_kind_table_destroy(replay->kinds);
    delete replay;
}

/*============================================================================
 * Host Helpers
 *============================================================================*/

size_t matchtape_replay_force_spectators(const Matchtape_Host *host, int team) {
    if (!host) return 0;

    std::vector<uint16_t> players(64);
    size_t count = host->list_players(host->userdata, players.data(), players.size());
    if (count > players.size()) {
        players.resize(count);
        count = host->list_players(host->userdata, players.data(), players.size());
        if (count > players.size()) count = players.size();
    }

    size_t moved = 0;
    for (size_t i = 0; i < count; i++) {
        if (host->get_player_team(host->userdata, players[i]) != team) {
            host->set_player_team(host->userdata, players[i], team);
            moved++;
        }
    }
    return moved;
}

static std::vector<Matchtape_EntityId> list_live(const Matchtape_Host *host) {
    std::vector<Matchtape_EntityId> ids(256);
    size_t count = host->list_entities(host->userdata, ids.data(), ids.size());
    if (count > ids.size()) {
        ids.resize(count);
        count = host->list_entities(host->userdata, ids.data(), ids.size());
        if (count > ids.size()) count = ids.size();
    }
    ids.resize(count);
    return ids;
}

/* Destroy live entities of every kind the recording re-creates */
static size_t clear_recorded_kinds(const Matchtape_Replay *replay, const Matchtape_Host *host) {
    std::unordered_set<std::string> kinds;
    for (size_t i = 0; i < matchtape_recording_get_meta_count(replay->rec); i++) {
        kinds.insert(matchtape_recording_get_meta(replay->rec, i)->kind);
    }
    if (kinds.empty()) return 0;

    std::vector<Matchtape_EntityId> doomed;
    for (Matchtape_EntityId id : list_live(host)) {
        Matchtape_EntityDesc desc;
        memset(&desc, 0, sizeof(desc));
        if (host->describe_entity(host->userdata, id, &desc) && kinds.count(desc.kind)) {
            doomed.push_back(id);
        }
    }

    for (Matchtape_EntityId id : doomed) {
        host->destroy_entity(host->userdata, id);
    }
    return doomed.size();
}

/*============================================================================
 * Tick Application
 *============================================================================*/

static Matchtape_EntityId spawn(Matchtape_Replay *replay, const Matchtape_Host *host,
                                const Matchtape_EntityMeta *meta, const Matchtape_EntitySample *sample) {
    void *ud = host->userdata;
    Matchtape_EntityId id = MATCHTAPE_INVALID_ENTITY;

    switch (matchtape_kind_table_lookup(replay->kinds, meta->kind)) {
        case MATCHTAPE_SPAWN_APPEARANCE:
            id = host->create_entity_uninitialized(ud, meta->kind);
            if (id == MATCHTAPE_INVALID_ENTITY) break;

            host->set_team(ud, id, meta->team);
            host->set_position(ud, id, sample->position);
            host->set_appearance(ud, id, meta->sex, meta->head);
            if (!host->init_entity(ud, id)) {
                host->destroy_entity(ud, id);
                id = MATCHTAPE_INVALID_ENTITY;
            }
            break;

        case MATCHTAPE_SPAWN_GENERIC:
            id = host->create_entity(ud, meta->kind, meta->team, sample->position);
            break;
    }

    if (id == MATCHTAPE_INVALID_ENTITY) {
        replay->stats.spawn_failures++;
        matchtape_log_error(MATCHTAPE_LOG_REPLAY,
                            "Spawn failed: netid=%u kind='%s' team=%d at (%.2f, %.2f)",
                            meta->netid, meta->kind, meta->team,
                            (double)sample->position.x, (double)sample->position.y);
        return MATCHTAPE_INVALID_ENTITY;
    }

    replay->stats.spawned++;
    matchtape_log_debug(MATCHTAPE_LOG_REPLAY, "Spawned netid=%u kind='%s' as entity %llu",
                        meta->netid, meta->kind, (unsigned long long)id);
    return id;
}

static void apply_control(Matchtape_Replay *replay, const Matchtape_Host *host,
                          Matchtape_EntityId id, const Matchtape_EntitySample *sample) {
    void *ud = host->userdata;

    Matchtape_Vec2 live = host->get_position(ud, id);
    if (matchtape_vec2_distance(live, sample->position) > replay->config.snap_threshold) {
        host->set_position(ud, id, sample->position);
        replay->stats.snaps++;
        matchtape_log_debug(MATCHTAPE_LOG_REPLAY, "Snapped netid=%u from (%.2f, %.2f) to (%.2f, %.2f)",
                            sample->netid, (double)live.x, (double)live.y,
                            (double)sample->position.x, (double)sample->position.y);
    }

    host->set_aim(ud, id, sample->aim);

    for (int k = 0; k < MATCHTAPE_KEY_COUNT; k++) {
        host->set_key_pressed(ud, id, (Matchtape_Key)k,
                              (sample->keys & MATCHTAPE_KEY_BIT(k)) != 0);
    }
}

static void apply_sample(Matchtape_Replay *replay, const Matchtape_Host *host,
                         const Matchtape_EntitySample *sample) {
    const Matchtape_EntityMeta *meta = matchtape_recording_find_meta(replay->rec, sample->netid);
    if (!meta) {
        replay->stats.missing_meta++;
        matchtape_log_error(MATCHTAPE_LOG_REPLAY, "Tick %zu: no meta for netid %u, sample skipped",
                            replay->fake_t, sample->netid);
        return;
    }

    auto it = replay->mapping.find(sample->netid);
    if (it == replay->mapping.end()) {
        Matchtape_EntityId id = spawn(replay, host, meta, sample);
        replay->mapping.emplace(sample->netid, id);
        if (id != MATCHTAPE_INVALID_ENTITY) {
            apply_control(replay, host, id, sample);
        }
        return;
    }

    Matchtape_EntityId id = it->second;
    if (id == MATCHTAPE_INVALID_ENTITY) {
        return;
    }

    if (!host->entity_exists(host->userdata, id)) {
        replay->stats.stale_mappings++;
        matchtape_log_warning(MATCHTAPE_LOG_REPLAY,
                              "Tick %zu: entity %llu for netid %u no longer exists, not re-spawning",
                              replay->fake_t, (unsigned long long)id, sample->netid);
        it->second = MATCHTAPE_INVALID_ENTITY;
        return;
    }

    apply_control(replay, host, id, sample);
}

static void apply_tick(Matchtape_Replay *replay, const Matchtape_Host *host) {
    size_t count = 0;
    const Matchtape_EntitySample *samples =
        matchtape_recording_get_tick(replay->rec, replay->fake_t, &count);

    for (size_t i = 0; i < count; i++) {
        apply_sample(replay, host, &samples[i]);
    }
    replay->stats.ticks_applied++;
}

/*============================================================================
 * Playback
 *============================================================================*/

bool matchtape_replay_start(Matchtape_Replay *replay, const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTRS2_RET(replay, host, false);

    size_t num_ticks = matchtape_recording_get_num_ticks(replay->rec);
    if (num_ticks == 0) {
        matchtape_set_error("replay: recording has no ticks");
        return false;
    }
    if (replay->config.first_tick >= num_ticks) {
        matchtape_set_error("replay: first tick %zu is past the end (%zu ticks)",
                            replay->config.first_tick, num_ticks);
        return false;
    }

    size_t moved = matchtape_replay_force_spectators(host, replay->config.spectator_team);
    size_t cleared = clear_recorded_kinds(replay, host);

    uint32_t starts = replay->stats.starts + 1;
    memset(&replay->stats, 0, sizeof(replay->stats));
    replay->stats.starts = starts;

    replay->mapping.clear();
    replay->fake_t = replay->config.first_tick;
    replay->started = true;

    matchtape_log_info(MATCHTAPE_LOG_REPLAY,
                       "Replay start #%u at tick %zu of %zu (%zu players to spectators, %zu entities cleared)",
                       starts, replay->fake_t, num_ticks, moved, cleared);

    apply_tick(replay, host);
    return true;
}

bool matchtape_replay_advance(Matchtape_Replay *replay, const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTRS2_RET(replay, host, false);

    if (!replay->started) {
        matchtape_set_error("replay: advance before start");
        return false;
    }

    size_t num_ticks = matchtape_recording_get_num_ticks(replay->rec);
    if (replay->fake_t + 1 >= num_ticks) {
        matchtape_set_error("replay: advance past final tick %zu", num_ticks - 1);
        matchtape_log_error(MATCHTAPE_LOG_REPLAY, "%s", matchtape_get_last_error());
        return false;
    }

    replay->fake_t++;
    apply_tick(replay, host);
    return true;
}

bool matchtape_replay_is_finished(const Matchtape_Replay *replay) {
    if (!replay || !replay->started) return false;
    return replay->fake_t + 1 >= matchtape_recording_get_num_ticks(replay->rec);
}

Matchtape_ReplayState matchtape_replay_get_state(const Matchtape_Replay *replay) {
    if (!replay || !replay->started) return MATCHTAPE_REPLAY_IDLE;
    return matchtape_replay_is_finished(replay) ? MATCHTAPE_REPLAY_FINISHED : MATCHTAPE_REPLAY_ACTIVE;
}

size_t matchtape_replay_get_tick(const Matchtape_Replay *replay) {
    return replay ? replay->fake_t : 0;
}

const Matchtape_Recording *matchtape_replay_get_recording(const Matchtape_Replay *replay) {
    return replay ? replay->rec : nullptr;
}

Matchtape_EntityId matchtape_replay_get_mapped_entity(const Matchtape_Replay *replay, uint16_t netid) {
    if (!replay) return MATCHTAPE_INVALID_ENTITY;
    auto it = replay->mapping.find(netid);
    return it == replay->mapping.end() ? MATCHTAPE_INVALID_ENTITY : it->second;
}

size_t matchtape_replay_get_mapping_count(const Matchtape_Replay *replay) {
    return replay ? replay->mapping.size() : 0;
}

Matchtape_ReplayStats matchtape_replay_get_stats(const Matchtape_Replay *replay) {
    Matchtape_ReplayStats stats;
    memset(&stats, 0, sizeof(stats));
    if (replay) stats = replay->stats;
    return stats;
}
