/**
 * Matchtape - Flecs Reference Host
 */

#include "matchtape/flecs_host.h"
#include "matchtape/error.h"
#include "matchtape/log.h"

#include <new>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <unordered_map>
#include <vector>

ECS_COMPONENT_DECLARE(MT_Identity);
ECS_COMPONENT_DECLARE(MT_Controller);
ECS_COMPONENT_DECLARE(MT_Position);
ECS_COMPONENT_DECLARE(MT_Aim);
ECS_COMPONENT_DECLARE(MT_Keys);
ECS_COMPONENT_DECLARE(MT_Health);

/*============================================================================
 * Internal Types
 *============================================================================*/

struct PlayerRecord {
    uint16_t id;
    int team;
    std::string username;
    std::string charname;
};

struct Matchtape_FlecsHost {
    ecs_world_t *world;
    ecs_query_t *identities;   /* MT_Identity */
    ecs_query_t *movers;       /* MT_Position, MT_Keys */

    Matchtape_FlecsHostConfig config;
    std::string map_name;
    uint32_t time;
    uint32_t map_loads;

    uint16_t next_netid;
    uint16_t next_player_id;
    std::vector<PlayerRecord> players;

    std::unordered_map<std::string, std::string> blobs;

    std::string last_broadcast;
    size_t broadcast_count;
};

/*============================================================================
 * Helpers
 *============================================================================*/

static Matchtape_FlecsHost *sim_of(void *ud) {
    return static_cast<Matchtape_FlecsHost *>(ud);
}

static PlayerRecord *find_player(Matchtape_FlecsHost *sim, uint16_t player_id) {
    for (auto &p : sim->players) {
        if (p.id == player_id) return &p;
    }
    return nullptr;
}

static bool is_sim_entity(Matchtape_FlecsHost *sim, Matchtape_EntityId id) {
    return id != MATCHTAPE_INVALID_ENTITY &&
           ecs_is_alive(sim->world, (ecs_entity_t)id) &&
           ecs_has(sim->world, (ecs_entity_t)id, MT_Identity);
}

static std::vector<ecs_entity_t> collect_identities(Matchtape_FlecsHost *sim, bool initialized_only) {
    std::vector<ecs_entity_t> out;
    ecs_iter_t it = ecs_query_iter(sim->world, sim->identities);
    while (ecs_query_next(&it)) {
        MT_Identity *ident = ecs_field(&it, MT_Identity, 0);
        for (int i = 0; i < it.count; i++) {
            if (!initialized_only || ident[i].initialized) {
                out.push_back(it.entities[i]);
            }
        }
    }
    return out;
}

static ecs_entity_t new_sim_entity(Matchtape_FlecsHost *sim, const char *kind, int team,
                                   Matchtape_Vec2 pos, bool initialized) {
    ecs_entity_t e = ecs_new(sim->world);
    if (!e) return 0;

    MT_Identity ident = {};
    ident.netid = sim->next_netid++;
    if (sim->next_netid == 0) sim->next_netid = 1;
    strncpy(ident.kind, kind, sizeof(ident.kind) - 1);
    ident.team = team;
    ident.initialized = initialized;

    MT_Position position = { pos.x, pos.y };
    MT_Aim aim = { pos.x, pos.y };
    MT_Keys keys = { 0 };
    MT_Health health = { sim->config.default_health };

    ecs_set_ptr(sim->world, e, MT_Identity, &ident);
    ecs_set_ptr(sim->world, e, MT_Position, &position);
    ecs_set_ptr(sim->world, e, MT_Aim, &aim);
    ecs_set_ptr(sim->world, e, MT_Keys, &keys);
    ecs_set_ptr(sim->world, e, MT_Health, &health);
    return e;
}

/*============================================================================
 * Host Callbacks: Queries
 *============================================================================*/

static size_t cb_list_entities(void *ud, Matchtape_EntityId *out, size_t max) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    std::vector<ecs_entity_t> ids = collect_identities(sim, true);
    for (size_t i = 0; i < ids.size() && i < max; i++) {
        out[i] = (Matchtape_EntityId)ids[i];
    }
    return ids.size();
}

static bool cb_entity_exists(void *ud, Matchtape_EntityId id) {
    return is_sim_entity(sim_of(ud), id);
}

static bool cb_describe_entity(void *ud, Matchtape_EntityId id, Matchtape_EntityDesc *out) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id) || !out) return false;

    const MT_Identity *ident = ecs_get(sim->world, (ecs_entity_t)id, MT_Identity);
    memset(out, 0, sizeof(*out));
    out->netid = ident->netid;
    memcpy(out->kind, ident->kind, sizeof(out->kind));
    out->team = ident->team;
    out->sex = ident->sex;
    out->head = ident->head;

    const MT_Controller *ctl = ecs_get(sim->world, (ecs_entity_t)id, MT_Controller);
    if (ctl) {
        PlayerRecord *player = find_player(sim, ctl->player_id);
        if (player) {
            out->player_id = player->id;
            strncpy(out->player_username, player->username.c_str(), sizeof(out->player_username) - 1);
            strncpy(out->player_charname, player->charname.c_str(), sizeof(out->player_charname) - 1);
        }
    }
    return true;
}

static Matchtape_Vec2 cb_get_position(void *ud, Matchtape_EntityId id) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    Matchtape_Vec2 v = { 0.0f, 0.0f };
    if (!is_sim_entity(sim, id)) return v;
    const MT_Position *p = ecs_get(sim->world, (ecs_entity_t)id, MT_Position);
    if (p) {
        v.x = p->x;
        v.y = p->y;
    }
    return v;
}

static Matchtape_Vec2 cb_get_aim(void *ud, Matchtape_EntityId id) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    Matchtape_Vec2 v = { 0.0f, 0.0f };
    if (!is_sim_entity(sim, id)) return v;
    const MT_Aim *a = ecs_get(sim->world, (ecs_entity_t)id, MT_Aim);
    if (a) {
        v.x = a->x;
        v.y = a->y;
    }
    return v;
}

static bool cb_is_key_pressed(void *ud, Matchtape_EntityId id, Matchtape_Key key) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id) || key < 0 || key >= MATCHTAPE_KEY_COUNT) return false;
    const MT_Keys *k = ecs_get(sim->world, (ecs_entity_t)id, MT_Keys);
    return k && (k->bits & MATCHTAPE_KEY_BIT(key)) != 0;
}

static float cb_get_health(void *ud, Matchtape_EntityId id) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return 0.0f;
    const MT_Health *h = ecs_get(sim->world, (ecs_entity_t)id, MT_Health);
    return h ? h->value : 0.0f;
}

/*============================================================================
 * Host Callbacks: Control
 *============================================================================*/

static void cb_set_position(void *ud, Matchtape_EntityId id, Matchtape_Vec2 pos) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return;
    MT_Position p = { pos.x, pos.y };
    ecs_set_ptr(sim->world, (ecs_entity_t)id, MT_Position, &p);
}

static void cb_set_aim(void *ud, Matchtape_EntityId id, Matchtape_Vec2 aim) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return;
    MT_Aim a = { aim.x, aim.y };
    ecs_set_ptr(sim->world, (ecs_entity_t)id, MT_Aim, &a);
}

static void cb_set_key_pressed(void *ud, Matchtape_EntityId id, Matchtape_Key key, bool pressed) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id) || key < 0 || key >= MATCHTAPE_KEY_COUNT) return;

    MT_Keys *k = ecs_get_mut(sim->world, (ecs_entity_t)id, MT_Keys);
    if (!k) return;
    if (pressed) {
        k->bits |= MATCHTAPE_KEY_BIT(key);
    } else {
        k->bits &= (uint16_t)~MATCHTAPE_KEY_BIT(key);
    }
    ecs_modified(sim->world, (ecs_entity_t)id, MT_Keys);
}

/*============================================================================
 * Host Callbacks: Lifecycle
 *============================================================================*/

static Matchtape_EntityId cb_create_entity(void *ud, const char *kind, int team, Matchtape_Vec2 pos) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!kind || !kind[0]) return MATCHTAPE_INVALID_ENTITY;
    return (Matchtape_EntityId)new_sim_entity(sim, kind, team, pos, true);
}

static Matchtape_EntityId cb_create_entity_uninitialized(void *ud, const char *kind) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!kind || !kind[0]) return MATCHTAPE_INVALID_ENTITY;
    Matchtape_Vec2 origin = { 0.0f, 0.0f };
    return (Matchtape_EntityId)new_sim_entity(sim, kind, 0, origin, false);
}

static void cb_set_team(void *ud, Matchtape_EntityId id, int team) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return;
    MT_Identity *ident = ecs_get_mut(sim->world, (ecs_entity_t)id, MT_Identity);
    ident->team = team;
    ecs_modified(sim->world, (ecs_entity_t)id, MT_Identity);
}

static void cb_set_appearance(void *ud, Matchtape_EntityId id, int sex, int head) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return;
    MT_Identity *ident = ecs_get_mut(sim->world, (ecs_entity_t)id, MT_Identity);
    ident->sex = sex;
    ident->head = head;
    ecs_modified(sim->world, (ecs_entity_t)id, MT_Identity);
}

static bool cb_init_entity(void *ud, Matchtape_EntityId id) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return false;
    MT_Identity *ident = ecs_get_mut(sim->world, (ecs_entity_t)id, MT_Identity);
    if (ident->initialized) return false;
    ident->initialized = true;
    ecs_modified(sim->world, (ecs_entity_t)id, MT_Identity);
    return true;
}

static void cb_destroy_entity(void *ud, Matchtape_EntityId id) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!is_sim_entity(sim, id)) return;
    ecs_delete(sim->world, (ecs_entity_t)id);
}

/*============================================================================
 * Host Callbacks: Players
 *============================================================================*/

static size_t cb_list_players(void *ud, uint16_t *out, size_t max) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    for (size_t i = 0; i < sim->players.size() && i < max; i++) {
        out[i] = sim->players[i].id;
    }
    return sim->players.size();
}

static int cb_get_player_team(void *ud, uint16_t player_id) {
    PlayerRecord *player = find_player(sim_of(ud), player_id);
    return player ? player->team : -1;
}

static void cb_set_player_team(void *ud, uint16_t player_id, int team) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    PlayerRecord *player = find_player(sim, player_id);
    if (!player) return;
    player->team = team;
    matchtape_log_debug(MATCHTAPE_LOG_HOST, "Player %s moved to team %d",
                        player->username.c_str(), team);
}

/*============================================================================
 * Host Callbacks: Session
 *============================================================================*/

static uint32_t cb_get_time(void *ud) {
    return sim_of(ud)->time;
}

static bool cb_get_map_name(void *ud, char *buf, size_t size) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!buf || size == 0 || sim->map_name.size() >= size) return false;
    memcpy(buf, sim->map_name.c_str(), sim->map_name.size() + 1);
    return true;
}

static bool cb_load_map(void *ud, const char *map_name) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!map_name || !map_name[0]) return false;

    /* Collect first: deleting while iterating invalidates the iterator */
    std::vector<ecs_entity_t> doomed = collect_identities(sim, false);
    for (ecs_entity_t e : doomed) {
        ecs_delete(sim->world, e);
    }

    sim->map_name = map_name;
    sim->time = 0;
    sim->map_loads++;
    matchtape_log_info(MATCHTAPE_LOG_HOST, "Loaded map %s (%zu entities cleared)",
                       map_name, doomed.size());
    return true;
}

static bool cb_persist(void *ud, const char *name, const char *text, size_t len) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!name || !text) return false;
    sim->blobs[name] = std::string(text, len);
    return true;
}

static char *cb_restore(void *ud, const char *name, size_t *out_len) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    if (!name) return nullptr;

    auto it = sim->blobs.find(name);
    if (it == sim->blobs.end()) {
        matchtape_set_error("host: no stored recording '%s'", name);
        return nullptr;
    }

    char *copy = static_cast<char *>(malloc(it->second.size() + 1));
    if (!copy) {
        matchtape_set_error("host: out of memory restoring '%s'", name);
        return nullptr;
    }
    memcpy(copy, it->second.data(), it->second.size());
    copy[it->second.size()] = '\0';
    if (out_len) *out_len = it->second.size();
    return copy;
}

static void cb_broadcast(void *ud, const char *message) {
    Matchtape_FlecsHost *sim = sim_of(ud);
    sim->last_broadcast = message ? message : "";
    sim->broadcast_count++;
    matchtape_log_info(MATCHTAPE_LOG_HOST, "[broadcast] %s", sim->last_broadcast.c_str());
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

Matchtape_FlecsHost *matchtape_flecs_host_create(const Matchtape_FlecsHostConfig *config) {
    Matchtape_FlecsHostConfig defaults = MATCHTAPE_FLECS_HOST_CONFIG_DEFAULT;
    const Matchtape_FlecsHostConfig *cfg = config ? config : &defaults;

    Matchtape_FlecsHost *sim = new (std::nothrow) Matchtape_FlecsHost();
    if (!sim) {
        matchtape_set_error("host: failed to allocate simulation");
        return nullptr;
    }

    sim->world = ecs_init();
    if (!sim->world) {
        matchtape_set_error("host: failed to create Flecs world");
        delete sim;
        return nullptr;
    }

    ecs_world_t *w = sim->world;
    ECS_COMPONENT_DEFINE(w, MT_Identity);
    ECS_COMPONENT_DEFINE(w, MT_Controller);
    ECS_COMPONENT_DEFINE(w, MT_Position);
    ECS_COMPONENT_DEFINE(w, MT_Aim);
    ECS_COMPONENT_DEFINE(w, MT_Keys);
    ECS_COMPONENT_DEFINE(w, MT_Health);

    ecs_query_desc_t ident_desc = {};
    ident_desc.terms[0].id = ecs_id(MT_Identity);
    sim->identities = ecs_query_init(w, &ident_desc);

    ecs_query_desc_t mover_desc = {};
    mover_desc.terms[0].id = ecs_id(MT_Position);
    mover_desc.terms[1].id = ecs_id(MT_Keys);
    sim->movers = ecs_query_init(w, &mover_desc);

    if (!sim->identities || !sim->movers) {
        matchtape_set_error("host: failed to create Flecs queries");
        matchtape_flecs_host_destroy(sim);
        return nullptr;
    }

    sim->config = *cfg;
    sim->map_name = (cfg->map_name && cfg->map_name[0]) ? cfg->map_name : "arena";
    sim->config.map_name = nullptr;
    sim->next_netid = 1;
    sim->next_player_id = 1;

    matchtape_log_info(MATCHTAPE_LOG_HOST, "Flecs host ready on %s (Flecs v%d.%d.%d)",
                       sim->map_name.c_str(), FLECS_VERSION_MAJOR, FLECS_VERSION_MINOR,
                       FLECS_VERSION_PATCH);
    return sim;
}

void matchtape_flecs_host_destroy(Matchtape_FlecsHost *sim) {
    if (!sim) return;

    if (sim->world) {
        if (sim->identities) ecs_query_fini(sim->identities);
        if (sim->movers) ecs_query_fini(sim->movers);
        ecs_fini(sim->world);
    }
    delete sim;
}

ecs_world_t *matchtape_flecs_host_get_world(Matchtape_FlecsHost *sim) {
    return sim ? sim->world : nullptr;
}

void matchtape_flecs_host_get_host(Matchtape_FlecsHost *sim, Matchtape_Host *out_host) {
    if (!out_host) return;
    memset(out_host, 0, sizeof(*out_host));
    if (!sim) return;

    out_host->userdata = sim;

    out_host->list_entities = cb_list_entities;
    out_host->entity_exists = cb_entity_exists;
    out_host->describe_entity = cb_describe_entity;
    out_host->get_position = cb_get_position;
    out_host->get_aim = cb_get_aim;
    out_host->is_key_pressed = cb_is_key_pressed;
    out_host->get_health = cb_get_health;

    out_host->set_position = cb_set_position;
    out_host->set_aim = cb_set_aim;
    out_host->set_key_pressed = cb_set_key_pressed;

    out_host->create_entity = cb_create_entity;
    out_host->create_entity_uninitialized = cb_create_entity_uninitialized;
    out_host->set_team = cb_set_team;
    out_host->set_appearance = cb_set_appearance;
    out_host->init_entity = cb_init_entity;
    out_host->destroy_entity = cb_destroy_entity;

    out_host->list_players = cb_list_players;
    out_host->get_player_team = cb_get_player_team;
    out_host->set_player_team = cb_set_player_team;

    out_host->get_time = cb_get_time;
    out_host->get_map_name = cb_get_map_name;
    out_host->load_map = cb_load_map;

    if (sim->config.in_memory_storage) {
        out_host->persist = cb_persist;
        out_host->restore = cb_restore;
    }
    out_host->broadcast = cb_broadcast;
}

/*============================================================================
 * Players and Entities
 *============================================================================*/

uint16_t matchtape_flecs_host_add_player(Matchtape_FlecsHost *sim, const char *username,
                                         const char *charname, int team) {
    if (!sim || !username || !username[0]) {
        matchtape_set_error("host: player needs a username");
        return 0;
    }
    if (sim->next_player_id == 0) {
        matchtape_set_error("host: player ids exhausted");
        return 0;
    }

    PlayerRecord player;
    player.id = sim->next_player_id++;
    player.team = team;
    player.username = username;
    player.charname = charname ? charname : username;
    sim->players.push_back(player);

    matchtape_log_debug(MATCHTAPE_LOG_HOST, "Player %u joined as %s (team %d)",
                        player.id, username, team);
    return player.id;
}

Matchtape_EntityId matchtape_flecs_host_spawn_player_character(Matchtape_FlecsHost *sim,
                                                               uint16_t player_id,
                                                               const char *kind,
                                                               Matchtape_Vec2 pos) {
    if (!sim || !kind || !kind[0]) {
        matchtape_set_error("host: invalid spawn request");
        return MATCHTAPE_INVALID_ENTITY;
    }

    PlayerRecord *player = find_player(sim, player_id);
    if (!player) {
        matchtape_set_error("host: unknown player %u", player_id);
        return MATCHTAPE_INVALID_ENTITY;
    }

    ecs_entity_t e = new_sim_entity(sim, kind, player->team, pos, true);
    if (!e) {
        matchtape_set_error("host: failed to create entity");
        return MATCHTAPE_INVALID_ENTITY;
    }

    MT_Controller ctl = { player_id };
    ecs_set_ptr(sim->world, e, MT_Controller, &ctl);
    return (Matchtape_EntityId)e;
}

Matchtape_EntityId matchtape_flecs_host_find_player_character(Matchtape_FlecsHost *sim,
                                                              uint16_t player_id) {
    if (!sim) return MATCHTAPE_INVALID_ENTITY;

    for (ecs_entity_t e : collect_identities(sim, true)) {
        const MT_Controller *ctl = ecs_get(sim->world, e, MT_Controller);
        if (ctl && ctl->player_id == player_id) {
            return (Matchtape_EntityId)e;
        }
    }
    return MATCHTAPE_INVALID_ENTITY;
}

size_t matchtape_flecs_host_entity_count(Matchtape_FlecsHost *sim) {
    return sim ? collect_identities(sim, true).size() : 0;
}

/*============================================================================
 * Simulation
 *============================================================================*/

void matchtape_flecs_host_step(Matchtape_FlecsHost *sim) {
    if (!sim) return;

    float speed = sim->config.move_speed;
    ecs_iter_t it = ecs_query_iter(sim->world, sim->movers);
    while (ecs_query_next(&it)) {
        MT_Position *pos = ecs_field(&it, MT_Position, 0);
        MT_Keys *keys = ecs_field(&it, MT_Keys, 1);

        for (int i = 0; i < it.count; i++) {
            uint16_t bits = keys[i].bits;
            if (bits & MATCHTAPE_KEY_BIT(MATCHTAPE_KEY_LEFT))  pos[i].x -= speed;
            if (bits & MATCHTAPE_KEY_BIT(MATCHTAPE_KEY_RIGHT)) pos[i].x += speed;
            if (bits & MATCHTAPE_KEY_BIT(MATCHTAPE_KEY_UP))    pos[i].y -= speed;
            if (bits & MATCHTAPE_KEY_BIT(MATCHTAPE_KEY_DOWN))  pos[i].y += speed;
        }
    }

    sim->time++;
}

uint32_t matchtape_flecs_host_get_time(const Matchtape_FlecsHost *sim) {
    return sim ? sim->time : 0;
}

const char *matchtape_flecs_host_get_map_name(const Matchtape_FlecsHost *sim) {
    return sim ? sim->map_name.c_str() : "";
}

uint32_t matchtape_flecs_host_get_map_loads(const Matchtape_FlecsHost *sim) {
    return sim ? sim->map_loads : 0;
}

const char *matchtape_flecs_host_get_last_broadcast(const Matchtape_FlecsHost *sim) {
    return sim ? sim->last_broadcast.c_str() : "";
}

size_t matchtape_flecs_host_get_broadcast_count(const Matchtape_FlecsHost *sim) {
    return sim ? sim->broadcast_count : 0;
}
