#ifndef MATCHTAPE_HOST_H
#define MATCHTAPE_HOST_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @file host.h
 * @brief Callback table through which matchtape talks to the game simulation
 *
 * The host owns entities, teams, players, maps and persistence. Matchtape only
 * reads and drives them through these callbacks, once per simulation tick, on
 * the thread that owns the simulation.
 *
 * Usage:
 *   Matchtape_Host host = {};
 *   host.userdata = my_world;
 *   host.list_entities = my_list_entities;
 *   ...
 *   if (!matchtape_host_validate(&host)) {
 *       printf("%s\n", matchtape_get_last_error());
 *   }
 */

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Types
 *============================================================================*/

/** Simulation-assigned entity id. 0 is never a valid entity. */
typedef uint64_t Matchtape_EntityId;

#define MATCHTAPE_INVALID_ENTITY ((Matchtape_EntityId)0)

#define MATCHTAPE_KIND_MAX      32
#define MATCHTAPE_PLAYER_NAME_MAX 64
#define MATCHTAPE_MAP_NAME_MAX  128

typedef struct Matchtape_Vec2 {
    float x;
    float y;
} Matchtape_Vec2;

/** Recognized control keys. The order defines the recorded bitmask layout. */
typedef enum Matchtape_Key {
    MATCHTAPE_KEY_UP = 0,
    MATCHTAPE_KEY_DOWN,
    MATCHTAPE_KEY_LEFT,
    MATCHTAPE_KEY_RIGHT,
    MATCHTAPE_KEY_ACTION1,
    MATCHTAPE_KEY_ACTION2,
    MATCHTAPE_KEY_ACTION3,
    MATCHTAPE_KEY_USE,
    MATCHTAPE_KEY_INVENTORY,
    MATCHTAPE_KEY_PICKUP,
    MATCHTAPE_KEY_JUMP,
    MATCHTAPE_KEY_TAUNTS,
    MATCHTAPE_KEY_MAP,
    MATCHTAPE_KEY_BUBBLES,
    MATCHTAPE_KEY_CROUCH,
    MATCHTAPE_KEY_COUNT
} Matchtape_Key;

#define MATCHTAPE_KEY_BIT(key) ((uint16_t)(1u << (unsigned)(key)))

/**
 * Identity and appearance of a live entity, as reported by the host.
 * player_id is 0 when no player controls the entity.
 */
typedef struct Matchtape_EntityDesc {
    uint16_t netid;
    char kind[MATCHTAPE_KIND_MAX];
    int team;
    int sex;
    int head;
    uint16_t player_id;
    char player_username[MATCHTAPE_PLAYER_NAME_MAX];
    char player_charname[MATCHTAPE_PLAYER_NAME_MAX];
} Matchtape_EntityDesc;

/*============================================================================
 * Callback Table
 *============================================================================*/

typedef struct Matchtape_Host {
    void *userdata;

    /* Queries. list_entities/list_players return the total count and write at most max ids. */
    size_t (*list_entities)(void *ud, Matchtape_EntityId *out, size_t max);
    bool (*entity_exists)(void *ud, Matchtape_EntityId id);
    bool (*describe_entity)(void *ud, Matchtape_EntityId id, Matchtape_EntityDesc *out);
    Matchtape_Vec2 (*get_position)(void *ud, Matchtape_EntityId id);
    Matchtape_Vec2 (*get_aim)(void *ud, Matchtape_EntityId id);
    bool (*is_key_pressed)(void *ud, Matchtape_EntityId id, Matchtape_Key key);
    float (*get_health)(void *ud, Matchtape_EntityId id);

    /* Control */
    void (*set_position)(void *ud, Matchtape_EntityId id, Matchtape_Vec2 pos);
    void (*set_aim)(void *ud, Matchtape_EntityId id, Matchtape_Vec2 aim);
    void (*set_key_pressed)(void *ud, Matchtape_EntityId id, Matchtape_Key key, bool pressed);

    /* Lifecycle */
    Matchtape_EntityId (*create_entity)(void *ud, const char *kind, int team, Matchtape_Vec2 pos);
    Matchtape_EntityId (*create_entity_uninitialized)(void *ud, const char *kind);
    void (*set_team)(void *ud, Matchtape_EntityId id, int team);
    void (*set_appearance)(void *ud, Matchtape_EntityId id, int sex, int head);
    bool (*init_entity)(void *ud, Matchtape_EntityId id);
    void (*destroy_entity)(void *ud, Matchtape_EntityId id);

    /* Players */
    size_t (*list_players)(void *ud, uint16_t *out, size_t max);
    int (*get_player_team)(void *ud, uint16_t player_id);
    void (*set_player_team)(void *ud, uint16_t player_id, int team);

    /* Session */
    uint32_t (*get_time)(void *ud);
    bool (*get_map_name)(void *ud, char *buf, size_t size);
    bool (*load_map)(void *ud, const char *map_name);

    /* Optional: persistence and operator messages. NULL when unsupported. */
    bool (*persist)(void *ud, const char *name, const char *text, size_t len);
    char *(*restore)(void *ud, const char *name, size_t *out_len);
    void (*broadcast)(void *ud, const char *message);
} Matchtape_Host;

/**
 * Check that every required callback is set.
 * persist, restore and broadcast are optional.
 *
 * @param host Host table
 * @return true if usable, false with the first missing callback in the error
 */
bool matchtape_host_validate(const Matchtape_Host *host);

/**
 * Send an operator message through the host's broadcast callback, if any.
 */
void matchtape_host_broadcast(const Matchtape_Host *host, const char *fmt, ...);

/** @return Short lowercase name of a key, or "?" */
const char *matchtape_key_name(Matchtape_Key key);

/** @return Euclidean distance between two points */
float matchtape_vec2_distance(Matchtape_Vec2 a, Matchtape_Vec2 b);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_HOST_H */
