/**
 * @file flecs_host.h
 * @brief Reference simulation backed by a Flecs world
 *
 * Implements every Matchtape_Host callback on top of Flecs entities, so the
 * recorder and the replayer can run without a game engine.
 *
 * Usage:
 *   Matchtape_FlecsHostConfig hcfg = MATCHTAPE_FLECS_HOST_CONFIG_DEFAULT;
 *   Matchtape_FlecsHost *sim = matchtape_flecs_host_create(&hcfg);
 *
 *   uint16_t alice = matchtape_flecs_host_add_player(sim, "alice", "Alice", 0);
 *   matchtape_flecs_host_spawn_player_character(sim, alice, "knight", {10, 20});
 *
 *   Matchtape_Host host;
 *   matchtape_flecs_host_get_host(sim, &host);
 *
 *   // Each tick:
 *   matchtape_flecs_host_step(sim);
 *
 *   matchtape_flecs_host_destroy(sim);
 */

#ifndef MATCHTAPE_FLECS_HOST_H
#define MATCHTAPE_FLECS_HOST_H

#include "flecs.h"
#include "matchtape/host.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Components
 *============================================================================*/

/** Network identity and appearance. Uninitialized entities are not listed. */
typedef struct MT_Identity {
    uint16_t netid;
    char kind[MATCHTAPE_KIND_MAX];
    int team;
    int sex;
    int head;
    bool initialized;
} MT_Identity;

/** Player in control of the entity */
typedef struct MT_Controller {
    uint16_t player_id;
} MT_Controller;

typedef struct MT_Position {
    float x, y;
} MT_Position;

typedef struct MT_Aim {
    float x, y;
} MT_Aim;

/** Pressed keys, one bit per Matchtape_Key */
typedef struct MT_Keys {
    uint16_t bits;
} MT_Keys;

typedef struct MT_Health {
    float value;
} MT_Health;

extern ECS_COMPONENT_DECLARE(MT_Identity);
extern ECS_COMPONENT_DECLARE(MT_Controller);
extern ECS_COMPONENT_DECLARE(MT_Position);
extern ECS_COMPONENT_DECLARE(MT_Aim);
extern ECS_COMPONENT_DECLARE(MT_Keys);
extern ECS_COMPONENT_DECLARE(MT_Health);

/*============================================================================
 * Configuration
 *============================================================================*/

typedef struct Matchtape_FlecsHostConfig {
    const char *map_name;       /**< Map loaded at creation */
    float move_speed;           /**< Distance per step per pressed direction key */
    float default_health;
    bool in_memory_storage;     /**< Provide persist/restore backed by memory */
} Matchtape_FlecsHostConfig;

#define MATCHTAPE_FLECS_HOST_CONFIG_DEFAULT { \
    .map_name = "arena",                      \
    .move_speed = 1.0f,                       \
    .default_health = 2.0f,                   \
    .in_memory_storage = false                \
}

typedef struct Matchtape_FlecsHost Matchtape_FlecsHost;

/*============================================================================
 * Lifecycle
 *============================================================================*/

/**
 * Create a simulation with its own Flecs world.
 * Caller OWNS the returned pointer and MUST call matchtape_flecs_host_destroy().
 *
 * @param config Configuration (NULL for defaults)
 * @return New simulation, or NULL on failure
 */
Matchtape_FlecsHost *matchtape_flecs_host_create(const Matchtape_FlecsHostConfig *config);

void matchtape_flecs_host_destroy(Matchtape_FlecsHost *sim);

/** @return Underlying Flecs world (borrowed) */
ecs_world_t *matchtape_flecs_host_get_world(Matchtape_FlecsHost *sim);

/**
 * Fill a callback table bound to this simulation.
 * persist/restore are set only with in_memory_storage.
 */
void matchtape_flecs_host_get_host(Matchtape_FlecsHost *sim, Matchtape_Host *out_host);

/*============================================================================
 * Players and Entities
 *============================================================================*/

/** @return New player id (never 0), or 0 on failure */
uint16_t matchtape_flecs_host_add_player(Matchtape_FlecsHost *sim, const char *username,
                                         const char *charname, int team);

/**
 * Spawn an initialized entity controlled by a player.
 *
 * @return Entity id, or MATCHTAPE_INVALID_ENTITY if the player is unknown
 */
Matchtape_EntityId matchtape_flecs_host_spawn_player_character(Matchtape_FlecsHost *sim,
                                                               uint16_t player_id,
                                                               const char *kind,
                                                               Matchtape_Vec2 pos);

/** @return Entity controlled by the player, or MATCHTAPE_INVALID_ENTITY */
Matchtape_EntityId matchtape_flecs_host_find_player_character(Matchtape_FlecsHost *sim,
                                                              uint16_t player_id);

/** @return Number of live initialized entities */
size_t matchtape_flecs_host_entity_count(Matchtape_FlecsHost *sim);

/*============================================================================
 * Simulation
 *============================================================================*/

/** Move entities by their pressed direction keys and advance the clock by one tick. */
void matchtape_flecs_host_step(Matchtape_FlecsHost *sim);

uint32_t matchtape_flecs_host_get_time(const Matchtape_FlecsHost *sim);
const char *matchtape_flecs_host_get_map_name(const Matchtape_FlecsHost *sim);

/** @return Number of map loads since creation (the initial map is not counted) */
uint32_t matchtape_flecs_host_get_map_loads(const Matchtape_FlecsHost *sim);

/** @return Last broadcast message ("" if none) */
const char *matchtape_flecs_host_get_last_broadcast(const Matchtape_FlecsHost *sim);
size_t matchtape_flecs_host_get_broadcast_count(const Matchtape_FlecsHost *sim);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_FLECS_HOST_H */
