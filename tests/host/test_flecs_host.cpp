/*
 * Matchtape Flecs Reference Host Tests
 *
 * The host callbacks backed by a Flecs world, exercised directly and
 * through recording and replay.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "matchtape/flecs_host.h"
#include "matchtape/recording.h"
#include "matchtape/replay.h"
#include <cstdlib>
#include <cstring>
#include <string>

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

TEST_CASE("Flecs host lifecycle", "[flecs_host][lifecycle]") {
    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(nullptr);
    REQUIRE(sim != nullptr);
    REQUIRE(matchtape_flecs_host_get_world(sim) != nullptr);
    REQUIRE(strcmp(matchtape_flecs_host_get_map_name(sim), "arena") == 0);
    REQUIRE(matchtape_flecs_host_get_time(sim) == 0);
    REQUIRE(matchtape_flecs_host_entity_count(sim) == 0);
    REQUIRE(matchtape_flecs_host_get_map_loads(sim) == 0);

    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    REQUIRE(matchtape_host_validate(&host));
    REQUIRE(host.persist == nullptr);
    REQUIRE(host.restore == nullptr);
    REQUIRE(host.broadcast != nullptr);

    matchtape_flecs_host_destroy(sim);
    matchtape_flecs_host_destroy(nullptr);
}

TEST_CASE("Flecs host configuration", "[flecs_host][config]") {
    Matchtape_FlecsHostConfig cfg = MATCHTAPE_FLECS_HOST_CONFIG_DEFAULT;
    cfg.map_name = "canyon";
    cfg.move_speed = 2.5f;
    cfg.default_health = 3.0f;
    cfg.in_memory_storage = true;

    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(&cfg);
    REQUIRE(sim != nullptr);
    REQUIRE(strcmp(matchtape_flecs_host_get_map_name(sim), "canyon") == 0);

    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    REQUIRE(host.persist != nullptr);

    uint16_t p = matchtape_flecs_host_add_player(sim, "alice", "Alice", 0);
    Matchtape_EntityId e = matchtape_flecs_host_spawn_player_character(sim, p, "knight", {0.0f, 0.0f});
    REQUIRE(host.get_health(host.userdata, e) == Catch::Approx(3.0f));

    host.set_key_pressed(host.userdata, e, MATCHTAPE_KEY_RIGHT, true);
    matchtape_flecs_host_step(sim);
    REQUIRE(host.get_position(host.userdata, e).x == Catch::Approx(2.5f));

    SECTION("In-memory persistence") {
        REQUIRE(host.persist(host.userdata, "a.cfg", "hello", 5));
        size_t len = 0;
        char *text = host.restore(host.userdata, "a.cfg", &len);
        REQUIRE(text != nullptr);
        REQUIRE(len == 5);
        REQUIRE(std::string(text) == "hello");
        free(text);
        REQUIRE(host.restore(host.userdata, "b.cfg", &len) == nullptr);
    }

    matchtape_flecs_host_destroy(sim);
}

/* ============================================================================
 * Entities and Players
 * ============================================================================ */

TEST_CASE("Flecs host entities", "[flecs_host][entities]") {
    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(nullptr);
    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    void *ud = host.userdata;

    uint16_t alice = matchtape_flecs_host_add_player(sim, "alice", "Alice", 1);
    REQUIRE(alice == 1);
    REQUIRE(matchtape_flecs_host_add_player(sim, "", "x", 0) == 0);

    Matchtape_EntityId knight = matchtape_flecs_host_spawn_player_character(sim, alice, "knight",
                                                                             {10.0f, 20.0f});
    REQUIRE(knight != MATCHTAPE_INVALID_ENTITY);
    REQUIRE(matchtape_flecs_host_spawn_player_character(sim, 42, "knight", {0.0f, 0.0f}) ==
            MATCHTAPE_INVALID_ENTITY);
    REQUIRE(matchtape_flecs_host_find_player_character(sim, alice) == knight);

    SECTION("Describe a player character") {
        Matchtape_EntityDesc desc;
        REQUIRE(host.describe_entity(ud, knight, &desc));
        REQUIRE(desc.netid == 1);
        REQUIRE(strcmp(desc.kind, "knight") == 0);
        REQUIRE(desc.team == 1);
        REQUIRE(desc.player_id == alice);
        REQUIRE(strcmp(desc.player_username, "alice") == 0);
        REQUIRE(strcmp(desc.player_charname, "Alice") == 0);
        REQUIRE(host.get_position(ud, knight).y == Catch::Approx(20.0f));
    }

    SECTION("Generic create") {
        Matchtape_EntityId chicken = host.create_entity(ud, "chicken", 255, {1.0f, 1.0f});
        REQUIRE(chicken != MATCHTAPE_INVALID_ENTITY);
        REQUIRE(host.create_entity(ud, "", 0, {0.0f, 0.0f}) == MATCHTAPE_INVALID_ENTITY);

        Matchtape_EntityDesc desc;
        REQUIRE(host.describe_entity(ud, chicken, &desc));
        REQUIRE(desc.player_id == 0);
        REQUIRE(desc.netid == 2);
        REQUIRE(matchtape_flecs_host_entity_count(sim) == 2);
    }

    SECTION("Uninitialized entities are hidden until init") {
        Matchtape_EntityId archer = host.create_entity_uninitialized(ud, "archer");
        REQUIRE(archer != MATCHTAPE_INVALID_ENTITY);
        REQUIRE(host.entity_exists(ud, archer));
        REQUIRE(matchtape_flecs_host_entity_count(sim) == 1);

        host.set_team(ud, archer, 2);
        host.set_appearance(ud, archer, 1, 7);
        host.set_position(ud, archer, {5.0f, 6.0f});
        REQUIRE(host.init_entity(ud, archer));
        REQUIRE_FALSE(host.init_entity(ud, archer));
        REQUIRE(matchtape_flecs_host_entity_count(sim) == 2);

        Matchtape_EntityDesc desc;
        REQUIRE(host.describe_entity(ud, archer, &desc));
        REQUIRE(desc.team == 2);
        REQUIRE(desc.sex == 1);
        REQUIRE(desc.head == 7);
        REQUIRE(host.get_position(ud, archer).x == Catch::Approx(5.0f));
    }

    SECTION("Destroy") {
        host.destroy_entity(ud, knight);
        REQUIRE_FALSE(host.entity_exists(ud, knight));
        Matchtape_EntityDesc desc;
        REQUIRE_FALSE(host.describe_entity(ud, knight, &desc));
        REQUIRE(matchtape_flecs_host_entity_count(sim) == 0);
        REQUIRE_FALSE(host.entity_exists(ud, MATCHTAPE_INVALID_ENTITY));
    }

    SECTION("Listing reports the total") {
        host.create_entity(ud, "chicken", 0, {0.0f, 0.0f});
        host.create_entity(ud, "chicken", 0, {0.0f, 0.0f});
        Matchtape_EntityId one[1];
        REQUIRE(host.list_entities(ud, one, 1) == 3);
    }

    SECTION("Players and teams") {
        uint16_t bob = matchtape_flecs_host_add_player(sim, "bob", nullptr, 0);
        uint16_t ids[4];
        REQUIRE(host.list_players(ud, ids, 4) == 2);
        REQUIRE(ids[1] == bob);
        REQUIRE(host.get_player_team(ud, bob) == 0);
        host.set_player_team(ud, bob, 200);
        REQUIRE(host.get_player_team(ud, bob) == 200);
        REQUIRE(host.get_player_team(ud, 99) == -1);
    }

    matchtape_flecs_host_destroy(sim);
}

/* ============================================================================
 * Simulation
 * ============================================================================ */

TEST_CASE("Flecs host step and keys", "[flecs_host][step]") {
    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(nullptr);
    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    void *ud = host.userdata;

    Matchtape_EntityId e = host.create_entity(ud, "chicken", 0, {0.0f, 0.0f});
    host.set_key_pressed(ud, e, MATCHTAPE_KEY_LEFT, true);
    host.set_key_pressed(ud, e, MATCHTAPE_KEY_DOWN, true);
    REQUIRE(host.is_key_pressed(ud, e, MATCHTAPE_KEY_LEFT));
    REQUIRE_FALSE(host.is_key_pressed(ud, e, MATCHTAPE_KEY_RIGHT));

    matchtape_flecs_host_step(sim);
    matchtape_flecs_host_step(sim);
    Matchtape_Vec2 pos = host.get_position(ud, e);
    REQUIRE(pos.x == Catch::Approx(-2.0f));
    REQUIRE(pos.y == Catch::Approx(2.0f));
    REQUIRE(host.get_time(ud) == 2);

    host.set_key_pressed(ud, e, MATCHTAPE_KEY_LEFT, false);
    matchtape_flecs_host_step(sim);
    REQUIRE(host.get_position(ud, e).x == Catch::Approx(-2.0f));

    host.set_aim(ud, e, {9.0f, 8.0f});
    REQUIRE(host.get_aim(ud, e).x == Catch::Approx(9.0f));

    matchtape_flecs_host_destroy(sim);
}

TEST_CASE("Flecs host session", "[flecs_host][session]") {
    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(nullptr);
    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    void *ud = host.userdata;

    SECTION("Map name buffer") {
        char small[3];
        REQUIRE_FALSE(host.get_map_name(ud, small, sizeof(small)));
        char buf[32];
        REQUIRE(host.get_map_name(ud, buf, sizeof(buf)));
        REQUIRE(strcmp(buf, "arena") == 0);
    }

    SECTION("Loading a map clears the world") {
        host.create_entity(ud, "chicken", 0, {0.0f, 0.0f});
        host.create_entity_uninitialized(ud, "knight");
        matchtape_flecs_host_step(sim);

        REQUIRE(host.load_map(ud, "canyon"));
        REQUIRE(matchtape_flecs_host_entity_count(sim) == 0);
        REQUIRE(strcmp(matchtape_flecs_host_get_map_name(sim), "canyon") == 0);
        REQUIRE(matchtape_flecs_host_get_time(sim) == 0);
        REQUIRE(matchtape_flecs_host_get_map_loads(sim) == 1);
        REQUIRE_FALSE(host.load_map(ud, ""));
    }

    SECTION("Broadcasts are kept") {
        matchtape_host_broadcast(&host, "hello %d", 7);
        REQUIRE(strcmp(matchtape_flecs_host_get_last_broadcast(sim), "hello 7") == 0);
        REQUIRE(matchtape_flecs_host_get_broadcast_count(sim) == 1);
    }

    matchtape_flecs_host_destroy(sim);
}

/* ============================================================================
 * Recording and Replay
 * ============================================================================ */

TEST_CASE("Flecs host replays what it recorded", "[flecs_host][replay]") {
    Matchtape_FlecsHost *sim = matchtape_flecs_host_create(nullptr);
    Matchtape_Host host;
    matchtape_flecs_host_get_host(sim, &host);
    void *ud = host.userdata;

    uint16_t alice = matchtape_flecs_host_add_player(sim, "alice", "Alice", 0);
    Matchtape_EntityId knight = matchtape_flecs_host_spawn_player_character(sim, alice, "knight",
                                                                             {0.0f, 0.0f});
    host.create_entity(ud, "chicken", 255, {3.0f, 3.0f});

    Matchtape_Recording *rec = matchtape_recording_create(nullptr);
    REQUIRE(matchtape_recording_start(rec, &host));
    host.set_key_pressed(ud, knight, MATCHTAPE_KEY_RIGHT, true);
    for (int i = 0; i < 6; i++) {
        matchtape_flecs_host_step(sim);
        REQUIRE(matchtape_recording_capture_tick(rec, &host));
    }
    REQUIRE(matchtape_recording_end(rec, &host));
    REQUIRE(matchtape_recording_get_meta_count(rec) == 1);

    Matchtape_Replay *replay = matchtape_replay_create(rec, nullptr);
    REQUIRE(matchtape_replay_start(replay, &host));

    REQUIRE_FALSE(host.entity_exists(ud, knight));
    REQUIRE(host.get_player_team(ud, alice) == MATCHTAPE_REPLAY_DEFAULT_SPECTATOR_TEAM);
    REQUIRE(matchtape_flecs_host_entity_count(sim) == 2);

    Matchtape_EntityId ghost = matchtape_replay_get_mapped_entity(replay, 1);
    REQUIRE(ghost != MATCHTAPE_INVALID_ENTITY);
    REQUIRE(host.is_key_pressed(ud, ghost, MATCHTAPE_KEY_RIGHT));
    REQUIRE(host.get_position(ud, ghost).x == Catch::Approx(1.0f));

    while (!matchtape_replay_is_finished(replay)) {
        matchtape_flecs_host_step(sim);
        REQUIRE(matchtape_replay_advance(replay, &host));
    }

    REQUIRE(host.get_position(ud, ghost).x == Catch::Approx(6.0f));
    REQUIRE(matchtape_replay_get_stats(replay).snaps == 0);

    matchtape_replay_destroy(replay);
    matchtape_recording_destroy(rec);
    matchtape_flecs_host_destroy(sim);
}
