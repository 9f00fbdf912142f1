/*
 * Matchtape Mode Controller Tests
 *
 * Mode transitions, rejected commands, saving and loading, and the
 * autorecord event hooks.
 */

#include <catch2/catch_test_macros.hpp>
#include "matchtape/controller.h"
#include "matchtape/error.h"
#include "matchtape/recording.h"
#include "matchtape/storage.h"
#include "fake_host.h"
#include "recording_text.h"
#include <cstdio>
#include <cstring>
#include <string>

using namespace matchtape_test;

static Matchtape_Config test_config() {
    Matchtape_Config cfg;
    matchtape_config_defaults(&cfg);
    snprintf(cfg.session_name, sizeof(cfg.session_name), "session");
    snprintf(cfg.save_dir, sizeof(cfg.save_dir), "/tmp/matchtape_controller_test");
    return cfg;
}

namespace {

/* Host with one knight player and a controller over it */
struct ControllerFixture {
    FakeHost fake;
    Matchtape_Host host;
    Matchtape_Controller *ctrl = nullptr;
    Matchtape_EntityId knight = MATCHTAPE_INVALID_ENTITY;

    explicit ControllerFixture(bool with_storage = true) {
        fake.with_storage = with_storage;
        knight = fake.add_player_character("alice", "knight", 0, {10.0f, 10.0f});
        host = fake.host();
        Matchtape_Config cfg = test_config();
        ctrl = matchtape_controller_create(&host, &cfg);
        REQUIRE(ctrl != nullptr);
    }

    ~ControllerFixture() {
        matchtape_controller_destroy(ctrl);
    }

    const std::string &last_broadcast() const {
        static const std::string none;
        return fake.broadcasts.empty() ? none : fake.broadcasts.back();
    }

    void record_ticks(int n) {
        REQUIRE(matchtape_controller_start_recording(ctrl));
        for (int i = 0; i < n; i++) {
            fake.find(knight)->position.x += 1.0f;
            REQUIRE(matchtape_controller_update(ctrl));
        }
        REQUIRE(matchtape_controller_stop_recording(ctrl));
    }
};

} // namespace

/* ============================================================================
 * Creation
 * ============================================================================ */

TEST_CASE("Controller creation", "[controller][lifecycle]") {
    FakeHost fake;

    SECTION("Incomplete host is rejected") {
        Matchtape_Host host = fake.host();
        host.load_map = nullptr;
        REQUIRE(matchtape_controller_create(&host, nullptr) == nullptr);
        REQUIRE(strstr(matchtape_get_last_error(), "load_map") != nullptr);
    }

    SECTION("Defaults") {
        Matchtape_Host host = fake.host();
        Matchtape_Config cfg = test_config();
        Matchtape_Controller *ctrl = matchtape_controller_create(&host, &cfg);
        REQUIRE(ctrl != nullptr);

        REQUIRE(matchtape_controller_get_mode(ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(strcmp(matchtape_controller_get_session_name(ctrl), "session") == 0);
        REQUIRE(matchtape_controller_get_match_number(ctrl) == 0);
        REQUIRE(matchtape_controller_get_recording_number(ctrl) == 0);
        REQUIRE(matchtape_controller_get_recording(ctrl) == nullptr);
        REQUIRE(matchtape_controller_get_replay(ctrl) == nullptr);
        REQUIRE_FALSE(matchtape_controller_get_autorecord(ctrl));
        REQUIRE(matchtape_controller_get_host(ctrl)->userdata == &fake);
        REQUIRE(matchtape_controller_update(ctrl));

        matchtape_controller_destroy(ctrl);
    }

    SECTION("Generated session name") {
        Matchtape_Host host = fake.host();
        Matchtape_Config cfg = test_config();
        cfg.session_name[0] = '\0';
        Matchtape_Controller *ctrl = matchtape_controller_create(&host, &cfg);
        REQUIRE(ctrl != nullptr);
        REQUIRE(strlen(matchtape_controller_get_session_name(ctrl)) == 15);
        matchtape_controller_destroy(ctrl);
    }

    matchtape_controller_destroy(nullptr);
}

TEST_CASE("Mode names", "[controller][mode]") {
    REQUIRE(strcmp(matchtape_mode_name(MATCHTAPE_MODE_IDLE), "idle") == 0);
    REQUIRE(strcmp(matchtape_mode_name(MATCHTAPE_MODE_RECORDING), "recording") == 0);
    REQUIRE(strcmp(matchtape_mode_name(MATCHTAPE_MODE_REPLAYING), "replaying") == 0);
}

/* ============================================================================
 * Recording
 * ============================================================================ */

TEST_CASE("Controller recording transitions", "[controller][recording]") {
    ControllerFixture f;

    REQUIRE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_RECORDING);
    REQUIRE(f.last_broadcast() == "Recording started (match 0)");

    REQUIRE_FALSE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE(f.last_broadcast() == "Already recording");
    REQUIRE(strcmp(matchtape_get_last_error(), "Already recording") == 0);

    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_recording_get_num_ticks(matchtape_controller_get_recording(f.ctrl)) == 2);

    REQUIRE(matchtape_controller_stop_recording(f.ctrl));
    REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
    REQUIRE(f.last_broadcast() == "Recording stopped after 2 ticks");
    REQUIRE(matchtape_recording_is_ended(matchtape_controller_get_recording(f.ctrl)));

    REQUIRE_FALSE(matchtape_controller_stop_recording(f.ctrl));
    REQUIRE(f.last_broadcast() == "Not recording");

    SECTION("A new recording replaces the old one") {
        REQUIRE(matchtape_controller_start_recording(f.ctrl));
        REQUIRE(matchtape_recording_get_num_ticks(matchtape_controller_get_recording(f.ctrl)) == 0);
    }
}

TEST_CASE("Controller save points", "[controller][savepoint]") {
    ControllerFixture f;

    REQUIRE_FALSE(matchtape_controller_add_save_point(f.ctrl, "early"));
    REQUIRE(f.last_broadcast() == "Save points can only be set while recording");

    REQUIRE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_add_save_point(f.ctrl, "fight"));
    REQUIRE(f.last_broadcast() == "Save point 'fight' set at tick 1");
    REQUIRE_FALSE(matchtape_controller_add_save_point(f.ctrl, "fight"));
}

/* ============================================================================
 * Saving and Loading
 * ============================================================================ */

TEST_CASE("Controller saves through the host", "[controller][save]") {
    ControllerFixture f(true);

    REQUIRE_FALSE(matchtape_controller_save_recording(f.ctrl));
    REQUIRE(f.last_broadcast() == "No recording to save");

    REQUIRE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));

    SECTION("Saving stops a running recording") {
        REQUIRE(matchtape_controller_save_recording(f.ctrl));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(f.fake.blobs.count("session_match0recording0.cfg") == 1);
        REQUIRE(f.fake.blobs["session_match0recording0.cfg"].find("<matchrecording>") == 0);
        REQUIRE(strcmp(matchtape_controller_get_last_save_name(f.ctrl), "session_match0recording0.cfg") == 0);
        REQUIRE(matchtape_controller_get_recording_number(f.ctrl) == 1);
        REQUIRE(f.last_broadcast() == "Saved recording as session_match0recording0.cfg");

        REQUIRE(matchtape_controller_save_recording(f.ctrl));
        REQUIRE(f.fake.blobs.count("session_match0recording1.cfg") == 1);
        REQUIRE(matchtape_controller_get_recording_number(f.ctrl) == 2);
    }

    SECTION("Refused persist keeps the counter") {
        f.fake.fail_persist = true;
        REQUIRE_FALSE(matchtape_controller_save_recording(f.ctrl));
        REQUIRE(matchtape_controller_get_recording_number(f.ctrl) == 0);
        REQUIRE(f.fake.blobs.empty());
        REQUIRE(f.last_broadcast().find("Failed to save recording") == 0);
    }
}

TEST_CASE("Controller saves to the save directory", "[controller][save]") {
    ControllerFixture f(false);
    f.record_ticks(3);

    REQUIRE(matchtape_controller_save_recording(f.ctrl));

    Matchtape_Storage *storage = matchtape_storage_create("/tmp/matchtape_controller_test");
    REQUIRE(storage != nullptr);
    REQUIRE(matchtape_storage_exists(storage, "session_match0recording0.cfg"));

    REQUIRE(matchtape_controller_load_recording(f.ctrl, "session_match0recording0.cfg"));
    const Matchtape_Recording *rec = matchtape_controller_get_recording(f.ctrl);
    REQUIRE(matchtape_recording_get_num_ticks(rec) == 3);
    REQUIRE(strcmp(matchtape_recording_get_map_name(rec), "testmap") == 0);

    matchtape_storage_destroy(storage);
    remove("/tmp/matchtape_controller_test/session_match0recording0.cfg");
}

TEST_CASE("Controller loads recordings", "[controller][load]") {
    ControllerFixture f(true);
    f.fake.blobs["good.cfg"] = recording_text(meta_block(1, "knight", 0, 1),
                                              {sample_block(1, 0.0f, 0.0f), ""});
    f.fake.blobs["bad.cfg"] = "<matchrecording>";

    SECTION("Success replaces the current recording") {
        f.record_ticks(5);
        REQUIRE(matchtape_controller_load_recording(f.ctrl, "good.cfg"));
        REQUIRE(matchtape_recording_get_num_ticks(matchtape_controller_get_recording(f.ctrl)) == 2);
        REQUIRE(f.last_broadcast() == "Loaded good.cfg (2 ticks on 'arena')");
    }

    SECTION("Only while idle") {
        REQUIRE(matchtape_controller_start_recording(f.ctrl));
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, "good.cfg"));
        REQUIRE(f.last_broadcast() == "Cannot load a recording while recording");
    }

    SECTION("Unsafe name") {
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, "../good.cfg"));
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, nullptr));
    }

    SECTION("Missing or broken file keeps the current recording") {
        f.record_ticks(1);
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, "missing.cfg"));
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, "bad.cfg"));
        REQUIRE(f.last_broadcast().find("Cannot load recording: bad.cfg:") == 0);
        REQUIRE(matchtape_recording_get_num_ticks(matchtape_controller_get_recording(f.ctrl)) == 1);
    }
}

/* ============================================================================
 * Replay
 * ============================================================================ */

TEST_CASE("Controller replay rejections", "[controller][replay]") {
    ControllerFixture f;

    REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, nullptr));
    REQUIRE(f.last_broadcast() == "No recording to replay");

    REQUIRE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, nullptr));
    REQUIRE(f.last_broadcast() == "Stop recording before replaying");
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_stop_recording(f.ctrl));

    SECTION("Autorecord blocks replay") {
        REQUIRE(matchtape_controller_set_autorecord(f.ctrl, true));
        REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, nullptr));
        REQUIRE(f.last_broadcast() == "Cannot replay while autorecord is on");
    }

    SECTION("Unknown save point") {
        REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, "nowhere"));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
    }

    SECTION("No recording while replaying") {
        REQUIRE(matchtape_controller_start_replay(f.ctrl, nullptr));
        REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, nullptr));
        REQUIRE(f.last_broadcast() == "Already replaying");
        REQUIRE_FALSE(matchtape_controller_start_recording(f.ctrl));
        REQUIRE(f.last_broadcast() == "Cannot record while a replay is running");
        REQUIRE_FALSE(matchtape_controller_load_recording(f.ctrl, "x.cfg"));
    }

    SECTION("Stop when not replaying") {
        REQUIRE_FALSE(matchtape_controller_stop_replay(f.ctrl));
        REQUIRE(f.last_broadcast() == "Not replaying");
    }

    SECTION("Recording without ticks cannot be replayed") {
        REQUIRE(matchtape_controller_start_recording(f.ctrl));
        REQUIRE(matchtape_controller_stop_recording(f.ctrl));
        size_t spawned = f.fake.entities.size();

        REQUIRE_FALSE(matchtape_controller_start_replay(f.ctrl, nullptr));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(matchtape_controller_get_replay(f.ctrl) == nullptr);
        REQUIRE(f.last_broadcast().find("no ticks") != std::string::npos);
        REQUIRE(f.fake.entities.size() == spawned);
    }

    SECTION("Autorecord cannot be enabled during a replay") {
        REQUIRE(matchtape_controller_start_replay(f.ctrl, nullptr));
        REQUIRE_FALSE(matchtape_controller_set_autorecord(f.ctrl, true));
        REQUIRE(f.last_broadcast() == "Cannot enable autorecord while a replay is running");
        REQUIRE_FALSE(matchtape_controller_get_autorecord(f.ctrl));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_REPLAYING);

        REQUIRE(matchtape_controller_stop_replay(f.ctrl));
        REQUIRE(matchtape_controller_set_autorecord(f.ctrl, true));
    }
}

TEST_CASE("Controller replays and loops", "[controller][replay]") {
    ControllerFixture f;
    f.record_ticks(3);
    uint16_t alice = f.fake.find(f.knight)->player_id;

    REQUIRE(matchtape_controller_start_replay(f.ctrl, nullptr));
    REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_REPLAYING);
    REQUIRE(f.last_broadcast() == "Replay started (3 ticks from tick 0)");
    REQUIRE(f.fake.find_player(alice)->team == MATCHTAPE_REPLAY_DEFAULT_SPECTATOR_TEAM);
    REQUIRE(f.fake.find(f.knight) == nullptr);

    const Matchtape_Replay *replay = matchtape_controller_get_replay(f.ctrl);
    REQUIRE(replay != nullptr);
    REQUIRE(matchtape_replay_get_tick(replay) == 0);

    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_replay_get_tick(replay) == 2);
    REQUIRE(matchtape_replay_is_finished(replay));

    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_replay_get_tick(replay) == 0);
    REQUIRE(matchtape_replay_get_stats(replay).starts == 2);
    REQUIRE(f.fake.of_kind("knight").size() == 1);

    SECTION("Stop reloads the map") {
        REQUIRE(matchtape_controller_stop_replay(f.ctrl));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(matchtape_controller_get_replay(f.ctrl) == nullptr);
        REQUIRE(f.fake.loaded_maps.size() == 1);
        REQUIRE(f.fake.loaded_maps[0] == "testmap");
        REQUIRE(f.last_broadcast() == "Replay stopped, reloading 'testmap'");
    }

    SECTION("Stop still leaves replay mode when the map fails") {
        f.fake.fail_load_map = true;
        REQUIRE_FALSE(matchtape_controller_stop_replay(f.ctrl));
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(f.last_broadcast().find("could not be reloaded") != std::string::npos);
    }
}

TEST_CASE("Controller replays from a save point", "[controller][replay]") {
    ControllerFixture f;

    REQUIRE(matchtape_controller_start_recording(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_add_save_point(f.ctrl, "late"));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_controller_stop_recording(f.ctrl));

    REQUIRE(matchtape_controller_start_replay(f.ctrl, "late"));
    const Matchtape_Replay *replay = matchtape_controller_get_replay(f.ctrl);
    REQUIRE(matchtape_replay_get_tick(replay) == 2);
    REQUIRE(f.last_broadcast() == "Replay started (4 ticks from tick 2)");

    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_replay_is_finished(replay));
    REQUIRE(matchtape_controller_update(f.ctrl));
    REQUIRE(matchtape_replay_get_tick(replay) == 2);
}

static bool record_chickens(const Matchtape_EntityDesc *desc, void *userdata) {
    ++*static_cast<int *>(userdata);
    return strcmp(desc->kind, "chicken") == 0;
}

TEST_CASE("Controller records with a configured predicate", "[controller][recording]") {
    FakeHost fake;
    fake.with_storage = true;
    fake.add_player_character("alice", "knight", 0, {10.0f, 10.0f});
    Matchtape_EntityId chicken = fake.add_entity("chicken", 255, {3.0f, 4.0f});
    Matchtape_Host host = fake.host();

    int calls = 0;
    Matchtape_Config cfg = test_config();
    cfg.record_predicate = record_chickens;
    cfg.record_predicate_userdata = &calls;

    Matchtape_Controller *ctrl = matchtape_controller_create(&host, &cfg);
    REQUIRE(ctrl != nullptr);

    REQUIRE(matchtape_controller_start_recording(ctrl));
    REQUIRE(matchtape_controller_update(ctrl));
    REQUIRE(matchtape_controller_stop_recording(ctrl));
    REQUIRE(calls > 0);

    const Matchtape_Recording *rec = matchtape_controller_get_recording(ctrl);
    REQUIRE(matchtape_recording_get_meta_count(rec) == 1);
    const Matchtape_EntityMeta *meta = matchtape_recording_find_meta(rec, fake.find(chicken)->netid);
    REQUIRE(meta != nullptr);
    REQUIRE(strcmp(meta->kind, "chicken") == 0);

    size_t count = 0;
    matchtape_recording_get_tick(rec, 0, &count);
    REQUIRE(count == 1);

    matchtape_controller_destroy(ctrl);
}

/* ============================================================================
 * Autorecord
 * ============================================================================ */

TEST_CASE("Controller autorecord", "[controller][autorecord]") {
    ControllerFixture f(true);

    REQUIRE(matchtape_controller_set_autorecord(f.ctrl, true));
    REQUIRE(matchtape_controller_get_autorecord(f.ctrl));
    REQUIRE(f.last_broadcast() == "Autorecord enabled");
    REQUIRE(matchtape_controller_set_autorecord(f.ctrl, true));
    REQUIRE(f.last_broadcast() == "Autorecord is already on");

    SECTION("Restart starts recording") {
        matchtape_controller_on_restart(f.ctrl);
        REQUIRE(matchtape_controller_get_match_number(f.ctrl) == 1);
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_RECORDING);
    }

    SECTION("Game over saves the recording") {
        matchtape_controller_on_restart(f.ctrl);
        REQUIRE(matchtape_controller_update(f.ctrl));
        matchtape_controller_on_game_over(f.ctrl);

        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(f.fake.blobs.count("session_match1recording0.cfg") == 1);

        matchtape_controller_on_game_over(f.ctrl);
        REQUIRE(f.fake.blobs.size() == 1);
    }

    SECTION("Restart without game over saves the previous match") {
        matchtape_controller_on_restart(f.ctrl);
        REQUIRE(matchtape_controller_update(f.ctrl));
        matchtape_controller_on_restart(f.ctrl);

        REQUIRE(f.fake.blobs.count("session_match1recording0.cfg") == 1);
        REQUIRE(matchtape_controller_get_match_number(f.ctrl) == 2);
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_RECORDING);
        REQUIRE(matchtape_recording_get_num_ticks(matchtape_controller_get_recording(f.ctrl)) == 0);
    }

    SECTION("Disabled autorecord only counts matches") {
        REQUIRE(matchtape_controller_set_autorecord(f.ctrl, false));
        matchtape_controller_on_restart(f.ctrl);
        matchtape_controller_on_game_over(f.ctrl);
        REQUIRE(matchtape_controller_get_match_number(f.ctrl) == 1);
        REQUIRE(matchtape_controller_get_mode(f.ctrl) == MATCHTAPE_MODE_IDLE);
        REQUIRE(f.fake.blobs.empty());
    }
}

TEST_CASE("Controller force spectate", "[controller][spectate]") {
    ControllerFixture f;
    f.fake.add_player("bob", 1);

    REQUIRE(matchtape_controller_force_spectate(f.ctrl) == 2);
    REQUIRE(f.last_broadcast() == "Moved 2 players to spectators");
    REQUIRE(matchtape_controller_force_spectate(f.ctrl) == 0);
}
