/**
 * Matchtape - Arena Example
 *
 * Headless session on the Flecs reference host. Two scripted players run
 * around an arena while console commands record the match, save it, load it
 * back and replay it.
 *
 * Usage:
 *   matchtape_arena [config.toml] [--stdin]
 *
 * With --stdin, console commands are read one per line instead of running
 * the built-in script. Besides the matchtape commands, the example adds:
 *   tick [n]     step the simulation n times (default 1)
 *   restart      start a new match
 *   gameover     end the current match
 */

#include "matchtape/matchtape.h"
#include "matchtape/flecs_host.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

typedef struct Arena {
    Matchtape_FlecsHost *sim;
    Matchtape_Host host;
    Matchtape_Controller *ctrl;
    uint16_t players[2];
} Arena;

static const char *s_script[] = {
    "status",
    "startrecording",
    "tick 20",
    "savepoint turn",
    "tick 20",
    "saverecording",
    "restart",
    "loadrecording %s",     /* last saved file */
    "startreplay",
    "tick 45",
    "status",
    "stopreplay",
    "startreplay turn",
    "tick 5",
    "stopreplay",
    "status",
};

/* Players without a character get one, at opposite ends of the arena */
static void spawn_missing(Arena *arena) {
    static const char *kinds[2] = { "knight", "archer" };
    for (int i = 0; i < 2; i++) {
        if (matchtape_flecs_host_find_player_character(arena->sim, arena->players[i]) ==
            MATCHTAPE_INVALID_ENTITY) {
            Matchtape_Vec2 pos = { i == 0 ? -20.0f : 20.0f, 0.0f };
            if (matchtape_flecs_host_spawn_player_character(arena->sim, arena->players[i],
                                                            kinds[i], pos) == MATCHTAPE_INVALID_ENTITY) {
                matchtape_log_and_clear_error(MATCHTAPE_LOG_HOST);
            }
        }
    }
}

/* Scripted input: players walk toward each other, then strafe */
static void drive_players(Arena *arena) {
    uint32_t t = matchtape_flecs_host_get_time(arena->sim);
    for (int i = 0; i < 2; i++) {
        Matchtape_EntityId e = matchtape_flecs_host_find_player_character(arena->sim, arena->players[i]);
        if (e == MATCHTAPE_INVALID_ENTITY) continue;

        bool early = (t % 40) < 20;
        Matchtape_Key toward = i == 0 ? MATCHTAPE_KEY_RIGHT : MATCHTAPE_KEY_LEFT;
        arena->host.set_key_pressed(arena->host.userdata, e, toward, early);
        arena->host.set_key_pressed(arena->host.userdata, e, MATCHTAPE_KEY_UP, !early);
        if (t % 20 == 0) {
            matchtape_log_debug(MATCHTAPE_LOG_HOST, "player %d now holds %s", i,
                                matchtape_key_name(early ? toward : MATCHTAPE_KEY_UP));
        }
    }
}

/* ============================================================================
 * Example Commands
 * ============================================================================ */

static void cmd_tick(Matchtape_Console *console, int argc, const char **argv, void *userdata) {
    Arena *arena = (Arena *)userdata;
    int n = argc > 1 ? atoi(argv[1]) : 1;
    if (n <= 0) {
        matchtape_console_error(console, "Usage: tick [n]");
        return;
    }

    for (int i = 0; i < n; i++) {
        if (matchtape_controller_get_mode(arena->ctrl) != MATCHTAPE_MODE_REPLAYING) {
            drive_players(arena);
        }
        matchtape_flecs_host_step(arena->sim);
        if (!matchtape_controller_update(arena->ctrl)) {
            matchtape_console_error(console, "Tick %d failed: %s", i, matchtape_get_last_error());
            return;
        }
    }
    matchtape_console_print(console, "t=%u, %zu entities", matchtape_flecs_host_get_time(arena->sim),
                            matchtape_flecs_host_entity_count(arena->sim));
}

static void cmd_restart(Matchtape_Console *console, int argc, const char **argv, void *userdata) {
    (void)argc; (void)argv;
    Arena *arena = (Arena *)userdata;
    if (!arena->host.load_map(arena->host.userdata, matchtape_flecs_host_get_map_name(arena->sim))) {
        matchtape_console_error(console, "Map reload failed");
        return;
    }
    spawn_missing(arena);
    matchtape_controller_on_restart(arena->ctrl);
    matchtape_console_print(console, "Match %u", matchtape_controller_get_match_number(arena->ctrl));
}

static void cmd_game_over(Matchtape_Console *console, int argc, const char **argv, void *userdata) {
    (void)argc; (void)argv;
    Arena *arena = (Arena *)userdata;
    matchtape_controller_on_game_over(arena->ctrl);
    matchtape_console_print(console, "Game over");
}

/* ============================================================================
 * Main
 * ============================================================================ */

static void run_line(Matchtape_Console *console, const char *line) {
    SDL_Log("> %s", line);
    matchtape_console_clear_output(console);
    matchtape_console_execute(console, line, true);

    const char *lines[MATCHTAPE_CONSOLE_MAX_OUTPUT];
    int count = matchtape_console_get_output(console, lines, MATCHTAPE_CONSOLE_MAX_OUTPUT);
    for (int i = 0; i < count; i++) {
        SDL_Log("  %s", lines[i]);
    }
}

int main(int argc, char *argv[]) {
    const char *config_path = NULL;
    bool from_stdin = false;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--stdin") == 0) {
            from_stdin = true;
        } else {
            config_path = argv[i];
        }
    }

    Matchtape_Config config;
    if (config_path) {
        if (!matchtape_config_load_file(config_path, &config)) {
            fprintf(stderr, "Failed to load %s: %s\n", config_path, matchtape_get_last_error());
            return 1;
        }
    } else {
        matchtape_config_defaults(&config);
        snprintf(config.session_name, sizeof(config.session_name), "demo");
    }
    if (!matchtape_config_apply_logging(&config)) {
        fprintf(stderr, "%s\n", matchtape_get_last_error());
        return 1;
    }

    Arena arena;
    memset(&arena, 0, sizeof(arena));

    Matchtape_FlecsHostConfig hcfg = MATCHTAPE_FLECS_HOST_CONFIG_DEFAULT;
    arena.sim = matchtape_flecs_host_create(&hcfg);
    if (!arena.sim) {
        fprintf(stderr, "Failed to create simulation: %s\n", matchtape_get_last_error());
        matchtape_log_shutdown();
        return 1;
    }
    matchtape_flecs_host_get_host(arena.sim, &arena.host);

    arena.players[0] = matchtape_flecs_host_add_player(arena.sim, "alice", "Alice", 0);
    arena.players[1] = matchtape_flecs_host_add_player(arena.sim, "bob", "Bob", 1);
    spawn_missing(&arena);

    arena.ctrl = matchtape_controller_create(&arena.host, &config);
    Matchtape_Console *console = arena.ctrl ? matchtape_console_create(arena.ctrl) : NULL;
    if (!console) {
        fprintf(stderr, "Failed to create session: %s\n", matchtape_get_last_error());
        matchtape_controller_destroy(arena.ctrl);
        matchtape_flecs_host_destroy(arena.sim);
        matchtape_log_shutdown();
        return 1;
    }

    bool ok = matchtape_console_register(console, "tick", "Step the simulation: tick [n]", cmd_tick, &arena, false) &&
              matchtape_console_register(console, "restart", "Start a new match", cmd_restart, &arena, true) &&
              matchtape_console_register(console, "gameover", "End the current match", cmd_game_over, &arena, true);
    if (!ok) {
        matchtape_log_and_clear_error(MATCHTAPE_LOG_CONSOLE);
    }

    SDL_Log("Matchtape %d.%d.%d arena, session %s, saving to %s",
            MATCHTAPE_VERSION_MAJOR, MATCHTAPE_VERSION_MINOR, MATCHTAPE_VERSION_PATCH,
            matchtape_controller_get_session_name(arena.ctrl), config.save_dir);

    if (from_stdin) {
        char line[MATCHTAPE_CONSOLE_MAX_INPUT];
        while (fgets(line, sizeof(line), stdin)) {
            line[strcspn(line, "\r\n")] = '\0';
            if (strcmp(line, "quit") == 0) break;
            if (line[0] != '\0') run_line(console, line);
        }
    } else {
        for (size_t i = 0; i < sizeof(s_script) / sizeof(s_script[0]); i++) {
            char line[MATCHTAPE_CONSOLE_MAX_INPUT];
            snprintf(line, sizeof(line), s_script[i], matchtape_controller_get_last_save_name(arena.ctrl));
            run_line(console, line);
        }
    }

    matchtape_console_destroy(console);
    matchtape_controller_destroy(arena.ctrl);
    matchtape_flecs_host_destroy(arena.sim);
    matchtape_log_shutdown();
    return 0;
}
