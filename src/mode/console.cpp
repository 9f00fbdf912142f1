/**
 * Matchtape - Command Console
 */

#include "matchtape/console.h"
#include "matchtape/error.h"
#include "matchtape/log.h"

#include <ctype.h>
#include <new>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>

#define CONSOLE_MAX_CMD_NAME 32
#define CONSOLE_MAX_CMD_HELP 96

/* ============================================================================
 * Internal Types
 * ============================================================================ */

typedef struct ConsoleCommand {
    char name[CONSOLE_MAX_CMD_NAME];
    char help[CONSOLE_MAX_CMD_HELP];
    Matchtape_CommandFunc func;
    void *userdata;
    bool privileged;
    bool active;
} ConsoleCommand;

typedef struct ConsoleLine {
    char text[MATCHTAPE_CONSOLE_LINE_MAX];
    bool is_error;
} ConsoleLine;

struct Matchtape_Console {
    Matchtape_Controller *ctrl;

    ConsoleCommand commands[MATCHTAPE_CONSOLE_MAX_COMMANDS];
    int command_count;

    ConsoleLine output[MATCHTAPE_CONSOLE_MAX_OUTPUT];
    int output_head;
    int output_count;
};

static void register_builtin_commands(Matchtape_Console *console);

/* ============================================================================
 * Helpers
 * ============================================================================ */

/* forward: also broadcast through the host */
static void console_add_output(Matchtape_Console *console, const char *text, bool is_error,
                               bool forward) {
    ConsoleLine *line = &console->output[console->output_head];
    snprintf(line->text, sizeof(line->text), "%s", text);
    line->is_error = is_error;

    console->output_head = (console->output_head + 1) % MATCHTAPE_CONSOLE_MAX_OUTPUT;
    if (console->output_count < MATCHTAPE_CONSOLE_MAX_OUTPUT) {
        console->output_count++;
    }

    if (forward && console->ctrl) {
        matchtape_host_broadcast(matchtape_controller_get_host(console->ctrl), "%s", text);
    }
}

static ConsoleCommand *find_command(Matchtape_Console *console, const char *name) {
    for (int i = 0; i < MATCHTAPE_CONSOLE_MAX_COMMANDS; i++) {
        if (console->commands[i].active &&
            strcasecmp(console->commands[i].name, name) == 0) {
            return &console->commands[i];
        }
    }
    return NULL;
}

/* ============================================================================
 * Lifecycle
 * ============================================================================ */

Matchtape_Console *matchtape_console_create(Matchtape_Controller *ctrl) {
    Matchtape_Console *console = new (std::nothrow) Matchtape_Console();
    if (!console) {
        matchtape_set_error("console: failed to allocate console");
        return nullptr;
    }

    console->ctrl = ctrl;
    if (ctrl) {
        register_builtin_commands(console);
    }
    return console;
}

void matchtape_console_destroy(Matchtape_Console *console) {
    delete console;
}

Matchtape_Controller *matchtape_console_get_controller(const Matchtape_Console *console) {
    return console ? console->ctrl : nullptr;
}

/* ============================================================================
 * Registration
 * ============================================================================ */

bool matchtape_console_register(Matchtape_Console *console, const char *name, const char *help,
                                Matchtape_CommandFunc func, void *userdata, bool privileged) {
    if (!console || !name || !name[0] || !func) {
        matchtape_set_error("console: invalid command registration");
        return false;
    }
    if (strlen(name) >= CONSOLE_MAX_CMD_NAME) {
        matchtape_set_error("console: command name too long: %s", name);
        return false;
    }
    if (find_command(console, name)) {
        matchtape_set_error("console: command already registered: %s", name);
        return false;
    }

    int slot = -1;
    for (int i = 0; i < MATCHTAPE_CONSOLE_MAX_COMMANDS; i++) {
        if (!console->commands[i].active) {
            slot = i;
            break;
        }
    }
    if (slot < 0) {
        matchtape_set_error("console: command registry full");
        return false;
    }

    ConsoleCommand *cmd = &console->commands[slot];
    snprintf(cmd->name, sizeof(cmd->name), "%s", name);
    snprintf(cmd->help, sizeof(cmd->help), "%s", help ? help : "");
    cmd->func = func;
    cmd->userdata = userdata;
    cmd->privileged = privileged;
    cmd->active = true;
    console->command_count++;

    return true;
}

bool matchtape_console_unregister(Matchtape_Console *console, const char *name) {
    if (!console || !name) return false;

    ConsoleCommand *cmd = find_command(console, name);
    if (!cmd) return false;

    memset(cmd, 0, sizeof(*cmd));
    console->command_count--;
    return true;
}

/* ============================================================================
 * Execution
 * ============================================================================ */

bool matchtape_console_execute(Matchtape_Console *console, const char *line, bool privileged) {
    if (!console || !line) return false;

    while (*line && isspace((unsigned char)*line)) line++;
    if (*line == '!' || *line == '/') line++;
    if (*line == '\0') return false;

    char buffer[MATCHTAPE_CONSOLE_MAX_INPUT];
    snprintf(buffer, sizeof(buffer), "%s", line);

    const char *argv[MATCHTAPE_CONSOLE_MAX_ARGS];
    int argc = 0;

    char *token = strtok(buffer, " \t\r\n");
    while (token && argc < MATCHTAPE_CONSOLE_MAX_ARGS) {
        argv[argc++] = token;
        token = strtok(NULL, " \t\r\n");
    }

    if (argc == 0) return false;

    ConsoleCommand *cmd = find_command(console, argv[0]);
    if (!cmd) {
        matchtape_console_error(console, "Unknown command: %s", argv[0]);
        return false;
    }
    if (cmd->privileged && !privileged) {
        matchtape_log_warning(MATCHTAPE_LOG_CONSOLE, "Refused unprivileged '%s'", cmd->name);
        matchtape_console_error(console, "You are not allowed to use %s", cmd->name);
        return false;
    }

    matchtape_log_debug(MATCHTAPE_LOG_CONSOLE, "Running '%s' (%d args)", cmd->name, argc - 1);
    cmd->func(console, argc, argv, cmd->userdata);
    return true;
}

/* ============================================================================
 * Output
 * ============================================================================ */

void matchtape_console_print(Matchtape_Console *console, const char *fmt, ...) {
    if (!console) return;

    char buffer[MATCHTAPE_CONSOLE_LINE_MAX];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    console_add_output(console, buffer, false, true);
}

void matchtape_console_error(Matchtape_Console *console, const char *fmt, ...) {
    if (!console) return;

    char buffer[MATCHTAPE_CONSOLE_LINE_MAX];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    console_add_output(console, buffer, true, true);
}

int matchtape_console_get_output(const Matchtape_Console *console, const char **out_lines, int max_lines) {
    if (!console || !out_lines || max_lines <= 0) return 0;

    int count = console->output_count < max_lines ? console->output_count : max_lines;
    int start = (console->output_head - console->output_count + MATCHTAPE_CONSOLE_MAX_OUTPUT)
                % MATCHTAPE_CONSOLE_MAX_OUTPUT;

    for (int i = 0; i < count; i++) {
        int idx = (start + i) % MATCHTAPE_CONSOLE_MAX_OUTPUT;
        out_lines[i] = console->output[idx].text;
    }
    return count;
}

const char *matchtape_console_last_output(const Matchtape_Console *console, bool *out_is_error) {
    if (out_is_error) *out_is_error = false;
    if (!console || console->output_count == 0) return "";

    int idx = (console->output_head - 1 + MATCHTAPE_CONSOLE_MAX_OUTPUT) % MATCHTAPE_CONSOLE_MAX_OUTPUT;
    if (out_is_error) *out_is_error = console->output[idx].is_error;
    return console->output[idx].text;
}

void matchtape_console_clear_output(Matchtape_Console *console) {
    if (!console) return;
    console->output_count = 0;
    console->output_head = 0;
}

/* ============================================================================
 * Built-in Commands
 * ============================================================================ */

/* Report a controller call: the controller already broadcast its own message */
static void report(Matchtape_Console *console, bool ok) {
    char text[MATCHTAPE_CONSOLE_LINE_MAX];
    if (ok) {
        snprintf(text, sizeof(text), "ok (%s)",
                 matchtape_mode_name(matchtape_controller_get_mode(console->ctrl)));
    } else {
        snprintf(text, sizeof(text), "%s", matchtape_get_last_error());
    }
    console_add_output(console, text, !ok, false);
}

static void cmd_start_autorecord(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_set_autorecord(console->ctrl, true));
}

static void cmd_stop_autorecord(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_set_autorecord(console->ctrl, false));
}

static void cmd_start_recording(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_start_recording(console->ctrl));
}

static void cmd_stop_recording(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_stop_recording(console->ctrl));
}

static void cmd_start_replay(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)ud;
    report(console, matchtape_controller_start_replay(console->ctrl, argc > 1 ? argv[1] : NULL));
}

static void cmd_stop_replay(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_stop_replay(console->ctrl));
}

static void cmd_save_recording(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    report(console, matchtape_controller_save_recording(console->ctrl));
}

static void cmd_all_spec(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    matchtape_controller_force_spectate(console->ctrl);
    report(console, true);
}

static void cmd_load_recording(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)ud;
    if (argc < 2) {
        matchtape_console_error(console, "Usage: loadrecording <file>");
        return;
    }
    report(console, matchtape_controller_load_recording(console->ctrl, argv[1]));
}

static void cmd_save_point(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)ud;
    if (argc < 2) {
        matchtape_console_error(console, "Usage: savepoint <name>");
        return;
    }
    report(console, matchtape_controller_add_save_point(console->ctrl, argv[1]));
}

static void cmd_status(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)argc; (void)argv; (void)ud;
    Matchtape_Controller *ctrl = console->ctrl;
    const Matchtape_Recording *rec = matchtape_controller_get_recording(ctrl);

    matchtape_console_print(console, "session %s, match %u, mode %s, autorecord %s, recording %s (%zu ticks)",
                            matchtape_controller_get_session_name(ctrl),
                            matchtape_controller_get_match_number(ctrl),
                            matchtape_mode_name(matchtape_controller_get_mode(ctrl)),
                            matchtape_controller_get_autorecord(ctrl) ? "on" : "off",
                            rec ? "present" : "none",
                            matchtape_recording_get_num_ticks(rec));
}

static void cmd_help(Matchtape_Console *console, int argc, const char **argv, void *ud) {
    (void)ud;

    if (argc > 1) {
        ConsoleCommand *cmd = find_command(console, argv[1]);
        if (cmd) {
            matchtape_console_print(console, "%s: %s", cmd->name, cmd->help);
        } else {
            matchtape_console_error(console, "Unknown command: %s", argv[1]);
        }
        return;
    }

    matchtape_console_print(console, "Available commands:");
    for (int i = 0; i < MATCHTAPE_CONSOLE_MAX_COMMANDS; i++) {
        if (console->commands[i].active) {
            matchtape_console_print(console, "  %s - %s",
                                    console->commands[i].name, console->commands[i].help);
        }
    }
}

static void register_builtin_commands(Matchtape_Console *console) {
    static const struct {
        const char *name;
        const char *help;
        Matchtape_CommandFunc func;
        bool privileged;
    } builtins[] = {
        { "startautorecord", "Record every match from its restart", cmd_start_autorecord, true },
        { "stopautorecord",  "Stop recording matches automatically", cmd_stop_autorecord, true },
        { "startrecording",  "Start recording now", cmd_start_recording, true },
        { "stoprecording",   "Stop the running recording", cmd_stop_recording, true },
        { "startreplay",     "Replay the current recording: startreplay [savepoint]", cmd_start_replay, true },
        { "stopreplay",      "Stop the replay and reload the map", cmd_stop_replay, true },
        { "saverecording",   "Save the current recording to a file", cmd_save_recording, true },
        { "allspec",         "Move every player to spectators", cmd_all_spec, true },
        { "loadrecording",   "Load a saved recording: loadrecording <file>", cmd_load_recording, true },
        { "savepoint",       "Name the next recorded tick: savepoint <name>", cmd_save_point, true },
        { "status",          "Show session and mode", cmd_status, false },
        { "help",            "List commands or show help: help [command]", cmd_help, false },
    };

    for (const auto &b : builtins) {
        if (!matchtape_console_register(console, b.name, b.help, b.func, NULL, b.privileged)) {
            matchtape_log_error(MATCHTAPE_LOG_CONSOLE, "Cannot register '%s': %s",
                                b.name, matchtape_get_last_error());
        }
    }
}
