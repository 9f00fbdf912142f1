/**
 * @file console.h
 * @brief Chat-style command surface for the mode controller
 *
 * Lines such as "!startreplay opening" are split on whitespace, matched
 * case-insensitively against registered commands and dispatched with
 * argc/argv. Commands that change the session require a privileged caller.
 *
 * Built-in commands (bound to a controller):
 *   startautorecord, stopautorecord, startrecording, stoprecording,
 *   startreplay [savepoint], stopreplay, saverecording, allspec,
 *   loadrecording <file>, savepoint <name>, status, help [command]
 */

#ifndef MATCHTAPE_CONSOLE_H
#define MATCHTAPE_CONSOLE_H

#include "matchtape/controller.h"
#include <stdarg.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define MATCHTAPE_CONSOLE_MAX_COMMANDS  32
#define MATCHTAPE_CONSOLE_MAX_ARGS      8
#define MATCHTAPE_CONSOLE_MAX_INPUT     256
#define MATCHTAPE_CONSOLE_MAX_OUTPUT    64
#define MATCHTAPE_CONSOLE_LINE_MAX      256

typedef struct Matchtape_Console Matchtape_Console;

typedef void (*Matchtape_CommandFunc)(Matchtape_Console *console, int argc,
                                      const char **argv, void *userdata);

/**
 * Create a console. With a controller, the built-in commands are registered.
 *
 * @param ctrl Controller the built-ins act on (may be NULL)
 */
Matchtape_Console *matchtape_console_create(Matchtape_Controller *ctrl);

void matchtape_console_destroy(Matchtape_Console *console);

/**
 * @param privileged true if only privileged callers may run it
 * @return false on duplicate name or full registry
 */
bool matchtape_console_register(Matchtape_Console *console, const char *name, const char *help,
                                Matchtape_CommandFunc func, void *userdata, bool privileged);

bool matchtape_console_unregister(Matchtape_Console *console, const char *name);

/**
 * Run one line. A leading '!' or '/' is ignored.
 *
 * @param privileged Whether the caller may run privileged commands
 * @return true if a command ran
 */
bool matchtape_console_execute(Matchtape_Console *console, const char *line, bool privileged);

void matchtape_console_print(Matchtape_Console *console, const char *fmt, ...);
void matchtape_console_error(Matchtape_Console *console, const char *fmt, ...);

/**
 * Output lines, oldest first.
 *
 * @return Number of lines written to out_lines
 */
int matchtape_console_get_output(const Matchtape_Console *console, const char **out_lines, int max_lines);

/** @return Most recent output line ("" if none) */
const char *matchtape_console_last_output(const Matchtape_Console *console, bool *out_is_error);

void matchtape_console_clear_output(Matchtape_Console *console);

/** @return Controller given at create (may be NULL) */
Matchtape_Controller *matchtape_console_get_controller(const Matchtape_Console *console);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_CONSOLE_H */
