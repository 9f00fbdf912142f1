#ifndef MATCHTAPE_VALIDATE_H
#define MATCHTAPE_VALIDATE_H

#include "matchtape/error.h"
#include <stdbool.h>
#include <stddef.h>

/**
 * Matchtape Argument Checks
 *
 * Early-return guards for the public entry points. A failed check names
 * the function and the offending argument in the error buffer, e.g.
 * "matchtape_recording_get_tick: index 7 out of range (5)".
 *
 * Usage:
 *   bool matchtape_recording_add_save_point(Matchtape_Recording *rec, const char *name) {
 *       MATCHTAPE_VALIDATE_PTR_RET(rec, false);
 *       MATCHTAPE_VALIDATE_STRING_RET(name, false);
 *       ...
 *   }
 */

/* Shared failure path: report against the calling function and return */
#define MATCHTAPE_VALIDATE_FAIL_(ret, fmt, ...) \
    do { \
        matchtape_set_error("%s: " fmt, __func__, __VA_ARGS__); \
        return ret; \
    } while (0)

#define MATCHTAPE_VALIDATE_PTR_RET(ptr, ret) \
    do { \
        if (!(ptr)) MATCHTAPE_VALIDATE_FAIL_((ret), "%s is NULL", #ptr); \
    } while (0)

#define MATCHTAPE_VALIDATE_PTRS2_RET(p1, p2, ret) \
    do { \
        MATCHTAPE_VALIDATE_PTR_RET(p1, ret); \
        MATCHTAPE_VALIDATE_PTR_RET(p2, ret); \
    } while (0)

/* Tick and slot lookups */
#define MATCHTAPE_VALIDATE_INDEX_RET(index, count, ret) \
    do { \
        if ((size_t)(index) >= (size_t)(count)) \
            MATCHTAPE_VALIDATE_FAIL_((ret), "%s %zu out of range (%zu)", \
                                     #index, (size_t)(index), (size_t)(count)); \
    } while (0)

/* Names: session, kind, save point */
#define MATCHTAPE_VALIDATE_STRING_RET(str, ret) \
    do { \
        if (!(str) || (str)[0] == '\0') \
            MATCHTAPE_VALIDATE_FAIL_((ret), "%s is NULL or empty", #str); \
    } while (0)

#define MATCHTAPE_VALIDATE_COND_RET(cond, msg, ret) \
    do { \
        if (!(cond)) MATCHTAPE_VALIDATE_FAIL_((ret), "%s", (msg)); \
    } while (0)

#endif /* MATCHTAPE_VALIDATE_H */
