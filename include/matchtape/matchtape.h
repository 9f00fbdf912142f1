#ifndef MATCHTAPE_H
#define MATCHTAPE_H

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

// Version info
#define MATCHTAPE_VERSION_MAJOR 0
#define MATCHTAPE_VERSION_MINOR 1
#define MATCHTAPE_VERSION_PATCH 0

/*============================================================================
 * Memory Ownership Conventions
 *============================================================================
 *
 * 1. CREATE/DESTROY PAIRS:
 *    `matchtape_*_create()` returns an owned pointer; the caller MUST pass it
 *    to the matching `matchtape_*_destroy()`. Destroy functions accept NULL.
 *
 *      Matchtape_Controller *ctrl = matchtape_controller_create(&host, &cfg);
 *      matchtape_controller_destroy(ctrl);
 *
 * 2. SERIALIZED TEXT:
 *    `matchtape_recording_serialize()`, `matchtape_storage_read()` and the
 *    host `restore` callback return malloc'd buffers; release with free().
 *
 * 3. GET FUNCTIONS:
 *    `matchtape_*_get_*()` return borrowed pointers valid until the owner is
 *    destroyed or, for a replay, until its recording is replaced.
 *
 * 4. NULL/FALSE ON FAILURE:
 *    Failing calls return NULL or false and leave a message readable with
 *    matchtape_get_last_error().
 *
 *============================================================================*/

#include "matchtape/error.h"
#include "matchtape/log.h"
#include "matchtape/host.h"
#include "matchtape/tagblock.h"
#include "matchtape/entity_meta.h"
#include "matchtape/entity_sample.h"
#include "matchtape/recording.h"
#include "matchtape/kinds.h"
#include "matchtape/replay.h"
#include "matchtape/storage.h"
#include "matchtape/config.h"
#include "matchtape/controller.h"
#include "matchtape/console.h"

#endif /* MATCHTAPE_H */
