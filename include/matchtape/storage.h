#ifndef MATCHTAPE_STORAGE_H
#define MATCHTAPE_STORAGE_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @file storage.h
 * @brief Recording files in a save directory
 *
 * Used when the host has no persist/restore callbacks. Names are single
 * path components; anything that could escape the directory is rejected.
 */

#ifdef __cplusplus
extern "C" {
#endif

#define MATCHTAPE_STORAGE_NAME_MAX  128
#define MATCHTAPE_STORAGE_PATH_MAX  512

typedef struct Matchtape_Storage Matchtape_Storage;

/**
 * @return true if name is non-empty, fits MATCHTAPE_STORAGE_NAME_MAX and
 *         has no path separators or ".." component
 */
bool matchtape_storage_name_is_safe(const char *name);

/**
 * Build "{session}_match{match}recording{recording}.cfg".
 *
 * @return false if the buffer is too small or the result is not a safe name
 */
bool matchtape_storage_format_name(const char *session, uint32_t match_number,
                                   uint32_t recording_number, char *out, size_t size);

/** Write a session name from the local time ("YYYYmmdd_HHMMSS"). */
bool matchtape_storage_session_name_now(char *out, size_t size);

/**
 * @param dir Save directory (NULL for "recordings"). Created on first write.
 */
Matchtape_Storage *matchtape_storage_create(const char *dir);

void matchtape_storage_destroy(Matchtape_Storage *storage);

const char *matchtape_storage_get_dir(const Matchtape_Storage *storage);

/**
 * Write a whole file. Goes through a temporary file so a failed write
 * leaves no partial recording behind.
 */
bool matchtape_storage_write(Matchtape_Storage *storage, const char *name,
                             const char *text, size_t len);

/**
 * Read a whole file.
 *
 * @param out_len Optional, receives the length
 * @return NUL-terminated text (caller frees with free()), or NULL
 */
char *matchtape_storage_read(const Matchtape_Storage *storage, const char *name, size_t *out_len);

bool matchtape_storage_exists(const Matchtape_Storage *storage, const char *name);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_STORAGE_H */
