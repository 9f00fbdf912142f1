#include "matchtape/storage.h"
#include "matchtape/error.h"
#include "matchtape/log.h"
#include "matchtape/validate.h"
#include <SDL3/SDL.h>
#include <new>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#define DEFAULT_STORAGE_DIR "recordings"

struct Matchtape_Storage {
    char dir[MATCHTAPE_STORAGE_PATH_MAX];
    bool dir_ready;
};

static bool is_separator(char c) {
    return c == '/' || c == '\\';
}

bool matchtape_storage_name_is_safe(const char *name) {
    if (!name || name[0] == '\0') {
        return false;
    }

    size_t len = strlen(name);
    if (len > MATCHTAPE_STORAGE_NAME_MAX) {
        return false;
    }

    for (size_t i = 0; i < len; i++) {
        if (is_separator(name[i]) || name[i] == ':') {
            return false;
        }
    }

    if (strcmp(name, ".") == 0 || strcmp(name, "..") == 0) {
        return false;
    }

    return true;
}

bool matchtape_storage_format_name(const char *session, uint32_t match_number,
                                   uint32_t recording_number, char *out, size_t size) {
    MATCHTAPE_VALIDATE_STRING_RET(session, false);
    MATCHTAPE_VALIDATE_PTR_RET(out, false);

    int written = snprintf(out, size, "%s_match%urecording%u.cfg",
                           session, (unsigned)match_number, (unsigned)recording_number);
    if (written < 0 || (size_t)written >= size) {
        matchtape_set_error("storage: file name for session '%s' is too long", session);
        return false;
    }
    if (!matchtape_storage_name_is_safe(out)) {
        matchtape_set_error("storage: unsafe file name '%s'", out);
        return false;
    }
    return true;
}

bool matchtape_storage_session_name_now(char *out, size_t size) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);

    time_t now = time(NULL);
    struct tm *tm_info = localtime(&now);
    if (!tm_info || strftime(out, size, "%Y%m%d_%H%M%S", tm_info) == 0) {
        matchtape_set_error("storage: cannot format session timestamp");
        return false;
    }
    return true;
}

Matchtape_Storage *matchtape_storage_create(const char *dir) {
    const char *use_dir = (dir && dir[0] != '\0') ? dir : DEFAULT_STORAGE_DIR;
    if (strlen(use_dir) + MATCHTAPE_STORAGE_NAME_MAX + 8 >= MATCHTAPE_STORAGE_PATH_MAX) {
        matchtape_set_error("storage: directory path too long: %s", use_dir);
        return nullptr;
    }

    Matchtape_Storage *storage = new (std::nothrow) Matchtape_Storage();
    if (!storage) {
        matchtape_set_error("storage: failed to allocate storage");
        return nullptr;
    }

    snprintf(storage->dir, sizeof(storage->dir), "%s", use_dir);
    storage->dir_ready = false;
    return storage;
}

void matchtape_storage_destroy(Matchtape_Storage *storage) {
    delete storage;
}

const char *matchtape_storage_get_dir(const Matchtape_Storage *storage) {
    return storage ? storage->dir : NULL;
}

static bool build_path(const Matchtape_Storage *storage, const char *name, const char *suffix,
                       char *out, size_t size) {
    if (!matchtape_storage_name_is_safe(name)) {
        matchtape_set_error("storage: unsafe file name '%s'", name ? name : "(null)");
        return false;
    }

    size_t dir_len = strlen(storage->dir);
    const char *sep = (dir_len > 0 && is_separator(storage->dir[dir_len - 1])) ? "" : "/";
    int written = snprintf(out, size, "%s%s%s%s", storage->dir, sep, name, suffix ? suffix : "");
    if (written < 0 || (size_t)written >= size) {
        matchtape_set_error("storage: path too long for '%s'", name);
        return false;
    }
    return true;
}

bool matchtape_storage_write(Matchtape_Storage *storage, const char *name,
                             const char *text, size_t len) {
    MATCHTAPE_VALIDATE_PTRS2_RET(storage, text, false);

    char path[MATCHTAPE_STORAGE_PATH_MAX];
    char tmp_path[MATCHTAPE_STORAGE_PATH_MAX];
    if (!build_path(storage, name, NULL, path, sizeof(path)) ||
        !build_path(storage, name, ".tmp", tmp_path, sizeof(tmp_path))) {
        return false;
    }

    if (!storage->dir_ready) {
        if (!SDL_CreateDirectory(storage->dir)) {
            matchtape_set_error_from_sdl("storage: cannot create save directory");
            return false;
        }
        storage->dir_ready = true;
    }

    FILE *fp = fopen(tmp_path, "wb");
    if (!fp) {
        matchtape_set_error_from_errno("storage: cannot open %s for writing", tmp_path);
        return false;
    }

    bool success = fwrite(text, 1, len, fp) == len;
    success = (fclose(fp) == 0) && success;

    if (success && rename(tmp_path, path) != 0) {
        success = false;
    }

    if (!success) {
        remove(tmp_path);
        matchtape_set_error("storage: failed to write %s", path);
        return false;
    }

    matchtape_log_info(MATCHTAPE_LOG_STORAGE, "Wrote %zu bytes to %s", len, path);
    return true;
}

char *matchtape_storage_read(const Matchtape_Storage *storage, const char *name, size_t *out_len) {
    MATCHTAPE_VALIDATE_PTR_RET(storage, NULL);

    char path[MATCHTAPE_STORAGE_PATH_MAX];
    if (!build_path(storage, name, NULL, path, sizeof(path))) {
        return NULL;
    }

    FILE *fp = fopen(path, "rb");
    if (!fp) {
        matchtape_set_error_from_errno("storage: cannot open %s", path);
        return NULL;
    }

    char *data = NULL;
    long size = -1;
    if (fseek(fp, 0, SEEK_END) == 0) {
        size = ftell(fp);
    }
    if (size >= 0 && fseek(fp, 0, SEEK_SET) == 0) {
        data = (char *)malloc((size_t)size + 1);
    }

    bool success = data && fread(data, 1, (size_t)size, fp) == (size_t)size;
    fclose(fp);

    if (!success) {
        free(data);
        matchtape_set_error("storage: failed to read %s", path);
        return NULL;
    }

    data[size] = '\0';
    if (out_len) *out_len = (size_t)size;
    matchtape_log_info(MATCHTAPE_LOG_STORAGE, "Read %ld bytes from %s", size, path);
    return data;
}

bool matchtape_storage_exists(const Matchtape_Storage *storage, const char *name) {
    if (!storage || !matchtape_storage_name_is_safe(name)) return false;

    char path[MATCHTAPE_STORAGE_PATH_MAX];
    if (!build_path(storage, name, NULL, path, sizeof(path))) return false;

    FILE *fp = fopen(path, "rb");
    if (!fp) return false;
    fclose(fp);
    return true;
}
