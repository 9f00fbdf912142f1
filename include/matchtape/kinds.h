#ifndef MATCHTAPE_KINDS_H
#define MATCHTAPE_KINDS_H

#include <stdbool.h>
#include <stddef.h>

/**
 * @file kinds.h
 * @brief Spawn policy per entity kind
 *
 * Replay re-creates entities either through the host's generic create call
 * or through the multi-step appearance path (create uninitialized, set team,
 * position and appearance, then initialize). Kinds not in the table use the
 * generic path.
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef enum Matchtape_SpawnKind {
    MATCHTAPE_SPAWN_GENERIC = 0,
    MATCHTAPE_SPAWN_APPEARANCE
} Matchtape_SpawnKind;

typedef struct Matchtape_KindTable Matchtape_KindTable;

/** @return Empty table (every kind generic), or NULL on failure */
Matchtape_KindTable *matchtape_kind_table_create(void);

/** @return Table with "knight", "archer" and "builder" using the appearance path */
Matchtape_KindTable *matchtape_kind_table_create_default(void);

/** @return Deep copy of a table, or NULL on failure */
Matchtape_KindTable *matchtape_kind_table_clone(const Matchtape_KindTable *table);

void matchtape_kind_table_destroy(Matchtape_KindTable *table);

/** Register or overwrite the policy for a kind. */
bool matchtape_kind_table_set(Matchtape_KindTable *table, const char *kind, Matchtape_SpawnKind policy);

/** Remove every entry. */
void matchtape_kind_table_clear(Matchtape_KindTable *table);

/** @return Policy for kind (GENERIC when unknown or table is NULL) */
Matchtape_SpawnKind matchtape_kind_table_lookup(const Matchtape_KindTable *table, const char *kind);

size_t matchtape_kind_table_count(const Matchtape_KindTable *table);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_KINDS_H */
