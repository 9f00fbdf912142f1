/**
 * Matchtape - Kind Table
 */

#include "matchtape/kinds.h"
#include "matchtape/error.h"
#include "matchtape/validate.h"
#include <new>
#include <string>
#include <unordered_map>

struct Matchtape_KindTable {
    std::unordered_map<std::string, Matchtape_SpawnKind> kinds;
};

static const char *s_default_appearance_kinds[] = {
    "knight",
    "archer",
    "builder"
};

Matchtape_KindTable *matchtape_kind_table_create(void) {
    Matchtape_KindTable *table = new (std::nothrow) Matchtape_KindTable();
    if (!table) {
        matchtape_set_error("kinds: failed to allocate kind table");
        return nullptr;
    }
    return table;
}

Matchtape_KindTable *matchtape_kind_table_create_default(void) {
    Matchtape_KindTable *table = matchtape_kind_table_create();
    if (!table) return nullptr;

    for (const char *kind : s_default_appearance_kinds) {
        table->kinds[kind] = MATCHTAPE_SPAWN_APPEARANCE;
    }
    return table;
}

Matchtape_KindTable *matchtape_kind_table_clone(const Matchtape_KindTable *table) {
    MATCHTAPE_VALIDATE_PTR_RET(table, nullptr);

    Matchtape_KindTable *copy = matchtape_kind_table_create();
    if (!copy) return nullptr;
    copy->kinds = table->kinds;
    return copy;
}

void matchtape_kind_table_destroy(Matchtape_KindTable *table) {
    delete table;
}

bool matchtape_kind_table_set(Matchtape_KindTable *table, const char *kind, Matchtape_SpawnKind policy) {
    MATCHTAPE_VALIDATE_PTR_RET(table, false);
    MATCHTAPE_VALIDATE_STRING_RET(kind, false);

    table->kinds[kind] = policy;
    return true;
}

void matchtape_kind_table_clear(Matchtape_KindTable *table) {
    if (table) table->kinds.clear();
}

Matchtape_SpawnKind matchtape_kind_table_lookup(const Matchtape_KindTable *table, const char *kind) {
    if (!table || !kind) return MATCHTAPE_SPAWN_GENERIC;

    auto it = table->kinds.find(kind);
    return it == table->kinds.end() ? MATCHTAPE_SPAWN_GENERIC : it->second;
}

size_t matchtape_kind_table_count(const Matchtape_KindTable *table) {
    return table ? table->kinds.size() : 0;
}
