#ifndef MATCHTAPE_TAGBLOCK_H
#define MATCHTAPE_TAGBLOCK_H

#include "matchtape/host.h"
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @file tagblock.h
 * @brief Nested tagged-block text codec used by recording files
 *
 * Output Format:
 *   <outer>
 *     <leaf>value</leaf>
 *     <empty></empty>
 *   </outer>
 *
 * Leaves carry text with '&', '<' and '>' escaped as entities. Containers
 * hold only child blocks. Order of children is preserved.
 */

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Writer
 *============================================================================*/

typedef struct Matchtape_TagWriter Matchtape_TagWriter;

/** @return New writer, or NULL on allocation failure */
Matchtape_TagWriter *matchtape_tag_writer_create(void);

/** Destroy a writer (safe with NULL). */
void matchtape_tag_writer_destroy(Matchtape_TagWriter *writer);

/**
 * Open a container block.
 *
 * @param name Tag name ([A-Za-z0-9_]+)
 * @return false if the name is invalid
 */
bool matchtape_tag_open(Matchtape_TagWriter *writer, const char *name);

/**
 * Close the innermost open block.
 *
 * @param name Must match the innermost open tag
 * @return false on mismatch or when nothing is open
 */
bool matchtape_tag_close(Matchtape_TagWriter *writer, const char *name);

bool matchtape_tag_write_int(Matchtape_TagWriter *writer, const char *name, int64_t value);
bool matchtape_tag_write_uint(Matchtape_TagWriter *writer, const char *name, uint64_t value);
bool matchtape_tag_write_float(Matchtape_TagWriter *writer, const char *name, float value);
bool matchtape_tag_write_vec2(Matchtape_TagWriter *writer, const char *name, Matchtape_Vec2 value);
bool matchtape_tag_write_string(Matchtape_TagWriter *writer, const char *name, const char *value);

/** @return Depth of currently open blocks */
int matchtape_tag_writer_depth(const Matchtape_TagWriter *writer);

/**
 * Take the written text. Fails if blocks are still open.
 * The writer is empty afterwards and may be reused.
 *
 * @param out_len Optional, receives the text length
 * @return Text (caller frees with free()), or NULL on error
 */
char *matchtape_tag_writer_finish(Matchtape_TagWriter *writer, size_t *out_len);

/*============================================================================
 * Parse Tree
 *============================================================================*/

typedef struct Matchtape_TagNode Matchtape_TagNode;

/**
 * Parse a single root block.
 *
 * @param text        Source text
 * @param len         Text length in bytes
 * @param source_name Name used in error messages (NULL for "<source>")
 * @return Root node (destroy with matchtape_tag_node_destroy), or NULL with
 *         "source:line:column: message" in the error buffer
 */
Matchtape_TagNode *matchtape_tag_parse(const char *text, size_t len, const char *source_name);

/** Destroy a parse tree (safe with NULL). */
void matchtape_tag_node_destroy(Matchtape_TagNode *node);

const char *matchtape_tag_node_name(const Matchtape_TagNode *node);

/** @return Unescaped leaf text ("" for containers) */
const char *matchtape_tag_node_text(const Matchtape_TagNode *node);

/** @return Source line the block opened on */
int matchtape_tag_node_line(const Matchtape_TagNode *node);

size_t matchtape_tag_node_child_count(const Matchtape_TagNode *node);
const Matchtape_TagNode *matchtape_tag_node_child(const Matchtape_TagNode *node, size_t index);

/** @return First child with the given name, or NULL */
const Matchtape_TagNode *matchtape_tag_node_find(const Matchtape_TagNode *node, const char *name);

/*
 * Typed leaf accessors. Each looks up the named child of node and converts
 * its text; on a missing child or malformed value they set the error and
 * return false.
 */
bool matchtape_tag_get_int(const Matchtape_TagNode *node, const char *name, int *out);
bool matchtape_tag_get_u16(const Matchtape_TagNode *node, const char *name, uint16_t *out);
bool matchtape_tag_get_u32(const Matchtape_TagNode *node, const char *name, uint32_t *out);
bool matchtape_tag_get_float(const Matchtape_TagNode *node, const char *name, float *out);
bool matchtape_tag_get_vec2(const Matchtape_TagNode *node, const char *name, Matchtape_Vec2 *out);
bool matchtape_tag_get_string(const Matchtape_TagNode *node, const char *name, char *buf, size_t size);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_TAGBLOCK_H */
