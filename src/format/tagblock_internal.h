/**
 * Matchtape - Tagged Block Internal Types
 *
 * Internal header shared between tagblock_lexer.cpp and tagblock_parser.cpp.
 */

#ifndef MATCHTAPE_TAGBLOCK_INTERNAL_H
#define MATCHTAPE_TAGBLOCK_INTERNAL_H

#include <stddef.h>
#include <stdbool.h>

/* ============================================================================
 * Token Types
 * ============================================================================ */

typedef enum Matchtape_TagTokenType {
    TAGTOK_EOF = 0,
    TAGTOK_ERROR,
    TAGTOK_OPEN,       /* <name> */
    TAGTOK_CLOSE,      /* </name> */
    TAGTOK_TEXT        /* raw text between tags, entities still escaped */
} Matchtape_TagTokenType;

typedef struct Matchtape_TagToken {
    Matchtape_TagTokenType type;
    const char *start;   /* Name for OPEN/CLOSE, raw text for TEXT */
    int length;
    int line;            /* 1-based */
    int column;          /* 1-based */
} Matchtape_TagToken;

/* ============================================================================
 * Lexer
 * ============================================================================ */

typedef struct Matchtape_TagLexer {
    const char *start;   /* Start of current token */
    const char *current;
    const char *end;
    int line;
    int column;
    int start_line;
    int start_column;
    const char *name;    /* Source name for errors */

    char error[256];
    bool has_error;
} Matchtape_TagLexer;

void matchtape_tag_lexer_init(Matchtape_TagLexer *lexer, const char *source,
                              size_t length, const char *name);

Matchtape_TagToken matchtape_tag_lexer_next(Matchtape_TagLexer *lexer);

const char *matchtape_tag_token_type_name(Matchtape_TagTokenType type);

/** @return true if c may appear in a tag name */
bool matchtape_tag_is_name_char(char c);

#endif /* MATCHTAPE_TAGBLOCK_INTERNAL_H */
