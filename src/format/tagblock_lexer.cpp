/**
 * Matchtape - Tagged Block Lexer
 *
 * Splits recording text into open tags, close tags and text runs.
 */

#include "tagblock_internal.h"
#include <ctype.h>
#include <stdio.h>
#include <string.h>

/* ============================================================================
 * Helper Functions
 * ============================================================================ */

static bool is_at_end(Matchtape_TagLexer *lexer) {
    return lexer->current >= lexer->end;
}

static char advance(Matchtape_TagLexer *lexer) {
    char c = *lexer->current++;
    if (c == '\n') {
        lexer->line++;
        lexer->column = 1;
    } else {
        lexer->column++;
    }
    return c;
}

static char peek(Matchtape_TagLexer *lexer) {
    if (is_at_end(lexer)) return '\0';
    return *lexer->current;
}

static Matchtape_TagToken make_token(Matchtape_TagLexer *lexer, Matchtape_TagTokenType type,
                                     const char *start, int length) {
    Matchtape_TagToken token = {};
    token.type = type;
    token.start = start;
    token.length = length;
    token.line = lexer->start_line;
    token.column = lexer->start_column;
    return token;
}

static Matchtape_TagToken error_token(Matchtape_TagLexer *lexer, const char *message) {
    snprintf(lexer->error, sizeof(lexer->error), "%s:%d:%d: %s",
             lexer->name ? lexer->name : "<source>",
             lexer->start_line, lexer->start_column, message);
    lexer->has_error = true;

    Matchtape_TagToken token = {};
    token.type = TAGTOK_ERROR;
    token.start = message;
    token.length = (int)strlen(message);
    token.line = lexer->start_line;
    token.column = lexer->start_column;
    return token;
}

bool matchtape_tag_is_name_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

/* ============================================================================
 * Token Scanning
 * ============================================================================ */

static Matchtape_TagToken scan_tag(Matchtape_TagLexer *lexer) {
    /* '<' already consumed */
    bool closing = false;
    if (peek(lexer) == '/') {
        advance(lexer);
        closing = true;
    }

    const char *name_start = lexer->current;
    while (matchtape_tag_is_name_char(peek(lexer))) {
        advance(lexer);
    }
    int name_length = (int)(lexer->current - name_start);

    if (name_length == 0) {
        return error_token(lexer, "Expected tag name after '<'");
    }
    if (is_at_end(lexer)) {
        return error_token(lexer, "Unterminated tag");
    }
    if (peek(lexer) != '>') {
        return error_token(lexer, "Invalid character in tag name");
    }
    advance(lexer);

    return make_token(lexer, closing ? TAGTOK_CLOSE : TAGTOK_OPEN, name_start, name_length);
}

static Matchtape_TagToken scan_text(Matchtape_TagLexer *lexer) {
    while (!is_at_end(lexer) && peek(lexer) != '<') {
        if (peek(lexer) == '>') {
            return error_token(lexer, "Unescaped '>' in text");
        }
        advance(lexer);
    }
    return make_token(lexer, TAGTOK_TEXT, lexer->start, (int)(lexer->current - lexer->start));
}

/* ============================================================================
 * Public API
 * ============================================================================ */

void matchtape_tag_lexer_init(Matchtape_TagLexer *lexer, const char *source,
                              size_t length, const char *name) {
    memset(lexer, 0, sizeof(*lexer));
    lexer->start = source;
    lexer->current = source;
    lexer->end = source + length;
    lexer->line = 1;
    lexer->column = 1;
    lexer->name = name;
}

Matchtape_TagToken matchtape_tag_lexer_next(Matchtape_TagLexer *lexer) {
    lexer->start = lexer->current;
    lexer->start_line = lexer->line;
    lexer->start_column = lexer->column;

    if (is_at_end(lexer)) {
        return make_token(lexer, TAGTOK_EOF, lexer->current, 0);
    }

    if (peek(lexer) == '<') {
        advance(lexer);
        return scan_tag(lexer);
    }

    return scan_text(lexer);
}

const char *matchtape_tag_token_type_name(Matchtape_TagTokenType type) {
    switch (type) {
        case TAGTOK_EOF:   return "end of input";
        case TAGTOK_ERROR: return "error";
        case TAGTOK_OPEN:  return "open tag";
        case TAGTOK_CLOSE: return "close tag";
        case TAGTOK_TEXT:  return "text";
    }
    return "unknown";
}
