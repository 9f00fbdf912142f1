/**
 * Matchtape - Tagged Block Parser
 *
 * Builds a parse tree from lexer tokens.
 *
 * Grammar:
 *   document  = ws block ws
 *   block     = "<" name ">" content "</" name ">"
 *   content   = text | (ws block)* ws
 */

#include "tagblock_internal.h"
#include "matchtape/tagblock.h"
#include "matchtape/error.h"
#include "matchtape/validate.h"

#include <errno.h>
#include <limits.h>
#include <stdarg.h>
#include <new>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

#define MATCHTAPE_TAG_MAX_DEPTH 32

struct Matchtape_TagNode {
    std::string name;
    std::string text;
    std::vector<Matchtape_TagNode> children;
    int line = 0;
    int column = 0;
};

/* ============================================================================
 * Parser Structure
 * ============================================================================ */

typedef struct TagParser {
    Matchtape_TagLexer lexer;
    Matchtape_TagToken current;

    char error[512];
    bool has_error;
} TagParser;

static void parser_error_at(TagParser *p, const Matchtape_TagToken *token, const char *fmt, ...) {
    if (p->has_error) return;
    p->has_error = true;

    char message[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    snprintf(p->error, sizeof(p->error), "%s:%d:%d: %s",
             p->lexer.name ? p->lexer.name : "<source>",
             token->line, token->column, message);
}

static void parser_advance(TagParser *p) {
    p->current = matchtape_tag_lexer_next(&p->lexer);
    if (p->current.type == TAGTOK_ERROR && !p->has_error) {
        snprintf(p->error, sizeof(p->error), "%s", p->lexer.error);
        p->has_error = true;
    }
}

static bool is_blank(const char *start, int length) {
    for (int i = 0; i < length; i++) {
        char c = start[i];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

static void skip_blank_text(TagParser *p) {
    while (p->current.type == TAGTOK_TEXT && is_blank(p->current.start, p->current.length)) {
        parser_advance(p);
    }
}

/* Decode &lt; &gt; &amp; into out */
static bool unescape_text(TagParser *p, const Matchtape_TagToken *token, std::string &out) {
    const char *s = token->start;
    const char *end = token->start + token->length;

    while (s < end) {
        if (*s != '&') {
            out.push_back(*s++);
            continue;
        }

        size_t remaining = (size_t)(end - s);
        if (remaining >= 4 && strncmp(s, "&lt;", 4) == 0) {
            out.push_back('<');
            s += 4;
        } else if (remaining >= 4 && strncmp(s, "&gt;", 4) == 0) {
            out.push_back('>');
            s += 4;
        } else if (remaining >= 5 && strncmp(s, "&amp;", 5) == 0) {
            out.push_back('&');
            s += 5;
        } else {
            parser_error_at(p, token, "Unknown entity in text");
            return false;
        }
    }
    return true;
}

/* ============================================================================
 * Block Parsing
 * ============================================================================ */

static bool parse_block(TagParser *p, Matchtape_TagNode *node, int depth) {
    /* Current token is the OPEN tag */
    Matchtape_TagToken open = p->current;
    node->name.assign(open.start, (size_t)open.length);
    node->line = open.line;
    node->column = open.column;

    if (depth > MATCHTAPE_TAG_MAX_DEPTH) {
        parser_error_at(p, &open, "Blocks nested too deeply");
        return false;
    }

    parser_advance(p);

    std::string raw_text;
    bool has_text = false;
    Matchtape_TagToken text_token = {};

    for (;;) {
        if (p->has_error) return false;

        switch (p->current.type) {
            case TAGTOK_TEXT:
                if (!has_text && !is_blank(p->current.start, p->current.length)) {
                    text_token = p->current;
                    has_text = true;
                }
                if (!unescape_text(p, &p->current, raw_text)) return false;
                parser_advance(p);
                break;

            case TAGTOK_OPEN: {
                node->children.emplace_back();
                if (!parse_block(p, &node->children.back(), depth + 1)) return false;
                break;
            }

            case TAGTOK_CLOSE: {
                std::string close_name(p->current.start, (size_t)p->current.length);
                if (close_name != node->name) {
                    parser_error_at(p, &p->current, "Expected </%s> but found </%s>",
                                    node->name.c_str(), close_name.c_str());
                    return false;
                }
                if (!node->children.empty()) {
                    if (has_text) {
                        parser_error_at(p, &text_token, "Text mixed with child blocks in <%s>",
                                        node->name.c_str());
                        return false;
                    }
                } else {
                    node->text = raw_text;
                }
                parser_advance(p);
                return true;
            }

            case TAGTOK_EOF:
                parser_error_at(p, &open, "Unclosed <%s>", node->name.c_str());
                return false;

            case TAGTOK_ERROR:
                return false;
        }
    }
}

/* ============================================================================
 * Public API
 * ============================================================================ */

Matchtape_TagNode *matchtape_tag_parse(const char *text, size_t len, const char *source_name) {
    MATCHTAPE_VALIDATE_PTR_RET(text, NULL);

    TagParser parser;
    memset(&parser, 0, sizeof(parser));
    matchtape_tag_lexer_init(&parser.lexer, text, len, source_name);

    parser_advance(&parser);
    skip_blank_text(&parser);

    if (!parser.has_error && parser.current.type != TAGTOK_OPEN) {
        parser_error_at(&parser, &parser.current, "Expected opening block, found %s",
                        matchtape_tag_token_type_name(parser.current.type));
    }

    Matchtape_TagNode *root = NULL;
    if (!parser.has_error) {
        root = new (std::nothrow) Matchtape_TagNode();
        if (!root) {
            matchtape_set_error("tagblock: out of memory");
            return NULL;
        }
        if (parse_block(&parser, root, 0)) {
            skip_blank_text(&parser);
            if (!parser.has_error && parser.current.type != TAGTOK_EOF) {
                parser_error_at(&parser, &parser.current, "Unexpected %s after root block",
                                matchtape_tag_token_type_name(parser.current.type));
            }
        }
    }

    if (parser.has_error) {
        delete root;
        matchtape_set_error("%s", parser.error);
        return NULL;
    }

    return root;
}

void matchtape_tag_node_destroy(Matchtape_TagNode *node) {
    delete node;
}

const char *matchtape_tag_node_name(const Matchtape_TagNode *node) {
    return node ? node->name.c_str() : "";
}

const char *matchtape_tag_node_text(const Matchtape_TagNode *node) {
    return node ? node->text.c_str() : "";
}

int matchtape_tag_node_line(const Matchtape_TagNode *node) {
    return node ? node->line : 0;
}

size_t matchtape_tag_node_child_count(const Matchtape_TagNode *node) {
    return node ? node->children.size() : 0;
}

const Matchtape_TagNode *matchtape_tag_node_child(const Matchtape_TagNode *node, size_t index) {
    if (!node || index >= node->children.size()) return NULL;
    return &node->children[index];
}

const Matchtape_TagNode *matchtape_tag_node_find(const Matchtape_TagNode *node, const char *name) {
    if (!node || !name) return NULL;
    for (const Matchtape_TagNode &child : node->children) {
        if (child.name == name) return &child;
    }
    return NULL;
}

/* ============================================================================
 * Typed Accessors
 * ============================================================================ */

static const Matchtape_TagNode *require_leaf(const Matchtape_TagNode *node, const char *name) {
    if (!node || !name) {
        matchtape_set_error("tagblock: null node or name");
        return NULL;
    }
    const Matchtape_TagNode *child = matchtape_tag_node_find(node, name);
    if (!child) {
        matchtape_set_error("tagblock: line %d: <%s> is missing <%s>",
                            node->line, node->name.c_str(), name);
        return NULL;
    }
    if (!child->children.empty()) {
        matchtape_set_error("tagblock: line %d: <%s> must hold a value", child->line, name);
        return NULL;
    }
    return child;
}

static bool parse_long(const Matchtape_TagNode *leaf, long long min, long long max, long long *out) {
    const char *s = leaf->text.c_str();
    char *end = NULL;
    errno = 0;
    long long value = strtoll(s, &end, 10);
    if (s[0] == '\0' || *end != '\0' || errno == ERANGE || value < min || value > max) {
        matchtape_set_error("tagblock: line %d: <%s> expects an integer in [%lld, %lld], got '%s'",
                            leaf->line, leaf->name.c_str(), min, max, s);
        return false;
    }
    *out = value;
    return true;
}

bool matchtape_tag_get_int(const Matchtape_TagNode *node, const char *name, int *out) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    long long value;
    if (!leaf || !parse_long(leaf, INT_MIN, INT_MAX, &value)) return false;
    *out = (int)value;
    return true;
}

bool matchtape_tag_get_u16(const Matchtape_TagNode *node, const char *name, uint16_t *out) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    long long value;
    if (!leaf || !parse_long(leaf, 0, UINT16_MAX, &value)) return false;
    *out = (uint16_t)value;
    return true;
}

bool matchtape_tag_get_u32(const Matchtape_TagNode *node, const char *name, uint32_t *out) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    long long value;
    if (!leaf || !parse_long(leaf, 0, UINT32_MAX, &value)) return false;
    *out = (uint32_t)value;
    return true;
}

static bool parse_float_text(const char *s, float *out) {
    char *end = NULL;
    float value = strtof(s, &end);
    if (s[0] == '\0' || *end != '\0') return false;
    *out = value;
    return true;
}

bool matchtape_tag_get_float(const Matchtape_TagNode *node, const char *name, float *out) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    if (!leaf) return false;
    if (!parse_float_text(leaf->text.c_str(), out)) {
        matchtape_set_error("tagblock: line %d: <%s> expects a number, got '%s'",
                            leaf->line, name, leaf->text.c_str());
        return false;
    }
    return true;
}

bool matchtape_tag_get_vec2(const Matchtape_TagNode *node, const char *name, Matchtape_Vec2 *out) {
    MATCHTAPE_VALIDATE_PTR_RET(out, false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    if (!leaf) return false;

    const std::string &text = leaf->text;
    size_t comma = text.find(',');
    Matchtape_Vec2 value = {0.0f, 0.0f};
    if (comma == std::string::npos ||
        !parse_float_text(text.substr(0, comma).c_str(), &value.x) ||
        !parse_float_text(text.substr(comma + 1).c_str(), &value.y)) {
        matchtape_set_error("tagblock: line %d: <%s> expects 'x,y', got '%s'",
                            leaf->line, name, text.c_str());
        return false;
    }
    *out = value;
    return true;
}

bool matchtape_tag_get_string(const Matchtape_TagNode *node, const char *name, char *buf, size_t size) {
    MATCHTAPE_VALIDATE_PTR_RET(buf, false);
    MATCHTAPE_VALIDATE_COND_RET(size > 0, "buffer size is zero", false);
    const Matchtape_TagNode *leaf = require_leaf(node, name);
    if (!leaf) return false;

    if (leaf->text.size() >= size) {
        matchtape_set_error("tagblock: line %d: <%s> is longer than %zu bytes",
                            leaf->line, name, size - 1);
        return false;
    }
    memcpy(buf, leaf->text.c_str(), leaf->text.size() + 1);
    return true;
}
