/**
 * Matchtape - Tagged Block Writer
 *
 * Emits nested blocks with two-space indentation. Leaves and empty
 * containers are written on a single line.
 */

#include "tagblock_internal.h"
#include "matchtape/tagblock.h"
#include "matchtape/error.h"
#include "matchtape/validate.h"

#include <new>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <inttypes.h>
#include <string>
#include <vector>

/* ============================================================================
 * Writer
 * ============================================================================ */

struct OpenBlock {
    std::string name;
    bool has_children;
};

struct Matchtape_TagWriter {
    std::string out;
    std::vector<OpenBlock> stack;
    bool failed = false;
};

static bool is_valid_name(const char *name) {
    if (!name || !*name) return false;
    for (const char *p = name; *p; p++) {
        if (!matchtape_tag_is_name_char(*p)) return false;
    }
    return true;
}

static bool writer_fail(Matchtape_TagWriter *writer, const char *fmt, const char *arg) {
    writer->failed = true;
    matchtape_set_error(fmt, arg);
    return false;
}

/* Starts a new line for a child of the innermost open block */
static void begin_child(Matchtape_TagWriter *writer) {
    if (!writer->stack.empty()) {
        OpenBlock &parent = writer->stack.back();
        if (!parent.has_children) {
            parent.has_children = true;
            writer->out += '\n';
        }
    }
    writer->out.append(writer->stack.size() * 2, ' ');
}

static void append_escaped(std::string &out, const char *str) {
    for (const char *p = str; *p; p++) {
        switch (*p) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default:  out += *p; break;
        }
    }
}

/* Leaf helper: value is already formatted, escaping happens here */
static bool write_leaf(Matchtape_TagWriter *writer, const char *name, const char *value) {
    if (writer->failed) return false;
    if (!is_valid_name(name)) {
        return writer_fail(writer, "tagblock: invalid tag name '%s'", name ? name : "(null)");
    }

    begin_child(writer);
    writer->out += '<';
    writer->out += name;
    writer->out += '>';
    append_escaped(writer->out, value);
    writer->out += "</";
    writer->out += name;
    writer->out += ">\n";
    return true;
}

Matchtape_TagWriter *matchtape_tag_writer_create(void) {
    Matchtape_TagWriter *writer = new (std::nothrow) Matchtape_TagWriter();
    if (!writer) {
        matchtape_set_error("tagblock: out of memory");
        return NULL;
    }
    writer->out.reserve(4096);
    return writer;
}

void matchtape_tag_writer_destroy(Matchtape_TagWriter *writer) {
    delete writer;
}

bool matchtape_tag_open(Matchtape_TagWriter *writer, const char *name) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    if (writer->failed) return false;
    if (!is_valid_name(name)) {
        return writer_fail(writer, "tagblock: invalid tag name '%s'", name ? name : "(null)");
    }

    begin_child(writer);
    writer->out += '<';
    writer->out += name;
    writer->out += '>';
    writer->stack.push_back(OpenBlock{name, false});
    return true;
}

bool matchtape_tag_close(Matchtape_TagWriter *writer, const char *name) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    if (writer->failed) return false;
    if (writer->stack.empty()) {
        return writer_fail(writer, "tagblock: close of <%s> with no open block", name ? name : "(null)");
    }

    OpenBlock top = writer->stack.back();
    if (!name || top.name != name) {
        return writer_fail(writer, "tagblock: expected to close <%s>", top.name.c_str());
    }
    writer->stack.pop_back();

    if (top.has_children) {
        writer->out.append(writer->stack.size() * 2, ' ');
    }
    writer->out += "</";
    writer->out += top.name;
    writer->out += ">\n";
    return true;
}

bool matchtape_tag_write_int(Matchtape_TagWriter *writer, const char *name, int64_t value) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    char buf[32];
    snprintf(buf, sizeof(buf), "%" PRId64, value);
    return write_leaf(writer, name, buf);
}

bool matchtape_tag_write_uint(Matchtape_TagWriter *writer, const char *name, uint64_t value) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    char buf[32];
    snprintf(buf, sizeof(buf), "%" PRIu64, value);
    return write_leaf(writer, name, buf);
}

bool matchtape_tag_write_float(Matchtape_TagWriter *writer, const char *name, float value) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    char buf[48];
    snprintf(buf, sizeof(buf), "%.9g", (double)value);
    return write_leaf(writer, name, buf);
}

bool matchtape_tag_write_vec2(Matchtape_TagWriter *writer, const char *name, Matchtape_Vec2 value) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    char buf[96];
    snprintf(buf, sizeof(buf), "%.9g,%.9g", (double)value.x, (double)value.y);
    return write_leaf(writer, name, buf);
}

bool matchtape_tag_write_string(Matchtape_TagWriter *writer, const char *name, const char *value) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, false);
    return write_leaf(writer, name, value ? value : "");
}

int matchtape_tag_writer_depth(const Matchtape_TagWriter *writer) {
    return writer ? (int)writer->stack.size() : 0;
}

char *matchtape_tag_writer_finish(Matchtape_TagWriter *writer, size_t *out_len) {
    MATCHTAPE_VALIDATE_PTR_RET(writer, NULL);

    if (writer->failed) {
        matchtape_set_error("tagblock: writer is in a failed state");
        return NULL;
    }
    if (!writer->stack.empty()) {
        matchtape_set_error("tagblock: <%s> is still open", writer->stack.back().name.c_str());
        return NULL;
    }

    /* Callers release the text with free() */
    char *text = (char *)malloc(writer->out.size() + 1);
    if (!text) {
        matchtape_set_error("tagblock: out of memory");
        return NULL;
    }
    memcpy(text, writer->out.data(), writer->out.size());
    text[writer->out.size()] = '\0';
    if (out_len) *out_len = writer->out.size();
    writer->out.clear();
    return text;
}
