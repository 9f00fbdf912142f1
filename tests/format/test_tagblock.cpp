/*
 * Matchtape Tagged Block Format Tests
 *
 * Tests for the block writer, the parser and the typed getters.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "matchtape/error.h"
#include "matchtape/tagblock.h"
#include <cstdlib>
#include <cstring>
#include <string>

static Matchtape_TagNode *parse(const std::string &text) {
    return matchtape_tag_parse(text.c_str(), text.size(), "test.cfg");
}

/* ============================================================================
 * Writer
 * ============================================================================ */

TEST_CASE("Writer layout", "[tagblock][writer]") {
    Matchtape_TagWriter *w = matchtape_tag_writer_create();
    REQUIRE(w != nullptr);

    SECTION("Nested blocks are indented two spaces per level") {
        REQUIRE(matchtape_tag_open(w, "outer"));
        REQUIRE(matchtape_tag_write_int(w, "version", 1));
        REQUIRE(matchtape_tag_open(w, "inner"));
        REQUIRE(matchtape_tag_write_string(w, "name", "knight"));
        REQUIRE(matchtape_tag_close(w, "inner"));
        REQUIRE(matchtape_tag_close(w, "outer"));

        size_t len = 0;
        char *text = matchtape_tag_writer_finish(w, &len);
        REQUIRE(text != nullptr);
        REQUIRE(std::string(text) ==
                "<outer>\n"
                "  <version>1</version>\n"
                "  <inner>\n"
                "    <name>knight</name>\n"
                "  </inner>\n"
                "</outer>\n");
        REQUIRE(len == strlen(text));
        free(text);
    }

    SECTION("Empty blocks stay on one line") {
        REQUIRE(matchtape_tag_open(w, "recording"));
        REQUIRE(matchtape_tag_open(w, "tick"));
        REQUIRE(matchtape_tag_close(w, "tick"));
        REQUIRE(matchtape_tag_close(w, "recording"));

        char *text = matchtape_tag_writer_finish(w, nullptr);
        REQUIRE(std::string(text) == "<recording>\n  <tick></tick>\n</recording>\n");
        free(text);
    }

    SECTION("Markup characters are escaped") {
        REQUIRE(matchtape_tag_open(w, "p"));
        REQUIRE(matchtape_tag_write_string(w, "name", "<Tom & Jerry>"));
        REQUIRE(matchtape_tag_close(w, "p"));

        char *text = matchtape_tag_writer_finish(w, nullptr);
        REQUIRE(strstr(text, "<name>&lt;Tom &amp; Jerry&gt;</name>") != nullptr);
        free(text);
    }

    SECTION("Floats keep nine significant digits") {
        REQUIRE(matchtape_tag_open(w, "p"));
        REQUIRE(matchtape_tag_write_float(w, "health", 0.1f));
        REQUIRE(matchtape_tag_write_vec2(w, "position", Matchtape_Vec2{10.5f, -3.0f}));
        REQUIRE(matchtape_tag_close(w, "p"));

        char *text = matchtape_tag_writer_finish(w, nullptr);
        REQUIRE(strstr(text, "<health>0.100000001</health>") != nullptr);
        REQUIRE(strstr(text, "<position>10.5,-3</position>") != nullptr);
        free(text);
    }

    SECTION("Mismatched close fails the writer") {
        REQUIRE(matchtape_tag_open(w, "a"));
        REQUIRE(matchtape_tag_open(w, "b"));
        REQUIRE_FALSE(matchtape_tag_close(w, "a"));
        REQUIRE(strstr(matchtape_get_last_error(), "<b>") != nullptr);
        REQUIRE_FALSE(matchtape_tag_write_int(w, "x", 1));
        REQUIRE(matchtape_tag_writer_finish(w, nullptr) == nullptr);
    }

    SECTION("Finish with open blocks fails") {
        REQUIRE(matchtape_tag_open(w, "a"));
        REQUIRE(matchtape_tag_writer_depth(w) == 1);
        REQUIRE(matchtape_tag_writer_finish(w, nullptr) == nullptr);
        REQUIRE(strstr(matchtape_get_last_error(), "still open") != nullptr);
    }

    SECTION("Invalid tag names are rejected") {
        REQUIRE_FALSE(matchtape_tag_open(w, "bad name"));
        REQUIRE_FALSE(matchtape_tag_open(w, ""));
    }

    matchtape_tag_writer_destroy(w);
}

/* ============================================================================
 * Parser
 * ============================================================================ */

TEST_CASE("Parse tree structure", "[tagblock][parser]") {
    Matchtape_TagNode *root = parse(
        "\n<match>\n"
        "  <mapname>Fort &amp; Field</mapname>\n"
        "  <list>\n"
        "    <item>1</item>\n"
        "    <item>2</item>\n"
        "  </list>\n"
        "  <empty></empty>\n"
        "</match>\n\n");
    REQUIRE(root != nullptr);

    REQUIRE(strcmp(matchtape_tag_node_name(root), "match") == 0);
    REQUIRE(matchtape_tag_node_child_count(root) == 3);
    REQUIRE(matchtape_tag_node_line(root) == 2);

    const Matchtape_TagNode *map = matchtape_tag_node_find(root, "mapname");
    REQUIRE(map != nullptr);
    REQUIRE(strcmp(matchtape_tag_node_text(map), "Fort & Field") == 0);

    const Matchtape_TagNode *list = matchtape_tag_node_find(root, "list");
    REQUIRE(matchtape_tag_node_child_count(list) == 2);
    REQUIRE(strcmp(matchtape_tag_node_text(matchtape_tag_node_child(list, 1)), "2") == 0);
    REQUIRE(matchtape_tag_node_child(list, 2) == nullptr);

    const Matchtape_TagNode *empty = matchtape_tag_node_find(root, "empty");
    REQUIRE(matchtape_tag_node_child_count(empty) == 0);
    REQUIRE(strcmp(matchtape_tag_node_text(empty), "") == 0);

    REQUIRE(matchtape_tag_node_find(root, "absent") == nullptr);

    matchtape_tag_node_destroy(root);
}

TEST_CASE("Parse errors carry a location", "[tagblock][parser][errors]") {
    matchtape_clear_error();

    SECTION("Mismatched close") {
        REQUIRE(parse("<a>\n  <b>1</c>\n</a>") == nullptr);
        std::string err = matchtape_get_last_error();
        REQUIRE(err.find("test.cfg:2:") == 0);
        REQUIRE(err.find("</b>") != std::string::npos);
    }

    SECTION("Unclosed block") {
        REQUIRE(parse("<a><b>1</b>") == nullptr);
        REQUIRE(std::string(matchtape_get_last_error()).find("Unclosed <a>") != std::string::npos);
    }

    SECTION("Text beside child blocks") {
        REQUIRE(parse("<a>stray<b>1</b></a>") == nullptr);
        REQUIRE(std::string(matchtape_get_last_error()).find("Text mixed") != std::string::npos);
    }

    SECTION("Unknown entity") {
        REQUIRE(parse("<a>&quot;</a>") == nullptr);
    }

    SECTION("Unescaped '>'") {
        REQUIRE(parse("<a>1 > 0</a>") == nullptr);
    }

    SECTION("Trailing content after root") {
        REQUIRE(parse("<a>1</a><b>2</b>") == nullptr);
    }

    SECTION("No root block") {
        REQUIRE(parse("just text") == nullptr);
        REQUIRE(parse("") == nullptr);
    }

    SECTION("Excessive nesting") {
        std::string deep;
        for (int i = 0; i < 64; i++) deep += "<n>";
        for (int i = 0; i < 64; i++) deep += "</n>";
        REQUIRE(parse(deep) == nullptr);
    }

    matchtape_clear_error();
}

/* ============================================================================
 * Typed Getters
 * ============================================================================ */

TEST_CASE("Typed getters", "[tagblock][getters]") {
    Matchtape_TagNode *root = parse(
        "<d>"
        "<i>-42</i><u16>65535</u16><big>70000</big><u32>4000000000</u32>"
        "<f>2.5</f><v>1.5,-2</v><bad>abc</bad><s>hello</s><block><x>1</x></block>"
        "</d>");
    REQUIRE(root != nullptr);

    int i = 0;
    uint16_t u16 = 0;
    uint32_t u32 = 0;
    float f = 0.0f;
    Matchtape_Vec2 v = {0.0f, 0.0f};
    char s[8];

    REQUIRE(matchtape_tag_get_int(root, "i", &i));
    REQUIRE(i == -42);

    REQUIRE(matchtape_tag_get_u16(root, "u16", &u16));
    REQUIRE(u16 == 65535);
    REQUIRE_FALSE(matchtape_tag_get_u16(root, "big", &u16));
    REQUIRE_FALSE(matchtape_tag_get_u16(root, "i", &u16));

    REQUIRE(matchtape_tag_get_u32(root, "u32", &u32));
    REQUIRE(u32 == 4000000000u);

    REQUIRE(matchtape_tag_get_float(root, "f", &f));
    REQUIRE(f == Catch::Approx(2.5f));
    REQUIRE_FALSE(matchtape_tag_get_float(root, "bad", &f));

    REQUIRE(matchtape_tag_get_vec2(root, "v", &v));
    REQUIRE(v.x == Catch::Approx(1.5f));
    REQUIRE(v.y == Catch::Approx(-2.0f));
    REQUIRE_FALSE(matchtape_tag_get_vec2(root, "f", &v));

    REQUIRE(matchtape_tag_get_string(root, "s", s, sizeof(s)));
    REQUIRE(strcmp(s, "hello") == 0);
    char tiny[3];
    REQUIRE_FALSE(matchtape_tag_get_string(root, "s", tiny, sizeof(tiny)));

    REQUIRE_FALSE(matchtape_tag_get_int(root, "missing", &i));
    REQUIRE(strstr(matchtape_get_last_error(), "missing") != nullptr);
    REQUIRE_FALSE(matchtape_tag_get_int(root, "block", &i));

    matchtape_tag_node_destroy(root);
    matchtape_clear_error();
}
