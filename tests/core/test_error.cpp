/*
 * Matchtape Error Handling Tests
 *
 * Tests for the thread-local error buffer.
 */

#include <catch2/catch_test_macros.hpp>
#include "matchtape/error.h"
#include "matchtape/log.h"
#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

/* ============================================================================
 * Basic Error Operations
 * ============================================================================ */

TEST_CASE("Error set and get", "[error][basic]") {
    matchtape_clear_error();

    SECTION("Initial state has no error") {
        REQUIRE_FALSE(matchtape_has_error());
        REQUIRE(strlen(matchtape_get_last_error()) == 0);
    }

    SECTION("Set formatted error") {
        matchtape_set_error("recording: line %d: %s", 42, "duplicate meta");
        REQUIRE(matchtape_has_error());
        REQUIRE(strcmp(matchtape_get_last_error(), "recording: line 42: duplicate meta") == 0);
    }

    SECTION("Clear error") {
        matchtape_set_error("An error occurred");
        matchtape_clear_error();
        REQUIRE_FALSE(matchtape_has_error());
    }

    SECTION("Overwrite existing error") {
        matchtape_set_error("First error");
        matchtape_set_error("Second error");
        REQUIRE(strcmp(matchtape_get_last_error(), "Second error") == 0);
    }

    SECTION("NULL format clears") {
        matchtape_set_error("something");
        matchtape_set_error(nullptr);
        REQUIRE_FALSE(matchtape_has_error());
    }

    matchtape_clear_error();
}

TEST_CASE("Error buffer truncates long messages", "[error][edge]") {
    std::string longtext(4000, 'x');
    matchtape_set_error("%s", longtext.c_str());

    size_t len = strlen(matchtape_get_last_error());
    REQUIRE(len > 0);
    REQUIRE(len < longtext.size());

    matchtape_clear_error();
}

TEST_CASE("Error context", "[error][context]") {
    matchtape_clear_error();

    SECTION("Prefix wraps the current cause") {
        matchtape_set_error("storage: unsafe file name '%s'", "../x");
        matchtape_prefix_error("Cannot load %s", "recording");
        REQUIRE(std::string(matchtape_get_last_error()) ==
                "Cannot load recording: storage: unsafe file name '../x'");
    }

    SECTION("Prefix without a cause stands alone") {
        matchtape_prefix_error("Cannot replay");
        REQUIRE(std::string(matchtape_get_last_error()) == "Cannot replay");
    }

    SECTION("Errno reason is appended") {
        errno = ENOENT;
        matchtape_set_error_from_errno("storage: cannot open %s", "a.cfg");
        std::string expected = std::string("storage: cannot open a.cfg: ") + strerror(ENOENT);
        REQUIRE(std::string(matchtape_get_last_error()) == expected);
    }

    matchtape_clear_error();
}

TEST_CASE("Error buffer is per thread", "[error][thread]") {
    matchtape_set_error("main thread error");

    std::string seen_in_worker = "unset";
    std::thread worker([&seen_in_worker]() {
        seen_in_worker = matchtape_get_last_error();
        matchtape_set_error("worker error");
    });
    worker.join();

    REQUIRE(seen_in_worker.empty());
    REQUIRE(strcmp(matchtape_get_last_error(), "main thread error") == 0);

    matchtape_clear_error();
}

/* ============================================================================
 * Logging Integration
 * ============================================================================ */

static void capture_log(Matchtape_LogLevel level, const char *subsystem, const char *message,
                        void *userdata) {
    (void)subsystem;
    if (level == MATCHTAPE_LOG_LEVEL_ERROR) {
        static_cast<std::vector<std::string> *>(userdata)->push_back(message);
    }
}

TEST_CASE("Log and clear error", "[error][log]") {
    std::vector<std::string> errors;
    matchtape_log_set_console_output(false);
    uint32_t handle = matchtape_log_add_callback(capture_log, &errors);
    REQUIRE(handle != 0);

    SECTION("Pending error is logged and cleared") {
        matchtape_set_error("storage: disk full");
        matchtape_log_and_clear_error(MATCHTAPE_LOG_STORAGE);

        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0] == "storage: disk full");
        REQUIRE_FALSE(matchtape_has_error());
    }

    SECTION("Nothing is logged without an error") {
        matchtape_clear_error();
        matchtape_log_and_clear_error(MATCHTAPE_LOG_STORAGE);
        REQUIRE(errors.empty());
    }

    matchtape_log_remove_callback(handle);
    matchtape_log_set_console_output(true);
}
