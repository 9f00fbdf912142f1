#include "matchtape/host.h"
#include "matchtape/error.h"
#include "matchtape/validate.h"
#include <math.h>
#include <stdarg.h>
#include <stdio.h>

static const char *key_names[MATCHTAPE_KEY_COUNT] = {
    "up",
    "down",
    "left",
    "right",
    "action1",
    "action2",
    "action3",
    "use",
    "inventory",
    "pickup",
    "jump",
    "taunts",
    "map",
    "bubbles",
    "crouch"
};

#define CHECK_CALLBACK(field) \
    do { \
        if (!host->field) { \
            matchtape_set_error("host: missing required callback '%s'", #field); \
            return false; \
        } \
    } while(0)

bool matchtape_host_validate(const Matchtape_Host *host) {
    MATCHTAPE_VALIDATE_PTR_RET(host, false);

    CHECK_CALLBACK(list_entities);
    CHECK_CALLBACK(entity_exists);
    CHECK_CALLBACK(describe_entity);
    CHECK_CALLBACK(get_position);
    CHECK_CALLBACK(get_aim);
    CHECK_CALLBACK(is_key_pressed);
    CHECK_CALLBACK(get_health);
    CHECK_CALLBACK(set_position);
    CHECK_CALLBACK(set_aim);
    CHECK_CALLBACK(set_key_pressed);
    CHECK_CALLBACK(create_entity);
    CHECK_CALLBACK(create_entity_uninitialized);
    CHECK_CALLBACK(set_team);
    CHECK_CALLBACK(set_appearance);
    CHECK_CALLBACK(init_entity);
    CHECK_CALLBACK(destroy_entity);
    CHECK_CALLBACK(list_players);
    CHECK_CALLBACK(get_player_team);
    CHECK_CALLBACK(set_player_team);
    CHECK_CALLBACK(get_time);
    CHECK_CALLBACK(get_map_name);
    CHECK_CALLBACK(load_map);

    return true;
}

#undef CHECK_CALLBACK

void matchtape_host_broadcast(const Matchtape_Host *host, const char *fmt, ...) {
    if (!host || !host->broadcast || !fmt) return;

    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    host->broadcast(host->userdata, message);
}

const char *matchtape_key_name(Matchtape_Key key) {
    if ((int)key < 0 || key >= MATCHTAPE_KEY_COUNT) return "?";
    return key_names[key];
}

float matchtape_vec2_distance(Matchtape_Vec2 a, Matchtape_Vec2 b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return sqrtf(dx * dx + dy * dy);
}
