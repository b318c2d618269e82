#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils.hpp"

// Key codes follow GLFW's layout so host events convert without a table.
enum class key: int {
    unknown   = -1,
    space     = 32,
    apostrophe = 39,
    comma     = 44,
    minus     = 45,
    period    = 46,
    slash     = 47,
    num_0 = 48, num_1, num_2, num_3, num_4, num_5, num_6, num_7, num_8, num_9,
    semicolon = 59,
    equal     = 61,
    a = 65, b, c, d, e, f, g, h, i, j, k, l, m, n, o, p, q, r, s, t, u, v, w, x, y, z,
    escape    = 256,
    enter     = 257,
    tab       = 258,
    backspace = 259,
    insert    = 260,
    del       = 261,
    right     = 262,
    left      = 263,
    down      = 264,
    up        = 265,
    f1 = 290, f2, f3, f4, f5, f6, f7, f8, f9, f10, f11, f12,
    keypad_enter = 335,
};

// Match predicate for trial loops; events only ever carry pressed or released.
enum class key_state { pressed, released, any };

struct key_event {
    key code = key::unknown;
    key_state state = key_state::pressed;
    timer::time_point timestamp = timer::now();
};

inline bool matches(key_state predicate, key_state observed) {
    return predicate == key_state::any || predicate == observed;
}

key key_from_glfw(int code);
std::string_view to_string(key);
std::string_view to_string(key_state);

template <> struct fmt::formatter<key>: fmt::formatter<std::string_view> {
    template <typename Ctx> auto format(key k, Ctx& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(k), ctx);
    }
};

template <> struct fmt::formatter<key_state>: fmt::formatter<std::string_view> {
    template <typename Ctx> auto format(key_state s, Ctx& ctx) const {
        return fmt::formatter<std::string_view>::format(to_string(s), ctx);
    }
};
