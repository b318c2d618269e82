#include "input.hpp"

#include <utility>

namespace {
using namespace std::literals;

constexpr std::pair<key, std::string_view> key_names[] = {
    {key::space, "space"sv}, {key::apostrophe, "apostrophe"sv}, {key::comma, "comma"sv},
    {key::minus, "minus"sv}, {key::period, "period"sv},         {key::slash, "slash"sv},
    {key::num_0, "0"sv}, {key::num_1, "1"sv}, {key::num_2, "2"sv}, {key::num_3, "3"sv}, {key::num_4, "4"sv},
    {key::num_5, "5"sv}, {key::num_6, "6"sv}, {key::num_7, "7"sv}, {key::num_8, "8"sv}, {key::num_9, "9"sv},
    {key::semicolon, "semicolon"sv}, {key::equal, "equal"sv},
    {key::a, "a"sv}, {key::b, "b"sv}, {key::c, "c"sv}, {key::d, "d"sv}, {key::e, "e"sv}, {key::f, "f"sv},
    {key::g, "g"sv}, {key::h, "h"sv}, {key::i, "i"sv}, {key::j, "j"sv}, {key::k, "k"sv}, {key::l, "l"sv},
    {key::m, "m"sv}, {key::n, "n"sv}, {key::o, "o"sv}, {key::p, "p"sv}, {key::q, "q"sv}, {key::r, "r"sv},
    {key::s, "s"sv}, {key::t, "t"sv}, {key::u, "u"sv}, {key::v, "v"sv}, {key::w, "w"sv}, {key::x, "x"sv},
    {key::y, "y"sv}, {key::z, "z"sv},
    {key::escape, "escape"sv}, {key::enter, "enter"sv}, {key::tab, "tab"sv}, {key::backspace, "backspace"sv},
    {key::insert, "insert"sv}, {key::del, "delete"sv},
    {key::right, "right"sv}, {key::left, "left"sv}, {key::down, "down"sv}, {key::up, "up"sv},
    {key::f1, "f1"sv}, {key::f2, "f2"sv}, {key::f3, "f3"sv}, {key::f4, "f4"sv}, {key::f5, "f5"sv}, {key::f6, "f6"sv},
    {key::f7, "f7"sv}, {key::f8, "f8"sv}, {key::f9, "f9"sv}, {key::f10, "f10"sv}, {key::f11, "f11"sv}, {key::f12, "f12"sv},
    {key::keypad_enter, "keypad_enter"sv},
};
}

key key_from_glfw(int code) {
    for (const auto& [k, _]: key_names) {
        if (static_cast<int>(k) == code) return k;
    }
    return key::unknown;
}

std::string_view to_string(key k) {
    for (const auto& [c, name]: key_names) {
        if (c == k) return name;
    }
    return "unknown";
}

std::string_view to_string(key_state s) {
    switch (s) {
        case key_state::pressed:  return "pressed";
        case key_state::released: return "released";
        case key_state::any:      return "any";
    }
    return "any";
}
