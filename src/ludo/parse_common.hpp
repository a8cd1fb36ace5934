#pragma once

#include <cctype>
#include <string>

namespace ludo {

// Check if a byte is an HTTP character.
inline bool isChar(int c) {
    return c >= 0 && c <= 127;
}

// Check if a byte is an HTTP control character.
inline bool isCtl(int c) {
    return (c >= 0 && c <= 31) || (c == 127);
}

// Check if a byte is defined as an HTTP tspecial character.
inline bool isTsspecial(int c) {
    switch (c) {
        case '(':
        case ')':
        case '<':
        case '>':
        case '@':
        case ',':
        case ';':
        case ':':
        case '\\':
        case '"':
        case '/':
        case '[':
        case ']':
        case '?':
        case '=':
        case '{':
        case '}':
        case ' ':
        case '\t':
            return true;
        default:
            return false;
    }
}

inline bool isDigit(int c) {
    return c >= '0' && c <= '9';
}

// Value of a hex digit, -1 for anything else.
inline int hexValue(int c) {
    if (isDigit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Case insensitive compare, used for header names and tokens.
inline bool iequals(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace ludo
