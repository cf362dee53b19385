#include <scan.hpp>
#include <cstring>


const std::vector<const char*>& denyList() {
    static const std::vector<const char*> list = {
        // host-environment and reflection names pattern authors tend to reach for
        "process", "require", "eval", "Function", "constructor", "__proto__", "prototype", "import", "global", "globalThis",
        // Lua: host environment
        "os", "io", "debug", "jit", "ffi",
        // Lua: module loading
        "package", "module",
        // Lua: dynamic code evaluation
        "load", "loadstring", "loadfile", "dofile",
        // Lua: the global table and ways to reach it or rewire it
        "_G", "_ENV", "getfenv", "setfenv", "getmetatable", "setmetatable", "rawget", "rawset", "rawequal", "newproxy", "collectgarbage"
    };
    return list;
}

bool isIdentifierChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

static bool isPropertyAccess(const std::string& script, size_t tokenStart) { // is the token directly preceded by `.` or `:`?
    if (tokenStart == 0) {
        return false;
    }
    char before = script[tokenStart - 1];
    if (before == ':') {
        return true;
    }
    if (before != '.') {
        return false;
    }
    return tokenStart < 2 || script[tokenStart - 2] != '.'; // `..` is concatenation, not a field access
}

const char* deniedToken(const std::string& script) {
    size_t i = 0;
    while (i < script.size()) {
        if (!isIdentifierChar(script[i])) {
            i ++;
            continue;
        }
        size_t start = i;
        while (i < script.size() && isIdentifierChar(script[i])) {
            i ++;
        }
        if (isPropertyAccess(script, start)) {
            continue;
        }
        size_t len = i - start;
        for (const char* word : denyList()) {
            if (strlen(word) == len && script.compare(start, len, word) == 0) {
                return word;
            }
        }
    }
    return NULL;
}
