#include <sandbox.hpp>
#include <scan.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>


static const char* safeGlobals[] = { // the only base library functions a pattern gets
    "assert", "error", "ipairs", "next", "pairs", "select", "tonumber", "tostring", "type", "unpack",
    NULL
};

static const char* stringExcluded[] = {
    "dump", // turns functions into bytecode
    "rep", // one call can allocate gigabytes
    "match", // Lua patterns backtrack inside C, out of the deadline hook's reach. find is swapped for plainFind
    "gmatch",
    "gsub",
    NULL
};

static const char* nothingExcluded[] = { NULL };


static int setupState(lua_State* L) { // runs under lua_cpcall, so running out of memory here is an error, not a panic
    SandboxExecutor* self = (SandboxExecutor*)lua_touserdata(L, 1);
    lua_CFunction openers[] = { luaopen_base, luaopen_string, luaopen_table, luaopen_math };
    const char* names[] = { "", LUA_STRLIBNAME, LUA_TABLIBNAME, LUA_MATHLIBNAME };
    for (size_t i = 0; i < 4; i ++) { // io, os, package, debug, jit and ffi are never opened
        lua_pushcfunction(L, openers[i]);
        lua_pushstring(L, names[i]);
        lua_call(L, 1, 0);
    }
    lua_getglobal(L, LUA_STRLIBNAME); // ("x"):rep() goes through the string metatable to the real library, so trim that too
    for (size_t i = 0; stringExcluded[i] != NULL; i ++) {
        lua_pushnil(L);
        lua_setfield(L, -2, stringExcluded[i]);
    }
    lua_pushcfunction(L, SandboxExecutor::plainFind);
    lua_setfield(L, -2, "find");
    lua_pop(L, 1);
    lua_pushlightuserdata(L, self);
    lua_setfield(L, LUA_REGISTRYINDEX, SANDBOX_REGISTRY_KEY);
    return 0;
}


SandboxExecutor::SandboxExecutor(SandboxConfig c) : config(c) {
    lua = lua_newstate(limitedAlloc, this); // LuaJIT only accepts a custom allocator in GC64 builds
    if (lua == NULL) {
        printf(ERROR "Couldn't create a Lua state for the sandbox! (a memory-capped state needs a GC64 LuaJIT)\n");
        return;
    }
    luaJIT_setmode(lua, 0, LUAJIT_MODE_ENGINE | LUAJIT_MODE_OFF); // compiled traces skip count hooks, and the deadline lives in a hook
    if (lua_cpcall(lua, setupState, this) != 0) {
        const char* message = lua_tostring(lua, -1);
        printf(ERROR "Couldn't set up the sandbox: %s\n", message != NULL ? message : "unknown error");
        lua_close(lua);
        lua = NULL;
    }
}

SandboxExecutor::~SandboxExecutor() {
    if (lua != NULL) {
        lua_close(lua);
    }
}

void SandboxExecutor::copyLibrary(const char* name, const char** excluded) { // env[name] = shallow copy of the real library, minus excluded
    lua_createtable(lua, 0, 16);
    lua_getglobal(lua, name);
    if (lua_istable(lua, -1)) {
        lua_pushnil(lua);
        while (lua_next(lua, -2) != 0) { // [env copy lib key value]
            bool skip = lua_type(lua, -2) != LUA_TSTRING;
            for (size_t i = 0; !skip && excluded[i] != NULL; i ++) {
                skip = strcmp(lua_tostring(lua, -2), excluded[i]) == 0;
            }
            if (skip) {
                lua_pop(lua, 1);
                continue;
            }
            lua_pushvalue(lua, -2);
            lua_insert(lua, -2); // [env copy lib key key value]
            lua_rawset(lua, -5);
        }
    }
    lua_pop(lua, 1); // the real library
    lua_setfield(lua, -2, name);
}

void SandboxExecutor::buildEnvironment(GuardedView& context) {
    lua_createtable(lua, 0, 24);
    for (size_t i = 0; safeGlobals[i] != NULL; i ++) {
        lua_getglobal(lua, safeGlobals[i]);
        lua_setfield(lua, -2, safeGlobals[i]);
    }
    copyLibrary(LUA_STRLIBNAME, stringExcluded); // copies, so one pattern can't rewire the next one's library
    copyLibrary(LUA_TABLIBNAME, nothingExcluded);
    copyLibrary(LUA_MATHLIBNAME, nothingExcluded);
    lua_pushcfunction(lua, GuardProxy::luaKeys);
    lua_setfield(lua, -2, "keys");
    lua_pushcfunction(lua, luaLog);
    lua_pushvalue(lua, -1);
    lua_setfield(lua, -3, "log");
    lua_setfield(lua, -2, "print");
    context.push();
    lua_pushvalue(lua, -1);
    lua_setfield(lua, -3, "context");
    lua_setfield(lua, -2, "chart");
}

SandboxExecutor* SandboxExecutor::fromState(lua_State* L) {
    lua_getfield(L, LUA_REGISTRYINDEX, SANDBOX_REGISTRY_KEY);
    SandboxExecutor* self = (SandboxExecutor*)lua_touserdata(L, -1);
    lua_pop(L, 1);
    return self;
}

bool SandboxExecutor::pastDeadline() {
    if (std::chrono::steady_clock::now() > deadline) {
        timedOut = true;
        return true;
    }
    return false;
}

void* SandboxExecutor::limitedAlloc(void* ud, void* ptr, size_t osize, size_t nsize) {
    SandboxExecutor* self = (SandboxExecutor*)ud;
    size_t old = ptr == NULL ? 0 : osize;
    if (nsize == 0) {
        free(ptr);
        self -> memoryUsed -= old;
        return NULL;
    }
    if (nsize > old) { // shrinking always succeeds; growing has to fit
        if (self -> memoryUsed - old + nsize > self -> config.memoryLimit) {
            return NULL; // lua raises "not enough memory"
        }
        if (self -> running && self -> pastDeadline()) { // catches allocating loops inside a single C call
            return NULL;
        }
    }
    void* block = realloc(ptr, nsize);
    if (block == NULL) {
        return NULL;
    }
    self -> memoryUsed = self -> memoryUsed - old + nsize;
    return block;
}

void SandboxExecutor::deadlineHook(lua_State* L, lua_Debug* ar) {
    SandboxExecutor* self = fromState(L);
    if (self != NULL && self -> pastDeadline()) { // keeps firing on every later check too, so the script can't shrug it off
        luaL_error(L, "pattern exceeded its %d ms budget", self -> config.timeoutMs);
    }
}

int SandboxExecutor::plainFind(lua_State* L) {
    size_t len;
    size_t needleLen;
    const char* haystack = luaL_checklstring(L, 1, &len);
    const char* needle = luaL_checklstring(L, 2, &needleLen);
    lua_Integer init = luaL_optinteger(L, 3, 1);
    if (init < 0) {
        init += (lua_Integer)len + 1;
    }
    if (init < 1) {
        init = 1;
    }
    if ((size_t)init > len + 1) {
        lua_pushnil(L);
        return 1;
    }
    const char* start = haystack + init - 1;
    const void* hit = needleLen == 0 ? start : memmem(start, len - (size_t)(init - 1), needle, needleLen); // two-way search: linear time
    if (hit == NULL) {
        lua_pushnil(L);
        return 1;
    }
    size_t at = (const char*)hit - haystack;
    lua_pushinteger(L, (lua_Integer)at + 1);
    lua_pushinteger(L, (lua_Integer)(at + needleLen));
    return 2;
}

int SandboxExecutor::protectedRun(lua_State* L) { // [executor, context, chunk]: build the environment and call the chunk
    SandboxExecutor* self = (SandboxExecutor*)lua_touserdata(L, 1);
    GuardedView* context = (GuardedView*)lua_touserdata(L, 2);
    self -> buildEnvironment(*context);
    lua_setfenv(L, 3);
    lua_pushvalue(L, 3);
    lua_call(L, 0, 1);
    return 1;
}

int SandboxExecutor::luaLog(lua_State* L) { // log(...) inside scripts. silent unless scriptLog is on
    SandboxExecutor* self = fromState(L);
    if (self == NULL || !self -> config.scriptLog) {
        return 0;
    }
    std::string line;
    int count = lua_gettop(L);
    for (int i = 1; i <= count && line.size() < LOG_LINE_LIMIT; i ++) {
        if (i > 1) {
            line += ' ';
        }
        switch (lua_type(L, i)) {
            case LUA_TSTRING: {
                size_t len;
                const char* data = lua_tolstring(L, i, &len);
                line.append(data, len);
                break;
            }
            case LUA_TNUMBER: {
                char number[32];
                snprintf(number, sizeof(number), "%.14g", (double)lua_tonumber(L, i));
                line += number;
                break;
            }
            case LUA_TBOOLEAN:
                line += lua_toboolean(L, i) ? "true" : "false";
                break;
            default: // no __tostring calls from in here
                line += luaL_typename(L, i);
                break;
        }
    }
    if (line.size() > LOG_LINE_LIMIT) {
        line.resize(LOG_LINE_LIMIT);
    }
    for (char& c : line) {
        if (c >= 0 && c < 0x20) { // keep script output from driving the terminal
            c = '?';
        }
    }
    printf(SANDBOX "%s says: %s\n", self -> label.c_str(), line.c_str());
    return 0;
}

SandboxExecutor::Outcome SandboxExecutor::run(const std::string& script, GuardedView& context, std::string& diagnostic, std::string name) {
    diagnostic.clear();
    label = name;
    if (lua == NULL) {
        diagnostic = "no interpreter";
        return Threw;
    }
    if (context.lua != lua) {
        diagnostic = "context was wrapped for a different sandbox";
        return Rejected;
    }
    if (config.staticScan) {
        const char* token = deniedToken(script);
        if (token != NULL) {
            diagnostic = (std::string)"forbidden identifier '" + token + "'";
            return Rejected;
        }
    }

    int top = lua_gettop(lua);
    lua_pushcfunction(lua, protectedRun);
    lua_pushlightuserdata(lua, this);
    lua_pushlightuserdata(lua, &context);
    if (luaL_loadbufferx(lua, script.c_str(), script.size(), "=pattern", "t") != 0) { // "t": source text only, never bytecode
        const char* message = lua_tostring(lua, -1);
        diagnostic = message != NULL ? message : "couldn't load script";
        lua_settop(lua, top);
        return Threw;
    }

    timedOut = false;
    deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.timeoutMs);
    running = true;
    lua_sethook(lua, deadlineHook, LUA_MASKCOUNT, config.hookInterval);
    int status = lua_pcall(lua, 3, 1, 0);
    lua_sethook(lua, NULL, 0, 0);
    running = false;

    Outcome outcome;
    if (status != 0) {
        outcome = timedOut ? TimedOut : Threw;
        const char* message = lua_tostring(lua, -1);
        diagnostic = message != NULL ? message : "error object is not a string";
        if (status == LUA_ERRMEM) { // either the cap, or the allocator refusing to grow past the deadline
            diagnostic = timedOut ? "pattern exceeded its " + std::to_string(config.timeoutMs) + " ms budget"
                : "memory limit of " + std::to_string(config.memoryLimit) + " bytes reached";
        }
    }
    else if (lua_type(lua, -1) == LUA_TBOOLEAN && lua_toboolean(lua, -1)) { // strictly `true`. 1, "yes" and {} don't count
        outcome = Matched;
    }
    else {
        outcome = NotMatched;
    }
    lua_settop(lua, top);
    lua_gc(lua, LUA_GCCOLLECT, 0); // the next pattern starts with the whole memory budget
    return outcome;
}

bool SandboxExecutor::evaluate(const std::string& script, GuardedView& context, std::string name) {
    std::string diagnostic;
    Outcome outcome = run(script, context, diagnostic, name);
    if (outcome != Matched && outcome != NotMatched) {
        printf(SANDBOX "%s %s: %s\n", name.c_str(), describe(outcome), diagnostic.c_str());
    }
    return outcome == Matched;
}

const char* SandboxExecutor::describe(Outcome outcome) {
    switch (outcome) {
        case Matched:
            return "matched";
        case NotMatched:
            return "did not match";
        case Rejected:
            return "was rejected";
        case Threw:
            return "threw";
        case TimedOut:
            return "timed out";
    }
    return "?";
}
