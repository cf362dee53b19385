// SandboxExecutor runs one pattern script at a time on a private LuaJIT state.
// Each run gets a brand new environment holding the guarded context, a trimmed-down standard library and a log() shim; nothing
// else (no io, os, package, debug, loaders, metatables) is reachable. A count hook enforces a wall-clock deadline, and the
// state's allocator enforces a byte cap (and stops handing out memory once the deadline has passed), so no single library
// call can run away with the process either.
// Scripts are predicates: only a literal `true` counts as a match. Everything else, failures included, is a non-match.
#pragma once
#include <defs.h>
#include <guard.hpp>
#include <string>
#include <chrono>

#define SANDBOX_REGISTRY_KEY "chartpat.sandbox"


struct SandboxConfig {
    int timeoutMs = DEFAULT_TIMEOUT_MS;
    int hookInterval = DEFAULT_HOOK_INTERVAL;
    size_t memoryLimit = DEFAULT_MEMORY_LIMIT;
    bool staticScan = true; // run deniedToken() before compiling anything
    bool scriptLog = false; // let log() output from scripts through to stdout
};


struct SandboxExecutor {
    enum Outcome {
        Matched,
        NotMatched,
        Rejected, // refused before running: deny-listed identifier or a context from another sandbox
        Threw, // syntax error, runtime error, memory limit, or a host error raised through the guard
        TimedOut
    };

    lua_State* lua;
    SandboxConfig config;
    std::chrono::steady_clock::time_point deadline;
    bool timedOut = false;
    bool running = false; // a script is executing; the allocator only enforces the deadline while this is set
    size_t memoryUsed = 0;
    std::string label; // what's running right now, for log lines

    SandboxExecutor(SandboxConfig c = SandboxConfig());

    SandboxExecutor(const SandboxExecutor&) = delete;

    ~SandboxExecutor();

    bool evaluate(const std::string& script, GuardedView& context, std::string name = "pattern"); // never throws, logs failures

    Outcome run(const std::string& script, GuardedView& context, std::string& diagnostic, std::string name = "pattern");
    // run() is evaluate() without the logging: diagnostic is filled in for anything other than Matched/NotMatched

    static const char* describe(Outcome outcome);

    static int plainFind(lua_State* L); // stands in for string.find: no patterns, s:find(needle [, init]) -> start, end

private:
    void buildEnvironment(GuardedView& context); // pushes the environment table for one run

    void copyLibrary(const char* name, const char** excluded);

    bool pastDeadline(); // marks timedOut too

    static void* limitedAlloc(void* ud, void* ptr, size_t osize, size_t nsize);

    static void deadlineHook(lua_State* L, lua_Debug* ar);

    static int protectedRun(lua_State* L);

    static int luaLog(lua_State* L);

    static SandboxExecutor* fromState(lua_State* L);
};
