// The guard: read-only, reflection-blocking views of host chart values for scripts running in a sandbox lua_State.
// Every object, array or callable a script can reach is a full userdata with the guard metatable. Reads forward to the real
// ChartNode (except a handful of meta-keys, which always read as nil), writes are silently dropped, calls are bound to the
// real receiver, and anything coming back out gets the same treatment. Views are cached per node so identity holds.
#pragma once
#include <defs.h>
#include <chart.hpp>
#include <luajit-2.1/lua.hpp> // TODO: fix this somehow
#include <string>

#define GUARD_METATABLE "chartpat.guard"


struct GuardTarget { // what actually lives inside a guard userdata. never handed to scripts directly
    ChartNode* node;
    ChartNode* receiver; // for bound methods: the real object the function was read from
    GuardProxy* guard;
};


struct GuardedView { // a guarded value anchored in the registry, so the collector can't take it while we still need it
    lua_State* lua;
    int ref;

    GuardedView(lua_State* L, int r);

    GuardedView(const GuardedView&) = delete;

    ~GuardedView();

    void push(); // push the anchored value back onto the stack
};


struct GuardProxy {
    lua_State* lua;
    int cacheRef; // registry reference to the identity cache (weak values)

    GuardProxy(lua_State* L); // a GuardProxy must outlive every script run that touches its views

    ~GuardProxy();

    GuardedView wrap(ChartValue value);

    void push(ChartValue value, ChartNode* receiver = NULL); // push the guarded form of value. receiver is only used for functions

    ChartValue pull(int index); // read a script value back as a host value, unwrapping guarded views to their real nodes.
    // script tables and functions never reach the host; they come through as Absent.

    bool identical(GuardedView& one, GuardedView& two);

    static bool isDeniedKey(const char* key);

    static GuardTarget* toTarget(lua_State* L, int index); // NULL if the value at index isn't one of ours

    static int luaKeys(lua_State* L); // keys(view) for the sandbox environment

private:
    void pushNode(ChartNode* node, ChartNode* receiver);

    void pushCacheKey(ChartNode* node, ChartNode* receiver);
};
