#include <guard.hpp>
#include <cstring>
#include <cstdio>
#include <exception>
#include <functional>


static const char* deniedKeys[] = { // meta-properties that would lead a script from a value to its type machinery
    "constructor",
    "prototype",
    "__proto__",
    "__index",
    "__metatable",
    NULL
};


static int hostGuarded(lua_State* L, std::function<int()> body) { // run host code, turning C++ exceptions into script errors
    char message[256];
    message[0] = 0;
    int results = 0;
    try {
        results = body();
    }
    catch (std::exception& e) {
        snprintf(message, sizeof(message), "host error: %s", e.what());
    }
    if (message[0] != 0) { // raised outside the handler, once the host exception is done with
        return luaL_error(L, "%s", message);
    }
    return results;
}


static int guard_index(lua_State* L) {
    GuardTarget* target = (GuardTarget*)luaL_checkudata(L, 1, GUARD_METATABLE);
    int keyType = lua_type(L, 2);
    if (keyType == LUA_TSTRING && GuardProxy::isDeniedKey(lua_tostring(L, 2))) {
        lua_pushnil(L);
        return 1;
    }
    ChartNode* node = target -> node;
    if (node -> kind == ChartNode::Function || (keyType != LUA_TSTRING && keyType != LUA_TNUMBER)) {
        lua_pushnil(L);
        return 1;
    }
    if (node -> kind == ChartNode::Array && keyType == LUA_TNUMBER) {
        double n = lua_tonumber(L, 2);
        return hostGuarded(L, [&]() {
            if (n != n || n < 1 || n > 4294967295.0 || n != (double)(size_t)n) { // NaN first: casting it is undefined
                lua_pushnil(L);
            }
            else {
                target -> guard -> push(node -> at((size_t)n - 1), node);
            }
            return 1;
        });
    }
    lua_pushvalue(L, 2); // convert a copy, so the key on the stack isn't touched
    size_t len;
    const char* raw = lua_tolstring(L, -1, &len);
    std::string key(raw, len);
    lua_pop(L, 1);
    if (node -> kind == ChartNode::Array && key == "length") {
        lua_pushnumber(L, (double)node -> length());
        return 1;
    }
    return hostGuarded(L, [&]() {
        target -> guard -> push(node -> get(key), node);
        return 1;
    });
}

static int guard_newindex(lua_State* L) { // views are read-only; writes and deletes just don't happen
    return 0;
}

static int guard_call(lua_State* L) {
    GuardTarget* target = (GuardTarget*)luaL_checkudata(L, 1, GUARD_METATABLE);
    if (target -> node -> kind != ChartNode::Function) {
        return luaL_error(L, "attempt to call a guarded %s", target -> node -> kind == ChartNode::Array ? "array" : "object");
    }
    int first = 2;
    if (target -> receiver != NULL && lua_gettop(L) >= 2) { // obj:method() passes the view of obj along; the real receiver is bound already
        GuardTarget* self = GuardProxy::toTarget(L, 2);
        if (self != NULL && self -> node == target -> receiver) {
            first = 3;
        }
    }
    return hostGuarded(L, [&]() {
        std::vector<ChartValue> args;
        for (int i = first; i <= lua_gettop(L); i ++) {
            args.push_back(target -> guard -> pull(i));
        }
        ChartValue ret = target -> node -> call(target -> receiver, args);
        target -> guard -> push(ret);
        return 1;
    });
}

static int guard_len(lua_State* L) {
    GuardTarget* target = (GuardTarget*)luaL_checkudata(L, 1, GUARD_METATABLE);
    return hostGuarded(L, [&]() {
        lua_pushnumber(L, (double)target -> node -> length());
        return 1;
    });
}

static int guard_tostring(lua_State* L) {
    GuardTarget* target = (GuardTarget*)luaL_checkudata(L, 1, GUARD_METATABLE);
    switch (target -> node -> kind) {
        case ChartNode::Object:
            lua_pushliteral(L, "[guarded object]");
            break;
        case ChartNode::Array:
            lua_pushliteral(L, "[guarded array]");
            break;
        case ChartNode::Function:
            lua_pushliteral(L, "[guarded function]");
            break;
    }
    return 1;
}


GuardedView::GuardedView(lua_State* L, int r) : lua(L), ref(r) {}

GuardedView::~GuardedView() {
    luaL_unref(lua, LUA_REGISTRYINDEX, ref);
}

void GuardedView::push() {
    lua_rawgeti(lua, LUA_REGISTRYINDEX, ref);
}


GuardProxy::GuardProxy(lua_State* L) : lua(L) {
    if (luaL_newmetatable(lua, GUARD_METATABLE)) { // shared by every GuardProxy on this state
        lua_pushcfunction(lua, guard_index);
        lua_setfield(lua, -2, "__index");
        lua_pushcfunction(lua, guard_newindex);
        lua_setfield(lua, -2, "__newindex");
        lua_pushcfunction(lua, guard_call);
        lua_setfield(lua, -2, "__call");
        lua_pushcfunction(lua, guard_len);
        lua_setfield(lua, -2, "__len");
        lua_pushcfunction(lua, guard_tostring);
        lua_setfield(lua, -2, "__tostring");
        lua_pushboolean(lua, 0);
        lua_setfield(lua, -2, "__metatable"); // getmetatable(view) == false, and it can't be swapped out
    }
    lua_pop(lua, 1);

    lua_createtable(lua, 0, 0); // the identity cache
    lua_createtable(lua, 0, 1);
    lua_pushliteral(lua, "v"); // weak values: a view only lives as long as something in lua holds it
    lua_setfield(lua, -2, "__mode");
    lua_setmetatable(lua, -2);
    cacheRef = luaL_ref(lua, LUA_REGISTRYINDEX);
}

GuardProxy::~GuardProxy() {
    luaL_unref(lua, LUA_REGISTRYINDEX, cacheRef);
}

GuardedView GuardProxy::wrap(ChartValue value) {
    push(value);
    return GuardedView(lua, luaL_ref(lua, LUA_REGISTRYINDEX));
}

void GuardProxy::push(ChartValue value, ChartNode* receiver) {
    switch (value.type) {
        case ChartValue::Absent:
            lua_pushnil(lua);
            break;
        case ChartValue::Boolean:
            lua_pushboolean(lua, value.boolean);
            break;
        case ChartValue::Number:
            lua_pushnumber(lua, value.number);
            break;
        case ChartValue::String:
            lua_pushlstring(lua, value.string.c_str(), value.string.size());
            break;
        case ChartValue::Reference:
            pushNode(value.node, value.node -> kind == ChartNode::Function ? receiver : NULL);
            break;
    }
}

void GuardProxy::pushCacheKey(ChartNode* node, ChartNode* receiver) {
    if (receiver == NULL) {
        lua_pushlightuserdata(lua, node);
    }
    else { // the same function read off two different objects is two different bound methods
        lua_pushfstring(lua, "%p:%p", (void*)node, (void*)receiver);
    }
}

void GuardProxy::pushNode(ChartNode* node, ChartNode* receiver) {
    lua_rawgeti(lua, LUA_REGISTRYINDEX, cacheRef);
    pushCacheKey(node, receiver);
    lua_rawget(lua, -2);
    if (!lua_isnil(lua, -1)) { // seen it before: hand back the same view
        lua_remove(lua, -2);
        return;
    }
    lua_pop(lua, 1);
    GuardTarget* target = (GuardTarget*)lua_newuserdata(lua, sizeof(GuardTarget));
    target -> node = node;
    target -> receiver = receiver;
    target -> guard = this;
    luaL_getmetatable(lua, GUARD_METATABLE);
    lua_setmetatable(lua, -2);
    pushCacheKey(node, receiver);
    lua_pushvalue(lua, -2);
    lua_rawset(lua, -4); // cache[key] = view
    lua_remove(lua, -2); // drop the cache, leaving the view
}

ChartValue GuardProxy::pull(int index) {
    switch (lua_type(lua, index)) {
        case LUA_TBOOLEAN:
            return ChartValue((bool)lua_toboolean(lua, index));
        case LUA_TNUMBER:
            return ChartValue((double)lua_tonumber(lua, index));
        case LUA_TSTRING: {
            size_t len;
            const char* data = lua_tolstring(lua, index, &len);
            return ChartValue(std::string(data, len));
        }
        case LUA_TUSERDATA: {
            GuardTarget* target = toTarget(lua, index);
            if (target != NULL) {
                return ChartValue(target -> node);
            }
            return ChartValue();
        }
        default:
            return ChartValue();
    }
}

bool GuardProxy::identical(GuardedView& one, GuardedView& two) {
    one.push();
    two.push();
    bool same = lua_rawequal(lua, -1, -2);
    lua_pop(lua, 2);
    return same;
}

bool GuardProxy::isDeniedKey(const char* key) {
    for (size_t i = 0; deniedKeys[i] != NULL; i ++) {
        if (strcmp(key, deniedKeys[i]) == 0) {
            return true;
        }
    }
    return false;
}

GuardTarget* GuardProxy::toTarget(lua_State* L, int index) {
    void* data = lua_touserdata(L, index);
    if (data == NULL || lua_islightuserdata(L, index) || !lua_getmetatable(L, index)) {
        return NULL;
    }
    luaL_getmetatable(L, GUARD_METATABLE);
    bool ours = lua_rawequal(L, -1, -2);
    lua_pop(L, 2);
    return ours ? (GuardTarget*)data : NULL;
}

int GuardProxy::luaKeys(lua_State* L) {
    GuardTarget* target = toTarget(L, 1);
    lua_createtable(L, 0, 0);
    if (target == NULL) {
        return 1;
    }
    return hostGuarded(L, [&]() {
        std::vector<std::string> keys = target -> node -> keys();
        int n = 1;
        for (std::string& key : keys) {
            if (isDeniedKey(key.c_str())) {
                continue;
            }
            lua_pushlstring(L, key.c_str(), key.size());
            lua_rawseti(L, -2, n);
            n ++;
        }
        return 1;
    });
}
