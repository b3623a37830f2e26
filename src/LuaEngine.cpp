#include "LuaEngine.hpp"
#include <plog/Log.h>
#include <csignal>
#include <cstdio>
#include <sstream>

namespace InkWell {

namespace {

volatile std::sig_atomic_t s_cancelRequested = 0;

std::string joinArgs(lua_State *L)
{
    int nargs = lua_gettop(L);
    std::ostringstream ss;
    for (int i = 1; i <= nargs; ++i)
    {
        size_t len = 0;
        const char *s = luaL_tolstring(L, i, &len);
        ss.write(s, static_cast<std::streamsize>(len));
        lua_pop(L, 1);
        if (i < nargs)
            ss << "\t";
    }
    ss << "\n";
    return ss.str();
}

void writeAndFlush(std::FILE *stream, const std::string &s)
{
    std::fwrite(s.data(), 1, s.size(), stream);
    std::fflush(stream);
}

} // namespace

LuaEngine::LuaEngine(bool sandbox)
{
    m_L = luaL_newstate();
    if (!m_L) {
        PLOGE << "Lua: failed to create state";
        return;
    }
    luaL_openlibs(m_L);
    if (sandbox)
        setupSandbox();
    installOutputBindings();

    lua_pushlightuserdata(m_L, this);
    lua_pushcclosure(m_L, &LuaEngine::l_messageHandler, 1);
    lua_setfield(m_L, LUA_REGISTRYINDEX, "inkwell.msgh");

    lua_sethook(m_L, &LuaEngine::cancelHook, LUA_MASKCOUNT, kHookInstructionCount);
}

LuaEngine::~LuaEngine()
{
    if (m_L)
        lua_close(m_L);
}

void LuaEngine::requestCancel() noexcept
{
    s_cancelRequested = 1;
}

bool LuaEngine::cancelRequested() noexcept
{
    return s_cancelRequested != 0;
}

void LuaEngine::captureLuaError(const char *msg)
{
    if (msg)
        m_failure.message = msg;
    else
        m_failure.message = "unknown lua error";
    PLOGW << "Lua error: " << m_failure.message;
}

void LuaEngine::setupSandbox()
{
    // Keep the harmless part of 'os' before removing it
    lua_newtable(m_L);
    int safeOs = lua_gettop(m_L);
    lua_getglobal(m_L, "os");
    if (lua_istable(m_L, -1))
    {
        for (const char *name : {"clock", "time", "date", "difftime"})
        {
            lua_getfield(m_L, -1, name);
            lua_setfield(m_L, safeOs, name);
        }
    }
    lua_pop(m_L, 1);

    // Remove dangerous globals. require/package would hand back the full
    // libraries or load C code; debug reaches the registry.
    for (const char *name : {"io", "loadfile", "dofile", "load", "require", "package", "debug"})
    {
        lua_pushnil(m_L);
        lua_setglobal(m_L, name);
    }

    // luaL_openlibs also cached every library in the loaded table
    luaL_getsubtable(m_L, LUA_REGISTRYINDEX, LUA_LOADED_TABLE);
    for (const char *name : {"io", "package", "debug"})
    {
        lua_pushnil(m_L);
        lua_setfield(m_L, -2, name);
    }
    lua_pushvalue(m_L, safeOs);
    lua_setfield(m_L, -2, "os");
    lua_pop(m_L, 1);

    lua_setglobal(m_L, "os");
}

void LuaEngine::installOutputBindings()
{
    lua_pushcfunction(m_L, &LuaEngine::l_print);
    lua_setglobal(m_L, "print");
    lua_pushcfunction(m_L, &LuaEngine::l_eprint);
    lua_setglobal(m_L, "eprint");
}

int LuaEngine::l_print(lua_State *L)
{
    writeAndFlush(stdout, joinArgs(L));
    return 0;
}

int LuaEngine::l_eprint(lua_State *L)
{
    writeAndFlush(stderr, joinArgs(L));
    return 0;
}

// Runs on the erroring stack: record the traceback, pass the message through.
int LuaEngine::l_messageHandler(lua_State *L)
{
    LuaEngine *eng = reinterpret_cast<LuaEngine *>(lua_touserdata(L, lua_upvalueindex(1)));
    const char *msg = lua_tostring(L, 1);
    if (!msg)
    {
        if (luaL_callmeta(L, 1, "__tostring") && lua_type(L, -1) == LUA_TSTRING)
            msg = lua_tostring(L, -1);
        else
            msg = lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
    }
    luaL_traceback(L, L, nullptr, 1);
    if (eng)
        eng->m_failure.traceback = lua_tostring(L, -1);
    lua_pop(L, 1);
    lua_pushstring(L, msg);
    return 1;
}

void LuaEngine::cancelHook(lua_State *L, lua_Debug * /*ar*/)
{
    if (s_cancelRequested)
        luaL_error(L, "cancelled");
}

bool LuaEngine::runScript(const std::string &code, const std::string &chunkName)
{
    m_failure = ScriptFailure{};
    m_cancelled = false;
    if (!m_L)
    {
        captureLuaError("lua state not initialized");
        return false;
    }

    lua_getfield(m_L, LUA_REGISTRYINDEX, "inkwell.msgh");
    int msgh = lua_gettop(m_L);

    int r = luaL_loadbuffer(m_L, code.c_str(), code.size(), chunkName.c_str());
    if (r != LUA_OK)
    {
        captureLuaError(lua_tostring(m_L, -1));
        lua_settop(m_L, msgh - 1);
        return false;
    }
    // run chunk
    r = lua_pcall(m_L, 0, 0, msgh);
    if (r != LUA_OK)
    {
        if (cancelRequested())
        {
            m_cancelled = true;
            m_failure.message = "cancelled";
            PLOGI << "Lua: script cancelled";
        }
        else
        {
            captureLuaError(lua_tostring(m_L, -1));
        }
        lua_settop(m_L, msgh - 1);
        return false;
    }
    lua_settop(m_L, msgh - 1);
    return true;
}

} // namespace InkWell
