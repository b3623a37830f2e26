#pragma once

#include <string>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
#include <lualib.h>
}

namespace InkWell {

struct ScriptFailure {
    std::string message;
    std::string traceback; // empty for compile errors
};

// One Lua state running console scripts. print/eprint write straight to the
// process's stdout/stderr and flush, so a parent reading the pipes sees
// output as it happens.
class LuaEngine {
public:
    explicit LuaEngine(bool sandbox = true);
    ~LuaEngine();

    LuaEngine(const LuaEngine &) = delete;
    LuaEngine &operator=(const LuaEngine &) = delete;

    // Compile and run a chunk (returns false on error or cancellation)
    bool runScript(const std::string &code, const std::string &chunkName = "=console");

    const ScriptFailure &lastFailure() const { return m_failure; }
    bool wasCancelled() const { return m_cancelled; }

    lua_State *L() { return m_L; }

    // Async-signal-safe. The running script raises "cancelled" at its next
    // instruction-count hook.
    static void requestCancel() noexcept;
    static bool cancelRequested() noexcept;

    static constexpr int kHookInstructionCount = 1000;

private:
    lua_State *m_L = nullptr;
    ScriptFailure m_failure;
    bool m_cancelled = false;

    void setupSandbox();
    void installOutputBindings();
    void captureLuaError(const char *msg);

    static int l_print(lua_State *L);
    static int l_eprint(lua_State *L);
    static int l_messageHandler(lua_State *L);
    static void cancelHook(lua_State *L, lua_Debug *ar);
};

} // namespace InkWell
