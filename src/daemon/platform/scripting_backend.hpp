#pragma once

#include <expected>
#include <string>

enum class ScriptErrorKind { TransportUnavailable, HostRejected, ResourceExhausted };

struct ScriptError {
    ScriptErrorKind kind;
    std::string message;
};

std::string to_string(const ScriptError& err);

// Remote scripting host (KWin's org.kde.kwin.Scripting on the session bus).
class ScriptingBackend {
public:
    virtual ~ScriptingBackend() = default;
    virtual std::expected<int, ScriptError> load_script(const std::string& path) = 0;
    virtual std::expected<void, ScriptError> run(int script_id) = 0;
    virtual std::expected<void, ScriptError> stop(int script_id) = 0;
    virtual std::expected<void, ScriptError> unload_script(const std::string& path) = 0;
};
