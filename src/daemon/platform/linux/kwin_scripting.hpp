#pragma once

#include "platform/scripting_backend.hpp"

#include <QDBusConnection>
#include <QDBusMessage>

// org.kde.kwin.Scripting on the session bus. Calls block until KWin replies;
// incoming D-Bus calls stay queued meanwhile.
class KWinScripting : public ScriptingBackend {
public:
    explicit KWinScripting(QDBusConnection bus);

    std::expected<int, ScriptError> load_script(const std::string& path) override;
    std::expected<void, ScriptError> run(int script_id) override;
    std::expected<void, ScriptError> stop(int script_id) override;
    std::expected<void, ScriptError> unload_script(const std::string& path) override;

    static constexpr const char* SERVICE = "org.kde.KWin";

private:
    std::expected<QDBusMessage, ScriptError> call(QDBusMessage msg);
    std::expected<void, ScriptError> call_script(int script_id, const char* method);

    QDBusConnection bus_;
};
