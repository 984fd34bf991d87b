#include "platform/linux/kwin_scripting.hpp"

#include <QDBusError>
#include <QVariant>

namespace {

constexpr const char* SCRIPTING_PATH = "/Scripting";
constexpr const char* SCRIPTING_IFACE = "org.kde.kwin.Scripting";
constexpr const char* SCRIPT_IFACE = "org.kde.kwin.Script";

ScriptErrorKind classify(const QDBusError& err) {
    switch (err.type()) {
        case QDBusError::NoReply:
        case QDBusError::Disconnected:
        case QDBusError::ServiceUnknown:
        case QDBusError::Timeout:
        case QDBusError::TimedOut:
        case QDBusError::NoServer:
        case QDBusError::NoNetwork:
            return ScriptErrorKind::TransportUnavailable;
        default:
            return ScriptErrorKind::HostRejected;
    }
}

} // namespace

KWinScripting::KWinScripting(QDBusConnection bus) : bus_(std::move(bus)) {}

std::expected<QDBusMessage, ScriptError> KWinScripting::call(QDBusMessage msg) {
    if (!bus_.isConnected()) {
        return std::unexpected(ScriptError{ScriptErrorKind::TransportUnavailable,
                                           "session bus not connected"});
    }

    auto reply = bus_.call(msg, QDBus::Block);
    if (reply.type() == QDBusMessage::ErrorMessage) {
        QDBusError err(reply);
        auto text = (msg.member() + ": " + err.name() + ": " + err.message()).toStdString();
        return std::unexpected(ScriptError{classify(err), text});
    }
    return reply;
}

std::expected<int, ScriptError> KWinScripting::load_script(const std::string& path) {
    auto msg = QDBusMessage::createMethodCall(
        QString::fromLatin1(SERVICE), QString::fromLatin1(SCRIPTING_PATH),
        QString::fromLatin1(SCRIPTING_IFACE), QStringLiteral("loadScript"));
    msg << QString::fromStdString(path);

    auto reply = call(std::move(msg));
    if (!reply) return std::unexpected(reply.error());

    const auto args = reply->arguments();
    bool ok = false;
    int id = args.isEmpty() ? -1 : args.first().toInt(&ok);
    if (!ok || id < 0) {
        return std::unexpected(ScriptError{ScriptErrorKind::HostRejected,
                                           "loadScript refused " + path});
    }
    return id;
}

std::expected<void, ScriptError> KWinScripting::call_script(int script_id, const char* method) {
    auto msg = QDBusMessage::createMethodCall(
        QString::fromLatin1(SERVICE), QStringLiteral("/Scripting/Script%1").arg(script_id),
        QString::fromLatin1(SCRIPT_IFACE), QString::fromLatin1(method));

    auto reply = call(std::move(msg));
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, ScriptError> KWinScripting::run(int script_id) {
    return call_script(script_id, "run");
}

std::expected<void, ScriptError> KWinScripting::stop(int script_id) {
    return call_script(script_id, "stop");
}

std::expected<void, ScriptError> KWinScripting::unload_script(const std::string& path) {
    auto msg = QDBusMessage::createMethodCall(
        QString::fromLatin1(SERVICE), QString::fromLatin1(SCRIPTING_PATH),
        QString::fromLatin1(SCRIPTING_IFACE), QStringLiteral("unloadScript"));
    msg << QString::fromStdString(path);

    auto reply = call(std::move(msg));
    if (!reply) return std::unexpected(reply.error());

    const auto args = reply->arguments();
    if (args.isEmpty() || !args.first().toBool()) {
        return std::unexpected(ScriptError{ScriptErrorKind::HostRejected,
                                           "unloadScript found no script " + path});
    }
    return {};
}
