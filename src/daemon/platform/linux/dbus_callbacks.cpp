#include "platform/linux/dbus_callbacks.hpp"

#include <QDBusConnection>
#include <QDBusError>
#include <QDBusMessage>
#include <QMetaType>
#include <QVariant>
#include <vector>

DBusCallbacks::DBusCallbacks(std::string interface, Handler handler)
    : interface_(std::move(interface)), handler_(std::move(handler)) {}

QString DBusCallbacks::introspect(const QString& /*path*/) const {
    return QString::fromStdString(host_interface_xml(interface_));
}

bool DBusCallbacks::handleMessage(const QDBusMessage& message, const QDBusConnection& connection) {
    if (message.type() != QDBusMessage::MethodCallMessage) return false;
    if (!message.interface().isEmpty() && message.interface().toStdString() != interface_) {
        return false;
    }

    std::vector<std::string> args;
    bool strings_only = true;
    for (const auto& arg : message.arguments()) {
        if (arg.metaType().id() != QMetaType::QString) {
            strings_only = false;
            break;
        }
        args.push_back(arg.toString().toStdString());
    }

    std::expected<HostEvent, HostEventError> event = std::unexpected(HostEventError::InvalidArgs);
    if (strings_only) event = parse_host_call(message.member().toStdString(), args);

    if (!event) {
        bool unknown = event.error() == HostEventError::UnknownMember;
        connection.send(message.createErrorReply(
            unknown ? QDBusError::UnknownMethod : QDBusError::InvalidArgs,
            (unknown ? QStringLiteral("No such method: ") : QStringLiteral("Invalid arguments for "))
                + message.member()));
        return true;
    }

    connection.send(message.createReply());
    handler_(*event);
    return true;
}
