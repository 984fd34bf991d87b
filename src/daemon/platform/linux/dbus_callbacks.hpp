#pragma once

#include "host_event.hpp"

#include <QDBusVirtualObject>
#include <functional>
#include <string>

// Object exported on the session bus that KWin scripts reach with callDBus().
// Each call is parsed into a HostEvent and passed to the handler.
class DBusCallbacks : public QDBusVirtualObject {
public:
    using Handler = std::function<void(const HostEvent&)>;

    DBusCallbacks(std::string interface, Handler handler);

    QString introspect(const QString& path) const override;
    bool handleMessage(const QDBusMessage& message, const QDBusConnection& connection) override;

private:
    std::string interface_;
    Handler handler_;
};
