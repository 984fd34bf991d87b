#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

struct WindowData {
    std::string identity;       // KWin internalId, e.g. "{0b5c...}"
    std::string caption;        // window title
    std::string resource_class; // application class, e.g. "org.kde.konsole"

    bool operator==(const WindowData&) const = default;
};

class WindowRegistry {
public:
    // Inserts or replaces the entry for data.identity.
    // Returns false if an entry with that identity was replaced.
    bool insert(WindowData data);

    // Returns false if the identity was not registered.
    bool remove(const std::string& identity);

    const WindowData* find(const std::string& identity) const;
    bool contains(const std::string& identity) const { return windows_.contains(identity); }
    size_t size() const { return windows_.size(); }

private:
    std::unordered_map<std::string, WindowData> windows_;
};
