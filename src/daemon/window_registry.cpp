#include "window_registry.hpp"

bool WindowRegistry::insert(WindowData data) {
    auto key = data.identity;
    auto [it, inserted] = windows_.insert_or_assign(std::move(key), std::move(data));
    return inserted;
}

bool WindowRegistry::remove(const std::string& identity) {
    return windows_.erase(identity) > 0;
}

const WindowData* WindowRegistry::find(const std::string& identity) const {
    auto it = windows_.find(identity);
    if (it == windows_.end()) return nullptr;
    return &it->second;
}
