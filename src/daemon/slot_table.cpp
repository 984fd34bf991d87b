#include "slot_table.hpp"

#include <algorithm>

SlotTable::SlotTable(size_t key_count) : slots_(key_count) {}

std::optional<size_t> SlotTable::assign(const std::string& identity) {
    if (auto existing = find(identity)) return existing;

    for (size_t i = 0; i < slots_.size(); i++) {
        if (!slots_[i]) {
            slots_[i] = identity;
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> SlotTable::release(const std::string& identity) {
    std::optional<size_t> cleared;
    for (size_t i = 0; i < slots_.size(); i++) {
        if (slots_[i] == identity) {
            slots_[i].reset();
            if (!cleared) cleared = i;
        }
    }
    return cleared;
}

std::optional<std::string> SlotTable::occupant(size_t index) const {
    if (index >= slots_.size()) return std::nullopt;
    return slots_[index];
}

std::optional<size_t> SlotTable::find(const std::string& identity) const {
    auto it = std::find(slots_.begin(), slots_.end(), identity);
    if (it == slots_.end()) return std::nullopt;
    return static_cast<size_t>(it - slots_.begin());
}

size_t SlotTable::occupied() const {
    return static_cast<size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const auto& s) { return s.has_value(); }));
}
