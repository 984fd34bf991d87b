#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Fixed-capacity mapping from device key index to the window shown on it.
// A window identity occupies at most one slot.
class SlotTable {
public:
    explicit SlotTable(size_t key_count);

    // Places `identity` in the first empty slot. Returns nullopt when every
    // slot is taken; the table is left untouched in that case.
    std::optional<size_t> assign(const std::string& identity);

    // Clears the slot holding `identity`. Returns nullopt if none does.
    std::optional<size_t> release(const std::string& identity);

    std::optional<std::string> occupant(size_t index) const;
    std::optional<size_t> find(const std::string& identity) const;

    size_t size() const { return slots_.size(); }
    size_t occupied() const;

    bool operator==(const SlotTable&) const = default;

private:
    std::vector<std::optional<std::string>> slots_;
};
