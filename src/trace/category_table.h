#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace dts {

// Interned agent category. UAV is always registered first; ground
// categories receive the following ids in order of first appearance.
enum class CategoryId : uint16_t {
    UAV = 0,
};

class CategoryTable {
public:
    CategoryTable();

    // Return the id of `name`, registering it (label = name) if new.
    CategoryId intern(const std::string& name);

    // False if `name` was never registered.
    bool find(const std::string& name, CategoryId& out) const;

    bool contains(CategoryId id) const;

    // Throws SimError(UNKNOWN_CATEGORY) for an unregistered id.
    const std::string& name(CategoryId id) const;
    const std::string& label(CategoryId id) const;

    // Throws SimError(UNKNOWN_CATEGORY) if `name` is not registered.
    void set_label(const std::string& name, const std::string& label);

    std::size_t size() const { return entries_.size(); }

    // All ids in registration order.
    std::vector<CategoryId> ids() const;

private:
    struct Entry {
        std::string name;
        std::string label;
    };

    const Entry& entry(CategoryId id) const;

    std::vector<Entry> entries_;
};

} // namespace dts
