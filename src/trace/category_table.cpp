#include "trace/category_table.h"
#include "common/errors.h"
#include "common/types.h"

namespace dts {

CategoryTable::CategoryTable() {
    entries_.push_back({UAV_CATEGORY, UAV_CATEGORY});
}

CategoryId CategoryTable::intern(const std::string& name) {
    CategoryId id;
    if (find(name, id))
        return id;
    entries_.push_back({name, name});
    return static_cast<CategoryId>(entries_.size() - 1);
}

bool CategoryTable::find(const std::string& name, CategoryId& out) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name == name) {
            out = static_cast<CategoryId>(i);
            return true;
        }
    }
    return false;
}

bool CategoryTable::contains(CategoryId id) const {
    return static_cast<std::size_t>(id) < entries_.size();
}

const CategoryTable::Entry& CategoryTable::entry(CategoryId id) const {
    if (!contains(id))
        throw SimError(ErrorKind::UNKNOWN_CATEGORY,
                       "category id " + std::to_string(static_cast<unsigned>(id)));
    return entries_[static_cast<std::size_t>(id)];
}

const std::string& CategoryTable::name(CategoryId id) const {
    return entry(id).name;
}

const std::string& CategoryTable::label(CategoryId id) const {
    return entry(id).label;
}

void CategoryTable::set_label(const std::string& name, const std::string& label) {
    CategoryId id;
    if (!find(name, id))
        throw SimError(ErrorKind::UNKNOWN_CATEGORY, "category '" + name + "'");
    entries_[static_cast<std::size_t>(id)].label = label;
}

std::vector<CategoryId> CategoryTable::ids() const {
    std::vector<CategoryId> out;
    out.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i)
        out.push_back(static_cast<CategoryId>(i));
    return out;
}

} // namespace dts
