#include <wsarrow/record/record.hpp>

namespace wsarrow::record {

auto RecordTree::set(std::string name, Value value) -> bool {
    if (fields_.find(name) != fields_.end()) {
        return false;
    }
    order_.push_back(name);
    fields_.emplace(std::move(name), std::move(value));
    return true;
}

auto RecordTree::get(std::string_view name) const -> const Value* {
    if (auto it = fields_.find(std::string(name)); it != fields_.end()) {
        return &it->second;
    }
    return nullptr;
}

auto RecordTree::text(std::string_view name) const -> const std::string* {
    if (const auto* value = get(name)) {
        return std::get_if<std::string>(value);
    }
    return nullptr;
}

auto RecordTree::list(std::string_view name) const -> const List* {
    if (const auto* value = get(name)) {
        return std::get_if<List>(value);
    }
    return nullptr;
}

}  // namespace wsarrow::record
