#include <wsarrow/batch/flatten.hpp>

namespace wsarrow::batch {

namespace {

auto elements_of(const record::RecordTree& record, const FieldSpec& field)
    -> const record::RecordTree::List* {
    const auto* list = record.list(field.name);
    if (list == nullptr || list->empty()) {
        return nullptr;
    }
    return list;
}

}  // namespace

auto exploded_size(const record::RecordTree& record, const Schema& schema, bool flatten)
    -> std::size_t {
    if (!flatten) {
        return 1;
    }
    std::size_t rows = 1;
    for (auto index : schema.association_indices()) {
        if (const auto* list = elements_of(record, schema.fields()[index])) {
            rows *= list->size();
        }
    }
    return rows;
}

auto explode(const record::RecordTree& record, const Schema& schema, bool flatten)
    -> std::vector<ExplodedRow> {
    std::vector<ExplodedRow> rows;
    if (!flatten) {
        rows.push_back(ExplodedRow{.parent = &record});
        return rows;
    }

    struct Axis {
        std::size_t field;
        const record::RecordTree::List* list;
    };
    std::vector<Axis> axes;
    for (auto index : schema.association_indices()) {
        axes.push_back(Axis{.field = index, .list = elements_of(record, schema.fields()[index])});
    }

    rows.reserve(exploded_size(record, schema, flatten));
    // Odometer over the axes; the last axis turns fastest.
    std::vector<std::size_t> position(axes.size(), 0);
    while (true) {
        ExplodedRow row{.parent = &record,
                        .elements = std::vector<const record::RecordTree*>(schema.size(), nullptr)};
        for (std::size_t a = 0; a < axes.size(); ++a) {
            if (axes[a].list != nullptr) {
                row.elements[axes[a].field] = &(*axes[a].list)[position[a]];
            }
        }
        rows.push_back(std::move(row));

        std::size_t a = axes.size();
        while (a > 0) {
            --a;
            const std::size_t extent = axes[a].list != nullptr ? axes[a].list->size() : 1;
            if (++position[a] < extent) {
                break;
            }
            position[a] = 0;
            if (a == 0) {
                return rows;
            }
        }
        if (axes.empty()) {
            return rows;
        }
    }
}

}  // namespace wsarrow::batch
