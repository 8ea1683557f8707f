#include "schema/shape_diff.hpp"
#include "reflect/shape_inspector.hpp"

#include <unordered_map>
#include <unordered_set>

namespace shapesql {

namespace {

bool ptr_equal(const ShapePtr& a, const ShapePtr& b) {
    if (!a || !b) return a == b;
    return a == b || ShapeDiff::shapes_equal(*a, *b);
}

bool fields_equal(const std::vector<Field>& a, const std::vector<Field>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name) return false;
        if (!ptr_equal(a[i].shape, b[i].shape)) return false;
    }
    return true;
}

bool layouts_equal(const ShapeLayout& a, const ShapeLayout& b) {
    return a.size_bytes == b.size_bytes && a.is_signed == b.is_signed
        && a.is_float == b.is_float && a.sized == b.sized;
}

} // anonymous namespace

ShapeDiff::ShapeDiff(DiffKind kind, ShapePtr from, ShapePtr to)
    : kind_(kind), from_(std::move(from)), to_(std::move(to)) {}

bool ShapeDiff::shapes_equal(const Shape& a, const Shape& b) {
    if (a.type_identifier != b.type_identifier) return false;
    if (a.kind != b.kind || a.def != b.def || a.primitive != b.primitive) return false;
    if (!layouts_equal(a.layout, b.layout)) return false;
    if (a.array_length != b.array_length) return false;
    if (a.variants != b.variants) return false;
    if (!ptr_equal(a.inner, b.inner) || !ptr_equal(a.key, b.key)) return false;
    return fields_equal(a.fields, b.fields);
}

ShapeDiff ShapeDiff::compute(ShapePtr from, ShapePtr to) {
    if (!from || !to) {
        const auto kind = (from == to) ? DiffKind::EQUAL : DiffKind::DIFFERENT;
        return ShapeDiff(kind, std::move(from), std::move(to));
    }

    if (shapes_equal(*from, *to)) {
        return ShapeDiff(DiffKind::EQUAL, std::move(from), std::move(to));
    }

    if (ShapeInspector::is_record(*from) && ShapeInspector::is_record(*to)) {
        ShapeDiff diff(DiffKind::RECORD, from, to);

        std::unordered_map<std::string, const Field*> to_fields;
        for (const auto& f : to->fields) to_fields.emplace(f.name, &f);

        std::unordered_set<std::string> from_names;
        for (const auto& f : from->fields) {
            from_names.insert(f.name);
            const auto it = to_fields.find(f.name);
            if (it == to_fields.end()) {
                diff.deletions_.push_back(f.name);
            } else if (ptr_equal(f.shape, it->second->shape)) {
                diff.unchanged_.push_back(f.name);
            } else {
                diff.updates_.push_back(f.name);
            }
        }

        for (const auto& f : to->fields) {
            if (!from_names.contains(f.name)) {
                diff.insertions_.push_back(f.name);
            }
        }
        return diff;
    }

    if (ShapeInspector::is_sequence(*from) && ShapeInspector::is_sequence(*to)) {
        return ShapeDiff(DiffKind::SEQUENCE, std::move(from), std::move(to));
    }

    return ShapeDiff(DiffKind::DIFFERENT, std::move(from), std::move(to));
}

} // namespace shapesql
