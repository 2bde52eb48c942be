#include "list_registry.hpp"

#include <utility>

namespace tapl {

std::optional<std::string> mangle_element(const TypeStore& types,
                                          TypeId elem) {
    const TypeData& d = types.get(elem);
    switch (d.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Generic:
            return std::nullopt;
        case TypeKind::Bool:
            return std::string("u1");
        case TypeKind::Char:
            return std::string("char");
        case TypeKind::Int:
            return std::string(int_kind_name(d.int_kind));
        case TypeKind::Float:
            return std::string(float_kind_name(d.float_kind));
        case TypeKind::Class: {
            if (!d.class_def || d.class_def->name.empty()) return std::nullopt;
            const std::string& name = d.class_def->name;
            return "C" + std::to_string(name.size()) + name;
        }
        case TypeKind::List: {
            std::optional<std::string> inner = mangle_element(types, d.elem);
            if (!inner) return std::nullopt;
            return "L" + *inner;
        }
    }
    return std::nullopt;
}

std::string list_definition_name(std::string_view mangled_element) {
    return "list_" + std::string(mangled_element);
}

ListInstance* ListRegistry::find(std::string_view name) {
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

const ListInstance* ListRegistry::find(std::string_view name) const {
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

ListInstance& ListRegistry::add(std::string name, TypeId element) {
    auto inst = std::make_unique<ListInstance>();
    inst->name = std::move(name);
    inst->element = element;
    ListInstance* raw = inst.get();
    instances_.push_back(std::move(inst));
    by_name_.insert({raw->name, raw});
    return *raw;
}

}  // namespace tapl
