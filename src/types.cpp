#include "types.hpp"

#include <sstream>
#include <utility>

namespace tapl {

TypeId TypeStore::make(TypeData d) const {
    TypeId id = static_cast<TypeId>(types_.size());
    types_.push_back(std::move(d));
    return id;
}

TypeId TypeStore::error() const {
    if (cached_error_) return *cached_error_;
    cached_error_ = make(TypeData{.kind = TypeKind::Error});
    return *cached_error_;
}

TypeId TypeStore::void_() const {
    if (cached_void_) return *cached_void_;
    cached_void_ = make(TypeData{.kind = TypeKind::Void});
    return *cached_void_;
}

TypeId TypeStore::bool_() const {
    if (cached_bool_) return *cached_bool_;
    cached_bool_ = make(TypeData{.kind = TypeKind::Bool});
    return *cached_bool_;
}

TypeId TypeStore::char_() const {
    if (cached_char_) return *cached_char_;
    cached_char_ = make(TypeData{.kind = TypeKind::Char});
    return *cached_char_;
}

TypeId TypeStore::int_(IntKind k) const {
    if (auto it = cached_ints_.find(k); it != cached_ints_.end())
        return it->second;
    TypeId id = make(TypeData{.kind = TypeKind::Int, .int_kind = k});
    cached_ints_.insert({k, id});
    return id;
}

TypeId TypeStore::float_(FloatKind k) const {
    if (auto it = cached_floats_.find(k); it != cached_floats_.end())
        return it->second;
    TypeId id = make(TypeData{.kind = TypeKind::Float, .float_kind = k});
    cached_floats_.insert({k, id});
    return id;
}

TypeId TypeStore::list(TypeId elem) const {
    if (auto it = cached_lists_.find(elem); it != cached_lists_.end())
        return it->second;
    TypeId id = make(TypeData{.kind = TypeKind::List, .elem = elem});
    cached_lists_.insert({elem, id});
    return id;
}

TypeId TypeStore::generic(std::string param_name) const {
    TypeData d{.kind = TypeKind::Generic};
    d.param_name = std::move(param_name);
    return make(std::move(d));
}

TypeId TypeStore::define_class(std::string name,
                               std::vector<ClassField> fields) {
    auto def = std::make_unique<ClassDef>();
    def->name = std::move(name);
    def->fields = std::move(fields);
    const ClassDef* raw = def.get();
    classes_.push_back(std::move(def));
    return make(TypeData{.kind = TypeKind::Class, .class_def = raw});
}

TypeId TypeStore::declare_class(std::string name) {
    return define_class(std::move(name), {});
}

void TypeStore::set_class_fields(TypeId cls, std::vector<ClassField> fields) {
    const ClassDef* def = get(cls).class_def;
    for (const std::unique_ptr<ClassDef>& c : classes_) {
        if (c.get() == def) {
            c->fields = std::move(fields);
            return;
        }
    }
}

bool TypeStore::equal(TypeId a, TypeId b) const {
    if (a == b) return true;
    const TypeData& ta = get(a);
    const TypeData& tb = get(b);
    if (ta.kind != tb.kind) return false;

    switch (ta.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Bool:
        case TypeKind::Char:
            return true;
        case TypeKind::Int:
            return ta.int_kind == tb.int_kind;
        case TypeKind::Float:
            return ta.float_kind == tb.float_kind;
        case TypeKind::List:
            return equal(ta.elem, tb.elem);
        case TypeKind::Class:
            return ta.class_def == tb.class_def;
        case TypeKind::Generic:
            return ta.param_name == tb.param_name;
    }
    return false;
}

bool TypeStore::is_concrete(TypeId t) const {
    std::vector<const ClassDef*> visiting{};
    return is_concrete(t, visiting);
}

bool TypeStore::is_concrete(TypeId t,
                            std::vector<const ClassDef*>& visiting) const {
    const TypeData& d = get(t);
    switch (d.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Generic:
            return false;
        case TypeKind::Bool:
        case TypeKind::Int:
        case TypeKind::Float:
        case TypeKind::Char:
            return true;
        case TypeKind::List:
            return is_concrete(d.elem, visiting);
        case TypeKind::Class: {
            if (!d.class_def) return false;
            // A class reached again through its own fields adds nothing new.
            for (const ClassDef* v : visiting) {
                if (v == d.class_def) return true;
            }
            visiting.push_back(d.class_def);
            bool ok = true;
            for (const ClassField& f : d.class_def->fields) {
                if (!is_concrete(f.type, visiting)) {
                    ok = false;
                    break;
                }
            }
            visiting.pop_back();
            return ok;
        }
    }
    return false;
}

std::string_view int_kind_name(IntKind k) {
    switch (k) {
        case IntKind::U8:
            return "u8";
        case IntKind::U16:
            return "u16";
        case IntKind::U32:
            return "u32";
        case IntKind::U64:
            return "u64";
        case IntKind::S8:
            return "s8";
        case IntKind::S16:
            return "s16";
        case IntKind::S32:
            return "s32";
        case IntKind::S64:
            return "s64";
    }
    return "s64";
}

std::string_view float_kind_name(FloatKind k) {
    switch (k) {
        case FloatKind::F32:
            return "f32";
        case FloatKind::F64:
            return "f64";
    }
    return "f64";
}

std::string TypeStore::to_string(TypeId t) const {
    const TypeData& d = get(t);
    switch (d.kind) {
        case TypeKind::Error:
            return "<error>";
        case TypeKind::Void:
            return "void";
        case TypeKind::Bool:
            return "bool";
        case TypeKind::Int:
            return std::string(int_kind_name(d.int_kind));
        case TypeKind::Float:
            return std::string(float_kind_name(d.float_kind));
        case TypeKind::Char:
            return "char";
        case TypeKind::List: {
            std::ostringstream out;
            out << "list[" << to_string(d.elem) << "]";
            return out.str();
        }
        case TypeKind::Class:
            return d.class_def ? d.class_def->name : "<class>";
        case TypeKind::Generic:
            return d.param_name;
    }
    return "<type>";
}

std::optional<TypeId> TypeStore::parse(std::string_view spelling) const {
    constexpr std::string_view kListOpen = "list[";
    if (spelling.substr(0, kListOpen.size()) == kListOpen) {
        if (spelling.size() <= kListOpen.size() || spelling.back() != ']')
            return std::nullopt;
        std::string_view inner = spelling.substr(
            kListOpen.size(), spelling.size() - kListOpen.size() - 1);
        std::optional<TypeId> elem = parse(inner);
        if (!elem) return std::nullopt;
        return list(*elem);
    }

    if (spelling == "void") return void_();
    if (spelling == "bool" || spelling == "u1") return bool_();
    if (spelling == "char") return char_();
    if (auto k = parse_int_kind(spelling)) return int_(*k);
    if (auto k = parse_float_kind(spelling)) return float_(*k);
    return std::nullopt;
}

std::optional<IntKind> TypeStore::parse_int_kind(std::string_view name) const {
    if (name == "u8") return IntKind::U8;
    if (name == "u16") return IntKind::U16;
    if (name == "u32") return IntKind::U32;
    if (name == "u64") return IntKind::U64;
    if (name == "s8") return IntKind::S8;
    if (name == "s16") return IntKind::S16;
    if (name == "s32") return IntKind::S32;
    if (name == "s64") return IntKind::S64;
    return std::nullopt;
}

std::optional<FloatKind> TypeStore::parse_float_kind(
    std::string_view name) const {
    if (name == "f32") return FloatKind::F32;
    if (name == "f64") return FloatKind::F64;
    return std::nullopt;
}

}  // namespace tapl
