#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tapl {

using TypeId = std::uint32_t;

enum class IntKind : std::uint8_t {
    U8,
    U16,
    U32,
    U64,
    S8,
    S16,
    S32,
    S64,
};

enum class FloatKind : std::uint8_t {
    F32,
    F64,
};

enum class TypeKind : std::uint8_t {
    Error,
    Void,
    Bool,
    Int,
    Float,
    Char,
    Class,
    List,
    Generic,
};

struct ClassField {
    std::string name{};
    TypeId type = 0;
};

struct ClassDef {
    std::string name{};
    std::vector<ClassField> fields{};
};

struct TypeData {
    TypeKind kind = TypeKind::Error;

    // Int
    IntKind int_kind{};

    // Float
    FloatKind float_kind{};

    // List
    TypeId elem = 0;

    // Class
    const ClassDef* class_def = nullptr;

    // Generic (an unsubstituted type parameter, e.g. the `T` of `list[T]`)
    std::string param_name{};
};

// Interned type identities, as handed out by the type checker.
//
// Builtins, classes and list types are cached so that repeated requests return
// the same `TypeId`; `equal` still compares structurally because generic
// parameters are not interned.
class TypeStore {
   public:
    TypeStore() = default;

    TypeId error() const;
    TypeId void_() const;
    TypeId bool_() const;
    TypeId char_() const;

    TypeId int_(IntKind k) const;
    TypeId float_(FloatKind k) const;
    TypeId list(TypeId elem) const;
    TypeId generic(std::string param_name) const;

    // Registers a user class. Field types must already be known.
    TypeId define_class(std::string name, std::vector<ClassField> fields);
    // Forward declaration for classes whose fields refer to the class itself;
    // the fields are filled in later with `set_class_fields`.
    TypeId declare_class(std::string name);
    void set_class_fields(TypeId cls, std::vector<ClassField> fields);

    const TypeData& get(TypeId id) const {
        return types_.at(static_cast<size_t>(id));
    }

    bool equal(TypeId a, TypeId b) const;
    bool is_concrete(TypeId t) const;
    std::string to_string(TypeId t) const;

    // Parses the source spelling of a builtin or list type (`u64`, `bool`,
    // `list[list[char]]`). Classes are not nameable here.
    std::optional<TypeId> parse(std::string_view spelling) const;

    std::optional<IntKind> parse_int_kind(std::string_view name) const;
    std::optional<FloatKind> parse_float_kind(std::string_view name) const;

   private:
    mutable std::vector<TypeData> types_{};
    std::vector<std::unique_ptr<ClassDef>> classes_{};

    mutable std::optional<TypeId> cached_error_{};
    mutable std::optional<TypeId> cached_void_{};
    mutable std::optional<TypeId> cached_bool_{};
    mutable std::optional<TypeId> cached_char_{};

    mutable std::unordered_map<IntKind, TypeId> cached_ints_{};
    mutable std::unordered_map<FloatKind, TypeId> cached_floats_{};
    mutable std::unordered_map<TypeId, TypeId> cached_lists_{};

    TypeId make(TypeData d) const;
    bool is_concrete(TypeId t, std::vector<const ClassDef*>& visiting) const;
};

std::string_view int_kind_name(IntKind k);
std::string_view float_kind_name(FloatKind k);

}  // namespace tapl
