#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "list_contract.hpp"
#include "types.hpp"

namespace llvm {
class Function;
class StructType;
class Type;
}  // namespace llvm

namespace tapl {

// One concrete `list[T]` implementation emitted into the program's module.
struct ListInstance {
    std::string name{};  // definition name, e.g. `list_u64`
    TypeId element = 0;

    llvm::Type* element_ty = nullptr;
    llvm::StructType* list_ty = nullptr;  // %<name>
    llvm::StructType* node_ty = nullptr;  // %<name>_element

    std::array<llvm::Function*, kListOpCount> fns{};

    llvm::Function* fn(ListOp op) const {
        return fns[static_cast<std::size_t>(op)];
    }
};

// Canonical, self-delimiting code of an element type:
//   builtins  -> their keyword (`u64`, `u1` for bool, `char`, `f32`, ...)
//   class Foo -> `C3Foo`
//   list[T]   -> `L` + code(T)
// Returns nullopt for types that have no runtime representation.
std::optional<std::string> mangle_element(const TypeStore& types, TypeId elem);

std::string list_definition_name(std::string_view mangled_element);

// Element type -> instantiation, for one compiled program. Entries are never
// modified after `add` and are kept in first-use order.
class ListRegistry {
   public:
    ListInstance* find(std::string_view name);
    const ListInstance* find(std::string_view name) const;

    // `name` must not be registered yet.
    ListInstance& add(std::string name, TypeId element);

    const std::vector<std::unique_ptr<ListInstance>>& instances() const {
        return instances_;
    }
    std::size_t size() const { return instances_.size(); }

   private:
    std::vector<std::unique_ptr<ListInstance>> instances_{};
    std::unordered_map<std::string, ListInstance*> by_name_{};
};

}  // namespace tapl
