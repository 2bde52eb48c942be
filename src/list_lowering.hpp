#pragma once

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Module.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "chain_emitter.hpp"
#include "list_registry.hpp"
#include "source.hpp"
#include "types.hpp"

namespace tapl {

struct Session;

struct ListLoweringOptions {
    // Emit the forward access cache in get/set. Without it every indexed
    // access walks from the head.
    bool access_cache = true;
    // Instantiate `list[char]` up front; the standard library's file
    // functions return it.
    bool prelude = true;
};

// Lowers every `list[T]` of one compiled program to its concrete
// implementation in `module`. Constructed after the module's DataLayout is
// set, and discarded together with the module.
//
// Failures are reported on the session as `internal error: ...` diagnostics
// at the use site; nothing is emitted for the failing request.
class ListLowering {
   public:
    ListLowering(Session& session, const TypeStore& types,
                 llvm::Module& module, ListLoweringOptions opts = {});

    // Definition name of the implementation for `list[elem]`, emitting it on
    // first use.
    std::optional<std::string> resolve(TypeId elem, Span use_site);
    ListInstance* instance(TypeId elem, Span use_site);

    // Instantiates the implementations every program gets, if enabled.
    bool resolve_prelude();

    const ListRegistry& registry() const { return registry_; }

    // LLVM type of a value of type `t`; lists are their `%list_<code>`
    // struct, classes their `%class.<Name>` struct.
    llvm::Type* value_type(TypeId t, Span use_site);

    // Call-site emission. `list` is the address of a `%list_<code>` value.
    llvm::Value* emit_declaration(llvm::IRBuilder<>& b, TypeId elem,
                                  Span use_site, std::string_view name = {});
    llvm::Value* emit_literal(llvm::IRBuilder<>& b, TypeId elem,
                              std::span<llvm::Value* const> elements,
                              Span use_site, std::string_view name = {});
    llvm::Value* emit_index_load(llvm::IRBuilder<>& b, TypeId elem,
                                 llvm::Value* list, llvm::Value* index,
                                 Span use_site);
    bool emit_index_store(llvm::IRBuilder<>& b, TypeId elem, llvm::Value* list,
                          llvm::Value* index, llvm::Value* value,
                          Span use_site);
    // Returns the call; for methods without a result that is the void call
    // instruction itself. Null on failure.
    llvm::Value* emit_method_call(llvm::IRBuilder<>& b, TypeId elem,
                                  llvm::Value* list, std::string_view method,
                                  std::span<llvm::Value* const> args,
                                  Span use_site);
    bool emit_destroy(llvm::IRBuilder<>& b, TypeId elem, llvm::Value* list,
                      Span use_site);

   private:
    Session& session_;
    const TypeStore& types_;
    llvm::Module& module_;
    ListLoweringOptions opts_;
    ListRegistry registry_{};
    ChainEmitter emitter_;

    std::unordered_map<const ClassDef*, llvm::StructType*> class_types_{};
    std::unordered_set<const ClassDef*> classes_in_progress_{};

    void internal_error(Span span, std::string message);

    llvm::StructType* class_type(const ClassDef& def, Span use_site);
    llvm::Value* index_operand(llvm::IRBuilder<>& b, llvm::Value* index,
                               std::string_view what, Span use_site);
    bool check_value(const ListInstance& inst, llvm::Value* value,
                     std::string_view what, Span use_site);
    llvm::Value* call_op(llvm::IRBuilder<>& b, const ListInstance& inst,
                         ListOp op, llvm::Value* list,
                         std::span<llvm::Value* const> args);
};

}  // namespace tapl
