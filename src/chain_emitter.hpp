#pragma once

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Module.h>

#include <cstdint>
#include <string_view>
#include <utility>

#include "list_contract.hpp"
#include "list_registry.hpp"

namespace tapl {

// Emits the LLVM IR of one `list[T]` instantiation:
//
//   %<name>_element = type { T, ptr }
//   %<name>         = type { ptr head, ptr tail, i1 cache_valid,
//                            i64 cache_index, ptr cache_element, i64 size }
//
// plus one function per `ListOp` and a private cold `<name>_bounds_fault`.
// Only `malloc`, `free` and `write` are referenced from outside the
// instantiation. The module must carry its final DataLayout.
class ChainEmitter {
   public:
    ChainEmitter(llvm::Module& module, bool access_cache);

    // Fills `inst.list_ty`, `inst.node_ty` and `inst.fns`; `inst.name` and
    // `inst.element_ty` must be set.
    void emit(ListInstance& inst);

   private:
    llvm::Module& module_;
    llvm::LLVMContext& ctx_;
    llvm::IRBuilder<> builder_;
    bool access_cache_ = true;

    ListInstance* inst_ = nullptr;
    llvm::Function* fault_fn_ = nullptr;

    llvm::PointerType* ptr_ty();
    llvm::IntegerType* index_ty();
    llvm::IntegerType* size_t_ty();

    llvm::FunctionCallee malloc_fn();
    llvm::FunctionCallee free_fn();
    llvm::FunctionCallee write_fn();

    llvm::Function* declare(ListOp op);

    llvm::Value* field_ptr(llvm::Value* self, unsigned field);
    llvm::Value* load_field(llvm::Value* self, unsigned field);
    void store_field(llvm::Value* self, unsigned field, llvm::Value* value);
    llvm::Value* node_next_ptr(llvm::Value* node);
    llvm::Value* new_node(llvm::Value* value, llvm::Value* next);
    void adjust_size(llvm::Value* self, std::int64_t delta);
    void invalidate(llvm::Value* self);

    std::pair<llvm::Value*, llvm::Value*> emit_walk(llvm::Function* fn,
                                                    llvm::Value* start,
                                                    llvm::Value* count,
                                                    std::string_view prefix);
    llvm::BasicBlock* fault_block(llvm::Function* fn, ListOp op);
    llvm::Value* emit_locate(llvm::Function* fn, ListOp op,
                             llvm::Value* self, llvm::Value* index);

    void emit_bounds_fault();
    void emit_create();
    void emit_destroy();
    void emit_cache_invalidate();
    void emit_size();
    void emit_append();
    void emit_get();
    void emit_set();
    void emit_insert();
    void emit_delete();
};

}  // namespace tapl
