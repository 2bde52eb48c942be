#include "list_lowering.hpp"

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Type.h>

#include <string>
#include <utility>
#include <vector>

#include "session.hpp"

namespace tapl {
namespace {

unsigned int_bits(IntKind k) {
    switch (k) {
        case IntKind::U8:
        case IntKind::S8:
            return 8;
        case IntKind::U16:
        case IntKind::S16:
            return 16;
        case IntKind::U32:
        case IntKind::S32:
            return 32;
        case IntKind::U64:
        case IntKind::S64:
            return 64;
    }
    return 64;
}

}  // namespace

ListLowering::ListLowering(Session& session, const TypeStore& types,
                           llvm::Module& module, ListLoweringOptions opts)
    : session_(session),
      types_(types),
      module_(module),
      opts_(opts),
      emitter_(module, opts.access_cache) {}

void ListLowering::internal_error(Span span, std::string message) {
    session_.error(span, "internal error: " + std::move(message));
}

std::optional<std::string> ListLowering::resolve(TypeId elem, Span use_site) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return std::nullopt;
    return inst->name;
}

ListInstance* ListLowering::instance(TypeId elem, Span use_site) {
    std::optional<std::string> code{};
    if (types_.is_concrete(elem)) code = mangle_element(types_, elem);
    if (!code) {
        internal_error(use_site, "cannot instantiate `list[" +
                                     types_.to_string(elem) +
                                     "]`: element type is not concrete");
        return nullptr;
    }

    std::string name = list_definition_name(*code);
    if (ListInstance* found = registry_.find(name)) return found;

    // Lowering the element first instantiates any list it contains.
    llvm::Type* element_ty = value_type(elem, use_site);
    if (!element_ty) return nullptr;

    ListInstance& inst = registry_.add(std::move(name), elem);
    inst.element_ty = element_ty;
    emitter_.emit(inst);
    return &inst;
}

bool ListLowering::resolve_prelude() {
    if (!opts_.prelude) return true;
    return instance(types_.char_(), Span{}) != nullptr;
}

llvm::Type* ListLowering::value_type(TypeId t, Span use_site) {
    llvm::LLVMContext& ctx = module_.getContext();
    const TypeData& d = types_.get(t);
    switch (d.kind) {
        case TypeKind::Error:
        case TypeKind::Void:
        case TypeKind::Generic:
            break;
        case TypeKind::Bool:
            return llvm::Type::getInt1Ty(ctx);
        case TypeKind::Char:
            return llvm::Type::getInt8Ty(ctx);
        case TypeKind::Int:
            return llvm::IntegerType::get(ctx, int_bits(d.int_kind));
        case TypeKind::Float:
            return d.float_kind == FloatKind::F32 ? llvm::Type::getFloatTy(ctx)
                                                  : llvm::Type::getDoubleTy(ctx);
        case TypeKind::Class:
            if (!d.class_def) break;
            return class_type(*d.class_def, use_site);
        case TypeKind::List: {
            ListInstance* inst = instance(d.elem, use_site);
            return inst ? inst->list_ty : nullptr;
        }
    }
    internal_error(use_site, "type `" + types_.to_string(t) +
                                 "` has no runtime representation");
    return nullptr;
}

llvm::StructType* ListLowering::class_type(const ClassDef& def,
                                           Span use_site) {
    if (auto it = class_types_.find(&def); it != class_types_.end())
        return it->second;
    if (classes_in_progress_.contains(&def)) {
        // The element would have to contain its own list by value.
        internal_error(use_site, "class `" + def.name +
                                     "` contains a list of itself; recursive "
                                     "list elements are not supported");
        return nullptr;
    }

    classes_in_progress_.insert(&def);
    std::vector<llvm::Type*> fields{};
    fields.reserve(def.fields.size());
    for (const ClassField& f : def.fields) {
        llvm::Type* ty = value_type(f.type, use_site);
        if (!ty) break;
        fields.push_back(ty);
    }
    classes_in_progress_.erase(&def);
    if (fields.size() != def.fields.size()) return nullptr;

    // The rest of code generation may already have declared the class.
    const std::string struct_name = "class." + def.name;
    llvm::StructType* st =
        llvm::StructType::getTypeByName(module_.getContext(), struct_name);
    if (!st) st = llvm::StructType::create(module_.getContext(), struct_name);
    if (st->isOpaque()) st->setBody(fields);
    class_types_.insert({&def, st});
    return st;
}

llvm::Value* ListLowering::index_operand(llvm::IRBuilder<>& b,
                                         llvm::Value* index,
                                         std::string_view what,
                                         Span use_site) {
    auto* ty =
        index ? llvm::dyn_cast<llvm::IntegerType>(index->getType()) : nullptr;
    if (!ty || ty->getBitWidth() > 64) {
        internal_error(use_site, std::string(what) +
                                     " is not an integer of at most 64 bits");
        return nullptr;
    }
    if (ty->getBitWidth() < 64) return b.CreateZExt(index, b.getInt64Ty());
    return index;
}

bool ListLowering::check_value(const ListInstance& inst, llvm::Value* value,
                               std::string_view what, Span use_site) {
    if (value && value->getType() == inst.element_ty) return true;
    internal_error(use_site, std::string(what) +
                                 " does not have the element type of `" +
                                 types_.to_string(types_.list(inst.element)) +
                                 "`");
    return false;
}

llvm::Value* ListLowering::call_op(llvm::IRBuilder<>& b,
                                   const ListInstance& inst, ListOp op,
                                   llvm::Value* list,
                                   std::span<llvm::Value* const> args) {
    std::vector<llvm::Value*> call_args{list};
    call_args.insert(call_args.end(), args.begin(), args.end());
    return b.CreateCall(inst.fn(op), call_args);
}

llvm::Value* ListLowering::emit_declaration(llvm::IRBuilder<>& b, TypeId elem,
                                            Span use_site,
                                            std::string_view name) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return nullptr;

    llvm::BasicBlock* block = b.GetInsertBlock();
    llvm::Function* fn = block ? block->getParent() : nullptr;
    if (!fn) {
        internal_error(use_site, "list declaration outside of a function");
        return nullptr;
    }

    // Stack slots live in the entry block so they are allocated once.
    llvm::BasicBlock& entry = fn->getEntryBlock();
    llvm::IRBuilder<> at_entry(&entry, entry.getFirstInsertionPt());
    llvm::AllocaInst* slot =
        at_entry.CreateAlloca(inst->list_ty, nullptr, llvm::StringRef(name));
    call_op(b, *inst, ListOp::Create, slot, {});
    return slot;
}

llvm::Value* ListLowering::emit_literal(llvm::IRBuilder<>& b, TypeId elem,
                                        std::span<llvm::Value* const> elements,
                                        Span use_site, std::string_view name) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return nullptr;
    for (std::size_t i = 0; i < elements.size(); i++) {
        if (!check_value(*inst, elements[i],
                         "list literal element " + std::to_string(i),
                         use_site))
            return nullptr;
    }

    llvm::Value* slot = emit_declaration(b, elem, use_site, name);
    if (!slot) return nullptr;
    for (llvm::Value* v : elements) {
        llvm::Value* arg[] = {v};
        call_op(b, *inst, ListOp::Append, slot, arg);
    }
    return slot;
}

llvm::Value* ListLowering::emit_index_load(llvm::IRBuilder<>& b, TypeId elem,
                                           llvm::Value* list,
                                           llvm::Value* index, Span use_site) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return nullptr;
    llvm::Value* idx = index_operand(b, index, "list index", use_site);
    if (!idx) return nullptr;
    llvm::Value* arg[] = {idx};
    return call_op(b, *inst, ListOp::Get, list, arg);
}

bool ListLowering::emit_index_store(llvm::IRBuilder<>& b, TypeId elem,
                                    llvm::Value* list, llvm::Value* index,
                                    llvm::Value* value, Span use_site) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return false;
    if (!check_value(*inst, value, "assigned value", use_site)) return false;
    llvm::Value* idx = index_operand(b, index, "list index", use_site);
    if (!idx) return false;
    llvm::Value* args[] = {idx, value};
    call_op(b, *inst, ListOp::Set, list, args);
    return true;
}

llvm::Value* ListLowering::emit_method_call(
    llvm::IRBuilder<>& b, TypeId elem, llvm::Value* list,
    std::string_view method, std::span<llvm::Value* const> args,
    Span use_site) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return nullptr;

    const std::string receiver = types_.to_string(types_.list(elem));
    std::optional<ListOp> op = list_op_from_method(method);
    if (!op) {
        internal_error(use_site, "`" + receiver + "` has no method `" +
                                     std::string(method) + "`");
        return nullptr;
    }
    const std::size_t arity = list_op_arity(*op);
    if (args.size() != arity) {
        internal_error(use_site, "`" + receiver + "." + std::string(method) +
                                     "` takes " + std::to_string(arity) +
                                     " argument(s), got " +
                                     std::to_string(args.size()));
        return nullptr;
    }

    const ListOpInfo& info = list_op_info(*op);
    std::vector<llvm::Value*> call_args{};
    std::size_t next = 0;
    if (info.range != IndexRange::None) {
        llvm::Value* idx = index_operand(
            b, args[next++], "index argument of `" + std::string(method) + "`",
            use_site);
        if (!idx) return nullptr;
        call_args.push_back(idx);
    }
    if (info.takes_value) {
        if (!check_value(*inst, args[next],
                         "value argument of `" + std::string(method) + "`",
                         use_site))
            return nullptr;
        call_args.push_back(args[next++]);
    }
    return call_op(b, *inst, *op, list, call_args);
}

bool ListLowering::emit_destroy(llvm::IRBuilder<>& b, TypeId elem,
                                llvm::Value* list, Span use_site) {
    ListInstance* inst = instance(elem, use_site);
    if (!inst) return false;
    call_op(b, *inst, ListOp::Destroy, list, {});
    return true;
}

}  // namespace tapl
