#include "chain_emitter.hpp"

#include <llvm/IR/Constants.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Intrinsics.h>

#include <string>
#include <vector>

namespace tapl {
namespace {

// Field order of `%<name>`.
enum ListField : unsigned {
    kHead = 0,
    kTail = 1,
    kCacheValid = 2,
    kCacheIndex = 3,
    kCacheElement = 4,
    kSize = 5,
};

// Field order of `%<name>_element`.
enum NodeField : unsigned {
    kValue = 0,
    kNext = 1,
};

constexpr int kStderrFd = 2;

}  // namespace

ChainEmitter::ChainEmitter(llvm::Module& module, bool access_cache)
    : module_(module),
      ctx_(module.getContext()),
      builder_(ctx_),
      access_cache_(access_cache) {}

llvm::PointerType* ChainEmitter::ptr_ty() {
    return llvm::PointerType::get(ctx_, 0);
}

llvm::IntegerType* ChainEmitter::index_ty() { return builder_.getInt64Ty(); }

llvm::IntegerType* ChainEmitter::size_t_ty() {
    return module_.getDataLayout().getIntPtrType(ctx_);
}

llvm::FunctionCallee ChainEmitter::malloc_fn() {
    return module_.getOrInsertFunction(
        "malloc", llvm::FunctionType::get(ptr_ty(), {size_t_ty()},
                                          /*isVarArg=*/false));
}

llvm::FunctionCallee ChainEmitter::free_fn() {
    return module_.getOrInsertFunction(
        "free", llvm::FunctionType::get(builder_.getVoidTy(), {ptr_ty()},
                                        /*isVarArg=*/false));
}

llvm::FunctionCallee ChainEmitter::write_fn() {
    return module_.getOrInsertFunction(
        "write",
        llvm::FunctionType::get(size_t_ty(),
                                {builder_.getInt32Ty(), ptr_ty(), size_t_ty()},
                                /*isVarArg=*/false));
}

void ChainEmitter::emit(ListInstance& inst) {
    inst_ = &inst;

    inst.node_ty = llvm::StructType::create(
        ctx_, {inst.element_ty, ptr_ty()}, inst.name + "_element");
    inst.list_ty = llvm::StructType::create(
        ctx_,
        {ptr_ty(), ptr_ty(), builder_.getInt1Ty(), index_ty(), ptr_ty(),
         index_ty()},
        inst.name);

    // Declare everything first; bodies call each other.
    for (const ListOpInfo& info : list_ops()) declare(info.op);

    emit_bounds_fault();
    emit_create();
    emit_destroy();
    emit_cache_invalidate();
    emit_size();
    emit_append();
    emit_get();
    emit_set();
    emit_insert();
    emit_delete();

    fault_fn_ = nullptr;
    inst_ = nullptr;
}

llvm::Function* ChainEmitter::declare(ListOp op) {
    const ListOpInfo& info = list_op_info(op);

    llvm::Type* ret = builder_.getVoidTy();
    if (info.returns_value) ret = inst_->element_ty;
    if (info.returns_size) ret = index_ty();

    std::vector<llvm::Type*> params{ptr_ty()};
    if (info.range != IndexRange::None) params.push_back(index_ty());
    if (info.takes_value) params.push_back(inst_->element_ty);

    llvm::FunctionType* fty =
        llvm::FunctionType::get(ret, params, /*isVarArg=*/false);
    llvm::Function* fn =
        llvm::Function::Create(fty, llvm::GlobalValue::ExternalLinkage,
                               list_symbol(inst_->name, op), module_);

    unsigned arg = 0;
    fn->getArg(arg++)->setName("this");
    if (info.range != IndexRange::None) fn->getArg(arg++)->setName("index");
    if (info.takes_value) fn->getArg(arg++)->setName("value");

    inst_->fns[static_cast<std::size_t>(op)] = fn;
    return fn;
}

llvm::Value* ChainEmitter::field_ptr(llvm::Value* self, unsigned field) {
    return builder_.CreateStructGEP(inst_->list_ty, self, field);
}

llvm::Value* ChainEmitter::load_field(llvm::Value* self, unsigned field) {
    return builder_.CreateLoad(inst_->list_ty->getElementType(field),
                               field_ptr(self, field));
}

void ChainEmitter::store_field(llvm::Value* self, unsigned field,
                               llvm::Value* value) {
    builder_.CreateStore(value, field_ptr(self, field));
}

llvm::Value* ChainEmitter::node_next_ptr(llvm::Value* node) {
    return builder_.CreateStructGEP(inst_->node_ty, node, kNext, "next.ptr");
}

llvm::Value* ChainEmitter::new_node(llvm::Value* value, llvm::Value* next) {
    const llvm::DataLayout& dl = module_.getDataLayout();
    std::uint64_t bytes = dl.getTypeAllocSize(inst_->node_ty).getFixedValue();
    llvm::Value* node = builder_.CreateCall(
        malloc_fn(), {llvm::ConstantInt::get(size_t_ty(), bytes)}, "node");
    builder_.CreateStore(
        value, builder_.CreateStructGEP(inst_->node_ty, node, kValue));
    builder_.CreateStore(next, node_next_ptr(node));
    return node;
}

void ChainEmitter::adjust_size(llvm::Value* self, std::int64_t delta) {
    llvm::Value* size = load_field(self, kSize);
    llvm::Value* updated = builder_.CreateAdd(
        size, llvm::ConstantInt::getSigned(index_ty(), delta), "size");
    store_field(self, kSize, updated);
}

void ChainEmitter::invalidate(llvm::Value* self) {
    builder_.CreateCall(inst_->fn(ListOp::CacheInvalidate), {self});
}

// Follows `count` successor links from `start`, stopping early at a null
// link. Leaves the builder in the exit block and returns the cursor and the
// number of links that could not be followed.
std::pair<llvm::Value*, llvm::Value*> ChainEmitter::emit_walk(
    llvm::Function* fn, llvm::Value* start, llvm::Value* count,
    std::string_view prefix) {
    const std::string p(prefix);
    llvm::BasicBlock* pre = builder_.GetInsertBlock();
    llvm::BasicBlock* loop = llvm::BasicBlock::Create(ctx_, p + ".loop", fn);
    llvm::BasicBlock* step = llvm::BasicBlock::Create(ctx_, p + ".step", fn);
    llvm::BasicBlock* done = llvm::BasicBlock::Create(ctx_, p + ".done", fn);
    builder_.CreateBr(loop);

    builder_.SetInsertPoint(loop);
    llvm::PHINode* cursor = builder_.CreatePHI(ptr_ty(), 2, "cursor");
    llvm::PHINode* remaining = builder_.CreatePHI(index_ty(), 2, "remaining");
    cursor->addIncoming(start, pre);
    remaining->addIncoming(count, pre);
    llvm::Value* at_end = builder_.CreateIsNull(cursor, "at_end");
    llvm::Value* arrived = builder_.CreateICmpEQ(
        remaining, llvm::ConstantInt::get(index_ty(), 0), "arrived");
    builder_.CreateCondBr(builder_.CreateOr(at_end, arrived), done, step);

    builder_.SetInsertPoint(step);
    llvm::Value* next =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(cursor), "next");
    llvm::Value* left = builder_.CreateSub(
        remaining, llvm::ConstantInt::get(index_ty(), 1), "remaining.dec");
    cursor->addIncoming(next, step);
    remaining->addIncoming(left, step);
    builder_.CreateBr(loop);

    builder_.SetInsertPoint(done);
    return {cursor, remaining};
}

llvm::BasicBlock* ChainEmitter::fault_block(llvm::Function* fn, ListOp op) {
    llvm::BasicBlock* bb = llvm::BasicBlock::Create(ctx_, "bounds.fault", fn);
    const std::string symbol = list_symbol(inst_->name, op);
    const std::string message =
        "panic: index out of bounds in " + symbol + "!\n";

    llvm::IRBuilder<> b(bb);
    llvm::GlobalVariable* text =
        b.CreateGlobalString(message, symbol + ".fault_msg", 0, &module_);
    b.CreateCall(fault_fn_,
                 {text, llvm::ConstantInt::get(size_t_ty(), message.size())});
    b.CreateUnreachable();
    return bb;
}

// Shared by get/set: resolves `index` to its element, starting from the
// cached element when the request lies at or after the cached index. The
// cache is only updated once the element is known to exist.
llvm::Value* ChainEmitter::emit_locate(llvm::Function* fn, ListOp op,
                                       llvm::Value* self, llvm::Value* index) {
    llvm::BasicBlock* fault = fault_block(fn, op);
    llvm::BasicBlock* entry = builder_.GetInsertBlock();
    llvm::Value* head = load_field(self, kHead);
    llvm::Value* start = head;
    llvm::Value* count = index;

    if (access_cache_) {
        llvm::BasicBlock* check =
            llvm::BasicBlock::Create(ctx_, "cache.check", fn);
        llvm::BasicBlock* hit = llvm::BasicBlock::Create(ctx_, "cache.hit", fn);
        llvm::BasicBlock* merge =
            llvm::BasicBlock::Create(ctx_, "cache.merge", fn);

        llvm::Value* valid = load_field(self, kCacheValid);
        builder_.CreateCondBr(valid, check, merge);

        builder_.SetInsertPoint(check);
        llvm::Value* cached_index = load_field(self, kCacheIndex);
        llvm::Value* ahead =
            builder_.CreateICmpUGE(index, cached_index, "ahead");
        builder_.CreateCondBr(ahead, hit, merge);

        builder_.SetInsertPoint(hit);
        llvm::Value* cached = load_field(self, kCacheElement);
        llvm::Value* rest = builder_.CreateSub(index, cached_index, "rest");
        builder_.CreateBr(merge);

        builder_.SetInsertPoint(merge);
        llvm::PHINode* start_phi = builder_.CreatePHI(ptr_ty(), 3, "start");
        start_phi->addIncoming(head, entry);
        start_phi->addIncoming(head, check);
        start_phi->addIncoming(cached, hit);
        llvm::PHINode* count_phi = builder_.CreatePHI(index_ty(), 3, "count");
        count_phi->addIncoming(index, entry);
        count_phi->addIncoming(index, check);
        count_phi->addIncoming(rest, hit);
        start = start_phi;
        count = count_phi;
    }

    auto [cursor, remaining] = emit_walk(fn, start, count, "walk");
    llvm::Value* short_chain = builder_.CreateICmpNE(
        remaining, llvm::ConstantInt::get(index_ty(), 0), "short");
    llvm::Value* missing = builder_.CreateIsNull(cursor, "missing");
    llvm::BasicBlock* found = llvm::BasicBlock::Create(ctx_, "found", fn);
    builder_.CreateCondBr(builder_.CreateOr(short_chain, missing), fault,
                          found);

    builder_.SetInsertPoint(found);
    if (access_cache_) {
        store_field(self, kCacheValid, builder_.getTrue());
        store_field(self, kCacheIndex, index);
        store_field(self, kCacheElement, cursor);
    }
    return cursor;
}

void ChainEmitter::emit_bounds_fault() {
    llvm::FunctionType* fty =
        llvm::FunctionType::get(builder_.getVoidTy(), {ptr_ty(), size_t_ty()},
                                /*isVarArg=*/false);
    fault_fn_ = llvm::Function::Create(fty, llvm::GlobalValue::InternalLinkage,
                                       inst_->name + "_bounds_fault", module_);
    fault_fn_->addFnAttr(llvm::Attribute::NoReturn);
    fault_fn_->addFnAttr(llvm::Attribute::Cold);
    fault_fn_->addFnAttr(llvm::Attribute::NoInline);
    llvm::Value* text = fault_fn_->getArg(0);
    llvm::Value* len = fault_fn_->getArg(1);
    text->setName("message");
    len->setName("len");

    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fault_fn_));
    builder_.CreateCall(write_fn(), {builder_.getInt32(kStderrFd), text, len});
    auto trap = llvm::Intrinsic::getDeclaration(&module_,
                                                llvm::Intrinsic::trap);
    builder_.CreateCall(trap);
    builder_.CreateUnreachable();
}

void ChainEmitter::emit_create() {
    llvm::Function* fn = inst_->fn(ListOp::Create);
    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn));
    llvm::Value* self = fn->getArg(0);
    llvm::Value* null = llvm::ConstantPointerNull::get(ptr_ty());

    store_field(self, kHead, null);
    store_field(self, kTail, null);
    store_field(self, kCacheValid, builder_.getFalse());
    store_field(self, kCacheIndex, builder_.getInt64(0));
    store_field(self, kCacheElement, null);
    store_field(self, kSize, builder_.getInt64(0));
    builder_.CreateRetVoid();
}

// Frees every element and leaves the list empty, as after `create`.
void ChainEmitter::emit_destroy() {
    llvm::Function* fn = inst_->fn(ListOp::Destroy);
    llvm::BasicBlock* entry = llvm::BasicBlock::Create(ctx_, "entry", fn);
    llvm::BasicBlock* loop = llvm::BasicBlock::Create(ctx_, "free.loop", fn);
    llvm::BasicBlock* release =
        llvm::BasicBlock::Create(ctx_, "free.node", fn);
    llvm::BasicBlock* done = llvm::BasicBlock::Create(ctx_, "free.done", fn);
    llvm::Value* self = fn->getArg(0);

    builder_.SetInsertPoint(entry);
    llvm::Value* head = load_field(self, kHead);
    builder_.CreateBr(loop);

    builder_.SetInsertPoint(loop);
    llvm::PHINode* cursor = builder_.CreatePHI(ptr_ty(), 2, "cursor");
    cursor->addIncoming(head, entry);
    builder_.CreateCondBr(builder_.CreateIsNull(cursor), done, release);

    builder_.SetInsertPoint(release);
    llvm::Value* next =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(cursor), "next");
    builder_.CreateCall(free_fn(), {cursor});
    cursor->addIncoming(next, release);
    builder_.CreateBr(loop);

    builder_.SetInsertPoint(done);
    builder_.CreateCall(inst_->fn(ListOp::Create), {self});
    builder_.CreateRetVoid();
}

void ChainEmitter::emit_cache_invalidate() {
    llvm::Function* fn = inst_->fn(ListOp::CacheInvalidate);
    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn));
    store_field(fn->getArg(0), kCacheValid, builder_.getFalse());
    builder_.CreateRetVoid();
}

void ChainEmitter::emit_size() {
    llvm::Function* fn = inst_->fn(ListOp::Size);
    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn));
    builder_.CreateRet(load_field(fn->getArg(0), kSize));
}

void ChainEmitter::emit_append() {
    llvm::Function* fn = inst_->fn(ListOp::Append);
    llvm::BasicBlock* entry = llvm::BasicBlock::Create(ctx_, "entry", fn);
    llvm::BasicBlock* empty =
        llvm::BasicBlock::Create(ctx_, "append.empty", fn);
    llvm::BasicBlock* link = llvm::BasicBlock::Create(ctx_, "append.link", fn);
    llvm::BasicBlock* done = llvm::BasicBlock::Create(ctx_, "append.done", fn);
    llvm::Value* self = fn->getArg(0);
    llvm::Value* value = fn->getArg(1);

    builder_.SetInsertPoint(entry);
    invalidate(self);
    llvm::Value* node =
        new_node(value, llvm::ConstantPointerNull::get(ptr_ty()));
    llvm::Value* head = load_field(self, kHead);
    builder_.CreateCondBr(builder_.CreateIsNull(head, "is_empty"), empty,
                          link);

    builder_.SetInsertPoint(empty);
    store_field(self, kHead, node);
    store_field(self, kTail, node);
    builder_.CreateBr(done);

    builder_.SetInsertPoint(link);
    llvm::Value* tail = load_field(self, kTail);
    builder_.CreateStore(node, node_next_ptr(tail));
    store_field(self, kTail, node);
    builder_.CreateBr(done);

    builder_.SetInsertPoint(done);
    adjust_size(self, 1);
    builder_.CreateRetVoid();
}

void ChainEmitter::emit_get() {
    llvm::Function* fn = inst_->fn(ListOp::Get);
    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn));
    llvm::Value* element =
        emit_locate(fn, ListOp::Get, fn->getArg(0), fn->getArg(1));
    llvm::Value* value = builder_.CreateLoad(
        inst_->element_ty,
        builder_.CreateStructGEP(inst_->node_ty, element, kValue), "value");
    builder_.CreateRet(value);
}

void ChainEmitter::emit_set() {
    llvm::Function* fn = inst_->fn(ListOp::Set);
    builder_.SetInsertPoint(llvm::BasicBlock::Create(ctx_, "entry", fn));
    llvm::Value* element =
        emit_locate(fn, ListOp::Set, fn->getArg(0), fn->getArg(1));
    builder_.CreateStore(
        fn->getArg(2),
        builder_.CreateStructGEP(inst_->node_ty, element, kValue));
    builder_.CreateRetVoid();
}

void ChainEmitter::emit_insert() {
    llvm::Function* fn = inst_->fn(ListOp::Insert);
    llvm::BasicBlock* entry = llvm::BasicBlock::Create(ctx_, "entry", fn);
    llvm::BasicBlock* fault = fault_block(fn, ListOp::Insert);
    llvm::BasicBlock* front = llvm::BasicBlock::Create(ctx_, "front", fn);
    llvm::BasicBlock* front_tail =
        llvm::BasicBlock::Create(ctx_, "front.tail", fn);
    llvm::BasicBlock* inner = llvm::BasicBlock::Create(ctx_, "inner", fn);
    llvm::BasicBlock* link = llvm::BasicBlock::Create(ctx_, "inner.link", fn);
    llvm::BasicBlock* link_tail =
        llvm::BasicBlock::Create(ctx_, "inner.tail", fn);
    llvm::BasicBlock* done = llvm::BasicBlock::Create(ctx_, "done", fn);
    llvm::Value* self = fn->getArg(0);
    llvm::Value* index = fn->getArg(1);
    llvm::Value* value = fn->getArg(2);

    builder_.SetInsertPoint(entry);
    invalidate(self);
    builder_.CreateCondBr(
        builder_.CreateICmpEQ(index, builder_.getInt64(0), "at_front"), front,
        inner);

    builder_.SetInsertPoint(front);
    llvm::Value* head = load_field(self, kHead);
    llvm::Value* first = new_node(value, head);
    store_field(self, kHead, first);
    builder_.CreateCondBr(builder_.CreateIsNull(head, "was_empty"), front_tail,
                          done);

    builder_.SetInsertPoint(front_tail);
    store_field(self, kTail, first);
    builder_.CreateBr(done);

    // Walk to `index - 1`; the new element goes right after it.
    builder_.SetInsertPoint(inner);
    llvm::Value* inner_head = load_field(self, kHead);
    llvm::Value* before = builder_.CreateSub(index, builder_.getInt64(1));
    auto [prev, remaining] = emit_walk(fn, inner_head, before, "walk");
    llvm::Value* bad = builder_.CreateOr(
        builder_.CreateICmpNE(remaining, builder_.getInt64(0)),
        builder_.CreateIsNull(prev));
    builder_.CreateCondBr(bad, fault, link);

    builder_.SetInsertPoint(link);
    llvm::Value* after =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(prev), "after");
    llvm::Value* node = new_node(value, after);
    builder_.CreateStore(node, node_next_ptr(prev));
    builder_.CreateCondBr(builder_.CreateIsNull(after, "at_end"), link_tail,
                          done);

    builder_.SetInsertPoint(link_tail);
    store_field(self, kTail, node);
    builder_.CreateBr(done);

    builder_.SetInsertPoint(done);
    adjust_size(self, 1);
    builder_.CreateRetVoid();
}

void ChainEmitter::emit_delete() {
    llvm::Function* fn = inst_->fn(ListOp::Delete);
    llvm::BasicBlock* entry = llvm::BasicBlock::Create(ctx_, "entry", fn);
    llvm::BasicBlock* fault = fault_block(fn, ListOp::Delete);
    llvm::BasicBlock* front = llvm::BasicBlock::Create(ctx_, "front", fn);
    llvm::BasicBlock* front_unlink =
        llvm::BasicBlock::Create(ctx_, "front.unlink", fn);
    llvm::BasicBlock* front_clear =
        llvm::BasicBlock::Create(ctx_, "front.clear_tail", fn);
    llvm::BasicBlock* inner = llvm::BasicBlock::Create(ctx_, "inner", fn);
    llvm::BasicBlock* check = llvm::BasicBlock::Create(ctx_, "inner.check", fn);
    llvm::BasicBlock* unlink =
        llvm::BasicBlock::Create(ctx_, "inner.unlink", fn);
    llvm::BasicBlock* retail =
        llvm::BasicBlock::Create(ctx_, "inner.retail", fn);
    llvm::BasicBlock* release =
        llvm::BasicBlock::Create(ctx_, "inner.free", fn);
    llvm::BasicBlock* done = llvm::BasicBlock::Create(ctx_, "done", fn);
    llvm::Value* self = fn->getArg(0);
    llvm::Value* index = fn->getArg(1);

    builder_.SetInsertPoint(entry);
    invalidate(self);
    builder_.CreateCondBr(
        builder_.CreateICmpEQ(index, builder_.getInt64(0), "at_front"), front,
        inner);

    builder_.SetInsertPoint(front);
    llvm::Value* head = load_field(self, kHead);
    builder_.CreateCondBr(builder_.CreateIsNull(head, "is_empty"), fault,
                          front_unlink);

    builder_.SetInsertPoint(front_unlink);
    llvm::Value* second =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(head), "second");
    store_field(self, kHead, second);
    builder_.CreateCall(free_fn(), {head});
    adjust_size(self, -1);
    builder_.CreateCondBr(builder_.CreateIsNull(second, "now_empty"),
                          front_clear, done);

    builder_.SetInsertPoint(front_clear);
    store_field(self, kTail, llvm::ConstantPointerNull::get(ptr_ty()));
    builder_.CreateBr(done);

    // Walk to `index - 1`; its successor is the victim.
    builder_.SetInsertPoint(inner);
    llvm::Value* inner_head = load_field(self, kHead);
    llvm::Value* before = builder_.CreateSub(index, builder_.getInt64(1));
    auto [prev, remaining] = emit_walk(fn, inner_head, before, "walk");
    llvm::Value* bad = builder_.CreateOr(
        builder_.CreateICmpNE(remaining, builder_.getInt64(0)),
        builder_.CreateIsNull(prev));
    builder_.CreateCondBr(bad, fault, check);

    builder_.SetInsertPoint(check);
    llvm::Value* victim =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(prev), "victim");
    builder_.CreateCondBr(builder_.CreateIsNull(victim), fault, unlink);

    builder_.SetInsertPoint(unlink);
    llvm::Value* after =
        builder_.CreateLoad(ptr_ty(), node_next_ptr(victim), "after");
    builder_.CreateStore(after, node_next_ptr(prev));
    builder_.CreateCondBr(builder_.CreateIsNull(after, "was_tail"), retail,
                          release);

    builder_.SetInsertPoint(retail);
    store_field(self, kTail, prev);
    builder_.CreateBr(release);

    builder_.SetInsertPoint(release);
    builder_.CreateCall(free_fn(), {victim});
    adjust_size(self, -1);
    builder_.CreateBr(done);

    builder_.SetInsertPoint(done);
    builder_.CreateRetVoid();
}

}  // namespace tapl
