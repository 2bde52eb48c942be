#include <gtest/gtest.h>

#include <llvm/ExecutionEngine/Orc/ExecutionUtils.h>
#include <llvm/ExecutionEngine/Orc/LLJIT.h>
#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/TargetSelect.h>

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "chain_list.hpp"
#include "list_lowering.hpp"
#include "session.hpp"
#include "types.hpp"

namespace tapl {
namespace {

// Host view of `%list_<code>`.
struct RawList {
    void* head = nullptr;
    void* tail = nullptr;
    bool cache_valid = false;
    std::uint64_t cache_index = 0;
    void* cache_element = nullptr;
    std::uint64_t size = 0;
};

template <typename T>
struct ListFns {
    void (*create)(RawList*) = nullptr;
    void (*destroy)(RawList*) = nullptr;
    std::uint64_t (*size)(RawList*) = nullptr;
    void (*add)(RawList*, T) = nullptr;
    T (*get)(RawList*, std::uint64_t) = nullptr;
    void (*set)(RawList*, std::uint64_t, T) = nullptr;
    void (*insert)(RawList*, std::uint64_t, T) = nullptr;
    void (*del)(RawList*, std::uint64_t) = nullptr;
};

// Builds `u64 scenario()`: [1, 2, 3], insert(1, 9), del(0), set(2, 7), and
// returns 100 * xs[0] + 10 * xs[1] + xs[2].
bool emit_scenario(ListLowering& lists, TypeStore& types, llvm::Module& m) {
    llvm::LLVMContext& ctx = m.getContext();
    llvm::Function* fn = llvm::Function::Create(
        llvm::FunctionType::get(llvm::Type::getInt64Ty(ctx), false),
        llvm::GlobalValue::ExternalLinkage, "scenario", m);
    llvm::IRBuilder<> b(llvm::BasicBlock::Create(ctx, "entry", fn));
    TypeId u64 = types.int_(IntKind::U64);

    llvm::Value* elems[] = {b.getInt64(1), b.getInt64(2), b.getInt64(3)};
    llvm::Value* xs = lists.emit_literal(b, u64, elems, Span{}, "xs");
    if (!xs) return false;
    llvm::Value* insert_args[] = {b.getInt32(1), b.getInt64(9)};
    llvm::Value* del_args[] = {b.getInt32(0)};
    if (!lists.emit_method_call(b, u64, xs, "insert", insert_args, Span{}) ||
        !lists.emit_method_call(b, u64, xs, "del", del_args, Span{}) ||
        !lists.emit_index_store(b, u64, xs, b.getInt64(2), b.getInt64(7),
                                Span{}))
        return false;

    llvm::Value* total = b.getInt64(0);
    for (std::uint64_t i = 0; i < 3; i++) {
        llvm::Value* v =
            lists.emit_index_load(b, u64, xs, b.getInt64(i), Span{});
        if (!v) return false;
        total = b.CreateAdd(b.CreateMul(total, b.getInt64(10)), v);
    }
    if (!lists.emit_destroy(b, u64, xs, Span{})) return false;
    b.CreateRet(total);
    return true;
}

llvm::Expected<std::unique_ptr<llvm::orc::LLJIT>> build_jit(bool access_cache) {
    auto jit = llvm::orc::LLJITBuilder().create();
    if (!jit) return jit.takeError();

    auto ctx = std::make_unique<llvm::LLVMContext>();
    auto module = std::make_unique<llvm::Module>("jit", *ctx);
    module->setDataLayout((*jit)->getDataLayout());
    module->setTargetTriple((*jit)->getTargetTriple().str());

    Session session{};
    TypeStore types{};
    ListLoweringOptions opts{};
    opts.access_cache = access_cache;
    {
        ListLowering lists(session, types, *module, opts);
        (void)lists.resolve_prelude();
        (void)lists.resolve(types.int_(IntKind::U64), Span{});
        (void)lists.resolve(types.float_(FloatKind::F64), Span{});
        (void)emit_scenario(lists, types, *module);
    }
    if (session.has_errors()) {
        std::string text{};
        for (const Diagnostic& d : session.diags) text += d.message + "\n";
        return llvm::createStringError(llvm::inconvertibleErrorCode(), text);
    }

    auto generator =
        llvm::orc::DynamicLibrarySearchGenerator::GetForCurrentProcess(
            (*jit)->getDataLayout().getGlobalPrefix());
    if (!generator) return generator.takeError();
    (*jit)->getMainJITDylib().addGenerator(std::move(*generator));

    if (auto err = (*jit)->addIRModule(
            llvm::orc::ThreadSafeModule(std::move(module), std::move(ctx))))
        return std::move(err);
    return jit;
}

class ChainJitTest : public ::testing::Test {
   protected:
    static inline std::unique_ptr<llvm::orc::LLJIT> cached_{};
    static inline std::unique_ptr<llvm::orc::LLJIT> plain_{};

    static void SetUpTestSuite() {
        llvm::InitializeNativeTarget();
        llvm::InitializeNativeTargetAsmPrinter();
        for (bool cache : {true, false}) {
            auto jit = build_jit(cache);
            if (!jit) {
                ADD_FAILURE() << llvm::toString(jit.takeError());
                continue;
            }
            (cache ? cached_ : plain_) = std::move(*jit);
        }
    }

    static void TearDownTestSuite() {
        cached_.reset();
        plain_.reset();
    }

    void SetUp() override {
        ASSERT_NE(cached_, nullptr);
        ASSERT_NE(plain_, nullptr);
    }

    template <typename Fn>
    static Fn* lookup(llvm::orc::LLJIT& jit, const std::string& name) {
        auto sym = jit.lookup(name);
        if (!sym) {
            ADD_FAILURE() << name << ": " << llvm::toString(sym.takeError());
            return nullptr;
        }
        return llvm::jitTargetAddressToPointer<Fn*>(sym->getAddress());
    }

    template <typename T>
    static ListFns<T> fns(llvm::orc::LLJIT& jit, const std::string& name) {
        ListFns<T> f{};
        f.create = lookup<void(RawList*)>(jit, name + "_create");
        f.destroy = lookup<void(RawList*)>(jit, name + "_destroy");
        f.size = lookup<std::uint64_t(RawList*)>(jit, name + "_size");
        f.add = lookup<void(RawList*, T)>(jit, name + "_add");
        f.get = lookup<T(RawList*, std::uint64_t)>(jit, name + "_get");
        f.set = lookup<void(RawList*, std::uint64_t, T)>(jit, name + "_set");
        f.insert =
            lookup<void(RawList*, std::uint64_t, T)>(jit, name + "_insert");
        f.del = lookup<void(RawList*, std::uint64_t)>(jit, name + "_del");
        return f;
    }
};

TEST_F(ChainJitTest, ConcreteScenario) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    EXPECT_EQ(f.size(&xs), 0u);
    for (std::uint64_t v : {1, 2, 3}) f.add(&xs, v);
    f.insert(&xs, 1, 9);
    f.del(&xs, 0);
    f.set(&xs, 2, 7);

    EXPECT_EQ(f.size(&xs), 3u);
    EXPECT_EQ(xs.size, 3u);
    EXPECT_EQ(f.get(&xs, 0), 9u);
    EXPECT_EQ(f.get(&xs, 1), 2u);
    EXPECT_EQ(f.get(&xs, 2), 7u);
    EXPECT_TRUE(xs.cache_valid);
    EXPECT_EQ(xs.cache_index, 2u);
    EXPECT_EQ(xs.cache_element, xs.tail);

    f.destroy(&xs);
    EXPECT_EQ(xs.size, 0u);
    EXPECT_EQ(xs.head, nullptr);
    EXPECT_EQ(xs.tail, nullptr);
    EXPECT_FALSE(xs.cache_valid);

    f.add(&xs, 4);
    EXPECT_EQ(f.get(&xs, 0), 4u);
    f.destroy(&xs);
}

TEST_F(ChainJitTest, CallSiteHelpersRunTheScenario) {
    auto* scenario = lookup<std::uint64_t()>(*cached_, "scenario");
    ASSERT_NE(scenario, nullptr);
    EXPECT_EQ(scenario(), 927u);

    auto* uncached = lookup<std::uint64_t()>(*plain_, "scenario");
    ASSERT_NE(uncached, nullptr);
    EXPECT_EQ(uncached(), 927u);
}

TEST_F(ChainJitTest, InsertAtFrontOfEmptyListSetsTail) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    f.insert(&xs, 0, 5);
    EXPECT_EQ(xs.tail, xs.head);
    f.add(&xs, 6);
    EXPECT_EQ(f.size(&xs), 2u);
    EXPECT_EQ(f.get(&xs, 0), 5u);
    EXPECT_EQ(f.get(&xs, 1), 6u);
    f.destroy(&xs);
}

TEST_F(ChainJitTest, DeleteLastRetails) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    for (std::uint64_t v : {1, 2, 3}) f.add(&xs, v);
    f.del(&xs, 2);
    f.add(&xs, 8);
    EXPECT_EQ(f.get(&xs, 2), 8u);
    f.del(&xs, 0);
    f.del(&xs, 0);
    f.del(&xs, 0);
    EXPECT_EQ(xs.head, nullptr);
    EXPECT_EQ(xs.tail, nullptr);
    f.destroy(&xs);
}

TEST_F(ChainJitTest, FloatElements) {
    ListFns<double> f = fns<double>(*cached_, "list_f64");
    RawList xs{};
    f.create(&xs);
    f.add(&xs, 1.5);
    f.insert(&xs, 0, -2.25);
    EXPECT_DOUBLE_EQ(f.get(&xs, 0), -2.25);
    EXPECT_DOUBLE_EQ(f.get(&xs, 1), 1.5);
    f.destroy(&xs);
}

// The emitted runtime, with and without the cache, agrees with the host
// implementation on random operation sequences.
TEST_F(ChainJitTest, MatchesHostRuntime) {
    ListFns<std::uint64_t> c = fns<std::uint64_t>(*cached_, "list_u64");
    ListFns<std::uint64_t> p = fns<std::uint64_t>(*plain_, "list_u64");
    RawList cached{};
    RawList plain{};
    c.create(&cached);
    p.create(&plain);
    ChainList<std::uint64_t> host{};

    std::mt19937_64 rng(7);
    for (int step = 0; step < 4000; step++) {
        const std::uint64_t value = rng() % 10000;
        const std::uint64_t n = host.size();
        const std::uint64_t choice = rng() % 6;
        if (n == 0 || choice == 0) {
            c.add(&cached, value);
            p.add(&plain, value);
            host.append(value);
        } else if (choice == 1) {
            const std::uint64_t i = rng() % (n + 1);
            c.insert(&cached, i, value);
            p.insert(&plain, i, value);
            host.insert(i, value);
        } else if (choice == 2) {
            const std::uint64_t i = rng() % n;
            c.del(&cached, i);
            p.del(&plain, i);
            host.erase(i);
        } else if (choice == 3) {
            const std::uint64_t i = rng() % n;
            c.set(&cached, i, value);
            p.set(&plain, i, value);
            host.set(i, value);
        } else {
            const std::uint64_t i = rng() % n;
            const std::uint64_t expected = host.get(i);
            ASSERT_EQ(c.get(&cached, i), expected) << "step " << step;
            ASSERT_EQ(p.get(&plain, i), expected) << "step " << step;
        }
        ASSERT_EQ(c.size(&cached), host.size());
        ASSERT_EQ(p.size(&plain), host.size());
    }

    // Ascending scan through the cache.
    for (std::uint64_t i = 0; i < host.size(); i++)
        ASSERT_EQ(c.get(&cached, i), host.get(i));

    c.destroy(&cached);
    p.destroy(&plain);
}

using ChainJitDeathTest = ChainJitTest;

TEST_F(ChainJitDeathTest, GetPastEndFaults) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    for (std::uint64_t v : {9, 2, 7}) f.add(&xs, v);
    EXPECT_DEATH((void)f.get(&xs, 5),
                 "panic: index out of bounds in list_u64_get!");
}

TEST_F(ChainJitDeathTest, CachedGetPastEndFaults) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    for (std::uint64_t v : {1, 2}) f.add(&xs, v);
    EXPECT_EQ(f.get(&xs, 1), 2u);
    EXPECT_DEATH((void)f.get(&xs, 2),
                 "panic: index out of bounds in list_u64_get!");
}

TEST_F(ChainJitDeathTest, UncachedSetFaults) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*plain_, "list_u64");
    RawList xs{};
    f.create(&xs);
    EXPECT_DEATH(f.set(&xs, 0, 1),
                 "panic: index out of bounds in list_u64_set!");
}

TEST_F(ChainJitDeathTest, DeleteOnEmptyFaults) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    EXPECT_DEATH(f.del(&xs, 0), "panic: index out of bounds in list_u64_del!");
}

TEST_F(ChainJitDeathTest, InsertPastSizeFaults) {
    ListFns<std::uint64_t> f = fns<std::uint64_t>(*cached_, "list_u64");
    RawList xs{};
    f.create(&xs);
    f.add(&xs, 1);
    EXPECT_DEATH(f.insert(&xs, 2, 0),
                 "panic: index out of bounds in list_u64_insert!");
}

}  // namespace
}  // namespace tapl
