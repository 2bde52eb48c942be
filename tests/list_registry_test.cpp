#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "list_contract.hpp"
#include "list_registry.hpp"
#include "types.hpp"

namespace tapl {
namespace {

TEST(ListRegistryTest, MangledNames) {
    TypeStore types{};
    EXPECT_EQ(mangle_element(types, types.int_(IntKind::U64)), "u64");
    EXPECT_EQ(mangle_element(types, types.bool_()), "u1");
    EXPECT_EQ(mangle_element(types, types.char_()), "char");
    EXPECT_EQ(mangle_element(types, types.float_(FloatKind::F32)), "f32");
    EXPECT_EQ(mangle_element(types, types.list(types.int_(IntKind::S16))),
              "Ls16");

    TypeId node = types.define_class("Node", {});
    EXPECT_EQ(mangle_element(types, node), "C4Node");
    EXPECT_EQ(mangle_element(types, types.list(types.list(node))), "LLC4Node");

    EXPECT_EQ(list_definition_name("u64"), "list_u64");
}

TEST(ListRegistryTest, NonConcreteElementsHaveNoName) {
    TypeStore types{};
    EXPECT_FALSE(mangle_element(types, types.void_()).has_value());
    EXPECT_FALSE(mangle_element(types, types.error()).has_value());
    EXPECT_FALSE(
        mangle_element(types, types.list(types.generic("T"))).has_value());
}

TEST(ListRegistryTest, StructurallyEqualTypesShareAName) {
    TypeStore types{};
    TypeStore other{};
    EXPECT_EQ(mangle_element(types, types.list(types.char_())),
              mangle_element(other, other.list(other.char_())));
}

// Class names that could run into a neighbouring code if the length prefix
// were missing.
TEST(ListRegistryTest, DistinctTypesNeverCollide) {
    TypeStore types{};
    std::vector<TypeId> elems{
        types.char_(),
        types.bool_(),
        types.int_(IntKind::U8),
        types.int_(IntKind::U64),
        types.int_(IntKind::S64),
        types.float_(FloatKind::F64),
        types.define_class("u8", {}),
        types.define_class("Lu8", {}),
        types.define_class("C2ab", {}),
        types.define_class("C", {}),
        types.define_class("C1", {}),
    };
    const std::size_t base = elems.size();
    for (std::size_t i = 0; i < base; i++) {
        elems.push_back(types.list(elems[i]));
        elems.push_back(types.list(types.list(elems[i])));
    }

    std::set<std::string> names{};
    std::set<std::string> symbols{};
    std::size_t symbol_count = 0;
    for (TypeId t : elems) {
        auto code = mangle_element(types, t);
        ASSERT_TRUE(code.has_value()) << types.to_string(t);
        const std::string name = list_definition_name(*code);
        EXPECT_TRUE(names.insert(name).second) << name;
        for (const ListOpInfo& info : list_ops()) {
            symbols.insert(list_symbol(name, info.op));
            symbol_count++;
        }
    }
    EXPECT_EQ(names.size(), elems.size());
    EXPECT_EQ(symbols.size(), symbol_count);
}

TEST(ListRegistryTest, FindAndAdd) {
    TypeStore types{};
    ListRegistry registry{};
    EXPECT_EQ(registry.find("list_u64"), nullptr);

    ListInstance& a = registry.add("list_u64", types.int_(IntKind::U64));
    ListInstance& b = registry.add("list_char", types.char_());
    EXPECT_EQ(registry.find("list_u64"), &a);
    EXPECT_EQ(registry.find("list_char"), &b);
    EXPECT_EQ(registry.size(), 2u);

    // First-use order.
    ASSERT_EQ(registry.instances().size(), 2u);
    EXPECT_EQ(registry.instances()[0]->name, "list_u64");
    EXPECT_EQ(registry.instances()[1]->name, "list_char");
}

TEST(ListContractTest, MethodsMapToOperations) {
    EXPECT_EQ(list_op_from_method("add"), ListOp::Append);
    EXPECT_EQ(list_op_from_method("del"), ListOp::Delete);
    EXPECT_EQ(list_op_from_method("size"), ListOp::Size);
    EXPECT_FALSE(list_op_from_method("create").has_value());
    EXPECT_FALSE(list_op_from_method("").has_value());
    EXPECT_FALSE(list_op_from_method("append").has_value());

    EXPECT_EQ(list_op_arity(ListOp::Size), 0u);
    EXPECT_EQ(list_op_arity(ListOp::Get), 1u);
    EXPECT_EQ(list_op_arity(ListOp::Insert), 2u);
    EXPECT_EQ(list_symbol("list_u8", ListOp::CacheInvalidate),
              "list_u8_cache_invalidate");
}

}  // namespace
}  // namespace tapl
