#include "list_contract.hpp"

namespace tapl {
namespace {

constexpr std::array<ListOpInfo, kListOpCount> kOps{{
    {.op = ListOp::Create, .suffix = "create"},
    {.op = ListOp::Destroy, .suffix = "destroy", .structural = true},
    {.op = ListOp::CacheInvalidate, .suffix = "cache_invalidate"},
    {.op = ListOp::Size,
     .suffix = "size",
     .method = "size",
     .returns_size = true},
    {.op = ListOp::Append,
     .suffix = "add",
     .method = "add",
     .takes_value = true,
     .structural = true},
    {.op = ListOp::Get,
     .suffix = "get",
     .method = "get",
     .range = IndexRange::Element,
     .returns_value = true},
    {.op = ListOp::Set,
     .suffix = "set",
     .method = "set",
     .range = IndexRange::Element,
     .takes_value = true},
    {.op = ListOp::Insert,
     .suffix = "insert",
     .method = "insert",
     .range = IndexRange::Position,
     .takes_value = true,
     .structural = true},
    {.op = ListOp::Delete,
     .suffix = "del",
     .method = "del",
     .range = IndexRange::Element,
     .structural = true},
}};

}  // namespace

const ListOpInfo& list_op_info(ListOp op) {
    return kOps[static_cast<std::size_t>(op)];
}

const std::array<ListOpInfo, kListOpCount>& list_ops() { return kOps; }

std::optional<ListOp> list_op_from_method(std::string_view method) {
    if (method.empty()) return std::nullopt;
    for (const ListOpInfo& info : kOps) {
        if (info.method == method) return info.op;
    }
    return std::nullopt;
}

std::size_t list_op_arity(ListOp op) {
    const ListOpInfo& info = list_op_info(op);
    std::size_t n = 0;
    if (info.range != IndexRange::None) n++;
    if (info.takes_value) n++;
    return n;
}

std::string list_symbol(std::string_view definition, ListOp op) {
    std::string out(definition);
    out += "_";
    out += list_op_info(op).suffix;
    return out;
}

}  // namespace tapl
