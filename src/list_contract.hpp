#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tapl {

// Operations every concrete `list[T]` implementation provides. The emitted
// runtime and the host `ChainList` follow the same contract:
// - ordered sequence, 0-based indices;
// - get/set/del accept [0, size), insert accepts [0, size] (size appends);
// - an index outside the accepted range is a fatal bounds fault.
enum class ListOp : std::uint8_t {
    Create,
    Destroy,
    CacheInvalidate,
    Size,
    Append,
    Get,
    Set,
    Insert,
    Delete,
};

inline constexpr std::size_t kListOpCount = 9;

enum class IndexRange : std::uint8_t {
    None,
    Element,   // [0, size)
    Position,  // [0, size]
};

struct ListOpInfo {
    ListOp op{};
    std::string_view suffix{};  // symbol suffix: `<definition>_<suffix>`
    std::string_view method{};  // source-level method name, empty if none
    IndexRange range = IndexRange::None;
    bool takes_value = false;
    bool returns_value = false;  // returns T
    bool returns_size = false;   // returns u64
    bool structural = false;     // changes links; invalidates the cache
};

const ListOpInfo& list_op_info(ListOp op);
const std::array<ListOpInfo, kListOpCount>& list_ops();

// Maps the method spelled in `name.method(...)` to its operation.
std::optional<ListOp> list_op_from_method(std::string_view method);

// Number of explicit arguments, not counting the list itself.
std::size_t list_op_arity(ListOp op);

std::string list_symbol(std::string_view definition, ListOp op);

}  // namespace tapl
