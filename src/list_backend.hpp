#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <vector>

#include "list_lowering.hpp"
#include "types.hpp"

namespace tapl {

struct Session;
struct TargetSpec;

struct ListEmitOptions {
    std::optional<std::filesystem::path> out_ll{};
    std::optional<std::filesystem::path> out_bc{};
    std::optional<std::filesystem::path> out_obj{};
    std::ostream* print_ir = nullptr;  // textual IR, in addition to the files
};

// Builds one module holding the implementation of `list[T]` for every
// requested element type (in request order, after the prelude), verifies it
// and writes the requested outputs.
bool emit_list_runtime(Session& session, const TypeStore& types,
                       const TargetSpec& target,
                       const std::vector<TypeId>& elements,
                       const ListLoweringOptions& lowering,
                       const ListEmitOptions& opts);

}  // namespace tapl
