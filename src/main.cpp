#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "diag.hpp"
#include "list_backend.hpp"
#include "list_lowering.hpp"
#include "session.hpp"
#include "target.hpp"
#include "types.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--emit-llvm <out.ll>] [--emit-bc <out.bc>] "
                 "[--emit-obj <out.o>] [--target <triple>] "
                 "[--no-access-cache] [--no-prelude] <type>...\n";
}

int main(int argc, char** argv) {
    std::optional<std::string_view> emit_llvm{};
    std::optional<std::string_view> emit_bc{};
    std::optional<std::string_view> emit_obj{};
    std::optional<std::string_view> target_triple{};
    tapl::ListLoweringOptions lowering{};
    std::vector<int> type_args{};

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--emit-llvm") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_llvm = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-bc") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_bc = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--emit-obj") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_obj = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--target") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            target_triple = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--no-access-cache") {
            lowering.access_cache = false;
            continue;
        }
        if (arg == "--no-prelude") {
            lowering.prelude = false;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        }
        type_args.push_back(i);
    }

    if (type_args.empty()) {
        usage(argv[0]);
        return 2;
    }

    // Argument N is line N of `<command-line>`.
    std::vector<std::string> lines(argv + 1, argv + argc);
    tapl::Session session{};
    tapl::FileId cmdline =
        session.sources.add_virtual_file("<command-line>", std::move(lines));

    tapl::TypeStore types{};
    std::vector<tapl::TypeId> elements{};
    for (int i : type_args) {
        std::string_view spelling = argv[i];
        const auto line = static_cast<std::uint32_t>(i);
        tapl::Span span{
            .file = cmdline,
            .begin = {.line = line, .column = 1},
            .end = {.line = line,
                    .column = static_cast<std::uint32_t>(spelling.size() + 1)},
        };
        std::optional<tapl::TypeId> t = types.parse(spelling);
        if (!t) {
            session.error(span, "unknown element type `" +
                                    std::string(spelling) + "`");
            continue;
        }
        if (!types.is_concrete(*t)) {
            session.error(span, "`" + std::string(spelling) +
                                    "` cannot be a list element type");
            continue;
        }
        elements.push_back(*t);
    }

    std::optional<tapl::TargetSpec> target{};
    if (!session.has_errors())
        target = tapl::compute_target_spec(session, target_triple);

    if (!session.has_errors() && target) {
        tapl::ListEmitOptions opts{};
        if (emit_llvm)
            opts.out_ll = std::filesystem::path(std::string(*emit_llvm));
        if (emit_bc) opts.out_bc = std::filesystem::path(std::string(*emit_bc));
        if (emit_obj)
            opts.out_obj = std::filesystem::path(std::string(*emit_obj));
        if (!emit_llvm && !emit_bc && !emit_obj) opts.print_ir = &std::cout;
        (void)tapl::emit_list_runtime(session, types, *target, elements,
                                      lowering, opts);
    }

    if (session.has_errors()) {
        session.print_diagnostics(std::cerr);
        return 1;
    }
    return 0;
}
