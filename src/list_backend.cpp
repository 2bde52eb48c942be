#include "list_backend.hpp"

#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/LegacyPassManager.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_os_ostream.h>
#include <llvm/Support/raw_ostream.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/ADT/Triple.h>

#include <memory>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

#include "session.hpp"
#include "target.hpp"

namespace tapl {
namespace {

class ListBackend {
   public:
    ListBackend(Session& session, const TypeStore& types,
                const TargetSpec& target)
        : session_(session),
          types_(types),
          target_(target),
          module_(std::make_unique<llvm::Module>("tapl", ctx_)) {}

    bool run(const std::vector<TypeId>& elements,
             const ListLoweringOptions& lowering,
             const ListEmitOptions& opts) {
        target_machine_ = create_target_machine(session_, target_);
        if (!target_machine_) return false;

        module_->setTargetTriple(llvm::Triple(target_.triple).str());
        module_->setDataLayout(target_machine_->createDataLayout());

        ListLowering lists(session_, types_, *module_, lowering);
        (void)lists.resolve_prelude();
        for (TypeId elem : elements) (void)lists.resolve(elem, Span{});

        if (session_.has_errors()) return false;
        if (!verify_module()) return false;

        if (!write_outputs(opts)) return false;
        return !session_.has_errors();
    }

   private:
    Session& session_;
    const TypeStore& types_;
    const TargetSpec& target_;

    llvm::LLVMContext ctx_{};
    std::unique_ptr<llvm::Module> module_{};
    std::unique_ptr<llvm::TargetMachine> target_machine_{};

    void error(std::string message) { session_.error(Span{}, std::move(message)); }

    bool verify_module() {
        std::string out{};
        llvm::raw_string_ostream os(out);
        if (!llvm::verifyModule(*module_, &os)) return true;
        error("LLVM module verification failed:\n" + os.str());
        return false;
    }

    bool open(const std::filesystem::path& path,
              std::unique_ptr<llvm::raw_fd_ostream>& out) {
        std::error_code ec{};
        out = std::make_unique<llvm::raw_fd_ostream>(path.string(), ec,
                                                     llvm::sys::fs::OF_None);
        if (ec) {
            error("failed to open output file `" + path.string() +
                  "`: " + ec.message());
            return false;
        }
        return true;
    }

    bool write_ll(const std::filesystem::path& out_ll) {
        std::unique_ptr<llvm::raw_fd_ostream> out{};
        if (!open(out_ll, out)) return false;
        module_->print(*out, nullptr);
        return true;
    }

    bool write_bc(const std::filesystem::path& out_bc) {
        std::unique_ptr<llvm::raw_fd_ostream> out{};
        if (!open(out_bc, out)) return false;
        llvm::WriteBitcodeToFile(*module_, *out);
        return true;
    }

    bool write_obj(const std::filesystem::path& out_obj) {
        std::unique_ptr<llvm::raw_fd_ostream> out{};
        if (!open(out_obj, out)) return false;

        llvm::legacy::PassManager pm;
        if (target_machine_->addPassesToEmitFile(
                pm, *out, nullptr, llvm::CGFT_ObjectFile)) {
            error("LLVM target does not support object emission");
            return false;
        }
        pm.run(*module_);
        return true;
    }

    bool write_outputs(const ListEmitOptions& opts) {
        if (opts.out_ll && !write_ll(*opts.out_ll)) return false;
        if (opts.out_bc && !write_bc(*opts.out_bc)) return false;
        if (opts.out_obj && !write_obj(*opts.out_obj)) return false;
        if (opts.print_ir) {
            llvm::raw_os_ostream os(*opts.print_ir);
            module_->print(os, nullptr);
        }
        return true;
    }
};

}  // namespace

bool emit_list_runtime(Session& session, const TypeStore& types,
                       const TargetSpec& target,
                       const std::vector<TypeId>& elements,
                       const ListLoweringOptions& lowering,
                       const ListEmitOptions& opts) {
    ListBackend backend(session, types, target);
    return backend.run(elements, lowering, opts);
}

}  // namespace tapl
