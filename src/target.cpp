#include "target.hpp"

#include <llvm/ADT/StringMap.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/Support/Host.h>
#include <llvm/MC/SubtargetFeature.h>
#include <llvm/ADT/Triple.h>

#include <optional>
#include <string>
#include <string_view>

#include "session.hpp"

namespace tapl {
namespace {

void ensure_llvm_target_init() {
    static bool done = false;
    if (done) return;
    done = true;
    llvm::InitializeAllTargetInfos();
    llvm::InitializeAllTargets();
    llvm::InitializeAllTargetMCs();
    llvm::InitializeAllAsmParsers();
    llvm::InitializeAllAsmPrinters();
}

std::string host_features_string() {
    llvm::StringMap<bool> features{};
    llvm::sys::getHostCPUFeatures(features);
    llvm::SubtargetFeatures out{};
    for (const auto& f : features) out.AddFeature(f.getKey(), f.getValue());
    return out.getString();
}

const llvm::Target* lookup_target(Session& session, const std::string& triple) {
    std::string error{};
    const llvm::Target* target =
        llvm::TargetRegistry::lookupTarget(triple, error);
    if (!target) {
        session.error(Span{},
                      "LLVM target lookup failed for `" + triple + "`: " + error);
    }
    return target;
}

}  // namespace

std::unique_ptr<llvm::TargetMachine> create_target_machine(
    Session& session, const TargetSpec& target) {
    ensure_llvm_target_init();

    const llvm::Target* t = lookup_target(session, target.triple);
    if (!t) return nullptr;

    llvm::TargetOptions opts{};
    auto reloc = llvm::Optional<llvm::Reloc::Model>{};
    auto tm = std::unique_ptr<llvm::TargetMachine>(t->createTargetMachine(
        llvm::Triple(target.triple).str(), target.cpu, target.features, opts, reloc));
    if (!tm) {
        session.error(Span{}, "failed to create LLVM TargetMachine for `" +
                                  target.triple + "`");
    }
    return tm;
}

std::optional<TargetSpec> compute_target_spec(
    Session& session, std::optional<std::string_view> triple_arg) {
    // Prefer the process triple (what can run on this machine) over LLVM's
    // configured default triple.
    const std::string host_triple = llvm::sys::getProcessTriple();
    TargetSpec out{};
    out.triple = triple_arg ? std::string(*triple_arg) : host_triple;
    out.cpu = "generic";
    if (!triple_arg || out.triple == host_triple) {
        out.cpu = std::string(llvm::sys::getHostCPUName());
        out.features = host_features_string();
    }

    std::unique_ptr<llvm::TargetMachine> tm =
        create_target_machine(session, out);
    if (!tm) return std::nullopt;

    out.data_layout = tm->createDataLayout().getStringRepresentation();
    return out;
}

}  // namespace tapl
