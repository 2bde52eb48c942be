#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llvm {
class TargetMachine;
}  // namespace llvm

namespace tapl {

struct Session;

struct TargetSpec {
    std::string triple{};
    std::string cpu{};
    std::string features{};
    std::string data_layout{};
};

// Without an explicit triple, targets the running process with the host CPU
// and its features.
std::optional<TargetSpec> compute_target_spec(
    Session& session, std::optional<std::string_view> triple);

std::unique_ptr<llvm::TargetMachine> create_target_machine(
    Session& session, const TargetSpec& target);

}  // namespace tapl
