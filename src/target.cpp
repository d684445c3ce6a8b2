#include "target.hpp"

#include <llvm/ADT/StringMap.h>
#include <llvm/IR/DataLayout.h>
#include <llvm/MC/TargetRegistry.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Target/TargetMachine.h>
#include <llvm/TargetParser/Host.h>
#include <llvm/TargetParser/SubtargetFeature.h>
#include <llvm/TargetParser/Triple.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "session.hpp"

namespace mlc {
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

std::string host_features() {
    llvm::SubtargetFeatures out{};
    for (const auto& f : llvm::sys::getHostCPUFeatures())
        out.AddFeature(f.getKey(), f.getValue());
    return out.getString();
}

}  // namespace

std::optional<TargetSpec> compute_target_spec(
    Session& session, std::optional<std::string_view> triple_arg) {
    ensure_llvm_target_init();

    TargetSpec spec{};
    const std::string host = llvm::sys::getProcessTriple();
    spec.triple = triple_arg ? std::string(*triple_arg) : host;
    spec.cpu = "generic";
    // Host tuning only applies when the output runs where it is built.
    if (spec.triple == host) {
        spec.cpu = std::string(llvm::sys::getHostCPUName());
        spec.features = host_features();
    }

    std::string error{};
    const llvm::Target* target =
        llvm::TargetRegistry::lookupTarget(spec.triple, error);
    if (!target) {
        session.error(Span{}, "LLVM target lookup failed for `" +
                                  spec.triple + "`: " + error);
        return std::nullopt;
    }

    llvm::TargetOptions opts{};
    std::unique_ptr<llvm::TargetMachine> tm(target->createTargetMachine(
        llvm::Triple(spec.triple), spec.cpu, spec.features, opts,
        std::optional<llvm::Reloc::Model>{}));
    if (!tm) {
        session.error(Span{}, "failed to create LLVM TargetMachine for `" +
                                  spec.triple + "`");
        return std::nullopt;
    }

    spec.data_layout = tm->createDataLayout().getStringRepresentation();
    return spec;
}

}  // namespace mlc
