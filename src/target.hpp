#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mlc {

struct Session;

// What the module emitter needs to know about the machine it targets. The
// data layout string sizes every heap record the runtime allocator is asked
// for, so it must come from the same TargetMachine that will emit the code.
struct TargetSpec {
    std::string triple{};
    std::string cpu{};
    std::string features{};
    std::string data_layout{};
};

// Queries LLVM's target registry; `triple` defaults to the process triple,
// in which case the host CPU and its features are used. Failures are
// reported to the session.
std::optional<TargetSpec> compute_target_spec(
    Session& session, std::optional<std::string_view> triple);

}  // namespace mlc
