#include "session.hpp"

#include <utility>

namespace mlc {

void Session::error(Span span, std::string message) {
    diags.push_back(Diagnostic{.severity = Severity::Error,
                               .span = span,
                               .message = std::move(message)});
}

void Session::report(const InternalError& e) {
    error(e.span(), std::string("internal compiler error: ") + e.what());
}

bool Session::has_errors() const { return error_count() != 0; }

std::size_t Session::error_count() const {
    std::size_t n = 0;
    for (const auto& d : diags) {
        if (d.severity == Severity::Error) n++;
    }
    return n;
}

}  // namespace mlc
