#include "diag.hpp"

#include <sstream>
#include <utility>

namespace mlc {

static const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Error:
            return "error";
        case Severity::Warning:
            return "warning";
        case Severity::Note:
            return "note";
    }
    return "error";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
    std::ostringstream out;
    out << sm.describe(d.span) << ": " << severity_name(d.severity) << ": "
        << d.message;
    return out.str();
}

void internal_error(std::string message, Span span) {
    throw InternalError(std::move(message), span);
}

}  // namespace mlc
