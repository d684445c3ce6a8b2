#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "diag.hpp"
#include "source.hpp"

namespace mlc {

struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    void error(Span span, std::string message);
    void report(const InternalError& e);

    bool has_errors() const;
    std::size_t error_count() const;
};

}  // namespace mlc
