#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "source.hpp"

namespace mlc {

enum class Severity : std::uint8_t { Error, Warning, Note };

struct Diagnostic {
    Severity severity = Severity::Error;
    Span span{};
    std::string message{};
};

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);

// Raised when lowering meets input that earlier phases should have rejected
// (missing bindings, eliminated IR variants, ill-typed operator uses, absent
// runtime symbols). It is never a user error; the module emitter turns it
// into an error diagnostic and abandons the module.
class InternalError : public std::runtime_error {
   public:
    InternalError(std::string message, Span span)
        : std::runtime_error(message), span_(span) {}

    Span span() const { return span_; }

   private:
    Span span_{};
};

[[noreturn]] void internal_error(std::string message, Span span = Span{});

}  // namespace mlc
