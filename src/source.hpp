#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace mlc {

using FileId = std::uint32_t;

struct SourceLoc {
    std::uint32_t line = 0;
    std::uint32_t column = 0;
};

// Source position attached to IR instructions. A zero line means the
// instruction was synthesized and has no position.
struct Span {
    FileId file = 0;
    SourceLoc begin{};

    bool known() const { return begin.line != 0; }
};

struct SourceFile {
    FileId id = 0;
    std::string path{};
};

class SourceManager {
   public:
    FileId add_file(std::string path);

    const SourceFile& file(FileId id) const;
    const std::string& path(FileId id) const;
    bool contains(FileId id) const { return id < files_.size(); }

    // `path:line:col`, or `<unknown>` for synthesized positions.
    std::string describe(Span span) const;

   private:
    std::vector<SourceFile> files_{};
    std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace mlc
