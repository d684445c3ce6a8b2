#include "source.hpp"

#include <sstream>

namespace mlc {

FileId SourceManager::add_file(std::string path) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{.id = id, .path = std::move(path)});
    by_path_.insert({files_.back().path, id});
    return id;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

std::string SourceManager::describe(Span span) const {
    if (!span.known()) return "<unknown>";
    std::ostringstream out;
    out << (contains(span.file) ? path(span.file) : std::string("<input>"))
        << ":" << span.begin.line << ":" << span.begin.column;
    return out.str();
}

}  // namespace mlc
