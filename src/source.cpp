#include "source.hpp"

#include <utility>

namespace tapl {

FileId SourceManager::add_file(std::string path) {
    return add_virtual_file(std::move(path), {});
}

FileId SourceManager::add_virtual_file(std::string path,
                                       std::vector<std::string> lines) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(SourceFile{
        .id = id, .path = std::move(path), .lines = std::move(lines)});
    by_path_.insert({files_.back().path, id});
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

std::optional<std::string_view> SourceManager::line_text(
    FileId id, std::uint32_t line) const {
    if (!has_file(id)) return std::nullopt;
    const SourceFile& f = file(id);
    if (line == 0 || line > f.lines.size()) return std::nullopt;
    return std::string_view(f.lines[line - 1]);
}

}  // namespace tapl
