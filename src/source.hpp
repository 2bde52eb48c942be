#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tapl {

using FileId = std::uint32_t;

struct SourceLoc {
  std::uint32_t line = 1;
  std::uint32_t column = 1;
};

struct Span {
  FileId file = 0;
  SourceLoc begin{};
  SourceLoc end{};
};

struct SourceFile {
  FileId id = 0;
  std::string path{};
  // Only populated for virtual files (e.g. the driver's command line).
  std::vector<std::string> lines{};
};

class SourceManager {
 public:
  FileId add_file(std::string path);
  FileId add_virtual_file(std::string path, std::vector<std::string> lines);
  std::optional<FileId> find_file(std::string_view path) const;

  bool has_file(FileId id) const { return id < files_.size(); }
  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;
  std::optional<std::string_view> line_text(FileId id, std::uint32_t line) const;

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace tapl
