#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace kiln::os {

struct ReadTextResult {
    bool ok = false;
    std::string text{};
    std::string err{};
};

ReadTextResult read_text_file(std::string_view path);

// Lexical normalization of a root-relative path: '/' separators, no "." parts.
// Returns false when the path is absolute, empty or climbs out of its root.
bool normalize_relative(std::string_view rel, std::string& out);

// Writes `<path>.tmp` and renames it over `path`. On failure the previous
// content of `path` is left in place.
bool write_file_atomic(const std::filesystem::path& path, std::string_view content, std::string& err);

class FileSystemView {
public:
    virtual ~FileSystemView() = default;

    // `rel` is relative to the project source directory.
    virtual bool exists(std::string_view rel) const = 0;
};

class RealFileSystem final : public FileSystemView {
public:
    explicit RealFileSystem(std::filesystem::path root) : root_(std::move(root)) {}

    bool exists(std::string_view rel) const override;

private:
    std::filesystem::path root_;
};

class MemoryFileSystem final : public FileSystemView {
public:
    void add(std::string rel) { files_.insert(std::move(rel)); }
    bool exists(std::string_view rel) const override { return files_.contains(std::string(rel)); }

private:
    std::set<std::string> files_{};
};

} // namespace kiln::os
