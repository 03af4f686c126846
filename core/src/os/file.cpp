#include <kiln/os/File.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace kiln::os {

ReadTextResult read_text_file(std::string_view path) {
    ReadTextResult r{};
    std::ifstream in{std::filesystem::path(path), std::ios::binary};
    if (!in) {
        r.err = std::string("cannot open file: ") + std::strerror(errno);
        return r;
    }
    r.text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        r.text.clear();
        r.err = "read error";
        return r;
    }
    // CRLF input reads as LF
    std::erase(r.text, '\r');
    r.ok = true;
    return r;
}

bool normalize_relative(std::string_view rel, std::string& out) {
    out.clear();
    if (rel.empty() || rel.front() == '/' || rel.front() == '\\') return false;
    if (rel.size() >= 2 && rel[1] == ':') return false;

    std::vector<std::string> parts{};
    std::string cur{};
    auto flush = [&]() -> bool {
        if (cur.empty() || cur == ".") {
            cur.clear();
            return true;
        }
        if (cur == "..") {
            if (parts.empty()) return false;
            parts.pop_back();
            cur.clear();
            return true;
        }
        parts.push_back(std::move(cur));
        cur.clear();
        return true;
    };

    for (const char c : rel) {
        if (c == '/' || c == '\\') {
            if (!flush()) return false;
            continue;
        }
        cur.push_back(c);
    }
    if (!flush()) return false;
    if (parts.empty()) return false;

    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out.push_back('/');
        out += parts[i];
    }
    return true;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view content, std::string& err) {
    err.clear();
    if (path.empty()) {
        err = "empty output path";
        return false;
    }

    std::error_code ec{};
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            err = "failed to create directory: " + path.parent_path().string();
            return false;
        }
    }

    const std::filesystem::path tmp = path.string() + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            err = "failed to open temporary file for write: " + tmp.string();
            return false;
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (!ofs.good()) {
            ofs.close();
            std::filesystem::remove(tmp, ec);
            err = "failed to write temporary file: " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code rm_ec{};
        std::filesystem::remove(tmp, rm_ec);
        err = "failed to move temporary file to final path: " + path.string();
        return false;
    }
    return true;
}

bool RealFileSystem::exists(std::string_view rel) const {
    std::error_code ec{};
    return std::filesystem::is_regular_file(root_ / std::filesystem::path(rel), ec);
}

} // namespace kiln::os
