#include "file_io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
    if (f.bad())
        throw std::runtime_error("Read error on file: " + path);
    return data;
}

std::string read_file_text(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    std::string data((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
    if (f.bad())
        throw std::runtime_error("Read error on file: " + path);
    return data;
}

void write_file(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot open file for writing: " + path);
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    f.close();
    if (!f)
        throw std::runtime_error("Write error on file: " + path);
}

void write_file(const std::string& path, const std::string& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
        throw std::runtime_error("Cannot open file for writing: " + path);
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.close();
    if (!f)
        throw std::runtime_error("Write error on file: " + path);
}

void copy_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open file: " + src);
    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("Cannot open file for writing: " + dst);
    out << in.rdbuf();
    out.close();
    if (!out || in.bad())
        throw std::runtime_error("Copy failed: " + src + " -> " + dst);
}

void make_directory(const std::string& path) {
    if (::mkdir(path.c_str(), 0755) == 0)
        return;
    int err = errno;
    struct stat st;
    if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
        return;
    throw DirectoryError("Directory \"" + path + "\" could not be created: " +
                         std::strerror(err));
}

void remove_tree(const std::string& path) noexcept {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    // Failures are ignored; see header.
}

void clear_directory(const std::string& path) {
    std::error_code ec;
    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec))
        children.push_back(it->path());
    if (ec)
        throw DirectoryError("Directory \"" + path + "\" could not be listed: " + ec.message());

    for (const auto& child : children) {
        std::filesystem::remove_all(child, ec);
        if (ec)
            throw DirectoryError("Stale entry \"" + child.string() + "\" could not be removed: " +
                                 ec.message());
    }
}

static void walk_into(const std::filesystem::path& dir,
                      const std::string& prefix,
                      std::vector<TreeEntry>& out)
{
    std::error_code ec;
    std::vector<std::filesystem::directory_entry> children;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        children.push_back(*it);
    if (ec)
        throw DirectoryError("Cannot list directory \"" + dir.string() + "\": " + ec.message());

    std::sort(children.begin(), children.end(),
              [](const auto& a, const auto& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& child : children) {
        std::string rel = prefix + child.path().filename().string();
        auto st = child.symlink_status(ec);
        if (ec) continue;
        if (std::filesystem::is_directory(st)) {
            out.push_back({rel, true});
            walk_into(child.path(), rel + "/", out);
        } else if (std::filesystem::is_regular_file(st)) {
            out.push_back({rel, false});
        }
    }
}

std::vector<TreeEntry> walk_tree(const std::string& root) {
    std::vector<TreeEntry> out;
    walk_into(root, "", out);
    return out;
}
