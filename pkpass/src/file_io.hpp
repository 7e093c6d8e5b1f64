#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Whole-file helpers. All throw std::runtime_error naming the path.

std::vector<uint8_t> read_file(const std::string& path);
std::string          read_file_text(const std::string& path);

void write_file(const std::string& path, const std::vector<uint8_t>& data);
void write_file(const std::string& path, const std::string& data);

// Byte-for-byte copy of src to dst (dst is truncated).
void copy_file(const std::string& src, const std::string& dst);

// mkdir with mode 0755. Succeeds if the directory already exists; throws
// DirectoryError for any other failure. Parents are not created.
void make_directory(const std::string& path);

// Best-effort removal of a file or directory tree. Missing paths and
// permission problems are ignored: cleanup must never mask the error that
// triggered it.
void remove_tree(const std::string& path) noexcept;

// Removes everything below path, keeping path itself. Throws
// DirectoryError if path cannot be listed or an entry cannot be removed.
void clear_directory(const std::string& path);

struct TreeEntry {
    std::string relative;   // forward-slash path below the root, no leading '/'
    bool        is_directory = false;
};

// Pre-order walk of everything below root: a directory's entry precedes
// its children, siblings are sorted by name. Symlinks and special files
// are skipped. Throws DirectoryError if root cannot be listed.
std::vector<TreeEntry> walk_tree(const std::string& root);
