#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace clonekit {

// True for "refs/..." names that stay inside the refs directory
// (no empty, "." or ".." components, no backslashes or NULs).
bool is_safe_refname(std::string_view refname);

// Read HEAD file as raw string (e.g., "ref: refs/heads/main\n" or a 40-hex id).
// Returns std::nullopt if HEAD does not exist yet.
std::optional<std::string> read_HEAD(const std::filesystem::path& repo_root);

// Write symbolic HEAD: "ref: <refname>\n"
void set_HEAD_symbolic(const std::filesystem::path& repo_root, const std::string& refname);

void set_HEAD_detached(const std::filesystem::path& repo_root, std::string_view hex_oid);

// Read a ref file (e.g., "refs/heads/main") -> 40-hex OID (without trailing newline).
std::optional<std::string> read_ref(const std::filesystem::path& repo_root, const std::string& refname);

// Overwrite/create a ref with the given 40-hex OID (adds trailing newline on disk).
void update_ref(const std::filesystem::path& repo_root, const std::string& refname, const std::string& hex_oid);

// HEAD -> commit id, following at most one "ref: " indirection.
// Throws Error{NotFound} if HEAD or the branch it names is missing.
std::string resolve_HEAD(const std::filesystem::path& repo_root);

} // namespace clonekit
