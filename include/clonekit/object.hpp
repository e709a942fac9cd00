#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace clonekit {

// Object kinds this store keeps. Annotated tags are not supported.
enum class ObjectKind : std::uint8_t { Blob, Tree, Commit };

[[nodiscard]] auto kind_name(ObjectKind kind) -> std::string_view;

// "blob" | "tree" | "commit" -> kind; anything else -> nullopt.
[[nodiscard]] auto parse_kind(std::string_view name) -> std::optional<ObjectKind>;

struct Object {
  ObjectKind kind;                   // blob | tree | commit
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

} // namespace clonekit
