#include "clonekit/object.hpp"

#include "clonekit/consts.hpp"

namespace clonekit {

auto kind_name(ObjectKind kind) -> std::string_view {
  switch (kind) {
  case ObjectKind::Blob:
    return consts::kTypeBlob;
  case ObjectKind::Tree:
    return consts::kTypeTree;
  case ObjectKind::Commit:
    return consts::kTypeCommit;
  }
  return {};
}

auto parse_kind(std::string_view name) -> std::optional<ObjectKind> {
  if (name == consts::kTypeBlob) {
    return ObjectKind::Blob;
  }
  if (name == consts::kTypeTree) {
    return ObjectKind::Tree;
  }
  if (name == consts::kTypeCommit) {
    return ObjectKind::Commit;
  }
  return std::nullopt;
}

} // namespace clonekit
