#include "clonekit/commit.hpp"

#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/object_store.hpp"
#include "clonekit/util.hpp"

#include <string>

namespace clonekit::commit {

auto decode(std::span<const std::uint8_t> payload) -> CommitInfo {
  const std::string text(payload.begin(), payload.end());

  CommitInfo info{};
  std::size_t pos = 0;
  bool first = true;

  for (;;) {
    const std::size_t nl = text.find(consts::kLF, pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (first) {
      if (!line.starts_with(consts::kTreePrefix) ||
          !looks_hex40(std::string_view(line).substr(consts::kTreePrefix.size()))) {
        throw Error(ErrorKind::CorruptObject, "commit parse: first line is not 'tree <oid>'");
      }
      info.tree_hex = line.substr(consts::kTreePrefix.size());
      first = false;
    } else if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size(), consts::kOidHexLen));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  return info;
}

auto encode(const CommitInfo &info) -> std::vector<std::uint8_t> {
  std::string txt;

  txt += consts::kTreePrefix;
  txt += info.tree_hex;
  txt += consts::kLF;

  for (const auto &p : info.parents) {
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  txt += consts::kAuthorPrefix;
  txt += info.author;
  txt += consts::kLF;

  txt += consts::kCommitterPrefix;
  txt += info.committer;
  txt += "\n\n";

  txt += info.message;
  return {txt.begin(), txt.end()};
}

auto read(const ObjectStore &store, std::string_view hex_oid) -> CommitInfo {
  const auto obj = store.read(hex_oid);
  if (obj.kind != ObjectKind::Commit) {
    throw Error(ErrorKind::CorruptObject, "object is not a commit: " + std::string(hex_oid));
  }
  return decode(obj.data);
}

} // namespace clonekit::commit
