#pragma once
#include "clonekit/checkout.hpp"
#include "clonekit/pack.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace clonekit {

namespace http {
class Client; // fwd
}

namespace remote {

struct AdvertisedRef {
  std::string name; // "HEAD", "refs/heads/main", ...
  std::string hex;  // 40-hex object id

  friend bool operator==(const AdvertisedRef &, const AdvertisedRef &) = default;
};

struct RefAdvertisement {
  std::vector<AdvertisedRef> refs;       // in advertised order, HEAD included
  std::optional<std::string> head_symref; // from "symref=HEAD:<ref>"
  std::vector<std::string> capabilities;

  [[nodiscard]] auto head() const -> std::optional<std::string>;
};

// Parse an info/refs body: optional "# service=" banner + flush, then
// "<hex> <name>[\0caps]" lines up to the closing flush. Peeled ("^{}") lines
// and the empty-repository placeholder are dropped.
// Throws Error{ProtocolError} on malformed lines or unsafe ref names.
auto parse_ref_advertisement(std::span<const std::uint8_t> body) -> RefAdvertisement;

// Distinct advertised ids, first-seen order.
auto want_list(const RefAdvertisement &adv) -> std::vector<std::string>;

// "0032want <hex>\n"... "0000" "0009done\n"
auto build_upload_request(const std::vector<std::string> &wants) -> std::string;

// Skip an optional leading NAK/ACK pkt-line and return the bytes starting at
// "PACK". Throws Error{ProtocolError} if no pack follows (or the server sent
// an "ERR" line).
auto strip_ack(std::span<const std::uint8_t> body) -> std::span<const std::uint8_t>;

// Write HEAD (symbolic when advertised so) and every other ref under .git.
void persist_refs(const std::filesystem::path &repo_root, const RefAdvertisement &adv);

// GET <url>/info/refs?service=git-upload-pack
auto discover_refs(http::Client &client, const std::string &url) -> RefAdvertisement;

// POST <url>/git-upload-pack; returns the raw response body.
auto fetch_pack(http::Client &client, const std::string &url,
                const std::vector<std::string> &wants) -> std::vector<std::uint8_t>;

struct CloneResult {
  RefAdvertisement refs;
  pack::UnpackStats pack;
  std::vector<checkout::WrittenFile> files;
};

// Clone `url` into `dst` (created if missing; must be empty if present):
// discover refs, fetch and unpack one pack, write refs and config, then check
// out HEAD. A failure leaves whatever was already written in place.
auto clone_repo(http::Client &client, const std::string &url, const std::filesystem::path &dst)
    -> CloneResult;

} // namespace remote

} // namespace clonekit
