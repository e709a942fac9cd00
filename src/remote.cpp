#include "clonekit/remote.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/config.hpp"
#include "clonekit/consts.hpp"
#include "clonekit/error.hpp"
#include "clonekit/http.hpp"
#include "clonekit/pkt_line.hpp"
#include "clonekit/refs.hpp"
#include "clonekit/repo.hpp"
#include "clonekit/util.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <string_view>

namespace stdfs = std::filesystem;

namespace clonekit::remote {

namespace {

const std::string kZeroId(consts::kOidHexLen, '0');

[[noreturn]] void protocol_error(const std::string &what) {
  throw Error(ErrorKind::ProtocolError, "remote: " + what);
}

std::vector<std::string> split_capabilities(std::string_view caps) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < caps.size()) {
    const std::size_t sp = caps.find(consts::kSpace, pos);
    const auto tok = caps.substr(pos, sp == std::string_view::npos ? std::string_view::npos
                                                                    : sp - pos);
    if (!tok.empty()) {
      out.emplace_back(tok);
    }
    if (sp == std::string_view::npos) {
      break;
    }
    pos = sp + 1;
  }
  return out;
}

// "symref=HEAD:refs/heads/main" -> "refs/heads/main"
std::optional<std::string> head_symref_from(const std::vector<std::string> &caps) {
  constexpr std::string_view kHeadSource = "HEAD:";
  for (const auto &cap : caps) {
    std::string_view sv{cap};
    if (!sv.starts_with(consts::kSymrefCap)) {
      continue;
    }
    sv.remove_prefix(consts::kSymrefCap.size());
    if (!sv.starts_with(kHeadSource)) {
      continue;
    }
    sv.remove_prefix(kHeadSource.size());
    if (!is_safe_refname(sv)) {
      protocol_error("unsafe symref target '" + std::string(sv) + "'");
    }
    return std::string(sv);
  }
  return std::nullopt;
}

std::string trim_url(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

bool dir_is_empty(const stdfs::path &p) {
  return stdfs::directory_iterator(p) == stdfs::directory_iterator();
}

} // namespace

auto RefAdvertisement::head() const -> std::optional<std::string> {
  const auto it = std::ranges::find_if(
      refs, [](const AdvertisedRef &r) { return r.name == consts::kHeadRef; });
  if (it == refs.end()) {
    return std::nullopt;
  }
  return it->hex;
}

auto parse_ref_advertisement(std::span<const std::uint8_t> body) -> RefAdvertisement {
  const auto packets = pkt::split(body);
  std::size_t i = 0;

  // Smart servers open with "# service=git-upload-pack\n" and a flush.
  if (i < packets.size() && !packets[i].flush &&
      packets[i].payload.starts_with(consts::kServiceBanner)) {
    ++i;
    if (i < packets.size() && packets[i].flush) {
      ++i;
    }
  }

  RefAdvertisement adv;
  bool closed = false;
  for (; i < packets.size(); ++i) {
    if (packets[i].flush) {
      closed = true;
      break;
    }
    std::string_view line = pkt::chomp(packets[i].payload);

    const std::size_t nul = line.find(consts::kNul);
    if (nul != std::string_view::npos) {
      auto caps = split_capabilities(line.substr(nul + 1));
      adv.capabilities.insert(adv.capabilities.end(), caps.begin(), caps.end());
      line = line.substr(0, nul);
    }

    if (line.size() < consts::kOidHexLen + 2 || line[consts::kOidHexLen] != consts::kSpace ||
        !looks_hex40(line.substr(0, consts::kOidHexLen))) {
      protocol_error("malformed ref line '" + std::string(line) + "'");
    }
    std::string hex(line.substr(0, consts::kOidHexLen));
    std::ranges::transform(hex, hex.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    const std::string_view name = line.substr(consts::kOidHexLen + 1);

    if (name == consts::kCapabilitiesRef || name.ends_with(consts::kPeeledSuffix)) {
      continue;
    }
    if (name != consts::kHeadRef && !is_safe_refname(name)) {
      protocol_error("unsafe ref name '" + std::string(name) + "'");
    }
    adv.refs.push_back(AdvertisedRef{.name = std::string(name), .hex = std::move(hex)});
  }
  if (!closed) {
    protocol_error("ref advertisement is not terminated by a flush packet");
  }

  adv.head_symref = head_symref_from(adv.capabilities);
  return adv;
}

auto want_list(const RefAdvertisement &adv) -> std::vector<std::string> {
  std::vector<std::string> wants;
  std::set<std::string> seen;
  for (const auto &r : adv.refs) {
    if (r.hex == kZeroId) {
      continue;
    }
    if (seen.insert(r.hex).second) {
      wants.push_back(r.hex);
    }
  }
  return wants;
}

auto build_upload_request(const std::vector<std::string> &wants) -> std::string {
  std::string req;
  for (const auto &hex : wants) {
    req += pkt::encode(std::string(consts::kWantPrefix) + hex + "\n");
  }
  req += pkt::flush();
  req += pkt::encode(consts::kDoneLine);
  return req;
}

auto strip_ack(std::span<const std::uint8_t> body) -> std::span<const std::uint8_t> {
  const auto starts_with_pack = [](std::span<const std::uint8_t> b) {
    return b.size() >= consts::kPackMagic.size() &&
           std::equal(consts::kPackMagic.begin(), consts::kPackMagic.end(), b.begin());
  };
  if (starts_with_pack(body)) {
    return body;
  }

  ByteReader in{body};
  const auto first = pkt::read_packet(in);
  const std::string_view line = pkt::chomp(first.payload);
  if (line.starts_with("ERR ")) {
    protocol_error("server error: " + std::string(line.substr(4)));
  }
  if (first.flush || (line != pkt::chomp(consts::kNakLine) && !line.starts_with("ACK "))) {
    protocol_error("expected NAK before pack data");
  }
  if (!starts_with_pack(in.rest())) {
    protocol_error("missing PACK signature after " + std::string(line));
  }
  return in.rest();
}

void persist_refs(const stdfs::path &repo_root, const RefAdvertisement &adv) {
  for (const auto &r : adv.refs) {
    if (r.name != consts::kHeadRef) {
      update_ref(repo_root, r.name, r.hex);
    }
  }

  const auto head_hex = adv.head();
  if (adv.head_symref) {
    const bool target_advertised = std::ranges::any_of(
        adv.refs, [&](const AdvertisedRef &r) { return r.name == *adv.head_symref; });
    if (!target_advertised && head_hex) {
      update_ref(repo_root, *adv.head_symref, *head_hex);
    }
    set_HEAD_symbolic(repo_root, *adv.head_symref);
  } else if (head_hex) {
    set_HEAD_detached(repo_root, *head_hex);
  }
}

auto discover_refs(http::Client &client, const std::string &url) -> RefAdvertisement {
  const auto body = client.get(trim_url(url) + std::string(consts::kInfoRefsPath));
  return parse_ref_advertisement(body);
}

auto fetch_pack(http::Client &client, const std::string &url,
                const std::vector<std::string> &wants) -> std::vector<std::uint8_t> {
  const std::string request = build_upload_request(wants);
  return client.post(trim_url(url) + std::string(consts::kUploadPackPath),
                     consts::kUploadPackRequestType, as_bytes(request));
}

auto clone_repo(http::Client &client, const std::string &url, const stdfs::path &dst)
    -> CloneResult {
  if (stdfs::exists(dst) && (!stdfs::is_directory(dst) || !dir_is_empty(dst))) {
    throw std::runtime_error("destination path '" + dst.string() +
                             "' already exists and is not an empty directory");
  }
  stdfs::create_directories(dst);

  const Repository repo{dst};
  repo.init_layout();

  CloneResult result{};
  result.refs = discover_refs(client, url);
  persist_refs(dst, result.refs);

  const auto wants = want_list(result.refs);
  if (!wants.empty()) {
    const auto body = fetch_pack(client, url, wants);
    result.pack = pack::unpack(repo.objects(), strip_ack(body));
  }

  std::string branch;
  if (result.refs.head_symref && result.refs.head_symref->starts_with("refs/heads/")) {
    branch = result.refs.head_symref->substr(std::string_view("refs/heads/").size());
  }
  save_remote_config(dst, RemoteConfig{.url = trim_url(url), .branch = branch});

  if (result.refs.head()) {
    result.files = checkout::checkout_head(repo);
  }
  return result;
}

} // namespace clonekit::remote
