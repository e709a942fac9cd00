#include "support.hpp"

#include "clonekit/commit.hpp"
#include "clonekit/config.hpp"
#include "clonekit/object_store.hpp"
#include "clonekit/pkt_line.hpp"
#include "clonekit/remote.hpp"
#include "clonekit/repo.hpp"
#include "clonekit/tree.hpp"

using namespace testsupport;
using clonekit::ObjectKind;
using clonekit::ObjectStore;

namespace {

constexpr std::uint8_t kCommit = 1;
constexpr std::uint8_t kTree = 2;
constexpr std::uint8_t kBlob = 3;
constexpr std::uint8_t kRefDelta = 7;

const std::string kUrl = "https://example.test/team/project.git";

std::string advertise(const std::string &head_hex) {
  namespace pkt = clonekit::pkt;
  return pkt::encode("# service=git-upload-pack\n") + pkt::flush() +
         pkt::encode(head_hex + " HEAD" + std::string(1, '\0') +
                     "multi_ack symref=HEAD:refs/heads/main agent=git/2.43\n") +
         pkt::encode(head_hex + " refs/heads/main\n") + pkt::flush();
}

bytes nak_then(const bytes &pack) {
  bytes out = to_bytes("0008NAK\n");
  out.insert(out.end(), pack.begin(), pack.end());
  return out;
}

bool is_exec(const fs::path &p) {
  return (fs::status(p).permissions() & fs::perms::owner_exec) != fs::perms::none;
}

clonekit::CommitInfo commit_for(const clonekit::oid &tree) {
  return clonekit::CommitInfo{
      .tree_hex = clonekit::to_hex(tree),
      .parents = {},
      .author = "Fixture Author <author@example.test> 1714412345 +0000",
      .committer = "Fixture Author <author@example.test> 1714412345 +0000",
      .message = "initial\n"};
}

// One commit, one tree, two blobs (one executable), no deltas.
int clone_flat_fixture() {
  const bytes hello = to_bytes("hello\n");
  const bytes script = to_bytes("#!/bin/sh\necho hi\n");
  const auto hello_id = ObjectStore::hash_object(ObjectKind::Blob, hello);
  const auto script_id = ObjectStore::hash_object(ObjectKind::Blob, script);

  const auto tree_payload = clonekit::tree::encode({
      {.mode = clonekit::consts::kModeFile, .name = "hello.txt", .id = hello_id},
      {.mode = clonekit::consts::kModeExec, .name = "run.sh", .id = script_id},
  });
  const auto tree_id = ObjectStore::hash_object(ObjectKind::Tree, tree_payload);
  const auto commit_payload = clonekit::commit::encode(commit_for(tree_id));
  const std::string commit_hex =
      clonekit::to_hex(ObjectStore::hash_object(ObjectKind::Commit, commit_payload));

  const auto pack = PackBuilder{}
                        .add(kCommit, commit_payload)
                        .add(kTree, tree_payload)
                        .add(kBlob, hello)
                        .add(kBlob, script)
                        .finish();
  FixtureRemote remote{advertise(commit_hex), nak_then(pack)};

  const TempDir tmp{"clone_flat"};
  const fs::path dst = tmp.path() / "project";
  const auto res = clonekit::remote::clone_repo(remote, kUrl + "/", dst);

  if (remote.gets != std::vector<std::string>{kUrl + "/info/refs?service=git-upload-pack"} ||
      remote.posts != std::vector<std::string>{kUrl + "/git-upload-pack"} ||
      remote.last_content_type != "application/x-git-upload-pack-request") {
    std::cerr << "unexpected requests\n";
    return 1;
  }
  if (remote.last_post_body != "0032want " + commit_hex + "\n0000" + "0009done\n") {
    std::cerr << "negotiation body wrong: " << remote.last_post_body << "\n";
    return 1;
  }
  if (res.pack.entries != 4 || res.pack.objects != 4 || res.files.size() != 2) {
    std::cerr << "clone result counts wrong\n";
    return 1;
  }

  if (slurp(dst / "hello.txt") != "hello\n" || slurp(dst / "run.sh") != "#!/bin/sh\necho hi\n") {
    std::cerr << "file contents wrong\n";
    return 1;
  }
  if (is_exec(dst / "hello.txt") || !is_exec(dst / "run.sh")) {
    std::cerr << "executable bits wrong\n";
    return 1;
  }
  if (slurp(dst / ".git/HEAD") != "ref: refs/heads/main\n" ||
      slurp(dst / ".git/refs/heads/main") != commit_hex + "\n") {
    std::cerr << "refs wrong\n";
    return 1;
  }
  const auto cfg = clonekit::load_remote_config(dst);
  if (cfg.url != kUrl || cfg.branch != "main") {
    std::cerr << "config wrong: " << cfg.url << " / " << cfg.branch << "\n";
    return 1;
  }

  // Every object is readable from the clone's store under its content id.
  const clonekit::Repository repo{dst};
  if (repo.read_blob(clonekit::to_hex(hello_id)) != hello ||
      clonekit::commit::read(repo.objects(), commit_hex).tree_hex != clonekit::to_hex(tree_id)) {
    std::cerr << "objects not readable after clone\n";
    return 1;
  }

  // A second clone into the now non-empty directory is refused up front.
  FixtureRemote again{advertise(commit_hex), nak_then(pack)};
  try {
    (void)clonekit::remote::clone_repo(again, kUrl, dst);
    std::cerr << "clone into non-empty dir should fail\n";
    return 1;
  } catch (const std::runtime_error &) {
  }
  if (!again.gets.empty()) {
    std::cerr << "refused clone still talked to the remote\n";
    return 1;
  }
  return 0;
}

// Nested directory and a blob shipped as a ref-delta against another blob.
int clone_nested_delta_fixture() {
  const std::string base_text = "shared prefix line\nbase tail\n";
  const std::string derived_text = "shared prefix line\nderived tail\n";
  const auto base_id = ObjectStore::hash_object(ObjectKind::Blob, to_bytes(base_text));
  const auto derived_id = ObjectStore::hash_object(ObjectKind::Blob, to_bytes(derived_text));

  DeltaBuilder d{base_text.size(), derived_text.size()};
  d.copy(0, 19).insert("derived tail\n");

  const auto sub_payload = clonekit::tree::encode({
      {.mode = clonekit::consts::kModeExec, .name = "tool", .id = derived_id},
  });
  const auto sub_id = ObjectStore::hash_object(ObjectKind::Tree, sub_payload);
  const auto root_payload = clonekit::tree::encode({
      {.mode = clonekit::consts::kModeFile, .name = "base.txt", .id = base_id},
      {.mode = clonekit::consts::kModeTree, .name = "bin", .id = sub_id},
  });
  const auto root_id = ObjectStore::hash_object(ObjectKind::Tree, root_payload);
  const auto commit_payload = clonekit::commit::encode(commit_for(root_id));
  const std::string commit_hex =
      clonekit::to_hex(ObjectStore::hash_object(ObjectKind::Commit, commit_payload));

  const auto pack = PackBuilder{}
                        .add(kCommit, commit_payload)
                        .add(kTree, root_payload)
                        .add(kTree, sub_payload)
                        .add(kBlob, to_bytes(base_text))
                        .add(kRefDelta, d.data(), base_id)
                        .finish();
  FixtureRemote remote{advertise(commit_hex), pack}; // no NAK line this time

  const TempDir tmp{"clone_nested"};
  const auto res = clonekit::remote::clone_repo(remote, kUrl, tmp.path());

  if (res.pack.deltas != 1 || res.files.size() != 2 || res.files[0].path != "base.txt" ||
      res.files[1].path != "bin/tool") {
    std::cerr << "nested clone result wrong\n";
    return 1;
  }
  if (slurp(tmp.path() / "bin/tool") != derived_text || !is_exec(tmp.path() / "bin/tool")) {
    std::cerr << "delta-encoded file wrong\n";
    return 1;
  }
  return 0;
}

// The remote fails the ref discovery request.
int clone_transport_failure() {
  class Refusing final : public clonekit::http::Client {
  public:
    auto get(const std::string &url) -> bytes override {
      throw clonekit::Error(clonekit::ErrorKind::TransportError, "HTTP 403 from " + url);
    }
    auto post(const std::string &, std::string_view, std::span<const std::uint8_t>) -> bytes override {
      return {};
    }
  };
  Refusing remote;
  const TempDir tmp{"clone_refused"};
  if (!throws_kind(clonekit::ErrorKind::TransportError,
                   [&] { (void)clonekit::remote::clone_repo(remote, kUrl, tmp.path() / "x"); })) {
    std::cerr << "transport failure should surface as TransportError\n";
    return 1;
  }
  return 0;
}

} // namespace

int main() {
  try {
    if (clone_flat_fixture() != 0 || clone_nested_delta_fixture() != 0 ||
        clone_transport_failure() != 0) {
      return 1;
    }
    std::cout << "clone_fixture OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
