#include "support.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/object_store.hpp"
#include "clonekit/pack.hpp"
#include "clonekit/repo.hpp"

using namespace testsupport;
using clonekit::ObjectKind;

namespace {

constexpr std::uint8_t kCommit = 1;
constexpr std::uint8_t kBlob = 3;
constexpr std::uint8_t kTag = 4;
constexpr std::uint8_t kOfsDelta = 6;
constexpr std::uint8_t kRefDelta = 7;

clonekit::oid blob_id(std::string_view s) {
  return clonekit::ObjectStore::hash_object(ObjectKind::Blob, to_bytes(s));
}

} // namespace

int main() {
  try {
    // ---- inflate reports how much compressed input it used
    {
      auto two = clonekit::fs::z_compress(to_bytes("first"));
      const std::size_t first_len = two.size();
      const auto second = clonekit::fs::z_compress(to_bytes("second"));
      two.insert(two.end(), second.begin(), second.end());

      clonekit::ByteReader in{two};
      if (to_string(in.inflate()) != "first" || in.bytes_consumed_by_last_inflate() != first_len ||
          in.position() != first_len) {
        std::cerr << "first inflate consumed the wrong amount\n";
        return 1;
      }
      if (to_string(in.inflate()) != "second" || !in.at_end()) {
        std::cerr << "second inflate did not end the stream\n";
        return 1;
      }
    }

    // ---- one blob entry reproduces the id of a direct write
    {
      const TempDir tmp{"pack_blob"};
      const clonekit::Repository repo{tmp.path()};
      repo.init_layout();
      const auto store = repo.objects();

      const auto pack = PackBuilder{}.add(kBlob, to_bytes("hello\n")).finish();
      const auto stats = clonekit::pack::unpack(store, pack);
      if (stats.entries != 1 || stats.objects != 1 || stats.deltas != 0) {
        std::cerr << "unexpected stats for one-blob pack\n";
        return 1;
      }
      const std::string direct = store.write(ObjectKind::Blob, to_bytes("hello\n"));
      if (direct != "e965047ad7c57865823c7d992b1d046ea66edf78" || !store.contains(direct)) {
        std::cerr << "packed blob not stored under its id\n";
        return 1;
      }
    }

    // ---- ref-delta inherits the base kind; base before and after the delta
    {
      const TempDir tmp{"pack_delta"};
      const clonekit::Repository repo{tmp.path()};
      repo.init_layout();
      const auto store = repo.objects();

      const std::string base = "line one\nline two\n";
      const std::string target = "line one\nline three\n";
      DeltaBuilder d{base.size(), target.size()};
      d.copy(0, 15).insert("hree\n");

      // chained: second delta is against the first delta's result
      const std::string target2 = "line one\n";
      DeltaBuilder d2{target.size(), target2.size()};
      d2.copy(0, 9);

      const auto pack = PackBuilder{}
                            .add(kRefDelta, d2.data(), blob_id(target))
                            .add(kRefDelta, d.data(), blob_id(base))
                            .add(kBlob, to_bytes(base))
                            .finish();
      const auto stats = clonekit::pack::unpack(store, pack);
      if (stats.objects != 3 || stats.deltas != 2) {
        std::cerr << "expected 3 objects / 2 deltas, got " << stats.objects << " / "
                  << stats.deltas << "\n";
        return 1;
      }
      const auto obj = store.read(clonekit::to_hex(blob_id(target)));
      const auto obj2 = store.read(clonekit::to_hex(blob_id(target2)));
      if (obj.kind != ObjectKind::Blob || to_string(obj.data) != target ||
          to_string(obj2.data) != target2) {
        std::cerr << "delta result wrong\n";
        return 1;
      }
    }

    // ---- delta against a commit is stored as a commit
    {
      const TempDir tmp{"pack_commit_delta"};
      const clonekit::Repository repo{tmp.path()};
      repo.init_layout();
      const auto store = repo.objects();
      const std::string base = "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n\nfirst\n";
      const std::string target = "tree 4b825dc642cb6eb9a060e54bf8d69288fbee4904\n\nsecond\n";
      DeltaBuilder d{base.size(), target.size()};
      d.copy(0, 47).insert("second\n");
      const auto base_id = clonekit::ObjectStore::hash_object(ObjectKind::Commit, to_bytes(base));
      const auto pack =
          PackBuilder{}.add(kCommit, to_bytes(base)).add(kRefDelta, d.data(), base_id).finish();
      (void)clonekit::pack::unpack(store, pack);
      const auto id = clonekit::ObjectStore::hash_object(ObjectKind::Commit, to_bytes(target));
      if (store.read(clonekit::to_hex(id)).kind != ObjectKind::Commit) {
        std::cerr << "delta on a commit should produce a commit\n";
        return 1;
      }
    }

    // ---- failures
    const TempDir tmp{"pack_errors"};
    const clonekit::Repository repo{tmp.path()};
    repo.init_layout();
    const auto store = repo.objects();

    auto bad_magic = PackBuilder{}.add(kBlob, to_bytes("x")).finish();
    bad_magic[0] = 'J';
    if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                     [&] { (void)clonekit::pack::unpack(store, bad_magic); })) {
      std::cerr << "bad magic should be ProtocolError\n";
      return 1;
    }

    auto bad_sum = PackBuilder{}.add(kBlob, to_bytes("x")).finish();
    bad_sum.back() ^= 0x01;
    if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                     [&] { (void)clonekit::pack::unpack(store, bad_sum); })) {
      std::cerr << "bad trailer should be ProtocolError\n";
      return 1;
    }

    auto no_sum = PackBuilder{}.add(kBlob, to_bytes("x")).finish();
    no_sum.resize(no_sum.size() - clonekit::consts::kPackTrailerLen);
    if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                     [&] { (void)clonekit::pack::unpack(store, no_sum); })) {
      std::cerr << "missing trailer should be ProtocolError\n";
      return 1;
    }

    const auto tag = PackBuilder{}.add(kTag, to_bytes("object ...")).finish();
    if (!throws_kind(clonekit::ErrorKind::UnsupportedPackEntry,
                     [&] { (void)clonekit::pack::unpack(store, tag); })) {
      std::cerr << "tag entry should be UnsupportedPackEntry\n";
      return 1;
    }

    const auto ofs = PackBuilder{}.add(kBlob, to_bytes("a")).add(kOfsDelta, to_bytes("zz")).finish();
    if (!throws_kind(clonekit::ErrorKind::UnsupportedPackEntry,
                     [&] { (void)clonekit::pack::unpack(store, ofs); })) {
      std::cerr << "offset-delta entry should be UnsupportedPackEntry\n";
      return 1;
    }

    const auto reserved = PackBuilder{}.add(5, to_bytes("a")).finish();
    if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                     [&] { (void)clonekit::pack::unpack(store, reserved); })) {
      std::cerr << "type 5 should be ProtocolError\n";
      return 1;
    }

    const auto wrong_size = PackBuilder{}.add_raw(kBlob, 4, to_bytes("abc")).finish();
    if (!throws_kind(clonekit::ErrorKind::CorruptObject,
                     [&] { (void)clonekit::pack::unpack(store, wrong_size); })) {
      std::cerr << "declared size mismatch should be CorruptObject\n";
      return 1;
    }

    DeltaBuilder orphan{3, 3};
    orphan.copy(0, 3);
    const auto missing_base =
        PackBuilder{}.add(kRefDelta, orphan.data(), blob_id("not in this pack")).finish();
    if (!throws_kind(clonekit::ErrorKind::NotFound,
                     [&] { (void)clonekit::pack::unpack(store, missing_base); })) {
      std::cerr << "unresolvable ref-delta should be NotFound\n";
      return 1;
    }

    // one entry announced, none present
    auto short_pack = PackBuilder{}.finish();
    short_pack.resize(clonekit::consts::kPackHeaderLen);
    short_pack[11] = 1;
    if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                     [&] { (void)clonekit::pack::unpack(store, short_pack); })) {
      std::cerr << "entry count past the data should be ProtocolError\n";
      return 1;
    }

    // count says two entries, the checksummed body holds one
    {
      auto over = PackBuilder{}.add(kBlob, to_bytes("x")).finish();
      over[11] = 2;
      resign_pack(over);
      try {
        (void)clonekit::pack::unpack(store, over);
        std::cerr << "overstated entry count should throw\n";
        return 1;
      } catch (const clonekit::Error &e) {
        if (e.kind() != clonekit::ErrorKind::ProtocolError ||
            std::string_view(e.what()).find("after 1 of 2 entries") == std::string_view::npos) {
          std::cerr << "overstated entry count: " << e.what() << "\n";
          return 1;
        }
      }
    }

    // bytes between the last entry and the trailer
    {
      auto stray = PackBuilder{}.add(kBlob, to_bytes("x")).finish();
      stray.insert(stray.end() - clonekit::consts::kPackTrailerLen, {0x00, 0x00});
      resign_pack(stray);
      if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                       [&] { (void)clonekit::pack::unpack(store, stray); })) {
        std::cerr << "stray bytes before the trailer should be ProtocolError\n";
        return 1;
      }
    }

    // compressed payload cut short inside a correctly signed pack
    {
      const std::string text(200, 'q');
      auto cut = PackBuilder{}.add(kBlob, to_bytes(text + "tail")).finish();
      cut.erase(cut.end() - clonekit::consts::kPackTrailerLen - 6,
                cut.end() - clonekit::consts::kPackTrailerLen);
      resign_pack(cut);
      if (!throws_kind(clonekit::ErrorKind::ProtocolError,
                       [&] { (void)clonekit::pack::unpack(store, cut); })) {
        std::cerr << "truncated entry payload should be ProtocolError\n";
        return 1;
      }
    }

    // a declared size far beyond memory must not be trusted for allocation
    {
      const auto huge = PackBuilder{}.add_raw(kBlob, 1ULL << 62U, to_bytes("x")).finish();
      if (!throws_kind(clonekit::ErrorKind::CorruptObject,
                       [&] { (void)clonekit::pack::unpack(store, huge); })) {
        std::cerr << "huge declared size should be CorruptObject\n";
        return 1;
      }
    }

    std::cout << "pack OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
