#include "clonekit/pack.hpp"

#include "clonekit/byte_reader.hpp"
#include "clonekit/consts.hpp"
#include "clonekit/delta.hpp"
#include "clonekit/error.hpp"
#include "clonekit/object_store.hpp"
#include "clonekit/varint.hpp"

#include <algorithm>
#include <string>

namespace clonekit::pack {

auto entry_kind_name(PackEntryKind kind) -> std::string_view {
  switch (kind) {
  case PackEntryKind::Commit:
    return "commit";
  case PackEntryKind::Tree:
    return "tree";
  case PackEntryKind::Blob:
    return "blob";
  case PackEntryKind::Tag:
    return "tag";
  case PackEntryKind::OffsetDelta:
    return "ofs-delta";
  case PackEntryKind::RefDelta:
    return "ref-delta";
  }
  return "unknown";
}

auto to_entry_kind(std::uint8_t type) -> PackEntryKind {
  switch (type) {
  case 1:
  case 2:
  case 3:
  case 4:
  case 6:
  case 7:
    return static_cast<PackEntryKind>(type);
  default:
    throw Error(ErrorKind::ProtocolError, "pack: invalid entry type " + std::to_string(type));
  }
}

auto to_object_kind(PackEntryKind kind) -> ObjectKind {
  switch (kind) {
  case PackEntryKind::Commit:
    return ObjectKind::Commit;
  case PackEntryKind::Tree:
    return ObjectKind::Tree;
  case PackEntryKind::Blob:
    return ObjectKind::Blob;
  case PackEntryKind::Tag:
  case PackEntryKind::OffsetDelta:
  case PackEntryKind::RefDelta:
    break;
  }
  throw Error(ErrorKind::UnsupportedPackEntry,
              "pack: unsupported entry type " + std::string(entry_kind_name(kind)));
}

auto read_header(ByteReader &in) -> Header {
  const auto magic = in.read_bytes(consts::kPackMagic.size());
  if (!std::equal(magic.begin(), magic.end(), consts::kPackMagic.begin())) {
    throw Error(ErrorKind::ProtocolError, "pack: missing PACK signature");
  }
  Header hdr{};
  hdr.version = in.read_be32();
  if (hdr.version != 2 && hdr.version != 3) {
    throw Error(ErrorKind::ProtocolError,
                "pack: unsupported version " + std::to_string(hdr.version));
  }
  hdr.count = in.read_be32();
  return hdr;
}

auto read_entry(ByteReader &in) -> Entry {
  const std::size_t at = in.position();
  const auto hdr = varint::read_pack_entry_header(in);

  Entry e{};
  e.kind = to_entry_kind(hdr.type);
  e.declared_size = hdr.size;

  switch (e.kind) {
  case PackEntryKind::Commit:
  case PackEntryKind::Tree:
  case PackEntryKind::Blob:
    break;
  case PackEntryKind::RefDelta:
    e.base = oid_from_raw(in.read_bytes(consts::kOidRawLen));
    break;
  case PackEntryKind::Tag:
  case PackEntryKind::OffsetDelta:
    // Their payload framing is not decoded, so the cursor cannot move past
    // them reliably: stop here instead of misreading every later entry.
    throw Error(ErrorKind::UnsupportedPackEntry,
                "pack: unsupported " + std::string(entry_kind_name(e.kind)) +
                    " entry at offset " + std::to_string(at));
  }

  e.data = in.inflate(static_cast<std::size_t>(e.declared_size));
  if (e.data.size() != e.declared_size) {
    throw Error(ErrorKind::CorruptObject,
                "pack: entry at offset " + std::to_string(at) + " inflated to " +
                    std::to_string(e.data.size()) + " bytes, header says " +
                    std::to_string(e.declared_size));
  }
  return e;
}

namespace {

void verify_trailer(std::span<const std::uint8_t> body, std::span<const std::uint8_t> trailer) {
  const oid expected = sha1(body);
  if (!std::equal(expected.begin(), expected.end(), trailer.begin())) {
    throw Error(ErrorKind::ProtocolError, "pack: checksum mismatch (expected " +
                                              to_hex(expected) + ", got " +
                                              to_hex(oid_from_raw(trailer)) + ")");
  }
}

// Apply a ref-delta whose base is in the store; the result takes the base's kind.
void store_delta(const ObjectStore &store, const Entry &e) {
  const auto base = store.read(to_hex(*e.base));
  const auto target = delta::apply(base.data, e.data);
  (void)store.write(base.kind, target);
}

} // namespace

auto unpack(const ObjectStore &store, std::span<const std::uint8_t> pack_bytes) -> UnpackStats {
  ByteReader in{pack_bytes};
  const Header hdr = read_header(in);
  if (in.remaining() < consts::kPackTrailerLen) {
    throw Error(ErrorKind::ProtocolError, "pack: missing trailing checksum");
  }
  const std::size_t body_len = pack_bytes.size() - consts::kPackTrailerLen;
  verify_trailer(pack_bytes.first(body_len), pack_bytes.subspan(body_len));

  // Entries are read from the checksummed body only, never from the trailer.
  ByteReader body{pack_bytes.first(body_len)};
  (void)body.read_bytes(in.position());

  UnpackStats stats{};
  stats.entries = hdr.count;
  std::vector<Entry> pending;

  for (std::uint32_t i = 0; i < hdr.count; ++i) {
    if (body.at_end()) {
      throw Error(ErrorKind::ProtocolError, "pack: data ends after " + std::to_string(i) +
                                                " of " + std::to_string(hdr.count) + " entries");
    }
    Entry e = read_entry(body);
    if (e.kind == PackEntryKind::RefDelta) {
      if (store.contains(to_hex(*e.base))) {
        store_delta(store, e);
        ++stats.deltas;
        ++stats.objects;
      } else {
        pending.push_back(std::move(e));
      }
      continue;
    }
    (void)store.write(to_object_kind(e.kind), e.data);
    ++stats.objects;
  }

  if (!body.at_end()) {
    throw Error(ErrorKind::ProtocolError, "pack: " + std::to_string(body.remaining()) +
                                              " stray bytes after the last entry");
  }

  // Deltas against bases that came later in the pack (or against other deltas).
  while (!pending.empty()) {
    std::vector<Entry> still_pending;
    for (auto &e : pending) {
      if (store.contains(to_hex(*e.base))) {
        store_delta(store, e);
        ++stats.deltas;
        ++stats.objects;
      } else {
        still_pending.push_back(std::move(e));
      }
    }
    if (still_pending.size() == pending.size()) {
      throw Error(ErrorKind::NotFound,
                  "pack: ref-delta base not found: " + to_hex(*still_pending.front().base));
    }
    pending = std::move(still_pending);
  }

  return stats;
}

} // namespace clonekit::pack
