#pragma once
#include <cstdint>
#include <string_view>

namespace clonekit::consts {

// Directory and file names
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kRefsDir     = "refs";
inline constexpr std::string_view kHeadsDir    = "heads";
inline constexpr std::string_view kTagsDir     = "tags";
inline constexpr std::string_view kHeadFile    = "HEAD";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kHeadRef     = "HEAD";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";

// File modes (octal)
inline constexpr std::uint32_t kModeFile = 0100644; // regular file
inline constexpr std::uint32_t kModeExec = 0100755; // executable file
inline constexpr std::uint32_t kModeTree = 0040000; // directory entry in tree

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Pack stream ———
inline constexpr std::string_view kPackMagic   = "PACK";
inline constexpr std::size_t kPackHeaderLen    = 12; // magic + version + count
inline constexpr std::size_t kPackTrailerLen   = 20; // SHA-1 of everything before it

// ——— Smart HTTP (protocol v0/v1) ———
inline constexpr std::string_view kInfoRefsPath    = "/info/refs?service=git-upload-pack";
inline constexpr std::string_view kUploadPackPath  = "/git-upload-pack";
inline constexpr std::string_view kUploadPackRequestType =
    "application/x-git-upload-pack-request";
inline constexpr std::string_view kServiceBanner   = "# service=";
inline constexpr std::string_view kSymrefCap       = "symref=";
inline constexpr std::string_view kPeeledSuffix    = "^{}";
inline constexpr std::string_view kCapabilitiesRef = "capabilities^{}";

// ——— pkt-line ———
inline constexpr std::size_t kPktLenDigits    = 4;
inline constexpr std::size_t kPktMaxLen       = 65520;
inline constexpr std::string_view kFlushPkt   = "0000";
inline constexpr std::string_view kWantPrefix = "want ";
inline constexpr std::string_view kDoneLine   = "done\n";
inline constexpr std::string_view kNakLine    = "NAK\n";

inline constexpr std::string_view kDefaultUserAgent = "clonekit/1.0";

} // namespace clonekit::consts
