#pragma once
#include <cstdint>
#include <string_view>

namespace strata::consts {

// Directory and file names
inline constexpr std::string_view kRepoDir      = "REPO";
inline constexpr std::string_view kDataDir      = "DATA";
inline constexpr std::string_view kMetadataFile = "metadatadir.txt";
inline constexpr std::string_view kCommitsFile  = "commits.txt";
inline constexpr std::string_view kLockFile     = "LOCK";
inline constexpr std::string_view kConfigFile   = "config";

// ——— Artifact name prefixes: "<PREFIX><rev>- <filename>" ———
inline constexpr std::string_view kLiveText      = "ET";
inline constexpr std::string_view kLiveBinary    = "EB";
inline constexpr std::string_view kHistText      = "HT";
inline constexpr std::string_view kHistBinary    = "HB";
inline constexpr std::string_view kDeleteMarker  = "D";
inline constexpr std::string_view kBackupPrefix  = "BAK";
inline constexpr std::string_view kRevSeparator  = "- ";
inline constexpr std::string_view kArtifactPattern = "^(ET|EB|HT|HB|D)(\\d+)- (.+)$";

// ——— Delta opcodes ———
inline constexpr char kOpInsert = 'i';
inline constexpr char kOpSkip   = 's';
inline constexpr char kOpCopy   = 'c';

// ——— Commit log markers ———
inline constexpr std::string_view kLogIndent      = "  ";
inline constexpr std::string_view kLogDirAdded    = "+d";
inline constexpr std::string_view kLogDirDeleted  = "-d";
inline constexpr std::string_view kLogFileAdded   = "+f";
inline constexpr std::string_view kLogFileChanged = "*f";
inline constexpr std::string_view kLogFileDeleted = "-f";

// ——— Config keys ———
inline constexpr std::string_view kKeyLogLevel = "log-level:";
inline constexpr std::string_view kEnvLogLevel = "STRATA_LOG";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kComma = ',';
inline constexpr char kLF    = '\n';

} // namespace strata::consts
