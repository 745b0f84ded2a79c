#pragma once

#include "json.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guardian {

struct ManifestEntry {
    std::string digest;  // lowercase hex SHA-256
    std::string path;    // relative to the bundle directory
};

struct Manifest {
    std::optional<std::size_t> declared_records;
    std::optional<std::uint64_t> first;
    std::string anchor;   // previous_hash expected on the first record
    std::string created;
    std::vector<ManifestEntry> entries;
};

// Parses MANIFEST.sha256 text. Unknown comment lines are ignored; a malformed
// entry line throws std::runtime_error.
Manifest parse_manifest(std::string_view text);

struct FileCheck {
    std::string path;
    std::string expected;
    std::string actual;  // empty when the file is missing
    bool passed = false;
};

struct RecordCheck {
    std::uint64_t sequence = 0;
    std::string path;
    bool valid = false;
    std::string reason;  // empty when valid
};

struct VerificationReport {
    std::string bundle;  // directory name only
    std::vector<FileCheck> files;
    std::vector<RecordCheck> records;
    std::optional<std::size_t> declared_records;
    std::size_t record_count = 0;
    bool files_valid = false;
    bool chain_valid = false;
    bool count_matches = false;
    bool final_pass = false;
    std::vector<std::string> notes;
};

/**
 * Offline custody check of an exported bundle. Reads nothing outside the
 * bundle directory and never writes. Every listed file digest is checked,
 * then the records are replayed in sequence order: canonical re-encoding,
 * hash recomputation and the previous_hash link. A break at record k marks
 * k and every later record invalid.
 *
 * A missing or unreadable bundle yields a failing report, not an exception.
 */
VerificationReport verify_bundle(const std::filesystem::path& bundle_dir);

Json to_json(const VerificationReport& report);

} // namespace guardian
