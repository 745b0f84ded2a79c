#include "../include/guardian/verifier.hpp"
#include "../include/guardian/digest.hpp"
#include "../include/guardian/ledger.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace guardian {

namespace fs = std::filesystem;

namespace {

constexpr const char* kManifestName = "MANIFEST.sha256";

bool is_hex_digest(std::string_view text) {
    return text.size() == 64 && std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
    T value {};
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool escapes_bundle(const std::string& relative) {
    const fs::path path(relative);
    if (path.is_absolute()) {
        return true;
    }
    return std::any_of(path.begin(), path.end(), [](const fs::path& part) { return part == ".."; });
}

std::string bundle_name(const fs::path& bundle_dir) {
    fs::path normal = bundle_dir.lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.filename().string();
}

} // namespace

Manifest parse_manifest(std::string_view text) {
    Manifest manifest;
    std::size_t start = 0;
    std::size_t line_number = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string_view line = trim(text.substr(start, end - start));
        start = end + 1;
        ++line_number;
        if (line.empty()) {
            continue;
        }
        if (line.front() == '#') {
            const std::string_view body = trim(line.substr(1));
            const std::size_t space = body.find(' ');
            const std::string_view key = body.substr(0, space);
            const std::string_view value = space == std::string_view::npos ? std::string_view() : trim(body.substr(space));
            if (key == "records") {
                manifest.declared_records = parse_unsigned<std::size_t>(value);
                if (!manifest.declared_records) {
                    throw std::runtime_error("manifest line " + std::to_string(line_number) + ": bad record count");
                }
            } else if (key == "first") {
                manifest.first = parse_unsigned<std::uint64_t>(value);
                if (!manifest.first) {
                    throw std::runtime_error("manifest line " + std::to_string(line_number) + ": bad first sequence");
                }
            } else if (key == "anchor") {
                manifest.anchor = std::string(value);
            } else if (key == "created") {
                manifest.created = std::string(value);
            }
            continue;
        }

        const std::size_t gap = line.find_first_of(" \t");
        if (gap == std::string_view::npos) {
            throw std::runtime_error("manifest line " + std::to_string(line_number) + ": missing path");
        }
        std::string_view digest = line.substr(0, gap);
        std::string_view path = trim(line.substr(gap));
        if (!path.empty() && path.front() == '*') {
            path.remove_prefix(1);
        }
        if (!is_hex_digest(digest) || path.empty()) {
            throw std::runtime_error("manifest line " + std::to_string(line_number) + ": malformed entry");
        }
        manifest.entries.push_back({std::string(digest), std::string(path)});
    }
    return manifest;
}

VerificationReport verify_bundle(const fs::path& bundle_dir) {
    VerificationReport report;
    report.bundle = bundle_name(bundle_dir);

    std::error_code ec;
    if (!fs::is_directory(bundle_dir, ec)) {
        report.notes.push_back("bundle directory not found");
        return report;
    }

    Manifest manifest;
    bool manifest_ok = false;
    if (const auto text = read_file(bundle_dir / kManifestName)) {
        try {
            manifest = parse_manifest(*text);
            manifest_ok = true;
        } catch (const std::runtime_error& ex) {
            report.notes.push_back(std::string("unreadable manifest: ") + ex.what());
        }
    } else {
        report.notes.push_back(std::string(kManifestName) + " missing");
    }
    report.declared_records = manifest.declared_records;

    // Per-file digest checks.
    bool files_ok = manifest_ok;
    std::map<std::string, bool> listed;
    for (const auto& entry : manifest.entries) {
        FileCheck check;
        check.path = entry.path;
        check.expected = entry.digest;
        if (escapes_bundle(entry.path)) {
            report.notes.push_back("manifest path escapes the bundle: " + entry.path);
        } else if (fs::is_regular_file(bundle_dir / entry.path, ec)) {
            try {
                check.actual = sha256_file_hex(bundle_dir / entry.path);
            } catch (const std::runtime_error& ex) {
                report.notes.push_back(ex.what());
            }
        } else {
            report.notes.push_back("listed file missing: " + entry.path);
        }
        check.passed = !check.actual.empty() && check.actual == check.expected;
        files_ok = files_ok && check.passed;
        listed[entry.path] = check.passed;
        report.files.push_back(std::move(check));
    }

    // Records present in the bundle, in sequence order.
    std::vector<std::pair<std::uint64_t, std::string>> present;
    const fs::path records_dir = bundle_dir / "records";
    if (fs::is_directory(records_dir, ec)) {
        for (const auto& item : fs::directory_iterator(records_dir)) {
            if (!item.is_regular_file() || item.path().extension() != ".rec") {
                continue;
            }
            const auto sequence = parse_unsigned<std::uint64_t>(item.path().stem().string());
            if (!sequence) {
                report.notes.push_back("unrecognised record file: records/" + item.path().filename().string());
                files_ok = false;
                continue;
            }
            present.emplace_back(*sequence, "records/" + item.path().filename().string());
        }
    }
    std::sort(present.begin(), present.end());
    report.record_count = present.size();

    // Replay the chain.
    std::string expected_previous = manifest.anchor.empty() ? kGenesisHash : manifest.anchor;
    std::optional<std::uint64_t> expected_sequence = manifest.first;
    std::optional<std::uint64_t> broken_at;
    for (const auto& [sequence, relative] : present) {
        RecordCheck check;
        check.sequence = sequence;
        check.path = relative;

        const auto listing = listed.find(relative);
        if (listing == listed.end()) {
            report.notes.push_back("unlisted file: " + relative);
            files_ok = false;
        }

        if (broken_at) {
            check.reason = "follows broken record " + std::to_string(*broken_at);
            report.records.push_back(std::move(check));
            continue;
        }

        const auto text = read_file(bundle_dir / relative);
        if (listing == listed.end()) {
            check.reason = "not listed in manifest";
        } else if (!listing->second) {
            check.reason = "digest does not match manifest";
        } else if (!text) {
            check.reason = "unreadable";
        } else {
            try {
                const DecisionRecord record = decode_evidence(*text);
                if (encode_evidence(record) != *text) {
                    check.reason = "non-canonical encoding";
                } else if (record.sequence != sequence ||
                           (expected_sequence && record.sequence != *expected_sequence)) {
                    check.reason = "sequence gap: expected " +
                                   std::to_string(expected_sequence.value_or(sequence));
                } else if (record.previous_hash != expected_previous) {
                    check.reason = "previous_hash does not link to the prior record";
                } else if (compute_record_hash(record) != record.record_hash) {
                    check.reason = "record hash mismatch";
                } else {
                    check.valid = true;
                    expected_previous = record.record_hash;
                    expected_sequence = record.sequence + 1;
                }
            } catch (const std::runtime_error& ex) {
                check.reason = std::string("malformed evidence: ") + ex.what();
            }
        }
        if (!check.valid) {
            broken_at = sequence;
        }
        report.records.push_back(std::move(check));
    }

    report.files_valid = files_ok;
    report.chain_valid = !broken_at;
    if (!report.declared_records) {
        if (manifest_ok) {
            report.notes.push_back("manifest does not declare a record count");
        }
    } else if (*report.declared_records != report.record_count) {
        report.notes.push_back("manifest declares " + std::to_string(*report.declared_records) +
                               " records but bundle holds " + std::to_string(report.record_count));
    } else {
        report.count_matches = true;
    }
    if (broken_at) {
        report.notes.push_back("chain broken at record " + std::to_string(*broken_at));
    }
    report.final_pass = report.files_valid && report.chain_valid && report.count_matches;
    return report;
}

Json to_json(const VerificationReport& report) {
    JsonArray files;
    for (const auto& file : report.files) {
        JsonObject entry;
        entry["path"] = Json(file.path);
        entry["expected"] = Json(file.expected);
        entry["actual"] = file.actual.empty() ? Json(nullptr) : Json(file.actual);
        entry["passed"] = Json(file.passed);
        files.emplace_back(Json(entry));
    }
    JsonArray records;
    for (const auto& record : report.records) {
        JsonObject entry;
        entry["sequence"] = Json(record.sequence);
        entry["path"] = Json(record.path);
        entry["valid"] = Json(record.valid);
        entry["reason"] = record.reason.empty() ? Json(nullptr) : Json(record.reason);
        records.emplace_back(Json(entry));
    }
    JsonArray notes;
    for (const auto& note : report.notes) {
        notes.emplace_back(Json(note));
    }

    JsonObject out;
    out["bundle"] = Json(report.bundle);
    out["files"] = Json(files);
    out["records"] = Json(records);
    out["declared_records"] =
        report.declared_records ? Json(static_cast<std::uint64_t>(*report.declared_records)) : Json(nullptr);
    out["record_count"] = Json(static_cast<std::uint64_t>(report.record_count));
    out["files_valid"] = Json(report.files_valid);
    out["chain_valid"] = Json(report.chain_valid);
    out["count_matches"] = Json(report.count_matches);
    out["final_pass"] = Json(report.final_pass);
    out["notes"] = Json(notes);
    return Json(out);
}

} // namespace guardian
