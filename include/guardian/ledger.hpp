#pragma once

#include "policy_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guardian {

// previous_hash of the first record in a ledger.
inline const std::string kGenesisHash(64, '0');

struct DecisionRecord {
    std::uint64_t sequence = 0;
    std::string timestamp;
    std::string kind;          // check, answer-pre, answer-generation, answer-post, verify
    std::string request_hash;  // SHA-256 of the evaluated text
    Decision verdict = Decision::Pass;
    double risk = 0.0;
    std::optional<double> protection_index;
    std::optional<double> mhi;
    std::vector<std::string> fired;
    std::string rationale;
    std::string previous_hash;
    std::string record_hash;
};

// Fixed field order, one "key=value" line each, numbers as %.6f, absent indices as "-".
// Excludes previous_hash and record_hash.
std::string canonical_serialize(const DecisionRecord& record);

// SHA256(canonical_serialize(record) || record.previous_hash), lowercase hex.
std::string compute_record_hash(const DecisionRecord& record);

// Evidence file body: the canonical form followed by previous_hash and record_hash lines.
std::string encode_evidence(const DecisionRecord& record);

// Inverse of encode_evidence. Throws std::runtime_error on malformed input.
DecisionRecord decode_evidence(std::string_view text);

// "records/00000042.rec"
std::string evidence_file_name(std::uint64_t sequence);

struct AppendResult {
    std::uint64_t sequence = 0;
    std::string record_hash;
};

/**
 * Ledger
 *
 * Append-only, hash-chained decision store rooted at an evidence directory:
 *
 *   <root>/records/<seq>.rec   one evidence file per record, written first
 *   <root>/chain.log           "<seq> <hash>" per linked record, written second
 *
 * A record only belongs to the chain once its chain.log line exists; an
 * evidence file without one is an unlinked tail and is set aside on open.
 * All appends go through one mutex; reads copy a snapshot under it.
 */
class Ledger {
public:
    // Replays and verifies the existing chain. Throws IntegrityError on a mismatch.
    explicit Ledger(std::filesystem::path root);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    // Assigns sequence and links to the current head. A non-empty previous_hash
    // that differs from the head raises IntegrityError and halts the ledger.
    AppendResult append(DecisionRecord record);

    std::vector<DecisionRecord> read(std::uint64_t first, std::size_t count) const;
    std::size_t size() const;
    std::string head_hash() const;
    bool halted() const;
    const std::filesystem::path& root() const noexcept { return m_root; }

    // Copies the slice's evidence files into a fresh directory under out_dir and
    // writes MANIFEST.sha256. count == 0 exports through the current head.
    std::filesystem::path export_bundle(const std::filesystem::path& out_dir,
                                        std::uint64_t first = 0,
                                        std::size_t count = 0) const;

private:
    std::filesystem::path m_root;
    std::filesystem::path m_records_dir;
    std::filesystem::path m_chain_path;
    mutable std::mutex m_mutex;
    std::vector<DecisionRecord> m_records;
    std::ofstream m_chain;
    bool m_halted = false;

    void recover();
    void write_evidence(const DecisionRecord& record);
    [[noreturn]] void halt(const std::string& reason);
};

} // namespace guardian
