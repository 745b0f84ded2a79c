#include "guardian/digest.hpp"
#include "guardian/ledger.hpp"
#include "guardian/verifier.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

namespace {

using namespace guardian;
namespace fs = std::filesystem;

DecisionRecord sample_record(int index) {
    DecisionRecord record;
    record.timestamp = "2026-03-01T12:00:00Z";
    record.kind = index % 2 == 0 ? "check" : "verify";
    record.request_hash = sha256_hex("request " + std::to_string(index));
    record.verdict = index % 3 == 0 ? Decision::Halt : Decision::Pass;
    record.risk = index % 3 == 0 ? 1.0 : 0.1;
    if (record.kind == "check") {
        record.protection_index = 1.0 - record.risk;
    } else {
        record.mhi = 1.0 - record.risk;
    }
    record.rationale = "decision " + std::to_string(index);
    return record;
}

fs::path build_bundle(const fs::path& root, int count, std::uint64_t first = 0, std::size_t slice = 0) {
    Ledger ledger(root / "evidence");
    for (int i = 0; i < count; ++i) {
        ledger.append(sample_record(i));
    }
    return ledger.export_bundle(root / "bundles", first, slice);
}

void replace_in_file(const fs::path& path, const std::string& from, const std::string& to) {
    std::string text = test::read_text(path);
    const auto pos = text.find(from);
    ASSERT_NE(pos, std::string::npos) << from;
    text.replace(pos, from.size(), to);
    test::write_text(path, text);
}

bool any_note_contains(const VerificationReport& report, const std::string& needle) {
    return std::any_of(report.notes.begin(), report.notes.end(),
                       [&needle](const std::string& note) { return note.find(needle) != std::string::npos; });
}

TEST(VerifierTest, IntactBundlePasses) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 6);
    const VerificationReport report = verify_bundle(bundle);
    EXPECT_TRUE(report.final_pass);
    EXPECT_TRUE(report.files_valid);
    EXPECT_TRUE(report.chain_valid);
    EXPECT_TRUE(report.count_matches);
    EXPECT_EQ(report.record_count, 6u);
    ASSERT_EQ(report.files.size(), 6u);
    for (const auto& file : report.files) {
        EXPECT_TRUE(file.passed) << file.path;
    }
    for (const auto& record : report.records) {
        EXPECT_TRUE(record.valid) << record.sequence;
    }
    EXPECT_TRUE(report.notes.empty());
}

TEST(VerifierTest, VerificationIsIdempotent) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 4);
    const std::string first = to_json(verify_bundle(bundle)).dump();
    const std::string second = to_json(verify_bundle(bundle)).dump();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.find("2026-"), std::string::npos);
}

TEST(VerifierTest, MutatingRecordInvalidatesItAndEveryLaterRecord) {
    constexpr int kRecords = 7;
    for (int k = 0; k < kRecords; ++k) {
        test::TempDir dir;
        const fs::path bundle = build_bundle(dir.path(), kRecords);
        replace_in_file(bundle / evidence_file_name(k), "decision " + std::to_string(k), "decisiom " + std::to_string(k));

        const VerificationReport report = verify_bundle(bundle);
        EXPECT_FALSE(report.final_pass);
        EXPECT_FALSE(report.chain_valid);
        ASSERT_EQ(report.records.size(), static_cast<std::size_t>(kRecords));
        for (int i = 0; i < kRecords; ++i) {
            EXPECT_EQ(report.records[i].valid, i < k) << "k=" << k << " i=" << i;
        }
        EXPECT_FALSE(report.files[k].passed);
    }
}

TEST(VerifierTest, ForgedRecordWithRecomputedHashBreaksTheNextLink) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 5);
    const fs::path target = bundle / evidence_file_name(2);

    DecisionRecord forged = decode_evidence(test::read_text(target));
    const std::string old_digest = sha256_file_hex(target);
    forged.verdict = Decision::Pass;
    forged.rationale = "nothing to see";
    forged.record_hash = compute_record_hash(forged);
    test::write_text(target, encode_evidence(forged));
    replace_in_file(bundle / "MANIFEST.sha256", old_digest, sha256_file_hex(target));

    const VerificationReport report = verify_bundle(bundle);
    EXPECT_TRUE(report.files_valid);
    EXPECT_FALSE(report.chain_valid);
    EXPECT_FALSE(report.final_pass);
    EXPECT_TRUE(report.records[2].valid);
    EXPECT_FALSE(report.records[3].valid);
    EXPECT_FALSE(report.records[4].valid);
}

TEST(VerifierTest, DeclaredCountMismatchFailsBundle) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 29);
    replace_in_file(bundle / "MANIFEST.sha256", "# records 29\n", "# records 30\n");

    const VerificationReport report = verify_bundle(bundle);
    EXPECT_TRUE(report.files_valid);
    EXPECT_TRUE(report.chain_valid);
    EXPECT_FALSE(report.count_matches);
    EXPECT_FALSE(report.final_pass);
    EXPECT_EQ(report.declared_records.value(), 30u);
    EXPECT_EQ(report.record_count, 29u);
    EXPECT_TRUE(any_note_contains(report, "declares 30 records but bundle holds 29"));
}

TEST(VerifierTest, MissingRecordFileFailsFileAndChain) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 5);
    fs::remove(bundle / evidence_file_name(3));

    const VerificationReport report = verify_bundle(bundle);
    EXPECT_FALSE(report.files_valid);
    EXPECT_FALSE(report.files[3].passed);
    EXPECT_FALSE(report.chain_valid);
    EXPECT_FALSE(report.final_pass);
    ASSERT_EQ(report.records.size(), 4u);
    EXPECT_TRUE(report.records[2].valid);
    EXPECT_FALSE(report.records[3].valid);
    EXPECT_EQ(report.records[3].sequence, 4u);
    EXPECT_TRUE(any_note_contains(report, "listed file missing"));
}

TEST(VerifierTest, UnlistedRecordFileFailsBundle) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 3);
    fs::copy_file(dir.path() / "evidence" / evidence_file_name(2), bundle / "records" / "00000003.rec");

    const VerificationReport report = verify_bundle(bundle);
    EXPECT_FALSE(report.files_valid);
    EXPECT_FALSE(report.final_pass);
    EXPECT_TRUE(any_note_contains(report, "unlisted file"));
}

TEST(VerifierTest, SliceVerifiesAgainstItsAnchor) {
    test::TempDir dir;
    const fs::path bundle = build_bundle(dir.path(), 8, 3, 4);
    const VerificationReport report = verify_bundle(bundle);
    EXPECT_TRUE(report.final_pass);
    ASSERT_EQ(report.records.size(), 4u);
    EXPECT_EQ(report.records.front().sequence, 3u);

    replace_in_file(bundle / "MANIFEST.sha256", "# anchor ", "# anchor 0");
    EXPECT_FALSE(verify_bundle(bundle).chain_valid);
}

TEST(VerifierTest, MissingBundleProducesFailingReport) {
    test::TempDir dir;
    const VerificationReport report = verify_bundle(dir.path() / "nope");
    EXPECT_FALSE(report.final_pass);
    EXPECT_EQ(report.bundle, "nope");
    EXPECT_TRUE(any_note_contains(report, "not found"));

    fs::create_directories(dir.path() / "empty");
    const VerificationReport empty = verify_bundle(dir.path() / "empty");
    EXPECT_FALSE(empty.final_pass);
    EXPECT_TRUE(any_note_contains(empty, "MANIFEST.sha256 missing"));
}

TEST(VerifierTest, ParseManifestReadsHeaderAndEntries) {
    const std::string digest(64, 'a');
    const Manifest manifest = parse_manifest("# guardian custody bundle v1\n"
                                             "# records 1\n"
                                             "# first 4\n"
                                             "# anchor " + std::string(64, '0') + "\n" +
                                             digest + "  records/00000004.rec\n");
    EXPECT_EQ(manifest.declared_records.value(), 1u);
    EXPECT_EQ(manifest.first.value(), 4u);
    ASSERT_EQ(manifest.entries.size(), 1u);
    EXPECT_EQ(manifest.entries.front().path, "records/00000004.rec");

    EXPECT_THROW(parse_manifest("nothex  records/00000000.rec\n"), std::runtime_error);
    EXPECT_THROW(parse_manifest("# records many\n"), std::runtime_error);
}

} // namespace
