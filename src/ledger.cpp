#include "../include/guardian/ledger.hpp"
#include "../include/guardian/digest.hpp"
#include "../include/guardian/errors.hpp"
#include "../include/guardian/log.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace guardian {

namespace fs = std::filesystem;

namespace {

constexpr const char* kFieldOrder[] = {
    "seq", "timestamp", "kind", "request_hash", "verdict", "risk",
    "protection_index", "mhi", "fired", "rationale", "previous_hash", "record_hash",
};
constexpr std::size_t kFieldCount = sizeof(kFieldOrder) / sizeof(kFieldOrder[0]);

std::string escape_field(std::string_view text, bool escape_comma) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case ',':
            if (escape_comma) {
                out += "\\,";
            } else {
                out += c;
            }
            break;
        default: out += c; break;
        }
    }
    return out;
}

std::string unescape_field(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out.push_back(text[i]);
            continue;
        }
        if (++i >= text.size()) {
            throw std::runtime_error("dangling escape");
        }
        switch (text[i]) {
        case '\\': out.push_back('\\'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case ',': out.push_back(','); break;
        default: throw std::runtime_error("unknown escape");
        }
    }
    return out;
}

std::vector<std::string> split_fired(std::string_view text) {
    std::vector<std::string> ids;
    if (text.empty()) {
        return ids;
    }
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            current.push_back(text[i]);
            current.push_back(text[++i]);
        } else if (text[i] == ',') {
            ids.push_back(unescape_field(current));
            current.clear();
        } else {
            current.push_back(text[i]);
        }
    }
    ids.push_back(unescape_field(current));
    return ids;
}

std::string format_number(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6) << value;
    return oss.str();
}

std::string format_optional(const std::optional<double>& value) {
    return value ? format_number(*value) : std::string("-");
}

double parse_number(std::string_view text) {
    double value = 0.0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        throw std::runtime_error("invalid number '" + std::string(text) + "'");
    }
    return value;
}

std::optional<double> parse_optional(std::string_view text) {
    if (text == "-") {
        return std::nullopt;
    }
    return parse_number(text);
}

std::uint64_t parse_sequence(std::string_view text) {
    std::uint64_t value = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        throw std::runtime_error("invalid sequence '" + std::string(text) + "'");
    }
    return value;
}

bool is_hex_digest(std::string_view text) {
    return text.size() == 64 && std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("unable to open " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void sync_to_disk(const fs::path& path) {
#ifndef _WIN32
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("unable to reopen " + path.string() + " for sync");
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error("fsync failed for " + path.string());
    }
#else
    (void)path;
#endif
}

std::string compact_timestamp() {
    std::string stamp = utc_timestamp();
    stamp.erase(std::remove_if(stamp.begin(), stamp.end(), [](char c) { return c == '-' || c == ':'; }),
                stamp.end());
    return stamp;
}

} // namespace

std::string canonical_serialize(const DecisionRecord& record) {
    std::string out;
    out += "seq=" + std::to_string(record.sequence) + "\n";
    out += "timestamp=" + escape_field(record.timestamp, false) + "\n";
    out += "kind=" + escape_field(record.kind, false) + "\n";
    out += "request_hash=" + escape_field(record.request_hash, false) + "\n";
    out += "verdict=" + to_string(record.verdict) + "\n";
    out += "risk=" + format_number(record.risk) + "\n";
    out += "protection_index=" + format_optional(record.protection_index) + "\n";
    out += "mhi=" + format_optional(record.mhi) + "\n";
    out += "fired=";
    for (std::size_t i = 0; i < record.fired.size(); ++i) {
        if (i != 0) {
            out += ',';
        }
        out += escape_field(record.fired[i], true);
    }
    out += "\n";
    out += "rationale=" + escape_field(record.rationale, false) + "\n";
    return out;
}

std::string compute_record_hash(const DecisionRecord& record) {
    return sha256_hex(canonical_serialize(record) + record.previous_hash);
}

std::string encode_evidence(const DecisionRecord& record) {
    return canonical_serialize(record) + "previous_hash=" + record.previous_hash + "\n" +
           "record_hash=" + record.record_hash + "\n";
}

DecisionRecord decode_evidence(std::string_view text) {
    if (text.empty() || text.back() != '\n') {
        throw std::runtime_error("evidence must end with a newline");
    }
    std::vector<std::string_view> values;
    std::size_t start = 0;
    while (start < text.size()) {
        const std::size_t end = text.find('\n', start);
        const std::string_view line = text.substr(start, end - start);
        start = end + 1;
        if (values.size() >= kFieldCount) {
            throw std::runtime_error("unexpected trailing line");
        }
        const std::string_view key = kFieldOrder[values.size()];
        if (line.size() <= key.size() || line.substr(0, key.size()) != key || line[key.size()] != '=') {
            throw std::runtime_error("expected field '" + std::string(key) + "'");
        }
        values.push_back(line.substr(key.size() + 1));
    }
    if (values.size() != kFieldCount) {
        throw std::runtime_error("missing fields in evidence");
    }

    DecisionRecord record;
    record.sequence = parse_sequence(values[0]);
    record.timestamp = unescape_field(values[1]);
    record.kind = unescape_field(values[2]);
    record.request_hash = unescape_field(values[3]);
    try {
        record.verdict = parse_decision(std::string(values[4]));
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(ex.what());
    }
    record.risk = parse_number(values[5]);
    record.protection_index = parse_optional(values[6]);
    record.mhi = parse_optional(values[7]);
    record.fired = split_fired(values[8]);
    record.rationale = unescape_field(values[9]);
    record.previous_hash = std::string(values[10]);
    record.record_hash = std::string(values[11]);
    if (!is_hex_digest(record.previous_hash) || !is_hex_digest(record.record_hash)) {
        throw std::runtime_error("hash fields must be 64 lowercase hex characters");
    }
    return record;
}

std::string evidence_file_name(std::uint64_t sequence) {
    std::ostringstream oss;
    oss << "records/" << std::setw(8) << std::setfill('0') << sequence << ".rec";
    return oss.str();
}

Ledger::Ledger(fs::path root)
    : m_root(std::move(root))
    , m_records_dir(m_root / "records")
    , m_chain_path(m_root / "chain.log") {
    fs::create_directories(m_records_dir);
    recover();
    m_chain.open(m_chain_path, std::ios::binary | std::ios::app);
    if (!m_chain) {
        throw Error("unable to open " + m_chain_path.string() + " for append");
    }
}

void Ledger::recover() {
    std::string chain_text;
    if (fs::exists(m_chain_path)) {
        chain_text = read_file(m_chain_path);
    }
    const std::size_t complete = chain_text.rfind('\n');
    const std::size_t linked_bytes = complete == std::string::npos ? 0 : complete + 1;
    if (linked_bytes != chain_text.size()) {
        log("Ledger", "Discarding partial chain line at end of " + m_chain_path.string());
        chain_text.resize(linked_bytes);
        std::ofstream rewrite(m_chain_path, std::ios::binary | std::ios::trunc);
        rewrite << chain_text;
        rewrite.flush();
        if (!rewrite) {
            throw Error("unable to rewrite " + m_chain_path.string());
        }
    }

    std::string previous = kGenesisHash;
    std::istringstream lines(chain_text);
    std::string line;
    while (std::getline(lines, line)) {
        const std::size_t space = line.find(' ');
        if (space == std::string::npos) {
            throw IntegrityError("malformed chain line: " + line);
        }
        std::uint64_t sequence = 0;
        try {
            sequence = parse_sequence(std::string_view(line).substr(0, space));
        } catch (const std::runtime_error& ex) {
            throw IntegrityError(std::string("malformed chain line: ") + ex.what());
        }
        const std::string linked_hash = line.substr(space + 1);
        if (sequence != m_records.size()) {
            throw IntegrityError("chain sequence gap at " + std::to_string(sequence));
        }

        const fs::path evidence = m_root / evidence_file_name(sequence);
        DecisionRecord record;
        try {
            record = decode_evidence(read_file(evidence));
        } catch (const std::runtime_error& ex) {
            throw IntegrityError("record " + std::to_string(sequence) + " unreadable: " + ex.what());
        }
        if (record.sequence != sequence) {
            throw IntegrityError("record " + std::to_string(sequence) + " carries sequence " +
                                 std::to_string(record.sequence));
        }
        if (record.previous_hash != previous) {
            throw IntegrityError("record " + std::to_string(sequence) + " does not link to its predecessor");
        }
        const std::string recomputed = compute_record_hash(record);
        if (recomputed != record.record_hash || recomputed != linked_hash) {
            throw IntegrityError("record " + std::to_string(sequence) + " hash mismatch");
        }
        previous = record.record_hash;
        m_records.push_back(std::move(record));
    }

    std::vector<fs::path> stored;
    for (const auto& entry : fs::directory_iterator(m_records_dir)) {
        stored.push_back(entry.path());
    }
    for (const auto& path : stored) {
        if (path.extension() == ".tmp") {
            fs::remove(path);
            continue;
        }
        if (path.extension() != ".rec") {
            continue;
        }
        std::uint64_t sequence = 0;
        try {
            sequence = parse_sequence(path.stem().string());
        } catch (const std::runtime_error&) {
            continue;
        }
        if (sequence >= m_records.size()) {
            fs::path orphan = path;
            orphan += ".orphan";
            fs::rename(path, orphan);
            log("Ledger", "Set aside unlinked tail record " + path.filename().string());
        }
    }

    if (!m_records.empty()) {
        log("Ledger", "Recovered " + std::to_string(m_records.size()) + " record(s); head " +
                          m_records.back().record_hash.substr(0, 12));
    }
}

void Ledger::write_evidence(const DecisionRecord& record) {
    const fs::path target = m_root / evidence_file_name(record.sequence);
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("unable to open " + temp.string());
        }
        file << encode_evidence(record);
        file.flush();
        if (!file) {
            throw std::runtime_error("write failed for " + temp.string());
        }
    }
    sync_to_disk(temp);
    fs::rename(temp, target);
}

void Ledger::halt(const std::string& reason) {
    m_halted = true;
    log("Ledger", "INTEGRITY FAILURE: " + reason + "; ledger halted");
    throw IntegrityError(reason);
}

AppendResult Ledger::append(DecisionRecord record) {
    std::scoped_lock lock(m_mutex);
    if (m_halted) {
        throw IntegrityError("ledger halted after an integrity failure");
    }
    const std::string head = m_records.empty() ? kGenesisHash : m_records.back().record_hash;
    if (!record.previous_hash.empty() && record.previous_hash != head) {
        halt("supplied previous_hash " + record.previous_hash.substr(0, 12) + " does not match head " +
             head.substr(0, 12));
    }

    record.sequence = m_records.size();
    record.previous_hash = head;
    if (record.timestamp.empty()) {
        record.timestamp = utc_timestamp();
    }
    record.record_hash = compute_record_hash(record);

    try {
        write_evidence(record);
    } catch (const std::exception& ex) {
        halt(std::string("unable to persist evidence: ") + ex.what());
    }
    m_chain << record.sequence << ' ' << record.record_hash << '\n';
    m_chain.flush();
    if (!m_chain) {
        halt("unable to link record " + std::to_string(record.sequence) + " into " + m_chain_path.string());
    }

    AppendResult result {record.sequence, record.record_hash};
    m_records.push_back(std::move(record));
    return result;
}

std::vector<DecisionRecord> Ledger::read(std::uint64_t first, std::size_t count) const {
    std::scoped_lock lock(m_mutex);
    if (first >= m_records.size()) {
        return {};
    }
    const std::size_t end = static_cast<std::size_t>(
        std::min<std::uint64_t>(m_records.size(), first + static_cast<std::uint64_t>(count)));
    return std::vector<DecisionRecord>(m_records.begin() + static_cast<std::ptrdiff_t>(first),
                                       m_records.begin() + static_cast<std::ptrdiff_t>(end));
}

std::size_t Ledger::size() const {
    std::scoped_lock lock(m_mutex);
    return m_records.size();
}

std::string Ledger::head_hash() const {
    std::scoped_lock lock(m_mutex);
    return m_records.empty() ? kGenesisHash : m_records.back().record_hash;
}

bool Ledger::halted() const {
    std::scoped_lock lock(m_mutex);
    return m_halted;
}

fs::path Ledger::export_bundle(const fs::path& out_dir, std::uint64_t first, std::size_t count) const {
    std::vector<std::uint64_t> sequences;
    std::string anchor;
    {
        std::scoped_lock lock(m_mutex);
        if (first > m_records.size()) {
            throw std::out_of_range("bundle start " + std::to_string(first) + " is beyond the ledger head");
        }
        const std::uint64_t end = count == 0
                                      ? m_records.size()
                                      : std::min<std::uint64_t>(m_records.size(), first + count);
        for (std::uint64_t seq = first; seq < end; ++seq) {
            sequences.push_back(seq);
        }
        anchor = first == 0 ? kGenesisHash : m_records[static_cast<std::size_t>(first - 1)].record_hash;
    }

    std::string name = "bundle_" + compact_timestamp() + "_" + std::to_string(first) + "-" +
                       std::to_string(sequences.empty() ? first : sequences.back());
    fs::create_directories(out_dir);
    fs::path bundle_dir = out_dir / name;
    for (int suffix = 2; !fs::create_directory(bundle_dir); ++suffix) {
        bundle_dir = out_dir / (name + "_" + std::to_string(suffix));
    }
    fs::create_directory(bundle_dir / "records");

    std::ostringstream manifest;
    manifest << "# guardian custody bundle v1\n";
    manifest << "# created " << utc_timestamp() << "\n";
    manifest << "# first " << first << "\n";
    manifest << "# records " << sequences.size() << "\n";
    manifest << "# anchor " << anchor << "\n";
    for (std::uint64_t seq : sequences) {
        const std::string relative = evidence_file_name(seq);
        fs::copy_file(m_root / relative, bundle_dir / relative);
        manifest << sha256_file_hex(bundle_dir / relative) << "  " << relative << "\n";
    }

    std::ofstream out(bundle_dir / "MANIFEST.sha256", std::ios::binary | std::ios::trunc);
    out << manifest.str();
    out.flush();
    if (!out) {
        throw std::runtime_error("unable to write manifest in " + bundle_dir.string());
    }
    log("Ledger", "Exported " + std::to_string(sequences.size()) + " record(s) to " + bundle_dir.string());
    return bundle_dir;
}

} // namespace guardian
