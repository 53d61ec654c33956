#include "hostmon/process_ranker.hpp"
#include <algorithm>
#include <sstream>

namespace hostmon {

namespace {

constexpr std::size_t kFixedFields = 10;

bool parse_u64(const std::string& text, uint64_t& out) {
    if (!is_numeric(text) || text.size() > 19) {
        return false;
    }
    out = std::stoull(text);
    return true;
}

} // namespace

const char* sort_field(SortKey key) {
    switch (key) {
        case SortKey::Mem: return "%mem";
        case SortKey::Rss: return "rss";
        default:           return "%cpu";
    }
}

std::string truncate_command(const std::string& command) {
    if (command.empty()) {
        return kNoCommand;
    }
    if (command.size() > kCommandWidth) {
        return command.substr(0, kCommandWidth - 3) + "...";
    }
    return command;
}

std::optional<ProcessEntry> parse_process_row(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() < kFixedFields) {
        return std::nullopt;
    }

    ProcessEntry entry;
    entry.user = tokens[0];

    uint64_t pid = 0;
    uint64_t vsz_kb = 0;
    uint64_t rss_kb = 0;
    if (!parse_u64(tokens[1], pid) || !parse_u64(tokens[4], vsz_kb) || !parse_u64(tokens[5], rss_kb)) {
        return std::nullopt;
    }
    if (!is_decimal(tokens[2]) || !is_decimal(tokens[3])) {
        return std::nullopt;
    }

    entry.pid = static_cast<int>(pid);
    entry.cpu_pct = std::stod(tokens[2]);
    entry.mem_pct = std::stod(tokens[3]);
    entry.vsz_mb = vsz_kb / 1024;
    entry.rss_mb = rss_kb / 1024;

    std::string command;
    for (size_t i = kFixedFields; i < tokens.size(); ++i) {
        if (!command.empty()) command += ' ';
        command += tokens[i];
    }
    entry.command = truncate_command(trim(command));
    return entry;
}

RowHighlight classify_row(const ProcessEntry& entry, SortKey key) {
    switch (key) {
        case SortKey::Cpu:
            if (entry.cpu_pct > 50.0) return RowHighlight::Critical;
            if (entry.cpu_pct > 20.0) return RowHighlight::Elevated;
            return RowHighlight::Normal;
        case SortKey::Mem:
            if (entry.mem_pct > 20.0) return RowHighlight::Elevated;
            return RowHighlight::Normal;
        default:
            return RowHighlight::Normal;
    }
}

double sort_value(const ProcessEntry& entry, SortKey key) {
    switch (key) {
        case SortKey::Mem: return entry.mem_pct;
        case SortKey::Rss: return static_cast<double>(entry.rss_mb);
        default:           return entry.cpu_pct;
    }
}

ProcessRanker::ProcessRanker(MetricsCollector& collector)
    : collector_(collector)
{
}

std::vector<ProcessEntry> ProcessRanker::rank(const std::vector<std::string>& table, SortKey key) {
    std::vector<ProcessEntry> rows;
    for (size_t i = 1; i < table.size(); ++i) {
        if (auto entry = parse_process_row(table[i])) {
            rows.push_back(std::move(*entry));
        } else if (!trim(table[i]).empty()) {
            DebugLogger::log("skipping malformed process row: ", table[i]);
        }
    }

    // Stable so that ties keep the order of the OS listing
    std::stable_sort(rows.begin(), rows.end(), [key](const ProcessEntry& a, const ProcessEntry& b) {
        return sort_value(a, key) > sort_value(b, key);
    });

    if (rows.size() > kTopCount) {
        rows.resize(kTopCount);
    }
    for (auto& row : rows) {
        row.highlight = classify_row(row, key);
    }
    return rows;
}

std::vector<ProcessEntry> ProcessRanker::top(SortKey key) const {
    auto table = collector_.list_processes(key);
    if (!table) {
        DebugLogger::log("process table unavailable for key ", sort_field(key));
        return {};
    }
    return rank(*table, key);
}

} // namespace hostmon
