#include "store/memory_audit_store.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <numeric>

namespace codeauditor {

namespace {

// First `chars` code points of a UTF-8 string (LEFT(text, n) semantics)
std::string utf8_prefix(const std::string& text, size_t chars) {
    size_t i = 0;
    size_t seen = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if ((lead & 0xC0) != 0x80) {
            if (seen == chars) break;
            ++seen;
        }
        ++i;
    }
    return text.substr(0, i);
}

// created_at DESC, id DESC
bool newer_first(const AuditRecord& a, const AuditRecord& b) {
    if (a.created_at != b.created_at) return a.created_at > b.created_at;
    return a.id > b.id;
}

} // anonymous namespace

Result<AuditRecord> MemoryAuditStore::append(const AuditRecord& record) {
    if (record.id.empty()) {
        return Result<AuditRecord>::error(ErrorCategory::STORAGE_ERROR, "record has no id");
    }
    if (!record.is_consistent()) {
        return Result<AuditRecord>::error(ErrorCategory::STORAGE_ERROR,
            std::format("record {} violates the validity/diagnostic constraint", record.id));
    }

    std::unique_lock lock(mutex_);
    if (by_id_.contains(record.id)) {
        return Result<AuditRecord>::error(ErrorCategory::STORAGE_ERROR,
            std::format("duplicate record id {}", record.id));
    }
    records_.push_back(record);
    by_id_.emplace(record.id, records_.size() - 1);
    if (record.is_valid) {
        ++counts_.valid;
    } else {
        ++counts_.invalid;
    }
    return Result<AuditRecord>::ok(record);
}

Result<std::vector<AuditRecord>> MemoryAuditStore::list_recent(size_t limit, size_t offset) {
    std::shared_lock lock(mutex_);

    std::vector<AuditRecord> page;
    if (offset >= records_.size() || limit == 0) {
        return Result<std::vector<AuditRecord>>::ok(std::move(page));
    }

    std::vector<size_t> order(records_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    const size_t end = std::min(records_.size(), offset + limit);
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(end), order.end(),
        [this](size_t a, size_t b) { return newer_first(records_[a], records_[b]); });

    page.reserve(end - offset);
    for (size_t i = offset; i < end; ++i) {
        page.push_back(records_[order[i]]);
    }
    return Result<std::vector<AuditRecord>>::ok(std::move(page));
}

Result<std::optional<AuditRecord>> MemoryAuditStore::find_by_id(const std::string& id) {
    std::shared_lock lock(mutex_);
    const auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<std::optional<AuditRecord>>::ok(std::nullopt);
    }
    return Result<std::optional<AuditRecord>>::ok(records_[it->second]);
}

Result<ValidityCounts> MemoryAuditStore::count_by_validity() {
    std::shared_lock lock(mutex_);
    return Result<ValidityCounts>::ok(counts_);
}

Result<std::vector<DiagnosticFrequency>> MemoryAuditStore::top_diagnostics(size_t limit) {
    std::unordered_map<std::string, uint64_t> groups;
    {
        std::shared_lock lock(mutex_);
        for (const auto& r : records_) {
            if (r.diagnostic) {
                ++groups[utf8_prefix(*r.diagnostic, kDiagnosticGroupPrefix)];
            }
        }
    }

    std::vector<DiagnosticFrequency> top;
    top.reserve(groups.size());
    for (auto& [text, count] : groups) {
        top.push_back({text, count});
    }
    std::sort(top.begin(), top.end(), [](const DiagnosticFrequency& a, const DiagnosticFrequency& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.diagnostic < b.diagnostic;
    });
    if (top.size() > limit) top.resize(limit);
    return Result<std::vector<DiagnosticFrequency>>::ok(std::move(top));
}

size_t MemoryAuditStore::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace codeauditor
