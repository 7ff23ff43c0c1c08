#include "application/BuildReport.hpp"

#include <sstream>

namespace dirtree::application {

void BuildReport::record(std::string path, domain::NodeKind kind, BuildOutcome outcome, std::string detail) {
    m_entries.push_back(BuildEntry{std::move(path), kind, outcome, std::move(detail)});
    ++m_counts[static_cast<int>(outcome)];
}

std::size_t BuildReport::count(BuildOutcome outcome) const {
    return m_counts[static_cast<int>(outcome)];
}

std::string BuildReport::renderText(bool includeEntries) const {
    std::ostringstream out;
    if (includeEntries) {
        for (const auto& entry : m_entries) {
            out << "  " << OutcomeToString(entry.outcome) << "\t" << domain::KindToString(entry.kind)
                << "\t" << entry.path;
            if (!entry.detail.empty()) out << "  (" << entry.detail << ")";
            out << "\n";
        }
    }
    out << "created: " << count(BuildOutcome::Created)
        << ", overwritten: " << count(BuildOutcome::Overwritten)
        << ", skipped: " << count(BuildOutcome::Skipped)
        << ", failed: " << count(BuildOutcome::Failed);
    if (m_cancelled) out << " (cancelled)";
    out << "\n";
    return out.str();
}

} // namespace dirtree::application
