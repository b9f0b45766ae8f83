#include "csi/query/row_filter.h"
#include "csi/common/logger.h"
#include <absl/strings/str_join.h>
#include <algorithm>
#include <sstream>

namespace csi {
namespace query {

bool RowQuery::matches(const index::Row& row) const {
    return row.matches_time_interval(interval) &&
           row.matches_measurement(measurement) &&
           row.matches_field(field) &&
           row.matches_tag_sets(tag_sets);
}

std::string RowQuery::to_string() const {
    std::ostringstream oss;
    oss << "measurement=" << measurement << " field=" << field
        << " interval=" << interval.to_string() << " tags=";
    std::vector<std::string> groups;
    groups.reserve(tag_sets.size());
    for (const auto& group : tag_sets) {
        groups.push_back("(" + absl::StrJoin(group, " OR ") + ")");
    }
    oss << (groups.empty() ? "*" : absl::StrJoin(groups, " AND "));
    return oss.str();
}

std::vector<const index::Row*> select_candidates(const index::ClientSideIndex& row_index,
                                                 const RowQuery& query) {
    std::vector<const index::Row*> result;

    if (query.tag_sets.empty()) {
        for (const auto& row : row_index.rows()) {
            if (query.matches(row)) {
                result.push_back(&row);
            }
        }
    } else {
        // Union of the first group's postings, kept in arena order.
        index::PostingList seed;
        for (const auto& tag : query.tag_sets.front()) {
            auto it = row_index.by_tag().find(tag);
            if (it != row_index.by_tag().end()) {
                seed.insert(seed.end(), it->second.begin(), it->second.end());
            }
        }
        std::sort(seed.begin(), seed.end());
        seed.erase(std::unique(seed.begin(), seed.end()), seed.end());

        for (index::RowRef ref : seed) {
            const auto& row = row_index.row(ref);
            if (query.matches(row)) {
                result.push_back(&row);
            }
        }
    }

    if (spdlog::should_log(spdlog::level::trace)) {
        CSI_TRACE("Query {} selected {} of {} rows", query.to_string(), result.size(), row_index.size());
    }
    return result;
}

} // namespace query
} // namespace csi
