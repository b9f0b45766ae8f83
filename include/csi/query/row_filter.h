#ifndef CSI_QUERY_ROW_FILTER_H_
#define CSI_QUERY_ROW_FILTER_H_

#include <string>
#include <utility>
#include <vector>
#include "csi/core/types.h"
#include "csi/index/client_side_index.h"
#include "csi/index/row.h"

namespace csi {
namespace query {

/**
 * @brief The row-level part of a high-level query
 */
struct RowQuery {
    std::string measurement;
    std::string field;
    core::TimeInterval interval;
    core::TagGroups tag_sets;   // AND of ORs; empty matches all

    RowQuery() = default;
    RowQuery(std::string m, std::string f, core::TimeInterval ti, core::TagGroups tags = {})
        : measurement(std::move(m)), field(std::move(f)), interval(ti), tag_sets(std::move(tags)) {}

    // True iff all four row predicates hold.
    bool matches(const index::Row& row) const;

    std::string to_string() const;
};

/**
 * @brief Rows of the index matching the query, in index order.
 *
 * When tag_sets is non-empty the postings of its first group seed the
 * candidates; otherwise every row is a candidate.
 */
std::vector<const index::Row*> select_candidates(const index::ClientSideIndex& row_index,
                                                 const RowQuery& query);

} // namespace query
} // namespace csi

#endif // CSI_QUERY_ROW_FILTER_H_
