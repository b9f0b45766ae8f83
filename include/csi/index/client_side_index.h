#ifndef CSI_INDEX_CLIENT_SIDE_INDEX_H_
#define CSI_INDEX_CLIENT_SIDE_INDEX_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <absl/container/flat_hash_map.h>
#include "csi/core/result.h"
#include "csi/core/types.h"
#include "csi/index/row.h"

namespace csi {
namespace index {

/**
 * @brief Handle of a row inside the index's row arena
 */
using RowRef = uint32_t;

/**
 * @brief Ascending, duplicate-free list of row handles
 */
using PostingList = std::vector<RowRef>;

/**
 * @brief Read-only metadata index over every row id of the store
 *
 * Built once from a full scan and never mutated afterwards, so const access
 * from any number of threads needs no locking. Rows are stored once in an
 * arena; both inverted indices hold RowRef handles into it.
 *
 * by_time_interval() groups rows by their exact bucket. It is not an
 * interval index: a query spanning several buckets must also apply
 * Row::matches_time_interval over the rows to find every overlap.
 */
class ClientSideIndex {
public:
    using TimeIntervalMap = absl::flat_hash_map<core::TimeInterval, PostingList, core::TimeIntervalHash>;
    using TagMap = absl::flat_hash_map<core::Tag, PostingList>;

    /**
     * @brief Build the index from a snapshot of parsed rows.
     *
     * Fails with EMPTY_INDEX_INPUT when rows is empty.
     */
    static core::Result<std::shared_ptr<const ClientSideIndex>> build(std::vector<Row> rows);

    /**
     * @brief Parse every (table, id) pair, then build.
     *
     * The first malformed id fails the whole build.
     */
    static core::Result<std::shared_ptr<const ClientSideIndex>> build_from_raw(
        const std::vector<RawRowId>& raw_ids);

    ClientSideIndex(const ClientSideIndex&) = delete;
    ClientSideIndex& operator=(const ClientSideIndex&) = delete;

    // Fresh container the caller may reorder or extend. The rows pointed at
    // stay owned by the index and must not be modified.
    std::vector<const Row*> copy_of_rows() const;

    const std::vector<Row>& rows() const { return rows_; }
    const std::vector<std::string>& all_ids() const { return ids_; }
    const TimeIntervalMap& by_time_interval() const { return by_time_interval_; }
    const TagMap& by_tag() const { return by_tag_; }

    // Throws InvalidArgumentError for a handle outside the arena.
    const Row& row(RowRef ref) const;

    std::vector<const Row*> resolve(const PostingList& postings) const;
    std::vector<const Row*> rows_for_time_interval(const core::TimeInterval& interval) const;
    std::vector<const Row*> rows_for_tag(const core::Tag& tag) const;

    size_t size() const { return rows_.size(); }
    size_t num_time_intervals() const { return by_time_interval_.size(); }
    size_t num_tags() const { return by_tag_.size(); }

private:
    explicit ClientSideIndex(std::vector<Row> rows);

    std::vector<Row> rows_;
    std::vector<std::string> ids_;
    TimeIntervalMap by_time_interval_;
    TagMap by_tag_;
};

} // namespace index
} // namespace csi

#endif // CSI_INDEX_CLIENT_SIDE_INDEX_H_
