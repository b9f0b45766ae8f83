#include "csi/index/client_side_index.h"
#include "csi/common/logger.h"
#include "csi/core/error.h"
#include <chrono>
#include <utility>

namespace csi {
namespace index {

ClientSideIndex::ClientSideIndex(std::vector<Row> rows) : rows_(std::move(rows)) {
    ids_.reserve(rows_.size());

    // Handles are appended in arena order, so every posting list stays sorted
    // and a row lands in each of its buckets exactly once.
    for (size_t i = 0; i < rows_.size(); ++i) {
        const Row& row = rows_[i];
        RowRef ref = static_cast<RowRef>(i);

        by_time_interval_[row.time_interval()].push_back(ref);
        for (const auto& tag : row.tags()) {
            by_tag_[tag].push_back(ref);
        }
        ids_.push_back(row.id());
    }
}

core::Result<std::shared_ptr<const ClientSideIndex>> ClientSideIndex::build(std::vector<Row> rows) {
    using ResultType = core::Result<std::shared_ptr<const ClientSideIndex>>;

    if (rows.empty()) {
        CSI_ERROR("No rows to build the client side index from");
        return ResultType(core::EmptyIndexInputError("no data to build client side index"));
    }
    if (rows.size() > static_cast<size_t>(UINT32_MAX)) {
        CSI_ERROR("Too many rows for the client side index: {}", rows.size());
        return ResultType(core::InvalidArgumentError(
            "row count " + std::to_string(rows.size()) + " exceeds RowRef range"));
    }

    auto start = std::chrono::steady_clock::now();
    std::shared_ptr<const ClientSideIndex> index(new ClientSideIndex(std::move(rows)));
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    CSI_INFO("Built client side index: {} rows, {} time buckets, {} tags in {} ms",
             index->size(), index->num_time_intervals(), index->num_tags(), elapsed_ms);
    return ResultType(std::move(index));
}

core::Result<std::shared_ptr<const ClientSideIndex>> ClientSideIndex::build_from_raw(
    const std::vector<RawRowId>& raw_ids) {
    using ResultType = core::Result<std::shared_ptr<const ClientSideIndex>>;

    std::vector<Row> rows;
    rows.reserve(raw_ids.size());
    for (const auto& [table, id] : raw_ids) {
        auto parsed = parse_row(table, id);
        if (!parsed.ok()) {
            return ResultType::error(parsed.error(), parsed.error_code());
        }
        rows.push_back(parsed.take_value());
    }
    return build(std::move(rows));
}

std::vector<const Row*> ClientSideIndex::copy_of_rows() const {
    std::vector<const Row*> result;
    result.reserve(rows_.size());
    for (const auto& row : rows_) {
        result.push_back(&row);
    }
    return result;
}

const Row& ClientSideIndex::row(RowRef ref) const {
    if (ref >= rows_.size()) {
        throw core::InvalidArgumentError("row handle " + std::to_string(ref) +
                                         " out of range (" + std::to_string(rows_.size()) + " rows)");
    }
    return rows_[ref];
}

std::vector<const Row*> ClientSideIndex::resolve(const PostingList& postings) const {
    std::vector<const Row*> result;
    result.reserve(postings.size());
    for (RowRef ref : postings) {
        result.push_back(&row(ref));
    }
    return result;
}

std::vector<const Row*> ClientSideIndex::rows_for_time_interval(const core::TimeInterval& interval) const {
    auto it = by_time_interval_.find(interval);
    if (it == by_time_interval_.end()) {
        return {};
    }
    return resolve(it->second);
}

std::vector<const Row*> ClientSideIndex::rows_for_tag(const core::Tag& tag) const {
    auto it = by_tag_.find(tag);
    if (it == by_tag_.end()) {
        return {};
    }
    return resolve(it->second);
}

} // namespace index
} // namespace csi
