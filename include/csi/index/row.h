#ifndef CSI_INDEX_ROW_H_
#define CSI_INDEX_ROW_H_

#include <string>
#include <utility>
#include "csi/core/result.h"
#include "csi/core/types.h"

namespace csi {
namespace index {

/**
 * @brief One wide row of the time-series store, parsed from its id
 *
 * Identifier grammar:
 *   <measurement>(,<tag>)*#<field>#<YYYY-MM-DD>
 * e.g. "cpu,hostname=host_0,region=eu-central-1#usage_idle#2016-01-01"
 *
 * Immutable after construction.
 */
class Row {
public:
    Row() = default;
    Row(std::string table, std::string id, std::string measurement,
        core::TagSet tags, std::string field, core::TimeInterval time_interval);

    const std::string& table() const { return table_; }
    const std::string& id() const { return id_; }
    const std::string& measurement() const { return measurement_; }
    const core::TagSet& tags() const { return tags_; }
    const std::string& field() const { return field_; }
    const core::TimeInterval& time_interval() const { return time_interval_; }

    bool has_tag(const core::Tag& tag) const { return tags_.count(tag) != 0; }

    bool matches_time_interval(const core::TimeInterval& interval) const;
    bool matches_measurement(const std::string& measurement) const;
    bool matches_field(const std::string& field) const;

    /**
     * @brief Every group must contain at least one tag of this row.
     *
     * An empty list of groups matches any row; an empty group matches none.
     */
    bool matches_tag_sets(const core::TagGroups& tag_sets) const;

    bool operator==(const Row& other) const;
    bool operator!=(const Row& other) const;

private:
    std::string table_;
    std::string id_;
    std::string measurement_;
    core::TagSet tags_;
    std::string field_;
    core::TimeInterval time_interval_;
};

/**
 * @brief Raw (table, identifier) pair as listed by the backing store
 */
using RawRowId = std::pair<std::string, std::string>;

/**
 * @brief Parse one identifier into a Row.
 *
 * Fails with MALFORMED_IDENTIFIER when the id does not have exactly three
 * '#'-separated sections, repeats a tag, or carries a date that is not a
 * valid YYYY-MM-DD day.
 */
core::Result<Row> parse_row(const std::string& table, const std::string& id);

} // namespace index
} // namespace csi

#endif // CSI_INDEX_ROW_H_
