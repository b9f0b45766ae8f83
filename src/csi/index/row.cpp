#include "csi/index/row.h"
#include "csi/common/logger.h"
#include "csi/core/error.h"
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>
#include <absl/strings/string_view.h>
#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <vector>

namespace csi {
namespace index {

namespace {

constexpr size_t kSectionCount = 3;

core::Result<Row> malformed(const std::string& id, const std::string& reason) {
    CSI_ERROR("Malformed row id '{}': {}", id, reason);
    return core::Result<Row>(core::MalformedIdentifierError("malformed row id '" + id + "': " + reason));
}

// Strict YYYY-MM-DD; the civil parser alone accepts single-digit fields.
bool has_date_shape(absl::string_view date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) {
            continue;
        }
        if (!absl::ascii_isdigit(static_cast<unsigned char>(date[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

Row::Row(std::string table, std::string id, std::string measurement,
         core::TagSet tags, std::string field, core::TimeInterval time_interval)
    : table_(std::move(table)),
      id_(std::move(id)),
      measurement_(std::move(measurement)),
      tags_(std::move(tags)),
      field_(std::move(field)),
      time_interval_(time_interval) {}

bool Row::matches_time_interval(const core::TimeInterval& interval) const {
    return time_interval_.overlaps(interval);
}

bool Row::matches_measurement(const std::string& measurement) const {
    return measurement_ == measurement;
}

bool Row::matches_field(const std::string& field) const {
    return field_ == field;
}

bool Row::matches_tag_sets(const core::TagGroups& tag_sets) const {
    for (const auto& group : tag_sets) {
        bool match = false;
        for (const auto& tag : group) {
            if (has_tag(tag)) {
                match = true;
                break;
            }
        }
        if (!match) {
            return false;
        }
    }
    return true;
}

bool Row::operator==(const Row& other) const {
    return table_ == other.table_ && id_ == other.id_ &&
           measurement_ == other.measurement_ && tags_ == other.tags_ &&
           field_ == other.field_ && time_interval_ == other.time_interval_;
}

bool Row::operator!=(const Row& other) const {
    return !(*this == other);
}

core::Result<Row> parse_row(const std::string& table, const std::string& id) {
    std::vector<absl::string_view> sections = absl::StrSplit(id, '#');
    if (sections.size() != kSectionCount) {
        return malformed(id, "expected 3 '#'-separated sections, found " +
                                 std::to_string(sections.size()));
    }

    std::vector<absl::string_view> measurement_and_tags = absl::StrSplit(sections[0], ',');

    core::TagSet tags;
    for (size_t i = 1; i < measurement_and_tags.size(); ++i) {
        auto inserted = tags.emplace(measurement_and_tags[i]);
        if (!inserted.second) {
            return malformed(id, "duplicate tag '" + std::string(measurement_and_tags[i]) + "'");
        }
    }

    absl::string_view date = sections[2];
    absl::CivilDay day;
    if (!has_date_shape(date) || !absl::ParseCivilTime(date, &day)) {
        return malformed(id, "bad time bucket '" + std::string(date) + "'");
    }
    core::Timestamp start = absl::ToUnixMillis(absl::FromCivil(day, absl::UTCTimeZone()));

    return core::Result<Row>(Row(table, id,
                                 std::string(measurement_and_tags[0]),
                                 std::move(tags),
                                 std::string(sections[1]),
                                 core::TimeInterval(start, start + core::kBucketDuration)));
}

} // namespace index
} // namespace csi
