#ifndef CSI_CORE_TYPES_H_
#define CSI_CORE_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace csi {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch (UTC)
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Size of one wide-row time bucket: one UTC day
 */
constexpr Duration kBucketDuration = 24LL * 3600 * 1000;

/**
 * @brief A single "key=value" token attached to a row
 */
using Tag = std::string;

/**
 * @brief The tags carried by one row, unique
 */
using TagSet = std::set<Tag>;

/**
 * @brief Query-side tag filter: AND across groups, OR within a group
 */
using TagGroups = std::vector<std::vector<Tag>>;

/**
 * @brief Half-open time range [start, end)
 *
 * Plain value type. Equality and hashing use both endpoints so an
 * interval can key a hash map.
 */
class TimeInterval {
public:
    TimeInterval() : start_(0), end_(0) {}
    TimeInterval(Timestamp start, Timestamp end) : start_(start), end_(end) {}

    Timestamp start() const { return start_; }
    Timestamp end() const { return end_; }
    Duration duration() const { return end_ - start_; }
    bool empty() const { return end_ <= start_; }

    bool contains(Timestamp ts) const { return ts >= start_ && ts < end_; }

    // Non-empty intersection only; [a,b) and [b,c) do not overlap, and an
    // empty or inverted interval overlaps nothing.
    bool overlaps(const TimeInterval& other) const {
        return !empty() && !other.empty() &&
               start_ < other.end_ && other.start_ < end_;
    }

    bool operator==(const TimeInterval& other) const {
        return start_ == other.start_ && end_ == other.end_;
    }
    bool operator!=(const TimeInterval& other) const { return !(*this == other); }
    bool operator<(const TimeInterval& other) const {
        return start_ < other.start_ || (start_ == other.start_ && end_ < other.end_);
    }

    std::string to_string() const;

private:
    Timestamp start_;
    Timestamp end_;
};

struct TimeIntervalHash {
    size_t operator()(const TimeInterval& ti) const {
        size_t h1 = std::hash<Timestamp>{}(ti.start());
        size_t h2 = std::hash<Timestamp>{}(ti.end());
        return h1 ^ (h2 * 0x9e3779b97f4a7c15ULL);
    }
};

} // namespace core
} // namespace csi

#endif // CSI_CORE_TYPES_H_
