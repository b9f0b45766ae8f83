#include <gtest/gtest.h>
#include "csi/index/client_side_index.h"
#include "csi/core/error.h"
#include <algorithm>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace csi {
namespace index {
namespace {

constexpr core::Timestamp kJan1 = 1451606400000LL;  // 2016-01-01T00:00:00Z
constexpr core::Timestamp kJan2 = kJan1 + core::kBucketDuration;
constexpr core::Timestamp kJan3 = kJan2 + core::kBucketDuration;

class ClientSideIndexTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = ClientSideIndex::build_from_raw({
            {"series_double", "cpu,hostname=host_0,region=eu-central-1#usage_idle#2016-01-01"},
            {"series_double", "cpu,hostname=host_1,region=eu-central-1#usage_idle#2016-01-01"},
            {"series_bigint", "mem,hostname=host_0,region=us-west-1#available#2016-01-02"},
        });
        ASSERT_TRUE(result.ok()) << result.error();
        index_ = result.take_value();
    }

    std::shared_ptr<const ClientSideIndex> index_;
};

TEST_F(ClientSideIndexTest, PreservesInputOrder) {
    ASSERT_EQ(index_->size(), 3u);
    ASSERT_EQ(index_->all_ids().size(), 3u);
    for (size_t i = 0; i < index_->size(); ++i) {
        EXPECT_EQ(index_->rows()[i].id(), index_->all_ids()[i]);
    }
    EXPECT_EQ(index_->rows()[2].table(), "series_bigint");
}

TEST_F(ClientSideIndexTest, GroupsRowsByExactTimeBucket) {
    ASSERT_EQ(index_->num_time_intervals(), 2u);

    const auto& buckets = index_->by_time_interval();
    auto day1 = buckets.find(core::TimeInterval(kJan1, kJan2));
    auto day2 = buckets.find(core::TimeInterval(kJan2, kJan3));
    ASSERT_TRUE(day1 != buckets.end());
    ASSERT_TRUE(day2 != buckets.end());
    EXPECT_EQ(day1->second, (PostingList{0, 1}));
    EXPECT_EQ(day2->second, (PostingList{2}));

    // Exact-bucket index: a two-day query interval is not a key.
    EXPECT_TRUE(index_->rows_for_time_interval(core::TimeInterval(kJan1, kJan3)).empty());
}

TEST_F(ClientSideIndexTest, GroupsRowsByTag) {
    EXPECT_EQ(index_->num_tags(), 4u);
    const auto& tags = index_->by_tag();
    EXPECT_EQ(tags.at("hostname=host_0"), (PostingList{0, 2}));
    EXPECT_EQ(tags.at("hostname=host_1"), (PostingList{1}));
    EXPECT_EQ(tags.at("region=eu-central-1"), (PostingList{0, 1}));
    EXPECT_EQ(tags.at("region=us-west-1"), (PostingList{2}));
}

TEST_F(ClientSideIndexTest, EveryRowOnlyInItsOwnBuckets) {
    for (const auto& [interval, postings] : index_->by_time_interval()) {
        for (RowRef ref : postings) {
            EXPECT_EQ(index_->row(ref).time_interval(), interval);
        }
    }
    for (const auto& [tag, postings] : index_->by_tag()) {
        for (RowRef ref : postings) {
            EXPECT_TRUE(index_->row(ref).has_tag(tag)) << tag;
        }
    }

    // and every row is present in each bucket it belongs to
    for (size_t i = 0; i < index_->size(); ++i) {
        const Row& row = index_->rows()[i];
        RowRef ref = static_cast<RowRef>(i);
        const auto& by_time = index_->by_time_interval().at(row.time_interval());
        EXPECT_TRUE(std::binary_search(by_time.begin(), by_time.end(), ref));
        for (const auto& tag : row.tags()) {
            const auto& by_tag = index_->by_tag().at(tag);
            EXPECT_TRUE(std::binary_search(by_tag.begin(), by_tag.end(), ref));
        }
    }
}

TEST_F(ClientSideIndexTest, BucketsShareArenaRows) {
    auto by_time = index_->rows_for_time_interval(core::TimeInterval(kJan1, kJan2));
    auto by_tag = index_->rows_for_tag("hostname=host_0");
    ASSERT_EQ(by_time.size(), 2u);
    ASSERT_EQ(by_tag.size(), 2u);

    EXPECT_EQ(by_time[0], &index_->rows()[0]);
    EXPECT_EQ(by_tag[0], by_time[0]);
    EXPECT_EQ(by_tag[1], &index_->rows()[2]);
}

TEST_F(ClientSideIndexTest, UnknownKeysResolveToNothing) {
    EXPECT_TRUE(index_->rows_for_tag("hostname=host_9").empty());
    EXPECT_TRUE(index_->rows_for_time_interval(core::TimeInterval(kJan3, kJan3 + 1)).empty());
}

TEST_F(ClientSideIndexTest, RowHandleOutOfRangeThrows) {
    EXPECT_NO_THROW(index_->row(2));
    EXPECT_THROW(index_->row(3), core::InvalidArgumentError);
}

TEST_F(ClientSideIndexTest, CopyOfRowsIsIndependent) {
    auto copy = index_->copy_of_rows();
    ASSERT_EQ(copy.size(), 3u);

    std::reverse(copy.begin(), copy.end());
    copy.push_back(copy.front());
    copy.push_back(nullptr);

    EXPECT_EQ(copy.size(), 5u);
    EXPECT_EQ(index_->size(), 3u);
    EXPECT_EQ(index_->copy_of_rows().size(), 3u);
    EXPECT_EQ(index_->copy_of_rows()[0], &index_->rows()[0]);
    EXPECT_EQ(index_->rows()[0].measurement(), "cpu");
}

TEST_F(ClientSideIndexTest, ConcurrentReaders) {
    std::vector<std::thread> readers;
    std::vector<size_t> matched(8, 0);
    for (size_t t = 0; t < matched.size(); ++t) {
        readers.emplace_back([this, t, &matched]() {
            for (int i = 0; i < 1000; ++i) {
                matched[t] += index_->rows_for_tag("region=eu-central-1").size();
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    for (size_t count : matched) {
        EXPECT_EQ(count, 2000u);
    }
}

TEST(ClientSideIndexBuildTest, EmptyInputFails) {
    auto result = ClientSideIndex::build({});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::EMPTY_INDEX_INPUT);

    auto raw = ClientSideIndex::build_from_raw({});
    ASSERT_FALSE(raw.ok());
    EXPECT_EQ(raw.error_code(), core::Error::Code::EMPTY_INDEX_INPUT);
}

TEST(ClientSideIndexBuildTest, MalformedIdentifierFailsWholeBuild) {
    auto result = ClientSideIndex::build_from_raw({
        {"T", "cpu,hostname=host_0#usage_idle#2016-01-01"},
        {"T", "cpu,hostname=host_0,hostname=host_0#usage_idle#2016-01-01"},
    });
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), core::Error::Code::MALFORMED_IDENTIFIER);
    EXPECT_EQ(result.value(), nullptr);
}

TEST(ClientSideIndexBuildTest, EndToEndFromRawPairs) {
    auto result = ClientSideIndex::build_from_raw({
        {"T", "cpu,hostname=host_0#usage_idle#2016-01-01"},
        {"T", "mem,hostname=host_1#available#2016-01-02"},
    });
    ASSERT_TRUE(result.ok()) << result.error();
    const auto& index = *result.value();

    EXPECT_EQ(index.rows().size(), 2u);
    EXPECT_EQ(index.by_time_interval().size(), 2u);
    ASSERT_EQ(index.by_tag().count("hostname=host_0"), 1u);
    ASSERT_EQ(index.by_tag().count("hostname=host_1"), 1u);
    EXPECT_EQ(index.by_tag().at("hostname=host_0").size(), 1u);
    EXPECT_EQ(index.by_tag().at("hostname=host_1").size(), 1u);
    EXPECT_EQ(index.rows_for_tag("hostname=host_1")[0]->measurement(), "mem");
}

TEST(ClientSideIndexBuildTest, BuildFromParsedRows) {
    std::vector<Row> rows;
    rows.emplace_back("T", "disk#used#2016-01-01", "disk", core::TagSet{},
                      "used", core::TimeInterval(kJan1, kJan2));
    auto result = ClientSideIndex::build(std::move(rows));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value()->size(), 1u);
    EXPECT_EQ(result.value()->num_tags(), 0u);
    EXPECT_EQ(result.value()->all_ids(), (std::vector<std::string>{"disk#used#2016-01-01"}));
}

} // namespace
} // namespace index
} // namespace csi
