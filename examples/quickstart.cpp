#include "csi/common/logger.h"
#include "csi/core/config.h"
#include "csi/core/error.h"
#include "csi/index/row_source.h"
#include "csi/query/row_filter.h"
#include <cstdlib>

using namespace csi;

int main() {
    common::Logger::Init();

    core::IndexConfig config = core::IndexConfig::Default();
    config.tables = {"series_double", "series_bigint"};
    common::Logger::SetLevel(config.log_level);

    // Stand-in for the store scan a driver-backed RowSource performs.
    index::InMemoryRowSource source;
    source.add({
        {"series_double", "cpu,hostname=host_0,region=eu-central-1#usage_idle#2016-01-01"},
        {"series_double", "cpu,hostname=host_1,region=eu-central-1#usage_idle#2016-01-01"},
        {"series_double", "cpu,hostname=host_0,region=eu-central-1#usage_idle#2016-01-02"},
        {"series_bigint", "mem,hostname=host_1,region=us-west-1#available#2016-01-02"},
    });

    auto loaded = index::load_index(source, config);
    if (!loaded.ok()) {
        // No partial index: a run without one has nothing to plan against.
        CSI_CRITICAL("Cannot start without a client side index ({}): {}",
                     core::Error::code_name(loaded.error_code()), loaded.error());
        return EXIT_FAILURE;
    }
    auto csi_index = loaded.take_value();

    auto day1 = csi_index->rows_for_time_interval(csi_index->rows().front().time_interval());
    CSI_INFO("{} rows share the bucket {}", day1.size(), csi_index->rows().front().time_interval().to_string());

    query::RowQuery q("cpu", "usage_idle",
                      core::TimeInterval(csi_index->rows().front().time_interval().start(),
                                         csi_index->rows().front().time_interval().start() + 2 * core::kBucketDuration),
                      {{"hostname=host_0", "hostname=host_1"}, {"region=eu-central-1"}});

    auto candidates = query::select_candidates(*csi_index, q);
    CSI_INFO("Query {} matched {} rows", q.to_string(), candidates.size());
    for (const auto* row : candidates) {
        CSI_INFO("  {} {}", row->table(), row->id());
    }
    return EXIT_SUCCESS;
}
