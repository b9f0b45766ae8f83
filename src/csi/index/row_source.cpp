#include "csi/index/row_source.h"
#include "csi/common/logger.h"
#include "csi/core/error.h"
#include <utility>

namespace csi {
namespace index {

void InMemoryRowSource::add(const std::string& table, const std::string& id) {
    auto& entry = tables_[table];
    if (entry.seen.insert(id).second) {
        entry.ids.push_back(id);
    }
}

void InMemoryRowSource::add(const std::vector<RawRowId>& raw_ids) {
    for (const auto& [table, id] : raw_ids) {
        add(table, id);
    }
}

core::Result<std::vector<std::string>> InMemoryRowSource::distinct_row_ids(const std::string& table) {
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return core::Result<std::vector<std::string>>(
            core::NotFoundError("unknown table '" + table + "'"));
    }
    return core::Result<std::vector<std::string>>(it->second.ids);
}

core::Result<std::vector<Row>> fetch_rows(RowSource& source, const std::vector<std::string>& tables) {
    std::vector<Row> rows;

    for (const auto& table : tables) {
        auto ids = source.distinct_row_ids(table);
        if (!ids.ok()) {
            CSI_ERROR("Listing row ids of table {} failed: {}", table, ids.error());
            return core::Result<std::vector<Row>>::error(ids.error(), ids.error_code());
        }

        for (const auto& id : ids.value()) {
            auto row = parse_row(table, id);
            if (!row.ok()) {
                return core::Result<std::vector<Row>>::error(row.error(), row.error_code());
            }
            rows.push_back(row.take_value());
        }
        CSI_DEBUG("Fetched {} row ids from table {}", ids.value().size(), table);
    }

    return core::Result<std::vector<Row>>(std::move(rows));
}

core::Result<std::shared_ptr<const ClientSideIndex>> load_index(RowSource& source,
                                                                const core::IndexConfig& config) {
    CSI_INFO("Loading client side index from {} tables", config.tables.size());

    auto rows = fetch_rows(source, config.tables);
    if (!rows.ok()) {
        return core::Result<std::shared_ptr<const ClientSideIndex>>::error(rows.error(), rows.error_code());
    }
    return ClientSideIndex::build(rows.take_value());
}

} // namespace index
} // namespace csi
