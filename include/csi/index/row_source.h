#ifndef CSI_INDEX_ROW_SOURCE_H_
#define CSI_INDEX_ROW_SOURCE_H_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <absl/container/flat_hash_set.h>
#include "csi/core/config.h"
#include "csi/core/result.h"
#include "csi/index/client_side_index.h"
#include "csi/index/row.h"

namespace csi {
namespace index {

/**
 * @brief Interface for listing the distinct row ids stored in a table
 *
 * Implemented by the storage driver; connection lifecycle stays on that
 * side of the boundary.
 */
class RowSource {
public:
    virtual ~RowSource() = default;

    virtual core::Result<std::vector<std::string>> distinct_row_ids(const std::string& table) = 0;
};

/**
 * @brief RowSource over ids held in memory, e.g. a replayed snapshot
 */
class InMemoryRowSource : public RowSource {
public:
    InMemoryRowSource() = default;

    void add(const std::string& table, const std::string& id);
    void add(const std::vector<RawRowId>& raw_ids);

    // NOT_FOUND for a table that was never added.
    core::Result<std::vector<std::string>> distinct_row_ids(const std::string& table) override;

private:
    // Ids in insertion order, plus a set for the distinct check.
    struct TableIds {
        std::vector<std::string> ids;
        absl::flat_hash_set<std::string> seen;
    };

    std::map<std::string, TableIds> tables_;
};

/**
 * @brief Enumerate and parse every row of the given tables, in table order.
 */
core::Result<std::vector<Row>> fetch_rows(RowSource& source, const std::vector<std::string>& tables);

/**
 * @brief Fetch every configured table and build the index from the result.
 */
core::Result<std::shared_ptr<const ClientSideIndex>> load_index(RowSource& source,
                                                                const core::IndexConfig& config);

} // namespace index
} // namespace csi

#endif // CSI_INDEX_ROW_SOURCE_H_
