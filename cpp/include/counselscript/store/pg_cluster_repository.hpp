#pragma once

#include <memory>

#include "counselscript/db/connection.hpp"
#include "counselscript/store/cluster_repository.hpp"

namespace counselscript {

/**
 * PostgreSQL ClusterRepository. Each write runs in one transaction;
 * representative replacement additionally holds a transaction-scoped
 * advisory lock keyed on the cluster result id so concurrent replacements
 * serialize instead of interleaving.
 */
class PgClusterRepository : public ClusterRepository {
public:
    explicit PgClusterRepository(std::shared_ptr<db::ConnectionPool> pool);

    std::string save_cluster_run(ClusterResult result,
                                 std::vector<ClusterAssignment> assignments) override;
    std::optional<ClusterResult> find_cluster_result(const std::string& id) const override;
    std::vector<ClusterAssignment> list_assignments(const std::string& cluster_result_id) const override;
    void replace_representatives(const std::string& cluster_result_id,
                                 const std::vector<ClusterRepresentative>& representatives) override;
    std::vector<ClusterRepresentative> list_representatives(const std::string& cluster_result_id) const override;
    std::vector<ClusterRepresentative> list_primary_representatives(
        const std::string& exclude_cluster_result_id) const override;
    void save_anomaly_results(const std::vector<AnomalyResult>& results) override;
    std::vector<AnomalyResult> list_anomaly_results(const std::string& algorithm = "") const override;

private:
    std::shared_ptr<db::ConnectionPool> pool_;
};

} // namespace counselscript
