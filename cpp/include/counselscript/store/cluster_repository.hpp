#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "counselscript/types.hpp"

namespace counselscript {

/**
 * Persistence boundary for clustering output.
 *
 * Every write is atomic with respect to readers: a result is visible
 * together with all of its assignments or not at all, and a
 * representative snapshot is replaced as a whole. Failed writes leave
 * nothing behind and throw PersistenceError.
 */
class ClusterRepository {
public:
    virtual ~ClusterRepository() = default;

    // Stores result and assignments in one transaction; returns the result id
    virtual std::string save_cluster_run(ClusterResult result,
                                         std::vector<ClusterAssignment> assignments) = 0;

    virtual std::optional<ClusterResult> find_cluster_result(const std::string& id) const = 0;

    virtual std::vector<ClusterAssignment> list_assignments(const std::string& cluster_result_id) const = 0;

    // Delete-then-insert of the full set for cluster_result_id
    virtual void replace_representatives(const std::string& cluster_result_id,
                                         const std::vector<ClusterRepresentative>& representatives) = 0;

    virtual std::vector<ClusterRepresentative> list_representatives(const std::string& cluster_result_id) const = 0;

    // Primary representatives of every other cluster result
    virtual std::vector<ClusterRepresentative> list_primary_representatives(
        const std::string& exclude_cluster_result_id) const = 0;

    virtual void save_anomaly_results(const std::vector<AnomalyResult>& results) = 0;

    virtual std::vector<AnomalyResult> list_anomaly_results(const std::string& algorithm = "") const = 0;
};

class InMemoryClusterRepository : public ClusterRepository {
public:
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
    std::map<std::string, ClusterResult> results_;
    std::map<std::string, std::vector<ClusterAssignment>> assignments_;
    std::map<std::string, std::vector<ClusterRepresentative>> representatives_;
    std::vector<AnomalyResult> anomalies_;
    mutable std::shared_mutex mutex_;
};

} // namespace counselscript
