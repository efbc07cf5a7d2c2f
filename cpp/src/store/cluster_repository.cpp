#include "counselscript/store/cluster_repository.hpp"
#include "counselscript/error.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/util/ids.hpp"

#include <mutex>
#include <set>

namespace counselscript {

std::string InMemoryClusterRepository::save_cluster_run(ClusterResult result,
                                                        std::vector<ClusterAssignment> assignments) {
    if (result.id.empty()) result.id = util::generate_id();
    if (result.created_at == TimePoint{}) result.created_at = std::chrono::system_clock::now();

    // Validate everything before touching shared state
    std::set<std::string> seen;
    for (auto& a : assignments) {
        if (a.vector_id.empty()) {
            throw PersistenceError("Assignment without vector id", "save_cluster_run");
        }
        if (!seen.insert(a.vector_id).second) {
            throw PersistenceError("Vector assigned twice: " + a.vector_id, "save_cluster_run");
        }
        a.cluster_result_id = result.id;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (results_.count(result.id)) {
        throw PersistenceError("Cluster result already exists: " + result.id, "save_cluster_run");
    }
    const std::string id = result.id;
    assignments_[id] = std::move(assignments);
    results_[id] = std::move(result);
    return id;
}

std::optional<ClusterResult> InMemoryClusterRepository::find_cluster_result(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = results_.find(id);
    if (it == results_.end()) return std::nullopt;
    return it->second;
}

std::vector<ClusterAssignment> InMemoryClusterRepository::list_assignments(const std::string& cluster_result_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = assignments_.find(cluster_result_id);
    if (it == assignments_.end()) return {};
    return it->second;
}

void InMemoryClusterRepository::replace_representatives(const std::string& cluster_result_id,
                                                        const std::vector<ClusterRepresentative>& representatives) {
    std::vector<ClusterRepresentative> snapshot = representatives;
    for (auto& rep : snapshot) {
        rep.cluster_result_id = cluster_result_id;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!results_.count(cluster_result_id)) {
        throw PersistenceError("Unknown cluster result: " + cluster_result_id, "replace_representatives");
    }
    representatives_[cluster_result_id] = std::move(snapshot);
    LOG_DEBUG("Replaced representatives for ", cluster_result_id, ": ", representatives.size(), " rows");
}

std::vector<ClusterRepresentative> InMemoryClusterRepository::list_representatives(
    const std::string& cluster_result_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = representatives_.find(cluster_result_id);
    if (it == representatives_.end()) return {};
    return it->second;
}

std::vector<ClusterRepresentative> InMemoryClusterRepository::list_primary_representatives(
    const std::string& exclude_cluster_result_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ClusterRepresentative> primaries;
    for (const auto& [id, reps] : representatives_) {
        if (id == exclude_cluster_result_id) continue;
        for (const auto& rep : reps) {
            if (rep.is_primary) primaries.push_back(rep);
        }
    }
    return primaries;
}

void InMemoryClusterRepository::save_anomaly_results(const std::vector<AnomalyResult>& results) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    anomalies_.insert(anomalies_.end(), results.begin(), results.end());
}

std::vector<AnomalyResult> InMemoryClusterRepository::list_anomaly_results(const std::string& algorithm) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (algorithm.empty()) return anomalies_;
    std::vector<AnomalyResult> out;
    for (const auto& r : anomalies_) {
        if (r.algorithm == algorithm) out.push_back(r);
    }
    return out;
}

} // namespace counselscript
