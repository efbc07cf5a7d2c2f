#include "counselscript/clustering/hdbscan.hpp"
#include "counselscript/clustering/metrics.hpp"
#include "counselscript/error.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <numeric>

namespace counselscript::clustering {

namespace {

// Lambda for zero-length merges
constexpr double kMaxLambda = 1e12;

struct MstEdge {
    int a;
    int b;
    double weight;
};

struct LinkageNode {
    int left;
    int right;
    double distance;
    int size;
};

std::vector<MstEdge> prim_mst(const Eigen::MatrixXd& mr) {
    const int n = static_cast<int>(mr.rows());
    std::vector<MstEdge> edges;
    edges.reserve(static_cast<size_t>(n > 0 ? n - 1 : 0));

    std::vector<bool> in_tree(static_cast<size_t>(n), false);
    std::vector<double> best(static_cast<size_t>(n), std::numeric_limits<double>::infinity());
    std::vector<int> from(static_cast<size_t>(n), -1);

    int current = 0;
    for (int step = 0; step < n - 1; ++step) {
        in_tree[static_cast<size_t>(current)] = true;
        int next = -1;
        double next_weight = std::numeric_limits<double>::infinity();
        for (int j = 0; j < n; ++j) {
            if (in_tree[static_cast<size_t>(j)]) continue;
            double w = mr(current, j);
            if (w < best[static_cast<size_t>(j)]) {
                best[static_cast<size_t>(j)] = w;
                from[static_cast<size_t>(j)] = current;
            }
            if (best[static_cast<size_t>(j)] < next_weight) {
                next_weight = best[static_cast<size_t>(j)];
                next = j;
            }
        }
        edges.push_back({from[static_cast<size_t>(next)], next, next_weight});
        current = next;
    }
    return edges;
}

std::vector<LinkageNode> single_linkage(std::vector<MstEdge> edges, int n) {
    std::stable_sort(edges.begin(), edges.end(),
                     [](const MstEdge& x, const MstEdge& y) { return x.weight < y.weight; });

    std::vector<int> parent(static_cast<size_t>(n));
    std::iota(parent.begin(), parent.end(), 0);
    std::vector<int> node_of(static_cast<size_t>(n));
    std::iota(node_of.begin(), node_of.end(), 0);
    std::vector<int> size_of(static_cast<size_t>(n), 1);

    auto find = [&parent](int x) {
        while (parent[static_cast<size_t>(x)] != x) {
            parent[static_cast<size_t>(x)] = parent[static_cast<size_t>(parent[static_cast<size_t>(x)])];
            x = parent[static_cast<size_t>(x)];
        }
        return x;
    };

    std::vector<LinkageNode> hierarchy;
    hierarchy.reserve(edges.size());
    for (const auto& e : edges) {
        int ra = find(e.a);
        int rb = find(e.b);
        int size = size_of[static_cast<size_t>(ra)] + size_of[static_cast<size_t>(rb)];
        hierarchy.push_back({node_of[static_cast<size_t>(ra)], node_of[static_cast<size_t>(rb)], e.weight, size});
        parent[static_cast<size_t>(rb)] = ra;
        size_of[static_cast<size_t>(ra)] = size;
        node_of[static_cast<size_t>(ra)] = n + static_cast<int>(hierarchy.size()) - 1;
    }
    return hierarchy;
}

// node and every descendant, breadth first
std::vector<int> bfs_from(const std::vector<LinkageNode>& hierarchy, int n, int root) {
    std::vector<int> out;
    std::deque<int> queue{root};
    while (!queue.empty()) {
        int node = queue.front();
        queue.pop_front();
        out.push_back(node);
        if (node >= n) {
            const auto& h = hierarchy[static_cast<size_t>(node - n)];
            queue.push_back(h.left);
            queue.push_back(h.right);
        }
    }
    return out;
}

std::vector<CondensedEdge> condense_tree(const std::vector<LinkageNode>& hierarchy, int n, int min_cluster_size) {
    const int root = 2 * n - 2;
    std::vector<int> relabel(static_cast<size_t>(2 * n - 1), 0);
    std::vector<bool> ignore(static_cast<size_t>(2 * n - 1), false);
    int next_label = n + 1;
    relabel[static_cast<size_t>(root)] = n;

    auto node_size = [&](int node) {
        return node < n ? 1 : hierarchy[static_cast<size_t>(node - n)].size;
    };

    std::vector<CondensedEdge> tree;
    for (int node : bfs_from(hierarchy, n, root)) {
        if (node < n || ignore[static_cast<size_t>(node)]) continue;

        const auto& h = hierarchy[static_cast<size_t>(node - n)];
        const double lambda = h.distance > 0.0 ? std::min(kMaxLambda, 1.0 / h.distance) : kMaxLambda;
        const int left_count = node_size(h.left);
        const int right_count = node_size(h.right);
        const int parent_label = relabel[static_cast<size_t>(node)];

        auto drop_points = [&](int child) {
            for (int sub : bfs_from(hierarchy, n, child)) {
                if (sub < n) tree.push_back({parent_label, sub, lambda, 1});
                ignore[static_cast<size_t>(sub)] = true;
            }
        };

        if (left_count >= min_cluster_size && right_count >= min_cluster_size) {
            relabel[static_cast<size_t>(h.left)] = next_label++;
            tree.push_back({parent_label, relabel[static_cast<size_t>(h.left)], lambda, left_count});
            relabel[static_cast<size_t>(h.right)] = next_label++;
            tree.push_back({parent_label, relabel[static_cast<size_t>(h.right)], lambda, right_count});
        } else if (left_count < min_cluster_size && right_count < min_cluster_size) {
            drop_points(h.left);
            drop_points(h.right);
        } else if (left_count < min_cluster_size) {
            relabel[static_cast<size_t>(h.right)] = parent_label;
            drop_points(h.left);
        } else {
            relabel[static_cast<size_t>(h.left)] = parent_label;
            drop_points(h.right);
        }
    }
    return tree;
}

} // namespace

const char* metric_name(DistanceMetric metric) {
    return metric == DistanceMetric::Cosine ? "cosine" : "euclidean";
}

Eigen::MatrixXd distance_matrix(const Eigen::MatrixXd& X, DistanceMetric metric) {
    if (metric == DistanceMetric::Euclidean) {
        return pairwise_euclidean(X);
    }
    Eigen::VectorXd norms = X.rowwise().norm();
    Eigen::MatrixXd normalized = X;
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        if (norms(i) > 0.0) normalized.row(i) /= norms(i);
    }
    Eigen::MatrixXd D = (1.0 - (normalized * normalized.transpose()).array()).matrix();
    D = D.cwiseMax(0.0);
    D.diagonal().setZero();
    return D;
}

HdbscanResult hdbscan_fit(const Eigen::MatrixXd& X, const HdbscanParams& params) {
    const int n = static_cast<int>(X.rows());
    COUNSELSCRIPT_CHECK_ARGUMENT(n >= 2, "HDBSCAN needs at least 2 points");
    COUNSELSCRIPT_CHECK_ARGUMENT(params.alpha > 0.0, "alpha must be positive");

    HdbscanResult result;
    result.min_cluster_size = params.min_cluster_size > 0 ? params.min_cluster_size : std::max(5, n / 10);
    const int min_samples = std::clamp(params.min_samples, 1, n);

    // Core distances
    const Eigen::MatrixXd D = distance_matrix(X, params.metric);
    Eigen::VectorXd core(n);
    for (int i = 0; i < n; ++i) {
        std::vector<double> row(static_cast<size_t>(n));
        for (int j = 0; j < n; ++j) row[static_cast<size_t>(j)] = D(i, j);
        std::nth_element(row.begin(), row.begin() + (min_samples - 1), row.end());
        core(i) = row[static_cast<size_t>(min_samples - 1)];
    }

    // Mutual reachability
    Eigen::MatrixXd mr(n, n);
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            mr(i, j) = i == j ? 0.0 : std::max({core(i), core(j), D(i, j) / params.alpha});
        }
    }

    auto hierarchy = single_linkage(prim_mst(mr), n);
    result.condensed_tree = condense_tree(hierarchy, n, result.min_cluster_size);
    const auto& tree = result.condensed_tree;

    // Stability: sum over children of (lambda - birth lambda) * size
    const int root = n;
    std::map<int, double> birth{{root, 0.0}};
    std::map<int, double> stability{{root, 0.0}};
    std::map<int, int> parent_of;
    for (const auto& e : tree) {
        parent_of[e.child] = e.parent;
        if (e.child >= n) {
            birth[e.child] = e.lambda;
            stability.emplace(e.child, 0.0);
        }
    }
    for (const auto& e : tree) {
        stability[e.parent] += (e.lambda - birth[e.parent]) * e.child_size;
    }

    // Excess of mass, leaves first; the root is never a candidate
    std::map<int, std::vector<int>> child_clusters;
    for (const auto& e : tree) {
        if (e.child >= n) child_clusters[e.parent].push_back(e.child);
    }
    std::map<int, bool> is_cluster;
    for (const auto& [id, s] : stability) {
        if (id != root) is_cluster[id] = true;
    }
    std::map<int, double> subtree_best = stability;
    for (auto it = stability.rbegin(); it != stability.rend(); ++it) {
        const int node = it->first;
        if (node == root) continue;
        double children_sum = 0.0;
        for (int c : child_clusters[node]) children_sum += subtree_best[c];

        if (!child_clusters[node].empty() && children_sum > stability[node]) {
            is_cluster[node] = false;
            subtree_best[node] = children_sum;
        } else {
            std::deque<int> queue(child_clusters[node].begin(), child_clusters[node].end());
            while (!queue.empty()) {
                int c = queue.front();
                queue.pop_front();
                is_cluster[c] = false;
                for (int g : child_clusters[c]) queue.push_back(g);
            }
        }
    }

    std::vector<int> selected;
    for (const auto& [id, flag] : is_cluster) {
        if (flag) selected.push_back(id);
    }
    std::map<int, int> label_of;
    for (size_t i = 0; i < selected.size(); ++i) {
        label_of[selected[i]] = static_cast<int>(i);
        result.cluster_persistence.push_back(stability[selected[i]]);
    }

    result.labels.assign(static_cast<size_t>(n), -1);
    for (int p = 0; p < n; ++p) {
        auto it = parent_of.find(p);
        int node = it == parent_of.end() ? root : it->second;
        while (node != root && !label_of.count(node)) {
            node = parent_of[node];
        }
        if (node != root) result.labels[static_cast<size_t>(p)] = label_of[node];
    }

    result.n_clusters = static_cast<int>(selected.size());
    result.n_noise = static_cast<int>(std::count(result.labels.begin(), result.labels.end(), -1));
    return result;
}

} // namespace counselscript::clustering
