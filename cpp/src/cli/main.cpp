// =============================================================================
// counselscript CLI
// =============================================================================
//
// Usage:
//   counselscript [--config <file>] [-v|-q] <command> [options]
//
// Commands:
//   init-db          Create the pgvector extension and tables
//   cluster          Cluster the stored success vectors
//   representatives  Select representatives for a cluster result
//   anomalies        Detect special success cases
//   match            Find success exemplars for a failure transcript
//   score            Score a generated script (markdown)
//   generate         Generate, parse and score an improvement script
//   version          Show version information
//   help             Show this help message
//
// =============================================================================

#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "counselscript/analysis/anomaly_detector.hpp"
#include "counselscript/analysis/representative_extractor.hpp"
#include "counselscript/clustering/clustering_service.hpp"
#include "counselscript/config.hpp"
#include "counselscript/db/connection.hpp"
#include "counselscript/db/schema.hpp"
#include "counselscript/embedding/embedding_engine.hpp"
#include "counselscript/generation/text_generator.hpp"
#include "counselscript/logging.hpp"
#include "counselscript/matching/similarity_matcher.hpp"
#include "counselscript/pipeline/script_pipeline.hpp"
#include "counselscript/scoring/report_json.hpp"
#include "counselscript/store/cached_vector_search.hpp"
#include "counselscript/store/pg_cluster_repository.hpp"
#include "counselscript/store/pg_vector_store.hpp"
#include "counselscript/thread_pool.hpp"

namespace json = boost::json;

namespace counselscript::cli {
    int cmd_init_db(int argc, char* argv[]);
    int cmd_cluster(int argc, char* argv[]);
    int cmd_representatives(int argc, char* argv[]);
    int cmd_anomalies(int argc, char* argv[]);
    int cmd_match(int argc, char* argv[]);
    int cmd_score(int argc, char* argv[]);
    int cmd_generate(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

#define COUNSELSCRIPT_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"init-db",         "Create the pgvector extension and tables", counselscript::cli::cmd_init_db},
    {"cluster",         "Cluster the stored success vectors", counselscript::cli::cmd_cluster},
    {"representatives", "Select representatives for a cluster result", counselscript::cli::cmd_representatives},
    {"anomalies",       "Detect special success cases", counselscript::cli::cmd_anomalies},
    {"match",           "Find success exemplars for a failure transcript", counselscript::cli::cmd_match},
    {"score",           "Score a generated script (markdown)", counselscript::cli::cmd_score},
    {"generate",        "Generate, parse and score an improvement script", counselscript::cli::cmd_generate},
    {"version",         "Show version information", counselscript::cli::cmd_version},
    {"help",            "Show this help message", counselscript::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;
static counselscript::Config g_config;

namespace {

using namespace counselscript;

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw InvalidArgumentError("Cannot open file: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int report_error(const Error& error) {
    std::cerr << "Error [" << error_code_name(error.code) << "]: " << error.message << "\n";
    return 1;
}

void print_json(const json::value& value) {
    std::cout << json::serialize(value) << "\n";
}

// Services over the configured PostgreSQL backend
struct Backend {
    std::shared_ptr<db::ConnectionPool> pool;
    std::shared_ptr<PgVectorStore> store;
    std::shared_ptr<PgClusterRepository> repository;

    explicit Backend(const Config& config)
        : pool(std::make_shared<db::ConnectionPool>(config))
        , store(std::make_shared<PgVectorStore>(pool, static_cast<size_t>(config.embedding.dimension)))
        , repository(std::make_shared<PgClusterRepository>(pool)) {}
};

std::shared_ptr<EmbeddingEngine> make_embedding_engine(const Config& config) {
    auto http = std::make_shared<net::HttpClient>(config.embedding.endpoint);
    auto provider = std::make_shared<HttpEmbeddingProvider>(http, config.embedding.model);
    return std::make_shared<EmbeddingEngine>(provider, config.embedding);
}

} // namespace

namespace counselscript::cli {

// =============================================================================
// Help / Version
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "counselscript - counseling script analytics\n";
    std::cout << "Version " << COUNSELSCRIPT_VERSION_STRING << "\n\n";
    std::cout << "Usage: counselscript [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 18; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     YAML configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Warnings and errors only\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  CS_*                    Configuration overrides (e.g. CS_DB_HOST, CS_EMBEDDING_API_KEY)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  counselscript --config cs.yaml cluster --algorithm hdbscan\n";
    std::cout << "  counselscript representatives <cluster-result-id> --max-per-cluster 3\n";
    std::cout << "  counselscript score script.md --base base.json\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "counselscript " << COUNSELSCRIPT_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Database
// =============================================================================

int cmd_init_db([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    db::ConnectionPool pool(g_config);
    db::PooledConnection conn(pool);
    db::ensure_schema(conn, g_config.embedding.dimension);
    if (!g_options.quiet) std::cout << "Schema ready\n";
    return 0;
}

// =============================================================================
// Clustering
// =============================================================================

int cmd_cluster(int argc, char* argv[]) {
    ClusteringRequest request = ClusteringRequest::from_settings(g_config.clustering);
    VectorFilter filter;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-a" || arg == "--algorithm") && i + 1 < argc) {
            request.algorithm = argv[++i];
        } else if (arg == "--k-min" && i + 1 < argc) {
            request.k_min = std::stoi(argv[++i]);
        } else if (arg == "--k-max" && i + 1 < argc) {
            request.k_max = std::stoi(argv[++i]);
        } else if (arg == "--no-auto-k") {
            request.auto_select_k = false;
        } else if (arg == "--counselor" && i + 1 < argc) {
            filter.counselor_names.push_back(argv[++i]);
        } else {
            std::cerr << "Unknown option for cluster: " << arg << "\n";
            return 1;
        }
    }

    Backend backend(g_config);
    ThreadPool pool;
    ClusteringEngine engine(static_cast<size_t>(g_config.embedding.dimension),
                            vecops::DimensionPolicy::Reject, &pool);
    ClusteringService service(*backend.store, *backend.repository, engine);

    auto future = pool.submit([&]() { return service.perform_clustering(request, filter); });
    auto summary = future.get();
    if (!summary) return report_error(summary.error());

    const auto& s = summary.value();
    json::object scores;
    for (const auto& [k, score] : s.output.performance.scores_by_k) {
        scores[std::to_string(k)] = score;
    }
    print_json(json::object{{"cluster_result_id", s.cluster_result_id},
                            {"algorithm", algorithm_name(s.output.algorithm)},
                            {"cluster_count", s.output.cluster_count},
                            {"silhouette_score", s.output.silhouette_score},
                            {"vectors", s.vector_ids.size()},
                            {"scores_by_k", std::move(scores)}});
    return 0;
}

int cmd_representatives(int argc, char* argv[]) {
    std::string cluster_result_id;
    size_t max_per_cluster = 3;
    double min_quality = 0.5;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-per-cluster" && i + 1 < argc) {
            max_per_cluster = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--min-quality" && i + 1 < argc) {
            min_quality = std::stod(argv[++i]);
        } else if (arg[0] != '-' && cluster_result_id.empty()) {
            cluster_result_id = arg;
        } else {
            std::cerr << "Unknown option for representatives: " << arg << "\n";
            return 1;
        }
    }
    if (cluster_result_id.empty()) {
        std::cerr << "Usage: counselscript representatives <cluster-result-id> [options]\n";
        return 1;
    }

    Backend backend(g_config);
    RepresentativeExtractor extractor(*backend.store, *backend.repository, g_config.lexicon);
    auto result = extractor.extract_representatives(cluster_result_id, max_per_cluster, min_quality);
    if (!result) return report_error(result.error());

    json::array clusters;
    for (const auto& cluster : result.value().clusters) {
        json::array reps;
        for (const auto& rep : cluster.representatives) {
            reps.push_back(json::object{{"vector_id", rep.vector_id},
                                        {"quality_score", rep.quality_score},
                                        {"is_primary", rep.is_primary},
                                        {"counselor_name", rep.counselor_name}});
        }
        clusters.push_back(json::object{{"cluster_label", cluster.cluster_label},
                                        {"representatives", std::move(reps)}});
    }
    const auto& summary = result.value().summary;
    print_json(json::object{{"cluster_result_id", cluster_result_id},
                            {"clusters", std::move(clusters)},
                            {"total_clusters", summary.total_clusters},
                            {"total_representatives", summary.total_representatives},
                            {"avg_quality_score", summary.avg_quality_score}});
    return 0;
}

int cmd_anomalies(int argc, char* argv[]) {
    std::string method_name = "isolation_forest";
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-m" || arg == "--method") && i + 1 < argc) {
            method_name = argv[++i];
        } else {
            std::cerr << "Unknown option for anomalies: " << arg << "\n";
            return 1;
        }
    }
    auto method = parse_anomaly_method(method_name);
    if (!method) return report_error(method.error());

    Backend backend(g_config);
    AnomalyDetector detector(g_config.anomaly, static_cast<size_t>(g_config.embedding.dimension));
    AnomalyDetectionService service(*backend.store, *backend.repository, detector);
    auto report = service.run(method.value());
    if (!report) return report_error(report.error());

    json::array outliers;
    if (report.value().analysis) {
        for (const auto& o : report.value().analysis->outliers) {
            outliers.push_back(json::object{{"vector_id", o.vector_id},
                                            {"session_id", o.session_id},
                                            {"distance_to_centroid", o.distance_to_centroid},
                                            {"text_preview", o.text_preview}});
        }
    }
    auto insights = AnomalyDetector::insights(report.value());
    json::array insight_list, recommendation_list;
    for (const auto& s : insights.insights) insight_list.emplace_back(json::string(s));
    for (const auto& s : insights.recommendations) recommendation_list.emplace_back(json::string(s));

    print_json(json::object{{"method", anomaly_method_name(method.value())},
                            {"total_conversations", report.value().total_conversations},
                            {"outliers_detected", report.value().outlier_indices.size()},
                            {"outliers", std::move(outliers)},
                            {"insights", std::move(insight_list)},
                            {"recommendations", std::move(recommendation_list)}});
    return 0;
}

// =============================================================================
// Matching
// =============================================================================

int cmd_match(int argc, char* argv[]) {
    std::string failure_file;
    MatchOptions options = MatchOptions::from_settings(g_config.matching);

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--top-k" && i + 1 < argc) {
            options.top_k = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg == "--threshold" && i + 1 < argc) {
            options.similarity_threshold = std::stod(argv[++i]);
        } else if (arg == "--no-analysis") {
            options.include_analysis = false;
        } else if (arg[0] != '-' && failure_file.empty()) {
            failure_file = arg;
        } else {
            std::cerr << "Unknown option for match: " << arg << "\n";
            return 1;
        }
    }
    if (failure_file.empty()) {
        std::cerr << "Usage: counselscript match <failure.txt> [options]\n";
        return 1;
    }

    Backend backend(g_config);
    CachedVectorSearch cached(backend.store, std::chrono::seconds(g_config.matching.cache_ttl_seconds),
                              g_config.matching.cache_capacity);
    auto embedding = make_embedding_engine(g_config);
    SimilarityMatcher matcher(*embedding, cached, g_config.lexicon);

    auto result = matcher.match_failure_to_success(read_file(failure_file), options);

    json::array matches;
    for (const auto& m : result.similar_successes) {
        json::array hints, differences;
        for (const auto& h : m.improvement_hints) hints.emplace_back(json::string(h));
        for (const auto& d : m.key_differences) differences.emplace_back(json::string(d));
        matches.push_back(json::object{{"vector_id", m.record.id},
                                       {"session_id", m.record.session_id},
                                       {"similarity_score", m.similarity_score},
                                       {"improvement_hints", std::move(hints)},
                                       {"key_differences", std::move(differences)}});
    }
    json::object out{{"token_count", result.failure_analysis.token_count},
                     {"similar_successes", std::move(matches)}};
    if (result.analysis_summary) {
        const auto& s = *result.analysis_summary;
        json::array areas;
        for (const auto& a : s.top_improvement_areas) areas.emplace_back(json::string(a));
        out["analysis_summary"] = json::object{{"total_found", s.total_found},
                                               {"avg_similarity", s.avg_similarity},
                                               {"median", s.distribution.median},
                                               {"min", s.distribution.min},
                                               {"max", s.distribution.max},
                                               {"top_improvement_areas", std::move(areas)}};
    }
    print_json(out);
    return 0;
}

// =============================================================================
// Scoring / Generation
// =============================================================================

int cmd_score(int argc, char* argv[]) {
    std::string script_file;
    std::string base_file;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-b" || arg == "--base") && i + 1 < argc) {
            base_file = argv[++i];
        } else if (arg[0] != '-' && script_file.empty()) {
            script_file = arg;
        } else {
            std::cerr << "Unknown option for score: " << arg << "\n";
            return 1;
        }
    }
    if (script_file.empty()) {
        std::cerr << "Usage: counselscript score <script.md> [--base <base.json>]\n";
        return 1;
    }

    ScriptParser parser(g_config.script_layout);
    const GeneratedScript script = parser.parse(read_file(script_file));
    const ScoringBaseData base = base_file.empty() ? ScoringBaseData{} : parse_base_data(read_file(base_file), parser);

    QualityScorer scorer(g_config.lexicon);
    print_json(to_json(scorer.score(script, base)));
    return 0;
}

int cmd_generate(int argc, char* argv[]) {
    GenerationRequest request;
    std::string base_file;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-f" || arg == "--failure") && i + 1 < argc) {
            request.failures.push_back({"", read_file(argv[++i])});
        } else if ((arg == "-b" || arg == "--base") && i + 1 < argc) {
            base_file = argv[++i];
        } else if (arg == "--max-representatives" && i + 1 < argc) {
            request.max_representatives = static_cast<size_t>(std::stoul(argv[++i]));
        } else if (arg[0] != '-' && request.cluster_result_id.empty()) {
            request.cluster_result_id = arg;
        } else {
            std::cerr << "Unknown option for generate: " << arg << "\n";
            return 1;
        }
    }
    if (request.cluster_result_id.empty()) {
        std::cerr << "Usage: counselscript generate <cluster-result-id> [--failure <file>]... [--base <file>]\n";
        return 1;
    }

    ScriptParser parser(g_config.script_layout);
    if (!base_file.empty()) {
        request.base_data = parse_base_data(read_file(base_file), parser);
    }

    Backend backend(g_config);
    ThreadPool pool;
    ClusteringEngine engine(static_cast<size_t>(g_config.embedding.dimension),
                            vecops::DimensionPolicy::Reject, &pool);
    ClusteringService clustering(*backend.store, *backend.repository, engine);
    RepresentativeExtractor extractor(*backend.store, *backend.repository, g_config.lexicon);
    auto embedding = make_embedding_engine(g_config);
    SimilarityMatcher matcher(*embedding, *backend.store, g_config.lexicon);
    HttpTextGenerator generator(std::make_shared<net::HttpClient>(g_config.generation.endpoint),
                                g_config.generation.model);
    QualityScorer scorer(g_config.lexicon);

    ScriptPipeline pipeline(pool, clustering, extractor, matcher, generator, scorer, parser, g_config.generation);
    auto result = pipeline.generate_script(request);
    if (!result) return report_error(result.error());

    const auto& r = result.value();
    print_json(json::object{{"generation_id", r.generation_id},
                            {"script", r.script.raw_content},
                            {"quality", to_json(r.quality)},
                            {"prompt_tokens", r.generation.prompt_tokens},
                            {"completion_tokens", r.generation.completion_tokens},
                            {"processing_time", r.processing_seconds},
                            {"model", r.generation.model}});
    return 0;
}

}  // namespace counselscript::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        counselscript::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    try {
        g_config = counselscript::load_config(g_options.config_file);

        auto level = counselscript::parse_log_level(g_config.log.level);
        if (g_options.verbose) level = counselscript::LogLevel::DEBUG;
        if (g_options.quiet) level = counselscript::LogLevel::WARN;
        counselscript::set_log_level(level);
        if (!g_config.log.file.empty()) {
            counselscript::set_log_file(g_config.log.file);
        }

        for (const Command* cmd = g_commands; cmd->name; ++cmd) {
            if (strcmp(cmd->name, cmd_name) == 0) {
                return cmd->handler(argc, argv);
            }
        }
    } catch (const counselscript::CounselScriptException& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'counselscript help' for usage.\n";
    return 1;
}
