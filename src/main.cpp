#include "curio/cli/cli.hpp"
#include "curio/builder/knowledge_graph_builder.hpp"
#include "curio/config/engine_config.hpp"
#include "curio/graph/memory_graph_store.hpp"
#include "curio/graph/similarity.hpp"
#include "curio/scheduler/graph_scheduler.hpp"
#include "curio/service/knowledge_graph_service.hpp"
#include "curio/vector/chroma_vector_store.hpp"
#include "curio/vector/memory_vector_store.hpp"
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

using namespace curio;
using namespace curio::cli;

// ============== Helper Functions ==============

// Logs go to stderr; stdout carries only command output
void install_logger() {
    auto logger = spdlog::stderr_color_mt("curio");
    spdlog::set_default_logger(logger);
}

EngineConfig load_engine_config(const Options& args) {
    EngineConfig config = load_config_with_fallback(args.text("config"));
    if (args.enabled("verbose")) {
        config.log_level = "debug";
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }

    configure_logging(config.log_level);
    return config;
}

std::unique_ptr<VectorStore> open_vector_store(const EngineConfig& config) {
    if (!config.chroma_url.empty()) {
        spdlog::info("Using ChromaDB at {} (collection {})", config.chroma_url, config.chroma_collection);
        return std::make_unique<ChromaVectorStore>(config.chroma_config());
    }

    spdlog::info("Loading embeddings from: {}", config.embeddings_path);
    auto store = InMemoryVectorStore::load_from_json(config.embeddings_path);
    return store;
}

void open_graph_store(InMemoryGraphStore& graph, const std::string& path) {
    if (!fs::exists(path)) {
        spdlog::info("No graph at {}, starting from an empty graph", path);
        return;
    }

    spdlog::info("Loading graph from: {}", path);
    graph.load_from_json(path);
}

void save_graph_store(const InMemoryGraphStore& graph, const std::string& path) {
    fs::path out_path(path);
    if (out_path.has_parent_path()) {
        fs::create_directories(out_path.parent_path());
    }
    graph.save_to_json(path);
    spdlog::info("Saved graph ({} nodes, {} relationships) to: {}",
                 graph.num_nodes(), graph.num_edges(), path);
}

void write_output(const nlohmann::json& j, const std::string& output_path) {
    if (output_path.empty()) {
        std::cout << j.dump(2) << "\n";
        return;
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + output_path);
    }
    file << j.dump(2);
    spdlog::info("Wrote {}", output_path);
}

std::vector<float> parse_vector(const std::string& text) {
    std::vector<float> result;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        try {
            result.push_back(std::stof(item));
        } catch (const std::logic_error&) {
            throw std::runtime_error("Not a number in vector: '" + item + "'");
        }
    }
    return result;
}

void apply_build_overrides(const Options& args, GraphBuildOptions& options) {
    options.concept_threshold = args.number("concept-threshold", options.concept_threshold);
    options.activity_threshold = args.number("activity-threshold", options.activity_threshold);
    options.limit = args.count("limit", options.limit);
    options.min_cluster_size = args.count("min-cluster-size", options.min_cluster_size);
    options.cluster_threshold = args.number("cluster-threshold", options.cluster_threshold);
    if (args.enabled("no-topics")) options.build_topics = false;
    if (args.enabled("temporal")) options.build_temporal = true;
    if (args.has("topic-ids")) {
        options.topic_id_scheme = topic_id_scheme_from_string(args.text("topic-ids"));
    }
    if (options.limit > static_cast<size_t>(kMaxEmbeddingLimit)) {
        throw std::runtime_error("--limit above " + std::to_string(kMaxEmbeddingLimit) +
                                 " is outside the supported range");
    }
}

void print_build_summary(const GraphBuildSummary& summary) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Knowledge Graph Build Summary\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "  Concept relationships:  " << summary.concept_relationships.relationships_created
              << " created, " << summary.concept_relationships.already_existing << " existing, "
              << summary.concept_relationships.failed << " failed\n";
    std::cout << "  Activity relationships: " << summary.activity_relationships.relationships_created
              << " created, " << summary.activity_relationships.already_existing << " existing, "
              << summary.activity_relationships.failed << " failed\n";
    if (summary.topic_clusters) {
        std::cout << "  Topic clusters:         " << summary.topic_clusters->clusters_created << "\n";
    }
    if (summary.temporal_relationships) {
        std::cout << "  Temporal relationships: "
                  << summary.temporal_relationships->relationships_created << "\n";
    }
    std::cout << "  Elapsed:                " << std::fixed << std::setprecision(2)
              << summary.elapsed_seconds << "s\n";
}

// ============== curio build ==============
int cmd_build(const Options& args) {
    EngineConfig config = load_engine_config(args);
    GraphBuildOptions options = config.build_options();
    apply_build_overrides(args, options);

    auto vectors = open_vector_store(config);
    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    KnowledgeGraphService service(*vectors, graph, options);
    GraphBuildSummary summary = service.build_knowledge_graph();

    print_build_summary(summary);
    save_graph_store(graph, config.graph_path);

    if (args.has("output")) {
        write_output(summary.to_json(), args.text("output"));
    }
    return 0;
}

// ============== curio stats ==============
int cmd_stats(const Options& args) {
    EngineConfig config = load_engine_config(args);

    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    GraphStats stats = graph.stats();
    std::cout << "\nGraph Statistics:\n";
    std::cout << "  Nodes: " << stats.total_nodes() << "\n";
    for (const auto& [label, count] : stats.nodes_by_label) {
        std::cout << "    " << label << ": " << count << "\n";
    }
    std::cout << "  Relationships: " << stats.total_relationships() << "\n";
    for (const auto& [type, count] : stats.relationships_by_type) {
        std::cout << "    " << type << ": " << count << "\n";
    }
    return 0;
}

// ============== curio visualize ==============
int cmd_visualize(const Options& args) {
    EngineConfig config = load_engine_config(args);
    VisualizationOptions options = config.visualization_options();
    options.limit = args.count("limit", options.limit);
    options.min_node_degree = args.count("min-degree", options.min_node_degree);
    if (args.enabled("no-activities")) options.include_activities = false;
    if (args.enabled("no-topics")) options.include_topics = false;

    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    VisualizationService visualization(graph);
    write_output(visualization.get_visualization_data(options).to_json(), args.text("output"));
    return 0;
}

// ============== curio concept ==============
int cmd_concept(const Options& args) {
    EngineConfig config = load_engine_config(args);
    std::string name = args.require("name");
    size_t limit = args.count("limit", 10);

    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    VisualizationService visualization(graph);
    auto details = visualization.get_concept_details(name, limit);
    if (!details) {
        std::cerr << "Concept not found: " << name << "\n";
        return 1;
    }

    write_output(details->to_json(), args.text("output"));
    return 0;
}

// ============== curio subgraph ==============
int cmd_subgraph(const Options& args) {
    EngineConfig config = load_engine_config(args);
    std::string node_id = args.require("node");
    size_t depth = args.count("depth", 2);
    size_t limit = args.count("limit", 50);

    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    VisualizationService visualization(graph);
    write_output(visualization.get_node_subgraph(node_id, depth, limit).to_json(),
                 args.text("output"));
    return 0;
}

// ============== curio schedule ==============
int cmd_schedule(const Options& args) {
    EngineConfig config = load_engine_config(args);
    GraphBuildOptions options = config.build_options();
    apply_build_overrides(args, options);

    int64_t interval_ms = config.graph_update_interval_ms;
    if (args.has("interval-ms")) {
        interval_ms = static_cast<int64_t>(args.count("interval-ms", 0));
    }
    size_t runs = args.count("runs", 1);
    if (runs == 0) {
        throw std::runtime_error("--runs must be at least 1");
    }

    auto vectors = open_vector_store(config);
    InMemoryGraphStore graph;
    open_graph_store(graph, config.graph_path);

    std::mutex mutex;
    std::condition_variable cv;
    size_t attempts = 0;

    auto finish_attempt = [&] {
        {
            std::lock_guard lock(mutex);
            ++attempts;
        }
        cv.notify_all();
    };

    GraphScheduler scheduler([&] {
        try {
            KnowledgeGraphBuilder builder(*vectors, graph);
            GraphBuildSummary summary = builder.build(options);
            print_build_summary(summary);
            save_graph_store(graph, config.graph_path);
            finish_attempt();
            return summary;
        } catch (const std::exception&) {
            finish_attempt();
            throw;
        }
    });

    if (args.enabled("now")) {
        scheduler.run_pending_tick();
    }

    scheduler.start(interval_ms);
    std::cout << "Scheduler running every " << interval_ms << " ms until "
              << runs << " build(s) have run\n";

    {
        std::unique_lock lock(mutex);
        cv.wait(lock, [&] { return attempts >= runs; });
    }

    scheduler.stop();
    return 0;
}

// ============== curio similarity ==============
int cmd_similarity(const Options& args) {
    std::vector<float> a = parse_vector(args.require("a"));
    std::vector<float> b = parse_vector(args.require("b"));

    try {
        std::cout << std::setprecision(6) << cosine_similarity(a, b) << "\n";
    } catch (const DimensionMismatch& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    install_logger();

    CommandLine cli("curio", "1.0.0");

    const OptionDef config_opt = {"config", "c", "Path to JSON config file (optional)"};
    const OptionDef verbose_opt = {"verbose", "V", "Enable debug logging", OptionKind::Switch};
    const OptionDef output_opt = {"output", "o", "Output JSON file (default: stdout)"};

    const std::vector<OptionDef> build_opts = {
        config_opt,
        verbose_opt,
        {"concept-threshold", "", "Similarity threshold for RELATED_TO edges", OptionKind::Number},
        {"activity-threshold", "", "Similarity threshold for CONNECTS edges", OptionKind::Number},
        {"limit", "l", "Embeddings fetched per stage", OptionKind::Count},
        {"min-cluster-size", "", "Smallest topic cluster kept", OptionKind::Count},
        {"cluster-threshold", "", "Similarity to the cluster seed", OptionKind::Number},
        {"topic-ids", "", "Topic id scheme: sequential or content_hash"},
        {"no-topics", "", "Skip topic clustering", OptionKind::Switch},
        {"temporal", "", "Chain session activities with BEFORE edges", OptionKind::Switch}
    };

    // curio build
    std::vector<OptionDef> build_command_opts = build_opts;
    build_command_opts.push_back({"output", "o", "Write the build summary JSON here"});
    cli.add({
        "build",
        "Build relationships and topic clusters from the embeddings",
        build_command_opts,
        cmd_build
    });

    // curio stats
    cli.add({
        "stats",
        "Print node and relationship counts of the graph",
        {config_opt, verbose_opt},
        cmd_stats
    });

    // curio visualize
    cli.add({
        "visualize",
        "Export the filtered node/edge/topic payload as JSON",
        {
            config_opt,
            verbose_opt,
            {"limit", "l", "Relationships read from the graph", OptionKind::Count},
            {"min-degree", "m", "Drop nodes with fewer edges", OptionKind::Count},
            {"no-activities", "", "Drop relationships touching activities", OptionKind::Switch},
            {"no-topics", "", "Omit the topic listing", OptionKind::Switch},
            output_opt
        },
        cmd_visualize
    });

    // curio concept
    cli.add({
        "concept",
        "Show a concept with its related concepts and source activities",
        {
            config_opt,
            verbose_opt,
            {"name", "n", "Concept name", OptionKind::Text, "", true},
            {"limit", "l", "Related concepts returned", OptionKind::Count, "10"},
            output_opt
        },
        cmd_concept
    });

    // curio subgraph
    cli.add({
        "subgraph",
        "Export the neighbourhood of a node as JSON",
        {
            config_opt,
            verbose_opt,
            {"node", "n", "Node id (e.g. concept_machine_learning)", OptionKind::Text, "", true},
            {"depth", "d", "Hops to expand", OptionKind::Count, "2"},
            {"limit", "l", "Maximum edges collected", OptionKind::Count, "50"},
            output_opt
        },
        cmd_subgraph
    });

    // curio schedule
    std::vector<OptionDef> schedule_opts = build_opts;
    schedule_opts.push_back({"interval-ms", "i", "Build interval in milliseconds", OptionKind::Count});
    schedule_opts.push_back({"runs", "r", "Exit after this many scheduled builds", OptionKind::Count, "1"});
    schedule_opts.push_back({"now", "", "Run one build before the first interval", OptionKind::Switch});
    cli.add({
        "schedule",
        "Rebuild the graph periodically",
        schedule_opts,
        cmd_schedule
    });

    // curio similarity
    cli.add({
        "similarity",
        "Cosine similarity of two comma-separated vectors",
        {
            {"a", "a", "First vector, e.g. 1,0,0", OptionKind::Text, "", true},
            {"b", "b", "Second vector", OptionKind::Text, "", true}
        },
        cmd_similarity
    });

    return cli.run(argc, argv);
}
