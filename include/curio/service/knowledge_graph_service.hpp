#pragma once

#include "curio/builder/knowledge_graph_builder.hpp"
#include "curio/graph/graph_store.hpp"
#include "curio/query/visualization_service.hpp"
#include "curio/scheduler/graph_scheduler.hpp"
#include "curio/vector/vector_store.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace curio {

/**
 * @brief Entry point used by the host application
 *
 * Owns the scheduler and the visualization service over one vector store
 * and one graph store. Direct builds, manual triggers and scheduled ticks
 * all go through the same BuildGuard, so only one build runs at a time.
 */
class KnowledgeGraphService {
public:
    KnowledgeGraphService(VectorStore& vectors, GraphStore& graph,
                          GraphBuildOptions default_options = GraphBuildOptions());

    KnowledgeGraphService(const KnowledgeGraphService&) = delete;
    KnowledgeGraphService& operator=(const KnowledgeGraphService&) = delete;

    // ==========================================
    // Building
    // ==========================================

    /**
     * @brief Run a full build with the given options
     * @throws BuildInProgress if another build holds the guard
     * @throws VectorStoreError / GraphStoreError from the stages
     */
    GraphBuildSummary build_knowledge_graph(const GraphBuildOptions& options);

    /**
     * @brief Run a full build with the default options
     */
    GraphBuildSummary build_knowledge_graph();

    /**
     * @brief Manual trigger; never throws, see ManualBuildResult
     */
    ManualBuildResult trigger_graph_build();

    SchedulerStatus get_scheduler_status() const;

    void start_scheduler(int64_t interval_ms = kDefaultGraphUpdateIntervalMs);
    void stop_scheduler();

    GraphBuildOptions get_default_options() const;
    void set_default_options(const GraphBuildOptions& options);

    // ==========================================
    // Reading
    // ==========================================

    /**
     * @brief Node and relationship counts; store failures propagate
     */
    GraphStats get_graph_statistics() const;

    VisualizationData get_visualization_data(
        const VisualizationOptions& options = VisualizationOptions()) const;

    std::vector<TopicSummary> get_topic_data() const;

    std::optional<ConceptDetails> get_concept_details(
        const std::string& concept_name,
        size_t limit = 10
    ) const;

    Subgraph get_node_subgraph(const std::string& node_id, size_t depth = 2, size_t limit = 50) const;

    GraphScheduler& scheduler() { return scheduler_; }

private:
    VectorStore& vectors_;
    GraphStore& graph_;

    mutable std::mutex options_mutex_;
    GraphBuildOptions default_options_;

    VisualizationService visualization_;

    // Declared last: its timer thread is joined before the members above go away
    GraphScheduler scheduler_;

    // Caller holds the build guard
    GraphBuildSummary run_build(const GraphBuildOptions& options);
};

} // namespace curio
