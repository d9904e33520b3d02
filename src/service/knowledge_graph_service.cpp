#include "curio/service/knowledge_graph_service.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace curio {

KnowledgeGraphService::KnowledgeGraphService(
    VectorStore& vectors,
    GraphStore& graph,
    GraphBuildOptions default_options
)
    : vectors_(vectors),
      graph_(graph),
      default_options_(std::move(default_options)),
      visualization_(graph),
      scheduler_([this] { return run_build(get_default_options()); }) {}

// ==========================================
// Building
// ==========================================

GraphBuildSummary KnowledgeGraphService::build_knowledge_graph(const GraphBuildOptions& options) {
    BuildLease lease(scheduler_.guard());
    if (!lease.acquired()) {
        spdlog::warn("Graph build already in progress");
        throw BuildInProgress();
    }
    return run_build(options);
}

GraphBuildSummary KnowledgeGraphService::build_knowledge_graph() {
    return build_knowledge_graph(get_default_options());
}

ManualBuildResult KnowledgeGraphService::trigger_graph_build() {
    return scheduler_.trigger_manual_build();
}

SchedulerStatus KnowledgeGraphService::get_scheduler_status() const {
    return scheduler_.status();
}

void KnowledgeGraphService::start_scheduler(int64_t interval_ms) {
    scheduler_.start(interval_ms);
}

void KnowledgeGraphService::stop_scheduler() {
    scheduler_.stop();
}

GraphBuildOptions KnowledgeGraphService::get_default_options() const {
    std::lock_guard lock(options_mutex_);
    return default_options_;
}

void KnowledgeGraphService::set_default_options(const GraphBuildOptions& options) {
    std::lock_guard lock(options_mutex_);
    default_options_ = options;
}

GraphBuildSummary KnowledgeGraphService::run_build(const GraphBuildOptions& options) {
    KnowledgeGraphBuilder builder(vectors_, graph_);
    return builder.build(options);
}

// ==========================================
// Reading
// ==========================================

GraphStats KnowledgeGraphService::get_graph_statistics() const {
    try {
        return graph_.stats();
    } catch (const std::exception& e) {
        spdlog::error("Error getting graph statistics: {}", e.what());
        throw;
    }
}

VisualizationData KnowledgeGraphService::get_visualization_data(const VisualizationOptions& options) const {
    return visualization_.get_visualization_data(options);
}

std::vector<TopicSummary> KnowledgeGraphService::get_topic_data() const {
    return visualization_.get_topic_data();
}

std::optional<ConceptDetails> KnowledgeGraphService::get_concept_details(
    const std::string& concept_name,
    size_t limit
) const {
    return visualization_.get_concept_details(concept_name, limit);
}

Subgraph KnowledgeGraphService::get_node_subgraph(const std::string& node_id, size_t depth, size_t limit) const {
    return visualization_.get_node_subgraph(node_id, depth, limit);
}

} // namespace curio
