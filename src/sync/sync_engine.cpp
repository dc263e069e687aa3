#include <neograph/cypher/property_encoder.h>
#include <neograph/cypher/sanitizer.h>
#include <neograph/cypher/upsert_query_builder.h>
#include <neograph/graph/graph_loader.h>
#include <neograph/sync/session_scope.h>
#include <neograph/sync/sync_engine.h>

#include <spdlog/spdlog.h>

namespace neograph::sync {

namespace {

constexpr const char* kReadAllNodes = "MATCH (n)\nRETURN n";

std::string edgeKey(const graph::EdgeKey& key) {
    return key.first + "->" + key.second;
}

} // namespace

SyncEngine::SyncEngine(executor::GraphExecutor& executor, SyncOptions options)
    : executor_(executor),
      logger_(options.logger ? std::move(options.logger) : spdlog::default_logger()) {}

Result<SyncReport> SyncEngine::synchronize(const graph::PropertyGraph& graph, bool verbose) {
    return withSession(executor_, [&](executor::ExecutorSession& session) -> Result<SyncReport> {
        SyncReport report;
        report.nodes.reserve(graph.nodeCount());
        report.edges.reserve(graph.edgeCount());

        // Nodes first so edge statements match existing endpoints
        for (const auto& [name, node] : graph.nodes()) {
            report.nodes.push_back(upsertNode(session, name, node, verbose));
        }
        for (const auto& [key, edge] : graph.edges()) {
            report.edges.push_back(upsertEdge(session, graph, key, edge, verbose));
        }

        if (report.ok()) {
            logger_->debug("Sync complete: {}", report.summary());
        } else {
            logger_->warn("Sync completed with failures: {}", report.summary());
        }
        return report;
    });
}

EntityOutcome SyncEngine::upsertNode(executor::ExecutorSession& session, const std::string& name,
                                     const graph::NodeData& node, bool verbose) {
    auto [label, cleanName] = cypher::sanitizeAll(node.label, name);
    auto statement = cypher::UpsertQueryBuilder::buildNodeUpsert(
        label, cleanName, cypher::encodeProperties(node.properties));
    return execute(session, EntityKind::Node, name, statement.text, statement.returns.at(1),
                   verbose);
}

EntityOutcome SyncEngine::upsertEdge(executor::ExecutorSession& session,
                                     const graph::PropertyGraph& graph, const graph::EdgeKey& key,
                                     const graph::EdgeData& edge, bool verbose) {
    const auto* from = graph.findNode(key.first);
    const auto* to = graph.findNode(key.second);
    if (!from || !to) {
        EntityOutcome outcome;
        outcome.kind = EntityKind::Edge;
        outcome.key = edgeKey(key);
        outcome.status = OutcomeStatus::Failed;
        outcome.error = Error{ErrorCode::NotFound,
                              "Edge endpoint '" + (from ? key.second : key.first) +
                                  "' is not a node of the graph"};
        logger_->warn("Skipping edge {}: {}", outcome.key, outcome.error->message);
        return outcome;
    }

    auto [fromLabel, fromName, toLabel, toName, relationship] =
        cypher::sanitizeAll(from->label, key.first, to->label, key.second, edge.label);
    auto statement = cypher::UpsertQueryBuilder::buildEdgeUpsert(
        fromLabel, fromName, toLabel, toName, relationship,
        cypher::encodeProperties(edge.properties));
    return execute(session, EntityKind::Edge, edgeKey(key), statement.text,
                   statement.returns.at(1), verbose);
}

EntityOutcome SyncEngine::execute(executor::ExecutorSession& session, EntityKind kind,
                                  std::string key, const std::string& statement,
                                  const std::string& createdColumn, bool verbose) {
    EntityOutcome outcome;
    outcome.kind = kind;
    outcome.key = std::move(key);

    if (verbose) {
        logger_->info("{}", statement);
    }

    auto result = session.runWrite(statement);
    if (!result) {
        outcome.status = OutcomeStatus::Failed;
        outcome.error = result.error();
        logger_->warn("Failed to upsert {} '{}': {}", toString(kind), outcome.key,
                      result.error().message);
        return outcome;
    }

    const auto& queryResult = result.value();
    if (verbose) {
        logger_->info("{}", queryResult.toJson().dump(
                                -1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    const auto& summary = queryResult.summary;
    bool created = kind == EntityKind::Node ? summary.nodesCreated > 0
                                            : summary.relationshipsCreated > 0;
    outcome.status = created ? OutcomeStatus::Created : OutcomeStatus::Matched;

    if (!queryResult.records.empty()) {
        const auto& record = queryResult.records.front();
        auto it = record.find(createdColumn);
        if (it != record.end() && it->is_number_integer()) {
            outcome.createdAt = it->get<int64_t>();
        }
    }
    return outcome;
}

Result<std::vector<PersistedNode>> SyncEngine::synchronizeRead() {
    return withSession(
        executor_, [&](executor::ExecutorSession& session) -> Result<std::vector<PersistedNode>> {
            auto result = session.runRead(kReadAllNodes);
            if (!result) {
                return result.error();
            }

            std::vector<PersistedNode> nodes;
            for (const auto& record : result.value().records) {
                auto it = record.find("n");
                if (it == record.end() || !it->is_object()) {
                    logger_->warn("Skipping malformed node record: {}", record.dump());
                    continue;
                }
                const auto& value = *it;

                PersistedNode node;
                node.id = value.value("id", int64_t{0});
                const auto& labels = value.value("labels", nlohmann::json::array());
                if (!labels.empty() && labels.front().is_string()) {
                    node.label = labels.front().get<std::string>();
                }

                auto properties = value.value("properties", nlohmann::json::object());
                for (const auto& [key, property] : properties.items()) {
                    if (key == graph::kNameKey && property.is_string()) {
                        node.name = property.get<std::string>();
                        continue;
                    }
                    if (key == "created" && property.is_number_integer()) {
                        node.created = property.get<int64_t>();
                        continue;
                    }
                    auto converted = graph::propertyFromJson(property);
                    if (!converted) {
                        logger_->warn("Skipping property '{}' of node {}: {}", key, node.id,
                                      converted.error().message);
                        continue;
                    }
                    node.properties.emplace(key, std::move(converted).value());
                }
                nodes.push_back(std::move(node));
            }
            return nodes;
        });
}

} // namespace neograph::sync
