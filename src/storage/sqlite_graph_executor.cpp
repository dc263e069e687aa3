#include <neograph/core/result_helpers.hpp>
#include <neograph/graph/graph_loader.h>
#include <neograph/storage/migration.h>
#include <neograph/storage/sqlite_graph_executor.h>
#include <neograph/storage/statement_parser.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <set>

namespace neograph::storage {

using executor::QueryResult;
using nlohmann::json;

namespace {

constexpr std::string_view kUriScheme = "sqlite://";
constexpr const char* kMemoryPath = ":memory:";

struct EntityRef {
    enum class Kind { Node, Relationship };
    Kind kind;
    int64_t id;
};

using Row = std::map<std::string, EntityRef>;

struct NodeRecord {
    int64_t id = 0;
    std::string label;
    json properties;
};

struct RelationshipRecord {
    int64_t id = 0;
    std::string type;
    int64_t src = 0;
    int64_t dst = 0;
    json properties;
};

struct ConstraintRecord {
    int64_t id = 0;
    std::string name;
    ConstraintEntity entity = ConstraintEntity::Node;
    std::string label;
    std::string property;
    ConstraintRequirement requirement = ConstraintRequirement::Unique;
};

const char* entityColumn(ConstraintEntity entity) {
    return entity == ConstraintEntity::Node ? "node" : "relationship";
}

const char* requirementColumn(ConstraintRequirement requirement) {
    return requirement == ConstraintRequirement::Unique ? "unique" : "exists";
}

std::string constraintTypeName(const ConstraintRecord& c) {
    if (c.entity == ConstraintEntity::Node) {
        return c.requirement == ConstraintRequirement::Unique ? "UNIQUENESS"
                                                              : "NODE_PROPERTY_EXISTENCE";
    }
    return c.requirement == ConstraintRequirement::Unique ? "RELATIONSHIP_UNIQUENESS"
                                                          : "RELATIONSHIP_PROPERTY_EXISTENCE";
}

Result<json> parseProperties(const std::string& text) {
    auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Error{ErrorCode::InvalidData, "Corrupt property blob in graph store"};
    }
    return parsed;
}

bool matchesProperties(const json& properties, const json& pattern) {
    for (const auto& [key, expected] : pattern.items()) {
        auto it = properties.find(key);
        if (it == properties.end() || *it != expected)
            return false;
    }
    return true;
}

json renderNode(const NodeRecord& node) {
    return json{{"id", node.id},
                {"labels", json::array({node.label})},
                {"properties", node.properties}};
}

json renderRelationship(const RelationshipRecord& rel) {
    return json{{"id", rel.id},
                {"type", rel.type},
                {"start", rel.src},
                {"end", rel.dst},
                {"properties", rel.properties}};
}

/**
 * @brief Evaluates one parsed statement against an open transaction
 *
 * Property blobs are read from and written back to the tables on every access, so
 * several rows bound to the same entity always observe each other's updates.
 */
class StatementEvaluator {
public:
    StatementEvaluator(Database& db, bool allowWrite)
        : db_(db), allowWrite_(allowWrite),
          now_(std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count()) {}

    Result<QueryResult> run(const ParsedStatement& statement) {
        if (const auto* query = std::get_if<QueryStatement>(&statement)) {
            if (query->isWrite() && !allowWrite_) {
                return Error{ErrorCode::InvalidOperation,
                             "Writing in read access mode not allowed"};
            }
            NEOGRAPH_TRY(evalQuery(*query));
            NEOGRAPH_TRY(enforceConstraints());
        } else if (const auto* create = std::get_if<CreateConstraintStatement>(&statement)) {
            if (!allowWrite_) {
                return Error{ErrorCode::InvalidOperation,
                             "Schema operations in read access mode not allowed"};
            }
            NEOGRAPH_TRY(createConstraint(*create));
        } else {
            NEOGRAPH_TRY(showConstraints());
        }
        return std::move(result_);
    }

private:
    Database& db_;
    bool allowWrite_;
    int64_t now_;
    QueryResult result_;
    std::set<int64_t> touchedNodes_;
    std::set<int64_t> touchedRelationships_;

    // ---------------------------------------------------------------------
    // Clause evaluation
    // ---------------------------------------------------------------------

    Result<void> evalQuery(const QueryStatement& query) {
        std::vector<Row> rows(1);
        for (const auto& clause : query.clauses) {
            if (const auto* match = std::get_if<MatchClause>(&clause)) {
                NEOGRAPH_TRY_UNWRAP(matched, evalMatch(rows, *match));
                rows = std::move(matched);
            } else if (const auto* merge = std::get_if<MergeClause>(&clause)) {
                NEOGRAPH_TRY_UNWRAP(merged, evalMerge(rows, *merge));
                rows = std::move(merged);
            } else if (const auto* set = std::get_if<SetClause>(&clause)) {
                for (const auto& row : rows) {
                    NEOGRAPH_TRY(applySetItems(row, set->items));
                }
            } else if (const auto* ret = std::get_if<ReturnClause>(&clause)) {
                NEOGRAPH_TRY(evalReturn(rows, *ret));
            }
        }
        return {};
    }

    Result<std::vector<Row>> evalMatch(const std::vector<Row>& rows, const MatchClause& match) {
        const auto& pattern = match.pattern;
        NEOGRAPH_TRY_UNWRAP(startProps, evalMap(pattern.start.properties, false));

        std::vector<Row> out;
        if (!pattern.relationship) {
            NEOGRAPH_TRY_UNWRAP(candidates, listNodes(pattern.start.label));
            for (const auto& row : rows) {
                for (const auto& node : candidates) {
                    if (!matchesProperties(node.properties, startProps))
                        continue;
                    Row next = row;
                    if (bindNode(next, pattern.start.variable, node.id))
                        out.push_back(std::move(next));
                }
            }
            return out;
        }

        const auto& rel = *pattern.relationship;
        const auto& end = *pattern.end;
        NEOGRAPH_TRY_UNWRAP(relProps, evalMap(rel.properties, false));
        NEOGRAPH_TRY_UNWRAP(endProps, evalMap(end.properties, false));
        NEOGRAPH_TRY_UNWRAP(relationships, listRelationships(rel.type));

        for (const auto& row : rows) {
            for (const auto& r : relationships) {
                if (!matchesProperties(r.properties, relProps))
                    continue;

                std::vector<std::pair<int64_t, int64_t>> orientations;
                if (rel.direction != Direction::Incoming)
                    orientations.emplace_back(r.src, r.dst);
                if (rel.direction != Direction::Outgoing)
                    orientations.emplace_back(r.dst, r.src);

                for (const auto& [first, second] : orientations) {
                    NEOGRAPH_TRY_UNWRAP(startOk, nodeMatches(first, pattern.start, startProps));
                    NEOGRAPH_TRY_UNWRAP(endOk, nodeMatches(second, end, endProps));
                    if (!startOk || !endOk)
                        continue;
                    Row next = row;
                    if (bindNode(next, pattern.start.variable, first) &&
                        bindNode(next, end.variable, second) &&
                        bindRelationship(next, rel.variable, r.id)) {
                        out.push_back(std::move(next));
                    }
                }
            }
        }
        return out;
    }

    Result<std::vector<Row>> evalMerge(const std::vector<Row>& rows, const MergeClause& merge) {
        std::vector<Row> out;
        for (const auto& row : rows) {
            std::vector<Row> matched;
            bool created = false;
            if (merge.pattern.relationship) {
                NEOGRAPH_TRY(mergeRelationship(row, merge.pattern, matched, created));
            } else {
                NEOGRAPH_TRY(mergeNode(row, merge.pattern.start, matched, created));
            }
            for (auto& next : matched) {
                NEOGRAPH_TRY(applySetItems(next, created ? merge.onCreate : merge.onMatch));
                out.push_back(std::move(next));
            }
        }
        return out;
    }

    Result<void> mergeNode(const Row& row, const NodePattern& pattern, std::vector<Row>& out,
                           bool& created) {
        if (!pattern.variable.empty() && row.count(pattern.variable)) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Variable `{}` already declared", pattern.variable)};
        }
        if (!pattern.label) {
            return Error{ErrorCode::NotSupported, "MERGE of a node requires a label"};
        }
        NEOGRAPH_TRY_UNWRAP(props, evalMap(pattern.properties, true));
        NEOGRAPH_TRY_UNWRAP(candidates, listNodes(pattern.label));

        for (const auto& node : candidates) {
            if (!matchesProperties(node.properties, props))
                continue;
            Row next = row;
            bindNode(next, pattern.variable, node.id);
            out.push_back(std::move(next));
        }
        if (!out.empty()) {
            created = false;
            return {};
        }

        NEOGRAPH_TRY_UNWRAP(id, insertNode(*pattern.label, props));
        result_.summary.nodesCreated++;
        result_.summary.labelsAdded++;
        result_.summary.propertiesSet += static_cast<int64_t>(props.size());
        touchedNodes_.insert(id);

        Row next = row;
        bindNode(next, pattern.variable, id);
        out.push_back(std::move(next));
        created = true;
        return {};
    }

    Result<void> mergeRelationship(const Row& row, const PathPattern& pattern,
                                   std::vector<Row>& out, bool& created) {
        const auto& rel = *pattern.relationship;
        if (!rel.type) {
            return Error{ErrorCode::InvalidData,
                         "Exactly one relationship type must be specified for MERGE"};
        }
        if (!rel.variable.empty() && row.count(rel.variable)) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Variable `{}` already declared", rel.variable)};
        }
        NEOGRAPH_TRY_UNWRAP(from, boundEndpoint(row, pattern.start));
        NEOGRAPH_TRY_UNWRAP(to, boundEndpoint(row, *pattern.end));
        NEOGRAPH_TRY_UNWRAP(props, evalMap(rel.properties, true));
        NEOGRAPH_TRY_UNWRAP(candidates, listRelationships(rel.type));

        for (const auto& r : candidates) {
            bool forward = r.src == from && r.dst == to;
            bool backward = r.src == to && r.dst == from;
            bool hit = (rel.direction == Direction::Outgoing && forward) ||
                       (rel.direction == Direction::Incoming && backward) ||
                       (rel.direction == Direction::Undirected && (forward || backward));
            if (!hit || !matchesProperties(r.properties, props))
                continue;
            Row next = row;
            bindRelationship(next, rel.variable, r.id);
            out.push_back(std::move(next));
        }
        if (!out.empty()) {
            created = false;
            return {};
        }

        bool reversed = rel.direction == Direction::Incoming;
        NEOGRAPH_TRY_UNWRAP(id, insertRelationship(*rel.type, reversed ? to : from,
                                                   reversed ? from : to, props));
        result_.summary.relationshipsCreated++;
        result_.summary.propertiesSet += static_cast<int64_t>(props.size());
        touchedRelationships_.insert(id);

        Row next = row;
        bindRelationship(next, rel.variable, id);
        out.push_back(std::move(next));
        created = true;
        return {};
    }

    Result<int64_t> boundEndpoint(const Row& row, const NodePattern& pattern) {
        auto it = pattern.variable.empty() ? row.end() : row.find(pattern.variable);
        if (it == row.end()) {
            return Error{ErrorCode::NotSupported,
                         "MERGE of a relationship requires both endpoints to be bound"};
        }
        if (it->second.kind != EntityRef::Kind::Node) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Type mismatch: `{}` is not a node", pattern.variable)};
        }
        if (pattern.label || !pattern.properties.empty()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Can't create node `{}` with labels or properties here. "
                                     "The variable is already declared in this context",
                                     pattern.variable)};
        }
        return it->second.id;
    }

    Result<void> applySetItems(const Row& row, const std::vector<SetItem>& items) {
        for (const auto& item : items) {
            auto it = row.find(item.variable);
            if (it == row.end()) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("Variable `{}` not defined", item.variable)};
            }
            const auto& ref = it->second;
            NEOGRAPH_TRY_UNWRAP(props, loadProperties(ref));

            if (item.kind == SetItem::Kind::Property) {
                NEOGRAPH_TRY_UNWRAP(value, evalExpression(item.value));
                assignProperty(props, item.property, std::move(value));
            } else {
                NEOGRAPH_TRY_UNWRAP(values, evalMap(item.map, false));
                if (item.kind == SetItem::Kind::ReplaceMap) {
                    for (const auto& [key, _] : props.items()) {
                        if (!values.contains(key))
                            result_.summary.propertiesSet++;
                    }
                    props = json::object();
                }
                for (const auto& [key, value] : values.items()) {
                    assignProperty(props, key, value);
                }
            }
            NEOGRAPH_TRY(storeProperties(ref, props));
        }
        return {};
    }

    /// Null removes the key, like the server does.
    void assignProperty(json& props, const std::string& key, json value) {
        if (value.is_null()) {
            if (props.erase(key) > 0)
                result_.summary.propertiesSet++;
            return;
        }
        props[key] = std::move(value);
        result_.summary.propertiesSet++;
    }

    Result<void> evalReturn(const std::vector<Row>& rows, const ReturnClause& ret) {
        result_.keys.clear();
        for (const auto& item : ret.items) {
            result_.keys.push_back(item.column);
        }

        for (const auto& row : rows) {
            json record = json::object();
            for (const auto& item : ret.items) {
                auto it = row.find(item.variable);
                if (it == row.end()) {
                    return Error{ErrorCode::InvalidData,
                                 fmt::format("Variable `{}` not defined", item.variable)};
                }
                const auto& ref = it->second;
                if (item.property) {
                    NEOGRAPH_TRY_UNWRAP(props, loadProperties(ref));
                    auto found = props.find(*item.property);
                    record[item.column] = found == props.end() ? json(nullptr) : *found;
                } else if (ref.kind == EntityRef::Kind::Node) {
                    NEOGRAPH_TRY_UNWRAP(node, loadNode(ref.id));
                    record[item.column] = renderNode(node);
                } else {
                    NEOGRAPH_TRY_UNWRAP(rel, loadRelationship(ref.id));
                    record[item.column] = renderRelationship(rel);
                }
            }
            result_.records.push_back(std::move(record));
        }
        return {};
    }

    // ---------------------------------------------------------------------
    // Expressions and bindings
    // ---------------------------------------------------------------------

    Result<json> evalExpression(const Expression& expr) const {
        switch (expr.kind) {
            case Expression::Kind::Literal:
                return graph::propertyToJson(expr.literal);
            case Expression::Kind::Timestamp:
                return json(now_);
            case Expression::Kind::Null:
                break;
        }
        return json(nullptr);
    }

    Result<json> evalMap(const MapLiteral& map, bool rejectNull) const {
        json out = json::object();
        for (const auto& [key, expr] : map) {
            NEOGRAPH_TRY_UNWRAP(value, evalExpression(expr));
            if (value.is_null() && rejectNull) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("Cannot merge using null property value for '{}'", key)};
            }
            out[key] = std::move(value);
        }
        return out;
    }

    Result<bool> nodeMatches(int64_t id, const NodePattern& pattern, const json& props) {
        NEOGRAPH_TRY_UNWRAP(node, loadNode(id));
        if (pattern.label && node.label != *pattern.label)
            return false;
        return matchesProperties(node.properties, props);
    }

    static bool bindNode(Row& row, const std::string& variable, int64_t id) {
        return bind(row, variable, EntityRef{EntityRef::Kind::Node, id});
    }

    static bool bindRelationship(Row& row, const std::string& variable, int64_t id) {
        return bind(row, variable, EntityRef{EntityRef::Kind::Relationship, id});
    }

    /// False when the variable is already bound to a different entity.
    static bool bind(Row& row, const std::string& variable, EntityRef ref) {
        if (variable.empty())
            return true;
        auto [it, inserted] = row.emplace(variable, ref);
        return inserted || (it->second.kind == ref.kind && it->second.id == ref.id);
    }

    // ---------------------------------------------------------------------
    // Storage access
    // ---------------------------------------------------------------------

    Result<std::vector<NodeRecord>> listNodes(const std::optional<std::string>& label) {
        std::string sql = "SELECT id, label, properties FROM graph_nodes";
        if (label)
            sql += " WHERE label = ?";
        sql += " ORDER BY id";

        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare(sql));
        if (label)
            NEOGRAPH_TRY(stmt.bind(1, *label));

        std::vector<NodeRecord> nodes;
        while (true) {
            NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            NEOGRAPH_TRY_UNWRAP(props, parseProperties(stmt.getString(2)));
            nodes.push_back(NodeRecord{stmt.getInt64(0), stmt.getString(1), std::move(props)});
        }
        return nodes;
    }

    Result<std::vector<RelationshipRecord>>
    listRelationships(const std::optional<std::string>& type) {
        std::string sql = "SELECT id, type, src_id, dst_id, properties FROM graph_relationships";
        if (type)
            sql += " WHERE type = ?";
        sql += " ORDER BY id";

        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare(sql));
        if (type)
            NEOGRAPH_TRY(stmt.bind(1, *type));

        std::vector<RelationshipRecord> rels;
        while (true) {
            NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            NEOGRAPH_TRY_UNWRAP(props, parseProperties(stmt.getString(4)));
            rels.push_back(RelationshipRecord{stmt.getInt64(0), stmt.getString(1),
                                              stmt.getInt64(2), stmt.getInt64(3),
                                              std::move(props)});
        }
        return rels;
    }

    Result<NodeRecord> loadNode(int64_t id) {
        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare("SELECT label, properties FROM graph_nodes "
                                              "WHERE id = ?"));
        NEOGRAPH_TRY(stmt.bind(1, id));
        NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, fmt::format("Node({}) does not exist", id)};
        }
        NEOGRAPH_TRY_UNWRAP(props, parseProperties(stmt.getString(1)));
        return NodeRecord{id, stmt.getString(0), std::move(props)};
    }

    Result<RelationshipRecord> loadRelationship(int64_t id) {
        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare("SELECT type, src_id, dst_id, properties "
                                              "FROM graph_relationships WHERE id = ?"));
        NEOGRAPH_TRY(stmt.bind(1, id));
        NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow) {
            return Error{ErrorCode::NotFound, fmt::format("Relationship({}) does not exist", id)};
        }
        NEOGRAPH_TRY_UNWRAP(props, parseProperties(stmt.getString(3)));
        return RelationshipRecord{id, stmt.getString(0), stmt.getInt64(1), stmt.getInt64(2),
                                  std::move(props)};
    }

    Result<json> loadProperties(const EntityRef& ref) {
        if (ref.kind == EntityRef::Kind::Node) {
            NEOGRAPH_TRY_UNWRAP(node, loadNode(ref.id));
            return std::move(node.properties);
        }
        NEOGRAPH_TRY_UNWRAP(rel, loadRelationship(ref.id));
        return std::move(rel.properties);
    }

    Result<void> storeProperties(const EntityRef& ref, const json& props) {
        bool isNode = ref.kind == EntityRef::Kind::Node;
        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare(isNode
                                                  ? "UPDATE graph_nodes SET properties = ? "
                                                    "WHERE id = ?"
                                                  : "UPDATE graph_relationships SET properties = "
                                                    "? WHERE id = ?"));
        NEOGRAPH_TRY(stmt.bindAll(props.dump(), ref.id));
        NEOGRAPH_TRY(stmt.execute());
        (isNode ? touchedNodes_ : touchedRelationships_).insert(ref.id);
        return {};
    }

    Result<int64_t> insertNode(const std::string& label, const json& props) {
        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare("INSERT INTO graph_nodes (label, properties) "
                                              "VALUES (?, ?)"));
        NEOGRAPH_TRY(stmt.bindAll(label, props.dump()));
        NEOGRAPH_TRY(stmt.execute());
        return db_.lastInsertRowId();
    }

    Result<int64_t> insertRelationship(const std::string& type, int64_t src, int64_t dst,
                                       const json& props) {
        NEOGRAPH_TRY_UNWRAP(stmt, db_.prepare("INSERT INTO graph_relationships "
                                              "(type, src_id, dst_id, properties) "
                                              "VALUES (?, ?, ?, ?)"));
        NEOGRAPH_TRY(stmt.bindAll(type, src, dst, props.dump()));
        NEOGRAPH_TRY(stmt.execute());
        return db_.lastInsertRowId();
    }

    // ---------------------------------------------------------------------
    // Constraints
    // ---------------------------------------------------------------------

    Result<std::vector<ConstraintRecord>> listConstraintRecords() {
        NEOGRAPH_TRY_UNWRAP(stmt,
                            db_.prepare("SELECT id, name, entity_type, label, property, kind "
                                        "FROM graph_constraints ORDER BY name"));
        std::vector<ConstraintRecord> out;
        while (true) {
            NEOGRAPH_TRY_UNWRAP(hasRow, stmt.step());
            if (!hasRow)
                break;
            ConstraintRecord c;
            c.id = stmt.getInt64(0);
            c.name = stmt.getString(1);
            c.entity = stmt.getString(2) == "node" ? ConstraintEntity::Node
                                                   : ConstraintEntity::Relationship;
            c.label = stmt.getString(3);
            c.property = stmt.getString(4);
            c.requirement = stmt.getString(5) == "unique" ? ConstraintRequirement::Unique
                                                          : ConstraintRequirement::NotNull;
            out.push_back(std::move(c));
        }
        return out;
    }

    /// (id, properties) of every entity the constraint governs.
    Result<std::vector<std::pair<int64_t, json>>> governedEntities(const ConstraintRecord& c) {
        std::vector<std::pair<int64_t, json>> out;
        if (c.entity == ConstraintEntity::Node) {
            NEOGRAPH_TRY_UNWRAP(nodes, listNodes(c.label));
            for (auto& n : nodes)
                out.emplace_back(n.id, std::move(n.properties));
        } else {
            NEOGRAPH_TRY_UNWRAP(rels, listRelationships(c.label));
            for (auto& r : rels)
                out.emplace_back(r.id, std::move(r.properties));
        }
        return out;
    }

    /**
     * @brief Check @p c against the entities in @p scope (all governed entities when null)
     */
    Result<void> checkConstraint(const ConstraintRecord& c, const std::set<int64_t>* scope) {
        NEOGRAPH_TRY_UNWRAP(entities, governedEntities(c));
        const char* kind = c.entity == ConstraintEntity::Node ? "Node" : "Relationship";
        const char* labelWord = c.entity == ConstraintEntity::Node ? "label" : "type";

        for (const auto& [id, props] : entities) {
            if (scope && !scope->count(id))
                continue;
            auto value = props.find(c.property);

            if (c.requirement == ConstraintRequirement::NotNull) {
                if (value == props.end()) {
                    return Error{ErrorCode::ConstraintViolation,
                                 fmt::format("{}({}) with {} `{}` must have the property `{}`",
                                             kind, id, labelWord, c.label, c.property)};
                }
                continue;
            }

            if (value == props.end())
                continue;
            for (const auto& [otherId, otherProps] : entities) {
                if (otherId == id)
                    continue;
                auto other = otherProps.find(c.property);
                if (other != otherProps.end() && *other == *value) {
                    return Error{ErrorCode::ConstraintViolation,
                                 fmt::format("{}({}) already exists with {} `{}` and property "
                                             "`{}` = {}",
                                             kind, otherId, labelWord, c.label, c.property,
                                             value->dump(-1, ' ', false,
                                                         json::error_handler_t::replace))};
                }
            }
        }
        return {};
    }

    Result<void> enforceConstraints() {
        if (touchedNodes_.empty() && touchedRelationships_.empty())
            return {};
        NEOGRAPH_TRY_UNWRAP(constraints, listConstraintRecords());
        for (const auto& c : constraints) {
            const auto& scope =
                c.entity == ConstraintEntity::Node ? touchedNodes_ : touchedRelationships_;
            if (scope.empty())
                continue;
            NEOGRAPH_TRY(checkConstraint(c, &scope));
        }
        return {};
    }

    Result<void> createConstraint(const CreateConstraintStatement& stmt) {
        ConstraintRecord wanted;
        wanted.name = stmt.name.empty()
                          ? fmt::format("constraint_{}_{}_{}_{}", entityColumn(stmt.entity),
                                        stmt.label, stmt.property,
                                        requirementColumn(stmt.requirement))
                          : stmt.name;
        wanted.entity = stmt.entity;
        wanted.label = stmt.label;
        wanted.property = stmt.property;
        wanted.requirement = stmt.requirement;

        NEOGRAPH_TRY_UNWRAP(existing, listConstraintRecords());
        for (const auto& c : existing) {
            bool equivalent = c.entity == wanted.entity && c.label == wanted.label &&
                              c.property == wanted.property && c.requirement == wanted.requirement;
            if (c.name != wanted.name && !equivalent)
                continue;
            if (stmt.ifNotExists) {
                spdlog::debug("Constraint '{}' already exists", c.name);
                return {};
            }
            return Error{ErrorCode::ConstraintViolation,
                         equivalent ? fmt::format("An equivalent constraint already exists: '{}'",
                                                  c.name)
                                    : fmt::format("A constraint named '{}' already exists",
                                                  c.name)};
        }

        auto valid = checkConstraint(wanted, nullptr);
        if (!valid) {
            return Error{ErrorCode::ConstraintViolation,
                         fmt::format("Unable to create constraint '{}': {}", wanted.name,
                                     valid.error().message)};
        }

        NEOGRAPH_TRY_UNWRAP(insert,
                            db_.prepare("INSERT INTO graph_constraints "
                                        "(name, entity_type, label, property, kind) "
                                        "VALUES (?, ?, ?, ?, ?)"));
        NEOGRAPH_TRY(insert.bindAll(wanted.name, entityColumn(wanted.entity), wanted.label,
                                    wanted.property, requirementColumn(wanted.requirement)));
        NEOGRAPH_TRY(insert.execute());
        result_.summary.constraintsAdded++;
        return {};
    }

    Result<void> showConstraints() {
        NEOGRAPH_TRY_UNWRAP(constraints, listConstraintRecords());
        result_.keys = {"id", "name", "type", "entityType", "labelsOrTypes", "properties"};
        for (const auto& c : constraints) {
            result_.records.push_back(json{
                {"id", c.id},
                {"name", c.name},
                {"type", constraintTypeName(c)},
                {"entityType", c.entity == ConstraintEntity::Node ? "NODE" : "RELATIONSHIP"},
                {"labelsOrTypes", json::array({c.label})},
                {"properties", json::array({c.property})}});
        }
        return {};
    }
};

class SqliteExecutorSession : public executor::ExecutorSession {
public:
    explicit SqliteExecutorSession(std::shared_ptr<SqliteGraphExecutor::SharedState> state)
        : state_(std::move(state)) {}

    ~SqliteExecutorSession() override {
        if (open_) {
            auto result = close();
            if (!result) {
                spdlog::warn("Failed to close graph store session: {}", result.error().message);
            }
        }
    }

    Result<QueryResult> runWrite(const std::string& statement) override {
        return run(statement, true);
    }

    Result<QueryResult> runRead(const std::string& statement) override {
        return run(statement, false);
    }

    Result<void> close() override {
        open_ = false;
        return {};
    }

    bool isOpen() const override { return open_; }

private:
    std::shared_ptr<SqliteGraphExecutor::SharedState> state_;
    bool open_ = true;

    Result<QueryResult> run(const std::string& text, bool write) {
        if (!open_) {
            return Error{ErrorCode::InvalidState, "Session is closed"};
        }

        std::lock_guard<std::mutex> lock(state_->mutex);
        auto& db = state_->db;
        if (!db.isOpen()) {
            return Error{ErrorCode::NotInitialized, "Graph store is not open"};
        }

        NEOGRAPH_TRY_UNWRAP(parsed, parseStatement(text));
        spdlog::trace("Evaluating statement: {}", text);

        NEOGRAPH_TRY(db.beginTransaction(write));
        auto rollback = scope_exit([&db] {
            auto result = db.rollback();
            if (!result) {
                spdlog::warn("Rollback failed: {}", result.error().message);
            }
        });

        StatementEvaluator evaluator(db, write);
        auto evaluated = [&]() -> Result<QueryResult> {
            try {
                return evaluator.run(parsed);
            } catch (const json::exception& e) {
                // Property blobs are stored as JSON text, which must be valid UTF-8
                return Error{ErrorCode::InvalidData,
                             fmt::format("Cannot store property values: {}", e.what())};
            }
        }();
        NEOGRAPH_TRY_UNWRAP(result, std::move(evaluated));
        NEOGRAPH_TRY(db.commit());
        rollback.dismiss();
        return std::move(result);
    }
};

} // namespace

SqliteGraphExecutor::SqliteGraphExecutor() : state_(std::make_shared<SharedState>()) {}

SqliteGraphExecutor::~SqliteGraphExecutor() {
    close();
}

Result<std::string> SqliteGraphExecutor::pathFromUri(const std::string& uri) {
    if (uri.compare(0, kUriScheme.size(), kUriScheme) != 0) {
        return Error{ErrorCode::NotSupported,
                     fmt::format("Unsupported graph store URI '{}': expected sqlite://", uri)};
    }
    auto path = uri.substr(kUriScheme.size());
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "Graph store URI has no database path"};
    }
    return path;
}

Result<void> SqliteGraphExecutor::open(const config::ConnectionConfig& config) {
    NEOGRAPH_TRY_UNWRAP(path, pathFromUri(config.uri));

    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& db = state_->db;
    if (db.isOpen()) {
        return Error{ErrorCode::InvalidState, "Graph store already open"};
    }

    bool memory = path == kMemoryPath;
    NEOGRAPH_TRY(db.open(path, memory ? ConnectionMode::Memory : ConnectionMode::Create));
    auto closeOnError = scope_exit([&db] { db.close(); });

    NEOGRAPH_TRY(db.setBusyTimeout(config.busyTimeout));
    NEOGRAPH_TRY(db.execute("PRAGMA foreign_keys = ON"));
    if (!memory) {
        auto wal = db.enableWAL();
        if (!wal) {
            spdlog::warn("Could not enable WAL for '{}': {}", path, wal.error().message);
        }
    }

    MigrationManager migrations(db);
    NEOGRAPH_TRY(migrations.initialize());
    migrations.registerMigrations(GraphStoreMigrations::getAllMigrations());
    NEOGRAPH_TRY(migrations.migrate());

    closeOnError.dismiss();
    config_ = config;
    spdlog::debug("Opened graph store '{}'", path);
    return {};
}

void SqliteGraphExecutor::close() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->db.isOpen()) {
        state_->db.close();
        spdlog::debug("Closed graph store");
    }
}

Result<void> SqliteGraphExecutor::reopen() {
    if (!config_) {
        return Error{ErrorCode::InvalidState, "Graph store was never opened"};
    }
    close();
    return open(*config_);
}

bool SqliteGraphExecutor::isOpen() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->db.isOpen();
}

Result<std::unique_ptr<executor::ExecutorSession>> SqliteGraphExecutor::openSession() {
    if (!isOpen()) {
        return Error{ErrorCode::NotInitialized, "Graph store is not open"};
    }
    return std::unique_ptr<executor::ExecutorSession>(
        std::make_unique<SqliteExecutorSession>(state_));
}

} // namespace neograph::storage
