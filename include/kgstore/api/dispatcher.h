#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "kgstore/core/result.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/operation_metrics.h"
#include "kgstore/storage/partition_manager.h"
#include "kgstore/storage/store_context.h"

namespace kgstore {
namespace api {

// Graph mutations. batch_size 0 means the configured default.

struct CreateEntitiesRequest {
    std::vector<core::Entity> entities;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct AddObservationsRequest {
    std::vector<core::ObservationAddition> additions;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct DeleteEntitiesRequest {
    std::vector<std::string> names;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct DeleteObservationsRequest {
    std::vector<core::ObservationDeletion> deletions;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct CreateRelationsRequest {
    std::vector<core::Relation> relations;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct DeleteRelationsRequest {
    std::vector<core::RelationKey> relations;
    size_t batch_size = 0;
    std::optional<std::string> changed_by;
};

struct UpdateEntityRequest {
    std::string name;
    core::EntityUpdate update;
    std::optional<std::string> changed_by;
};

// Graph reads

struct SearchNodesRequest {
    std::string query;
};

struct OpenNodesRequest {
    std::vector<std::string> names;
};

struct ReadGraphRequest {};
struct EntityStatisticsRequest {};
struct RelationSummaryRequest {};

// History

struct EntityAtTimeRequest {
    std::string name;
    core::Timestamp timestamp = 0;
};

struct EntityChangesRequest {
    std::string name;
    std::optional<core::Timestamp> start;
    std::optional<core::Timestamp> end;
};

struct RelationsAtTimeRequest {
    std::string name;
    core::Timestamp timestamp = 0;
    core::Direction direction = core::Direction::BOTH;
};

struct ChangesInPeriodRequest {
    core::Timestamp start = 0;
    core::Timestamp end = 0;
    std::optional<std::string> entity_type;
    std::optional<core::ChangeType> change_type;
};

struct RelationChangesRequest {
    core::RelationKey relation;
};

struct GraphAtTimeRequest {
    core::Timestamp timestamp = 0;
};

struct ChangeSummaryRequest {
    std::string name;
};

// Administration

struct MaintenanceRequest {};

/**
 * @brief Every operation the store accepts
 */
using Request = std::variant<
    CreateEntitiesRequest, AddObservationsRequest, DeleteEntitiesRequest,
    DeleteObservationsRequest, CreateRelationsRequest, DeleteRelationsRequest,
    UpdateEntityRequest, SearchNodesRequest, OpenNodesRequest, ReadGraphRequest,
    EntityStatisticsRequest, RelationSummaryRequest, EntityAtTimeRequest, EntityChangesRequest,
    RelationsAtTimeRequest, ChangesInPeriodRequest, RelationChangesRequest, GraphAtTimeRequest,
    ChangeSummaryRequest, MaintenanceRequest>;

using ObservationMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Output of a dispatched operation
 *
 * Holds the same type the matching store method returns. Operations that
 * share a return type (the relation lists) share an alternative.
 */
using Response = std::variant<
    std::monostate,
    std::vector<core::Entity>,
    ObservationMap,
    std::vector<std::string>,
    std::vector<core::Relation>,
    core::Entity,
    core::KnowledgeGraph,
    std::vector<core::EntityTypeStats>,
    std::vector<core::RelationTypeSummary>,
    std::optional<core::EntityVersion>,
    std::vector<core::EntityVersion>,
    std::vector<core::RelationVersion>,
    std::vector<core::VersionDiff>,
    storage::MaintenanceReport>;

/**
 * @brief Metrics bucket an operation is recorded under
 */
storage::OperationKind OperationKindOf(const Request& request);

/**
 * @brief Routes requests to the components of one store
 */
class Dispatcher {
public:
    explicit Dispatcher(storage::StoreContext& store) : store_(store) {}

    core::Result<Response> Dispatch(const Request& request);

private:
    storage::StoreContext& store_;
};

} // namespace api
} // namespace kgstore
