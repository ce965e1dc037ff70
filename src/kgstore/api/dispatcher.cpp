#include "kgstore/api/dispatcher.h"

#include "kgstore/common/logger.h"

namespace kgstore {
namespace api {

namespace {

using storage::OperationKind;

template <typename T>
core::Result<Response> Wrap(core::Result<T> result) {
    if (!result.ok()) return result.error_info();
    return Response(result.take_value());
}

struct KindVisitor {
    OperationKind operator()(const CreateEntitiesRequest&) const { return OperationKind::CREATE_ENTITIES; }
    OperationKind operator()(const AddObservationsRequest&) const { return OperationKind::ADD_OBSERVATIONS; }
    OperationKind operator()(const DeleteEntitiesRequest&) const { return OperationKind::DELETE_ENTITIES; }
    OperationKind operator()(const DeleteObservationsRequest&) const { return OperationKind::DELETE_OBSERVATIONS; }
    OperationKind operator()(const CreateRelationsRequest&) const { return OperationKind::CREATE_RELATIONS; }
    OperationKind operator()(const DeleteRelationsRequest&) const { return OperationKind::DELETE_RELATIONS; }
    OperationKind operator()(const UpdateEntityRequest&) const { return OperationKind::UPDATE_ENTITY; }
    OperationKind operator()(const SearchNodesRequest&) const { return OperationKind::SEARCH_NODES; }
    OperationKind operator()(const OpenNodesRequest&) const { return OperationKind::OPEN_NODES; }
    OperationKind operator()(const ReadGraphRequest&) const { return OperationKind::READ_GRAPH; }
    OperationKind operator()(const EntityStatisticsRequest&) const { return OperationKind::ENTITY_STATISTICS; }
    OperationKind operator()(const RelationSummaryRequest&) const { return OperationKind::RELATION_SUMMARY; }
    OperationKind operator()(const EntityAtTimeRequest&) const { return OperationKind::ENTITY_AT_TIME; }
    OperationKind operator()(const EntityChangesRequest&) const { return OperationKind::ENTITY_CHANGES; }
    OperationKind operator()(const RelationsAtTimeRequest&) const { return OperationKind::RELATIONS_AT_TIME; }
    OperationKind operator()(const ChangesInPeriodRequest&) const { return OperationKind::CHANGES_IN_PERIOD; }
    OperationKind operator()(const RelationChangesRequest&) const { return OperationKind::RELATION_CHANGES; }
    OperationKind operator()(const GraphAtTimeRequest&) const { return OperationKind::GRAPH_AT_TIME; }
    OperationKind operator()(const ChangeSummaryRequest&) const { return OperationKind::CHANGE_SUMMARY; }
    OperationKind operator()(const MaintenanceRequest&) const { return OperationKind::MAINTENANCE; }
};

class DispatchVisitor {
public:
    explicit DispatchVisitor(storage::StoreContext& store) : store_(store) {}

    core::Result<Response> operator()(const CreateEntitiesRequest& r) const {
        return Wrap(store_.graph().create_entities(r.entities, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const AddObservationsRequest& r) const {
        return Wrap(store_.graph().add_observations(r.additions, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const DeleteEntitiesRequest& r) const {
        return Wrap(store_.graph().delete_entities(r.names, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const DeleteObservationsRequest& r) const {
        return Wrap(store_.graph().delete_observations(r.deletions, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const CreateRelationsRequest& r) const {
        return Wrap(store_.graph().create_relations(r.relations, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const DeleteRelationsRequest& r) const {
        return Wrap(store_.graph().delete_relations(r.relations, r.batch_size, r.changed_by));
    }
    core::Result<Response> operator()(const UpdateEntityRequest& r) const {
        return Wrap(store_.graph().update_entity(r.name, r.update, r.changed_by));
    }
    core::Result<Response> operator()(const SearchNodesRequest& r) const {
        return Wrap(store_.graph().search_nodes(r.query));
    }
    core::Result<Response> operator()(const OpenNodesRequest& r) const {
        return Wrap(store_.graph().open_nodes(r.names));
    }
    core::Result<Response> operator()(const ReadGraphRequest&) const {
        return Wrap(store_.graph().read_graph());
    }
    core::Result<Response> operator()(const EntityStatisticsRequest&) const {
        return Wrap(store_.graph().get_entity_statistics());
    }
    core::Result<Response> operator()(const RelationSummaryRequest&) const {
        return Wrap(store_.graph().get_relation_summary());
    }
    core::Result<Response> operator()(const EntityAtTimeRequest& r) const {
        return Wrap(store_.temporal().get_entity_at_time(r.name, r.timestamp));
    }
    core::Result<Response> operator()(const EntityChangesRequest& r) const {
        return Wrap(store_.temporal().get_entity_changes(r.name, r.start, r.end));
    }
    core::Result<Response> operator()(const RelationsAtTimeRequest& r) const {
        return Wrap(store_.temporal().get_relations_at_time(r.name, r.timestamp, r.direction));
    }
    core::Result<Response> operator()(const ChangesInPeriodRequest& r) const {
        return Wrap(store_.temporal().get_changes_in_period(r.start, r.end, r.entity_type,
                                                            r.change_type));
    }
    core::Result<Response> operator()(const RelationChangesRequest& r) const {
        return Wrap(store_.temporal().get_relation_changes(r.relation));
    }
    core::Result<Response> operator()(const GraphAtTimeRequest& r) const {
        return Wrap(store_.temporal().get_graph_at_time(r.timestamp));
    }
    core::Result<Response> operator()(const ChangeSummaryRequest& r) const {
        return Wrap(store_.temporal().get_change_summary(r.name));
    }
    core::Result<Response> operator()(const MaintenanceRequest&) const {
        return Wrap(store_.partitions().run_maintenance());
    }

private:
    storage::StoreContext& store_;
};

}  // namespace

storage::OperationKind OperationKindOf(const Request& request) {
    return std::visit(KindVisitor{}, request);
}

core::Result<Response> Dispatcher::Dispatch(const Request& request) {
    auto response = std::visit(DispatchVisitor(store_), request);
    if (!response.ok()) {
        KGSTORE_DEBUG("{} failed: [{}] {}", storage::OperationKindName(OperationKindOf(request)),
                      core::CodeName(response.code()), response.error());
    }
    return response;
}

} // namespace api
} // namespace kgstore
