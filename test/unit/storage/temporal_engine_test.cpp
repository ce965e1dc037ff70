#include <gtest/gtest.h>
#include "kgstore/storage/temporal_engine.h"
#include "test_util/store_fixture.h"
#include <string>
#include <vector>

namespace kgstore {
namespace storage {
namespace test {

using testutil::kTestEpoch;
using Strings = std::vector<std::string>;

class TemporalEngineTest : public testutil::StoreTest {
protected:
    static constexpr int64_t kT0 = kTestEpoch;
    static constexpr int64_t kT1 = kTestEpoch + 1000;
    static constexpr int64_t kT2 = kTestEpoch + 2000;
    static constexpr int64_t kT3 = kTestEpoch + 3000;

    // alice: created at T0, observed at T1, retyped at T2, deleted at T3
    void build_alice_history() {
        create({core::Entity("alice", "person", {"a"})});
        clock_.set(kT1);
        ASSERT_TRUE(graph().add_observations({{"alice", {"b"}}}).ok());
        clock_.set(kT2);
        core::EntityUpdate update;
        update.entity_type = "engineer";
        ASSERT_TRUE(graph().update_entity("alice", update).ok());
        clock_.set(kT3);
        ASSERT_TRUE(graph().delete_entities({"alice"}).ok());
    }
};

// ============================================================================
// Entity history
// ============================================================================

TEST_F(TemporalEngineTest, EntityAtTimeFollowsHistory) {
    build_alice_history();

    auto before = temporal().get_entity_at_time("alice", kT0 - 1);
    ASSERT_TRUE(before.ok()) << before.error();
    EXPECT_FALSE(before.value().has_value());

    auto created = temporal().get_entity_at_time("alice", kT0);
    ASSERT_TRUE(created.ok());
    ASSERT_TRUE(created.value().has_value());
    EXPECT_EQ(created.value()->version_number, 1);
    EXPECT_EQ(created.value()->state.observations, (Strings{"a"}));

    auto between = temporal().get_entity_at_time("alice", kT0 + 500);
    ASSERT_TRUE(between.ok());
    ASSERT_TRUE(between.value().has_value());
    EXPECT_EQ(between.value()->version_number, 1);

    auto observed = temporal().get_entity_at_time("alice", kT1);
    ASSERT_TRUE(observed.ok());
    ASSERT_TRUE(observed.value().has_value());
    EXPECT_EQ(observed.value()->state.observations, (Strings{"a", "b"}));
    EXPECT_EQ(observed.value()->state.entity_type, "person");

    auto retyped = temporal().get_entity_at_time("alice", kT2 + 1);
    ASSERT_TRUE(retyped.ok());
    ASSERT_TRUE(retyped.value().has_value());
    EXPECT_EQ(retyped.value()->state.entity_type, "engineer");
    EXPECT_EQ(retyped.value()->change_type, core::ChangeType::UPDATE);

    for (int64_t t : {kT3, kT3 + 1, kT3 + 100000}) {
        auto deleted = temporal().get_entity_at_time("alice", t);
        ASSERT_TRUE(deleted.ok());
        EXPECT_FALSE(deleted.value().has_value()) << "at " << t;
    }
}

TEST_F(TemporalEngineTest, VersionsAreGapFreeAndContiguous) {
    build_alice_history();

    auto versions = temporal().get_entity_changes("alice");
    ASSERT_TRUE(versions.ok()) << versions.error();
    ASSERT_EQ(versions.value().size(), 4u);

    const auto& v = versions.value();
    for (size_t i = 0; i < v.size(); ++i) {
        EXPECT_EQ(v[i].version_number, static_cast<int64_t>(i + 1));
    }
    EXPECT_EQ(v[0].change_type, core::ChangeType::CREATE);
    EXPECT_EQ(v[1].change_type, core::ChangeType::UPDATE);
    EXPECT_EQ(v[2].change_type, core::ChangeType::UPDATE);
    EXPECT_EQ(v[3].change_type, core::ChangeType::DELETE);

    for (size_t i = 0; i + 1 < v.size(); ++i) {
        ASSERT_TRUE(v[i].valid_until.has_value());
        EXPECT_EQ(*v[i].valid_until, v[i + 1].valid_from);
    }
    // Tombstones cover no instant
    EXPECT_EQ(v[3].valid_from, kT3);
    EXPECT_EQ(v[3].valid_until, std::optional<int64_t>(kT3));
}

TEST_F(TemporalEngineTest, EntityChangesRange) {
    build_alice_history();

    auto middle = temporal().get_entity_changes("alice", kT1, kT2);
    ASSERT_TRUE(middle.ok());
    ASSERT_EQ(middle.value().size(), 2u);
    EXPECT_EQ(middle.value()[0].version_number, 2);
    EXPECT_EQ(middle.value()[1].version_number, 3);

    auto open_start = temporal().get_entity_changes("alice", std::nullopt, kT0);
    ASSERT_TRUE(open_start.ok());
    EXPECT_EQ(open_start.value().size(), 1u);

    auto inverted = temporal().get_entity_changes("alice", kT2, kT1);
    ASSERT_FALSE(inverted.ok());
    EXPECT_EQ(inverted.code(), core::Error::Code::INVALID_ARGUMENT);

    auto unknown = temporal().get_entity_changes("nobody");
    ASSERT_TRUE(unknown.ok());
    EXPECT_TRUE(unknown.value().empty());
}

TEST_F(TemporalEngineTest, ChangedByIsRecorded) {
    auto created = graph().create_entities({core::Entity("alice", "person")}, 0,
                                           std::string("importer"));
    ASSERT_TRUE(created.ok());

    auto versions = temporal().get_entity_changes("alice");
    ASSERT_TRUE(versions.ok());
    ASSERT_EQ(versions.value().size(), 1u);
    EXPECT_EQ(versions.value()[0].changed_by, std::optional<std::string>("importer"));
}

TEST_F(TemporalEngineTest, VersionsNeverRunBackwardsWhenClockDoes) {
    create({core::Entity("alice", "person")});
    clock_.set(kT0 - 5000);
    ASSERT_TRUE(graph().add_observations({{"alice", {"late"}}}).ok());

    auto versions = temporal().get_entity_changes("alice");
    ASSERT_TRUE(versions.ok());
    ASSERT_EQ(versions.value().size(), 2u);
    EXPECT_EQ(versions.value()[1].valid_from, kT0);
    EXPECT_EQ(versions.value()[0].valid_until, std::optional<int64_t>(kT0));

    auto now = temporal().get_entity_at_time("alice", kT0);
    ASSERT_TRUE(now.ok());
    ASSERT_TRUE(now.value().has_value());
    EXPECT_EQ(now.value()->state.observations, (Strings{"late"}));
}

TEST_F(TemporalEngineTest, RecreatedEntityContinuesNumbering) {
    create({core::Entity("alice", "person")});
    clock_.set(kT1);
    ASSERT_TRUE(graph().delete_entities({"alice"}).ok());
    clock_.set(kT2);
    create({core::Entity("alice", "robot")});

    auto versions = temporal().get_entity_changes("alice");
    ASSERT_TRUE(versions.ok());
    ASSERT_EQ(versions.value().size(), 3u);
    EXPECT_EQ(versions.value()[2].version_number, 3);
    EXPECT_EQ(versions.value()[2].change_type, core::ChangeType::CREATE);

    auto gone = temporal().get_entity_at_time("alice", kT1 + 1);
    ASSERT_TRUE(gone.ok());
    EXPECT_FALSE(gone.value().has_value());

    auto back = temporal().get_entity_at_time("alice", kT2);
    ASSERT_TRUE(back.ok());
    ASSERT_TRUE(back.value().has_value());
    EXPECT_EQ(back.value()->state.entity_type, "robot");
}

TEST_F(TemporalEngineTest, ChangeSummaryListsChangedFields) {
    build_alice_history();

    auto summary = temporal().get_change_summary("alice");
    ASSERT_TRUE(summary.ok()) << summary.error();
    ASSERT_EQ(summary.value().size(), 4u);

    EXPECT_EQ(summary.value()[0].change_type, core::ChangeType::CREATE);
    EXPECT_EQ(summary.value()[0].changed_fields, (Strings{"entity_type", "observations"}));
    EXPECT_EQ(summary.value()[1].changed_fields, (Strings{"observations"}));
    EXPECT_EQ(summary.value()[2].changed_fields, (Strings{"entity_type"}));
    EXPECT_EQ(summary.value()[3].change_type, core::ChangeType::DELETE);
    EXPECT_TRUE(summary.value()[3].changed_fields.empty());
    EXPECT_EQ(summary.value()[3].valid_from, kT3);
}

// ============================================================================
// Relations over time
// ============================================================================

TEST_F(TemporalEngineTest, RelationsAtTimeByDirection) {
    create({core::Entity("alice", "person"), core::Entity("bob", "person"),
            core::Entity("carol", "person")});
    clock_.set(kT1);
    relate("alice", "bob", "knows");
    relate("carol", "alice", "likes");
    clock_.set(kT2);
    ASSERT_TRUE(graph().delete_relations({{"alice", "bob", "knows"}}).ok());

    auto none = temporal().get_relations_at_time("alice", kT0, core::Direction::BOTH);
    ASSERT_TRUE(none.ok()) << none.error();
    EXPECT_TRUE(none.value().empty());

    auto outgoing = temporal().get_relations_at_time("alice", kT1, core::Direction::OUTGOING);
    ASSERT_TRUE(outgoing.ok());
    ASSERT_EQ(outgoing.value().size(), 1u);
    EXPECT_EQ(outgoing.value()[0].key(), (core::RelationKey{"alice", "bob", "knows"}));

    auto incoming = temporal().get_relations_at_time("alice", kT1, core::Direction::INCOMING);
    ASSERT_TRUE(incoming.ok());
    ASSERT_EQ(incoming.value().size(), 1u);
    EXPECT_EQ(incoming.value()[0].from_entity, "carol");

    auto both = temporal().get_relations_at_time("alice", kT1, core::Direction::BOTH);
    ASSERT_TRUE(both.ok());
    ASSERT_EQ(both.value().size(), 2u);
    EXPECT_EQ(both.value()[0].from_entity, "alice");
    EXPECT_EQ(both.value()[1].from_entity, "carol");

    auto after_delete = temporal().get_relations_at_time("alice", kT2, core::Direction::BOTH);
    ASSERT_TRUE(after_delete.ok());
    ASSERT_EQ(after_delete.value().size(), 1u);
    EXPECT_EQ(after_delete.value()[0].relation_type, "likes");
}

TEST_F(TemporalEngineTest, RelationsAtTimeHonorValidity) {
    create({core::Entity("alice", "person"), core::Entity("bob", "person")});
    core::Relation lease("alice", "bob", "rents_from");
    lease.valid_from = kT0 + 100;
    lease.valid_until = kT0 + 500;
    ASSERT_TRUE(graph().create_relations({lease}).ok());

    auto early = temporal().get_relations_at_time("bob", kT0 + 50, core::Direction::INCOMING);
    ASSERT_TRUE(early.ok());
    EXPECT_TRUE(early.value().empty());

    auto during = temporal().get_relations_at_time("bob", kT0 + 100, core::Direction::INCOMING);
    ASSERT_TRUE(during.ok());
    ASSERT_EQ(during.value().size(), 1u);
    EXPECT_EQ(during.value()[0].valid_until, std::optional<int64_t>(kT0 + 500));

    auto expired = temporal().get_relations_at_time("bob", kT0 + 500, core::Direction::INCOMING);
    ASSERT_TRUE(expired.ok());
    EXPECT_TRUE(expired.value().empty());
}

TEST_F(TemporalEngineTest, RelationChangesTrackLifecycle) {
    create({core::Entity("alice", "person"), core::Entity("bob", "person")});
    clock_.set(kT1);
    relate("alice", "bob", "knows");
    clock_.set(kT2);
    ASSERT_TRUE(graph().delete_relations({{"alice", "bob", "knows"}}).ok());
    clock_.set(kT3);
    relate("alice", "bob", "knows");

    auto changes = temporal().get_relation_changes({"alice", "bob", "knows"});
    ASSERT_TRUE(changes.ok()) << changes.error();
    ASSERT_EQ(changes.value().size(), 3u);

    const auto& v = changes.value();
    EXPECT_EQ(v[0].change_type, core::ChangeType::CREATE);
    EXPECT_EQ(v[0].valid_from, kT1);
    EXPECT_EQ(v[0].valid_until, std::optional<int64_t>(kT2));
    EXPECT_EQ(v[1].change_type, core::ChangeType::DELETE);
    EXPECT_EQ(v[1].valid_until, std::optional<int64_t>(kT2));
    EXPECT_EQ(v[2].change_type, core::ChangeType::CREATE);
    EXPECT_EQ(v[2].version_number, 3);
    EXPECT_EQ(v[2].state.valid_from, kT3);
    EXPECT_FALSE(v[2].valid_until.has_value());

    auto other = temporal().get_relation_changes({"bob", "alice", "knows"});
    ASSERT_TRUE(other.ok());
    EXPECT_TRUE(other.value().empty());
}

TEST_F(TemporalEngineTest, EntityDeleteRecordsRelationDeletes) {
    create({core::Entity("alice", "person"), core::Entity("bob", "person")});
    relate("alice", "bob", "knows");
    clock_.set(kT1);
    ASSERT_TRUE(graph().delete_entities({"bob"}).ok());

    auto changes = temporal().get_relation_changes({"alice", "bob", "knows"});
    ASSERT_TRUE(changes.ok());
    ASSERT_EQ(changes.value().size(), 2u);
    EXPECT_EQ(changes.value()[1].change_type, core::ChangeType::DELETE);
    EXPECT_EQ(changes.value()[1].valid_from, kT1);
}

// ============================================================================
// Period and graph snapshots
// ============================================================================

TEST_F(TemporalEngineTest, ChangesInPeriodNewestFirstWithFilters) {
    create({core::Entity("alice", "person"), core::Entity("bob", "robot")});
    clock_.set(kT1);
    ASSERT_TRUE(graph().add_observations({{"bob", {"beeps"}}}).ok());
    clock_.set(kT2);
    ASSERT_TRUE(graph().delete_entities({"alice"}).ok());

    auto all = temporal().get_changes_in_period(kT0, kT2);
    ASSERT_TRUE(all.ok()) << all.error();
    ASSERT_EQ(all.value().size(), 4u);
    EXPECT_EQ(all.value()[0].state.name, "alice");
    EXPECT_EQ(all.value()[0].change_type, core::ChangeType::DELETE);
    EXPECT_EQ(all.value()[1].state.name, "bob");
    EXPECT_EQ(all.value()[1].change_type, core::ChangeType::UPDATE);
    EXPECT_EQ(all.value()[2].state.name, "alice");
    EXPECT_EQ(all.value()[3].state.name, "bob");

    // alice is gone, so her versions are filtered on their own type
    auto people = temporal().get_changes_in_period(kT0, kT2, std::string("person"));
    ASSERT_TRUE(people.ok());
    ASSERT_EQ(people.value().size(), 2u);
    for (const auto& version : people.value()) {
        EXPECT_EQ(version.state.name, "alice");
    }

    auto updates = temporal().get_changes_in_period(kT0, kT2, std::nullopt,
                                                    core::ChangeType::UPDATE);
    ASSERT_TRUE(updates.ok());
    ASSERT_EQ(updates.value().size(), 1u);
    EXPECT_EQ(updates.value()[0].state.name, "bob");

    auto window = temporal().get_changes_in_period(kT0 + 1, kT1);
    ASSERT_TRUE(window.ok());
    ASSERT_EQ(window.value().size(), 1u);
    EXPECT_EQ(window.value()[0].valid_from, kT1);

    auto inverted = temporal().get_changes_in_period(kT2, kT0);
    ASSERT_FALSE(inverted.ok());
    EXPECT_EQ(inverted.code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(TemporalEngineTest, ChangesInPeriodFiltersOnCurrentType) {
    create({core::Entity("alice", "person")});
    clock_.set(kT1);
    core::EntityUpdate update;
    update.entity_type = "engineer";
    ASSERT_TRUE(graph().update_entity("alice", update).ok());

    auto engineers = temporal().get_changes_in_period(kT0, kT1, std::string("engineer"));
    ASSERT_TRUE(engineers.ok());
    EXPECT_EQ(engineers.value().size(), 2u);

    auto people = temporal().get_changes_in_period(kT0, kT1, std::string("person"));
    ASSERT_TRUE(people.ok());
    EXPECT_TRUE(people.value().empty());
}

TEST_F(TemporalEngineTest, GraphAtTimeReconstructsPastStates) {
    create({core::Entity("alice", "person", {"a"}), core::Entity("bob", "person")});
    clock_.set(kT1);
    relate("alice", "bob", "knows");
    ASSERT_TRUE(graph().add_observations({{"alice", {"b"}}}).ok());
    clock_.set(kT2);
    ASSERT_TRUE(graph().delete_entities({"bob"}).ok());

    auto empty = temporal().get_graph_at_time(kT0 - 1);
    ASSERT_TRUE(empty.ok()) << empty.error();
    EXPECT_TRUE(empty.value().entities.empty());
    EXPECT_TRUE(empty.value().relations.empty());

    auto start = temporal().get_graph_at_time(kT0);
    ASSERT_TRUE(start.ok());
    EXPECT_EQ(NamesOf(start.value()), (Strings{"alice", "bob"}));
    EXPECT_TRUE(start.value().relations.empty());
    EXPECT_EQ(start.value().entities[0].observations, (Strings{"a"}));

    auto linked = temporal().get_graph_at_time(kT1);
    ASSERT_TRUE(linked.ok());
    EXPECT_EQ(NamesOf(linked.value()), (Strings{"alice", "bob"}));
    ASSERT_EQ(linked.value().relations.size(), 1u);
    EXPECT_EQ(linked.value().relations[0].relation_type, "knows");
    EXPECT_EQ(linked.value().entities[0].observations, (Strings{"a", "b"}));

    auto after = temporal().get_graph_at_time(kT2);
    ASSERT_TRUE(after.ok());
    EXPECT_EQ(NamesOf(after.value()), (Strings{"alice"}));
    EXPECT_TRUE(after.value().relations.empty());
}

TEST_F(TemporalEngineTest, CurrentGraphMatchesGraphAtNow) {
    create({core::Entity("alice", "person", {"x"}), core::Entity("bob", "robot")});
    relate("alice", "bob", "owns");
    clock_.set(kT1);
    ASSERT_TRUE(graph().delete_observations({{"alice", {"x"}}}).ok());

    auto current = graph().read_graph();
    auto snapshot = temporal().get_graph_at_time(kT1);
    ASSERT_TRUE(current.ok());
    ASSERT_TRUE(snapshot.ok());
    EXPECT_EQ(NamesOf(current.value()), NamesOf(snapshot.value()));
    EXPECT_EQ(current.value().relations, snapshot.value().relations);
    for (size_t i = 0; i < current.value().entities.size(); ++i) {
        EXPECT_EQ(current.value().entities[i].observations,
                  snapshot.value().entities[i].observations);
        EXPECT_EQ(current.value().entities[i].entity_type,
                  snapshot.value().entities[i].entity_type);
    }
}

}  // namespace test
}  // namespace storage
}  // namespace kgstore
