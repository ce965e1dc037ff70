#pragma once

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "kgstore/core/config.h"
#include "kgstore/storage/store_context.h"
#include "test_util/temp_dir.h"

namespace kgstore {
namespace testutil {

// 2023-11-14T22:13:20Z
constexpr int64_t kTestEpoch = 1'700'000'000'000;

/**
 * @brief Opens a private store file with a manual clock and no background thread
 */
class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<ScopedTestDir>("kgstore_store");
        config_.partition.enable_background = false;
        config_.clock = clock_.as_clock();
        customize(config_);
        auto opened = storage::StoreContext::Open("sqlite://" + dir_->file("graph.db"), config_);
        ASSERT_TRUE(opened.ok()) << opened.error();
        store_ = opened.take_value();
    }

    void TearDown() override {
        store_.reset();
    }

    // Hook for fixtures that need a different configuration
    virtual void customize(core::StoreConfig&) {}

    storage::GraphStore& graph() { return store_->graph(); }
    storage::TemporalEngine& temporal() { return store_->temporal(); }

    void create(std::vector<core::Entity> entities) {
        auto created = graph().create_entities(std::move(entities));
        ASSERT_TRUE(created.ok()) << created.error();
    }

    void relate(const std::string& from, const std::string& to, const std::string& type) {
        auto created = graph().create_relations({core::Relation(from, to, type)});
        ASSERT_TRUE(created.ok()) << created.error();
    }

    static std::vector<std::string> NamesOf(const core::KnowledgeGraph& graph) {
        std::vector<std::string> names;
        for (const auto& entity : graph.entities) names.push_back(entity.name);
        return names;
    }

    ManualClock clock_{kTestEpoch};
    std::unique_ptr<ScopedTestDir> dir_;
    core::StoreConfig config_;
    std::unique_ptr<storage::StoreContext> store_;
};

} // namespace testutil
} // namespace kgstore
