#include "kgstore/common/logger.h"
#include "kgstore/core/types.h"
#include "kgstore/storage/store_context.h"
#include <cstdlib>
#include <iostream>

using namespace kgstore;

int main(int argc, char** argv) {
    std::cout << "=== kgstore Quick Start Example ===" << std::endl;
    spdlog::level::level_enum level = spdlog::level::info;
    if (const char* configured = std::getenv("KGSTORE_LOG_LEVEL")) {
        auto parsed = common::Logger::ParseLevel(configured);
        if (parsed.ok()) {
            level = parsed.value();
        } else {
            std::cerr << parsed.error() << ", using info" << std::endl;
        }
    }
    common::Logger::Init(level);

    std::string connection = argc > 1 ? argv[1] : "sqlite://./kgstore_data/memory.db";

    // Configure store
    core::StoreConfig config = core::StoreConfig::Default();
    config.partition.enable_background = false;

    std::cout << "Opening store: " << connection << std::endl;
    auto opened = storage::StoreContext::Open(connection, config);
    if (!opened.ok()) {
        std::cerr << "Open failed: " << opened.error() << std::endl;
        return 1;
    }
    auto store = opened.take_value();
    auto& graph = store->graph();
    std::cout << "✅ Store opened" << std::endl;

    // Create entities (a rerun finds them already present)
    auto created = graph.create_entities({
        core::Entity("alice", "person", {"likes tea"}),
        core::Entity("bob", "person", {"plays chess"}, 0.8),
    });
    if (created.ok()) {
        std::cout << "✅ Created " << created.value().size() << " entities" << std::endl;
    } else if (created.code() == core::Error::Code::ENTITY_ALREADY_EXISTS) {
        std::cout << "Entities already present: " << created.error() << std::endl;
    } else {
        std::cerr << "Create failed: " << created.error() << std::endl;
        return 1;
    }

    auto related = graph.create_relations({core::Relation("alice", "bob", "knows")});
    if (!related.ok()) {
        std::cerr << "Relate failed: " << related.error() << std::endl;
        return 1;
    }

    auto added = graph.add_observations({{"alice", {"works remotely"}}});
    if (!added.ok()) {
        std::cerr << "Add observations failed: " << added.error() << std::endl;
        return 1;
    }

    // Search
    auto found = graph.search_nodes("tea");
    if (found.ok()) {
        std::cout << "✅ Search for 'tea' matched " << found.value().entities.size()
                  << " entities" << std::endl;
        for (const auto& entity : found.value().entities) {
            std::cout << "  " << entity.name << " (" << entity.entity_type << "), "
                      << entity.observations.size() << " observations" << std::endl;
        }
    } else {
        std::cerr << "Search failed: " << found.error() << std::endl;
    }

    // History
    auto history = store->temporal().get_entity_changes("alice");
    if (history.ok()) {
        std::cout << "✅ alice has " << history.value().size() << " versions" << std::endl;
        for (const auto& version : history.value()) {
            std::cout << "  v" << version.version_number << " "
                      << core::ChangeTypeName(version.change_type)
                      << " at " << version.valid_from << std::endl;
        }
    }

    auto maintenance = store->partitions().run_maintenance();
    if (!maintenance.ok()) {
        std::cerr << "Maintenance failed: " << maintenance.error() << std::endl;
    }

    std::cout << "Health: " << store->health().ToJson() << std::endl;
    std::cout << "✅ Quick start complete!" << std::endl;
    return 0;
}
