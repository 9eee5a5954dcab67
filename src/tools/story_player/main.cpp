/// @file main.cpp
/// @brief Story player entry point.
///
/// Console host for the narrative runtime. Builds a small sample story,
/// plays it through a scripted sequence of clicks and choices and prints
/// everything the runtime publishes.

#include <any>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nrt/command/command_bus.hpp"
#include "nrt/command/document_commands.hpp"
#include "nrt/engine/engine_config.hpp"
#include "nrt/engine/story_runtime.hpp"
#include "nrt/event/story_events.hpp"
#include "nrt/foundation/config_manager.hpp"
#include "nrt/foundation/runtime_logger.hpp"
#include "nrt/story/document_factory.hpp"
#include "nrt/version.hpp"

namespace {

using namespace nrt;

std::string parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return {};
}

struct SampleStory {
    story::StoryAsset asset;
    std::string deskHotspotId;
    std::string askChoiceId;
};

/// Prologue: a hall with a searchable desk, a butler who asks whether you
/// found the key, and a branch on the inventory.
SampleStory buildSampleStory(story::DocumentFactory& factory, command::CommandBus& history) {
    SampleStory sample;
    auto& doc = sample.asset;
    doc = factory.createStory("The Quiet Manor");

    auto segment = factory.createSegment("Prologue");
    const std::string segId = segment.id;
    doc.segments.push_back(std::move(segment));
    doc.activeSegmentId = segId;
    doc.items.push_back(story::Item{.id = "item_key", .name = "Brass Key"});

    auto start = factory.createNode(story::NodeType::Start);

    auto hall = factory.createNode(story::NodeType::Location, {400.0, 0.0});
    hall.name = "Hall";
    story::Hotspot desk{.id = factory.generateId("hs"), .name = "Desk"};
    sample.deskHotspotId = desk.id;
    hall.as<story::LocationBody>()->hotspots.push_back(desk);
    story::NodeEvent search{.id = factory.generateId("evt"),
                            .trigger = story::trigger::kOnClick,
                            .label = "Search the desk",
                            .targetId = desk.id};
    hall.events.push_back(search);

    auto searchDesk = factory.createNode(story::NodeType::Action, {400.0, 300.0});
    searchDesk.name = "Search desk";
    searchDesk.as<story::ActionBody>()->actions = {
        story::ActionSpec{.id = factory.generateId("act"),
                          .type = story::action_type::kAddItem,
                          .params = {{"itemId", story::Value(std::string("item_key"))}}},
        story::ActionSpec{.id = factory.generateId("act"),
                          .type = story::action_type::kShowToast,
                          .params = {{"message", story::Value(std::string("Found a brass key"))}}},
    };

    auto butler = factory.createNode(story::NodeType::Dialogue, {800.0, 0.0});
    auto* line = butler.as<story::DialogueBody>();
    line->text = "Did you find what you were looking for?";
    sample.askChoiceId = factory.generateId("choice");
    line->choices = {{sample.askChoiceId, "Show him the desk drawer"},
                     {factory.generateId("choice"), "Leave quietly"}};

    auto check = factory.createNode(story::NodeType::Branch, {1200.0, 0.0});
    story::ConditionNode hasKey{.type = story::condition_type::kHasItem,
                                .params = {{"itemId", story::Value(std::string("item_key"))}}};
    const std::string keyHandle = factory.generateId("cond");
    check.as<story::BranchBody>()->conditions.push_back(
        story::BranchCondition{.id = keyHandle, .test = hasKey});

    auto opened = factory.createNode(story::NodeType::Dialogue, {1600.0, -200.0});
    opened.as<story::DialogueBody>()->text = "The cellar door swings open.";
    auto locked = factory.createNode(story::NodeType::Dialogue, {1600.0, 200.0});
    locked.as<story::DialogueBody>()->text = "The cellar stays locked.";

    doc.segments.front().rootNodeId = start.id;

    // Authoring goes through the command bus like an editor would.
    std::vector<std::unique_ptr<command::Command>> steps;
    for (const auto* node : {&start, &hall, &searchDesk, &butler, &check, &opened, &locked}) {
        steps.push_back(std::make_unique<command::AddNodeCommand>(segId, *node));
    }
    auto connect = [&](const std::string& from, const std::string& to,
                       std::optional<std::string> handle = std::nullopt) {
        steps.push_back(std::make_unique<command::AddEdgeCommand>(
            segId, factory.createEdge(from, to, std::move(handle))));
    };
    connect(start.id, hall.id);
    connect(hall.id, searchDesk.id, search.id);
    connect(hall.id, butler.id);
    connect(butler.id, check.id, sample.askChoiceId);
    connect(check.id, opened.id, keyHandle);
    connect(check.id, locked.id);

    auto built = history.execute(
        std::make_unique<command::CompositeCommand>("Build prologue", std::move(steps)), doc);
    if (!built) {
        std::cerr << "Failed to build sample story: " << built.error().message() << "\n";
    }
    return sample;
}

void describe(const story::NarrativeNode* node) {
    if (!node) {
        std::cout << "  (no current node)\n";
        return;
    }
    std::cout << "  at " << story::nodeTypeName(node->type()) << " '" << node->name << "'\n";
}

} // namespace

int main(int argc, char* argv[]) {
    foundation::ConfigManager config;
    auto configPath = parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        auto loadResult = config.load(configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto engineCfg = engine::EngineConfig::fromConfig(config);
    engineCfg.applyLogLevels(foundation::RuntimeLogger::instance());

    std::cout << "narrative_runtime " << NRT_VERSION_STRING << "\n";

    story::DocumentFactory factory(20240601);
    command::CommandBus history(engineCfg.commandHistoryLimit);
    auto sample = buildSampleStory(factory, history);

    auto runtime = engine::StoryRuntime::Create(engineCfg);
    auto& bus = runtime->bus();
    bus.Subscribe<event::SegmentStarted>(event::topics::kSegmentStarted,
                                         [](const event::SegmentStarted& e) {
                                             std::cout << "[segment] " << e.name << "\n";
                                         });
    bus.Subscribe<event::NodeEnter>(event::topics::kNodeEnter, [](const event::NodeEnter& e) {
        std::cout << "[enter] " << story::nodeTypeName(e.type) << " " << e.node.name << "\n";
        if (const auto* line = e.node.as<story::DialogueBody>()) {
            std::cout << "        \"" << line->text << "\"\n";
        }
    });
    bus.Subscribe<event::Toast>(event::topics::kToast, [](const event::Toast& e) {
        std::cout << "[toast] " << e.message << "\n";
    });
    bus.Subscribe<event::InventoryChanged>(event::topics::kInventoryAdded,
                                           [](const event::InventoryChanged& e) {
                                               std::cout << "[inventory] +" << e.count << " "
                                                         << e.itemId << "\n";
                                           });
    bus.Subscribe(event::topics::kStoryEnd, [](const std::any&) {
        std::cout << "[end]\n";
    });

    auto& player = runtime->engine();
    player.loadStory(sample.asset);
    describe(player.startSegment(sample.asset.activeSegmentId));

    player.triggerEvent(story::trigger::kOnClick, sample.deskHotspotId);
    runtime->timers().advance(std::chrono::milliseconds(16));
    describe(player.getCurrentNode());

    describe(player.advance());
    describe(player.advance(sample.askChoiceId));
    describe(player.advance());

    return EXIT_SUCCESS;
}
