#include <gtest/gtest.h>

#include "creation_orchestrator.hpp"
#include "mock_backend.hpp"

#include <string>
#include <vector>

using layout_sim::backend::CallType;
using layout_sim::backend::MockBackend;

namespace {

config::RuleTable makeRules(config::ErrorPolicy policy = config::ErrorPolicy::WARN_AND_CONTINUE)
{
    config::RuleTable rules;
    rules.target.templates = {{"Source", ".MaterialFlow.Source"}, {"SingleProc", ".MaterialFlow.SingleProc"}};
    rules.errorHandling.onCreation = policy;
    rules.errorHandling.onProperty = policy;
    rules.errorHandling.onConnection = policy;
    return rules;
}

mapping::ObjectMapping makeMapping(const std::string& id, const std::string& templateName = "SingleProc")
{
    mapping::ObjectMapping m;
    m.resourceId = id;
    m.resourceName = id;
    m.resourceType = "station";
    m.templateName = templateName;
    m.objectName = id;
    m.setProperty({mapping::MappingEngine::kNameProperty, id, mapping::PropertyKind::VALUE, config::DataType::STRING, {}});
    m.setProperty({mapping::MappingEngine::kPositionProperty, std::vector<double> {1.0, 2.0, 0.0},
                   mapping::PropertyKind::LIST, config::DataType::FLOAT, {}});
    return m;
}

mapping::MappedProperty materialUnitProperty(const std::string& productType, const std::string& name)
{
    mapping::MaterialUnitInfo info {productType, name};
    return {"MU", name, mapping::PropertyKind::MATERIAL_UNIT, config::DataType::STRING, info};
}

data::Document chainDocument()
{
    data::Document doc;
    doc.connections.push_back({"AB", "A", "B", ""});
    doc.connections.push_back({"BC", "B", "C", ""});
    return doc;
}

// Fails every derive from one template, whatever the object name.
class TemplateFailingBackend : public MockBackend
{
public:
    explicit TemplateFailingBackend(std::string templatePath) : m_templatePath(std::move(templatePath)) {}

    layout_sim::backend::ObjectHandle derive(const layout_sim::backend::ObjectHandle& templ,
                                             const layout_sim::backend::ObjectHandle& parent,
                                             const std::string& name) override
    {
        if (templ.path == m_templatePath)
            throw layout_sim::backend::BackendError("Derive from '" + templ.path + "' failed");
        return MockBackend::derive(templ, parent, name);
    }

private:
    std::string m_templatePath;
};

std::vector<std::string> derivedNames(const MockBackend& mock)
{
    std::vector<std::string> names;
    for (const auto& call : mock.getCalls(CallType::Derive))
        names.push_back(call.args[2]);
    return names;
}

} // namespace

TEST(CreationOrchestratorTest, CreatesObjectsAndConnectionsInOrder)
{
    MockBackend mock;
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    auto created = orchestrator.createObjects(mappings);
    ASSERT_EQ(created.size(), 3u);
    EXPECT_EQ(created[1].handle.path, ".Models.Model.B");

    auto connections = orchestrator.createConnections(chainDocument());
    ASSERT_EQ(connections.size(), 2u);
    EXPECT_EQ(connections[0], (layout_sim::ConnectionPair {"A", "B"}));
    EXPECT_EQ(connections[1], (layout_sim::ConnectionPair {"B", "C"}));

    auto connectCalls = mock.getCalls(CallType::Connect);
    ASSERT_EQ(connectCalls.size(), 2u);
    EXPECT_EQ(connectCalls[0].args,
              (std::vector<std::string> {".MaterialFlow.Connector", ".Models.Model.A", ".Models.Model.B"}));

    auto post = orchestrator.validateCreatedObjects();
    EXPECT_TRUE(post.errors.empty());
    EXPECT_TRUE(post.warnings.empty());

    const auto& stats = orchestrator.statistics();
    EXPECT_EQ(stats.objectsCreated, 3u);
    EXPECT_EQ(stats.connectionsCreated, 2u);
    EXPECT_EQ(stats.errors, 0u);
}

TEST(CreationOrchestratorTest, NamePropertyIsConsumedByDerive)
{
    MockBackend mock;
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A")};
    orchestrator.createObjects(mappings);

    auto sets = mock.getCalls(CallType::SetProperty);
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_EQ(sets[0].args[1], mapping::MappingEngine::kPositionProperty);
    EXPECT_EQ(sets[0].args[2], "[1, 2, 0]");

    auto derives = mock.getCalls(CallType::Derive);
    ASSERT_EQ(derives.size(), 1u);
    EXPECT_EQ(derives[0].args, (std::vector<std::string> {".MaterialFlow.SingleProc", ".Models.Model", "A"}));
}

TEST(CreationOrchestratorTest, ErrorAndStopHaltsBeforeLaterMappings)
{
    MockBackend mock;
    mock.failDerive("B");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules(config::ErrorPolicy::ERROR_AND_STOP));

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    try {
        orchestrator.createObjects(mappings);
        FAIL() << "expected CreationHalted";
    } catch (const layout_sim::CreationHalted& ex) {
        EXPECT_EQ(ex.category(), layout_sim::ErrorCategory::CREATION);
    }

    EXPECT_EQ(derivedNames(mock), (std::vector<std::string> {"A", "B"}));
    EXPECT_EQ(orchestrator.statistics().objectsCreated, 1u);
    EXPECT_EQ(orchestrator.statistics().errors, 1u);
    EXPECT_EQ(mappings[1].errors.size(), 1u);
}

TEST(CreationOrchestratorTest, WarnAndContinueAttemptsEveryMapping)
{
    MockBackend mock;
    mock.failDerive("B");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    auto created = orchestrator.createObjects(mappings);

    EXPECT_EQ(derivedNames(mock), (std::vector<std::string> {"A", "B", "C"}));
    EXPECT_EQ(created.size(), 2u);
    EXPECT_EQ(orchestrator.statistics().errors, 1u);
    ASSERT_EQ(orchestrator.errors().size(), 1u);
    EXPECT_EQ(orchestrator.errors()[0].category, data::IssueCategory::CREATION);
    EXPECT_FALSE(orchestrator.findCreated("B").has_value());

    // Connections touching the missing object are skipped with a warning.
    auto connections = orchestrator.createConnections(chainDocument());
    EXPECT_TRUE(connections.empty());
    ASSERT_EQ(orchestrator.warnings().size(), 2u);
    EXPECT_EQ(orchestrator.warnings()[0].message, "Target object 'B' not found for connection");
    EXPECT_EQ(orchestrator.warnings()[1].message, "Source object 'B' not found for connection");

    auto post = orchestrator.validateCreatedObjects();
    ASSERT_EQ(post.warnings.size(), 2u);
    EXPECT_EQ(post.warnings[0].message, "Object 'A' has no connections");
}

TEST(CreationOrchestratorTest, IgnorePolicyStillCountsErrors)
{
    MockBackend mock;
    mock.failTemplate(".MaterialFlow.Source");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules(config::ErrorPolicy::IGNORE));

    std::vector<mapping::ObjectMapping> mappings {makeMapping("S", "Source"), makeMapping("M")};
    auto created = orchestrator.createObjects(mappings);
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].resourceId, "M");
    EXPECT_EQ(orchestrator.statistics().errors, 1u);
}

TEST(CreationOrchestratorTest, PropertyFailureKeepsObject)
{
    MockBackend mock;
    mock.failProperty(mapping::MappingEngine::kPositionProperty);
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A")};
    mappings[0].setProperty({"ProcTime", 30.0, mapping::PropertyKind::VALUE, config::DataType::FLOAT, {}});
    auto created = orchestrator.createObjects(mappings);

    ASSERT_EQ(created.size(), 1u);
    ASSERT_EQ(orchestrator.errors().size(), 1u);
    EXPECT_EQ(orchestrator.errors()[0].category, data::IssueCategory::PROPERTY);
    EXPECT_EQ(mock.getCalls(CallType::SetProperty).size(), 2u);
}

TEST(CreationOrchestratorTest, PropertyErrorAndStopHalts)
{
    MockBackend mock;
    mock.failProperty("ProcTime");
    auto rules = makeRules();
    rules.errorHandling.onProperty = config::ErrorPolicy::ERROR_AND_STOP;
    layout_sim::CreationOrchestrator orchestrator(mock, rules);

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B")};
    mappings[0].setProperty({"ProcTime", 30.0, mapping::PropertyKind::VALUE, config::DataType::FLOAT, {}});
    EXPECT_THROW(orchestrator.createObjects(mappings), layout_sim::CreationHalted);
    EXPECT_EQ(derivedNames(mock), (std::vector<std::string> {"A"}));
}

TEST(CreationOrchestratorTest, MaterialUnitsAreDerivedOnceAndReferenced)
{
    MockBackend mock;
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("S1", "Source"), makeMapping("S2", "Source")};
    for (auto& m : mappings) {
        m.setProperty(materialUnitProperty("gear", "PartA"));
        m.setProperty({mapping::MappingEngine::kMaterialUnitMetadata, std::string("gear"),
                       mapping::PropertyKind::HANDLER_METADATA, config::DataType::STRING,
                       mapping::MaterialUnitInfo {"gear", "PartA"}});
    }
    orchestrator.createObjects(mappings);

    EXPECT_EQ(derivedNames(mock), (std::vector<std::string> {"S1", "PartA", "S2"}));
    auto derives = mock.getCalls(CallType::Derive);
    EXPECT_EQ(derives[1].args[0], ".MUs.Entity");
    EXPECT_EQ(derives[1].args[1], ".UserObjects");

    auto sets = mock.getCalls(CallType::SetProperty);
    std::size_t muSets = 0;
    for (const auto& call : sets) {
        EXPECT_NE(call.args[1], mapping::MappingEngine::kMaterialUnitMetadata);
        if (call.args[1] == "MU") {
            ++muSets;
            EXPECT_EQ(call.args[2], ".UserObjects.PartA");
        }
    }
    EXPECT_EQ(muSets, 2u);
    EXPECT_EQ(orchestrator.statistics().materialUnitsCreated, 1u);
    ASSERT_EQ(orchestrator.materialUnitObjects().size(), 1u);
    EXPECT_EQ(orchestrator.materialUnitObjects()[0].second.path, ".UserObjects.PartA");
}

TEST(CreationOrchestratorTest, MaterialUnitFailureIsPropertyError)
{
    MockBackend mock;
    mock.failDerive("PartA");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("S1", "Source")};
    mappings[0].setProperty(materialUnitProperty("gear", "PartA"));
    auto created = orchestrator.createObjects(mappings);

    EXPECT_EQ(created.size(), 1u);
    ASSERT_EQ(orchestrator.errors().size(), 1u);
    EXPECT_EQ(orchestrator.errors()[0].category, data::IssueCategory::PROPERTY);
    EXPECT_EQ(orchestrator.statistics().materialUnitsCreated, 0u);
}

TEST(CreationOrchestratorTest, DuplicateNamesGetNumericSuffix)
{
    MockBackend mock;
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    mappings[1].objectName = "A";
    mappings[2].objectName = "A";
    auto created = orchestrator.createObjects(mappings);

    ASSERT_EQ(created.size(), 3u);
    EXPECT_EQ(created[1].handle.name, "A_2");
    EXPECT_EQ(created[2].handle.name, "A_3");
    ASSERT_EQ(orchestrator.warnings().size(), 2u);
    EXPECT_EQ(orchestrator.warnings()[0].category, data::IssueCategory::CREATION);
}

TEST(CreationOrchestratorTest, FailedDeriveLeavesNameFree)
{
    TemplateFailingBackend backend(".MaterialFlow.Source");
    layout_sim::CreationOrchestrator orchestrator(backend, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A", "Source"), makeMapping("B")};
    mappings[1].objectName = "A";
    auto created = orchestrator.createObjects(mappings);

    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].resourceId, "B");
    EXPECT_EQ(created[0].handle.name, "A");
    EXPECT_EQ(orchestrator.errors().size(), 1u);
    for (const auto& warning : orchestrator.warnings())
        EXPECT_NE(warning.category, data::IssueCategory::CREATION);
}

TEST(CreationOrchestratorTest, MissingTemplateNameIsCreationError)
{
    MockBackend mock;
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A", "")};
    EXPECT_TRUE(orchestrator.createObjects(mappings).empty());
    EXPECT_EQ(orchestrator.statistics().errors, 1u);
    EXPECT_TRUE(mock.getCalls().empty());
    EXPECT_EQ(orchestrator.templatePath("Custom"), ".UserObjects.Custom");
}

TEST(CreationOrchestratorTest, ConnectorFailureSkipsAllConnections)
{
    MockBackend mock;
    mock.failTemplate(".MaterialFlow.Connector");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    orchestrator.createObjects(mappings);
    EXPECT_TRUE(orchestrator.createConnections(chainDocument()).empty());
    ASSERT_EQ(orchestrator.errors().size(), 1u);
    EXPECT_EQ(orchestrator.errors()[0].category, data::IssueCategory::CONNECTION);
    EXPECT_TRUE(mock.getCalls(CallType::Connect).empty());
}

TEST(CreationOrchestratorTest, FailedConnectionIsCountedAndSkipped)
{
    MockBackend mock;
    mock.failConnection(".Models.Model.A", ".Models.Model.B");
    layout_sim::CreationOrchestrator orchestrator(mock, makeRules());

    std::vector<mapping::ObjectMapping> mappings {makeMapping("A"), makeMapping("B"), makeMapping("C")};
    orchestrator.createObjects(mappings);
    auto connections = orchestrator.createConnections(chainDocument());
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].first, "B");
    EXPECT_EQ(orchestrator.statistics().errors, 1u);

    auto post = orchestrator.validateCreatedObjects();
    ASSERT_EQ(post.warnings.size(), 1u);
    EXPECT_EQ(post.warnings[0].entityId, "A");
}
