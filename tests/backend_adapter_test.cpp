#include <gtest/gtest.h>

#include "backend_adapter.hpp"
#include "in_process_backend.hpp"
#include "mock_backend.hpp"
#include "remote_backend.hpp"

#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace layout_sim::backend;

namespace {

// Records commands and replays canned replies; a reply of "!fail" raises BackendError.
class ScriptedTransport : public CommandTransport
{
public:
    explicit ScriptedTransport(std::vector<std::string>& sink)
        : m_sink(sink)
    {
    }

    std::string execute(const std::string& command) override
    {
        m_sink.push_back(command);
        if (m_replies.empty())
            return {};
        auto reply = m_replies.front();
        m_replies.pop_front();
        if (reply == "!fail")
            throw BackendError("remote rejected " + command);
        if (reply == "!crash")
            throw std::runtime_error("socket closed");
        return reply;
    }

    void queue(const std::string& reply) { m_replies.push_back(reply); }

private:
    std::vector<std::string>& m_sink;
    std::deque<std::string>   m_replies;
};

} // namespace

TEST(BackendAdapterTest, ChildPathJoinsWithDots)
{
    EXPECT_EQ(childPath(".Models.Model", "Lathe"), ".Models.Model.Lathe");
    EXPECT_EQ(childPath(".UserObjects.", "PartA"), ".UserObjects.PartA");
    EXPECT_EQ(childPath("", "Root"), ".Root");
}

TEST(BackendAdapterTest, RendersPropertyValues)
{
    EXPECT_EQ(propertyValueToString(PropertyValue {std::string("abc")}), "abc");
    EXPECT_EQ(propertyValueToString(PropertyValue {42LL}), "42");
    EXPECT_EQ(propertyValueToString(PropertyValue {std::vector<double> {1.0, 2.5, 0.0}}), "[1, 2.5, 0]");
    EXPECT_EQ(propertyValueToString(PropertyValue {ObjectHandle {".UserObjects.PartA", "PartA"}}),
              ".UserObjects.PartA");

    auto converted = toPropertyValue(data::Value {0.2});
    ASSERT_TRUE(std::holds_alternative<double>(converted));
    EXPECT_DOUBLE_EQ(std::get<double>(converted), 0.2);
}

TEST(BackendAdapterTest, FactoryBuildsConfiguredBackend)
{
    config::PipelineSettings settings;
    settings.backend = config::BackendKind::MOCK;
    EXPECT_STREQ(createBackend(settings)->name(), "mock");

    settings.backend = config::BackendKind::IN_PROCESS;
    settings.inProcessTemplates = {".MaterialFlow.Source"};
    auto backend = createBackend(settings);
    EXPECT_STREQ(backend->name(), "in_process");
    EXPECT_EQ(backend->resolveTemplate(".MaterialFlow.Source").name, "Source");
    EXPECT_THROW(backend->resolveTemplate(".MaterialFlow.Drain"), BackendError);
}

TEST(MockBackendTest, RecordsCallsInOrder)
{
    MockBackend mock;
    auto templ = mock.resolveTemplate(".MaterialFlow.SingleProc");
    EXPECT_EQ(templ.name, "SingleProc");

    auto obj = mock.derive(templ, ObjectHandle {".Models.Model", "Model"}, "Lathe");
    EXPECT_EQ(obj.path, ".Models.Model.Lathe");
    mock.setProperty(obj, "ProcTime", 120.0);
    mock.connect(ObjectHandle {".MaterialFlow.Connector", "Connector"}, obj, obj);

    auto calls = mock.getCalls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[0].type, CallType::ResolveTemplate);
    EXPECT_EQ(calls[1].args, (std::vector<std::string> {".MaterialFlow.SingleProc", ".Models.Model", "Lathe"}));
    EXPECT_EQ(calls[2].args[2], "120");
    EXPECT_STREQ(callTypeName(calls[3].type), "Connect");
    EXPECT_EQ(mock.getCalls(CallType::SetProperty).size(), 1u);

    mock.clearCalls();
    EXPECT_TRUE(mock.getCalls().empty());
}

TEST(MockBackendTest, ForcedFailuresThrowAfterRecording)
{
    MockBackend mock;
    mock.failTemplate(".MaterialFlow.Line");
    mock.failDerive("Broken");
    mock.failProperty("Speed");
    mock.failConnection(".Models.Model.A", ".Models.Model.B");

    const ObjectHandle frame {".Models.Model", "Model"};
    const ObjectHandle a {".Models.Model.A", "A"};
    const ObjectHandle b {".Models.Model.B", "B"};

    EXPECT_THROW(mock.resolveTemplate(".MaterialFlow.Line"), BackendError);
    EXPECT_THROW(mock.derive(a, frame, "Broken"), BackendError);
    EXPECT_THROW(mock.setProperty(a, "Speed", 1.0), BackendError);
    EXPECT_NO_THROW(mock.setProperty(a, "Length", 1.0));
    EXPECT_THROW(mock.connect(frame, a, b), BackendError);
    EXPECT_NO_THROW(mock.connect(frame, b, a));
    EXPECT_EQ(mock.getCalls().size(), 6u);
}

TEST(InProcessBackendTest, DerivedObjectsCopyTemplateProperties)
{
    InProcessBackend backend;
    backend.registerTemplate(".MaterialFlow.Line", {{"Speed", PropertyValue {1.0}}});

    auto templ = backend.resolveTemplate(".MaterialFlow.Line");
    auto obj = backend.derive(templ, ObjectHandle {".Models.Model", "Model"}, "BeltA");
    EXPECT_EQ(obj.path, ".Models.Model.BeltA");

    backend.setProperty(obj, "Length", 4.5);
    auto speed = backend.getProperty(obj.path, "Speed");
    ASSERT_TRUE(speed.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>(*speed), 1.0);
    EXPECT_DOUBLE_EQ(std::get<double>(*backend.getProperty(obj.path, "Length")), 4.5);

    auto native = backend.findObject(obj.path);
    ASSERT_TRUE(native.has_value());
    EXPECT_EQ(native->templatePath, ".MaterialFlow.Line");
    EXPECT_FALSE(native->isTemplate);

    auto frame = backend.findObject(".Models.Model");
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(backend.getChildren(".Models.Model"), (std::vector<std::string> {obj.path}));

    // The template itself is untouched.
    EXPECT_FALSE(backend.getProperty(".MaterialFlow.Line", "Length").has_value());
}

TEST(InProcessBackendTest, RejectsUnknownAndDuplicateObjects)
{
    InProcessBackend backend;
    backend.registerTemplate(".MaterialFlow.Source");
    const ObjectHandle frame {".Models.Model", "Model"};

    EXPECT_THROW(backend.resolveTemplate(".MaterialFlow.Drain"), BackendError);
    EXPECT_THROW(backend.derive(ObjectHandle {".MaterialFlow.Drain", "Drain"}, frame, "D"), BackendError);

    auto src = backend.derive(backend.resolveTemplate(".MaterialFlow.Source"), frame, "S");
    EXPECT_THROW(backend.derive(backend.resolveTemplate(".MaterialFlow.Source"), frame, "S"), BackendError);

    EXPECT_THROW(backend.setProperty(ObjectHandle {".Models.Model.Nope", "Nope"}, "X", 1LL), BackendError);
    EXPECT_THROW(backend.setProperty(src, "MU", ObjectHandle {".UserObjects.PartA", "PartA"}), BackendError);
}

TEST(InProcessBackendTest, ConnectRequiresExistingObjects)
{
    InProcessBackend backend;
    backend.registerTemplate(".MaterialFlow.Source");
    backend.registerTemplate(".MaterialFlow.Connector");
    const ObjectHandle frame {".Models.Model", "Model"};

    auto templ = backend.resolveTemplate(".MaterialFlow.Source");
    auto a = backend.derive(templ, frame, "A");
    auto b = backend.derive(templ, frame, "B");
    auto connector = backend.resolveTemplate(".MaterialFlow.Connector");

    backend.connect(connector, a, b);
    EXPECT_THROW(backend.connect(connector, a, ObjectHandle {".Models.Model.C", "C"}), BackendError);
    EXPECT_THROW(backend.connect(ObjectHandle {".Nope", "Nope"}, a, b), BackendError);

    auto conns = backend.getConnections();
    ASSERT_EQ(conns.size(), 1u);
    EXPECT_EQ(conns[0].fromPath, a.path);
    EXPECT_EQ(conns[0].toPath, b.path);
}

TEST(RemoteBackendTest, FormatsCommandValues)
{
    EXPECT_EQ(quoteString("say \"hi\"\n"), "\"say \\\"hi\\\"\\n\"");
    EXPECT_EQ(formatCommandValue(PropertyValue {std::string("Belt A")}), "\"Belt A\"");
    EXPECT_EQ(formatCommandValue(PropertyValue {7LL}), "7");
    EXPECT_EQ(formatCommandValue(PropertyValue {0.2}), "0.2");
    EXPECT_EQ(formatCommandValue(PropertyValue {std::vector<double> {8.0, 5.0, 0.0}}), "[8, 5, 0]");
    EXPECT_EQ(formatCommandValue(PropertyValue {ObjectHandle {".UserObjects.PartA", "PartA"}}), ".UserObjects.PartA");
}

TEST(RemoteBackendTest, TranslatesCallsToCommands)
{
    std::vector<std::string> sent;
    RemoteBackend backend(std::make_unique<ScriptedTransport>(sent));

    auto templ = backend.resolveTemplate(".MaterialFlow.SingleProc");
    EXPECT_TRUE(sent.empty());
    EXPECT_EQ(templ.name, "SingleProc");

    auto obj = backend.derive(templ, ObjectHandle {".Models.Model", "Model"}, "Lathe");
    EXPECT_EQ(obj.path, ".Models.Model.Lathe");
    backend.setProperty(obj, "ProcTime", 120.0);
    backend.setProperty(obj, "name", std::string("Lathe"));
    backend.connect(ObjectHandle {".MaterialFlow.Connector", "Connector"}, obj,
                    ObjectHandle {".Models.Model.Belt", "Belt"});

    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent[0], ".MaterialFlow.SingleProc.derive(.Models.Model, \"Lathe\")");
    EXPECT_EQ(sent[1], ".Models.Model.Lathe.ProcTime := 120");
    EXPECT_EQ(sent[2], ".Models.Model.Lathe.name := \"Lathe\"");
    EXPECT_EQ(sent[3], ".MaterialFlow.Connector.connect(.Models.Model.Lathe, .Models.Model.Belt)");
    EXPECT_EQ(backend.commandsSent(), 4u);
}

TEST(RemoteBackendTest, TransportFailuresBecomeBackendErrors)
{
    std::vector<std::string> sent;
    auto transport = std::make_unique<ScriptedTransport>(sent);
    auto* script = transport.get();
    RemoteBackend backend(std::move(transport));

    script->queue("!fail");
    script->queue("!crash");
    const ObjectHandle obj {".Models.Model.A", "A"};

    EXPECT_THROW(backend.setProperty(obj, "X", 1LL), BackendError);
    EXPECT_THROW(backend.setProperty(obj, "Y", 2LL), BackendError);
    EXPECT_EQ(backend.commandsSent(), 0u);
    EXPECT_EQ(sent.size(), 2u);

    EXPECT_THROW(RemoteBackend(nullptr), BackendError);
    EXPECT_THROW(backend.resolveTemplate(""), BackendError);
}
