#pragma once

#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "backend_adapter.hpp"

namespace layout_sim::backend {

enum class CallType
{
    ResolveTemplate,
    Derive,
    SetProperty,
    Connect
};

const char* callTypeName(CallType type);

struct CallRecord
{
    CallType                 type;
    std::vector<std::string> args; // paths, names and rendered values in call order
};

/**
 * Deterministic backend that executes nothing and records every call for
 * replay in tests. Failures can be forced per template, derived name,
 * property path or connection.
 */
class MockBackend : public BackendAdapter
{
public:
    explicit MockBackend(diag::DiagnosticManager* diag = nullptr);

    const char* name() const override { return "mock"; }

    ObjectHandle resolveTemplate(const std::string& path) override;
    ObjectHandle derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name) override;
    void setProperty(const ObjectHandle& object, const std::string& propertyPath, const PropertyValue& value) override;
    void connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to) override;

    std::vector<CallRecord> getCalls() const;
    std::vector<CallRecord> getCalls(CallType type) const;
    void                    clearCalls();

    // Test helpers to simulate backend failures
    void failTemplate(const std::string& path);
    void failDerive(const std::string& objectName);
    void failProperty(const std::string& propertyPath);
    void failConnection(const std::string& fromPath, const std::string& toPath);

private:
    void record(CallType type, std::vector<std::string> args);
    void log(const std::string& message) const;

    diag::DiagnosticManager* m_diag{nullptr};

    mutable std::mutex                            m_mtx;
    std::vector<CallRecord>                       m_calls;
    std::set<std::string>                         m_failTemplates;
    std::set<std::string>                         m_failDerives;
    std::set<std::string>                         m_failProperties;
    std::set<std::pair<std::string, std::string>> m_failConnections;
};

} // namespace layout_sim::backend
