#include "mock_backend.hpp"

#include "diagnostic_manager.hpp"

namespace layout_sim::backend {

const char* callTypeName(CallType type)
{
    switch (type) {
    case CallType::ResolveTemplate: return "ResolveTemplate";
    case CallType::Derive: return "Derive";
    case CallType::SetProperty: return "SetProperty";
    case CallType::Connect: return "Connect";
    }
    return "Unknown";
}

MockBackend::MockBackend(diag::DiagnosticManager* diag)
    : m_diag(diag)
{
}

ObjectHandle MockBackend::resolveTemplate(const std::string& path)
{
    record(CallType::ResolveTemplate, {path});
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_failTemplates.count(path))
            throw BackendError("Template '" + path + "' not found");
    }

    auto dot = path.rfind('.');
    return ObjectHandle{path, dot == std::string::npos ? path : path.substr(dot + 1)};
}

ObjectHandle MockBackend::derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name)
{
    record(CallType::Derive, {templ.path, parent.path, name});
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_failDerives.count(name))
            throw BackendError("Derive of '" + name + "' from '" + templ.path + "' failed");
    }

    ObjectHandle obj{childPath(parent.path, name), name};
    log("Mock derive: " + obj.path);
    return obj;
}

void MockBackend::setProperty(const ObjectHandle& object, const std::string& propertyPath, const PropertyValue& value)
{
    record(CallType::SetProperty, {object.path, propertyPath, propertyValueToString(value)});
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_failProperties.count(propertyPath))
        throw BackendError("Setting '" + object.path + "." + propertyPath + "' failed");
}

void MockBackend::connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to)
{
    record(CallType::Connect, {connector.path, from.path, to.path});
    {
        std::lock_guard<std::mutex> lk(m_mtx);
        if (m_failConnections.count({from.path, to.path}))
            throw BackendError("Connecting '" + from.path + "' to '" + to.path + "' failed");
    }
    log("Mock connection: " + from.name + " -> " + to.name);
}

std::vector<CallRecord> MockBackend::getCalls() const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_calls;
}

std::vector<CallRecord> MockBackend::getCalls(CallType type) const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    std::vector<CallRecord> out;
    for (const auto& call : m_calls) {
        if (call.type == type)
            out.push_back(call);
    }
    return out;
}

void MockBackend::clearCalls()
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_calls.clear();
}

void MockBackend::failTemplate(const std::string& path)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_failTemplates.insert(path);
}

void MockBackend::failDerive(const std::string& objectName)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_failDerives.insert(objectName);
}

void MockBackend::failProperty(const std::string& propertyPath)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_failProperties.insert(propertyPath);
}

void MockBackend::failConnection(const std::string& fromPath, const std::string& toPath)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_failConnections.emplace(fromPath, toPath);
}

void MockBackend::record(CallType type, std::vector<std::string> args)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    m_calls.push_back(CallRecord{type, std::move(args)});
}

void MockBackend::log(const std::string& message) const
{
    if (m_diag)
        m_diag->log(diag::Severity::DEBUG, "MockBackend", message);
}

} // namespace layout_sim::backend
