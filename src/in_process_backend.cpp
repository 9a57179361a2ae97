#include "in_process_backend.hpp"

#include "diagnostic_manager.hpp"

namespace layout_sim::backend {

namespace {

constexpr const char* kComponent = "InProcessBackend";

std::string normalizePropertyPath(const std::string& propertyPath)
{
    std::string out = propertyPath;
    while (!out.empty() && out.front() == '.')
        out.erase(out.begin());
    return out;
}

} // namespace

InProcessBackend::InProcessBackend(diag::DiagnosticManager* diag)
    : m_diag(diag)
{
}

std::string InProcessBackend::leafName(const std::string& path)
{
    auto dot = path.rfind('.');
    return dot == std::string::npos ? path : path.substr(dot + 1);
}

void InProcessBackend::registerTemplate(const std::string& path, std::map<std::string, PropertyValue> properties)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    NativeObject obj;
    obj.path = path;
    obj.name = leafName(path);
    obj.isTemplate = true;
    obj.properties = std::move(properties);
    m_objects[path] = std::move(obj);
}

NativeObject& InProcessBackend::ensureFrame(const std::string& path)
{
    auto it = m_objects.find(path);
    if (it != m_objects.end())
        return it->second;

    NativeObject frame;
    frame.path = path;
    frame.name = leafName(path);
    if (m_diag)
        m_diag->log(diag::Severity::DEBUG, kComponent, "Created frame " + path);
    return m_objects.emplace(path, std::move(frame)).first->second;
}

ObjectHandle InProcessBackend::resolveTemplate(const std::string& path)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_objects.find(path);
    if (it == m_objects.end())
        throw BackendError("Template '" + path + "' not found");
    return ObjectHandle{it->second.path, it->second.name};
}

ObjectHandle InProcessBackend::derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto tmpl = m_objects.find(templ.path);
    if (tmpl == m_objects.end())
        throw BackendError("Template '" + templ.path + "' not found");
    if (name.empty())
        throw BackendError("Cannot derive an object without a name");

    const auto path = childPath(parent.path, name);
    if (m_objects.count(path))
        throw BackendError("Object '" + path + "' already exists");

    NativeObject obj;
    obj.path = path;
    obj.name = name;
    obj.templatePath = templ.path;
    obj.properties = tmpl->second.properties;

    ensureFrame(parent.path).children.push_back(path);
    m_objects.emplace(path, std::move(obj));

    if (m_diag)
        m_diag->log(diag::Severity::DEBUG, kComponent, "Derived " + path + " from " + templ.path);
    return ObjectHandle{path, name};
}

void InProcessBackend::setProperty(const ObjectHandle& object, const std::string& propertyPath,
                                   const PropertyValue& value)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_objects.find(object.path);
    if (it == m_objects.end())
        throw BackendError("Object '" + object.path + "' not found");

    const auto key = normalizePropertyPath(propertyPath);
    if (key.empty())
        throw BackendError("Empty property path for '" + object.path + "'");

    if (const auto* ref = std::get_if<ObjectHandle>(&value)) {
        if (!m_objects.count(ref->path))
            throw BackendError("Referenced object '" + ref->path + "' not found");
    }
    it->second.properties[key] = value;
}

void InProcessBackend::connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    if (!m_objects.count(connector.path))
        throw BackendError("Connector '" + connector.path + "' not found");
    if (!m_objects.count(from.path))
        throw BackendError("Object '" + from.path + "' not found");
    if (!m_objects.count(to.path))
        throw BackendError("Object '" + to.path + "' not found");

    m_connections.push_back(NativeConnection{connector.path, from.path, to.path});
}

std::optional<NativeObject> InProcessBackend::findObject(const std::string& path) const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_objects.find(path);
    if (it == m_objects.end())
        return std::nullopt;
    return it->second;
}

std::optional<PropertyValue> InProcessBackend::getProperty(const std::string& path,
                                                           const std::string& propertyPath) const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_objects.find(path);
    if (it == m_objects.end())
        return std::nullopt;
    auto prop = it->second.properties.find(normalizePropertyPath(propertyPath));
    if (prop == it->second.properties.end())
        return std::nullopt;
    return prop->second;
}

std::vector<NativeConnection> InProcessBackend::getConnections() const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_connections;
}

std::vector<std::string> InProcessBackend::getChildren(const std::string& path) const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    auto it = m_objects.find(path);
    if (it == m_objects.end())
        return {};
    return it->second.children;
}

} // namespace layout_sim::backend
