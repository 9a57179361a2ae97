#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "backend_adapter.hpp"

namespace layout_sim::backend {

struct NativeObject
{
    std::string                          path;
    std::string                          name;
    std::string                          templatePath; // empty for templates and frames
    bool                                 isTemplate{false};
    std::map<std::string, PropertyValue> properties;   // nested paths kept as dotted keys
    std::vector<std::string>             children;
};

struct NativeConnection
{
    std::string connectorPath;
    std::string fromPath;
    std::string toPath;
};

/**
 * Backend that builds the object model in this process. Templates must be
 * registered before use; frames named as derive parents are created on
 * first use. Derived objects start with a copy of their template's
 * properties.
 */
class InProcessBackend : public BackendAdapter
{
public:
    explicit InProcessBackend(diag::DiagnosticManager* diag = nullptr);

    const char* name() const override { return "in_process"; }

    void registerTemplate(const std::string& path, std::map<std::string, PropertyValue> properties = {});

    ObjectHandle resolveTemplate(const std::string& path) override;
    ObjectHandle derive(const ObjectHandle& templ, const ObjectHandle& parent, const std::string& name) override;
    void setProperty(const ObjectHandle& object, const std::string& propertyPath, const PropertyValue& value) override;
    void connect(const ObjectHandle& connector, const ObjectHandle& from, const ObjectHandle& to) override;

    std::optional<NativeObject>   findObject(const std::string& path) const;
    std::optional<PropertyValue>  getProperty(const std::string& path, const std::string& propertyPath) const;
    std::vector<NativeConnection> getConnections() const;
    std::vector<std::string>      getChildren(const std::string& path) const;

private:
    NativeObject& ensureFrame(const std::string& path);
    static std::string leafName(const std::string& path);

    diag::DiagnosticManager* m_diag{nullptr};

    mutable std::mutex                  m_mtx;
    std::map<std::string, NativeObject> m_objects;
    std::vector<NativeConnection>       m_connections;
};

} // namespace layout_sim::backend
