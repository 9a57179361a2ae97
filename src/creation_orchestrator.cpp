#include "creation_orchestrator.hpp"

#include "diagnostic_manager.hpp"

#include <unordered_set>

#include <nlohmann/json.hpp>

namespace layout_sim
{

    namespace
    {

        constexpr const char* kComponent = "Orchestrator";

        data::IssueCategory issueCategory(ErrorCategory category)
        {
            switch (category)
            {
            case ErrorCategory::CREATION: return data::IssueCategory::CREATION;
            case ErrorCategory::PROPERTY: return data::IssueCategory::PROPERTY;
            case ErrorCategory::CONNECTION: return data::IssueCategory::CONNECTION;
            }
            return data::IssueCategory::CREATION;
        }

        backend::ObjectHandle frameHandle(const std::string& path)
        {
            auto dot = path.rfind('.');
            return backend::ObjectHandle{path, dot == std::string::npos ? path : path.substr(dot + 1)};
        }

        bool isNameProperty(const std::string& target)
        {
            return data::toLower(target) == mapping::MappingEngine::kNameProperty;
        }

    } // namespace

    const char* errorCategoryName(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::CREATION: return "creation";
        case ErrorCategory::PROPERTY: return "property";
        case ErrorCategory::CONNECTION: return "connection";
        }
        return "unknown";
    }

    CreationHalted::CreationHalted(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), m_category(category)
    {
    }

    CreationOrchestrator::CreationOrchestrator(backend::BackendAdapter& backend, config::RuleTable rules,
                                               diag::DiagnosticManager* diag)
        : m_backend(backend), m_rules(std::move(rules)), m_diag(diag)
    {
        m_modelFrame  = frameHandle(m_rules.target.modelFrame);
        m_userObjects = frameHandle(m_rules.target.userObjects);
    }

    std::string CreationOrchestrator::templatePath(const std::string& templateName) const
    {
        auto it = m_rules.target.templates.find(templateName);
        if (it != m_rules.target.templates.end())
            return it->second;
        return backend::childPath(m_rules.target.userObjects, templateName);
    }

    std::optional<backend::ObjectHandle> CreationOrchestrator::findCreated(const std::string& resourceId) const
    {
        auto it = m_createdIndex.find(resourceId);
        if (it == m_createdIndex.end())
            return std::nullopt;
        return m_created[it->second].handle;
    }

    std::vector<CreatedObject> CreationOrchestrator::createObjects(std::vector<mapping::ObjectMapping>& mappings)
    {
        if (m_diag)
            m_diag->log(diag::Severity::INFO, kComponent,
                        "Creating " + std::to_string(mappings.size()) + " objects on " + m_backend.name() + " backend");

        std::vector<CreatedObject> created;
        for (auto& mapping : mappings)
        {
            auto handle = createSingleObject(mapping);
            if (!handle)
                continue;

            CreatedObject obj{mapping.resourceId, *handle};
            m_createdIndex[mapping.resourceId] = m_created.size();
            m_created.push_back(obj);
            created.push_back(obj);
            ++m_stats.objectsCreated;

            if (m_diag)
                m_diag->log(diag::Severity::INFO, kComponent,
                            "Created object: " + mapping.resourceName + " (" + mapping.resourceType + ") as " +
                                handle->path);
        }
        return created;
    }

    std::optional<backend::ObjectHandle> CreationOrchestrator::createSingleObject(mapping::ObjectMapping& mapping)
    {
        if (mapping.templateName.empty())
        {
            handleError(ErrorCategory::CREATION, "No template specified for resource '" + mapping.resourceId + "'",
                        "Resource", mapping.resourceId, {}, &mapping);
            return std::nullopt;
        }

        backend::ObjectHandle templ;
        const auto            path = templatePath(mapping.templateName);
        try
        {
            templ = m_backend.resolveTemplate(path);
        }
        catch (const backend::BackendError& ex)
        {
            handleError(ErrorCategory::CREATION,
                        "Template '" + mapping.templateName + "' not found for '" + mapping.resourceId + "': " + ex.what(),
                        "Resource", mapping.resourceId, path, &mapping);
            return std::nullopt;
        }

        const auto baseName = mapping.objectName.empty() ? std::string("unnamed") : mapping.objectName;
        const auto name     = uniqueName(m_modelFrame.path, baseName);

        backend::ObjectHandle object;
        try
        {
            object = m_backend.derive(templ, m_modelFrame, name);
        }
        catch (const backend::BackendError& ex)
        {
            handleError(ErrorCategory::CREATION,
                        "Failed to create object " + mapping.resourceName + " from template: " + ex.what(), "Resource",
                        mapping.resourceId, path, &mapping);
            return std::nullopt;
        }
        m_usedNames[m_modelFrame.path].insert(name);

        if (name != baseName)
            addWarning(data::IssueCategory::CREATION,
                       "Object name '" + baseName + "' already used; created as '" + name + "'", "Resource",
                       mapping.resourceId, name);

        applyProperties(object, mapping);
        return object;
    }

    void CreationOrchestrator::applyProperties(const backend::ObjectHandle& object, mapping::ObjectMapping& mapping)
    {
        for (const auto& prop : mapping.properties)
        {
            if (isNameProperty(prop.target))
                continue; // consumed by derive
            try
            {
                applyProperty(object, prop);
            }
            catch (const backend::BackendError& ex)
            {
                handleError(ErrorCategory::PROPERTY, "Failed to set property " + prop.target + ": " + ex.what(),
                            "Resource", mapping.resourceId, prop.target, &mapping);
            }
        }
    }

    void CreationOrchestrator::applyProperty(const backend::ObjectHandle& object, const mapping::MappedProperty& prop)
    {
        switch (prop.kind)
        {
        case mapping::PropertyKind::HANDLER_METADATA: return;
        case mapping::PropertyKind::MATERIAL_UNIT:
        {
            if (!prop.materialUnit)
                throw backend::BackendError("Material unit property without handler information");
            auto mu = materialUnitObject(*prop.materialUnit);
            m_backend.setProperty(object, prop.target, mu);
            return;
        }
        case mapping::PropertyKind::VALUE:
        case mapping::PropertyKind::LIST: m_backend.setProperty(object, prop.target, backend::toPropertyValue(prop.value));
        }
    }

    backend::ObjectHandle CreationOrchestrator::materialUnitObject(const mapping::MaterialUnitInfo& info)
    {
        for (const auto& [name, handle] : m_materialUnits)
        {
            if (name == info.name)
                return handle;
        }

        auto templ  = m_backend.resolveTemplate(m_rules.materialUnits.templatePath);
        auto object = m_backend.derive(templ, m_userObjects, info.name);
        m_materialUnits.emplace_back(info.name, object);
        ++m_stats.materialUnitsCreated;

        if (m_diag)
        {
            nlohmann::json extra{{"productType", info.productType}, {"path", object.path}};
            m_diag->log(diag::Severity::INFO, kComponent, "Created material unit: " + info.name, extra.dump());
        }
        return object;
    }

    std::vector<ConnectionPair> CreationOrchestrator::createConnections(const data::Document& doc)
    {
        if (m_diag)
            m_diag->log(diag::Severity::INFO, kComponent,
                        "Creating " + std::to_string(doc.connections.size()) + " connections");

        std::vector<ConnectionPair> created;
        if (doc.connections.empty())
            return created;

        backend::ObjectHandle connector;
        try
        {
            connector = m_backend.resolveTemplate(m_rules.target.connector);
        }
        catch (const backend::BackendError& ex)
        {
            handleError(ErrorCategory::CONNECTION, std::string("Connector unavailable: ") + ex.what(), "Connector",
                        m_rules.target.connector, {});
            return created;
        }

        for (const auto& conn : doc.connections)
        {
            auto from = findCreated(conn.fromResourceId);
            if (!from)
            {
                addWarning(data::IssueCategory::CONNECTION,
                           "Source object '" + conn.fromResourceId + "' not found for connection", "Connection",
                           conn.identifier, conn.fromResourceId);
                continue;
            }
            auto to = findCreated(conn.toResourceId);
            if (!to)
            {
                addWarning(data::IssueCategory::CONNECTION,
                           "Target object '" + conn.toResourceId + "' not found for connection", "Connection",
                           conn.identifier, conn.toResourceId);
                continue;
            }

            try
            {
                m_backend.connect(connector, *from, *to);
            }
            catch (const backend::BackendError& ex)
            {
                handleError(ErrorCategory::CONNECTION,
                            "Failed to create connection " + conn.fromResourceId + " -> " + conn.toResourceId + ": " +
                                ex.what(),
                            "Connection", conn.identifier, conn.toResourceId);
                continue;
            }

            created.emplace_back(conn.fromResourceId, conn.toResourceId);
            m_connections.emplace_back(conn.fromResourceId, conn.toResourceId);
            ++m_stats.connectionsCreated;
            if (m_diag)
                m_diag->log(diag::Severity::DEBUG, kComponent,
                            "Created connection: " + conn.fromResourceId + " -> " + conn.toResourceId);
        }
        return created;
    }

    CreationIssues CreationOrchestrator::validateCreatedObjects() const
    {
        std::unordered_set<std::string> connected;
        for (const auto& [from, to] : m_connections)
        {
            connected.insert(from);
            connected.insert(to);
        }

        CreationIssues issues;
        for (const auto& obj : m_created)
        {
            if (!connected.count(obj.resourceId))
            {
                issues.warnings.push_back({data::IssueSeverity::WARNING, data::IssueCategory::CONNECTION, "Object",
                                           obj.resourceId, {}, "Object '" + obj.resourceId + "' has no connections"});
            }
        }
        return issues;
    }

    std::string CreationOrchestrator::uniqueName(const std::string& parentPath, const std::string& name) const
    {
        auto it = m_usedNames.find(parentPath);
        if (it == m_usedNames.end())
            return name;
        auto candidate = name;
        for (int suffix = 2; it->second.count(candidate); ++suffix)
            candidate = name + "_" + std::to_string(suffix);
        return candidate;
    }

    void CreationOrchestrator::handleError(ErrorCategory category, const std::string& message,
                                           const std::string& entityKind, const std::string& entityId,
                                           const std::string& referenceId, mapping::ObjectMapping* mapping)
    {
        ++m_stats.errors;

        data::Issue issue{data::IssueSeverity::ERROR, issueCategory(category), entityKind, entityId, referenceId,
                          message};
        m_errors.push_back(issue);
        if (mapping)
            mapping->errors.push_back(issue);

        config::ErrorPolicy policy = config::ErrorPolicy::WARN_AND_CONTINUE;
        switch (category)
        {
        case ErrorCategory::CREATION: policy = m_rules.errorHandling.onCreation; break;
        case ErrorCategory::PROPERTY: policy = m_rules.errorHandling.onProperty; break;
        case ErrorCategory::CONNECTION: policy = m_rules.errorHandling.onConnection; break;
        }

        switch (policy)
        {
        case config::ErrorPolicy::ERROR_AND_STOP:
            if (m_diag)
                m_diag->log(diag::Severity::FATAL, kComponent, message);
            throw CreationHalted(category, message);
        case config::ErrorPolicy::WARN_AND_CONTINUE:
            if (m_diag)
                m_diag->log(diag::Severity::ERROR, kComponent, message);
            break;
        case config::ErrorPolicy::IGNORE: break;
        }
    }

    void CreationOrchestrator::addWarning(data::IssueCategory category, const std::string& message,
                                          const std::string& entityKind, const std::string& entityId,
                                          const std::string& referenceId)
    {
        ++m_stats.warnings;
        m_warnings.push_back({data::IssueSeverity::WARNING, category, entityKind, entityId, referenceId, message});
        if (m_diag)
            m_diag->log(diag::Severity::WARN, kComponent, message);
    }

} // namespace layout_sim
