#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "backend_adapter.hpp"
#include "config_manager.hpp"
#include "data_types.hpp"
#include "mapping_engine.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace layout_sim
{

    enum class ErrorCategory
    {
        CREATION,
        PROPERTY,
        CONNECTION
    };

    const char* errorCategoryName(ErrorCategory category);

    // Raised when a category configured as error_and_stop records an error.
    class CreationHalted : public std::runtime_error
    {
      public:
        CreationHalted(ErrorCategory category, const std::string& message);

        ErrorCategory category() const { return m_category; }

      private:
        ErrorCategory m_category;
    };

    struct CreationStatistics
    {
        std::size_t objectsCreated{0};
        std::size_t connectionsCreated{0};
        std::size_t materialUnitsCreated{0};
        std::size_t errors{0};
        std::size_t warnings{0};
    };

    struct CreationIssues
    {
        std::vector<data::Issue> errors;
        std::vector<data::Issue> warnings;
    };

    struct CreatedObject
    {
        std::string           resourceId;
        backend::ObjectHandle handle;
    };

    using ConnectionPair = std::pair<std::string, std::string>;

    /**
     * Drives a backend from object mappings. Objects are derived under the
     * model frame and their mapped properties applied in declaration order;
     * connections follow document order. Every backend failure is counted
     * and then handled by the error policy of its category.
     */
    class CreationOrchestrator
    {
      public:
        CreationOrchestrator(backend::BackendAdapter& backend, config::RuleTable rules,
                             diag::DiagnosticManager* diag = nullptr);

        // Mapping-level errors for failed objects and properties are appended to the mappings.
        std::vector<CreatedObject>  createObjects(std::vector<mapping::ObjectMapping>& mappings);
        std::vector<ConnectionPair> createConnections(const data::Document& doc);

        // Created objects with no incident connection, reported as warnings.
        CreationIssues validateCreatedObjects() const;

        const CreationStatistics&          statistics() const { return m_stats; }
        const std::vector<data::Issue>&    errors() const { return m_errors; }
        const std::vector<data::Issue>&    warnings() const { return m_warnings; }
        const std::vector<CreatedObject>&  createdObjects() const { return m_created; }
        const std::vector<ConnectionPair>& createdConnections() const { return m_connections; }
        std::optional<backend::ObjectHandle> findCreated(const std::string& resourceId) const;

        // Material-unit name -> object handle, creation order.
        const std::vector<std::pair<std::string, backend::ObjectHandle>>& materialUnitObjects() const
        {
            return m_materialUnits;
        }

        std::string templatePath(const std::string& templateName) const;

      private:
        std::optional<backend::ObjectHandle> createSingleObject(mapping::ObjectMapping& mapping);
        void applyProperties(const backend::ObjectHandle& object, mapping::ObjectMapping& mapping);
        void applyProperty(const backend::ObjectHandle& object, const mapping::MappedProperty& prop);
        backend::ObjectHandle materialUnitObject(const mapping::MaterialUnitInfo& info);

        // First free name under the parent; reserved only once derive succeeds.
        std::string uniqueName(const std::string& parentPath, const std::string& name) const;

        void handleError(ErrorCategory category, const std::string& message, const std::string& entityKind,
                         const std::string& entityId, const std::string& referenceId,
                         mapping::ObjectMapping* mapping = nullptr);
        void addWarning(data::IssueCategory category, const std::string& message, const std::string& entityKind,
                        const std::string& entityId, const std::string& referenceId);

        backend::BackendAdapter& m_backend;
        config::RuleTable        m_rules;
        diag::DiagnosticManager* m_diag{nullptr};

        backend::ObjectHandle m_modelFrame;
        backend::ObjectHandle m_userObjects;

        CreationStatistics                                     m_stats;
        std::vector<data::Issue>                               m_errors;
        std::vector<data::Issue>                               m_warnings;
        std::vector<CreatedObject>                             m_created;
        std::unordered_map<std::string, std::size_t>           m_createdIndex;
        std::vector<ConnectionPair>                            m_connections;
        std::vector<std::pair<std::string, backend::ObjectHandle>> m_materialUnits;
        std::map<std::string, std::set<std::string>>           m_usedNames; // parent path -> names
    };

} // namespace layout_sim
