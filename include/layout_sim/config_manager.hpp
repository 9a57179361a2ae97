#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "data_types.hpp"

namespace config
{

    class ConfigError : public std::runtime_error
    {
      public:
        ConfigError(const std::string& filePath, int line, const std::string& message);

        int                line() const { return m_line; }
        const std::string& file() const { return m_file; }

      private:
        std::string m_file;
        int         m_line{};
    };

    // ---- Schema configuration: where each semantic field lives in the source tree ----

    struct FieldPaths
    {
        std::string                                  xpath;
        std::unordered_map<std::string, std::string> fields;

        // Empty when the field is not configured.
        std::string field(const std::string& key) const;
        bool        configured() const { return !xpath.empty(); }
    };

    struct SchemaConfig
    {
        std::string rootElement; // optional expected root name
        FieldPaths  header;
        FieldPaths  resources;
        FieldPaths  resourceProperties;
        FieldPaths  resourceConnections;
        FieldPaths  layoutObjects;
        FieldPaths  layoutObjectBoundary; // xpath unused, fields width/depth/height/unit
        FieldPaths  layout;
        FieldPaths  layoutBoundary;
        FieldPaths  placements;
        FieldPaths  partTypes;
    };

    // ---- Mapping rule table ----

    enum class DataType
    {
        STRING,
        INT,
        FLOAT,
        POSITIVE_INT,
        POSITIVE_FLOAT
    };

    std::optional<DataType> dataTypeFromString(const std::string& name);
    const char*             dataTypeName(DataType type);

    struct PropertyRule
    {
        std::string                sourceName;
        std::string                targetName;
        DataType                   dataType{DataType::STRING};
        std::optional<std::string> unitConversion;
        std::optional<std::string> specialHandler;
    };

    struct ResourceRule
    {
        std::string                                      resourceType;
        std::string                                      templateName;
        std::vector<std::string>                         aliases;
        std::vector<PropertyRule>                        properties; // declaration order
        std::vector<std::string>                         requiredProperties;
        std::vector<std::pair<std::string, data::Value>> defaultProperties;

        const PropertyRule* findProperty(const std::string& sourceName) const;
        const data::Value*  findDefault(const std::string& sourceName) const;
    };

    struct UnitCategory
    {
        std::string                             baseUnit;
        std::unordered_map<std::string, double> factors; // unit -> multiplier to base
    };

    struct NamingRules
    {
        enum class CaseHandling
        {
            PRESERVE,
            UPPER,
            LOWER
        };

        CaseHandling caseHandling{CaseHandling::PRESERVE};
        std::string  invalidChars{" .-/\\:;,()[]{}"};
        char         replacementChar{'_'};
        std::size_t  maxLength{32};
        std::string  digitPrefix{"obj_"};
    };

    struct TargetSettings
    {
        std::string                                  modelFrame{".Models.Model"};
        std::string                                  connector{".MaterialFlow.Connector"};
        std::string                                  userObjects{".UserObjects"};
        std::unordered_map<std::string, std::string> templates; // template name -> path
    };

    enum class ErrorPolicy
    {
        ERROR_AND_STOP,
        WARN_AND_CONTINUE,
        IGNORE
    };

    std::optional<ErrorPolicy> errorPolicyFromString(const std::string& name);

    struct ErrorHandling
    {
        ErrorPolicy onCreation{ErrorPolicy::WARN_AND_CONTINUE};
        ErrorPolicy onProperty{ErrorPolicy::WARN_AND_CONTINUE};
        ErrorPolicy onConnection{ErrorPolicy::WARN_AND_CONTINUE};
    };

    struct MaterialUnitSettings
    {
        std::string templatePath{".MUs.Entity"};
        std::string namePrefix{"Part"};
    };

    struct RuleTable
    {
        std::vector<ResourceRule>                               resourceRules;
        std::unordered_map<std::string, UnitCategory>           unitConversions;
        std::unordered_map<std::string, std::pair<double, double>> ranges;
        NamingRules                                             naming;
        TargetSettings                                          target;
        ErrorHandling                                           errorHandling;
        MaterialUnitSettings                                    materialUnits;

        // Case-insensitive lookup by resource type, then one level of alias indirection.
        const ResourceRule* findRule(const std::string& resourceType) const;
    };

    // ---- Pipeline settings ----

    struct DebugConfig
    {
        std::string fileName;
        std::size_t fileSize{};
        bool        toStdout{true};
        char        level{'I'};
    };

    enum class BackendKind
    {
        REMOTE,
        IN_PROCESS,
        MOCK
    };

    struct RemoteConfig
    {
        std::string url{"http://127.0.0.1:8086"};
        std::string endpoint{"/simtalk"};
        double      timeoutSec{10.0};
    };

    struct PipelineSettings
    {
        BackendKind              backend{BackendKind::MOCK};
        RemoteConfig             remote;
        std::vector<std::string> inProcessTemplates;
        DebugConfig              debug;
    };

    // --------- ConfigManager class ----------

    class ConfigManager
    {
      public:
        SchemaConfig loadSchemaConfig(const std::string& path);
        SchemaConfig parseSchemaConfig(const std::string& jsonText, const std::string& source = {});

        RuleTable loadRuleTable(const std::string& path);
        RuleTable parseRuleTable(const std::string& jsonText, const std::string& source = {});
        void      validateRuleTable(const RuleTable& rules, const std::string& source = {});

        PipelineSettings loadPipelineSettings(const std::string& path);
        PipelineSettings parsePipelineSettings(const std::string& jsonText, const std::string& source = {});
    };

} // namespace config
