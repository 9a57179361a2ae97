#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config_manager.hpp"
#include "data_types.hpp"
#include "name_sanitizer.hpp"
#include "unit_converter.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace mapping
{

    enum class PropertyKind
    {
        VALUE,
        LIST,
        MATERIAL_UNIT,   // value is the material-unit name; the backend sets a reference to that object
        HANDLER_METADATA // bookkeeping for special handlers, never sent to a backend
    };

    struct MaterialUnitInfo
    {
        std::string productType;
        std::string name;
    };

    struct MappedProperty
    {
        std::string                     target;
        data::Value                     value;
        PropertyKind                    kind{PropertyKind::VALUE};
        config::DataType                dataType{config::DataType::STRING};
        std::optional<MaterialUnitInfo> materialUnit;
    };

    struct ObjectMapping
    {
        std::string resourceId;
        std::string resourceName;
        std::string resourceType;
        std::string templateName;
        std::string objectName; // sanitized, also present as the "name" property

        std::vector<MappedProperty> properties; // application order
        std::vector<data::Issue>    errors;
        std::vector<data::Issue>    warnings;

        // Replaces an existing entry with the same target in place.
        void                  setProperty(MappedProperty prop);
        const MappedProperty* findProperty(const std::string& target) const;

        void addError(data::IssueCategory category, const std::string& message, const std::string& referenceId = {});
        void addWarning(data::IssueCategory category, const std::string& message,
                        const std::string& referenceId = {});
    };

    const ObjectMapping* findMapping(const std::vector<ObjectMapping>& mappings, const std::string& resourceId);

    // Bijective base-26 label: 0 -> "A", 25 -> "Z", 26 -> "AA".
    std::string materialUnitLabel(std::size_t index);

    /**
     * Assigns one material-unit name per distinct product type, in first-seen
     * order. Repeated lookups of the same product type return the same name.
     */
    class MaterialUnitRegistry
    {
      public:
        explicit MaterialUnitRegistry(std::string namePrefix = "Part");

        const std::string& assign(const std::string& productType);
        void               clear();

        // (product type, material-unit name), first-seen order.
        const std::vector<std::pair<std::string, std::string>>& entries() const { return m_entries; }

      private:
        std::string                                      m_prefix;
        std::vector<std::pair<std::string, std::string>> m_entries;
        std::unordered_map<std::string, std::size_t>     m_index;
    };

    class MappingEngine
    {
      public:
        static constexpr const char* kPositionProperty     = "Coordinate3D";
        static constexpr const char* kRotationProperty     = "_3D.Rotation";
        static constexpr const char* kNameProperty         = "name";
        static constexpr const char* kMaterialUnitMetadata = "_material_unit_info";
        static constexpr const char* kMaterialUnitHandler  = "assign_material_unit";

        explicit MappingEngine(config::RuleTable rules, diag::DiagnosticManager* diag = nullptr);

        // One mapping per mappable resource, in layout-object order. Resets the material-unit registry.
        std::vector<ObjectMapping> mapDocument(const data::Document& doc);

        // nullopt when no rule matches the resource type.
        std::optional<ObjectMapping> mapResource(const data::Document& doc, const data::Resource& resource,
                                                 const data::LayoutObject& layoutObject);

        const std::vector<std::pair<std::string, std::string>>& materialUnits() const
        {
            return m_materialUnits.entries();
        }

      private:
        void mapBasicProperties(ObjectMapping& mapping, const data::Resource& resource,
                                const data::Placement* placement) const;
        void mapResourceProperties(ObjectMapping& mapping, const data::Resource& resource,
                                   const config::ResourceRule& rule);
        void mapSingleProperty(ObjectMapping& mapping, const data::Property& source, const config::PropertyRule& rule);
        void applyRequiredProperties(ObjectMapping& mapping, const data::Resource& resource,
                                     const config::ResourceRule& rule) const;
        void handleSpecialProperty(ObjectMapping& mapping, const data::Property& source,
                                   const config::PropertyRule& rule);

        data::Value convertValue(ObjectMapping& mapping, const data::Property& source,
                                 const config::PropertyRule& rule) const;

        void log(bool warning, const std::string& message) const;

        config::RuleTable        m_rules;
        NameSanitizer            m_sanitizer;
        UnitConverter            m_units;
        PropertyValidator        m_validator;
        MaterialUnitRegistry     m_materialUnits;
        diag::DiagnosticManager* m_diag{nullptr};
    };

} // namespace mapping
