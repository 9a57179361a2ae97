#include "mapping_engine.hpp"

#include "diagnostic_manager.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace mapping
{

    namespace
    {

        constexpr const char* kComponent = "MappingEngine";

        bool isIntegral(config::DataType type)
        {
            return type == config::DataType::INT || type == config::DataType::POSITIVE_INT;
        }

        bool isFloating(config::DataType type)
        {
            return type == config::DataType::FLOAT || type == config::DataType::POSITIVE_FLOAT;
        }

        data::Value coerce(const std::string& text, config::DataType type)
        {
            if (isIntegral(type))
            {
                auto v = data::parseDouble(text);
                if (!v || !std::isfinite(*v))
                    return 0LL;
                return static_cast<long long>(std::trunc(*v));
            }
            if (isFloating(type))
                return data::parseDouble(text).value_or(0.0);
            return text;
        }

        // Default values keep their configured form but follow the declared data type when numeric.
        data::Value coerceDefault(const data::Value& value, config::DataType type)
        {
            if (type == config::DataType::STRING)
                return value;
            if (std::holds_alternative<std::vector<double>>(value))
                return value;
            return coerce(data::valueToString(value), type);
        }

        config::DataType inferType(const data::Value& value)
        {
            if (std::holds_alternative<long long>(value))
                return config::DataType::INT;
            if (std::holds_alternative<double>(value))
                return config::DataType::FLOAT;
            return config::DataType::STRING;
        }

    } // namespace

    // ---- ObjectMapping ----

    void ObjectMapping::setProperty(MappedProperty prop)
    {
        auto it = std::find_if(properties.begin(), properties.end(),
                               [&](const MappedProperty& p) { return p.target == prop.target; });
        if (it != properties.end())
            *it = std::move(prop);
        else
            properties.push_back(std::move(prop));
    }

    const MappedProperty* ObjectMapping::findProperty(const std::string& target) const
    {
        for (const auto& p : properties)
        {
            if (p.target == target)
                return &p;
        }
        return nullptr;
    }

    void ObjectMapping::addError(data::IssueCategory category, const std::string& message,
                                 const std::string& referenceId)
    {
        errors.push_back({data::IssueSeverity::ERROR, category, "Resource", resourceId, referenceId, message});
    }

    void ObjectMapping::addWarning(data::IssueCategory category, const std::string& message,
                                   const std::string& referenceId)
    {
        warnings.push_back({data::IssueSeverity::WARNING, category, "Resource", resourceId, referenceId, message});
    }

    const ObjectMapping* findMapping(const std::vector<ObjectMapping>& mappings, const std::string& resourceId)
    {
        for (const auto& m : mappings)
        {
            if (m.resourceId == resourceId)
                return &m;
        }
        return nullptr;
    }

    // ---- Material units ----

    std::string materialUnitLabel(std::size_t index)
    {
        std::string label;
        std::size_t n = index + 1;
        while (n > 0)
        {
            --n;
            label.insert(label.begin(), static_cast<char>('A' + n % 26));
            n /= 26;
        }
        return label;
    }

    MaterialUnitRegistry::MaterialUnitRegistry(std::string namePrefix) : m_prefix(std::move(namePrefix)) {}

    const std::string& MaterialUnitRegistry::assign(const std::string& productType)
    {
        auto it = m_index.find(productType);
        if (it != m_index.end())
            return m_entries[it->second].second;

        m_index.emplace(productType, m_entries.size());
        m_entries.emplace_back(productType, m_prefix + materialUnitLabel(m_entries.size()));
        return m_entries.back().second;
    }

    void MaterialUnitRegistry::clear()
    {
        m_entries.clear();
        m_index.clear();
    }

    // ---- MappingEngine ----

    MappingEngine::MappingEngine(config::RuleTable rules, diag::DiagnosticManager* diag)
        : m_rules(std::move(rules)), m_sanitizer(m_rules.naming), m_units(m_rules.unitConversions),
          m_validator(m_rules.ranges), m_materialUnits(m_rules.materialUnits.namePrefix), m_diag(diag)
    {
    }

    std::vector<ObjectMapping> MappingEngine::mapDocument(const data::Document& doc)
    {
        m_materialUnits.clear();

        std::vector<ObjectMapping>      mappings;
        std::unordered_set<std::string> mapped;
        for (const auto& layoutObject : doc.layoutObjects)
        {
            const auto* resource = doc.findResource(layoutObject.associatedResourceId);
            if (!resource)
                continue;

            if (mapped.count(resource->identifier))
            {
                log(true, "Resource '" + resource->identifier + "' already mapped; ignoring layout object '" +
                              layoutObject.identifier + "'");
                continue;
            }

            auto mapping = mapResource(doc, *resource, layoutObject);
            if (!mapping)
                continue;
            mapped.insert(resource->identifier);
            mappings.push_back(std::move(*mapping));
        }

        if (m_diag)
        {
            std::size_t errors = 0;
            std::size_t warnings = 0;
            for (const auto& m : mappings)
            {
                errors += m.errors.size();
                warnings += m.warnings.size();
            }
            nlohmann::json extra{{"mappings", mappings.size()},
                                 {"errors", errors},
                                 {"warnings", warnings},
                                 {"materialUnits", m_materialUnits.entries().size()}};
            m_diag->log(diag::Severity::INFO, kComponent, "Mapped document '" + doc.identifier + "'", extra.dump());
        }
        return mappings;
    }

    std::optional<ObjectMapping> MappingEngine::mapResource(const data::Document& doc, const data::Resource& resource,
                                                            const data::LayoutObject& layoutObject)
    {
        const auto* rule = m_rules.findRule(resource.resourceType);
        if (!rule)
        {
            log(true, "No mapping configuration for resource type '" + data::toLower(resource.resourceType) +
                          "' (resource '" + resource.identifier + "')");
            return std::nullopt;
        }

        ObjectMapping mapping;
        mapping.resourceId   = resource.identifier;
        mapping.resourceName = resource.name;
        mapping.resourceType = resource.resourceType;
        mapping.templateName = rule->templateName;

        mapBasicProperties(mapping, resource, doc.findPlacement(layoutObject.identifier));
        mapResourceProperties(mapping, resource, *rule);

        for (const auto& err : mapping.errors)
            log(true, "Resource '" + mapping.resourceId + "': " + err.message);
        return mapping;
    }

    void MappingEngine::mapBasicProperties(ObjectMapping& mapping, const data::Resource& resource,
                                           const data::Placement* placement) const
    {
        if (!placement)
        {
            mapping.addWarning(data::IssueCategory::PLACEMENT, "No placement information found");
        }
        else
        {
            const auto& pos = placement->position;
            mapping.setProperty(
                {kPositionProperty, std::vector<double>{pos.x, pos.y, pos.z}, PropertyKind::LIST, config::DataType::FLOAT, {}});

            if (placement->rotation)
            {
                const auto& rot = *placement->rotation;
                mapping.setProperty({kRotationProperty, std::vector<double>{rot.angle, rot.axisX, rot.axisY, rot.axisZ},
                                     PropertyKind::LIST, config::DataType::FLOAT, {}});
            }
        }

        mapping.objectName = m_sanitizer.sanitize(resource.name);
        mapping.setProperty({kNameProperty, mapping.objectName, PropertyKind::VALUE, config::DataType::STRING, {}});
    }

    void MappingEngine::mapResourceProperties(ObjectMapping& mapping, const data::Resource& resource,
                                              const config::ResourceRule& rule)
    {
        for (const auto& propRule : rule.properties)
        {
            const auto* source = resource.findProperty(propRule.sourceName);
            if (!source)
                continue;
            mapSingleProperty(mapping, *source, propRule);
        }
        applyRequiredProperties(mapping, resource, rule);
    }

    void MappingEngine::mapSingleProperty(ObjectMapping& mapping, const data::Property& source,
                                          const config::PropertyRule& rule)
    {
        if (rule.specialHandler)
        {
            handleSpecialProperty(mapping, source, rule);
            return;
        }

        auto value = convertValue(mapping, source, rule);
        if (auto error = m_validator.validate(rule.sourceName, value, rule.dataType))
        {
            mapping.addError(data::IssueCategory::RANGE, *error, rule.sourceName);
            return;
        }
        mapping.setProperty({rule.targetName, std::move(value), PropertyKind::VALUE, rule.dataType, {}});
    }

    data::Value MappingEngine::convertValue(ObjectMapping& mapping, const data::Property& source,
                                            const config::PropertyRule& rule) const
    {
        std::string text = source.value;

        if (rule.unitConversion && source.unit && !source.unit->empty())
        {
            if (auto numeric = source.numericValue())
            {
                if (auto converted = m_units.toBase(*numeric, *source.unit, *rule.unitConversion))
                {
                    if (isFloating(rule.dataType))
                        return *converted;
                    if (isIntegral(rule.dataType))
                        return std::isfinite(*converted) ? static_cast<long long>(std::trunc(*converted)) : 0LL;
                    text = data::valueToString(*converted);
                }
                else
                {
                    mapping.addWarning(data::IssueCategory::UNIT,
                                       "Unit '" + *source.unit + "' of property '" + source.name +
                                           "' is not known in conversion category '" + *rule.unitConversion +
                                           "'; value used unconverted",
                                       source.name);
                }
            }
        }

        return coerce(text, rule.dataType);
    }

    void MappingEngine::applyRequiredProperties(ObjectMapping& mapping, const data::Resource& resource,
                                                const config::ResourceRule& rule) const
    {
        for (const auto& required : rule.requiredProperties)
        {
            if (resource.hasProperty(required))
                continue;

            const auto* def = rule.findDefault(required);
            if (!def)
            {
                mapping.addError(data::IssueCategory::REQUIRED,
                                 "Required property '" + required + "' not found and no default available", required);
                continue;
            }

            const auto* propRule = rule.findProperty(required);
            const auto  target   = propRule ? propRule->targetName : required;
            const auto  type     = propRule ? propRule->dataType : inferType(*def);
            mapping.setProperty({target, coerceDefault(*def, type), PropertyKind::VALUE, type, {}});
            mapping.addWarning(data::IssueCategory::REQUIRED,
                               "Using default value for required property '" + required +
                                   "': " + data::valueToString(*def),
                               required);
        }
    }

    void MappingEngine::handleSpecialProperty(ObjectMapping& mapping, const data::Property& source,
                                              const config::PropertyRule& rule)
    {
        if (*rule.specialHandler != kMaterialUnitHandler)
        {
            mapping.addWarning(data::IssueCategory::HANDLER, "Unknown special handler: " + *rule.specialHandler,
                               source.name);
            return;
        }

        const auto& productType = source.value;
        const auto  muName      = m_materialUnits.assign(productType);
        MaterialUnitInfo info{productType, muName};

        mapping.setProperty({rule.targetName, muName, PropertyKind::MATERIAL_UNIT, config::DataType::STRING, info});
        mapping.setProperty(
            {kMaterialUnitMetadata, productType, PropertyKind::HANDLER_METADATA, config::DataType::STRING, info});
    }

    void MappingEngine::log(bool warning, const std::string& message) const
    {
        if (m_diag)
            m_diag->log(warning ? diag::Severity::WARN : diag::Severity::INFO, kComponent, message);
    }

} // namespace mapping
