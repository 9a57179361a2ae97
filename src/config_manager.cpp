#include "config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace config
{

    ConfigError::ConfigError(const std::string& filePath, int line, const std::string& message)
        : std::runtime_error([&]() {
            std::ostringstream oss;
            if (!filePath.empty())
                oss << filePath << ':';
            if (line > 0)
                oss << line << ' ';
            oss << message;
            return oss.str();
        }()),
          m_file(filePath), m_line(line)
    {
    }

    namespace
    {

        using Json = nlohmann::ordered_json;

        [[noreturn]] void throwError(const std::string& path, const std::string& message)
        {
            throw ConfigError(path, 0, message);
        }

        int lineOfOffset(const std::string& text, std::size_t byte)
        {
            byte = std::min(byte, text.size());
            return 1 + static_cast<int>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(byte), '\n'));
        }

        std::string readFile(const std::string& path)
        {
            std::ifstream ifs(path);
            if (!ifs)
                throwError(path, "Failed to open configuration file");
            std::ostringstream oss;
            oss << ifs.rdbuf();
            return oss.str();
        }

        Json parseJson(const std::string& text, const std::string& source)
        {
            try
            {
                Json j = Json::parse(text);
                if (!j.is_object())
                    throwError(source, "Configuration root must be a JSON object");
                return j;
            }
            catch (const nlohmann::json::parse_error& ex)
            {
                throw ConfigError(source, lineOfOffset(text, ex.byte), std::string("Malformed JSON: ") + ex.what());
            }
        }

        std::string parseString(const std::string& path, const Json& obj, const char* key, bool required,
                                const std::string& defaultValue = {})
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
            {
                if (required)
                    throwError(path, std::string("Missing required key '") + key + "'");
                return defaultValue;
            }
            if (!it->is_string())
                throwError(path, std::string("Key '") + key + "' must be a string");
            return it->get<std::string>();
        }

        bool parseBool(const std::string& path, const Json& obj, const char* key, bool defaultValue)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return defaultValue;
            if (!it->is_boolean())
                throwError(path, std::string("Key '") + key + "' must be a boolean");
            return it->get<bool>();
        }

        double parseNumber(const std::string& path, const Json& obj, const char* key, double defaultValue)
        {
            auto it = obj.find(key);
            if (it == obj.end())
                return defaultValue;
            if (!it->is_number())
                throwError(path, std::string("Key '") + key + "' must be a number");
            return it->get<double>();
        }

        const Json* section(const std::string& path, const Json& obj, const char* key)
        {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return nullptr;
            if (!it->is_object())
                throwError(path, std::string("Section '") + key + "' must be an object");
            return &*it;
        }

        std::vector<std::string> parseStringList(const std::string& path, const Json& obj, const char* key)
        {
            std::vector<std::string> out;
            auto                     it = obj.find(key);
            if (it == obj.end() || it->is_null())
                return out;
            if (it->is_string())
            {
                out.push_back(it->get<std::string>());
                return out;
            }
            if (!it->is_array())
                throwError(path, std::string("Key '") + key + "' must be a string or an array of strings");
            for (const auto& item : *it)
            {
                if (!item.is_string())
                    throwError(path, std::string("Entries of '") + key + "' must be strings");
                out.push_back(item.get<std::string>());
            }
            return out;
        }

        FieldPaths parseFieldPaths(const std::string& path, const Json* obj, const std::string& defaultXpath)
        {
            FieldPaths fp;
            if (!obj)
                return fp;
            fp.xpath = parseString(path, *obj, "xpath", false, defaultXpath);
            if (const auto* fields = section(path, *obj, "fields"))
            {
                for (auto it = fields->begin(); it != fields->end(); ++it)
                {
                    if (!it.value().is_string())
                        throwError(path, "Field path for '" + it.key() + "' must be a string");
                    fp.fields[it.key()] = it.value().get<std::string>();
                }
            }
            return fp;
        }

        // Boundary blocks are flat {width, depth, height, unit} path maps.
        FieldPaths parseBoundaryPaths(const std::string& path, const Json* obj)
        {
            FieldPaths fp;
            if (!obj)
                return fp;
            for (auto it = obj->begin(); it != obj->end(); ++it)
            {
                if (!it.value().is_string())
                    throwError(path, "Boundary path for '" + it.key() + "' must be a string");
                fp.fields[it.key()] = it.value().get<std::string>();
            }
            return fp;
        }

        data::Value parseValue(const std::string& path, const std::string& key, const Json& j)
        {
            if (j.is_string())
                return j.get<std::string>();
            if (j.is_number_integer())
                return j.get<long long>();
            if (j.is_number())
                return j.get<double>();
            if (j.is_boolean())
                return static_cast<long long>(j.get<bool>() ? 1 : 0);
            if (j.is_array())
            {
                std::vector<double> list;
                for (const auto& item : j)
                {
                    if (!item.is_number())
                        throwError(path, "Default for '" + key + "' must be a list of numbers");
                    list.push_back(item.get<double>());
                }
                return list;
            }
            throwError(path, "Unsupported default value type for '" + key + "'");
        }

        PropertyRule parsePropertyRule(const std::string& path, const std::string& sourceName, const Json& obj)
        {
            if (!obj.is_object())
                throwError(path, "Property rule '" + sourceName + "' must be an object");

            PropertyRule rule;
            rule.sourceName = sourceName;
            rule.targetName = parseString(path, obj, "target_property", false, sourceName);

            const auto typeStr = parseString(path, obj, "data_type", false, "string");
            auto       type    = dataTypeFromString(typeStr);
            if (!type)
                throwError(path, "Unknown data_type '" + typeStr + "' for property '" + sourceName + "'");
            rule.dataType = *type;

            if (obj.contains("unit_conversion"))
                rule.unitConversion = parseString(path, obj, "unit_conversion", true);
            if (obj.contains("special_handler"))
                rule.specialHandler = parseString(path, obj, "special_handler", true);
            return rule;
        }

        ResourceRule parseResourceRule(const std::string& path, const std::string& type, const Json& obj)
        {
            if (!obj.is_object())
                throwError(path, "Resource mapping '" + type + "' must be an object");

            ResourceRule rule;
            rule.resourceType = data::toLower(type);
            rule.templateName = parseString(path, obj, "template", false, {});
            for (const auto& alias : parseStringList(path, obj, "alias"))
                rule.aliases.push_back(data::toLower(alias));

            if (const auto* props = section(path, obj, "properties"))
            {
                for (auto it = props->begin(); it != props->end(); ++it)
                    rule.properties.push_back(parsePropertyRule(path, it.key(), it.value()));
            }

            rule.requiredProperties = parseStringList(path, obj, "required_properties");

            if (const auto* defaults = section(path, obj, "default_properties"))
            {
                for (auto it = defaults->begin(); it != defaults->end(); ++it)
                    rule.defaultProperties.emplace_back(it.key(), parseValue(path, it.key(), it.value()));
            }
            return rule;
        }

        NamingRules parseNaming(const std::string& path, const Json* obj)
        {
            NamingRules naming;
            if (!obj)
                return naming;

            const auto caseStr = parseString(path, *obj, "case_handling", false, "preserve");
            if (caseStr == "preserve")
                naming.caseHandling = NamingRules::CaseHandling::PRESERVE;
            else if (caseStr == "upper")
                naming.caseHandling = NamingRules::CaseHandling::UPPER;
            else if (caseStr == "lower")
                naming.caseHandling = NamingRules::CaseHandling::LOWER;
            else
                throwError(path, "Unknown naming case_handling: " + caseStr);

            if (obj->contains("invalid_chars"))
            {
                const auto& chars = obj->at("invalid_chars");
                naming.invalidChars.clear();
                if (chars.is_string())
                    naming.invalidChars = chars.get<std::string>();
                else
                {
                    for (const auto& c : parseStringList(path, *obj, "invalid_chars"))
                        naming.invalidChars += c;
                }
            }

            const auto repl = parseString(path, *obj, "replacement_char", false, "_");
            if (repl.size() != 1)
                throwError(path, "naming.replacement_char must be exactly one character");
            naming.replacementChar = repl[0];

            const double maxLen = parseNumber(path, *obj, "max_length", 32);
            if (maxLen < 1)
                throwError(path, "naming.max_length must be at least 1");
            naming.maxLength   = static_cast<std::size_t>(maxLen);
            naming.digitPrefix = parseString(path, *obj, "digit_prefix", false, "obj_");
            return naming;
        }

        ErrorPolicy parsePolicy(const std::string& path, const Json& obj, const char* key)
        {
            const auto word   = parseString(path, obj, key, false, "warn_and_continue");
            auto       policy = errorPolicyFromString(word);
            if (!policy)
                throwError(path, std::string("Unknown error policy for '") + key + "': " + word);
            return *policy;
        }

        BackendKind parseBackendKind(const std::string& path, const std::string& name)
        {
            if (name == "remote")
                return BackendKind::REMOTE;
            if (name == "in_process")
                return BackendKind::IN_PROCESS;
            if (name == "mock")
                return BackendKind::MOCK;
            throwError(path, "Unknown backend kind: " + name);
        }

        char parseLevel(const std::string& path, const std::string& level)
        {
            if (level.empty())
                throwError(path, "logging.level must not be empty");
            const std::string folded = data::toLower(level);
            if (folded == "debug" || folded == "d")
                return 'D';
            if (folded == "info" || folded == "i")
                return 'I';
            if (folded == "warn" || folded == "warning" || folded == "w")
                return 'W';
            if (folded == "error" || folded == "e")
                return 'E';
            if (folded == "fatal" || folded == "f")
                return 'F';
            throwError(path, "Unknown logging level: " + level);
        }

    } // namespace

    std::string FieldPaths::field(const std::string& key) const
    {
        auto it = fields.find(key);
        return it == fields.end() ? std::string{} : it->second;
    }

    std::optional<DataType> dataTypeFromString(const std::string& name)
    {
        if (name == "string")
            return DataType::STRING;
        if (name == "int")
            return DataType::INT;
        if (name == "float")
            return DataType::FLOAT;
        if (name == "positive_int")
            return DataType::POSITIVE_INT;
        if (name == "positive_float")
            return DataType::POSITIVE_FLOAT;
        return std::nullopt;
    }

    const char* dataTypeName(DataType type)
    {
        switch (type)
        {
        case DataType::STRING: return "string";
        case DataType::INT: return "int";
        case DataType::FLOAT: return "float";
        case DataType::POSITIVE_INT: return "positive_int";
        case DataType::POSITIVE_FLOAT: return "positive_float";
        }
        return "string";
    }

    std::optional<ErrorPolicy> errorPolicyFromString(const std::string& name)
    {
        if (name == "error_and_stop")
            return ErrorPolicy::ERROR_AND_STOP;
        if (name == "warn_and_continue")
            return ErrorPolicy::WARN_AND_CONTINUE;
        if (name == "ignore")
            return ErrorPolicy::IGNORE;
        return std::nullopt;
    }

    const PropertyRule* ResourceRule::findProperty(const std::string& sourceName) const
    {
        const auto folded = data::toLower(sourceName);
        for (const auto& prop : properties)
        {
            if (data::toLower(prop.sourceName) == folded)
                return &prop;
        }
        return nullptr;
    }

    const data::Value* ResourceRule::findDefault(const std::string& sourceName) const
    {
        for (const auto& entry : defaultProperties)
        {
            if (entry.first == sourceName)
                return &entry.second;
        }
        return nullptr;
    }

    const ResourceRule* RuleTable::findRule(const std::string& resourceType) const
    {
        const auto folded = data::toLower(resourceType);
        for (const auto& rule : resourceRules)
        {
            if (rule.resourceType == folded)
                return &rule;
        }
        for (const auto& rule : resourceRules)
        {
            if (std::find(rule.aliases.begin(), rule.aliases.end(), folded) != rule.aliases.end())
                return &rule;
        }
        return nullptr;
    }

    SchemaConfig ConfigManager::loadSchemaConfig(const std::string& path)
    {
        return parseSchemaConfig(readFile(path), path);
    }

    SchemaConfig ConfigManager::parseSchemaConfig(const std::string& jsonText, const std::string& source)
    {
        const Json root = parseJson(jsonText, source);

        SchemaConfig cfg;
        cfg.rootElement = parseString(source, root, "root", false, {});

        const auto* header = section(source, root, "header");
        if (!header)
            throwError(source, "Schema is missing the 'header' section");
        cfg.header = parseFieldPaths(source, header, {});
        if (cfg.header.xpath.empty())
            throwError(source, "Schema header section requires an 'xpath'");

        if (const auto* res = section(source, root, "resources"))
        {
            cfg.resources           = parseFieldPaths(source, res, ".//{*}Resource");
            cfg.resourceProperties  = parseFieldPaths(source, section(source, *res, "properties"), {});
            cfg.resourceConnections = parseFieldPaths(source, section(source, *res, "connections"), {});
        }

        if (const auto* lo = section(source, root, "layout_objects"))
        {
            cfg.layoutObjects        = parseFieldPaths(source, lo, ".//{*}LayoutObject");
            cfg.layoutObjectBoundary = parseBoundaryPaths(source, section(source, *lo, "boundary"));
        }

        if (const auto* layout = section(source, root, "layout"))
        {
            cfg.layout         = parseFieldPaths(source, layout, ".//{*}Layout");
            cfg.layoutBoundary = parseBoundaryPaths(source, section(source, *layout, "boundary"));
            cfg.placements     = parseFieldPaths(source, section(source, *layout, "placements"), {});
        }

        if (const auto* pt = section(source, root, "part_types"))
            cfg.partTypes = parseFieldPaths(source, pt, ".//{*}PartType");

        if (cfg.resources.configured() && cfg.resources.field("identifier").empty())
            throwError(source, "Schema resources section requires an 'identifier' field path");

        return cfg;
    }

    RuleTable ConfigManager::loadRuleTable(const std::string& path)
    {
        return parseRuleTable(readFile(path), path);
    }

    RuleTable ConfigManager::parseRuleTable(const std::string& jsonText, const std::string& source)
    {
        const Json root = parseJson(jsonText, source);

        RuleTable rules;
        if (const auto* mappings = section(source, root, "resource_mappings"))
        {
            for (auto it = mappings->begin(); it != mappings->end(); ++it)
                rules.resourceRules.push_back(parseResourceRule(source, it.key(), it.value()));
        }

        if (const auto* units = section(source, root, "unit_conversions"))
        {
            for (auto it = units->begin(); it != units->end(); ++it)
            {
                if (!it.value().is_object())
                    throwError(source, "Unit conversion category '" + it.key() + "' must be an object");
                UnitCategory cat;
                cat.baseUnit = parseString(source, it.value(), "base_unit", true);
                if (const auto* factors = section(source, it.value(), "conversions"))
                {
                    for (auto f = factors->begin(); f != factors->end(); ++f)
                    {
                        if (!f.value().is_number())
                            throwError(source, "Conversion factor for '" + f.key() + "' must be a number");
                        cat.factors[f.key()] = f.value().get<double>();
                    }
                }
                rules.unitConversions[it.key()] = std::move(cat);
            }
        }

        if (const auto* validation = section(source, root, "property_validation"))
        {
            if (const auto* ranges = section(source, *validation, "ranges"))
            {
                for (auto it = ranges->begin(); it != ranges->end(); ++it)
                {
                    const auto& r = it.value();
                    if (!r.is_array() || r.size() != 2 || !r[0].is_number() || !r[1].is_number())
                        throwError(source, "Range for '" + it.key() + "' must be [min, max]");
                    rules.ranges[it.key()] = {r[0].get<double>(), r[1].get<double>()};
                }
            }
        }

        rules.naming = parseNaming(source, section(source, root, "naming"));

        if (const auto* target = section(source, root, "target_settings"))
        {
            rules.target.modelFrame  = parseString(source, *target, "model_frame", false, rules.target.modelFrame);
            rules.target.connector   = parseString(source, *target, "connector", false, rules.target.connector);
            rules.target.userObjects = parseString(source, *target, "user_objects", false, rules.target.userObjects);
            if (const auto* templates = section(source, *target, "templates"))
            {
                for (auto it = templates->begin(); it != templates->end(); ++it)
                {
                    if (!it.value().is_string())
                        throwError(source, "Template path for '" + it.key() + "' must be a string");
                    rules.target.templates[it.key()] = it.value().get<std::string>();
                }
            }
        }

        if (const auto* errors = section(source, root, "error_handling"))
        {
            rules.errorHandling.onCreation   = parsePolicy(source, *errors, "on_creation_error");
            rules.errorHandling.onProperty   = parsePolicy(source, *errors, "on_property_error");
            rules.errorHandling.onConnection = parsePolicy(source, *errors, "on_connection_error");
        }

        if (const auto* mu = section(source, root, "material_units"))
        {
            rules.materialUnits.templatePath =
                parseString(source, *mu, "template_path", false, rules.materialUnits.templatePath);
            rules.materialUnits.namePrefix = parseString(source, *mu, "name_prefix", false, rules.materialUnits.namePrefix);
        }

        validateRuleTable(rules, source);
        return rules;
    }

    void ConfigManager::validateRuleTable(const RuleTable& rules, const std::string& source)
    {
        std::unordered_set<std::string> types;
        for (const auto& rule : rules.resourceRules)
        {
            if (!types.insert(rule.resourceType).second)
                throwError(source, "Duplicate resource mapping: " + rule.resourceType);
            if (rule.templateName.empty())
                throwError(source, "Resource mapping '" + rule.resourceType + "' has no template");

            std::unordered_set<std::string> sources;
            for (const auto& prop : rule.properties)
            {
                if (!sources.insert(data::toLower(prop.sourceName)).second)
                    throwError(source, "Duplicate property rule '" + prop.sourceName + "' in mapping '" +
                                           rule.resourceType + "'");
                if (prop.unitConversion && !rules.unitConversions.count(*prop.unitConversion))
                    throwError(source, "Property '" + prop.sourceName + "' references unknown unit conversion '" +
                                           *prop.unitConversion + "'");
            }
        }

        for (const auto& entry : rules.ranges)
        {
            if (entry.second.first > entry.second.second)
                throwError(source, "Range for '" + entry.first + "' has min greater than max");
        }

        // Sanitized names must be a fixed point of the sanitizer.
        const auto& naming = rules.naming;
        if (naming.invalidChars.find(naming.replacementChar) != std::string::npos)
            throwError(source, "naming.replacement_char must not be one of naming.invalid_chars");
        if (std::isdigit(static_cast<unsigned char>(naming.replacementChar)))
            throwError(source, "naming.replacement_char must not be a digit");
        const auto repl = static_cast<unsigned char>(naming.replacementChar);
        if ((naming.caseHandling == NamingRules::CaseHandling::UPPER && std::islower(repl)) ||
            (naming.caseHandling == NamingRules::CaseHandling::LOWER && std::isupper(repl)))
            throwError(source, "naming.replacement_char must be unchanged by naming.case_handling");
        if (naming.digitPrefix.empty() || std::isdigit(static_cast<unsigned char>(naming.digitPrefix[0])))
            throwError(source, "naming.digit_prefix must be non-empty and must not start with a digit");
        if (naming.maxLength < 1)
            throwError(source, "naming.max_length must be at least 1");
    }

    PipelineSettings ConfigManager::loadPipelineSettings(const std::string& path)
    {
        return parsePipelineSettings(readFile(path), path);
    }

    PipelineSettings ConfigManager::parsePipelineSettings(const std::string& jsonText, const std::string& source)
    {
        const Json root = parseJson(jsonText, source);

        PipelineSettings settings;
        if (const auto* backend = section(source, root, "backend"))
        {
            settings.backend = parseBackendKind(source, parseString(source, *backend, "kind", false, "mock"));
            if (const auto* remote = section(source, *backend, "remote"))
            {
                settings.remote.url        = parseString(source, *remote, "url", false, settings.remote.url);
                settings.remote.endpoint   = parseString(source, *remote, "endpoint", false, settings.remote.endpoint);
                settings.remote.timeoutSec = parseNumber(source, *remote, "timeout_sec", settings.remote.timeoutSec);
                if (settings.remote.timeoutSec <= 0)
                    throwError(source, "backend.remote.timeout_sec must be positive");
            }
            if (const auto* inProcess = section(source, *backend, "in_process"))
                settings.inProcessTemplates = parseStringList(source, *inProcess, "templates");
        }

        if (const auto* logging = section(source, root, "logging"))
        {
            settings.debug.level    = parseLevel(source, parseString(source, *logging, "level", false, "info"));
            settings.debug.toStdout = parseBool(source, *logging, "stdout", true);
            settings.debug.fileName = parseString(source, *logging, "file", false, {});
            const double size       = parseNumber(source, *logging, "max_file_size", 0);
            if (size < 0)
                throwError(source, "logging.max_file_size must not be negative");
            settings.debug.fileSize = static_cast<std::size_t>(size);
        }

        return settings;
    }

} // namespace config
