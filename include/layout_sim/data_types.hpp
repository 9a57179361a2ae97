#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace data
{

    // Lenient numeric coercion used for document fields and property values.
    // Leading/trailing whitespace is ignored; anything else unparsable yields nullopt.
    // parseDouble accepts finite decimal notation only (no nan, inf or hex floats).
    std::optional<double>    parseDouble(const std::string& text);
    std::optional<long long> parseInteger(const std::string& text);

    std::string toLower(const std::string& text);

    // Scalar or coordinate-list value carried from configuration and mapping to a backend.
    using Value = std::variant<std::string, long long, double, std::vector<double>>;

    std::string valueToString(const Value& value);

    struct Property
    {
        std::string                name;
        std::string                value;
        std::optional<std::string> unit;

        std::optional<double>    numericValue() const { return parseDouble(value); }
        std::optional<long long> intValue() const { return parseInteger(value); }
    };

    struct Position
    {
        double x{0.0};
        double y{0.0};
        double z{0.0};
    };

    struct Rotation
    {
        double angle{0.0};
        double axisX{0.0};
        double axisY{0.0};
        double axisZ{1.0};
    };

    struct Boundary
    {
        double      width{0.0};
        double      depth{0.0};
        double      height{1.0};
        std::string unit{"meter"};
    };

    class Resource
    {
      public:
        std::string                identifier;
        std::string                resourceType;
        std::string                name;
        std::string                description;
        std::string                currentStatus;
        std::optional<std::string> resourceClassIdentifier;

        // Target resource ids, filled once all connections are known.
        std::vector<std::string> connections;

        void addProperty(Property prop);

        // Case-insensitive; the first property registered under a folded name wins.
        const Property* findProperty(const std::string& name) const;
        bool            hasProperty(const std::string& name) const { return findProperty(name) != nullptr; }

        const std::vector<Property>& properties() const { return m_properties; }

      private:
        std::vector<Property>                        m_properties;
        std::unordered_map<std::string, std::size_t> m_foldedIndex;
    };

    struct Connection
    {
        std::string identifier;
        std::string fromResourceId;
        std::string toResourceId;
        std::string description;
    };

    struct LayoutObject
    {
        std::string             identifier;
        std::string             associatedResourceId;
        std::optional<Boundary> boundary;
    };

    struct Placement
    {
        std::string             layoutElementId;
        Position                position;
        std::optional<Rotation> rotation;
    };

    struct PartType
    {
        std::string             identifier;
        std::string             name;
        std::string             description;
        std::optional<double>   weight;
        std::optional<Boundary> dimensions;
    };

    /**
     * Ordered collection with O(1) lookup by identifier. Iteration follows
     * insertion (document) order; re-inserting an identifier replaces the
     * entry in place.
     */
    template <typename T>
    class Registry
    {
      public:
        // Returns false when an entry with the same key was replaced.
        bool put(const std::string& key, T value)
        {
            auto it = m_index.find(key);
            if (it != m_index.end())
            {
                m_items[it->second] = std::move(value);
                return false;
            }
            m_index.emplace(key, m_items.size());
            m_items.push_back(std::move(value));
            return true;
        }

        const T* find(const std::string& key) const
        {
            auto it = m_index.find(key);
            return it == m_index.end() ? nullptr : &m_items[it->second];
        }

        T* find(const std::string& key)
        {
            auto it = m_index.find(key);
            return it == m_index.end() ? nullptr : &m_items[it->second];
        }

        bool        contains(const std::string& key) const { return m_index.count(key) > 0; }
        std::size_t size() const { return m_items.size(); }
        bool        empty() const { return m_items.empty(); }

        typename std::vector<T>::const_iterator begin() const { return m_items.begin(); }
        typename std::vector<T>::const_iterator end() const { return m_items.end(); }

      private:
        std::vector<T>                               m_items;
        std::unordered_map<std::string, std::size_t> m_index;
    };

    struct Layout
    {
        std::string             identifier;
        std::string             description;
        std::optional<Boundary> boundary;
        Registry<Placement>     placements; // keyed by layoutElementId
    };

    struct Document
    {
        std::string identifier;
        std::string description;
        std::string version;
        std::string creationTime;

        std::string timeUnit{"second"};
        std::string lengthUnit{"meter"};
        std::string weightUnit{"kilogram"};

        Registry<Resource>      resources;
        std::vector<Connection> connections;
        Registry<LayoutObject>  layoutObjects;
        std::optional<Layout>   layout;
        Registry<PartType>      partTypes;

        const Resource*     findResource(const std::string& id) const { return resources.find(id); }
        const LayoutObject* findLayoutObject(const std::string& id) const { return layoutObjects.find(id); }
        const PartType*     findPartType(const std::string& id) const { return partTypes.find(id); }
        const Placement*    findPlacement(const std::string& layoutElementId) const;

        const std::vector<std::string>& resourceConnections(const std::string& resourceId) const;
    };

    enum class IssueSeverity
    {
        WARNING,
        ERROR
    };

    enum class IssueCategory
    {
        DOCUMENT,
        REFERENCE,
        COVERAGE,
        PLACEMENT,
        PROPERTY,
        UNIT,
        RANGE,
        REQUIRED,
        HANDLER,
        CREATION,
        CONNECTION
    };

    const char* issueCategoryName(IssueCategory category);

    struct Issue
    {
        IssueSeverity severity{IssueSeverity::ERROR};
        IssueCategory category{IssueCategory::DOCUMENT};
        std::string   entityKind;
        std::string   entityId;
        std::string   referenceId;
        std::string   message;
    };

    struct ValidationResult
    {
        bool               isValid{true};
        std::vector<Issue> errors;
        std::vector<Issue> warnings;

        void addError(IssueCategory category, std::string entityKind, std::string entityId, std::string referenceId,
                      std::string message);
        void addWarning(IssueCategory category, std::string entityKind, std::string entityId, std::string referenceId,
                        std::string message);
    };

} // namespace data
