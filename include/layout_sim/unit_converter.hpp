#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "config_manager.hpp"

namespace mapping
{

    /**
     * Multiplicative unit conversion driven by the rule table's
     * unit_conversions section. Each category declares a base unit and a
     * factor per known unit (value_in_base = value * factor).
     */
    class UnitConverter
    {
      public:
        explicit UnitConverter(std::unordered_map<std::string, config::UnitCategory> categories = {});

        // nullopt when the category or the unit is unknown; the base unit converts to itself.
        std::optional<double> toBase(double value, const std::string& fromUnit, const std::string& category) const;
        std::optional<double> fromBase(double value, const std::string& toUnit, const std::string& category) const;

        bool knowsCategory(const std::string& category) const { return m_categories.count(category) > 0; }
        bool knowsUnit(const std::string& unit, const std::string& category) const;

      private:
        std::optional<double> factor(const std::string& unit, const std::string& category) const;

        std::unordered_map<std::string, config::UnitCategory> m_categories;
    };

    /**
     * Checks coerced values against the declared data type and the
     * optional [min, max] range keyed by source property name.
     */
    class PropertyValidator
    {
      public:
        explicit PropertyValidator(std::unordered_map<std::string, std::pair<double, double>> ranges = {});

        // Error message, or nullopt when the value is acceptable.
        std::optional<std::string> validate(const std::string& propertyName, const data::Value& value,
                                            config::DataType type) const;

      private:
        std::unordered_map<std::string, std::pair<double, double>> m_ranges;
    };

} // namespace mapping
