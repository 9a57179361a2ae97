#include "unit_converter.hpp"

#include <cmath>
#include <sstream>

namespace mapping
{

    UnitConverter::UnitConverter(std::unordered_map<std::string, config::UnitCategory> categories)
        : m_categories(std::move(categories))
    {
    }

    std::optional<double> UnitConverter::factor(const std::string& unit, const std::string& category) const
    {
        auto cat = m_categories.find(category);
        if (cat == m_categories.end())
            return std::nullopt;
        if (unit == cat->second.baseUnit)
            return 1.0;
        auto it = cat->second.factors.find(unit);
        if (it == cat->second.factors.end() || it->second == 0.0)
            return std::nullopt;
        return it->second;
    }

    bool UnitConverter::knowsUnit(const std::string& unit, const std::string& category) const
    {
        return factor(unit, category).has_value();
    }

    std::optional<double> UnitConverter::toBase(double value, const std::string& fromUnit,
                                                const std::string& category) const
    {
        auto f = factor(fromUnit, category);
        if (!f)
            return std::nullopt;
        return value * *f;
    }

    std::optional<double> UnitConverter::fromBase(double value, const std::string& toUnit,
                                                  const std::string& category) const
    {
        auto f = factor(toUnit, category);
        if (!f)
            return std::nullopt;
        return value / *f;
    }

    PropertyValidator::PropertyValidator(std::unordered_map<std::string, std::pair<double, double>> ranges)
        : m_ranges(std::move(ranges))
    {
    }

    std::optional<std::string> PropertyValidator::validate(const std::string& propertyName, const data::Value& value,
                                                           config::DataType type) const
    {
        if (type == config::DataType::STRING)
            return std::nullopt;

        double numeric = 0.0;
        if (const auto* i = std::get_if<long long>(&value))
            numeric = static_cast<double>(*i);
        else if (const auto* d = std::get_if<double>(&value))
            numeric = *d;
        else
        {
            return "Invalid data type for " + propertyName + ". Expected " + config::dataTypeName(type);
        }

        if (!std::isfinite(numeric))
            return propertyName + " value is not a finite number";

        if ((type == config::DataType::POSITIVE_INT || type == config::DataType::POSITIVE_FLOAT) && numeric < 0.0)
        {
            std::ostringstream oss;
            oss << propertyName << " value " << numeric << " must not be negative";
            return oss.str();
        }

        auto range = m_ranges.find(propertyName);
        if (range != m_ranges.end())
        {
            const auto [minVal, maxVal] = range->second;
            if (numeric < minVal || numeric > maxVal)
            {
                std::ostringstream oss;
                oss << propertyName << " value " << numeric << " outside valid range [" << minVal << ", " << maxVal
                    << "]";
                return oss.str();
            }
        }
        return std::nullopt;
    }

} // namespace mapping
