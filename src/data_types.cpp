#include "data_types.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace data
{

    namespace
    {

        std::string trimmed(const std::string& text)
        {
            std::size_t begin = 0;
            std::size_t end   = text.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
                ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                --end;
            return text.substr(begin, end - begin);
        }

        const std::vector<std::string> kNoConnections;

    } // namespace

    std::optional<double> parseDouble(const std::string& text)
    {
        const std::string t = trimmed(text);
        if (t.empty())
            return std::nullopt;

        // Decimal notation only; strtod would also take hex floats.
        if (t.find_first_of("xX") != std::string::npos)
            return std::nullopt;

        errno           = 0;
        char*        end = nullptr;
        const double v   = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size() || errno == ERANGE || !std::isfinite(v))
            return std::nullopt;
        return v;
    }

    std::optional<long long> parseInteger(const std::string& text)
    {
        const std::string t = trimmed(text);
        if (t.empty())
            return std::nullopt;

        errno              = 0;
        char*           end = nullptr;
        const long long v   = std::strtoll(t.c_str(), &end, 10);
        if (end != t.c_str() + t.size() || errno == ERANGE)
            return std::nullopt;
        return v;
    }

    std::string toLower(const std::string& text)
    {
        std::string out(text);
        for (auto& c : out)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    std::string valueToString(const Value& value)
    {
        std::ostringstream oss;
        oss << std::setprecision(15);
        if (const auto* s = std::get_if<std::string>(&value))
            return *s;
        if (const auto* i = std::get_if<long long>(&value))
            oss << *i;
        else if (const auto* d = std::get_if<double>(&value))
            oss << *d;
        else if (const auto* list = std::get_if<std::vector<double>>(&value))
        {
            oss << '[';
            for (std::size_t i = 0; i < list->size(); ++i)
            {
                if (i)
                    oss << ", ";
                oss << (*list)[i];
            }
            oss << ']';
        }
        return oss.str();
    }

    void Resource::addProperty(Property prop)
    {
        const std::string folded = toLower(prop.name);
        auto              it     = m_foldedIndex.find(folded);
        if (it != m_foldedIndex.end())
        {
            if (m_properties[it->second].name == prop.name)
            {
                m_properties[it->second] = std::move(prop);
                return;
            }
            m_properties.push_back(std::move(prop));
            return;
        }
        m_foldedIndex.emplace(folded, m_properties.size());
        m_properties.push_back(std::move(prop));
    }

    const Property* Resource::findProperty(const std::string& name) const
    {
        auto it = m_foldedIndex.find(toLower(name));
        if (it == m_foldedIndex.end())
            return nullptr;
        return &m_properties[it->second];
    }

    const Placement* Document::findPlacement(const std::string& layoutElementId) const
    {
        if (!layout)
            return nullptr;
        return layout->placements.find(layoutElementId);
    }

    const std::vector<std::string>& Document::resourceConnections(const std::string& resourceId) const
    {
        const auto* res = resources.find(resourceId);
        return res ? res->connections : kNoConnections;
    }

    const char* issueCategoryName(IssueCategory category)
    {
        switch (category)
        {
        case IssueCategory::DOCUMENT: return "document";
        case IssueCategory::REFERENCE: return "reference";
        case IssueCategory::COVERAGE: return "coverage";
        case IssueCategory::PLACEMENT: return "placement";
        case IssueCategory::PROPERTY: return "property";
        case IssueCategory::UNIT: return "unit";
        case IssueCategory::RANGE: return "range";
        case IssueCategory::REQUIRED: return "required";
        case IssueCategory::HANDLER: return "handler";
        case IssueCategory::CREATION: return "creation";
        case IssueCategory::CONNECTION: return "connection";
        }
        return "unknown";
    }

    void ValidationResult::addError(IssueCategory category, std::string entityKind, std::string entityId,
                                    std::string referenceId, std::string message)
    {
        errors.push_back({IssueSeverity::ERROR, category, std::move(entityKind), std::move(entityId),
                          std::move(referenceId), std::move(message)});
        isValid = false;
    }

    void ValidationResult::addWarning(IssueCategory category, std::string entityKind, std::string entityId,
                                      std::string referenceId, std::string message)
    {
        warnings.push_back({IssueSeverity::WARNING, category, std::move(entityKind), std::move(entityId),
                            std::move(referenceId), std::move(message)});
    }

} // namespace data
