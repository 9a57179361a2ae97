#include "name_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace mapping
{

    NameSanitizer::NameSanitizer(config::NamingRules rules) : m_rules(std::move(rules)) {}

    std::string NameSanitizer::sanitize(const std::string& rawName) const
    {
        std::string name = rawName.empty() ? std::string("unnamed") : rawName;

        if (std::isdigit(static_cast<unsigned char>(name.front())))
            name = m_rules.digitPrefix + name;

        switch (m_rules.caseHandling)
        {
        case config::NamingRules::CaseHandling::UPPER:
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            break;
        case config::NamingRules::CaseHandling::LOWER:
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            break;
        case config::NamingRules::CaseHandling::PRESERVE: break;
        }

        for (auto& c : name)
        {
            if (m_rules.invalidChars.find(c) != std::string::npos)
                c = m_rules.replacementChar;
        }

        if (m_rules.maxLength > 0 && name.size() > m_rules.maxLength)
        {
            // Cut on a UTF-8 code-point boundary: never keep a lead byte without its continuation bytes.
            std::size_t n = m_rules.maxLength;
            while (n > 0 && (static_cast<unsigned char>(name[n]) & 0xC0) == 0x80)
                --n;
            name.resize(n);
            if (name.empty())
                name = std::string("unnamed").substr(0, m_rules.maxLength);
        }

        return name;
    }

} // namespace mapping
