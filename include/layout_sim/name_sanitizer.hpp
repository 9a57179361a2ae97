#pragma once

#include <string>

#include "config_manager.hpp"

namespace mapping
{

    /**
     * Turns free-text resource names into identifiers accepted by the
     * target object model. The result never starts with a digit and is never
     * empty. Applying it to its own output returns the same string, provided
     * the naming rules passed ConfigManager::validateRuleTable.
     */
    class NameSanitizer
    {
      public:
        explicit NameSanitizer(config::NamingRules rules = {});

        std::string sanitize(const std::string& rawName) const;

      private:
        config::NamingRules m_rules;
    };

} // namespace mapping
