#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tinyxml2
{
    class XMLElement;
}

namespace parser
{

    /**
     * Compiled location path in the ElementTree subset used by schema
     * configurations:
     *
     *   Name / {*}Name / {uri}Name   child element (namespace-agnostic with braces)
     *   .//Name or //Name            any descendant
     *   *                            any element
     *   .                            the context element
     *   @attr                        attribute of the selected element (last step only)
     *
     * Steps are separated by '/'. Namespace URIs are not resolved; a braced
     * step matches on the local part of the element name.
     */
    class XmlPath
    {
      public:
        XmlPath() = default;
        explicit XmlPath(const std::string& expression);

        bool               empty() const { return m_steps.empty() && !m_attribute; }
        const std::string& expression() const { return m_expression; }

        std::vector<const tinyxml2::XMLElement*> selectAll(const tinyxml2::XMLElement* context) const;
        const tinyxml2::XMLElement*              selectFirst(const tinyxml2::XMLElement* context) const;

        // Trimmed text (or attribute value) of the first match; nullopt when absent or blank.
        std::optional<std::string> text(const tinyxml2::XMLElement* context) const;

      private:
        struct Step
        {
            enum class Axis
            {
                CHILD,
                DESCENDANT
            };
            enum class Kind
            {
                SELF,
                ANY,
                NAME
            };

            Axis        axis{Axis::CHILD};
            Kind        kind{Kind::NAME};
            std::string name;
            bool        anyNamespace{false};
        };

        bool matches(const Step& step, const tinyxml2::XMLElement* elem) const;

        std::string                m_expression;
        std::vector<Step>          m_steps;
        std::optional<std::string> m_attribute;
    };

} // namespace parser
