#include "xml_path.hpp"

#include "config_manager.hpp"

#include <cctype>
#include <cstring>
#include <unordered_set>

#include <tinyxml2.h>

namespace parser
{

    namespace
    {

        using tinyxml2::XMLElement;

        std::string trim(const char* text)
        {
            if (!text)
                return {};
            const char* begin = text;
            const char* end   = text + std::strlen(text);
            while (begin < end && std::isspace(static_cast<unsigned char>(*begin)))
                ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1))))
                --end;
            return std::string(begin, end);
        }

        const char* localName(const char* qualified)
        {
            const char* colon = std::strrchr(qualified, ':');
            return colon ? colon + 1 : qualified;
        }

        std::vector<std::string> splitSteps(const std::string& expr)
        {
            std::vector<std::string> tokens;
            std::string              current;
            int                      braceDepth = 0;
            for (char c : expr)
            {
                if (c == '{')
                    ++braceDepth;
                else if (c == '}' && braceDepth > 0)
                    --braceDepth;

                if (c == '/' && braceDepth == 0)
                {
                    tokens.push_back(current);
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }
            tokens.push_back(current);
            return tokens;
        }

        void collectDescendants(const XMLElement* elem, std::vector<const XMLElement*>& out)
        {
            for (auto* child = elem->FirstChildElement(); child; child = child->NextSiblingElement())
            {
                out.push_back(child);
                collectDescendants(child, out);
            }
        }

    } // namespace

    XmlPath::XmlPath(const std::string& expression) : m_expression(expression)
    {
        if (expression.empty())
            return;

        const auto tokens     = splitSteps(expression);
        bool       descendant = false;
        for (std::size_t i = 0; i < tokens.size(); ++i)
        {
            const auto& tok = tokens[i];
            if (tok.empty())
            {
                // "//" or a leading '/': the next step searches all descendants
                if (i + 1 < tokens.size())
                    descendant = true;
                continue;
            }

            if (tok[0] == '@')
            {
                if (i + 1 != tokens.size() || tok.size() < 2)
                    throw config::ConfigError({}, 0, "Invalid attribute step in path '" + expression + "'");
                m_attribute = tok.substr(1);
                continue;
            }

            Step step;
            step.axis  = descendant ? Step::Axis::DESCENDANT : Step::Axis::CHILD;
            descendant = false;

            if (tok == ".")
            {
                step.kind = Step::Kind::SELF;
                // A leading "." is only an anchor for what follows.
                if (i + 1 < tokens.size())
                    continue;
            }
            else if (tok == "*" || tok == "{*}*")
            {
                step.kind = Step::Kind::ANY;
            }
            else if (tok[0] == '{')
            {
                const auto close = tok.find('}');
                if (close == std::string::npos || close + 1 >= tok.size())
                    throw config::ConfigError({}, 0, "Invalid namespace step in path '" + expression + "'");
                step.kind         = Step::Kind::NAME;
                step.name         = tok.substr(close + 1);
                step.anyNamespace = true;
            }
            else
            {
                step.kind = Step::Kind::NAME;
                step.name = tok;
            }
            m_steps.push_back(std::move(step));
        }
    }

    bool XmlPath::matches(const Step& step, const XMLElement* elem) const
    {
        switch (step.kind)
        {
        case Step::Kind::SELF:
        case Step::Kind::ANY: return true;
        case Step::Kind::NAME:
            if (step.anyNamespace)
                return step.name == localName(elem->Name());
            return step.name == elem->Name();
        }
        return false;
    }

    std::vector<const XMLElement*> XmlPath::selectAll(const XMLElement* context) const
    {
        if (!context)
            return {};

        std::vector<const XMLElement*> current{context};
        for (const auto& step : m_steps)
        {
            std::vector<const XMLElement*>           next;
            std::unordered_set<const XMLElement*>    seen;
            auto add = [&](const XMLElement* e) {
                if (matches(step, e) && seen.insert(e).second)
                    next.push_back(e);
            };

            for (const auto* node : current)
            {
                if (step.kind == Step::Kind::SELF && step.axis == Step::Axis::CHILD)
                {
                    add(node);
                }
                else if (step.axis == Step::Axis::CHILD)
                {
                    for (auto* child = node->FirstChildElement(); child; child = child->NextSiblingElement())
                        add(child);
                }
                else
                {
                    std::vector<const XMLElement*> all;
                    collectDescendants(node, all);
                    for (const auto* e : all)
                        add(e);
                }
            }
            current = std::move(next);
            if (current.empty())
                break;
        }
        return current;
    }

    const XMLElement* XmlPath::selectFirst(const XMLElement* context) const
    {
        auto all = selectAll(context);
        return all.empty() ? nullptr : all.front();
    }

    std::optional<std::string> XmlPath::text(const XMLElement* context) const
    {
        if (empty())
            return std::nullopt;

        for (const auto* elem : selectAll(context))
        {
            std::string value;
            if (m_attribute)
            {
                const char* attr = elem->Attribute(m_attribute->c_str());
                if (!attr)
                    continue;
                value = trim(attr);
            }
            else
            {
                value = trim(elem->GetText());
            }
            return value.empty() ? std::nullopt : std::optional<std::string>(value);
        }
        return std::nullopt;
    }

} // namespace parser
