#include "document_parser.hpp"

#include "diagnostic_manager.hpp"
#include "xml_path.hpp"

#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <tinyxml2.h>

namespace parser
{

    ParseError::ParseError(const std::string& source, int line, const std::string& message)
        : std::runtime_error([&]() {
            std::ostringstream oss;
            if (!source.empty())
                oss << source << ':';
            if (line > 0)
                oss << line << ' ';
            oss << message;
            return oss.str();
        }()),
          m_source(source), m_line(line)
    {
    }

    namespace
    {

        using tinyxml2::XMLDocument;
        using tinyxml2::XMLElement;

        constexpr const char* kComponent = "Parser";

        // Text of a configured field relative to an element; nullopt when the
        // field is not configured, missing or blank.
        std::optional<std::string> fieldText(const XMLElement* elem, const config::FieldPaths& paths,
                                             const std::string& key)
        {
            const auto expr = paths.field(key);
            if (expr.empty())
                return std::nullopt;
            return XmlPath(expr).text(elem);
        }

        std::string fieldOr(const XMLElement* elem, const config::FieldPaths& paths, const std::string& key,
                            const std::string& def = {})
        {
            auto v = fieldText(elem, paths, key);
            return v ? *v : def;
        }

        std::optional<double> fieldNumber(const XMLElement* elem, const config::FieldPaths& paths,
                                          const std::string& key)
        {
            auto v = fieldText(elem, paths, key);
            if (!v)
                return std::nullopt;
            return data::parseDouble(*v);
        }

        std::vector<const XMLElement*> select(const XMLElement* context, const config::FieldPaths& paths)
        {
            if (!paths.configured())
                return {};
            return XmlPath(paths.xpath).selectAll(context);
        }

    } // namespace

    DocumentParser::DocumentParser(config::SchemaConfig schema, diag::DiagnosticManager* diag)
        : m_schema(std::move(schema)), m_diag(diag)
    {
    }

    data::Document DocumentParser::parseFile(const std::string& path) const
    {
        XMLDocument doc;
        const auto  rc = doc.LoadFile(path.c_str());
        if (rc == tinyxml2::XML_ERROR_FILE_NOT_FOUND || rc == tinyxml2::XML_ERROR_FILE_COULD_NOT_BE_OPENED ||
            rc == tinyxml2::XML_ERROR_FILE_READ_ERROR)
        {
            throw ParseError(path, 0, "Unable to read layout document");
        }
        if (rc != tinyxml2::XML_SUCCESS)
            throw ParseError(path, doc.ErrorLineNum(), std::string("Malformed XML: ") + doc.ErrorStr());
        return parseDocument(doc, path);
    }

    data::Document DocumentParser::parseString(const std::string& xml, const std::string& source) const
    {
        XMLDocument doc;
        if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS)
            throw ParseError(source, doc.ErrorLineNum(), std::string("Malformed XML: ") + doc.ErrorStr());
        return parseDocument(doc, source);
    }

    data::Document DocumentParser::parseDocument(const XMLDocument& doc, const std::string& source) const
    {
        const XMLElement* root = doc.RootElement();
        if (!root)
            throw ParseError(source, 0, "Document has no root element");

        if (!m_schema.rootElement.empty())
        {
            std::string expected = m_schema.rootElement;
            auto        brace    = expected.rfind('}');
            if (brace != std::string::npos)
                expected = expected.substr(brace + 1);

            std::string name  = root->Name();
            auto        colon = name.rfind(':');
            if (colon != std::string::npos)
                name = name.substr(colon + 1);

            if (name != expected)
            {
                throw ParseError(source, root->GetLineNum(),
                                 "Unexpected root element '" + std::string(root->Name()) + "', expected '" + expected +
                                     "'");
            }
        }

        data::Document out;
        parseHeader(root, out, source);
        parseResources(root, out);
        parseConnections(root, out);
        parseLayoutObjects(root, out);
        parseLayout(root, out);
        parsePartTypes(root, out);

        // Derived connection lists are filled only now that every connection is known.
        for (const auto& conn : out.connections)
        {
            if (auto* res = out.resources.find(conn.fromResourceId))
                res->connections.push_back(conn.toResourceId);
        }

        if (m_diag)
        {
            nlohmann::json extra{{"resources", out.resources.size()},
                                 {"connections", out.connections.size()},
                                 {"layoutObjects", out.layoutObjects.size()},
                                 {"placements", out.layout ? out.layout->placements.size() : 0},
                                 {"partTypes", out.partTypes.size()}};
            m_diag->log(diag::Severity::INFO, kComponent, "Parsed document '" + out.identifier + "'", extra.dump());
        }
        return out;
    }

    void DocumentParser::parseHeader(const XMLElement* root, data::Document& out, const std::string& source) const
    {
        const XMLElement* header = XmlPath(m_schema.header.xpath).selectFirst(root);
        if (!header)
            throw ParseError(source, root->GetLineNum(), "Header section not found ('" + m_schema.header.xpath + "')");

        const auto& paths = m_schema.header;
        out.identifier    = fieldOr(header, paths, "identifier");
        out.description   = fieldOr(header, paths, "description");
        out.version       = fieldOr(header, paths, "version");
        out.creationTime  = fieldOr(header, paths, "creation_time");
        out.timeUnit      = fieldOr(header, paths, "time_unit", "second");
        out.lengthUnit    = fieldOr(header, paths, "length_unit", "meter");
        out.weightUnit    = fieldOr(header, paths, "weight_unit", "kilogram");
    }

    void DocumentParser::parseResources(const XMLElement* root, data::Document& out) const
    {
        const auto& paths = m_schema.resources;
        for (const auto* elem : select(root, paths))
        {
            auto id = fieldText(elem, paths, "identifier");
            if (!id)
            {
                warn("Skipping resource without identifier (line " + std::to_string(elem->GetLineNum()) + ")");
                continue;
            }

            data::Resource res;
            res.identifier    = *id;
            res.resourceType  = fieldOr(elem, paths, "resource_type");
            res.name          = fieldOr(elem, paths, "name", *id);
            res.description   = fieldOr(elem, paths, "description");
            res.currentStatus = fieldOr(elem, paths, "current_status");
            res.resourceClassIdentifier = fieldText(elem, paths, "resource_class");

            const auto& propPaths = m_schema.resourceProperties;
            for (const auto* propElem : select(elem, propPaths))
            {
                auto name  = fieldText(propElem, propPaths, "name");
                auto value = fieldText(propElem, propPaths, "value");
                if (!name || !value)
                    continue;
                res.addProperty(data::Property{*name, *value, fieldText(propElem, propPaths, "unit")});
            }

            if (!out.resources.put(res.identifier, std::move(res)))
                warn("Duplicate resource identifier '" + *id + "'; later definition replaces the earlier one");
        }
    }

    void DocumentParser::parseConnections(const XMLElement* root, data::Document& out) const
    {
        const auto& resPaths  = m_schema.resources;
        const auto& connPaths = m_schema.resourceConnections;
        if (!connPaths.configured())
            return;

        for (const auto* resElem : select(root, resPaths))
        {
            auto from = fieldText(resElem, resPaths, "identifier");
            if (!from)
                continue;

            for (const auto* elem : select(resElem, connPaths))
            {
                auto to = fieldText(elem, connPaths, "target");
                if (!to)
                {
                    warn("Skipping connection of resource '" + *from + "' without target resource");
                    continue;
                }

                data::Connection conn;
                conn.fromResourceId = *from;
                conn.toResourceId   = *to;
                conn.identifier     = fieldOr(elem, connPaths, "identifier", "conn_" + *from + "_to_" + *to);
                conn.description    = fieldOr(elem, connPaths, "description");
                out.connections.push_back(std::move(conn));
            }
        }
    }

    void DocumentParser::parseLayoutObjects(const XMLElement* root, data::Document& out) const
    {
        const auto& paths = m_schema.layoutObjects;
        for (const auto* elem : select(root, paths))
        {
            auto id  = fieldText(elem, paths, "identifier");
            auto ref = fieldText(elem, paths, "resource_reference");
            if (!id || !ref)
            {
                warn("Skipping layout object without identifier or resource reference (line " +
                     std::to_string(elem->GetLineNum()) + ")");
                continue;
            }

            data::LayoutObject obj;
            obj.identifier           = *id;
            obj.associatedResourceId = *ref;
            obj.boundary             = parseBoundary(elem, m_schema.layoutObjectBoundary);

            if (!out.layoutObjects.put(obj.identifier, std::move(obj)))
                warn("Duplicate layout object identifier '" + *id + "'; later definition replaces the earlier one");
        }
    }

    void DocumentParser::parseLayout(const XMLElement* root, data::Document& out) const
    {
        const auto& paths = m_schema.layout;
        if (!paths.configured())
            return;

        const XMLElement* elem = XmlPath(paths.xpath).selectFirst(root);
        if (!elem)
            return;

        data::Layout layout;
        layout.identifier  = fieldOr(elem, paths, "identifier", "main_layout");
        layout.description = fieldOr(elem, paths, "description");
        layout.boundary    = parseBoundary(elem, m_schema.layoutBoundary);

        const auto& placePaths = m_schema.placements;
        for (const auto* placeElem : select(elem, placePaths))
        {
            auto target = fieldText(placeElem, placePaths, "layout_element");
            if (!target)
            {
                warn("Skipping placement without layout element reference (line " +
                     std::to_string(placeElem->GetLineNum()) + ")");
                continue;
            }

            auto x = fieldNumber(placeElem, placePaths, "position_x");
            auto y = fieldNumber(placeElem, placePaths, "position_y");
            if (!x || !y)
            {
                warn("Skipping placement of '" + *target + "' without numeric x/y position");
                continue;
            }

            data::Placement placement;
            placement.layoutElementId = *target;
            placement.position.x      = *x;
            placement.position.y      = *y;
            placement.position.z      = fieldNumber(placeElem, placePaths, "position_z").value_or(0.0);

            if (auto angle = fieldNumber(placeElem, placePaths, "rotation_angle"))
            {
                data::Rotation rot;
                rot.angle = *angle;
                rot.axisX = fieldNumber(placeElem, placePaths, "rotation_axis_x").value_or(0.0);
                rot.axisY = fieldNumber(placeElem, placePaths, "rotation_axis_y").value_or(0.0);
                rot.axisZ = fieldNumber(placeElem, placePaths, "rotation_axis_z").value_or(1.0);
                placement.rotation = rot;
            }

            if (!layout.placements.put(placement.layoutElementId, placement))
                warn("Duplicate placement for '" + *target + "'; later definition replaces the earlier one");
        }

        out.layout = std::move(layout);
    }

    void DocumentParser::parsePartTypes(const XMLElement* root, data::Document& out) const
    {
        const auto& paths = m_schema.partTypes;
        for (const auto* elem : select(root, paths))
        {
            auto id = fieldText(elem, paths, "identifier");
            if (!id)
            {
                warn("Skipping part type without identifier (line " + std::to_string(elem->GetLineNum()) + ")");
                continue;
            }

            data::PartType part;
            part.identifier  = *id;
            part.name        = fieldOr(elem, paths, "name", *id);
            part.description = fieldOr(elem, paths, "description");
            part.weight      = fieldNumber(elem, paths, "weight");

            auto width = fieldNumber(elem, paths, "width");
            auto depth = fieldNumber(elem, paths, "depth");
            if (width && depth)
            {
                data::Boundary dims;
                dims.width  = *width;
                dims.depth  = *depth;
                dims.height = fieldNumber(elem, paths, "height").value_or(1.0);
                dims.unit   = fieldOr(elem, paths, "unit", "meter");
                part.dimensions = dims;
            }

            if (!out.partTypes.put(part.identifier, std::move(part)))
                warn("Duplicate part type identifier '" + *id + "'; later definition replaces the earlier one");
        }
    }

    std::optional<data::Boundary> DocumentParser::parseBoundary(const XMLElement* elem,
                                                                const config::FieldPaths& paths) const
    {
        if (paths.fields.empty())
            return std::nullopt;

        auto width = fieldNumber(elem, paths, "width");
        auto depth = fieldNumber(elem, paths, "depth");
        if (!width || !depth)
            return std::nullopt;

        data::Boundary b;
        b.width  = *width;
        b.depth  = *depth;
        b.height = fieldNumber(elem, paths, "height").value_or(1.0);
        b.unit   = fieldOr(elem, paths, "unit", "meter");
        return b;
    }

    void DocumentParser::warn(const std::string& message) const
    {
        if (m_diag)
            m_diag->log(diag::Severity::WARN, kComponent, message);
    }

} // namespace parser
