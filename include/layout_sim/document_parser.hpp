#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "config_manager.hpp"
#include "data_types.hpp"

namespace tinyxml2
{
    class XMLDocument;
    class XMLElement;
} // namespace tinyxml2

namespace diag
{
    class DiagnosticManager;
}

namespace parser
{

    class ParseError : public std::runtime_error
    {
      public:
        ParseError(const std::string& source, int line, const std::string& message);

        int                line() const { return m_line; }
        const std::string& source() const { return m_source; }

      private:
        std::string m_source;
        int         m_line{};
    };

    /**
     * Builds the intermediate document from layout XML. Every field location
     * comes from the schema configuration. Only malformed markup, a wrong
     * root element, or a missing header section fail the parse; entities
     * lacking their identifiers are skipped with a warning.
     */
    class DocumentParser
    {
      public:
        explicit DocumentParser(config::SchemaConfig schema, diag::DiagnosticManager* diag = nullptr);

        data::Document parseFile(const std::string& path) const;
        data::Document parseString(const std::string& xml, const std::string& source = "<memory>") const;

        const config::SchemaConfig& schema() const { return m_schema; }

      private:
        data::Document parseDocument(const tinyxml2::XMLDocument& doc, const std::string& source) const;

        void parseHeader(const tinyxml2::XMLElement* root, data::Document& out, const std::string& source) const;
        void parseResources(const tinyxml2::XMLElement* root, data::Document& out) const;
        void parseConnections(const tinyxml2::XMLElement* root, data::Document& out) const;
        void parseLayoutObjects(const tinyxml2::XMLElement* root, data::Document& out) const;
        void parseLayout(const tinyxml2::XMLElement* root, data::Document& out) const;
        void parsePartTypes(const tinyxml2::XMLElement* root, data::Document& out) const;

        std::optional<data::Boundary> parseBoundary(const tinyxml2::XMLElement* elem,
                                                    const config::FieldPaths& paths) const;

        void warn(const std::string& message) const;

        config::SchemaConfig     m_schema;
        diag::DiagnosticManager* m_diag{nullptr};
    };

} // namespace parser
