#include "document_validator.hpp"

#include <unordered_set>

namespace data
{

    ValidationResult validateDocument(const Document& doc)
    {
        ValidationResult result;

        if (doc.identifier.empty())
            result.addError(IssueCategory::DOCUMENT, "Document", "", "", "Missing document identifier");

        if (doc.resources.empty())
            result.addError(IssueCategory::DOCUMENT, "Document", doc.identifier, "", "No resources defined");

        for (const auto& lo : doc.layoutObjects)
        {
            if (!doc.resources.contains(lo.associatedResourceId))
                result.addError(IssueCategory::REFERENCE, "LayoutObject", lo.identifier, lo.associatedResourceId,
                                "LayoutObject '" + lo.identifier + "' references unknown resource '" +
                                    lo.associatedResourceId + "'");
        }

        if (doc.layout)
        {
            for (const auto& placement : doc.layout->placements)
            {
                if (!doc.layoutObjects.contains(placement.layoutElementId))
                    result.addError(IssueCategory::REFERENCE, "Placement", placement.layoutElementId,
                                    placement.layoutElementId,
                                    "Placement references unknown layout object '" + placement.layoutElementId + "'");
            }
        }

        for (const auto& conn : doc.connections)
        {
            if (!doc.resources.contains(conn.fromResourceId))
                result.addError(IssueCategory::REFERENCE, "Connection", conn.identifier, conn.fromResourceId,
                                "Connection '" + conn.identifier + "' references unknown source resource '" +
                                    conn.fromResourceId + "'");
            if (!doc.resources.contains(conn.toResourceId))
                result.addError(IssueCategory::REFERENCE, "Connection", conn.identifier, conn.toResourceId,
                                "Connection '" + conn.identifier + "' references unknown target resource '" +
                                    conn.toResourceId + "'");
        }

        std::unordered_set<std::string> withLayout;
        for (const auto& lo : doc.layoutObjects)
            withLayout.insert(lo.associatedResourceId);

        for (const auto& res : doc.resources)
        {
            if (!withLayout.count(res.identifier))
                result.addWarning(IssueCategory::COVERAGE, "Resource", res.identifier, "",
                                  "Resource '" + res.identifier + "' has no associated layout object");
        }

        return result;
    }

} // namespace data
