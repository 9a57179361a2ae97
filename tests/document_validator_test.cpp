#include <gtest/gtest.h>

#include "document_validator.hpp"

namespace
{

    data::Document makeDocument()
    {
        data::Document doc;
        doc.identifier = "doc-1";

        for (const char* id : {"A", "B", "C"})
        {
            data::Resource res;
            res.identifier = id;
            res.name       = id;
            doc.resources.put(id, res);

            data::LayoutObject lo;
            lo.identifier           = std::string("LO-") + id;
            lo.associatedResourceId = id;
            doc.layoutObjects.put(lo.identifier, lo);
        }

        doc.connections.push_back({"AB", "A", "B", ""});
        doc.connections.push_back({"BC", "B", "C", ""});

        data::Layout layout;
        layout.identifier = "main";
        data::Placement placement;
        placement.layoutElementId = "LO-A";
        layout.placements.put(placement.layoutElementId, placement);
        doc.layout = layout;
        return doc;
    }

} // namespace

TEST(DocumentValidator, AcceptsConsistentDocument)
{
    auto result = data::validateDocument(makeDocument());
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(result.warnings.empty());
}

TEST(DocumentValidator, UnknownConnectionEndpointIsSingleError)
{
    auto doc = makeDocument();
    doc.connections.push_back({"CX", "C", "X", ""});

    auto result = data::validateDocument(doc);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].category, data::IssueCategory::REFERENCE);
    EXPECT_EQ(result.errors[0].entityId, "CX");
    EXPECT_EQ(result.errors[0].referenceId, "X");
    EXPECT_NE(result.errors[0].message.find("CX"), std::string::npos);
}

TEST(DocumentValidator, ReportsDanglingLayoutReferences)
{
    auto doc = makeDocument();
    data::LayoutObject lo;
    lo.identifier           = "LO-Z";
    lo.associatedResourceId = "Z";
    doc.layoutObjects.put(lo.identifier, lo);

    data::Placement placement;
    placement.layoutElementId = "LO-MISSING";
    doc.layout->placements.put(placement.layoutElementId, placement);

    auto result = data::validateDocument(doc);
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].entityKind, "LayoutObject");
    EXPECT_EQ(result.errors[1].entityKind, "Placement");
}

TEST(DocumentValidator, EmptyDocumentFailsHeaderChecks)
{
    data::Document doc;
    auto           result = data::validateDocument(doc);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST(DocumentValidator, ResourceWithoutLayoutObjectIsWarning)
{
    auto           doc = makeDocument();
    data::Resource res;
    res.identifier = "D";
    doc.resources.put("D", res);

    auto result = data::validateDocument(doc);
    EXPECT_TRUE(result.isValid);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].category, data::IssueCategory::COVERAGE);
    EXPECT_EQ(result.warnings[0].entityId, "D");
}
