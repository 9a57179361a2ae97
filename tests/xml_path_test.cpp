#include <gtest/gtest.h>

#include "config_manager.hpp"
#include "xml_path.hpp"

#include <tinyxml2.h>

namespace
{

    const char* kDoc = "<Root xmlns:c=\"urn:c\">"
                       "  <c:Header><c:Id> H-1 </c:Id></c:Header>"
                       "  <Data>"
                       "    <Item key=\"a\"><Name>first</Name></Item>"
                       "    <Group><Item key=\"b\"><Name>second</Name></Item></Group>"
                       "    <Item key=\"c\"><Name>   </Name></Item>"
                       "  </Data>"
                       "</Root>";

    struct Fixture
    {
        tinyxml2::XMLDocument doc;
        const tinyxml2::XMLElement* root{nullptr};

        Fixture()
        {
            EXPECT_EQ(doc.Parse(kDoc), tinyxml2::XML_SUCCESS);
            root = doc.RootElement();
        }
    };

} // namespace

TEST(XmlPath, SelectsDirectChildrenOnly)
{
    Fixture f;
    auto    items = parser::XmlPath("Data/Item").selectAll(f.root);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_STREQ(items[0]->Attribute("key"), "a");
    EXPECT_STREQ(items[1]->Attribute("key"), "c");
}

TEST(XmlPath, SelectsDescendantsInDocumentOrder)
{
    Fixture f;
    auto    items = parser::XmlPath(".//Item").selectAll(f.root);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_STREQ(items[0]->Attribute("key"), "a");
    EXPECT_STREQ(items[1]->Attribute("key"), "b");
    EXPECT_STREQ(items[2]->Attribute("key"), "c");
}

TEST(XmlPath, WildcardNamespaceMatchesPrefixedNames)
{
    Fixture f;
    EXPECT_EQ(parser::XmlPath(".//{*}Header/{*}Id").text(f.root).value_or(""), "H-1");
    EXPECT_FALSE(parser::XmlPath(".//Header").selectFirst(f.root));
    EXPECT_TRUE(parser::XmlPath(".//c:Header").selectFirst(f.root));
}

TEST(XmlPath, ReadsAttributesAndTrimsText)
{
    Fixture f;
    auto*   item = parser::XmlPath(".//Group/Item").selectFirst(f.root);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(parser::XmlPath("@key").text(item).value_or(""), "b");
    EXPECT_EQ(parser::XmlPath("Name").text(item).value_or(""), "second");
    EXPECT_FALSE(parser::XmlPath("@missing").text(item).has_value());
}

TEST(XmlPath, BlankOrMissingTextIsAbsent)
{
    Fixture f;
    auto    items = parser::XmlPath("Data/Item").selectAll(f.root);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_FALSE(parser::XmlPath("Name").text(items[1]).has_value());
    EXPECT_FALSE(parser::XmlPath("Nope").text(items[0]).has_value());
    EXPECT_FALSE(parser::XmlPath().text(items[0]).has_value());
}

TEST(XmlPath, AnyElementStep)
{
    Fixture f;
    auto    children = parser::XmlPath("Data/*").selectAll(f.root);
    EXPECT_EQ(children.size(), 3u);
}

TEST(XmlPath, RejectsAttributeBeforeLastStep)
{
    EXPECT_THROW(parser::XmlPath("@key/Name"), config::ConfigError);
    EXPECT_THROW(parser::XmlPath("{urn:c"), config::ConfigError);
}
