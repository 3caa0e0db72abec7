#include "errors.h"
#include "xmlelement.h"

#include <QByteArray>

#include <gtest/gtest.h>

using namespace svgdraw;

TEST(XmlElement, ParsesTree)
{
	XmlElement root = XmlElement::parse(
				"<?xml version='1.0'?>"
				"<svg xmlns='http://www.w3.org/2000/svg' width='10'>"
				"<g id='a'><rect x='1'/></g>"
				"<circle r='2'/>"
				"</svg>");
	EXPECT_EQ(root.name(), QStringLiteral("svg"));
	EXPECT_EQ(root.attribute("width"), QStringLiteral("10"));
	EXPECT_FALSE(root.hasAttribute("xmlns"));
	ASSERT_EQ(root.children().count(), 2);
	EXPECT_EQ(root.children()[0].name(), QStringLiteral("g"));
	ASSERT_EQ(root.children()[0].children().count(), 1);
	EXPECT_EQ(root.children()[0].children()[0].attribute("x"), QStringLiteral("1"));
	EXPECT_EQ(root.children()[1].name(), QStringLiteral("circle"));
}

TEST(XmlElement, PrefixesAreStripped)
{
	XmlElement root = XmlElement::parse(
				"<svg:svg xmlns:svg='http://www.w3.org/2000/svg' xmlns:xlink='http://www.w3.org/1999/xlink'>"
				"<svg:linearGradient xlink:href='#base'/>"
				"</svg:svg>");
	EXPECT_EQ(root.name(), QStringLiteral("svg"));
	ASSERT_EQ(root.children().count(), 1);
	EXPECT_EQ(root.children()[0].name(), QStringLiteral("linearGradient"));
	EXPECT_EQ(root.children()[0].attribute("href"), QStringLiteral("#base"));
}

TEST(XmlElement, TextIsSimplified)
{
	XmlElement root = XmlElement::parse("<svg><text>  Hello\n  <tspan>big</tspan> world </text></svg>");
	ASSERT_EQ(root.children().count(), 1);
	EXPECT_EQ(root.children()[0].text(), QStringLiteral("Hello big world"));
}

TEST(XmlElement, MalformedXmlThrows)
{
	EXPECT_THROW(XmlElement::parse("<svg><g></svg>"), InvalidDocumentError);
	EXPECT_THROW(XmlElement::parse(""), InvalidDocumentError);
	EXPECT_THROW(XmlElement::parse("<?xml version='1.0'?>"), InvalidDocumentError);
}
