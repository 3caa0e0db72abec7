#include "errors.h"
#include "svgimage.h"

#include <QBuffer>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace svgdraw;

namespace {

const QByteArray document =
		"<svg>"
		"<rect width='1' height='1' fill='red' fill-opacity='0.5' stroke='red' stroke-width='3' stroke-linecap='round'/>"
		"<g><circle r='2' fill='#ff0000'/><circle r='2' fill='blue'/></g>"
		"</svg>";

class StaticResolver : public ResourceResolver
{
public:
	explicit StaticResolver(const QByteArray &data) : m_data(data) {}
	QByteArray fetch(const QUrl &url) override
	{
		m_lastUrl = url;
		return m_data;
	}
	QUrl lastUrl() const { return m_lastUrl; }
private:
	QByteArray m_data;
	QUrl m_lastUrl;
};

const Brush red(QColor(Qt::red));
const Brush green(QColor(0, 128, 0));

}

TEST(SvgImage, FromDataErrors)
{
	EXPECT_THROW(SvgImage::fromData(QByteArray()), EmptyInputError);
	EXPECT_THROW(SvgImage::fromData("<notsvg/>"), InvalidDocumentError);
	EXPECT_TRUE(SvgImage().isNull());
	EXPECT_FALSE(SvgImage::fromData(document).isNull());
}

TEST(SvgImage, FromDevice)
{
	EXPECT_THROW(SvgImage::fromDevice(nullptr), EmptyInputError);
	QBuffer empty;
	EXPECT_THROW(SvgImage::fromDevice(&empty), EmptyInputError);
	QByteArray data = document;
	QBuffer buffer(&data);
	SvgImage image = SvgImage::fromDevice(&buffer);
	EXPECT_EQ(image.drawing().childCount(), 2);
}

TEST(SvgImage, FromFile)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const QString path = dir.filePath("image.svg");
	{
		QFile f(path);
		ASSERT_TRUE(f.open(QIODevice::WriteOnly));
		f.write(document);
	}
	SvgImage image = SvgImage::fromFile(path);
	EXPECT_EQ(image.drawing().childCount(), 2);
	EXPECT_EQ(image.sourceUrl(), QUrl::fromLocalFile(path));
	EXPECT_THROW(SvgImage::fromFile(dir.filePath("missing.svg")), ResourceError);

	FileResourceResolver resolver;
	SvgImage by_url = SvgImage::fromUrl(QUrl::fromLocalFile(path), resolver);
	EXPECT_EQ(by_url.drawing(), image.drawing());
	EXPECT_THROW(resolver.fetch(QUrl("http://example.com/a.svg")), ResourceError);
}

TEST(SvgImage, FromUrlUsesResolver)
{
	StaticResolver resolver(document);
	const QUrl url("mem:/doc.svg");
	SvgImage image = SvgImage::fromUrl(url, resolver);
	EXPECT_EQ(resolver.lastUrl(), url);
	EXPECT_EQ(image.sourceUrl(), url);
	EXPECT_EQ(image.drawing().childCount(), 2);

	StaticResolver empty_resolver{QByteArray()};
	EXPECT_THROW(SvgImage::fromUrl(url, empty_resolver), EmptyInputError);
}

TEST(SvgImage, ReplaceFillMatchesByColor)
{
	DrawingTree tree = SvgImage::fromData(document).drawing();
	DrawingTree replaced = replaceFillBrush(tree, red, green);
	EXPECT_EQ(replaced.childAt(1).childAt(0).fill(), green);
	EXPECT_EQ(replaced.childAt(1).childAt(1).fill(), Brush(QColor(Qt::blue)));
	// half transparent red is another colour
	EXPECT_EQ(replaced.childAt(0).fill().color(), QColor(255, 0, 0, 128));

	// input tree is left untouched
	EXPECT_EQ(tree.childAt(1).childAt(0).fill(), red);
	EXPECT_NE(tree, replaced);
}

TEST(SvgImage, ReplaceFillKeepsOpacity)
{
	DrawingTree tree = SvgImage::fromData(document).drawing();
	DrawingTree replaced = replaceFillBrush(tree, Brush(QColor(255, 0, 0, 128)), green);
	const Brush &rect_fill = replaced.childAt(0).fill();
	EXPECT_EQ(rect_fill.color().rgb(), QColor(0, 128, 0).rgb());
	EXPECT_EQ(rect_fill.color().alpha(), 128);
	EXPECT_EQ(replaced.childAt(1).childAt(0).fill(), red);
}

TEST(SvgImage, ReplaceStrokeKeepsPen)
{
	DrawingTree tree = SvgImage::fromData(document).drawing();
	DrawingTree replaced = replaceStrokeBrush(tree, red, green);
	const Pen &pen = replaced.childAt(0).stroke();
	EXPECT_EQ(pen.brush(), green);
	EXPECT_EQ(pen.thickness(), 3);
	EXPECT_EQ(pen.startCap(), Qt::RoundCap);
	// fills are a different property
	EXPECT_EQ(replaced.childAt(1).childAt(0).fill(), red);
	EXPECT_EQ(tree.childAt(0).stroke().brush(), red);
}

TEST(SvgImage, NoMatchLeavesTreeEqual)
{
	DrawingTree tree = SvgImage::fromData(document).drawing();
	EXPECT_EQ(replaceFillBrush(tree, Brush(QColor(1, 2, 3)), green), tree);
}

TEST(SvgImage, EditSession)
{
	SvgImage image = SvgImage::fromData(document);
	const DrawingTree original = image.drawing();
	image.beginEdit();
	EXPECT_TRUE(image.isEditing());
	EXPECT_THROW(image.beginEdit(), InvalidOperationError);
	image.replaceFillBrush(red, green);
	// the published tree does not change until the session ends
	EXPECT_EQ(image.drawing(), original);
	image.endEdit();
	EXPECT_FALSE(image.isEditing());
	EXPECT_EQ(image.drawing().childAt(1).childAt(0).fill(), green);
	EXPECT_THROW(image.endEdit(), InvalidOperationError);
}

TEST(SvgImage, ReplaceWithoutSessionAndReset)
{
	SvgImage image = SvgImage::fromData(document);
	const DrawingTree original = image.drawing();
	image.replaceStrokeBrush(red, green);
	EXPECT_EQ(image.drawing().childAt(0).stroke().brush(), green);
	image.beginEdit();
	image.replaceFillBrush(red, green);
	image.reset();
	EXPECT_FALSE(image.isEditing());
	EXPECT_EQ(image.drawing(), original);
	EXPECT_THROW(SvgImage().reset(), InvalidOperationError);
}
