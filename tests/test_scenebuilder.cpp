#include "scenebuilder.h"
#include "svghandler.h"

#include <QGraphicsItem>
#include <QGraphicsScene>
#include <QPen>

#include <gtest/gtest.h>

using namespace svgdraw;

namespace {

DrawingTree load(const QByteArray &xml)
{
	SvgHandler handler;
	return handler.load(xml);
}

}

TEST(SceneBuilder, BuildsItemHierarchy)
{
	QGraphicsScene scene;
	DrawingTree tree = load("<svg>"
							"<rect x='1' y='2' width='3' height='4' fill='red'/>"
							"<g transform='translate(10,0)'><circle cx='5' cy='5' r='2'/><line x2='4' stroke='blue'/></g>"
							"</svg>");
	SceneBuilder builder(&scene);
	QGraphicsItem *root = builder.build(tree);
	ASSERT_NE(root, nullptr);
	EXPECT_EQ(root->parentItem(), nullptr);
	ASSERT_EQ(root->childItems().count(), 2);
	EXPECT_EQ(scene.items().count(), 5);

	auto *rect = qgraphicsitem_cast<QGraphicsRectItem *>(root->childItems().at(0));
	ASSERT_NE(rect, nullptr);
	EXPECT_EQ(rect->rect(), QRectF(1, 2, 3, 4));
	EXPECT_EQ(rect->brush().color(), QColor(Qt::red));
	EXPECT_EQ(rect->pen().style(), Qt::NoPen);

	QGraphicsItem *group = root->childItems().at(1);
	EXPECT_EQ(group->transform(), QTransform::fromTranslate(10, 0));
	ASSERT_EQ(group->childItems().count(), 2);
	auto *ellipse = qgraphicsitem_cast<QGraphicsEllipseItem *>(group->childItems().at(0));
	ASSERT_NE(ellipse, nullptr);
	EXPECT_EQ(ellipse->rect(), QRectF(3, 3, 4, 4));
	auto *line = qgraphicsitem_cast<QGraphicsLineItem *>(group->childItems().at(1));
	ASSERT_NE(line, nullptr);
	EXPECT_EQ(line->pen().color(), QColor(Qt::blue));
}

TEST(SceneBuilder, RoundedRectAndPathBecomePathItems)
{
	QGraphicsScene scene;
	DrawingTree tree = load("<svg><rect width='10' height='10' rx='2'/><path d='M0,0 L5,5' transform='scale(2)'/></svg>");
	QGraphicsItem *root = SceneBuilder(&scene).build(tree);
	ASSERT_EQ(root->childItems().count(), 2);
	EXPECT_NE(qgraphicsitem_cast<QGraphicsPathItem *>(root->childItems().at(0)), nullptr);
	QGraphicsItem *path = root->childItems().at(1);
	EXPECT_NE(qgraphicsitem_cast<QGraphicsPathItem *>(path), nullptr);
	EXPECT_EQ(path->transform(), QTransform::fromScale(2, 2));
}

TEST(SceneBuilder, TextItem)
{
	QGraphicsScene scene;
	DrawingTree tree = load("<svg><text x='3' y='20' fill='blue'>label</text></svg>");
	QGraphicsItem *root = SceneBuilder(&scene).build(tree);
	ASSERT_EQ(root->childItems().count(), 1);
	auto *text = qgraphicsitem_cast<QGraphicsSimpleTextItem *>(root->childItems().at(0));
	ASSERT_NE(text, nullptr);
	EXPECT_EQ(text->text(), QStringLiteral("label"));
	EXPECT_EQ(text->brush().color(), QColor(Qt::blue));
	EXPECT_EQ(text->pos().x(), 3);
	EXPECT_LE(text->pos().y(), 20);
}

TEST(SceneBuilder, TreeIsNotModified)
{
	QGraphicsScene scene;
	DrawingTree tree = load("<svg><g opacity='0.5'><rect width='1' height='1'/></g></svg>");
	const DrawingTree copy = tree;
	SceneBuilder(&scene).build(tree);
	EXPECT_EQ(tree, copy);
}
