#include "scenebuilder.h"

#include "log.h"

#include <QBrush>
#include <QFontMetricsF>
#include <QGraphicsItem>
#include <QGraphicsScene>
#include <QPen>

namespace svgdraw {

SceneBuilder::SceneBuilder(QGraphicsScene *scene)
	: m_scene(scene)
{
}

QGraphicsItem *SceneBuilder::build(const DrawingTree &tree)
{
	m_topLevelItem = nullptr;
	m_rootItem = nullptr;
	addNode(tree);
	logSvgI() << "scene items:" << m_scene->items().count();
	return m_rootItem;
}

void SceneBuilder::addNode(const DrawingNode &node)
{
	switch (node.type()) {
	case DrawingNode::Type::Group:
		addGroup(node);
		break;
	case DrawingNode::Type::Shape:
		addShape(node);
		break;
	case DrawingNode::Type::Text:
		addText(node);
		break;
	}
}

void SceneBuilder::addGroup(const DrawingNode &node)
{
	auto *g = new QGraphicsRectItem();
	g->setPen(Qt::NoPen);
	if(!node.transform().isIdentity())
		g->setTransform(node.transform().toQTransform());
	addItem(g);
	m_topLevelItem = g;
	for(const DrawingNode &child : node.children())
		addNode(child);
	m_topLevelItem = g->parentItem();
}

void SceneBuilder::setStyle(QAbstractGraphicsShapeItem *it, const DrawingNode &node)
{
	const Geometry &geometry = node.geometry();
	QBrush brush = node.fill().toQBrush();
	if(node.fill().isGradient() && !geometry.transform().isIdentity()) {
		// the item transform already moves the gradient with the shape
		brush.setTransform(brush.transform() * geometry.transform().toQTransform().inverted());
	}
	it->setBrush(brush);
	it->setPen(node.stroke().toQPen());
}

void SceneBuilder::addShape(const DrawingNode &node)
{
	const Geometry &geometry = node.geometry();
	QGraphicsItem *item = nullptr;
	switch (geometry.type()) {
	case Geometry::Type::Rect:
		if(geometry.radiusX() <= 0 && geometry.radiusY() <= 0) {
			auto *rect = new QGraphicsRectItem(geometry.rect());
			setStyle(rect, node);
			item = rect;
			break;
		}
		// rounded corners need a path
		/* Falls through. */
	case Geometry::Type::Path:
	case Geometry::Type::None: {
		auto *path = new QGraphicsPathItem(geometry.toPainterPath());
		setStyle(path, node);
		item = path;
		break;
	}
	case Geometry::Type::Ellipse: {
		QRectF r(0, 0, 2 * geometry.radiusX(), 2 * geometry.radiusY());
		r.moveCenter(geometry.center());
		auto *ellipse = new QGraphicsEllipseItem(r);
		setStyle(ellipse, node);
		item = ellipse;
		break;
	}
	case Geometry::Type::Line: {
		auto *line = new QGraphicsLineItem(geometry.line());
		line->setPen(node.stroke().toQPen());
		item = line;
		break;
	}
	}
	if(!geometry.transform().isIdentity())
		item->setTransform(geometry.transform().toQTransform());
	addItem(item);
}

void SceneBuilder::addText(const DrawingNode &node)
{
	const TextRun &run = node.textRun();
	auto *text = new QGraphicsSimpleTextItem(run.text());
	text->setFont(run.font());
	text->setBrush(run.foreground().toQBrush());
	text->setPen(Qt::NoPen);
	// item position is its top left corner, the run is anchored at the baseline
	QFontMetricsF fm(run.font());
	text->setPos(run.baselineOrigin() - QPointF(0, fm.ascent()));
	addItem(text);
}

void SceneBuilder::addItem(QGraphicsItem *it)
{
	if(!m_topLevelItem) {
		m_scene->addItem(it);
		if(!m_rootItem)
			m_rootItem = it;
	}
	else {
		it->setParentItem(m_topLevelItem);
	}
}

}
