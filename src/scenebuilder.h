#ifndef SVGDRAW_SCENEBUILDER_H
#define SVGDRAW_SCENEBUILDER_H

#include "drawing.h"

class QGraphicsScene;
class QGraphicsItem;
class QAbstractGraphicsShapeItem;

namespace svgdraw {

// renders a drawing tree as QGraphicsItems, the tree is not modified
class SceneBuilder
{
public:
	explicit SceneBuilder(QGraphicsScene *scene);

	// returns the item created for the tree root, it is owned by the scene
	QGraphicsItem *build(const DrawingTree &tree);
private:
	void addNode(const DrawingNode &node);
	void addGroup(const DrawingNode &node);
	void addShape(const DrawingNode &node);
	void addText(const DrawingNode &node);
	void setStyle(QAbstractGraphicsShapeItem *it, const DrawingNode &node);
	void addItem(QGraphicsItem *it);
private:
	QGraphicsScene *m_scene;
	QGraphicsItem *m_topLevelItem = nullptr;
	QGraphicsItem *m_rootItem = nullptr;
};

}

#endif // SVGDRAW_SCENEBUILDER_H
