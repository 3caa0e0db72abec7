#ifndef SVGDRAW_SHAPES_H
#define SVGDRAW_SHAPES_H

#include "brush.h"
#include "drawing.h"
#include "style.h"

#include <QString>

namespace svgdraw {

class DefinitionsRegistry;
class XmlElement;

struct ParserOptions
{
	// device pixels per 1/96 inch
	qreal pixelsPerDip = 1.0;
	QString defaultFontFamily = QStringLiteral("Arial");
	qreal defaultFontSize = 12;
};

// paint properties inherited from the enclosing <g> elements, always passed by value
struct GroupState
{
	QString stroke;
	bool hasStroke = false;
	qreal strokeWidth = 1;
	bool hasStrokeWidth = false;
	QString fill;
	bool hasFill = false;
	QString fillRule;
	bool hasFillRule = false;
	qreal opacity = 1;
};

class ElementContext
{
public:
	ElementContext(const XmlElement &element, const DefinitionsRegistry &registry,
				   const GroupState &inherited = GroupState(), const ParserOptions &options = ParserOptions())
		: m_element(element), m_registry(registry), m_inherited(inherited), m_options(options) {}

	const XmlElement &element() const { return m_element; }
	const DefinitionsRegistry &registry() const { return m_registry; }
	const GroupState &inherited() const { return m_inherited; }
	const ParserOptions &options() const { return m_options; }

	ElementContext withElement(const XmlElement &element) const { return ElementContext(element, m_registry, m_inherited, m_options); }
private:
	const XmlElement &m_element;
	const DefinitionsRegistry &m_registry;
	GroupState m_inherited;
	ParserOptions m_options;
};

DrawingNode parseRect(const ElementContext &ctx);
DrawingNode parseCircle(const ElementContext &ctx);
DrawingNode parseEllipse(const ElementContext &ctx);
DrawingNode parseLine(const ElementContext &ctx);
DrawingNode parsePolyline(const ElementContext &ctx);
DrawingNode parsePolygon(const ElementContext &ctx);
DrawingNode parsePath(const ElementContext &ctx);
DrawingNode parseText(const ElementContext &ctx);

Brush parseLinearGradient(const ElementContext &ctx);
Brush parseRadialGradient(const ElementContext &ctx);

bool isShapeElement(const QString &name);
bool isGradientElement(const QString &name);

// shared by the converters
// soft attribute parsing, a missing or malformed value gives default_value
qreal numberAttribute(const XmlElement &element, const QString &name, qreal default_value = 0, bool *ok = nullptr);
// fill source from the properties, the inherited fill or black, with the combined opacity applied
Brush resolveFill(const ElementContext &ctx, const PropertyMap &properties);
// Pen() when neither the element nor its groups set a stroke
Pen resolveStroke(const ElementContext &ctx, const PropertyMap &properties);

// dispatch by tag name, element must be a shape or text element
DrawingNode parseShape(const ElementContext &ctx);
// element must be a gradient element
Brush parseGradient(const ElementContext &ctx);

}

#endif // SVGDRAW_SHAPES_H
