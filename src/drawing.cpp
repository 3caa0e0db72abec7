#include "drawing.h"

#include <QPen>

namespace svgdraw {

QPen Pen::toQPen() const
{
	if(isNone())
		return QPen(Qt::NoPen);
	QPen ret(m_brush.toQBrush(), m_thickness, Qt::SolidLine, m_startCap, m_lineJoin);
	ret.setMiterLimit(m_miterLimit);
	if(!m_dashPattern.isEmpty()) {
		// QPen dashes are in units of the pen width
		QVector<qreal> pattern;
		for(qreal v : m_dashPattern)
			pattern << v / m_thickness;
		if(pattern.count() % 2)
			pattern += pattern;
		ret.setDashPattern(pattern);
		ret.setDashOffset(m_dashOffset / m_thickness);
	}
	return ret;
}

bool Pen::operator==(const Pen &other) const
{
	return m_brush == other.m_brush
			&& m_thickness == other.m_thickness
			&& m_startCap == other.m_startCap
			&& m_endCap == other.m_endCap
			&& m_lineJoin == other.m_lineJoin
			&& m_miterLimit == other.m_miterLimit
			&& m_dashPattern == other.m_dashPattern
			&& m_dashOffset == other.m_dashOffset;
}

Geometry Geometry::path(const QPainterPath &p)
{
	Geometry ret;
	ret.m_type = Type::Path;
	ret.m_path = p;
	return ret;
}

Geometry Geometry::rect(const QRectF &r, qreal rx, qreal ry)
{
	Geometry ret;
	ret.m_type = Type::Rect;
	ret.m_rect = r;
	ret.m_radiusX = rx;
	ret.m_radiusY = ry;
	return ret;
}

Geometry Geometry::ellipse(const QPointF &center, qreal rx, qreal ry)
{
	Geometry ret;
	ret.m_type = Type::Ellipse;
	ret.m_center = center;
	ret.m_radiusX = rx;
	ret.m_radiusY = ry;
	return ret;
}

Geometry Geometry::line(const QLineF &l)
{
	Geometry ret;
	ret.m_type = Type::Line;
	ret.m_line = l;
	return ret;
}

void Geometry::setPath(const QPainterPath &p)
{
	Qt::FillRule rule = m_path.fillRule();
	m_path = p;
	m_path.setFillRule(rule);
}

QPainterPath Geometry::toPainterPath() const
{
	QPainterPath ret;
	switch (m_type) {
	case Type::None:
		break;
	case Type::Path:
		ret = m_path;
		break;
	case Type::Rect:
		if(m_radiusX > 0 || m_radiusY > 0)
			ret.addRoundedRect(m_rect, m_radiusX, m_radiusY);
		else
			ret.addRect(m_rect);
		break;
	case Type::Ellipse:
		ret.addEllipse(m_center, m_radiusX, m_radiusY);
		break;
	case Type::Line:
		ret.moveTo(m_line.p1());
		ret.lineTo(m_line.p2());
		break;
	}
	return ret;
}

bool Geometry::operator==(const Geometry &other) const
{
	return m_type == other.m_type
			&& m_path == other.m_path
			&& m_rect == other.m_rect
			&& m_center == other.m_center
			&& m_radiusX == other.m_radiusX
			&& m_radiusY == other.m_radiusY
			&& m_line == other.m_line
			&& m_transform == other.m_transform;
}

qreal TextRun::width() const
{
	qreal ret = 0;
	for(qreal a : m_advances)
		ret += a;
	return ret;
}

bool TextRun::operator==(const TextRun &other) const
{
	return m_text == other.m_text
			&& m_font == other.m_font
			&& m_fontSize == other.m_fontSize
			&& m_baselineOrigin == other.m_baselineOrigin
			&& m_pixelsPerDip == other.m_pixelsPerDip
			&& m_glyphRun == other.m_glyphRun
			&& m_advances == other.m_advances
			&& m_foreground == other.m_foreground;
}

class DrawingNodeData : public QSharedData
{
public:
	DrawingNode::Type type = DrawingNode::Type::Group;
	Transform transform;
	QVector<DrawingNode> children;
	Geometry geometry;
	Brush fill;
	Pen stroke;
	TextRun textRun;
};

DrawingNode::DrawingNode()
	: d(new DrawingNodeData)
{
}

DrawingNode::DrawingNode(const DrawingNode &other) = default;
DrawingNode &DrawingNode::operator=(const DrawingNode &other) = default;
DrawingNode::~DrawingNode() = default;

DrawingNode DrawingNode::group(const Transform &transform)
{
	DrawingNode ret;
	ret.d->transform = transform;
	return ret;
}

DrawingNode DrawingNode::shape(const Geometry &geometry, const Brush &fill, const Pen &stroke)
{
	DrawingNode ret;
	ret.d->type = Type::Shape;
	ret.d->geometry = geometry;
	ret.d->fill = fill;
	ret.d->stroke = stroke;
	return ret;
}

DrawingNode DrawingNode::text(const TextRun &run)
{
	DrawingNode ret;
	ret.d->type = Type::Text;
	ret.d->textRun = run;
	return ret;
}

DrawingNode::Type DrawingNode::type() const
{
	return d->type;
}

const Transform &DrawingNode::transform() const
{
	return d->transform;
}

void DrawingNode::setTransform(const Transform &t)
{
	d->transform = t;
}

const QVector<DrawingNode> &DrawingNode::children() const
{
	return d->children;
}

DrawingNode &DrawingNode::childRef(int ix)
{
	return d->children[ix];
}

void DrawingNode::appendChild(const DrawingNode &child)
{
	d->children.append(child);
}

const Geometry &DrawingNode::geometry() const
{
	return d->geometry;
}

void DrawingNode::setGeometry(const Geometry &g)
{
	d->geometry = g;
}

const Brush &DrawingNode::fill() const
{
	return d->fill;
}

void DrawingNode::setFill(const Brush &b)
{
	d->fill = b;
}

const Pen &DrawingNode::stroke() const
{
	return d->stroke;
}

void DrawingNode::setStroke(const Pen &p)
{
	d->stroke = p;
}

const TextRun &DrawingNode::textRun() const
{
	return d->textRun;
}

void DrawingNode::setTextRun(const TextRun &r)
{
	d->textRun = r;
}

bool DrawingNode::operator==(const DrawingNode &other) const
{
	if(d == other.d)
		return true;
	return d->type == other.d->type
			&& d->transform == other.d->transform
			&& d->children == other.d->children
			&& d->geometry == other.d->geometry
			&& d->fill == other.d->fill
			&& d->stroke == other.d->stroke
			&& d->textRun == other.d->textRun;
}

}
