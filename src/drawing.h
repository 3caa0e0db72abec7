#ifndef SVGDRAW_DRAWING_H
#define SVGDRAW_DRAWING_H

#include "brush.h"
#include "transform.h"

#include <QFont>
#include <QGlyphRun>
#include <QLineF>
#include <QPainterPath>
#include <QRectF>
#include <QSharedDataPointer>
#include <QVector>

class QPen;

namespace svgdraw {

class Pen
{
public:
	Pen() {}
	Pen(const Brush &brush, qreal thickness) : m_brush(brush) { setThickness(thickness); }

	// a pen without brush strokes nothing
	bool isNone() const { return m_brush.isNone(); }

	const Brush &brush() const { return m_brush; }
	void setBrush(const Brush &b) { m_brush = b; }
	qreal thickness() const { return m_thickness; }
	void setThickness(qreal t) { m_thickness = t > 0? t: 1; }
	Qt::PenCapStyle startCap() const { return m_startCap; }
	void setStartCap(Qt::PenCapStyle c) { m_startCap = c; }
	Qt::PenCapStyle endCap() const { return m_endCap; }
	void setEndCap(Qt::PenCapStyle c) { m_endCap = c; }
	void setLineCap(Qt::PenCapStyle c) { m_startCap = m_endCap = c; }
	Qt::PenJoinStyle lineJoin() const { return m_lineJoin; }
	void setLineJoin(Qt::PenJoinStyle j) { m_lineJoin = j; }
	qreal miterLimit() const { return m_miterLimit; }
	void setMiterLimit(qreal l) { m_miterLimit = qMax(qreal(1), l); }
	const QVector<qreal> &dashPattern() const { return m_dashPattern; }
	void setDashPattern(const QVector<qreal> &p) { m_dashPattern = p; }
	qreal dashOffset() const { return m_dashOffset; }
	void setDashOffset(qreal o) { m_dashOffset = o; }

	QPen toQPen() const;

	bool operator==(const Pen &other) const;
	bool operator!=(const Pen &other) const { return !(*this == other); }
private:
	Brush m_brush;
	qreal m_thickness = 1;
	Qt::PenCapStyle m_startCap = Qt::FlatCap;
	Qt::PenCapStyle m_endCap = Qt::FlatCap;
	Qt::PenJoinStyle m_lineJoin = Qt::MiterJoin;
	qreal m_miterLimit = 4;
	QVector<qreal> m_dashPattern;
	qreal m_dashOffset = 0;
};

class Geometry
{
public:
	enum class Type {
		None,
		Path,
		Rect,
		Ellipse,
		Line
	};

	Geometry() {}

	static Geometry path(const QPainterPath &p = QPainterPath());
	static Geometry rect(const QRectF &r = QRectF(), qreal rx = 0, qreal ry = 0);
	static Geometry ellipse(const QPointF &center = QPointF(), qreal rx = 0, qreal ry = 0);
	static Geometry line(const QLineF &l = QLineF());

	Type type() const { return m_type; }

	const QPainterPath &path() const { return m_path; }
	void setPath(const QPainterPath &p);
	Qt::FillRule fillRule() const { return m_path.fillRule(); }
	void setFillRule(Qt::FillRule r) { m_path.setFillRule(r); }

	QRectF rect() const { return m_rect; }
	void setRect(const QRectF &r) { m_rect = r; }
	QPointF center() const { return m_center; }
	void setCenter(const QPointF &c) { m_center = c; }
	// rect corner radii or ellipse radii
	qreal radiusX() const { return m_radiusX; }
	void setRadiusX(qreal r) { m_radiusX = r; }
	qreal radiusY() const { return m_radiusY; }
	void setRadiusY(qreal r) { m_radiusY = r; }
	QLineF line() const { return m_line; }
	void setLine(const QLineF &l) { m_line = l; }

	const Transform &transform() const { return m_transform; }
	void setTransform(const Transform &t) { m_transform = t; }

	// outline in local coordinates, the transform is not applied
	QPainterPath toPainterPath() const;
	QRectF bounds() const { return toPainterPath().boundingRect(); }

	bool operator==(const Geometry &other) const;
	bool operator!=(const Geometry &other) const { return !(*this == other); }
private:
	Type m_type = Type::None;
	QPainterPath m_path;
	QRectF m_rect;
	QPointF m_center;
	qreal m_radiusX = 0;
	qreal m_radiusY = 0;
	QLineF m_line;
	Transform m_transform;
};

// single baseline run of positioned glyphs
class TextRun
{
public:
	TextRun() {}

	QString text() const { return m_text; }
	void setText(const QString &t) { m_text = t; }
	QFont font() const { return m_font; }
	void setFont(const QFont &f) { m_font = f; }
	qreal fontSize() const { return m_fontSize; }
	void setFontSize(qreal s) { m_fontSize = s; }
	QPointF baselineOrigin() const { return m_baselineOrigin; }
	void setBaselineOrigin(const QPointF &p) { m_baselineOrigin = p; }
	qreal pixelsPerDip() const { return m_pixelsPerDip; }
	void setPixelsPerDip(qreal p) { m_pixelsPerDip = p; }

	// empty when no font face could be resolved
	const QGlyphRun &glyphRun() const { return m_glyphRun; }
	void setGlyphRun(const QGlyphRun &r) { m_glyphRun = r; }
	const QVector<qreal> &advances() const { return m_advances; }
	void setAdvances(const QVector<qreal> &a) { m_advances = a; }
	qreal width() const;

	const Brush &foreground() const { return m_foreground; }
	void setForeground(const Brush &b) { m_foreground = b; }

	bool operator==(const TextRun &other) const;
private:
	QString m_text;
	QFont m_font;
	qreal m_fontSize = 12;
	QPointF m_baselineOrigin;
	qreal m_pixelsPerDip = 1;
	QGlyphRun m_glyphRun;
	QVector<qreal> m_advances;
	Brush m_foreground;
};

class DrawingNodeData;

/*
 * Node of the immutable drawing tree. Copies are cheap and share data until
 * one of them is modified, a modified copy never affects the others.
 */
class DrawingNode
{
public:
	enum class Type {
		Group,
		Shape,
		Text
	};

	// empty group
	DrawingNode();
	DrawingNode(const DrawingNode &other);
	DrawingNode &operator=(const DrawingNode &other);
	~DrawingNode();

	static DrawingNode group(const Transform &transform = Transform());
	static DrawingNode shape(const Geometry &geometry, const Brush &fill = Brush(), const Pen &stroke = Pen());
	static DrawingNode text(const TextRun &run);

	Type type() const;
	bool isGroup() const { return type() == Type::Group; }
	bool isShape() const { return type() == Type::Shape; }
	bool isText() const { return type() == Type::Text; }

	// group
	const Transform &transform() const;
	void setTransform(const Transform &t);
	const QVector<DrawingNode> &children() const;
	int childCount() const { return children().count(); }
	const DrawingNode &childAt(int ix) const { return children().at(ix); }
	DrawingNode &childRef(int ix);
	void appendChild(const DrawingNode &child);

	// shape
	const Geometry &geometry() const;
	void setGeometry(const Geometry &g);
	const Brush &fill() const;
	void setFill(const Brush &b);
	const Pen &stroke() const;
	void setStroke(const Pen &p);

	// text
	const TextRun &textRun() const;
	void setTextRun(const TextRun &r);

	bool operator==(const DrawingNode &other) const;
	bool operator!=(const DrawingNode &other) const { return !(*this == other); }
private:
	QSharedDataPointer<DrawingNodeData> d;
};

typedef DrawingNode DrawingTree;

}

#endif // SVGDRAW_DRAWING_H
