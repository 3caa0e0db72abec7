#ifndef SVGDRAW_BRUSH_H
#define SVGDRAW_BRUSH_H

#include "transform.h"

#include <QColor>
#include <QGradient>
#include <QPointF>

class QBrush;

namespace svgdraw {

/*
 * Paint source: nothing, a solid colour or a linear/radial gradient.
 * Gradient geometry defaults follow the bounding box unit square, start (0,0),
 * end (1,1) for linear and center = origin = (0.5,0.5), radius 0.5 for radial.
 */
class Brush
{
public:
	enum class Type {
		None,
		Solid,
		LinearGradient,
		RadialGradient
	};

	Brush() {}
	explicit Brush(const QColor &color) : m_type(Type::Solid), m_color(color) {}

	static Brush linearGradient();
	static Brush radialGradient();

	Type type() const { return m_type; }
	bool isNone() const { return m_type == Type::None; }
	bool isSolid() const { return m_type == Type::Solid; }
	bool isGradient() const { return m_type == Type::LinearGradient || m_type == Type::RadialGradient; }
	bool isTransparent() const { return isSolid() && m_color.alpha() == 0; }

	QColor color() const { return m_color; }
	void setColor(const QColor &c) { m_color = c; }

	QPointF startPoint() const { return m_start; }
	void setStartPoint(const QPointF &p) { m_start = p; }
	QPointF endPoint() const { return m_end; }
	void setEndPoint(const QPointF &p) { m_end = p; }

	QPointF center() const { return m_center; }
	void setCenter(const QPointF &p) { m_center = p; }
	QPointF gradientOrigin() const { return m_origin; }
	void setGradientOrigin(const QPointF &p) { m_origin = p; }
	qreal radiusX() const { return m_radiusX; }
	void setRadiusX(qreal r) { m_radiusX = r; }
	qreal radiusY() const { return m_radiusY; }
	void setRadiusY(qreal r) { m_radiusY = r; }

	const QGradientStops &stops() const { return m_stops; }
	void setStops(const QGradientStops &stops) { m_stops = stops; }
	// offset is clamped to [0, 1]
	void addStop(qreal offset, const QColor &color);

	QGradient::Spread spread() const { return m_spread; }
	void setSpread(QGradient::Spread s) { m_spread = s; }
	// ObjectBoundingMode is relative to the painted shape, LogicalMode is absolute
	QGradient::CoordinateMode mappingMode() const { return m_mappingMode; }
	void setMappingMode(QGradient::CoordinateMode m) { m_mappingMode = m; }

	const Transform &transform() const { return m_transform; }
	void setTransform(const Transform &t) { m_transform = t; }

	QBrush toQBrush() const;

	bool operator==(const Brush &other) const;
	bool operator!=(const Brush &other) const { return !(*this == other); }
private:
	Type m_type = Type::None;
	QColor m_color;
	QPointF m_start = QPointF(0, 0);
	QPointF m_end = QPointF(1, 1);
	QPointF m_center = QPointF(0.5, 0.5);
	QPointF m_origin = QPointF(0.5, 0.5);
	qreal m_radiusX = 0.5;
	qreal m_radiusY = 0.5;
	QGradientStops m_stops;
	QGradient::Spread m_spread = QGradient::PadSpread;
	QGradient::CoordinateMode m_mappingMode = QGradient::ObjectBoundingMode;
	Transform m_transform;
};

// 'none' gives a transparent solid brush, throws FormatError on an unknown colour
Brush parseBrush(const QString &value);
QColor parseColor(const QString &value);

QColor applyOpacityToColor(const QColor &color, qreal opacity);
// solid colours and every gradient stop get their alpha scaled
Brush applyOpacityToBrush(const Brush &brush, qreal opacity);

// equality by resolved solid colour, gradients never match
bool sameColor(const Brush &a, const Brush &b);

}

#endif // SVGDRAW_BRUSH_H
