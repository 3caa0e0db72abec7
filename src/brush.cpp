#include "brush.h"

#include "errors.h"
#include "svgnames.h"

#include <QBrush>
#include <QLinearGradient>
#include <QRadialGradient>
#include <QStringList>

#include <algorithm>

namespace svgdraw {

Brush Brush::linearGradient()
{
	Brush ret;
	ret.m_type = Type::LinearGradient;
	return ret;
}

Brush Brush::radialGradient()
{
	Brush ret;
	ret.m_type = Type::RadialGradient;
	return ret;
}

void Brush::addStop(qreal offset, const QColor &color)
{
	m_stops.append(QGradientStop(qBound(qreal(0), offset, qreal(1)), color));
}

static QGradientStops sortedStops(QGradientStops stops)
{
	std::stable_sort(stops.begin(), stops.end(), [](const QGradientStop &a, const QGradientStop &b) {
		return a.first < b.first;
	});
	return stops;
}

QBrush Brush::toQBrush() const
{
	switch (m_type) {
	case Type::None:
		return QBrush(Qt::NoBrush);
	case Type::Solid:
		return QBrush(m_color);
	case Type::LinearGradient: {
		QLinearGradient gradient(m_start, m_end);
		gradient.setStops(sortedStops(m_stops));
		gradient.setSpread(m_spread);
		gradient.setCoordinateMode(m_mappingMode);
		QBrush ret(gradient);
		ret.setTransform(m_transform.toQTransform());
		return ret;
	}
	case Type::RadialGradient: {
		QRadialGradient gradient(m_center, m_radiusX, m_origin);
		gradient.setStops(sortedStops(m_stops));
		gradient.setSpread(m_spread);
		gradient.setCoordinateMode(m_mappingMode);
		QBrush ret(gradient);
		QTransform t;
		if(m_radiusX > 0 && !qFuzzyCompare(m_radiusX, m_radiusY)) {
			// QRadialGradient is circular, stretch it around the center
			t.translate(m_center.x(), m_center.y());
			t.scale(1, m_radiusY / m_radiusX);
			t.translate(-m_center.x(), -m_center.y());
		}
		ret.setTransform(t * m_transform.toQTransform());
		return ret;
	}
	}
	return QBrush();
}

bool Brush::operator==(const Brush &other) const
{
	if(m_type != other.m_type)
		return false;
	switch (m_type) {
	case Type::None:
		return true;
	case Type::Solid:
		return m_color == other.m_color;
	case Type::LinearGradient:
		if(m_start != other.m_start || m_end != other.m_end)
			return false;
		break;
	case Type::RadialGradient:
		if(m_center != other.m_center || m_origin != other.m_origin
				|| m_radiusX != other.m_radiusX || m_radiusY != other.m_radiusY)
			return false;
		break;
	}
	return m_stops == other.m_stops
			&& m_spread == other.m_spread
			&& m_mappingMode == other.m_mappingMode
			&& m_transform == other.m_transform;
}

static inline int hexDigit(char hex)
{
	if (hex >= '0' && hex <= '9')
		return hex - '0';
	if (hex >= 'a' && hex <= 'f')
		return hex - 'a' + 10;
	if (hex >= 'A' && hex <= 'F')
		return hex - 'A' + 10;
	return -1;
}

static inline int hexByte(const char *s)
{
	int hi = hexDigit(s[0]);
	int lo = hexDigit(s[1]);
	if(hi < 0 || lo < 0)
		return -1;
	return (hi << 4) | lo;
}

static inline int hexByte(char s)
{
	int h = hexDigit(s);
	if(h < 0)
		return -1;
	return (h << 4) | h;
}

static bool parseHexRgb(const QString &str, QRgb *rgb)
{
	const QByteArray latin = str.toLatin1();
	const char *name = latin.constData();
	if(name[0] != '#')
		return false;
	name++;
	int len = latin.length() - 1;
	int r, g, b;
	if (len == 12) {
		r = hexByte(name);
		g = hexByte(name + 4);
		b = hexByte(name + 8);
	} else if (len == 9) {
		r = hexByte(name);
		g = hexByte(name + 3);
		b = hexByte(name + 6);
	} else if (len == 6) {
		r = hexByte(name);
		g = hexByte(name + 2);
		b = hexByte(name + 4);
	} else if (len == 3) {
		r = hexByte(name[0]);
		g = hexByte(name[1]);
		b = hexByte(name[2]);
	} else {
		r = g = b = -1;
	}
	if ((uint)r > 255 || (uint)g > 255 || (uint)b > 255) {
		*rgb = 0;
		return false;
	}
	*rgb = qRgb(r, g ,b);
	return true;
}

// malformed components become 0, a wrong component count gives black
static QColor parseRgbFunction(const QString &str)
{
	int start = str.indexOf('(') + 1;
	int end = str.indexOf(')', start);
	if(end < 0)
		end = str.length();
	const QStringList parts = str.mid(start, end - start).split(',');
	if(start <= 0 || parts.count() != 3)
		return QColor(Qt::black);
	int rgb[3];
	for (int i = 0; i < 3; ++i) {
		bool ok;
		uint v = parts[i].trimmed().toUInt(&ok);
		rgb[i] = (ok && v <= 255)? int(v): 0;
	}
	return QColor(rgb[0], rgb[1], rgb[2]);
}

QColor parseColor(const QString &value)
{
	const QString color_str = value.trimmed();
	if(color_str.startsWith(names::none))
		return QColor(Qt::transparent);
	if(color_str.startsWith(names::rgb))
		return parseRgbFunction(color_str);
	if(color_str.startsWith('#')) {
		// #rrggbb is very very common, so let's tackle it here
		// rather than falling back to QColor
		QRgb rgb;
		if(parseHexRgb(color_str, &rgb))
			return QColor(rgb);
		throw FormatError(QStringLiteral("Invalid hex colour: %1").arg(color_str));
	}
	if(QColor::isValidColor(color_str))
		return QColor(color_str);
	throw FormatError(QStringLiteral("Unknown colour: %1").arg(color_str));
}

Brush parseBrush(const QString &value)
{
	return Brush(parseColor(value));
}

QColor applyOpacityToColor(const QColor &color, qreal opacity)
{
	if(opacity >= 1.0)
		return color;
	opacity = qBound(qreal(0), opacity, qreal(1));
	QColor ret = color;
	ret.setAlpha(qRound(color.alpha() * opacity));
	return ret;
}

Brush applyOpacityToBrush(const Brush &brush, qreal opacity)
{
	if(opacity >= 1.0)
		return brush;
	Brush ret = brush;
	if(ret.isSolid()) {
		ret.setColor(applyOpacityToColor(ret.color(), opacity));
	}
	else if(ret.isGradient()) {
		QGradientStops stops = ret.stops();
		for(QGradientStop &stop : stops)
			stop.second = applyOpacityToColor(stop.second, opacity);
		ret.setStops(stops);
	}
	return ret;
}

bool sameColor(const Brush &a, const Brush &b)
{
	return a.isSolid() && b.isSolid() && a.color().rgba() == b.color().rgba();
}

}
