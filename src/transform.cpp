#include "transform.h"

#include "errors.h"
#include "log.h"
#include "numbers.h"
#include "svgnames.h"

#include <QRegExp>
#include <QStringList>
#include <QtMath>

namespace svgdraw {

class TransformData : public QSharedData
{
public:
	Transform::Type type = Transform::Type::Identity;
	QVector<qreal> parameters;
	QVector<Transform> children;
};

Transform::Transform()
	: d(new TransformData)
{
}

Transform::Transform(const Transform &other) = default;
Transform &Transform::operator=(const Transform &other) = default;
Transform::~Transform() = default;

Transform Transform::primitive(Type type, const QVector<qreal> &params)
{
	Transform ret;
	ret.d->type = type;
	ret.d->parameters = params;
	return ret;
}

Transform Transform::translate(qreal dx, qreal dy)
{
	return primitive(Type::Translate, QVector<qreal>{dx, dy});
}

Transform Transform::scale(qreal sx, qreal sy)
{
	return primitive(Type::Scale, QVector<qreal>{sx, sy});
}

Transform Transform::rotate(qreal angle)
{
	return primitive(Type::Rotate, QVector<qreal>{angle});
}

Transform Transform::skewX(qreal angle)
{
	return primitive(Type::SkewX, QVector<qreal>{angle});
}

Transform Transform::skewY(qreal angle)
{
	return primitive(Type::SkewY, QVector<qreal>{angle});
}

Transform Transform::matrix(qreal a, qreal b, qreal c, qreal d, qreal e, qreal f)
{
	return primitive(Type::Matrix, QVector<qreal>{a, b, c, d, e, f});
}

Transform Transform::group(const QVector<Transform> &children)
{
	Transform ret;
	ret.d->type = Type::Group;
	ret.d->children = children;
	return ret;
}

Transform::Type Transform::type() const
{
	return d->type;
}

const QVector<qreal> &Transform::parameters() const
{
	return d->parameters;
}

const QVector<Transform> &Transform::children() const
{
	return d->children;
}

void Transform::append(const Transform &child)
{
	if(!isGroup()) {
		QVector<Transform> children;
		if(!isIdentity())
			children << *this;
		*this = group(children);
	}
	d->children.append(child);
}

QTransform Transform::toQTransform() const
{
	const QVector<qreal> &p = d->parameters;
	switch (d->type) {
	case Type::Identity:
		return QTransform();
	case Type::Translate:
		return QTransform::fromTranslate(p[0], p[1]);
	case Type::Scale:
		return QTransform::fromScale(p[0], p[1]);
	case Type::Rotate: {
		QTransform t;
		t.rotate(p[0]);
		return t;
	}
	case Type::SkewX:
		return QTransform(1, 0, qTan(qDegreesToRadians(p[0])), 1, 0, 0);
	case Type::SkewY:
		return QTransform(1, qTan(qDegreesToRadians(p[0])), 0, 1, 0, 0);
	case Type::Matrix:
		return QTransform(p[0], p[1], p[2], p[3], p[4], p[5]);
	case Type::Group: {
		QTransform t;
		for(const Transform &child : d->children)
			t = t * child.toQTransform();
		return t;
	}
	}
	return QTransform();
}

static QString typeName(Transform::Type type)
{
	switch (type) {
	case Transform::Type::Identity: return QStringLiteral("identity");
	case Transform::Type::Translate: return names::translate;
	case Transform::Type::Scale: return names::scale;
	case Transform::Type::Rotate: return names::rotate;
	case Transform::Type::SkewX: return names::skewX;
	case Transform::Type::SkewY: return names::skewY;
	case Transform::Type::Matrix: return names::matrix;
	case Transform::Type::Group: return QStringLiteral("group");
	}
	return QString();
}

QString Transform::toString() const
{
	QStringList parts;
	if(isGroup()) {
		for(const Transform &child : d->children)
			parts << child.toString();
	}
	else {
		for(qreal v : d->parameters)
			parts << QString::number(v);
	}
	return typeName(d->type) + QLatin1Char('(') + parts.join(isGroup()? QStringLiteral(" "): QStringLiteral(",")) + QLatin1Char(')');
}

bool Transform::operator==(const Transform &other) const
{
	if(d == other.d)
		return true;
	return d->type == other.d->type
			&& d->parameters == other.d->parameters
			&& d->children == other.d->children;
}

static QVector<qreal> parseParameters(const QString &command, const QString &params)
{
	QVector<qreal> ret;
	const QStringList parts = params.split(QRegExp(QStringLiteral("[\\s,]+")), QString::SkipEmptyParts);
	for(const QString &part : parts) {
		bool ok;
		qreal v = toDouble(part, &ok);
		if(!ok)
			throw FormatError(QStringLiteral("Invalid number '%1' in SVG transform command: %2").arg(part, command));
		ret << v;
	}
	return ret;
}

static qreal singleAngle(const QString &command, const QVector<qreal> &params)
{
	// rotate about a center point is not supported
	if(params.count() != 1)
		throw FormatError(QStringLiteral("SVG transform command %1 takes exactly one angle").arg(command));
	return params[0];
}

Transform parseTransform(const QString &str)
{
	QVector<Transform> transforms;
	const int len = str.length();
	int index = 0;
	while (index < len) {
		if (str.at(index).isSpace() || str.at(index) == QLatin1Char(',')) {
			++index;
			continue;
		}
		// none anywhere cancels the whole transform
		if(str.midRef(index).startsWith(names::none))
			return Transform();
		int open_paren = str.indexOf('(', index);
		if(open_paren < 0)
			break;
		const QString command = str.mid(index, open_paren - index).trimmed();
		int close_paren = str.indexOf(')', open_paren);
		if(close_paren < 0)
			throw FormatError(QStringLiteral("Unterminated SVG transform command: %1").arg(command));
		const QString params_str = str.mid(open_paren + 1, close_paren - open_paren - 1);
		index = close_paren + 1;

		if(command == names::translate) {
			QVector<qreal> params = parseParameters(command, params_str);
			if(params.count() == 1)
				transforms << Transform::translate(params[0], 0);
			else if(params.count() == 2)
				transforms << Transform::translate(params[0], params[1]);
		}
		else if(command == names::scale) {
			QVector<qreal> params = parseParameters(command, params_str);
			if(params.count() == 1)
				transforms << Transform::scale(params[0], params[0]);
			else if(params.count() == 2)
				transforms << Transform::scale(params[0], params[1]);
		}
		else if(command == names::rotate) {
			transforms << Transform::rotate(singleAngle(command, parseParameters(command, params_str)));
		}
		else if(command == names::skewX) {
			transforms << Transform::skewX(singleAngle(command, parseParameters(command, params_str)));
		}
		else if(command == names::skewY) {
			transforms << Transform::skewY(singleAngle(command, parseParameters(command, params_str)));
		}
		else if(command == names::matrix) {
			QVector<qreal> p = parseParameters(command, params_str);
			if(p.count() == 6)
				transforms << Transform::matrix(p[0], p[1], p[2], p[3], p[4], p[5]);
			else
				logSvgD() << "matrix() with" << p.count() << "parameters ignored";
		}
		else {
			throw FormatError(QStringLiteral("Invalid SVG transform command: %1").arg(command));
		}
	}
	if(transforms.count() > 1)
		return Transform::group(transforms);
	if(transforms.count() == 1)
		return transforms[0];
	return Transform();
}

}
