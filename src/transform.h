#ifndef SVGDRAW_TRANSFORM_H
#define SVGDRAW_TRANSFORM_H

#include <QSharedDataPointer>
#include <QString>
#include <QTransform>
#include <QVector>

namespace svgdraw {

class TransformData;

/*
 * Structured 2-D affine transform: identity, one primitive or an ordered
 * group of transforms. Group children apply left to right, the first child
 * is applied first in local space, so the flattened matrix of a group is
 * children[0] * children[1] * ... in QTransform (row vector) terms.
 */
class Transform
{
public:
	enum class Type {
		Identity,
		Translate,
		Scale,
		Rotate,
		SkewX,
		SkewY,
		Matrix,
		Group
	};

	Transform();
	Transform(const Transform &other);
	Transform &operator=(const Transform &other);
	~Transform();

	static Transform translate(qreal dx, qreal dy);
	static Transform scale(qreal sx, qreal sy);
	static Transform rotate(qreal angle);
	static Transform skewX(qreal angle);
	static Transform skewY(qreal angle);
	static Transform matrix(qreal a, qreal b, qreal c, qreal d, qreal e, qreal f);
	static Transform group(const QVector<Transform> &children);

	Type type() const;
	bool isIdentity() const { return type() == Type::Identity; }
	bool isGroup() const { return type() == Type::Group; }

	// translate: dx dy, scale: sx sy, rotate/skew: angle in degrees, matrix: a b c d e f
	const QVector<qreal> &parameters() const;
	const QVector<Transform> &children() const;
	int childCount() const { return children().count(); }
	void append(const Transform &child);

	QTransform toQTransform() const;
	QString toString() const;

	bool operator==(const Transform &other) const;
	bool operator!=(const Transform &other) const { return !(*this == other); }
private:
	static Transform primitive(Type type, const QVector<qreal> &params);
	QSharedDataPointer<TransformData> d;
};

// throws FormatError on an unknown command or an unparsable number
Transform parseTransform(const QString &str);

}

#endif // SVGDRAW_TRANSFORM_H
