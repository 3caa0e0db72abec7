#ifndef SVGDRAW_DEFINITIONS_H
#define SVGDRAW_DEFINITIONS_H

#include "brush.h"
#include "drawing.h"
#include "transform.h"

#include <QHash>
#include <QMetaType>
#include <QStringList>
#include <QVariant>

Q_DECLARE_METATYPE(svgdraw::Brush)
Q_DECLARE_METATYPE(svgdraw::Transform)
Q_DECLARE_METATYPE(svgdraw::DrawingNode)

namespace svgdraw {

/*
 * Reusable artifacts of one document keyed by element id. Brushes, drawing
 * nodes, transforms and scalars share one id space, a lookup asks for the
 * type it expects and gets a copy, never a reference into the registry.
 */
class DefinitionsRegistry
{
public:
	DefinitionsRegistry() {}

	// last write wins
	template<typename T>
	void insert(const QString &id, const T &value)
	{
		m_items[id] = QVariant::fromValue(value);
	}

	bool contains(const QString &id) const { return m_items.contains(id); }

	template<typename T>
	bool contains(const QString &id) const
	{
		auto it = m_items.constFind(id);
		return it != m_items.constEnd() && it.value().userType() == qMetaTypeId<T>();
	}

	// default_value is returned on a missing id or a type mismatch
	template<typename T>
	T value(const QString &id, const T &default_value = T(), bool *ok = nullptr) const
	{
		auto it = m_items.constFind(id);
		bool found = it != m_items.constEnd() && it.value().userType() == qMetaTypeId<T>();
		if(ok)
			*ok = found;
		return found? it.value().template value<T>(): default_value;
	}

	int count() const { return m_items.count(); }
	QStringList ids() const { return m_items.keys(); }
	void clear() { m_items.clear(); }
private:
	QHash<QString, QVariant> m_items;
};

}

#endif // SVGDRAW_DEFINITIONS_H
