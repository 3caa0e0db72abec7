#ifndef SVGDRAW_XMLELEMENT_H
#define SVGDRAW_XMLELEMENT_H

#include <QMap>
#include <QString>
#include <QVector>

class QByteArray;
class QXmlStreamReader;

namespace svgdraw {

/*
 * Generic XML element tree. Element and attribute names are stored without
 * namespace prefix, so xlink:href is reachable as href.
 */
class XmlElement
{
public:
	using Attributes = QMap<QString, QString>;

	XmlElement() {}
	explicit XmlElement(const QString &name) : m_name(name) {}

	QString name() const { return m_name; }
	void setName(const QString &n) { m_name = n; }

	const Attributes &attributes() const { return m_attributes; }
	bool hasAttribute(const QString &name) const { return m_attributes.contains(name); }
	QString attribute(const QString &name, const QString &default_value = QString()) const { return m_attributes.value(name, default_value); }
	void setAttribute(const QString &name, const QString &value) { m_attributes[name] = value; }

	const QVector<XmlElement> &children() const { return m_children; }
	void appendChild(const XmlElement &child) { m_children.append(child); }

	// character data of this element and all its descendants, whitespace simplified
	QString text() const { return m_text.simplified(); }
	void appendText(const QString &t) { m_text += t; }

	// throws InvalidDocumentError when the data is not well formed or has no root
	static XmlElement parse(const QByteArray &data);
	static XmlElement parse(QXmlStreamReader &reader);
private:
	QString m_name;
	Attributes m_attributes;
	QVector<XmlElement> m_children;
	QString m_text;
};

}

#endif // SVGDRAW_XMLELEMENT_H
