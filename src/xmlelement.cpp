#include "xmlelement.h"

#include "errors.h"
#include "log.h"

#include <QStack>
#include <QXmlStreamReader>

namespace svgdraw {

static QString localName(const QStringRef &qualified_name)
{
	int ix = qualified_name.indexOf(':');
	if(ix < 0)
		return qualified_name.toString();
	return qualified_name.mid(ix + 1).toString();
}

static bool isNamespaceDeclaration(const QStringRef &qualified_name)
{
	return qualified_name == QLatin1String("xmlns") || qualified_name.startsWith(QLatin1String("xmlns:"));
}

XmlElement XmlElement::parse(const QByteArray &data)
{
	QXmlStreamReader reader(data);
	return parse(reader);
}

XmlElement XmlElement::parse(QXmlStreamReader &reader)
{
	QStack<XmlElement> element_stack;
	XmlElement root;
	bool done = false;
	reader.setNamespaceProcessing(false);
	while (!reader.atEnd() && !done) {
		switch (reader.readNext()) {
		case QXmlStreamReader::StartElement: {
			XmlElement el(localName(reader.qualifiedName()));
			for(const QXmlStreamAttribute &attr : reader.attributes()) {
				if(isNamespaceDeclaration(attr.qualifiedName()))
					continue;
				el.setAttribute(localName(attr.qualifiedName()), attr.value().toString());
			}
			logSvgD() << "start element:" << el.name();
			element_stack.push(el);
			break;
		}
		case QXmlStreamReader::EndElement: {
			XmlElement el = element_stack.pop();
			logSvgD() << "end element:" << el.name() << "children:" << el.children().count();
			if(element_stack.isEmpty()) {
				root = el;
				done = true;
			}
			else {
				element_stack.top().appendChild(el);
			}
			break;
		}
		case QXmlStreamReader::Characters: {
			const QString text = reader.text().toString();
			for (int i = 0; i < element_stack.count(); ++i)
				element_stack[i].appendText(text);
			break;
		}
		case QXmlStreamReader::ProcessingInstruction:
			logSvgD() << "processing instruction:" << reader.processingInstructionTarget() << reader.processingInstructionData();
			break;
		default:
			break;
		}
	}
	if(reader.hasError()) {
		throw InvalidDocumentError(QStringLiteral("XML error at line %1, column %2: %3")
								   .arg(reader.lineNumber())
								   .arg(reader.columnNumber())
								   .arg(reader.errorString()));
	}
	if(!done)
		throw InvalidDocumentError(QStringLiteral("XML document has no root element"));
	return root;
}

}
