#ifndef SVGDRAW_SVGHANDLER_H
#define SVGDRAW_SVGHANDLER_H

#include "definitions.h"
#include "drawing.h"
#include "shapes.h"

class QByteArray;

namespace svgdraw {

class XmlElement;

/*
 * Walks an <svg> element tree and builds the drawing tree. Every document
 * gets a fresh definitions registry, filled in document order, so a url(#id)
 * reference only sees definitions that precede it.
 */
class SvgHandler
{
public:
	explicit SvgHandler(const ParserOptions &options = ParserOptions());

	// throws InvalidDocumentError when the root is not <svg>
	DrawingTree parseDocument(const XmlElement &root);
	DrawingTree load(const QByteArray &data);

	DrawingNode parseGroup(const XmlElement &element, const GroupState &inherited);
	void parseDefinitions(const XmlElement &element, const GroupState &inherited);

	const DefinitionsRegistry &definitions() const { return m_definitions; }
	const ParserOptions &options() const { return m_options; }
private:
	GroupState groupState(const XmlElement &element, const GroupState &inherited) const;
	Transform groupTransform(const XmlElement &element) const;
	void registerDefinition(const XmlElement &element, const GroupState &inherited);
private:
	ParserOptions m_options;
	DefinitionsRegistry m_definitions;
};

DrawingTree parseDocument(const XmlElement &root, const ParserOptions &options = ParserOptions());

}

#endif // SVGDRAW_SVGHANDLER_H
