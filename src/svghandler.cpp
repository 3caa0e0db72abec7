#include "svghandler.h"

#include "errors.h"
#include "log.h"
#include "numbers.h"
#include "svgnames.h"
#include "xmlelement.h"

namespace svgdraw {

SvgHandler::SvgHandler(const ParserOptions &options)
	: m_options(options)
{
}

DrawingTree SvgHandler::load(const QByteArray &data)
{
	return parseDocument(XmlElement::parse(data));
}

DrawingTree SvgHandler::parseDocument(const XmlElement &root)
{
	if(root.name() != names::svg)
		throw InvalidDocumentError(QStringLiteral("Invalid SVG document, root element: '%1'").arg(root.name()));
	m_definitions.clear();
	DrawingTree ret = parseGroup(root, GroupState());
	logSvgI() << "SVG parsed, top level nodes:" << ret.childCount() << "definitions:" << m_definitions.count();
	return ret;
}

GroupState SvgHandler::groupState(const XmlElement &element, const GroupState &inherited) const
{
	GroupState ret = inherited;
	const CssAttributes style = splitStyle(element.attribute(names::style));
	auto value = [&](const QString &name, QString *val) {
		if(style.contains(name)) {
			*val = style.value(name);
			return true;
		}
		if(element.hasAttribute(name)) {
			*val = element.attribute(name);
			return true;
		}
		return false;
	};
	QString val;
	if(value(names::stroke, &val)) {
		ret.stroke = val;
		ret.hasStroke = true;
	}
	if(value(names::strokeWidth, &val)) {
		bool ok;
		qreal w = toDouble(val, &ok);
		if(ok) {
			ret.strokeWidth = w;
			ret.hasStrokeWidth = true;
		}
		else {
			nWarning() << element.name() << "invalid stroke-width:" << val;
		}
	}
	if(value(names::fill, &val)) {
		ret.fill = val;
		ret.hasFill = true;
	}
	if(value(names::fillRule, &val)) {
		ret.fillRule = val;
		ret.hasFillRule = true;
	}
	if(value(names::opacity, &val)) {
		bool ok;
		qreal o = toDouble(val, &ok);
		if(ok)
			ret.opacity *= qBound(qreal(0), o, qreal(1));
		else
			nWarning() << element.name() << "invalid opacity:" << val;
	}
	return ret;
}

Transform SvgHandler::groupTransform(const XmlElement &element) const
{
	const CssAttributes style = splitStyle(element.attribute(names::style));
	const QString str = style.value(names::transform, element.attribute(names::transform));
	QString id;
	if(isUrlReference(str, &id))
		return m_definitions.value<Transform>(id);
	return parseTransform(str);
}

DrawingNode SvgHandler::parseGroup(const XmlElement &element, const GroupState &inherited)
{
	const GroupState state = groupState(element, inherited);
	DrawingNode group = DrawingNode::group(groupTransform(element));
	logSvgD() << "group:" << element.name() << element.attribute(names::id) << "opacity:" << state.opacity;
	for(const XmlElement &child : element.children()) {
		const QString name = child.name();
		if(name == names::g) {
			group.appendChild(parseGroup(child, state));
		}
		else if(name == names::defs) {
			parseDefinitions(child, state);
		}
		else if(isShapeElement(name)) {
			group.appendChild(parseShape(ElementContext(child, m_definitions, state, m_options)));
		}
		else if(isGradientElement(name)) {
			// a gradient outside <defs> paints nothing by itself
			if(child.hasAttribute(names::id))
				registerDefinition(child, state);
		}
		else {
			nWarning() << "unsupported element:" << name;
		}
	}
	return group;
}

void SvgHandler::parseDefinitions(const XmlElement &element, const GroupState &inherited)
{
	for(const XmlElement &child : element.children()) {
		if(!child.hasAttribute(names::id)) {
			logSvgD() << "skipping definition without id:" << child.name();
			continue;
		}
		registerDefinition(child, inherited);
	}
}

void SvgHandler::registerDefinition(const XmlElement &element, const GroupState &inherited)
{
	const QString id = element.attribute(names::id);
	const QString name = element.name();
	ElementContext ctx(element, m_definitions, inherited, m_options);
	if(isGradientElement(name)) {
		m_definitions.insert(id, parseGradient(ctx));
	}
	else if(isShapeElement(name)) {
		m_definitions.insert(id, parseShape(ctx));
	}
	else {
		nWarning() << "unsupported definition:" << name << "id:" << id;
		return;
	}
	logSvgD() << "registered definition:" << id << "element:" << name;
}

DrawingTree parseDocument(const XmlElement &root, const ParserOptions &options)
{
	SvgHandler handler(options);
	return handler.parseDocument(root);
}

}
