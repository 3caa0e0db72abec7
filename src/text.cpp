#include "shapes.h"

#include "log.h"
#include "numbers.h"
#include "svgnames.h"
#include "xmlelement.h"

#include <QRawFont>

namespace svgdraw {

static int cssFontWeight(const QString &value, int default_weight)
{
	const QString s = value.trimmed();
	if(s == QLatin1String("normal"))
		return QFont::Normal;
	if(s == QLatin1String("bold"))
		return QFont::Bold;
	bool ok;
	int w = s.toInt(&ok);
	if(!ok)
		return default_weight;
	if(w <= 100) return QFont::Thin;
	if(w <= 200) return QFont::ExtraLight;
	if(w <= 300) return QFont::Light;
	if(w <= 400) return QFont::Normal;
	if(w <= 500) return QFont::Medium;
	if(w <= 600) return QFont::DemiBold;
	if(w <= 700) return QFont::Bold;
	if(w <= 800) return QFont::ExtraBold;
	return QFont::Black;
}

static QString firstFontFamily(const QString &value)
{
	QString family = value.section(',', 0, 0).trimmed();
	if(family.length() >= 2 && (family.startsWith('\'') || family.startsWith('"')))
		family = family.mid(1, family.length() - 2);
	return family;
}

static void layoutGlyphs(TextRun &run)
{
	QRawFont raw_font = QRawFont::fromFont(run.font());
	if(!raw_font.isValid()) {
		nWarning() << "no font face for family:" << run.font().family();
		return;
	}
	raw_font.setPixelSize(run.fontSize());
	const QVector<quint32> glyphs = raw_font.glyphIndexesForString(run.text());
	const QVector<QPointF> glyph_advances = raw_font.advancesForGlyphIndexes(glyphs);
	QVector<QPointF> positions;
	QVector<qreal> advances;
	QPointF pos = run.baselineOrigin();
	for (int i = 0; i < glyphs.count() && i < glyph_advances.count(); ++i) {
		positions << pos;
		advances << glyph_advances[i].x();
		pos.rx() += glyph_advances[i].x();
	}
	QGlyphRun glyph_run;
	glyph_run.setRawFont(raw_font);
	glyph_run.setGlyphIndexes(glyphs.mid(0, positions.count()));
	glyph_run.setPositions(positions);
	run.setGlyphRun(glyph_run);
	run.setAdvances(advances);
}

DrawingNode parseText(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	const ParserOptions &options = ctx.options();
	const PropertyMap properties = resolveProperties(el, ctx.registry());
	const CssAttributes style = splitStyle(el.attribute(names::style));
	auto font_property = [&](const QString &name) {
		return style.value(name, el.attribute(name));
	};

	QString family = firstFontFamily(font_property(names::fontFamily));
	if(family.isEmpty())
		family = options.defaultFontFamily;
	qreal font_size = options.defaultFontSize;
	{
		QString s = font_property(names::fontSize).trimmed();
		if(s.endsWith(QLatin1String("px")))
			s.chop(2);
		bool ok;
		qreal sz = toDouble(s, &ok);
		if(ok && sz > 0)
			font_size = sz;
	}
	QFont font(family);
	font.setPixelSize(qMax(1, qRound(font_size)));
	font.setWeight(cssFontWeight(font_property(names::fontWeight), QFont::Normal));
	const QString font_style = font_property(names::fontStyle).trimmed();
	if(font_style == QLatin1String("italic"))
		font.setStyle(QFont::StyleItalic);
	else if(font_style == QLatin1String("oblique"))
		font.setStyle(QFont::StyleOblique);

	TextRun run;
	run.setText(el.text());
	run.setFont(font);
	run.setFontSize(font_size);
	run.setBaselineOrigin(QPointF(numberAttribute(el, names::x), numberAttribute(el, names::y)));
	run.setPixelsPerDip(options.pixelsPerDip);
	run.setForeground(resolveFill(ctx, properties));
	layoutGlyphs(run);
	logSvgD() << "text:" << run.text() << "glyphs:" << run.advances().count() << "width:" << run.width();
	return DrawingNode::text(run);
}

}
