#ifndef SVGDRAW_SVGIMAGE_H
#define SVGDRAW_SVGIMAGE_H

#include "drawing.h"
#include "shapes.h"

#include <QByteArray>
#include <QUrl>

class QIODevice;

namespace svgdraw {

// fetches the bytes behind an URL, throws ResourceError when it cannot
class ResourceResolver
{
public:
	virtual ~ResourceResolver() {}
	virtual QByteArray fetch(const QUrl &url) = 0;
};

// local files and Qt resources (qrc:/ or :/)
class FileResourceResolver : public ResourceResolver
{
public:
	QByteArray fetch(const QUrl &url) override;
};

/*
 * Parsed SVG document together with its source bytes. The drawing can be
 * recoloured, optionally inside an edit session, and reset() restores the
 * tree as it was loaded.
 */
class SvgImage
{
public:
	SvgImage() {}

	static SvgImage fromFile(const QString &path, const ParserOptions &options = ParserOptions());
	// device must not be null or empty
	static SvgImage fromDevice(QIODevice *device, const ParserOptions &options = ParserOptions());
	static SvgImage fromData(const QByteArray &data, const ParserOptions &options = ParserOptions());
	static SvgImage fromUrl(const QUrl &url, ResourceResolver &resolver, const ParserOptions &options = ParserOptions());

	bool isNull() const { return m_sourceData.isEmpty(); }
	QUrl sourceUrl() const { return m_sourceUrl; }
	const DrawingTree &drawing() const { return m_drawing; }

	void reset();

	bool isEditing() const { return m_editing; }
	void beginEdit();
	void endEdit();
	// work on the edit session copy when a session is open
	void replaceFillBrush(const Brush &existing, const Brush &replacement);
	void replaceStrokeBrush(const Brush &existing, const Brush &replacement);
private:
	void load(const QByteArray &data, const ParserOptions &options);
private:
	QByteArray m_sourceData;
	QUrl m_sourceUrl;
	ParserOptions m_options;
	DrawingTree m_drawing;
	DrawingTree m_editDrawing;
	bool m_editing = false;
};

/*
 * Shapes whose fill (stroke brush) has the same colour as existing get the
 * replacement, with the alpha of the replaced colour applied to it. Pen
 * thickness, caps, join and dashes are kept. The input tree is left untouched.
 */
DrawingTree replaceFillBrush(const DrawingTree &tree, const Brush &existing, const Brush &replacement);
DrawingTree replaceStrokeBrush(const DrawingTree &tree, const Brush &existing, const Brush &replacement);

}

#endif // SVGDRAW_SVGIMAGE_H
