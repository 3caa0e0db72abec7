#include "svgimage.h"

#include "errors.h"
#include "log.h"
#include "svghandler.h"

#include <QFile>
#include <QIODevice>

namespace svgdraw {

QByteArray FileResourceResolver::fetch(const QUrl &url)
{
	QString path;
	if(url.isLocalFile())
		path = url.toLocalFile();
	else if(url.scheme() == QLatin1String("qrc"))
		path = QLatin1Char(':') + url.path();
	else if(url.scheme().isEmpty())
		path = url.path();
	else
		throw ResourceError(QStringLiteral("Unsupported URL scheme: %1").arg(url.toString()));
	QFile file(path);
	if(!file.open(QIODevice::ReadOnly))
		throw ResourceError(QStringLiteral("Cannot open '%1': %2").arg(path, file.errorString()));
	return file.readAll();
}

void SvgImage::load(const QByteArray &data, const ParserOptions &options)
{
	SvgHandler handler(options);
	m_drawing = handler.load(data);
	m_sourceData = data;
	m_options = options;
	m_editDrawing = DrawingTree();
	m_editing = false;
}

SvgImage SvgImage::fromFile(const QString &path, const ParserOptions &options)
{
	QFile file(path);
	if(!file.open(QIODevice::ReadOnly))
		throw ResourceError(QStringLiteral("Cannot open '%1': %2").arg(path, file.errorString()));
	logSvgI() << "loading SVG file:" << path;
	SvgImage ret;
	ret.load(file.readAll(), options);
	ret.m_sourceUrl = QUrl::fromLocalFile(path);
	return ret;
}

SvgImage SvgImage::fromDevice(QIODevice *device, const ParserOptions &options)
{
	if(!device)
		throw EmptyInputError(QStringLiteral("SVG device is null"));
	if(!device->isOpen() && !device->open(QIODevice::ReadOnly))
		throw ResourceError(QStringLiteral("Cannot open SVG device: %1").arg(device->errorString()));
	const QByteArray data = device->readAll();
	if(data.isEmpty())
		throw EmptyInputError(QStringLiteral("SVG device is empty"));
	SvgImage ret;
	ret.load(data, options);
	return ret;
}

SvgImage SvgImage::fromData(const QByteArray &data, const ParserOptions &options)
{
	if(data.isEmpty())
		throw EmptyInputError(QStringLiteral("SVG data is empty"));
	SvgImage ret;
	ret.load(data, options);
	return ret;
}

SvgImage SvgImage::fromUrl(const QUrl &url, ResourceResolver &resolver, const ParserOptions &options)
{
	logSvgI() << "loading SVG url:" << url.toString();
	const QByteArray data = resolver.fetch(url);
	if(data.isEmpty())
		throw EmptyInputError(QStringLiteral("SVG resource is empty: %1").arg(url.toString()));
	SvgImage ret;
	ret.load(data, options);
	ret.m_sourceUrl = url;
	return ret;
}

void SvgImage::reset()
{
	if(m_sourceData.isEmpty())
		throw InvalidOperationError(QStringLiteral("No original SVG document to reset to"));
	load(m_sourceData, m_options);
}

void SvgImage::beginEdit()
{
	if(m_editing)
		throw InvalidOperationError(QStringLiteral("An edit is already in progress"));
	m_editDrawing = m_drawing;
	m_editing = true;
}

void SvgImage::endEdit()
{
	if(!m_editing)
		throw InvalidOperationError(QStringLiteral("No edit in progress"));
	m_drawing = m_editDrawing;
	m_editDrawing = DrawingTree();
	m_editing = false;
}

void SvgImage::replaceFillBrush(const Brush &existing, const Brush &replacement)
{
	DrawingTree &target = m_editing? m_editDrawing: m_drawing;
	target = svgdraw::replaceFillBrush(target, existing, replacement);
}

void SvgImage::replaceStrokeBrush(const Brush &existing, const Brush &replacement)
{
	DrawingTree &target = m_editing? m_editDrawing: m_drawing;
	target = svgdraw::replaceStrokeBrush(target, existing, replacement);
}

static Brush withAlphaOf(const Brush &replacement, const Brush &existing)
{
	return applyOpacityToBrush(replacement, existing.color().alphaF());
}

static void replaceFill(DrawingNode &node, const Brush &existing, const Brush &replacement)
{
	if(node.isGroup()) {
		for (int i = 0; i < node.childCount(); ++i)
			replaceFill(node.childRef(i), existing, replacement);
	}
	else if(node.isShape() && sameColor(node.fill(), existing)) {
		node.setFill(withAlphaOf(replacement, node.fill()));
	}
}

static void replaceStroke(DrawingNode &node, const Brush &existing, const Brush &replacement)
{
	if(node.isGroup()) {
		for (int i = 0; i < node.childCount(); ++i)
			replaceStroke(node.childRef(i), existing, replacement);
	}
	else if(node.isShape() && sameColor(node.stroke().brush(), existing)) {
		Pen pen = node.stroke();
		pen.setBrush(withAlphaOf(replacement, pen.brush()));
		node.setStroke(pen);
	}
}

DrawingTree replaceFillBrush(const DrawingTree &tree, const Brush &existing, const Brush &replacement)
{
	DrawingTree ret = tree;
	replaceFill(ret, existing, replacement);
	return ret;
}

DrawingTree replaceStrokeBrush(const DrawingTree &tree, const Brush &existing, const Brush &replacement)
{
	DrawingTree ret = tree;
	replaceStroke(ret, existing, replacement);
	return ret;
}

}
