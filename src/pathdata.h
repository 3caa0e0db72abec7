#ifndef SVGDRAW_PATHDATA_H
#define SVGDRAW_PATHDATA_H

#include <QPainterPath>
#include <QPolygonF>
#include <QString>

namespace svgdraw {

// SVG path mini-language, parsing stops at the first unknown command, what was parsed so far is kept
QPainterPath parsePathData(const QString &data, bool *ok = nullptr);
// coordinate pairs, a trailing odd number is dropped
QPolygonF parsePoints(const QString &data);

}

#endif // SVGDRAW_PATHDATA_H
