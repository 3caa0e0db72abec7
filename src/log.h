#ifndef SVGDRAW_LOG_H
#define SVGDRAW_LOG_H

#include <necrolog.h>

#include <QString>
#include <QStringRef>

inline NecroLog operator<<(NecroLog log, const QString &s)
{
	return log.operator<<(s.toStdString());
}

inline NecroLog operator<<(NecroLog log, const QStringRef &s)
{
	return log.operator<<(s.toString().toStdString());
}

#define logSvgI() nCInfo("svg")
#define logSvgD() nCDebug("svg")

#endif // SVGDRAW_LOG_H
