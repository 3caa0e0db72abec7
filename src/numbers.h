#ifndef SVGDRAW_NUMBERS_H
#define SVGDRAW_NUMBERS_H

#include <QString>
#include <QVector>

namespace svgdraw {

// '0' is 0x30 and '9' is 0x39
inline bool isDigit(ushort ch)
{
	static quint16 magic = 0x3ff;
	return ((ch >> 4) == 3) && (magic >> (ch & 15));
}

inline bool isNumberStart(QChar ch)
{
	return isDigit(ch.unicode()) || ch == QLatin1Char('-') || ch == QLatin1Char('+') || ch == QLatin1Char('.');
}

// consumes one number at str, str must be 0-terminated
qreal toDouble(const QChar *&str);
// whole (trimmed) string must be a number, ok is false otherwise
qreal toDouble(const QString &str, bool *ok = nullptr);
QVector<qreal> parseNumbersList(const QChar *&str);
QVector<qreal> parseNumbersList(const QString &str);

}

#endif // SVGDRAW_NUMBERS_H
