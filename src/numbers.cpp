#include "numbers.h"

#include <QByteArray>

namespace svgdraw {

qreal toDouble(const QChar *&str)
{
	const int max_len = 255;//technically doubles can go til 308+ but whatever
	char temp[max_len+1];
	int pos = 0;
	if (*str == QLatin1Char('-')) {
		temp[pos++] = '-';
		++str;
	} else if (*str == QLatin1Char('+')) {
		++str;
	}
	while (isDigit(str->unicode()) && pos < max_len) {
		temp[pos++] = str->toLatin1();
		++str;
	}
	if (*str == QLatin1Char('.') && pos < max_len) {
		temp[pos++] = '.';
		++str;
	}
	while (isDigit(str->unicode()) && pos < max_len) {
		temp[pos++] = str->toLatin1();
		++str;
	}
	bool exponent = false;
	if ((*str == QLatin1Char('e') || *str == QLatin1Char('E')) && pos < max_len) {
		exponent = true;
		temp[pos++] = 'e';
		++str;
		if ((*str == QLatin1Char('-') || *str == QLatin1Char('+')) && pos < max_len) {
			temp[pos++] = str->toLatin1();
			++str;
		}
		while (isDigit(str->unicode()) && pos < max_len) {
			temp[pos++] = str->toLatin1();
			++str;
		}
	}
	temp[pos] = '\0';
	qreal val;
	if (!exponent && pos < 10) {
		int ival = 0;
		const char *t = temp;
		bool neg = false;
		if(*t == '-') {
			neg = true;
			++t;
		}
		while(*t && *t != '.') {
			ival *= 10;
			ival += (*t) - '0';
			++t;
		}
		if(*t == '.') {
			++t;
			int div = 1;
			while(*t) {
				ival *= 10;
				ival += (*t) - '0';
				div *= 10;
				++t;
			}
			val = ((qreal)ival)/((qreal)div);
		} else {
			val = ival;
		}
		if (neg)
			val = -val;
	} else {
		val = QByteArray::fromRawData(temp, pos).toDouble();
	}
	return val;
}

qreal toDouble(const QString &str, bool *ok)
{
	const QString s = str.trimmed();
	const QChar *c = s.constData();
	const QChar *end = c + s.length();
	bool has_digit = false;
	for (const QChar *p = c; p != end && !has_digit; ++p)
		has_digit = isDigit(p->unicode());
	qreal res = has_digit? toDouble(c): 0;
	if (ok)
		*ok = has_digit && c == end;
	return res;
}

QVector<qreal> parseNumbersList(const QChar *&str)
{
	QVector<qreal> points;
	if (!str)
		return points;
	points.reserve(32);
	while (str->isSpace())
		++str;
	while (isNumberStart(*str)) {
		points.append(toDouble(str));
		while (str->isSpace())
			++str;
		if (*str == QLatin1Char(','))
			++str;
		//eat the rest of space
		while (str->isSpace())
			++str;
	}
	return points;
}

QVector<qreal> parseNumbersList(const QString &str)
{
	const QChar *c = str.constData();
	return parseNumbersList(c);
}

}
