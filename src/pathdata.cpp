#include "pathdata.h"

#include "log.h"
#include "numbers.h"

#include <QtMath>

namespace svgdraw {

// the arc handling code underneath is from XSVG (BSD license)
/*
 * Copyright  2002 USC/Information Sciences Institute
 *
 * Permission to use, copy, modify, distribute, and sell this software
 * and its documentation for any purpose is hereby granted without
 * fee, provided that the above copyright notice appear in all copies
 * and that both that copyright notice and this permission notice
 * appear in supporting documentation, and that the name of
 * Information Sciences Institute not be used in advertising or
 * publicity pertaining to distribution of the software without
 * specific, written prior permission.  Information Sciences Institute
 * makes no representations about the suitability of this software for
 * any purpose.  It is provided "as is" without express or implied
 * warranty.
 *
 * INFORMATION SCIENCES INSTITUTE DISCLAIMS ALL WARRANTIES WITH REGARD
 * TO THIS SOFTWARE, INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS, IN NO EVENT SHALL INFORMATION SCIENCES
 * INSTITUTE BE LIABLE FOR ANY SPECIAL, INDIRECT OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 *
 */
static void pathArcSegment(QPainterPath &path,
						   qreal xc, qreal yc,
						   qreal th0, qreal th1,
						   qreal rx, qreal ry, qreal x_axis_rotation)
{
	const qreal sin_th = qSin(qDegreesToRadians(x_axis_rotation));
	const qreal cos_th = qCos(qDegreesToRadians(x_axis_rotation));
	const qreal a00 =  cos_th * rx;
	const qreal a01 = -sin_th * ry;
	const qreal a10 =  sin_th * rx;
	const qreal a11 =  cos_th * ry;
	const qreal th_half = 0.5 * (th1 - th0);
	const qreal t = (8.0 / 3.0) * qSin(th_half * 0.5) * qSin(th_half * 0.5) / qSin(th_half);
	const qreal x1 = xc + qCos(th0) - t * qSin(th0);
	const qreal y1 = yc + qSin(th0) + t * qCos(th0);
	const qreal x3 = xc + qCos(th1);
	const qreal y3 = yc + qSin(th1);
	const qreal x2 = x3 + t * qSin(th1);
	const qreal y2 = y3 - t * qCos(th1);
	path.cubicTo(a00 * x1 + a01 * y1, a10 * x1 + a11 * y1,
				 a00 * x2 + a01 * y2, a10 * x2 + a11 * y2,
				 a00 * x3 + a01 * y3, a10 * x3 + a11 * y3);
}

static void pathArc(QPainterPath &path,
					qreal rx, qreal ry,
					qreal x_axis_rotation,
					bool large_arc, bool sweep,
					const QPointF &from, const QPointF &to)
{
	rx = qAbs(rx);
	ry = qAbs(ry);
	if(qFuzzyIsNull(rx) || qFuzzyIsNull(ry)) {
		// degenerate radii draw a straight line
		path.lineTo(to);
		return;
	}
	const qreal sin_th = qSin(qDegreesToRadians(x_axis_rotation));
	const qreal cos_th = qCos(qDegreesToRadians(x_axis_rotation));
	const qreal dx = (from.x() - to.x()) / 2.0;
	const qreal dy = (from.y() - to.y()) / 2.0;
	const qreal dx1 =  cos_th * dx + sin_th * dy;
	const qreal dy1 = -sin_th * dx + cos_th * dy;
	/* check if radii are large enough */
	const qreal check = (dx1 * dx1) / (rx * rx) + (dy1 * dy1) / (ry * ry);
	if (check > 1) {
		rx = rx * qSqrt(check);
		ry = ry * qSqrt(check);
	}
	const qreal a00 =  cos_th / rx;
	const qreal a01 =  sin_th / rx;
	const qreal a10 = -sin_th / ry;
	const qreal a11 =  cos_th / ry;
	const qreal x0 = a00 * from.x() + a01 * from.y();
	const qreal y0 = a10 * from.x() + a11 * from.y();
	const qreal x1 = a00 * to.x() + a01 * to.y();
	const qreal y1 = a10 * to.x() + a11 * to.y();
	/* (x0, y0) is current point in transformed coordinate space.
	   (x1, y1) is new point in transformed coordinate space.
	   The arc fits a unit-radius circle in this space.
	*/
	const qreal d = (x1 - x0) * (x1 - x0) + (y1 - y0) * (y1 - y0);
	if(qFuzzyIsNull(d))
		return;
	qreal sfactor_sq = 1.0 / d - 0.25;
	if (sfactor_sq < 0)
		sfactor_sq = 0;
	qreal sfactor = qSqrt(sfactor_sq);
	if (sweep == large_arc)
		sfactor = -sfactor;
	const qreal xc = 0.5 * (x0 + x1) - sfactor * (y1 - y0);
	const qreal yc = 0.5 * (y0 + y1) + sfactor * (x1 - x0);
	/* (xc, yc) is center of the circle. */
	const qreal th0 = qAtan2(y0 - yc, x0 - xc);
	const qreal th1 = qAtan2(y1 - yc, x1 - xc);
	qreal th_arc = th1 - th0;
	if (th_arc < 0 && sweep)
		th_arc += 2 * M_PI;
	else if (th_arc > 0 && !sweep)
		th_arc -= 2 * M_PI;
	const int n_segs = qCeil(qAbs(th_arc / (M_PI * 0.5 + 0.001)));
	for (int i = 0; i < n_segs; i++) {
		pathArcSegment(path, xc, yc,
					   th0 + i * th_arc / n_segs,
					   th0 + (i + 1) * th_arc / n_segs,
					   rx, ry, x_axis_rotation);
	}
}

static int argumentCount(char cmd)
{
	switch (cmd) {
	case 'Z': return 0;
	case 'H':
	case 'V': return 1;
	case 'M':
	case 'L':
	case 'T': return 2;
	case 'S':
	case 'Q': return 4;
	case 'C': return 6;
	case 'A': return 7;
	default: return -1;
	}
}

QPainterPath parsePathData(const QString &data, bool *ok)
{
	QPainterPath path;
	QPointF start;        // subpath start
	QPointF current;
	QPointF ctrl_pt;      // last control point for S and T
	char last_cmd = 0;
	if(ok)
		*ok = true;
	const QChar *str = data.constData();
	const QChar *end = str + data.length();
	while (str < end) {
		while (str < end && (str->isSpace() || *str == QLatin1Char(',')))
			++str;
		if(str == end)
			break;
		const char raw_cmd = str->toLatin1();
		const char cmd = (raw_cmd >= 'a' && raw_cmd <= 'z')? char(raw_cmd - 'a' + 'A'): raw_cmd;
		const bool relative = raw_cmd != cmd;
		const int argc = argumentCount(cmd);
		if(argc < 0) {
			nWarning() << "invalid path command:" << QString(*str) << "in:" << data;
			if(ok)
				*ok = false;
			break;
		}
		++str;
		QVector<qreal> args = parseNumbersList(str);
		if(argc == 0) {
			path.closeSubpath();
			current = start;
			last_cmd = cmd;
			continue;
		}
		int ix = 0;
		char cur_cmd = cmd;
		while (ix + argc <= args.count()) {
			const qreal *num = args.constData() + ix;
			const QPointF offset = relative? current: QPointF();
			switch (cur_cmd) {
			case 'M':
				current = start = QPointF(num[0], num[1]) + offset;
				path.moveTo(current);
				break;
			case 'L':
				current = QPointF(num[0], num[1]) + offset;
				path.lineTo(current);
				break;
			case 'H':
				current.setX(num[0] + offset.x());
				path.lineTo(current);
				break;
			case 'V':
				current.setY(num[0] + offset.y());
				path.lineTo(current);
				break;
			case 'C': {
				QPointF c1 = QPointF(num[0], num[1]) + offset;
				ctrl_pt = QPointF(num[2], num[3]) + offset;
				current = QPointF(num[4], num[5]) + offset;
				path.cubicTo(c1, ctrl_pt, current);
				break;
			}
			case 'S': {
				QPointF c1 = (last_cmd == 'C' || last_cmd == 'S')? 2.0 * current - ctrl_pt: current;
				ctrl_pt = QPointF(num[0], num[1]) + offset;
				current = QPointF(num[2], num[3]) + offset;
				path.cubicTo(c1, ctrl_pt, current);
				break;
			}
			case 'Q':
				ctrl_pt = QPointF(num[0], num[1]) + offset;
				current = QPointF(num[2], num[3]) + offset;
				path.quadTo(ctrl_pt, current);
				break;
			case 'T':
				ctrl_pt = (last_cmd == 'Q' || last_cmd == 'T')? 2.0 * current - ctrl_pt: current;
				current = QPointF(num[0], num[1]) + offset;
				path.quadTo(ctrl_pt, current);
				break;
			case 'A': {
				QPointF to = QPointF(num[5], num[6]) + offset;
				pathArc(path, num[0], num[1], num[2], num[3] != 0, num[4] != 0, current, to);
				current = to;
				break;
			}
			}
			last_cmd = cur_cmd;
			ix += argc;
			// extra coordinate pairs after a moveto are implicit linetos
			if(cur_cmd == 'M') {
				cur_cmd = 'L';
			}
		}
		if(ix < args.count())
			logSvgD() << "path command" << QString(QLatin1Char(raw_cmd)) << "has" << (args.count() - ix) << "dangling arguments";
	}
	return path;
}

QPolygonF parsePoints(const QString &data)
{
	QPolygonF ret;
	const QVector<qreal> numbers = parseNumbersList(data);
	for (int i = 0; i + 1 < numbers.count(); i += 2)
		ret << QPointF(numbers[i], numbers[i + 1]);
	return ret;
}

}
