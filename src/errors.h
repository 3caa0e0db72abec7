#ifndef SVGDRAW_ERRORS_H
#define SVGDRAW_ERRORS_H

#include <QString>

#include <stdexcept>

namespace svgdraw {

class SvgException : public std::runtime_error
{
public:
	explicit SvgException(const QString &message) : std::runtime_error(message.toStdString()) {}
};

// malformed transform grammar, unparsable transform number or colour
class FormatError : public SvgException
{
public:
	explicit FormatError(const QString &message) : SvgException(message) {}
};

// root element missing or not <svg>
class InvalidDocumentError : public SvgException
{
public:
	explicit InvalidDocumentError(const QString &message) : SvgException(message) {}
};

class EmptyInputError : public SvgException
{
public:
	explicit EmptyInputError(const QString &message) : SvgException(message) {}
};

class ResourceError : public SvgException
{
public:
	explicit ResourceError(const QString &message) : SvgException(message) {}
};

class InvalidOperationError : public SvgException
{
public:
	explicit InvalidOperationError(const QString &message) : SvgException(message) {}
};

}

#endif // SVGDRAW_ERRORS_H
