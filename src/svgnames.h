#ifndef SVGDRAW_SVGNAMES_H
#define SVGDRAW_SVGNAMES_H

#include <QLatin1String>

namespace svgdraw {
namespace names {

// elements
static const QLatin1String svg("svg");
static const QLatin1String g("g");
static const QLatin1String defs("defs");
static const QLatin1String path("path");
static const QLatin1String rect("rect");
static const QLatin1String circle("circle");
static const QLatin1String ellipse("ellipse");
static const QLatin1String line("line");
static const QLatin1String polyline("polyline");
static const QLatin1String polygon("polygon");
static const QLatin1String text("text");
static const QLatin1String linearGradient("linearGradient");
static const QLatin1String radialGradient("radialGradient");
static const QLatin1String stop("stop");

// paint and stroke
static const QLatin1String style("style");
static const QLatin1String fill("fill");
static const QLatin1String fillOpacity("fill-opacity");
static const QLatin1String fillRule("fill-rule");
static const QLatin1String stroke("stroke");
static const QLatin1String strokeWidth("stroke-width");
static const QLatin1String strokeLinecap("stroke-linecap");
static const QLatin1String strokeLinejoin("stroke-linejoin");
static const QLatin1String strokeMiterlimit("stroke-miterlimit");
static const QLatin1String strokeDasharray("stroke-dasharray");
static const QLatin1String strokeDashoffset("stroke-dashoffset");
static const QLatin1String strokeOpacity("stroke-opacity");
static const QLatin1String opacity("opacity");
static const QLatin1String stopColor("stop-color");
static const QLatin1String stopOpacity("stop-opacity");
static const QLatin1String transform("transform");

// keyword values
static const QLatin1String none("none");
static const QLatin1String rgb("rgb");
static const QLatin1String url("url");
static const QLatin1String evenodd("evenodd");
static const QLatin1String nonzero("nonzero");
static const QLatin1String butt("butt");
static const QLatin1String round("round");
static const QLatin1String square("square");
static const QLatin1String miter("miter");
static const QLatin1String miterClip("miter-clip");
static const QLatin1String bevel("bevel");
static const QLatin1String userSpaceOnUse("userSpaceOnUse");
static const QLatin1String pad("pad");
static const QLatin1String reflect("reflect");
static const QLatin1String repeat("repeat");

// geometry
static const QLatin1String id("id");
static const QLatin1String d("d");
static const QLatin1String x("x");
static const QLatin1String y("y");
static const QLatin1String width("width");
static const QLatin1String height("height");
static const QLatin1String cx("cx");
static const QLatin1String cy("cy");
static const QLatin1String fx("fx");
static const QLatin1String fy("fy");
static const QLatin1String r("r");
static const QLatin1String rx("rx");
static const QLatin1String ry("ry");
static const QLatin1String x1("x1");
static const QLatin1String y1("y1");
static const QLatin1String x2("x2");
static const QLatin1String y2("y2");
static const QLatin1String points("points");

// gradients
static const QLatin1String href("href");
static const QLatin1String offset("offset");
static const QLatin1String gradientTransform("gradientTransform");
static const QLatin1String gradientUnits("gradientUnits");
static const QLatin1String spreadMethod("spreadMethod");

// text
static const QLatin1String fontFamily("font-family");
static const QLatin1String fontSize("font-size");
static const QLatin1String fontWeight("font-weight");
static const QLatin1String fontStyle("font-style");

// transform commands
static const QLatin1String translate("translate");
static const QLatin1String scale("scale");
static const QLatin1String rotate("rotate");
static const QLatin1String skewX("skewX");
static const QLatin1String skewY("skewY");
static const QLatin1String matrix("matrix");

}
}

#endif // SVGDRAW_SVGNAMES_H
