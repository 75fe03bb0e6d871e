// EN: Boost.Geometry models used by the geo module (lon/lat and projected planes).
// FR: Modèles Boost.Geometry utilisés par le module geo (plans lon/lat et projeté).

#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/ring.hpp>

namespace ARL::Geo {

namespace bg = boost::geometry;

// EN: x = longitude (or easting), y = latitude (or northing).
// FR: x = longitude (ou abscisse), y = latitude (ou ordonnée).
using Point = bg::model::d2::point_xy<double>;

// EN: Counter-clockwise closed rings, the GeoJSON exterior convention.
// FR: Anneaux fermés anti-horaires, la convention GeoJSON des extérieurs.
using Ring = bg::model::ring<Point, false, true>;
using Polygon = bg::model::polygon<Point, false, true>;
using MultiPolygon = bg::model::multi_polygon<Polygon>;
using Box = bg::model::box<Point>;

} // namespace ARL::Geo
