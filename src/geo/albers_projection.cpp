// EN: Implementation of the ellipsoidal Albers Equal Area projection.
// FR: Implémentation de la projection Albers équivalente ellipsoïdale.

#include "geo/albers_projection.hpp"

#include <algorithm>
#include <cmath>

namespace ARL::Geo {

namespace {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kConeEpsilon = 1e-10;

} // namespace

AlbersEqualArea::AlbersEqualArea(double standard_parallel_1_deg, double standard_parallel_2_deg,
                                 double central_meridian_deg)
    : e2_(kWgs84Flattening * (2.0 - kWgs84Flattening)),
      lambda0_(central_meridian_deg * kDegToRad) {
    e_ = std::sqrt(e2_);

    const double phi1 = standard_parallel_1_deg * kDegToRad;
    const double phi2 = standard_parallel_2_deg * kDegToRad;
    const double m1 = meridianM(phi1);
    const double m2 = meridianM(phi2);
    const double q1 = authalicQ(phi1);
    const double q2 = authalicQ(phi2);

    if (std::fabs(phi1 - phi2) < kConeEpsilon) {
        n_ = std::sin(phi1);
    } else {
        n_ = (m1 * m1 - m2 * m2) / (q2 - q1);
    }

    if (std::fabs(n_) < kConeEpsilon) {
        cylindrical_ = true;
        return;
    }

    c_ = m1 * m1 + n_ * q1;
    rho0_ = kWgs84SemiMajorAxis * std::sqrt(std::max(c_ - n_ * authalicQ(0.0), 0.0)) / n_;
}

AlbersEqualArea AlbersEqualArea::forBounds(const Box& lon_lat_bounds) {
    const double min_lon = bg::get<bg::min_corner, 0>(lon_lat_bounds);
    const double min_lat = bg::get<bg::min_corner, 1>(lon_lat_bounds);
    const double max_lon = bg::get<bg::max_corner, 0>(lon_lat_bounds);
    const double max_lat = bg::get<bg::max_corner, 1>(lon_lat_bounds);
    return AlbersEqualArea(min_lat, max_lat, (min_lon + max_lon) / 2.0);
}

Point AlbersEqualArea::project(const Point& lon_lat) const {
    const double lambda = lon_lat.x() * kDegToRad;
    const double phi = lon_lat.y() * kDegToRad;
    const double q = authalicQ(phi);

    if (cylindrical_) {
        return Point(kWgs84SemiMajorAxis * (lambda - lambda0_), kWgs84SemiMajorAxis * q / 2.0);
    }

    const double rho = kWgs84SemiMajorAxis * std::sqrt(std::max(c_ - n_ * q, 0.0)) / n_;
    const double theta = n_ * (lambda - lambda0_);
    return Point(rho * std::sin(theta), rho0_ - rho * std::cos(theta));
}

// EN: Snyder eq. 3-12
// FR: Snyder éq. 3-12
double AlbersEqualArea::authalicQ(double phi) const {
    const double sin_phi = std::sin(phi);
    const double e_sin = e_ * sin_phi;
    return (1.0 - e2_) * (sin_phi / (1.0 - e_sin * e_sin) -
                          (1.0 / (2.0 * e_)) * std::log((1.0 - e_sin) / (1.0 + e_sin)));
}

double AlbersEqualArea::meridianM(double phi) const {
    const double sin_phi = std::sin(phi);
    return std::cos(phi) / std::sqrt(1.0 - e2_ * sin_phi * sin_phi);
}

} // namespace ARL::Geo
