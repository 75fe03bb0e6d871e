// EN: Ellipsoidal Albers Equal Area projection on WGS84, used to measure boundary surfaces.
// FR: Projection Albers équivalente ellipsoïdale sur WGS84, utilisée pour mesurer les surfaces.

#pragma once

#include "geo/geo_types.hpp"

namespace ARL::Geo {

// EN: WGS84 ellipsoid constants
// FR: Constantes de l'ellipsoïde WGS84
constexpr double kWgs84SemiMajorAxis = 6378137.0;
constexpr double kWgs84Flattening = 1.0 / 298.257223563;

// EN: Albers conic equal-area projection (Snyder, USGS PP 1395, eq. 14-1..14-4 and 3-12).
//     Falls back to the cylindrical equal-area case when the cone constant vanishes.
// FR: Projection conique équivalente d'Albers (Snyder, USGS PP 1395, éq. 14-1..14-4 et 3-12).
//     Bascule sur le cas cylindrique équivalent quand la constante du cône s'annule.
class AlbersEqualArea {
public:
    AlbersEqualArea(double standard_parallel_1_deg, double standard_parallel_2_deg, double central_meridian_deg);

    // EN: Projection whose standard parallels are the latitude bounds and whose central meridian is the middle longitude.
    // FR: Projection dont les parallèles standards sont les bornes en latitude et le méridien central la longitude médiane.
    static AlbersEqualArea forBounds(const Box& lon_lat_bounds);

    // EN: Project (lon, lat) in degrees to metres.
    // FR: Projette (lon, lat) en degrés vers des mètres.
    Point project(const Point& lon_lat) const;

    double coneConstant() const { return n_; }
    bool isCylindrical() const { return cylindrical_; }

private:
    double authalicQ(double phi) const;
    double meridianM(double phi) const;

    double e_;
    double e2_;
    double lambda0_;
    double n_{0.0};
    double c_{0.0};
    double rho0_{0.0};
    bool cylindrical_{false};
};

} // namespace ARL::Geo
