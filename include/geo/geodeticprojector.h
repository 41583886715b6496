#ifndef GEODETICPROJECTOR_H
#define GEODETICPROJECTOR_H

#include <QPointF>

/**
 * @brief GeodeticProjector - Geographic to planar projection
 *
 * Transverse Mercator forward series on the GRS80 ellipsoid with the
 * Korea 2000 / Unified CS parameters (EPSG:5179). Output is easting/northing
 * in metres. Stateless; NaN or out-of-range input propagates.
 */
class GeodeticProjector
{
public:
    static constexpr double kSemiMajorAxis = 6378137.0;
    static constexpr double kFlattening = 1.0 / 298.257222101;
    static constexpr double kScaleFactor = 0.9996;
    static constexpr double kOriginLatitude = 38.0;
    static constexpr double kOriginLongitude = 127.5;
    static constexpr double kFalseEasting = 1000000.0;
    static constexpr double kFalseNorthing = 2000000.0;

    static QPointF project(double lonDeg, double latDeg);

    // Meridional arc length from the equator to latitude phi (radians)
    static double meridionalArc(double phiRad);

    static double eccentricitySquared();
    static double secondEccentricitySquared();
};

#endif // GEODETICPROJECTOR_H
