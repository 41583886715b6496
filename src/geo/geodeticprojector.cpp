#include "geo/geodeticprojector.h"

#include <QtMath>

double GeodeticProjector::eccentricitySquared()
{
    return 2.0 * kFlattening - kFlattening * kFlattening;
}

double GeodeticProjector::secondEccentricitySquared()
{
    const double e2 = eccentricitySquared();
    return e2 / (1.0 - e2);
}

double GeodeticProjector::meridionalArc(double phiRad)
{
    const double e2 = eccentricitySquared();
    const double e4 = e2 * e2;
    const double e6 = e4 * e2;

    return kSemiMajorAxis *
        ((1.0 - e2 / 4.0 - 3.0 * e4 / 64.0 - 5.0 * e6 / 256.0) * phiRad -
         (3.0 * e2 / 8.0 + 3.0 * e4 / 32.0 + 45.0 * e6 / 1024.0) * qSin(2.0 * phiRad) +
         (15.0 * e4 / 256.0 + 45.0 * e6 / 1024.0) * qSin(4.0 * phiRad) -
         (35.0 * e6 / 3072.0) * qSin(6.0 * phiRad));
}

QPointF GeodeticProjector::project(double lonDeg, double latDeg)
{
    const double e2 = eccentricitySquared();
    const double ep2 = secondEccentricitySquared();

    const double phi = qDegreesToRadians(latDeg);
    const double lambda = qDegreesToRadians(lonDeg);
    const double lambda0 = qDegreesToRadians(kOriginLongitude);

    const double sinPhi = qSin(phi);
    const double cosPhi = qCos(phi);
    const double tanPhi = qTan(phi);

    const double N = kSemiMajorAxis / qSqrt(1.0 - e2 * sinPhi * sinPhi);
    const double T = tanPhi * tanPhi;
    const double C = ep2 * cosPhi * cosPhi;
    const double A = cosPhi * (lambda - lambda0);

    const double M = meridionalArc(phi);
    const double M0 = meridionalArc(qDegreesToRadians(kOriginLatitude));

    const double A2 = A * A;
    const double A3 = A2 * A;
    const double A4 = A3 * A;
    const double A5 = A4 * A;
    const double A6 = A5 * A;

    const double x = kFalseEasting + kScaleFactor * N *
        (A + (1.0 - T + C) * A3 / 6.0 +
         (5.0 - 18.0 * T + T * T + 72.0 * C - 58.0 * ep2) * A5 / 120.0);

    const double y = kFalseNorthing + kScaleFactor *
        (M - M0 + N * tanPhi *
         (A2 / 2.0 +
          (5.0 - T + 9.0 * C + 4.0 * C * C) * A4 / 24.0 +
          (61.0 - 58.0 * T + T * T + 600.0 * C - 330.0 * ep2) * A6 / 720.0));

    return QPointF(x, y);
}
