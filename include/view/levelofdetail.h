#ifndef LEVELOFDETAIL_H
#define LEVELOFDETAIL_H

#include "layers/maplayers.h"

/**
 * @brief LevelOfDetail - Chooses which contour lines are drawn at a given zoom
 *
 * The interval is the elevation step kept at the current contour render
 * scale; 0 means every line is drawn.
 */
class LevelOfDetail
{
public:
    static int intervalForScale(double renderScale);
    static bool shouldDraw(const ContourLine& line, int interval);
    // Short fragments are noise once the interval is coarse
    static bool isFragmentSuppressed(const ContourLine& line, int interval);
    static double contourRenderScale(double viewScale);
};

#endif // LEVELOFDETAIL_H
