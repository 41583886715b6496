#include "view/levelofdetail.h"
#include "core/mapconstants.h"

#include <QtGlobal>

int LevelOfDetail::intervalForScale(double renderScale)
{
    if (renderScale < 1.1) return 100;
    if (renderScale < 2.0) return 40;
    if (renderScale < 3.6) return 20;
    if (renderScale < 6.0) return 10;
    return 0;
}

bool LevelOfDetail::shouldDraw(const ContourLine& line, int interval)
{
    if (interval <= 0) return true;
    if (line.elevation == 0) {
        return line.isMajor || interval <= 20;
    }
    if (qAbs(line.elevation) % interval == 0) return true;
    // Majors stay on screen at coarse intervals even when off the step
    return interval >= 40 && line.isMajor;
}

bool LevelOfDetail::isFragmentSuppressed(const ContourLine& line, int interval)
{
    return interval >= 20 && line.points.size() < 3;
}

double LevelOfDetail::contourRenderScale(double viewScale)
{
    const double safeScale = viewScale > 0.0 ? viewScale : 1.0;
    return safeScale * MapConstants::kContourScaleBoost;
}
