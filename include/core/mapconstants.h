#ifndef MAPCONSTANTS_H
#define MAPCONSTANTS_H

// Geometry and interaction tunables shared by the map core.
namespace MapConstants {

// Track bounds are inflated so a freshly imported track is framed with context.
constexpr double kTrackBoundsMargin = 1400.0;
// Contour layers are clipped to the tracks' extent grown by this margin.
constexpr double kContourClipMargin = 5000.0;

// Viewport projector
constexpr double kBaselineZoom = 1.6;
constexpr double kFitRatio = 0.92;
constexpr double kMinViewScale = 0.2;
constexpr double kMaxViewScale = 48.0;
constexpr double kWheelZoomFactor = 1.15;

// Contour rendering
constexpr double kContourScaleBoost = 1.85;
constexpr double kMinContourLayerWidth = 0.3;
constexpr double kMaxContourLayerWidth = 6.0;
constexpr double kMinorContourWidthFactor = 0.08;
constexpr double kMajorContourWidthFactor = 0.14;
constexpr double kMinContourStroke = 0.03;
constexpr double kMaxContourStroke = 0.52;
constexpr double kMinorContourOpacity = 0.75;

// Track rendering
constexpr double kMinTrackStroke = 0.4;
constexpr double kMaxTrackStroke = 7.0;
constexpr double kEndpointMarkerRadius = 1.4;
constexpr double kNoteMarkerRadius = 1.8;
constexpr double kMinMarkerRadius = 0.7;
constexpr double kMaxMarkerRadius = 3.2;
constexpr double kNoteMarkerRing = 0.6;
constexpr double kLeaderWidth = 0.35;

// Note labels (canvas pixels)
constexpr double kLabelOffsetX = 36.0;
constexpr double kLabelOffsetY = 16.0;
constexpr double kLabelPadX = 3.0;
constexpr double kLabelPadY = 2.0;
constexpr double kLabelMaxTextWidth = 120.0;
constexpr int kLabelFontPixelSize = 10;

// Hit testing (canvas pixels)
constexpr double kTrackHitThreshold = 24.0;
constexpr double kNoteMarkerHitThreshold = 24.0;
constexpr double kNoteLabelHitThreshold = 16.0;
constexpr double kLabelTapInflate = 12.0;
constexpr double kLabelDragInflate = 16.0;
constexpr double kMinProjectorScale = 0.0001;
// Pointer travel in viewport pixels that still counts as a tap
constexpr double kTapSlop = 4.0;

// Title badge
constexpr int kMinTitleFontSize = 12;
constexpr int kMaxTitleFontSize = 56;

// Export
constexpr double kMinExportPixelRatio = 2.0;
constexpr double kMaxExportPixelRatio = 5.0;

constexpr int kMaxNoteLength = 28;

} // namespace MapConstants

#endif // MAPCONSTANTS_H
