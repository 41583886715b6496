#ifndef MAPLAYERS_H
#define MAPLAYERS_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

struct ContourLine {
    int elevation{0};
    bool isMajor{false};
    QVector<QPointF> points;
};

struct ContourLayer {
    QString id;
    QString sourceId;
    QString name;
    QRectF bounds;
    QVector<ContourLine> lines;
    bool visible{true};
    QColor color{0x4B, 0x62, 0x56};
    double strokeWidth{2.2};
    double opacity{0.5};
};

struct TrackNote {
    QString id;
    QPointF anchorPoint;     // World position on the track, fixed at creation
    QString text;
    QPointF labelOffset;     // World offset from anchor to label center
    bool visible{true};

    QPointF labelCenter() const { return anchorPoint + labelOffset; }
};

struct TrackLayer {
    QString id;
    QString name;
    QVector<QVector<QPointF>> polylines;
    QVector<TrackNote> notes;
    bool visible{true};
    QColor color;
    double strokeWidth{2.2};
    double opacity{1.0};

    const TrackNote* findNote(const QString& noteId) const
    {
        for (const auto& note : notes) {
            if (note.id == noteId) return &note;
        }
        return nullptr;
    }
};

enum class MapDecoration {
    Title,
    NorthArrow,
    Legend
};

struct TitleStyle {
    QString text{QStringLiteral("My Track")};
    QColor color{0x1F, 0x2A, 0x24};
    int fontSize{28};
    QString fontFamily{QStringLiteral("Noto Sans KR")};
};

/**
 * @brief Selection - Exactly one of None, a contour layer, a track layer or a decoration
 */
struct Selection {
    enum class Kind {
        None,
        Contour,
        Track,
        Decoration
    };

    Kind kind{Kind::None};
    QString layerId;
    MapDecoration decoration{MapDecoration::Title};

    static Selection none() { return Selection{}; }
    static Selection contour(const QString& id) { return Selection{Kind::Contour, id, MapDecoration::Title}; }
    static Selection track(const QString& id) { return Selection{Kind::Track, id, MapDecoration::Title}; }
    static Selection ofDecoration(MapDecoration d) { return Selection{Kind::Decoration, QString(), d}; }

    bool isNone() const { return kind == Kind::None; }
    bool isContour(const QString& id) const { return kind == Kind::Contour && layerId == id; }
    bool isTrack(const QString& id) const { return kind == Kind::Track && layerId == id; }
    bool isDecoration(MapDecoration d) const { return kind == Kind::Decoration && decoration == d; }

    bool operator==(const Selection& other) const
    {
        if (kind != other.kind) return false;
        if (kind == Kind::Decoration) return decoration == other.decoration;
        return layerId == other.layerId;
    }
    bool operator!=(const Selection& other) const { return !(*this == other); }
};

struct LegendIntervals {
    int major{100};
    int minor{20};
};

#endif // MAPLAYERS_H
