#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

#include <QPointF>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <QVector>
#include <utility>

#include "interaction/noteprompter.h"
#include "render/notelabellayout.h"

namespace trail_test {

// Fixed-size labels so hit tests do not depend on installed fonts
class FixedTextMeasurer : public NoteTextMeasurer
{
public:
    explicit FixedTextMeasurer(const QSizeF& size = QSizeF(40.0, 12.0)) : m_size(size) {}

    QSizeF measure(const QString& text, QString& displayText) const override
    {
        displayText = text;
        return m_size;
    }

private:
    QSizeF m_size;
};

// Records requests and either answers immediately or holds the callback
class ScriptedPrompter : public NotePrompter
{
public:
    void requestAction(const QString& noteText, ActionCallback done) override
    {
        actionRequests << noteText;
        if (deferAnswers) {
            pendingAction = std::move(done);
            return;
        }
        done(actionAccepted, nextAction);
    }

    void requestText(const QString& title, const QString& initialText, TextCallback done) override
    {
        textRequests << title;
        initialTexts << initialText;
        if (deferAnswers) {
            pendingText = std::move(done);
            return;
        }
        done(textAccepted, nextText);
    }

    bool deferAnswers{false};
    bool actionAccepted{true};
    NoteAction nextAction{NoteAction::Edit};
    bool textAccepted{true};
    QString nextText{QStringLiteral("Summit")};

    QStringList actionRequests;
    QStringList textRequests;
    QStringList initialTexts;
    ActionCallback pendingAction;
    TextCallback pendingText;
};

inline QByteArray gpxDocument(const QString& body)
{
    return QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<gpx version=\"1.1\" creator=\"test\" xmlns=\"http://www.topografix.com/GPX/1/1\">\n"
        "%1\n"
        "</gpx>\n").arg(body).toUtf8();
}

inline QVector<QPointF> straightLine(const QPointF& from, const QPointF& to, int count)
{
    QVector<QPointF> points;
    for (int i = 0; i < count; ++i) {
        const double t = count > 1 ? static_cast<double>(i) / (count - 1) : 0.0;
        points.append(from + (to - from) * t);
    }
    return points;
}

} // namespace trail_test

#endif // TEST_SUPPORT_H
