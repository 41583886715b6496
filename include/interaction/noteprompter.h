#ifndef NOTEPROMPTER_H
#define NOTEPROMPTER_H

#include <QString>
#include <functional>

enum class NoteAction {
    Edit,
    MoveText,
    Delete
};

/**
 * @brief NotePrompter - Presentation-side dialogs used by the annotation engine
 *
 * Each request completes exactly once through its callback, either
 * immediately or after the user answers. A cancelled dialog reports
 * accepted = false.
 */
class NotePrompter
{
public:
    using ActionCallback = std::function<void(bool accepted, NoteAction action)>;
    using TextCallback = std::function<void(bool accepted, const QString& text)>;

    virtual ~NotePrompter() = default;

    virtual void requestAction(const QString& noteText, ActionCallback done) = 0;
    virtual void requestText(const QString& title, const QString& initialText, TextCallback done) = 0;
};

#endif // NOTEPROMPTER_H
