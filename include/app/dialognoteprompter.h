#ifndef DIALOGNOTEPROMPTER_H
#define DIALOGNOTEPROMPTER_H

#include "interaction/noteprompter.h"

class QWidget;

// Modal QMenu / QInputDialog implementation of the note prompts
class DialogNotePrompter : public NotePrompter
{
public:
    explicit DialogNotePrompter(QWidget* parent);

    void requestAction(const QString& noteText, ActionCallback done) override;
    void requestText(const QString& title, const QString& initialText, TextCallback done) override;

private:
    QWidget* m_parent{nullptr};
};

#endif // DIALOGNOTEPROMPTER_H
