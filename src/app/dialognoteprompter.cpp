#include "app/dialognoteprompter.h"
#include "core/mapconstants.h"

#include <QAction>
#include <QCursor>
#include <QInputDialog>
#include <QLineEdit>
#include <QMenu>
#include <QWidget>

DialogNotePrompter::DialogNotePrompter(QWidget* parent)
    : m_parent(parent)
{
}

void DialogNotePrompter::requestAction(const QString& noteText, ActionCallback done)
{
    QMenu menu(m_parent);
    QAction* header = menu.addAction(noteText);
    header->setEnabled(false);
    menu.addSeparator();
    QAction* editAction = menu.addAction(QObject::tr("Edit note"));
    QAction* moveAction = menu.addAction(QObject::tr("Move text"));
    QAction* deleteAction = menu.addAction(QObject::tr("Delete point"));

    QAction* chosen = menu.exec(QCursor::pos());
    if (chosen == editAction) {
        done(true, NoteAction::Edit);
    } else if (chosen == moveAction) {
        done(true, NoteAction::MoveText);
    } else if (chosen == deleteAction) {
        done(true, NoteAction::Delete);
    } else {
        done(false, NoteAction::Edit);
    }
}

void DialogNotePrompter::requestText(const QString& title, const QString& initialText, TextCallback done)
{
    QInputDialog dialog(m_parent);
    dialog.setWindowTitle(title);
    dialog.setLabelText(QObject::tr("Note (max %1 characters):").arg(MapConstants::kMaxNoteLength));
    dialog.setInputMode(QInputDialog::TextInput);
    dialog.setTextValue(initialText.left(MapConstants::kMaxNoteLength));
    if (QLineEdit* edit = dialog.findChild<QLineEdit*>()) {
        edit->setMaxLength(MapConstants::kMaxNoteLength);
    }

    const bool ok = dialog.exec() == QDialog::Accepted;
    done(ok, ok ? dialog.textValue().left(MapConstants::kMaxNoteLength) : QString());
}
