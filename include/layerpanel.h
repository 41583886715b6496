#ifndef LAYERPANEL_H
#define LAYERPANEL_H

#include <QWidget>
#include <QColor>

class QTreeWidget;
class QTreeWidgetItem;
class QPushButton;
class QDoubleSpinBox;
class QSlider;
class LayerStore;
class MapSession;

class LayerPanel : public QWidget
{
    Q_OBJECT
public:
    explicit LayerPanel(QWidget* parent = nullptr);
    void setSession(MapSession* session);
    void reload();

private slots:
    void onItemChanged(QTreeWidgetItem* item, int column);
    void onCurrentItemChanged(QTreeWidgetItem* current, QTreeWidgetItem* previous);
    void onRemove();
    void onSetColor();
    void onWidthChanged(double width);
    void onOpacityChanged(int percent);
    void syncStyleControls();

private:
    enum ItemKind {
        DecorationItem = 1,
        ContourItem,
        TrackItem,
        NoteItem
    };

    QTreeWidgetItem* addSection(const QString& title);
    void selectCurrentInTree();

    MapSession* m_session{nullptr};
    LayerStore* m_store{nullptr};
    QTreeWidget* m_tree{nullptr};
    QPushButton* m_removeBtn{nullptr};
    QPushButton* m_colorBtn{nullptr};
    QDoubleSpinBox* m_widthSpin{nullptr};
    QSlider* m_opacitySlider{nullptr};
    bool m_blockUpdates{false};
};

#endif // LAYERPANEL_H
