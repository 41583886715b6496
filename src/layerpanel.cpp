#include "layerpanel.h"
#include "layers/layerstore.h"
#include "session/mapsession.h"

#include <QColorDialog>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSlider>
#include <QTreeWidget>
#include <QTreeWidgetItem>
#include <QTreeWidgetItemIterator>
#include <QVBoxLayout>

namespace {
constexpr int kKindRole = Qt::UserRole;
constexpr int kIdRole = Qt::UserRole + 1;
constexpr int kExtraRole = Qt::UserRole + 2;
}

LayerPanel::LayerPanel(QWidget* parent)
    : QWidget(parent)
{
    auto* layout = new QVBoxLayout(this);
    m_tree = new QTreeWidget(this);
    m_tree->setColumnCount(1);
    m_tree->header()->setVisible(false);
    m_tree->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(m_tree);

    auto* style = new QFormLayout();
    m_colorBtn = new QPushButton(tr("Color..."), this);
    m_widthSpin = new QDoubleSpinBox(this);
    m_widthSpin->setRange(0.3, 6.0);
    m_widthSpin->setSingleStep(0.1);
    m_widthSpin->setDecimals(1);
    m_opacitySlider = new QSlider(Qt::Horizontal, this);
    m_opacitySlider->setRange(0, 100);
    style->addRow(tr("Color"), m_colorBtn);
    style->addRow(tr("Width"), m_widthSpin);
    style->addRow(tr("Opacity"), m_opacitySlider);
    layout->addLayout(style);

    auto* buttons = new QHBoxLayout();
    m_removeBtn = new QPushButton(tr("Remove"), this);
    buttons->addStretch();
    buttons->addWidget(m_removeBtn);
    layout->addLayout(buttons);

    connect(m_tree, &QTreeWidget::itemChanged, this, &LayerPanel::onItemChanged);
    connect(m_tree, &QTreeWidget::currentItemChanged, this, &LayerPanel::onCurrentItemChanged);
    connect(m_removeBtn, &QPushButton::clicked, this, &LayerPanel::onRemove);
    connect(m_colorBtn, &QPushButton::clicked, this, &LayerPanel::onSetColor);
    connect(m_widthSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, &LayerPanel::onWidthChanged);
    connect(m_opacitySlider, &QSlider::valueChanged, this, &LayerPanel::onOpacityChanged);
}

void LayerPanel::setSession(MapSession* session)
{
    m_session = session;
    m_store = session ? session->store() : nullptr;
    if (m_store) {
        // Queued: the tree is rebuilt after the item signal that caused the change returns
        connect(m_store, &LayerStore::layersChanged, this, &LayerPanel::reload, Qt::QueuedConnection);
        connect(m_store, &LayerStore::decorationsChanged, this, &LayerPanel::reload, Qt::QueuedConnection);
        connect(m_store, &LayerStore::selectionChanged, this, [this]() {
            selectCurrentInTree();
            syncStyleControls();
        });
    }
    reload();
}

QTreeWidgetItem* LayerPanel::addSection(const QString& title)
{
    auto* section = new QTreeWidgetItem(m_tree, QStringList() << title);
    section->setFlags(Qt::ItemIsEnabled);
    section->setExpanded(true);
    return section;
}

void LayerPanel::reload()
{
    if (!m_store) return;
    m_blockUpdates = true;
    m_tree->clear();

    QTreeWidgetItem* decorations = addSection(tr("Map decorations"));
    const MapDecoration kinds[] = {MapDecoration::Title, MapDecoration::NorthArrow, MapDecoration::Legend};
    for (MapDecoration d : kinds) {
        auto* item = new QTreeWidgetItem(decorations, QStringList() << LayerStore::decorationLabel(d));
        item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
        item->setCheckState(0, m_store->isDecorationVisible(d) ? Qt::Checked : Qt::Unchecked);
        item->setData(0, kKindRole, DecorationItem);
        item->setData(0, kExtraRole, static_cast<int>(d));
    }

    QTreeWidgetItem* contours = addSection(tr("Contour layers"));
    for (const auto& layer : m_store->contourLayers()) {
        auto* item = new QTreeWidgetItem(contours, QStringList() << layer.name);
        item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
        item->setCheckState(0, layer.visible ? Qt::Checked : Qt::Unchecked);
        item->setForeground(0, layer.color);
        item->setData(0, kKindRole, ContourItem);
        item->setData(0, kIdRole, layer.id);
    }

    QTreeWidgetItem* tracks = addSection(tr("GPX tracks"));
    for (const auto& track : m_store->trackLayers()) {
        auto* item = new QTreeWidgetItem(tracks, QStringList() << track.name);
        item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
        item->setCheckState(0, track.visible ? Qt::Checked : Qt::Unchecked);
        item->setForeground(0, track.color);
        item->setData(0, kKindRole, TrackItem);
        item->setData(0, kIdRole, track.id);

        for (const auto& note : track.notes) {
            auto* noteItem = new QTreeWidgetItem(item, QStringList() << note.text);
            noteItem->setFlags(noteItem->flags() | Qt::ItemIsUserCheckable);
            noteItem->setCheckState(0, note.visible ? Qt::Checked : Qt::Unchecked);
            noteItem->setData(0, kKindRole, NoteItem);
            noteItem->setData(0, kIdRole, track.id);
            noteItem->setData(0, kExtraRole, note.id);
        }
        item->setExpanded(true);
    }

    selectCurrentInTree();
    m_blockUpdates = false;
    syncStyleControls();
}

void LayerPanel::selectCurrentInTree()
{
    if (!m_store) return;
    const bool wasBlocked = m_blockUpdates;
    m_blockUpdates = true;

    const Selection& sel = m_store->selection();
    QTreeWidgetItem* match = nullptr;
    for (QTreeWidgetItemIterator it(m_tree); *it && !match; ++it) {
        QTreeWidgetItem* item = *it;
        const int kind = item->data(0, kKindRole).toInt();
        if (kind == DecorationItem && sel.isDecoration(static_cast<MapDecoration>(item->data(0, kExtraRole).toInt()))) {
            match = item;
        } else if (kind == ContourItem && sel.isContour(item->data(0, kIdRole).toString())) {
            match = item;
        } else if (kind == TrackItem && sel.isTrack(item->data(0, kIdRole).toString())) {
            match = item;
        }
    }
    m_tree->setCurrentItem(match);
    if (!match) m_tree->clearSelection();

    m_blockUpdates = wasBlocked;
}

void LayerPanel::onItemChanged(QTreeWidgetItem* item, int column)
{
    if (m_blockUpdates || !m_store || !item || column != 0) return;
    const bool checked = item->checkState(0) == Qt::Checked;
    const QString id = item->data(0, kIdRole).toString();

    switch (item->data(0, kKindRole).toInt()) {
        case DecorationItem:
            m_session->setDecorationVisible(static_cast<MapDecoration>(item->data(0, kExtraRole).toInt()), checked);
            break;
        case ContourItem:
            m_store->setContourVisible(id, checked);
            break;
        case TrackItem:
            m_store->setTrackVisible(id, checked);
            break;
        case NoteItem:
            m_store->setNoteVisible(id, item->data(0, kExtraRole).toString(), checked);
            break;
        default:
            break;
    }
}

void LayerPanel::onCurrentItemChanged(QTreeWidgetItem* current, QTreeWidgetItem* previous)
{
    Q_UNUSED(previous);
    if (m_blockUpdates || !m_store || !current) return;

    const QString id = current->data(0, kIdRole).toString();
    switch (current->data(0, kKindRole).toInt()) {
        case DecorationItem:
            m_store->select(Selection::ofDecoration(static_cast<MapDecoration>(current->data(0, kExtraRole).toInt())));
            break;
        case ContourItem:
            m_store->select(Selection::contour(id));
            break;
        case TrackItem:
        case NoteItem:
            m_store->select(Selection::track(id));
            break;
        default:
            break;
    }
}

void LayerPanel::onRemove()
{
    if (!m_store) return;
    QTreeWidgetItem* item = m_tree->currentItem();
    if (!item) return;

    const QString id = item->data(0, kIdRole).toString();
    switch (item->data(0, kKindRole).toInt()) {
        case DecorationItem:
            m_session->setDecorationVisible(static_cast<MapDecoration>(item->data(0, kExtraRole).toInt()), false);
            break;
        case ContourItem:
            m_session->removeContourLayer(id);
            break;
        case TrackItem:
            m_session->removeTrack(id);
            break;
        case NoteItem:
            m_store->removeNote(id, item->data(0, kExtraRole).toString());
            break;
        default:
            break;
    }
}

void LayerPanel::onSetColor()
{
    if (!m_store) return;
    QColor initial = Qt::white;
    if (const ContourLayer* contour = m_store->selectedContour()) initial = contour->color;
    if (const TrackLayer* track = m_store->selectedTrack()) initial = track->color;
    QColor c = QColorDialog::getColor(initial, this, tr("Layer color"));
    if (!c.isValid()) return;
    m_store->setSelectedColor(c);
}

void LayerPanel::onWidthChanged(double width)
{
    if (m_blockUpdates || !m_store) return;
    m_store->setSelectedStrokeWidth(width);
}

void LayerPanel::onOpacityChanged(int percent)
{
    if (m_blockUpdates || !m_store) return;
    m_store->setSelectedOpacity(percent / 100.0);
}

void LayerPanel::syncStyleControls()
{
    if (!m_store) return;
    const ContourLayer* contour = m_store->selectedContour();
    const TrackLayer* track = m_store->selectedTrack();
    const bool enabled = contour || track;

    QSignalBlocker blockWidth(m_widthSpin);
    QSignalBlocker blockOpacity(m_opacitySlider);
    m_colorBtn->setEnabled(enabled);
    m_widthSpin->setEnabled(enabled);
    m_opacitySlider->setEnabled(enabled);
    if (contour) {
        m_widthSpin->setValue(contour->strokeWidth);
        m_opacitySlider->setValue(qRound(contour->opacity * 100.0));
    } else if (track) {
        m_widthSpin->setValue(track->strokeWidth);
        m_opacitySlider->setValue(qRound(track->opacity * 100.0));
    }
    m_removeBtn->setEnabled(m_tree->currentItem() && m_tree->currentItem()->data(0, kKindRole).toInt() != 0);
}
