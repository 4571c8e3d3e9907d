module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QModelIndex>
#include <QString>
#include <QVariant>
#include <QVector>
#include <QtGlobal>

module skylift.core.uploadmodel;

import skylift.core.uploadtask;

UploadModel::UploadModel(QObject* parent) : QAbstractListModel(parent) {}

int UploadModel::rowCount(const QModelIndex& parent) const {
    Q_UNUSED(parent)
    return m_tasks.size();
}

QVariant UploadModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() >= m_tasks.size()) return {};
    const UploadTask* task = m_tasks[index.row()];
    if (!task) return {};

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole: return task->fileName();
    case FilePathRole: return task->filePath();
    case SizeRole: return task->size();
    case StrategyRole: return task->strategyString();
    case StatusRole: return task->stateString();
    case ProgressRole: return task->progress();
    case ErrorRole: return task->errorString();
    case TaskRole: return QVariant::fromValue(static_cast<QObject*>(m_tasks[index.row()]));
    }
    return {};
}

QHash<int, QByteArray> UploadModel::roleNames() const {
    return {
        {FileNameRole, "fileName"},
        {FilePathRole, "filePath"},
        {SizeRole, "size"},
        {StrategyRole, "strategy"},
        {StatusRole, "status"},
        {ProgressRole, "progress"},
        {ErrorRole, "error"},
        {TaskRole, "task"}
    };
}

void UploadModel::addTask(UploadTask* task) {
    if (!task) return;
    beginInsertRows(QModelIndex(), m_tasks.size(), m_tasks.size());
    m_tasks.append(task);
    endInsertRows();

    connect(task, &UploadTask::stateChanged, this, &UploadModel::onTaskChanged);
    connect(task, &UploadTask::progressChanged, this, &UploadModel::onTaskChanged);
}

UploadTask* UploadModel::taskAt(int index) const {
    if (index < 0 || index >= m_tasks.size()) return nullptr;
    return m_tasks[index];
}

int UploadModel::indexOf(const UploadTask* task) const {
    for (int i = 0; i < m_tasks.size(); ++i) {
        if (m_tasks[i] == task) return i;
    }
    return -1;
}

void UploadModel::removeAt(int index) {
    if (index < 0 || index >= m_tasks.size()) return;
    beginRemoveRows(QModelIndex(), index, index);
    UploadTask* task = m_tasks.takeAt(index);
    endRemoveRows();
    if (task) {
        disconnect(task, nullptr, this, nullptr);
        task->deleteLater();
    }
}

int UploadModel::removeFinished() {
    int removed = 0;
    for (int i = m_tasks.size() - 1; i >= 0; --i) {
        if (m_tasks[i] && m_tasks[i]->isFinished()) {
            removeAt(i);
            ++removed;
        }
    }
    return removed;
}

void UploadModel::onTaskChanged() {
    auto* senderTask = qobject_cast<UploadTask*>(sender());
    const int row = indexOf(senderTask);
    if (row < 0) return;
    const QModelIndex idx = index(row);
    emit dataChanged(idx, idx, {StatusRole, ProgressRole, ErrorRole, StrategyRole});
}
