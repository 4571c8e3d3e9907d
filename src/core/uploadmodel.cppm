/*!
 * @file        uploadmodel.cppm
 * @brief       List model of the upload queue.
 * @details     Exposes the tasks owned by the scheduler as a Qt item model so
 *              that a view, a tray menu or a diagnostic dump can observe the
 *              queue without touching the scheduler internals.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/raad/blob/main/LICENSE.md
 */

module;
#include <QAbstractListModel>
#include <QByteArray>
#include <QHash>
#include <QVariant>
#include <QVector>

#ifndef Q_MOC_RUN
export module skylift.core.uploadmodel;
import skylift.core.uploadtask;
#endif

#ifdef Q_MOC_RUN
#define SKYLIFT_MODULE_EXPORT
#else
#define SKYLIFT_MODULE_EXPORT export
#endif

/**
 * @brief Qt list model over UploadTask rows.
 *
 * Rows follow the task signals; the model deletes a task when its row is
 * removed.
 */
SKYLIFT_MODULE_EXPORT class UploadModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom model roles.
     */
    enum Roles {
        FileNameRole = Qt::UserRole + 1,  //!< Display file name
        FilePathRole,                     //!< Full source path
        SizeRole,                         //!< File size in bytes
        StrategyRole,                     //!< "single" or "multipart"
        StatusRole,                       //!< Human-readable status string
        ProgressRole,                     //!< Progress ratio (0.0 – 1.0)
        ErrorRole,                        //!< Last error message
        TaskRole                          //!< Pointer to UploadTask
    };

    explicit UploadModel(QObject* parent = nullptr);

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    /**
     * @brief Append a task row and start following its signals.
     */
    void addTask(UploadTask* task);

    UploadTask* taskAt(int index) const;
    int indexOf(const UploadTask* task) const;

    /**
     * @brief Remove a row and schedule its task for deletion.
     */
    void removeAt(int index);

    /**
     * @brief Remove every finished row.
     * @return Number of rows removed.
     */
    int removeFinished();

private slots:
    void onTaskChanged();

private:
    QVector<UploadTask*> m_tasks;   //!< Rows, in enqueue order
};

#include "uploadmodel.moc"
