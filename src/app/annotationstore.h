/*
 * annotationstore.h — Per-document annotation persistence
 *
 * Annotations live in one JSON file per source document under
 * AppDataLocation/annotations, keyed by a hash of the document path.
 * Ids are allocated from a per-document counter and never reused.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_ANNOTATIONSTORE_H
#define MARGINREADER_ANNOTATIONSTORE_H

#include <QJsonObject>
#include <QList>
#include <QObject>
#include <QString>

#include "annotation.h"

class AnnotationStore : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationStore(QObject *parent = nullptr);

    QList<Annotation> annotations(const QString &filePath) const;

    // Returns the new id, or -1 if the anchor is blank or the file could not
    // be written.
    int add(const QString &filePath, const QString &anchorText,
            AnnotationKind kind, const QString &note = {});
    bool remove(const QString &filePath, int id);
    bool setNote(const QString &filePath, int id, const QString &note);

Q_SIGNALS:
    void annotationsChanged(const QString &filePath);

private:
    QJsonObject load(const QString &filePath) const;
    bool save(const QString &filePath, const QJsonObject &data);

    QString storeDir() const;
    QString storeFilePath(const QString &filePath) const;
    QString hashPath(const QString &filePath) const;
};

#endif // MARGINREADER_ANNOTATIONSTORE_H
