/*
 * annotationstore.cpp — Per-document annotation persistence
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "annotationstore.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>

#include <utility>

namespace {

const QLatin1String kFilePathKey("filePath");
const QLatin1String kNextIdKey("nextId");
const QLatin1String kAnnotationsKey("annotations");

QJsonObject toJson(const Annotation &annotation)
{
    QJsonObject obj;
    obj[QLatin1String("id")] = annotation.id;
    obj[QLatin1String("anchorText")] = annotation.anchorText;
    obj[QLatin1String("kind")] = annotationKindName(annotation.kind);
    if (!annotation.note.isEmpty())
        obj[QLatin1String("note")] = annotation.note;
    return obj;
}

bool fromJson(const QJsonObject &obj, Annotation *annotation)
{
    bool ok = false;
    annotation->id = obj.value(QLatin1String("id")).toInt(-1);
    annotation->anchorText = obj.value(QLatin1String("anchorText")).toString();
    annotation->kind = annotationKindFromName(
        obj.value(QLatin1String("kind")).toString(), &ok);
    annotation->note = obj.value(QLatin1String("note")).toString();
    return ok && annotation->id >= 0 && !annotation->anchorText.isEmpty();
}

} // namespace

AnnotationStore::AnnotationStore(QObject *parent)
    : QObject(parent)
{
}

QString AnnotationStore::storeDir() const
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                  + QStringLiteral("/annotations");
    QDir().mkpath(dir);
    return dir;
}

QString AnnotationStore::hashPath(const QString &filePath) const
{
    QByteArray hash = QCryptographicHash::hash(
        filePath.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex().left(16));
}

QString AnnotationStore::storeFilePath(const QString &filePath) const
{
    return storeDir() + QLatin1Char('/') + hashPath(filePath)
           + QStringLiteral(".json");
}

QJsonObject AnnotationStore::load(const QString &filePath) const
{
    QFile file(storeFilePath(filePath));
    if (!file.open(QIODevice::ReadOnly))
        return {};

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "AnnotationStore: ignoring corrupt file" << file.fileName()
                   << error.errorString();
        return {};
    }
    return doc.object();
}

bool AnnotationStore::save(const QString &filePath, const QJsonObject &data)
{
    QSaveFile file(storeFilePath(filePath));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "AnnotationStore: cannot write" << file.fileName()
                   << file.errorString();
        return false;
    }

    QJsonObject obj = data;
    obj[kFilePathKey] = filePath;
    file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "AnnotationStore: commit failed for" << file.fileName()
                   << file.errorString();
        return false;
    }
    return true;
}

QList<Annotation> AnnotationStore::annotations(const QString &filePath) const
{
    QList<Annotation> result;
    if (filePath.isEmpty())
        return result;

    const QJsonArray array = load(filePath).value(kAnnotationsKey).toArray();
    for (const QJsonValue &value : array) {
        Annotation annotation;
        if (fromJson(value.toObject(), &annotation))
            result.append(annotation);
    }
    return result;
}

int AnnotationStore::add(const QString &filePath, const QString &anchorText,
                         AnnotationKind kind, const QString &note)
{
    const QString anchor = anchorText.trimmed();
    if (filePath.isEmpty() || anchor.isEmpty())
        return -1;

    QJsonObject data = load(filePath);
    QJsonArray array = data.value(kAnnotationsKey).toArray();

    // Recover the counter from the entries if the file predates it
    int nextId = data.value(kNextIdKey).toInt(0);
    for (const QJsonValue &value : std::as_const(array))
        nextId = qMax(nextId, value.toObject().value(QLatin1String("id")).toInt(-1) + 1);

    Annotation annotation;
    annotation.id = nextId;
    annotation.anchorText = anchor;
    annotation.kind = kind;
    annotation.note = note;
    array.append(toJson(annotation));

    data[kAnnotationsKey] = array;
    data[kNextIdKey] = nextId + 1;
    if (!save(filePath, data))
        return -1;

    Q_EMIT annotationsChanged(filePath);
    return annotation.id;
}

bool AnnotationStore::remove(const QString &filePath, int id)
{
    QJsonObject data = load(filePath);
    QJsonArray array = data.value(kAnnotationsKey).toArray();

    for (int i = 0; i < array.size(); ++i) {
        if (array.at(i).toObject().value(QLatin1String("id")).toInt(-1) != id)
            continue;
        array.removeAt(i);
        data[kAnnotationsKey] = array;
        if (!save(filePath, data))
            return false;
        Q_EMIT annotationsChanged(filePath);
        return true;
    }
    return false;
}

bool AnnotationStore::setNote(const QString &filePath, int id, const QString &note)
{
    QJsonObject data = load(filePath);
    QJsonArray array = data.value(kAnnotationsKey).toArray();

    for (int i = 0; i < array.size(); ++i) {
        QJsonObject obj = array.at(i).toObject();
        if (obj.value(QLatin1String("id")).toInt(-1) != id)
            continue;
        if (note.isEmpty())
            obj.remove(QLatin1String("note"));
        else
            obj[QLatin1String("note")] = note;
        array.replace(i, obj);
        data[kAnnotationsKey] = array;
        if (!save(filePath, data))
            return false;
        Q_EMIT annotationsChanged(filePath);
        return true;
    }
    return false;
}
