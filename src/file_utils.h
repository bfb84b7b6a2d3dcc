#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDir>

/**
 * FileUtils - Filesystem helpers shared by the transfer engine
 *
 * Destination preparation and partial-file cleanup used by every copy path.
 */
namespace FileUtils {

/**
 * Size of a regular file, or -1 when it does not exist.
 */
inline qint64 fileSize(const QString& filePath)
{
    QFileInfo fi(filePath);
    if (!fi.exists() || !fi.isFile()) return -1;
    return fi.size();
}

/**
 * Create the parent directory of a destination file if needed.
 *
 * @param filePath Destination file path
 * @param errorOut Receives a message on failure
 * @return true if the directory exists afterwards
 */
inline bool ensureParentDir(const QString& filePath, QString* errorOut = nullptr)
{
    const QString dir = QFileInfo(filePath).absolutePath();
    if (QDir(dir).exists()) return true;
    if (QDir().mkpath(dir)) return true;
    if (errorOut) *errorOut = QString("Failed to create directory %1").arg(dir);
    return false;
}

/**
 * Remove a (possibly partial) destination file.
 *
 * @return true if no file remains at the path
 */
inline bool removePartial(const QString& filePath)
{
    if (!QFileInfo::exists(filePath)) return true;
    return QFile::remove(filePath);
}

} // namespace FileUtils
