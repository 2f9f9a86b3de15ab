// ============================================================================
// FileDropHandlerRegistry - Implementation
// ============================================================================

#include "FileDropHandlerRegistry.h"

#include <QDebug>
#include <QFileInfo>

void FileDropHandlerRegistry::registerHandler(const QString& extension, Handler handler)
{
    const QString key = normalizeExtension(extension);
    if (key.isEmpty() || !handler) {
        qWarning() << "FileDropHandlerRegistry: Ignoring handler for extension" << extension;
        return;
    }
    m_handlers.insert(key, std::move(handler));
}

void FileDropHandlerRegistry::unregisterHandler(const QString& extension)
{
    m_handlers.remove(normalizeExtension(extension));
}

bool FileDropHandlerRegistry::hasHandler(const QString& extension) const
{
    return m_handlers.contains(normalizeExtension(extension));
}

bool FileDropHandlerRegistry::canHandle(const QString& filePath) const
{
    return hasHandler(extensionOf(filePath));
}

bool FileDropHandlerRegistry::dispatch(const QString& filePath, MarkupAnnotation* popup) const
{
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isReadable()) {
        qWarning() << "FileDropHandlerRegistry: Dropped file is not readable:" << filePath;
        return false;
    }

    const auto it = m_handlers.constFind(extensionOf(filePath));
    if (it == m_handlers.constEnd()) {
        qDebug() << "FileDropHandlerRegistry: No handler for" << info.fileName();
        return false;
    }

    if (!it.value()(filePath, popup)) {
        qDebug() << "FileDropHandlerRegistry: Handler rejected" << info.fileName();
        return false;
    }
    return true;
}

QStringList FileDropHandlerRegistry::extensions() const
{
    QStringList result = m_handlers.keys();
    result.sort();
    return result;
}

QString FileDropHandlerRegistry::extensionOf(const QString& filePath)
{
    return QFileInfo(filePath).suffix().toLower();
}

QString FileDropHandlerRegistry::normalizeExtension(const QString& extension)
{
    QString key = extension.trimmed().toLower();
    if (key.startsWith(QLatin1Char('.'))) {
        key.remove(0, 1);
    }
    return key;
}
