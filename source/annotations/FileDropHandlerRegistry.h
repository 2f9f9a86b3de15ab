#pragma once

// ============================================================================
// FileDropHandlerRegistry - Handlers for files dropped onto a popup
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Handlers are keyed by lower-case file extension without the dot ("png",
// "txt"). The registry is owned by the application and passed to every
// popup widget; popups never look handlers up globally.
// ============================================================================

#include "MarkupAnnotation.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <functional>

class FileDropHandlerRegistry {
public:
    /**
     * @brief Drop handler.
     * @param filePath Local path of the dropped file.
     * @param popup Popup annotation the file was dropped on.
     * @return True if the file was consumed.
     */
    using Handler = std::function<bool(const QString& filePath, MarkupAnnotation* popup)>;

    /**
     * @brief Register (or replace) the handler for an extension.
     */
    void registerHandler(const QString& extension, Handler handler);

    void unregisterHandler(const QString& extension);

    bool hasHandler(const QString& extension) const;

    /**
     * @brief True if a handler exists for the file's extension.
     */
    bool canHandle(const QString& filePath) const;

    /**
     * @brief Dispatch a dropped file to its handler.
     * @return False if the file is unreadable, has no handler, or the
     *         handler rejected it.
     */
    bool dispatch(const QString& filePath, MarkupAnnotation* popup) const;

    QStringList extensions() const;

    static QString extensionOf(const QString& filePath);

private:
    static QString normalizeExtension(const QString& extension);

    QHash<QString, Handler> m_handlers;
};
