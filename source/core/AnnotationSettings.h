#pragma once

// ============================================================================
// AnnotationSettings - User preferences for the annotation components
// ============================================================================
// Part of the MarkupView core
//
// Loaded once in main() from QSettings("MarkupView", "App") and passed by
// value to every component that needs it. Components never read QSettings
// themselves, which keeps them testable with hand-built settings.
// ============================================================================

#include <QString>

struct AnnotationSettings {
    QString userName;                   ///< Author written into new annotations (/T)
    bool publicByDefault = true;        ///< New annotations are not private
    bool privatePropertyEnabled = false;///< Show the privacy toggle in popups
    bool interactiveAnnotations = true; ///< Popups can be moved and resized
    qreal defaultFontSize = 12.0;       ///< Popup text size for new popups

    /**
     * @brief Load from the application settings.
     *
     * A missing user name falls back to the login name of the OS user.
     */
    static AnnotationSettings load();

    /**
     * @brief Write back to the application settings.
     */
    void save() const;

    /**
     * @brief Login name from the environment (USER / USERNAME).
     */
    static QString systemUserName();
};
