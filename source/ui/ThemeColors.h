#ifndef THEMECOLORS_H
#define THEMECOLORS_H

#include <QColor>
#include <QMenu>

/**
 * @brief Color palette shared by the viewer's widgets.
 *
 * Supports light and dark modes. Popup windows take their background from
 * the annotation color and pick their text color with contrastText().
 */
namespace ThemeColors {

// ============================================================================
// Base Gray Palette
// ============================================================================

inline QColor darkPrimary()     { return QColor(0x2a, 0x2e, 0x32); }  // #2a2e32 - backgrounds
inline QColor darkSecondary()   { return QColor(0x3a, 0x3e, 0x42); }  // #3a3e42 - hover states
inline QColor darkTertiary()    { return QColor(0x4d, 0x4d, 0x4d); }  // #4d4d4d - borders

inline QColor lightPrimary()    { return QColor(0xF5, 0xF5, 0xF5); }  // #F5F5F5 - backgrounds
inline QColor lightSecondary()  { return QColor(0xE8, 0xE8, 0xE8); }  // #E8E8E8 - hover states
inline QColor lightTertiary()   { return QColor(0xD0, 0xD0, 0xD0); }  // #D0D0D0 - borders

inline QColor background(bool dark)     { return dark ? darkPrimary() : QColor(Qt::white); }
inline QColor hover(bool dark)          { return dark ? darkSecondary() : lightSecondary(); }
inline QColor border(bool dark)         { return dark ? darkTertiary() : lightTertiary(); }

// ============================================================================
// Text Colors
// ============================================================================

inline QColor textPrimary(bool dark)    { return dark ? QColor(240, 240, 240) : QColor(30, 30, 30); }
inline QColor textSecondary(bool dark)  { return dark ? QColor(180, 180, 180) : QColor(100, 100, 100); }

// ============================================================================
// Page View
// ============================================================================

inline QColor pageViewBackground(bool dark) { return dark ? QColor(0x20, 0x22, 0x25) : QColor(0x9a, 0x9a, 0x9a); }
inline QColor pageShadow()                  { return QColor(0, 0, 0, 60); }

// ============================================================================
// Popup Annotations
// ============================================================================

inline QColor popupBackground()         { return QColor(0xFC, 0xFD, 0xE3); }  // #FCFDE3 - pale yellow
inline QColor popupBorder()             { return QColor(0x99, 0x99, 0x99); }

/**
 * @brief Black or white text, whichever reads better on a background.
 *
 * Uses the YIQ brightness of the background.
 */
inline QColor contrastText(const QColor& backgroundColor) {
    const int yiq = (backgroundColor.red() * 299 +
                     backgroundColor.green() * 587 +
                     backgroundColor.blue() * 114) / 1000;
    return yiq >= 128 ? QColor(Qt::black) : QColor(Qt::white);
}

// ============================================================================
// Menu Styling Helper
// ============================================================================

/**
 * @brief Style a QMenu with rounded corners and theme-appropriate colors.
 *
 * Call this immediately after creating the menu, before adding actions.
 */
inline void styleMenu(QMenu* menu, bool dark) {
    if (!menu) return;

    // Required for true rounded corners on Linux/X11
    menu->setWindowFlags(menu->windowFlags() | Qt::FramelessWindowHint);
    menu->setAttribute(Qt::WA_TranslucentBackground);

    menu->setStyleSheet(QString(
        "QMenu {"
        "  background-color: %1;"
        "  border: 1px solid %2;"
        "  border-radius: 8px;"
        "  padding: 4px;"
        "}"
        "QMenu::item {"
        "  color: %3;"
        "  padding: 6px 16px;"
        "  border-radius: 4px;"
        "}"
        "QMenu::item:selected {"
        "  background-color: %4;"
        "}"
        "QMenu::item:disabled {"
        "  color: %5;"
        "}"
    ).arg(background(dark).name(), border(dark).name(), textPrimary(dark).name(),
          hover(dark).name(), textSecondary(dark).name()));
}

} // namespace ThemeColors

#endif // THEMECOLORS_H
