#pragma once

// ============================================================================
// MarkupAnnotation - One annotation of a PDF page
// ============================================================================
// Part of the MarkupView annotation architecture
//
// MarkupAnnotation is the viewer-side record of an annotation object:
// - Markup annotations (Text, FreeText, Highlight, Polygon, ...) carry the
//   comment content and the in-reply-to (IRT) link that forms threads
// - Popup annotations carry the on-screen geometry of a comment window and
//   point back to their markup parent
//
// Records are owned by an AnnotationStore. Everything else holds raw
// pointers that stay valid until the store deletes the record (which is
// always announced with an AnnotationEvent::Type::Deleted).
// ============================================================================

#include "AnnotationRef.h"

#include <QString>
#include <QColor>
#include <QRectF>
#include <QDateTime>
#include <QJsonObject>

/**
 * @brief Viewer-side record of a PDF annotation.
 */
class MarkupAnnotation {
public:
    /**
     * @brief Annotation subtypes the viewer distinguishes.
     */
    enum class Subtype {
        Text,       ///< Sticky note (also used for replies)
        FreeText,
        Highlight,
        Polygon,
        Square,
        Circle,
        Ink,
        Popup,      ///< Comment window of a markup annotation
        Other
    };

    // ===== PDF annotation flags (ISO 32000 table 165) =====
    static constexpr int FLAG_INVISIBLE = 1 << 0;
    static constexpr int FLAG_HIDDEN = 1 << 1;
    static constexpr int FLAG_PRINT = 1 << 2;
    static constexpr int FLAG_READ_ONLY = 1 << 6;
    static constexpr int FLAG_LOCKED = 1 << 7;
    static constexpr int FLAG_LOCKED_CONTENTS = 1 << 9;
    /// Viewer extension: contents only visible to the author
    static constexpr int FLAG_PRIVATE_CONTENTS = 1 << 10;

    // ===== Review states (ISO 32000 12.5.6.3) =====
    static const QString STATE_MODEL_REVIEW;
    static const QString STATE_REVIEW_ACCEPTED;
    static const QString STATE_REVIEW_REJECTED;
    static const QString STATE_REVIEW_CANCELLED;
    static const QString STATE_REVIEW_COMPLETED;
    static const QString STATE_REVIEW_NONE;

    static constexpr qreal DEFAULT_FONT_SIZE = 12.0;

    // ===== Identity =====
    AnnotationRef ref;                  ///< Object reference (assigned by the store)
    int pageIndex = 0;                  ///< 0-based page the annotation lives on
    Subtype subtype = Subtype::Text;

    // ===== Markup data =====
    AnnotationRef inReplyTo;            ///< IRT target, null if not a reply
    AnnotationRef popupRef;             ///< Popup window of this markup, may be null
    QString contents;                   ///< Comment text
    QColor color = QColor(255, 255, 0); ///< Annotation color (/C)
    QString titleText;                  ///< Author (/T)
    QDateTime creationDate;
    QDateTime modifiedDate;
    int flags = FLAG_PRINT;
    QRectF rect;                        ///< Page space (PDF user space) rectangle
    QString stateModel;                 ///< Review state model, empty if none
    QString state;                      ///< Review state

    // ===== Popup data =====
    AnnotationRef parentRef;            ///< Markup parent of a popup
    bool open = false;                  ///< Popup is shown
    qreal textAreaFontSize = DEFAULT_FONT_SIZE;
    qreal headerFontSize = DEFAULT_FONT_SIZE;

    MarkupAnnotation() = default;
    explicit MarkupAnnotation(Subtype type);

    /**
     * @brief True for annotations that can take part in a comment thread.
     *
     * Popups are windows of another annotation, not comments themselves.
     */
    bool isMarkup() const { return subtype != Subtype::Popup; }

    bool isReply() const { return !inReplyTo.isNull(); }

    bool hasFlag(int flag) const { return (flags & flag) != 0; }
    void setFlag(int flag, bool enabled);

    bool isPrivate() const { return hasFlag(FLAG_PRIVATE_CONTENTS); }
    bool isReadOnly() const { return hasFlag(FLAG_READ_ONLY); }
    bool isLocked() const { return hasFlag(FLAG_LOCKED); }

    /**
     * @brief Stamp the modified date with the current time.
     */
    void touch();

    /**
     * @brief Title as shown in a popup header (falls back to "Anonymous").
     */
    QString formattedTitleText() const;

    /**
     * @brief Creation date in the locale's short format.
     */
    QString formattedCreationDate() const;

    /**
     * @brief Tree row text: "<title> - <contents>".
     */
    QString displayText() const;

    // ===== Serialization =====

    QJsonObject toJson() const;
    void loadFromJson(const QJsonObject& obj);

    static QString subtypeToString(Subtype type);
    static Subtype subtypeFromString(const QString& name);
};
