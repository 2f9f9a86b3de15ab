#pragma once

// ============================================================================
// AnnotationEvent - Notification published on every annotation mutation
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Events carry references, not pointers: a Deleted event outlives the record
// it describes, and a queued event may be delivered after further mutations.
// Receivers resolve references through the store when they need fields.
// ============================================================================

#include "AnnotationRef.h"

#include <QMetaType>
#include <QString>

/**
 * @brief A typed annotation notification.
 *
 * The type decides which fields are meaningful:
 * - Added / Updated: pageIndex, ref
 * - Deleted: pageIndex, ref, inReplyTo (IRT of the removed record)
 * - SummaryUpdated: pageIndex, ref (popup), summaryText, summaryPrivate, source
 */
struct AnnotationEvent {
    enum class Type {
        Added,          ///< A new annotation was registered
        Deleted,        ///< An annotation was removed from the store
        Updated,        ///< Fields of an annotation changed and were persisted
        SummaryUpdated  ///< Another view edited the text shown by a popup
    };

    Type type = Type::Updated;
    int pageIndex = -1;
    AnnotationRef ref;

    // Deleted data
    AnnotationRef inReplyTo;

    // SummaryUpdated data
    QString summaryText;
    bool summaryPrivate = false;
    const void* source = nullptr;   ///< Publisher identity, never dereferenced

    static AnnotationEvent added(int page, const AnnotationRef& ref) {
        AnnotationEvent event;
        event.type = Type::Added;
        event.pageIndex = page;
        event.ref = ref;
        return event;
    }

    static AnnotationEvent deleted(int page, const AnnotationRef& ref, const AnnotationRef& irt) {
        AnnotationEvent event;
        event.type = Type::Deleted;
        event.pageIndex = page;
        event.ref = ref;
        event.inReplyTo = irt;
        return event;
    }

    static AnnotationEvent updated(int page, const AnnotationRef& ref) {
        AnnotationEvent event;
        event.type = Type::Updated;
        event.pageIndex = page;
        event.ref = ref;
        return event;
    }

    static AnnotationEvent summaryUpdated(int page, const AnnotationRef& popupRef,
                                          const QString& text, bool isPrivate,
                                          const void* source) {
        AnnotationEvent event;
        event.type = Type::SummaryUpdated;
        event.pageIndex = page;
        event.ref = popupRef;
        event.summaryText = text;
        event.summaryPrivate = isPrivate;
        event.source = source;
        return event;
    }
};
Q_DECLARE_METATYPE(AnnotationEvent)
