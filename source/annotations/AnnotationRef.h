#pragma once

// ============================================================================
// AnnotationRef - Stable identity of an annotation object
// ============================================================================
// An annotation is identified by the indirect object that stores it in the
// PDF (object number + generation). Object number 0 is never used by a PDF
// body, so it marks a null reference.
// ============================================================================

#include <QString>
#include <QHash>
#include <QMetaType>

/**
 * @brief Opaque, comparable reference to an annotation.
 */
struct AnnotationRef {
    int objectNumber = 0;   ///< PDF object number (0 = null reference)
    int generation = 0;     ///< PDF generation number

    AnnotationRef() = default;
    explicit AnnotationRef(int num, int gen = 0)
        : objectNumber(num), generation(gen) {}

    bool isNull() const { return objectNumber <= 0; }

    bool operator==(const AnnotationRef& other) const {
        return objectNumber == other.objectNumber && generation == other.generation;
    }
    bool operator!=(const AnnotationRef& other) const { return !(*this == other); }

    /**
     * @brief PDF-style text form, e.g. "12 0 R".
     */
    QString toString() const {
        return isNull() ? QStringLiteral("null")
                        : QStringLiteral("%1 %2 R").arg(objectNumber).arg(generation);
    }
};

inline size_t qHash(const AnnotationRef& ref, size_t seed = 0)
{
    return qHashMulti(seed, ref.objectNumber, ref.generation);
}

Q_DECLARE_METATYPE(AnnotationRef)
