#pragma once

// ============================================================================
// MemoryAnnotationStore - In-memory implementation of AnnotationStore
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Owns its records in insertion order. Used directly by the tests and as the
// record keeper underneath MuPdfAnnotationStore.
// ============================================================================

#include "AnnotationStore.h"

#include <QJsonArray>
#include <vector>

class MemoryAnnotationStore : public AnnotationStore {
public:
    /**
     * @brief Construct an empty store.
     * @param pageCount Number of pages annotations may be placed on.
     */
    explicit MemoryAnnotationStore(int pageCount = 1);
    ~MemoryAnnotationStore() override = default;

    // Non-copyable (owns unique_ptr records)
    MemoryAnnotationStore(const MemoryAnnotationStore&) = delete;
    MemoryAnnotationStore& operator=(const MemoryAnnotationStore&) = delete;

    // ===== AnnotationStore interface =====
    int pageCount() const override { return m_pageCount; }
    QVector<MarkupAnnotation*> annotations(int pageIndex) const override;
    MarkupAnnotation* annotation(const AnnotationRef& ref) const override;
    MarkupAnnotation* addAnnotation(int pageIndex,
                                    std::unique_ptr<MarkupAnnotation> annotation) override;
    bool removeAnnotation(const AnnotationRef& ref) override;
    bool commit(const MarkupAnnotation& annotation) override;

    /**
     * @brief True if any record was added, removed or committed since load.
     */
    bool isModified() const { return m_modified; }
    void setModified(bool modified) { m_modified = modified; }

    /**
     * @brief Total number of records on all pages.
     */
    int count() const { return static_cast<int>(m_annotations.size()); }

    // ===== Serialization =====

    /**
     * @brief Serialize all records (used by --dump-annotations).
     */
    QJsonArray toJson() const;

    /**
     * @brief Replace the contents with records from JSON.
     * @param array Array of MarkupAnnotation::toJson() objects.
     * @return Number of records loaded (records on invalid pages are skipped).
     *
     * References from the JSON are kept, so IRT links survive the load.
     */
    int loadFromJson(const QJsonArray& array);

protected:
    /**
     * @brief Insert a record that already carries its reference.
     * @return The stored record, or nullptr if the reference is null or taken.
     */
    MarkupAnnotation* insertRecord(std::unique_ptr<MarkupAnnotation> annotation);

    /**
     * @brief Next unused object number for new records.
     */
    int nextObjectNumber() const { return m_nextObjectNumber; }

    void clearRecords();

    int m_pageCount = 1;

private:
    std::vector<std::unique_ptr<MarkupAnnotation>> m_annotations;  ///< Document order
    int m_nextObjectNumber = 1;
    bool m_modified = false;
};
