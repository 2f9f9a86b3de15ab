#pragma once

// ============================================================================
// MuPdfAnnotationStore - Annotations of a PDF file, backed by MuPDF
// ============================================================================
// Part of the MarkupView document architecture
//
// Reads every annotation of every page into MarkupAnnotation records when
// the file is opened. Record references are the PDF object numbers, so IRT,
// /Popup and /Parent links resolve directly. Mutations are mirrored into
// the pdf_document immediately; save() writes the file through
// pdf_save_document().
// ============================================================================

#include "../annotations/MemoryAnnotationStore.h"

#include <QRectF>
#include <QVector>

// Forward declarations for MuPDF types (avoid exposing mupdf headers)
struct fz_context;
struct pdf_document;
struct pdf_page;
struct pdf_annot;
struct pdf_obj;

class MuPdfAnnotationStore : public MemoryAnnotationStore {
public:
    /**
     * @brief Open a PDF file and load its annotations.
     * @param pdfPath Path to the PDF file.
     *
     * Check isValid() after construction.
     */
    explicit MuPdfAnnotationStore(const QString& pdfPath);
    ~MuPdfAnnotationStore() override;

    MuPdfAnnotationStore(const MuPdfAnnotationStore&) = delete;
    MuPdfAnnotationStore& operator=(const MuPdfAnnotationStore&) = delete;

    bool isValid() const { return m_ctx != nullptr && m_doc != nullptr; }
    QString filePath() const { return m_path; }

    // ===== Page geometry (PDF user space) =====

    /**
     * @brief CropBox of a page, falling back to MediaBox.
     * @return Rectangle (x0, y0, width, height) or an empty rectangle if invalid.
     */
    QRectF pageBoundary(int pageIndex) const;

    /**
     * @brief The page's own /Rotate, normalized to 0, 90, 180 or 270.
     */
    int pageRotation(int pageIndex) const;

    // ===== AnnotationStore interface =====
    MarkupAnnotation* addAnnotation(int pageIndex,
                                    std::unique_ptr<MarkupAnnotation> annotation) override;
    bool removeAnnotation(const AnnotationRef& ref) override;
    bool commit(const MarkupAnnotation& annotation) override;

    // ===== Saving =====

    /**
     * @brief Write the document.
     * @param outputPath Target file; empty saves over the opened file.
     * @return True on success.
     *
     * Saving over the opened file appends an incremental update when MuPDF
     * allows it.
     */
    bool save(const QString& outputPath = QString());

private:
    void loadAnnotations();
    std::unique_ptr<MarkupAnnotation> readAnnotation(pdf_annot* annot, int pageIndex) const;
    void writeAnnotation(pdf_obj* obj, const MarkupAnnotation& annotation) const;
    pdf_annot* findAnnot(const AnnotationRef& ref, int pageIndex) const;
    pdf_page* page(int pageIndex) const;

    fz_context* m_ctx = nullptr;        ///< MuPDF context (owns all allocations)
    pdf_document* m_doc = nullptr;      ///< The opened PDF
    QVector<pdf_page*> m_pages;         ///< Loaded pages (annotations live on them)
    QString m_path;
};
