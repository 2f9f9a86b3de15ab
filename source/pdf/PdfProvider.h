#pragma once

// ============================================================================
// PdfProvider - Abstract interface for PDF page rendering
// ============================================================================
// Part of the MarkupView document architecture
//
// This abstraction layer enables:
// - Swapping PDF rendering backends (MuPDF or Poppler, chosen per platform)
// - Easier testing with mock providers
//
// Annotations are not read through this interface. They are owned by an
// AnnotationStore (MuPdfAnnotationStore for PDF files), so the renderer only
// has to produce page images.
//
// Design: Uses simple data types instead of passing backend-specific types.
// This ensures any implementation can provide the same interface.
// ============================================================================

#include <QString>
#include <QSizeF>
#include <QImage>
#include <QPixmap>
#include <memory>

/**
 * @brief Abstract interface for PDF document rendering.
 *
 * Implemented by MuPdfProvider and PopplerPdfProvider.
 */
class PdfProvider {
public:
    virtual ~PdfProvider() = default;

    // ===== Document Info =====

    /**
     * @brief Check if the PDF was loaded successfully.
     * @return True if a valid PDF is loaded.
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Check if the PDF is password-protected and locked.
     * @return True if the PDF requires a password.
     */
    virtual bool isLocked() const = 0;

    /**
     * @brief Get the total number of pages.
     * @return Page count, or 0 if invalid.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief Get the PDF title from metadata.
     * @return Title string, or empty if not available.
     */
    virtual QString title() const = 0;

    /**
     * @brief Get the file path this provider was loaded from.
     * @return The PDF file path.
     */
    virtual QString filePath() const = 0;

    // ===== Page Info =====

    /**
     * @brief Get the size of a page in points (1/72 inch).
     * @param pageIndex 0-based page index.
     * @return Page size in points (after the page's own /Rotate), or empty
     *         QSizeF if invalid.
     */
    virtual QSizeF pageSize(int pageIndex) const = 0;

    // ===== Rendering =====

    /**
     * @brief Render a page to a QImage.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch.
     * @return Rendered image, or null QImage on error.
     *
     * The page's own /Rotate is applied. View rotation is not; the caller
     * rotates the image.
     */
    virtual QImage renderPageToImage(int pageIndex, qreal dpi) const = 0;

    /**
     * @brief Render a page to a QPixmap.
     * @param pageIndex 0-based page index.
     * @param dpi Resolution in dots per inch.
     * @return Rendered pixmap, or null QPixmap on error.
     *
     * Default implementation converts from renderPageToImage().
     */
    virtual QPixmap renderPageToPixmap(int pageIndex, qreal dpi) const {
        QImage img = renderPageToImage(pageIndex, dpi);
        return img.isNull() ? QPixmap() : QPixmap::fromImage(img);
    }

    // ===== Factory =====

    /**
     * @brief Create a PdfProvider for the given file.
     * @param pdfPath Path to the PDF file.
     * @return Provider instance, or nullptr on failure.
     *
     * The backend is chosen at compile time for the current platform.
     */
    static std::unique_ptr<PdfProvider> create(const QString& pdfPath);

    /**
     * @brief Name of the compiled-in rendering backend ("MuPDF" or "Poppler").
     */
    static QString backendName();
};
