// ============================================================================
// MuPdfProvider - MuPDF implementation of PdfProvider
// ============================================================================

#include "MuPdfProvider.h"

#include <mupdf/fitz.h>

#include <QDebug>

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfProvider::MuPdfProvider(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfProvider: Failed to create MuPDF context";
        return;
    }

    fz_try(m_ctx) {
        fz_register_document_handlers(m_ctx);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to register document handlers";
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
        return;
    }

    const QByteArray pathUtf8 = pdfPath.toUtf8();
    fz_try(m_ctx) {
        m_doc = fz_open_document(m_ctx, pathUtf8.constData());
        m_pageCount = fz_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        m_pageCount = 0;
        return;
    }

    qDebug() << "MuPdfProvider: Loaded" << pdfPath << "with" << m_pageCount << "pages";
}

MuPdfProvider::~MuPdfProvider()
{
    if (m_doc) {
        fz_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
    }
    if (m_ctx) {
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

// ============================================================================
// Document Info
// ============================================================================

bool MuPdfProvider::isValid() const
{
    return m_ctx != nullptr && m_doc != nullptr && m_pageCount > 0;
}

bool MuPdfProvider::isLocked() const
{
    if (!m_doc) return false;
    return fz_needs_password(m_ctx, m_doc) != 0;
}

int MuPdfProvider::pageCount() const
{
    return m_pageCount;
}

QString MuPdfProvider::title() const
{
    return getMetadata(FZ_META_INFO_TITLE);
}

QString MuPdfProvider::filePath() const
{
    return m_path;
}

QString MuPdfProvider::getMetadata(const char* key) const
{
    if (!isValid()) return QString();

    char buf[256] = {0};
    fz_try(m_ctx) {
        fz_lookup_metadata(m_ctx, m_doc, key, buf, sizeof(buf));
    }
    fz_catch(m_ctx) {
        return QString();
    }

    return QString::fromUtf8(buf);
}

// ============================================================================
// Page Info
// ============================================================================

QSizeF MuPdfProvider::pageSize(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QSizeF();
    }

    fz_page* page = nullptr;
    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);
        bounds = fz_bound_page(m_ctx, page);
    }
    fz_always(m_ctx) {
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Cannot measure page" << pageIndex;
        return QSizeF();
    }

    return QSizeF(bounds.x1 - bounds.x0, bounds.y1 - bounds.y0);
}

// ============================================================================
// Rendering
// ============================================================================

QImage MuPdfProvider::renderPageToImage(int pageIndex, qreal dpi) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QImage();
    }

    // PDF points are 72 dpi
    const float scale = static_cast<float>(dpi / 72.0);

    fz_page* page = nullptr;
    fz_pixmap* pix = nullptr;
    QImage result;

    fz_try(m_ctx) {
        page = fz_load_page(m_ctx, m_doc, pageIndex);

        // Opaque RGB pixmap: the page background is white, popups are drawn
        // by the view as widgets on top
        pix = fz_new_pixmap_from_page(m_ctx, page, fz_scale(scale, scale),
                                      fz_device_rgb(m_ctx), 0);

        const int width = fz_pixmap_width(m_ctx, pix);
        const int height = fz_pixmap_height(m_ctx, pix);
        const int stride = static_cast<int>(fz_pixmap_stride(m_ctx, pix));
        const unsigned char* samples = fz_pixmap_samples(m_ctx, pix);

        // Deep copy: the pixmap is dropped below
        result = QImage(samples, width, height, stride, QImage::Format_RGB888).copy();
    }
    fz_always(m_ctx) {
        if (pix) fz_drop_pixmap(m_ctx, pix);
        if (page) fz_drop_page(m_ctx, page);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfProvider: Render failed for page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        return QImage();
    }

    return result;
}
