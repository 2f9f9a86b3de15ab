// ============================================================================
// MuPdfAnnotationStore - Implementation
// ============================================================================

#include "MuPdfAnnotationStore.h"
#include "../annotations/PageSpaceMapper.h"

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <QDebug>
#include <QFileInfo>

// ============================================================================
// Helpers
// ============================================================================

static MarkupAnnotation::Subtype subtypeFromPdf(enum pdf_annot_type type)
{
    switch (type) {
    case PDF_ANNOT_TEXT:        return MarkupAnnotation::Subtype::Text;
    case PDF_ANNOT_FREE_TEXT:   return MarkupAnnotation::Subtype::FreeText;
    case PDF_ANNOT_HIGHLIGHT:   return MarkupAnnotation::Subtype::Highlight;
    case PDF_ANNOT_POLYGON:     return MarkupAnnotation::Subtype::Polygon;
    case PDF_ANNOT_SQUARE:      return MarkupAnnotation::Subtype::Square;
    case PDF_ANNOT_CIRCLE:      return MarkupAnnotation::Subtype::Circle;
    case PDF_ANNOT_INK:         return MarkupAnnotation::Subtype::Ink;
    case PDF_ANNOT_POPUP:       return MarkupAnnotation::Subtype::Popup;
    default:                    return MarkupAnnotation::Subtype::Other;
    }
}

static enum pdf_annot_type subtypeToPdf(MarkupAnnotation::Subtype type)
{
    switch (type) {
    case MarkupAnnotation::Subtype::FreeText:   return PDF_ANNOT_FREE_TEXT;
    case MarkupAnnotation::Subtype::Highlight:  return PDF_ANNOT_HIGHLIGHT;
    case MarkupAnnotation::Subtype::Polygon:    return PDF_ANNOT_POLYGON;
    case MarkupAnnotation::Subtype::Square:     return PDF_ANNOT_SQUARE;
    case MarkupAnnotation::Subtype::Circle:     return PDF_ANNOT_CIRCLE;
    case MarkupAnnotation::Subtype::Ink:        return PDF_ANNOT_INK;
    case MarkupAnnotation::Subtype::Popup:      return PDF_ANNOT_POPUP;
    default:                                    return PDF_ANNOT_TEXT;
    }
}

static AnnotationRef refOf(fz_context* ctx, pdf_obj* obj)
{
    if (!obj || !pdf_is_indirect(ctx, obj)) {
        return AnnotationRef();
    }
    return AnnotationRef(pdf_to_num(ctx, obj), pdf_to_gen(ctx, obj));
}

/**
 * @brief Read a /C color array (gray, RGB or CMYK).
 * @return The color, or an invalid QColor if the array is missing or empty.
 */
static QColor readColor(fz_context* ctx, pdf_obj* array)
{
    const int n = pdf_array_len(ctx, array);
    auto comp = [ctx, array](int i) {
        return qBound(0.0, static_cast<double>(pdf_array_get_real(ctx, array, i)), 1.0);
    };
    switch (n) {
    case 1:
        return QColor::fromRgbF(comp(0), comp(0), comp(0));
    case 3:
        return QColor::fromRgbF(comp(0), comp(1), comp(2));
    case 4:
        return QColor::fromCmykF(comp(0), comp(1), comp(2), comp(3));
    default:
        return QColor();
    }
}

static QDateTime readDate(fz_context* ctx, pdf_obj* dict, pdf_obj* key)
{
    const int64_t secs = pdf_dict_get_date(ctx, dict, key);
    return secs > 0 ? QDateTime::fromSecsSinceEpoch(secs) : QDateTime();
}

static void putRef(fz_context* ctx, pdf_document* doc, pdf_obj* dict, pdf_obj* key,
                   const AnnotationRef& ref)
{
    if (ref.isNull()) {
        pdf_dict_del(ctx, dict, key);
    } else {
        pdf_dict_put_drop(ctx, dict, key, pdf_new_indirect(ctx, doc, ref.objectNumber, ref.generation));
    }
}

static void putText(fz_context* ctx, pdf_obj* dict, const char* key, const QString& text)
{
    if (text.isEmpty()) {
        pdf_dict_dels(ctx, dict, key);
    } else {
        pdf_dict_puts_drop(ctx, dict, key, pdf_new_text_string(ctx, text.toUtf8().constData()));
    }
}

// ============================================================================
// Construction / Destruction
// ============================================================================

MuPdfAnnotationStore::MuPdfAnnotationStore(const QString& pdfPath)
    : MemoryAnnotationStore(0)
    , m_path(pdfPath)
{
    m_ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Failed to create MuPDF context";
        return;
    }

    const QByteArray pathUtf8 = pdfPath.toUtf8();
    int pageCount = 0;
    fz_try(m_ctx) {
        m_doc = pdf_open_document(m_ctx, pathUtf8.constData());
        pageCount = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Failed to open" << pdfPath
                   << "-" << fz_caught_message(m_ctx);
        if (m_doc) {
            pdf_drop_document(m_ctx, m_doc);
            m_doc = nullptr;
        }
        return;
    }

    m_pageCount = pageCount;
    m_pages.fill(nullptr, pageCount);
    loadAnnotations();
    setModified(false);

    qDebug() << "MuPdfAnnotationStore: Loaded" << count() << "annotations from" << pdfPath;
}

MuPdfAnnotationStore::~MuPdfAnnotationStore()
{
    clearRecords();
    if (m_ctx) {
        for (pdf_page* p : m_pages) {
            if (p) pdf_drop_page(m_ctx, p);
        }
        m_pages.clear();
        if (m_doc) {
            pdf_drop_document(m_ctx, m_doc);
            m_doc = nullptr;
        }
        fz_drop_context(m_ctx);
        m_ctx = nullptr;
    }
}

pdf_page* MuPdfAnnotationStore::page(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pages.size()) {
        return nullptr;
    }
    return m_pages[pageIndex];
}

// ============================================================================
// Loading
// ============================================================================

void MuPdfAnnotationStore::loadAnnotations()
{
    for (int i = 0; i < m_pageCount; ++i) {
        pdf_page* p = nullptr;
        fz_try(m_ctx) {
            p = pdf_load_page(m_ctx, m_doc, i);
        }
        fz_catch(m_ctx) {
            qWarning() << "MuPdfAnnotationStore: Cannot load page" << i
                       << "-" << fz_caught_message(m_ctx);
            continue;
        }
        m_pages[i] = p;

        for (pdf_annot* annot = pdf_first_annot(m_ctx, p); annot;
             annot = pdf_next_annot(m_ctx, annot)) {
            std::unique_ptr<MarkupAnnotation> record = readAnnotation(annot, i);
            if (!record) {
                continue;
            }
            const AnnotationRef ref = record->ref;
            if (!insertRecord(std::move(record))) {
                qWarning() << "MuPdfAnnotationStore: Skipping annotation" << ref.toString()
                           << "on page" << i;
            }
        }
    }
}

std::unique_ptr<MarkupAnnotation> MuPdfAnnotationStore::readAnnotation(pdf_annot* annot,
                                                                       int pageIndex) const
{
    auto record = std::make_unique<MarkupAnnotation>();
    bool ok = true;

    fz_try(m_ctx) {
        pdf_obj* obj = pdf_annot_obj(m_ctx, annot);

        record->ref = refOf(m_ctx, obj);
        record->pageIndex = pageIndex;
        record->subtype = subtypeFromPdf(pdf_annot_type(m_ctx, annot));

        const fz_rect r = pdf_to_rect(m_ctx, pdf_dict_get(m_ctx, obj, PDF_NAME(Rect)));
        record->rect = QRectF(r.x0, r.y0, r.x1 - r.x0, r.y1 - r.y0).normalized();
        record->flags = pdf_dict_get_int(m_ctx, obj, PDF_NAME(F));

        record->inReplyTo = refOf(m_ctx, pdf_dict_get(m_ctx, obj, PDF_NAME(IRT)));
        record->popupRef = refOf(m_ctx, pdf_dict_get(m_ctx, obj, PDF_NAME(Popup)));
        record->parentRef = refOf(m_ctx, pdf_dict_get(m_ctx, obj, PDF_NAME(Parent)));

        record->contents = QString::fromUtf8(pdf_dict_get_text_string(m_ctx, obj, PDF_NAME(Contents)));
        record->titleText = QString::fromUtf8(pdf_dict_get_text_string(m_ctx, obj, PDF_NAME(T)));
        record->stateModel = QString::fromUtf8(pdf_to_text_string(m_ctx, pdf_dict_gets(m_ctx, obj, "StateModel")));
        record->state = QString::fromUtf8(pdf_to_text_string(m_ctx, pdf_dict_gets(m_ctx, obj, "State")));
        record->open = pdf_dict_get_bool(m_ctx, obj, PDF_NAME(Open));

        const QColor color = readColor(m_ctx, pdf_dict_get(m_ctx, obj, PDF_NAME(C)));
        if (color.isValid()) {
            record->color = color;
        }

        record->creationDate = readDate(m_ctx, obj, PDF_NAME(CreationDate));
        record->modifiedDate = readDate(m_ctx, obj, PDF_NAME(M));
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Cannot read annotation on page" << pageIndex
                   << "-" << fz_caught_message(m_ctx);
        ok = false;
    }

    if (!ok || record->ref.isNull()) {
        return nullptr;
    }
    return record;
}

// ============================================================================
// Page geometry
// ============================================================================

QRectF MuPdfAnnotationStore::pageBoundary(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return QRectF();
    }

    fz_rect box = fz_empty_rect;
    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        pdf_obj* boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(CropBox));
        if (!boxObj) {
            boxObj = pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(MediaBox));
        }
        if (boxObj) {
            box = pdf_to_rect(m_ctx, boxObj);
        }
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: No page box for page" << pageIndex;
        return QRectF();
    }

    return QRectF(box.x0, box.y0, box.x1 - box.x0, box.y1 - box.y0).normalized();
}

int MuPdfAnnotationStore::pageRotation(int pageIndex) const
{
    if (!isValid() || pageIndex < 0 || pageIndex >= m_pageCount) {
        return 0;
    }

    int rotation = 0;
    fz_try(m_ctx) {
        pdf_obj* pageObj = pdf_lookup_page_obj(m_ctx, m_doc, pageIndex);
        rotation = pdf_to_int(m_ctx, pdf_dict_get_inheritable(m_ctx, pageObj, PDF_NAME(Rotate)));
    }
    fz_catch(m_ctx) {
        rotation = 0;
    }
    return PageSpaceMapper::normalizeRotation(rotation);
}

// ============================================================================
// Mutations
// ============================================================================

pdf_annot* MuPdfAnnotationStore::findAnnot(const AnnotationRef& ref, int pageIndex) const
{
    pdf_page* p = page(pageIndex);
    if (!p || ref.isNull()) {
        return nullptr;
    }
    for (pdf_annot* annot = pdf_first_annot(m_ctx, p); annot; annot = pdf_next_annot(m_ctx, annot)) {
        if (refOf(m_ctx, pdf_annot_obj(m_ctx, annot)) == ref) {
            return annot;
        }
    }
    return nullptr;
}

void MuPdfAnnotationStore::writeAnnotation(pdf_obj* obj, const MarkupAnnotation& annotation) const
{
    // Callers wrap this in fz_try
    const QRectF r = annotation.rect.normalized();
    pdf_dict_put_rect(m_ctx, obj, PDF_NAME(Rect),
                      fz_make_rect(static_cast<float>(r.left()), static_cast<float>(r.top()),
                                   static_cast<float>(r.right()), static_cast<float>(r.bottom())));
    pdf_dict_put_int(m_ctx, obj, PDF_NAME(F), annotation.flags);

    if (annotation.isMarkup()) {
        putRef(m_ctx, m_doc, obj, PDF_NAME(IRT), annotation.inReplyTo);
        putRef(m_ctx, m_doc, obj, PDF_NAME(Popup), annotation.popupRef);
        pdf_dict_put_text_string(m_ctx, obj, PDF_NAME(Contents), annotation.contents.toUtf8().constData());
        pdf_dict_put_text_string(m_ctx, obj, PDF_NAME(T), annotation.titleText.toUtf8().constData());
        putText(m_ctx, obj, "StateModel", annotation.stateModel);
        putText(m_ctx, obj, "State", annotation.state);

        pdf_obj* color = pdf_new_array(m_ctx, m_doc, 3);
        pdf_array_push_real(m_ctx, color, annotation.color.redF());
        pdf_array_push_real(m_ctx, color, annotation.color.greenF());
        pdf_array_push_real(m_ctx, color, annotation.color.blueF());
        pdf_dict_put_drop(m_ctx, obj, PDF_NAME(C), color);

        if (annotation.creationDate.isValid()) {
            pdf_dict_put_date(m_ctx, obj, PDF_NAME(CreationDate),
                              annotation.creationDate.toSecsSinceEpoch());
        }
    } else {
        putRef(m_ctx, m_doc, obj, PDF_NAME(Parent), annotation.parentRef);
    }

    if (annotation.subtype == MarkupAnnotation::Subtype::Text ||
        annotation.subtype == MarkupAnnotation::Subtype::Popup) {
        pdf_dict_put_bool(m_ctx, obj, PDF_NAME(Open), annotation.open);
    }
    if (annotation.modifiedDate.isValid()) {
        pdf_dict_put_date(m_ctx, obj, PDF_NAME(M), annotation.modifiedDate.toSecsSinceEpoch());
    }
}

MarkupAnnotation* MuPdfAnnotationStore::addAnnotation(int pageIndex,
                                                      std::unique_ptr<MarkupAnnotation> annotation)
{
    pdf_page* p = page(pageIndex);
    if (!annotation || !p) {
        qWarning() << "MuPdfAnnotationStore: Cannot add annotation to page" << pageIndex;
        return nullptr;
    }

    annotation->pageIndex = pageIndex;
    pdf_annot* created = nullptr;
    AnnotationRef ref;

    fz_try(m_ctx) {
        created = pdf_create_annot(m_ctx, p, subtypeToPdf(annotation->subtype));
        pdf_obj* obj = pdf_annot_obj(m_ctx, created);
        ref = refOf(m_ctx, obj);
        writeAnnotation(obj, *annotation);
        pdf_update_annot(m_ctx, created);
    }
    fz_always(m_ctx) {
        if (created) pdf_drop_annot(m_ctx, created);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Failed to create annotation -" << fz_caught_message(m_ctx);
        return nullptr;
    }

    annotation->ref = ref;
    MarkupAnnotation* stored = insertRecord(std::move(annotation));
    if (stored) {
        setModified(true);
    }
    return stored;
}

bool MuPdfAnnotationStore::removeAnnotation(const AnnotationRef& ref)
{
    const MarkupAnnotation* record = annotation(ref);
    if (!record) {
        return false;
    }

    const int pageIndex = record->pageIndex;
    pdf_annot* annot = findAnnot(ref, pageIndex);
    if (annot) {
        fz_try(m_ctx) {
            pdf_delete_annot(m_ctx, page(pageIndex), annot);
        }
        fz_catch(m_ctx) {
            qWarning() << "MuPdfAnnotationStore: Failed to delete" << ref.toString()
                       << "-" << fz_caught_message(m_ctx);
            return false;
        }
    } else {
        qDebug() << "MuPdfAnnotationStore:" << ref.toString() << "has no PDF object, dropping record";
    }

    return MemoryAnnotationStore::removeAnnotation(ref);
}

bool MuPdfAnnotationStore::commit(const MarkupAnnotation& annotation)
{
    if (!MemoryAnnotationStore::commit(annotation)) {
        return false;
    }

    pdf_annot* annot = findAnnot(annotation.ref, annotation.pageIndex);
    if (!annot) {
        qWarning() << "MuPdfAnnotationStore: No PDF object for" << annotation.ref.toString();
        return false;
    }

    fz_try(m_ctx) {
        writeAnnotation(pdf_annot_obj(m_ctx, annot), annotation);
        pdf_update_annot(m_ctx, annot);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Failed to write" << annotation.ref.toString()
                   << "-" << fz_caught_message(m_ctx);
        return false;
    }
    return true;
}

// ============================================================================
// Saving
// ============================================================================

bool MuPdfAnnotationStore::save(const QString& outputPath)
{
    if (!isValid()) {
        return false;
    }

    const QString target = outputPath.isEmpty() ? m_path : outputPath;
    const bool inPlace = QFileInfo(target) == QFileInfo(m_path);
    const QByteArray pathUtf8 = target.toUtf8();

    fz_try(m_ctx) {
        pdf_write_options opts = pdf_default_write_options;
        if (inPlace && pdf_can_be_saved_incrementally(m_ctx, m_doc)) {
            opts.do_incremental = 1;
        } else {
            opts.do_compress = 1;
        }
        pdf_save_document(m_ctx, m_doc, pathUtf8.constData(), &opts);
    }
    fz_catch(m_ctx) {
        qWarning() << "MuPdfAnnotationStore: Failed to save" << target
                   << "-" << fz_caught_message(m_ctx);
        return false;
    }

    setModified(false);
    qDebug() << "MuPdfAnnotationStore: Saved to" << target;
    return true;
}
