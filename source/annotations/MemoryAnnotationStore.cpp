// ============================================================================
// MemoryAnnotationStore - Implementation
// ============================================================================

#include "MemoryAnnotationStore.h"

#include <QJsonObject>
#include <QDebug>
#include <algorithm>

MemoryAnnotationStore::MemoryAnnotationStore(int pageCount)
    : m_pageCount(std::max(pageCount, 0))
{
}

QVector<MarkupAnnotation*> MemoryAnnotationStore::annotations(int pageIndex) const
{
    QVector<MarkupAnnotation*> result;
    if (pageIndex < 0 || pageIndex >= m_pageCount) {
        return result;
    }
    for (const auto& annot : m_annotations) {
        if (annot->pageIndex == pageIndex) {
            result.append(annot.get());
        }
    }
    return result;
}

MarkupAnnotation* MemoryAnnotationStore::annotation(const AnnotationRef& ref) const
{
    if (ref.isNull()) {
        return nullptr;
    }
    auto it = std::find_if(m_annotations.begin(), m_annotations.end(),
                           [&ref](const std::unique_ptr<MarkupAnnotation>& annot) {
                               return annot->ref == ref;
                           });
    return it != m_annotations.end() ? it->get() : nullptr;
}

MarkupAnnotation* MemoryAnnotationStore::addAnnotation(int pageIndex,
                                                       std::unique_ptr<MarkupAnnotation> annotation)
{
    if (!annotation) {
        return nullptr;
    }
    if (pageIndex < 0 || pageIndex >= m_pageCount) {
        qWarning() << "MemoryAnnotationStore: Cannot add annotation to invalid page" << pageIndex;
        return nullptr;
    }

    annotation->pageIndex = pageIndex;
    if (annotation->ref.isNull() || this->annotation(annotation->ref)) {
        annotation->ref = AnnotationRef(m_nextObjectNumber);
    }

    MarkupAnnotation* stored = insertRecord(std::move(annotation));
    if (stored) {
        m_modified = true;
    }
    return stored;
}

bool MemoryAnnotationStore::removeAnnotation(const AnnotationRef& ref)
{
    auto it = std::find_if(m_annotations.begin(), m_annotations.end(),
                           [&ref](const std::unique_ptr<MarkupAnnotation>& annot) {
                               return annot->ref == ref;
                           });
    if (it == m_annotations.end()) {
        return false;
    }
    m_annotations.erase(it);
    m_modified = true;
    return true;
}

bool MemoryAnnotationStore::commit(const MarkupAnnotation& annotation)
{
    if (this->annotation(annotation.ref) != &annotation) {
        qDebug() << "MemoryAnnotationStore: Commit of unknown annotation" << annotation.ref.toString();
        return false;
    }
    m_modified = true;
    return true;
}

MarkupAnnotation* MemoryAnnotationStore::insertRecord(std::unique_ptr<MarkupAnnotation> annotation)
{
    if (!annotation || annotation->ref.isNull() || this->annotation(annotation->ref)) {
        return nullptr;
    }
    m_nextObjectNumber = std::max(m_nextObjectNumber, annotation->ref.objectNumber + 1);
    MarkupAnnotation* ptr = annotation.get();
    m_annotations.push_back(std::move(annotation));
    return ptr;
}

void MemoryAnnotationStore::clearRecords()
{
    m_annotations.clear();
    m_nextObjectNumber = 1;
    m_modified = false;
}

// ============================================================================
// Serialization
// ============================================================================

QJsonArray MemoryAnnotationStore::toJson() const
{
    QJsonArray array;
    for (const auto& annot : m_annotations) {
        array.append(annot->toJson());
    }
    return array;
}

int MemoryAnnotationStore::loadFromJson(const QJsonArray& array)
{
    clearRecords();

    int loaded = 0;
    for (const QJsonValue& value : array) {
        auto annot = std::make_unique<MarkupAnnotation>();
        annot->loadFromJson(value.toObject());

        if (annot->pageIndex < 0 || annot->pageIndex >= m_pageCount) {
            qDebug() << "MemoryAnnotationStore: Skipping annotation on invalid page" << annot->pageIndex;
            continue;
        }
        if (annot->ref.isNull()) {
            annot->ref = AnnotationRef(m_nextObjectNumber);
        }
        if (insertRecord(std::move(annot))) {
            ++loaded;
        }
    }
    return loaded;
}
