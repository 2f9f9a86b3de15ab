// ============================================================================
// MarkupAnnotation - Implementation
// ============================================================================

#include "MarkupAnnotation.h"

#include <QLocale>

const QString MarkupAnnotation::STATE_MODEL_REVIEW = QStringLiteral("Review");
const QString MarkupAnnotation::STATE_REVIEW_ACCEPTED = QStringLiteral("Accepted");
const QString MarkupAnnotation::STATE_REVIEW_REJECTED = QStringLiteral("Rejected");
const QString MarkupAnnotation::STATE_REVIEW_CANCELLED = QStringLiteral("Cancelled");
const QString MarkupAnnotation::STATE_REVIEW_COMPLETED = QStringLiteral("Completed");
const QString MarkupAnnotation::STATE_REVIEW_NONE = QStringLiteral("None");

MarkupAnnotation::MarkupAnnotation(Subtype type)
    : subtype(type)
{
    creationDate = QDateTime::currentDateTime();
    modifiedDate = creationDate;
}

void MarkupAnnotation::setFlag(int flag, bool enabled)
{
    if (enabled) {
        flags |= flag;
    } else {
        flags &= ~flag;
    }
}

void MarkupAnnotation::touch()
{
    modifiedDate = QDateTime::currentDateTime();
}

QString MarkupAnnotation::formattedTitleText() const
{
    return titleText.isEmpty() ? QStringLiteral("Anonymous") : titleText;
}

QString MarkupAnnotation::formattedCreationDate() const
{
    if (!creationDate.isValid()) {
        return QString();
    }
    return QLocale().toString(creationDate, QLocale::ShortFormat);
}

QString MarkupAnnotation::displayText() const
{
    return titleText + QStringLiteral(" - ") + contents;
}

// ============================================================================
// Serialization
// ============================================================================

QJsonObject MarkupAnnotation::toJson() const
{
    QJsonObject obj;

    obj["type"] = subtypeToString(subtype);
    obj["num"] = ref.objectNumber;
    obj["gen"] = ref.generation;
    obj["page"] = pageIndex;
    obj["x"] = rect.x();
    obj["y"] = rect.y();
    obj["width"] = rect.width();
    obj["height"] = rect.height();
    obj["flags"] = flags;

    if (subtype == Subtype::Popup) {
        obj["parentNum"] = parentRef.objectNumber;
        obj["parentGen"] = parentRef.generation;
        obj["open"] = open;
        obj["textFontSize"] = textAreaFontSize;
        obj["headerFontSize"] = headerFontSize;
        return obj;
    }

    if (!inReplyTo.isNull()) {
        obj["irtNum"] = inReplyTo.objectNumber;
        obj["irtGen"] = inReplyTo.generation;
    }
    if (!popupRef.isNull()) {
        obj["popupNum"] = popupRef.objectNumber;
        obj["popupGen"] = popupRef.generation;
    }
    obj["contents"] = contents;
    obj["color"] = color.name(QColor::HexRgb);
    obj["title"] = titleText;
    obj["created"] = creationDate.toString(Qt::ISODate);
    obj["modified"] = modifiedDate.toString(Qt::ISODate);
    if (!stateModel.isEmpty()) {
        obj["stateModel"] = stateModel;
        obj["state"] = state;
    }

    return obj;
}

void MarkupAnnotation::loadFromJson(const QJsonObject& obj)
{
    subtype = subtypeFromString(obj["type"].toString());
    ref = AnnotationRef(obj["num"].toInt(), obj["gen"].toInt());
    pageIndex = obj["page"].toInt(0);
    rect = QRectF(obj["x"].toDouble(), obj["y"].toDouble(),
                  obj["width"].toDouble(), obj["height"].toDouble());
    flags = obj["flags"].toInt(FLAG_PRINT);

    if (subtype == Subtype::Popup) {
        parentRef = AnnotationRef(obj["parentNum"].toInt(), obj["parentGen"].toInt());
        open = obj["open"].toBool(false);
        textAreaFontSize = obj["textFontSize"].toDouble(DEFAULT_FONT_SIZE);
        headerFontSize = obj["headerFontSize"].toDouble(DEFAULT_FONT_SIZE);
        return;
    }

    inReplyTo = AnnotationRef(obj["irtNum"].toInt(), obj["irtGen"].toInt());
    popupRef = AnnotationRef(obj["popupNum"].toInt(), obj["popupGen"].toInt());
    contents = obj["contents"].toString();
    color = QColor(obj["color"].toString("#ffff00"));
    titleText = obj["title"].toString();
    creationDate = QDateTime::fromString(obj["created"].toString(), Qt::ISODate);
    modifiedDate = QDateTime::fromString(obj["modified"].toString(), Qt::ISODate);
    stateModel = obj["stateModel"].toString();
    state = obj["state"].toString();
}

QString MarkupAnnotation::subtypeToString(Subtype type)
{
    switch (type) {
        case Subtype::Text:      return QStringLiteral("Text");
        case Subtype::FreeText:  return QStringLiteral("FreeText");
        case Subtype::Highlight: return QStringLiteral("Highlight");
        case Subtype::Polygon:   return QStringLiteral("Polygon");
        case Subtype::Square:    return QStringLiteral("Square");
        case Subtype::Circle:    return QStringLiteral("Circle");
        case Subtype::Ink:       return QStringLiteral("Ink");
        case Subtype::Popup:     return QStringLiteral("Popup");
        case Subtype::Other:     break;
    }
    return QStringLiteral("Other");
}

MarkupAnnotation::Subtype MarkupAnnotation::subtypeFromString(const QString& name)
{
    if (name == "Text")      return Subtype::Text;
    if (name == "FreeText")  return Subtype::FreeText;
    if (name == "Highlight") return Subtype::Highlight;
    if (name == "Polygon")   return Subtype::Polygon;
    if (name == "Square")    return Subtype::Square;
    if (name == "Circle")    return Subtype::Circle;
    if (name == "Ink")       return Subtype::Ink;
    if (name == "Popup")     return Subtype::Popup;
    return Subtype::Other;
}
