#include "AnnotationSettings.h"

#include <QSettings>
#include <QtGlobal>

AnnotationSettings AnnotationSettings::load()
{
    QSettings settings("MarkupView", "App");
    AnnotationSettings result;

    result.userName = settings.value("annotations/userName", systemUserName()).toString();
    if (result.userName.isEmpty()) {
        result.userName = systemUserName();
    }
    result.publicByDefault = settings.value("annotations/publicByDefault", true).toBool();
    result.privatePropertyEnabled = settings.value("annotations/privatePropertyEnabled", false).toBool();
    result.interactiveAnnotations = settings.value("annotations/interactive", true).toBool();

    qreal fontSize = settings.value("annotations/defaultFontSize", 12.0).toDouble();
    if (fontSize < 4.0 || fontSize > 96.0) {
        fontSize = 12.0; // Out of range, back to default
    }
    result.defaultFontSize = fontSize;

    return result;
}

void AnnotationSettings::save() const
{
    QSettings settings("MarkupView", "App");
    settings.setValue("annotations/userName", userName);
    settings.setValue("annotations/publicByDefault", publicByDefault);
    settings.setValue("annotations/privatePropertyEnabled", privatePropertyEnabled);
    settings.setValue("annotations/interactive", interactiveAnnotations);
    settings.setValue("annotations/defaultFontSize", defaultFontSize);
}

QString AnnotationSettings::systemUserName()
{
    QString name = qEnvironmentVariable("USER");
    if (name.isEmpty()) {
        name = qEnvironmentVariable("USERNAME");
    }
    return name;
}
