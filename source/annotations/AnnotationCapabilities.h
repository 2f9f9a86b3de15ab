#pragma once

// ============================================================================
// AnnotationCapabilities - What the view lets the user do with an annotation
// ============================================================================
// Part of the MarkupView annotation architecture
// ============================================================================

#include "MarkupAnnotation.h"

struct AnnotationCapabilities {
    bool editable = false;              ///< Contents can be edited
    bool rollover = false;              ///< Highlights while hovered
    bool movable = false;
    bool resizable = false;
    bool showInvisibleBorder = false;   ///< Draw a border even if /Border is 0

    /**
     * @brief Capabilities of the component that shows an annotation subtype.
     * @param subtype Annotation subtype.
     * @param annotation Optional record; read-only and locked records lose
     *                   edit and move capabilities.
     */
    static AnnotationCapabilities forSubtype(MarkupAnnotation::Subtype subtype,
                                             const MarkupAnnotation* annotation = nullptr)
    {
        AnnotationCapabilities caps;
        switch (subtype) {
        case MarkupAnnotation::Subtype::Popup:
            caps.editable = true;
            caps.movable = true;
            caps.resizable = true;
            break;
        case MarkupAnnotation::Subtype::Polygon:
            caps.editable = true;
            caps.rollover = true;
            caps.movable = true;
            caps.resizable = true;
            caps.showInvisibleBorder = true;
            break;
        default:
            caps.editable = true;
            caps.rollover = true;
            break;
        }

        if (annotation) {
            if (annotation->isReadOnly()) {
                caps.editable = false;
                caps.movable = false;
                caps.resizable = false;
            } else if (annotation->isLocked()) {
                caps.movable = false;
                caps.resizable = false;
            }
        }
        return caps;
    }
};
