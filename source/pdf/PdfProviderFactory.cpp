// ============================================================================
// PdfProviderFactory - Platform-specific PDF renderer creation
// ============================================================================
// Selects the rendering backend for the target platform:
//   - Android: MuPDF (bundled dependencies)
//   - Alpine Linux (musl): MuPDF (avoids symbol collision with Poppler/OpenJPEG)
//   - Desktop (glibc): Poppler (system library)
//
// Annotations are always read and written through MuPDF
// (MuPdfAnnotationStore), independent of the renderer chosen here.
// ============================================================================

#include "PdfProvider.h"

#include <memory>

// ============================================================================
// Platform Detection
// ============================================================================
// On musl, both MuPDF and Poppler use OpenJPEG for JPEG2000. When both are
// loaded as shared libraries, MuPDF's custom allocators get called by
// Poppler's OpenJPEG, causing crashes. musl doesn't define __GLIBC__.
// ============================================================================

#if defined(Q_OS_ANDROID)
    #define MARKUPVIEW_USE_MUPDF 1

#elif defined(__linux__) && !defined(__GLIBC__)
    #define MARKUPVIEW_USE_MUPDF 1

#else
    #define MARKUPVIEW_USE_POPPLER 1

#endif

#ifdef MARKUPVIEW_USE_MUPDF
#include "MuPdfProvider.h"
using PdfProviderImpl = MuPdfProvider;
static const char* const kBackendName = "MuPDF";
#else
#include "PopplerPdfProvider.h"
using PdfProviderImpl = PopplerPdfProvider;
static const char* const kBackendName = "Poppler";
#endif

// ============================================================================
// Factory Methods
// ============================================================================

std::unique_ptr<PdfProvider> PdfProvider::create(const QString& pdfPath)
{
    auto provider = std::make_unique<PdfProviderImpl>(pdfPath);
    if (provider->isValid()) {
        return provider;
    }
    return nullptr;
}

QString PdfProvider::backendName()
{
    return QString::fromLatin1(kBackendName);
}
