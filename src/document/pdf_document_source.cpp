#include "lectern/document/pdf_document_source.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <podofo/podofo.h>
#include <filesystem>
#include <sstream>
#include <vector>

using namespace PoDoFo;

namespace lectern
{
namespace document
{

class PdfDocumentSource::Impl
{
public:
    PdfMemDocument doc;
    int pages = 0;
};

PdfDocumentSource::PdfDocumentSource(const std::string& filePath) : pImpl(std::make_unique<Impl>())
{
    if (!std::filesystem::is_regular_file(filePath))
    {
        throw ExtractionFailed(0, "PDF file not found: " + filePath);
    }

    try
    {
        pImpl->doc.Load(filePath);
        pImpl->pages = static_cast<int>(pImpl->doc.GetPages().GetCount());
    }
    catch (const std::exception& e)
    {
        throw ExtractionFailed(0, std::string("Invalid PDF format: ") + e.what());
    }

    if (pImpl->pages <= 0)
    {
        throw ExtractionFailed(0, "PDF has no pages");
    }

    ServerLogger::logDebug("Opened PDF %s with %d pages", filePath.c_str(), pImpl->pages);
}

PdfDocumentSource::~PdfDocumentSource() = default;

int PdfDocumentSource::pageCount() const
{
    return pImpl->pages;
}

std::string PdfDocumentSource::extractPage(int pageNumber)
{
    if (pageNumber < 1 || pageNumber > pImpl->pages)
    {
        throw ExtractionFailed(pageNumber, "Page index out of range");
    }

    try
    {
        auto& page = pImpl->doc.GetPages().GetPageAt(static_cast<unsigned>(pageNumber - 1));

        std::vector<PdfTextEntry> entries;
        page.ExtractTextTo(entries);

        std::ostringstream output;
        for (size_t i = 0; i < entries.size(); ++i)
        {
            if (i > 0)
            {
                output << ' ';
            }
            output << entries[i].Text;
        }
        return output.str();
    }
    catch (const std::exception& e)
    {
        throw ExtractionFailed(pageNumber, e.what());
    }
}

std::unique_ptr<IDocumentTextSource> PdfDocumentSource::open(const std::string& filePath)
{
    return std::make_unique<PdfDocumentSource>(filePath);
}

} // namespace document
} // namespace lectern
