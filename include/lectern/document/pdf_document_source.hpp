#pragma once

#include "../export.hpp"
#include "document_chunker.hpp"
#include <memory>
#include <string>

namespace lectern
{
namespace document
{

/**
 * @brief Page text of a PDF file, read with PoDoFo.
 *
 * The constructor loads the document and throws ExtractionFailed(0, ...) when it
 * is not a readable PDF or has no pages. Text entries of a page are joined with
 * single spaces.
 */
class LECTERN_SERVER_API PdfDocumentSource : public IDocumentTextSource
{
public:
    explicit PdfDocumentSource(const std::string& filePath);
    ~PdfDocumentSource() override;

    PdfDocumentSource(const PdfDocumentSource&) = delete;
    PdfDocumentSource& operator=(const PdfDocumentSource&) = delete;

    int pageCount() const override;
    std::string extractPage(int pageNumber) override;

    // Factory usable as a DocumentProcessor opener.
    static std::unique_ptr<IDocumentTextSource> open(const std::string& filePath);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace document
} // namespace lectern
