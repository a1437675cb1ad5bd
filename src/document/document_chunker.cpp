#include "lectern/document/document_chunker.hpp"
#include "lectern/document/text_utils.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <stdexcept>

namespace lectern
{
namespace document
{

DocumentChunker::DocumentChunker(size_t maxChunkSize) : maxChunkSize_(maxChunkSize)
{
    if (maxChunkSize_ < 1)
    {
        throw std::invalid_argument("max chunk size must be at least 1");
    }
}

std::string DocumentChunker::normalizePage(const std::string& raw)
{
    std::string text = collapseWhitespace(raw);
    if (text.empty())
    {
        return text;
    }
    if (!hasSentenceTerminal(text))
    {
        text += '.';
    }
    return text;
}

void DocumentChunker::appendPage(std::vector<TextChunk>& chunks, int pageNumber, const std::string& raw) const
{
    const std::string text = normalizePage(raw);
    if (text.empty())
    {
        ServerLogger::logDebug("Page %d has no text, skipping", pageNumber);
        return;
    }

    ChunkBuilder builder(text, pageNumber, maxChunkSize_, static_cast<long long>(chunks.size()));
    while (auto chunk = builder.next())
    {
        chunks.push_back(std::move(*chunk));
    }
}

std::vector<TextChunk> DocumentChunker::chunkPages(const std::vector<PageText>& pages) const
{
    std::vector<TextChunk> chunks;
    for (const auto& page : pages)
    {
        appendPage(chunks, page.pageNumber, page.text);
    }
    return chunks;
}

std::vector<TextChunk> DocumentChunker::chunkDocument(IDocumentTextSource& source) const
{
    int pageCount = 0;
    try
    {
        pageCount = source.pageCount();
    }
    catch (const ExtractionFailed&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ExtractionFailed(0, std::string("Error processing PDF: ") + e.what());
    }

    std::vector<TextChunk> chunks;
    for (int page = 1; page <= pageCount; ++page)
    {
        std::string raw;
        try
        {
            raw = source.extractPage(page);
        }
        catch (const ExtractionFailed& e)
        {
            if (e.page() > 0)
            {
                throw;
            }
            throw ExtractionFailed(page, e.what());
        }
        catch (const std::exception& e)
        {
            throw ExtractionFailed(page, e.what());
        }

        appendPage(chunks, page, raw);
    }

    ServerLogger::logDebug("Chunked %d pages into %zu chunks", pageCount, chunks.size());
    return chunks;
}

} // namespace document
} // namespace lectern
