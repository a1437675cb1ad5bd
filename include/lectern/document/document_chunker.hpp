#ifndef LECTERN_DOCUMENT_CHUNKER_HPP
#define LECTERN_DOCUMENT_CHUNKER_HPP

#include "../export.hpp"
#include "chunk_builder.hpp"
#include "text_chunk.hpp"
#include <string>
#include <vector>

namespace lectern
{
namespace document
{

struct PageText
{
    int pageNumber;
    std::string text;
};

/**
 * @brief Per-page text extraction from an opened document.
 *
 * Implementations throw ExtractionFailed (or any std::exception, which the
 * chunker wraps with the page number) when a page cannot be read.
 */
class LECTERN_SERVER_API IDocumentTextSource
{
public:
    virtual ~IDocumentTextSource() = default;

    virtual int pageCount() const = 0;

    // pageNumber is 1-based.
    virtual std::string extractPage(int pageNumber) = 0;
};

/**
 * @brief Turns page text into one document-wide chunk sequence.
 *
 * Pages are chunked in order with ChunkBuilder. Blank pages are skipped, runs of
 * whitespace become single spaces, and a page without any '.', '!' or '?' gets
 * a closing '.'. Chunk indices run 0..N-1 across the whole document.
 */
class LECTERN_SERVER_API DocumentChunker
{
public:
    explicit DocumentChunker(size_t maxChunkSize = ChunkBuilder::kDefaultMaxChunkSize);

    std::vector<TextChunk> chunkPages(const std::vector<PageText>& pages) const;

    // Any page failure aborts the whole document with ExtractionFailed(page).
    std::vector<TextChunk> chunkDocument(IDocumentTextSource& source) const;

    size_t maxChunkSize() const { return maxChunkSize_; }

    // Whitespace-collapsed page text with a closing '.' when it has no terminal
    // mark, or an empty string for a blank page.
    static std::string normalizePage(const std::string& raw);

private:
    void appendPage(std::vector<TextChunk>& chunks, int pageNumber, const std::string& raw) const;

    size_t maxChunkSize_;
};

} // namespace document
} // namespace lectern

#endif // LECTERN_DOCUMENT_CHUNKER_HPP
