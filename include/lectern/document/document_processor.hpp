#ifndef LECTERN_DOCUMENT_PROCESSOR_HPP
#define LECTERN_DOCUMENT_PROCESSOR_HPP

#include "../export.hpp"
#include "document_chunker.hpp"
#include "text_chunk.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lectern
{
namespace document
{

using DocumentOpener = std::function<std::unique_ptr<IDocumentTextSource>(const std::string& path)>;

// Deletes the file it names when it goes out of scope.
class LECTERN_SERVER_API ScopedTempFile
{
public:
    explicit ScopedTempFile(std::filesystem::path path);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // Writes `content` to the file, replacing anything already there.
    void write(const std::string& content) const;

private:
    std::filesystem::path path_;
};

/**
 * @brief Turns the bytes of an uploaded document into chunks.
 *
 * The content is spooled to a uniquely named file under the temp directory,
 * opened with the document opener (PoDoFo by default) and chunked page by page.
 * The spooled file is removed on every path out of process().
 */
class LECTERN_SERVER_API DocumentProcessor
{
public:
    // An empty tempDir means <system temp>/lectern.
    DocumentProcessor(const std::string& tempDir = "",
                      size_t maxChunkSize = ChunkBuilder::kDefaultMaxChunkSize,
                      DocumentOpener opener = nullptr);

    /**
     * @brief Extracts and chunks one document.
     * @param content Raw document bytes
     * @param filename Name the client gave the upload; used for logging only
     * @return Chunks indexed 0..N-1; empty when the document has no text
     * @throws ValidationError when content is empty
     * @throws ExtractionFailed when the document cannot be read
     */
    std::vector<TextChunk> process(const std::string& content, const std::string& filename) const;

    const std::filesystem::path& tempDirectory() const { return tempDir_; }

private:
    std::filesystem::path uniqueTempPath() const;

    std::filesystem::path tempDir_;
    DocumentChunker chunker_;
    DocumentOpener opener_;
};

} // namespace document
} // namespace lectern

#endif // LECTERN_DOCUMENT_PROCESSOR_HPP
