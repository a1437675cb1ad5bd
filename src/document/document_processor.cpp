#include "lectern/document/document_processor.hpp"
#include "lectern/document/pdf_document_source.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace lectern
{
namespace document
{

ScopedTempFile::ScopedTempFile(std::filesystem::path path) : path_(std::move(path))
{
}

ScopedTempFile::~ScopedTempFile()
{
    std::error_code ec;
    if (std::filesystem::exists(path_, ec))
    {
        std::filesystem::remove(path_, ec);
        if (ec)
        {
            ServerLogger::logWarning("Failed to remove temporary file %s: %s",
                                     path_.string().c_str(), ec.message().c_str());
        }
    }
}

void ScopedTempFile::write(const std::string& content) const
{
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Cannot create temporary file " + path_.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out)
    {
        throw std::runtime_error("Cannot write temporary file " + path_.string());
    }
}

DocumentProcessor::DocumentProcessor(const std::string& tempDir, size_t maxChunkSize, DocumentOpener opener)
    : tempDir_(tempDir.empty() ? std::filesystem::temp_directory_path() / "lectern"
                               : std::filesystem::path(tempDir)),
      chunker_(maxChunkSize),
      opener_(opener ? std::move(opener) : DocumentOpener(&PdfDocumentSource::open))
{
    std::filesystem::create_directories(tempDir_);
}

std::filesystem::path DocumentProcessor::uniqueTempPath() const
{
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream name;
    name << "upload_" << std::hex << std::setfill('0') << std::setw(16) << rng() << ".pdf";
    return tempDir_ / name.str();
}

std::vector<TextChunk> DocumentProcessor::process(const std::string& content, const std::string& filename) const
{
    if (content.empty())
    {
        throw ValidationError("Empty PDF file");
    }

    ScopedTempFile spool(uniqueTempPath());
    spool.write(content);

    try
    {
        auto source = opener_(spool.path().string());
        if (!source)
        {
            throw ExtractionFailed(0, "Unable to open document");
        }

        auto chunks = chunker_.chunkDocument(*source);
        ServerLogger::logInfo("Processed '%s' (%zu bytes) into %zu chunks",
                              filename.c_str(), content.size(), chunks.size());
        return chunks;
    }
    catch (const LecternError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ExtractionFailed(0, std::string("Error processing PDF: ") + e.what());
    }
}

} // namespace document
} // namespace lectern
