#include "lectern/document/text_chunk.hpp"
#include "lectern/document/text_utils.hpp"
#include <stdexcept>

namespace lectern
{
namespace document
{

TextChunk::TextChunk(std::string text,
                     int pageNumber,
                     long long chunkIndex,
                     Position startPosition,
                     bool isSentenceStart)
    : text_(std::move(text))
    , pageNumber_(pageNumber)
    , chunkIndex_(chunkIndex)
    , startPosition_(startPosition)
    , isSentenceStart_(isSentenceStart)
{
    if (isBlank(text_))
    {
        throw std::invalid_argument("chunk text must not be empty");
    }
    if (pageNumber_ < 1)
    {
        throw std::invalid_argument("page number must be positive, got " + std::to_string(pageNumber_));
    }
    if (chunkIndex_ < 0)
    {
        throw std::invalid_argument("chunk index must not be negative, got " + std::to_string(chunkIndex_));
    }
}

nlohmann::json TextChunk::to_json() const
{
    return nlohmann::json{
        {"text", text_},
        {"page_number", pageNumber_},
        {"chunk_index", chunkIndex_},
        {"start_position", {startPosition_.first, startPosition_.second}},
        {"is_sentence_start", isSentenceStart_}};
}

bool TextChunk::operator==(const TextChunk& other) const
{
    return text_ == other.text_ &&
           pageNumber_ == other.pageNumber_ &&
           chunkIndex_ == other.chunkIndex_ &&
           startPosition_ == other.startPosition_ &&
           isSentenceStart_ == other.isSentenceStart_;
}

} // namespace document
} // namespace lectern
