#ifndef LECTERN_TEXT_CHUNK_HPP
#define LECTERN_TEXT_CHUNK_HPP

#include "../export.hpp"
#include <json.hpp>
#include <string>
#include <utility>

namespace lectern
{
namespace document
{

/**
 * @brief One size-bounded unit of a document, ready to be read aloud.
 *
 * Instances are immutable once built. The constructor rejects text that is
 * blank, page numbers below 1 and negative chunk indices.
 */
class LECTERN_SERVER_API TextChunk
{
public:
    using Position = std::pair<double, double>;

    TextChunk(std::string text,
              int pageNumber,
              long long chunkIndex,
              Position startPosition = Position(0.0, 0.0),
              bool isSentenceStart = true);

    const std::string& text() const { return text_; }
    int pageNumber() const { return pageNumber_; }
    long long chunkIndex() const { return chunkIndex_; }
    const Position& startPosition() const { return startPosition_; }
    bool isSentenceStart() const { return isSentenceStart_; }

    nlohmann::json to_json() const;

    bool operator==(const TextChunk& other) const;
    bool operator!=(const TextChunk& other) const { return !(*this == other); }

private:
    std::string text_;
    int pageNumber_;
    long long chunkIndex_;
    Position startPosition_;
    bool isSentenceStart_;
};

} // namespace document
} // namespace lectern

#endif // LECTERN_TEXT_CHUNK_HPP
