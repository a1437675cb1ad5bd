#include "lectern/document/chunk_builder.hpp"
#include "lectern/document/sentence_splitter.hpp"
#include "lectern/document/text_utils.hpp"
#include <memory>
#include <stdexcept>

namespace lectern
{
namespace document
{

ChunkBuilder::ChunkBuilder(const std::string& text, int pageNumber, size_t maxChunkSize, long long firstIndex)
    : ChunkBuilder(
          [splitter = std::make_shared<SentenceSplitter>(text)](std::string& sentence) {
              return splitter->next(sentence);
          },
          pageNumber, maxChunkSize, firstIndex)
{
}

ChunkBuilder::ChunkBuilder(std::vector<std::string> sentences, int pageNumber, size_t maxChunkSize, long long firstIndex)
    : ChunkBuilder(
          [sentences = std::make_shared<std::vector<std::string>>(std::move(sentences)),
           position = size_t(0)](std::string& sentence) mutable {
              if (position >= sentences->size())
              {
                  return false;
              }
              sentence = (*sentences)[position++];
              return true;
          },
          pageNumber, maxChunkSize, firstIndex)
{
}

ChunkBuilder::ChunkBuilder(SentenceSource source, int pageNumber, size_t maxChunkSize, long long firstIndex)
    : source_(std::move(source))
    , pageNumber_(pageNumber)
    , maxChunkSize_(maxChunkSize)
    , nextIndex_(firstIndex)
    , exhausted_(false)
    , pendingLength_(0)
{
    if (maxChunkSize_ < 1)
    {
        throw std::invalid_argument("max chunk size must be at least 1");
    }
    if (pageNumber_ < 1)
    {
        throw std::invalid_argument("page number must be positive, got " + std::to_string(pageNumber_));
    }
    if (firstIndex < 0)
    {
        throw std::invalid_argument("first chunk index must not be negative");
    }
}

std::optional<TextChunk> ChunkBuilder::next()
{
    while (ready_.empty() && !exhausted_)
    {
        std::string sentence;
        if (!source_(sentence))
        {
            flushPending();
            exhausted_ = true;
            break;
        }
        consume(trim(sentence));
    }

    if (ready_.empty())
    {
        return std::nullopt;
    }

    TextChunk chunk = std::move(ready_.front());
    ready_.pop_front();
    return chunk;
}

std::vector<TextChunk> ChunkBuilder::collect()
{
    std::vector<TextChunk> chunks;
    while (auto chunk = next())
    {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

std::vector<TextChunk> ChunkBuilder::build(const std::string& text, int pageNumber, size_t maxChunkSize, long long firstIndex)
{
    ChunkBuilder builder(text, pageNumber, maxChunkSize, firstIndex);
    return builder.collect();
}

void ChunkBuilder::consume(const std::string& sentence)
{
    if (sentence.empty())
    {
        return;
    }

    const size_t length = utf8Length(sentence);
    const size_t separator = pending_.empty() ? 0 : 1;

    if (!pending_.empty() && pendingLength_ + separator + length > maxChunkSize_)
    {
        flushPending();
    }

    pendingLength_ += length + (pending_.empty() ? 0 : 1);
    pending_.push_back(sentence);

    if (pendingLength_ > maxChunkSize_)
    {
        // Only reachable when the sentence alone is over the limit
        pending_.pop_back();
        pendingLength_ = pending_.empty() ? 0 : pendingLength_ - length - 1;
        flushPending();
        splitOversized(sentence);
    }
}

void ChunkBuilder::flushPending()
{
    if (!pending_.empty())
    {
        emit(joinWithSpaces(pending_));
    }
    pending_.clear();
    pendingLength_ = 0;
}

void ChunkBuilder::splitOversized(const std::string& sentence)
{
    std::vector<std::string> words;
    size_t wordsLength = 0;

    for (auto& word : splitWords(sentence))
    {
        const size_t length = utf8Length(word);
        if (!words.empty() && wordsLength + 1 + length > maxChunkSize_)
        {
            emit(joinWithSpaces(words));
            words.clear();
            wordsLength = 0;
        }
        wordsLength += length + (words.empty() ? 0 : 1);
        words.push_back(std::move(word));
    }

    if (!words.empty())
    {
        emit(joinWithSpaces(words));
    }
}

void ChunkBuilder::emit(std::string text)
{
    ready_.emplace_back(std::move(text), pageNumber_, nextIndex_++);
}

} // namespace document
} // namespace lectern
