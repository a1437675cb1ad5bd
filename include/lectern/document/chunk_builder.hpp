#ifndef LECTERN_CHUNK_BUILDER_HPP
#define LECTERN_CHUNK_BUILDER_HPP

#include "../export.hpp"
#include "text_chunk.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lectern
{
namespace document
{

/**
 * @brief Groups sentences into chunks of at most maxChunkSize characters.
 *
 * Sentences are packed greedily and joined with single spaces. A sentence that
 * alone exceeds the limit is cut at word boundaries with the same greedy fill;
 * a single word longer than the limit is emitted whole rather than truncated.
 * A sentence exactly as long as the limit stays intact.
 *
 * Lengths are counted in Unicode code points. Chunk indices start at firstIndex
 * and increase by one per emitted chunk.
 *
 * The builder is a cursor: next() produces one chunk at a time and pulls only
 * as many sentences as it needs.
 */
class LECTERN_SERVER_API ChunkBuilder
{
public:
    static constexpr size_t kDefaultMaxChunkSize = 2000;

    // Chunks the sentences of `text` (split with SentenceSplitter).
    ChunkBuilder(const std::string& text,
                 int pageNumber,
                 size_t maxChunkSize = kDefaultMaxChunkSize,
                 long long firstIndex = 0);

    // Chunks an already split sentence sequence.
    ChunkBuilder(std::vector<std::string> sentences,
                 int pageNumber,
                 size_t maxChunkSize = kDefaultMaxChunkSize,
                 long long firstIndex = 0);

    std::optional<TextChunk> next();

    // Index the next emitted chunk will carry.
    long long nextIndex() const { return nextIndex_; }

    // Drains the builder.
    std::vector<TextChunk> collect();

    static std::vector<TextChunk> build(const std::string& text,
                                        int pageNumber,
                                        size_t maxChunkSize = kDefaultMaxChunkSize,
                                        long long firstIndex = 0);

private:
    using SentenceSource = std::function<bool(std::string&)>;

    ChunkBuilder(SentenceSource source, int pageNumber, size_t maxChunkSize, long long firstIndex);

    void consume(const std::string& sentence);
    void flushPending();
    void splitOversized(const std::string& sentence);
    void emit(std::string text);

    SentenceSource source_;
    int pageNumber_;
    size_t maxChunkSize_;
    long long nextIndex_;
    bool exhausted_;

    std::vector<std::string> pending_;
    size_t pendingLength_;
    std::deque<TextChunk> ready_;
};

} // namespace document
} // namespace lectern

#endif // LECTERN_CHUNK_BUILDER_HPP
