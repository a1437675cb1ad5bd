#ifndef LECTERN_SENTENCE_SPLITTER_HPP
#define LECTERN_SENTENCE_SPLITTER_HPP

#include "../export.hpp"
#include <string>
#include <vector>

namespace lectern
{
namespace document
{

/**
 * @brief Cursor over the sentences of a text.
 *
 * A sentence ends at '.', '!' or '?' when at least one character precedes the
 * mark in the sentence being accumulated. A trailing fragment without a mark is
 * returned as the last sentence. Sentences are trimmed; blank ones are skipped.
 *
 * Text that is not valid UTF-8 is not segmented: the whole trimmed input comes
 * back as a single sentence.
 */
class LECTERN_SERVER_API SentenceSplitter
{
public:
    explicit SentenceSplitter(std::string text);

    /**
     * @brief Advances to the next sentence.
     * @param sentence Receives the sentence when one is available
     * @return false once the text is exhausted
     */
    bool next(std::string& sentence);

    // Rewinds to the first sentence.
    void reset();

    bool segmentable() const { return segmentable_; }

    // Convenience: all sentences of `text` in order.
    static std::vector<std::string> split(const std::string& text);

private:
    std::string text_;
    size_t position_;
    bool segmentable_;
};

} // namespace document
} // namespace lectern

#endif // LECTERN_SENTENCE_SPLITTER_HPP
