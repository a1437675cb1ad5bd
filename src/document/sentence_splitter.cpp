#include "lectern/document/sentence_splitter.hpp"
#include "lectern/document/text_utils.hpp"
#include "lectern/logger.hpp"

namespace lectern
{
namespace document
{

SentenceSplitter::SentenceSplitter(std::string text)
    : text_(std::move(text))
    , position_(0)
    , segmentable_(isValidUtf8(text_))
{
    if (!segmentable_)
    {
        ServerLogger::logDebug("Sentence splitter: input of %zu bytes is not valid UTF-8, keeping it as one sentence",
                               text_.size());
    }
}

bool SentenceSplitter::next(std::string& sentence)
{
    if (!segmentable_)
    {
        if (position_ >= text_.size())
        {
            return false;
        }
        position_ = text_.size();
        std::string whole = trim(text_);
        if (whole.empty())
        {
            return false;
        }
        sentence = std::move(whole);
        return true;
    }

    size_t start = position_;
    for (size_t i = position_; i < text_.size(); ++i)
    {
        if (isSentenceTerminal(text_[i]) && i > start)
        {
            std::string candidate = trim(text_.substr(start, i - start + 1));
            position_ = i + 1;
            if (!candidate.empty())
            {
                sentence = std::move(candidate);
                return true;
            }
            start = position_;
        }
    }

    if (start < text_.size())
    {
        std::string tail = trim(text_.substr(start));
        position_ = text_.size();
        if (!tail.empty())
        {
            sentence = std::move(tail);
            return true;
        }
    }

    position_ = text_.size();
    return false;
}

void SentenceSplitter::reset()
{
    position_ = 0;
}

std::vector<std::string> SentenceSplitter::split(const std::string& text)
{
    std::vector<std::string> sentences;
    SentenceSplitter splitter(text);
    std::string sentence;
    while (splitter.next(sentence))
    {
        sentences.push_back(sentence);
    }
    return sentences;
}

} // namespace document
} // namespace lectern
