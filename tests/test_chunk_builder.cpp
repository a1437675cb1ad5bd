#include "test_common.h"
#include "lectern/document/chunk_builder.hpp"
#include <stdexcept>

using lectern::document::ChunkBuilder;
using lectern::document::TextChunk;
using lectern::document::utf8Length;
using lectern::document::splitWords;

namespace {

std::string join_chunks(const std::vector<TextChunk> &chunks) {
    std::string all;
    for (const auto &c : chunks) { if (!all.empty()) all += ' '; all += c.text(); }
    return all;
}

// Every chunk fits, or is a single word that does not fit anywhere.
bool within_limit(const std::vector<TextChunk> &chunks, size_t max) {
    for (const auto &c : chunks) {
        if (utf8Length(c.text()) <= max) continue;
        if (splitWords(c.text()).size() != 1) return false;
    }
    return true;
}

bool indices_dense(const std::vector<TextChunk> &chunks, long long first = 0) {
    for (size_t i = 0; i < chunks.size(); ++i)
        if (chunks[i].chunkIndex() != first + static_cast<long long>(i)) return false;
    return true;
}

} // namespace

int main() {
    int failures = 0;

    {
        const std::string text = "First sentence. Second sentence. Third sentence.";
        auto chunks = ChunkBuilder::build(text, 1, 100);
        CHECK(!chunks.empty());
        if (!chunks.empty()) CHECK(chunks[0].text().rfind("First sentence", 0) == 0);
        CHECK(word_counts(join_chunks(chunks)) == word_counts(text));
        CHECK(indices_dense(chunks));
        for (const auto &c : chunks) CHECK(c.pageNumber() == 1);
    }

    // no sentence marks, 150 characters, limit 50
    {
        std::string text;
        for (int i = 0; i < 30; ++i) text += "word ";
        auto chunks = ChunkBuilder::build(text, 1, 50);
        CHECK(chunks.size() >= 3);
        for (const auto &c : chunks) CHECK(utf8Length(c.text()) <= 50);
        CHECK(word_counts(join_chunks(chunks)) == word_counts(text));
        CHECK(indices_dense(chunks));
    }

    // sentences pack greedily
    {
        auto chunks = ChunkBuilder::build("Aaaa. Bbbb. Cccc.", 2, 11);
        CHECK(chunks.size() == 2);
        if (chunks.size() == 2) {
            CHECK(chunks[0].text() == "Aaaa. Bbbb.");
            CHECK(chunks[1].text() == "Cccc.");
            CHECK(chunks[1].pageNumber() == 2);
        }
    }

    // a sentence exactly at the limit stays intact
    {
        std::string sentence = "abcd efgh.";
        auto chunks = ChunkBuilder::build(sentence, 1, utf8Length(sentence));
        CHECK(chunks.size() == 1);
        if (chunks.size() == 1) CHECK(chunks[0].text() == sentence);
    }

    // an over-long word is emitted whole
    {
        std::string text = "tiny supercalifragilisticexpialidocious tiny";
        auto chunks = ChunkBuilder::build(text, 1, 10);
        CHECK(within_limit(chunks, 10));
        CHECK(word_counts(join_chunks(chunks)) == word_counts(text));
        bool found = false;
        for (const auto &c : chunks) if (c.text() == "supercalifragilisticexpialidocious") found = true;
        CHECK(found);
    }

    // lengths are code points, not bytes
    {
        std::string text = "ééééé ééééé.";  // 12 code points, 22 bytes
        auto chunks = ChunkBuilder::build(text, 1, 12);
        CHECK(chunks.size() == 1);
    }

    // empty and whitespace-only text produce nothing
    CHECK(ChunkBuilder::build("", 1, 100).empty());
    CHECK(ChunkBuilder::build(" \n\t  ", 1, 100).empty());

    // deterministic
    {
        std::string text = "Lorem ipsum dolor sit amet. Consectetur adipiscing elit! Sed do eiusmod tempor? Incididunt ut labore.";
        for (size_t max : std::vector<size_t>{1, 5, 17, 40, 2000}) {
            auto a = ChunkBuilder::build(text, 3, max);
            auto b = ChunkBuilder::build(text, 3, max);
            CHECK(a == b);
            CHECK(within_limit(a, max));
            CHECK(indices_dense(a));
            CHECK(word_counts(join_chunks(a)) == word_counts(text));
        }
    }

    // cursor form, first index offset and pre-split sentences
    {
        ChunkBuilder builder(std::vector<std::string>{"One two.", "Three four.", "Five."}, 4, 9, 7);
        CHECK(builder.nextIndex() == 7);
        auto first = builder.next();
        CHECK(first.has_value());
        if (first) CHECK(first->chunkIndex() == 7);
        auto rest = builder.collect();
        // "Three four." is over the limit on its own and is cut at the space
        CHECK(rest.size() == 3);
        CHECK(indices_dense(rest, 8));
        CHECK(!builder.next().has_value());
    }

    CHECK_THROWS(ChunkBuilder("text", 1, 0), std::invalid_argument);
    CHECK_THROWS(ChunkBuilder("text", 0, 10), std::invalid_argument);
    CHECK_THROWS(ChunkBuilder("text", 1, 10, -1), std::invalid_argument);

    // chunk value type
    CHECK_THROWS(TextChunk("   ", 1, 0), std::invalid_argument);
    CHECK_THROWS(TextChunk("text", 0, 0), std::invalid_argument);
    CHECK_THROWS(TextChunk("text", 1, -1), std::invalid_argument);
    {
        TextChunk c("hello.", 2, 5);
        CHECK(c.chunkIndex() == 5);
        CHECK(c.text() == "hello.");
        auto j = c.to_json();
        CHECK(j["page_number"] == 2);
        CHECK(j["chunk_index"] == 5);
    }

    return report("chunk_builder", failures);
}
