#include "test_common.h"
#include "lectern/document/document_chunker.hpp"
#include "lectern/document/document_processor.hpp"
#include "lectern/errors.hpp"
#include <fstream>
#include <memory>
#include <stdexcept>

using namespace lectern;
using namespace lectern::document;

namespace {

class FakeDocument : public IDocumentTextSource {
public:
    explicit FakeDocument(std::vector<std::string> pages, int failingPage = 0)
        : pages_(std::move(pages)), failingPage_(failingPage) {}

    int pageCount() const override { return static_cast<int>(pages_.size()); }

    std::string extractPage(int pageNumber) override {
        if (pageNumber == failingPage_) throw std::runtime_error("bad content stream");
        return pages_.at(static_cast<size_t>(pageNumber - 1));
    }

private:
    std::vector<std::string> pages_;
    int failingPage_;
};

class BrokenDocument : public IDocumentTextSource {
public:
    int pageCount() const override { throw std::runtime_error("no page tree"); }
    std::string extractPage(int) override { return ""; }
};

size_t files_in(const std::filesystem::path &dir) {
    size_t n = 0;
    for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) ++n;
    return n;
}

} // namespace

int main() {
    int failures = 0;

    CHECK(DocumentChunker::normalizePage("  hello \n\n  world  ") == "hello world.");
    CHECK(DocumentChunker::normalizePage("Already ends here!") == "Already ends here!");
    CHECK(DocumentChunker::normalizePage(" \t\n ").empty());

    // indices run across pages, blank pages are skipped
    {
        DocumentChunker chunker(20);
        FakeDocument doc({"Page one has words. And more words here.", "   ", "Page three."});
        auto chunks = chunker.chunkDocument(doc);
        CHECK(chunks.size() >= 3);
        for (size_t i = 0; i < chunks.size(); ++i) CHECK(chunks[i].chunkIndex() == static_cast<long long>(i));
        bool sawPage2 = false;
        for (const auto &c : chunks) if (c.pageNumber() == 2) sawPage2 = true;
        CHECK(!sawPage2);
        CHECK(chunks.back().pageNumber() == 3);
        CHECK(chunks.back().text() == "Page three.");
    }

    // same result through chunkPages
    {
        DocumentChunker chunker(20);
        FakeDocument doc({"Alpha beta gamma", "Delta."});
        auto a = chunker.chunkDocument(doc);
        auto b = chunker.chunkPages({{1, "Alpha beta gamma"}, {2, "Delta."}});
        CHECK(a == b);
        CHECK(!a.empty());
        if (!a.empty()) CHECK(a[0].text() == "Alpha beta gamma.");
    }

    // a failing page aborts the document and names the page
    {
        DocumentChunker chunker(100);
        FakeDocument doc({"Fine.", "Also fine.", "Never read."}, 2);
        bool caught = false;
        try { chunker.chunkDocument(doc); }
        catch (const ExtractionFailed &e) {
            caught = true;
            CHECK(e.page() == 2);
            CHECK(std::string(e.what()).find("page 2") != std::string::npos);
        }
        CHECK(caught);
    }

    {
        DocumentChunker chunker(100);
        BrokenDocument doc;
        bool caught = false;
        try { chunker.chunkDocument(doc); }
        catch (const ExtractionFailed &e) { caught = true; CHECK(e.page() == 0); }
        CHECK(caught);
    }

    CHECK_THROWS(DocumentChunker(0), std::invalid_argument);

    // upload processing: spooled file is visible to the opener and gone afterwards
    {
        auto dir = make_temp_dir("lectern_processor_test");
        std::string seenPath;
        std::string seenContent;
        DocumentProcessor processor(dir.string(), 50, [&](const std::string &path) {
            seenPath = path;
            std::ifstream in(path, std::ios::binary);
            seenContent.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            return std::unique_ptr<IDocumentTextSource>(new FakeDocument({"Hello there. General Kenobi."}));
        });

        auto chunks = processor.process("%PDF-1.4 fake bytes", "talk.pdf");
        CHECK(!chunks.empty());
        CHECK(seenContent == "%PDF-1.4 fake bytes");
        CHECK(!seenPath.empty());
        CHECK(!std::filesystem::exists(seenPath));
        CHECK(files_in(dir) == 0);
        CHECK(processor.tempDirectory() == dir);

        std::filesystem::remove_all(dir);
    }

    // cleanup on failure too
    {
        auto dir = make_temp_dir("lectern_processor_fail");
        DocumentProcessor failing(dir.string(), 50, [](const std::string &) -> std::unique_ptr<IDocumentTextSource> {
            throw std::runtime_error("not a PDF");
        });
        bool caught = false;
        try { failing.process("garbage", "x.pdf"); }
        catch (const ExtractionFailed &e) {
            caught = true;
            CHECK(std::string(e.what()).find("not a PDF") != std::string::npos);
        }
        CHECK(caught);
        CHECK(files_in(dir) == 0);

        DocumentProcessor pageFailure(dir.string(), 50, [](const std::string &) {
            return std::unique_ptr<IDocumentTextSource>(new FakeDocument({"ok.", "boom"}, 2));
        });
        CHECK_THROWS(pageFailure.process("bytes", "y.pdf"), ExtractionFailed);
        CHECK(files_in(dir) == 0);

        CHECK_THROWS(pageFailure.process("", "empty.pdf"), ValidationError);

        std::filesystem::remove_all(dir);
    }

    // an unwritable spool directory is an I/O fault, not a bad document
    {
        auto dir = make_temp_dir("lectern_processor_gone");
        bool opened = false;
        DocumentProcessor processor(dir.string(), 50, [&](const std::string &) {
            opened = true;
            return std::unique_ptr<IDocumentTextSource>(new FakeDocument({"never read."}));
        });
        std::filesystem::remove_all(dir);

        bool extraction = false;
        bool io = false;
        try { processor.process("%PDF-1.4", "z.pdf"); }
        catch (const ExtractionFailed &) { extraction = true; }
        catch (const std::runtime_error &e) {
            io = true;
            CHECK(std::string(e.what()).find("Cannot create temporary file") != std::string::npos);
        }
        CHECK(!extraction);
        CHECK(io);
        CHECK(!opened);
    }

    return report("document_chunker", failures);
}
