#include "test_common.h"
#include "lectern/upload_decoder.hpp"
#include "lectern/errors.hpp"
#include "lectern/utils.hpp"

using namespace lectern;

namespace {

const std::string kBoundary = "----LecternBoundary7MA4YWxk";

std::string part(const std::string &name, const std::string &filename, const std::string &content) {
    std::string p = "--" + kBoundary + "\r\n";
    p += "Content-Disposition: form-data; name=\"" + name + "\"";
    if (!filename.empty()) p += "; filename=\"" + filename + "\"";
    p += "\r\n";
    if (!filename.empty()) p += "Content-Type: application/pdf\r\n";
    p += "\r\n" + content + "\r\n";
    return p;
}

std::string closing() { return "--" + kBoundary + "--\r\n"; }

} // namespace

int main() {
    int failures = 0;
    const std::string contentType = "multipart/form-data; boundary=" + kBoundary;

    // binary content survives untouched, including CR/LF and NUL bytes
    {
        std::string binary("%PDF-1.7\r\n\0\x01\x02 stream\r\n--not-a-boundary\r\n", 40);
        std::string body = part("note", "", "hello") + part("file", "report.pdf", binary) + closing();
        auto file = parseMultipartUpload(body, contentType);
        CHECK(file.has_value());
        if (file) {
            CHECK(file->filename == "report.pdf");
            CHECK(file->contentType == "application/pdf");
            CHECK(file->content == binary);
        }
    }

    // quoted boundary
    {
        std::string body = part("file", "a.pdf", "x") + closing();
        auto file = parseMultipartUpload(body, "multipart/form-data; boundary=\"" + kBoundary + "\"");
        CHECK(file.has_value());
        if (file) CHECK(file->content == "x");
    }

    // the field is absent
    {
        std::string body = part("other", "a.pdf", "x") + closing();
        CHECK(!parseMultipartUpload(body, contentType).has_value());
    }

    CHECK_THROWS(parseMultipartUpload("whatever", "multipart/form-data"), ValidationError);
    CHECK_THROWS(parseMultipartUpload("no delimiter here", contentType), ValidationError);
    {
        std::string truncated = "--" + kBoundary + "\r\nContent-Disposition: form-data; name=\"file\"; filename=\"a.pdf\"\r\n\r\nabc";
        CHECK_THROWS(parseMultipartUpload(truncated, contentType), ValidationError);
    }

    // header parameters
    CHECK(headerParameter("form-data; name=\"file\"; filename=\"my;doc.pdf\"", "filename") == "my;doc.pdf");
    CHECK(headerParameter("form-data; name=\"file\"; filename=\"my;doc.pdf\"", "name") == "file");
    CHECK(headerParameter("multipart/form-data; Boundary=abc", "boundary") == "abc");
    CHECK(headerParameter("text/plain", "charset").empty());

    // JSON form
    {
        auto file = parseJsonUpload(R"({"filename": "doc.pdf", "data": "JVBERi0xLjQ="})");
        CHECK(file.has_value());
        if (file) {
            CHECK(file->filename == "doc.pdf");
            CHECK(file->content == "%PDF-1.4");
        }
    }
    CHECK(!parseJsonUpload(R"({"filename": "doc.pdf"})").has_value());
    CHECK(!parseJsonUpload(R"({"data": "AAAA"})").has_value());
    CHECK_THROWS(parseJsonUpload("{not json"), ValidationError);
    CHECK_THROWS(parseJsonUpload(R"({"filename": 1, "data": "AAAA"})"), ValidationError);
    CHECK_THROWS(parseJsonUpload(R"({"filename": "a.pdf", "data": "!!!!"})"), ValidationError);

    // lower-casing leaves UTF-8 bytes untouched
    {
        CHECK(to_lower("Multipart/Form-Data") == "multipart/form-data");
        CHECK(to_lower("R\xC3\xA9SUM\xC3\x89.PDF") == "r\xC3\xA9sum\xC3\x89.pdf");
        CHECK(to_lower("") == "");
    }

    return report("multipart", failures);
}
