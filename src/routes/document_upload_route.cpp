#include "lectern/routes/document_upload_route.hpp"
#include "lectern/document/document_processor.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include "lectern/models/upload_response_model.hpp"
#include "lectern/session/session_store.hpp"
#include "lectern/upload_decoder.hpp"
#include "lectern/utils.hpp"

namespace lectern
{

    namespace
    {
        bool hasPdfExtension(const std::string &filename)
        {
            if (filename.size() < 4)
                return false;
            return to_lower(filename.substr(filename.size() - 4)) == ".pdf";
        }
    } // namespace

    DocumentUploadRoute::DocumentUploadRoute(session::SessionStore &sessions, const document::DocumentProcessor &processor)
        : sessions_(sessions), processor_(processor)
    {
    }

    bool DocumentUploadRoute::match(const std::string &method, const std::string &path)
    {
        return method == "POST" && path == "/pdf/upload";
    }

    void DocumentUploadRoute::handle(SocketType sock, const HttpRequest &request)
    {
        try
        {
            const std::string contentType = request.header("content-type");
            const std::string lowerType = to_lower(contentType);

            std::optional<UploadedFile> upload;
            try
            {
                if (lowerType.rfind("multipart/form-data", 0) == 0)
                {
                    upload = parseMultipartUpload(request.body, contentType, "file");
                }
                else if (lowerType.rfind("application/json", 0) == 0)
                {
                    upload = parseJsonUpload(request.body);
                }
                else
                {
                    send_error(sock, 415, "Content-Type must be multipart/form-data or application/json");
                    return;
                }
            }
            catch (const ValidationError &ex)
            {
                ServerLogger::logWarning("Rejected upload: %s", ex.what());
                send_error(sock, 400, ex.what());
                return;
            }

            if (!upload)
            {
                send_error(sock, 422, "Field 'file' is required");
                return;
            }

            if (!hasPdfExtension(upload->filename))
            {
                send_error(sock, 400, "File must be a PDF");
                return;
            }

            if (upload->content.empty())
            {
                send_error(sock, 400, "Empty PDF file");
                return;
            }

            std::vector<document::TextChunk> chunks;
            try
            {
                chunks = processor_.process(upload->content, upload->filename);
            }
            catch (const ValidationError &ex)
            {
                send_error(sock, 400, ex.what());
                return;
            }
            catch (const ExtractionFailed &ex)
            {
                ServerLogger::logWarning("Extraction failed for '%s': %s", upload->filename.c_str(), ex.what());
                send_error(sock, 400, ex.what());
                return;
            }
            catch (const std::exception &ex)
            {
                ServerLogger::logError("Unexpected error processing '%s': %s", upload->filename.c_str(), ex.what());
                send_error(sock, 500, std::string("Unexpected error processing PDF: ") + ex.what());
                return;
            }

            if (chunks.empty())
            {
                send_error(sock, 400, "No text content found in PDF");
                return;
            }

            UploadResponse response;
            response.total_chunks = chunks.size();
            response.session_id = sessions_.createSession(std::move(chunks));

            send_json(sock, 200, response.to_json());
            ServerLogger::logInfo("Upload '%s' opened session %s with %zu chunks",
                                  upload->filename.c_str(), response.session_id.c_str(), response.total_chunks);
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Error handling upload request: %s", ex.what());
            send_error(sock, 500, std::string("Unexpected error: ") + ex.what());
        }
    }

} // namespace lectern
