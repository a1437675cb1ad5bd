#ifndef LECTERN_DOCUMENT_UPLOAD_ROUTE_HPP
#define LECTERN_DOCUMENT_UPLOAD_ROUTE_HPP

#include "route_interface.hpp"

namespace lectern {

    namespace document { class DocumentProcessor; }
    namespace session { class SessionStore; }

    // POST /pdf/upload: chunks an uploaded PDF and opens a reading session for it.
    class LECTERN_SERVER_API DocumentUploadRoute : public IRoute {
    public:
        DocumentUploadRoute(session::SessionStore& sessions, const document::DocumentProcessor& processor);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;

    private:
        session::SessionStore& sessions_;
        const document::DocumentProcessor& processor_;
    };

} // namespace lectern

#endif // LECTERN_DOCUMENT_UPLOAD_ROUTE_HPP
