#ifndef DOCUMENT_STACK_CURL_GLOBAL_HPP
#define DOCUMENT_STACK_CURL_GLOBAL_HPP

namespace documentstack::http::client {

    // Owns libcurl's process-wide state. Create one before the first CurlEasy::send and
    // keep it alive until every transfer has finished.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };

}  // namespace documentstack::http::client

#endif
