/**
 * @file http_transport.hpp
 * @brief Minimal HTTP request/response transport
 * 
 * The control-plane client talks HTTP only through HttpTransport, so tests
 * can substitute a scripted transport. CurlTransport is the production
 * implementation: it drives the curl binary with its configuration fed on
 * stdin, which keeps bearer tokens and passwords out of the process table.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <map>
#include <optional>
#include <chrono>

namespace overseer {
namespace api {

/**
 * @struct HttpRequest
 * @brief Outgoing request
 */
struct HttpRequest {
    std::string method{"GET"};                    ///< HTTP method
    std::string url;                              ///< Absolute URL
    std::map<std::string, std::string> headers;   ///< Extra headers
    std::optional<std::string> body;              ///< Request body
    std::chrono::seconds timeout{30};             ///< Whole-request deadline
};

/**
 * @struct HttpResponse
 * @brief Response, or transport failure when status is 0
 */
struct HttpResponse {
    int status{0};         ///< HTTP status, 0 if no response was received
    std::string body;      ///< Response body
    std::string error;     ///< Transport error description
    
    bool Ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Whether a status is worth retrying
 * 
 * Transport failures (0), 429 and 5xx are transient; everything else is not.
 */
bool IsTransientStatus(int status);

/**
 * @class HttpTransport
 * @brief Sends one request, never throws for HTTP-level failures
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

/**
 * @class CurlTransport
 * @brief HttpTransport backed by the curl executable
 * 
 * **Usage Example**:
 * @code
 * CurlTransport transport;
 * HttpRequest request;
 * request.method = "POST";
 * request.url = "http://127.0.0.1:8000/auth/session";
 * request.headers["Content-Type"] = "application/json";
 * request.body = R"({"email":"a@b.c","password":"x"})";
 * HttpResponse response = transport.Send(request);
 * @endcode
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string curl_binary = "curl");
    
    HttpResponse Send(const HttpRequest& request) override;
    
    /**
     * @brief Render the curl config file for a request
     * 
     * Values are double-quoted with curl's config escapes; the status code is
     * appended to the output on its own final line.
     */
    static std::string BuildCurlConfig(const HttpRequest& request);
    
    /**
     * @brief Split curl output into body and trailing status line
     */
    static HttpResponse ParseCurlOutput(const std::string& output);

private:
    std::string curl_binary_;
};

} // namespace api
} // namespace overseer
