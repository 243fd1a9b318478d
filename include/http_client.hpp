#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <string>

namespace Lempctl {

struct HttpResponse
{
    bool ok = false;      // transfer completed (any HTTP status)
    long statusCode = 0;
    std::string body;
    std::string error;    // libcurl error text when !ok
};

/**
 * @class HttpClient
 * @brief Issues blocking HTTP GET requests.
 */
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Fetches the given URL and returns the full response body.
     *
     * Transport errors are reported through HttpResponse::ok/error rather
     * than thrown, so a smoke test can always continue to its cleanup.
     */
    virtual HttpResponse get(const std::string& url) = 0;
};

/**
 * @class CurlHttpClient
 * @brief HttpClient backed by libcurl's easy interface.
 */
class CurlHttpClient : public HttpClient
{
public:
    /**
     * @param timeout Upper bound for the whole transfer, connect included.
     */
    explicit CurlHttpClient(std::chrono::seconds timeout = std::chrono::seconds(10));

    HttpResponse get(const std::string& url) override;

private:
    std::chrono::seconds timeout_;
};

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

} // namespace Lempctl

#endif // HTTP_CLIENT_HPP
