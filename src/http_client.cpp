#include "http_client.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>

namespace Lempctl {

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        std::cerr << "Error appending data to response: "
                  << e.what() << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout)
    : timeout_(timeout)
{
}

/**
 * @brief Fetches a URL using libcurl. An HTTP error status still counts as
 *        a completed transfer; only transport failures set `error`.
 */
HttpResponse CurlHttpClient::get(const std::string& url)
{
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "Failed to initialize libcurl";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "lempctl/1.0");

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.statusCode);
    response.ok = true;

    curl_easy_cleanup(curl);
    return response;
}

} // namespace Lempctl
