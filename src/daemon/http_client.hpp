#pragma once

#include <expected>
#include <string>
#include <vector>

namespace http {

struct Response {
    long status = 0;
    std::string body;
};

// libcurl write callback appending into a std::string.
size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata);

// POSTs a JSON body. Transport failures are errors; HTTP error statuses are
// returned in the response for the caller to interpret.
std::expected<Response, std::string>
post_json(const std::string& url, const std::string& body,
          const std::vector<std::string>& headers, long timeout_s);

} // namespace http
