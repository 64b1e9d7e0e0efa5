#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchwise::net {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Transport failure (status 0) or a non-2xx response; `body` keeps the server's explanation.
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& message, long status, std::string body)
        : std::runtime_error(message), m_status(status), m_body(std::move(body)) {}

    long status() const noexcept { return m_status; }
    const std::string& body() const noexcept { return m_body; }

private:
    long m_status;
    std::string m_body;
};

std::string post_json(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      long timeout_ms = -1);

// Invoked once per complete response line, without the trailing newline.
using LineHandler = std::function<void(std::string_view line)>;

void post_json_stream(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      const LineHandler& on_line,
                      long timeout_ms = -1);

} // namespace patchwise::net
