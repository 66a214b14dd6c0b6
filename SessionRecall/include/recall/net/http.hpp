#pragma once

#include <string>
#include <utility>
#include <vector>

namespace recall::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// POSTs a JSON body and returns the response body. Throws std::runtime_error
// on transport failures and non-2xx statuses. A non-positive timeout_ms means
// 15 seconds.
std::string post_json(const std::string& url,
                      const std::string& body,
                      const HeaderList& headers,
                      long timeout_ms = -1);

} // namespace recall::net
