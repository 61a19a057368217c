#include "pfetch/detail/curl_utils.hpp"
#include "pfetch/log.hpp"

#include <curl/curl.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <mutex>

namespace pfetch::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string{"Failed to initialize libcurl: "} + curl_easy_strerror(code));
        }
        std::atexit([] { curl_global_cleanup(); });
        log::get()->debug("libcurl initialized: {}", curl_version());
    });
}

} // namespace pfetch::detail
