#pragma once

namespace pfetch::detail {

// Runs curl_global_init once per process; throws std::runtime_error if it fails.
void ensureCurlInitialized();

} // namespace pfetch::detail
