#include "pfetch/curl_transfer_engine.hpp"
#include "pfetch/detail/curl_utils.hpp"
#include "pfetch/log.hpp"
#include "pfetch/progress.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace pfetch {

class CurlTransferEngine::Impl {
public:
    explicit Impl(EngineOptions options) : options_(std::move(options)) {}

    void run(const std::string& url,
             const std::filesystem::path& destination,
             const std::atomic<bool>& cancel_requested,
             const PayloadSink& sink) {
        auto logger = log::get();

        if (cancel_requested.load()) {
            logger->debug("Cancelled before request: {}", url);
            sink(InterruptedPayload{0});
            return;
        }

        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            sink(ErrorPayload{ErrorCategory::Network, "Failed to allocate curl handle"});
            return;
        }

        TransferContext ctx{destination, cancel_requested, sink, curl.get()};
        char error_buffer[CURL_ERROR_SIZE] = {0};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(kChunkSize));
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options_.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options_.max_redirects);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.total_timeout.count()));
        if (options_.low_speed_limit > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options_.low_speed_limit);
            curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_time.count()));
        }
        if (!options_.user_agent.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        }

        logger->debug("GET {} -> {}", url, destination.string());
        const CURLcode res = curl_easy_perform(curl.get());

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        // Only an abort from one of our callbacks counts as a cancel; a cancel
        // that arrives after libcurl already failed keeps the real error.
        if (ctx.stop == Stop::Cancelled) {
            removePartial(ctx);
            logger->info("Interrupted {} after {} bytes", url, ctx.downloaded);
            sink(InterruptedPayload{ctx.downloaded});
            return;
        }

        if (ctx.stop == Stop::HttpError || (res == CURLE_OK && status >= 400)) {
            removePartial(ctx);
            fail(ctx, url, ErrorCategory::Network, fmt::format("Server returned HTTP {}", status));
            return;
        }

        if (ctx.stop == Stop::FileError) {
            removePartial(ctx);
            fail(ctx, url, ErrorCategory::FileSystem, ctx.failure);
            return;
        }

        if (res != CURLE_OK) {
            removePartial(ctx);
            std::string message = error_buffer[0] != '\0' ? std::string{error_buffer} : curl_easy_strerror(res);
            fail(ctx, url, ErrorCategory::Network, std::move(message));
            return;
        }

        // An empty body never reached the write callback.
        if (!ctx.file && !openDestination(ctx)) {
            fail(ctx, url, ErrorCategory::FileSystem, ctx.failure);
            return;
        }

        if (!closeDestination(ctx)) {
            removePartial(ctx);
            fail(ctx, url, ErrorCategory::FileSystem, ctx.failure);
            return;
        }

        logger->info("Completed {} ({} bytes)", url, ctx.downloaded);
        sink(CompletedPayload{ctx.downloaded, destination.string()});
    }

    [[nodiscard]] const EngineOptions& options() const { return options_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    enum class Stop {
        None,
        Cancelled,
        HttpError,
        FileError,
    };

    struct TransferContext {
        TransferContext(const std::filesystem::path& destination_,
                        const std::atomic<bool>& cancel_requested_,
                        const PayloadSink& sink_,
                        CURL* curl_)
            : destination(destination_), cancel_requested(cancel_requested_), sink(sink_), curl(curl_) {}

        const std::filesystem::path& destination;
        const std::atomic<bool>& cancel_requested;
        const PayloadSink& sink;
        CURL* curl;

        std::unique_ptr<FILE, FileDeleter> file{};
        bool created_file{false};
        bool headers_checked{false};
        std::uint64_t downloaded{0};
        std::optional<std::uint64_t> total;
        Stop stop{Stop::None};
        std::string failure;
    };

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        if (!ctx) {
            return 0;
        }

        const size_t total = size * nmemb;

        if (ctx->cancel_requested.load()) {
            ctx->stop = Stop::Cancelled;
            return 0;
        }

        if (!ctx->headers_checked) {
            ctx->headers_checked = true;

            long status = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 400) {
                ctx->stop = Stop::HttpError;
                return 0;
            }

            curl_off_t length = -1;
            curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            // libcurl reports -1 when the server sent no content length.
            if (length >= 0) {
                ctx->total = static_cast<std::uint64_t>(length);
            }

            if (!openDestination(*ctx)) {
                ctx->stop = Stop::FileError;
                return 0;
            }
        }

        if (total == 0) {
            return 0;
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file.get());
        if (written != total) {
            ctx->stop = Stop::FileError;
            ctx->failure = fmt::format("Failed to write {}: {}", ctx->destination.string(), std::strerror(errno));
            return 0;
        }

        ctx->downloaded += written;
        log::get()->trace("{}: chunk of {} bytes, {} total", ctx->destination.string(), written, ctx->downloaded);
        ctx->sink(ProgressPayload{ctx->downloaded, ctx->total, computePercent(ctx->downloaded, ctx->total)});

        return written;
    }

    // Lets a cancel interrupt a connection that is not delivering chunks.
    static int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<TransferContext*>(clientp);
        if (ctx && ctx->cancel_requested.load()) {
            ctx->stop = Stop::Cancelled;
            return 1;
        }
        return 0;
    }

    // "x" refuses to open a path that already exists, so two writers can
    // never share a destination and existing files are never clobbered.
    static bool openDestination(TransferContext& ctx) {
        ctx.file.reset(std::fopen(ctx.destination.c_str(), "wbx"));
        if (!ctx.file) {
            ctx.failure = fmt::format("Cannot create {}: {}", ctx.destination.string(), std::strerror(errno));
            return false;
        }
        ctx.created_file = true;
        return true;
    }

    static bool closeDestination(TransferContext& ctx) {
        FILE* fp = ctx.file.release();
        if (std::fflush(fp) != 0 || std::fclose(fp) != 0) {
            ctx.failure = fmt::format("Failed to finish {}: {}", ctx.destination.string(), std::strerror(errno));
            return false;
        }
        return true;
    }

    // Only ever deletes a file this run created.
    static void removePartial(TransferContext& ctx) {
        ctx.file.reset();
        if (!ctx.created_file) {
            return;
        }

        std::error_code ec;
        std::filesystem::remove(ctx.destination, ec);
        if (ec) {
            log::get()->warn("Could not remove partial file {}: {}", ctx.destination.string(), ec.message());
        }
        ctx.created_file = false;
    }

    static void fail(TransferContext& ctx, const std::string& url, ErrorCategory category, std::string message) {
        log::get()->warn("Download of {} failed ({}): {}", url, toString(category), message);
        ctx.sink(ErrorPayload{category, std::move(message)});
    }

    EngineOptions options_;
};

CurlTransferEngine::CurlTransferEngine(EngineOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
    detail::ensureCurlInitialized();
}

CurlTransferEngine::~CurlTransferEngine() = default;

void CurlTransferEngine::run(const std::string& url,
                             const std::filesystem::path& destination,
                             const std::atomic<bool>& cancel_requested,
                             const PayloadSink& sink) {
    impl_->run(url, destination, cancel_requested, sink);
}

const EngineOptions& CurlTransferEngine::options() const { return impl_->options(); }

EngineFactory CurlTransferEngine::factory(EngineOptions options) {
    return [options = std::move(options)]() -> TransferEnginePtr {
        return std::make_unique<CurlTransferEngine>(options);
    };
}

} // namespace pfetch
