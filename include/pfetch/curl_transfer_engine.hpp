#pragma once

#include "transfer_engine.hpp"

#include <memory>

namespace pfetch {

class CurlTransferEngine final : public TransferEngine {
public:
    explicit CurlTransferEngine(EngineOptions options = {});
    ~CurlTransferEngine() override;

    CurlTransferEngine(const CurlTransferEngine&) = delete;
    CurlTransferEngine& operator=(const CurlTransferEngine&) = delete;

    void run(const std::string& url,
             const std::filesystem::path& destination,
             const std::atomic<bool>& cancel_requested,
             const PayloadSink& sink) override;

    [[nodiscard]] const EngineOptions& options() const;

    [[nodiscard]] static EngineFactory factory(EngineOptions options = {});

private:
    // The libcurl state stays out of the header.
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pfetch
