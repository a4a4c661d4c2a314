#pragma once

#include "transport.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resumedl {

// What a CurlTransport resume token carries.
struct CurlResumeState {
    std::string url;
    std::string partial_path;
    std::uint64_t offset{0};
    std::uint64_t total{0};
    std::string etag;
    std::string last_modified;
};

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(std::filesystem::path staging_dir,
                           std::string user_agent = "resumedl/1.0");
    ~CurlTransport() override;

    void setEventSink(TransportEvents* events) override;

    [[nodiscard]] TransferIdentity issueNewTransfer(const std::string& url) override;
    [[nodiscard]] TransferIdentity issueResumedTransfer(const ResumeToken& token) override;
    std::optional<ResumeToken> cancel(TransferIdentity identity, bool produce_token) override;
    void discard(const ResumeToken& token) override;
    [[nodiscard]] std::vector<LiveTransfer> liveTransfers() const override;

    [[nodiscard]] static ResumeToken encodeToken(const CurlResumeState& state);
    [[nodiscard]] static std::optional<CurlResumeState> decodeToken(const ResumeToken& token);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace resumedl
