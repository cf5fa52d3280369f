#pragma once

#include <nmbridge/core/types.h>
#include <nmbridge/host/lifecycle.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace nmbridge::native {
class NativeTransport;
}

namespace nmbridge::host {

using json = nlohmann::json;

/**
 * Companion-initiated control calls: status, init, shutdown.
 *
 * Registered on the native transport's inbound-RPC path. Runtime figures (bound port, pending
 * requests) are read through callbacks so this class does not own the components it reports on.
 */
class ControlHandlers {
public:
    struct Context {
        std::string name;
        std::string version;
        std::string runMode = "production";
        std::string sseBaseUrl;
        std::function<uint16_t()> ssePort;
        std::function<size_t()> pendingRequests;
    };

    ControlHandlers(Context ctx, LifecycleCoordinator& lifecycle);

    void registerWith(native::NativeTransport& transport);

    Result<json> status(const json& params) const;
    Result<json> init(const json& params);
    Result<json> shutdown(const json& params);

    bool initialized() const;
    int initCount() const;

private:
    Context ctx_;
    LifecycleCoordinator& lifecycle_;
    const std::chrono::system_clock::time_point startTime_;
    const std::chrono::steady_clock::time_point startSteady_;

    mutable std::mutex mutex_;
    int initCount_{0};
    std::optional<std::chrono::system_clock::time_point> firstInitTime_;
};

} // namespace nmbridge::host
