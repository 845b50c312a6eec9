#pragma once

#include <v6boot/core/types.h>

#include <functional>
#include <memory>
#include <string>

namespace v6boot::probe {

/**
 * One time-bounded HTTP GET. Returns the response status code, or an error for
 * transport failures (connect, resolve, timeout).
 */
class IHttpProbe {
public:
    virtual ~IHttpProbe() = default;

    virtual Result<long> get(const std::string& url, Duration timeout) = 0;
};

/**
 * libcurl easy-API implementation. Response bodies are discarded.
 */
class CurlHttpProbe final : public IHttpProbe {
public:
    CurlHttpProbe();
    ~CurlHttpProbe() override;

    CurlHttpProbe(const CurlHttpProbe&) = delete;
    CurlHttpProbe& operator=(const CurlHttpProbe&) = delete;

    Result<long> get(const std::string& url, Duration timeout) override;

private:
    void* handle_{nullptr}; // CURL*
};

std::unique_ptr<IHttpProbe> makeCurlHttpProbe();

enum class Readiness { Ready, Unready };

struct ProbePolicy {
    int attempts{5};
    Duration timeoutPerAttempt{4000};
    Duration interval{5000};
};

struct ProbeReport {
    Readiness readiness{Readiness::Unready};
    int attempts{0};
    int waits{0};
    long lastStatus{0};
    std::string lastError;

    bool ready() const { return readiness == Readiness::Ready; }
};

/**
 * Fixed-interval readiness loop for a co-located upstream.
 *
 * Each attempt is one GET; any 2xx ends the loop. Between failed attempts the
 * prober waits `interval` (no backoff, no wait after the last attempt).
 */
class ReadinessProber {
public:
    using Sleeper = std::function<void(Duration)>;

    explicit ReadinessProber(IHttpProbe& probe, Sleeper sleeper = {});

    ProbeReport waitUntilReady(const std::string& url, const ProbePolicy& policy = {}) const;

private:
    IHttpProbe& probe_;
    Sleeper sleeper_;
};

// Ready -> success; Unready -> ReadinessTimeout describing the last failure
Result<void> toResult(const ProbeReport& report, const std::string& url);

} // namespace v6boot::probe
