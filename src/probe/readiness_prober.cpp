#include <v6boot/probe/readiness_prober.h>

#include <spdlog/spdlog.h>

#include <thread>

namespace v6boot::probe {

ReadinessProber::ReadinessProber(IHttpProbe& probe, Sleeper sleeper)
    : probe_(probe), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](Duration d) { std::this_thread::sleep_for(d); };
    }
}

ProbeReport ReadinessProber::waitUntilReady(const std::string& url,
                                            const ProbePolicy& policy) const {
    ProbeReport report;
    const int attempts = policy.attempts > 0 ? policy.attempts : 1;

    spdlog::info("Waiting for API endpoint at {} ({} attempts, {}ms timeout, {}ms interval)",
                 url, attempts, policy.timeoutPerAttempt.count(), policy.interval.count());

    for (int i = 1; i <= attempts; ++i) {
        report.attempts = i;
        auto status = probe_.get(url, policy.timeoutPerAttempt);
        if (status) {
            report.lastStatus = status.value();
            if (report.lastStatus >= 200 && report.lastStatus < 300) {
                report.readiness = Readiness::Ready;
                report.lastError.clear();
                spdlog::info("API endpoint at {} is up (attempt {}/{})", url, i, attempts);
                return report;
            }
            report.lastError = "HTTP status " + std::to_string(report.lastStatus);
        } else {
            report.lastError = status.error().message;
        }
        spdlog::debug("Attempt {}/{} against {} failed: {}", i, attempts, url, report.lastError);

        if (i < attempts) {
            sleeper_(policy.interval);
            ++report.waits;
        }
    }

    spdlog::error("API endpoint at {} is down after {} attempts: {}", url, report.attempts,
                  report.lastError);
    return report;
}

Result<void> toResult(const ProbeReport& report, const std::string& url) {
    if (report.ready()) {
        return {};
    }
    return Error{ErrorCode::ReadinessTimeout,
                 "Server at " + url + " not up after " + std::to_string(report.attempts) +
                     " attempts (last failure: " + report.lastError + ")"};
}

} // namespace v6boot::probe
