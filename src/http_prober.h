#pragma once

#include <string>

namespace netlaunch {

// Result of one reachability request
struct ProbeOutcome {
    bool responded;      // an HTTP response arrived
    int status_code;     // valid when responded
    std::string error;   // transport error message when !responded

    ProbeOutcome() : responded(false), status_code(0) {}

    static ProbeOutcome response(int status_code) {
        ProbeOutcome outcome;
        outcome.responded = true;
        outcome.status_code = status_code;
        return outcome;
    }

    static ProbeOutcome failure(const std::string& error) {
        ProbeOutcome outcome;
        outcome.error = error;
        return outcome;
    }
};

/**
 * Issues lightweight reachability requests. Implementations must be safe to
 * call from several threads at once.
 */
class HttpProber {
public:
    virtual ~HttpProber() = default;

    /**
     * Send a HEAD request without following redirects
     * @param url Absolute URL
     * @param timeout_ms Deadline for the whole request
     */
    virtual ProbeOutcome head(const std::string& url, int timeout_ms) = 0;
};

/**
 * HttpProber backed by libcurl's easy interface
 */
class CurlHttpProber : public HttpProber {
public:
    CurlHttpProber();

    ProbeOutcome head(const std::string& url, int timeout_ms) override;
};

} // namespace netlaunch
