/*
 * Chaos Load - Request Outcome
 *
 * One virtual user's single GET, as handed to the result recorder.
 */

#pragma once

#include <string>

struct RequestOutcome {
    int         vu          = 0;
    long        iteration   = 0;
    long long   started_at  = 0;    // wall clock, ms since epoch
    double      duration_ms = 0.0;
    long        status      = 0;    // final status after redirects, 0 = no response
    std::string error;              // transport error, empty on success

    bool failed() const {
        return !error.empty() || status < 200 || status >= 400;
    }
};
