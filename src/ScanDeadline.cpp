#include "DocShield/ScanDeadline.hpp"

#include "DocShield/ScanTypes.hpp"

namespace docshield {

namespace {

thread_local const ScanDeadline *activeDeadline = nullptr;

} // namespace

ScanDeadline::ScanDeadline(Clock::time_point expiry) : expiry(expiry), previous(activeDeadline) {
    activeDeadline = this;
}

ScanDeadline::~ScanDeadline() {
    activeDeadline = previous;
}

void ScanDeadline::check(const char *where) {
    if (activeDeadline == nullptr) {
        return;
    }
    if (Clock::now() >= activeDeadline->expiry) {
        throw ScanTimedOut(where);
    }
}

} // namespace docshield
