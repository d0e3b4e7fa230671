#include "ambassador/error.hpp"

namespace ambassador {

AuthFailure classify_unauthorized(const HttpStatusError& e) {
    if (e.backend_code == backend_code::SessionExpired) return AuthFailure::SessionExpired;
    if (e.backend_code == backend_code::SessionSuspended) return AuthFailure::SessionSuspended;
    return AuthFailure::Unknown;
}

} // namespace ambassador
