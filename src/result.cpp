#include <result.hpp>

namespace NReservation {

    const char* ErrorKindName(EErrorKind kind) {
        switch (kind) {
            case EErrorKind::Validation:
                return "validation";
            case EErrorKind::NotFound:
                return "not_found";
            case EErrorKind::Conflict:
                return "conflict";
            case EErrorKind::InvalidReference:
                return "invalid_reference";
            case EErrorKind::IllegalTransition:
                return "illegal_transition";
            case EErrorKind::StoreUnavailable:
                return "store_unavailable";
        }
        return "unknown";
    }

} // namespace NReservation
