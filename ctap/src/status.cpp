#include "large_blob.hpp"

namespace blobkey {

const char* status_name(StatusCode code) {
    switch (code) {
    case StatusCode::Ctap1ErrInvalidParameter:       return "CTAP1_ERR_INVALID_PARAMETER";
    case StatusCode::Ctap1ErrInvalidLength:          return "CTAP1_ERR_INVALID_LENGTH";
    case StatusCode::Ctap1ErrInvalidSeq:             return "CTAP1_ERR_INVALID_SEQ";
    case StatusCode::Ctap2ErrMissingParameter:       return "CTAP2_ERR_MISSING_PARAMETER";
    case StatusCode::Ctap2ErrKeyStoreFull:           return "CTAP2_ERR_KEY_STORE_FULL";
    case StatusCode::Ctap2ErrPinAuthInvalid:         return "CTAP2_ERR_PIN_AUTH_INVALID";
    case StatusCode::Ctap2ErrPuatRequired:           return "CTAP2_ERR_PUAT_REQUIRED";
    case StatusCode::Ctap2ErrLargeBlobStorageFull:   return "CTAP2_ERR_LARGE_BLOB_STORAGE_FULL";
    case StatusCode::Ctap2ErrIntegrityFailure:       return "CTAP2_ERR_INTEGRITY_FAILURE";
    case StatusCode::Ctap2ErrUnauthorizedPermission: return "CTAP2_ERR_UNAUTHORIZED_PERMISSION";
    case StatusCode::Ctap2ErrVendorInternalError:    return "CTAP2_ERR_VENDOR_INTERNAL_ERROR";
    }
    return "CTAP_UNKNOWN_STATUS";
}

} // namespace blobkey
