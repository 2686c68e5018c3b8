#include "UploadTypes.hpp"

namespace MediaUpload {

std::string_view toString(TokenStatus status) {
    switch (status) {
        case TokenStatus::Pending:
            return "pending";
        case TokenStatus::Partial:
            return "partial";
        case TokenStatus::Full:
            return "full";
        case TokenStatus::Unknown:
            break;
    }
    return "unknown";
}

}  // namespace MediaUpload
