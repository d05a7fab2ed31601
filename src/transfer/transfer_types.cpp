#include "lobbylink/transfer/transfer_types.hpp"

namespace lobbylink::transfer {

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

}
