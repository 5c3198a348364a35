#include "transfer_types.hpp"

const char* to_string(TransferState state)
{
    switch (state) {
        case TransferState::Queued:
            return "queued";
        case TransferState::Checking:
            return "checking";
        case TransferState::Downloading:
            return "downloading";
        case TransferState::Paused:
            return "paused";
        case TransferState::Seeding:
            return "seeding";
        case TransferState::Finished:
            return "finished";
        case TransferState::Error:
            return "error";
        case TransferState::Removed:
            return "removed";
    }
    return "unknown";
}

bool is_terminal(TransferState state)
{
    return state == TransferState::Finished ||
           state == TransferState::Error ||
           state == TransferState::Removed;
}
