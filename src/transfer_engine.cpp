#include "transfer_engine.hpp"

const char* to_string(EngineEventKind kind)
{
    switch (kind) {
        case EngineEventKind::VerifyStarted:
            return "verify_started";
        case EngineEventKind::VerifyDone:
            return "verify_done";
        case EngineEventKind::PieceVerified:
            return "piece_verified";
        case EngineEventKind::Completed:
            return "completed";
        case EngineEventKind::PeerCountChanged:
            return "peer_count_changed";
        case EngineEventKind::RateSample:
            return "rate_sample";
        case EngineEventKind::DiskError:
            return "disk_error";
        case EngineEventKind::FatalError:
            return "fatal_error";
    }
    return "unknown";
}
