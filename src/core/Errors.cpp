#include "Errors.hpp"
#include "Location.hpp"


const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSquare:    return "InvalidSquare";
        case ErrorKind::EmptySource:      return "EmptySource";
        case ErrorKind::WrongTurnOwner:   return "WrongTurnOwner";
        case ErrorKind::BlockedPath:      return "BlockedPath";
        case ErrorKind::IllegalGeometry:  return "IllegalGeometry";
        case ErrorKind::IllegalCapture:   return "IllegalCapture";
        case ErrorKind::SelfCheck:        return "SelfCheck";
        case ErrorKind::AmbiguousMove:    return "AmbiguousMove";
        case ErrorKind::NoLegalCandidate: return "NoLegalCandidate";
        case ErrorKind::IllegalCastle:    return "IllegalCastle";
        case ErrorKind::PromotionError:   return "PromotionError";
        case ErrorKind::InvalidNotation:  return "InvalidNotation";
        case ErrorKind::InvalidFen:       return "InvalidFen";
    }
    return "Unknown";
}

std::string MoveError::describe() const {
    std::string out = std::string(to_string(kind)) + ": " + message;
    if (from || to) {
        out += " [";
        if (from) out += Location(*from).to_string();
        out += "->";
        if (to) out += Location(*to).to_string();
        out += "]";
    }
    if (!fen.empty()) out += " (" + fen + ")";
    return out;
}
