#include "datatypes.hpp"

namespace core {

    SignalAction signalFromInt(int raw) {
        switch (raw) {
            case 1:  return SignalAction::EnterLong;
            case -1: return SignalAction::ExitLong;
            default: return SignalAction::None; // Malformed values act as 0
        }
    }

    std::string toString(TradeSide side) {
        return side == TradeSide::Buy ? "BUY" : "SELL";
    }

} // namespace core
