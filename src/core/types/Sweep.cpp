#include "core/types/Sweep.hpp"

namespace netscan::core {

std::string sweepStateToString(SweepState state) {
    switch (state) {
    case SweepState::Idle:
        return "Idle";
    case SweepState::ResolvingInterface:
        return "ResolvingInterface";
    case SweepState::Sweeping:
        return "Sweeping";
    case SweepState::Reconciling:
        return "Reconciling";
    case SweepState::Done:
        return "Done";
    case SweepState::Cancelled:
        return "Cancelled";
    }
    return "Idle";
}

} // namespace netscan::core
