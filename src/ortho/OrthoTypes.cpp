#include "nodeweave/ortho/OrthoTypes.h"

namespace nodeweave {

std::string toString(Side side) {
    switch (side) {
        case Side::Right: return "Right";
        case Side::Left: return "Left";
        case Side::Top: return "Top";
        case Side::Bottom: return "Bottom";
    }
    return "Unknown";
}

std::string toString(BendDirection bend) {
    switch (bend) {
        case BendDirection::UpLeft: return "UpLeft";
        case BendDirection::UpRight: return "UpRight";
        case BendDirection::DownLeft: return "DownLeft";
        case BendDirection::DownRight: return "DownRight";
    }
    return "Unknown";
}

}  // namespace nodeweave
