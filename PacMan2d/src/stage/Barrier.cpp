#include "stage/Barrier.h"

namespace pm2d {

const char* to_string(BarrierKind kind) noexcept {
    switch (kind) {
        case BarrierKind::Border: return "Border";
        case BarrierKind::Structure: return "Structure";
        case BarrierKind::Interior: return "Interior";
        case BarrierKind::Door: return "Door";
        default: return "Unknown";
    }
}

const char* to_string(TextureTag tag) noexcept {
    switch (tag) {
        case TextureTag::Default: return "Default";
        case TextureTag::StraightHorizontalDown: return "StraightHorizontalDown";
        case TextureTag::StraightHorizontalUp: return "StraightHorizontalUp";
        case TextureTag::StraightVerticalLeft: return "StraightVerticalLeft";
        case TextureTag::StraightVerticalRight: return "StraightVerticalRight";
        case TextureTag::OuterArcTopLeft: return "OuterArcTopLeft";
        case TextureTag::OuterArcTopRight: return "OuterArcTopRight";
        case TextureTag::OuterArcBottomLeft: return "OuterArcBottomLeft";
        case TextureTag::OuterArcBottomRight: return "OuterArcBottomRight";
        case TextureTag::InsideArcTopLeft: return "InsideArcTopLeft";
        case TextureTag::InsideArcTopRight: return "InsideArcTopRight";
        case TextureTag::InsideArcBottomLeft: return "InsideArcBottomLeft";
        case TextureTag::InsideArcBottomRight: return "InsideArcBottomRight";
        case TextureTag::BorderVerticalLeftTopConnector: return "BorderVerticalLeftTopConnector";
        case TextureTag::BorderVerticalLeftBottomConnector: return "BorderVerticalLeftBottomConnector";
        case TextureTag::BorderVerticalRightTopConnector: return "BorderVerticalRightTopConnector";
        case TextureTag::BorderVerticalRightBottomConnector: return "BorderVerticalRightBottomConnector";
        case TextureTag::BorderHorizontalLeftTopConnector: return "BorderHorizontalLeftTopConnector";
        case TextureTag::BorderHorizontalRightTopConnector: return "BorderHorizontalRightTopConnector";
        case TextureTag::BorderHorizontalLeftBottomConnector: return "BorderHorizontalLeftBottomConnector";
        case TextureTag::BorderHorizontalRightBottomConnector: return "BorderHorizontalRightBottomConnector";
        case TextureTag::BorderSingleLineVerticalLeft: return "BorderSingleLineVerticalLeft";
        case TextureTag::BorderSingleLineVerticalRight: return "BorderSingleLineVerticalRight";
        case TextureTag::BorderSingleLineHorizontalUp: return "BorderSingleLineHorizontalUp";
        case TextureTag::BorderSingleLineHorizontalDown: return "BorderSingleLineHorizontalDown";
        default: return "Unknown";
    }
}

bool isBorderOnlyTag(TextureTag tag) noexcept {
    return tag >= TextureTag::BorderVerticalLeftTopConnector && tag <= TextureTag::BorderSingleLineHorizontalDown;
}

Color barrierColor(BarrierKind kind) noexcept {
    if (kind == BarrierKind::Door) return Color{255, 184, 255, 255};
    return Color{33, 33, 222, 255};
}

bool isTagAllowed(BarrierKind kind, TextureTag tag) noexcept {
    if (kind == BarrierKind::Border) return true;
    return !isBorderOnlyTag(tag);
}

std::optional<BarrierCell> makeBarrier(BarrierKind kind, TextureTag tag) {
    if (!isTagAllowed(kind, tag)) return std::nullopt;
    Color c = barrierColor(kind);
    return BarrierCell{kind, tag, c, c};
}

} // namespace pm2d
