#include "stage/TextureSelector.h"

namespace pm2d {
namespace {

bool isStructure(const Neighbour& n) noexcept {
    return n.present && n.kind == BarrierKind::Structure;
}

} // namespace

TextureTag selectTexture(const AdjacencyInfo& n, BarrierKind kind) noexcept {
    const bool l = n.left.present;
    const bool r = n.right.present;
    const bool t = n.top.present;
    const bool b = n.bottom.present;
    const bool lt = n.leftTop.present;
    const bool rt = n.rightTop.present;
    const bool lb = n.leftBottom.present;
    const bool rb = n.rightBottom.present;

    TextureTag tag = TextureTag::Default;

    if (b && l && r && !t) {
        tag = TextureTag::StraightHorizontalDown;
    } else if (t && l && r && !b) {
        tag = TextureTag::StraightHorizontalUp;
    } else if (l && t && b && !r) {
        tag = TextureTag::StraightVerticalLeft;
    } else if (r && t && b && !l) {
        tag = TextureTag::StraightVerticalRight;
    }

    if (l && t && lt && !r && !b) {
        tag = TextureTag::OuterArcTopLeft;
    } else if (l && b && lb && !r && !t) {
        tag = TextureTag::OuterArcBottomLeft;
    } else if (r && b && rb && !l && !t) {
        tag = TextureTag::OuterArcBottomRight;
    } else if (r && t && rt && !l && !b) {
        tag = TextureTag::OuterArcTopRight;
    }

    const bool allOrthogonal = l && r && t && b;

    if (allOrthogonal) {
        if (lt && rt && lb && !rb) {
            tag = TextureTag::InsideArcTopLeft;
        } else if (lb && rb && lt && !rt) {
            tag = TextureTag::InsideArcBottomLeft;
        } else if (lt && rt && rb && !lb) {
            tag = TextureTag::InsideArcTopRight;
        } else if (lb && rb && rt && !lt) {
            tag = TextureTag::InsideArcBottomRight;
        }
    }

    if (kind == BarrierKind::Border && allOrthogonal) {
        if (isStructure(n.right)) {
            if (!rb) tag = TextureTag::BorderVerticalLeftTopConnector;
            else if (!rt) tag = TextureTag::BorderVerticalLeftBottomConnector;
        } else if (isStructure(n.left)) {
            if (!lt) tag = TextureTag::BorderVerticalRightBottomConnector;
            else if (!lb) tag = TextureTag::BorderVerticalRightTopConnector;
        } else if (isStructure(n.bottom)) {
            if (!lb) tag = TextureTag::BorderHorizontalRightTopConnector;
            else if (!rb) tag = TextureTag::BorderHorizontalLeftTopConnector;
        } else if (isStructure(n.top)) {
            if (!rt) tag = TextureTag::BorderHorizontalLeftBottomConnector;
            else if (!lt) tag = TextureTag::BorderHorizontalRightBottomConnector;
        }
    }

    if (kind == BarrierKind::Border && allOrthogonal && lt && rt && lb && rb) {
        if (isStructure(n.right)) {
            tag = TextureTag::BorderSingleLineVerticalLeft;
        } else if (isStructure(n.left)) {
            tag = TextureTag::BorderSingleLineVerticalRight;
        } else if (isStructure(n.bottom)) {
            tag = TextureTag::BorderSingleLineHorizontalUp;
        } else if (isStructure(n.top)) {
            tag = TextureTag::BorderSingleLineHorizontalDown;
        }
    }

    return tag;
}

} // namespace pm2d
