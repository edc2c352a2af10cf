#ifndef PATH_CLIP_STITCH_HPP
#define PATH_CLIP_STITCH_HPP

#include <vector>
#include <algorithm>
#include <memory_resource>
#include <span>
#include <cstddef>

#include "base.hpp"
#include "segment.hpp"
#include "path.hpp"
#include "contain.hpp"
#include "split.hpp"


namespace path_clip {

/** An open contour together with the side of the clipping region it lies
on */
template<coordinate Coord> struct labeled_contour {
    contour<Coord> value;
    bool inside;
};

namespace detail {

/* The point half way along a sub-segment, measured by approximate arc length,
the direction of travel there and the distance from there to either end */
template<coordinate Coord> struct sub_segment_middle {
    point_t<Coord> p;
    point_t<Coord> dir;
    Coord half_length;
};

template<coordinate Coord> sub_segment_middle<Coord> middle_of(
    const contour<Coord> &c,
    std::span<const piece<Coord>> pieces)
{
    PATH_CLIP_ASSERT(!pieces.empty());

    Coord total = 0;
    for(auto &pc : pieces) total += c[pc.segment].portion(pc.t0,pc.t1).approx_length();

    Coord remaining = total / Coord(2);
    for(auto &pc : pieces) {
        auto &s = c[pc.segment];
        Coord len = s.portion(pc.t0,pc.t1).approx_length();
        if(remaining <= len || &pc == &pieces.back()) {
            Coord f = len > Coord(0) ? std::min(remaining/len,Coord(1)) : Coord(0.5);
            Coord t = pc.t0 + (pc.t1 - pc.t0)*f;
            return {s.at(t),s.tangent(t),total / Coord(2)};
        }
        remaining -= len;
    }
    PATH_CLIP_ASSERT(false);
    return {c.start_point(),{Coord(0),Coord(0)},Coord(0)};
}

/* Decide which side of "region" each sub-segment is on, by the point half way
along it */
template<coordinate Coord> void classify_sub_segments(
    const path<Coord> &open,
    const path_slices<Coord> &slices,
    const path<Coord> &region,
    fill_rule_t rule,
    Coord tolerance,
    std::pmr::vector<point_location> &labels)
{
    labels.clear();
    labels.reserve(slices.subs.size());
    for(auto &sub : slices.subs) {
        auto mid = middle_of(open[sub.contour],slices.pieces_of(sub));
        point_location r = classify_nudged(mid.p,mid.dir,mid.half_length,region,rule,tolerance);
        PATH_CLIP_DEBUG_LOG(
            "sub-segment of contour {} with {} piece(s) at ({},{}) is {}",
            sub.contour,sub.piece_count(),mid.p.x(),mid.p.y(),
            r == point_location::inside ? "inside" : "outside");
        labels.push_back(r);
    }
}

/* Turn pieces into segments, joining adjacent pieces of the same segment back
into one */
template<coordinate Coord> contour<Coord> assemble(const contour<Coord> &c,std::span<const piece<Coord>> pieces) {
    contour<Coord> r;
    std::size_t i = 0;
    while(i < pieces.size()) {
        piece<Coord> cur = pieces[i++];
        while(i < pieces.size() && pieces[i].segment == cur.segment && pieces[i].t0 == cur.t1) {
            cur.t1 = pieces[i++].t1;
        }
        r.push_back(c[cur.segment].portion(cur.t0,cur.t1));
    }
    return r;
}

} // namespace detail

/**
 * Join the retained sub-segments of `slices` into contours.
 *
 * A sub-segment is retained if its entry in `labels` is
 * `point_location::inside`, or `point_location::outside` when `invert` is
 * true.
 * Consecutive retained sub-segments of the same contour become one contour.
 * The contours keep the direction of `open`.
 */
template<coordinate Coord> std::vector<contour<Coord>> stitch(
    const path<Coord> &open,
    const path_slices<Coord> &slices,
    std::span<const point_location> labels,
    bool invert)
{
    PATH_CLIP_ASSERT(labels.size() == slices.subs.size());

    std::vector<contour<Coord>> r;
    std::vector<piece<Coord>> run;
    std::size_t run_contour = 0;

    auto flush = [&]() {
        if(run.empty()) return;
        r.push_back(detail::assemble(open[run_contour],std::span<const piece<Coord>>{run}));
        run.clear();
    };

    for(std::size_t i=0; i<slices.subs.size(); ++i) {
        auto &sub = slices.subs[i];
        if(sub.contour != run_contour) flush();
        run_contour = sub.contour;
        if((labels[i] == point_location::inside) == invert) {
            flush();
            continue;
        }
        auto p = slices.pieces_of(sub);
        run.insert(run.end(),p.begin(),p.end());
    }
    flush();

    PATH_CLIP_DEBUG_LOG("stitched {} sub-segment(s) into {} contour(s)",slices.subs.size(),r.size());
    return r;
}

/** Every sub-segment of `slices` as its own contour, with its side of the
region, in the order of `open` */
template<coordinate Coord> std::vector<labeled_contour<Coord>> label_all(
    const path<Coord> &open,
    const path_slices<Coord> &slices,
    std::span<const point_location> labels)
{
    PATH_CLIP_ASSERT(labels.size() == slices.subs.size());

    std::vector<labeled_contour<Coord>> r;
    r.reserve(slices.subs.size());
    for(std::size_t i=0; i<slices.subs.size(); ++i) {
        auto &sub = slices.subs[i];
        r.push_back({detail::assemble(open[sub.contour],slices.pieces_of(sub)),labels[i] == point_location::inside});
    }
    return r;
}

} // namespace path_clip

#endif
