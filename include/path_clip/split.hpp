#ifndef PATH_CLIP_SPLIT_HPP
#define PATH_CLIP_SPLIT_HPP

#include <vector>
#include <algorithm>
#include <memory_resource>
#include <optional>
#include <span>
#include <tuple>
#include <cstddef>

#include "base.hpp"
#include "segment.hpp"
#include "path.hpp"
#include "intersect.hpp"
#include "error.hpp"


namespace path_clip {

/** A place where the open path meets the outline of the clipping region */
template<coordinate Coord> struct cut_point {
    std::size_t contour;
    std::size_t segment;
    Coord t;
    point_t<Coord> p;

    /** The location of the same point on the clipping region. A segment index
    equal to the contour's size refers to the implied line that closes the
    contour. */
    std::size_t region_contour;
    std::size_t region_segment;
    Coord region_t;
};

/** The part of segment `segment` of an open contour between `t0` and `t1` */
template<coordinate Coord> struct piece {
    std::size_t segment;
    Coord t0;
    Coord t1;
};

/**
 * A stretch of one open contour between two consecutive cut points (or a
 * contour end).
 *
 * The stretch is made of the pieces `pieces[first_piece]` to
 * `pieces[last_piece-1]` of the `path_slices` instance it belongs to.
 */
struct sub_segment {
    std::size_t contour;
    std::size_t first_piece;
    std::size_t last_piece;

    std::size_t piece_count() const noexcept { return last_piece - first_piece; }
};

/** An open path cut into sub-segments. Concatenating the sub-segments in
order gives back the original path. */
template<coordinate Coord> struct path_slices {
    std::pmr::vector<piece<Coord>> pieces;
    std::pmr::vector<sub_segment> subs;

    explicit path_slices(std::pmr::memory_resource *mem=nullptr)
        : pieces(mem == nullptr ? std::pmr::get_default_resource() : mem),
          subs(mem == nullptr ? std::pmr::get_default_resource() : mem) {}

    void clear() {
        pieces.clear();
        subs.clear();
    }

    std::span<const piece<Coord>> pieces_of(const sub_segment &s) const {
        return std::span<const piece<Coord>>{pieces}.subspan(s.first_piece,s.piece_count());
    }
};

namespace detail {

/* A segment of the clipping region, including the implied closing lines */
template<coordinate Coord> struct region_edge {
    segment<Coord> seg;
    box_t<Coord> box;
    std::size_t contour;
    std::size_t index;
};

template<coordinate Coord> void collect_region_edges(
    const path<Coord> &region,
    std::pmr::vector<region_edge<Coord>> &edges)
{
    edges.clear();
    for(std::size_t ci=0; ci<region.size(); ++ci) {
        auto &c = region[ci];
        if(c.empty()) continue;
        for(std::size_t si=0; si<c.size(); ++si) {
            edges.push_back({c[si],c[si].control_box(),ci,si});
        }
        if(c.end_point() != c.start_point()) {
            auto closing = segment<Coord>::line(c.end_point(),c.start_point());
            edges.push_back({closing,closing.control_box(),ci,c.size()});
        }
    }
}

/* Intersect every segment of "open" with every edge of the region whose box
comes within "params.tolerance" of its own. */
template<coordinate Coord> std::optional<clip_error> find_cuts(
    const path<Coord> &open,
    std::span<const region_edge<Coord>> edges,
    const intersect_params<Coord> &params,
    intersect_scratch<Coord> &scratch,
    std::pmr::vector<intersection<Coord>> &tmp,
    std::pmr::vector<cut_point<Coord>> &cuts)
{
    cuts.clear();
    for(std::size_t ci=0; ci<open.size(); ++ci) {
        auto &c = open[ci];
        for(std::size_t si=0; si<c.size(); ++si) {
            auto &s = c[si];
            box_t<Coord> sbox = s.control_box();
            for(auto &e : edges) {
                if(!sbox.overlaps(e.box,params.tolerance)) continue;

                tmp.clear();
                if(detail::intersect(s,e.seg,params,scratch,tmp) != intersect_status::ok) {
                    PATH_CLIP_DEBUG_LOG(
                        "failed to intersect open {}:{} with region {}:{}",
                        ci,si,e.contour,e.index);
                    return clip_error{error_kind::numerical_failure,operand_t::open_path,ci,si,e.contour,e.index};
                }
                for(auto &x : tmp) {
                    PATH_CLIP_DEBUG_LOG(
                        "cut at open {}:{} t={} region {}:{} t={} ({},{})",
                        ci,si,x.ta,e.contour,e.index,x.tb,x.p.x(),x.p.y());
                    cuts.push_back({ci,si,x.ta,x.p,e.contour,e.index,x.tb});
                }
            }
        }
    }
    return std::nullopt;
}

/* Snap cut points near the end of a segment onto the end, sort them by their
position along the open path, merge the ones that are less than "tolerance"
apart and drop the ones at the ends of a contour, where there is nothing to
cut. */
template<coordinate Coord> void normalize_cuts(
    const path<Coord> &open,
    std::pmr::vector<cut_point<Coord>> &cuts,
    Coord tolerance)
{
    for(auto &cut : cuts) {
        auto &c = open[cut.contour];
        auto &s = c[cut.segment];
        if(approx_equal(cut.p,s.start(),tolerance)) {
            cut.t = 0;
            cut.p = s.start();
        } else if(approx_equal(cut.p,s.end(),tolerance)) {
            cut.t = 1;
            cut.p = s.end();
        }

        /* the end of one segment and the start of the next are the same
        place */
        if(cut.t >= Coord(1) && cut.segment + 1 < c.size()) {
            ++cut.segment;
            cut.t = 0;
            cut.p = c[cut.segment].start();
        }
    }

    std::sort(cuts.begin(),cuts.end(),[](const cut_point<Coord> &a,const cut_point<Coord> &b) {
        return std::tie(a.contour,a.segment,a.t) < std::tie(b.contour,b.segment,b.t);
    });

    auto kept = cuts.begin();
    for(auto itr=cuts.begin(); itr!=cuts.end(); ++itr) {
        auto &c = open[itr->contour];
        if(approx_equal(itr->p,c.start_point(),tolerance) && itr->segment == 0) continue;
        if(approx_equal(itr->p,c.end_point(),tolerance) && itr->segment + 1 == c.size()) continue;

        if(kept != cuts.begin()) {
            auto &prev = *(kept - 1);
            if(prev.contour == itr->contour && approx_equal(prev.p,itr->p,tolerance)) {
                PATH_CLIP_DEBUG_LOG(
                    "merged cut {}:{} t={} into {}:{} t={}",
                    itr->contour,itr->segment,itr->t,prev.contour,prev.segment,prev.t);
                continue;
            }
        }
        *kept++ = *itr;
    }
    cuts.erase(kept,cuts.end());
}

/* True if the pieces of "slices" run along every non-empty contour of "open"
from start to end, in order, with no gaps or overlaps */
template<coordinate Coord> bool slices_cover(const path<Coord> &open,const path_slices<Coord> &slices) {
    std::size_t next_piece = 0;
    auto sub = slices.subs.begin();
    for(std::size_t ci=0; ci<open.size(); ++ci) {
        if(open[ci].empty()) continue;

        std::size_t seg = 0;
        Coord t = 0;
        for(; sub != slices.subs.end() && sub->contour == ci; ++sub) {
            if(sub->first_piece != next_piece || sub->last_piece <= sub->first_piece) return false;
            for(auto &pc : slices.pieces_of(*sub)) {
                if(t == Coord(1) && pc.segment == seg + 1) {
                    ++seg;
                    t = 0;
                }
                if(pc.segment != seg || pc.t0 != t || pc.t1 <= pc.t0) return false;
                t = pc.t1;
            }
            next_piece = sub->last_piece;
        }
        if(seg + 1 != open[ci].size() || t != Coord(1)) return false;
    }
    return sub == slices.subs.end() && next_piece == slices.pieces.size();
}

/* Cut every contour of "open" at the sorted points in "cuts" */
template<coordinate Coord> void slice_contours(
    const path<Coord> &open,
    std::span<const cut_point<Coord>> cuts,
    path_slices<Coord> &out)
{
    out.clear();
    auto next_cut = cuts.begin();
    for(std::size_t ci=0; ci<open.size(); ++ci) {
        auto &c = open[ci];
        if(c.empty()) continue;

        std::size_t seg = 0;
        Coord t = 0;
        std::size_t first = out.pieces.size();

        auto advance_to = [&](std::size_t end_seg,Coord end_t) {
            for(; seg < end_seg; ++seg, t = 0) {
                if(t < Coord(1)) out.pieces.push_back({seg,t,Coord(1)});
            }
            if(end_t > t) out.pieces.push_back({seg,t,end_t});
            t = end_t;
        };

        for(; next_cut != cuts.end() && next_cut->contour == ci; ++next_cut) {
            advance_to(next_cut->segment,next_cut->t);
            if(out.pieces.size() == first) continue;
            out.subs.push_back({ci,first,out.pieces.size()});
            first = out.pieces.size();
        }
        advance_to(c.size() - 1,Coord(1));
        if(out.pieces.size() != first) out.subs.push_back({ci,first,out.pieces.size()});
    }

    PATH_CLIP_ASSERT_SLOW(slices_cover(open,out));
}

/* Find, clean up and apply the cut points of "open" against "region". The
vectors are scratch space owned by the caller. */
template<coordinate Coord> std::optional<clip_error> cut_into_slices(
    const path<Coord> &open,
    const path<Coord> &region,
    const intersect_params<Coord> &params,
    std::pmr::vector<region_edge<Coord>> &edges,
    intersect_scratch<Coord> &scratch,
    std::pmr::vector<intersection<Coord>> &tmp,
    std::pmr::vector<cut_point<Coord>> &cuts,
    path_slices<Coord> &out)
{
    collect_region_edges(region,edges);
    if(auto e = find_cuts(open,std::span<const region_edge<Coord>>{edges},params,scratch,tmp,cuts)) {
        return e;
    }
    normalize_cuts(open,cuts,params.tolerance);
    PATH_CLIP_DEBUG_LOG("{} cut point(s)",cuts.size());

    slice_contours(open,std::span<const cut_point<Coord>>{cuts},out);
    return std::nullopt;
}

} // namespace detail

/**
 * Cut the contours of `open` wherever they meet the outline of `region`.
 *
 * Every contour of `open` must be open and every contour of `region` must be
 * closed. A contour that doesn't meet the outline becomes a single
 * sub-segment. If a pair of curves can't be intersected within
 * `max_depth` subdivisions, an `error_kind::numerical_failure` error is
 * returned.
 */
template<coordinate Coord> result<path_slices<Coord>> split_path(
    const path<Coord> &open,
    const path<Coord> &region,
    Coord tolerance,
    unsigned int max_depth=40)
{
    std::pmr::vector<detail::region_edge<Coord>> edges;
    std::pmr::vector<cut_point<Coord>> cuts;
    std::pmr::vector<intersection<Coord>> tmp;
    detail::intersect_scratch<Coord> scratch;
    path_slices<Coord> r;

    if(auto e = detail::cut_into_slices(open,region,intersect_params<Coord>{tolerance,max_depth},edges,scratch,tmp,cuts,r)) {
        return *e;
    }
    return r;
}

} // namespace path_clip

#endif
