#ifndef PATH_CLIP_CONTAIN_HPP
#define PATH_CLIP_CONTAIN_HPP

#include <algorithm>
#include <limits>
#include <initializer_list>

#include "base.hpp"
#include "roots.hpp"
#include "segment.hpp"
#include "path.hpp"


namespace path_clip {

enum class fill_rule_t {non_zero,even_odd,positive,negative};

enum class point_location {outside,inside,boundary};

namespace detail {

inline bool should_fill(fill_rule_t rule,long winding) {
    switch(rule) {
    case fill_rule_t::non_zero:
        return winding != 0;
    case fill_rule_t::even_odd:
        return winding % 2;
    case fill_rule_t::positive:
        return winding > 0;
    case fill_rule_t::negative:
        return winding < 0;
    }
    PATH_CLIP_ASSERT(false);
    return false;
}

/* The winding contribution of a piece of a segment, between "t0" and "t1",
that is monotonic in Y. "start" and "end" are the points at "t0" and "t1".

A ray is cast from "p" toward positive X. The ends of a piece are treated as
half-open (the lower end is included, the upper end is not) so that a ray
passing exactly through the point where two pieces meet is counted once. */
template<coordinate Coord> long monotonic_crossing(
    const segment<Coord> &s,
    Coord t0,
    Coord t1,
    const point_t<Coord> &start,
    const point_t<Coord> &end,
    const point_t<Coord> &p)
{
    Coord y0 = start.y();
    Coord y1 = end.y();
    if(y0 == y1) return 0;

    bool up = y0 < y1;
    if(up ? (p.y() < y0 || p.y() >= y1) : (p.y() < y1 || p.y() >= y0)) return 0;

    /* quick rejections before searching for the crossing */
    Coord min_x = std::min(start.x(),end.x());
    Coord max_x = std::max(start.x(),end.x());
    if(!s.is_line()) {
        box_t<Coord> cb = s.portion(t0,t1).control_box();
        min_x = cb.min.x();
        max_x = cb.max.x();
    }
    if(max_x <= p.x()) return 0;
    if(min_x > p.x()) return up ? 1 : -1;

    Coord x;
    if(s.is_line()) {
        x = start.x() + (end.x() - start.x())*(p.y() - y0)/(y1 - y0);
    } else {
        Coord lo = t0, hi = t1;
        for(int i=0; i<64 && lo < hi; ++i) {
            Coord mid = (lo + hi)/Coord(2);
            if(mid <= lo || mid >= hi) break;
            if((s.at(mid).y() <= p.y()) == up) lo = mid;
            else hi = mid;
        }
        x = s.at((lo + hi)/Coord(2)).x();
    }
    if(x > p.x()) return up ? 1 : -1;
    return 0;
}

template<coordinate Coord> long segment_winding(const segment<Coord> &s,const point_t<Coord> &p) {
    box_t<Coord> cb = s.control_box();
    if(p.y() < cb.min.y() || p.y() > cb.max.y() || p.x() >= cb.max.x()) return 0;

    if(s.is_line()) return monotonic_crossing(s,Coord(0),Coord(1),s.start(),s.end(),p);

    root_set<Coord> ts;
    axis_extrema(s,1,ts);

    long r = 0;
    Coord prev_t = 0;
    point_t<Coord> prev_p = s.start();
    for(Coord t : ts) {
        if(t <= prev_t || t >= Coord(1)) continue;
        point_t<Coord> cur = s.at(t);
        r += monotonic_crossing(s,prev_t,t,prev_p,cur,p);
        prev_t = t;
        prev_p = cur;
    }
    r += monotonic_crossing(s,prev_t,Coord(1),prev_p,s.end(),p);
    return r;
}

/* The distance from "p" to the nearest point of "s" */
template<coordinate Coord> Coord segment_distance(const segment<Coord> &s,const point_t<Coord> &p) {
    if(s.is_line()) {
        point_t<Coord> d = s.end() - s.start();
        Coord dd = square(d);
        if(dd == Coord(0)) return vdist(s.start(),p);
        Coord t = std::clamp(vdot(p - s.start(),d)/dd,Coord(0),Coord(1));
        return vdist(s.at(t),p);
    }

    /* start Newton's method from the nearest of a few evenly spaced samples */
    const int samples = 16;
    Coord best_t = 0;
    Coord best = square(s.start() - p);
    for(int i=1; i<=samples; ++i) {
        Coord t = Coord(i)/Coord(samples);
        Coord d = square(s.at(t) - p);
        if(d < best) {
            best = d;
            best_t = t;
        }
    }
    return vdist(s.at(closest_param(s,p,best_t)),p);
}

/* The lower bound of the distance between "p" and anything inside "b" */
template<coordinate Coord> Coord box_distance(const box_t<Coord> &b,const point_t<Coord> &p) {
    Coord dx = std::max({b.min.x() - p.x(),Coord(0),p.x() - b.max.x()});
    Coord dy = std::max({b.min.y() - p.y(),Coord(0),p.y() - b.max.y()});
    return coord_ops<Coord>::sqrt(dx*dx + dy*dy);
}

} // namespace detail

/**
 * The winding number of `region` around `p`.
 *
 * Every contour is treated as closed, whether or not its last point matches
 * its first. Counter-clockwise contours (with the Y axis pointing up) add one
 * and clockwise contours subtract one.
 */
template<coordinate Coord> long winding_number(const point_t<Coord> &p,const path<Coord> &region) {
    long r = 0;
    for(auto &c : region) {
        if(c.empty()) continue;
        for(auto &s : c) r += detail::segment_winding(s,p);
        if(c.end_point() != c.start_point()) {
            r += detail::segment_winding(segment<Coord>::line(c.end_point(),c.start_point()),p);
        }
    }
    return r;
}

/** True if `p` is inside `region` according to `rule`. Points on the boundary
may go either way. */
template<coordinate Coord> bool is_inside(
    const point_t<Coord> &p,
    const path<Coord> &region,
    fill_rule_t rule=fill_rule_t::even_odd)
{
    return detail::should_fill(rule,winding_number(p,region));
}

/** The distance from `p` to the nearest point on the outline of `region`,
including the implied closing lines */
template<coordinate Coord> Coord boundary_distance(const point_t<Coord> &p,const path<Coord> &region) {
    Coord best = std::numeric_limits<Coord>::max();
    auto check = [&](const segment<Coord> &s) {
        if(detail::box_distance(s.control_box(),p) >= best) return;
        best = std::min(best,detail::segment_distance(s,p));
    };
    for(auto &c : region) {
        if(c.empty()) continue;
        for(auto &s : c) check(s);
        if(c.end_point() != c.start_point()) check(segment<Coord>::line(c.end_point(),c.start_point()));
    }
    return best;
}

/** Determine whether `p` is inside or outside of `region`, or within
`tolerance` of its outline */
template<coordinate Coord> point_location locate_point(
    const point_t<Coord> &p,
    const path<Coord> &region,
    fill_rule_t rule,
    Coord tolerance)
{
    if(boundary_distance(p,region) <= tolerance) return point_location::boundary;
    return is_inside(p,region,rule) ? point_location::inside : point_location::outside;
}

/**
 * Classify a point that belongs to a piece of an open path.
 *
 * If `p` lies on the outline of `region`, it is moved along `dir` (the
 * direction of the open path at `p`, as a unit vector) by twice the
 * tolerance, then four times and so on, for as long as the distance moved
 * doesn't exceed `reach`. If every such point is still on the outline, the
 * same is tried in the opposite direction. A piece that never leaves the
 * outline runs along it, and the outline counts as part of the region.
 *
 * The result is never `point_location::boundary`.
 */
template<coordinate Coord> point_location classify_nudged(
    const point_t<Coord> &p,
    const point_t<Coord> &dir,
    Coord reach,
    const path<Coord> &region,
    fill_rule_t rule,
    Coord tolerance)
{
    point_location loc = locate_point(p,region,rule,tolerance);
    if(loc != point_location::boundary) return loc;

    for(Coord sign : {Coord(1),Coord(-1)}) {
        for(Coord step=tolerance*Coord(2); step > Coord(0) && step <= reach; step *= Coord(2)) {
            point_t<Coord> q = p + dir*(sign*step);
            loc = locate_point(q,region,rule,tolerance);
            if(loc != point_location::boundary) {
                PATH_CLIP_DEBUG_LOG("nudged ({},{}) by {} to classify it",p.x(),p.y(),sign*step);
                return loc;
            }
        }
    }

    PATH_CLIP_DEBUG_LOG("({},{}) stays on the boundary",p.x(),p.y());
    return point_location::inside;
}

} // namespace path_clip

#endif
