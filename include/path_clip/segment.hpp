#ifndef PATH_CLIP_SEGMENT_HPP
#define PATH_CLIP_SEGMENT_HPP

#include <algorithm>
#include <span>
#include <utility>
#include <cstddef>

#include "base.hpp"
#include "roots.hpp"


namespace path_clip {

enum class segment_kind {line=1,quadratic=2,cubic=3};

/**
 * A directed curve element: a straight line, a quadratic Bézier curve or a
 * cubic Bézier curve.
 *
 * The first point is the start and the last point is the end. Any points in
 * between are control points. Segments are immutable; operations that change
 * the geometry, such as `split` and `portion`, return new segments.
 */
template<coordinate Coord> class segment {
    point_t<Coord> pts[4];
    segment_kind _kind;

    segment(segment_kind k) : pts{}, _kind{k} {}

public:
    /** Create a straight line from `a` to `b` */
    static segment line(const point_t<Coord> &a,const point_t<Coord> &b) {
        segment r{segment_kind::line};
        r.pts[0] = a;
        r.pts[1] = b;
        return r;
    }

    /** Create a quadratic Bézier curve from `a` to `b` with control point
    `c` */
    static segment quadratic(const point_t<Coord> &a,const point_t<Coord> &c,const point_t<Coord> &b) {
        segment r{segment_kind::quadratic};
        r.pts[0] = a;
        r.pts[1] = c;
        r.pts[2] = b;
        return r;
    }

    /** Create a cubic Bézier curve from `a` to `b` with control points `c1` and
    `c2` */
    static segment cubic(
        const point_t<Coord> &a,
        const point_t<Coord> &c1,
        const point_t<Coord> &c2,
        const point_t<Coord> &b)
    {
        segment r{segment_kind::cubic};
        r.pts[0] = a;
        r.pts[1] = c1;
        r.pts[2] = c2;
        r.pts[3] = b;
        return r;
    }

    segment(const segment&) = default;
    segment &operator=(const segment&) = default;

    segment_kind kind() const noexcept { return _kind; }
    unsigned int degree() const noexcept { return static_cast<unsigned int>(_kind); }
    bool is_line() const noexcept { return _kind == segment_kind::line; }

    /** The start point, control points and end point, in that order */
    std::span<const point_t<Coord>> points() const noexcept {
        return {pts,static_cast<std::size_t>(degree()) + 1};
    }

    const point_t<Coord> &start() const noexcept { return pts[0]; }
    const point_t<Coord> &end() const noexcept { return pts[degree()]; }

    /** Get the point at parameter `t`, where `t` is between 0 and 1 */
    point_t<Coord> at(Coord t) const {
        Coord mt = Coord(1) - t;
        switch(_kind) {
        case segment_kind::line:
            return vlerp(pts[0],pts[1],t);
        case segment_kind::quadratic:
            return pts[0]*(mt*mt) + pts[1]*(Coord(2)*mt*t) + pts[2]*(t*t);
        case segment_kind::cubic:
            return pts[0]*(mt*mt*mt)
                + pts[1]*(Coord(3)*mt*mt*t)
                + pts[2]*(Coord(3)*mt*t*t)
                + pts[3]*(t*t*t);
        }
        PATH_CLIP_ASSERT(false);
        return pts[0];
    }

    /** The first derivative with respect to `t` */
    point_t<Coord> derivative(Coord t) const {
        Coord mt = Coord(1) - t;
        switch(_kind) {
        case segment_kind::line:
            return pts[1] - pts[0];
        case segment_kind::quadratic:
            return (pts[1] - pts[0])*(Coord(2)*mt) + (pts[2] - pts[1])*(Coord(2)*t);
        case segment_kind::cubic:
            return (pts[1] - pts[0])*(Coord(3)*mt*mt)
                + (pts[2] - pts[1])*(Coord(6)*mt*t)
                + (pts[3] - pts[2])*(Coord(3)*t*t);
        }
        PATH_CLIP_ASSERT(false);
        return {Coord(0),Coord(0)};
    }

    /** The direction of travel at `t`, as a unit vector.
     *
     * At a cusp, where the first derivative vanishes, the direction is taken
     * from the control polygon instead: the first non-coincident control point
     * going forward (for `t` < 0.5) or backward. A degenerate segment has a
     * zero tangent.
     */
    point_t<Coord> tangent(Coord t) const {
        point_t<Coord> d = derivative(t);
        if(square(d) > Coord(0)) return vunit(d);

        auto p = points();
        if(t < Coord(0.5)) {
            for(std::size_t i=1; i<p.size(); ++i) {
                if(p[i] != p[0]) return vunit(p[i] - p[0]);
            }
        } else {
            std::size_t last = p.size() - 1;
            for(std::size_t i=last; i-- > 0;) {
                if(p[i] != p[last]) return vunit(p[last] - p[i]);
            }
        }
        return {Coord(0),Coord(0)};
    }

    /** Split at `t` using de Casteljau's algorithm */
    std::pair<segment,segment> split(Coord t) const {
        switch(_kind) {
        case segment_kind::line:
            {
                point_t<Coord> m = vlerp(pts[0],pts[1],t);
                return {line(pts[0],m),line(m,pts[1])};
            }
        case segment_kind::quadratic:
            {
                point_t<Coord> a = vlerp(pts[0],pts[1],t);
                point_t<Coord> b = vlerp(pts[1],pts[2],t);
                point_t<Coord> m = vlerp(a,b,t);
                return {quadratic(pts[0],a,m),quadratic(m,b,pts[2])};
            }
        case segment_kind::cubic:
            {
                point_t<Coord> a = vlerp(pts[0],pts[1],t);
                point_t<Coord> b = vlerp(pts[1],pts[2],t);
                point_t<Coord> c = vlerp(pts[2],pts[3],t);
                point_t<Coord> ab = vlerp(a,b,t);
                point_t<Coord> bc = vlerp(b,c,t);
                point_t<Coord> m = vlerp(ab,bc,t);
                return {cubic(pts[0],a,ab,m),cubic(m,bc,c,pts[3])};
            }
        }
        PATH_CLIP_ASSERT(false);
        return {*this,*this};
    }

    /** The part of this segment between `t0` and `t1`.
     *
     * The end points of the result are exactly `at(t0)` and `at(t1)` (or the
     * original end points when `t0` is 0 or `t1` is 1), so adjacent portions
     * share their end points bit for bit.
     */
    segment portion(Coord t0,Coord t1) const {
        PATH_CLIP_ASSERT(t0 <= t1);
        if(t0 <= Coord(0) && t1 >= Coord(1)) return *this;
        if(t0 >= t1) {
            segment r = *this;
            point_t<Coord> p = at(t0);
            for(unsigned int i=0; i<=degree(); ++i) r.pts[i] = p;
            return r;
        }

        segment r = *this;
        if(t1 < Coord(1)) r = r.split(t1).first;
        if(t0 > Coord(0)) r = r.split(t0/t1).second;

        r.pts[0] = t0 > Coord(0) ? at(t0) : pts[0];
        r.pts[degree()] = t1 < Coord(1) ? at(t1) : end();
        return r;
    }

    /** The same geometry traversed in the opposite direction */
    segment reversed() const {
        segment r = *this;
        std::reverse(r.pts,r.pts + degree() + 1);
        return r;
    }

    /** The box that contains all the control points. This is cheaper to
    compute than `bounding_box` and always contains it. */
    box_t<Coord> control_box() const {
        box_t<Coord> r{pts[0]};
        for(auto &p : points().subspan(1)) r.expand(p);
        return r;
    }

    /** The length of the control polygon. This is never shorter than the
    segment itself. */
    Coord control_length() const {
        Coord r = 0;
        for(unsigned int i=0; i<degree(); ++i) r += vdist(pts[i],pts[i+1]);
        return r;
    }

    /** An approximation of the arc length, the average of the chord length and
    the control polygon length */
    Coord approx_length() const {
        if(is_line()) return vdist(pts[0],pts[1]);
        return (control_length() + vdist(start(),end())) / Coord(2);
    }

    /** The greatest distance between a control point and the chord. A flat
    segment can be treated as a line. */
    Coord flatness() const {
        if(is_line()) return Coord(0);
        point_t<Coord> chord = end() - start();
        Coord len = vmag(chord);
        Coord r = 0;
        for(unsigned int i=1; i<degree(); ++i) {
            Coord d = len > Coord(0)
                ? coord_ops<Coord>::abs(vcross(chord,pts[i] - start())) / len
                : vdist(start(),pts[i]);
            r = std::max(r,d);
        }
        return r;
    }

    /** True if every point of this segment is within `tolerance` of its start
    point */
    bool is_degenerate(Coord tolerance) const {
        for(auto &p : points().subspan(1)) {
            if(!approx_equal(pts[0],p,tolerance)) return false;
        }
        return true;
    }

    friend bool operator==(const segment &a,const segment &b) {
        return a._kind == b._kind && std::ranges::equal(a.points(),b.points());
    }
};

/** Get the point at parameter `t` of `s` */
template<coordinate Coord> point_t<Coord> evaluate(const segment<Coord> &s,Coord t) {
    return s.at(t);
}

namespace detail {
/* Add the parameters in (0,1) where the derivative of coordinate "axis" of "s"
is zero. These are the extrema along that axis. */
template<coordinate Coord> void axis_extrema(const segment<Coord> &s,std::size_t axis,root_set<Coord> &out) {
    auto p = s.points();
    switch(s.kind()) {
    case segment_kind::line:
        return;
    case segment_kind::quadratic:
        {
            Coord d[] = {p[1][axis] - p[0][axis],p[2][axis] - p[1][axis]};
            bezier_roots<Coord>(d,out);
        }
        break;
    case segment_kind::cubic:
        {
            Coord d[] = {
                p[1][axis] - p[0][axis],
                p[2][axis] - p[1][axis],
                p[3][axis] - p[2][axis]};
            bezier_roots<Coord>(d,out);
        }
        break;
    }
}

/* The parameter of the point of "s" closest to "p", found with Newton's method
starting at "t" */
template<coordinate Coord> Coord closest_param(const segment<Coord> &s,const point_t<Coord> &p,Coord t) {
    Coord best = square(s.at(t) - p);
    for(int i=0; i<8; ++i) {
        point_t<Coord> d = s.derivative(t);
        Coord dd = square(d);
        if(dd == Coord(0)) break;
        Coord nt = std::clamp(t - vdot(s.at(t) - p,d)/dd,Coord(0),Coord(1));
        Coord dist = square(s.at(nt) - p);
        if(dist >= best) break;
        best = dist;
        t = nt;
    }
    return t;
}

} // namespace detail

/** The smallest axis-aligned box that contains `s` */
template<coordinate Coord> box_t<Coord> bounding_box(const segment<Coord> &s) {
    box_t<Coord> r{s.start()};
    r.expand(s.end());
    for(std::size_t axis=0; axis<2; ++axis) {
        detail::root_set<Coord> ts;
        detail::axis_extrema(s,axis,ts);
        for(Coord t : ts) r.expand(s.at(t));
    }
    return r;
}

} // namespace path_clip

#endif
