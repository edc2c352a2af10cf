#ifndef PATH_CLIP_INTERSECT_HPP
#define PATH_CLIP_INTERSECT_HPP

#include <vector>
#include <algorithm>
#include <memory_resource>
#include <span>

#include "base.hpp"
#include "roots.hpp"
#include "segment.hpp"


namespace path_clip {

/** A point where two segments meet. `ta` is the parameter on the first segment
and `tb` is the parameter on the second. */
template<coordinate Coord> struct intersection {
    Coord ta;
    Coord tb;
    point_t<Coord> p;
};

enum class intersect_status {
    ok,

    /** Subdivision of a curve/curve pair reached its depth limit without the
    pieces becoming flat enough to treat as lines */
    depth_exceeded
};

template<coordinate Coord> struct intersect_params {
    Coord tolerance;
    unsigned int max_depth = 40;
};

namespace detail {

/* Call "fn(sa,sb)" for every point where the straight line from "a0" to "a1"
meets the straight line from "b0" to "b1". Lines that are parallel and less than
"tolerance" apart are treated as overlapping and "fn" is called for both ends of
the overlap. A line shorter than "tolerance" is treated as a point. */
template<coordinate Coord,typename F> void intersect_lines(
    const point_t<Coord> &a0,
    const point_t<Coord> &a1,
    const point_t<Coord> &b0,
    const point_t<Coord> &b1,
    Coord tolerance,
    F &&fn)
{
    point_t<Coord> da = a1 - a0;
    point_t<Coord> db = b1 - b0;
    Coord la = vmag(da);
    Coord lb = vmag(db);

    auto project = [=](const point_t<Coord> &p,const point_t<Coord> &start,const point_t<Coord> &d,Coord len) {
        return std::clamp(vdot(p - start,d)/(len*len),Coord(0),Coord(1));
    };

    if(la <= tolerance || lb <= tolerance) {
        if(la <= tolerance && lb <= tolerance) {
            if(approx_equal(a0,b0,tolerance)) fn(Coord(0),Coord(0));
        } else if(la <= tolerance) {
            Coord sb = project(a0,b0,db,lb);
            if(approx_equal(a0,vlerp(b0,b1,sb),tolerance)) fn(Coord(0),sb);
        } else {
            Coord sa = project(b0,a0,da,la);
            if(approx_equal(b0,vlerp(a0,a1,sa),tolerance)) fn(sa,Coord(0));
        }
        return;
    }

    point_t<Coord> r = b0 - a0;
    Coord d = vcross(da,db);

    /* "d/la" is how far "b" strays from the direction of "a" over its whole
    length and vice versa */
    if(coord_ops<Coord>::abs(d) <= tolerance*std::min(la,lb)) {
        if(coord_ops<Coord>::abs(vcross(da,r))/la > tolerance
            && coord_ops<Coord>::abs(vcross(da,b1 - a0))/la > tolerance) return;

        Coord s0 = vdot(b0 - a0,da)/(la*la);
        Coord s1 = vdot(b1 - a0,da)/(la*la);
        Coord lo = std::max(Coord(0),std::min(s0,s1));
        Coord hi = std::min(Coord(1),std::max(s0,s1));
        Coord slack = tolerance/la;
        if(lo > hi + slack) return;
        if(lo > hi) lo = hi = (lo + hi)/Coord(2);

        fn(lo,project(vlerp(a0,a1,lo),b0,db,lb));
        if((hi - lo)*la > tolerance) fn(hi,project(vlerp(a0,a1,hi),b0,db,lb));
        return;
    }

    Coord sa = vcross(r,db)/d;
    Coord sb = vcross(r,da)/d;
    Coord slack_a = tolerance/la;
    Coord slack_b = tolerance/lb;
    if(sa < -slack_a || sa > Coord(1) + slack_a || sb < -slack_b || sb > Coord(1) + slack_b) return;
    fn(std::clamp(sa,Coord(0),Coord(1)),std::clamp(sb,Coord(0),Coord(1)));
}

/* Newton's method on a(ta) - b(tb) = 0. Steps that don't reduce the distance
between the two points are rejected, which leaves near-tangent pairs where they
are. */
template<coordinate Coord> void refine_crossing(
    const segment<Coord> &a,
    const segment<Coord> &b,
    Coord &ta,
    Coord &tb)
{
    point_t<Coord> f = a.at(ta) - b.at(tb);
    Coord err = square(f);
    for(int i=0; i<4 && err > Coord(0); ++i) {
        point_t<Coord> da = a.derivative(ta);
        point_t<Coord> db = b.derivative(tb);
        Coord det = vcross(da,db);
        if(det == Coord(0)) return;

        Coord nta = std::clamp(ta + vcross(db,f)/det,Coord(0),Coord(1));
        Coord ntb = std::clamp(tb + vcross(da,f)/det,Coord(0),Coord(1));
        point_t<Coord> nf = a.at(nta) - b.at(ntb);
        Coord nerr = square(nf);
        if(nerr >= err) return;
        ta = nta;
        tb = ntb;
        f = nf;
        err = nerr;
    }
}

/* Move "ta" and "tb" toward the place where "a" and "b" come closest by
projecting each onto the other in turn. Used where the segments run side by
side, so the crossing refinement has nothing to work with. */
template<coordinate Coord> void refine_closest(
    const segment<Coord> &a,
    const segment<Coord> &b,
    Coord &ta,
    Coord &tb)
{
    for(int i=0; i<16; ++i) {
        Coord ntb = closest_param(b,a.at(ta),tb);
        Coord nta = closest_param(a,b.at(ntb),ta);
        bool done = nta == ta && ntb == tb;
        ta = nta;
        tb = ntb;
        if(done) break;
    }
}

template<coordinate Coord> void intersect_line_line(
    const segment<Coord> &a,
    const segment<Coord> &b,
    Coord tolerance,
    std::pmr::vector<intersection<Coord>> &out)
{
    intersect_lines(a.start(),a.end(),b.start(),b.end(),tolerance,[&](Coord ta,Coord tb) {
        out.push_back({ta,tb,a.at(ta)});
    });
}

/* "line" must be a straight line and "curve" must be a quadratic or cubic
curve. Returns false if the curve lies along the line, in which case the
roots don't describe the intersection. */
template<coordinate Coord> bool intersect_line_curve(
    const segment<Coord> &line,
    const segment<Coord> &curve,
    Coord tolerance,
    bool swapped,
    std::pmr::vector<intersection<Coord>> &out)
{
    point_t<Coord> dir = line.end() - line.start();
    Coord len = vmag(dir);

    /* the signed distance of each control point from the line */
    Coord dist[4];
    bool all_near = true;
    auto cpts = curve.points();
    for(std::size_t i=0; i<cpts.size(); ++i) {
        dist[i] = vcross(dir,cpts[i] - line.start())/len;
        if(coord_ops<Coord>::abs(dist[i]) > tolerance) all_near = false;
    }
    if(all_near) return false;

    root_set<Coord> roots;
    bezier_roots<Coord>(std::span<const Coord>{dist,cpts.size()},roots);

    /* an end point resting on the line counts even if rounding put the root
    just outside the curve's parameter range */
    Coord candidates[5];
    std::size_t n = 0;
    for(Coord tc : roots) candidates[n++] = tc;
    if(coord_ops<Coord>::abs(dist[0]) <= tolerance) candidates[n++] = Coord(0);
    if(coord_ops<Coord>::abs(dist[cpts.size()-1]) <= tolerance) candidates[n++] = Coord(1);

    Coord slack = tolerance/len;
    for(Coord tc : std::span<const Coord>{candidates,n}) {
        point_t<Coord> p = curve.at(tc);
        Coord tl = vdot(p - line.start(),dir)/(len*len);
        if(tl < -slack || tl > Coord(1) + slack) continue;
        tl = std::clamp(tl,Coord(0),Coord(1));
        if(swapped) out.push_back({tc,tl,p});
        else out.push_back({tl,tc,p});
    }
    return true;
}

template<coordinate Coord> struct subdivision_item {
    segment<Coord> a;
    segment<Coord> b;
    Coord a0, a1;
    Coord b0, b1;
    unsigned int depth;
};

/* Find the intersections of two segments by recursively splitting them until
the pieces that overlap are flat enough to be treated as lines. */
template<coordinate Coord> intersect_status intersect_subdivide(
    const segment<Coord> &a,
    const segment<Coord> &b,
    const intersect_params<Coord> &params,
    std::pmr::vector<subdivision_item<Coord>> &stack,
    std::pmr::vector<intersection<Coord>> &out)
{
    const Coord tol = params.tolerance;
    stack.clear();
    stack.push_back({a,b,Coord(0),Coord(1),Coord(0),Coord(1),0u});

    while(!stack.empty()) {
        subdivision_item<Coord> item = stack.back();
        stack.pop_back();

        if(!item.a.control_box().overlaps(item.b.control_box(),tol)) continue;

        bool flat_a = item.a.flatness() <= tol;
        bool flat_b = item.b.flatness() <= tol;
        if(flat_a && flat_b) {
            Coord pa_len = item.a1 - item.a0;
            Coord pb_len = item.b1 - item.b0;
            bool parallel = false;
            point_t<Coord> da = item.a.end() - item.a.start();
            point_t<Coord> db = item.b.end() - item.b.start();
            Coord la = vmag(da);
            Coord lb = vmag(db);
            if(la > tol && lb > tol) {
                parallel = coord_ops<Coord>::abs(vcross(da,db)) <= tol*std::min(la,lb);
            }

            bool found = false;
            Coord sa_total = 0, sb_total = 0;
            intersect_lines(item.a.start(),item.a.end(),item.b.start(),item.b.end(),tol,[&](Coord sa,Coord sb) {
                Coord ta = item.a0 + sa*pa_len;
                Coord tb = item.b0 + sb*pb_len;
                if(parallel) {
                    /* pieces running side by side get one point, at their
                    closest approach */
                    if(!found) {
                        sa_total = ta;
                        sb_total = tb;
                    } else {
                        sa_total = (sa_total + ta)/Coord(2);
                        sb_total = (sb_total + tb)/Coord(2);
                    }
                    found = true;
                    return;
                }
                refine_crossing(a,b,ta,tb);
                out.push_back({ta,tb,a.at(ta)});
            });
            if(found) {
                refine_closest(a,b,sa_total,sb_total);
                point_t<Coord> pa = a.at(sa_total);
                if(approx_equal(pa,b.at(sb_total),tol)) out.push_back({sa_total,sb_total,pa});
            }
            continue;
        }

        if(item.depth >= params.max_depth) {
            PATH_CLIP_DEBUG_LOG(
                "subdivision depth limit reached at a=[{},{}] b=[{},{}]",
                item.a0,item.a1,item.b0,item.b1);
            return intersect_status::depth_exceeded;
        }

        Coord am = (item.a0 + item.a1)/Coord(2);
        Coord bm = (item.b0 + item.b1)/Coord(2);
        unsigned int depth = item.depth + 1;
        if(!flat_a && !flat_b) {
            auto [a_lo,a_hi] = item.a.split(Coord(0.5));
            auto [b_lo,b_hi] = item.b.split(Coord(0.5));
            stack.push_back({a_hi,b_hi,am,item.a1,bm,item.b1,depth});
            stack.push_back({a_hi,b_lo,am,item.a1,item.b0,bm,depth});
            stack.push_back({a_lo,b_hi,item.a0,am,bm,item.b1,depth});
            stack.push_back({a_lo,b_lo,item.a0,am,item.b0,bm,depth});
        } else if(!flat_a) {
            auto [a_lo,a_hi] = item.a.split(Coord(0.5));
            stack.push_back({a_hi,item.b,am,item.a1,item.b0,item.b1,depth});
            stack.push_back({a_lo,item.b,item.a0,am,item.b0,item.b1,depth});
        } else {
            auto [b_lo,b_hi] = item.b.split(Coord(0.5));
            stack.push_back({item.a,b_hi,item.a0,item.a1,bm,item.b1,depth});
            stack.push_back({item.a,b_lo,item.a0,item.a1,item.b0,bm,depth});
        }
    }
    return intersect_status::ok;
}

/* Sort by the parameter on the first segment and merge points that are less
than "tolerance" apart, starting at index "first" */
template<coordinate Coord> void dedupe_intersections(
    std::pmr::vector<intersection<Coord>> &out,
    std::size_t first,
    Coord tolerance)
{
    auto begin = out.begin() + static_cast<std::ptrdiff_t>(first);
    std::sort(begin,out.end(),[](auto &x,auto &y) { return x.ta < y.ta; });

    auto kept = begin;
    for(auto itr=begin; itr!=out.end(); ++itr) {
        bool dup = false;
        for(auto k=begin; k!=kept; ++k) {
            if(approx_equal(k->p,itr->p,tolerance)) {
                dup = true;
                break;
            }
        }
        if(!dup) *kept++ = *itr;
    }
    out.erase(kept,out.end());
}

template<coordinate Coord> struct intersect_scratch {
    std::pmr::vector<subdivision_item<Coord>> stack;

    explicit intersect_scratch(std::pmr::memory_resource *mem=nullptr)
        : stack(mem == nullptr ? std::pmr::get_default_resource() : mem) {}
};

template<coordinate Coord> intersect_status intersect(
    const segment<Coord> &a,
    const segment<Coord> &b,
    const intersect_params<Coord> &params,
    intersect_scratch<Coord> &scratch,
    std::pmr::vector<intersection<Coord>> &out)
{
    const Coord tol = params.tolerance;
    if(a.is_degenerate(tol) || b.is_degenerate(tol)) return intersect_status::ok;
    if(!a.control_box().overlaps(b.control_box(),tol)) return intersect_status::ok;

    std::size_t first = out.size();
    intersect_status r = intersect_status::ok;
    if(a.is_line() && b.is_line()) {
        intersect_line_line(a,b,tol,out);
    } else if(a.is_line()) {
        if(!intersect_line_curve(a,b,tol,false,out)) {
            r = intersect_subdivide(a,b,params,scratch.stack,out);
        }
    } else if(b.is_line()) {
        if(!intersect_line_curve(b,a,tol,true,out)) {
            r = intersect_subdivide(a,b,params,scratch.stack,out);
        }
    } else {
        r = intersect_subdivide(a,b,params,scratch.stack,out);
    }

    if(r != intersect_status::ok) {
        out.resize(first);
        return r;
    }
    dedupe_intersections(out,first,tol);
    return r;
}

} // namespace detail

/**
 * Find every point where `a` and `b` meet.
 *
 * Points less than `params.tolerance` apart are reported once. Where the
 * segments overlap along a stretch, the ends of the stretch are reported.
 * A degenerate segment (one whose points all lie within the tolerance of each
 * other) meets nothing.
 *
 * The intersections are appended to `out`, ordered by their parameter on `a`.
 * If `intersect_status::depth_exceeded` is returned, nothing is appended.
 */
template<coordinate Coord> intersect_status intersect(
    const segment<Coord> &a,
    const segment<Coord> &b,
    std::vector<intersection<Coord>> &out,
    const intersect_params<Coord> &params)
{
    detail::intersect_scratch<Coord> scratch;
    std::pmr::vector<intersection<Coord>> tmp;
    intersect_status r = detail::intersect(a,b,params,scratch,tmp);
    out.insert(out.end(),tmp.begin(),tmp.end());
    return r;
}

} // namespace path_clip

#endif
