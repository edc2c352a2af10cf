#ifndef PATH_CLIP_ROOTS_HPP
#define PATH_CLIP_ROOTS_HPP

#include <algorithm>
#include <span>
#include <cstddef>

#include "base.hpp"


namespace path_clip::detail {

/* A fixed-capacity set of polynomial roots. Polynomials of degree three or
lower never have more than three real roots. */
template<coordinate Coord> class root_set {
    Coord values[3];
    unsigned int n = 0;

public:
    void push_back(Coord x) {
        PATH_CLIP_ASSERT(n < 3);
        values[n++] = x;
    }

    void clear() noexcept { n = 0; }

    std::size_t size() const noexcept { return n; }
    bool empty() const noexcept { return n == 0; }

    Coord *begin() noexcept { return values; }
    const Coord *begin() const noexcept { return values; }
    Coord *end() noexcept { return values + n; }
    const Coord *end() const noexcept { return values + n; }

    Coord operator[](std::size_t i) const noexcept { return values[i]; }

    void sort() { std::sort(values,values + n); }

    /* Remove values that are within "tolerance" of the value before them. The
    set must already be sorted. */
    void unique(Coord tolerance) {
        if(n < 2) return;
        unsigned int out = 1;
        for(unsigned int i=1; i<n; ++i) {
            if(values[i] - values[out-1] > tolerance) values[out++] = values[i];
        }
        n = out;
    }
};

/* Rounding guards for the root finders. They are not geometric tolerances:
"relative_zero" is a fraction of the magnitude of the coefficients being
compared and "param_slack" is a distance in the unit parameter space of a
segment, so neither depends on the size of the input. */
template<coordinate Coord> Coord relative_zero() { return Coord(1e-12); }
template<coordinate Coord> Coord param_slack() { return Coord(1e-9); }

template<coordinate Coord> bool near_zero(Coord x,Coord scale) {
    return coord_ops<Coord>::abs(x) <= scale * relative_zero<Coord>();
}

/* Evaluate c3*t^3 + c2*t^2 + c1*t + c0 */
template<coordinate Coord> Coord eval_poly(Coord c3,Coord c2,Coord c1,Coord c0,Coord t) {
    return ((c3*t + c2)*t + c1)*t + c0;
}

/* A couple of Newton steps to clean up the roots produced by the closed form
solutions, which lose precision when roots are close together. A step is only
taken if it makes the residual smaller. */
template<coordinate Coord> Coord polish_root(Coord c3,Coord c2,Coord c1,Coord c0,Coord t) {
    for(int i=0; i<4; ++i) {
        Coord f = eval_poly(c3,c2,c1,c0,t);
        Coord df = (Coord(3)*c3*t + Coord(2)*c2)*t + c1;
        if(df == Coord(0)) break;
        Coord nt = t - f/df;
        if(coord_ops<Coord>::abs(eval_poly(c3,c2,c1,c0,nt)) >= coord_ops<Coord>::abs(f)) break;
        t = nt;
    }
    return t;
}

/* Find the real roots of c2*t^2 + c1*t + c0. A discriminant that is negative
only because of rounding error is treated as zero, so tangential touches still
produce a (double) root. */
template<coordinate Coord> void solve_quadratic(Coord c2,Coord c1,Coord c0,root_set<Coord> &out) {
    Coord scale = std::max({coord_ops<Coord>::abs(c2),coord_ops<Coord>::abs(c1),coord_ops<Coord>::abs(c0)});
    if(scale == Coord(0)) return;

    if(near_zero(c2,scale)) {
        if(near_zero(c1,scale)) return;
        out.push_back(-c0/c1);
        return;
    }

    Coord disc = c1*c1 - Coord(4)*c2*c0;
    if(disc < Coord(0)) {
        if(!near_zero(disc,c1*c1 + coord_ops<Coord>::abs(Coord(4)*c2*c0))) return;
        disc = Coord(0);
    }

    if(disc == Coord(0)) {
        out.push_back(-c1/(Coord(2)*c2));
        return;
    }

    /* this form avoids cancellation when c1 is much larger than the
    discriminant */
    Coord q = Coord(-0.5) * (c1 + (c1 < Coord(0) ? -coord_ops<Coord>::sqrt(disc) : coord_ops<Coord>::sqrt(disc)));
    out.push_back(q/c2);
    if(q != Coord(0)) out.push_back(c0/q);
    out.sort();
}

/* Find the real roots of c3*t^3 + c2*t^2 + c1*t + c0 using Cardano's method,
or the trigonometric method when there are three real roots. */
template<coordinate Coord> void solve_cubic(Coord c3,Coord c2,Coord c1,Coord c0,root_set<Coord> &out) {
    Coord scale = std::max({
        coord_ops<Coord>::abs(c3),
        coord_ops<Coord>::abs(c2),
        coord_ops<Coord>::abs(c1),
        coord_ops<Coord>::abs(c0)});
    if(scale == Coord(0)) return;

    if(near_zero(c3,scale)) {
        solve_quadratic(c2,c1,c0,out);
        return;
    }

    Coord a = c2/c3;
    Coord b = c1/c3;
    Coord c = c0/c3;

    Coord p = (Coord(3)*b - a*a) / Coord(3);
    Coord q = (Coord(2)*a*a*a - Coord(9)*a*b + Coord(27)*c) / Coord(27);
    Coord q2 = q / Coord(2);
    Coord p3 = p / Coord(3);
    Coord disc = q2*q2 + p3*p3*p3;
    Coord shift = a / Coord(3);

    Coord dscale = q2*q2 + coord_ops<Coord>::abs(p3*p3*p3);
    if(near_zero(disc,dscale)) disc = Coord(0);

    if(disc < Coord(0)) {
        Coord mp3 = -p3;
        Coord r = coord_ops<Coord>::sqrt(mp3*mp3*mp3);
        Coord cosphi = std::clamp(-q/(Coord(2)*r),Coord(-1),Coord(1));
        Coord phi = coord_ops<Coord>::acos(cosphi);
        Coord t1 = Coord(2) * coord_ops<Coord>::cbrt(r);
        Coord tau = Coord(2) * coord_ops<Coord>::pi();
        out.push_back(t1 * coord_ops<Coord>::cos(phi/Coord(3)) - shift);
        out.push_back(t1 * coord_ops<Coord>::cos((phi + tau)/Coord(3)) - shift);
        out.push_back(t1 * coord_ops<Coord>::cos((phi + Coord(2)*tau)/Coord(3)) - shift);
    } else if(disc == Coord(0)) {
        Coord u1 = -coord_ops<Coord>::cbrt(q2);
        out.push_back(Coord(2)*u1 - shift);
        if(u1 != Coord(0)) out.push_back(-u1 - shift);
    } else {
        Coord sd = coord_ops<Coord>::sqrt(disc);
        Coord u1 = coord_ops<Coord>::cbrt(-q2 + sd);
        Coord v1 = coord_ops<Coord>::cbrt(q2 + sd);
        out.push_back(u1 - v1 - shift);
    }

    for(Coord &t : out) t = polish_root(c3,c2,c1,c0,t);
    out.sort();
}

/* Find the parameters in [0,1] where a one-dimensional Bézier polynomial with
the given control values is zero. "bern" has between two and four values
(line, quadratic, cubic). Roots slightly outside the unit interval because of
rounding are clamped onto it. */
template<coordinate Coord> void bezier_roots(std::span<const Coord> bern,root_set<Coord> &out) {
    root_set<Coord> all;
    switch(bern.size()) {
    case 2:
        solve_quadratic(Coord(0),bern[1] - bern[0],bern[0],all);
        break;
    case 3:
        solve_quadratic(
            bern[0] - Coord(2)*bern[1] + bern[2],
            Coord(2)*(bern[1] - bern[0]),
            bern[0],
            all);
        break;
    case 4:
        solve_cubic(
            -bern[0] + Coord(3)*bern[1] - Coord(3)*bern[2] + bern[3],
            Coord(3)*bern[0] - Coord(6)*bern[1] + Coord(3)*bern[2],
            Coord(3)*(bern[1] - bern[0]),
            bern[0],
            all);
        break;
    default:
        PATH_CLIP_ASSERT(false);
        return;
    }

    const Coord slack = param_slack<Coord>();
    for(Coord t : all) {
        if(t < -slack || t > Coord(1) + slack) continue;
        out.push_back(std::clamp(t,Coord(0),Coord(1)));
    }
    out.sort();
    out.unique(slack);
}

} // namespace path_clip::detail

#endif
