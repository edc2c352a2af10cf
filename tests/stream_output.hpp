/* Stream output for the types in path_clip.hpp, and a plain text format for
reading and writing test paths.

The text format has one command per line, the same commands as SVG path data
but with absolute coordinates only:

    M x y
    L x y
    Q cx cy x y
    C c1x c1y c2x c2y x y
    Z

A line containing "===" separates the path to clip from the clipping region.
*/

#ifndef stream_output_hpp
#define stream_output_hpp

#include <tuple>
#include <vector>
#include <string>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "../include/path_clip/path_clip.hpp"

namespace path_clip {
template<typename T> inline std::ostream &operator<<(std::ostream &os,const point_t<T> &x) {
    return os << '{' << x.x() << ',' << x.y() << '}';
}

template<typename Coord> std::ostream &operator<<(std::ostream &os,const segment<Coord> &x) {
    switch(x.kind()) {
    case segment_kind::line: os << "line"; break;
    case segment_kind::quadratic: os << "quadratic"; break;
    case segment_kind::cubic: os << "cubic"; break;
    }
    os << '(';
    bool started = false;
    for(auto &p : x.points()) {
        if(started) os << ',';
        started = true;
        os << p;
    }
    return os << ')';
}

template<typename Coord> std::ostream &operator<<(std::ostream &os,const contour<Coord> &x) {
    os << (x.closed() ? "closed{" : "open{");
    bool started = false;
    for(auto &s : x) {
        if(started) os << ',';
        started = true;
        os << s;
    }
    return os << '}';
}

inline std::ostream &operator<<(std::ostream &os,error_kind x) {
    return os << to_string(x);
}

inline std::ostream &operator<<(std::ostream &os,point_location x) {
    switch(x) {
    case point_location::inside: return os << "inside";
    case point_location::outside: return os << "outside";
    case point_location::boundary: return os << "boundary";
    }
    return os;
}

inline std::ostream &operator<<(std::ostream &os,const clip_error &x) {
    return os << describe(x);
}
} // namespace path_clip

template<typename T> struct _pp {
    T value;
    unsigned int indent;
};

struct indent_t {
    unsigned int amount;
};
inline indent_t operator+(indent_t a,unsigned int b) {
    return {a.amount+b};
}

inline std::ostream &operator<<(std::ostream &os,indent_t indent) {
    os << '\n';
    for(unsigned int i=0; i<indent.amount; ++i) os << "  ";
    return os;
}

template<typename T> _pp<T> pp(T &&x,unsigned int indent) { return _pp<T>{std::forward<T>(x),indent}; }
template<typename T> _pp<T> pp(T &&x,indent_t indent) { return _pp<T>{std::forward<T>(x),indent.amount}; }

template<typename T> struct pp_printer {
    void operator()(std::ostream &os,indent_t,const T &x) const {
        os << x;
    }
};

template<> struct pp_printer<bool> {
    void operator()(std::ostream &os,indent_t,bool x) const {
        os << (x ? "true" : "false");
    }
};

template<typename Coord> struct pp_printer<path_clip::contour<Coord>> {
    void operator()(std::ostream &os,indent_t indent,const path_clip::contour<Coord> &x) const {
        os << (x.closed() ? "closed{" : "open{");
        bool started = false;
        indent = indent + 1;
        for(auto &s : x) {
            if(started) os << ',';
            started = true;
            if(x.size() > 1) os << indent;
            os << s;
        }
        os << '}';
    }
};

template<typename T,typename Alloc> struct pp_printer<std::vector<T,Alloc>> {
    void operator()(std::ostream &os,indent_t indent,const std::vector<T,Alloc> &x) const {
        os << "std::vector{";
        bool started = false;
        indent = indent + 1;
        for(const auto &item : x) {
            if(started) os << ',';
            started = true;
            if(x.size() > 1) os << indent;
            os << pp(item,indent);
        }
        os << '}';
    }
};

template<typename T> std::ostream &operator<<(std::ostream &os,const _pp<T> &x) {
    pp_printer<std::remove_cvref_t<T>>{}(os,indent_t{x.indent},x.value);
    return os;
}

template<typename Coord> void write_contour(std::ostream &os,const path_clip::contour<Coord> &c) {
    if(c.empty()) return;
    os << "M " << c.start_point()[0] << ' ' << c.start_point()[1] << '\n';
    for(auto &s : c) {
        auto pts = s.points();
        switch(s.kind()) {
        case path_clip::segment_kind::line: os << 'L'; break;
        case path_clip::segment_kind::quadratic: os << 'Q'; break;
        case path_clip::segment_kind::cubic: os << 'C'; break;
        }
        for(auto &p : pts.subspan(1)) os << ' ' << p[0] << ' ' << p[1];
        os << '\n';
    }
    if(c.closed()) os << "Z\n";
}

template<typename Coord> void write_path(std::ostream &os,const path_clip::path<Coord> &p) {
    for(auto &c : p) write_contour(os,c);
}

template<typename Coord> void write_clip_input(
    std::ostream &os,
    const path_clip::path<Coord> &open,
    const path_clip::path<Coord> &region)
{
    os.precision(17);
    write_path(os,open);
    os << "===\n";
    write_path(os,region);
}

struct bad_path_text : std::runtime_error {
    bad_path_text(const std::string &msg,int line)
        : std::runtime_error{"line " + std::to_string(line) + ": " + msg} {}
};

/* Read commands until the end of the stream or a "===" line. Returns false if
the end of the stream was reached. */
template<typename Coord> bool read_path(std::istream &is,path_clip::path<Coord> &out,int &line_no) {
    path_clip::path_builder<Coord> b;
    std::string line;
    bool more = false;
    while(std::getline(is,line)) {
        ++line_no;
        std::istringstream ls(line);
        std::string cmd;
        if(!(ls >> cmd)) continue;
        if(cmd == "===") {
            more = true;
            break;
        }

        Coord v[6];
        int needed;
        switch(cmd.size() == 1 ? cmd[0] : '?') {
        case 'M':
        case 'L': needed = 2; break;
        case 'Q': needed = 4; break;
        case 'C': needed = 6; break;
        case 'Z': needed = 0; break;
        default: throw bad_path_text{"unknown command \"" + cmd + '"',line_no};
        }
        for(int i=0; i<needed; ++i) {
            if(!(ls >> v[i])) throw bad_path_text{"expected a number",line_no};
        }

        switch(cmd[0]) {
        case 'M': b.move_to({v[0],v[1]}); break;
        case 'L': b.line_to({v[0],v[1]}); break;
        case 'Q': b.quad_to({v[0],v[1]},{v[2],v[3]}); break;
        case 'C': b.cubic_to({v[0],v[1]},{v[2],v[3]},{v[4],v[5]}); break;
        case 'Z': b.close(); break;
        }
    }
    if(is.bad()) throw std::runtime_error{"failed to read input"};
    out = b.build();
    return more;
}

/* Read the path to clip, then the clipping region, separated by "===" */
template<typename Coord> void read_clip_input(
    std::istream &is,
    path_clip::path<Coord> &open,
    path_clip::path<Coord> &region)
{
    int line_no = 0;
    if(!read_path(is,open,line_no)) throw bad_path_text{"expected \"===\" before the clipping region",line_no};
    read_path(is,region,line_no);
}

#endif
