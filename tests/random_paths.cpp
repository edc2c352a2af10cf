#include <iostream>
#include <fstream>
#include <random>
#include <memory>
#include <numbers>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <cmath>

struct assertion_failure : std::logic_error {
    using logic_error::logic_error;
};

#define PATH_CLIP_ASSERT(X) do { if(!(X)) throw assertion_failure{"assertion failure: " #X}; } while(false)

typedef double coord_t;

#include "stream_output.hpp"

using namespace path_clip;


constexpr long DEFAULT_POINT_COUNT = 5;
constexpr long DEFAULT_TEST_COUNT = 100000;

struct test_failure : std::runtime_error {
    using runtime_error::runtime_error;
};

struct settings_t {
    long point_count;
    long skip;
    long tests;
    bool curves;
    std::unique_ptr<char[]> failout;
    std::unique_ptr<char[]> datain;

    settings_t() : point_count(-1), skip(-1), tests(-1), curves(false) {}
};

/* A closed region shaped like a star around the middle of the drawing area.
Curved regions get quadratic edges bulging outward. */
path<coord_t> random_region(std::mt19937 &rand_gen,long size,bool curves) {
    std::uniform_real_distribution<coord_t> angle_dist(0,2*std::numbers::pi);
    std::uniform_real_distribution<coord_t> radius_dist(100,400);
    std::vector<coord_t> angles(size);
    for(auto &a : angles) a = angle_dist(rand_gen);
    std::sort(angles.begin(),angles.end());

    std::vector<point_t<coord_t>> pts;
    for(coord_t a : angles) {
        coord_t r = radius_dist(rand_gen);
        pts.push_back({500 + r*std::cos(a),500 + r*std::sin(a)});
    }

    if(!curves) return make_polyline_path<coord_t>(pts,true);

    path_builder<coord_t> b;
    b.move_to(pts[0]);
    for(std::size_t i=0; i<pts.size(); ++i) {
        auto &next = pts[(i+1) % pts.size()];
        auto mid = (pts[i] + next) / coord_t(2);
        b.quad_to(mid + (mid - point_t<coord_t>(500,500)) * coord_t(0.2),next);
    }
    return b.close().build();
}

path<coord_t> random_open(std::mt19937 &rand_gen,long size,bool curves) {
    std::uniform_real_distribution<coord_t> dist(0,1000);
    path_builder<coord_t> b;
    b.move_to({dist(rand_gen),dist(rand_gen)});
    for(long i=1; i<size; ++i) {
        if(curves && i % 2 == 0) {
            b.cubic_to({dist(rand_gen),dist(rand_gen)},{dist(rand_gen),dist(rand_gen)},{dist(rand_gen),dist(rand_gen)});
        } else {
            b.line_to({dist(rand_gen),dist(rand_gen)});
        }
    }
    return b.build();
}

/* approx_length() is not additive for curves, so sample them instead */
coord_t sampled_length(const segment<coord_t> &s) {
    if(s.is_line()) return vdist(s.start(),s.end());
    constexpr int samples = 256;
    coord_t r = 0;
    point_t<coord_t> prev = s.start();
    for(int i=1; i<=samples; ++i) {
        point_t<coord_t> p = s.at(coord_t(i)/samples);
        r += vdist(prev,p);
        prev = p;
    }
    return r;
}

template<typename R> coord_t total_length(const R &contours) {
    coord_t r = 0;
    for(auto &c : contours) {
        for(auto &s : c) r += sampled_length(s);
    }
    return r;
}

/* Clip both ways and check that the results account for the whole of the
open path */
void do_one(clipper<coord_t> &c,const path<coord_t> &open,const path<coord_t> &region) {
    auto in = c.clip(open,region);
    if(!in) {
        if(in.error().kind == error_kind::numerical_failure) return;
        throw test_failure{describe(in.error())};
    }
    auto out = c.clip(open,region,clip_options<coord_t>{}.keep(keep_side::outside));
    if(!out) throw test_failure{describe(out.error())};

    coord_t expected = total_length(open);
    coord_t actual = total_length(*in) + total_length(*out);
    if(std::abs(expected - actual) > expected * 1e-4) {
        throw test_failure{
            "the inside and outside parts have a total length of " + std::to_string(actual)
            + " instead of " + std::to_string(expected)};
    }

    for(auto &part : *in) {
        if(part.find_discontinuity(1e-9)) throw test_failure{"an inside part is not continuous"};
    }
    for(auto &part : *out) {
        if(part.find_discontinuity(1e-9)) throw test_failure{"an outside part is not continuous"};
    }
}

bool show_help() {
    std::cout << R"(Usage: random_paths [OPTIONS]

OPTIONS:
-c
    Generate curves as well as straight lines.

-d FILENAME
    Path to file containing input to use instead of generating data randomly.

-f FILENAME
    If a test failed, dump the input data to this path. This is ignored if "-d"
    is specified.

-h, -?, --help
    Show this message.

-n INTEGER
    A positive integer specifying how many random tests to run. The default is
    100000. This is ignored if "-d" is specified.

-p INTEGER
    A positive integer specifying how many points to generate for random tests.
    The default is 5. This is ignored if "-d" is specified.

-s INTEGER
    A non-negative integer specifying how many random tests to skip. The tests
    are not run but the pseudo-random number generator is advanced as if they
    were. This is ignored if "-d" is specified.
)";
    return false;
}

bool parse_fail() {
    std::cerr << "invalid command line arguments\n\n";
    return show_help();
}

void copy_str_into(std::unique_ptr<char[]> &dest,const char *src) {
    size_t s = std::strlen(src);
    dest.reset(new char[s+1]);
    std::memcpy(dest.get(),src,s);
    dest[s] = 0;
}

char *get_named_val(char **(&argv),char **end) {
    if((*argv)[2] == 0) {
        ++argv;
        if(argv == end) {
            parse_fail();
            return nullptr;
        }
        return *argv;
    }
    return *argv + 2;
}

bool handle_str_val(std::unique_ptr<char[]> &dest,char **(&argv),char **end) {
    if(dest) return parse_fail();
    char *val = get_named_val(argv,end);
    if(!val) return false;
    copy_str_into(dest,val);
    return true;
}

bool handle_int_val(long &value,long min,char **(&argv),char **end) {
    if(value >= 0) return parse_fail();
    const char *val = get_named_val(argv,end);
    if(!val) return false;

    char *val_end;
    value = std::strtol(val,&val_end,10);
    if(*val_end != 0 || value < min) return parse_fail();

    return true;
}

bool parse_command_line(settings_t &settings,char **argv,char **end) {
    for(; argv != end; ++argv) {
        if((*argv)[0] != '-') return parse_fail();
        switch((*argv)[1]) {
        case '-':
            if(strcmp(*argv+2,"help") != 0) return parse_fail();
            [[fallthrough]];
        case 'h':
        case '?':
            return show_help();
        case 'c':
            settings.curves = true;
            break;
        case 'f':
            if(!handle_str_val(settings.failout,argv,end)) return false;
            break;
        case 'd':
            if(!handle_str_val(settings.datain,argv,end)) return false;
            break;
        case 'n':
            if(!handle_int_val(settings.tests,1,argv,end)) return false;
            break;
        case 'p':
            if(!handle_int_val(settings.point_count,2,argv,end)) return false;
            break;
        case 's':
            if(!handle_int_val(settings.skip,0,argv,end)) return false;
            break;
        default:
            return parse_fail();
        }
    }
    return true;
}

int run_from_file(const settings_t &settings) {
    std::ifstream is(settings.datain.get());
    if(!is.is_open()) {
        std::cerr << "failed to open " << settings.datain.get() << ": " << std::strerror(errno) << std::endl;
        return 2;
    }

    path<coord_t> open, region;
    try {
        read_clip_input(is,open,region);
    } catch(const bad_path_text &e) {
        std::cerr << settings.datain.get() << ": " << e.what() << std::endl;
        return 2;
    }

    try {
        clipper<coord_t> c;
        do_one(c,open,region);
    } catch(const std::logic_error &e) {
        std::cout << e.what() << std::endl;
        return 1;
    } catch(const test_failure &e) {
        std::cout << e.what() << std::endl;
        return 1;
    }

    std::cout << "all succeeded\n";
    return 0;
}

void write_fail_file(const settings_t &settings,const path<coord_t> &open,const path<coord_t> &region) {
    if(settings.failout) {
        std::ofstream out(settings.failout.get());
        if(out.is_open()) {
            write_clip_input(out,open,region);
        } else {
            std::cerr << "cannot write to " << settings.failout.get() << ": " << std::strerror(errno) << std::endl;
            errno = 0;
        }
    }
}

int run_random(const settings_t &settings) {
    std::mt19937 rand_gen;
    clipper<coord_t> c;
    path<coord_t> open, region;
    long i=0;

    try {
        for(; i<settings.skip + settings.tests; ++i) {
            long tests = i - settings.skip;
            if(tests > 0 && tests % 1000 == 0)
                std::cout << "completed " << tests << " tests" << std::endl;
            region = random_region(rand_gen,settings.point_count + 2,settings.curves);
            open = random_open(rand_gen,settings.point_count,settings.curves);
            if(i >= settings.skip) do_one(c,open,region);
        }
    } catch(const std::logic_error &e) {
        write_fail_file(settings,open,region);
        std::cout << "failure on iteration " << i << ": " << e.what() << std::endl;
        return 1;
    } catch(const test_failure &e) {
        write_fail_file(settings,open,region);
        std::cout << "failure on iteration " << i << ": " << e.what() << std::endl;
        return 1;
    }
    std::cout << "all succeeded\n";
    return 0;
}

int main(int argc,char **argv) {
    settings_t settings;
    if(argc < 1 || !parse_command_line(settings,argv+1,argv+argc)) return 1;

    if(settings.point_count < 0) settings.point_count = DEFAULT_POINT_COUNT;
    if(settings.skip < 0) settings.skip = 0;
    if(settings.tests < 0) settings.tests = DEFAULT_TEST_COUNT;

    if(settings.datain) return run_from_file(settings);
    return run_random(settings);
}
