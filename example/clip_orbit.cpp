#include <vector>
#include <iostream>
#include <cmath>
#include <numbers>
#include <chrono>
#include <type_traits>

#include "SDL.h"

#include "../include/path_clip/path_clip.hpp"

typedef double coord_t;

using point = path_clip::point_t<coord_t>;


int emit_failure(const char *pre) {
    std::cerr << pre << SDL_GetError() << '\n';
    return 1;
}

/* A row of wavy open curves for the clipping region to pass over */
path_clip::path<coord_t> make_waves() {
    path_clip::path_builder<coord_t> b;
    for(int row=0; row<12; ++row) {
        coord_t y = 40 + row*45;
        b.move_to({20,y});
        for(int i=0; i<8; ++i) {
            coord_t x = 20 + i*95;
            b.cubic_to({x+30,y-35},{x+65,y+35},{x+95,y});
        }
    }
    return b.build();
}

/* A blob made of cubic curves, rotated by "angle" around "center" */
path_clip::path<coord_t> make_region(point center,double angle) {
    constexpr int lobes = 5;
    auto at = [&](double a,double r) {
        return center + point(r*std::cos(a + angle),r*std::sin(a + angle));
    };

    path_clip::path_builder<coord_t> b;
    double step = 2*std::numbers::pi / lobes;
    b.move_to(at(0,120));
    for(int i=0; i<lobes; ++i) {
        double a = i*step;
        b.cubic_to(at(a + step*0.3,260),at(a + step*0.7,60),at(a + step,120));
    }
    return b.close().build();
}

void flatten(const path_clip::contour<coord_t> &c,std::vector<SDL_FPoint> &out) {
    out.clear();
    if(c.empty()) return;
    out.push_back({float(c.start_point().x()),float(c.start_point().y())});
    for(auto &s : c) {
        int steps = s.is_line() ? 1 : 16;
        for(int i=1; i<=steps; ++i) {
            auto p = s.at(coord_t(i)/steps);
            out.push_back({float(p.x()),float(p.y())});
        }
    }
}

struct scene {
    path_clip::path<coord_t> waves;
    path_clip::path<coord_t> region;
    path_clip::clipper<coord_t> clip;
    path_clip::keep_side side = path_clip::keep_side::inside;
    std::vector<std::vector<SDL_FPoint>> line_buffer;
    std::vector<std::vector<SDL_FPoint>> outline_buffer;

    void update(double delta) {
        region = make_region(point(400 + 200*std::cos(delta*0.5),300 + 120*std::sin(delta*0.7)),delta);

        outline_buffer.resize(region.size());
        for(std::size_t i=0; i<region.size(); ++i) flatten(region[i],outline_buffer[i]);

        line_buffer.clear();
        auto r = clip.clip(waves,region,path_clip::clip_options<coord_t>{}.keep(side));
        if(!r) {
            std::cerr << path_clip::describe(r.error()) << '\n';
            return;
        }
        line_buffer.resize(r->size());
        for(std::size_t i=0; i<r->size(); ++i) flatten((*r)[i],line_buffer[i]);
    }
};

void draw_scene(scene &sc,SDL_Renderer *renderer) {
    SDL_SetRenderDrawColor(renderer,255,255,255,255);
    SDL_RenderClear(renderer);

    SDL_SetRenderDrawColor(renderer,180,180,220,255);
    for(auto &loop : sc.outline_buffer) {
        SDL_RenderDrawLinesF(renderer,loop.data(),static_cast<int>(loop.size()));
    }

    SDL_SetRenderDrawColor(renderer,0,0,0,255);
    for(auto &line : sc.line_buffer) {
        SDL_RenderDrawLinesF(renderer,line.data(),static_cast<int>(line.size()));
    }

    SDL_RenderPresent(renderer);
}

template<typename Fn> struct scope_exit {
    Fn f;
    scope_exit(Fn f) : f{f} {}
    ~scope_exit() noexcept(std::is_nothrow_invocable_v<Fn>) { f(); }
};

int main(int,char**) {
    scene sc;
    sc.waves = make_waves();

    SDL_SetHint(SDL_HINT_VIDEO_ALLOW_SCREENSAVER,"1");

    if(SDL_Init(SDL_INIT_VIDEO) < 0) return emit_failure("Failed to initialize SDL: ");
    scope_exit _sdl_exit{SDL_Quit};

    SDL_Window *window = SDL_CreateWindow("Clip Test",SDL_WINDOWPOS_UNDEFINED,SDL_WINDOWPOS_UNDEFINED,800,600,SDL_WINDOW_RESIZABLE);
    if(!window) return emit_failure("Failed to create window: ");
    scope_exit _window_exit{[=]{ SDL_DestroyWindow(window); }};

    SDL_Renderer *renderer = SDL_CreateRenderer(window,-1,0);
    if(!renderer) return emit_failure("Failed to create renderer: ");
    scope_exit _renderer_exit{[=]{ SDL_DestroyRenderer(renderer); }};

    SDL_Event event;
    Uint32 window_id = SDL_GetWindowID(window);
    auto start_time = std::chrono::steady_clock::now();
    for(;;) {
        while(SDL_PollEvent(&event)) {
            switch(event.type) {
            case SDL_KEYDOWN:
                if(event.key.keysym.sym == SDLK_SPACE) {
                    sc.side = sc.side == path_clip::keep_side::inside
                        ? path_clip::keep_side::outside
                        : path_clip::keep_side::inside;
                }
                break;
            case SDL_WINDOWEVENT:
                if(event.window.windowID == window_id) {
                    switch(event.window.event) {
                    case SDL_WINDOWEVENT_CLOSE:
                        return 0;
                    default:
                        break;
                    }
                }
                break;
            case SDL_QUIT:
                return 0;
            default:
                break;
            }
        }

        sc.update(std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - start_time).count());
        draw_scene(sc,renderer);
    }
}
